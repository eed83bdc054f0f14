#include "commands/check.hpp"

#include "recipe/Diagnostics.hpp"
#include "recipe/RecipeParser.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <utility>

namespace fs = std::filesystem;

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static std::string get_input(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--report") {
            ++i;
            continue;
        }
        if (a.rfind("--", 0) == 0) continue;
        return a;
    }
    return std::string();
}

static int check_usage() {
    std::cerr
        << "usage:\n"
        << "  recipe-md check <recipe.md> [--strict] [--report <path>]\n";
    return 1;
}

int cmd_check(int argc, char** argv) {
    const std::string input = get_input(argc, argv);
    if (input.empty()) {
        std::cerr << "[error] missing input file\n";
        return check_usage();
    }

    const bool strict = has_flag(argc, argv, "--strict");
    const std::string report_path = get_arg(argc, argv, "--report", "");

    recipe::DiagnosticsReport rep;
    rep.source_path = input;

    try {
        recipe::ParseResult res = recipe::load_recipe_file(input);
        rep.warnings = std::move(res.warnings);
    } catch (const recipe::StructureError& e) {
        rep.errors.push_back(std::string(recipe::structure_code_str(e.code())) + ": " + e.what());
    } catch (const std::exception& e) {
        rep.errors.push_back(e.what());
    }

    rep.pass = rep.errors.empty() && (!strict || rep.warnings.empty());

    for (const auto& e : rep.errors) std::cerr << "[error] " << e << "\n";
    for (const auto& w : rep.warnings) std::cerr << "[warn] " << w.code << ": " << w.message << "\n";

    if (!report_path.empty()) {
        try {
            recipe::write_diagnostics_report(fs::path(report_path), rep);
        } catch (const std::exception& e) {
            std::cerr << "[error] " << e.what() << "\n";
            return 1;
        }
    }

    std::cout << "CHECK: " << (rep.pass ? "pass" : "fail") << "\n";
    std::cout << "WARNINGS: " << rep.warnings.size() << "\n";
    if (!report_path.empty()) std::cout << "OUT_REPORT: " << report_path << "\n";

    return rep.pass ? 0 : 1;
}
