#include "commands/render.hpp"

#include "io/JsonIO.hpp"
#include "recipe/HtmlRenderer.hpp"
#include "recipe/MarkdownRenderer.hpp"
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

// First argument after the command name that is neither a flag nor a flag value.
static std::string get_input(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--out") {
            ++i;
            continue;
        }
        if (a.rfind("--", 0) == 0) continue;
        return a;
    }
    return std::string();
}

static int render_usage(const char* cmd, const char* extra) {
    std::cerr
        << "usage:\n"
        << "  recipe-md " << cmd << " <recipe.md> [--out <path>]" << extra << " [--permissive]\n";
    return 1;
}

static void print_warnings(const recipe::Warnings& warnings) {
    for (const auto& w : warnings) {
        std::cerr << "[warn] " << w.code << ": " << w.message << "\n";
    }
}

static bool is_json_path(const std::string& path) {
    return fs::path(path).extension() == ".json";
}

// Parse the input file, printing warnings and errors. Returns false on failure.
static bool load_input(int argc, char** argv, const std::string& path, bool allow_json, recipe::Recipe& out) {
    try {
        if (allow_json && is_json_path(path)) {
            out = recipe::load_recipe_json(path);
            return true;
        }

        recipe::ParseOptions opts;
        if (has_flag(argc, argv, "--permissive")) opts.mode = recipe::ParseMode::Permissive;

        recipe::ParseResult res = recipe::load_recipe_file(path, opts);
        print_warnings(res.warnings);
        out = std::move(res.recipe);
        return true;
    } catch (const recipe::StructureError& e) {
        std::cerr << "[error] " << recipe::structure_code_str(e.code()) << ": " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
    }
    return false;
}

static int emit(const std::string& text, const std::string& out_path, const char* label) {
    if (out_path.empty()) {
        std::cout << text;
        return 0;
    }

    try {
        recipe::write_text_file(fs::path(out_path), text);
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }

    std::cout << label << ": " << out_path << "\n";
    return 0;
}

int cmd_json(int argc, char** argv) {
    const std::string input = get_input(argc, argv);
    if (input.empty()) {
        std::cerr << "[error] missing input file\n";
        return render_usage("json", "");
    }

    recipe::Recipe r;
    if (!load_input(argc, argv, input, false, r)) return 1;

    return emit(recipe::render_json(r), get_arg(argc, argv, "--out", ""), "OUT_JSON");
}

int cmd_html(int argc, char** argv) {
    const std::string input = get_input(argc, argv);
    if (input.empty()) {
        std::cerr << "[error] missing input file\n";
        return render_usage("html", " [--schema-org] [--standalone]");
    }

    recipe::Recipe r;
    if (!load_input(argc, argv, input, false, r)) return 1;

    recipe::HtmlOptions hopts;
    hopts.schema_org = has_flag(argc, argv, "--schema-org");
    hopts.standalone = has_flag(argc, argv, "--standalone");

    return emit(recipe::render_html(r, hopts), get_arg(argc, argv, "--out", ""), "OUT_HTML");
}

int cmd_markdown(int argc, char** argv) {
    const std::string input = get_input(argc, argv);
    if (input.empty()) {
        std::cerr << "[error] missing input file\n";
        return render_usage("markdown", "");
    }

    recipe::Recipe r;
    if (!load_input(argc, argv, input, true, r)) return 1;

    return emit(recipe::render_markdown(r), get_arg(argc, argv, "--out", ""), "OUT_MARKDOWN");
}
