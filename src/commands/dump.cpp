#include "commands/dump.hpp"

#include "recipe/RecipeParser.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string format_amount(const recipe::Amount& a) {
    std::ostringstream oss;
    if (a.quantity) oss << *a.quantity;
    else oss << "?";
    if (!a.unit.empty()) oss << " [" << a.unit << "]";
    oss << " (\"" << a.original_text << "\")";
    return oss.str();
}

static void print_entries(const std::vector<recipe::IngredientEntry>& entries, int depth) {
    const std::string indent(static_cast<size_t>(depth) * 2, ' ');

    for (const auto& e : entries) {
        if (e.is_group()) {
            std::cout << indent << "[Group h" << e.group.level << "] " << e.group.name << "\n";
            print_entries(e.group.children, depth + 1);
            continue;
        }

        const recipe::Ingredient& ing = e.ingredient;
        std::cout << indent << "- " << ing.name;
        if (ing.amount) std::cout << "  amount: " << format_amount(*ing.amount);
        if (ing.link) std::cout << "  link: " << *ing.link;
        std::cout << "\n";
    }
}

int cmd_dump(int argc, char** argv) {
    std::string path;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a.rfind("--", 0) != 0) {
            path = a;
            break;
        }
    }
    if (path.empty()) {
        std::cerr << "usage:\n  recipe-md dump <recipe.md> [--permissive]\n";
        return 1;
    }

    recipe::ParseOptions opts;
    if (has_flag(argc, argv, "--permissive")) opts.mode = recipe::ParseMode::Permissive;

    recipe::ParseResult res;
    try {
        res = recipe::load_recipe_file(path, opts);
    } catch (const recipe::StructureError& e) {
        std::cerr << "[error] " << recipe::structure_code_str(e.code()) << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[error] failed to load recipe: " << e.what() << "\n";
        return 1;
    }

    const recipe::Recipe& r = res.recipe;

    std::cout << "[Recipe] " << r.title << "\n";
    std::cout << "  description blocks: " << r.description.size() << "\n";

    std::cout << "  tags: ";
    for (size_t i = 0; i < r.tags.size(); ++i) {
        std::cout << r.tags[i];
        if (i + 1 < r.tags.size()) std::cout << ", ";
    }
    std::cout << "\n";

    std::cout << "  yields:\n";
    for (const auto& y : r.yields) std::cout << "    " << format_amount(y) << "\n";
    std::cout << "\n";

    std::cout << "[Ingredients]\n";
    print_entries(r.ingredients, 1);
    std::cout << "\n";

    std::cout << "[Instructions] " << r.instructions.size() << " blocks\n";

    for (const auto& w : res.warnings) {
        std::cerr << "[warn] " << w.code << ": " << w.message << "\n";
    }

    return 0;
}
