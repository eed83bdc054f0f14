#include "io/JsonIO.hpp"

#include "recipe/AmountParser.hpp"
#include "recipe/TextUtil.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace recipe {

// ---------------------------------------------------------------------------
// export
// ---------------------------------------------------------------------------

static json text_blocks_to_json(const std::vector<std::string>& blocks) {
    if (blocks.empty()) return nullptr;
    return textutil::join(blocks, "\n\n");
}

static json amount_to_json(const Amount& a) {
    json j;
    j["factor"] = a.original_text;
    if (a.unit.empty()) j["unit"] = nullptr;
    else j["unit"] = a.unit;
    return j;
}

static json ingredient_to_json(const Ingredient& ing) {
    json j;
    j["name"] = ing.name;
    if (ing.amount) j["amount"] = amount_to_json(*ing.amount);
    else j["amount"] = nullptr;
    if (ing.link) j["link"] = *ing.link;
    else j["link"] = nullptr;
    return j;
}

static void entries_to_json(const std::vector<IngredientEntry>& entries, json& ingredients, json& groups);

static json group_to_json(const IngredientGroup& g) {
    json j;
    j["title"] = g.name;
    json ingredients = json::array();
    json groups = json::array();
    entries_to_json(g.children, ingredients, groups);
    j["ingredients"] = ingredients;
    j["ingredient_groups"] = groups;
    return j;
}

static void entries_to_json(const std::vector<IngredientEntry>& entries, json& ingredients, json& groups) {
    for (const auto& e : entries) {
        if (e.is_group()) groups.push_back(group_to_json(e.group));
        else ingredients.push_back(ingredient_to_json(e.ingredient));
    }
}

json recipe_to_json(const Recipe& r) {
    json j;
    j["title"] = r.title;
    j["description"] = text_blocks_to_json(r.description);
    j["tags"] = r.tags;

    json yields = json::array();
    for (const auto& y : r.yields) yields.push_back(amount_to_json(y));
    j["yields"] = yields;

    json ingredients = json::array();
    json groups = json::array();
    entries_to_json(r.ingredients, ingredients, groups);
    j["ingredients"] = ingredients;
    j["ingredient_groups"] = groups;

    j["instructions"] = text_blocks_to_json(r.instructions);
    return j;
}

std::string render_json(const Recipe& r) {
    return recipe_to_json(r).dump(2) + "\n";
}

// ---------------------------------------------------------------------------
// import
// ---------------------------------------------------------------------------

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static const json& require_array(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    const json& arr = j.at(key);
    if (!arr.is_array()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an array");
    }
    return arr;
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

// absent and null both mean "not set"
static std::string optional_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return std::string();
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string or null");
    }
    return j.at(key).get<std::string>();
}

static std::string index_path(const std::string& where, const char* key, size_t i) {
    std::ostringstream oss;
    oss << where << "." << key << "[" << i << "]";
    return oss.str();
}

static Amount parse_amount_json(const json& j, const std::string& where) {
    require_object(j, where);

    const std::string factor = require_string(j, "factor", where);
    const std::string unit = optional_string(j, "unit", where);
    if (textutil::trim(factor).empty() && textutil::trim(unit).empty()) {
        throw std::runtime_error(where + ".factor must not be empty");
    }

    Amount a = parse_amount(factor);
    // hand-written files may keep the unit out of the factor
    if (!unit.empty() && a.unit != unit) a = parse_amount(factor + " " + unit);
    return a;
}

static Ingredient parse_ingredient_json(const json& j, const std::string& where) {
    require_object(j, where);

    Ingredient ing;
    ing.name = textutil::trim(require_string(j, "name", where));
    if (ing.name.empty()) {
        throw std::runtime_error(where + ".name must not be empty");
    }

    if (j.contains("amount") && !j.at("amount").is_null()) {
        ing.amount = parse_amount_json(j.at("amount"), where + ".amount");
    }

    const std::string link = optional_string(j, "link", where);
    if (!link.empty()) ing.link = link;

    return ing;
}

static void parse_entries_json(const json& j, const std::string& where, int level, std::vector<IngredientEntry>& out);

static IngredientGroup parse_group_json(const json& j, const std::string& where, int level) {
    require_object(j, where);

    IngredientGroup g;
    g.name = require_string(j, "title", where);
    g.level = level;
    parse_entries_json(j, where, level + 1, g.children);
    return g;
}

static void parse_entries_json(const json& j, const std::string& where, int level, std::vector<IngredientEntry>& out) {
    if (j.contains("ingredients")) {
        const json& ings = require_array(j, "ingredients", where);
        for (size_t i = 0; i < ings.size(); ++i) {
            out.push_back(IngredientEntry::make(parse_ingredient_json(ings.at(i), index_path(where, "ingredients", i))));
        }
    }

    if (j.contains("ingredient_groups")) {
        const json& groups = require_array(j, "ingredient_groups", where);
        if (!groups.empty() && level > 6) {
            throw std::runtime_error(where + ".ingredient_groups nested deeper than heading level 6");
        }
        for (size_t i = 0; i < groups.size(); ++i) {
            out.push_back(IngredientEntry::make(parse_group_json(groups.at(i), index_path(where, "ingredient_groups", i), level)));
        }
    }
}

Recipe recipe_from_json(const json& j) {
    require_object(j, "root");

    Recipe r;
    r.title = require_string(j, "title", "root");
    if (textutil::trim(r.title).empty()) {
        throw std::runtime_error("root.title must not be empty");
    }

    const std::string description = optional_string(j, "description", "root");
    if (!textutil::trim(description).empty()) r.description.push_back(description);

    if (j.contains("tags")) {
        const json& tags = require_array(j, "tags", "root");
        for (size_t i = 0; i < tags.size(); ++i) {
            if (!tags.at(i).is_string()) {
                throw std::runtime_error(index_path("root", "tags", i) + " must be a string");
            }
            r.tags.push_back(tags.at(i).get<std::string>());
        }
    }

    if (j.contains("yields")) {
        const json& yields = require_array(j, "yields", "root");
        for (size_t i = 0; i < yields.size(); ++i) {
            r.yields.push_back(parse_amount_json(yields.at(i), index_path("root", "yields", i)));
        }
    }

    // top-level groups map to "##" headings
    parse_entries_json(j, "root", 2, r.ingredients);

    const std::string instructions = optional_string(j, "instructions", "root");
    if (!textutil::trim(instructions).empty()) r.instructions.push_back(instructions);

    return r;
}

Recipe load_recipe_json(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open recipe file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }

    return recipe_from_json(j);
}

}  // namespace recipe
