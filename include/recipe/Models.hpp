#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace recipe {

struct Amount {
    std::optional<double> quantity;  // none when no numeric literal was recognized
    std::string unit;                // may be empty
    std::string original_text;       // verbatim source span, always set
};

struct Ingredient {
    std::optional<Amount> amount;
    std::string name;                // non-empty after trim
    std::optional<std::string> link; // e.g. "./pie-crust.md"
};

struct IngredientEntry;

struct IngredientGroup {
    std::string name;
    int level = 2;                           // heading depth 1..6
    std::vector<IngredientEntry> children;   // deeper levels only
};

// Either an ingredient or a nested group.
struct IngredientEntry {
    enum class Kind {
        Ingredient,
        Group
    };

    Kind kind = Kind::Ingredient;
    Ingredient ingredient;   // valid when kind == Ingredient
    IngredientGroup group;   // valid when kind == Group

    bool is_group() const { return kind == Kind::Group; }

    static IngredientEntry make(Ingredient ing);
    static IngredientEntry make(IngredientGroup grp);
};

inline IngredientEntry IngredientEntry::make(Ingredient ing) {
    IngredientEntry e;
    e.kind = Kind::Ingredient;
    e.ingredient = std::move(ing);
    return e;
}

inline IngredientEntry IngredientEntry::make(IngredientGroup grp) {
    IngredientEntry e;
    e.kind = Kind::Group;
    e.group = std::move(grp);
    return e;
}

struct Recipe {
    std::string title;
    std::vector<std::string> description;    // markdown text blocks
    std::vector<std::string> tags;
    std::vector<Amount> yields;
    std::vector<IngredientEntry> ingredients;
    std::vector<std::string> instructions;   // markdown text blocks
};

}  // namespace recipe
