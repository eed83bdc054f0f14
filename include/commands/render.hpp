#pragma once

// recipe-md json <recipe.md> [--out <path>] [--permissive]
int cmd_json(int argc, char** argv);

// recipe-md html <recipe.md> [--out <path>] [--schema-org] [--standalone] [--permissive]
int cmd_html(int argc, char** argv);

// recipe-md markdown <recipe.md|recipe.json> [--out <path>] [--permissive]
int cmd_markdown(int argc, char** argv);
