#include "commands/check.hpp"
#include "commands/dump.hpp"
#include "commands/render.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  recipe-md json <recipe.md> [options]\n"
        << "  recipe-md html <recipe.md> [options]\n"
        << "  recipe-md markdown <recipe.md|recipe.json> [options]\n"
        << "  recipe-md check <recipe.md> [options]\n"
        << "  recipe-md dump <recipe.md> [--permissive]\n"
        << "  recipe-md help\n";
    return 1;
}

static int print_render_help() {
    std::cerr
        << "usage:\n"
        << "  recipe-md json|html|markdown <input> [options]\n"
        << "\n"
        << "common:\n"
        << "  --out <path>                 write to file instead of stdout\n"
        << "  --permissive                 accept a missing divider (warning instead of error)\n"
        << "\n"
        << "html:\n"
        << "  --schema-org                 add schema.org/Recipe microdata\n"
        << "  --standalone                 emit a full page with a stylesheet\n"
        << "\n"
        << "markdown:\n"
        << "  input may be a recipe .json (structured export) instead of markdown\n";
    return 0;
}

static int print_check_help() {
    std::cerr
        << "usage:\n"
        << "  recipe-md check <recipe.md> [options]\n"
        << "\n"
        << "options:\n"
        << "  --strict                     fail on any warning\n"
        << "  --report <path>              write a JSON diagnostics report\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage();
        return 0;
    }

    const bool want_help = (argc >= 3 && std::string(argv[2]) == "--help");
    if (want_help && (cmd == "json" || cmd == "html" || cmd == "markdown")) return print_render_help();
    if (want_help && cmd == "check") return print_check_help();

    if (cmd == "json")     return cmd_json(argc - 1, argv + 1);
    if (cmd == "html")     return cmd_html(argc - 1, argv + 1);
    if (cmd == "markdown") return cmd_markdown(argc - 1, argv + 1);
    if (cmd == "check")    return cmd_check(argc - 1, argv + 1);
    if (cmd == "dump")     return cmd_dump(argc - 1, argv + 1);

    std::cerr << "[error] unknown command: " << cmd << "\n";
    return print_usage();
}
