#include "recipe/Diagnostics.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace recipe {

StructureError::StructureError(Code code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

const char* warning_kind_str(WarningKind k) {
    switch (k) {
        case WarningKind::Ambiguity: return "ambiguity";
        case WarningKind::Content: return "content";
        case WarningKind::AmountParse: return "amount_parse";
        case WarningKind::Structure: return "structure";
        default: return "unknown";
    }
}

const char* structure_code_str(StructureError::Code c) {
    switch (c) {
        case StructureError::Code::MissingTitle: return "missing_title";
        case StructureError::Code::MissingDivider: return "missing_divider";
        default: return "unknown";
    }
}

void add_warning(Warnings& out, WarningKind kind, const std::string& code, const std::string& message) {
    ParseWarning w;
    w.kind = kind;
    w.code = code;
    w.message = message;
    out.push_back(std::move(w));
}

void write_diagnostics_report(const fs::path& path, const DiagnosticsReport& rep) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    nlohmann::json j;
    j["pass"] = rep.pass;
    j["source"] = rep.source_path;
    j["errors"] = rep.errors;
    j["warnings"] = nlohmann::json::array();

    for (const auto& w : rep.warnings) {
        j["warnings"].push_back({
            {"kind", warning_kind_str(w.kind)},
            {"code", w.code},
            {"message", w.message}
        });
    }

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open report file: " + path.string());
    out << j.dump(2) << "\n";
}

}  // namespace recipe
