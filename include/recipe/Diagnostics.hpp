#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace recipe {

enum class WarningKind {
    Ambiguity,     // duplicate title / tags / yields, first match wins
    Content,       // item dropped or block ignored
    AmountParse,   // literal kept as unit, no quantity
    Structure      // missing divider tolerated in permissive mode
};

struct ParseWarning {
    WarningKind kind = WarningKind::Content;
    std::string code;
    std::string message;
};

using Warnings = std::vector<ParseWarning>;

// Fatal: the document cannot be read as a recipe at all.
class StructureError : public std::runtime_error {
public:
    enum class Code {
        MissingTitle,
        MissingDivider
    };

    StructureError(Code code, const std::string& message);

    Code code() const { return code_; }

private:
    Code code_;
};

const char* warning_kind_str(WarningKind k);
const char* structure_code_str(StructureError::Code c);

void add_warning(Warnings& out, WarningKind kind, const std::string& code, const std::string& message);

struct DiagnosticsReport {
    bool pass = true;
    std::string source_path;
    std::vector<std::string> errors;
    Warnings warnings;
};

void write_diagnostics_report(const std::filesystem::path& path, const DiagnosticsReport& rep);

}  // namespace recipe
