#pragma once

#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace packsmith {

namespace step {

struct ExtractAllToRoot {};

struct ExtractAllToPath {
    std::string target_path;
};

struct ExtractSubfolderToPath {
    std::string subfolder_name;
    std::string target_path; // may be empty: target root
};

// Strips the archive's single top-level folder.
struct ExtractRootFolderToPath {
    std::string target_path; // may be empty: target root
};

struct CopySingleFile {
    std::string target_path;
};

// target_path/<stem>/<filename>
struct CopyToDerivedFolder {
    std::string target_path;
};

struct FindAndCopy {
    std::string source_pattern;
    std::string target_path;
    bool required = false;
};

struct FindAndRename {
    std::string source_pattern;
    std::string target_path;
    std::string target_filename;
    bool required = false;
};

struct DeletePath {
    std::string path;
};

} // namespace step

using Step = std::variant<step::ExtractAllToRoot,
                          step::ExtractAllToPath,
                          step::ExtractSubfolderToPath,
                          step::ExtractRootFolderToPath,
                          step::CopySingleFile,
                          step::CopyToDerivedFolder,
                          step::FindAndCopy,
                          step::FindAndRename,
                          step::DeletePath>;

struct DefinitionError {
    ErrorKind kind = ErrorKind::DefinitionInvalid;
    std::string message;
};

// Canonical action name ("extract_all_to_root", ...).
std::string_view StepActionName(const Step& s);

// Accepts canonical and legacy action names. Unknown actions are
// UnsupportedAction; missing, empty, mistyped or unknown parameters and
// unsafe paths are DefinitionInvalid.
std::expected<Step, DefinitionError> ParseStep(const nlohmann::json& j);

// Always emits the canonical action and parameter names.
nlohmann::json StepToJson(const Step& s);

} // namespace packsmith
