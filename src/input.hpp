#pragma once

#include <filesystem>
#include <string>

#include "diagnostics.hpp"
#include "files.hpp"

namespace caret {
    // source table and diagnostics read from one input document
    //
    // ```json
    // {
    //     "files": [{ "name": "main.fun", "source": "..." }, { "path": "lib.fun" }],
    //     "diagnostics": [{ "severity": "error", "message": "...", "labels": [...] }]
    // }
    // ```
    struct Input {
    public:
        SimpleFiles files;
        Vec<Diagnostic> diagnostics;
    };

    auto read_file(const std::filesystem::path& path) -> Result<std::string, std::string>;
    auto read_json(const std::filesystem::path& path) -> Result<Json, std::string>;

    // files given by "path" are read relative to `base`
    auto load_input(const Json& json, const std::filesystem::path& base)
        -> Result<Input, std::string>;
}  // namespace caret
