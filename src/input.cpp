#include "input.hpp"

#include <format>
#include <fstream>

namespace caret {
    namespace {
        auto load_files(const Json& files_json, const std::filesystem::path& base)
            -> Result<SimpleFiles, std::string> {
            if (!files_json.is_array()) {
                return std::unexpected(
                    std::format("expected a file list, found {}", files_json.dump())
                );
            }

            SimpleFiles files;
            for (const auto& file : files_json) {
                if (!file.is_object()) {
                    return std::unexpected(std::format("malformed file entry {}", file.dump()));
                }
                if (file.contains("source") && file.at("source").is_string()) {
                    files.add(
                        file.value("name", std::string("<source>")),
                        file.at("source").get<std::string>()
                    );
                    continue;
                }
                if (!file.contains("path") || !file.at("path").is_string()) {
                    return std::unexpected(
                        std::format("file entry {} has neither source nor path", file.dump())
                    );
                }

                const auto path = base / file.at("path").get<std::string>();
                auto content = read_file(path);
                if (!content) {
                    return std::unexpected(std::move(content).error());
                }
                files.add(file.value("name", path.filename().string()), std::move(*content));
            }
            return files;
        }
    }  // namespace

    auto read_file(const std::filesystem::path& path) -> Result<std::string, std::string> {
        std::ifstream file(path);
        if (!file) {
            return std::unexpected(std::format("cannot open file '{}'", path.string()));
        }
        return std::string(std::istreambuf_iterator<char>(file), {});
    }

    auto read_json(const std::filesystem::path& path) -> Result<Json, std::string> {
        auto content = read_file(path);
        if (!content) {
            return std::unexpected(std::move(content).error());
        }
        auto json = Json::parse(*content, nullptr, false);
        if (json.is_discarded()) {
            return std::unexpected(std::format("'{}' is not valid JSON", path.string()));
        }
        return json;
    }

    auto load_input(const Json& json, const std::filesystem::path& base)
        -> Result<Input, std::string> {
        try {
            if (!json.is_object()) {
                return std::unexpected(
                    std::format("expected an input object, found {}", json.dump())
                );
            }

            auto files = load_files(json.value("files", Json::array()), base);
            if (!files) {
                return std::unexpected(std::move(files).error());
            }

            const auto diagnostics_json = json.value("diagnostics", Json::array());
            if (!diagnostics_json.is_array()) {
                return std::unexpected(
                    std::format("expected a diagnostic list, found {}", diagnostics_json.dump())
                );
            }

            Vec<Diagnostic> diagnostics;
            for (const auto& diagnostic_json : diagnostics_json) {
                auto diagnostic = Diagnostic::from_json(diagnostic_json);
                if (!diagnostic) {
                    return std::unexpected(std::move(diagnostic).error());
                }
                diagnostics.push_back(std::move(*diagnostic));
            }

            return Input { .files = std::move(*files), .diagnostics = std::move(diagnostics) };
        } catch (const Json::exception& error) {
            return std::unexpected(std::format("malformed input: {}", error.what()));
        }
    }
}  // namespace caret
