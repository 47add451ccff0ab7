#include "diagnostics.hpp"

#include <format>
#include <limits>

namespace caret {
    namespace {
        template<typename E>
        auto parse_enum(const Json& json, std::string_view what) -> Result<E, std::string> {
            if (!json.is_string()) {
                return std::unexpected(std::format("expected {} name, found {}", what, json.dump()));
            }
            const auto name = json.get<std::string>();
            auto value = magic_enum::enum_cast<E>(name, magic_enum::case_insensitive);
            if (!value) {
                return std::unexpected(std::format("unknown {} '{}'", what, name));
            }
            return *value;
        }
    }  // namespace

    auto Label::to_json() const -> Json {
        return { { "file", m_file_id },
                 { "style", to_lower_str(magic_enum::enum_name(m_style)) },
                 { "start", m_range.start },
                 { "end", m_range.end },
                 { "message", m_message } };
    }

    auto Label::from_json(const Json& json) -> Result<Label, std::string> {
        try {
            auto style = parse_enum<LabelStyle>(json.value("style", Json("primary")), "label style");
            if (!style) {
                return std::unexpected(std::move(style).error());
            }

            const auto& file_json = json.at("file");
            if (!file_json.is_number_unsigned()
                || file_json.get<uint64_t>() > std::numeric_limits<FileId>::max()) {
                return std::unexpected(std::format("invalid file id {}", file_json.dump()));
            }

            const auto range = ByteRange {
                .start = json.at("start").get<size_t>(),
                .end = json.at("end").get<size_t>(),
            };
            return Label(*style, static_cast<FileId>(file_json.get<uint64_t>()), range)
                .with_message(json.value("message", std::string {}));
        } catch (const Json::exception& error) {
            return std::unexpected(std::format("malformed label: {}", error.what()));
        }
    }

    auto Diagnostic::to_json() const -> Json {
        auto labels = Json::array();
        for (const auto& label : m_labels) {
            labels.push_back(label.to_json());
        }

        auto json = Json { { "severity", severity_name(m_severity) } };
        if (m_code) {
            json["code"] = *m_code;
        }
        json["message"] = m_message;
        json["labels"] = std::move(labels);
        json["notes"] = m_notes;
        return json;
    }

    auto Diagnostic::from_json(const Json& json) -> Result<Diagnostic, std::string> {
        try {
            auto severity = parse_enum<Severity>(json.at("severity"), "severity");
            if (!severity) {
                return std::unexpected(std::move(severity).error());
            }

            auto diagnostic =
                Diagnostic(*severity).with_message(json.value("message", std::string {}));
            if (json.contains("code")) {
                diagnostic = std::move(diagnostic).with_code(json.at("code").get<std::string>());
            }

            Vec<Label> labels;
            for (const auto& label_json : json.value("labels", Json::array())) {
                auto label = Label::from_json(label_json);
                if (!label) {
                    return std::unexpected(std::move(label).error());
                }
                labels.push_back(std::move(*label));
            }

            return std::move(diagnostic)
                .with_labels(std::move(labels))
                .with_notes(json.value("notes", Vec<std::string> {}));
        } catch (const Json::exception& error) {
            return std::unexpected(std::format("malformed diagnostic: {}", error.what()));
        }
    }
}  // namespace caret
