#include "entry.hpp"

namespace caret {
    namespace {
        template<typename... Fs>
        struct Overloaded : Fs... {
            using Fs::operator()...;
        };

        auto severity_json(MarkSeverity severity) -> Json {
            if (!severity) {
                return nullptr;
            }
            return severity_name(*severity);
        }
    }  // namespace

    auto to_json(const Mark& mark) -> Json {
        return std::visit(
            Overloaded {
                [](const mark::Single& single) -> Json {
                    return { { "kind", "single" },
                             { "start", single.start },
                             { "end", single.end },
                             { "message", single.message } };
                },
                [](const mark::MultiTopLeft&) -> Json { return { { "kind", "multi_top_left" } }; },
                [](const mark::MultiTop& top) -> Json {
                    return { { "kind", "multi_top" }, { "end", top.end } };
                },
                [](const mark::MultiLeft&) -> Json { return { { "kind", "multi_left" } }; },
                [](const mark::MultiBottom& bottom) -> Json {
                    return { { "kind", "multi_bottom" },
                             { "end", bottom.end },
                             { "message", bottom.message } };
                },
            },
            mark
        );
    }

    auto to_json(const Entry& entry) -> Json {
        return std::visit(
            Overloaded {
                [](const entry::Header& header) -> Json {
                    auto json = Json { { "kind", "header" } };
                    json["locus"] = header.locus ? header.locus->to_json() : Json(nullptr);
                    json["severity"] = severity_name(header.severity);
                    json["code"] = header.code ? Json(*header.code) : Json(nullptr);
                    json["message"] = header.message;
                    return json;
                },
                [](const entry::Empty&) -> Json { return { { "kind", "empty" } }; },
                [](const entry::SourceStart& start) -> Json {
                    return { { "kind", "source_start" },
                             { "outer_padding", start.outer_padding },
                             { "locus", start.locus.to_json() } };
                },
                [](const entry::SourceBreak& source_break) -> Json {
                    return { { "kind", "source_break" },
                             { "outer_padding", source_break.outer_padding } };
                },
                [](const entry::SourceEmpty& empty) -> Json {
                    return { { "kind", "source_empty" }, { "outer_padding", empty.outer_padding } };
                },
                [](const entry::SourceLine& line) -> Json {
                    auto marks = Json::array();
                    for (const auto& line_mark : line.marks) {
                        if (!line_mark) {
                            marks.push_back(nullptr);
                            continue;
                        }
                        auto mark_json = to_json(line_mark->mark);
                        mark_json["severity"] = severity_json(line_mark->severity);
                        marks.push_back(std::move(mark_json));
                    }
                    return { { "kind", "source_line" },
                             { "outer_padding", line.outer_padding },
                             { "line_number", line.line_number },
                             { "source", line.source },
                             { "marks", std::move(marks) } };
                },
                [](const entry::SourceNote& note) -> Json {
                    return { { "kind", "source_note" },
                             { "outer_padding", note.outer_padding },
                             { "message", note.message } };
                },
            },
            entry
        );
    }

    auto to_json(const Vec<Entry>& entries) -> Json {
        auto json = Json::array();
        for (const auto& entry : entries) {
            json.push_back(to_json(entry));
        }
        return json;
    }
}  // namespace caret
