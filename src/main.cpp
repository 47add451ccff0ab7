#include <filesystem>
#include <format>
#include <iostream>
#include <print>

#include "input.hpp"
#include "layout.hpp"
#include "term.hpp"

namespace {
    struct Options {
        caret::Option<std::string> config_path;
        caret::ColorChoice color { caret::ColorChoice::Auto };
        bool short_display { false };
        bool dump_entries { false };
        std::string input_path;
    };

    auto usage() -> std::string_view {
        return "usage: caret [--short] [--color=always|never|auto] [--config FILE] [--entries] "
               "INPUT.json";
    }

    auto parse_options(int argc, char** argv) -> caret::Result<Options, std::string> {
        Options options;
        for (int i = 1; i < argc; ++i) {
            const auto arg = std::string_view(argv[i]);
            if (arg == "--short") {
                options.short_display = true;
            } else if (arg == "--entries") {
                options.dump_entries = true;
            } else if (arg == "--config") {
                if (i + 1 >= argc) {
                    return std::unexpected("missing file after '--config'");
                }
                options.config_path = argv[++i];
            } else if (arg.starts_with("--color=")) {
                const auto choice = arg.substr(std::string_view("--color=").length());
                auto color =
                    magic_enum::enum_cast<caret::ColorChoice>(choice, magic_enum::case_insensitive);
                if (!color) {
                    return std::unexpected(std::format("unknown color choice '{}'", choice));
                }
                options.color = *color;
            } else if (arg.starts_with("-")) {
                return std::unexpected(std::format("unknown option '{}'", arg));
            } else if (options.input_path.empty()) {
                options.input_path = arg;
            } else {
                return std::unexpected(std::format("unexpected argument '{}'", arg));
            }
        }
        if (options.input_path.empty()) {
            return std::unexpected(std::string(usage()));
        }
        return options;
    }

    auto load_config(const Options& options) -> caret::Result<caret::Config, std::string> {
        auto config = caret::Config {};
        if (options.config_path) {
            auto json = caret::read_json(*options.config_path);
            if (!json) {
                return std::unexpected(std::move(json).error());
            }
            auto loaded = caret::Config::from_json(*json);
            if (!loaded) {
                return std::unexpected(std::move(loaded).error());
            }
            config = std::move(*loaded);
        }
        if (options.short_display) {
            config.display_style = caret::DisplayStyle::Short;
        }
        return config;
    }
}  // namespace

auto main(int argc, char** argv) -> int32_t {
    auto options = parse_options(argc, argv);
    if (!options) {
        std::println(stderr, "{}", options.error());
        return 1;
    }

    auto config = load_config(*options);
    if (!config) {
        std::println(stderr, "config: {}", config.error());
        return 1;
    }

    const auto input_path = std::filesystem::path(options->input_path);
    auto input_json = caret::read_json(input_path);
    if (!input_json) {
        std::println(stderr, "{}", input_json.error());
        return 1;
    }

    auto input = caret::load_input(*input_json, input_path.parent_path());
    if (!input) {
        std::println(stderr, "{}", input.error());
        return 1;
    }
    const auto& files = input->files;
    const auto& diagnostics = input->diagnostics;

    if (options->dump_entries) {
        auto dump = caret::Json::array();
        for (const auto& diagnostic : diagnostics) {
            auto entries = config->display_style == caret::DisplayStyle::Short
                               ? caret::ShortDiagnostic(diagnostic).entries(files)
                               : caret::RichDiagnostic(diagnostic).entries(files);
            if (!entries) {
                std::println(stderr, "{}", entries.error());
                return 1;
            }
            dump.push_back(caret::to_json(*entries));
        }
        // sources read from disk need not be valid UTF-8
        std::println("{}", dump.dump(2, ' ', false, caret::Json::error_handler_t::replace));
        return 0;
    }

    caret::StreamWriter writer(std::cout, options->color);
    for (const auto& diagnostic : diagnostics) {
        if (auto result = caret::emit(writer, *config, files, diagnostic); !result) {
            std::println(stderr, "{}", result.error());
            return 1;
        }
    }
    return 0;
}
