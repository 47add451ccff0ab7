#pragma once

#include "config.hpp"
#include "diagnostics.hpp"
#include "files.hpp"
#include "writer.hpp"

namespace caret {
    // header, source snippets and notes
    //
    // fails on the first label `files` cannot resolve or the first write `writer` rejects;
    // nothing is retained once the call returns.
    auto render(
        const Diagnostic& diagnostic,
        const Files& files,
        WriteColor& writer,
        const Config& config
    ) -> RenderResult<void>;

    // one located header per primary label, or a single unlocated one
    auto render_short(
        const Diagnostic& diagnostic,
        const Files& files,
        WriteColor& writer,
        const Config& config
    ) -> RenderResult<void>;

    // picks `render` or `render_short` from `config.display_style`
    auto emit(
        WriteColor& writer,
        const Config& config,
        const Files& files,
        const Diagnostic& diagnostic
    ) -> RenderResult<void>;
}  // namespace caret
