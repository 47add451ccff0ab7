#pragma once

#include "config.hpp"
#include "entry.hpp"
#include "files.hpp"
#include "writer.hpp"

namespace caret {
    // a diagnostic laid out with its header, bordered source snippets and notes
    class RichDiagnostic {
    public:
        explicit RichDiagnostic(const Diagnostic& diagnostic) : m_diagnostic(diagnostic) {}

        // entries borrow from both the diagnostic and `files`
        [[nodiscard]] auto entries(const Files& files) const -> RenderResult<Vec<Entry>>;
        auto emit(const Files& files, WriteColor& writer, const Config& config) const
            -> RenderResult<void>;

    private:
        Ref<const Diagnostic> m_diagnostic;
    };

    // a diagnostic laid out as located headers only
    class ShortDiagnostic {
    public:
        explicit ShortDiagnostic(const Diagnostic& diagnostic) : m_diagnostic(diagnostic) {}

        [[nodiscard]] auto entries(const Files& files) const -> RenderResult<Vec<Entry>>;
        auto emit(const Files& files, WriteColor& writer, const Config& config) const
            -> RenderResult<void>;

    private:
        Ref<const Diagnostic> m_diagnostic;
    };
}  // namespace caret
