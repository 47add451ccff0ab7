#include "term.hpp"

#include "layout.hpp"

namespace caret {
    auto render(
        const Diagnostic& diagnostic,
        const Files& files,
        WriteColor& writer,
        const Config& config
    ) -> RenderResult<void> {
        return RichDiagnostic(diagnostic).emit(files, writer, config);
    }

    auto render_short(
        const Diagnostic& diagnostic,
        const Files& files,
        WriteColor& writer,
        const Config& config
    ) -> RenderResult<void> {
        return ShortDiagnostic(diagnostic).emit(files, writer, config);
    }

    auto emit(
        WriteColor& writer,
        const Config& config,
        const Files& files,
        const Diagnostic& diagnostic
    ) -> RenderResult<void> {
        switch (config.display_style) {
            case DisplayStyle::Rich:
                return render(diagnostic, files, writer, config);
            case DisplayStyle::Short:
                return render_short(diagnostic, files, writer, config);
        }
        return render(diagnostic, files, writer, config);
    }
}  // namespace caret
