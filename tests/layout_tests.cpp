#include <gtest/gtest.h>

#include "layout.hpp"

namespace {
    // line 2 starts at 12, line 3 at 29, line 4 at 40, line 5 at 47
    constexpr std::string_view CALL_SOURCE = "fn main() {\n"
                                             "    let x = foo(\n"
                                             "        1,\n"
                                             "    );\n"
                                             "}\n";

    template<typename T>
    auto entries_of(const caret::Vec<caret::Entry>& entries) -> caret::Vec<T> {
        caret::Vec<T> matching;
        for (const auto& entry : entries) {
            if (const auto* value = std::get_if<T>(&entry)) {
                matching.push_back(*value);
            }
        }
        return matching;
    }

    auto only_mark(const caret::entry::SourceLine& line) -> const caret::LineMark& {
        EXPECT_EQ(line.marks.size(), 1U);
        EXPECT_TRUE(line.marks.front().has_value());
        return *line.marks.front();
    }
}  // namespace

TEST(RichLayout, SingleLineLabel) {
    caret::SimpleFiles files;
    const auto file_id = files.add("test", "foo\nbar\n");
    auto diagnostic = caret::Diagnostic::error().with_code("E0001").with_message("bad").with_labels({
        caret::Label::primary(file_id, { 4, 7 }).with_message("oops"),
    });

    auto entries = caret::RichDiagnostic(diagnostic).entries(files);
    ASSERT_TRUE(entries.has_value()) << entries.error().message();
    ASSERT_EQ(entries->size(), 7U);

    const auto& header = std::get<caret::entry::Header>(entries->at(0));
    EXPECT_FALSE(header.locus.has_value());
    EXPECT_EQ(header.severity, caret::Severity::Error);
    EXPECT_EQ(header.code, "E0001");
    EXPECT_EQ(header.message, "bad");

    EXPECT_TRUE(std::holds_alternative<caret::entry::Empty>(entries->at(1)));

    const auto& start = std::get<caret::entry::SourceStart>(entries->at(2));
    EXPECT_EQ(start.outer_padding, 1U);
    EXPECT_EQ(start.locus, caret::Locus("test", 2, 1));

    EXPECT_TRUE(std::holds_alternative<caret::entry::SourceEmpty>(entries->at(3)));

    const auto& line = std::get<caret::entry::SourceLine>(entries->at(4));
    EXPECT_EQ(line.line_number, 2U);
    EXPECT_EQ(line.source, "bar\n");
    const auto& line_mark = only_mark(line);
    EXPECT_EQ(line_mark.severity, caret::Severity::Error);
    const auto& single = std::get<caret::mark::Single>(line_mark.mark);
    EXPECT_EQ(single.start, 0U);
    EXPECT_EQ(single.end, 3U);
    EXPECT_EQ(single.message, "oops");

    EXPECT_TRUE(std::holds_alternative<caret::entry::SourceEmpty>(entries->at(5)));
    EXPECT_TRUE(std::holds_alternative<caret::entry::Empty>(entries->at(6)));
}

TEST(RichLayout, MultiLineLabelAfterCodeStartsWithTopUnderline) {
    caret::SimpleFiles files;
    const auto file_id = files.add("test", std::string(CALL_SOURCE));
    auto diagnostic = caret::Diagnostic::error().with_message("bad call").with_labels({
        caret::Label::primary(file_id, { 24, 45 }).with_message("unclosed call"),
    });

    auto entries = caret::RichDiagnostic(diagnostic).entries(files);
    ASSERT_TRUE(entries.has_value()) << entries.error().message();

    const auto start = entries_of<caret::entry::SourceStart>(*entries);
    ASSERT_EQ(start.size(), 1U);
    EXPECT_EQ(start.front().locus, caret::Locus("test", 2, 13));

    const auto lines = entries_of<caret::entry::SourceLine>(*entries);
    ASSERT_EQ(lines.size(), 3U);

    EXPECT_EQ(lines.at(0).line_number, 2U);
    const auto& top = std::get<caret::mark::MultiTop>(only_mark(lines.at(0)).mark);
    EXPECT_EQ(top.end, 12U);

    EXPECT_EQ(lines.at(1).line_number, 3U);
    EXPECT_TRUE(std::holds_alternative<caret::mark::MultiLeft>(only_mark(lines.at(1)).mark));

    EXPECT_EQ(lines.at(2).line_number, 4U);
    const auto& bottom = std::get<caret::mark::MultiBottom>(only_mark(lines.at(2)).mark);
    EXPECT_EQ(bottom.end, 5U);
    EXPECT_EQ(bottom.message, "unclosed call");
}

TEST(RichLayout, MultiLineLabelAfterIndentationStartsWithTopLeft) {
    caret::SimpleFiles files;
    const auto file_id = files.add("test", std::string(CALL_SOURCE));
    auto diagnostic = caret::Diagnostic::error().with_labels({
        caret::Label::secondary(file_id, { 16, 45 }),
    });

    auto entries = caret::RichDiagnostic(diagnostic).entries(files);
    ASSERT_TRUE(entries.has_value());

    const auto lines = entries_of<caret::entry::SourceLine>(*entries);
    ASSERT_EQ(lines.size(), 3U);
    const auto& first = only_mark(lines.at(0));
    EXPECT_TRUE(std::holds_alternative<caret::mark::MultiTopLeft>(first.mark));
    EXPECT_FALSE(first.severity.has_value());
}

TEST(RichLayout, UnicodeWhitespacePrefixStartsWithTopLeft) {
    caret::SimpleFiles files;
    // U+3000 ideographic space and U+00A0 no-break space before "foo(", then "1)"
    const auto file_id = files.add("test", "\xE3\x80\x80\xC2\xA0" "foo(\n1)\n");
    auto diagnostic = caret::Diagnostic::error().with_labels({
        caret::Label::primary(file_id, { 5, 12 }),
    });

    auto entries = caret::RichDiagnostic(diagnostic).entries(files);
    ASSERT_TRUE(entries.has_value());

    const auto lines = entries_of<caret::entry::SourceLine>(*entries);
    ASSERT_EQ(lines.size(), 2U);
    EXPECT_TRUE(std::holds_alternative<caret::mark::MultiTopLeft>(only_mark(lines.at(0)).mark));
    EXPECT_EQ(std::get<caret::mark::MultiBottom>(only_mark(lines.at(1)).mark).end, 2U);
}

TEST(RichLayout, RangeEndingOnALineStartSpansIntoThatLine) {
    caret::SimpleFiles files;
    const auto file_id = files.add("test", "foo\nbar\n");
    auto diagnostic = caret::Diagnostic::error().with_labels({
        caret::Label::primary(file_id, { 0, 4 }),
    });

    auto entries = caret::RichDiagnostic(diagnostic).entries(files);
    ASSERT_TRUE(entries.has_value());

    const auto lines = entries_of<caret::entry::SourceLine>(*entries);
    ASSERT_EQ(lines.size(), 2U);
    EXPECT_TRUE(std::holds_alternative<caret::mark::MultiTopLeft>(only_mark(lines.at(0)).mark));
    EXPECT_EQ(lines.at(1).line_number, 2U);
    EXPECT_EQ(std::get<caret::mark::MultiBottom>(only_mark(lines.at(1)).mark).end, 0U);
}

TEST(RichLayout, LabelsInOneFileAreSeparatedByBreaks) {
    caret::SimpleFiles files;
    const auto file_id = files.add("test", "one\ntwo\nthree\n");
    auto diagnostic = caret::Diagnostic::warning().with_labels({
        caret::Label::primary(file_id, { 8, 13 }),
        caret::Label::secondary(file_id, { 0, 3 }),
    });

    auto entries = caret::RichDiagnostic(diagnostic).entries(files);
    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries->size(), 9U);

    EXPECT_TRUE(std::holds_alternative<caret::entry::SourceStart>(entries->at(2)));
    EXPECT_EQ(std::get<caret::entry::SourceStart>(entries->at(2)).locus, caret::Locus("test", 1, 1));
    EXPECT_TRUE(std::holds_alternative<caret::entry::SourceEmpty>(entries->at(3)));
    EXPECT_EQ(std::get<caret::entry::SourceLine>(entries->at(4)).line_number, 1U);
    EXPECT_TRUE(std::holds_alternative<caret::entry::SourceBreak>(entries->at(5)));
    EXPECT_EQ(std::get<caret::entry::SourceLine>(entries->at(6)).line_number, 3U);
    EXPECT_TRUE(std::holds_alternative<caret::entry::SourceEmpty>(entries->at(7)));
    EXPECT_TRUE(std::holds_alternative<caret::entry::Empty>(entries->at(8)));
}

TEST(RichLayout, EachFileGetsItsOwnSnippetAndNotesComeLast) {
    caret::SimpleFiles files;
    const auto lib = files.add("lib.fun", "pub fn f() -> Int\n");
    const auto main = files.add("main.fun", "let s: String = f()\n");
    auto diagnostic = caret::Diagnostic::error()
                          .with_message("mismatched types")
                          .with_labels({
                              caret::Label::primary(main, { 16, 19 }).with_message("expected String"),
                              caret::Label::secondary(lib, { 14, 17 }).with_message("declared here"),
                          })
                          .with_notes({ "expected type `String`", "found type `Int`" });

    auto entries = caret::RichDiagnostic(diagnostic).entries(files);
    ASSERT_TRUE(entries.has_value());

    const auto starts = entries_of<caret::entry::SourceStart>(*entries);
    ASSERT_EQ(starts.size(), 2U);
    EXPECT_EQ(starts.at(0).locus, caret::Locus("main.fun", 1, 17));
    EXPECT_EQ(starts.at(1).locus, caret::Locus("lib.fun", 1, 15));

    const auto notes = entries_of<caret::entry::SourceNote>(*entries);
    ASSERT_EQ(notes.size(), 2U);
    EXPECT_EQ(notes.at(0).message, "expected type `String`");
    EXPECT_EQ(notes.at(1).message, "found type `Int`");

    ASSERT_GE(entries->size(), 3U);
    EXPECT_TRUE(std::holds_alternative<caret::entry::SourceNote>(entries->at(entries->size() - 2)));
    EXPECT_TRUE(std::holds_alternative<caret::entry::Empty>(entries->back()));
}

TEST(RichLayout, LocusColumnCountsCharacters) {
    caret::SimpleFiles files;
    // 🗻∈🌏 followed by " x"
    const auto file_id = files.add("test", "\xF0\x9F\x97\xBB\xE2\x88\x88\xF0\x9F\x8C\x8F x\n");
    auto diagnostic = caret::Diagnostic::error().with_labels({
        caret::Label::primary(file_id, { 12, 13 }),
    });

    auto entries = caret::RichDiagnostic(diagnostic).entries(files);
    ASSERT_TRUE(entries.has_value());
    const auto starts = entries_of<caret::entry::SourceStart>(*entries);
    ASSERT_EQ(starts.size(), 1U);
    EXPECT_EQ(starts.front().locus, caret::Locus("test", 1, 5));
}

TEST(RichLayout, DiagnosticWithoutLabelsIsHeaderAndNotes) {
    caret::SimpleFiles files;
    auto diagnostic =
        caret::Diagnostic::error().with_code("E0002").with_message("bad config").with_notes({ "see docs" });

    auto entries = caret::RichDiagnostic(diagnostic).entries(files);
    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries->size(), 3U);
    EXPECT_TRUE(std::holds_alternative<caret::entry::Header>(entries->at(0)));
    EXPECT_EQ(std::get<caret::entry::SourceNote>(entries->at(1)).outer_padding, 0U);
    EXPECT_TRUE(std::holds_alternative<caret::entry::Empty>(entries->at(2)));
}

TEST(RichLayout, ResolutionFailureAbortsTheLayout) {
    caret::SimpleFiles files;
    const auto file_id = files.add("test", "abc\n");
    auto diagnostic = caret::Diagnostic::error().with_labels({
        caret::Label::primary(file_id, { 0, 1 }),
        caret::Label::primary(file_id, { 1, 99 }),
    });

    auto entries = caret::RichDiagnostic(diagnostic).entries(files);
    ASSERT_FALSE(entries.has_value());
    EXPECT_EQ(entries.error().kind(), caret::RenderError::Kind::IndexTooLarge);
}

TEST(RichLayout, EntriesAreDeterministic) {
    caret::SimpleFiles files;
    const auto file_id = files.add("test", std::string(CALL_SOURCE));
    auto diagnostic = caret::Diagnostic::bug().with_labels({
        caret::Label::primary(file_id, { 24, 45 }).with_message("here"),
        caret::Label::secondary(file_id, { 0, 2 }).with_message("there"),
    });

    auto first = caret::RichDiagnostic(diagnostic).entries(files);
    auto second = caret::RichDiagnostic(diagnostic).entries(files);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(caret::to_json(*first), caret::to_json(*second));
}

TEST(ShortLayout, OneHeaderPerPrimaryLabel) {
    caret::SimpleFiles files;
    const auto file_id = files.add("test", "foo\nbar\n");
    auto diagnostic = caret::Diagnostic::error().with_message("bad").with_labels({
        caret::Label::primary(file_id, { 5, 6 }),
        caret::Label::secondary(file_id, { 0, 1 }),
        caret::Label::primary(file_id, { 1, 2 }),
    });

    auto entries = caret::ShortDiagnostic(diagnostic).entries(files);
    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries->size(), 2U);
    EXPECT_EQ(std::get<caret::entry::Header>(entries->at(0)).locus, caret::Locus("test", 2, 2));
    EXPECT_EQ(std::get<caret::entry::Header>(entries->at(1)).locus, caret::Locus("test", 1, 2));
}

TEST(ShortLayout, NoPrimaryLabelsGivesOneUnlocatedHeader) {
    caret::SimpleFiles files;
    const auto file_id = files.add("test", "foo\n");
    auto diagnostic = caret::Diagnostic::warning().with_labels({
        caret::Label::secondary(file_id, { 0, 1 }),
    });

    auto entries = caret::ShortDiagnostic(diagnostic).entries(files);
    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries->size(), 1U);
    EXPECT_FALSE(std::get<caret::entry::Header>(entries->front()).locus.has_value());
}

TEST(EntryJson, DescribesMarks) {
    caret::SimpleFiles files;
    const auto file_id = files.add("test", "foo\nbar\n");
    auto diagnostic = caret::Diagnostic::error().with_labels({
        caret::Label::secondary(file_id, { 4, 7 }).with_message("oops"),
    });

    auto entries = caret::RichDiagnostic(diagnostic).entries(files);
    ASSERT_TRUE(entries.has_value());

    const auto json = caret::to_json(entries->at(4));
    EXPECT_EQ(json.at("kind"), "source_line");
    EXPECT_EQ(json.at("line_number"), 2);
    const auto& mark = json.at("marks").at(0);
    EXPECT_EQ(mark.at("kind"), "single");
    EXPECT_EQ(mark.at("start"), 0);
    EXPECT_EQ(mark.at("end"), 3);
    EXPECT_TRUE(mark.at("severity").is_null());
}
