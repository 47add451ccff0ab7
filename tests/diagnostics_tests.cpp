#include <gtest/gtest.h>

#include "diagnostics.hpp"

TEST(Diagnostic, BuilderAccumulatesLabelsAndNotes) {
    auto diagnostic = caret::Diagnostic::warning()
                          .with_code("W10")
                          .with_message("unused variable")
                          .with_labels({ caret::Label::primary(0, { 4, 5 }) })
                          .with_labels({ caret::Label::secondary(1, { 0, 3 }).with_message("here") })
                          .with_notes({ "prefix it with `_`" });

    EXPECT_EQ(diagnostic.severity(), caret::Severity::Warning);
    EXPECT_EQ(diagnostic.code(), "W10");
    EXPECT_EQ(diagnostic.message(), "unused variable");
    ASSERT_EQ(diagnostic.labels().size(), 2U);
    EXPECT_EQ(diagnostic.labels().at(0).style(), caret::LabelStyle::Primary);
    EXPECT_EQ(diagnostic.labels().at(1).file_id(), 1U);
    EXPECT_EQ(diagnostic.labels().at(1).message(), "here");
    EXPECT_EQ(diagnostic.notes().size(), 1U);
}

TEST(Diagnostic, SeveritiesAreOrdered) {
    EXPECT_LT(caret::Severity::Help, caret::Severity::Note);
    EXPECT_LT(caret::Severity::Note, caret::Severity::Warning);
    EXPECT_LT(caret::Severity::Warning, caret::Severity::Error);
    EXPECT_LT(caret::Severity::Error, caret::Severity::Bug);
    EXPECT_EQ(std::format("{}", caret::Severity::Bug), "bug");
}

TEST(Diagnostic, ReadsFromJson) {
    const auto json = caret::Json::parse(R"({
        "severity": "Error",
        "code": "E0308",
        "message": "mismatched types",
        "labels": [
            { "file": 0, "start": 16, "end": 19, "message": "expected `String`" },
            { "file": 1, "style": "secondary", "start": 14, "end": 17 }
        ],
        "notes": ["expected type `String`"]
    })");

    auto diagnostic = caret::Diagnostic::from_json(json);
    ASSERT_TRUE(diagnostic.has_value()) << diagnostic.error();
    EXPECT_EQ(diagnostic->severity(), caret::Severity::Error);
    EXPECT_EQ(diagnostic->code(), "E0308");
    ASSERT_EQ(diagnostic->labels().size(), 2U);

    const auto& primary = diagnostic->labels().at(0);
    EXPECT_EQ(primary.style(), caret::LabelStyle::Primary);
    EXPECT_EQ(primary.range(), (caret::ByteRange { .start = 16, .end = 19 }));
    EXPECT_EQ(primary.message(), "expected `String`");

    const auto& secondary = diagnostic->labels().at(1);
    EXPECT_EQ(secondary.style(), caret::LabelStyle::Secondary);
    EXPECT_TRUE(secondary.message().empty());
}

TEST(Diagnostic, MinimalJsonNeedsOnlySeverity) {
    auto diagnostic = caret::Diagnostic::from_json(caret::Json::parse(R"({ "severity": "note" })"));
    ASSERT_TRUE(diagnostic.has_value()) << diagnostic.error();
    EXPECT_FALSE(diagnostic->code().has_value());
    EXPECT_TRUE(diagnostic->message().empty());
    EXPECT_TRUE(diagnostic->labels().empty());
}

TEST(Diagnostic, RejectsMalformedJson) {
    const auto cases = {
        R"({ "message": "no severity" })",
        R"({ "severity": "fatal" })",
        R"({ "severity": 3 })",
        R"({ "severity": "error", "labels": [{ "file": 0, "style": "tertiary", "start": 0, "end": 1 }] })",
        R"({ "severity": "error", "labels": [{ "file": 0, "start": 0 }] })",
        R"({ "severity": "error", "labels": [{ "file": -1, "start": "zero", "end": 1 }] })",
    };

    for (const auto* text : cases) {
        auto diagnostic = caret::Diagnostic::from_json(caret::Json::parse(text));
        EXPECT_FALSE(diagnostic.has_value()) << text;
    }
}

TEST(Diagnostic, RejectsFileIdsOutsideTheIdRange) {
    const auto cases = {
        R"({ "file": 4294967297, "start": 0, "end": 1 })",
        R"({ "file": -1, "start": 0, "end": 1 })",
        R"({ "file": 1.5, "start": 0, "end": 1 })",
        R"({ "file": "0", "start": 0, "end": 1 })",
    };
    for (const auto* text : cases) {
        auto label = caret::Label::from_json(caret::Json::parse(text));
        EXPECT_FALSE(label.has_value()) << text;
    }

    auto largest = caret::Label::from_json(
        caret::Json::parse(R"({ "file": 4294967295, "start": 0, "end": 1 })")
    );
    ASSERT_TRUE(largest.has_value()) << largest.error();
    EXPECT_EQ(largest->file_id(), 4294967295U);
}

TEST(Diagnostic, WritesJson) {
    auto diagnostic = caret::Diagnostic::help().with_message("try this").with_labels({
        caret::Label::secondary(2, { 1, 4 }).with_message("there"),
    });

    const auto json = diagnostic.to_json();
    EXPECT_EQ(json.at("severity"), "help");
    EXPECT_FALSE(json.contains("code"));
    EXPECT_EQ(json.at("message"), "try this");
    EXPECT_TRUE(json.at("notes").empty());

    const auto& label = json.at("labels").at(0);
    EXPECT_EQ(label.at("file"), 2);
    EXPECT_EQ(label.at("style"), "secondary");
    EXPECT_EQ(label.at("start"), 1);
    EXPECT_EQ(label.at("end"), 4);
    EXPECT_EQ(label.at("message"), "there");
}
