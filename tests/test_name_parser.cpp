/**
 * @file test_name_parser.cpp
 * @brief Unit tests for stored file name parsing
 *
 * Covers decomposition, sanitation of the display name, the moved file
 * name format and the earliest-match rule for names with several UUIDs.
 */

#include <gtest/gtest.h>
#include "storagefile/exception/exceptions.h"
#include "storagefile/parser/name_parser.h"
#include "storagefile/utils/string_utils.h"
#include <random>

using namespace storagefile;
using parser::NameParser;
using domain::ParsedFileName;
using domain::UniqueId;

namespace {

const std::string kUuid = "85e16d7b-58ed-43bc-8dce-7d3ff7d69f41";

} // namespace

class NameParserTest : public ::testing::Test {};

// =============================================================================
// Basic decomposition
// =============================================================================

TEST_F(NameParserTest, Parse_Basic) {
    auto parsed = NameParser::parse("example_" + kUuid + ".png");
    EXPECT_EQ(parsed.getDisplayName(), "example");
    EXPECT_EQ(parsed.getUniqueId().getValue(), kUuid);
    EXPECT_EQ(parsed.getExtension(), "png");
    EXPECT_EQ(parsed.getMovedFileName(), "example_" + kUuid + ".png");
}

TEST_F(NameParserTest, Parse_HyphenatedDisplayName) {
    auto parsed = NameParser::parse("file-name_" + kUuid + ".jpg");
    EXPECT_EQ(parsed.getDisplayName(), "file-name");
    EXPECT_EQ(parsed.getExtension(), "jpg");
}

TEST_F(NameParserTest, Parse_UppercaseNormalized) {
    auto parsed = NameParser::parse("Scan_85E16D7B-58ED-43BC-8DCE-7D3FF7D69F41.PDF");
    EXPECT_EQ(parsed.getDisplayName(), "Scan");
    EXPECT_EQ(parsed.getUniqueId().getValue(), kUuid);
    EXPECT_EQ(parsed.getExtension(), "pdf");
}

TEST_F(NameParserTest, Parse_EmptyDisplayName) {
    auto parsed = NameParser::parse(kUuid + ".png");
    EXPECT_EQ(parsed.getDisplayName(), "");
    EXPECT_EQ(parsed.getMovedFileName(), "_" + kUuid + ".png");
}

TEST_F(NameParserTest, Parse_OnlySeparatorBeforeId) {
    auto parsed = NameParser::parse("_" + kUuid + ".png");
    EXPECT_EQ(parsed.getDisplayName(), "");
}

TEST_F(NameParserTest, Parse_NoExtension) {
    auto parsed = NameParser::parse("notes_" + kUuid);
    EXPECT_EQ(parsed.getExtension(), "");
    EXPECT_FALSE(parsed.hasExtension());
    EXPECT_EQ(parsed.getMovedFileName(), "notes_" + kUuid);
}

TEST_F(NameParserTest, Parse_MultiDotExtension) {
    auto parsed = NameParser::parse("backup_" + kUuid + ".tar.gz");
    EXPECT_EQ(parsed.getExtension(), "tar.gz");
}

TEST_F(NameParserTest, Parse_TailWithoutLeadingDot) {
    auto parsed = NameParser::parse("doc_" + kUuid + "-copy.txt");
    EXPECT_EQ(parsed.getExtension(), "txt");

    auto noDot = NameParser::parse("doc_" + kUuid + "-copy");
    EXPECT_EQ(noDot.getExtension(), "");
}

TEST_F(NameParserTest, Parse_NoSeparatorBeforeId) {
    auto parsed = NameParser::parse("photo" + kUuid + ".png");
    EXPECT_EQ(parsed.getDisplayName(), "photo");
}

TEST_F(NameParserTest, Parse_OnlyOneSeparatorStripped) {
    auto parsed = NameParser::parse("draft__" + kUuid + ".doc");
    EXPECT_EQ(parsed.getDisplayName(), "draft_");
}

// =============================================================================
// Sanitation
// =============================================================================

TEST_F(NameParserTest, Parse_CyrillicDisplayName) {
    auto parsed = NameParser::parse("Образец_для_заполнения_" + kUuid + ".png");
    EXPECT_EQ(parsed.getMovedFileName(), "___85e16d7b-58ed-43bc-8dce-7d3ff7d69f41.png");
}

TEST_F(NameParserTest, Parse_AsciiPunctuationReplaced) {
    auto parsed = NameParser::parse("my report (v2)_" + kUuid + ".pdf");
    EXPECT_EQ(parsed.getDisplayName(), "my_report__v2_");
}

TEST_F(NameParserTest, Parse_PlaceholderAsSeparator) {
    // '!' becomes '_' after the separator has been looked for
    auto parsed = NameParser::parse("name!" + kUuid + ".png");
    EXPECT_EQ(parsed.getDisplayName(), "name_");

    auto reparsed = NameParser::parse(parsed.getMovedFileName());
    EXPECT_EQ(reparsed, parsed);
}

TEST_F(NameParserTest, Parse_PathTraversalNeutralized) {
    auto parsed = NameParser::parse("../../etc/passwd_" + kUuid + "./../x");
    EXPECT_TRUE(utils::isStorageSafe(parsed.getDisplayName()));
    EXPECT_EQ(parsed.getMovedFileName().find('/'), std::string::npos);
}

TEST_F(NameParserTest, Parse_ExtensionSanitized) {
    auto parsed = NameParser::parse("a_" + kUuid + ".p n/g");
    EXPECT_EQ(parsed.getExtension(), "p_n_g");
}

TEST_F(NameParserTest, SanitizeDisplayName_Idempotent) {
    std::string once = NameParser::sanitizeDisplayName("Ünïcødé & spaces");
    EXPECT_EQ(NameParser::sanitizeDisplayName(once), once);
}

// =============================================================================
// Identifier selection
// =============================================================================

TEST_F(NameParserTest, Parse_EarliestIdentifierWins) {
    std::string later = "00000000-1111-2222-3333-444444444444";
    auto parsed = NameParser::parse("a_" + kUuid + "_" + later + ".png");
    EXPECT_EQ(parsed.getUniqueId().getValue(), kUuid);
    EXPECT_EQ(parsed.getDisplayName(), "a");
    EXPECT_EQ(parsed.getExtension(), "png");
}

TEST_F(NameParserTest, Parse_NoIdentifierThrows) {
    EXPECT_THROW(NameParser::parse("invalid-uuid.jpg"), exception::MalformedNameException);
    EXPECT_THROW(NameParser::parse(""), exception::MalformedNameException);
    EXPECT_THROW(NameParser::parse("photo.png"), exception::MalformedNameException);
}

TEST_F(NameParserTest, Parse_MalformedCarriesCodeAndInput) {
    try {
        NameParser::parse("photo.png");
        FAIL() << "Expected MalformedNameException";
    } catch (const exception::MalformedNameException& e) {
        EXPECT_EQ(e.getCode(), "MALFORMED_FILE_NAME");
        EXPECT_EQ(e.getRawName(), "photo.png");
    }
}

TEST_F(NameParserTest, Parse_TruncatedIdentifierThrows) {
    EXPECT_THROW(NameParser::parse("x_" + kUuid.substr(0, 35) + ".png"),
                 exception::MalformedNameException);
}

// =============================================================================
// Round trip
// =============================================================================

TEST_F(NameParserTest, RoundTrip_SafeDisplayNames) {
    std::mt19937 rng(20240611);
    const std::string alphabet =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789-_";
    const std::string extensions[] = {"", "png", "jpg", "tar.gz", "pdf"};

    for (int i = 0; i < 200; ++i) {
        std::uniform_int_distribution<size_t> lenDist(0, 24);
        std::uniform_int_distribution<size_t> charDist(0, alphabet.size() - 1);

        std::string display;
        size_t len = lenDist(rng);
        for (size_t j = 0; j < len; ++j) {
            display += alphabet[charDist(rng)];
        }

        ParsedFileName original(display, UniqueId::generate(), extensions[i % 5]);
        auto reparsed = NameParser::parse(original.getMovedFileName());

        EXPECT_EQ(reparsed.getDisplayName(), original.getDisplayName());
        EXPECT_EQ(reparsed.getUniqueId(), original.getUniqueId());
        EXPECT_EQ(reparsed.getExtension(), original.getExtension());
    }
}

// =============================================================================
// Composition of new upload names
// =============================================================================

TEST_F(NameParserTest, Compose_FromOriginalName) {
    auto id = UniqueId::of(kUuid);
    auto composed = NameParser::compose("Quarterly Report.PDF", id);

    EXPECT_EQ(composed.getDisplayName(), "Quarterly_Report");
    EXPECT_EQ(composed.getExtension(), "pdf");
    EXPECT_EQ(composed.getMovedFileName(), "Quarterly_Report_" + kUuid + ".pdf");
}

TEST_F(NameParserTest, Compose_WithoutExtension) {
    auto composed = NameParser::compose("README", UniqueId::of(kUuid));
    EXPECT_EQ(composed.getMovedFileName(), "README_" + kUuid);
}

TEST_F(NameParserTest, Compose_ParsesBack) {
    auto composed = NameParser::compose("Образец_для_заполнения.png", UniqueId::generate());
    EXPECT_EQ(NameParser::parse(composed.getMovedFileName()), composed);
}

TEST_F(NameParserTest, Compose_ReuploadKeepsNewIdentifier) {
    auto id = UniqueId::of("00000000-1111-2222-3333-444444444444");
    auto composed = NameParser::compose("report_" + kUuid + ".pdf", id);

    EXPECT_EQ(composed.getDisplayName(), "report_85e16d7b_58ed_43bc_8dce_7d3ff7d69f41");
    EXPECT_FALSE(UniqueId::findFirst(composed.getDisplayName()).has_value());

    auto parsed = NameParser::parse(composed.getMovedFileName());
    EXPECT_EQ(parsed.getUniqueId(), id);
    EXPECT_EQ(parsed, composed);
}

TEST_F(NameParserTest, Compose_IdentifierFormedBySanitationIsBroken) {
    // dropping the non-ASCII letter joins the pieces into a UUID shape
    auto id = UniqueId::generate();
    auto composed = NameParser::compose("85e16d7bé-58ed-43bc-8dce-7d3ff7d69f41.txt", id);

    EXPECT_EQ(composed.getDisplayName(), "85e16d7b_58ed_43bc_8dce_7d3ff7d69f41");
    EXPECT_EQ(NameParser::parse(composed.getMovedFileName()).getUniqueId(), id);
}

// =============================================================================
// ParsedFileName invariants
// =============================================================================

TEST_F(NameParserTest, ParsedFileName_RejectsUnsafeDisplayName) {
    EXPECT_THROW(ParsedFileName("bad name", UniqueId::of(kUuid), "png"),
                 exception::DomainException);
}

TEST_F(NameParserTest, ParsedFileName_RejectsUppercaseExtension) {
    EXPECT_THROW(ParsedFileName("ok", UniqueId::of(kUuid), "PNG"),
                 exception::DomainException);
}
