//
// Created by gregorian-rayne on 2/23/26.
//

#include "gcs/identity/identity.hpp"

#include <gtest/gtest.h>

namespace gcs::identity
{
    TEST(EmailTest, Validity) {
        EXPECT_TRUE(is_valid_email("alice@example.com"));
        EXPECT_TRUE(is_valid_email("a@b"));
        EXPECT_FALSE(is_valid_email(""));
        EXPECT_FALSE(is_valid_email("alice"));
        EXPECT_FALSE(is_valid_email("@example.com"));
        EXPECT_FALSE(is_valid_email("alice@"));
        EXPECT_FALSE(is_valid_email("a@b@c"));
        EXPECT_FALSE(is_valid_email("alice smith@example.com"));
    }

    TEST(CanonicalKeyTest, EmailWinsAndIsLowerCased) {
        EXPECT_EQ(canonical_key({"Alice", "Alice@Example.COM"}), "alice@example.com");
        EXPECT_EQ(canonical_key({"Someone Else", " alice@example.com "}), "alice@example.com");
    }

    TEST(CanonicalKeyTest, FallsBackToName) {
        EXPECT_EQ(canonical_key({"Alice Smith", ""}), "alice smith");
        EXPECT_EQ(canonical_key({"Alice Smith", "not-an-email"}), "alice smith");
    }

    TEST(CanonicalKeyTest, UnknownWhenNothingUsable) {
        EXPECT_EQ(canonical_key({"", ""}), kUnknownAuthor);
        EXPECT_EQ(canonical_key({"  ", "  "}), kUnknownAuthor);
    }

    TEST(CanonicalKeyTest, TransliterationMergesUmlautSpellings) {
        const Signature umlaut{"J\xC3\xBCrgen M\xC3\xBCller", ""};
        const Signature spelled{"Juergen Mueller", ""};
        EXPECT_NE(canonical_key(umlaut), canonical_key(spelled));
        EXPECT_EQ(canonical_key(umlaut, true), canonical_key(spelled, true));
        EXPECT_EQ(canonical_key(umlaut, true), "juergen mueller");
    }

    TEST(TransliterateTest, AllMappedLetters) {
        EXPECT_EQ(transliterate("\xC3\x84\xC3\xA4\xC3\x96\xC3\xB6\xC3\x9C\xC3\xBC\xC3\x9F"), "AeaeOeoeUeuess");
        // Other Latin-1 letters (e acute) stay as they are.
        EXPECT_EQ(transliterate("Ren\xC3\xA9"), "Ren\xC3\xA9");
        EXPECT_EQ(transliterate("plain"), "plain");
    }

    TEST(CoAuthorTrailerTest, ParsesStandardTrailer) {
        const auto sig = parse_co_author_trailer("Co-authored-by: Bob Jones <bob@example.com>");
        ASSERT_TRUE(sig.has_value());
        EXPECT_EQ(sig->name, "Bob Jones");
        EXPECT_EQ(sig->email, "bob@example.com");
    }

    TEST(CoAuthorTrailerTest, KeywordIsCaseInsensitive) {
        const auto sig = parse_co_author_trailer("  CO-AUTHORED-BY:Carol <carol@example.com>  ");
        ASSERT_TRUE(sig.has_value());
        EXPECT_EQ(sig->name, "Carol");
        EXPECT_EQ(sig->email, "carol@example.com");
    }

    TEST(CoAuthorTrailerTest, RepeatedKeyword) {
        const auto sig = parse_co_author_trailer("Co-authored-by: Co-authored-by: Dan <dan@example.com>");
        ASSERT_TRUE(sig.has_value());
        EXPECT_EQ(sig->name, "Dan");
    }

    TEST(CoAuthorTrailerTest, RejectsMalformedLines) {
        EXPECT_FALSE(parse_co_author_trailer("Signed-off-by: Bob <bob@example.com>").has_value());
        EXPECT_FALSE(parse_co_author_trailer("Co-authored-by: Bob").has_value());
        EXPECT_FALSE(parse_co_author_trailer("Co-authored-by: Bob <bob@example.com").has_value());
        EXPECT_FALSE(parse_co_author_trailer("Co-authored-by: <bob@example.com>").has_value());
        EXPECT_FALSE(parse_co_author_trailer("").has_value());
    }

    TEST(CoAuthorTrailerTest, EmptyEmailIsAllowed) {
        const auto sig = parse_co_author_trailer("Co-authored-by: Eve <>");
        ASSERT_TRUE(sig.has_value());
        EXPECT_EQ(sig->name, "Eve");
        EXPECT_TRUE(sig->email.empty());
    }

    TEST(ExtractCoAuthorsTest, CollectsInMessageOrder) {
        const std::string message =
            "Add parser\n"
            "\n"
            "Longer description.\n"
            "\n"
            "Co-authored-by: Bob <bob@example.com>\n"
            "co-authored-by: Carol <carol@example.com>\r\n"
            "Co-authored-by: not a trailer\n";

        const auto co_authors = extract_co_authors(message);
        ASSERT_EQ(co_authors.size(), 2u);
        EXPECT_EQ(co_authors[0].email, "bob@example.com");
        EXPECT_EQ(co_authors[1].email, "carol@example.com");
    }

    TEST(ExtractCoAuthorsTest, NoTrailers) {
        EXPECT_TRUE(extract_co_authors("Fix typo").empty());
        EXPECT_TRUE(extract_co_authors("").empty());
    }

}  // namespace gcs::identity
