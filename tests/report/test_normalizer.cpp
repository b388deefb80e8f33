#include "decode/structured_token.hpp"
#include "report/normalizer.hpp"
#include "support/captured_stream.hpp"

#include <gtest/gtest.h>

#include <source_location>
#include <string>
#include <vector>

using namespace parsediag;

// ============================================================================
// Test helpers
// ============================================================================

static NormalizedMessage norm(ErrorPrefix prefix, std::string token) {
    return normalize_message(RawErrorFragment{std::move(prefix), std::move(token)});
}

static NormalizedMessage before(std::string token) {
    return norm(ErrorPrefix::plain(std::string(kSyntaxErrorBefore)), std::move(token));
}

static std::string_view rule_for(ErrorPrefix prefix, std::string token) {
    return matching_rule(RawErrorFragment{std::move(prefix), std::move(token)}).name;
}

// ============================================================================
// Rule table
// ============================================================================

TEST(NormalizationRulesTest, Order) {
    std::vector<std::string_view> names;
    for (const auto& rule : normalization_rules()) {
        names.push_back(rule.name);
    }
    std::vector<std::string_view> expected = {
        "incomplete-expression", "missing-token", "end-of-line",   "dangling-end", "sigil",
        "quoted-alias",          "wrapped-list",  "prefix-suffix", "plain",
    };
    EXPECT_EQ(names, expected);
}

TEST(NormalizationRulesTest, LastRuleMatchesEverything) {
    const auto& last = normalization_rules().back();
    EXPECT_TRUE(last.matches(RawErrorFragment{ErrorPrefix::plain(""), ""}));
    EXPECT_TRUE(last.matches(RawErrorFragment{ErrorPrefix::wrapping("a", "b"), "['X']"}));
}

TEST(NormalizationRulesTest, IncompleteExpressionBeatsMissingToken) {
    EXPECT_EQ(rule_for(ErrorPrefix::plain(std::string(kSyntaxErrorBefore)), ""),
              "incomplete-expression");
    EXPECT_EQ(rule_for(ErrorPrefix::plain("missing terminator: end"), ""), "missing-token");
}

TEST(NormalizationRulesTest, AliasBeatsList) {
    EXPECT_EQ(rule_for(ErrorPrefix::plain(std::string(kSyntaxErrorBefore)), "['Foo']"),
              "quoted-alias");
    EXPECT_EQ(rule_for(ErrorPrefix::plain(std::string(kSyntaxErrorBefore)), "[<<\"x\">>]"),
              "wrapped-list");
}

TEST(NormalizationRulesTest, PairPrefixSkipsListRules) {
    EXPECT_EQ(rule_for(ErrorPrefix::wrapping("a", "b"), "['Foo']"), "prefix-suffix");
    EXPECT_EQ(rule_for(ErrorPrefix::wrapping("a", "b"), "[1]"), "prefix-suffix");
}

// ============================================================================
// Rewrites
// ============================================================================

TEST(NormalizeTest, IncompleteExpression) {
    auto msg = before("");
    EXPECT_EQ(msg.kind, DiagnosticKind::TokenMissingError);
    EXPECT_EQ(msg.message, "syntax error: expression is incomplete");
}

TEST(NormalizeTest, MissingTokenKeepsPrefix) {
    auto msg = norm(ErrorPrefix::plain("missing terminator: end"), "");
    EXPECT_EQ(msg.kind, DiagnosticKind::TokenMissingError);
    EXPECT_EQ(msg.message, "missing terminator: end");
}

TEST(NormalizeTest, MissingTokenWithPairPrefix) {
    auto msg = norm(ErrorPrefix::wrapping("missing terminator: ) ", "(for \"(\" at line 1)"), "");
    EXPECT_EQ(msg.kind, DiagnosticKind::TokenMissingError);
    EXPECT_EQ(msg.message, "missing terminator: ) (for \"(\" at line 1)");
}

TEST(NormalizeTest, EndOfLine) {
    auto msg = before("eol");
    EXPECT_EQ(msg.kind, DiagnosticKind::SyntaxError);
    EXPECT_EQ(msg.message,
              "unexpectedly reached end of line. The current expression is invalid or incomplete");
}

TEST(NormalizeTest, EndOfLineNeedsSyntaxErrorPrefix) {
    auto msg = norm(ErrorPrefix::plain("unexpected "), "eol");
    EXPECT_EQ(msg.message, "unexpected eol");
}

TEST(NormalizeTest, DanglingEnd) {
    auto msg = before("'end'");
    EXPECT_EQ(msg.kind, DiagnosticKind::SyntaxError);
    EXPECT_EQ(msg.message, "unexpected token: end");
}

TEST(NormalizeTest, Sigil) {
    auto msg = before("{sigil,{1,5,nil},115,[<<\"foo\">>],[],nil}");
    EXPECT_EQ(msg.kind, DiagnosticKind::SyntaxError);
    EXPECT_EQ(msg.message, "syntax error before: sigil ~s starting with content 'foo'");
}

TEST(NormalizeTest, SigilWithInterpolationHasEmptyContent) {
    auto msg = before("{sigil,1,$r,[{'{',[],[x]}],[],nil}");
    EXPECT_EQ(msg.message, "syntax error before: sigil ~r starting with content ''");
}

TEST(NormalizeTest, SigilLetterIsUtf8) {
    auto msg = before("{sigil,1,955,[<<\"a\">>],[],nil}");
    EXPECT_EQ(msg.message, "syntax error before: sigil ~\xCE\xBB starting with content 'a'");
}

TEST(NormalizeTest, SigilWithOtherPrefixIsPlain) {
    auto msg = norm(ErrorPrefix::plain("unexpected: "), "{sigil,1,115,[<<\"a\">>],[],nil}");
    EXPECT_EQ(msg.message, "unexpected: {sigil,1,115,[<<\"a\">>],[],nil}");
}

TEST(NormalizeTest, QuotedAlias) {
    auto msg = before("['Foo.Bar']");
    EXPECT_EQ(msg.kind, DiagnosticKind::SyntaxError);
    EXPECT_EQ(msg.message, "syntax error before: Foo.Bar");
}

TEST(NormalizeTest, WrappedListQuotesFirstBinary) {
    auto msg = before("[<<\"hello\">>]");
    EXPECT_EQ(msg.kind, DiagnosticKind::SyntaxError);
    EXPECT_EQ(msg.message, "syntax error before: \"hello\"");
}

TEST(NormalizeTest, WrappedListWithoutBinary) {
    EXPECT_EQ(before("[1]").message, "syntax error before: \"");
    EXPECT_EQ(before("[]").message, "syntax error before: \"");
}

TEST(NormalizeTest, WrappedListWithImproperTail) {
    EXPECT_EQ(before("[<<\"x\">>|foo]").message, "syntax error before: \"x\"");
}

TEST(NormalizeTest, PrefixSuffixPair) {
    auto msg = norm(ErrorPrefix::wrapping("unexpected ", ". Did you mean?"), "foo");
    EXPECT_EQ(msg.kind, DiagnosticKind::SyntaxError);
    EXPECT_EQ(msg.message, "unexpected foo. Did you mean?");
}

TEST(NormalizeTest, Plain) {
    auto msg = norm(ErrorPrefix::plain("X"), "Y");
    EXPECT_EQ(msg.kind, DiagnosticKind::SyntaxError);
    EXPECT_EQ(msg.message, "XY");
}

// ============================================================================
// Decode failures
// ============================================================================

TEST(NormalizeTest, MalformedSigilThrows) {
    EXPECT_THROW((void)before("{sigil,1,115,[],[],nil}"), TermDecodeError);
}

TEST(NormalizeTest, UnparsableListThrows) {
    EXPECT_THROW((void)before("[<<\"open"), TermDecodeError);
}

TEST(NormalizeTest, DeeplyNestedTokenThrows) {
    std::string deep = std::string(100000, '[') + std::string(100000, ']');
    EXPECT_THROW((void)before(deep), TermDecodeError);
}

TEST(NormalizeTest, SeveralAliasesThrow) {
    EXPECT_THROW((void)before("['a','b']"), TermDecodeError);
}

// ============================================================================
// normalize / parse_error
// ============================================================================

TEST(NormalizeTest, BuildsDiagnostic) {
    auto diag = normalize(3, "lib/a.ex",
                          RawErrorFragment{ErrorPrefix::plain(std::string(kSyntaxErrorBefore)),
                                           "'end'"});
    Diagnostic expected{DiagnosticKind::SyntaxError, "unexpected token: end", "lib/a.ex", 3};
    EXPECT_EQ(diag, expected);
}

TEST(NormalizeTest, MissingLineBecomesZero) {
    auto diag = normalize(std::nullopt, "a.ex", RawErrorFragment{ErrorPrefix::plain("X"), "Y"});
    EXPECT_EQ(diag.line, 0u);
}

TEST(ParseErrorTest, RaisesNormalizedDiagnostic) {
    auto prefix = ErrorPrefix::plain(std::string(kSyntaxErrorBefore));
    try {
        parse_error(5, "lib/a.ex", prefix, "");
        FAIL() << "parse_error returned";
    } catch (const TokenMissingError& e) {
        EXPECT_EQ(e.diagnostic(), normalize(5, "lib/a.ex", RawErrorFragment{prefix, ""}));
    }
}

TEST(ParseErrorTest, ThrowsSyntaxError) {
    auto prefix = ErrorPrefix::plain(std::string(kSyntaxErrorBefore));
    EXPECT_THROW(parse_error(1, "a.ex", prefix, "eol"), SyntaxError);
    EXPECT_THROW(parse_error(1, "a.ex", prefix, "['Foo']"), SyntaxError);
}

TEST(ParseErrorTest, DecodeFailurePropagates) {
    auto prefix = ErrorPrefix::plain(std::string(kSyntaxErrorBefore));
    EXPECT_THROW(parse_error(1, "a.ex", prefix, "['a','b']"), TermDecodeError);
}

TEST(ParseErrorTest, OriginIsTheCaller) {
    auto prefix = ErrorPrefix::plain("X");
    std::source_location here;
    try {
        here = std::source_location::current(); parse_error(1, "a.ex", prefix, "Y");
        FAIL() << "parse_error returned";
    } catch (const DiagnosticError& e) {
        EXPECT_EQ(e.origin().line(), here.line());
        EXPECT_STREQ(e.origin().file_name(), here.file_name());
    }
}

TEST(ParseErrorTest, WritesNothing) {
    test_support::CapturedStream out;
    EXPECT_THROW(parse_error(1, "a.ex", ErrorPrefix::plain("X"), "Y"), SyntaxError);
    EXPECT_EQ(out.contents(), "");
}
