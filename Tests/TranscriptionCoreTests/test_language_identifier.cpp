#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "LanguageIdentifier.hpp"

#include <stdexcept>

using namespace vnt;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace {

const std::vector<std::string> kSupported = {"en", "hi", "gu", "mr"};

class MockLanguageIdentifier : public LanguageIdentifier {
public:
    MOCK_METHOD(LanguageGuess, identify, (const std::string& text), (const, override));
};

LanguageGuess guess(const std::string& code) {
    LanguageGuess g;
    g.language_code = code;
    g.confidence = 0.9f;
    return g;
}

} // namespace

// ---------------------------------------------------------------------------
// ScriptLanguageIdentifier
// ---------------------------------------------------------------------------

class ScriptLanguageIdentifierTest : public ::testing::Test {
protected:
    ScriptLanguageIdentifier identifier_;
};

TEST_F(ScriptLanguageIdentifierTest, LatinIsEnglish) {
    EXPECT_EQ(identifier_.identify("Take two tablets after dinner.").language_code, "en");
}

TEST_F(ScriptLanguageIdentifierTest, DevanagariWithHindiStopWordsIsHindi) {
    EXPECT_EQ(identifier_.identify("यह दवा खाने के बाद लेनी है").language_code, "hi");
}

TEST_F(ScriptLanguageIdentifierTest, DevanagariWithMarathiStopWordsIsMarathi) {
    EXPECT_EQ(identifier_.identify("हे औषध जेवणानंतर घ्या आणि पाणी प्या").language_code, "mr");
}

TEST_F(ScriptLanguageIdentifierTest, GujaratiScriptIsGujarati) {
    EXPECT_EQ(identifier_.identify("આ દવા જમ્યા પછી લેવી").language_code, "gu");
}

TEST_F(ScriptLanguageIdentifierTest, DigitsOnlyAreUndetermined) {
    LanguageGuess g = identifier_.identify("12 34 56");
    EXPECT_EQ(g.language_code, kUndeterminedLanguage);
    EXPECT_FLOAT_EQ(g.confidence, 0.0f);
}

// ---------------------------------------------------------------------------
// detect_language_or_default
// ---------------------------------------------------------------------------

class DetectLanguageTest : public ::testing::Test {
protected:
    MockLanguageIdentifier mock_;
};

TEST_F(DetectLanguageTest, BlankTextSkipsIdentifier) {
    EXPECT_CALL(mock_, identify(_)).Times(0);
    EXPECT_EQ(detect_language_or_default(&mock_, "   \n\t", "en", kSupported), "en");
    EXPECT_EQ(detect_language_or_default(&mock_, "", "hi", kSupported), "hi");
}

TEST_F(DetectLanguageTest, SupportedResultIsReturned) {
    EXPECT_CALL(mock_, identify("namaste")).WillOnce(Return(guess("hi")));
    EXPECT_EQ(detect_language_or_default(&mock_, "namaste", "en", kSupported), "hi");
}

TEST_F(DetectLanguageTest, UndeterminedFallsBack) {
    EXPECT_CALL(mock_, identify(_)).WillOnce(Return(guess(kUndeterminedLanguage)));
    EXPECT_EQ(detect_language_or_default(&mock_, "hmm", "en", kSupported), "en");
}

TEST_F(DetectLanguageTest, UnsupportedLanguageFallsBack) {
    EXPECT_CALL(mock_, identify(_)).WillOnce(Return(guess("fr")));
    EXPECT_EQ(detect_language_or_default(&mock_, "bonjour", "en", kSupported), "en");
}

TEST_F(DetectLanguageTest, EmptySupportedListAcceptsAnything) {
    EXPECT_CALL(mock_, identify(_)).WillOnce(Return(guess("fr")));
    EXPECT_EQ(detect_language_or_default(&mock_, "bonjour", "en", {}), "fr");
}

TEST_F(DetectLanguageTest, IdentifierFailureFallsBack) {
    EXPECT_CALL(mock_, identify(_)).WillOnce(Throw(std::runtime_error("model missing")));
    EXPECT_EQ(detect_language_or_default(&mock_, "some text", "mr", kSupported), "mr");
}

TEST_F(DetectLanguageTest, NullIdentifierFallsBack) {
    EXPECT_EQ(detect_language_or_default(nullptr, "some text", "gu", kSupported), "gu");
}

// ---------------------------------------------------------------------------
// resolve_language
// ---------------------------------------------------------------------------

class ResolveLanguageTest : public ::testing::Test {
protected:
    MockLanguageIdentifier mock_;
};

TEST_F(ResolveLanguageTest, SupportedDecoderLanguageWins) {
    EXPECT_CALL(mock_, identify(_)).Times(0);
    EXPECT_EQ(resolve_language("mr", &mock_, "gola ghya", "en", kSupported), "mr");
}

TEST_F(ResolveLanguageTest, NewlySupportedLanguageIsReachable) {
    EXPECT_CALL(mock_, identify(_)).Times(0);
    const std::vector<std::string> supported = {"en", "hi", "gu", "mr", "es"};
    EXPECT_EQ(resolve_language("es", &mock_, "dos pastillas", "en", supported), "es");
}

TEST_F(ResolveLanguageTest, UnsupportedDecoderLanguageFallsThroughToText) {
    EXPECT_CALL(mock_, identify("dos pastillas")).WillOnce(Return(guess("en")));
    EXPECT_EQ(resolve_language("es", &mock_, "dos pastillas", "hi", kSupported), "en");
}

TEST_F(ResolveLanguageTest, MissingDecoderLanguageUsesText) {
    EXPECT_CALL(mock_, identify(_)).Times(2).WillRepeatedly(Return(guess("gu")));
    EXPECT_EQ(resolve_language("", &mock_, "text", "en", kSupported), "gu");
    EXPECT_EQ(resolve_language(kUndeterminedLanguage, &mock_, "text", "en", kSupported), "gu");
}

TEST_F(ResolveLanguageTest, BlankTextAlwaysFallsBack) {
    EXPECT_CALL(mock_, identify(_)).Times(0);
    EXPECT_EQ(resolve_language("hi", &mock_, "  ", "en", kSupported), "en");
}

TEST(Utf8LengthTest, CountsCodePoints) {
    EXPECT_EQ(utf8_length(""), 0u);
    EXPECT_EQ(utf8_length("dose"), 4u);
    EXPECT_EQ(utf8_length("दो"), 2u);
    EXPECT_EQ(utf8_length("દવા લો"), 6u);
}
