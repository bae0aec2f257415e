#include "LanguageIdentifier.hpp"

#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>
#include <unordered_set>

namespace vnt {

namespace {

const std::unordered_set<std::string> kHindiWords = {
    "है", "हैं", "और", "का", "की", "के", "में", "नहीं", "यह", "को", "से", "था", "थी", "मैं", "आप", "दवा"
};

const std::unordered_set<std::string> kMarathiWords = {
    "आहे", "आहेत", "आणि", "नाही", "हे", "ते", "मी", "तुम्ही", "होते", "च्या", "ला", "औषध", "घ्या", "काय"
};

/// Decode one UTF-8 code point starting at `i`; advances `i`.
/// Invalid sequences yield U+FFFD and consume one byte.
uint32_t next_code_point(const std::string& s, size_t& i) {
    const auto c0 = static_cast<unsigned char>(s[i]);
    if (c0 < 0x80) {
        ++i;
        return c0;
    }
    int extra = 0;
    uint32_t cp = 0;
    if ((c0 & 0xE0) == 0xC0)      { extra = 1; cp = c0 & 0x1F; }
    else if ((c0 & 0xF0) == 0xE0) { extra = 2; cp = c0 & 0x0F; }
    else if ((c0 & 0xF8) == 0xF0) { extra = 3; cp = c0 & 0x07; }
    else { ++i; return 0xFFFD; }

    if (i + extra >= s.size()) {
        ++i;
        return 0xFFFD;
    }
    for (int k = 1; k <= extra; ++k) {
        const auto cx = static_cast<unsigned char>(s[i + k]);
        if ((cx & 0xC0) != 0x80) {
            ++i;
            return 0xFFFD;
        }
        cp = (cp << 6) | (cx & 0x3F);
    }
    i += extra + 1;
    return cp;
}

bool is_latin_letter(uint32_t cp) {
    return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z')
        || (cp >= 0x00C0 && cp <= 0x024F && cp != 0x00D7 && cp != 0x00F7);
}

bool is_devanagari(uint32_t cp) { return cp >= 0x0900 && cp <= 0x097F; }
bool is_gujarati(uint32_t cp)   { return cp >= 0x0A80 && cp <= 0x0AFF; }

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream ss(text);
    std::string w;
    while (ss >> w) {
        // Strip ASCII punctuation at both ends; Indic punctuation (danda) too.
        while (!w.empty() && std::ispunct(static_cast<unsigned char>(w.back()))) w.pop_back();
        while (!w.empty() && std::ispunct(static_cast<unsigned char>(w.front()))) w.erase(0, 1);
        const std::string danda = "\xE0\xA5\xA4";   // U+0964
        if (w.size() >= danda.size()
            && w.compare(w.size() - danda.size(), danda.size(), danda) == 0) {
            w.erase(w.size() - danda.size());
        }
        if (!w.empty()) words.push_back(w);
    }
    return words;
}

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

bool is_supported(const std::string& code, const std::vector<std::string>& supported) {
    return supported.empty()
        || std::find(supported.begin(), supported.end(), code) != supported.end();
}

} // namespace

// ---------------------------------------------------------------------------
// ScriptLanguageIdentifier
// ---------------------------------------------------------------------------

LanguageGuess ScriptLanguageIdentifier::identify(const std::string& text) const {
    size_t latin = 0;
    size_t devanagari = 0;
    size_t gujarati = 0;

    for (size_t i = 0; i < text.size();) {
        const uint32_t cp = next_code_point(text, i);
        if (is_latin_letter(cp))      ++latin;
        else if (is_devanagari(cp))   ++devanagari;
        else if (is_gujarati(cp))     ++gujarati;
    }

    const size_t letters = latin + devanagari + gujarati;
    LanguageGuess guess;
    if (letters == 0) {
        return guess;
    }

    if (gujarati >= latin && gujarati >= devanagari) {
        guess.language_code = "gu";
        guess.confidence = static_cast<float>(gujarati) / static_cast<float>(letters);
        return guess;
    }

    if (devanagari >= latin) {
        size_t hindi_hits = 0;
        size_t marathi_hits = 0;
        for (const auto& w : split_words(text)) {
            if (kHindiWords.count(w)) ++hindi_hits;
            if (kMarathiWords.count(w)) ++marathi_hits;
        }
        guess.language_code = marathi_hits > hindi_hits ? "mr" : "hi";
        guess.confidence = static_cast<float>(devanagari) / static_cast<float>(letters);
        if (hindi_hits == marathi_hits) {
            guess.confidence *= 0.5f;   // script alone cannot separate hi/mr
        }
        return guess;
    }

    guess.language_code = "en";
    guess.confidence = static_cast<float>(latin) / static_cast<float>(letters);
    return guess;
}

// ---------------------------------------------------------------------------
// detect_language_or_default
// ---------------------------------------------------------------------------

std::string detect_language_or_default(const LanguageIdentifier* identifier,
                                       const std::string& text,
                                       const std::string& fallback_language,
                                       const std::vector<std::string>& supported_languages) {
    if (is_blank(text)) {
        return fallback_language;
    }
    if (!identifier) {
        Logger::warn("[LanguageIdentifier] No identifier configured, defaulting to "
                     + fallback_language);
        return fallback_language;
    }

    LanguageGuess guess;
    try {
        guess = identifier->identify(text);
    } catch (const std::exception& e) {
        Logger::error(std::string("[LanguageIdentifier] Error detecting language, defaulting to ")
                      + fallback_language + ": " + e.what());
        return fallback_language;
    }

    if (guess.language_code.empty() || guess.language_code == kUndeterminedLanguage) {
        Logger::warn("[LanguageIdentifier] Could not determine language, defaulting to "
                     + fallback_language);
        return fallback_language;
    }

    if (!is_supported(guess.language_code, supported_languages)) {
        Logger::warn("[LanguageIdentifier] Detected unsupported language "
                     + guess.language_code + ", defaulting to " + fallback_language);
        return fallback_language;
    }

    Logger::debug("[LanguageIdentifier] Language identified: " + guess.language_code);
    return guess.language_code;
}

// ---------------------------------------------------------------------------
// resolve_language
// ---------------------------------------------------------------------------

std::string resolve_language(const std::string& decoder_language,
                             const LanguageIdentifier* identifier,
                             const std::string& text,
                             const std::string& fallback_language,
                             const std::vector<std::string>& supported_languages) {
    if (is_blank(text)) {
        return fallback_language;
    }
    if (!decoder_language.empty() && decoder_language != kUndeterminedLanguage) {
        if (is_supported(decoder_language, supported_languages)) {
            Logger::debug("[LanguageIdentifier] Using decoder language: " + decoder_language);
            return decoder_language;
        }
        Logger::debug("[LanguageIdentifier] Decoder language " + decoder_language
                      + " not supported, checking text");
    }
    return detect_language_or_default(identifier, text, fallback_language, supported_languages);
}

size_t utf8_length(const std::string& text) {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

} // namespace vnt
