#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace vnt {

/// ISO 639-1 code returned when no language can be determined.
constexpr const char* kUndeterminedLanguage = "und";

struct LanguageGuess {
    std::string language_code = kUndeterminedLanguage;
    float       confidence    = 0.0f;
};

/// On-device text language identification.
class LanguageIdentifier {
public:
    virtual ~LanguageIdentifier() = default;

    /// Identify the language of `text`.  Returns "und" when undetermined.
    /// Implementations may throw on internal failure.
    virtual LanguageGuess identify(const std::string& text) const = 0;
};

/// Script- and stop-word-based identifier for the languages voice notes are
/// recorded in: Latin script -> en, Gujarati script -> gu, Devanagari ->
/// hi or mr depending on which stop-word list matches more words.  Used as
/// the secondary check behind a speech model's own language ID.
class ScriptLanguageIdentifier : public LanguageIdentifier {
public:
    LanguageGuess identify(const std::string& text) const override;
};

/// Run `identifier` over `text` and fall back to `fallback_language` when the
/// text is blank (the identifier is not called), when the identifier throws,
/// returns "und", or returns a code outside `supported_languages`.
/// An empty `supported_languages` accepts every code.
std::string detect_language_or_default(const LanguageIdentifier* identifier,
                                       const std::string& text,
                                       const std::string& fallback_language,
                                       const std::vector<std::string>& supported_languages);

/// Pick the transcript language.  `decoder_language` is the speech model's
/// own language ID (empty if it has none).  It wins when it is set, not
/// "und", and in `supported_languages`.  Otherwise the text goes through
/// detect_language_or_default.  Blank text always yields the fallback.
std::string resolve_language(const std::string& decoder_language,
                             const LanguageIdentifier* identifier,
                             const std::string& text,
                             const std::string& fallback_language,
                             const std::vector<std::string>& supported_languages);

/// Number of code points in UTF-8 `text`.  Continuation bytes are not counted.
size_t utf8_length(const std::string& text);

} // namespace vnt
