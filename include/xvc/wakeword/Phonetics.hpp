/**
 * Phonetics.hpp - Pinyin conversion and string similarity for wake words
 *
 * Text is reduced to a syllable sequence ("xiao3", "zhi4"). Chinese
 * characters are looked up in a lexicon; ASCII tokens are taken as
 * already-romanized syllables with an optional trailing tone digit.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace xvc::wakeword {

/** The three representations a phrase is matched on. */
struct PhoneticForm {
    std::vector<std::string> syllables;  // tonal, one entry per syllable
    std::string tonal;                   // "xiao3zhi4"
    std::string plain;                   // "xiaozhi"
    std::string initials;                // "xzh"

    size_t length() const { return syllables.size(); }
    bool empty() const { return syllables.empty(); }
};

class PinyinLexicon {
public:
    /** Lexicon preloaded with the built-in seed table. */
    PinyinLexicon();

    /**
     * Merge a JSON object {"字": "zi4", ...} from disk.
     * @return false if the file is missing or malformed
     */
    bool loadFile(const std::string& path);

    /** Add or replace one entry. `character` must be a single UTF-8 code point. */
    bool add(const std::string& character, const std::string& pinyin);

    std::optional<std::string> lookup(char32_t codepoint) const;

    /** Syllables of `text`. Unknown characters become "?". */
    std::vector<std::string> syllables(const std::string& text) const;

    PhoneticForm form(const std::string& text) const;

    size_t size() const { return table_.size(); }

private:
    std::unordered_map<char32_t, std::string> table_;
};

/** Build the three representations from a syllable list. */
PhoneticForm makeForm(std::vector<std::string> syllables);

std::string stripTone(const std::string& syllable);
std::string initialOf(const std::string& syllable);

size_t editDistance(const std::string& a, const std::string& b);

/** 1 - editDistance / max(length), in [0, 1]. Two empty strings are identical. */
float similarity(const std::string& a, const std::string& b);

/** Decode UTF-8; invalid bytes are skipped. */
std::vector<char32_t> decodeUtf8(const std::string& text);

} // namespace xvc::wakeword
