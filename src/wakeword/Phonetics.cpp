/**
 * Phonetics.cpp - Pinyin lexicon and Levenshtein similarity
 */

#include "xvc/wakeword/Phonetics.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

namespace xvc::wakeword {

namespace {

// Characters common in wake phrases and short commands, with their
// near-homophones so misrecognized transcripts still reduce correctly.
const std::pair<const char*, const char*> kSeedTable[] = {
    {"小", "xiao3"}, {"晓", "xiao3"}, {"笑", "xiao4"}, {"校", "xiao4"}, {"消", "xiao1"},
    {"智", "zhi4"}, {"志", "zhi4"}, {"治", "zhi4"}, {"知", "zhi1"}, {"之", "zhi1"},
    {"枝", "zhi1"}, {"直", "zhi2"}, {"纸", "zhi3"},
    {"美", "mei3"}, {"每", "mei3"}, {"没", "mei2"}, {"妹", "mei4"},
    {"你", "ni3"}, {"好", "hao3"}, {"同", "tong2"}, {"学", "xue2"},
    {"天", "tian1"}, {"猫", "mao1"}, {"精", "jing1"}, {"灵", "ling2"},
    {"爱", "ai4"}, {"丽", "li4"}, {"莎", "sha1"}, {"助", "zhu4"}, {"手", "shou3"},
    {"嘿", "hei1"}, {"嗨", "hai1"}, {"明", "ming2"}, {"安", "an1"}, {"度", "du4"},
    {"宝", "bao3"}, {"贝", "bei4"}, {"龙", "long2"}, {"飞", "fei1"}, {"云", "yun2"},
    {"问", "wen4"}, {"朋", "peng2"}, {"友", "you3"}, {"有", "you3"},
    {"的", "de5"}, {"了", "le5"}, {"是", "shi4"}, {"我", "wo3"}, {"今", "jin1"},
    {"气", "qi4"}, {"怎", "zen3"}, {"么", "me5"}, {"样", "yang4"}, {"请", "qing3"},
    {"打", "da3"}, {"开", "kai1"}, {"灯", "deng1"}, {"关", "guan1"}, {"音", "yin1"},
    {"量", "liang4"}, {"大", "da4"}, {"一", "yi1"}, {"点", "dian3"}, {"早", "zao3"},
    {"上", "shang4"}, {"晚", "wan3"}, {"吃", "chi1"}, {"饭", "fan4"}, {"人", "ren2"},
    {"他", "ta1"}, {"她", "ta1"}, {"在", "zai4"}, {"个", "ge4"}, {"这", "zhe4"},
    {"那", "na4"}, {"说", "shuo1"}, {"话", "hua4"}, {"听", "ting1"}, {"看", "kan4"},
    {"想", "xiang3"}, {"要", "yao4"}, {"去", "qu4"}, {"来", "lai2"}, {"不", "bu4"},
    {"很", "hen3"}, {"吗", "ma5"}, {"呢", "ne5"}, {"吧", "ba5"}, {"啊", "a5"},
};

bool isToneDigit(char c) {
    return c >= '1' && c <= '5';
}

} // namespace

std::vector<char32_t> decodeUtf8(const std::string& text) {
    std::vector<char32_t> out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        char32_t cp = 0;
        size_t extra = 0;

        if (c < 0x80) {
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F;
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F;
            extra = 2;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07;
            extra = 3;
        } else {
            ++i;
            continue;
        }

        // Truncated sequence at the end of the input
        if (i + extra >= text.size()) {
            break;
        }

        bool valid = true;
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (valid) {
            out.push_back(cp);
            i += extra + 1;
        } else {
            ++i;
        }
    }
    return out;
}

PinyinLexicon::PinyinLexicon() {
    for (const auto& [character, pinyin] : kSeedTable) {
        add(character, pinyin);
    }
}

bool PinyinLexicon::add(const std::string& character, const std::string& pinyin) {
    std::vector<char32_t> cps = decodeUtf8(character);
    if (cps.size() != 1 || pinyin.empty()) {
        std::cerr << "[WakeWord] Bad lexicon entry: " << character << std::endl;
        return false;
    }

    std::string normalized;
    for (char c : pinyin) {
        normalized += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    table_[cps[0]] = normalized;
    return true;
}

bool PinyinLexicon::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.good()) {
        std::cerr << "[WakeWord] Lexicon not found: " << path << std::endl;
        return false;
    }

    try {
        nlohmann::json entries = nlohmann::json::parse(file);
        if (!entries.is_object()) {
            std::cerr << "[WakeWord] Lexicon must be a JSON object: " << path << std::endl;
            return false;
        }

        size_t added = 0;
        for (auto& [character, pinyin] : entries.items()) {
            if (pinyin.is_string() && add(character, pinyin.get<std::string>())) {
                ++added;
            }
        }
        std::cout << "[WakeWord] Loaded " << added << " lexicon entries from " << path << std::endl;
        return true;
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[WakeWord] Lexicon parse error: " << e.what() << std::endl;
        return false;
    }
}

std::optional<std::string> PinyinLexicon::lookup(char32_t codepoint) const {
    auto it = table_.find(codepoint);
    if (it == table_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> PinyinLexicon::syllables(const std::string& text) const {
    std::vector<std::string> out;
    std::string ascii;

    auto flushAscii = [&]() {
        if (!ascii.empty()) {
            out.push_back(ascii);
            ascii.clear();
        }
    };

    for (char32_t cp : decodeUtf8(text)) {
        if (cp < 0x80) {
            char c = static_cast<char>(cp);
            if (std::isalpha(static_cast<unsigned char>(c))) {
                // A letter after a tone digit starts a new syllable ("xiao3zhi4")
                if (!ascii.empty() && isToneDigit(ascii.back())) flushAscii();
                ascii += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            } else if (isToneDigit(c) && !ascii.empty() && !isToneDigit(ascii.back())) {
                ascii += c;
            } else {
                flushAscii();
            }
            continue;
        }

        flushAscii();
        if (auto pinyin = lookup(cp)) {
            out.push_back(*pinyin);
        } else if (cp >= 0x4E00 && cp <= 0x9FFF) {
            out.push_back("?");
        }
        // Other non-ASCII (punctuation, symbols) separates tokens only
    }
    flushAscii();
    return out;
}

PhoneticForm PinyinLexicon::form(const std::string& text) const {
    return makeForm(syllables(text));
}

PhoneticForm makeForm(std::vector<std::string> syllables) {
    PhoneticForm f;
    for (const auto& s : syllables) {
        f.tonal += s;
        f.plain += stripTone(s);
        f.initials += initialOf(s);
    }
    f.syllables = std::move(syllables);
    return f;
}

std::string stripTone(const std::string& syllable) {
    if (!syllable.empty() && isToneDigit(syllable.back())) {
        return syllable.substr(0, syllable.size() - 1);
    }
    return syllable;
}

std::string initialOf(const std::string& syllable) {
    if (syllable.size() >= 2) {
        std::string head = syllable.substr(0, 2);
        if (head == "zh" || head == "ch" || head == "sh") return head;
    }
    if (!syllable.empty() && std::string("bpmfdtnlgkhjqxrzcsyw").find(syllable[0]) != std::string::npos) {
        return syllable.substr(0, 1);
    }
    return "";
}

size_t editDistance(const std::string& a, const std::string& b) {
    std::vector<size_t> prev(b.size() + 1);
    std::vector<size_t> curr(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;

    for (size_t i = 1; i <= a.size(); ++i) {
        curr[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, curr);
    }
    return prev[b.size()];
}

float similarity(const std::string& a, const std::string& b) {
    size_t longest = std::max(a.size(), b.size());
    if (longest == 0) return 1.0f;
    return 1.0f - static_cast<float>(editDistance(a, b)) / static_cast<float>(longest);
}

} // namespace xvc::wakeword
