#include "TextCleaner.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

namespace {

const std::array<const char*, 9> kStructuralTags = {
    "instrumental", "verse", "chorus", "bridge", "intro",
    "outro", "solo", "hook", "break"
};

const std::array<const char*, 10> kNoiseWords = {
    "noise", "machine", "whirring", "humming", "brrr",
    "clicking", "silence", "music", "applause", "cheering"
};

const std::array<const char*, 3> kCreditPhrases = {
    "translated by", "captioned by", "subtitles by"
};

const std::array<const char*, 2> kCreditPrefixes = {
    "subtitle", "caption"
};

enum class CharClass { Word, Apostrophe, Space, Punct };

// helper : decode one utf-8 sequence starting at i and advance past it
// malformed input comes back as U+FFFD, one byte at a time

char32_t next_codepoint(const std::string& s, std::size_t& i) {
    const unsigned char lead = static_cast<unsigned char>(s[i]);
    if (lead < 0x80) {
        ++i;
        return lead;
    }

    std::size_t extra = 0;
    char32_t cp = 0;
    if ((lead & 0xE0) == 0xC0) {
        extra = 1;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3;
        cp = lead & 0x07;
    } else {
        ++i;
        return 0xFFFD;
    }

    if (i + extra >= s.size()) {
        ++i;
        return 0xFFFD;
    }

    for (std::size_t k = 1; k <= extra; ++k) {
        const unsigned char b = static_cast<unsigned char>(s[i + k]);
        if ((b & 0xC0) != 0x80) {
            ++i;
            return 0xFFFD;
        }
        cp = (cp << 6) | (b & 0x3F);
    }

    i += extra + 1;
    return cp;
}

// letters of any script count as word characters, symbols and punctuation do not

CharClass classify(char32_t cp) {
    if (cp < 0x80) {
        const int c = static_cast<int>(cp);
        if (std::isalnum(c) || c == '_') return CharClass::Word;
        if (c == '\'') return CharClass::Apostrophe;
        if (std::isspace(c)) return CharClass::Space;
        return CharClass::Punct;
    }

    if (cp == 0x2018 || cp == 0x2019) return CharClass::Apostrophe;
    if (cp == 0x00A0 || cp == 0x3000) return CharClass::Space;
    if (cp == 0xFFFD) return CharClass::Punct;
    if ((cp >= 0x00A1 && cp <= 0x00BF) || cp == 0x00D7 || cp == 0x00F7) return CharClass::Punct;
    if (cp >= 0x2000 && cp <= 0x2BFF) return CharClass::Punct; // punctuation, arrows, music notes
    if (cp >= 0x3001 && cp <= 0x303F) return CharClass::Punct;
    if (cp >= 0xFE00 && cp <= 0xFE0F) return CharClass::Punct;
    if (cp >= 0x1F000) return CharClass::Punct;                 // emoji

    return CharClass::Word;
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

} // namespace

std::string TextCleaner::to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

std::string TextCleaner::trim(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    const std::size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    const std::size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

bool TextCleaner::is_tag_content(const std::string& inner) {
    const std::string lower = to_lower(inner);
    for (const char* tag : kStructuralTags) {
        if (starts_with(lower, tag)) return true;
    }
    return false;
}

std::vector<CleanToken> TextCleaner::protect_and_strip(const std::string& text) {
    std::vector<CleanToken> tokens;
    std::string current;
    bool current_has_word = false;

    auto flush = [&]() {
        // a run of bare apostrophes is not a word
        if (current_has_word) {
            tokens.push_back({current, false});
        }
        current.clear();
        current_has_word = false;
    };

    std::size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];

        if (c == '[' || c == '(') {
            const char close = (c == '[') ? ']' : ')';
            const std::size_t end = text.find(close, i + 1);

            if (end != std::string::npos) {
                flush();

                if (c == '[') {
                    const std::string inner = trim(text.substr(i + 1, end - i - 1));
                    if (is_tag_content(inner)) {
                        std::string compact;
                        for (char ch : inner) {
                            if (!std::isspace(static_cast<unsigned char>(ch))) compact += ch;
                        }
                        tokens.push_back({"[" + compact + "]", true});
                    }
                }

                i = end + 1;
                continue;
            }

            // unbalanced bracket: plain punctuation
            flush();
            ++i;
            continue;
        }

        const std::size_t begin = i;
        const char32_t cp = next_codepoint(text, i);

        switch (classify(cp)) {
            case CharClass::Word:
                current.append(text, begin, i - begin);
                current_has_word = true;
                break;
            case CharClass::Apostrophe:
                current.append(text, begin, i - begin);
                break;
            case CharClass::Space:
            case CharClass::Punct:
                flush();
                break;
        }
    }

    flush();
    return tokens;
}

std::string TextCleaner::restore(const std::vector<CleanToken>& tokens) {
    std::string out;
    const CleanToken* prev = nullptr;

    for (const auto& token : tokens) {
        if (token.is_tag && prev && prev->is_tag && prev->text == token.text) {
            continue;
        }

        if (!out.empty()) out += ' ';
        out += token.text;
        prev = &token;
    }

    return out;
}

std::string TextCleaner::clean(const std::string& text) {
    return restore(protect_and_strip(text));
}

bool TextCleaner::is_structural_tag(const std::string& cleaned) {
    if (cleaned.size() < 3 || cleaned.front() != '[' || cleaned.back() != ']') {
        return false;
    }

    const std::string inner = cleaned.substr(1, cleaned.size() - 2);
    if (inner.find_first_of(" []") != std::string::npos) return false;

    return is_tag_content(inner);
}

bool TextCleaner::is_noise(const std::string& cleaned) {
    const std::string lower = to_lower(trim(cleaned));
    for (const char* word : kNoiseWords) {
        if (lower == word) return true;
    }
    return false;
}

bool TextCleaner::is_credits(const std::string& cleaned) {
    const std::string lower = to_lower(trim(cleaned));

    for (const char* phrase : kCreditPhrases) {
        if (lower.find(phrase) != std::string::npos) return true;
    }

    for (const char* prefix : kCreditPrefixes) {
        if (starts_with(lower, prefix)) return true;
    }

    return false;
}

std::vector<std::string> TextCleaner::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;

    std::size_t i = 0;
    while (i < text.size()) {
        const std::size_t begin = i;
        const char32_t cp = next_codepoint(text, i);

        switch (classify(cp)) {
            case CharClass::Word:
                current += to_lower(text.substr(begin, i - begin));
                break;
            case CharClass::Apostrophe:
                // "don't" and "dont" should compare equal
                break;
            case CharClass::Space:
            case CharClass::Punct:
                if (!current.empty()) {
                    tokens.push_back(current);
                    current.clear();
                }
                break;
        }
    }

    if (!current.empty()) tokens.push_back(current);
    return tokens;
}

std::vector<std::string> TextCleaner::split_whitespace(const std::string& text) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string part;

    while (ss >> part) {
        parts.push_back(part);
    }

    return parts;
}
