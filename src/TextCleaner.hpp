#pragma once

#include <string>
#include <vector>

// one token of a cleaned asr string: either a plain word or a protected
// structural tag such as [Chorus]

struct CleanToken {
    std::string text;
    bool is_tag = false;
};

class TextCleaner {
public:
    // pass 1: protect structural tags, strip brackets, parentheses and punctuation
    static std::vector<CleanToken> protect_and_strip(const std::string& text);

    // pass 2: restore tags in bracket form and collapse repeated tags
    static std::string restore(const std::vector<CleanToken>& tokens);

    // both passes
    static std::string clean(const std::string& text);

    // true for a single restored tag like "[Instrumental]"
    static bool is_structural_tag(const std::string& cleaned);

    // exact (case-insensitive) hit on the noise vocabulary
    static bool is_noise(const std::string& cleaned);

    // hallucinated credits / caption lines ("translated by ...")
    static bool is_credits(const std::string& cleaned);

    static bool is_noise_or_credits(const std::string& cleaned) {
        return is_noise(cleaned) || is_credits(cleaned);
    }

    // lower-cased, punctuation-free tokens used by the matcher
    static std::vector<std::string> tokenize(const std::string& text);

    // whitespace split, no cleaning
    static std::vector<std::string> split_whitespace(const std::string& text);

    static std::string to_lower(std::string s);

    static std::string trim(const std::string& s);

private:
    static bool is_tag_content(const std::string& inner);
};
