#include "TranscriptSanitizer.hpp"
#include "TextCleaner.hpp"
#include <algorithm>
#include <iostream>

namespace {

double clamp_probability(double p) {
    return std::min(1.0, std::max(0.0, p));
}

std::string join_words(const std::vector<CleanWord>& words) {
    std::string text;
    for (const auto& w : words) {
        if (!text.empty()) text += ' ';
        text += w.text;
    }
    return text;
}

} // namespace

std::vector<CleanWord> TranscriptSanitizer::clean_words(const RawSegment& segment, double scale) const {
    std::vector<CleanWord> words;

    for (const auto& raw : segment.words) {
        std::string cleaned = TextCleaner::clean(raw.text);
        if (cleaned.empty()) continue;

        const bool is_tag = TextCleaner::is_structural_tag(cleaned);

        // structural tags survive the noise filter, but only once in a row
        if (!is_tag && TextCleaner::is_noise(cleaned)) continue;
        if (is_tag && !words.empty() && words.back().text == cleaned) continue;

        CleanWord word;
        word.text = std::move(cleaned);
        word.start = raw.start * scale;
        word.end = std::max(word.start, raw.end * scale);
        word.probability = clamp_probability(raw.probability);
        words.push_back(std::move(word));
    }

    return words;
}

std::vector<CleanWord> TranscriptSanitizer::estimate_words(const RawSegment& segment, double scale) const {
    std::vector<CleanWord> words;

    const auto parts = TextCleaner::split_whitespace(TextCleaner::clean(segment.text));
    if (parts.empty()) return words;

    const double start = segment.start * scale;
    const double end = std::max(start, segment.end * scale);
    const double per_word = (end - start) / static_cast<double>(parts.size());

    for (std::size_t k = 0; k < parts.size(); ++k) {
        const std::string& text = parts[k];
        const bool is_tag = TextCleaner::is_structural_tag(text);

        if (!is_tag && TextCleaner::is_noise(text)) continue;
        if (is_tag && !words.empty() && words.back().text == text) continue;

        CleanWord word;
        word.text = text;
        word.start = start + per_word * static_cast<double>(k);
        word.end = word.start + per_word;
        word.probability = config_.default_probability;
        words.push_back(std::move(word));
    }

    return words;
}

std::vector<CleanSegment> TranscriptSanitizer::sanitize(const std::vector<RawSegment>& segments, TimeUnit unit) const {
    std::vector<CleanSegment> result;
    const double scale = unit_scale(unit);
    std::size_t total_words = 0;

    for (std::size_t index = 0; index < segments.size(); ++index) {
        const RawSegment& raw = segments[index];

        // 1. word level

        std::vector<CleanWord> words;
        if (raw.words.empty()) {
            words = estimate_words(raw, scale);
            if (!words.empty()) {
                std::cout << "[sanitizer] segment " << index << ": estimated timestamps for "
                          << words.size() << " words" << std::endl;
            }
        } else {
            words = clean_words(raw, scale);

            // every word cleaned away: fall back to the text so noise is filtered per word
            if (words.empty()) {
                words = estimate_words(raw, scale);
            }
        }

        // 2. segment level

        std::string segment_text = TextCleaner::clean(raw.text);
        if (TextCleaner::is_noise_or_credits(segment_text)) {
            std::cout << "[sanitizer] noise/credit segment: \"" << segment_text << "\"" << std::endl;
            segment_text.clear();
        }

        // 3. words are the truth when there are any left

        CleanSegment clean;

        if (!words.empty()) {
            std::string reconstructed = join_words(words);
            if (TextCleaner::is_noise_or_credits(reconstructed)) {
                std::cout << "[sanitizer] dropped segment " << index << ": \"" << reconstructed << "\"" << std::endl;
                continue;
            }

            clean.text = std::move(reconstructed);
            clean.start = words.front().start;
            clean.end = words.front().end;
            for (const auto& w : words) {
                clean.end = std::max(clean.end, w.end);
            }
            clean.words = std::move(words);
        } else if (!segment_text.empty()) {
            clean.text = std::move(segment_text);
            clean.start = raw.start * scale;
            clean.end = std::max(clean.start, raw.end * scale);
        } else {
            continue;
        }

        total_words += clean.words.size();
        result.push_back(std::move(clean));
    }

    std::stable_sort(result.begin(), result.end(), [](const CleanSegment& a, const CleanSegment& b) {
        return a.start < b.start;
    });

    std::cout << "[sanitizer] kept " << result.size() << "/" << segments.size()
              << " segments, " << total_words << " words" << std::endl;

    return result;
}

std::vector<CleanWord> TranscriptSanitizer::flatten_words(const std::vector<CleanSegment>& segments) {
    std::vector<CleanWord> words;

    for (const auto& segment : segments) {
        words.insert(words.end(), segment.words.begin(), segment.words.end());
    }

    std::stable_sort(words.begin(), words.end(), [](const CleanWord& a, const CleanWord& b) {
        return a.start < b.start;
    });

    return words;
}
