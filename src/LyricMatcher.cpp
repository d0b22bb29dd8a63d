#include "LyricMatcher.hpp"
#include "TextCleaner.hpp"
#include <algorithm>
#include <iostream>

std::vector<CleanWord> LyricMatcher::words_in_window(const std::vector<CleanWord>& words,
                                                     double start, double end,
                                                     std::size_t hint_index) {
    std::vector<CleanWord> window;
    std::size_t i = std::min(hint_index, words.size());

    // the hint is only a scan start: words still open at `start` belong in the window
    while (i > 0 && words[i - 1].end >= start) {
        --i;
    }

    while (i < words.size() && words[i].end < start) {
        ++i;
    }

    while (i < words.size() && words[i].start <= end) {
        if (words[i].end >= start) {
            window.push_back(words[i]);
        }
        ++i;
    }

    return window;
}

int LyricMatcher::edit_distance(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    const std::size_t n = a.size();
    const std::size_t m = b.size();

    std::vector<int> prev(m + 1);
    std::vector<int> curr(m + 1);

    for (std::size_t j = 0; j <= m; ++j) {
        prev[j] = static_cast<int>(j);
    }

    for (std::size_t i = 1; i <= n; ++i) {
        curr[0] = static_cast<int>(i);

        for (std::size_t j = 1; j <= m; ++j) {
            const int cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            curr[j] = std::min({prev[j - 1] + cost, // substitution / match
                                prev[j] + 1,        // deletion
                                curr[j - 1] + 1});  // insertion
        }

        std::swap(prev, curr);
    }

    return prev[m];
}

WindowMatch LyricMatcher::find_best_in_window(const std::vector<std::string>& lyric_tokens,
                                              const std::vector<CleanWord>& window) const {
    WindowMatch best;
    if (lyric_tokens.empty() || window.empty()) return best;

    // compare against the first token of every transcript word
    std::vector<std::string> heads;
    heads.reserve(window.size());
    for (const auto& w : window) {
        const auto tokens = TextCleaner::tokenize(w.text);
        heads.push_back(tokens.empty() ? std::string() : tokens.front());
    }

    const int n = static_cast<int>(lyric_tokens.size());
    const std::size_t min_len = static_cast<std::size_t>(std::max(1, n - config_.length_margin_below));
    const std::size_t max_len = static_cast<std::size_t>(n + config_.length_margin_above);
    const double w_sim = config_.similarity_weight;

    // ties keep the first candidate: shortest length, then earliest offset
    for (std::size_t len = min_len; len <= max_len && len <= window.size(); ++len) {
        for (std::size_t i = 0; i + len <= window.size(); ++i) {
            const std::vector<std::string> candidate(heads.begin() + i, heads.begin() + i + len);
            const double sim = similarity(lyric_tokens, candidate);

            double prob_sum = 0.0;
            for (std::size_t k = i; k < i + len; ++k) {
                prob_sum += window[k].probability;
            }
            const double avg_prob = prob_sum / static_cast<double>(len);

            const double score = w_sim * sim + (1.0 - w_sim) * avg_prob;

            if (score > best.score) {
                best.timestamp = window[i].start;
                best.score = score;
                best.offset = i;
                best.length = len;
            }
        }
    }

    return best;
}

WindowMatch LyricMatcher::match_line(const std::string& line,
                                     const std::vector<CleanWord>& words,
                                     double start, double end,
                                     std::size_t hint_index) const {
    const auto window = words_in_window(words, start, end, hint_index);
    return find_best_in_window(TextCleaner::tokenize(line), window);
}

std::vector<AlignedLine> LyricMatcher::align(const std::vector<std::string>& lines,
                                             const std::vector<CleanWord>& words,
                                             MatcherState& state) const {
    std::vector<AlignedLine> aligned;
    aligned.reserve(lines.size());

    std::cout << "[aligner] aligning " << lines.size() << " lines with " << words.size() << " words" << std::endl;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        const std::size_t line_number = i + 1;

        // 1. primary window

        WindowMatch match = match_line(line, words, state.cursor_time,
                                       state.cursor_time + config_.primary_window,
                                       state.cursor_index);

        // 2. wider window for instrumental breaks, only trusted when very confident

        if (match.score < config_.fallback_trigger) {
            std::cout << "[aligner] line " << line_number << ": no match in primary window, trying "
                      << config_.fallback_window << "s fallback" << std::endl;

            const WindowMatch fallback = match_line(line, words, state.cursor_time,
                                                    state.cursor_time + config_.fallback_window,
                                                    state.cursor_index);

            if (fallback.score > config_.fallback_accept) {
                std::cout << "[aligner]   -> fallback match at " << fallback.timestamp
                          << "s (score " << fallback.score << ")" << std::endl;
                match = fallback;
            }
        }

        // 3. accept and move the cursor, or park the line just after it

        if (match.score >= config_.accept_threshold) {
            state.cursor_time = std::max(state.cursor_time, match.timestamp + config_.cursor_step);

            std::size_t index = state.cursor_index;
            while (index < words.size() && words[index].start < match.timestamp) {
                ++index;
            }
            state.cursor_index = index;

            aligned.push_back({line, match.timestamp, match.score});
            std::cout << "[aligner] line " << line_number << ": match at " << match.timestamp
                      << "s (score " << match.score << ")" << std::endl;
        } else {
            const double parked = state.cursor_time + config_.cursor_step;
            aligned.push_back({line, parked, match.score});
            std::cout << "[aligner] line " << line_number << ": weak match (score " << match.score
                      << "), parked at " << parked << "s" << std::endl;
        }
    }

    return aligned;
}
