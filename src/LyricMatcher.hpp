#pragma once

#include "Types.hpp"
#include <string>
#include <vector>

// best contiguous span of transcript words for one lyric line

struct WindowMatch {
    double timestamp = 0.0;
    double score = 0.0;
    std::size_t offset = 0; // into the window
    std::size_t length = 0; // 0 means nothing matched
};

// windowed fuzzy matcher. walks lyric lines in order and keeps a
// monotonic cursor (MatcherState) so later lines never match earlier audio.

class LyricMatcher {
public:
    LyricMatcher(AlignerConfig config = AlignerConfig()) : config_(config) {}

    // aligns every line; the output has one entry per input line, same order
    std::vector<AlignedLine> align(const std::vector<std::string>& lines,
                                   const std::vector<CleanWord>& words,
                                   MatcherState& state) const;

    std::vector<AlignedLine> align(const std::vector<std::string>& lines,
                                   const std::vector<CleanWord>& words) const {
        MatcherState state;
        return align(lines, words, state);
    }

    // one line against the words intersecting [start, end]
    WindowMatch match_line(const std::string& line,
                           const std::vector<CleanWord>& words,
                           double start, double end,
                           std::size_t hint_index) const;

    // words whose time range intersects [start, end]
    static std::vector<CleanWord> words_in_window(const std::vector<CleanWord>& words,
                                                  double start, double end,
                                                  std::size_t hint_index);

    // best scoring span inside an already collected window
    WindowMatch find_best_in_window(const std::vector<std::string>& lyric_tokens,
                                    const std::vector<CleanWord>& window) const;

    // token level levenshtein distance
    static int edit_distance(const std::vector<std::string>& a, const std::vector<std::string>& b);

    // 1 / (1 + edit distance)
    static double similarity(const std::vector<std::string>& a, const std::vector<std::string>& b) {
        return 1.0 / (1.0 + static_cast<double>(edit_distance(a, b)));
    }

private:
    AlignerConfig config_;
};
