#pragma once

#include "Types.hpp"
#include <vector>

// turns raw asr segments into a clean, time-ordered word stream.
// never fails: malformed records just end up empty and get dropped.

class TranscriptSanitizer {
public:
    TranscriptSanitizer(AlignerConfig config = AlignerConfig()) : config_(config) {}

    std::vector<CleanSegment> sanitize(const std::vector<RawSegment>& segments, TimeUnit unit) const;

    std::vector<CleanSegment> sanitize(const RawTranscript& transcript) const {
        return sanitize(transcript.segments, transcript.unit);
    }

    // all words of all segments, sorted by start time
    static std::vector<CleanWord> flatten_words(const std::vector<CleanSegment>& segments);

private:
    AlignerConfig config_;

    std::vector<CleanWord> clean_words(const RawSegment& segment, double scale) const;
    std::vector<CleanWord> estimate_words(const RawSegment& segment, double scale) const;
};
