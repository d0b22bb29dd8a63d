#pragma once

#include "Types.hpp"
#include "Interpolator.hpp"
#include "LyricMatcher.hpp"
#include "TranscriptSanitizer.hpp"
#include "VoiceActivity.hpp"
#include <string>
#include <vector>

struct AlignmentResult {
    std::vector<AlignedLine> lines;
    double overall_confidence = 0.0;
    std::size_t successful_matches = 0;
    std::size_t total_lines = 0;
    std::vector<std::string> warnings;
};

// runs sanitizer -> segmenter / matcher -> interpolator for one song.
// holds configuration only, so one instance can serve many songs.

class AutoTimestamper {
public:
    AutoTimestamper(AlignerConfig config = AlignerConfig());

    // user lyrics text (one line per line, timing markup allowed) + transcript
    AlignmentResult align_lyrics(const RawTranscript& transcript, const std::string& lyrics_text) const;

    // same, with lines already split
    AlignmentResult align_lines(const RawTranscript& transcript, const std::vector<std::string>& lines) const;

    // no user lyrics: build timed lines straight from the transcript
    AlignmentResult extract_lyrics(const RawTranscript& transcript) const;

    // capitalizes the first letter, trims
    static std::string normalize_lyric_text(const std::string& text);

    static double segment_confidence(const CleanSegment& segment);

private:
    AlignerConfig config_;
    TranscriptSanitizer sanitizer_;
    VoiceActivitySegmenter segmenter_;
    LyricMatcher matcher_;
    Interpolator interpolator_;
};
