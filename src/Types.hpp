#pragma once

#include <string>
#include <vector>
#include <cstddef>

// raw asr data (native time unit of the backend)

enum class TimeUnit {
    Seconds,
    Centiseconds,
    Milliseconds
};

struct RawWord {
    std::string text;
    double start = 0.0;
    double end = 0.0;
    double probability = 0.8;
};

struct RawSegment {
    std::string text;
    double start = 0.0;
    double end = 0.0;
    std::vector<RawWord> words; // may be empty
};

struct RawTranscript {
    std::vector<RawSegment> segments;
    TimeUnit unit = TimeUnit::Seconds;
    std::string language = "en";
};

// sanitized data (always seconds)

struct CleanWord {
    std::string text;
    double start = 0.0;
    double end = 0.0;
    double probability = 0.8;
};

struct CleanSegment {
    std::string text;
    double start = 0.0;
    double end = 0.0;
    std::vector<CleanWord> words;
};

struct VoiceZone {
    double start = 0.0;
    double end = 0.0;
};

struct AlignedLine {
    std::string text;
    double timestamp = 0.0;
    double confidence = 0.0;
};

// search cursor for one song, threaded through the matcher

struct MatcherState {
    double cursor_time = 0.0;
    std::size_t cursor_index = 0;
};

// tuning knobs for one alignment run

struct AlignerConfig {
    // matcher
    double primary_window = 15.0;
    double fallback_window = 60.0;
    double fallback_trigger = 0.4;  // primary score below this tries the fallback
    double fallback_accept = 0.8;   // fallback must score above this
    double accept_threshold = 0.6;
    double cursor_step = 0.1;
    double similarity_weight = 0.8; // rest goes to mean word probability
    int length_margin_below = 2;
    int length_margin_above = 3;

    // interpolator
    double anchor_threshold = 0.75;
    double min_line_gap = 0.5;
    double snap_stagger = 0.1;
    double interpolated_confidence = 0.5;

    // segmenter
    double voice_gap = 2.0;

    // sanitizer
    double default_probability = 0.8;

    // transcript-only extraction
    std::size_t extract_max_line_chars = 45;
    double extract_merge_gap = 0.25;
    double extract_warn_confidence = 0.7;
};

// seconds per native unit
inline double unit_scale(TimeUnit unit) {
    switch (unit) {
        case TimeUnit::Centiseconds: return 0.01;
        case TimeUnit::Milliseconds: return 0.001;
        case TimeUnit::Seconds: break;
    }
    return 1.0;
}
