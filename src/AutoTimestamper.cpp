#include "AutoTimestamper.hpp"
#include "LyricsEngine.hpp"
#include "TextCleaner.hpp"
#include <cctype>
#include <iostream>
#include <sstream>

AutoTimestamper::AutoTimestamper(AlignerConfig config)
    : config_(config),
      sanitizer_(config),
      segmenter_(config.voice_gap),
      matcher_(config),
      interpolator_(config) {}

std::string AutoTimestamper::normalize_lyric_text(const std::string& text) {
    std::string clean = TextCleaner::trim(text);
    if (!clean.empty() && std::islower(static_cast<unsigned char>(clean[0]))) {
        clean[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(clean[0])));
    }
    return clean;
}

double AutoTimestamper::segment_confidence(const CleanSegment& segment) {
    if (segment.words.empty()) return 0.8;

    double sum = 0.0;
    for (const auto& w : segment.words) {
        sum += w.probability;
    }
    return sum / static_cast<double>(segment.words.size());
}

AlignmentResult AutoTimestamper::align_lyrics(const RawTranscript& transcript, const std::string& lyrics_text) const {
    return align_lines(transcript, LyricsParser::parse_user_lyrics(lyrics_text));
}

AlignmentResult AutoTimestamper::align_lines(const RawTranscript& transcript, const std::vector<std::string>& lines) const {
    AlignmentResult result;
    result.total_lines = lines.size();

    if (lines.empty()) {
        std::cout << "[aligner] no lyric lines, nothing to align" << std::endl;
        return result;
    }

    // 1. sanitize

    const auto segments = sanitizer_.sanitize(transcript);
    const auto words = TranscriptSanitizer::flatten_words(segments);

    if (words.empty()) {
        const char* reason = transcript.segments.empty()
            ? "transcript is empty, audio may be silent"
            : "transcript has only music/noise, audio may be instrumental";
        std::cerr << "[aligner] warning: " << reason << std::endl;
        result.warnings.push_back(reason);
    }

    // 2. match, one cursor per song

    MatcherState state;
    result.lines = matcher_.align(lines, words, state);

    for (std::size_t i = 0; i < result.lines.size(); ++i) {
        if (result.lines[i].confidence >= config_.accept_threshold) {
            ++result.successful_matches;
        } else {
            std::ostringstream warning;
            warning << "line " << (i + 1) << ": low confidence ("
                    << static_cast<int>(result.lines[i].confidence * 100.0 + 0.5) << "%)";
            result.warnings.push_back(warning.str());
        }
    }

    // 3. stretch the rest between anchors, outside of silence

    const auto zones = segmenter_.infer_voice_zones(words);
    interpolator_.interpolate(result.lines, zones);

    result.overall_confidence = static_cast<double>(result.successful_matches) /
                                static_cast<double>(result.total_lines);

    std::cout << "[aligner] " << result.successful_matches << "/" << result.total_lines
              << " lines matched" << std::endl;

    return result;
}

AlignmentResult AutoTimestamper::extract_lyrics(const RawTranscript& transcript) const {
    AlignmentResult result;

    const auto segments = sanitizer_.sanitize(transcript);
    const std::size_t max_chars = config_.extract_max_line_chars;

    double prob_sum = 0.0;
    std::size_t word_count = 0;

    for (std::size_t index = 0; index < segments.size(); ++index) {
        const CleanSegment& segment = segments[index];
        const std::string text = TextCleaner::trim(segment.text);
        if (text.empty()) continue;

        const double confidence = segment_confidence(segment);

        for (const auto& w : segment.words) {
            prob_sum += w.probability;
            ++word_count;
        }

        if (confidence < config_.extract_warn_confidence) {
            std::ostringstream warning;
            warning << "segment " << (index + 1) << ": \"" << text.substr(0, 40) << "\" asr confidence "
                    << static_cast<int>(confidence * 100.0 + 0.5) << "%, may need review";
            result.warnings.push_back(warning.str());
        }

        // long subtitle-style blocks are split at word boundaries

        if (text.size() > max_chars) {
            const double per_char = (segment.end - segment.start) / static_cast<double>(text.size());
            double current_start = segment.start;
            std::string current;

            for (const auto& word : TextCleaner::split_whitespace(text)) {
                if (!current.empty() && current.size() + word.size() > max_chars) {
                    result.lines.push_back({normalize_lyric_text(current), current_start, confidence});
                    current_start += static_cast<double>(current.size()) * per_char;
                    current = word;
                } else {
                    current += (current.empty() ? "" : " ") + word;
                }
            }

            if (!current.empty()) {
                result.lines.push_back({normalize_lyric_text(current), current_start, confidence});
            }
            continue;
        }

        // short fragments right after the previous line join it, unless it ended a sentence

        if (!result.lines.empty()) {
            AlignedLine& last = result.lines.back();
            const char tail = last.text.empty() ? ' ' : last.text.back();
            const bool ends_sentence = tail == '.' || tail == '!' || tail == '?';

            if (segment.start - last.timestamp < config_.extract_merge_gap &&
                last.text.size() + text.size() < max_chars &&
                !ends_sentence) {
                last.text += " " + text;
                continue;
            }
        }

        result.lines.push_back({normalize_lyric_text(text), segment.start, confidence});
    }

    result.total_lines = result.lines.size();
    result.successful_matches = result.lines.size();
    result.overall_confidence = word_count > 0 ? prob_sum / static_cast<double>(word_count) : 0.8;

    std::cout << "[aligner] extracted " << result.lines.size() << " lines from "
              << segments.size() << " segments" << std::endl;

    return result;
}
