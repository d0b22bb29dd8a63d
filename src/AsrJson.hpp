#pragma once

#include "Types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// known asr backend output shapes

enum class AsrFormat {
    WhisperRn,  // segments[].t0/t1, words[].p        (centiseconds)
    Seconds,    // segments[].start/end, words[].probability
    SnakeCase,  // segments[].start_time/end_time, words[].confidence
    WhisperCli  // whisper.cpp -ojf: transcription[].offsets, tokens[] (milliseconds)
};

// time unit a format reports in unless the caller says otherwise
TimeUnit default_unit(AsrFormat format);

std::optional<AsrFormat> parse_asr_format_name(const std::string& name);

std::optional<TimeUnit> parse_time_unit_name(const std::string& name);

// boundary adapter: backend json -> RawTranscript

class AsrJsonAdapter {
public:
    // picks a format from the keys of the first segment
    static AsrFormat detect_format(const nlohmann::json& root);

    static RawTranscript parse(const nlohmann::json& root, AsrFormat format);

    static RawTranscript parse(const nlohmann::json& root) {
        return parse(root, detect_format(root));
    }

    // reads and parses a file; logs and returns nullopt on bad json.
    // a format override skips detection, a unit override replaces the format's default unit.
    static std::optional<RawTranscript> load_transcript(const std::filesystem::path& path,
                                                        std::optional<TimeUnit> unit_override = std::nullopt,
                                                        std::optional<AsrFormat> format_override = std::nullopt);

    static std::optional<RawTranscript> parse_string(const std::string& content,
                                                     std::optional<TimeUnit> unit_override = std::nullopt,
                                                     std::optional<AsrFormat> format_override = std::nullopt);

private:
    static RawTranscript parse_segments(const nlohmann::json& root, AsrFormat format);
    static RawTranscript parse_whisper_cli(const nlohmann::json& root);
};
