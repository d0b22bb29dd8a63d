#include "AsrJson.hpp"
#include "TextCleaner.hpp"
#include <algorithm>
#include <initializer_list>
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace {

struct FieldKeys {
    const char* start;
    const char* end;
    const char* probability;
};

FieldKeys keys_for(AsrFormat format) {
    switch (format) {
        case AsrFormat::WhisperRn: return {"t0", "t1", "p"};
        case AsrFormat::SnakeCase: return {"start_time", "end_time", "confidence"};
        case AsrFormat::Seconds:
        case AsrFormat::WhisperCli: break;
    }
    return {"start", "end", "probability"};
}

const char* format_name(AsrFormat format) {
    switch (format) {
        case AsrFormat::WhisperRn: return "whisper-rn";
        case AsrFormat::Seconds: return "seconds";
        case AsrFormat::SnakeCase: return "snake";
        case AsrFormat::WhisperCli: return "whisper-cli";
    }
    return "unknown";
}

// helper : tolerant field access, wrong types read as missing

double number_or(const json& obj, const char* key, double fallback) {
    if (!obj.is_object()) return fallback;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return fallback;
    return it->get<double>();
}

// first numeric field among the format's own key and its known aliases
double number_any(const json& obj, std::initializer_list<const char*> keys, double fallback) {
    if (!obj.is_object()) return fallback;
    for (const char* key : keys) {
        auto it = obj.find(key);
        if (it != obj.end() && it->is_number()) return it->get<double>();
    }
    return fallback;
}

std::string string_or(const json& obj, const char* key, const std::string& fallback = "") {
    if (!obj.is_object()) return fallback;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

// segments may sit under "segments" or be the root array itself
const json* segment_array(const json& root) {
    if (root.is_array()) return &root;
    if (root.is_object()) {
        auto it = root.find("segments");
        if (it != root.end() && it->is_array()) return &*it;
    }
    return nullptr;
}

RawWord make_word(std::string text, double start, double end, double probability) {
    RawWord word;
    word.text = TextCleaner::trim(text);
    word.start = start;
    word.end = std::max(start, end);
    word.probability = std::min(1.0, std::max(0.0, probability));
    return word;
}

} // namespace

TimeUnit default_unit(AsrFormat format) {
    switch (format) {
        case AsrFormat::WhisperRn: return TimeUnit::Centiseconds;
        case AsrFormat::WhisperCli: return TimeUnit::Milliseconds;
        case AsrFormat::Seconds:
        case AsrFormat::SnakeCase: break;
    }
    return TimeUnit::Seconds;
}

std::optional<AsrFormat> parse_asr_format_name(const std::string& name) {
    const std::string lower = TextCleaner::to_lower(name);
    if (lower == "whisper-rn" || lower == "rn") return AsrFormat::WhisperRn;
    if (lower == "seconds") return AsrFormat::Seconds;
    if (lower == "snake" || lower == "snake_case") return AsrFormat::SnakeCase;
    if (lower == "whisper-cli" || lower == "cli") return AsrFormat::WhisperCli;
    return std::nullopt;
}

std::optional<TimeUnit> parse_time_unit_name(const std::string& name) {
    const std::string lower = TextCleaner::to_lower(name);
    if (lower == "s" || lower == "sec" || lower == "seconds") return TimeUnit::Seconds;
    if (lower == "cs" || lower == "centiseconds") return TimeUnit::Centiseconds;
    if (lower == "ms" || lower == "milliseconds") return TimeUnit::Milliseconds;
    return std::nullopt;
}

AsrFormat AsrJsonAdapter::detect_format(const json& root) {
    if (root.is_object() && root.contains("transcription") && root["transcription"].is_array()) {
        return AsrFormat::WhisperCli;
    }

    const json* segments = segment_array(root);
    if (!segments) return AsrFormat::Seconds;

    for (const auto& segment : *segments) {
        if (!segment.is_object()) continue;

        if (segment.contains("t0") || segment.contains("t1")) return AsrFormat::WhisperRn;
        if (segment.contains("start_time") || segment.contains("end_time")) return AsrFormat::SnakeCase;
        if (segment.contains("start") || segment.contains("end")) return AsrFormat::Seconds;

        // no timing on the segment itself, look at its first word
        auto words = segment.find("words");
        if (words != segment.end() && words->is_array() && !words->empty()) {
            const json& w = words->front();
            if (w.is_object() && w.contains("t0")) return AsrFormat::WhisperRn;
            if (w.is_object() && w.contains("start_time")) return AsrFormat::SnakeCase;
        }
        break;
    }

    return AsrFormat::Seconds;
}

RawTranscript AsrJsonAdapter::parse_segments(const json& root, AsrFormat format) {
    RawTranscript transcript;
    transcript.unit = default_unit(format);
    transcript.language = string_or(root, "language", "en");

    const json* segments = segment_array(root);
    if (!segments) return transcript;

    const FieldKeys keys = keys_for(format);

    for (const auto& item : *segments) {
        if (!item.is_object()) continue;

        RawSegment segment;
        segment.text = string_or(item, "text");
        segment.start = number_any(item, {keys.start, "start", "t0"}, 0.0);
        segment.end = std::max(segment.start, number_any(item, {keys.end, "end", "t1"}, 0.0));

        auto words = item.find("words");
        if (words != item.end() && words->is_array()) {
            for (const auto& w : *words) {
                if (!w.is_object()) continue;

                std::string text = string_or(w, "word");
                if (text.empty()) text = string_or(w, "text");

                segment.words.push_back(make_word(std::move(text),
                                                  number_any(w, {keys.start, "start", "t0"}, 0.0),
                                                  number_any(w, {keys.end, "end", "t1"}, 0.0),
                                                  number_any(w, {keys.probability, "probability", "p"}, 0.8)));
            }
        }

        transcript.segments.push_back(std::move(segment));
    }

    return transcript;
}

RawTranscript AsrJsonAdapter::parse_whisper_cli(const json& root) {
    RawTranscript transcript;
    transcript.unit = TimeUnit::Milliseconds;

    auto result = root.find("result");
    if (result != root.end()) {
        transcript.language = string_or(*result, "language", "en");
    }

    for (const auto& entry : root["transcription"]) {
        if (!entry.is_object()) continue;

        RawSegment segment;
        segment.text = string_or(entry, "text");

        auto offsets = entry.find("offsets");
        if (offsets != entry.end()) {
            segment.start = number_or(*offsets, "from", 0.0);
            segment.end = std::max(segment.start, number_or(*offsets, "to", 0.0));
        }

        // with -ml 1 -sow every entry is one word made of sub-word tokens
        auto tokens = entry.find("tokens");
        if (tokens != entry.end() && tokens->is_array()) {
            double p_sum = 0.0;
            int p_count = 0;

            for (const auto& token : *tokens) {
                const std::string text = string_or(token, "text");
                if (text.rfind("[_", 0) == 0) continue; // [_BEG_], [_TT_123] ...
                p_sum += number_or(token, "p", 0.8);
                ++p_count;
            }

            if (p_count > 0 && !TextCleaner::trim(segment.text).empty()) {
                segment.words.push_back(make_word(segment.text, segment.start, segment.end,
                                                  p_sum / p_count));
            }
        }

        transcript.segments.push_back(std::move(segment));
    }

    return transcript;
}

RawTranscript AsrJsonAdapter::parse(const json& root, AsrFormat format) {
    if (format == AsrFormat::WhisperCli) {
        if (!root.is_object() || !root.contains("transcription") || !root["transcription"].is_array()) {
            std::cerr << "[asr] whisper-cli json without a transcription array" << std::endl;
            RawTranscript empty;
            empty.unit = TimeUnit::Milliseconds;
            return empty;
        }
        return parse_whisper_cli(root);
    }

    return parse_segments(root, format);
}

std::optional<RawTranscript> AsrJsonAdapter::parse_string(const std::string& content,
                                                          std::optional<TimeUnit> unit_override,
                                                          std::optional<AsrFormat> format_override) {
    try {
        const json root = json::parse(content);
        const AsrFormat format = format_override ? *format_override : detect_format(root);

        RawTranscript transcript = parse(root, format);
        if (unit_override) {
            transcript.unit = *unit_override;
        }

        std::cout << "[asr] format " << format_name(format) << ", "
                  << transcript.segments.size() << " segments" << std::endl;
        return transcript;
    } catch (const json::exception& e) {
        std::cerr << "[asr] json parsing error: " << e.what() << std::endl;
    }

    return std::nullopt;
}

std::optional<RawTranscript> AsrJsonAdapter::load_transcript(const std::filesystem::path& path,
                                                             std::optional<TimeUnit> unit_override,
                                                             std::optional<AsrFormat> format_override) {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "[asr] failed to open transcript: " << path << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse_string(buffer.str(), unit_override, format_override);
}
