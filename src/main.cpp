#include <iostream>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include <filesystem>
#include "AsrJson.hpp"
#include "AutoTimestamper.hpp"
#include "ExternalTools.hpp"
#include "LyricsEngine.hpp"

namespace fs = std::filesystem;

namespace {

void print_usage() {
    std::cout << "usage:\n"
              << "  lyricsync align <transcript.json> <lyrics.txt> [--unit s|cs|ms] [--format name] [--window sec] [--out file.lrc]\n"
              << "  lyricsync extract <transcript.json> [--unit s|cs|ms] [--format name] [--out file.lrc]\n"
              << "  lyricsync fetch <artist> <title> [--out lyrics.txt]\n"
              << "  lyricsync transcribe <audio> [--model path] [--whisper bin] [--ffmpeg bin]\n"
              << "  lyricsync sync <audio> (--lyrics file | --artist a --title t) [--model path] [--out file.lrc]"
              << std::endl;
}

// positional args and --key value options
struct Args {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;

    std::string get(const std::string& key, const std::string& fallback = "") const {
        auto it = options.find(key);
        return it == options.end() ? fallback : it->second;
    }

    bool has(const std::string& key) const {
        return options.count(key) > 0;
    }
};

std::optional<Args> parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << arg << std::endl;
                return std::nullopt;
            }
            args.options[arg.substr(2)] = argv[++i];
        } else {
            args.positional.push_back(arg);
        }
    }

    return args;
}

std::optional<std::string> read_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "failed to open " << path << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

Paths paths_from(const Args& args) {
    Paths paths;
    if (args.has("model")) paths.model_path = args.get("model");
    if (args.has("whisper")) paths.whisper_binary = args.get("whisper");
    if (args.has("ffmpeg")) paths.ffmpeg_binary = args.get("ffmpeg");
    if (args.has("language")) paths.language = args.get("language");
    return paths;
}

std::optional<AlignerConfig> config_from(const Args& args) {
    AlignerConfig config;

    if (args.has("window")) {
        try {
            config.primary_window = std::stod(args.get("window"));
        } catch (const std::exception&) {
            std::cerr << "invalid --window value: " << args.get("window") << std::endl;
            return std::nullopt;
        }
    }

    return config;
}

bool unit_from(const Args& args, std::optional<TimeUnit>& unit) {
    if (!args.has("unit")) return true;

    unit = parse_time_unit_name(args.get("unit"));
    if (!unit) {
        std::cerr << "unknown --unit: " << args.get("unit") << " (expected s, cs or ms)" << std::endl;
        return false;
    }
    return true;
}

bool format_from(const Args& args, std::optional<AsrFormat>& format) {
    if (!args.has("format")) return true;

    format = parse_asr_format_name(args.get("format"));
    if (!format) {
        std::cerr << "unknown --format: " << args.get("format")
                  << " (expected whisper-rn, seconds, snake or whisper-cli)" << std::endl;
        return false;
    }
    return true;
}

int report(const AlignmentResult& result, const Args& args) {
    LrcWriter writer;
    const std::string lrc = writer.to_lrc(result.lines);

    for (const auto& warning : result.warnings) {
        std::cerr << "[warning] " << warning << std::endl;
    }

    std::cout << "\n overall confidence: " << static_cast<int>(result.overall_confidence * 100.0 + 0.5)
              << "% (" << result.successful_matches << "/" << result.total_lines << " lines)" << std::endl;

    if (args.has("out")) {
        return writer.save_to_file(lrc, args.get("out")) ? 0 : 1;
    }

    std::cout << "\n" << lrc;
    return 0;
}

int run_align(const Args& args) {
    if (args.positional.size() < 2) {
        print_usage();
        return 1;
    }

    std::optional<TimeUnit> unit;
    if (!unit_from(args, unit)) return 1;

    std::optional<AsrFormat> format;
    if (!format_from(args, format)) return 1;

    auto config = config_from(args);
    if (!config) return 1;

    auto transcript = AsrJsonAdapter::load_transcript(args.positional[0], unit, format);
    if (!transcript) return 1;

    auto lyrics = read_file(args.positional[1]);
    if (!lyrics) return 1;

    AutoTimestamper timestamper(*config);
    return report(timestamper.align_lyrics(*transcript, *lyrics), args);
}

int run_extract(const Args& args) {
    if (args.positional.empty()) {
        print_usage();
        return 1;
    }

    std::optional<TimeUnit> unit;
    if (!unit_from(args, unit)) return 1;

    std::optional<AsrFormat> format;
    if (!format_from(args, format)) return 1;

    auto transcript = AsrJsonAdapter::load_transcript(args.positional[0], unit, format);
    if (!transcript) return 1;

    AutoTimestamper timestamper;
    AlignmentResult result = timestamper.extract_lyrics(*transcript);

    if (result.lines.empty()) {
        std::cerr << "could not extract lyrics. audio may be instrumental or unclear." << std::endl;
        return 1;
    }

    return report(result, args);
}

int run_fetch(const Args& args) {
    if (args.positional.size() < 2) {
        print_usage();
        return 1;
    }

    LyricsFetcher fetcher;
    auto lyrics = fetcher.fetch_plain_lyrics(args.positional[0], args.positional[1]);
    if (!lyrics) {
        std::cerr << "lyrics not found." << std::endl;
        return 1;
    }

    if (args.has("out")) {
        std::ofstream out(args.get("out"));
        if (!out.is_open()) {
            std::cerr << "failed to open file for writing: " << args.get("out") << std::endl;
            return 1;
        }
        out << *lyrics;
        return 0;
    }

    std::cout << *lyrics << std::endl;
    return 0;
}

int run_transcribe(const Args& args) {
    if (args.positional.empty()) {
        print_usage();
        return 1;
    }

    ExternalTools tools(paths_from(args));
    auto json_path = tools.transcribe(args.positional[0]);
    if (!json_path) return 1;

    std::cout << *json_path << std::endl;
    return 0;
}

int run_sync(const Args& args) {
    if (args.positional.empty()) {
        print_usage();
        return 1;
    }

    auto config = config_from(args);
    if (!config) return 1;

    // 1. lyrics
    std::cout << "\n[1/3] loading lyrics..." << std::endl;

    std::optional<std::string> lyrics;
    if (args.has("lyrics")) {
        lyrics = read_file(args.get("lyrics"));
    } else if (args.has("title")) {
        LyricsFetcher fetcher;
        lyrics = fetcher.fetch_plain_lyrics(args.get("artist"), args.get("title"));
    } else {
        print_usage();
        return 1;
    }

    if (!lyrics) {
        std::cerr << "lyrics not found." << std::endl;
        return 1;
    }

    // 2. transcript
    std::cout << "\n[2/3] transcribing audio..." << std::endl;

    ExternalTools tools(paths_from(args));
    auto json_path = tools.transcribe(args.positional[0]);
    if (!json_path) return 1;

    auto transcript = AsrJsonAdapter::load_transcript(*json_path);
    if (!transcript) return 1;

    // 3. align
    std::cout << "\n[3/3] aligning..." << std::endl;

    AutoTimestamper timestamper(*config);
    return report(timestamper.align_lyrics(*transcript, *lyrics), args);
}

} // namespace

int main(int argc, char* argv[]) {

    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string command = argv[1];

    auto args = parse_args(argc, argv);
    if (!args) return 1;

    if (command == "align") return run_align(*args);
    if (command == "extract") return run_extract(*args);
    if (command == "fetch") return run_fetch(*args);
    if (command == "transcribe") return run_transcribe(*args);
    if (command == "sync") return run_sync(*args);

    print_usage();
    return 1;
}
