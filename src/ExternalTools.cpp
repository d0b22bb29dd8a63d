#include "ExternalTools.hpp"
#include <iostream>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <array>
#include <memory>
#include <functional>

namespace fs = std::filesystem;

// helper : run command and capture output

std::string ExternalTools::run_command_with_output(const std::string& cmd) {
    std::array<char, 4096> buffer;
    std::string result;

    // open pipe to command

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(cmd.c_str(), "r"), pclose);
    if (!pipe) return "";

    // read stdout

    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr) {
        result += buffer.data();
    }

    // remove trailing newline

    if (!result.empty() && result.back() == '\n') {
        result.pop_back();
    }

    return result;

}

bool ExternalTools::execute_command(const std::string& cmd) {
    std::cout << "[exec] " << cmd << std::endl;
    int ret = std::system(cmd.c_str());
    return (ret == 0);
}

bool ExternalTools::tool_available(const fs::path& binary) {
    if (fs::exists(binary)) return true;

    std::string found = run_command_with_output("command -v \"" + binary.string() + "\" 2>/dev/null");
    return !found.empty();
}

std::optional<fs::path> ExternalTools::convert_to_whisper_wav(const fs::path& input, const fs::path& out_path) {
    // cache check
    if (fs::exists(out_path)) {
        std::cout << "[cache hit] audio already converted." << std::endl;
        return out_path;
    }

    if (!fs::exists(input)) {
        std::cerr << "[error] audio file not found: " << input << std::endl;
        return std::nullopt;
    }

    if (out_path.has_parent_path()) {
        fs::create_directories(out_path.parent_path());
    }

    std::stringstream cmd;
    cmd << "\"" << paths_.ffmpeg_binary.string() << "\" -y -loglevel error "
        << "-i \"" << input.string() << "\" "
        << "-ar 16000 -ac 1 -c:a pcm_s16le "
        << "\"" << out_path.string() << "\"";

    if (execute_command(cmd.str())) {
        if (fs::exists(out_path)) return out_path;
    }

    std::cerr << "[error] ffmpeg failed to convert audio" << std::endl;
    return std::nullopt;
}

std::optional<fs::path> ExternalTools::run_whisper(const fs::path& wav, const fs::path& out_json) {
    if (fs::exists(out_json)) {
        std::cout << "[cache hit] transcript already exists." << std::endl;
        return out_json;
    }

    if (!fs::exists(paths_.model_path)) {
        std::cerr << "[error] whisper model not found: " << paths_.model_path << std::endl;
        return std::nullopt;
    }

    // whisper-cli appends ".json" to the -of base name
    fs::path out_base = out_json;
    out_base.replace_extension();

    std::stringstream cmd;
    cmd << "\"" << paths_.whisper_binary.string() << "\" "
        << "-m \"" << paths_.model_path.string() << "\" "
        << "-f \"" << wav.string() << "\" "
        << "-l " << paths_.language << " "
        << "-ml 1 -sow -ojf -np "
        << "-of \"" << out_base.string() << "\"";

    if (execute_command(cmd.str())) {
        if (fs::exists(out_json)) return out_json;
    }

    std::cerr << "[error] whisper transcription failed" << std::endl;
    return std::nullopt;
}

std::optional<fs::path> ExternalTools::transcribe(const fs::path& audio) {
    for (const auto& binary : {paths_.ffmpeg_binary, paths_.whisper_binary}) {
        if (!tool_available(binary)) {
            std::cerr << "[error] required tool not found: " << binary << std::endl;
            return std::nullopt;
        }
    }

    // hash of the input path as the artifact folder name
    size_t input_hash = std::hash<std::string>{}(fs::absolute(audio).string());
    fs::path work_dir = paths_.temp_dir / std::to_string(input_hash);
    fs::create_directories(work_dir);

    auto wav = convert_to_whisper_wav(audio, work_dir / "audio16k.wav");
    if (!wav) return std::nullopt;

    return run_whisper(*wav, work_dir / "transcript.json");
}
