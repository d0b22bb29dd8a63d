#pragma once
#include <string>
#include <filesystem>
#include <optional>

struct Paths {
        std::filesystem::path ffmpeg_binary = "ffmpeg";
        std::filesystem::path whisper_binary = "whisper-cli";
        std::filesystem::path model_path = "models/ggml-base.en.bin";
        std::filesystem::path temp_dir = "temp";
        std::string language = "en";
    };

// the asr collaborator: ffmpeg + whisper.cpp driven as external processes

class ExternalTools {
public:

    ExternalTools(Paths paths = Paths()) : paths_(paths) {
        std::filesystem::create_directories(paths_.temp_dir);
    }

    // 1. is the binary on PATH (or an existing file)

    bool tool_available(const std::filesystem::path& binary);

    // 2. convert any audio file to 16 kHz mono pcm wav (what whisper expects)

    std::optional<std::filesystem::path> convert_to_whisper_wav(const std::filesystem::path& input,
                                                                const std::filesystem::path& out_path);

    // 3. run whisper.cpp with one word per segment, full json output

    std::optional<std::filesystem::path> run_whisper(const std::filesystem::path& wav,
                                                     const std::filesystem::path& out_json);

    // 2 + 3, artifacts cached under temp_dir/<hash of input path>

    std::optional<std::filesystem::path> transcribe(const std::filesystem::path& audio);

private:
    Paths paths_;

    bool execute_command(const std::string& cmd);

    std::string run_command_with_output(const std::string& cmd);

};
