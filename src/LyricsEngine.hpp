#pragma once

#include "Types.hpp"
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <nlohmann/json.hpp>

// network layer

class LyricsFetcher {
public:
    // plain lyrics from LRCLIB; synced lyrics are accepted with their timing stripped
    std::optional<std::string> fetch_plain_lyrics(const std::string& artist, const std::string& title);

    // picks the lyrics out of an LRCLIB /api/get response body
    static std::optional<std::string> lyrics_from_response(const std::string& response);

private:
    // lib curl helper functions
    static size_t WriteCallBack(void* contents, size_t size, size_t nmemb, std::string* userp);
    std::string url_encode(const std::string& value);
    std::string perform_get_request(const std::string& url);

};

// user supplied lyrics -> ordered plain lines

class LyricsParser {
public:
    // splits, trims, strips [mm:ss.xx] markup, drops timestamp-only and [Section] lines
    static std::vector<std::string> parse_user_lyrics(const std::string& raw_lyrics);

    // removes every inline timing tag from a line
    static std::string strip_timing(const std::string& line);

    static bool is_timestamp(const std::string& line);

    static bool is_metadata(const std::string& line);
};

// aligned lines -> .lrc

class LrcWriter {
public:
    // "[mm:ss.xx] text" per line, or bare text when nothing is timed
    std::string to_lrc(const std::vector<AlignedLine>& lines);

    bool save_to_file(const std::string& content, const std::filesystem::path& path);

    static std::string format_time_lrc(double seconds);
};
