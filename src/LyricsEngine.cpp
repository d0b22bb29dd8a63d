#include "LyricsEngine.hpp"
#include "TextCleaner.hpp"
#include <iostream>
#include <curl/curl.h>
#include <sstream>
#include <fstream>
#include <regex>
#include <cmath>
#include <cstdio>

using json = nlohmann::json;

// helper : Write Callback for LibCurl
// this accumulates the data received from the server into a std::string

size_t LyricsFetcher::WriteCallBack(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t realsize = size * nmemb;
    userp->append(static_cast<char*>(contents), realsize);
    return realsize;
}

// helper : url encoding
// converts spaces to %20, etc..

std::string LyricsFetcher::url_encode(const std::string& value) {
    CURL* curl = curl_easy_init();
    if (curl) {
        char* output = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.length()));
        std::string result = output ? output : "";
        curl_free(output);
        curl_easy_cleanup(curl);
        return result;
    }
    return "";
}

// helper :: perform http get

std::string LyricsFetcher::perform_get_request(const std::string& url) {
    std::string readBuffer;

    CURL* curl = curl_easy_init();

    if (curl) {
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallBack);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &readBuffer);

        // lrclib asks clients to identify themselves
        curl_easy_setopt(curl, CURLOPT_USERAGENT, "lyricsync");

        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, 10L);

        CURLcode res = curl_easy_perform(curl);

        if (res != CURLE_OK) {
            std::cerr << "[network] curl_easy_perform() failed: " << curl_easy_strerror(res) << std::endl;
            readBuffer.clear();
        }

        curl_easy_cleanup(curl);
    }

    return readBuffer;
}

std::optional<std::string> LyricsFetcher::lyrics_from_response(const std::string& response) {
    try {
        auto json_data = json::parse(response);
        if (!json_data.is_object()) return std::nullopt;

        // 1. plain lyrics are exactly what the aligner wants

        if (json_data.contains("plainLyrics") && json_data["plainLyrics"].is_string()) {
            std::string lyrics = json_data["plainLyrics"].get<std::string>();
            if (!lyrics.empty()) return lyrics;
        }

        // 2. fallback: synced lyrics, timing removed by the parser later

        if (json_data.contains("syncedLyrics") && json_data["syncedLyrics"].is_string()) {
            std::string lyrics = json_data["syncedLyrics"].get<std::string>();
            if (!lyrics.empty()) {
                std::cerr << "[network] warning: only synced lyrics found, timing will be discarded." << std::endl;
                return lyrics;
            }
        }

        if (json_data.value("instrumental", false)) {
            std::cerr << "[network] track is marked instrumental." << std::endl;
        }
    } catch (const json::exception& e) {
        std::cerr << "[network] json parsing error: " << e.what() << std::endl;
    }

    return std::nullopt;
}

// main method : fetch lyrics

std::optional<std::string> LyricsFetcher::fetch_plain_lyrics(const std::string& artist, const std::string& title) {
    // endpoint https://lrclib.net/api/get?artist_name=...&track_name=...

    std::string query_url = "https://lrclib.net/api/get?artist_name=" + url_encode(artist) +
                            "&track_name=" + url_encode(title);

    std::cout << "[network] fetching lyrics from: " << query_url << std::endl;

    std::string response = perform_get_request(query_url);

    if (response.empty()) {
        std::cerr << "[network] empty response from server." << std::endl;
        return std::nullopt;
    }

    return lyrics_from_response(response);
}


namespace {

// [mm:ss], [mm:ss.xx], <mm:ss.xx> anywhere in a line
const std::regex kInlineTiming(R"([\[<]\d{1,2}:\d{1,2}(?:[.:]\d{1,3})?[\]>])");

// a line that is nothing but a (possibly loose) timestamp, e.g. "0:3.75" or "[01:02]"
const std::regex kTimestampOnly(R"(^[\[\(]?\d{1,2}[:.]\d{1,2}(\.\d+)?[\]\)]?$)");

// [Chorus], [ar:Artist] ...
const std::regex kMetadata(R"(^\[.*\]$)");

// separators left behind once timing is gone
const std::regex kEdgeSeparators(R"(^[ \-:.|]+|[ \-:.|]+$)");

const std::regex kSpaceRuns(R"(\s{2,})");

} // namespace

std::string LyricsParser::strip_timing(const std::string& line) {
    return std::regex_replace(line, kInlineTiming, "");
}

bool LyricsParser::is_timestamp(const std::string& line) {
    return std::regex_match(TextCleaner::trim(line), kTimestampOnly);
}

bool LyricsParser::is_metadata(const std::string& line) {
    const std::string trimmed = TextCleaner::trim(line);
    return std::regex_match(trimmed, kMetadata) && !is_timestamp(trimmed);
}

std::vector<std::string> LyricsParser::parse_user_lyrics(const std::string& raw_lyrics) {
    std::vector<std::string> lines;
    std::stringstream ss(raw_lyrics);
    std::string segment;

    while (std::getline(ss, segment)) {
        // strip carriage returns (\r) just in case
        if (!segment.empty() && segment.back() == '\r') segment.pop_back();

        std::string line = TextCleaner::trim(segment);
        if (line.empty() || is_timestamp(line)) continue;

        const std::string untimed = strip_timing(line);
        if (untimed != line) {
            line = std::regex_replace(untimed, kEdgeSeparators, "");
            line = TextCleaner::trim(std::regex_replace(line, kSpaceRuns, " "));
        }

        if (line.empty() || is_metadata(line)) continue;

        lines.push_back(line);
    }

    std::cout << "[lyrics] parsed " << lines.size() << " lyric lines" << std::endl;
    return lines;
}


std::string LrcWriter::format_time_lrc(double seconds) {
    // format mm:ss.xx

    if (seconds < 0.0) seconds = 0.0;

    long total_cs = std::lround(seconds * 100.0);
    long m = total_cs / 6000;
    long s = (total_cs / 100) % 60;
    long cs = total_cs % 100;

    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%02ld:%02ld.%02ld", m, s, cs);
    return std::string(buffer);
}

std::string LrcWriter::to_lrc(const std::vector<AlignedLine>& lines) {
    std::stringstream ss;

    bool all_zero = true;
    for (const auto& line : lines) {
        if (line.timestamp != 0.0) {
            all_zero = false;
            break;
        }
    }

    for (const auto& line : lines) {
        if (all_zero) {
            ss << line.text << "\n";
        } else {
            ss << "[" << format_time_lrc(line.timestamp) << "] " << line.text << "\n";
        }
    }

    return ss.str();
}

bool LrcWriter::save_to_file(const std::string& content, const std::filesystem::path& path) {

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream out(path);

    if (out.is_open()) {
        out << content;
        out.close();
        std::cout << "[lyrics] wrote " << path << std::endl;
        return true;
    }

    std::cerr << "failed to open file for writing: " << path << std::endl;
    return false;

}
