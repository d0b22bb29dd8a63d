#include <catch2/catch.hpp>
#include "LyricMatcher.hpp"

namespace {

CleanWord word(const std::string& text, double start, double end, double p) {
    CleanWord w;
    w.text = text;
    w.start = start;
    w.end = end;
    w.probability = p;
    return w;
}

} // namespace

TEST_CASE("edit distance over tokens", "[matcher]") {
    using V = std::vector<std::string>;

    REQUIRE(LyricMatcher::edit_distance(V{"a", "b"}, V{"a", "b"}) == 0);
    REQUIRE(LyricMatcher::edit_distance(V{"a", "b"}, V{"a", "c"}) == 1);
    REQUIRE(LyricMatcher::edit_distance(V{"a", "b", "c"}, V{"a", "c"}) == 1);
    REQUIRE(LyricMatcher::edit_distance(V{}, V{"x", "y"}) == 2);
    REQUIRE(LyricMatcher::edit_distance(V{"kitten"}, V{}) == 1);

    REQUIRE(LyricMatcher::similarity(V{"a"}, V{"a"}) == Approx(1.0));
    REQUIRE(LyricMatcher::similarity(V{"a"}, V{"b"}) == Approx(0.5));
}

TEST_CASE("window collection uses the hint only as a scan start", "[matcher]") {
    const std::vector<CleanWord> words{
        word("a", 0, 5, 0.9),
        word("b", 6, 7, 0.9),
        word("c", 8, 9, 0.9),
        word("d", 30, 31, 0.9)
    };

    // "a" is still open at t=4 even though the hint points past it
    const auto window = LyricMatcher::words_in_window(words, 4.0, 19.0, 2);
    REQUIRE(window.size() == 3);
    REQUIRE(window.front().text == "a");
    REQUIRE(window.back().text == "c");

    REQUIRE(LyricMatcher::words_in_window(words, 10.0, 20.0, 0).empty());
    REQUIRE(LyricMatcher::words_in_window(words, 0.0, 100.0, 99).size() == 4);
}

TEST_CASE("an exact line matches at its first word", "[matcher]") {
    LyricMatcher matcher;
    const std::vector<CleanWord> words{word("hello", 0, 1, 0.9), word("world", 1, 2, 0.9)};

    const WindowMatch match = matcher.match_line("Hello, world!", words, 0.0, 15.0, 0);

    REQUIRE(match.score > 0.6);
    REQUIRE(match.score == Approx(0.98));
    REQUIRE(match.timestamp == Approx(0.0));
    REQUIRE(match.offset == 0);
    REQUIRE(match.length == 2);
}

TEST_CASE("transcript punctuation and apostrophes do not hurt the match", "[matcher]") {
    LyricMatcher matcher;
    const std::vector<CleanWord> words{
        word("oh", 3, 3.5, 1.0),
        word("Don't", 4, 4.5, 1.0),
        word("stop!", 4.5, 5, 1.0)
    };

    const WindowMatch match = matcher.match_line("dont stop", words, 0.0, 15.0, 0);

    REQUIRE(match.score == Approx(1.0));
    REQUIRE(match.timestamp == Approx(4.0));
}

TEST_CASE("equal scores keep the first candidate found", "[matcher]") {
    LyricMatcher matcher;
    const std::vector<CleanWord> words{
        word("la", 0, 1, 0.5),
        word("la", 5, 6, 0.5)
    };

    const WindowMatch match = matcher.match_line("la", words, 0.0, 15.0, 0);

    REQUIRE(match.timestamp == Approx(0.0));
    REQUIRE(match.length == 1);
}

TEST_CASE("a matched line advances the cursor", "[matcher]") {
    LyricMatcher matcher;
    const std::vector<CleanWord> words{
        word("hello", 0, 1, 0.9),
        word("world", 1, 2, 0.9),
        word("see", 5, 6, 0.9),
        word("you", 6, 7, 0.9)
    };

    MatcherState state;
    const auto lines = matcher.align({"hello world", "see you"}, words, state);

    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].timestamp == Approx(0.0));
    REQUIRE(lines[1].timestamp == Approx(5.0));
    REQUIRE(lines[1].confidence == Approx(0.98));
    REQUIRE(state.cursor_time == Approx(5.1));
    REQUIRE(state.cursor_index == 2);
}

TEST_CASE("a line without lexical overlap is parked after the cursor", "[matcher]") {
    LyricMatcher matcher;
    const std::vector<CleanWord> words{word("alpha", 0, 1, 0.5), word("beta", 1, 2, 0.5)};

    MatcherState state;
    const auto lines = matcher.align({"zulu yankee"}, words, state);

    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].confidence < 0.6);
    REQUIRE(lines[0].confidence == Approx(0.3667).epsilon(0.001));
    REQUIRE(lines[0].timestamp == Approx(0.1));
    REQUIRE(state.cursor_time == Approx(0.0));
    REQUIRE(state.cursor_index == 0);
}

TEST_CASE("the wide window is used only when it is very confident", "[matcher]") {
    LyricMatcher matcher;
    const std::vector<CleanWord> words{
        word("la", 0, 1, 0.1),
        word("far", 40, 41, 0.9),
        word("away", 41, 42, 0.9)
    };

    SECTION("confident fallback is accepted") {
        const auto lines = matcher.align({"far away"}, words);
        REQUIRE(lines[0].timestamp == Approx(40.0));
        REQUIRE(lines[0].confidence == Approx(0.98));
    }

    SECTION("mediocre fallback is rejected") {
        const auto lines = matcher.align({"far awry"}, words);
        REQUIRE(lines[0].timestamp == Approx(0.1));
        REQUIRE(lines[0].confidence == Approx(0.2867).epsilon(0.001));
    }
}

TEST_CASE("an empty transcript never fails", "[matcher]") {
    LyricMatcher matcher;

    const auto lines = matcher.align({"one", "two", "three"}, {});

    REQUIRE(lines.size() == 3);
    for (const auto& line : lines) {
        REQUIRE(line.confidence == Approx(0.0));
        REQUIRE(line.timestamp == Approx(0.1));
    }
}

TEST_CASE("a line of only punctuation scores zero", "[matcher]") {
    LyricMatcher matcher;
    const std::vector<CleanWord> words{word("hello", 0, 1, 0.9)};

    const WindowMatch match = matcher.match_line("...", words, 0.0, 15.0, 0);

    REQUIRE(match.score == Approx(0.0));
    REQUIRE(match.length == 0);
}

TEST_CASE("a weak line does not move the cursor for the next one", "[matcher]") {
    LyricMatcher matcher;
    const std::vector<CleanWord> words{
        word("hello", 0, 1, 0.9),
        word("world", 1, 2, 0.9),
        word("goodbye", 8, 9, 0.9),
        word("moon", 9, 10, 0.9)
    };

    const auto lines = matcher.align({"hello world", "xylophone quartz", "goodbye moon"}, words);

    REQUIRE(lines[0].timestamp == Approx(0.0));
    REQUIRE(lines[1].confidence < 0.6);
    REQUIRE(lines[1].timestamp == Approx(0.2));
    REQUIRE(lines[2].timestamp == Approx(8.0));
    REQUIRE(lines[2].confidence == Approx(0.98));
}
