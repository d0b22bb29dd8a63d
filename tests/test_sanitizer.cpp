#include <catch2/catch.hpp>
#include "TranscriptSanitizer.hpp"
#include <random>
#include <utility>

namespace {

RawSegment segment(const std::string& text, double start, double end, std::vector<RawWord> words = {}) {
    RawSegment s;
    s.text = text;
    s.start = start;
    s.end = end;
    s.words = std::move(words);
    return s;
}

RawWord word(const std::string& text, double start, double end, double p = 0.9) {
    RawWord w;
    w.text = text;
    w.start = start;
    w.end = end;
    w.probability = p;
    return w;
}

// feeds sanitized output back in as a seconds-based raw transcript
std::vector<RawSegment> to_raw(const std::vector<CleanSegment>& clean) {
    std::vector<RawSegment> raw;
    for (const auto& c : clean) {
        std::vector<RawWord> words;
        for (const auto& w : c.words) {
            words.push_back(word(w.text, w.start, w.end, w.probability));
        }
        raw.push_back(segment(c.text, c.start, c.end, words));
    }
    return raw;
}

void require_same(const std::vector<CleanSegment>& once, const std::vector<CleanSegment>& twice) {
    REQUIRE(twice.size() == once.size());
    for (std::size_t i = 0; i < once.size(); ++i) {
        REQUIRE(twice[i].text == once[i].text);
        REQUIRE(twice[i].start == Approx(once[i].start));
        REQUIRE(twice[i].words.size() == once[i].words.size());
        for (std::size_t k = 0; k < once[i].words.size(); ++k) {
            REQUIRE(twice[i].words[k].text == once[i].words[k].text);
            REQUIRE(twice[i].words[k].start == Approx(once[i].words[k].start));
            REQUIRE(twice[i].words[k].probability == Approx(once[i].words[k].probability));
        }
    }
}

} // namespace

TEST_CASE("a segment that is only music is dropped", "[sanitizer]") {
    TranscriptSanitizer sanitizer;

    REQUIRE(sanitizer.sanitize({segment("Music", 0, 500)}, TimeUnit::Centiseconds).empty());
    REQUIRE(sanitizer.sanitize({segment("mUsIc", 0, 5)}, TimeUnit::Seconds).empty());
    REQUIRE(sanitizer.sanitize({segment("(Music)", 0, 5)}, TimeUnit::Seconds).empty());
    REQUIRE(sanitizer.sanitize({segment(" music ", 0, 5, {word("music", 0, 5)})}, TimeUnit::Seconds).empty());
}

TEST_CASE("repeated structural tags collapse", "[sanitizer]") {
    TranscriptSanitizer sanitizer;

    const auto from_text = sanitizer.sanitize({segment("[Instrumental] [Instrumental] yeah", 0, 4)},
                                              TimeUnit::Seconds);
    REQUIRE(from_text.size() == 1);
    REQUIRE(from_text[0].text == "[Instrumental] yeah");
    REQUIRE(from_text[0].words.size() == 2);

    const auto from_words = sanitizer.sanitize(
        {segment("[Instrumental] [Instrumental] yeah", 0, 4,
                 {word("[Instrumental]", 0, 1), word("[Instrumental]", 1, 2), word("yeah", 3, 4)})},
        TimeUnit::Seconds);
    REQUIRE(from_words.size() == 1);
    REQUIRE(from_words[0].text == "[Instrumental] yeah");
}

TEST_CASE("credits are discarded regardless of confidence", "[sanitizer]") {
    TranscriptSanitizer sanitizer;

    REQUIRE(sanitizer.sanitize({segment("Translated by Amara.org", 10, 12)}, TimeUnit::Seconds).empty());

    const auto with_words = sanitizer.sanitize(
        {segment("Translated by Amara.org", 10, 12,
                 {word("Translated", 10, 10.5, 0.99), word("by", 10.5, 11, 0.99), word("Amara.org", 11, 12, 0.99)})},
        TimeUnit::Seconds);
    REQUIRE(with_words.empty());
}

TEST_CASE("noise words are removed from a segment", "[sanitizer]") {
    TranscriptSanitizer sanitizer;

    const auto result = sanitizer.sanitize(
        {segment("hello (music) music world", 0, 4,
                 {word("hello", 0, 1), word("(music)", 1, 2), word("music", 2, 3), word("world,", 3, 4)})},
        TimeUnit::Seconds);

    REQUIRE(result.size() == 1);
    REQUIRE(result[0].text == "hello world");
    REQUIRE(result[0].words.size() == 2);
    REQUIRE(result[0].words[1].text == "world");
}

TEST_CASE("word reconstruction recovers a discarded segment text", "[sanitizer]") {
    TranscriptSanitizer sanitizer;

    const auto result = sanitizer.sanitize(
        {segment("music", 2, 4, {word("la", 2, 3), word("la", 3, 4)})}, TimeUnit::Seconds);

    REQUIRE(result.size() == 1);
    REQUIRE(result[0].text == "la la");
    REQUIRE(result[0].start == Approx(2.0));
    REQUIRE(result[0].end == Approx(4.0));
}

TEST_CASE("missing words are estimated evenly across the segment", "[sanitizer]") {
    TranscriptSanitizer sanitizer;

    const auto result = sanitizer.sanitize({segment("one two three four", 100, 500)}, TimeUnit::Centiseconds);

    REQUIRE(result.size() == 1);
    const auto& words = result[0].words;
    REQUIRE(words.size() == 4);
    REQUIRE(words[0].start == Approx(1.0));
    REQUIRE(words[1].start == Approx(2.0));
    REQUIRE(words[3].end == Approx(5.0));
    REQUIRE(words[2].probability == Approx(0.8));
}

TEST_CASE("centisecond and millisecond inputs end up in seconds", "[sanitizer]") {
    TranscriptSanitizer sanitizer;

    const auto cs = sanitizer.sanitize({segment("hi", 150, 250, {word("hi", 150, 250)})}, TimeUnit::Centiseconds);
    REQUIRE(cs[0].words[0].start == Approx(1.5));
    REQUIRE(cs[0].words[0].end == Approx(2.5));

    const auto ms = sanitizer.sanitize({segment("hi", 1500, 2500, {word("hi", 1500, 2500)})}, TimeUnit::Milliseconds);
    REQUIRE(ms[0].words[0].start == Approx(1.5));
}

TEST_CASE("malformed timing degrades instead of failing", "[sanitizer]") {
    TranscriptSanitizer sanitizer;

    const auto result = sanitizer.sanitize({segment("", 0, 0, {word("hey", 5, 3, 1.7)})}, TimeUnit::Seconds);

    REQUIRE(result.size() == 1);
    REQUIRE(result[0].words[0].end == Approx(5.0));
    REQUIRE(result[0].words[0].probability == Approx(1.0));
    REQUIRE(sanitizer.sanitize({segment("", 0, 0)}, TimeUnit::Seconds).empty());
}

TEST_CASE("segments come out time ordered", "[sanitizer]") {
    TranscriptSanitizer sanitizer;

    const auto result = sanitizer.sanitize({segment("second", 5, 6), segment("first", 1, 2)}, TimeUnit::Seconds);

    REQUIRE(result.size() == 2);
    REQUIRE(result[0].text == "first");
    REQUIRE(result[1].text == "second");

    const auto words = TranscriptSanitizer::flatten_words(result);
    REQUIRE(words.size() == 2);
    REQUIRE(words[0].text == "first");
}

TEST_CASE("sanitizing sanitized output changes nothing", "[sanitizer]") {
    TranscriptSanitizer sanitizer;

    const std::vector<RawSegment> raw{
        segment("[Chorus] [Chorus] Hello, world!", 0, 3,
                {word("[Chorus]", 0, 0.5), word("[Chorus]", 0.5, 1), word("Hello,", 1, 2), word("world!", 2, 3)}),
        segment("Translated by Amara.org", 3, 4),
        segment("(music) don't stop", 4, 8),
        segment("applause", 8, 9)
    };

    const auto once = sanitizer.sanitize(raw, TimeUnit::Seconds);
    REQUIRE(once.size() == 2);
    require_same(once, sanitizer.sanitize(to_raw(once), TimeUnit::Seconds));
}

TEST_CASE("words that all clean away fall back to the segment text", "[sanitizer]") {
    TranscriptSanitizer sanitizer;

    const auto once = sanitizer.sanitize({segment("music [Chorus]", 0, 2, {word("\xE2\x99\xAA", 0, 2)})},
                                         TimeUnit::Seconds);

    REQUIRE(once.size() == 1);
    REQUIRE(once[0].text == "[Chorus]");
    REQUIRE(once[0].words.size() == 1);
    REQUIRE(once[0].words[0].start == Approx(1.0));

    require_same(once, sanitizer.sanitize(to_raw(once), TimeUnit::Seconds));
}

TEST_CASE("sanitizing is idempotent on random transcripts", "[sanitizer]") {
    const std::vector<std::string> vocab{
        "hello", "World,", "Music", "music", "\xE2\x99\xAA", "[Chorus]", "[Verse 1]", "(laughs)",
        "don't", "Amara.org", "Translated", "by", "applause", "yeah!", "[Instrumental]", "la"
    };

    TranscriptSanitizer sanitizer;
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> pick(0, static_cast<int>(vocab.size()) - 1);
    std::uniform_int_distribution<int> count(0, 4);
    std::uniform_real_distribution<double> when(0.0, 60.0);
    std::uniform_real_distribution<double> span(0.0, 5.0);
    std::uniform_real_distribution<double> prob(-0.2, 1.2);

    for (int trial = 0; trial < 300; ++trial) {
        std::vector<RawSegment> raw;
        const int segments = count(rng);

        for (int s = 0; s < segments; ++s) {
            const double start = when(rng);
            const double end = start + span(rng);

            std::string text;
            for (int n = count(rng); n > 0; --n) {
                text += (text.empty() ? "" : " ") + vocab[pick(rng)];
            }

            std::vector<RawWord> words;
            if (rng() % 2 == 0) {
                for (int n = count(rng); n > 0; --n) {
                    const double w_start = start + span(rng);
                    words.push_back(word(vocab[pick(rng)], w_start, w_start + span(rng) * 0.2, prob(rng)));
                }
            }

            raw.push_back(segment(text, start, end, words));
        }

        const auto once = sanitizer.sanitize(raw, TimeUnit::Seconds);
        require_same(once, sanitizer.sanitize(to_raw(once), TimeUnit::Seconds));
    }
}
