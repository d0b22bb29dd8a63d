#pragma once

#include "Types.hpp"
#include <vector>

// infers voice zones from word timing alone. a gap of `voice_gap` seconds or
// more between words is treated as an instrumental break.

class VoiceActivitySegmenter {
public:
    VoiceActivitySegmenter(double voice_gap = 2.0) : voice_gap_(voice_gap) {}

    std::vector<VoiceZone> infer_voice_zones(const std::vector<CleanWord>& words) const;

    // true if t lies inside some zone (bounds inclusive)
    static bool in_voice_zone(const std::vector<VoiceZone>& zones, double t);

    // first zone starting strictly after t, or nullptr
    static const VoiceZone* next_zone_after(const std::vector<VoiceZone>& zones, double t);

private:
    double voice_gap_;
};
