#include "VoiceActivity.hpp"
#include <algorithm>
#include <iostream>

std::vector<VoiceZone> VoiceActivitySegmenter::infer_voice_zones(const std::vector<CleanWord>& words) const {
    std::vector<VoiceZone> zones;
    if (words.empty()) return zones;

    VoiceZone current{words.front().start, words.front().end};

    for (std::size_t i = 1; i < words.size(); ++i) {
        const CleanWord& w = words[i];

        if (w.start - current.end < voice_gap_) {
            current.end = std::max(current.end, w.end);
        } else {
            zones.push_back(current);
            current = VoiceZone{w.start, w.end};
        }
    }

    zones.push_back(current);

    std::cout << "[vad] " << zones.size() << " voice zones from " << words.size() << " words" << std::endl;
    return zones;
}

bool VoiceActivitySegmenter::in_voice_zone(const std::vector<VoiceZone>& zones, double t) {
    return std::any_of(zones.begin(), zones.end(), [t](const VoiceZone& z) {
        return t >= z.start && t <= z.end;
    });
}

const VoiceZone* VoiceActivitySegmenter::next_zone_after(const std::vector<VoiceZone>& zones, double t) {
    auto it = std::find_if(zones.begin(), zones.end(), [t](const VoiceZone& z) {
        return z.start > t;
    });
    return it == zones.end() ? nullptr : &*it;
}
