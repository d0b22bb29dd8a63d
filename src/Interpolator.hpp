#pragma once

#include "Types.hpp"
#include <vector>

// anchor based elastic stretch. trusted matches become anchors and every
// line between two anchors is spread evenly, jumping over silent gaps.

class Interpolator {
public:
    Interpolator(AlignerConfig config = AlignerConfig()) : config_(config) {}

    // mutates timestamps / confidences in place
    void interpolate(std::vector<AlignedLine>& lines, const std::vector<VoiceZone>& zones) const;

    // anchor flags after the minimum spacing check, one per line
    std::vector<bool> classify_anchors(const std::vector<AlignedLine>& lines) const;

private:
    AlignerConfig config_;
};
