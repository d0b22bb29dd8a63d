#include "Interpolator.hpp"
#include "VoiceActivity.hpp"
#include <cmath>
#include <iostream>

std::vector<bool> Interpolator::classify_anchors(const std::vector<AlignedLine>& lines) const {
    std::vector<bool> anchors(lines.size(), false);

    for (std::size_t i = 0; i < lines.size(); ++i) {
        bool is_anchor = lines[i].confidence >= config_.anchor_threshold;

        // first and last line always pin the stretch
        if (i == 0 || i + 1 == lines.size()) {
            is_anchor = true;
        }

        // two lines cannot start within min_line_gap of each other
        if (i > 0 && lines[i].timestamp - lines[i - 1].timestamp < config_.min_line_gap) {
            is_anchor = false;
        }

        anchors[i] = is_anchor;
    }

    return anchors;
}

void Interpolator::interpolate(std::vector<AlignedLine>& lines, const std::vector<VoiceZone>& zones) const {
    if (lines.empty()) return;

    const std::vector<bool> anchors = classify_anchors(lines);

    // anchor times are read before any line is rewritten
    std::vector<double> anchor_time(lines.size());
    for (std::size_t i = 0; i < lines.size(); ++i) {
        anchor_time[i] = lines[i].timestamp;
    }

    std::size_t last_anchor = 0;

    for (std::size_t i = 1; i < lines.size(); ++i) {
        if (!anchors[i]) continue;

        const std::size_t prev = last_anchor;
        const std::size_t index_gap = i - prev;

        if (index_gap > 1) {
            const double step = (anchor_time[i] - anchor_time[prev]) / static_cast<double>(index_gap);

            std::cout << "[stretch] fixing " << (index_gap - 1) << " lines between "
                      << anchor_time[prev] << "s and " << anchor_time[i] << "s" << std::endl;

            for (std::size_t j = 1; j < index_gap; ++j) {
                double proposed = anchor_time[prev] + step * static_cast<double>(j);

                if (!VoiceActivitySegmenter::in_voice_zone(zones, proposed)) {
                    const VoiceZone* next = VoiceActivitySegmenter::next_zone_after(zones, proposed);
                    if (next) {
                        // stagger so lines snapped into the same zone do not collide
                        proposed = next->start + config_.snap_stagger * static_cast<double>(j);
                    }
                }

                // centisecond resolution, the same as an lrc timestamp
                lines[prev + j].timestamp = std::round(proposed * 100.0) / 100.0;
                lines[prev + j].confidence = config_.interpolated_confidence;
            }
        }

        last_anchor = i;
    }

    for (auto& line : lines) {
        if (line.timestamp < 0.0) line.timestamp = 0.0;
    }
}
