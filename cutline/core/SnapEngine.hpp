#pragma once

#include <array>
#include <optional>
#include <vector>

#include "TrackInfo.hpp"

namespace cutline {

enum class SnapTargetType { ClipStart, ClipEnd, Grid };

inline const char* getSnapTargetTypeName(SnapTargetType type) {
    switch (type) {
        case SnapTargetType::ClipStart:
            return "clip-start";
        case SnapTargetType::ClipEnd:
            return "clip-end";
        case SnapTargetType::Grid:
            return "grid";
    }
    return "unknown";
}

/**
 * @brief Candidate position for magnetic placement
 *
 * trackId/clipId are only set for clip edges.
 */
struct SnapTarget {
    TimeMs position = 0;
    SnapTargetType type = SnapTargetType::Grid;
    std::optional<TrackId> trackId;
    std::optional<ClipId> clipId;

    bool isClipEdge() const {
        return type != SnapTargetType::Grid;
    }
};

struct SnapResult {
    TimeMs snappedPosition = 0;
    std::optional<SnapTarget> indicator;  // Target snapped to, for drawing the guide line

    bool didSnap() const {
        return indicator.has_value();
    }
};

/**
 * @brief Magnetic snapping to grid lines and clip edges
 *
 * Clip edges strictly dominate grid lines: any clip edge within threshold wins
 * over every grid line, whichever is numerically closer. Among equidistant
 * targets of the same class the first one in list order wins.
 */
class SnapEngine {
  public:
    /** Grid interval ladder in ms */
    static constexpr std::array<TimeMs, 9> GRID_INTERVALS = {100,  250,   500,   1000, 2000,
                                                             5000, 10000, 30000, 60000};
    static constexpr double TARGET_GRID_SPACING_PX = 75.0;
    static constexpr TimeMs MIN_GRID_EXTENT_MS = 60000;

    /**
     * @brief Smallest ladder interval that keeps grid lines at least 75px apart
     * @param zoomLevel Timeline zoom (1.0 = base)
     * @param basePixelsPerSecond Pixels per second at zoom 1.0
     */
    static TimeMs gridInterval(double zoomLevel, double basePixelsPerSecond);

    /**
     * @brief Collect clip edges on all tracks plus grid lines
     *
     * Clip targets come first (start then end per clip, tracks in order), followed
     * by grid lines from 0 to max(totalDuration, 60s) inclusive.
     *
     * @param excludeClipId Clip being dragged; its own edges are skipped
     */
    static std::vector<SnapTarget> findTargets(const TimelineInfo& timeline, ClipId excludeClipId,
                                               double zoomLevel, double basePixelsPerSecond);

    /**
     * @brief Resolve a position against a target list
     *
     * A target matches when its distance is strictly less than thresholdMs.
     * Disabled snapping returns the position untouched with no indicator.
     */
    static SnapResult applySnap(TimeMs position, const std::vector<SnapTarget>& targets,
                                TimeMs thresholdMs, bool enabled);

    /** Nearest grid multiple if within threshold (inclusive), else position */
    static TimeMs snapToGrid(TimeMs position, TimeMs gridInterval, TimeMs thresholdMs);

    /** Nearest clip start/end strictly within threshold, else position */
    static TimeMs snapToClipEdges(TimeMs position, const std::vector<ClipInfo>& clips,
                                  TimeMs thresholdMs, ClipId excludeClipId = INVALID_CLIP_ID);

  private:
    static const SnapTarget* findClosest(TimeMs position, const std::vector<SnapTarget>& targets,
                                         bool clipEdges, TimeMs& minDistance);
};

}  // namespace cutline
