#include "SnapEngine.hpp"

#include <cmath>

#include "IntervalMath.hpp"

namespace cutline {

TimeMs SnapEngine::gridInterval(double zoomLevel, double basePixelsPerSecond) {
    const double pixelsPerMs = (basePixelsPerSecond / 1000.0) * zoomLevel;
    if (pixelsPerMs <= 0.0) {
        return GRID_INTERVALS.back();
    }

    const double msPerGridLine = TARGET_GRID_SPACING_PX / pixelsPerMs;

    for (auto interval : GRID_INTERVALS) {
        if (static_cast<double>(interval) >= msPerGridLine)
            return interval;
    }

    return GRID_INTERVALS.back();
}

std::vector<SnapTarget> SnapEngine::findTargets(const TimelineInfo& timeline,
                                                ClipId excludeClipId, double zoomLevel,
                                                double basePixelsPerSecond) {
    std::vector<SnapTarget> targets;

    // Clip edges across all tracks
    for (const auto& track : timeline.tracks) {
        for (const auto& clip : track.clips) {
            if (clip.id == excludeClipId)
                continue;

            targets.push_back({clip.startTime, SnapTargetType::ClipStart, track.id, clip.id});
            targets.push_back(
                {IntervalMath::endTime(clip), SnapTargetType::ClipEnd, track.id, clip.id});
        }
    }

    // Grid lines
    const TimeMs interval = gridInterval(zoomLevel, basePixelsPerSecond);
    const TimeMs maxTime = juce::jmax(timeline.totalDuration, MIN_GRID_EXTENT_MS);

    for (TimeMs t = 0; t <= maxTime; t += interval)
        targets.push_back({t, SnapTargetType::Grid, std::nullopt, std::nullopt});

    return targets;
}

const SnapTarget* SnapEngine::findClosest(TimeMs position, const std::vector<SnapTarget>& targets,
                                          bool clipEdges, TimeMs& minDistance) {
    const SnapTarget* closest = nullptr;

    for (const auto& target : targets) {
        if (target.isClipEdge() != clipEdges)
            continue;

        const TimeMs distance = std::abs(target.position - position);
        if (distance < minDistance) {
            minDistance = distance;
            closest = &target;
        }
    }

    return closest;
}

SnapResult SnapEngine::applySnap(TimeMs position, const std::vector<SnapTarget>& targets,
                                 TimeMs thresholdMs, bool enabled) {
    SnapResult result;
    result.snappedPosition = position;

    if (!enabled) {
        return result;
    }

    TimeMs minDistance = thresholdMs;

    // Clip edges have priority; grid only when no edge matched
    const SnapTarget* closest = findClosest(position, targets, true, minDistance);
    if (closest == nullptr)
        closest = findClosest(position, targets, false, minDistance);

    if (closest != nullptr) {
        result.snappedPosition = closest->position;
        result.indicator = *closest;
    }

    return result;
}

TimeMs SnapEngine::snapToGrid(TimeMs position, TimeMs gridInterval, TimeMs thresholdMs) {
    if (gridInterval <= 0) {
        return position;
    }

    const auto lineIndex = static_cast<TimeMs>(
        std::floor(static_cast<double>(position) / static_cast<double>(gridInterval) + 0.5));
    const TimeMs nearestGridLine = lineIndex * gridInterval;

    if (std::abs(position - nearestGridLine) <= thresholdMs) {
        return nearestGridLine;
    }

    return position;
}

TimeMs SnapEngine::snapToClipEdges(TimeMs position, const std::vector<ClipInfo>& clips,
                                   TimeMs thresholdMs, ClipId excludeClipId) {
    std::optional<TimeMs> closestEdge;
    TimeMs minDistance = thresholdMs;

    for (const auto& clip : clips) {
        if (excludeClipId != INVALID_CLIP_ID && clip.id == excludeClipId)
            continue;

        for (auto edge : {clip.startTime, IntervalMath::endTime(clip)}) {
            const TimeMs distance = std::abs(position - edge);
            if (distance < minDistance) {
                minDistance = distance;
                closestEdge = edge;
            }
        }
    }

    return closestEdge.value_or(position);
}

}  // namespace cutline
