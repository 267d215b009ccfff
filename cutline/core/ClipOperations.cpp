#include "ClipOperations.hpp"

#include <algorithm>
#include <cmath>

namespace cutline {

// ============================================================================
// Sequencing
// ============================================================================

std::vector<ClipInfo> ClipOperations::sortedByStart(const std::vector<ClipInfo>& clips) {
    std::vector<ClipInfo> sorted = clips;
    std::stable_sort(sorted.begin(), sorted.end(), [](const ClipInfo& a, const ClipInfo& b) {
        return a.startTime < b.startTime;
    });
    return sorted;
}

TimeMs ClipOperations::sequentialPosition(const TrackInfo& track) {
    if (track.clips.empty()) {
        return 0;
    }

    // Don't trust caller order
    const ClipInfo* last = &track.clips.front();
    for (const auto& clip : track.clips) {
        if (clip.startTime >= last->startTime)
            last = &clip;
    }
    return IntervalMath::endTime(*last);
}

// ============================================================================
// Collision Detection
// ============================================================================

bool ClipOperations::detectOverlap(const ClipInfo& candidate, const TrackInfo& track,
                                   ClipId excludeClipId) {
    for (const auto& existing : track.clips) {
        if (excludeClipId != INVALID_CLIP_ID && existing.id == excludeClipId)
            continue;

        if (IntervalMath::overlaps(candidate, existing))
            return true;
    }
    return false;
}

bool ClipOperations::validatePosition(const ClipInfo& clip, const TrackInfo& track,
                                      ClipId excludeClipId) {
    if (clip.startTime < 0) {
        return false;
    }
    return !detectOverlap(clip, track, excludeClipId);
}

const ClipInfo* ClipOperations::findClipAtTime(const TrackInfo& track, TimeMs time) {
    for (const auto& clip : track.clips) {
        if (IntervalMath::contains(IntervalMath::footprint(clip), time))
            return &clip;
    }
    return nullptr;
}

std::optional<ClipLocation> ClipOperations::findClipAtPlayhead(
    const std::vector<TrackInfo>& tracks, TimeMs time) {
    for (const auto& track : tracks) {
        if (auto* clip = findClipAtTime(track, time)) {
            return ClipLocation{clip->id, track.id};
        }
    }
    return std::nullopt;
}

TimeMs ClipOperations::findNearestValidPosition(const ClipInfo& clip, const TrackInfo& track,
                                                TimeMs desiredStart) {
    const TimeMs duration = IntervalMath::effectiveDuration(clip);
    const TimeMs clampedStart = juce::jmax<TimeMs>(0, desiredStart);

    auto isFree = [&](TimeMs start) {
        ClipInfo probe = clip;
        probe.startTime = start;
        return validatePosition(probe, track, clip.id);
    };

    if (isFree(clampedStart)) {
        return clampedStart;
    }

    std::vector<TimeMs> candidates;
    for (const auto& other : track.clips) {
        if (other.id == clip.id)
            continue;

        candidates.push_back(IntervalMath::endTime(other));

        const TimeMs before = other.startTime - duration;
        if (before >= 0)
            candidates.push_back(before);
    }

    bool found = false;
    TimeMs best = 0;
    TimeMs bestDistance = 0;

    for (auto candidate : candidates) {
        if (!isFree(candidate))
            continue;

        const TimeMs distance = std::abs(candidate - desiredStart);
        if (!found || distance < bestDistance ||
            (distance == bestDistance && candidate < best)) {
            found = true;
            best = candidate;
            bestDistance = distance;
        }
    }

    if (found) {
        return best;
    }

    // The end of the last clip is always free, so this is only reached for an
    // inconsistent track; fall back to appending.
    TrackInfo others = track;
    others.clips.erase(std::remove_if(others.clips.begin(), others.clips.end(),
                                      [&clip](const ClipInfo& c) { return c.id == clip.id; }),
                       others.clips.end());
    return sequentialPosition(others);
}

// ============================================================================
// Split
// ============================================================================

std::optional<std::pair<ClipInfo, ClipInfo>> ClipOperations::splitAt(const ClipInfo& clip,
                                                                     double splitTime,
                                                                     ClipId firstId,
                                                                     ClipId secondId) {
    // Round first so every following step is integer arithmetic
    const auto roundedSplit = static_cast<TimeMs>(std::llround(splitTime));

    const TimeMs clipStart = clip.startTime;
    const TimeMs clipEnd = IntervalMath::endTime(clip);

    if (roundedSplit <= clipStart || roundedSplit >= clipEnd) {
        return std::nullopt;
    }

    const TimeMs splitOffset = roundedSplit - clipStart;
    const TimeMs splitPointInSource = clip.trimIn + splitOffset;

    ClipInfo first = clip;
    first.id = firstId;
    first.trimOut = splitPointInSource;
    first.fadeOut = 0;

    ClipInfo second = clip;
    second.id = secondId;
    second.startTime = roundedSplit;
    second.trimIn = splitPointInSource;
    second.fadeIn = 0;

    return std::make_pair(first, second);
}

// ============================================================================
// Delete
// ============================================================================

std::vector<ClipInfo> ClipOperations::deleteClip(const std::vector<ClipInfo>& clips, ClipId clipId,
                                                 bool ripple) {
    auto it = std::find_if(clips.begin(), clips.end(),
                           [clipId](const ClipInfo& c) { return c.id == clipId; });

    if (it == clips.end()) {
        return clips;
    }

    const TimeMs deletedStart = it->startTime;
    const TimeMs shift = rippleShift(*it);

    std::vector<ClipInfo> result;
    result.reserve(clips.size() - 1);

    for (const auto& clip : clips) {
        if (clip.id == clipId)
            continue;

        ClipInfo kept = clip;
        if (ripple && kept.startTime > deletedStart)
            kept.startTime -= shift;
        result.push_back(kept);
    }

    return result;
}

// ============================================================================
// Fades
// ============================================================================

bool ClipOperations::validateFadeDuration(const ClipInfo& clip,
                                          std::optional<TimeMs> proposedFadeIn,
                                          std::optional<TimeMs> proposedFadeOut) {
    const TimeMs effectiveDuration = IntervalMath::effectiveDuration(clip);
    const TimeMs fadeIn = proposedFadeIn.value_or(clip.getFadeIn());
    const TimeMs fadeOut = proposedFadeOut.value_or(clip.getFadeOut());

    if (fadeIn < 0 || fadeOut < 0) {
        DBG("Fade rejected: negative duration (in=" << fadeIn << ", out=" << fadeOut << ")");
        return false;
    }

    if (fadeIn > MAX_FADE_DURATION_MS || fadeOut > MAX_FADE_DURATION_MS) {
        DBG("Fade rejected: exceeds " << MAX_FADE_DURATION_MS << "ms (in=" << fadeIn
                                      << ", out=" << fadeOut << ")");
        return false;
    }

    if (fadeIn + fadeOut > effectiveDuration) {
        DBG("Fade rejected: combined " << (fadeIn + fadeOut) << "ms exceeds clip duration "
                                       << effectiveDuration << "ms");
        return false;
    }

    return true;
}

}  // namespace cutline
