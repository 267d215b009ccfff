#pragma once

#include "ClipInfo.hpp"

namespace cutline {

/**
 * @brief Half-open time interval [start, end)
 */
struct TimeRange {
    TimeMs start = 0;
    TimeMs end = 0;

    TimeMs getLength() const {
        return end - start;
    }

    bool isEmpty() const {
        return end <= start;
    }
};

/**
 * @brief Pure interval arithmetic on clip footprints
 *
 * A clip's footprint is closed-open, so a clip ending at t and one starting at t
 * touch but do not overlap.
 */
namespace IntervalMath {

inline TimeMs effectiveDuration(const ClipInfo& clip) {
    return clip.trimOut - clip.trimIn;
}

inline TimeMs endTime(const ClipInfo& clip) {
    return clip.startTime + effectiveDuration(clip);
}

inline TimeRange footprint(const ClipInfo& clip) {
    return {clip.startTime, endTime(clip)};
}

inline bool overlaps(const TimeRange& a, const TimeRange& b) {
    return a.start < b.end && a.end > b.start;
}

inline bool overlaps(const ClipInfo& a, const ClipInfo& b) {
    return overlaps(footprint(a), footprint(b));
}

/// Inclusive start, exclusive end
inline bool contains(const TimeRange& range, TimeMs time) {
    return time >= range.start && time < range.end;
}

}  // namespace IntervalMath

}  // namespace cutline
