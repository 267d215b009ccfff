#pragma once

#include <optional>
#include <vector>

#include "IntervalMath.hpp"
#include "TrackInfo.hpp"

namespace cutline {

/**
 * @brief Where a gap sits relative to the track's clips
 */
enum class GapPosition {
    Start,   // Before the first clip (or the whole of an empty track)
    Middle,  // Between two non-touching clips
    End      // After the last clip, up to the timeline's end
};

inline const char* getGapPositionName(GapPosition position) {
    switch (position) {
        case GapPosition::Start:
            return "start";
        case GapPosition::Middle:
            return "middle";
        case GapPosition::End:
            return "end";
    }
    return "unknown";
}

/**
 * @brief A maximal interval on one track with no active clip
 */
struct GapSegment {
    TrackId trackId = INVALID_TRACK_ID;
    TrackType trackType = TrackType::Video;
    TimeMs startTime = 0;
    TimeMs endTime = 0;
    TimeMs duration = 0;
    GapPosition position = GapPosition::Middle;

    bool containsTime(TimeMs time) const {
        return time >= startTime && time < endTime;
    }
};

/**
 * @brief Gap report for every track of a timeline
 */
struct TimelineGapAnalysis {
    std::vector<GapSegment> gaps;
    int totalGaps = 0;
    bool hasGaps = false;
    std::vector<TrackId> tracksWithGaps;
};

/**
 * @brief Gap detection used by playback to decide between clip output and black/silence
 *
 * For any track the clip footprints together with analyzeTrack()'s gaps tile
 * [0, timelineDuration) exactly.
 */
class GapAnalyzer {
  public:
    /**
     * @brief Find every gap on a track within [0, timelineDuration)
     *
     * An empty track yields a single Start gap covering the whole timeline, or
     * nothing when the timeline is empty.
     */
    static std::vector<GapSegment> analyzeTrack(const TrackInfo& track, TimeMs timelineDuration);

    static TimelineGapAnalysis analyzeTimeline(const TimelineInfo& timeline);

    /**
     * @brief First gap containing the time
     * @return nullptr when no gap covers it
     */
    static const GapSegment* isTimeInGap(TimeMs time, const std::vector<GapSegment>& gaps);

    /** All gaps containing the time, in input order */
    static std::vector<GapSegment> getGapsAtTime(TimeMs time, const std::vector<GapSegment>& gaps);

    /**
     * @brief True when every track has a gap covering the time
     *
     * Gaps only exist inside [0, totalDuration), so this is false at or after
     * the end. An empty timeline (no tracks) counts as fully in gap.
     */
    static bool allTracksInGap(TimeMs time, const TimelineInfo& timeline);

    /**
     * @brief Earliest gap start or end strictly after the time
     */
    static std::optional<TimeMs> nextGapBoundary(TimeMs time, const std::vector<GapSegment>& gaps);

  private:
    static GapSegment makeGap(const TrackInfo& track, TimeMs start, TimeMs end,
                              GapPosition position);
};

}  // namespace cutline
