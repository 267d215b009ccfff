#pragma once

#include <optional>
#include <vector>

#include "TrackInfo.hpp"

namespace cutline {

/**
 * @brief A clip under the playhead together with its track context
 */
struct ActiveClip {
    ClipInfo clip;
    TrackId trackId = INVALID_TRACK_ID;
    int trackIndex = 0;  // 0-based position in the timeline, used for compositing order
    TrackType trackType = TrackType::Video;
    TimeMs relativeTime = 0;  // Offset from the clip's start on the timeline
};

/**
 * @brief Read-only queries the playback engine runs against a timeline
 */
class PlaybackQueries {
  public:
    /** Every clip whose footprint contains the time, tracks in order */
    static std::vector<ActiveClip> getActiveClipsAtTime(const TimelineInfo& timeline, TimeMs time);

    static std::vector<ActiveClip> getActiveAudioClips(const TimelineInfo& timeline, TimeMs time);

    /**
     * @brief Earliest clip start or end strictly after the time, on any track
     *
     * Lets the player skip per-frame lookups until something changes.
     */
    static std::optional<TimeMs> getNextClipBoundary(const TimelineInfo& timeline, TimeMs time);

    /**
     * @return nullptr for an unknown track or when nothing is at that time
     */
    static const ClipInfo* getClipAtTime(const TimelineInfo& timeline, TrackId trackId,
                                         TimeMs time);

    /**
     * @brief First clip on the track starting at or after the given clip's end
     */
    static const ClipInfo* getNextClip(const TimelineInfo& timeline, TrackId trackId,
                                       const ClipInfo& currentClip);

    /** True for a timeline without tracks, or at/after the last clip end */
    static bool isEndOfTimeline(const TimelineInfo& timeline, TimeMs time);
};

}  // namespace cutline
