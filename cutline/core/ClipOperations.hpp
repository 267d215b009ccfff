#pragma once

#include <juce_core/juce_core.h>

#include <optional>
#include <utility>
#include <vector>

#include "IntervalMath.hpp"
#include "TrackInfo.hpp"

namespace cutline {

/**
 * @brief Clip located by a cross-track search
 */
struct ClipLocation {
    ClipId clipId = INVALID_CLIP_ID;
    TrackId trackId = INVALID_TRACK_ID;
};

/**
 * @brief Centralized utility class for clip placement and editing
 *
 * Provides static methods for:
 * - Sequencing and collision detection on a single track
 * - Split, ripple delete and fade validation
 * - Collision resolution for committed moves
 *
 * All methods are stateless. Nothing here allocates clip ids; callers that
 * create clips (the store) pass fresh ids in.
 */
class ClipOperations {
  public:
    // ========================================================================
    // Constraint Constants
    // ========================================================================

    static constexpr TimeMs MAX_FADE_DURATION_MS = 5000;

    // ========================================================================
    // Sequencing
    // ========================================================================

    /**
     * @brief Start time that places a new clip end-to-end after the track's content
     * @return 0 for an empty track, else the end of the clip with the latest start
     */
    static TimeMs sequentialPosition(const TrackInfo& track);

    /**
     * @brief Copy of the clips sorted by start time
     */
    static std::vector<ClipInfo> sortedByStart(const std::vector<ClipInfo>& clips);

    // ========================================================================
    // Collision Detection
    // ========================================================================

    /**
     * @brief Check whether a clip at its current startTime would overlap any clip on the track
     * @param excludeClipId Clip to skip (the clip itself when repositioning)
     */
    static bool detectOverlap(const ClipInfo& candidate, const TrackInfo& track,
                              ClipId excludeClipId = INVALID_CLIP_ID);

    /**
     * @brief Reject negative start times and overlaps
     */
    static bool validatePosition(const ClipInfo& clip, const TrackInfo& track,
                                 ClipId excludeClipId = INVALID_CLIP_ID);

    /**
     * @brief Clip whose footprint contains the time (inclusive start, exclusive end)
     * @return nullptr if no clip is at that position
     */
    static const ClipInfo* findClipAtTime(const TrackInfo& track, TimeMs time);

    /**
     * @brief First clip under the playhead, scanning tracks in order
     */
    static std::optional<ClipLocation> findClipAtPlayhead(const std::vector<TrackInfo>& tracks,
                                                          TimeMs time);

    /**
     * @brief Nearest non-overlapping start time for a clip dropped at desiredStart
     *
     * Candidates are the desired position itself (clamped to 0), directly after each
     * other clip and directly before each other clip. The valid candidate with the
     * smallest displacement wins; ties go to the earlier position. The clip itself
     * (matched by id) is ignored.
     */
    static TimeMs findNearestValidPosition(const ClipInfo& clip, const TrackInfo& track,
                                           TimeMs desiredStart);

    // ========================================================================
    // Split
    // ========================================================================

    /**
     * @brief Cut a clip in two at a timeline position
     *
     * splitTime is rounded to the nearest millisecond before anything else, so the
     * halves tile exactly: first.trimOut == second.trimIn and
     * first.getEndTime() == second.startTime.
     *
     * The fade-out of the first half and the fade-in of the second half are dropped.
     *
     * @return Empty if splitTime is not strictly inside the clip
     */
    static std::optional<std::pair<ClipInfo, ClipInfo>> splitAt(const ClipInfo& clip,
                                                                double splitTime, ClipId firstId,
                                                                ClipId secondId);

    // ========================================================================
    // Delete
    // ========================================================================

    static TimeMs rippleShift(const ClipInfo& deletedClip) {
        return IntervalMath::effectiveDuration(deletedClip);
    }

    /**
     * @brief Remove a clip, optionally closing the hole it leaves
     *
     * With ripple, every clip that started after the deleted clip moves left by
     * rippleShift(). Without ripple all other clips keep their positions.
     * An unknown id returns the input unchanged.
     */
    static std::vector<ClipInfo> deleteClip(const std::vector<ClipInfo>& clips, ClipId clipId,
                                            bool ripple);

    // ========================================================================
    // Fades
    // ========================================================================

    /**
     * @brief Check proposed fade durations against the clip's effective (trimmed) duration
     *
     * Unspecified values fall back to the clip's current fades (absent = 0).
     * Rejects negative values, values above MAX_FADE_DURATION_MS and combined
     * fades longer than the clip. A combined length exactly equal to the clip is valid.
     */
    static bool validateFadeDuration(const ClipInfo& clip,
                                     std::optional<TimeMs> proposedFadeIn = std::nullopt,
                                     std::optional<TimeMs> proposedFadeOut = std::nullopt);
};

}  // namespace cutline
