#pragma once

#include <juce_core/juce_core.h>

#include "TrackInfo.hpp"

namespace cutline {

/**
 * @brief Converts a timeline to and from plain JSON data
 *
 * Keys are camelCase (startTime, trimIn, trackType ...). Optional clip fields
 * (fades, volume, muted, audioTracks, transform) are omitted when absent.
 *
 * Loading validates everything into a staging timeline first; the output is only
 * written when the whole document is valid. totalDuration is always recomputed
 * from the clips rather than trusted from the input.
 */
class TimelineSerializer {
  public:
    // ========================================================================
    // Timeline-level serialization
    // ========================================================================

    /**
     * @brief Serialize a timeline to a JSON var
     */
    static juce::var serializeTimeline(const TimelineInfo& timeline);

    /**
     * @brief Deserialize a timeline
     * @param json JSON var produced by serializeTimeline (or equivalent)
     * @param outTimeline Replaced on success, untouched on failure
     * @return true on success, false on error (see getLastError)
     */
    static bool deserializeTimeline(const juce::var& json, TimelineInfo& outTimeline);

    static juce::String toJsonString(const TimelineInfo& timeline, bool pretty = true);

    static bool fromJsonString(const juce::String& jsonString, TimelineInfo& outTimeline);

    // ========================================================================
    // Component-level serialization
    // ========================================================================

    static juce::var serializeTrack(const TrackInfo& track);
    static juce::var serializeClip(const ClipInfo& clip);

    /**
     * @brief Get last error message
     */
    static const juce::String& getLastError() {
        return lastError_;
    }

  private:
    static bool deserializeTrack(const juce::var& json, TrackInfo& outTrack);
    static bool deserializeClip(const juce::var& json, ClipInfo& outClip);
    static bool deserializeAudioTrack(const juce::var& json, ClipAudioTrack& outAudioTrack);
    static bool deserializeTransform(const juce::var& json, ClipTransform& outTransform);

    static bool validateTrack(const TrackInfo& track);

    static inline thread_local juce::String lastError_;
};

}  // namespace cutline
