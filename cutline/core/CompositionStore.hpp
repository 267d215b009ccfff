#pragma once

#include <juce_core/juce_core.h>

#include <optional>
#include <vector>

#include "ClipOperations.hpp"
#include "SnapEngine.hpp"
#include "SnapshotHistory.hpp"
#include "TrackInfo.hpp"

namespace cutline {

/**
 * @brief Timeline view settings held by the store (not part of undo history)
 */
struct ViewConfig {
    double pixelsPerSecond = 100.0;  // At zoom 1.0
    double zoomLevel = 1.0;
    int trackHeight = 80;
    int rulerHeight = 30;
    bool snapEnabled = true;
    TimeMs snapThresholdMs = 100;
    double minZoomLevel = 0.1;
    double maxZoomLevel = 10.0;
};

/**
 * @brief Partial clip update; only the fields that are set are applied
 *
 * id, trackId and sourceDuration are not patchable.
 */
struct ClipPatch {
    std::optional<TimeMs> startTime;
    std::optional<TimeMs> trimIn;
    std::optional<TimeMs> trimOut;
    std::optional<TimeMs> fadeIn;
    std::optional<TimeMs> fadeOut;
    std::optional<float> volume;
    std::optional<bool> muted;
    std::optional<std::vector<ClipAudioTrack>> audioTracks;
    std::optional<ClipTransform> transform;

    void applyTo(ClipInfo& clip) const {
        if (startTime)
            clip.startTime = *startTime;
        if (trimIn)
            clip.trimIn = *trimIn;
        if (trimOut)
            clip.trimOut = *trimOut;
        if (fadeIn)
            clip.fadeIn = *fadeIn;
        if (fadeOut)
            clip.fadeOut = *fadeOut;
        if (volume)
            clip.volume = *volume;
        if (muted)
            clip.muted = *muted;
        if (audioTracks)
            clip.audioTracks = *audioTracks;
        if (transform)
            clip.transform = *transform;
    }
};

/**
 * @brief Undo history entry: the editable state before a committed mutation
 */
struct CompositionSnapshot {
    std::vector<TrackInfo> tracks;
    TimeMs totalDuration = 0;
    ClipId selectedClipId = INVALID_CLIP_ID;
};

/**
 * @brief Listener interface for composition changes
 */
class CompositionStoreListener {
  public:
    virtual ~CompositionStoreListener() = default;

    // Called when tracks or clips are added, removed, moved or restored by undo
    virtual void compositionChanged() = 0;

    // Called when a specific clip's properties change
    virtual void clipPropertyChanged(ClipId clipId) {
        juce::ignoreUnused(clipId);
    }

    // Called when clip selection changes
    virtual void selectionChanged(ClipId clipId) {
        juce::ignoreUnused(clipId);
    }

    // Called when an entry is recorded, undone or the history is cleared
    virtual void historyChanged() {}
};

/**
 * @brief Owner of the editable timeline
 *
 * Every mutation works on a copy of the timeline: it is validated, then
 * committed as a whole or rejected with the store left exactly as it was.
 * Committed mutations keep each track sorted by start time, recompute the total
 * duration and (unless told otherwise) record the previous state for undo.
 *
 * A new store holds one empty video track.
 */
class CompositionStore {
  public:
    static constexpr size_t MAX_HISTORY_ENTRIES = 10;

    CompositionStore();
    explicit CompositionStore(const ViewConfig& viewConfig);

    // Prevent copying
    CompositionStore(const CompositionStore&) = delete;
    CompositionStore& operator=(const CompositionStore&) = delete;

    // ========================================================================
    // Tracks
    // ========================================================================

    /**
     * @return The new track's id
     */
    TrackId addTrack(TrackType type, const juce::String& name = {});

    /**
     * @brief Remove a track and its clips
     * @return false for an unknown id or when it is the only track
     */
    bool removeTrack(TrackId trackId);

    const std::vector<TrackInfo>& getTracks() const {
        return timeline_.tracks;
    }

    const TrackInfo* getTrack(TrackId trackId) const {
        return timeline_.findTrack(trackId);
    }

    const TimelineInfo& getTimeline() const {
        return timeline_;
    }

    TimeMs getTotalDuration() const {
        return timeline_.totalDuration;
    }

    // ========================================================================
    // Clips
    // ========================================================================

    /**
     * @brief Place a clip at its startTime on a track
     *
     * The clip's id and trackId are assigned by the store.
     * @return INVALID_CLIP_ID if the track is unknown, the clip is malformed,
     *         its fades are invalid or it would overlap
     */
    ClipId addClip(TrackId trackId, const ClipInfo& clip);

    /**
     * @brief Place a clip directly after the track's last clip
     */
    ClipId addClipAtEnd(TrackId trackId, const ClipInfo& clip);

    /**
     * @param ripple Shift later clips on the same track left to close the hole
     */
    bool removeClip(ClipId clipId, bool ripple = false);

    /**
     * @brief Apply a partial update
     *
     * The patched clip must stay structurally valid, fade-valid and free of
     * overlaps on its track, or nothing changes.
     */
    bool updateClip(ClipId clipId, const ClipPatch& patch, bool recordHistory = true);

    /**
     * @return nullptr when the clip doesn't exist
     */
    const ClipInfo* getClip(ClipId clipId) const {
        return timeline_.findClip(clipId);
    }

    /**
     * @brief Move a clip on its own track
     *
     * A position that collides is resolved to the nearest free position
     * (see ClipOperations::findNearestValidPosition).
     *
     * Use recordHistory=false for drag feedback; the state before the first
     * unrecorded move becomes the undo entry of the next recorded mutation.
     */
    bool moveClip(ClipId clipId, TimeMs newStartTime, bool recordHistory = true);

    /**
     * @brief Move a clip to another track keeping its start time
     * @return false for an unknown target, the same track, or a collision there
     */
    bool moveClipToTrack(ClipId clipId, TrackId targetTrackId);

    /**
     * @brief Replace a clip by two halves cut at splitTime (rounded to ms)
     * @return false when the cut is not strictly inside the clip or would leave
     *         a half shorter than its fades
     */
    bool splitClip(ClipId clipId, double splitTime);

    bool trimClip(ClipId clipId, TimeMs trimIn, TimeMs trimOut);

    /**
     * @brief Restore the full source range (trimIn = 0, trimOut = sourceDuration)
     */
    bool resetTrim(ClipId clipId);

    /**
     * @brief Set fade durations; unset values keep the clip's current fade
     * @return false if validateFadeDuration rejects them (values are never clamped)
     */
    bool setClipFades(ClipId clipId, std::optional<TimeMs> fadeIn,
                      std::optional<TimeMs> fadeOut);

    // ========================================================================
    // Selection
    // ========================================================================

    /**
     * @return false for an unknown clip (selection unchanged)
     */
    bool setSelectedClip(ClipId clipId);

    ClipId getSelectedClip() const {
        return selectedClipId_;
    }

    void clearSelection();

    // ========================================================================
    // View
    // ========================================================================

    const ViewConfig& getViewConfig() const {
        return viewConfig_;
    }

    void setViewConfig(const ViewConfig& config);

    /** Clamped to [minZoomLevel, maxZoomLevel] */
    void setZoomLevel(double zoomLevel);

    /**
     * @brief Snap a position against the current timeline using the view's settings
     * @param excludeClipId Clip being dragged
     */
    SnapResult snapPosition(TimeMs position, ClipId excludeClipId = INVALID_CLIP_ID) const;

    // ========================================================================
    // History
    // ========================================================================

    /**
     * @brief Restore the state before the most recent recorded mutation
     * @return false when there is nothing to undo
     */
    bool undo();

    bool canUndo() const {
        return history_.canUndo();
    }

    /** -1 when there is nothing to undo */
    int getHistoryIndex() const {
        return history_.getIndex();
    }

    int getHistorySize() const {
        return static_cast<int>(history_.size());
    }

    /**
     * @brief Reset to a single empty video track and drop all history
     */
    void clearTimeline();

    // ========================================================================
    // Listeners
    // ========================================================================

    void addListener(CompositionStoreListener* listener);
    void removeListener(CompositionStoreListener* listener);

  private:
    CompositionSnapshot captureState() const;
    void restoreState(const CompositionSnapshot& state);
    void pushHistory(bool record);

    /**
     * @brief Swap in a validated working copy
     *
     * Sorts every track, recomputes the duration and records history first.
     */
    void commit(TimelineInfo working, bool record);

    TrackInfo* findTrackContaining(TimelineInfo& timeline, ClipId clipId) const;
    TrackInfo makeTrack(TrackType type, const juce::String& name);

    void notifyCompositionChanged();
    void notifyClipPropertyChanged(ClipId clipId);
    void notifySelectionChanged(ClipId clipId);
    void notifyHistoryChanged();

    TimelineInfo timeline_;
    ClipId selectedClipId_ = INVALID_CLIP_ID;
    ViewConfig viewConfig_;

    SnapshotHistory<CompositionSnapshot, MAX_HISTORY_ENTRIES> history_;
    std::optional<CompositionSnapshot> unrecordedBaseline_;

    ClipId nextClipId_ = 1;
    TrackId nextTrackId_ = 1;

    std::vector<CompositionStoreListener*> listeners_;
};

}  // namespace cutline
