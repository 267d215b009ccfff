#include "CompositionStore.hpp"

#include <algorithm>

#include "TimelineUtils.hpp"

namespace cutline {

CompositionStore::CompositionStore() : CompositionStore(ViewConfig{}) {}

CompositionStore::CompositionStore(const ViewConfig& viewConfig) {
    setViewConfig(viewConfig);
    timeline_.tracks.push_back(makeTrack(TrackType::Video, {}));
}

// ============================================================================
// Tracks
// ============================================================================

TrackInfo CompositionStore::makeTrack(TrackType type, const juce::String& name) {
    TrackInfo track;
    track.id = nextTrackId_++;
    track.type = type;

    if (name.isNotEmpty()) {
        track.name = name;
    } else {
        int sameType = 0;
        for (const auto& existing : timeline_.tracks) {
            if (existing.type == type)
                ++sameType;
        }
        track.name = juce::String(getTrackTypeName(type)) + " " + juce::String(sameType + 1);
    }

    return track;
}

TrackId CompositionStore::addTrack(TrackType type, const juce::String& name) {
    TimelineInfo working = timeline_;
    working.tracks.push_back(makeTrack(type, name));
    const TrackId trackId = working.tracks.back().id;

    commit(std::move(working), true);

    DBG("Added " << getTrackTypeName(type) << " track (id=" << trackId << ")");
    return trackId;
}

bool CompositionStore::removeTrack(TrackId trackId) {
    if (timeline_.findTrack(trackId) == nullptr) {
        return false;
    }

    if (timeline_.tracks.size() <= 1) {
        DBG("Refusing to remove the last track (id=" << trackId << ")");
        return false;
    }

    TimelineInfo working = timeline_;
    working.tracks.erase(std::remove_if(working.tracks.begin(), working.tracks.end(),
                                        [trackId](const TrackInfo& t) { return t.id == trackId; }),
                         working.tracks.end());

    commit(std::move(working), true);

    DBG("Removed track (id=" << trackId << ")");
    return true;
}

// ============================================================================
// Clips
// ============================================================================

TrackInfo* CompositionStore::findTrackContaining(TimelineInfo& timeline, ClipId clipId) const {
    for (auto& track : timeline.tracks) {
        if (track.findClip(clipId) != nullptr)
            return &track;
    }
    return nullptr;
}

ClipId CompositionStore::addClip(TrackId trackId, const ClipInfo& clip) {
    auto* track = timeline_.findTrack(trackId);
    if (track == nullptr) {
        DBG("addClip: unknown track id=" << trackId);
        return INVALID_CLIP_ID;
    }

    ClipInfo placed = clip;
    placed.id = nextClipId_;
    placed.trackId = trackId;

    if (!placed.isStructurallyValid()) {
        DBG("addClip: rejected malformed clip (start=" << placed.startTime << ", trimIn="
                                                       << placed.trimIn << ", trimOut="
                                                       << placed.trimOut << ")");
        return INVALID_CLIP_ID;
    }

    if (!ClipOperations::validateFadeDuration(placed)) {
        return INVALID_CLIP_ID;
    }

    if (!ClipOperations::validatePosition(placed, *track)) {
        DBG("addClip: position " << placed.startTime << " overlaps on track " << trackId);
        return INVALID_CLIP_ID;
    }

    TimelineInfo working = timeline_;
    working.findTrack(trackId)->clips.push_back(placed);
    ++nextClipId_;

    commit(std::move(working), true);

    DBG("Added clip (id=" << placed.id << ", track=" << trackId << ", start="
                          << placed.startTime << ")");
    return placed.id;
}

ClipId CompositionStore::addClipAtEnd(TrackId trackId, const ClipInfo& clip) {
    auto* track = timeline_.findTrack(trackId);
    if (track == nullptr) {
        return INVALID_CLIP_ID;
    }

    ClipInfo placed = clip;
    placed.startTime = ClipOperations::sequentialPosition(*track);
    return addClip(trackId, placed);
}

bool CompositionStore::removeClip(ClipId clipId, bool ripple) {
    TimelineInfo working = timeline_;
    auto* track = findTrackContaining(working, clipId);
    if (track == nullptr) {
        return false;
    }

    track->clips = ClipOperations::deleteClip(track->clips, clipId, ripple);

    commit(std::move(working), true);

    DBG("Removed clip (id=" << clipId << (ripple ? ", ripple" : "") << ")");
    return true;
}

bool CompositionStore::updateClip(ClipId clipId, const ClipPatch& patch, bool recordHistory) {
    TimelineInfo working = timeline_;
    auto* track = findTrackContaining(working, clipId);
    if (track == nullptr) {
        return false;
    }

    ClipInfo* clip = track->findClip(clipId);
    ClipInfo patched = *clip;
    patch.applyTo(patched);

    if (!patched.isStructurallyValid()) {
        DBG("updateClip: rejected malformed result for clip " << clipId);
        return false;
    }

    if (!ClipOperations::validateFadeDuration(patched)) {
        return false;
    }

    if (!ClipOperations::validatePosition(patched, *track, clipId)) {
        DBG("updateClip: clip " << clipId << " would overlap at " << patched.startTime);
        return false;
    }

    *clip = patched;
    commit(std::move(working), recordHistory);
    notifyClipPropertyChanged(clipId);
    return true;
}

bool CompositionStore::moveClip(ClipId clipId, TimeMs newStartTime, bool recordHistory) {
    TimelineInfo working = timeline_;
    auto* track = findTrackContaining(working, clipId);
    if (track == nullptr) {
        return false;
    }

    ClipInfo* clip = track->findClip(clipId);
    const TimeMs resolved = ClipOperations::findNearestValidPosition(*clip, *track, newStartTime);

    if (resolved == clip->startTime) {
        // Nothing moves, but a finished drag still owes its undo entry
        if (recordHistory && unrecordedBaseline_) {
            pushHistory(true);
            notifyHistoryChanged();
        }
        return true;
    }

    if (resolved != newStartTime) {
        DBG("moveClip: clip " << clipId << " resolved from " << newStartTime << " to "
                              << resolved);
    }

    clip->startTime = resolved;
    commit(std::move(working), recordHistory);
    notifyClipPropertyChanged(clipId);
    return true;
}

bool CompositionStore::moveClipToTrack(ClipId clipId, TrackId targetTrackId) {
    TimelineInfo working = timeline_;
    auto* source = findTrackContaining(working, clipId);
    auto* target = working.findTrack(targetTrackId);

    if (source == nullptr || target == nullptr) {
        return false;
    }

    if (source == target) {
        return false;
    }

    ClipInfo moved = *source->findClip(clipId);
    moved.trackId = targetTrackId;

    if (ClipOperations::detectOverlap(moved, *target)) {
        DBG("moveClipToTrack: clip " << clipId << " collides on track " << targetTrackId);
        return false;
    }

    source->clips.erase(std::remove_if(source->clips.begin(), source->clips.end(),
                                       [clipId](const ClipInfo& c) { return c.id == clipId; }),
                        source->clips.end());
    target->clips.push_back(moved);

    commit(std::move(working), true);

    DBG("Moved clip " << clipId << " to track " << targetTrackId);
    return true;
}

bool CompositionStore::splitClip(ClipId clipId, double splitTime) {
    TimelineInfo working = timeline_;
    auto* track = findTrackContaining(working, clipId);
    if (track == nullptr) {
        return false;
    }

    auto halves =
        ClipOperations::splitAt(*track->findClip(clipId), splitTime, nextClipId_, nextClipId_ + 1);
    if (!halves) {
        DBG("splitClip: " << splitTime << " is not inside clip " << clipId);
        return false;
    }

    // A cut inside a fade would leave a half shorter than its fade
    if (!ClipOperations::validateFadeDuration(halves->first) ||
        !ClipOperations::validateFadeDuration(halves->second)) {
        DBG("splitClip: " << splitTime << " falls inside a fade of clip " << clipId);
        return false;
    }

    track->clips.erase(std::remove_if(track->clips.begin(), track->clips.end(),
                                      [clipId](const ClipInfo& c) { return c.id == clipId; }),
                       track->clips.end());
    track->clips.push_back(halves->first);
    track->clips.push_back(halves->second);
    nextClipId_ += 2;

    commit(std::move(working), true);

    DBG("Split clip " << clipId << " into " << halves->first.id << " and "
                      << halves->second.id << " at " << halves->second.startTime);
    return true;
}

bool CompositionStore::trimClip(ClipId clipId, TimeMs trimIn, TimeMs trimOut) {
    ClipPatch patch;
    patch.trimIn = trimIn;
    patch.trimOut = trimOut;
    return updateClip(clipId, patch);
}

bool CompositionStore::resetTrim(ClipId clipId) {
    const auto* clip = getClip(clipId);
    if (clip == nullptr) {
        return false;
    }
    return trimClip(clipId, 0, clip->sourceDuration);
}

bool CompositionStore::setClipFades(ClipId clipId, std::optional<TimeMs> fadeIn,
                                    std::optional<TimeMs> fadeOut) {
    const auto* clip = getClip(clipId);
    if (clip == nullptr) {
        return false;
    }

    if (!ClipOperations::validateFadeDuration(*clip, fadeIn, fadeOut)) {
        return false;
    }

    ClipPatch patch;
    patch.fadeIn = fadeIn;
    patch.fadeOut = fadeOut;
    return updateClip(clipId, patch);
}

// ============================================================================
// Selection
// ============================================================================

bool CompositionStore::setSelectedClip(ClipId clipId) {
    if (clipId == INVALID_CLIP_ID) {
        clearSelection();
        return true;
    }

    if (getClip(clipId) == nullptr) {
        return false;
    }

    if (selectedClipId_ != clipId) {
        selectedClipId_ = clipId;
        notifySelectionChanged(clipId);
    }
    return true;
}

void CompositionStore::clearSelection() {
    if (selectedClipId_ != INVALID_CLIP_ID) {
        selectedClipId_ = INVALID_CLIP_ID;
        notifySelectionChanged(INVALID_CLIP_ID);
    }
}

// ============================================================================
// View
// ============================================================================

void CompositionStore::setViewConfig(const ViewConfig& config) {
    viewConfig_ = config;

    // Limits may arrive swapped; keep them ordered and inside the supported range
    viewConfig_.minZoomLevel =
        TimelineUtils::clampZoomLevel(juce::jmin(config.minZoomLevel, config.maxZoomLevel));
    viewConfig_.maxZoomLevel =
        TimelineUtils::clampZoomLevel(juce::jmax(config.minZoomLevel, config.maxZoomLevel));

    setZoomLevel(config.zoomLevel);
}

void CompositionStore::setZoomLevel(double zoomLevel) {
    viewConfig_.zoomLevel =
        juce::jlimit(viewConfig_.minZoomLevel, viewConfig_.maxZoomLevel, zoomLevel);
}

SnapResult CompositionStore::snapPosition(TimeMs position, ClipId excludeClipId) const {
    auto targets = SnapEngine::findTargets(timeline_, excludeClipId, viewConfig_.zoomLevel,
                                           viewConfig_.pixelsPerSecond);
    return SnapEngine::applySnap(position, targets, viewConfig_.snapThresholdMs,
                                 viewConfig_.snapEnabled);
}

// ============================================================================
// History
// ============================================================================

CompositionSnapshot CompositionStore::captureState() const {
    CompositionSnapshot state;
    state.tracks = timeline_.tracks;
    state.totalDuration = timeline_.totalDuration;
    state.selectedClipId = selectedClipId_;
    return state;
}

void CompositionStore::restoreState(const CompositionSnapshot& state) {
    timeline_.tracks = state.tracks;
    timeline_.totalDuration = state.totalDuration;
    selectedClipId_ = state.selectedClipId;
}

void CompositionStore::pushHistory(bool record) {
    if (!record) {
        // Keep the state from before the first unrecorded change
        if (!unrecordedBaseline_)
            unrecordedBaseline_ = captureState();
        return;
    }

    if (unrecordedBaseline_) {
        history_.push(*unrecordedBaseline_);
        unrecordedBaseline_.reset();
    } else {
        history_.push(captureState());
    }
}

bool CompositionStore::undo() {
    const auto* previous = history_.stepBack();
    if (previous == nullptr) {
        return false;
    }

    const ClipId selectionBefore = selectedClipId_;

    restoreState(*previous);
    unrecordedBaseline_.reset();

    DBG("Undo: restored history entry, index now " << history_.getIndex());

    notifyCompositionChanged();
    if (selectedClipId_ != selectionBefore)
        notifySelectionChanged(selectedClipId_);
    notifyHistoryChanged();
    return true;
}

void CompositionStore::clearTimeline() {
    const bool hadSelection = selectedClipId_ != INVALID_CLIP_ID;

    timeline_ = TimelineInfo{};
    timeline_.tracks.push_back(makeTrack(TrackType::Video, {}));
    selectedClipId_ = INVALID_CLIP_ID;

    history_.clear();
    unrecordedBaseline_.reset();

    notifyCompositionChanged();
    if (hadSelection)
        notifySelectionChanged(INVALID_CLIP_ID);
    notifyHistoryChanged();
}

// ============================================================================
// Commit
// ============================================================================

void CompositionStore::commit(TimelineInfo working, bool record) {
    pushHistory(record);

    for (auto& track : working.tracks)
        track.clips = ClipOperations::sortedByStart(track.clips);
    working.recalculateDuration();

    timeline_ = std::move(working);

    // Drop a selection that points at a clip which no longer exists
    const bool selectionLost =
        selectedClipId_ != INVALID_CLIP_ID && timeline_.findClip(selectedClipId_) == nullptr;
    if (selectionLost)
        selectedClipId_ = INVALID_CLIP_ID;

    notifyCompositionChanged();
    if (selectionLost)
        notifySelectionChanged(INVALID_CLIP_ID);
    if (record)
        notifyHistoryChanged();
}

// ============================================================================
// Listeners
// ============================================================================

void CompositionStore::addListener(CompositionStoreListener* listener) {
    if (listener && std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
        listeners_.push_back(listener);
    }
}

void CompositionStore::removeListener(CompositionStoreListener* listener) {
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

void CompositionStore::notifyCompositionChanged() {
    // Make a copy because listeners may be removed during iteration
    auto listenersCopy = listeners_;
    for (auto* listener : listenersCopy) {
        if (std::find(listeners_.begin(), listeners_.end(), listener) != listeners_.end()) {
            listener->compositionChanged();
        }
    }
}

void CompositionStore::notifyClipPropertyChanged(ClipId clipId) {
    auto listenersCopy = listeners_;
    for (auto* listener : listenersCopy) {
        if (std::find(listeners_.begin(), listeners_.end(), listener) != listeners_.end()) {
            listener->clipPropertyChanged(clipId);
        }
    }
}

void CompositionStore::notifySelectionChanged(ClipId clipId) {
    auto listenersCopy = listeners_;
    for (auto* listener : listenersCopy) {
        if (std::find(listeners_.begin(), listeners_.end(), listener) != listeners_.end()) {
            listener->selectionChanged(clipId);
        }
    }
}

void CompositionStore::notifyHistoryChanged() {
    auto listenersCopy = listeners_;
    for (auto* listener : listenersCopy) {
        if (std::find(listeners_.begin(), listeners_.end(), listener) != listeners_.end()) {
            listener->historyChanged();
        }
    }
}

}  // namespace cutline
