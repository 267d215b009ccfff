#include "PlaybackQueries.hpp"

#include "ClipOperations.hpp"

namespace cutline {

std::vector<ActiveClip> PlaybackQueries::getActiveClipsAtTime(const TimelineInfo& timeline,
                                                              TimeMs time) {
    std::vector<ActiveClip> active;

    for (size_t i = 0; i < timeline.tracks.size(); ++i) {
        const auto& track = timeline.tracks[i];
        for (const auto& clip : track.clips) {
            if (!IntervalMath::contains(IntervalMath::footprint(clip), time))
                continue;

            ActiveClip entry;
            entry.clip = clip;
            entry.trackId = track.id;
            entry.trackIndex = static_cast<int>(i);
            entry.trackType = track.type;
            entry.relativeTime = time - clip.startTime;
            active.push_back(entry);
        }
    }

    return active;
}

std::vector<ActiveClip> PlaybackQueries::getActiveAudioClips(const TimelineInfo& timeline,
                                                             TimeMs time) {
    std::vector<ActiveClip> audio;
    for (const auto& entry : getActiveClipsAtTime(timeline, time)) {
        if (entry.trackType == TrackType::Audio)
            audio.push_back(entry);
    }
    return audio;
}

std::optional<TimeMs> PlaybackQueries::getNextClipBoundary(const TimelineInfo& timeline,
                                                           TimeMs time) {
    std::optional<TimeMs> earliest;

    for (const auto& track : timeline.tracks) {
        for (const auto& clip : track.clips) {
            for (auto boundary : {clip.startTime, IntervalMath::endTime(clip)}) {
                if (boundary > time && (!earliest || boundary < *earliest))
                    earliest = boundary;
            }
        }
    }

    return earliest;
}

const ClipInfo* PlaybackQueries::getClipAtTime(const TimelineInfo& timeline, TrackId trackId,
                                               TimeMs time) {
    auto* track = timeline.findTrack(trackId);
    if (track == nullptr) {
        return nullptr;
    }
    return ClipOperations::findClipAtTime(*track, time);
}

const ClipInfo* PlaybackQueries::getNextClip(const TimelineInfo& timeline, TrackId trackId,
                                             const ClipInfo& currentClip) {
    auto* track = timeline.findTrack(trackId);
    if (track == nullptr) {
        return nullptr;
    }

    const TimeMs currentEnd = IntervalMath::endTime(currentClip);
    const ClipInfo* next = nullptr;

    // Earliest qualifying start; the track may not be sorted
    for (const auto& clip : track->clips) {
        if (clip.id == currentClip.id || clip.startTime < currentEnd)
            continue;

        if (next == nullptr || clip.startTime < next->startTime)
            next = &clip;
    }

    return next;
}

bool PlaybackQueries::isEndOfTimeline(const TimelineInfo& timeline, TimeMs time) {
    if (timeline.tracks.empty()) {
        return true;
    }

    TimeMs maxEnd = 0;
    for (const auto& track : timeline.tracks)
        maxEnd = juce::jmax(maxEnd, track.getEndTime());

    return time >= maxEnd;
}

}  // namespace cutline
