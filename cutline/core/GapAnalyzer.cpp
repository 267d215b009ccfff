#include "GapAnalyzer.hpp"

#include <set>

#include "ClipOperations.hpp"

namespace cutline {

GapSegment GapAnalyzer::makeGap(const TrackInfo& track, TimeMs start, TimeMs end,
                                GapPosition position) {
    GapSegment gap;
    gap.trackId = track.id;
    gap.trackType = track.type;
    gap.startTime = start;
    gap.endTime = end;
    gap.duration = end - start;
    gap.position = position;
    return gap;
}

std::vector<GapSegment> GapAnalyzer::analyzeTrack(const TrackInfo& track,
                                                  TimeMs timelineDuration) {
    std::vector<GapSegment> gaps;

    if (track.clips.empty()) {
        if (timelineDuration > 0)
            gaps.push_back(makeGap(track, 0, timelineDuration, GapPosition::Start));
        return gaps;
    }

    const auto sorted = ClipOperations::sortedByStart(track.clips);

    const TimeMs firstStart = sorted.front().startTime;
    if (firstStart > 0) {
        gaps.push_back(makeGap(track, 0, firstStart, GapPosition::Start));
    }

    for (size_t i = 0; i + 1 < sorted.size(); ++i) {
        const TimeMs currentEnd = IntervalMath::endTime(sorted[i]);
        const TimeMs nextStart = sorted[i + 1].startTime;

        if (nextStart > currentEnd) {
            gaps.push_back(makeGap(track, currentEnd, nextStart, GapPosition::Middle));
        }
    }

    const TimeMs lastEnd = IntervalMath::endTime(sorted.back());
    if (lastEnd < timelineDuration) {
        gaps.push_back(makeGap(track, lastEnd, timelineDuration, GapPosition::End));
    }

    return gaps;
}

TimelineGapAnalysis GapAnalyzer::analyzeTimeline(const TimelineInfo& timeline) {
    TimelineGapAnalysis analysis;

    for (const auto& track : timeline.tracks) {
        auto trackGaps = analyzeTrack(track, timeline.totalDuration);
        if (trackGaps.empty())
            continue;

        analysis.tracksWithGaps.push_back(track.id);
        analysis.gaps.insert(analysis.gaps.end(), trackGaps.begin(), trackGaps.end());
    }

    analysis.totalGaps = static_cast<int>(analysis.gaps.size());
    analysis.hasGaps = !analysis.gaps.empty();
    return analysis;
}

const GapSegment* GapAnalyzer::isTimeInGap(TimeMs time, const std::vector<GapSegment>& gaps) {
    for (const auto& gap : gaps) {
        if (gap.containsTime(time))
            return &gap;
    }
    return nullptr;
}

std::vector<GapSegment> GapAnalyzer::getGapsAtTime(TimeMs time,
                                                   const std::vector<GapSegment>& gaps) {
    std::vector<GapSegment> result;
    for (const auto& gap : gaps) {
        if (gap.containsTime(time))
            result.push_back(gap);
    }
    return result;
}

bool GapAnalyzer::allTracksInGap(TimeMs time, const TimelineInfo& timeline) {
    if (timeline.tracks.empty()) {
        return true;
    }

    const auto analysis = analyzeTimeline(timeline);

    std::set<TrackId> tracksInGap;
    for (const auto& gap : getGapsAtTime(time, analysis.gaps))
        tracksInGap.insert(gap.trackId);

    return tracksInGap.size() == timeline.tracks.size();
}

std::optional<TimeMs> GapAnalyzer::nextGapBoundary(TimeMs time,
                                                   const std::vector<GapSegment>& gaps) {
    std::optional<TimeMs> next;

    for (const auto& gap : gaps) {
        for (auto boundary : {gap.startTime, gap.endTime}) {
            if (boundary > time && (!next || boundary < *next))
                next = boundary;
        }
    }

    return next;
}

}  // namespace cutline
