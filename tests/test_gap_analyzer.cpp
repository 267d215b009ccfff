#include <catch2/catch_test_macros.hpp>

#include "cutline/core/GapAnalyzer.hpp"

using namespace cutline;

namespace {

ClipInfo makeClip(ClipId id, TimeMs start, TimeMs duration) {
    ClipInfo clip = ClipInfo::fromSource("/media/gap.mp4", duration, start);
    clip.id = id;
    return clip;
}

TrackInfo makeTrack(TrackId id, TrackType type, std::vector<ClipInfo> clips) {
    TrackInfo track;
    track.id = id;
    track.type = type;
    track.clips = std::move(clips);
    return track;
}

}  // namespace

TEST_CASE("GapAnalyzer::analyzeTrack", "[gap]") {
    SECTION("Touching clips leave no gap") {
        auto track =
            makeTrack(1, TrackType::Video, {makeClip(1, 0, 5000), makeClip(2, 5000, 3000)});
        REQUIRE(GapAnalyzer::analyzeTrack(track, 8000).empty());
    }

    SECTION("Hole between clips is a middle gap") {
        auto track =
            makeTrack(1, TrackType::Video, {makeClip(1, 0, 5000), makeClip(2, 7000, 3000)});
        auto gaps = GapAnalyzer::analyzeTrack(track, 10000);

        REQUIRE(gaps.size() == 1);
        REQUIRE(gaps[0].startTime == 5000);
        REQUIRE(gaps[0].endTime == 7000);
        REQUIRE(gaps[0].duration == 2000);
        REQUIRE(gaps[0].position == GapPosition::Middle);
        REQUIRE(gaps[0].trackId == 1);
    }

    SECTION("Leading and trailing gaps") {
        auto track = makeTrack(2, TrackType::Audio, {makeClip(1, 1000, 2000)});
        auto gaps = GapAnalyzer::analyzeTrack(track, 6000);

        REQUIRE(gaps.size() == 2);
        REQUIRE(gaps[0].position == GapPosition::Start);
        REQUIRE(gaps[0].startTime == 0);
        REQUIRE(gaps[0].endTime == 1000);
        REQUIRE(gaps[0].trackType == TrackType::Audio);

        REQUIRE(gaps[1].position == GapPosition::End);
        REQUIRE(gaps[1].startTime == 3000);
        REQUIRE(gaps[1].endTime == 6000);
    }

    SECTION("Empty track is one start gap over the whole timeline") {
        auto gaps = GapAnalyzer::analyzeTrack(makeTrack(1, TrackType::Video, {}), 4000);

        REQUIRE(gaps.size() == 1);
        REQUIRE(gaps[0].position == GapPosition::Start);
        REQUIRE(gaps[0].startTime == 0);
        REQUIRE(gaps[0].endTime == 4000);
    }

    SECTION("Empty track on an empty timeline has no gap") {
        REQUIRE(GapAnalyzer::analyzeTrack(makeTrack(1, TrackType::Video, {}), 0).empty());
    }

    SECTION("Unsorted clips are sorted first") {
        auto track =
            makeTrack(1, TrackType::Video, {makeClip(2, 7000, 3000), makeClip(1, 0, 5000)});
        auto gaps = GapAnalyzer::analyzeTrack(track, 10000);

        REQUIRE(gaps.size() == 1);
        REQUIRE(gaps[0].startTime == 5000);
        REQUIRE(gaps[0].endTime == 7000);
    }
}

TEST_CASE("GapAnalyzer::analyzeTimeline", "[gap]") {
    TimelineInfo timeline;
    timeline.tracks.push_back(makeTrack(1, TrackType::Video, {makeClip(1, 0, 10000)}));
    timeline.tracks.push_back(
        makeTrack(2, TrackType::Audio, {makeClip(2, 0, 3000), makeClip(3, 5000, 2000)}));
    timeline.recalculateDuration();

    auto analysis = GapAnalyzer::analyzeTimeline(timeline);

    REQUIRE(analysis.hasGaps);
    REQUIRE(analysis.totalGaps == 2);
    REQUIRE(analysis.tracksWithGaps.size() == 1);
    REQUIRE(analysis.tracksWithGaps[0] == 2);

    SECTION("isTimeInGap - inclusive start, exclusive end") {
        REQUIRE(GapAnalyzer::isTimeInGap(2999, analysis.gaps) == nullptr);
        REQUIRE(GapAnalyzer::isTimeInGap(3000, analysis.gaps) != nullptr);
        REQUIRE(GapAnalyzer::isTimeInGap(3000, analysis.gaps)->position == GapPosition::Middle);
        REQUIRE(GapAnalyzer::isTimeInGap(5000, analysis.gaps) == nullptr);
        REQUIRE(GapAnalyzer::isTimeInGap(7000, analysis.gaps)->position == GapPosition::End);
    }

    SECTION("getGapsAtTime") {
        REQUIRE(GapAnalyzer::getGapsAtTime(4000, analysis.gaps).size() == 1);
        REQUIRE(GapAnalyzer::getGapsAtTime(6000, analysis.gaps).empty());
    }

    SECTION("nextGapBoundary") {
        REQUIRE(GapAnalyzer::nextGapBoundary(0, analysis.gaps) == 3000);
        REQUIRE(GapAnalyzer::nextGapBoundary(3000, analysis.gaps) == 5000);
        REQUIRE(GapAnalyzer::nextGapBoundary(5000, analysis.gaps) == 7000);
        REQUIRE(GapAnalyzer::nextGapBoundary(7000, analysis.gaps) == 10000);
        REQUIRE_FALSE(GapAnalyzer::nextGapBoundary(10000, analysis.gaps).has_value());
    }

    SECTION("allTracksInGap - false while any track plays") {
        REQUIRE_FALSE(GapAnalyzer::allTracksInGap(4000, timeline));
    }
}

TEST_CASE("GapAnalyzer::allTracksInGap", "[gap]") {
    SECTION("Timeline without tracks counts as gap") {
        REQUIRE(GapAnalyzer::allTracksInGap(0, TimelineInfo{}));
    }

    SECTION("Both tracks empty at the same time") {
        TimelineInfo timeline;
        timeline.tracks.push_back(
            makeTrack(1, TrackType::Video, {makeClip(1, 0, 2000), makeClip(2, 6000, 2000)}));
        timeline.tracks.push_back(
            makeTrack(2, TrackType::Audio, {makeClip(3, 0, 3000), makeClip(4, 5000, 3000)}));
        timeline.recalculateDuration();

        REQUIRE(GapAnalyzer::allTracksInGap(4000, timeline));
        REQUIRE_FALSE(GapAnalyzer::allTracksInGap(2500, timeline));
        REQUIRE_FALSE(GapAnalyzer::allTracksInGap(5500, timeline));
    }

    SECTION("No gap at or after the end of the timeline") {
        TimelineInfo timeline;
        timeline.tracks.push_back(makeTrack(1, TrackType::Video, {makeClip(1, 0, 2000)}));
        timeline.tracks.push_back(makeTrack(2, TrackType::Audio, {}));
        timeline.recalculateDuration();

        REQUIRE_FALSE(GapAnalyzer::allTracksInGap(2500, timeline));
        REQUIRE_FALSE(GapAnalyzer::allTracksInGap(2000, timeline));
    }

    SECTION("A single empty track on an empty timeline has no gap") {
        TimelineInfo timeline;
        timeline.tracks.push_back(makeTrack(1, TrackType::Video, {}));

        REQUIRE_FALSE(GapAnalyzer::allTracksInGap(0, timeline));
    }
}
