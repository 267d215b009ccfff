#include <catch2/catch_test_macros.hpp>

#include "cutline/core/ClipOperations.hpp"

/**
 * Tests for ClipOperations
 *
 * These tests verify:
 * - Sequential placement ignores the order clips are stored in
 * - Overlap detection treats touching clips as valid neighbours
 * - Split produces two halves that tile the original exactly
 * - Ripple delete shifts only the clips after the deleted one
 * - Fade validation against the effective (trimmed) duration
 * - Drop collision resolution picks the closest free position
 */

using namespace cutline;

namespace {

ClipInfo makeClip(ClipId id, TimeMs start, TimeMs trimIn, TimeMs trimOut,
                  TimeMs sourceDuration = 20000) {
    ClipInfo clip;
    clip.id = id;
    clip.trackId = 1;
    clip.sourcePath = "/media/clip.mp4";
    clip.startTime = start;
    clip.trimIn = trimIn;
    clip.trimOut = trimOut;
    clip.sourceDuration = sourceDuration;
    return clip;
}

TrackInfo makeTrack(std::vector<ClipInfo> clips) {
    TrackInfo track;
    track.id = 1;
    track.type = TrackType::Video;
    track.clips = std::move(clips);
    return track;
}

}  // namespace

// ============================================================================
// Sequencing
// ============================================================================

TEST_CASE("ClipOperations::sequentialPosition", "[clip][sequence]") {
    SECTION("Empty track starts at 0") {
        REQUIRE(ClipOperations::sequentialPosition(makeTrack({})) == 0);
    }

    SECTION("End of the clip with the latest start") {
        auto track = makeTrack({makeClip(1, 0, 0, 5000), makeClip(2, 7000, 0, 2000)});
        REQUIRE(ClipOperations::sequentialPosition(track) == 9000);
    }

    SECTION("Unsorted input is handled") {
        auto track = makeTrack({makeClip(2, 7000, 0, 2000), makeClip(1, 0, 0, 5000)});
        REQUIRE(ClipOperations::sequentialPosition(track) == 9000);
    }
}

// ============================================================================
// Collision Detection
// ============================================================================

TEST_CASE("ClipOperations::detectOverlap / validatePosition", "[clip][collision]") {
    auto track = makeTrack({makeClip(1, 0, 0, 5000), makeClip(2, 8000, 0, 2000)});

    SECTION("Touching on both sides is valid") {
        auto candidate = makeClip(3, 5000, 0, 3000);
        REQUIRE_FALSE(ClipOperations::detectOverlap(candidate, track));
        REQUIRE(ClipOperations::validatePosition(candidate, track));
    }

    SECTION("One millisecond too long overlaps") {
        auto candidate = makeClip(3, 5000, 0, 3001);
        REQUIRE(ClipOperations::detectOverlap(candidate, track));
        REQUIRE_FALSE(ClipOperations::validatePosition(candidate, track));
    }

    SECTION("Negative start is rejected even on an empty track") {
        auto candidate = makeClip(3, -1, 0, 1000);
        REQUIRE_FALSE(ClipOperations::validatePosition(candidate, makeTrack({})));
    }

    SECTION("A clip is not checked against itself when excluded") {
        auto moved = track.clips[0];
        moved.startTime = 1000;
        REQUIRE(ClipOperations::detectOverlap(moved, track));
        REQUIRE_FALSE(ClipOperations::detectOverlap(moved, track, moved.id));
        REQUIRE(ClipOperations::validatePosition(moved, track, moved.id));
    }
}

TEST_CASE("ClipOperations::findClipAtTime", "[clip][query]") {
    auto track = makeTrack({makeClip(1, 0, 0, 5000), makeClip(2, 5000, 0, 3000)});

    REQUIRE(ClipOperations::findClipAtTime(track, 0)->id == 1);
    REQUIRE(ClipOperations::findClipAtTime(track, 4999)->id == 1);
    REQUIRE(ClipOperations::findClipAtTime(track, 5000)->id == 2);
    REQUIRE(ClipOperations::findClipAtTime(track, 8000) == nullptr);
}

TEST_CASE("ClipOperations::findClipAtPlayhead - first track wins", "[clip][query]") {
    auto upper = makeTrack({makeClip(1, 0, 0, 5000)});
    upper.id = 1;
    auto lower = makeTrack({makeClip(2, 2000, 0, 5000)});
    lower.id = 2;

    std::vector<TrackInfo> tracks = {upper, lower};

    auto hit = ClipOperations::findClipAtPlayhead(tracks, 3000);
    REQUIRE(hit.has_value());
    REQUIRE(hit->clipId == 1);
    REQUIRE(hit->trackId == 1);

    auto lowerOnly = ClipOperations::findClipAtPlayhead(tracks, 6000);
    REQUIRE(lowerOnly.has_value());
    REQUIRE(lowerOnly->clipId == 2);
    REQUIRE(lowerOnly->trackId == 2);

    REQUIRE_FALSE(ClipOperations::findClipAtPlayhead(tracks, 7000).has_value());
}

// ============================================================================
// Split
// ============================================================================

TEST_CASE("ClipOperations::splitAt", "[clip][split]") {
    SECTION("Split at clip midpoint") {
        auto clip = makeClip(1, 5000, 0, 10000);

        auto halves = ClipOperations::splitAt(clip, 10000.0, 2, 3);
        REQUIRE(halves.has_value());

        const auto& first = halves->first;
        const auto& second = halves->second;

        REQUIRE(first.id == 2);
        REQUIRE(first.startTime == 5000);
        REQUIRE(first.trimIn == 0);
        REQUIRE(first.trimOut == 5000);

        REQUIRE(second.id == 3);
        REQUIRE(second.startTime == 10000);
        REQUIRE(second.trimIn == 5000);
        REQUIRE(second.trimOut == 10000);
    }

    SECTION("Split of a trimmed clip uses source offsets") {
        auto clip = makeClip(1, 1000, 2000, 8000);

        auto halves = ClipOperations::splitAt(clip, 3000.0, 2, 3);
        REQUIRE(halves.has_value());
        REQUIRE(halves->first.trimIn == 2000);
        REQUIRE(halves->first.trimOut == 4000);
        REQUIRE(halves->second.trimIn == 4000);
        REQUIRE(halves->second.trimOut == 8000);
        REQUIRE(halves->second.startTime == 3000);
    }

    SECTION("Fractional split time is rounded before arithmetic") {
        auto clip = makeClip(1, 0, 0, 10000);

        auto halves = ClipOperations::splitAt(clip, 3333.6, 2, 3);
        REQUIRE(halves.has_value());
        REQUIRE(halves->first.trimOut == 3334);
        REQUIRE(halves->second.trimIn == 3334);
        REQUIRE(halves->second.startTime == 3334);
        REQUIRE(halves->first.getEndTime() == halves->second.startTime);
    }

    SECTION("Split at or outside the bounds is rejected") {
        auto clip = makeClip(1, 5000, 0, 10000);

        REQUIRE_FALSE(ClipOperations::splitAt(clip, 5000.0, 2, 3).has_value());
        REQUIRE_FALSE(ClipOperations::splitAt(clip, 15000.0, 2, 3).has_value());
        REQUIRE_FALSE(ClipOperations::splitAt(clip, 4000.0, 2, 3).has_value());
        REQUIRE_FALSE(ClipOperations::splitAt(clip, 20000.0, 2, 3).has_value());

        // Rounds onto the boundary
        REQUIRE_FALSE(ClipOperations::splitAt(clip, 5000.4, 2, 3).has_value());
    }

    SECTION("Fades across the cut are dropped, others kept") {
        auto clip = makeClip(1, 0, 0, 10000);
        clip.fadeIn = 1000;
        clip.fadeOut = 2000;
        clip.volume = 0.5f;
        clip.muted = true;

        auto halves = ClipOperations::splitAt(clip, 4000.0, 2, 3);
        REQUIRE(halves.has_value());

        REQUIRE(halves->first.getFadeIn() == 1000);
        REQUIRE(halves->first.getFadeOut() == 0);
        REQUIRE(halves->second.getFadeIn() == 0);
        REQUIRE(halves->second.getFadeOut() == 2000);

        REQUIRE(halves->first.getVolume() == 0.5f);
        REQUIRE(halves->second.isMuted());
        REQUIRE(halves->second.sourcePath == clip.sourcePath);
        REQUIRE(halves->second.sourceDuration == clip.sourceDuration);
    }
}

// ============================================================================
// Delete
// ============================================================================

TEST_CASE("ClipOperations::deleteClip", "[clip][delete]") {
    std::vector<ClipInfo> clips = {makeClip(1, 0, 0, 5000), makeClip(2, 5000, 0, 3000),
                                   makeClip(3, 8000, 0, 2000)};

    SECTION("Ripple delete closes the hole") {
        auto result = ClipOperations::deleteClip(clips, 2, true);

        REQUIRE(result.size() == 2);
        REQUIRE(result[0].id == 1);
        REQUIRE(result[0].startTime == 0);
        REQUIRE(result[1].id == 3);
        REQUIRE(result[1].startTime == 5000);
    }

    SECTION("Plain delete leaves a gap") {
        auto result = ClipOperations::deleteClip(clips, 2, false);

        REQUIRE(result.size() == 2);
        REQUIRE(result[1].id == 3);
        REQUIRE(result[1].startTime == 8000);
    }

    SECTION("Ripple shift equals the deleted clip's trimmed duration") {
        clips[1].trimIn = 1000;  // 2000ms active
        REQUIRE(ClipOperations::rippleShift(clips[1]) == 2000);

        auto result = ClipOperations::deleteClip(clips, 2, true);
        REQUIRE(result[1].startTime == 6000);
    }

    SECTION("Unknown id returns the input unchanged") {
        auto result = ClipOperations::deleteClip(clips, 99, true);
        REQUIRE(result.size() == 3);
        REQUIRE(result[2].startTime == 8000);
    }
}

// ============================================================================
// Fades
// ============================================================================

TEST_CASE("ClipOperations::validateFadeDuration", "[clip][fade]") {
    auto clip = makeClip(1, 0, 0, 10000);

    SECTION("Fades summing to the clip duration are valid") {
        REQUIRE(ClipOperations::validateFadeDuration(clip, 5000, 5000));
    }

    SECTION("Each fade is capped at 5000ms regardless of duration") {
        REQUIRE_FALSE(ClipOperations::validateFadeDuration(clip, 5001, std::nullopt));
        REQUIRE_FALSE(ClipOperations::validateFadeDuration(clip, std::nullopt, 5001));
    }

    SECTION("Negative fades are rejected") {
        REQUIRE_FALSE(ClipOperations::validateFadeDuration(clip, -1, std::nullopt));
    }

    SECTION("Combined fades longer than the trimmed clip are rejected") {
        auto shortClip = makeClip(1, 0, 0, 3000);
        REQUIRE(ClipOperations::validateFadeDuration(shortClip, 1500, 1500));
        REQUIRE_FALSE(ClipOperations::validateFadeDuration(shortClip, 1500, 1501));
    }

    SECTION("Unspecified values fall back to the current fades") {
        clip.fadeOut = 4000;
        REQUIRE(ClipOperations::validateFadeDuration(clip, 5000, std::nullopt));

        clip.trimOut = 8000;  // Trimming shrinks the budget
        REQUIRE_FALSE(ClipOperations::validateFadeDuration(clip, 5000, std::nullopt));
    }

    SECTION("No fades is always valid") {
        REQUIRE(ClipOperations::validateFadeDuration(clip));
    }
}

// ============================================================================
// Drop collision resolution
// ============================================================================

TEST_CASE("ClipOperations::findNearestValidPosition", "[clip][collision]") {
    // [0,5000) and [8000,10000) leave a 3000ms hole
    auto track = makeTrack({makeClip(1, 0, 0, 5000), makeClip(2, 8000, 0, 2000)});

    SECTION("Free position is kept") {
        auto clip = makeClip(3, 0, 0, 2000);
        REQUIRE(ClipOperations::findNearestValidPosition(clip, track, 5500) == 5500);
        REQUIRE(ClipOperations::findNearestValidPosition(clip, track, 12000) == 12000);
    }

    SECTION("Negative desired start is clamped to 0 first") {
        auto clip = makeClip(3, 0, 0, 2000);
        auto empty = makeTrack({});
        REQUIRE(ClipOperations::findNearestValidPosition(clip, empty, -500) == 0);
    }

    SECTION("Collision snaps to the closest neighbour edge") {
        auto clip = makeClip(3, 0, 0, 2000);

        // Overlaps clip 1 near its end: after clip 1 is 1000ms away
        REQUIRE(ClipOperations::findNearestValidPosition(clip, track, 4000) == 5000);

        // Overlaps clip 2: before clip 2 (6000) is 1000ms away, after it (10000) 3000ms
        REQUIRE(ClipOperations::findNearestValidPosition(clip, track, 7000) == 6000);
    }

    SECTION("Clip that doesn't fit the hole goes after the neighbours") {
        auto clip = makeClip(3, 0, 0, 4000);
        REQUIRE(ClipOperations::findNearestValidPosition(clip, track, 6000) == 10000);
    }

    SECTION("Equal displacement prefers the earlier position") {
        auto clip = makeClip(3, 0, 0, 1000);
        auto tight = makeTrack({makeClip(1, 2000, 0, 2000), makeClip(2, 5000, 0, 2000)});

        // Desired 3500 hits clip 1 [2000,4000); before = 1000 (2500 away), after = 4000 (500 away)
        REQUIRE(ClipOperations::findNearestValidPosition(clip, tight, 3500) == 4000);

        // Desired 2500: before = 1000 (1500 away), after = 4000 (1500 away) -> earlier
        REQUIRE(ClipOperations::findNearestValidPosition(clip, tight, 2500) == 1000);
    }

    SECTION("The clip's own footprint is ignored") {
        auto own = track.clips[0];
        REQUIRE(ClipOperations::findNearestValidPosition(own, track, 1000) == 1000);
    }
}
