#pragma once

#include <juce_core/juce_core.h>

namespace cutline {

// Timeline positions and durations, always whole milliseconds
using TimeMs = juce::int64;

// Clip identifiers
using ClipId = int;
constexpr ClipId INVALID_CLIP_ID = -1;

// Track identifiers
using TrackId = int;
constexpr TrackId INVALID_TRACK_ID = -1;

}  // namespace cutline
