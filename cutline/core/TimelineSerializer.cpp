#include "TimelineSerializer.hpp"

#include <set>

#include "ClipOperations.hpp"

namespace cutline {

namespace {

bool trackTypeFromString(const juce::String& name, TrackType& outType) {
    if (name == "video") {
        outType = TrackType::Video;
        return true;
    }
    if (name == "audio") {
        outType = TrackType::Audio;
        return true;
    }
    return false;
}

juce::String trackTypeToString(TrackType type) {
    return type == TrackType::Audio ? "audio" : "video";
}

}  // namespace

// ============================================================================
// Timeline-level serialization
// ============================================================================

juce::var TimelineSerializer::serializeTimeline(const TimelineInfo& timeline) {
    auto* obj = new juce::DynamicObject();

    juce::Array<juce::var> tracksArray;
    for (const auto& track : timeline.tracks)
        tracksArray.add(serializeTrack(track));

    obj->setProperty("tracks", juce::var(tracksArray));
    obj->setProperty("totalDuration", timeline.totalDuration);

    return juce::var(obj);
}

bool TimelineSerializer::deserializeTimeline(const juce::var& json, TimelineInfo& outTimeline) {
    if (!json.isObject()) {
        lastError_ = "Invalid timeline JSON: not an object";
        return false;
    }

    auto* obj = json.getDynamicObject();
    auto tracksVar = obj->getProperty("tracks");
    if (!tracksVar.isArray()) {
        lastError_ = "Tracks data is not an array";
        return false;
    }

    // Stage everything; outTimeline is only touched once the whole document is valid
    TimelineInfo staged;
    std::set<TrackId> trackIds;
    std::set<ClipId> clipIds;

    for (const auto& trackVar : *tracksVar.getArray()) {
        TrackInfo track;
        if (!deserializeTrack(trackVar, track)) {
            return false;
        }

        if (!trackIds.insert(track.id).second) {
            lastError_ = "Duplicate track id: " + juce::String(track.id);
            return false;
        }

        for (const auto& clip : track.clips) {
            if (!clipIds.insert(clip.id).second) {
                lastError_ = "Duplicate clip id: " + juce::String(clip.id);
                return false;
            }
        }

        staged.tracks.push_back(std::move(track));
    }

    staged.recalculateDuration();
    outTimeline = std::move(staged);
    return true;
}

juce::String TimelineSerializer::toJsonString(const TimelineInfo& timeline, bool pretty) {
    return juce::JSON::toString(serializeTimeline(timeline), !pretty);
}

bool TimelineSerializer::fromJsonString(const juce::String& jsonString,
                                        TimelineInfo& outTimeline) {
    juce::var parsed;
    auto result = juce::JSON::parse(jsonString, parsed);
    if (result.failed()) {
        lastError_ = "Failed to parse JSON: " + result.getErrorMessage();
        return false;
    }

    return deserializeTimeline(parsed, outTimeline);
}

// ============================================================================
// Component-level serialization
// ============================================================================

juce::var TimelineSerializer::serializeTrack(const TrackInfo& track) {
    auto* obj = new juce::DynamicObject();

    obj->setProperty("id", track.id);
    obj->setProperty("trackType", trackTypeToString(track.type));
    obj->setProperty("name", track.name);

    juce::Array<juce::var> clipsArray;
    for (const auto& clip : track.clips)
        clipsArray.add(serializeClip(clip));
    obj->setProperty("clips", juce::var(clipsArray));

    return juce::var(obj);
}

juce::var TimelineSerializer::serializeClip(const ClipInfo& clip) {
    auto* obj = new juce::DynamicObject();

    obj->setProperty("id", clip.id);
    obj->setProperty("filePath", clip.sourcePath);
    obj->setProperty("startTime", clip.startTime);
    obj->setProperty("duration", clip.sourceDuration);
    obj->setProperty("trimIn", clip.trimIn);
    obj->setProperty("trimOut", clip.trimOut);

    // Optional fields are left out entirely when absent
    if (clip.fadeIn)
        obj->setProperty("fadeIn", *clip.fadeIn);
    if (clip.fadeOut)
        obj->setProperty("fadeOut", *clip.fadeOut);
    if (clip.volume)
        obj->setProperty("volume", static_cast<double>(*clip.volume));
    if (clip.muted)
        obj->setProperty("muted", *clip.muted);

    if (clip.audioTracks) {
        juce::Array<juce::var> audioArray;
        for (const auto& audioTrack : *clip.audioTracks) {
            auto* audioObj = new juce::DynamicObject();
            audioObj->setProperty("trackIndex", audioTrack.trackIndex);
            audioObj->setProperty("label", audioTrack.label);
            audioObj->setProperty("volume", static_cast<double>(audioTrack.volume));
            audioObj->setProperty("muted", audioTrack.muted);
            audioArray.add(juce::var(audioObj));
        }
        obj->setProperty("audioTracks", juce::var(audioArray));
    }

    if (clip.transform) {
        auto* transformObj = new juce::DynamicObject();
        transformObj->setProperty("x", clip.transform->x);
        transformObj->setProperty("y", clip.transform->y);
        transformObj->setProperty("scale", clip.transform->scale);
        transformObj->setProperty("rotation", clip.transform->rotation);
        obj->setProperty("transform", juce::var(transformObj));
    }

    return juce::var(obj);
}

bool TimelineSerializer::deserializeTrack(const juce::var& json, TrackInfo& outTrack) {
    if (!json.isObject()) {
        lastError_ = "Track data is not an object";
        return false;
    }

    auto* obj = json.getDynamicObject();

    if (!obj->hasProperty("id")) {
        lastError_ = "Track is missing its id";
        return false;
    }
    outTrack.id = obj->getProperty("id");

    if (!trackTypeFromString(obj->getProperty("trackType").toString(), outTrack.type)) {
        lastError_ = "Track " + juce::String(outTrack.id) + " has unknown trackType '" +
                     obj->getProperty("trackType").toString() + "'";
        return false;
    }

    // Name is optional (older documents don't carry it)
    outTrack.name = obj->getProperty("name").toString();

    auto clipsVar = obj->getProperty("clips");
    if (!clipsVar.isVoid()) {
        if (!clipsVar.isArray()) {
            lastError_ = "Clips data of track " + juce::String(outTrack.id) + " is not an array";
            return false;
        }

        for (const auto& clipVar : *clipsVar.getArray()) {
            ClipInfo clip;
            if (!deserializeClip(clipVar, clip)) {
                return false;
            }
            clip.trackId = outTrack.id;
            outTrack.clips.push_back(std::move(clip));
        }
    }

    outTrack.clips = ClipOperations::sortedByStart(outTrack.clips);
    return validateTrack(outTrack);
}

bool TimelineSerializer::deserializeClip(const juce::var& json, ClipInfo& outClip) {
    if (!json.isObject()) {
        lastError_ = "Clip data is not an object";
        return false;
    }

    auto* obj = json.getDynamicObject();

    for (auto* key : {"id", "startTime", "duration", "trimIn", "trimOut"}) {
        if (!obj->hasProperty(key)) {
            lastError_ = "Clip is missing required field '" + juce::String(key) + "'";
            return false;
        }
    }

    outClip.id = obj->getProperty("id");
    outClip.sourcePath = obj->getProperty("filePath").toString();
    outClip.startTime = static_cast<juce::int64>(obj->getProperty("startTime"));
    outClip.sourceDuration = static_cast<juce::int64>(obj->getProperty("duration"));
    outClip.trimIn = static_cast<juce::int64>(obj->getProperty("trimIn"));
    outClip.trimOut = static_cast<juce::int64>(obj->getProperty("trimOut"));

    if (obj->hasProperty("fadeIn"))
        outClip.fadeIn = static_cast<juce::int64>(obj->getProperty("fadeIn"));
    if (obj->hasProperty("fadeOut"))
        outClip.fadeOut = static_cast<juce::int64>(obj->getProperty("fadeOut"));
    if (obj->hasProperty("volume"))
        outClip.volume = static_cast<float>(static_cast<double>(obj->getProperty("volume")));
    if (obj->hasProperty("muted"))
        outClip.muted = static_cast<bool>(obj->getProperty("muted"));

    auto audioTracksVar = obj->getProperty("audioTracks");
    if (audioTracksVar.isArray()) {
        std::vector<ClipAudioTrack> audioTracks;
        for (const auto& audioVar : *audioTracksVar.getArray()) {
            ClipAudioTrack audioTrack;
            if (!deserializeAudioTrack(audioVar, audioTrack)) {
                return false;
            }
            audioTracks.push_back(audioTrack);
        }
        outClip.audioTracks = std::move(audioTracks);
    }

    auto transformVar = obj->getProperty("transform");
    if (!transformVar.isVoid()) {
        ClipTransform transform;
        if (!deserializeTransform(transformVar, transform)) {
            return false;
        }
        outClip.transform = transform;
    }

    if (!outClip.isStructurallyValid()) {
        lastError_ = "Clip " + juce::String(outClip.id) + " has an invalid trim range";
        return false;
    }

    if (!ClipOperations::validateFadeDuration(outClip)) {
        lastError_ = "Clip " + juce::String(outClip.id) + " has invalid fades";
        return false;
    }

    return true;
}

bool TimelineSerializer::deserializeAudioTrack(const juce::var& json,
                                               ClipAudioTrack& outAudioTrack) {
    if (!json.isObject()) {
        lastError_ = "Audio track data is not an object";
        return false;
    }

    auto* obj = json.getDynamicObject();
    outAudioTrack.trackIndex = obj->getProperty("trackIndex");
    outAudioTrack.label = obj->getProperty("label").toString();
    outAudioTrack.muted = obj->getProperty("muted");

    auto volumeVar = obj->getProperty("volume");
    outAudioTrack.volume =
        volumeVar.isVoid() ? 1.0f : static_cast<float>(static_cast<double>(volumeVar));

    return true;
}

bool TimelineSerializer::deserializeTransform(const juce::var& json,
                                              ClipTransform& outTransform) {
    if (!json.isObject()) {
        lastError_ = "Transform data is not an object";
        return false;
    }

    auto* obj = json.getDynamicObject();
    outTransform.x = obj->getProperty("x");
    outTransform.y = obj->getProperty("y");
    outTransform.rotation = obj->getProperty("rotation");

    auto scaleVar = obj->getProperty("scale");
    outTransform.scale = scaleVar.isVoid() ? 1.0 : static_cast<double>(scaleVar);

    return true;
}

bool TimelineSerializer::validateTrack(const TrackInfo& track) {
    // Clips are sorted, so checking neighbours is enough
    for (size_t i = 0; i + 1 < track.clips.size(); ++i) {
        if (IntervalMath::overlaps(track.clips[i], track.clips[i + 1])) {
            lastError_ = "Clips " + juce::String(track.clips[i].id) + " and " +
                         juce::String(track.clips[i + 1].id) + " overlap on track " +
                         juce::String(track.id);
            return false;
        }
    }
    return true;
}

}  // namespace cutline
