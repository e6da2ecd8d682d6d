#include "JsonIO.h"

#include "reelcut/Utility.h"

#include <stdexcept>

namespace reelcut {
namespace cli {

namespace {

double number_field(const Json::Value& obj, const char* key, double fallback) {
    if (!obj.isMember(key) || obj[key].isNull()) return fallback;
    if (!obj[key].isNumeric()) {
        throw std::runtime_error(std::string("field '") + key + "' must be a number");
    }
    return obj[key].asDouble();
}

std::string string_field(const Json::Value& obj, const char* key) {
    if (!obj.isMember(key) || obj[key].isNull()) return {};
    if (!obj[key].isString()) {
        throw std::runtime_error(std::string("field '") + key + "' must be a string");
    }
    return obj[key].asString();
}

const Json::Value& array_field(const Json::Value& obj, const char* key) {
    static const Json::Value empty(Json::arrayValue);
    if (!obj.isMember(key) || obj[key].isNull()) return empty;
    if (!obj[key].isArray()) {
        throw std::runtime_error(std::string("field '") + key + "' must be an array");
    }
    return obj[key];
}

void require_object(const Json::Value& v, const char* what) {
    if (!v.isObject()) throw std::runtime_error(std::string(what) + " entries must be objects");
}

}  // namespace

HighlightRequest request_from_json(const Json::Value& root) {
    if (!root.isObject()) {
        throw std::runtime_error("analysis document must be a JSON object");
    }

    HighlightRequest request;
    request.videoId = string_field(root, "video_id");
    request.title = string_field(root, "title");
    request.durationSeconds = number_field(root, "duration", 0.0);

    for (const auto& w : array_field(root, "words")) {
        require_object(w, "words");
        TimedWord word;
        word.text = string_field(w, "text");
        word.start = number_field(w, "start", 0.0);
        word.end = number_field(w, "end", word.start);
        word.confidence = number_field(w, "confidence", 1.0);
        request.words.push_back(std::move(word));
    }

    for (const auto& s : array_field(root, "loudness")) {
        require_object(s, "loudness");
        request.loudness.push_back(SignalSample{number_field(s, "t", 0.0), number_field(s, "value", 0.0)});
    }

    for (const auto& c : array_field(root, "scene_cuts")) {
        if (!c.isNumeric()) throw std::runtime_error("scene_cuts entries must be numbers");
        request.sceneCuts.push_back(c.asDouble());
    }

    // Absent/null means the video has no chapters; [] is the same for the engine.
    if (root.isMember("chapters") && !root["chapters"].isNull()) {
        std::vector<Chapter> chapters;
        for (const auto& ch : array_field(root, "chapters")) {
            require_object(ch, "chapters");
            chapters.push_back(Chapter{number_field(ch, "start", 0.0), string_field(ch, "title")});
        }
        request.chapters = std::move(chapters);
    }
    return request;
}

HighlightRequest read_request(std::istream& in) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        throw std::runtime_error("invalid analysis JSON: " + errors);
    }
    return request_from_json(root);
}

Json::Value result_to_json(const HighlightResult& result) {
    Json::Value out;
    out["video_id"] = result.videoId;
    out["title"] = result.title;
    out["duration"] = result.durationSeconds;
    out["candidate_count"] = static_cast<Json::UInt64>(result.candidateCount);
    out["used_chapter_clips"] = result.usedChapterClips;

    Json::Value missing(Json::arrayValue);
    for (SignalKind kind : result.missingSignals) missing.append(signal_kind_to_string(kind));
    out["missing_signals"] = missing;

    Json::Value weights(Json::objectValue);
    for (const auto& [kind, weight] : result.timeline.weights) weights[signal_kind_to_string(kind)] = weight;
    out["weights"] = weights;

    Json::Value clips(Json::arrayValue);
    const std::size_t total = result.clips.size();
    for (std::size_t i = 0; i < total; ++i) {
        const auto& clip = result.clips[i];
        Json::Value c;
        c["rank"] = clip.rank;
        c["start"] = clip.start;
        c["end"] = clip.end;
        c["duration"] = clip.duration();
        c["score"] = clip.score;
        c["dominant_signal"] = signal_kind_to_string(clip.dominantSignal);
        c["reason"] = clip.reason;
        c["caption"] = format_clip_caption(clip, i + 1, total);
        c["ss"] = format_timecode(clip.start);
        c["to"] = format_timecode(clip.end);

        Json::Value cues(Json::arrayValue);
        for (const auto& cue : clip.cues) {
            Json::Value jc;
            jc["word"] = cue.word;
            jc["start"] = cue.start;
            jc["end"] = cue.end;
            cues.append(jc);
        }
        c["cues"] = cues;

        Json::Value lines(Json::arrayValue);
        for (const auto& line : clip.lines) {
            Json::Value jl;
            jl["text"] = line.text;
            jl["start"] = line.start;
            jl["end"] = line.end;
            jl["first_cue"] = static_cast<Json::UInt64>(line.firstCue);
            jl["cue_count"] = static_cast<Json::UInt64>(line.cueCount);
            lines.append(jl);
        }
        c["lines"] = lines;
        clips.append(c);
    }
    out["clips"] = clips;
    if (result.clips.empty()) out["message"] = kNoHighlightsMessage;
    return out;
}

std::string write_json(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    return Json::writeString(writer, value);
}

}  // namespace cli
}  // namespace reelcut
