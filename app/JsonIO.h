#pragma once

#include "reelcut/ClipTypes.h"

#include <json/json.h>

#include <istream>
#include <string>

namespace reelcut {
namespace cli {

/**
 * Analysis document produced by the upstream collaborators:
 *
 * {
 *   "video_id": "abc", "title": "...", "duration": 120.0,
 *   "words":      [{"text": "wait", "start": 1.0, "end": 1.3, "confidence": 0.9}],
 *   "loudness":   [{"t": 0.0, "value": -23.5}],
 *   "scene_cuts": [12.4, 30.0],
 *   "chapters":   [{"start": 0.0, "title": "Intro"}]   (absent or null = no chapters)
 * }
 *
 * Throws std::runtime_error on malformed JSON or wrongly typed fields.
 */
HighlightRequest read_request(std::istream& in);
HighlightRequest request_from_json(const Json::Value& root);

Json::Value result_to_json(const HighlightResult& result);
std::string write_json(const Json::Value& value);

}  // namespace cli
}  // namespace reelcut
