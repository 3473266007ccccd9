#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>

namespace archiver {

// Maps a note object from the API into a RemoteNote. Missing or wrong-typed
// keys fall back to their defaults; this never throws on payload shape.
RemoteNote parseRemoteNote(const nlohmann::json &note);

// Sum of the numeric values of a reactions mapping, 0 if it is not one.
int64_t sumReactions(const nlohmann::json &reactions);

} // namespace archiver
