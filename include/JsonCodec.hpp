#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>

namespace archiver {

// JSON shapes of the records exposed by the HTTP API and the CLI. Keys are
// snake_case to match the database columns.
void to_json(nlohmann::json &j, const PostRecord &post);
void to_json(nlohmann::json &j, const MediaRecord &media);
void to_json(nlohmann::json &j, const PostSummary &summary);
void to_json(nlohmann::json &j, const ArchiveOutcome &outcome);
void to_json(nlohmann::json &j, const UserArchiveResult &result);
void to_json(nlohmann::json &j, const BackfillResult &result);
void to_json(nlohmann::json &j, const ArchiveJobState &state);
void to_json(nlohmann::json &j, const BackfillJobState &state);
void to_json(nlohmann::json &j, const BackfillStartResult &start);

} // namespace archiver
