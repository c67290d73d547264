#pragma once

#include <nlohmann/json.hpp>

#include "harvest_core/db/models/log_dto.hpp"
#include "harvest_core/db/models/queue_item_dto.hpp"
#include "harvest_core/db/models/task_dto.hpp"
#include "harvest_core/scheduler/queue_status.hpp"

namespace harvest_api {

// Wire shapes shared by the HTTP responses. Timestamps use the store's
// "YYYY-MM-DD HH:MM:SS.mmm" UTC format; absent optionals become null.
nlohmann::json task_to_json(const harvest_core::TaskDTO& task);
nlohmann::json log_to_json(const harvest_core::LogDTO& log);
nlohmann::json queue_item_to_json(const harvest_core::QueueItemDTO& item);
nlohmann::json stats_to_json(const harvest_core::QueueStats& stats);
nlohmann::json snapshot_to_json(const harvest_core::QueueStatusSnapshot& snapshot);

}  // namespace harvest_api
