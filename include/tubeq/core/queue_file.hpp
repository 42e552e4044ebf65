// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tubeq/core/error.hpp>
#include <tubeq/core/queue_engine.hpp>
#include <nlohmann/json.hpp>
#include <expected>
#include <filesystem>
#include <vector>

namespace tubeq::core {

// Queue files are a JSON array of {"url": ..., "settings": {...}}.
// Option fields hold text as typed; numbers are accepted and stringified.

[[nodiscard]] nlohmann::json queue_item_to_json(const QueueItem& item);
[[nodiscard]] QueueItem queue_item_from_json(const nlohmann::json& j);

[[nodiscard]] std::expected<std::vector<QueueItem>, std::error_code>
load_queue_file(const std::filesystem::path& path) noexcept;

[[nodiscard]] std::error_code save_queue_file(const std::filesystem::path& path,
                                              const std::vector<QueueItem>& items) noexcept;

} // namespace tubeq::core
