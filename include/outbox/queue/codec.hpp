#pragma once

/**
 * @file codec.hpp
 * @brief JSON layout of the persisted queue and history blobs
 *
 * Queue blob:   [{id, mediaUri, mediaType, recipientIds, timestamp, status,
 *                 retryCount?, textOverlays?}, ...]
 * History blob: [{id, timestamp, status, error?, progress?, mediaType}, ...]
 * Overlay:      {id, text, position:{x,y}, size:{width,height}, rotation,
 *                scale, color, fontSize, fontFamily}
 *
 * Optional fields are omitted rather than written as null.
 */

#include "outbox/core/result.hpp"
#include "outbox/queue/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace outbox::queue {

void to_json(nlohmann::json& j, const TextOverlay& overlay);
void from_json(const nlohmann::json& j, TextOverlay& overlay);

void to_json(nlohmann::json& j, const QueueItem& item);
void from_json(const nlohmann::json& j, QueueItem& item);

void to_json(nlohmann::json& j, const HistoryEntry& entry);
void from_json(const nlohmann::json& j, HistoryEntry& entry);

std::string encode_queue(const std::vector<QueueItem>& items);
Result<std::vector<QueueItem>> decode_queue(const std::string& blob);

std::string encode_history(const std::vector<HistoryEntry>& entries);
Result<std::vector<HistoryEntry>> decode_history(const std::string& blob);

/// Parses a JSON array of overlays (the CLI's --overlays file).
Result<std::vector<TextOverlay>> decode_overlays(const std::string& text);

} // namespace outbox::queue
