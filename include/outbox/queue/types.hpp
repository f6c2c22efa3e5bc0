#pragma once

/**
 * @file types.hpp
 * @brief Records held by the upload queue and the upload history
 *
 * WHY THIS FILE EXISTS:
 * A QueueItem is work that still needs a future upload attempt. A
 * HistoryEntry is what the user sees about that upload, and it outlives the
 * QueueItem: once an item completes or fails for good it leaves the queue,
 * but its history entry stays until the history is cleared explicitly.
 *
 * STATE TRANSITIONS (QueueItem):
 * pending → uploading → completed        (removed from queue)
 *                     → pending (retry)  (retry_count + 1)
 *                     → failed           (removed from queue)
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace outbox::queue {

enum class MediaKind {
    Image,
    Video
};

enum class ItemStatus {
    Pending,
    Uploading,
    Completed,
    Failed
};

/**
 * @brief Text annotation drawn over the media by the capture editor
 *
 * Sent verbatim to the server; the queue never interprets it.
 */
struct TextOverlay {
    std::string id;
    std::string text;
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    double rotation = 0.0;
    double scale = 1.0;
    std::string color;
    double font_size = 0.0;
    std::string font_family;
};

struct QueueItem {
    std::string id;                          ///< Creation stamp in ms, as text
    std::string payload_ref;                 ///< Local path or file:// URI of the media bytes
    MediaKind media_kind = MediaKind::Image;
    std::vector<std::string> recipients;
    std::int64_t timestamp = 0;              ///< Creation time, ms since epoch
    ItemStatus status = ItemStatus::Pending;
    std::optional<std::uint32_t> retry_count; ///< Unset until the first drain pass sees the item
    std::vector<TextOverlay> overlays;
};

struct HistoryEntry {
    std::string id;
    std::int64_t timestamp = 0;
    MediaKind media_kind = MediaKind::Image;
    ItemStatus status = ItemStatus::Pending;
    std::optional<int> progress;             ///< 0-100, meaningful while uploading
    std::optional<std::string> error;        ///< Set on failure or pending retry
};

const char* to_string(MediaKind kind) noexcept;
const char* to_string(ItemStatus status) noexcept;

std::optional<MediaKind> parse_media_kind(std::string_view text) noexcept;
std::optional<ItemStatus> parse_item_status(std::string_view text) noexcept;

/// "image/jpeg" or "video/mp4"
const char* content_type(MediaKind kind) noexcept;

/// "jpg" or "mp4"
const char* file_extension(MediaKind kind) noexcept;

inline bool is_terminal(ItemStatus status) noexcept {
    return status == ItemStatus::Completed || status == ItemStatus::Failed;
}

} // namespace outbox::queue
