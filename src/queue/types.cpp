#include "outbox/queue/types.hpp"
#include "outbox/queue/pass.hpp"

namespace outbox::queue {

const char* to_string(MediaKind kind) noexcept {
    switch (kind) {
        case MediaKind::Image: return "image";
        case MediaKind::Video: return "video";
    }
    return "image";
}

const char* to_string(ItemStatus status) noexcept {
    switch (status) {
        case ItemStatus::Pending: return "pending";
        case ItemStatus::Uploading: return "uploading";
        case ItemStatus::Completed: return "completed";
        case ItemStatus::Failed: return "failed";
    }
    return "pending";
}

std::optional<MediaKind> parse_media_kind(std::string_view text) noexcept {
    if (text == "image") return MediaKind::Image;
    if (text == "video") return MediaKind::Video;
    return std::nullopt;
}

std::optional<ItemStatus> parse_item_status(std::string_view text) noexcept {
    if (text == "pending") return ItemStatus::Pending;
    if (text == "uploading") return ItemStatus::Uploading;
    if (text == "completed") return ItemStatus::Completed;
    if (text == "failed") return ItemStatus::Failed;
    return std::nullopt;
}

const char* content_type(MediaKind kind) noexcept {
    return kind == MediaKind::Video ? "video/mp4" : "image/jpeg";
}

const char* file_extension(MediaKind kind) noexcept {
    return kind == MediaKind::Video ? "mp4" : "jpg";
}

const char* to_string(PassOutcome outcome) noexcept {
    switch (outcome) {
        case PassOutcome::Drained: return "drained";
        case PassOutcome::AlreadyRunning: return "already_running";
        case PassOutcome::QueueEmpty: return "queue_empty";
        case PassOutcome::ConfigurationMissing: return "configuration_missing";
        case PassOutcome::ServerUnavailable: return "server_unavailable";
        case PassOutcome::ConnectivityUnavailable: return "connectivity_unavailable";
        case PassOutcome::TransportNotAllowed: return "transport_not_allowed";
    }
    return "drained";
}

} // namespace outbox::queue
