#include "outbox/queue/codec.hpp"

#include <stdexcept>

namespace outbox::queue {
using json = nlohmann::json;

namespace {

MediaKind media_kind_from(const json& j) {
    const auto text = j.at("mediaType").get<std::string>();
    auto kind = parse_media_kind(text);
    if (!kind) {
        throw std::invalid_argument("unknown mediaType: " + text);
    }
    return *kind;
}

ItemStatus status_from(const json& j) {
    const auto text = j.at("status").get<std::string>();
    auto status = parse_item_status(text);
    if (!status) {
        throw std::invalid_argument("unknown status: " + text);
    }
    return *status;
}

// Older blobs may carry the id as a bare number.
std::string id_from(const json& j) {
    const auto& id = j.at("id");
    if (id.is_number_integer()) {
        return std::to_string(id.get<std::int64_t>());
    }
    return id.get<std::string>();
}

template<typename T>
Result<std::vector<T>> decode_array(const std::string& blob, const char* what) {
    try {
        const auto parsed = json::parse(blob);
        if (!parsed.is_array()) {
            return Fail<std::vector<T>>(ErrorCode::Parse, std::string(what) + " blob is not an array");
        }
        return Ok(parsed.get<std::vector<T>>());
    } catch (const json::exception& e) {
        return Fail<std::vector<T>>(ErrorCode::Parse, std::string(what) + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        return Fail<std::vector<T>>(ErrorCode::Parse, std::string(what) + ": " + e.what());
    }
}

} // namespace

void to_json(json& j, const TextOverlay& overlay) {
    j = json{
        {"id", overlay.id},
        {"text", overlay.text},
        {"position", {{"x", overlay.x}, {"y", overlay.y}}},
        {"size", {{"width", overlay.width}, {"height", overlay.height}}},
        {"rotation", overlay.rotation},
        {"scale", overlay.scale},
        {"color", overlay.color},
        {"fontSize", overlay.font_size},
        {"fontFamily", overlay.font_family},
    };
}

void from_json(const json& j, TextOverlay& overlay) {
    overlay.id = j.value("id", std::string{});
    overlay.text = j.value("text", std::string{});
    if (auto it = j.find("position"); it != j.end() && it->is_object()) {
        overlay.x = it->value("x", 0.0);
        overlay.y = it->value("y", 0.0);
    }
    if (auto it = j.find("size"); it != j.end() && it->is_object()) {
        overlay.width = it->value("width", 0.0);
        overlay.height = it->value("height", 0.0);
    }
    overlay.rotation = j.value("rotation", 0.0);
    overlay.scale = j.value("scale", 1.0);
    overlay.color = j.value("color", std::string{});
    overlay.font_size = j.value("fontSize", 0.0);
    overlay.font_family = j.value("fontFamily", std::string{});
}

void to_json(json& j, const QueueItem& item) {
    j = json{
        {"id", item.id},
        {"mediaUri", item.payload_ref},
        {"mediaType", to_string(item.media_kind)},
        {"recipientIds", item.recipients},
        {"timestamp", item.timestamp},
        {"status", to_string(item.status)},
    };
    if (item.retry_count) {
        j["retryCount"] = *item.retry_count;
    }
    if (!item.overlays.empty()) {
        j["textOverlays"] = item.overlays;
    }
}

void from_json(const json& j, QueueItem& item) {
    item.id = id_from(j);
    item.payload_ref = j.at("mediaUri").get<std::string>();
    item.media_kind = media_kind_from(j);
    item.recipients = j.value("recipientIds", std::vector<std::string>{});
    item.timestamp = j.at("timestamp").get<std::int64_t>();
    item.status = status_from(j);
    item.retry_count.reset();
    if (auto it = j.find("retryCount"); it != j.end() && !it->is_null()) {
        item.retry_count = it->get<std::uint32_t>();
    }
    item.overlays.clear();
    if (auto it = j.find("textOverlays"); it != j.end() && it->is_array()) {
        item.overlays = it->get<std::vector<TextOverlay>>();
    }
}

void to_json(json& j, const HistoryEntry& entry) {
    j = json{
        {"id", entry.id},
        {"timestamp", entry.timestamp},
        {"status", to_string(entry.status)},
        {"mediaType", to_string(entry.media_kind)},
    };
    if (entry.progress) {
        j["progress"] = *entry.progress;
    }
    if (entry.error) {
        j["error"] = *entry.error;
    }
}

void from_json(const json& j, HistoryEntry& entry) {
    entry.id = id_from(j);
    entry.timestamp = j.at("timestamp").get<std::int64_t>();
    entry.status = status_from(j);
    entry.media_kind = media_kind_from(j);
    entry.progress.reset();
    if (auto it = j.find("progress"); it != j.end() && it->is_number()) {
        entry.progress = it->get<int>();
    }
    entry.error.reset();
    if (auto it = j.find("error"); it != j.end() && it->is_string()) {
        entry.error = it->get<std::string>();
    }
}

std::string encode_queue(const std::vector<QueueItem>& items) {
    return json(items).dump();
}

Result<std::vector<QueueItem>> decode_queue(const std::string& blob) {
    return decode_array<QueueItem>(blob, "upload queue");
}

std::string encode_history(const std::vector<HistoryEntry>& entries) {
    return json(entries).dump();
}

Result<std::vector<HistoryEntry>> decode_history(const std::string& blob) {
    return decode_array<HistoryEntry>(blob, "upload history");
}

Result<std::vector<TextOverlay>> decode_overlays(const std::string& text) {
    return decode_array<TextOverlay>(text, "text overlays");
}

} // namespace outbox::queue
