/**
 * @file stream_accessor.cpp
 * @brief Implementation of stream range reads
 */

#include "kcenon/media_transfer/engine/stream_accessor.h"

#include <kcenon/media_transfer/core/file_key.h>
#include <kcenon/media_transfer/core/logging.h>

namespace kcenon::media_transfer {

stream_accessor::stream_accessor(transfer_registry& registry,
                                 std::shared_ptr<media_transport> transport,
                                 std::shared_ptr<message_service> messages,
                                 transfer_statistics& statistics,
                                 const engine_config& config)
    : registry_(registry),
      transport_(std::move(transport)),
      messages_(std::move(messages)),
      statistics_(statistics),
      config_(config) {
}

auto stream_accessor::stream_file(int64_t message_id, const file_location& location)
    -> std::string {
    const auto key = file_key_of(location);
    const auto owner = messages_->active_folder();

    streaming_file entry;
    if (auto existing = registry_.get_streaming_file(key)) {
        entry = std::move(*existing);
    } else {
        entry.id = location.id;
        entry.size = location.size;
        entry.type = location.type;
        entry.size_type = location.size_type;
        entry.original_size_type = location.original_size_type;
    }

    entry.file_reference = location.file_reference;
    entry.dc_id = location.dc_id;
    entry.access_hash = location.access_hash;
    entry.streaming = true;
    entry.folder = owner;
    entry.message_id = message_id;
    registry_.set_streaming_file(entry);

    transfer_log_context ctx;
    ctx.file_key = key;
    ctx.message_id = message_id;
    if (owner) {
        ctx.folder_id = owner->id;
    }
    MT_LOG_DEBUG_CTX(log_category::stream, "Streaming file registered", ctx);

    return config_.stream_url_prefix + key;
}

auto stream_accessor::get_streaming_file(const std::string& key) const
    -> std::optional<streaming_file> {
    return registry_.get_streaming_file(key);
}

auto stream_accessor::download_stream_file_part(const std::string& key,
                                                uint64_t offset,
                                                uint64_t part_size,
                                                std::optional<byte_buffer> file_reference)
    -> std::optional<byte_buffer> {
    return read_part(key, offset, part_size, std::move(file_reference), true);
}

auto stream_accessor::get_file_reference(int64_t folder_id,
                                         int64_t message_id,
                                         const std::string& media_id) const
    -> std::optional<byte_buffer> {
    auto found = messages_->find_message(folder_id, message_id);
    if (!found) {
        return std::nullopt;
    }

    if (found->primary_media && found->primary_media->id == media_id) {
        return found->primary_media->file_reference;
    }
    for (const auto& item : found->secondary_media) {
        if (item.id == media_id) {
            return item.file_reference;
        }
    }
    return std::nullopt;
}

auto stream_accessor::read_part(const std::string& key,
                                uint64_t offset,
                                uint64_t part_size,
                                std::optional<byte_buffer> file_reference,
                                bool allow_retry) -> std::optional<byte_buffer> {
    std::optional<streaming_file> entry;
    if (file_reference) {
        entry = registry_.update_streaming_file(key, [&file_reference](streaming_file& f) {
            f.file_reference = std::move(*file_reference);
        });
    } else {
        entry = registry_.get_streaming_file(key);
    }
    if (!entry) {
        return std::nullopt;
    }

    download_part_request request;
    request.id = entry->id;
    request.part_size = part_size;
    request.offset_size = offset;
    request.dc_id = entry->dc_id;
    request.access_hash = entry->access_hash;
    request.file_reference = entry->file_reference;
    request.size_type = entry->size_type;
    request.original_size_type = entry->original_size_type;
    request.precise = false;

    auto bytes = transport_->download_file_part(request);
    if (bytes) {
        statistics_.record_stream_part(bytes.value().size());
        return std::move(bytes).value();
    }

    transfer_log_context ctx;
    ctx.file_key = key;
    ctx.message_id = entry->message_id;
    ctx.error_message = bytes.error().message;

    if (!is_file_reference_expired(bytes.error())) {
        statistics_.record_transport_failure();
        MT_LOG_WARN_CTX(log_category::stream, "Stream read failed", ctx);
        return std::nullopt;
    }

    statistics_.record_reference_expired();
    if (!allow_retry) {
        MT_LOG_WARN_CTX(log_category::stream,
                        "File reference still expired after refresh", ctx);
        return std::nullopt;
    }
    if (!entry->folder || entry->message_id == 0) {
        MT_LOG_WARN_CTX(log_category::stream, "Stream has no owning message", ctx);
        return std::nullopt;
    }

    ctx.folder_id = entry->folder->id;
    auto refreshed = messages_->refresh_message(*entry->folder, entry->message_id,
                                                config_.stream_refresh_priority);
    if (!refreshed) {
        ctx.error_message = refreshed.error().message;
        MT_LOG_WARN_CTX(log_category::stream, "Message refresh failed", ctx);
        return std::nullopt;
    }

    auto fresh_reference = get_file_reference(entry->folder->id, entry->message_id, entry->id);
    if (!fresh_reference) {
        MT_LOG_WARN_CTX(log_category::stream, "Media not found after refresh", ctx);
        return std::nullopt;
    }

    statistics_.record_stream_retry();
    MT_LOG_DEBUG_CTX(log_category::stream, "Retrying stream read with refreshed reference",
                     ctx);
    return read_part(key, offset, part_size, std::move(fresh_reference), false);
}

}  // namespace kcenon::media_transfer
