/**
 * @file stream_accessor.h
 * @brief On-demand range reads for progressive playback
 */

#ifndef KCENON_MEDIA_TRANSFER_ENGINE_STREAM_ACCESSOR_H
#define KCENON_MEDIA_TRANSFER_ENGINE_STREAM_ACCESSOR_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "kcenon/media_transfer/core/media_types.h"
#include "kcenon/media_transfer/core/transfer_registry.h"
#include "kcenon/media_transfer/engine/engine_types.h"
#include "kcenon/media_transfer/messages/message_service.h"
#include "kcenon/media_transfer/transport/media_transport.h"

namespace kcenon::media_transfer {

/**
 * @brief Serves arbitrary byte ranges of a streamed file
 *
 * Reads bypass the download scheduler and run on the caller's thread.
 * When a read fails with "FILE_REFERENCE_EXPIRED", the owning message is
 * refreshed and the same read is retried exactly once with the refreshed
 * reference. Queued downloads pause instead; the asymmetry is deliberate.
 *
 * @code
 * auto url = accessor.stream_file(message_id, location);
 * auto key = make_file_key(location.id, location.size, location.size_type);
 * auto bytes = accessor.download_stream_file_part(key, 0, 512 * 1024);
 * @endcode
 */
class stream_accessor {
public:
    stream_accessor(transfer_registry& registry,
                    std::shared_ptr<media_transport> transport,
                    std::shared_ptr<message_service> messages,
                    transfer_statistics& statistics,
                    const engine_config& config = {});

    stream_accessor(const stream_accessor&) = delete;
    auto operator=(const stream_accessor&) -> stream_accessor& = delete;

    /**
     * @brief Register a file for streaming
     * @param message_id Message that owns the file
     * @param location Identity and locators of the file
     * @return Stream locator: configured prefix followed by the file key
     *
     * Creates the streaming entry on first use; later calls refresh its
     * locators and owner.
     */
    auto stream_file(int64_t message_id, const file_location& location) -> std::string;

    [[nodiscard]] auto get_streaming_file(const std::string& key) const
        -> std::optional<streaming_file>;

    /**
     * @brief Read bytes [offset, offset + part_size) of a streamed file
     * @param key File key of a registered streaming entry
     * @param offset Byte offset of the range
     * @param part_size Length of the range
     * @param file_reference Fresh reference to store before reading
     * @return Part bytes, or nullopt if the range cannot be served now
     *
     * The server may return a slightly larger aligned range.
     */
    auto download_stream_file_part(const std::string& key,
                                   uint64_t offset,
                                   uint64_t part_size,
                                   std::optional<byte_buffer> file_reference = std::nullopt)
        -> std::optional<byte_buffer>;

    /**
     * @brief Current reference of a media in a message
     *
     * Scans the primary media and then the secondary media of the message.
     */
    [[nodiscard]] auto get_file_reference(int64_t folder_id,
                                          int64_t message_id,
                                          const std::string& media_id) const
        -> std::optional<byte_buffer>;

private:
    auto read_part(const std::string& key,
                   uint64_t offset,
                   uint64_t part_size,
                   std::optional<byte_buffer> file_reference,
                   bool allow_retry) -> std::optional<byte_buffer>;

    transfer_registry& registry_;
    std::shared_ptr<media_transport> transport_;
    std::shared_ptr<message_service> messages_;
    transfer_statistics& statistics_;
    engine_config config_;
};

}  // namespace kcenon::media_transfer

#endif  // KCENON_MEDIA_TRANSFER_ENGINE_STREAM_ACCESSOR_H
