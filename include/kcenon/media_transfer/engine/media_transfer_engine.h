/**
 * @file media_transfer_engine.h
 * @brief Facade owning the transfer registry and the transfer components
 */

#ifndef KCENON_MEDIA_TRANSFER_ENGINE_MEDIA_TRANSFER_ENGINE_H
#define KCENON_MEDIA_TRANSFER_ENGINE_MEDIA_TRANSFER_ENGINE_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/media_transfer/core/media_types.h"
#include "kcenon/media_transfer/core/transfer_registry.h"
#include "kcenon/media_transfer/core/types.h"
#include "kcenon/media_transfer/engine/engine_types.h"
#include "kcenon/media_transfer/messages/message_service.h"
#include "kcenon/media_transfer/storage/part_store.h"
#include "kcenon/media_transfer/transport/media_transport.h"

namespace kcenon::media_transfer {

/**
 * @brief Media transfer engine
 *
 * Owns one transfer registry shared by the upload pipeline, the download
 * scheduler and the stream accessor. All transfer state lives and dies
 * with the engine object.
 *
 * @code
 * auto engine = media_transfer_engine::builder()
 *     .with_transport(transport)
 *     .with_part_store(store)
 *     .with_message_service(messages)
 *     .with_lane_count(4)
 *     .build();
 *
 * if (engine) {
 *     engine->download_file(message_id, location);
 * }
 * @endcode
 */
class media_transfer_engine {
public:
    /**
     * @brief Builder for media_transfer_engine
     */
    class builder {
    public:
        builder();

        /**
         * @brief Replace the whole configuration
         */
        auto with_config(const engine_config& config) -> builder&;

        /**
         * @brief Set number of download lanes
         * @param count Lane count (default: 4)
         * @return Reference to builder for chaining
         */
        auto with_lane_count(std::size_t count) -> builder&;

        /**
         * @brief Set download part size
         * @param size Part size in bytes (default: 512KB)
         * @return Reference to builder for chaining
         */
        auto with_part_size(uint64_t size) -> builder&;

        /**
         * @brief Set pause after each download task
         * @param pause Pause duration (default: 400ms)
         * @return Reference to builder for chaining
         */
        auto with_lane_pause(std::chrono::milliseconds pause) -> builder&;

        /**
         * @brief Set prefix of stream locators returned by stream_file()
         */
        auto with_stream_url_prefix(std::string prefix) -> builder&;

        auto with_transport(std::shared_ptr<media_transport> transport) -> builder&;
        auto with_part_store(std::shared_ptr<part_store> store) -> builder&;
        auto with_message_service(std::shared_ptr<message_service> messages) -> builder&;

        /**
         * @brief Build the engine instance
         * @return Result containing the engine or an error
         */
        [[nodiscard]] auto build() -> result<media_transfer_engine>;

    private:
        engine_config config_;
        std::shared_ptr<media_transport> transport_;
        std::shared_ptr<part_store> store_;
        std::shared_ptr<message_service> messages_;
    };

    // Non-copyable, movable
    media_transfer_engine(const media_transfer_engine&) = delete;
    auto operator=(const media_transfer_engine&) -> media_transfer_engine& = delete;
    media_transfer_engine(media_transfer_engine&&) noexcept;
    auto operator=(media_transfer_engine&&) noexcept -> media_transfer_engine&;
    ~media_transfer_engine();

    [[nodiscard]] auto config() const -> const engine_config&;

    /**
     * @brief Registry holding downloading, streaming and sending state
     */
    [[nodiscard]] auto registry() -> transfer_registry&;

    // ========================================================================
    // Uploads
    // ========================================================================

    auto upload_files(const input_message& message, const folder& target, int64_t parent_id)
        -> std::optional<input_message>;

    auto upload_file(const folder& target, const input_file& file)
        -> std::optional<uploaded_file>;

    [[nodiscard]] auto is_uploading(int64_t folder_id, const std::string& file_key) const
        -> bool;

    void reset_uploading_files(const std::vector<input_file>& files);

    // ========================================================================
    // Downloads
    // ========================================================================

    auto download_file(int64_t message_id, const file_location& location)
        -> std::optional<std::size_t>;

    [[nodiscard]] auto get_downloading_file(const file_location& location) const
        -> std::optional<downloading_file>;

    auto pause_downloading_file(const file_location& location) -> bool;

    auto reset_downloading_file(const file_location& location) -> bool;

    /**
     * @brief Block until all queued downloads finished
     */
    auto wait_for_downloads(std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto pending_downloads() const -> std::size_t;

    // ========================================================================
    // Streaming
    // ========================================================================

    auto stream_file(int64_t message_id, const file_location& location) -> std::string;

    [[nodiscard]] auto get_streaming_file(const std::string& key) const
        -> std::optional<streaming_file>;

    auto download_stream_file_part(const std::string& key,
                                   uint64_t offset,
                                   uint64_t part_size,
                                   std::optional<byte_buffer> file_reference = std::nullopt)
        -> std::optional<byte_buffer>;

    [[nodiscard]] auto get_file_reference(int64_t folder_id,
                                          int64_t message_id,
                                          const std::string& media_id) const
        -> std::optional<byte_buffer>;

    // ========================================================================
    // Statistics and lifecycle
    // ========================================================================

    [[nodiscard]] auto statistics() const -> engine_statistics;

    /**
     * @brief Stop download lanes; queued downloads are skipped
     */
    void shutdown();

private:
    media_transfer_engine(engine_config config,
                          std::shared_ptr<media_transport> transport,
                          std::shared_ptr<part_store> store,
                          std::shared_ptr<message_service> messages);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::media_transfer

#endif  // KCENON_MEDIA_TRANSFER_ENGINE_MEDIA_TRANSFER_ENGINE_H
