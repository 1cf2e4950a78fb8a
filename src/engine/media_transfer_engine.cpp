/**
 * @file media_transfer_engine.cpp
 * @brief Implementation of the media transfer engine facade
 */

#include "kcenon/media_transfer/engine/media_transfer_engine.h"

#include <kcenon/media_transfer/core/logging.h>
#include <kcenon/media_transfer/engine/download_scheduler.h>
#include <kcenon/media_transfer/engine/stream_accessor.h>
#include <kcenon/media_transfer/engine/upload_pipeline.h>

namespace kcenon::media_transfer {

struct media_transfer_engine::impl {
    engine_config config;
    transfer_registry registry;
    transfer_statistics statistics;

    upload_pipeline uploads;
    download_scheduler downloads;
    stream_accessor streams;

    impl(engine_config cfg,
         const std::shared_ptr<media_transport>& transport,
         const std::shared_ptr<part_store>& store,
         const std::shared_ptr<message_service>& messages)
        : config(std::move(cfg)),
          uploads(registry, transport, store, messages, statistics),
          downloads(registry, transport, store, messages, statistics, config),
          streams(registry, transport, messages, statistics, config) {
    }
};

// ============================================================================
// Builder implementation
// ============================================================================

media_transfer_engine::builder::builder() = default;

auto media_transfer_engine::builder::with_config(const engine_config& config) -> builder& {
    config_ = config;
    return *this;
}

auto media_transfer_engine::builder::with_lane_count(std::size_t count) -> builder& {
    config_.lane_count = count;
    return *this;
}

auto media_transfer_engine::builder::with_part_size(uint64_t size) -> builder& {
    config_.part_size = size;
    return *this;
}

auto media_transfer_engine::builder::with_lane_pause(std::chrono::milliseconds pause)
    -> builder& {
    config_.lane_pause = pause;
    return *this;
}

auto media_transfer_engine::builder::with_stream_url_prefix(std::string prefix) -> builder& {
    config_.stream_url_prefix = std::move(prefix);
    return *this;
}

auto media_transfer_engine::builder::with_transport(
    std::shared_ptr<media_transport> transport) -> builder& {
    transport_ = std::move(transport);
    return *this;
}

auto media_transfer_engine::builder::with_part_store(std::shared_ptr<part_store> store)
    -> builder& {
    store_ = std::move(store);
    return *this;
}

auto media_transfer_engine::builder::with_message_service(
    std::shared_ptr<message_service> messages) -> builder& {
    messages_ = std::move(messages);
    return *this;
}

auto media_transfer_engine::builder::build() -> result<media_transfer_engine> {
    if (auto valid = validate_config(config_); !valid) {
        return unexpected{valid.error()};
    }

    if (!transport_) {
        return unexpected{error{error_code::missing_collaborator, "Transport is required"}};
    }
    if (!store_) {
        return unexpected{error{error_code::missing_collaborator, "Part store is required"}};
    }
    if (!messages_) {
        return unexpected{error{error_code::missing_collaborator,
                                "Message service is required"}};
    }

    get_logger().initialize();
    MT_LOG_INFO(log_category::engine,
                "Media transfer engine created with " +
                    std::to_string(config_.lane_count) + " lanes, part size " +
                    std::to_string(config_.part_size));

    return media_transfer_engine(config_, transport_, store_, messages_);
}

// ============================================================================
// media_transfer_engine implementation
// ============================================================================

media_transfer_engine::media_transfer_engine(engine_config config,
                                             std::shared_ptr<media_transport> transport,
                                             std::shared_ptr<part_store> store,
                                             std::shared_ptr<message_service> messages)
    : impl_(std::make_unique<impl>(std::move(config), transport, store, messages)) {
}

media_transfer_engine::media_transfer_engine(media_transfer_engine&&) noexcept = default;
auto media_transfer_engine::operator=(media_transfer_engine&&) noexcept
    -> media_transfer_engine& = default;

media_transfer_engine::~media_transfer_engine() {
    if (impl_) {
        shutdown();
    }
}

auto media_transfer_engine::config() const -> const engine_config& {
    return impl_->config;
}

auto media_transfer_engine::registry() -> transfer_registry& {
    return impl_->registry;
}

auto media_transfer_engine::upload_files(const input_message& message,
                                         const folder& target,
                                         int64_t parent_id) -> std::optional<input_message> {
    return impl_->uploads.upload_files(message, target, parent_id);
}

auto media_transfer_engine::upload_file(const folder& target, const input_file& file)
    -> std::optional<uploaded_file> {
    return impl_->uploads.upload_file(target, file);
}

auto media_transfer_engine::is_uploading(int64_t folder_id, const std::string& file_key) const
    -> bool {
    return impl_->uploads.is_uploading(folder_id, file_key);
}

void media_transfer_engine::reset_uploading_files(const std::vector<input_file>& files) {
    impl_->uploads.reset_uploading_files(files);
}

auto media_transfer_engine::download_file(int64_t message_id, const file_location& location)
    -> std::optional<std::size_t> {
    return impl_->downloads.download_file(message_id, location);
}

auto media_transfer_engine::get_downloading_file(const file_location& location) const
    -> std::optional<downloading_file> {
    return impl_->downloads.get_downloading_file(location);
}

auto media_transfer_engine::pause_downloading_file(const file_location& location) -> bool {
    return impl_->downloads.pause_downloading_file(location);
}

auto media_transfer_engine::reset_downloading_file(const file_location& location) -> bool {
    return impl_->downloads.reset_downloading_file(location);
}

auto media_transfer_engine::wait_for_downloads(std::chrono::milliseconds timeout) -> bool {
    return impl_->downloads.wait_idle(timeout);
}

auto media_transfer_engine::pending_downloads() const -> std::size_t {
    return impl_->downloads.pending_tasks();
}

auto media_transfer_engine::stream_file(int64_t message_id, const file_location& location)
    -> std::string {
    return impl_->streams.stream_file(message_id, location);
}

auto media_transfer_engine::get_streaming_file(const std::string& key) const
    -> std::optional<streaming_file> {
    return impl_->streams.get_streaming_file(key);
}

auto media_transfer_engine::download_stream_file_part(const std::string& key,
                                                      uint64_t offset,
                                                      uint64_t part_size,
                                                      std::optional<byte_buffer> file_reference)
    -> std::optional<byte_buffer> {
    return impl_->streams.download_stream_file_part(key, offset, part_size,
                                                    std::move(file_reference));
}

auto media_transfer_engine::get_file_reference(int64_t folder_id,
                                               int64_t message_id,
                                               const std::string& media_id) const
    -> std::optional<byte_buffer> {
    return impl_->streams.get_file_reference(folder_id, message_id, media_id);
}

auto media_transfer_engine::statistics() const -> engine_statistics {
    return impl_->statistics.snapshot();
}

void media_transfer_engine::shutdown() {
    impl_->downloads.shutdown();
}

}  // namespace kcenon::media_transfer
