/**
 * @file engine_types.cpp
 * @brief Engine configuration validation and counters
 */

#include "kcenon/media_transfer/engine/engine_types.h"

namespace kcenon::media_transfer {

auto validate_config(const engine_config& config) -> result<void> {
    if (config.lane_count == 0 || config.lane_count > engine_config::max_lane_count) {
        return unexpected(error{error_code::invalid_lane_count,
                                "Lane count must be between 1 and " +
                                    std::to_string(engine_config::max_lane_count)});
    }

    if (config.part_size < engine_config::min_part_size ||
        config.part_size > engine_config::max_part_size ||
        config.part_size % 1024 != 0) {
        return unexpected(error{error_code::invalid_part_size,
                                "Part size must be a multiple of 1KB between 1KB and 1MB"});
    }

    if (config.lane_pause.count() < 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "Lane pause must not be negative"});
    }

    return {};
}

// ============================================================================
// transfer_statistics
// ============================================================================

void transfer_statistics::record_part_uploaded(uint64_t bytes) {
    parts_uploaded_.fetch_add(1, std::memory_order_relaxed);
    bytes_uploaded_.fetch_add(bytes, std::memory_order_relaxed);
}

void transfer_statistics::record_file_uploaded() {
    files_uploaded_.fetch_add(1, std::memory_order_relaxed);
}

void transfer_statistics::record_part_downloaded(uint64_t bytes) {
    parts_downloaded_.fetch_add(1, std::memory_order_relaxed);
    bytes_downloaded_.fetch_add(bytes, std::memory_order_relaxed);
}

void transfer_statistics::record_file_downloaded() {
    files_downloaded_.fetch_add(1, std::memory_order_relaxed);
}

void transfer_statistics::record_stream_part(uint64_t bytes) {
    stream_parts_served_.fetch_add(1, std::memory_order_relaxed);
    bytes_downloaded_.fetch_add(bytes, std::memory_order_relaxed);
}

void transfer_statistics::record_reference_expired() {
    reference_expiries_.fetch_add(1, std::memory_order_relaxed);
}

void transfer_statistics::record_stream_retry() {
    stream_retries_.fetch_add(1, std::memory_order_relaxed);
}

void transfer_statistics::record_transport_failure() {
    transport_failures_.fetch_add(1, std::memory_order_relaxed);
}

auto transfer_statistics::snapshot() const -> engine_statistics {
    engine_statistics snap;
    snap.parts_uploaded = parts_uploaded_.load(std::memory_order_relaxed);
    snap.bytes_uploaded = bytes_uploaded_.load(std::memory_order_relaxed);
    snap.files_uploaded = files_uploaded_.load(std::memory_order_relaxed);
    snap.parts_downloaded = parts_downloaded_.load(std::memory_order_relaxed);
    snap.bytes_downloaded = bytes_downloaded_.load(std::memory_order_relaxed);
    snap.files_downloaded = files_downloaded_.load(std::memory_order_relaxed);
    snap.stream_parts_served = stream_parts_served_.load(std::memory_order_relaxed);
    snap.reference_expiries = reference_expiries_.load(std::memory_order_relaxed);
    snap.stream_retries = stream_retries_.load(std::memory_order_relaxed);
    snap.transport_failures = transport_failures_.load(std::memory_order_relaxed);
    return snap;
}

void transfer_statistics::reset() {
    parts_uploaded_ = 0;
    bytes_uploaded_ = 0;
    files_uploaded_ = 0;
    parts_downloaded_ = 0;
    bytes_downloaded_ = 0;
    files_downloaded_ = 0;
    stream_parts_served_ = 0;
    reference_expiries_ = 0;
    stream_retries_ = 0;
    transport_failures_ = 0;
}

}  // namespace kcenon::media_transfer
