/**
 * @file engine_types.h
 * @brief Configuration and statistics types for the media transfer engine
 */

#ifndef KCENON_MEDIA_TRANSFER_ENGINE_ENGINE_TYPES_H
#define KCENON_MEDIA_TRANSFER_ENGINE_ENGINE_TYPES_H

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "kcenon/media_transfer/core/types.h"

namespace kcenon::media_transfer {

/**
 * @brief Engine configuration
 */
struct engine_config {
    static constexpr uint64_t default_part_size = 512 * 1024;  // 512KB
    static constexpr std::size_t default_lane_count = 4;
    static constexpr std::chrono::milliseconds default_lane_pause{400};

    static constexpr uint64_t min_part_size = 1024;
    static constexpr uint64_t max_part_size = 1024 * 1024;
    static constexpr std::size_t max_lane_count = 64;

    uint64_t part_size = default_part_size;          ///< Download part size
    std::size_t lane_count = default_lane_count;     ///< Concurrent download lanes
    std::chrono::milliseconds lane_pause = default_lane_pause;  ///< Pause after each lane task
    std::string stream_url_prefix = "stream://";     ///< Prefix of stream locators
    int download_refresh_priority = 1;               ///< Priority of refreshes after expiry
    int stream_refresh_priority = 0;                 ///< Priority of refreshes for stream reads
};

/**
 * @brief Validate an engine configuration
 *
 * Part size must be a multiple of 1KB within [1KB, 1MB]. Lane count must be
 * within [1, 64].
 */
[[nodiscard]] auto validate_config(const engine_config& config) -> result<void>;

/**
 * @brief Snapshot of engine counters
 */
struct engine_statistics {
    uint64_t parts_uploaded = 0;
    uint64_t bytes_uploaded = 0;
    uint64_t files_uploaded = 0;
    uint64_t parts_downloaded = 0;
    uint64_t bytes_downloaded = 0;
    uint64_t files_downloaded = 0;
    uint64_t stream_parts_served = 0;
    uint64_t reference_expiries = 0;
    uint64_t stream_retries = 0;
    uint64_t transport_failures = 0;
};

/**
 * @brief Thread-safe counters shared by the engine components
 *
 * @code
 * transfer_statistics stats;
 * stats.record_part_downloaded(bytes.size());
 * auto snap = stats.snapshot();
 * @endcode
 */
class transfer_statistics {
public:
    transfer_statistics() = default;

    transfer_statistics(const transfer_statistics&) = delete;
    auto operator=(const transfer_statistics&) -> transfer_statistics& = delete;

    void record_part_uploaded(uint64_t bytes);
    void record_file_uploaded();
    void record_part_downloaded(uint64_t bytes);
    void record_file_downloaded();
    void record_stream_part(uint64_t bytes);
    void record_reference_expired();
    void record_stream_retry();
    void record_transport_failure();

    [[nodiscard]] auto snapshot() const -> engine_statistics;

    void reset();

private:
    std::atomic<uint64_t> parts_uploaded_{0};
    std::atomic<uint64_t> bytes_uploaded_{0};
    std::atomic<uint64_t> files_uploaded_{0};
    std::atomic<uint64_t> parts_downloaded_{0};
    std::atomic<uint64_t> bytes_downloaded_{0};
    std::atomic<uint64_t> files_downloaded_{0};
    std::atomic<uint64_t> stream_parts_served_{0};
    std::atomic<uint64_t> reference_expiries_{0};
    std::atomic<uint64_t> stream_retries_{0};
    std::atomic<uint64_t> transport_failures_{0};
};

}  // namespace kcenon::media_transfer

#endif  // KCENON_MEDIA_TRANSFER_ENGINE_ENGINE_TYPES_H
