/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_MEDIA_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_MEDIA_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H

#include <kcenon/media_transfer/messages/message_service.h>
#include <kcenon/media_transfer/transport/media_transport.h>

#include <cstddef>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace kcenon::media_transfer::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     * @return Vector of random bytes
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0) -> byte_buffer;
};

/**
 * @brief Transport serving in-memory remote files without latency
 */
class loopback_transport : public media_transport {
public:
    void add_remote_file(const std::string& id, byte_buffer content);

    auto prepare_uploading_file(const file_meta& meta) -> result<upload_file_params> override;
    auto upload_file_part(const byte_buffer& bytes,
                          const upload_file_params& params,
                          int64_t part) -> result<void> override;
    auto download_file_part(const download_part_request& request)
        -> result<byte_buffer> override;

private:
    std::mutex mutex_;
    std::map<std::string, byte_buffer> remote_files_;
};

/**
 * @brief Message service with no folders and no messages
 */
class quiet_message_service : public message_service {
public:
    auto active_folder() const -> std::optional<folder> override;
    auto refresh_message(const folder& target, int64_t message_id, int priority)
        -> result<void> override;
    auto find_message(int64_t folder_id, int64_t message_id) const
        -> std::optional<message> override;
    auto create_message(const outgoing_message& outgoing, const folder& target, bool final)
        -> result<void> override;
};

/**
 * @brief Format bytes as human-readable string
 * @param bytes Number of bytes
 * @return Formatted string (e.g., "1.5 MB")
 */
auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 100 * KB;    // 100 KB
constexpr std::size_t medium_file = 4 * MB;     // 4 MB
constexpr std::size_t large_file = 32 * MB;     // 32 MB

// Part sizes accepted by the engine
constexpr std::size_t min_part = 1 * KB;        // 1 KB
constexpr std::size_t default_part = 512 * KB;  // 512 KB
constexpr std::size_t max_part = 1 * MB;        // 1 MB
}  // namespace sizes

}  // namespace kcenon::media_transfer::benchmark

#endif  // KCENON_MEDIA_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
