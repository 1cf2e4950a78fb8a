/**
 * @file download_scheduler.h
 * @brief Lane-based scheduler for resumable part downloads
 *
 * The scheduler owns a fixed number of sequential lanes. Every accepted
 * request is appended to the next lane in round-robin order, regardless of
 * how busy that lane is. Because each lane runs one task at a time, at most
 * lane_count() part fetches are in flight across all downloads.
 */

#ifndef KCENON_MEDIA_TRANSFER_ENGINE_DOWNLOAD_SCHEDULER_H
#define KCENON_MEDIA_TRANSFER_ENGINE_DOWNLOAD_SCHEDULER_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "kcenon/media_transfer/core/media_types.h"
#include "kcenon/media_transfer/core/transfer_registry.h"
#include "kcenon/media_transfer/engine/engine_types.h"
#include "kcenon/media_transfer/messages/message_service.h"
#include "kcenon/media_transfer/storage/part_store.h"
#include "kcenon/media_transfer/transport/media_transport.h"

namespace kcenon::media_transfer {

/**
 * @brief Queued, resumable, cancellable downloads
 *
 * A download task resumes from last_part + 1 and re-reads the registry
 * entry before every part, so a pause or reset is observed before the next
 * part is requested. Parts are appended to the part store; the last part
 * assembles the artifact and marks the entry complete.
 *
 * On "FILE_REFERENCE_EXPIRED" the download is paused without advancing
 * last_part and the owning message is refreshed. It is not resumed
 * automatically: a new download_file() call continues from last_part + 1.
 * Any other failure also pauses the download so a later call can resume it.
 *
 * @code
 * download_scheduler scheduler(registry, transport, store, messages, stats);
 * auto lane = scheduler.download_file(message_id, location);
 * scheduler.wait_idle(std::chrono::seconds(5));
 * auto entry = scheduler.get_downloading_file(location);
 * @endcode
 *
 * @note Registry listeners run on lane threads and must not call back into
 *       the scheduler synchronously.
 */
class download_scheduler {
public:
    download_scheduler(transfer_registry& registry,
                       std::shared_ptr<media_transport> transport,
                       std::shared_ptr<part_store> store,
                       std::shared_ptr<message_service> messages,
                       transfer_statistics& statistics,
                       const engine_config& config = {});
    ~download_scheduler();

    download_scheduler(const download_scheduler&) = delete;
    auto operator=(const download_scheduler&) -> download_scheduler& = delete;

    /**
     * @brief Request a download
     * @param message_id Message that owns the file, used to refresh references
     * @param location Identity and locators of the file
     * @return Lane the request was queued on, or nullopt if the request was
     *         a no-op (already complete, already downloading, empty file)
     *
     * Never blocks on the transfer itself.
     */
    auto download_file(int64_t message_id, const file_location& location)
        -> std::optional<std::size_t>;

    [[nodiscard]] auto get_downloading_file(const file_location& location) const
        -> std::optional<downloading_file>;

    /**
     * @brief Stop fetching further parts of a download
     * @return true if the download was running and is now paused
     */
    auto pause_downloading_file(const file_location& location) -> bool;

    /**
     * @brief Forget a download and its accumulated bytes
     * @return true if an entry existed
     */
    auto reset_downloading_file(const file_location& location) -> bool;

    /**
     * @brief Lane the next accepted request will be queued on
     */
    [[nodiscard]] auto next_lane() const -> std::size_t;

    [[nodiscard]] auto lane_count() const -> std::size_t;

    /**
     * @brief Tasks queued or running across all lanes
     */
    [[nodiscard]] auto pending_tasks() const -> std::size_t;

    /**
     * @brief Block until every lane is idle
     * @return true if all lanes became idle before the timeout
     */
    auto wait_idle(std::chrono::milliseconds timeout) -> bool;

    /**
     * @brief Stop all lanes; queued tasks are skipped
     */
    void shutdown();

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::media_transfer

#endif  // KCENON_MEDIA_TRANSFER_ENGINE_DOWNLOAD_SCHEDULER_H
