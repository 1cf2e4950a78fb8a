/**
 * @file download_scheduler.cpp
 * @brief Implementation of the lane-based download scheduler
 */

#include "kcenon/media_transfer/engine/download_scheduler.h"

#include <kcenon/media_transfer/adapters/thread_pool_adapter.h>
#include <kcenon/media_transfer/core/file_key.h>
#include <kcenon/media_transfer/core/logging.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace kcenon::media_transfer {

namespace {

/**
 * @brief State of one queued or running download task
 *
 * A run is cancelled by reset_downloading_file(). Once cancelled it never
 * writes to the registry or the part store again.
 */
struct download_run {
    std::size_t lane = 0;
    std::mutex commit_mutex;
    bool cancelled = false;
};

auto make_downloading_file(const file_location& location) -> downloading_file {
    downloading_file file;
    file.id = location.id;
    file.size = location.size;
    file.type = location.type;
    file.dc_id = location.dc_id;
    file.access_hash = location.access_hash;
    file.file_reference = location.file_reference;
    file.size_type = location.size_type;
    file.original_size_type = location.original_size_type;
    return file;
}

auto make_part_request(const downloading_file& file, int64_t part) -> download_part_request {
    download_part_request request;
    request.id = file.id;
    request.part_size = file.part_size;
    request.offset_size = static_cast<uint64_t>(part) * file.part_size;
    request.dc_id = file.dc_id;
    request.access_hash = file.access_hash;
    request.file_reference = file.file_reference;
    request.size_type = file.size_type;
    request.original_size_type = file.original_size_type;
    return request;
}

}  // namespace

struct download_scheduler::impl {
    transfer_registry& registry;
    std::shared_ptr<media_transport> transport;
    std::shared_ptr<part_store> store;
    std::shared_ptr<message_service> messages;
    transfer_statistics& statistics;
    engine_config config;

    // Guards active runs and lane assignment
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<download_run>> active;
    std::size_t next_lane = 0;

    std::atomic<bool> stopping{false};
    std::mutex stop_mutex;
    std::condition_variable stop_cv;

    std::vector<std::unique_ptr<adapters::task_lane_interface>> lanes;

    impl(transfer_registry& reg,
         std::shared_ptr<media_transport> tr,
         std::shared_ptr<part_store> ps,
         std::shared_ptr<message_service> ms,
         transfer_statistics& stats,
         const engine_config& cfg)
        : registry(reg),
          transport(std::move(tr)),
          store(std::move(ps)),
          messages(std::move(ms)),
          statistics(stats),
          config(cfg) {
        lanes.reserve(config.lane_count);
        for (std::size_t i = 0; i < config.lane_count; ++i) {
            lanes.push_back(adapters::task_lane_factory::create(
                "download_lane_" + std::to_string(i)));
        }
    }

    /// Caller must hold mutex
    void release_run(const std::string& key, const std::shared_ptr<download_run>& run) {
        auto it = active.find(key);
        if (it != active.end() && it->second == run) {
            active.erase(it);
        }
    }

    /// Pause the entry (unless the run was cancelled) and end the run
    void stop_run(const std::string& key, const std::shared_ptr<download_run>& run) {
        std::lock_guard lock(mutex);
        if (!run->cancelled) {
            registry.update_downloading_file(key, [](downloading_file& f) {
                f.downloading = false;
            });
        }
        release_run(key, run);
    }

    /**
     * @brief Latest entry if the run should fetch another part
     *
     * Ends the run when the entry was removed, paused or completed, or
     * when the scheduler is stopping.
     */
    auto next_part_entry(const std::string& key, const std::shared_ptr<download_run>& run)
        -> std::optional<downloading_file> {
        std::lock_guard lock(mutex);
        auto entry = registry.get_downloading_file(key);
        if (stopping || run->cancelled || !entry || !entry->downloading ||
            entry->is_complete()) {
            release_run(key, run);
            return std::nullopt;
        }

        if (entry->last_part + 1 >= entry->parts_count) {
            MT_LOG_WARN(log_category::download,
                        "All parts fetched but artifact missing, pausing " + key);
            registry.update_downloading_file(key, [](downloading_file& f) {
                f.downloading = false;
            });
            release_run(key, run);
            return std::nullopt;
        }
        return entry;
    }

    void pause_lane() {
        if (config.lane_pause.count() <= 0) {
            return;
        }
        std::unique_lock lock(stop_mutex);
        stop_cv.wait_for(lock, config.lane_pause, [this] { return stopping.load(); });
    }

    enum class commit_outcome { stored, failed, orphaned };

    /**
     * @brief Store a fetched part, assemble on the last part, advance the entry
     *
     * The part is written at part * part_size, so a part fetched again after
     * a failed commit replaces its earlier bytes. Releases the part buffer
     * once the store has taken the bytes.
     */
    auto commit_part(const std::string& key,
                     const downloading_file& entry,
                     int64_t part,
                     byte_buffer& bytes,
                     transfer_log_context& ctx) -> commit_outcome {
        const uint64_t offset = static_cast<uint64_t>(part) * entry.part_size;
        auto added = store->add_bytes(key, offset, bytes);
        byte_buffer().swap(bytes);
        if (!added) {
            ctx.error_message = added.error().message;
            MT_LOG_ERROR_CTX(log_category::download, "Failed to store part", ctx);
            return commit_outcome::failed;
        }

        std::optional<std::string> artifact;
        if (part == entry.parts_count - 1) {
            artifact = store->transfer_bytes_to_file(
                key, resolve_download_mime(entry.type, entry.size_type));
            if (!artifact) {
                ctx.error_message = "assemble failed";
                MT_LOG_ERROR_CTX(log_category::download,
                                 "Failed to assemble downloaded file", ctx);
                return commit_outcome::failed;
            }
        }

        const auto progress = calculate_progress(part, entry.parts_count);
        auto stored = registry.update_downloading_file(key, [&](downloading_file& f) {
            f.last_part = part;
            f.progress = progress;
            if (artifact) {
                f.file_key = artifact;
                f.downloading = false;
            }
        });

        if (!stored) {
            // Entry erased directly in the registry; drop the orphaned bytes
            store->delete_file(key);
            return commit_outcome::orphaned;
        }
        return commit_outcome::stored;
    }

    void run_download(const std::string& key,
                      const std::shared_ptr<download_run>& run,
                      int64_t message_id,
                      const std::optional<folder>& owner);

    void handle_failure(const std::string& key,
                        const std::shared_ptr<download_run>& run,
                        const error& err,
                        int64_t part,
                        int64_t message_id,
                        const std::optional<folder>& owner);
};

void download_scheduler::impl::run_download(const std::string& key,
                                            const std::shared_ptr<download_run>& run,
                                            int64_t message_id,
                                            const std::optional<folder>& owner) {
    transfer_log_context ctx;
    ctx.file_key = key;
    ctx.lane = run->lane;
    ctx.message_id = message_id;
    MT_LOG_DEBUG_CTX(log_category::download, "Download task started", ctx);

    for (;;) {
        auto entry = next_part_entry(key, run);
        if (!entry) {
            return;
        }

        const int64_t part = entry->last_part + 1;
        const bool is_last_part = part == entry->parts_count - 1;

        auto fetched = transport->download_file_part(make_part_request(*entry, part));
        if (!fetched) {
            handle_failure(key, run, fetched.error(), part, message_id, owner);
            return;
        }

        byte_buffer bytes = std::move(fetched).value();
        const uint64_t received = bytes.size();
        ctx.part_index = part;

        // Lock order is mutex before commit_mutex
        commit_outcome outcome = commit_outcome::stored;
        {
            std::lock_guard commit(run->commit_mutex);
            if (run->cancelled) {
                return;
            }
            outcome = commit_part(key, *entry, part, bytes, ctx);
        }

        if (outcome == commit_outcome::failed) {
            stop_run(key, run);
            return;
        }
        if (outcome == commit_outcome::orphaned) {
            std::lock_guard lock(mutex);
            release_run(key, run);
            return;
        }

        statistics.record_part_downloaded(received);
        ctx.parts_count = entry->parts_count;
        ctx.bytes = received;
        MT_LOG_TRACE(log_category::download,
                     "Part " + std::to_string(part) + " stored for " + key);

        if (is_last_part) {
            statistics.record_file_downloaded();
            ctx.progress = 100;
            MT_LOG_INFO_CTX(log_category::download, "Download completed", ctx);
            std::lock_guard lock(mutex);
            release_run(key, run);
            return;
        }
    }
}

void download_scheduler::impl::handle_failure(const std::string& key,
                                              const std::shared_ptr<download_run>& run,
                                              const error& err,
                                              int64_t part,
                                              int64_t message_id,
                                              const std::optional<folder>& owner) {
    transfer_log_context ctx;
    ctx.file_key = key;
    ctx.lane = run->lane;
    ctx.part_index = part;
    ctx.message_id = message_id;
    ctx.error_message = err.message;

    stop_run(key, run);

    if (!is_file_reference_expired(err)) {
        statistics.record_transport_failure();
        MT_LOG_WARN_CTX(log_category::download, "Part request failed, download paused", ctx);
        return;
    }

    statistics.record_reference_expired();
    MT_LOG_INFO_CTX(log_category::download,
                    "File reference expired, download paused", ctx);

    if (!owner) {
        MT_LOG_WARN_CTX(log_category::download,
                        "No folder to refresh the message in", ctx);
        return;
    }

    ctx.folder_id = owner->id;
    auto refreshed = messages->refresh_message(*owner, message_id,
                                               config.download_refresh_priority);
    if (!refreshed) {
        ctx.error_message = refreshed.error().message;
        MT_LOG_WARN_CTX(log_category::download, "Message refresh failed", ctx);
    }
}

// ============================================================================
// download_scheduler
// ============================================================================

download_scheduler::download_scheduler(transfer_registry& registry,
                                       std::shared_ptr<media_transport> transport,
                                       std::shared_ptr<part_store> store,
                                       std::shared_ptr<message_service> messages,
                                       transfer_statistics& statistics,
                                       const engine_config& config)
    : impl_(std::make_unique<impl>(registry, std::move(transport), std::move(store),
                                   std::move(messages), statistics, config)) {
    MT_LOG_DEBUG(log_category::scheduler,
                 "Download scheduler started with " +
                     std::to_string(impl_->lanes.size()) + " lanes");
}

download_scheduler::~download_scheduler() {
    shutdown();
}

auto download_scheduler::download_file(int64_t message_id, const file_location& location)
    -> std::optional<std::size_t> {
    if (impl_->stopping) {
        return std::nullopt;
    }

    const auto key = file_key_of(location);
    if (location.size == 0) {
        MT_LOG_WARN(log_category::download, "Ignoring download of empty file " + key);
        return std::nullopt;
    }

    const auto owner = impl_->messages->active_folder();

    std::lock_guard lock(impl_->mutex);

    auto existing = impl_->registry.get_downloading_file(key);
    if (existing && (existing->is_complete() || existing->downloading)) {
        return std::nullopt;
    }

    auto merge_locators = [&location](downloading_file& f) {
        f.file_reference = location.file_reference;
        f.dc_id = location.dc_id;
        f.access_hash = location.access_hash;
        f.size_type = location.size_type;
        if (location.original_size_type) {
            f.original_size_type = location.original_size_type;
        }
        f.downloading = true;
    };

    // A paused run that has not observed the pause yet simply continues
    auto active = impl_->active.find(key);
    if (existing && active != impl_->active.end()) {
        impl_->registry.update_downloading_file(key, merge_locators);
        return active->second->lane;
    }

    downloading_file entry = existing ? *existing : make_downloading_file(location);
    merge_locators(entry);
    if (entry.last_part < 0 || entry.part_size == 0) {
        entry.part_size = impl_->config.part_size;
        entry.parts_count = calculate_parts_count(entry.size, entry.part_size);
    }
    impl_->registry.set_downloading_file(entry);

    auto run = std::make_shared<download_run>();
    run->lane = impl_->next_lane;
    impl_->next_lane = (impl_->next_lane + 1) % impl_->lanes.size();
    impl_->active[key] = run;

    transfer_log_context ctx;
    ctx.file_key = key;
    ctx.lane = run->lane;
    ctx.part_index = entry.last_part + 1;
    ctx.parts_count = entry.parts_count;
    ctx.message_id = message_id;
    MT_LOG_INFO_CTX(log_category::scheduler, "Download queued", ctx);

    auto* state = impl_.get();
    impl_->lanes[run->lane]->submit([state, key, run, message_id, owner]() {
        state->run_download(key, run, message_id, owner);
        state->pause_lane();
    });

    return run->lane;
}

auto download_scheduler::get_downloading_file(const file_location& location) const
    -> std::optional<downloading_file> {
    return impl_->registry.get_downloading_file(file_key_of(location));
}

auto download_scheduler::pause_downloading_file(const file_location& location) -> bool {
    const auto key = file_key_of(location);
    bool paused = false;
    impl_->registry.update_downloading_file(key, [&paused](downloading_file& f) {
        if (f.downloading) {
            f.downloading = false;
            paused = true;
        }
    });
    if (paused) {
        MT_LOG_INFO(log_category::download, "Download paused: " + key);
    }
    return paused;
}

auto download_scheduler::reset_downloading_file(const file_location& location) -> bool {
    const auto key = file_key_of(location);

    std::lock_guard lock(impl_->mutex);
    auto active = impl_->active.find(key);
    if (active != impl_->active.end()) {
        auto run = active->second;
        std::lock_guard commit(run->commit_mutex);
        run->cancelled = true;
        impl_->active.erase(active);
    }

    const bool existed = impl_->registry.erase_downloading_file(key);
    impl_->store->delete_file(key);
    if (existed) {
        MT_LOG_INFO(log_category::download, "Download reset: " + key);
    }
    return existed;
}

auto download_scheduler::next_lane() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->next_lane;
}

auto download_scheduler::lane_count() const -> std::size_t {
    return impl_->lanes.size();
}

auto download_scheduler::pending_tasks() const -> std::size_t {
    std::size_t total = 0;
    for (const auto& lane : impl_->lanes) {
        total += lane->pending_tasks();
    }
    return total;
}

auto download_scheduler::wait_idle(std::chrono::milliseconds timeout) -> bool {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (auto& lane : impl_->lanes) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() < 0) {
            remaining = std::chrono::milliseconds(0);
        }
        if (!lane->wait_idle(remaining)) {
            return false;
        }
    }
    return true;
}

void download_scheduler::shutdown() {
    if (!impl_ || impl_->stopping.exchange(true)) {
        return;
    }
    {
        std::lock_guard lock(impl_->stop_mutex);
    }
    impl_->stop_cv.notify_all();

    for (auto& lane : impl_->lanes) {
        lane->shutdown();
    }
    MT_LOG_DEBUG(log_category::scheduler, "Download scheduler stopped");
}

}  // namespace kcenon::media_transfer
