/**
 * @file transfer_registry.cpp
 * @brief Implementation of the copy-on-write transfer registry
 */

#include "kcenon/media_transfer/core/transfer_registry.h"

#include <kcenon/media_transfer/core/file_key.h>
#include <kcenon/media_transfer/core/logging.h>

#include <algorithm>
#include <mutex>
#include <shared_mutex>

namespace kcenon::media_transfer {

struct transfer_registry::impl {
    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, downloading_file> downloading;
    std::unordered_map<std::string, streaming_file> streaming;
    std::unordered_map<int64_t, input_message> sending;

    // Sequence of the latest write, guarded by mutex
    uint64_t write_seq{0};

    std::mutex listener_mutex;
    downloading_listener downloading_cb;
    sending_listener sending_cb;

    // Serializes delivery; recursive so listeners may write to the registry
    std::recursive_mutex notify_mutex;
    std::unordered_map<std::string, uint64_t> delivered_downloading;
    std::unordered_map<int64_t, uint64_t> delivered_sending;

    /// Caller must hold mutex exclusively
    auto next_seq() -> uint64_t { return ++write_seq; }

    /**
     * @brief Deliver a change unless a later write to the entry was delivered
     */
    void notify_downloading(const std::string& key,
                            const std::optional<downloading_file>& file,
                            uint64_t seq) {
        std::lock_guard notify(notify_mutex);
        auto& delivered = delivered_downloading[key];
        if (seq <= delivered) {
            return;
        }
        delivered = seq;

        downloading_listener cb;
        {
            std::lock_guard lock(listener_mutex);
            cb = downloading_cb;
        }
        if (cb) {
            cb(key, file);
        }
    }

    void notify_sending(int64_t folder_id,
                        const std::optional<input_message>& message,
                        uint64_t seq) {
        std::lock_guard notify(notify_mutex);
        auto& delivered = delivered_sending[folder_id];
        if (seq <= delivered) {
            return;
        }
        delivered = seq;

        sending_listener cb;
        {
            std::lock_guard lock(listener_mutex);
            cb = sending_cb;
        }
        if (cb) {
            cb(folder_id, message);
        }
    }
};

namespace {

void enforce_progress_invariants(const downloading_file& previous,
                                 downloading_file& next,
                                 const std::string& key) {
    if (next.last_part < previous.last_part ||
        next.progress < previous.progress) {
        transfer_log_context ctx;
        ctx.file_key = key;
        ctx.part_index = next.last_part;
        ctx.progress = next.progress;
        MT_LOG_WARN_CTX(log_category::registry,
                        "Rejected regression of download progress", ctx);
    }
    next.last_part = std::max(next.last_part, previous.last_part);
    next.progress = std::max(next.progress, previous.progress);

    if (next.parts_count > 0) {
        next.last_part = std::min(next.last_part, next.parts_count - 1);
    }
    next.progress = std::min<uint32_t>(next.progress, 100);
}

}  // namespace

transfer_registry::transfer_registry()
    : impl_(std::make_unique<impl>()) {
}

transfer_registry::~transfer_registry() = default;

transfer_registry::transfer_registry(transfer_registry&&) noexcept = default;

auto transfer_registry::operator=(transfer_registry&&) noexcept
    -> transfer_registry& = default;

// ============================================================================
// Downloading files
// ============================================================================

auto transfer_registry::get_downloading_file(const std::string& key) const
    -> std::optional<downloading_file> {
    std::shared_lock lock(impl_->mutex);
    auto it = impl_->downloading.find(key);
    if (it == impl_->downloading.end()) {
        return std::nullopt;
    }
    return it->second;
}

void transfer_registry::set_downloading_file(const downloading_file& file) {
    auto key = file_key_of(file);
    uint64_t seq = 0;
    {
        std::unique_lock lock(impl_->mutex);
        impl_->downloading.insert_or_assign(key, file);
        seq = impl_->next_seq();
    }
    impl_->notify_downloading(key, file, seq);
}

auto transfer_registry::update_downloading_file(
    const std::string& key,
    const downloading_mutator& mutator) -> std::optional<downloading_file> {
    std::optional<downloading_file> stored;
    uint64_t seq = 0;
    {
        std::unique_lock lock(impl_->mutex);
        auto it = impl_->downloading.find(key);
        if (it == impl_->downloading.end()) {
            return std::nullopt;
        }

        downloading_file next = it->second;
        mutator(next);
        enforce_progress_invariants(it->second, next, key);

        it->second = next;
        stored = std::move(next);
        seq = impl_->next_seq();
    }
    impl_->notify_downloading(key, stored, seq);
    return stored;
}

auto transfer_registry::erase_downloading_file(const std::string& key) -> bool {
    uint64_t seq = 0;
    {
        std::unique_lock lock(impl_->mutex);
        if (impl_->downloading.erase(key) == 0) {
            return false;
        }
        seq = impl_->next_seq();
    }
    impl_->notify_downloading(key, std::nullopt, seq);
    return true;
}

auto transfer_registry::downloading_files() const
    -> std::unordered_map<std::string, downloading_file> {
    std::shared_lock lock(impl_->mutex);
    return impl_->downloading;
}

// ============================================================================
// Streaming files
// ============================================================================

auto transfer_registry::get_streaming_file(const std::string& key) const
    -> std::optional<streaming_file> {
    std::shared_lock lock(impl_->mutex);
    auto it = impl_->streaming.find(key);
    if (it == impl_->streaming.end()) {
        return std::nullopt;
    }
    return it->second;
}

void transfer_registry::set_streaming_file(const streaming_file& file) {
    std::unique_lock lock(impl_->mutex);
    impl_->streaming.insert_or_assign(file_key_of(file), file);
}

auto transfer_registry::update_streaming_file(
    const std::string& key,
    const streaming_mutator& mutator) -> std::optional<streaming_file> {
    std::unique_lock lock(impl_->mutex);
    auto it = impl_->streaming.find(key);
    if (it == impl_->streaming.end()) {
        return std::nullopt;
    }

    streaming_file next = it->second;
    mutator(next);
    it->second = next;
    return next;
}

auto transfer_registry::streaming_files() const
    -> std::unordered_map<std::string, streaming_file> {
    std::shared_lock lock(impl_->mutex);
    return impl_->streaming;
}

// ============================================================================
// Sending messages
// ============================================================================

auto transfer_registry::get_sending_message(int64_t folder_id) const
    -> std::optional<input_message> {
    std::shared_lock lock(impl_->mutex);
    auto it = impl_->sending.find(folder_id);
    if (it == impl_->sending.end()) {
        return std::nullopt;
    }
    return it->second;
}

void transfer_registry::set_sending_message(int64_t folder_id,
                                            const input_message& message) {
    uint64_t seq = 0;
    {
        std::unique_lock lock(impl_->mutex);
        impl_->sending.insert_or_assign(folder_id, message);
        seq = impl_->next_seq();
    }
    impl_->notify_sending(folder_id, message, seq);
}

auto transfer_registry::update_sending_message(
    int64_t folder_id,
    const sending_mutator& mutator) -> std::optional<input_message> {
    std::optional<input_message> stored;
    uint64_t seq = 0;
    {
        std::unique_lock lock(impl_->mutex);
        auto it = impl_->sending.find(folder_id);
        if (it == impl_->sending.end()) {
            return std::nullopt;
        }

        input_message next = it->second;
        mutator(next);
        it->second = next;
        stored = std::move(next);
        seq = impl_->next_seq();
    }
    impl_->notify_sending(folder_id, stored, seq);
    return stored;
}

auto transfer_registry::erase_sending_message(int64_t folder_id) -> bool {
    uint64_t seq = 0;
    {
        std::unique_lock lock(impl_->mutex);
        if (impl_->sending.erase(folder_id) == 0) {
            return false;
        }
        seq = impl_->next_seq();
    }
    impl_->notify_sending(folder_id, std::nullopt, seq);
    return true;
}

// ============================================================================
// Change notification
// ============================================================================

void transfer_registry::on_downloading_changed(downloading_listener listener) {
    std::lock_guard lock(impl_->listener_mutex);
    impl_->downloading_cb = std::move(listener);
}

void transfer_registry::on_sending_changed(sending_listener listener) {
    std::lock_guard lock(impl_->listener_mutex);
    impl_->sending_cb = std::move(listener);
}

}  // namespace kcenon::media_transfer
