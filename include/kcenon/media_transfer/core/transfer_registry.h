/**
 * @file transfer_registry.h
 * @brief Single source of truth for in-flight transfer state
 *
 * The registry holds three maps: downloading files and streaming files
 * keyed by file key, and sending messages keyed by folder id. Entries are
 * values: readers get snapshots, writers replace whole entries. The
 * update_* helpers perform read-latest-then-replace under one lock so a
 * writer never overwrites an entry from a stale snapshot.
 */

#ifndef KCENON_MEDIA_TRANSFER_CORE_TRANSFER_REGISTRY_H
#define KCENON_MEDIA_TRANSFER_CORE_TRANSFER_REGISTRY_H

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "kcenon/media_transfer/core/media_types.h"

namespace kcenon::media_transfer {

/**
 * @brief Process-wide transfer state store, owned by the engine
 *
 * @code
 * transfer_registry registry;
 * registry.set_downloading_file(file);
 *
 * registry.update_downloading_file(key, [](downloading_file& f) {
 *     f.last_part = 3;
 *     f.progress = 100;
 * });
 * @endcode
 *
 * @note Thread-safe. Listeners run on the mutating thread after the lock
 *       is released and must not assume any particular thread. Changes to
 *       one entry are delivered in write order; a change superseded by an
 *       already delivered later write is not delivered.
 */
class transfer_registry {
public:
    using downloading_mutator = std::function<void(downloading_file&)>;
    using streaming_mutator = std::function<void(streaming_file&)>;
    using sending_mutator = std::function<void(input_message&)>;

    /// Called with the new entry, or nullopt when the entry was removed
    using downloading_listener =
        std::function<void(const std::string&, const std::optional<downloading_file>&)>;
    using sending_listener =
        std::function<void(int64_t, const std::optional<input_message>&)>;

    transfer_registry();
    ~transfer_registry();

    // Non-copyable but movable
    transfer_registry(const transfer_registry&) = delete;
    auto operator=(const transfer_registry&) -> transfer_registry& = delete;
    transfer_registry(transfer_registry&&) noexcept;
    auto operator=(transfer_registry&&) noexcept -> transfer_registry&;

    // ========================================================================
    // Downloading files
    // ========================================================================

    [[nodiscard]] auto get_downloading_file(const std::string& key) const
        -> std::optional<downloading_file>;

    /**
     * @brief Insert or replace the entry for file_key_of(file)
     */
    void set_downloading_file(const downloading_file& file);

    /**
     * @brief Read the latest entry, apply mutator to a copy, replace it
     * @return The stored entry, or nullopt if no entry exists for key
     *
     * last_part and progress never decrease through this call, and
     * last_part is clamped to parts_count - 1.
     */
    auto update_downloading_file(const std::string& key,
                                 const downloading_mutator& mutator)
        -> std::optional<downloading_file>;

    /**
     * @brief Remove an entry
     * @return true if an entry was removed
     */
    auto erase_downloading_file(const std::string& key) -> bool;

    [[nodiscard]] auto downloading_files() const
        -> std::unordered_map<std::string, downloading_file>;

    // ========================================================================
    // Streaming files
    // ========================================================================

    [[nodiscard]] auto get_streaming_file(const std::string& key) const
        -> std::optional<streaming_file>;

    void set_streaming_file(const streaming_file& file);

    auto update_streaming_file(const std::string& key,
                               const streaming_mutator& mutator)
        -> std::optional<streaming_file>;

    [[nodiscard]] auto streaming_files() const
        -> std::unordered_map<std::string, streaming_file>;

    // ========================================================================
    // Sending messages
    // ========================================================================

    [[nodiscard]] auto get_sending_message(int64_t folder_id) const
        -> std::optional<input_message>;

    void set_sending_message(int64_t folder_id, const input_message& message);

    auto update_sending_message(int64_t folder_id,
                                const sending_mutator& mutator)
        -> std::optional<input_message>;

    auto erase_sending_message(int64_t folder_id) -> bool;

    // ========================================================================
    // Change notification
    // ========================================================================

    void on_downloading_changed(downloading_listener listener);
    void on_sending_changed(sending_listener listener);

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::media_transfer

#endif  // KCENON_MEDIA_TRANSFER_CORE_TRANSFER_REGISTRY_H
