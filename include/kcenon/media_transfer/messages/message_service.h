/**
 * @file message_service.h
 * @brief Message-layer collaborators consumed by the engine
 */

#ifndef KCENON_MEDIA_TRANSFER_MESSAGES_MESSAGE_SERVICE_H
#define KCENON_MEDIA_TRANSFER_MESSAGES_MESSAGE_SERVICE_H

#include <cstdint>
#include <optional>

#include "kcenon/media_transfer/core/media_types.h"
#include "kcenon/media_transfer/core/types.h"

namespace kcenon::media_transfer {

/**
 * @brief Access to folders and messages owned by the application
 *
 * The sending queue itself lives in the transfer registry; this interface
 * covers what the engine needs from the message domain.
 */
class message_service {
public:
    virtual ~message_service() = default;

    message_service() = default;
    message_service(const message_service&) = delete;
    auto operator=(const message_service&) -> message_service& = delete;

    /**
     * @brief Folder currently shown to the user
     */
    [[nodiscard]] virtual auto active_folder() const -> std::optional<folder> = 0;

    /**
     * @brief Re-fetch a message so its media carry fresh file references
     * @param target Folder that owns the message
     * @param message_id Message to refresh
     * @param priority Request priority, 0 is the most urgent
     * @return Success once the refreshed message is visible to find_message()
     */
    [[nodiscard]] virtual auto refresh_message(const folder& target,
                                               int64_t message_id,
                                               int priority) -> result<void> = 0;

    /**
     * @brief Look up a message in a folder
     */
    [[nodiscard]] virtual auto find_message(int64_t folder_id, int64_t message_id) const
        -> std::optional<message> = 0;

    /**
     * @brief Send a message carrying uploaded media
     * @param outgoing Text and input media
     * @param target Destination folder
     * @param final true for the last message of a batch
     */
    [[nodiscard]] virtual auto create_message(const outgoing_message& outgoing,
                                              const folder& target,
                                              bool final) -> result<void> = 0;
};

}  // namespace kcenon::media_transfer

#endif  // KCENON_MEDIA_TRANSFER_MESSAGES_MESSAGE_SERVICE_H
