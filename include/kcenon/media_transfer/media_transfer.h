/**
 * @file media_transfer.h
 * @brief Main header for media_trans_system library
 * @version 0.1.0
 *
 * This is the primary include file for the media_trans_system library.
 * Include this header to access the chunked media transfer engine.
 *
 * @code
 * #include <kcenon/media_transfer/media_transfer.h>
 *
 * using namespace kcenon::media_transfer;
 *
 * auto engine = media_transfer_engine::builder()
 *     .with_transport(transport)
 *     .with_part_store(std::make_shared<memory_part_store>())
 *     .with_message_service(messages)
 *     .build();
 * @endcode
 */

#ifndef KCENON_MEDIA_TRANSFER_MEDIA_TRANSFER_H
#define KCENON_MEDIA_TRANSFER_MEDIA_TRANSFER_H

#include <string>

// Core types
#include "kcenon/media_transfer/core/types.h"
#include "kcenon/media_transfer/core/media_types.h"
#include "kcenon/media_transfer/core/file_key.h"
#include "kcenon/media_transfer/core/transfer_registry.h"
#include "kcenon/media_transfer/core/logging.h"

// Collaborator contracts
#include "kcenon/media_transfer/messages/message_service.h"
#include "kcenon/media_transfer/transport/media_transport.h"

// Storage
#include "kcenon/media_transfer/storage/part_store.h"
#include "kcenon/media_transfer/storage/memory_part_store.h"
#include "kcenon/media_transfer/storage/local_part_store.h"

// Engine
#include "kcenon/media_transfer/engine/engine_types.h"
#include "kcenon/media_transfer/engine/download_scheduler.h"
#include "kcenon/media_transfer/engine/upload_pipeline.h"
#include "kcenon/media_transfer/engine/stream_accessor.h"
#include "kcenon/media_transfer/engine/media_transfer_engine.h"

namespace kcenon::media_transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::media_transfer

#endif  // KCENON_MEDIA_TRANSFER_MEDIA_TRANSFER_H
