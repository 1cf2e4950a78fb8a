/**
 * @file upload_pipeline.h
 * @brief Part-by-part upload of the files attached to a pending message
 */

#ifndef KCENON_MEDIA_TRANSFER_ENGINE_UPLOAD_PIPELINE_H
#define KCENON_MEDIA_TRANSFER_ENGINE_UPLOAD_PIPELINE_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/media_transfer/core/media_types.h"
#include "kcenon/media_transfer/core/transfer_registry.h"
#include "kcenon/media_transfer/engine/engine_types.h"
#include "kcenon/media_transfer/messages/message_service.h"
#include "kcenon/media_transfer/storage/part_store.h"
#include "kcenon/media_transfer/transport/media_transport.h"

namespace kcenon::media_transfer {

/**
 * @brief Uploads the files of a pending message, one file at a time
 *
 * The pending message lives in the registry under the folder id. Before
 * every part the pipeline checks that the pending message still lists the
 * file; when it does not (the send was cancelled) the upload of that file
 * stops silently. Parts already sent are not rolled back.
 *
 * After a file is uploaded a placeholder message marked with the parent
 * message id is created. Unless it was the last file of the batch, the
 * file is then removed from the pending message so that re-running the
 * batch skips it.
 *
 * @code
 * registry.set_sending_message(folder.id, message);
 * upload_pipeline pipeline(registry, transport, store, messages, stats);
 * auto sent = pipeline.upload_files(message, folder, parent_id);
 * @endcode
 */
class upload_pipeline {
public:
    upload_pipeline(transfer_registry& registry,
                    std::shared_ptr<media_transport> transport,
                    std::shared_ptr<part_store> store,
                    std::shared_ptr<message_service> messages,
                    transfer_statistics& statistics);

    upload_pipeline(const upload_pipeline&) = delete;
    auto operator=(const upload_pipeline&) -> upload_pipeline& = delete;

    /**
     * @brief Upload every file of a message and send a placeholder for each
     * @param message Pending message with attached files
     * @param target Folder the message is sent to
     * @param parent_id Message the files belong to
     * @return The message, or nullopt if the pending message disappeared
     *         from the registry (send cancelled)
     *
     * Blocks until the batch is done.
     */
    auto upload_files(const input_message& message, const folder& target, int64_t parent_id)
        -> std::optional<input_message>;

    /**
     * @brief Upload one file and its thumbnail concurrently
     * @return Input media for the uploaded file, or nullopt if the main
     *         file could not be uploaded
     */
    auto upload_file(const folder& target, const input_file& file)
        -> std::optional<uploaded_file>;

    /**
     * @brief Check whether the pending message of a folder still lists a key
     *
     * Matches both main file keys and thumbnail keys.
     */
    [[nodiscard]] auto is_uploading(int64_t folder_id, const std::string& file_key) const
        -> bool;

    /**
     * @brief Purge the staged bytes of files that will not be sent
     */
    void reset_uploading_files(const std::vector<input_file>& files);

private:
    auto upload_staged_file(const folder& target, const std::string& key, bool is_main)
        -> std::optional<upload_file_params>;

    void on_upload_part(int64_t folder_id, const std::string& key, uint32_t progress);

    transfer_registry& registry_;
    std::shared_ptr<media_transport> transport_;
    std::shared_ptr<part_store> store_;
    std::shared_ptr<message_service> messages_;
    transfer_statistics& statistics_;
};

}  // namespace kcenon::media_transfer

#endif  // KCENON_MEDIA_TRANSFER_ENGINE_UPLOAD_PIPELINE_H
