/**
 * @file memory_part_store.h
 * @brief In-memory part store
 */

#ifndef KCENON_MEDIA_TRANSFER_STORAGE_MEMORY_PART_STORE_H
#define KCENON_MEDIA_TRANSFER_STORAGE_MEMORY_PART_STORE_H

#include <memory>

#include "kcenon/media_transfer/storage/part_store.h"

namespace kcenon::media_transfer {

/**
 * @brief Part store keeping staged files, accumulated parts and assembled
 *        artifacts in memory
 *
 * Artifacts are addressed by "blob:<n>" keys, in creation order.
 *
 * @code
 * auto store = std::make_shared<memory_part_store>();
 * store->stage_file("upload-1", {"photo.jpg", bytes.size(), "image/jpeg"}, bytes);
 * @endcode
 */
class memory_part_store : public part_store {
public:
    /**
     * @brief Assembled artifact
     */
    struct artifact {
        std::string mime;
        byte_buffer bytes;
    };

    memory_part_store();
    ~memory_part_store() override;

    /**
     * @brief Stage a file for upload
     */
    void stage_file(const std::string& key, file_meta meta, byte_buffer bytes);

    /**
     * @brief Bytes accumulated under key and not yet assembled
     */
    [[nodiscard]] auto accumulated_size(const std::string& key) const -> uint64_t;

    /**
     * @brief Look up an assembled artifact
     */
    [[nodiscard]] auto get_artifact(const std::string& artifact_key) const
        -> std::optional<artifact>;

    /**
     * @brief Drop an assembled artifact
     * @return false when no artifact exists under artifact_key
     */
    auto release_artifact(const std::string& artifact_key) -> bool;

    [[nodiscard]] auto get_file_meta(const std::string& key) const
        -> std::optional<file_meta> override;
    [[nodiscard]] auto get_file_part(const std::string& key,
                                     uint64_t start,
                                     uint64_t end) const
        -> std::optional<byte_buffer> override;
    void delete_file(const std::string& key) override;
    [[nodiscard]] auto add_bytes(const std::string& key,
                                 uint64_t offset,
                                 const byte_buffer& bytes) -> result<void> override;
    [[nodiscard]] auto transfer_bytes_to_file(const std::string& key,
                                              const std::string& mime)
        -> std::optional<std::string> override;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::media_transfer

#endif  // KCENON_MEDIA_TRANSFER_STORAGE_MEMORY_PART_STORE_H
