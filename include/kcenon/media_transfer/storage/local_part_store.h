/**
 * @file local_part_store.h
 * @brief Directory-backed part store
 */

#ifndef KCENON_MEDIA_TRANSFER_STORAGE_LOCAL_PART_STORE_H
#define KCENON_MEDIA_TRANSFER_STORAGE_LOCAL_PART_STORE_H

#include <filesystem>
#include <memory>

#include "kcenon/media_transfer/storage/part_store.h"

namespace kcenon::media_transfer {

/**
 * @brief Part store persisting to a local directory
 *
 * Layout under the root directory:
 * - staged/<hex>.bin and staged/<hex>.meta : files staged for upload
 * - parts/<hex>.part                       : downloaded bytes being accumulated
 * - files/<hex>.<ext>                      : assembled artifacts
 *
 * <hex> is the hex encoding of the file key, so any key maps to a valid
 * file name. The artifact key returned by transfer_bytes_to_file() is the
 * artifact's path.
 */
class local_part_store : public part_store {
public:
    /**
     * @brief Construct with root directory (created when missing)
     */
    explicit local_part_store(std::filesystem::path root);
    ~local_part_store() override;

    /**
     * @brief Stage a file for upload by copying it into the store
     * @param key File key to stage under
     * @param meta Metadata reported by get_file_meta()
     * @param source File to copy
     */
    [[nodiscard]] auto stage_file(const std::string& key,
                                  const file_meta& meta,
                                  const std::filesystem::path& source) -> result<void>;

    [[nodiscard]] auto root() const -> const std::filesystem::path&;

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

#endif  // KCENON_MEDIA_TRANSFER_STORAGE_LOCAL_PART_STORE_H
