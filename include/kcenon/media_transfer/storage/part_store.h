/**
 * @file part_store.h
 * @brief Scratch storage contract for file parts and assembled files
 *
 * The engine consumes this contract; it does not own storage internals.
 * Staged uploads are read back by byte range, downloaded parts are
 * appended under the file key and finally assembled into an artifact.
 */

#ifndef KCENON_MEDIA_TRANSFER_STORAGE_PART_STORE_H
#define KCENON_MEDIA_TRANSFER_STORAGE_PART_STORE_H

#include <cstdint>
#include <optional>
#include <string>

#include "kcenon/media_transfer/core/media_types.h"
#include "kcenon/media_transfer/core/types.h"

namespace kcenon::media_transfer {

/**
 * @brief Part storage interface
 *
 * Implementations must be safe to call from several lanes at once; each
 * key is only ever written by one lane at a time.
 */
class part_store {
public:
    virtual ~part_store() = default;

    part_store() = default;
    part_store(const part_store&) = delete;
    auto operator=(const part_store&) -> part_store& = delete;

    /**
     * @brief Metadata of a staged file
     * @return nullopt when nothing is staged under key
     */
    [[nodiscard]] virtual auto get_file_meta(const std::string& key) const
        -> std::optional<file_meta> = 0;

    /**
     * @brief Read bytes [start, end) of a staged file
     * @return nullopt when the key is unknown or the range is not covered
     */
    [[nodiscard]] virtual auto get_file_part(const std::string& key,
                                             uint64_t start,
                                             uint64_t end) const
        -> std::optional<byte_buffer> = 0;

    /**
     * @brief Purge staged and accumulated bytes for key
     */
    virtual void delete_file(const std::string& key) = 0;

    /**
     * @brief Write downloaded bytes under key at offset
     * @param key File key the bytes belong to
     * @param offset Position of the bytes in the file
     * @param bytes Part content
     *
     * Bytes previously accumulated at or beyond offset are discarded, so
     * writing the same part again never duplicates it. Fails with
     * part_out_of_range when fewer than offset bytes are accumulated.
     */
    [[nodiscard]] virtual auto add_bytes(const std::string& key,
                                         uint64_t offset,
                                         const byte_buffer& bytes) -> result<void> = 0;

    /**
     * @brief Assemble the bytes accumulated under key into a final artifact
     * @param key File key the bytes were appended under
     * @param mime MIME type of the artifact
     * @return Artifact key, or nullopt when nothing was accumulated
     */
    [[nodiscard]] virtual auto transfer_bytes_to_file(const std::string& key,
                                                      const std::string& mime)
        -> std::optional<std::string> = 0;
};

}  // namespace kcenon::media_transfer

#endif  // KCENON_MEDIA_TRANSFER_STORAGE_PART_STORE_H
