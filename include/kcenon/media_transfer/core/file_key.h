/**
 * @file file_key.h
 * @brief Deterministic file keys and per-part arithmetic
 *
 * A file key identifies all transfer state for one logical file. It is a
 * pure function of (id, size[, size_type]) and is injective: the id is
 * length-prefixed, so no two distinct triples produce the same key.
 */

#ifndef KCENON_MEDIA_TRANSFER_CORE_FILE_KEY_H
#define KCENON_MEDIA_TRANSFER_CORE_FILE_KEY_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::media_transfer {

/**
 * @brief Derive the registry key for a file
 * @param id Remote file identifier
 * @param size File size in bytes
 * @param size_type Optional size-variant tag
 * @return Stable key, e.g. "6:123456:2000000" or "6:123456:2000000:m"
 */
[[nodiscard]] auto make_file_key(
    std::string_view id,
    uint64_t size,
    const std::optional<std::string>& size_type = std::nullopt) -> std::string;

/**
 * @brief Derive the registry key from any entry carrying id/size/size_type
 */
template <typename Entry>
[[nodiscard]] auto file_key_of(const Entry& entry) -> std::string {
    return make_file_key(entry.id, entry.size, entry.size_type);
}

/**
 * @brief MIME type of an assembled download
 *
 * Size variants are always image renditions, so they are stored as
 * "image/jpeg" like declared image types. Other files keep their type.
 */
[[nodiscard]] auto resolve_download_mime(
    std::string_view type,
    const std::optional<std::string>& size_type) -> std::string;

/**
 * @brief Progress after finishing a part, in percent
 * @return round((part + 1) / parts_count * 100), clamped to [0, 100]
 */
[[nodiscard]] auto calculate_progress(int64_t part, int64_t parts_count) -> uint32_t;

/**
 * @brief Number of parts needed for a file (ceil division)
 */
[[nodiscard]] auto calculate_parts_count(uint64_t size, uint64_t part_size) -> int64_t;

/**
 * @brief Text of the placeholder message that marks a file as sent
 * @param parent_id Message the file belongs to
 */
[[nodiscard]] auto make_file_message_mark(int64_t parent_id) -> std::string;

}  // namespace kcenon::media_transfer

#endif  // KCENON_MEDIA_TRANSFER_CORE_FILE_KEY_H
