/**
 * @file file_key.cpp
 * @brief Implementation of file key derivation and part arithmetic
 */

#include "kcenon/media_transfer/core/file_key.h"

#include <algorithm>
#include <cmath>

namespace kcenon::media_transfer {

namespace {

constexpr std::string_view image_prefix = "image";
constexpr std::string_view size_variant_mime = "image/jpeg";
constexpr std::string_view file_mark_prefix = "[file:";

}  // namespace

auto make_file_key(
    std::string_view id,
    uint64_t size,
    const std::optional<std::string>& size_type) -> std::string {
    std::string key;
    key.reserve(id.size() + 32);
    key += std::to_string(id.size());
    key += ':';
    key += id;
    key += ':';
    key += std::to_string(size);
    if (size_type) {
        key += ':';
        key += *size_type;
    }
    return key;
}

auto resolve_download_mime(
    std::string_view type,
    const std::optional<std::string>& size_type) -> std::string {
    if (size_type || type.starts_with(image_prefix)) {
        return std::string(size_variant_mime);
    }
    return std::string(type);
}

auto calculate_progress(int64_t part, int64_t parts_count) -> uint32_t {
    if (parts_count <= 0 || part < 0) {
        return 0;
    }
    auto percent = std::round(static_cast<double>(part + 1) /
                              static_cast<double>(parts_count) * 100.0);
    return static_cast<uint32_t>(std::clamp(percent, 0.0, 100.0));
}

auto calculate_parts_count(uint64_t size, uint64_t part_size) -> int64_t {
    if (part_size == 0) {
        return 0;
    }
    return static_cast<int64_t>((size + part_size - 1) / part_size);
}

auto make_file_message_mark(int64_t parent_id) -> std::string {
    std::string mark(file_mark_prefix);
    mark += std::to_string(parent_id);
    mark += ']';
    return mark;
}

}  // namespace kcenon::media_transfer
