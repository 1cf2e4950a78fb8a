/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <kcenon/media_transfer/core/file_key.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace kcenon::media_transfer::benchmark {

// test_data_generator implementation

auto test_data_generator::generate_random_data(std::size_t size, uint32_t seed)
    -> byte_buffer {
    byte_buffer data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

// loopback_transport implementation

void loopback_transport::add_remote_file(const std::string& id, byte_buffer content) {
    std::lock_guard lock(mutex_);
    remote_files_[id] = std::move(content);
}

auto loopback_transport::prepare_uploading_file(const file_meta& meta)
    -> result<upload_file_params> {
    upload_file_params params;
    params.part_size = sizes::default_part;
    params.parts_count = calculate_parts_count(meta.size, params.part_size);
    params.last_part_size =
        meta.size - static_cast<uint64_t>(std::max<int64_t>(params.parts_count - 1, 0)) *
                        params.part_size;
    params.file_id = meta.name;
    params.file_name = meta.name;
    params.file_type = meta.type;
    return params;
}

auto loopback_transport::upload_file_part(const byte_buffer& /*bytes*/,
                                          const upload_file_params& /*params*/,
                                          int64_t /*part*/) -> result<void> {
    return {};
}

auto loopback_transport::download_file_part(const download_part_request& request)
    -> result<byte_buffer> {
    std::lock_guard lock(mutex_);
    auto file = remote_files_.find(request.id);
    if (file == remote_files_.end() || request.offset_size >= file->second.size()) {
        return unexpected(error{error_code::download_part_failed, "FILE_ID_INVALID"});
    }

    const auto& content = file->second;
    auto end = std::min<uint64_t>(content.size(), request.offset_size + request.part_size);
    return byte_buffer(content.begin() + static_cast<std::ptrdiff_t>(request.offset_size),
                       content.begin() + static_cast<std::ptrdiff_t>(end));
}

// quiet_message_service implementation

auto quiet_message_service::active_folder() const -> std::optional<folder> {
    return std::nullopt;
}

auto quiet_message_service::refresh_message(const folder& /*target*/,
                                            int64_t /*message_id*/,
                                            int /*priority*/) -> result<void> {
    return unexpected(error{error_code::message_not_found, "MESSAGE_ID_INVALID"});
}

auto quiet_message_service::find_message(int64_t /*folder_id*/, int64_t /*message_id*/) const
    -> std::optional<message> {
    return std::nullopt;
}

auto quiet_message_service::create_message(const outgoing_message& /*outgoing*/,
                                           const folder& /*target*/,
                                           bool /*final*/) -> result<void> {
    return {};
}

// Utility functions

auto format_bytes(uint64_t bytes) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= sizes::MB) {
        oss << static_cast<double>(bytes) / sizes::MB << " MB";
    } else if (bytes >= sizes::KB) {
        oss << static_cast<double>(bytes) / sizes::KB << " KB";
    } else {
        oss << bytes << " B";
    }

    return oss.str();
}

}  // namespace kcenon::media_transfer::benchmark
