/**
 * @file memory_part_store.cpp
 * @brief Implementation of the in-memory part store
 */

#include "kcenon/media_transfer/storage/memory_part_store.h"

#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace kcenon::media_transfer {

struct memory_part_store::impl {
    struct staged_file {
        file_meta meta;
        byte_buffer bytes;
    };

    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, staged_file> staged;
    std::unordered_map<std::string, byte_buffer> accumulated;
    std::unordered_map<std::string, artifact> artifacts;
    uint64_t next_artifact{1};
};

memory_part_store::memory_part_store()
    : impl_(std::make_unique<impl>()) {
}

memory_part_store::~memory_part_store() = default;

void memory_part_store::stage_file(const std::string& key,
                                   file_meta meta,
                                   byte_buffer bytes) {
    std::unique_lock lock(impl_->mutex);
    impl_->staged.insert_or_assign(key, impl::staged_file{std::move(meta), std::move(bytes)});
}

auto memory_part_store::accumulated_size(const std::string& key) const -> uint64_t {
    std::shared_lock lock(impl_->mutex);
    auto it = impl_->accumulated.find(key);
    return it == impl_->accumulated.end() ? 0 : it->second.size();
}

auto memory_part_store::get_artifact(const std::string& artifact_key) const
    -> std::optional<artifact> {
    std::shared_lock lock(impl_->mutex);
    auto it = impl_->artifacts.find(artifact_key);
    if (it == impl_->artifacts.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto memory_part_store::get_file_meta(const std::string& key) const
    -> std::optional<file_meta> {
    std::shared_lock lock(impl_->mutex);
    auto it = impl_->staged.find(key);
    if (it == impl_->staged.end()) {
        return std::nullopt;
    }
    return it->second.meta;
}

auto memory_part_store::get_file_part(const std::string& key,
                                      uint64_t start,
                                      uint64_t end) const
    -> std::optional<byte_buffer> {
    std::shared_lock lock(impl_->mutex);
    auto it = impl_->staged.find(key);
    if (it == impl_->staged.end()) {
        return std::nullopt;
    }

    const auto& bytes = it->second.bytes;
    if (start > end || end > bytes.size()) {
        return std::nullopt;
    }
    return byte_buffer(bytes.begin() + static_cast<std::ptrdiff_t>(start),
                       bytes.begin() + static_cast<std::ptrdiff_t>(end));
}

auto memory_part_store::release_artifact(const std::string& artifact_key) -> bool {
    std::unique_lock lock(impl_->mutex);
    return impl_->artifacts.erase(artifact_key) > 0;
}

void memory_part_store::delete_file(const std::string& key) {
    std::unique_lock lock(impl_->mutex);
    impl_->staged.erase(key);
    impl_->accumulated.erase(key);
}

auto memory_part_store::add_bytes(const std::string& key,
                                  uint64_t offset,
                                  const byte_buffer& bytes) -> result<void> {
    std::unique_lock lock(impl_->mutex);
    auto it = impl_->accumulated.find(key);
    const uint64_t current = it == impl_->accumulated.end() ? 0 : it->second.size();
    if (offset > current) {
        return unexpected(error{error_code::part_out_of_range,
                                "offset " + std::to_string(offset) + " past accumulated " +
                                    std::to_string(current) + " bytes of " + key});
    }

    auto& target = impl_->accumulated[key];
    target.resize(static_cast<std::size_t>(offset));
    target.insert(target.end(), bytes.begin(), bytes.end());
    return {};
}

auto memory_part_store::transfer_bytes_to_file(const std::string& key,
                                               const std::string& mime)
    -> std::optional<std::string> {
    std::unique_lock lock(impl_->mutex);
    auto it = impl_->accumulated.find(key);
    if (it == impl_->accumulated.end()) {
        return std::nullopt;
    }

    auto artifact_key = "blob:" + std::to_string(impl_->next_artifact++);
    impl_->artifacts.emplace(artifact_key, artifact{mime, std::move(it->second)});
    impl_->accumulated.erase(it);
    return artifact_key;
}

}  // namespace kcenon::media_transfer
