/**
 * @file local_part_store.cpp
 * @brief Implementation of the directory-backed part store
 */

#include "kcenon/media_transfer/storage/local_part_store.h"

#include <kcenon/media_transfer/core/logging.h>

#include <fstream>
#include <mutex>
#include <stdexcept>

namespace kcenon::media_transfer {

namespace {

auto hex_encode(const std::string& key) -> std::string {
    constexpr char hex_chars[] = "0123456789abcdef";
    std::string out;
    out.reserve(key.size() * 2);
    for (unsigned char c : key) {
        out += hex_chars[c >> 4];
        out += hex_chars[c & 0x0F];
    }
    return out;
}

auto extension_for(const std::string& mime) -> std::string {
    if (mime == "image/jpeg") return ".jpg";
    if (mime == "image/png") return ".png";
    if (mime == "image/gif") return ".gif";
    if (mime == "image/webp") return ".webp";
    if (mime == "video/mp4") return ".mp4";
    if (mime == "video/quicktime") return ".mov";
    if (mime == "audio/mpeg") return ".mp3";
    if (mime == "application/pdf") return ".pdf";
    return ".bin";
}

}  // namespace

struct local_part_store::impl {
    std::filesystem::path root;
    std::filesystem::path staged_dir;
    std::filesystem::path parts_dir;
    std::filesystem::path files_dir;
    mutable std::mutex mutex;

    [[nodiscard]] auto staged_path(const std::string& key) const -> std::filesystem::path {
        return staged_dir / (hex_encode(key) + ".bin");
    }

    [[nodiscard]] auto meta_path(const std::string& key) const -> std::filesystem::path {
        return staged_dir / (hex_encode(key) + ".meta");
    }

    [[nodiscard]] auto part_path(const std::string& key) const -> std::filesystem::path {
        return parts_dir / (hex_encode(key) + ".part");
    }
};

local_part_store::local_part_store(std::filesystem::path root)
    : impl_(std::make_unique<impl>()) {
    impl_->root = std::move(root);
    impl_->staged_dir = impl_->root / "staged";
    impl_->parts_dir = impl_->root / "parts";
    impl_->files_dir = impl_->root / "files";

    for (const auto& dir : {impl_->staged_dir, impl_->parts_dir, impl_->files_dir}) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            MT_LOG_ERROR(log_category::storage,
                         "Cannot create " + dir.string() + ": " + ec.message());
        }
    }
}

local_part_store::~local_part_store() = default;

auto local_part_store::root() const -> const std::filesystem::path& {
    return impl_->root;
}

auto local_part_store::stage_file(const std::string& key,
                                  const file_meta& meta,
                                  const std::filesystem::path& source) -> result<void> {
    std::lock_guard lock(impl_->mutex);

    std::error_code ec;
    std::filesystem::copy_file(source, impl_->staged_path(key),
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return unexpected(error{error_code::part_write_error,
                                "cannot stage file: " + ec.message()});
    }

    std::ofstream meta_file(impl_->meta_path(key), std::ios::trunc);
    if (!meta_file) {
        return unexpected(error{error_code::part_write_error, "cannot write file meta"});
    }
    meta_file << meta.name << '\n' << meta.size << '\n' << meta.type << '\n';
    return {};
}

auto local_part_store::get_file_meta(const std::string& key) const
    -> std::optional<file_meta> {
    std::lock_guard lock(impl_->mutex);

    std::ifstream meta_file(impl_->meta_path(key));
    if (!meta_file) {
        return std::nullopt;
    }

    file_meta meta;
    std::string size_line;
    if (!std::getline(meta_file, meta.name) ||
        !std::getline(meta_file, size_line) ||
        !std::getline(meta_file, meta.type)) {
        return std::nullopt;
    }

    try {
        meta.size = std::stoull(size_line);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return meta;
}

auto local_part_store::get_file_part(const std::string& key,
                                     uint64_t start,
                                     uint64_t end) const
    -> std::optional<byte_buffer> {
    std::lock_guard lock(impl_->mutex);

    auto path = impl_->staged_path(key);
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec || start > end || end > size) {
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }

    byte_buffer bytes(static_cast<std::size_t>(end - start));
    file.seekg(static_cast<std::streamoff>(start));
    file.read(reinterpret_cast<char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    if (static_cast<uint64_t>(file.gcount()) != bytes.size()) {
        return std::nullopt;
    }
    return bytes;
}

void local_part_store::delete_file(const std::string& key) {
    std::lock_guard lock(impl_->mutex);

    std::error_code ec;
    std::filesystem::remove(impl_->staged_path(key), ec);
    std::filesystem::remove(impl_->meta_path(key), ec);
    std::filesystem::remove(impl_->part_path(key), ec);
}

auto local_part_store::add_bytes(const std::string& key,
                                 uint64_t offset,
                                 const byte_buffer& bytes) -> result<void> {
    std::lock_guard lock(impl_->mutex);

    auto path = impl_->part_path(key);
    std::error_code ec;
    uint64_t current = 0;
    if (std::filesystem::exists(path, ec)) {
        current = std::filesystem::file_size(path, ec);
        if (ec) {
            return unexpected(error{error_code::part_write_error,
                                    "cannot stat part file for " + key + ": " + ec.message()});
        }
    }
    if (offset > current) {
        return unexpected(error{error_code::part_out_of_range,
                                "offset " + std::to_string(offset) + " past accumulated " +
                                    std::to_string(current) + " bytes of " + key});
    }
    if (offset < current) {
        std::filesystem::resize_file(path, offset, ec);
        if (ec) {
            return unexpected(error{error_code::part_write_error,
                                    "cannot truncate part file for " + key + ": " +
                                        ec.message()});
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::app);
    if (!file) {
        return unexpected(error{error_code::part_write_error,
                                "cannot open part file for " + key});
    }
    file.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        return unexpected(error{error_code::part_write_error,
                                "cannot append part bytes for " + key});
    }
    return {};
}

auto local_part_store::transfer_bytes_to_file(const std::string& key,
                                              const std::string& mime)
    -> std::optional<std::string> {
    std::lock_guard lock(impl_->mutex);

    auto part = impl_->part_path(key);
    std::error_code ec;
    if (!std::filesystem::exists(part, ec)) {
        return std::nullopt;
    }

    auto final_path = impl_->files_dir / (hex_encode(key) + extension_for(mime));
    if (std::filesystem::exists(final_path, ec)) {
        std::filesystem::remove(final_path, ec);
    }

    std::filesystem::rename(part, final_path, ec);
    if (ec) {
        MT_LOG_ERROR(log_category::storage,
                     "Cannot assemble " + key + ": " + ec.message());
        return std::nullopt;
    }
    return final_path.string();
}

}  // namespace kcenon::media_transfer
