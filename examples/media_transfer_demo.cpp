/**
 * @file media_transfer_demo.cpp
 * @brief Media transfer engine walkthrough against an in-process remote
 *
 * This example demonstrates:
 * - Building the engine with a transport, part store and message service
 * - Lane downloads with progress reported through registry listeners
 * - Recovering from an expired file reference and resuming a download
 * - Serving a stream range
 * - Uploading a staged file as a batch message
 */

#include <kcenon/media_transfer/media_transfer.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

using namespace kcenon::media_transfer;

namespace {

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

/**
 * @brief Parse size string (e.g., "512K", "8M")
 */
auto parse_size(const std::string& size_str) -> uint64_t {
    size_t pos = 0;
    double value = std::stod(size_str, &pos);

    if (pos < size_str.size()) {
        char suffix = static_cast<char>(std::toupper(size_str[pos]));
        switch (suffix) {
            case 'K': return static_cast<uint64_t>(value * 1024);
            case 'M': return static_cast<uint64_t>(value * 1024 * 1024);
            default: break;
        }
    }
    return static_cast<uint64_t>(value);
}

auto make_payload(uint64_t size) -> byte_buffer {
    byte_buffer bytes(size);
    for (uint64_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<std::byte>('A' + (i % 26));
    }
    return bytes;
}

auto make_reference(const std::string& text) -> byte_buffer {
    byte_buffer bytes;
    for (char c : text) {
        bytes.push_back(static_cast<std::byte>(c));
    }
    return bytes;
}

/**
 * @brief Remote side of the demo
 *
 * Rejects every request whose file reference differs from the current one,
 * and rotates the reference whenever the owning message is refreshed.
 */
class demo_remote : public media_transport, public message_service {
public:
    demo_remote(byte_buffer content, std::chrono::milliseconds latency)
        : content_(std::move(content)), latency_(latency) {}

    void rotate_reference() {
        std::lock_guard lock(mutex_);
        reference_ = make_reference("ref-" + std::to_string(++generation_));
    }

    auto location() const -> file_location {
        std::lock_guard lock(mutex_);
        file_location loc;
        loc.id = "demo-clip";
        loc.size = content_.size();
        loc.type = "video/mp4";
        loc.dc_id = 2;
        loc.access_hash = "demo-hash";
        loc.file_reference = reference_;
        return loc;
    }

    auto sent_messages() const -> int { return sent_messages_.load(); }

    // media_transport

    auto prepare_uploading_file(const file_meta& meta) -> result<upload_file_params> override {
        upload_file_params params;
        params.part_size = 512 * 1024;
        params.parts_count = calculate_parts_count(meta.size, params.part_size);
        params.last_part_size =
            meta.size - static_cast<uint64_t>(std::max<int64_t>(params.parts_count - 1, 0)) *
                            params.part_size;
        params.file_id = "uploaded-" + meta.name;
        params.file_name = meta.name;
        params.file_type = meta.type;
        return params;
    }

    auto upload_file_part(const byte_buffer& /*bytes*/,
                          const upload_file_params& /*params*/,
                          int64_t /*part*/) -> result<void> override {
        std::this_thread::sleep_for(latency_);
        return {};
    }

    auto download_file_part(const download_part_request& request)
        -> result<byte_buffer> override {
        std::this_thread::sleep_for(latency_);

        std::lock_guard lock(mutex_);
        if (request.file_reference != reference_) {
            return unexpected(error{error_code::download_part_failed,
                                    std::string(file_reference_expired_message)});
        }
        if (request.offset_size >= content_.size()) {
            return unexpected(error{error_code::download_part_failed, "OFFSET_INVALID"});
        }
        auto end = std::min<uint64_t>(content_.size(), request.offset_size + request.part_size);
        return byte_buffer(content_.begin() + static_cast<std::ptrdiff_t>(request.offset_size),
                           content_.begin() + static_cast<std::ptrdiff_t>(end));
    }

    // message_service

    auto active_folder() const -> std::optional<folder> override {
        return folder{1, "Saved"};
    }

    auto refresh_message(const folder& /*target*/, int64_t message_id, int priority)
        -> result<void> override {
        std::cout << "[Remote] Refreshing message " << message_id << " (priority "
                  << priority << ")" << std::endl;
        rotate_reference();
        return {};
    }

    auto find_message(int64_t /*folder_id*/, int64_t message_id) const
        -> std::optional<message> override {
        auto loc = location();
        message msg;
        msg.id = message_id;
        msg.primary_media = media{loc.id, loc.size, loc.type, loc.dc_id, loc.access_hash,
                                  loc.file_reference};
        return msg;
    }

    auto create_message(const outgoing_message& outgoing, const folder& target, bool final)
        -> result<void> override {
        ++sent_messages_;
        std::cout << "[Remote] Message " << outgoing.text << " in " << target.title
                  << " carrying " << outgoing.input_media.file_id
                  << (final ? " (final)" : "") << std::endl;
        return {};
    }

private:
    mutable std::mutex mutex_;
    byte_buffer content_;
    byte_buffer reference_ = make_reference("ref-0");
    int generation_ = 0;
    std::chrono::milliseconds latency_;
    std::atomic<int> sent_messages_{0};
};

}  // namespace

void print_usage(const char* program) {
    std::cout << "Media Transfer Demo" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --size <size>        Remote file size (default: 4M)" << std::endl;
    std::cout << "  --part-size <size>   Download part size (default: 512K)" << std::endl;
    std::cout << "  --lanes <n>          Download lanes (default: 4)" << std::endl;
    std::cout << "  --latency <ms>       Simulated request latency (default: 20)" << std::endl;
    std::cout << "  --store <dir>        Part store directory (default: ./media_store)" << std::endl;
    std::cout << "  --help               Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    uint64_t file_size = 4 * 1024 * 1024;
    uint64_t part_size = 512 * 1024;
    std::size_t lanes = 4;
    std::chrono::milliseconds latency{20};
    std::filesystem::path store_dir = "media_store";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (i + 1 >= argc) {
            std::cerr << "Error: " << arg << " requires an argument" << std::endl;
            return 1;
        }
        if (arg == "--size") {
            file_size = parse_size(argv[++i]);
        } else if (arg == "--part-size") {
            part_size = parse_size(argv[++i]);
        } else if (arg == "--lanes") {
            lanes = static_cast<std::size_t>(std::stoul(argv[++i]));
        } else if (arg == "--latency") {
            latency = std::chrono::milliseconds{std::stoi(argv[++i])};
        } else if (arg == "--store") {
            store_dir = argv[++i];
        } else {
            std::cerr << "Error: unknown option " << arg << std::endl;
            return 1;
        }
    }

    auto remote = std::make_shared<demo_remote>(make_payload(file_size), latency);
    auto store = std::make_shared<local_part_store>(store_dir);

    auto built = media_transfer_engine::builder()
                     .with_lane_count(lanes)
                     .with_part_size(part_size)
                     .with_transport(remote)
                     .with_part_store(store)
                     .with_message_service(remote)
                     .build();
    if (!built) {
        std::cerr << "Failed to create engine: " << built.error().message << std::endl;
        return 1;
    }
    auto engine = std::move(built).value();

    engine.registry().on_downloading_changed(
        [](const std::string& key, const std::optional<downloading_file>& file) {
            if (!file) {
                return;
            }
            std::cout << "\r[Download] " << key << " " << std::setw(3) << file->progress
                      << "% (" << file->last_part + 1 << "/" << file->parts_count << ")"
                      << (file->downloading ? "" : " paused") << std::flush;
            if (file->is_complete()) {
                std::cout << std::endl;
            }
        });

    // The reference handed out first is already stale on the remote
    auto location = remote->location();
    remote->rotate_reference();

    std::cout << "Downloading " << format_bytes(file_size) << " over " << lanes
              << " lanes..." << std::endl;
    engine.download_file(100, location);
    engine.wait_for_downloads(std::chrono::minutes(5));
    std::cout << std::endl;

    auto entry = engine.get_downloading_file(location);
    if (entry && !entry->is_complete()) {
        std::cout << "Download paused, fetching a fresh reference..." << std::endl;
        auto fresh = engine.get_file_reference(1, 100, location.id);
        if (!fresh) {
            std::cerr << "Media disappeared from the message" << std::endl;
            return 1;
        }
        location.file_reference = *fresh;
        engine.download_file(100, location);
        engine.wait_for_downloads(std::chrono::minutes(5));
    }

    entry = engine.get_downloading_file(location);
    if (!entry || !entry->is_complete()) {
        std::cerr << "Download did not complete" << std::endl;
        return 1;
    }
    std::cout << "Assembled file: " << *entry->file_key << std::endl;

    // Stream the first part of the same file
    auto locator = engine.stream_file(100, location);
    std::cout << "Stream locator: " << locator << std::endl;
    auto head = engine.download_stream_file_part(file_key_of(location), 0, 64 * 1024);
    if (head) {
        std::cout << "Streamed " << format_bytes(head->size()) << " from offset 0" << std::endl;
    }

    // Upload the assembled file back as a one-file batch
    auto staged = store->stage_file("demo-upload",
                                    file_meta{"clip.mp4", file_size, "video/mp4"},
                                    *entry->file_key);
    if (!staged) {
        std::cerr << "Failed to stage upload: " << staged.error().message << std::endl;
        return 1;
    }

    input_file upload;
    upload.file_key = "demo-upload";
    upload.w = 1280;
    upload.h = 720;
    upload.duration = 30;
    input_message outgoing;
    outgoing.text = "demo";
    outgoing.input_files = {upload};
    engine.registry().set_sending_message(1, outgoing);

    engine.upload_files(outgoing, folder{1, "Saved"}, 100);
    engine.registry().erase_sending_message(1);

    auto stats = engine.statistics();
    std::cout << std::endl;
    std::cout << "Statistics:" << std::endl;
    std::cout << "  Downloaded:     " << format_bytes(stats.bytes_downloaded) << " in "
              << stats.parts_downloaded << " parts" << std::endl;
    std::cout << "  Uploaded:       " << format_bytes(stats.bytes_uploaded) << " in "
              << stats.parts_uploaded << " parts" << std::endl;
    std::cout << "  Stream parts:   " << stats.stream_parts_served << std::endl;
    std::cout << "  Expired refs:   " << stats.reference_expiries << std::endl;
    std::cout << "  Messages sent:  " << remote->sent_messages() << std::endl;

    engine.shutdown();
    return 0;
}
