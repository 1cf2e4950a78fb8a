/**
 * @file media_types.h
 * @brief Value types shared by the media transfer engine
 *
 * All entries stored in the transfer registry are plain values. Components
 * read a snapshot, build a modified copy, and replace the whole entry.
 */

#ifndef KCENON_MEDIA_TRANSFER_CORE_MEDIA_TYPES_H
#define KCENON_MEDIA_TRANSFER_CORE_MEDIA_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/media_transfer/core/types.h"

namespace kcenon::media_transfer {

/**
 * @brief Folder (chat) that owns messages and sending queues
 */
struct folder {
    int64_t id = 0;
    std::string title;

    [[nodiscard]] auto operator==(const folder& other) const -> bool = default;
};

/**
 * @brief Remote media attached to a message
 */
struct media {
    std::string id;
    uint64_t size = 0;
    std::string type;
    int32_t dc_id = 0;
    std::string access_hash;
    byte_buffer file_reference;
};

/**
 * @brief Message as seen by the engine: primary media plus grouped media
 */
struct message {
    int64_t id = 0;
    std::optional<media> primary_media;
    std::vector<media> secondary_media;
};

/**
 * @brief Locator and identity of a remote file
 *
 * Request input for downloads and streams. The same fields are copied into
 * the registry entries created from it.
 */
struct file_location {
    std::string id;
    uint64_t size = 0;
    std::string type;
    int32_t dc_id = 0;
    std::string access_hash;
    byte_buffer file_reference;
    std::optional<std::string> size_type;
    std::optional<std::string> original_size_type;
};

/**
 * @brief State of a queued, resumable download
 *
 * last_part is -1 until the first part completes. Once file_key (the
 * assembled artifact) is set, downloading is false and no further parts
 * are fetched.
 */
struct downloading_file {
    std::string id;
    uint64_t size = 0;
    std::string type;
    int32_t dc_id = 0;
    std::string access_hash;
    byte_buffer file_reference;
    std::optional<std::string> size_type;
    std::optional<std::string> original_size_type;

    uint64_t part_size = 0;
    int64_t parts_count = 0;
    int64_t last_part = -1;
    bool downloading = false;
    uint32_t progress = 0;
    std::optional<std::string> file_key;

    [[nodiscard]] auto is_complete() const -> bool { return file_key.has_value(); }
};

/**
 * @brief State of an on-demand streamed file
 *
 * folder and message_id are lookup-only back references used to refresh
 * an expired file reference.
 */
struct streaming_file {
    std::string id;
    uint64_t size = 0;
    std::string type;
    int32_t dc_id = 0;
    std::string access_hash;
    byte_buffer file_reference;
    std::optional<std::string> size_type;
    std::optional<std::string> original_size_type;

    std::optional<struct folder> folder;
    int64_t message_id = 0;
    bool streaming = false;
};

/**
 * @brief File staged for upload
 *
 * Width/height without duration classifies it as an image, with duration
 * as a video.
 */
struct input_file {
    std::string file_key;
    std::optional<std::string> thumb_file_key;
    std::optional<int32_t> w;
    std::optional<int32_t> h;
    std::optional<int32_t> duration;
    uint32_t progress = 0;
};

/**
 * @brief Pending outgoing message with attached files
 */
struct input_message {
    std::string text;
    std::vector<input_file> input_files;
};

/**
 * @brief Metadata of a staged file, as kept by the part store
 */
struct file_meta {
    std::string name;
    uint64_t size = 0;
    std::string type;
};

/**
 * @brief Upload parameters returned by the transport for one file
 */
struct upload_file_params {
    uint64_t part_size = 0;
    uint64_t last_part_size = 0;
    int64_t parts_count = 0;
    std::string file_id;
    std::string file_name;
    std::string file_type;
    bool is_large = false;
};

struct image_params {
    int32_t w = 0;
    int32_t h = 0;
};

struct video_params {
    int32_t w = 0;
    int32_t h = 0;
    int32_t duration = 0;
};

struct uploaded_thumb {
    std::string file_id;
    std::string file_name;
    std::string file_type;
    bool is_large = false;
    int64_t parts_count = 0;
};

/**
 * @brief Input media describing a fully uploaded file
 */
struct uploaded_file {
    std::string file_id;
    std::string file_name;
    std::string file_type;
    bool is_large = false;
    int64_t parts_count = 0;
    std::optional<struct image_params> image_params;
    std::optional<struct video_params> video_params;
    std::optional<uploaded_thumb> thumb;
};

/**
 * @brief Placeholder message created after a file finished uploading
 */
struct outgoing_message {
    std::string text;
    uploaded_file input_media;
};

/**
 * @brief Parameters of a single part request to the transport
 *
 * precise is unset for queued downloads and false for stream reads, which
 * lets the server return a slightly larger aligned range.
 */
struct download_part_request {
    std::string id;
    uint64_t part_size = 0;
    uint64_t offset_size = 0;
    int32_t dc_id = 0;
    std::string access_hash;
    byte_buffer file_reference;
    std::optional<std::string> size_type;
    std::optional<std::string> original_size_type;
    std::optional<bool> precise;
};

}  // namespace kcenon::media_transfer

#endif  // KCENON_MEDIA_TRANSFER_CORE_MEDIA_TYPES_H
