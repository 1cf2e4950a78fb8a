/**
 * @file upload_pipeline.cpp
 * @brief Implementation of the upload pipeline
 */

#include "kcenon/media_transfer/engine/upload_pipeline.h"

#include <kcenon/media_transfer/core/file_key.h>
#include <kcenon/media_transfer/core/logging.h>

#include <algorithm>
#include <future>

namespace kcenon::media_transfer {

namespace {

auto is_set(const std::optional<int32_t>& value) -> bool {
    return value.has_value() && *value != 0;
}

auto make_uploaded_file(const upload_file_params& main,
                        const std::optional<upload_file_params>& thumb,
                        const input_file& file) -> uploaded_file {
    uploaded_file uploaded;
    uploaded.file_id = main.file_id;
    uploaded.file_name = main.file_name;
    uploaded.file_type = main.file_type;
    uploaded.is_large = main.is_large;
    uploaded.parts_count = main.parts_count;

    const bool has_dimensions = is_set(file.w) && is_set(file.h);
    if (has_dimensions && !is_set(file.duration)) {
        uploaded.image_params = image_params{*file.w, *file.h};
    } else if (has_dimensions) {
        uploaded.video_params = video_params{*file.w, *file.h, *file.duration};
    }

    if (thumb) {
        uploaded.thumb = uploaded_thumb{thumb->file_id, thumb->file_name, thumb->file_type,
                                        thumb->is_large, thumb->parts_count};
    }
    return uploaded;
}

}  // namespace

upload_pipeline::upload_pipeline(transfer_registry& registry,
                                 std::shared_ptr<media_transport> transport,
                                 std::shared_ptr<part_store> store,
                                 std::shared_ptr<message_service> messages,
                                 transfer_statistics& statistics)
    : registry_(registry),
      transport_(std::move(transport)),
      store_(std::move(store)),
      messages_(std::move(messages)),
      statistics_(statistics) {
}

auto upload_pipeline::upload_files(const input_message& message,
                                   const folder& target,
                                   int64_t parent_id) -> std::optional<input_message> {
    const auto& files = message.input_files;

    for (std::size_t i = 0; i < files.size(); ++i) {
        if (!registry_.get_sending_message(target.id)) {
            MT_LOG_INFO(log_category::upload,
                        "Sending message removed, upload batch stopped");
            return std::nullopt;
        }

        const auto& file = files[i];
        const bool final = i == files.size() - 1;

        auto uploaded = upload_file(target, file);
        if (!uploaded) {
            continue;
        }

        outgoing_message outgoing{make_file_message_mark(parent_id), std::move(*uploaded)};
        auto created = messages_->create_message(outgoing, target, final);
        if (!created) {
            transfer_log_context ctx;
            ctx.file_key = file.file_key;
            ctx.folder_id = target.id;
            ctx.message_id = parent_id;
            ctx.error_message = created.error().message;
            MT_LOG_WARN_CTX(log_category::upload, "Failed to create file message", ctx);
            continue;
        }

        if (!final) {
            auto remaining = registry_.update_sending_message(
                target.id, [&file](input_message& pending) {
                    auto& pending_files = pending.input_files;
                    pending_files.erase(
                        std::remove_if(pending_files.begin(), pending_files.end(),
                                       [&file](const input_file& f) {
                                           return f.file_key == file.file_key;
                                       }),
                        pending_files.end());
                });
            if (!remaining) {
                return std::nullopt;
            }
        }
    }

    return message;
}

auto upload_pipeline::upload_file(const folder& target, const input_file& file)
    -> std::optional<uploaded_file> {
    if (file.file_key.empty()) {
        return std::nullopt;
    }

    auto main_future = std::async(std::launch::async, [this, &target, &file] {
        return upload_staged_file(target, file.file_key, true);
    });

    std::optional<upload_file_params> thumb;
    if (file.thumb_file_key) {
        auto thumb_future = std::async(std::launch::async, [this, &target, &file] {
            return upload_staged_file(target, *file.thumb_file_key, false);
        });
        thumb = thumb_future.get();
    }

    auto main = main_future.get();
    if (!main) {
        return std::nullopt;
    }

    statistics_.record_file_uploaded();

    transfer_log_context ctx;
    ctx.file_key = file.file_key;
    ctx.folder_id = target.id;
    ctx.parts_count = main->parts_count;
    MT_LOG_INFO_CTX(log_category::upload, "File uploaded", ctx);

    return make_uploaded_file(*main, thumb, file);
}

auto upload_pipeline::is_uploading(int64_t folder_id, const std::string& file_key) const
    -> bool {
    auto pending = registry_.get_sending_message(folder_id);
    if (!pending) {
        return false;
    }
    return std::any_of(pending->input_files.begin(), pending->input_files.end(),
                       [&file_key](const input_file& f) {
                           return f.file_key == file_key || f.thumb_file_key == file_key;
                       });
}

void upload_pipeline::reset_uploading_files(const std::vector<input_file>& files) {
    for (const auto& file : files) {
        if (!file.file_key.empty()) {
            store_->delete_file(file.file_key);
        }
        if (file.thumb_file_key) {
            store_->delete_file(*file.thumb_file_key);
        }
    }
}

auto upload_pipeline::upload_staged_file(const folder& target,
                                         const std::string& key,
                                         bool is_main) -> std::optional<upload_file_params> {
    transfer_log_context ctx;
    ctx.file_key = key;
    ctx.folder_id = target.id;

    auto meta = store_->get_file_meta(key);
    if (!meta) {
        MT_LOG_WARN_CTX(log_category::upload, "No staged file to upload", ctx);
        return std::nullopt;
    }
    if (!is_uploading(target.id, key)) {
        return std::nullopt;
    }

    auto prepared = transport_->prepare_uploading_file(*meta);
    if (!prepared) {
        ctx.error_message = prepared.error().message;
        MT_LOG_WARN_CTX(log_category::upload, "Failed to prepare upload", ctx);
        return std::nullopt;
    }
    const auto params = prepared.value();
    ctx.parts_count = params.parts_count;

    for (int64_t part = 0; part < params.parts_count; ++part) {
        if (!is_uploading(target.id, key)) {
            MT_LOG_DEBUG_CTX(log_category::upload, "Upload cancelled", ctx);
            return std::nullopt;
        }

        ctx.part_index = part;
        const bool is_last_part = part == params.parts_count - 1;
        const uint64_t start = static_cast<uint64_t>(part) * params.part_size;
        const uint64_t end = start + (is_last_part ? params.last_part_size : params.part_size);

        auto bytes = store_->get_file_part(key, start, end);
        if (!bytes) {
            MT_LOG_WARN_CTX(log_category::upload, "Staged part missing", ctx);
            return std::nullopt;
        }
        const uint64_t sent_bytes = bytes->size();

        auto sent = transport_->upload_file_part(*bytes, params, part);
        bytes.reset();
        if (!sent) {
            ctx.error_message = sent.error().message;
            MT_LOG_WARN_CTX(log_category::upload, "Part upload failed", ctx);
            return std::nullopt;
        }

        statistics_.record_part_uploaded(sent_bytes);
        if (is_main) {
            on_upload_part(target.id, key, calculate_progress(part, params.parts_count));
        }
    }

    store_->delete_file(key);
    return params;
}

void upload_pipeline::on_upload_part(int64_t folder_id,
                                     const std::string& key,
                                     uint32_t progress) {
    registry_.update_sending_message(folder_id, [&key, progress](input_message& pending) {
        for (auto& file : pending.input_files) {
            if (file.file_key == key) {
                file.progress = std::max(file.progress, progress);
            }
        }
    });
}

}  // namespace kcenon::media_transfer
