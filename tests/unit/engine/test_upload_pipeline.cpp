/**
 * @file test_upload_pipeline.cpp
 * @brief Unit tests for staged file uploads and batch messages
 */

#include "integration/test_fixtures.h"

namespace kcenon::media_transfer::test {

class UploadPipelineTest : public EngineFixture {
protected:
    void SetUp() override {
        EngineFixture::SetUp();
        pipeline_ = std::make_unique<upload_pipeline>(registry_, transport_, store_, messages_,
                                                      statistics_);
    }

    void TearDown() override {
        pipeline_.reset();
        EngineFixture::TearDown();
    }

    auto stage(const std::string& key, const std::string& name, std::size_t size,
               const std::string& type = "image/jpeg") -> input_file {
        store_->stage_file(key, file_meta{name, size, type}, make_bytes(size));
        input_file file;
        file.file_key = key;
        return file;
    }

    void set_pending(const std::vector<input_file>& files) {
        input_message pending;
        pending.text = "caption";
        pending.input_files = files;
        registry_.set_sending_message(folder_.id, pending);
    }

    auto calls_for(const std::string& file_id) const -> std::vector<fake_transport::upload_call> {
        std::vector<fake_transport::upload_call> calls;
        for (const auto& call : transport_->upload_calls()) {
            if (call.file_id == file_id) {
                calls.push_back(call);
            }
        }
        return calls;
    }

    std::unique_ptr<upload_pipeline> pipeline_;
};

// =============================================================================
// Single File
// =============================================================================

TEST_F(UploadPipelineTest, UploadsEveryPartInOrder) {
    auto file = stage("k-photo", "photo.jpg", 2500);
    set_pending({file});

    auto uploaded = pipeline_->upload_file(folder_, file);
    ASSERT_TRUE(uploaded.has_value());
    EXPECT_EQ(uploaded->file_id, "remote-photo.jpg");
    EXPECT_EQ(uploaded->file_name, "photo.jpg");
    EXPECT_EQ(uploaded->file_type, "image/jpeg");
    EXPECT_EQ(uploaded->parts_count, 3);
    EXPECT_FALSE(uploaded->thumb.has_value());

    auto calls = calls_for("remote-photo.jpg");
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0].part, 0);
    EXPECT_EQ(calls[1].part, 1);
    EXPECT_EQ(calls[2].part, 2);
    EXPECT_EQ(calls[0].size, 1024u);
    EXPECT_EQ(calls[2].size, 452u);

    auto stats = statistics_.snapshot();
    EXPECT_EQ(stats.parts_uploaded, 3u);
    EXPECT_EQ(stats.bytes_uploaded, 2500u);
    EXPECT_EQ(stats.files_uploaded, 1u);
}

TEST_F(UploadPipelineTest, StagedFileIsDeletedAfterUpload) {
    auto file = stage("k-photo", "photo.jpg", 100);
    set_pending({file});

    ASSERT_TRUE(pipeline_->upload_file(folder_, file).has_value());
    EXPECT_FALSE(store_->get_file_meta("k-photo").has_value());
}

TEST_F(UploadPipelineTest, ProgressIsRecordedForMainFile) {
    auto file = stage("k-photo", "photo.jpg", 4096);
    set_pending({file});

    std::vector<uint32_t> progress;
    registry_.on_sending_changed([&progress](int64_t, const std::optional<input_message>& m) {
        if (m && !m->input_files.empty()) {
            progress.push_back(m->input_files.front().progress);
        }
    });

    ASSERT_TRUE(pipeline_->upload_file(folder_, file).has_value());

    EXPECT_EQ(progress, (std::vector<uint32_t>{25, 50, 75, 100}));
    EXPECT_EQ(registry_.get_sending_message(folder_.id)->input_files.front().progress, 100u);
}

TEST_F(UploadPipelineTest, ThumbnailUploadsAlongsideMain) {
    auto file = stage("k-video", "clip.mp4", 3000, "video/mp4");
    stage("k-thumb", "thumb.jpg", 500);
    file.thumb_file_key = "k-thumb";
    set_pending({file});

    auto uploaded = pipeline_->upload_file(folder_, file);
    ASSERT_TRUE(uploaded.has_value());
    ASSERT_TRUE(uploaded->thumb.has_value());
    EXPECT_EQ(uploaded->thumb->file_id, "remote-thumb.jpg");
    EXPECT_EQ(uploaded->thumb->parts_count, 1);

    EXPECT_EQ(calls_for("remote-clip.mp4").size(), 3u);
    EXPECT_EQ(calls_for("remote-thumb.jpg").size(), 1u);
    EXPECT_FALSE(store_->get_file_meta("k-thumb").has_value());
    EXPECT_EQ(registry_.get_sending_message(folder_.id)->input_files.front().progress, 100u);
}

TEST_F(UploadPipelineTest, MissingThumbnailStillUploadsMain) {
    auto file = stage("k-video", "clip.mp4", 100, "video/mp4");
    file.thumb_file_key = "k-missing";
    set_pending({file});

    auto uploaded = pipeline_->upload_file(folder_, file);
    ASSERT_TRUE(uploaded.has_value());
    EXPECT_FALSE(uploaded->thumb.has_value());
}

TEST_F(UploadPipelineTest, ImageParamsWhenDimensionsWithoutDuration) {
    auto file = stage("k-photo", "photo.jpg", 100);
    file.w = 640;
    file.h = 480;
    set_pending({file});

    auto uploaded = pipeline_->upload_file(folder_, file);
    ASSERT_TRUE(uploaded.has_value());
    ASSERT_TRUE(uploaded->image_params.has_value());
    EXPECT_EQ(uploaded->image_params->w, 640);
    EXPECT_EQ(uploaded->image_params->h, 480);
    EXPECT_FALSE(uploaded->video_params.has_value());
}

TEST_F(UploadPipelineTest, VideoParamsWhenDurationSet) {
    auto file = stage("k-video", "clip.mp4", 100, "video/mp4");
    file.w = 1280;
    file.h = 720;
    file.duration = 12;
    set_pending({file});

    auto uploaded = pipeline_->upload_file(folder_, file);
    ASSERT_TRUE(uploaded.has_value());
    ASSERT_TRUE(uploaded->video_params.has_value());
    EXPECT_EQ(uploaded->video_params->duration, 12);
    EXPECT_FALSE(uploaded->image_params.has_value());
}

TEST_F(UploadPipelineTest, ZeroDimensionsCarryNoParams) {
    auto file = stage("k-doc", "doc.pdf", 100, "application/pdf");
    file.w = 0;
    file.h = 0;
    set_pending({file});

    auto uploaded = pipeline_->upload_file(folder_, file);
    ASSERT_TRUE(uploaded.has_value());
    EXPECT_FALSE(uploaded->image_params.has_value());
    EXPECT_FALSE(uploaded->video_params.has_value());
}

// =============================================================================
// Failures and Cancellation
// =============================================================================

TEST_F(UploadPipelineTest, UnstagedFileIsSkipped) {
    input_file file;
    file.file_key = "k-missing";
    set_pending({file});

    EXPECT_FALSE(pipeline_->upload_file(folder_, file).has_value());
    EXPECT_TRUE(transport_->upload_calls().empty());
}

TEST_F(UploadPipelineTest, FileNotPendingIsNotUploaded) {
    auto file = stage("k-photo", "photo.jpg", 100);

    EXPECT_FALSE(pipeline_->upload_file(folder_, file).has_value());
    EXPECT_TRUE(transport_->upload_calls().empty());
}

TEST_F(UploadPipelineTest, PartFailureAbortsFile) {
    auto file = stage("k-photo", "photo.jpg", 3000);
    set_pending({file});
    transport_->fail_upload_part("remote-photo.jpg", 1);

    EXPECT_FALSE(pipeline_->upload_file(folder_, file).has_value());
    EXPECT_EQ(calls_for("remote-photo.jpg").size(), 1u);
    EXPECT_EQ(statistics_.snapshot().files_uploaded, 0u);
}

TEST_F(UploadPipelineTest, CancellationStopsBeforeNextPart) {
    auto file = stage("k-photo", "photo.jpg", 5000);
    set_pending({file});

    transport_->on_upload_part([this](const upload_file_params&, int64_t part) {
        if (part == 1) {
            registry_.erase_sending_message(folder_.id);
        }
    });

    EXPECT_FALSE(pipeline_->upload_file(folder_, file).has_value());
    EXPECT_EQ(calls_for("remote-photo.jpg").size(), 2u);
}

TEST_F(UploadPipelineTest, IsUploadingMatchesMainAndThumb) {
    input_file file;
    file.file_key = "k-main";
    file.thumb_file_key = "k-thumb";
    set_pending({file});

    EXPECT_TRUE(pipeline_->is_uploading(folder_.id, "k-main"));
    EXPECT_TRUE(pipeline_->is_uploading(folder_.id, "k-thumb"));
    EXPECT_FALSE(pipeline_->is_uploading(folder_.id, "k-other"));
    EXPECT_FALSE(pipeline_->is_uploading(7, "k-main"));
}

TEST_F(UploadPipelineTest, ResetPurgesStagedFiles) {
    auto file = stage("k-video", "clip.mp4", 100, "video/mp4");
    stage("k-thumb", "thumb.jpg", 10);
    file.thumb_file_key = "k-thumb";

    pipeline_->reset_uploading_files({file});

    EXPECT_FALSE(store_->get_file_meta("k-video").has_value());
    EXPECT_FALSE(store_->get_file_meta("k-thumb").has_value());
}

// =============================================================================
// Batches
// =============================================================================

TEST_F(UploadPipelineTest, BatchCreatesOneMessagePerFile) {
    auto first = stage("k-1", "one.jpg", 100);
    auto second = stage("k-2", "two.jpg", 100);
    set_pending({first, second});

    input_message message;
    message.text = "caption";
    message.input_files = {first, second};

    auto sent = pipeline_->upload_files(message, folder_, 555);
    ASSERT_TRUE(sent.has_value());
    EXPECT_EQ(sent->input_files.size(), 2u);

    auto created = messages_->created_messages();
    ASSERT_EQ(created.size(), 2u);
    EXPECT_EQ(created[0].outgoing.text, "[file:555]");
    EXPECT_EQ(created[0].outgoing.input_media.file_id, "remote-one.jpg");
    EXPECT_FALSE(created[0].final);
    EXPECT_EQ(created[0].folder_id, folder_.id);
    EXPECT_TRUE(created[1].final);

    auto pending = registry_.get_sending_message(folder_.id);
    ASSERT_TRUE(pending.has_value());
    ASSERT_EQ(pending->input_files.size(), 1u);
    EXPECT_EQ(pending->input_files.front().file_key, "k-2");
}

TEST_F(UploadPipelineTest, BatchSkipsFailedFile) {
    auto first = stage("k-1", "one.jpg", 100);
    auto second = stage("k-2", "two.jpg", 100);
    set_pending({first, second});
    transport_->fail_upload_part("remote-one.jpg", 0);

    input_message message;
    message.input_files = {first, second};

    ASSERT_TRUE(pipeline_->upload_files(message, folder_, 1).has_value());

    auto created = messages_->created_messages();
    ASSERT_EQ(created.size(), 1u);
    EXPECT_EQ(created[0].outgoing.input_media.file_id, "remote-two.jpg");
    EXPECT_TRUE(created[0].final);
}

TEST_F(UploadPipelineTest, BatchWithoutSendingMessageReturnsNothing) {
    auto first = stage("k-1", "one.jpg", 100);
    input_message message;
    message.input_files = {first};

    EXPECT_FALSE(pipeline_->upload_files(message, folder_, 1).has_value());
    EXPECT_TRUE(messages_->created_messages().empty());
}

TEST_F(UploadPipelineTest, CreateMessageFailureIsNotFatal) {
    auto first = stage("k-1", "one.jpg", 100);
    set_pending({first});
    messages_->fail_create_message(true);

    input_message message;
    message.input_files = {first};

    EXPECT_TRUE(pipeline_->upload_files(message, folder_, 1).has_value());
    EXPECT_TRUE(messages_->created_messages().empty());
}

}  // namespace kcenon::media_transfer::test
