/**
 * @file test_stream_accessor.cpp
 * @brief Unit tests for streaming range reads
 */

#include "integration/test_fixtures.h"

namespace kcenon::media_transfer::test {

class StreamAccessorTest : public EngineFixture {
protected:
    void SetUp() override {
        EngineFixture::SetUp();
        accessor_ = std::make_unique<stream_accessor>(registry_, transport_, messages_,
                                                      statistics_, fast_config());

        content_ = make_bytes(8192);
        transport_->add_remote_file("clip", content_);
        location_ = make_location("clip", content_.size());

        message msg;
        msg.id = 900;
        msg.primary_media = media{"clip", content_.size(), "video/mp4", 2, "hash-clip",
                                  make_reference("ref-1")};
        messages_->put_message(folder_.id, msg);
    }

    void TearDown() override {
        accessor_.reset();
        EngineFixture::TearDown();
    }

    void refresh_to(const std::string& reference) {
        messages_->on_refresh([reference](message& msg) {
            msg.primary_media->file_reference = make_reference(reference);
        });
    }

    auto slice(uint64_t offset, uint64_t size) const -> byte_buffer {
        return byte_buffer(content_.begin() + static_cast<std::ptrdiff_t>(offset),
                           content_.begin() + static_cast<std::ptrdiff_t>(offset + size));
    }

    std::unique_ptr<stream_accessor> accessor_;
    byte_buffer content_;
    file_location location_;
};

// =============================================================================
// Registration
// =============================================================================

TEST_F(StreamAccessorTest, StreamFileReturnsLocator) {
    auto locator = accessor_->stream_file(900, location_);
    EXPECT_EQ(locator, "stream://" + file_key_of(location_));

    auto entry = accessor_->get_streaming_file(file_key_of(location_));
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->streaming);
    EXPECT_EQ(entry->message_id, 900);
    ASSERT_TRUE(entry->folder.has_value());
    EXPECT_EQ(entry->folder->id, folder_.id);
}

TEST_F(StreamAccessorTest, StreamFileUsesConfiguredPrefix) {
    auto config = fast_config();
    config.stream_url_prefix = "media://local/";
    stream_accessor accessor(registry_, transport_, messages_, statistics_, config);

    EXPECT_EQ(accessor.stream_file(900, location_), "media://local/" + file_key_of(location_));
}

TEST_F(StreamAccessorTest, StreamFileRefreshesLocators) {
    accessor_->stream_file(900, location_);

    auto updated = location_;
    updated.file_reference = make_reference("ref-9");
    accessor_->stream_file(901, updated);

    auto entry = accessor_->get_streaming_file(file_key_of(location_));
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->file_reference, make_reference("ref-9"));
    EXPECT_EQ(entry->message_id, 901);
    EXPECT_EQ(registry_.streaming_files().size(), 1u);
}

// =============================================================================
// Range Reads
// =============================================================================

TEST_F(StreamAccessorTest, ReadsRequestedRange) {
    auto key = file_key_of(location_);
    accessor_->stream_file(900, location_);

    auto bytes = accessor_->download_stream_file_part(key, 4096, 1024);
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, slice(4096, 1024));

    auto requests = transport_->download_requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].offset_size, 4096u);
    EXPECT_EQ(requests[0].part_size, 1024u);
    EXPECT_EQ(requests[0].precise, std::optional<bool>(false));

    auto stats = statistics_.snapshot();
    EXPECT_EQ(stats.stream_parts_served, 1u);
    EXPECT_EQ(stats.bytes_downloaded, 1024u);
}

TEST_F(StreamAccessorTest, UnknownStreamReturnsNothing) {
    EXPECT_FALSE(accessor_->download_stream_file_part("unknown", 0, 1024).has_value());
    EXPECT_TRUE(transport_->download_requests().empty());
}

TEST_F(StreamAccessorTest, SuppliedReferenceIsStored) {
    auto key = file_key_of(location_);
    accessor_->stream_file(900, location_);
    transport_->require_reference(make_reference("ref-5"));

    auto bytes = accessor_->download_stream_file_part(key, 0, 1024, make_reference("ref-5"));
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(accessor_->get_streaming_file(key)->file_reference, make_reference("ref-5"));
}

TEST_F(StreamAccessorTest, TransportFailureIsNotRetried) {
    auto key = file_key_of(location_);
    accessor_->stream_file(900, location_);
    transport_->fail_download("clip", 0, "TIMEOUT");

    EXPECT_FALSE(accessor_->download_stream_file_part(key, 0, 1024).has_value());
    EXPECT_EQ(transport_->download_requests().size(), 1u);
    EXPECT_TRUE(messages_->refresh_calls().empty());
    EXPECT_EQ(statistics_.snapshot().transport_failures, 1u);
}

// =============================================================================
// Reference Refresh
// =============================================================================

TEST_F(StreamAccessorTest, ExpiredReferenceRetriesOnceWithFreshReference) {
    auto key = file_key_of(location_);
    accessor_->stream_file(900, location_);
    transport_->require_reference(make_reference("ref-2"));
    refresh_to("ref-2");

    auto bytes = accessor_->download_stream_file_part(key, 1024, 1024);
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, slice(1024, 1024));

    auto refreshes = messages_->refresh_calls();
    ASSERT_EQ(refreshes.size(), 1u);
    EXPECT_EQ(refreshes[0].folder_id, folder_.id);
    EXPECT_EQ(refreshes[0].message_id, 900);
    EXPECT_EQ(refreshes[0].priority, 0);

    EXPECT_EQ(transport_->download_requests().size(), 2u);
    EXPECT_EQ(accessor_->get_streaming_file(key)->file_reference, make_reference("ref-2"));

    auto stats = statistics_.snapshot();
    EXPECT_EQ(stats.stream_retries, 1u);
    EXPECT_EQ(stats.reference_expiries, 1u);
}

TEST_F(StreamAccessorTest, StillExpiredAfterRefreshGivesUp) {
    auto key = file_key_of(location_);
    accessor_->stream_file(900, location_);
    transport_->require_reference(make_reference("ref-3"));
    refresh_to("ref-2");

    EXPECT_FALSE(accessor_->download_stream_file_part(key, 0, 1024).has_value());
    EXPECT_EQ(transport_->download_requests().size(), 2u);
    EXPECT_EQ(messages_->refresh_calls().size(), 1u);
}

TEST_F(StreamAccessorTest, MissingMediaAfterRefreshGivesUp) {
    auto key = file_key_of(location_);
    accessor_->stream_file(900, location_);
    transport_->require_reference(make_reference("ref-2"));
    messages_->on_refresh([](message& msg) { msg.primary_media.reset(); });

    EXPECT_FALSE(accessor_->download_stream_file_part(key, 0, 1024).has_value());
    EXPECT_EQ(transport_->download_requests().size(), 1u);
    EXPECT_EQ(statistics_.snapshot().stream_retries, 0u);
}

TEST_F(StreamAccessorTest, MissingMessageGivesUp) {
    auto key = file_key_of(location_);
    accessor_->stream_file(12345, location_);
    transport_->require_reference(make_reference("ref-2"));

    EXPECT_FALSE(accessor_->download_stream_file_part(key, 0, 1024).has_value());
    EXPECT_EQ(transport_->download_requests().size(), 1u);
}

TEST_F(StreamAccessorTest, NoOwnerFolderGivesUp) {
    messages_->set_active_folder(std::nullopt);
    auto key = file_key_of(location_);
    accessor_->stream_file(900, location_);
    transport_->require_reference(make_reference("ref-2"));

    EXPECT_FALSE(accessor_->download_stream_file_part(key, 0, 1024).has_value());
    EXPECT_TRUE(messages_->refresh_calls().empty());
}

// =============================================================================
// File Reference Lookup
// =============================================================================

TEST_F(StreamAccessorTest, FileReferenceFromSecondaryMedia) {
    message msg;
    msg.id = 901;
    msg.secondary_media.push_back(media{"thumb", 10, "image/jpeg", 2, "h", make_reference("t")});
    messages_->put_message(folder_.id, msg);

    auto reference = accessor_->get_file_reference(folder_.id, 901, "thumb");
    ASSERT_TRUE(reference.has_value());
    EXPECT_EQ(*reference, make_reference("t"));

    EXPECT_FALSE(accessor_->get_file_reference(folder_.id, 901, "other").has_value());
    EXPECT_FALSE(accessor_->get_file_reference(folder_.id, 999, "thumb").has_value());
}

}  // namespace kcenon::media_transfer::test
