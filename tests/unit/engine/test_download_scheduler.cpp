/**
 * @file test_download_scheduler.cpp
 * @brief Unit tests for lane-based resumable downloads
 */

#include "integration/test_fixtures.h"

namespace kcenon::media_transfer::test {

namespace {

/**
 * @brief Memory store whose first assemble attempts fail
 */
class failing_assemble_store : public memory_part_store {
public:
    explicit failing_assemble_store(int failures) : failures_(failures) {}

    auto transfer_bytes_to_file(const std::string& key, const std::string& mime)
        -> std::optional<std::string> override {
        if (failures_.fetch_sub(1) > 0) {
            return std::nullopt;
        }
        return memory_part_store::transfer_bytes_to_file(key, mime);
    }

private:
    std::atomic<int> failures_;
};

}  // namespace

class DownloadSchedulerTest : public EngineFixture {
protected:
    void SetUp() override {
        EngineFixture::SetUp();
        message msg;
        msg.id = 900;
        messages_->put_message(folder_.id, msg);
    }

    auto make_scheduler(const engine_config& config = fast_config())
        -> std::unique_ptr<download_scheduler> {
        return std::make_unique<download_scheduler>(registry_, transport_, store_, messages_,
                                                    statistics_, config);
    }

    auto artifact_of(const file_location& location) -> std::optional<memory_part_store::artifact> {
        auto entry = registry_.get_downloading_file(file_key_of(location));
        if (!entry || !entry->file_key) {
            return std::nullopt;
        }
        return store_->get_artifact(*entry->file_key);
    }

    static constexpr auto wait_timeout = std::chrono::milliseconds(5000);
};

// =============================================================================
// Completion
// =============================================================================

TEST_F(DownloadSchedulerTest, DownloadsAllPartsAndAssembles) {
    auto content = make_bytes(5000);
    transport_->add_remote_file("clip", content);
    auto location = make_location("clip", content.size());

    auto scheduler = make_scheduler();
    auto lane = scheduler->download_file(900, location);
    ASSERT_TRUE(lane.has_value());
    ASSERT_TRUE(scheduler->wait_idle(wait_timeout));

    auto entry = scheduler->get_downloading_file(location);
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->is_complete());
    EXPECT_FALSE(entry->downloading);
    EXPECT_EQ(entry->parts_count, 5);
    EXPECT_EQ(entry->last_part, 4);
    EXPECT_EQ(entry->progress, 100u);

    auto artifact = artifact_of(location);
    ASSERT_TRUE(artifact.has_value());
    EXPECT_EQ(artifact->bytes, content);
    EXPECT_EQ(artifact->mime, "video/mp4");

    EXPECT_EQ(transport_->requested_offsets("clip"),
              (std::vector<uint64_t>{0, 1024, 2048, 3072, 4096}));

    auto stats = statistics_.snapshot();
    EXPECT_EQ(stats.parts_downloaded, 5u);
    EXPECT_EQ(stats.bytes_downloaded, 5000u);
    EXPECT_EQ(stats.files_downloaded, 1u);
}

TEST_F(DownloadSchedulerTest, RequestsCarryLocators) {
    transport_->add_remote_file("doc", make_bytes(100));
    auto location = make_location("doc", 100, "application/pdf");
    location.size_type = "x";

    auto scheduler = make_scheduler();
    ASSERT_TRUE(scheduler->download_file(900, location).has_value());
    ASSERT_TRUE(scheduler->wait_idle(wait_timeout));

    auto requests = transport_->download_requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].part_size, 1024u);
    EXPECT_EQ(requests[0].offset_size, 0u);
    EXPECT_EQ(requests[0].dc_id, 2);
    EXPECT_EQ(requests[0].access_hash, "hash-doc");
    EXPECT_EQ(requests[0].file_reference, make_reference("ref-1"));
    EXPECT_EQ(requests[0].size_type, std::optional<std::string>("x"));
}

TEST_F(DownloadSchedulerTest, SizeVariantsAssembleAsJpeg) {
    transport_->add_remote_file("thumb", make_bytes(300));
    auto location = make_location("thumb", 300, "application/octet-stream");
    location.size_type = "m";

    auto scheduler = make_scheduler();
    ASSERT_TRUE(scheduler->download_file(900, location).has_value());
    ASSERT_TRUE(scheduler->wait_idle(wait_timeout));

    auto artifact = artifact_of(location);
    ASSERT_TRUE(artifact.has_value());
    EXPECT_EQ(artifact->mime, "image/jpeg");
}

// =============================================================================
// Scheduling
// =============================================================================

TEST_F(DownloadSchedulerTest, LanesAreAssignedRoundRobin) {
    auto scheduler = make_scheduler(fast_config(4));
    std::vector<std::size_t> lanes;
    for (int i = 0; i < 5; ++i) {
        auto id = "file-" + std::to_string(i);
        transport_->add_remote_file(id, make_bytes(10));
        auto lane = scheduler->download_file(900, make_location(id, 10));
        ASSERT_TRUE(lane.has_value());
        lanes.push_back(*lane);
    }

    EXPECT_EQ(lanes, (std::vector<std::size_t>{0, 1, 2, 3, 0}));
    EXPECT_EQ(scheduler->next_lane(), 1u);
    EXPECT_EQ(scheduler->lane_count(), 4u);
    EXPECT_TRUE(scheduler->wait_idle(wait_timeout));
}

TEST_F(DownloadSchedulerTest, InFlightRequestsBoundedByLaneCount) {
    transport_->set_download_delay(std::chrono::milliseconds(5));
    auto scheduler = make_scheduler(fast_config(2));

    for (int i = 0; i < 8; ++i) {
        auto id = "file-" + std::to_string(i);
        transport_->add_remote_file(id, make_bytes(3000));
        ASSERT_TRUE(scheduler->download_file(900, make_location(id, 3000)).has_value());
    }
    ASSERT_TRUE(scheduler->wait_idle(wait_timeout));

    EXPECT_LE(transport_->max_in_flight(), 2);
    EXPECT_EQ(statistics_.snapshot().files_downloaded, 8u);
}

TEST_F(DownloadSchedulerTest, LanePausesBetweenTasks) {
    transport_->add_remote_file("first", make_bytes(2048));
    transport_->add_remote_file("second", make_bytes(100));

    auto config = fast_config(1);
    config.lane_pause = std::chrono::milliseconds(50);
    auto scheduler = make_scheduler(config);

    ASSERT_TRUE(scheduler->download_file(900, make_location("first", 2048)).has_value());
    ASSERT_TRUE(scheduler->download_file(900, make_location("second", 100)).has_value());
    ASSERT_TRUE(scheduler->wait_idle(wait_timeout));

    auto first = transport_->request_times("first");
    auto second = transport_->request_times("second");
    ASSERT_EQ(first.size(), 2u);
    ASSERT_EQ(second.size(), 1u);

    EXPECT_GE(second.front() - first.back(), config.lane_pause);
}

TEST_F(DownloadSchedulerTest, PendingTasksReflectQueuedWork) {
    transport_->set_download_delay(std::chrono::milliseconds(20));
    auto scheduler = make_scheduler(fast_config(1));
    transport_->add_remote_file("a", make_bytes(10));
    transport_->add_remote_file("b", make_bytes(10));

    ASSERT_TRUE(scheduler->download_file(900, make_location("a", 10)).has_value());
    ASSERT_TRUE(scheduler->download_file(900, make_location("b", 10)).has_value());
    EXPECT_GE(scheduler->pending_tasks(), 1u);

    ASSERT_TRUE(scheduler->wait_idle(wait_timeout));
    EXPECT_EQ(scheduler->pending_tasks(), 0u);
}

// =============================================================================
// No-op Requests
// =============================================================================

TEST_F(DownloadSchedulerTest, EmptyFileIsNoop) {
    auto scheduler = make_scheduler();
    auto location = make_location("empty", 0);

    EXPECT_FALSE(scheduler->download_file(900, location).has_value());
    EXPECT_FALSE(scheduler->get_downloading_file(location).has_value());
    EXPECT_EQ(scheduler->next_lane(), 0u);
}

TEST_F(DownloadSchedulerTest, CompletedFileIsNoop) {
    transport_->add_remote_file("clip", make_bytes(100));
    auto location = make_location("clip", 100);
    auto scheduler = make_scheduler();

    ASSERT_TRUE(scheduler->download_file(900, location).has_value());
    ASSERT_TRUE(scheduler->wait_idle(wait_timeout));

    EXPECT_FALSE(scheduler->download_file(900, location).has_value());
    ASSERT_TRUE(scheduler->wait_idle(wait_timeout));
    EXPECT_EQ(transport_->download_requests().size(), 1u);
}

TEST_F(DownloadSchedulerTest, AlreadyDownloadingIsNoop) {
    transport_->set_download_delay(std::chrono::milliseconds(20));
    transport_->add_remote_file("clip", make_bytes(3000));
    auto location = make_location("clip", 3000);
    auto scheduler = make_scheduler();

    ASSERT_TRUE(scheduler->download_file(900, location).has_value());
    EXPECT_FALSE(scheduler->download_file(900, location).has_value());
    ASSERT_TRUE(scheduler->wait_idle(wait_timeout));

    EXPECT_EQ(transport_->requested_offsets("clip"), (std::vector<uint64_t>{0, 1024, 2048}));
}

// =============================================================================
// Resume
// =============================================================================

TEST_F(DownloadSchedulerTest, TransportFailurePausesAndResumesFromNextPart) {
    auto content = make_bytes(2000000);
    transport_->add_remote_file("movie", content);
    transport_->fail_download("movie", 1536000, "TIMEOUT");
    auto location = make_location("movie", content.size());

    auto scheduler = make_scheduler(fast_config(4, 512000));
    ASSERT_TRUE(scheduler->download_file(900, location).has_value());
    ASSERT_TRUE(scheduler->wait_idle(wait_timeout));

    auto paused = scheduler->get_downloading_file(location);
    ASSERT_TRUE(paused.has_value());
    EXPECT_EQ(paused->parts_count, 4);
    EXPECT_EQ(paused->last_part, 2);
    EXPECT_FALSE(paused->downloading);
    EXPECT_FALSE(paused->is_complete());
    EXPECT_EQ(statistics_.snapshot().transport_failures, 1u);
    EXPECT_TRUE(messages_->refresh_calls().empty());

    ASSERT_TRUE(scheduler->download_file(900, location).has_value());
    ASSERT_TRUE(scheduler->wait_idle(wait_timeout));

    EXPECT_EQ(transport_->requested_offsets("movie"),
              (std::vector<uint64_t>{0, 512000, 1024000, 1536000, 1536000}));

    auto entry = scheduler->get_downloading_file(location);
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->is_complete());
    EXPECT_EQ(entry->last_part, 3);

    auto artifact = artifact_of(location);
    ASSERT_TRUE(artifact.has_value());
    EXPECT_EQ(artifact->bytes, content);
}

TEST_F(DownloadSchedulerTest, ResumeAfterFailedAssembleKeepsBytesIntact) {
    auto content = make_bytes(3000);
    transport_->add_remote_file("clip", content);
    auto location = make_location("clip", content.size());

    auto store = std::make_shared<failing_assemble_store>(1);
    download_scheduler scheduler(registry_, transport_, store, messages_, statistics_,
                                 fast_config());

    ASSERT_TRUE(scheduler.download_file(900, location).has_value());
    ASSERT_TRUE(scheduler.wait_idle(wait_timeout));

    auto paused = scheduler.get_downloading_file(location);
    ASSERT_TRUE(paused.has_value());
    EXPECT_FALSE(paused->is_complete());
    EXPECT_FALSE(paused->downloading);
    EXPECT_EQ(paused->last_part, 1);
    EXPECT_EQ(store->accumulated_size(file_key_of(location)), 3000u);

    ASSERT_TRUE(scheduler.download_file(900, location).has_value());
    ASSERT_TRUE(scheduler.wait_idle(wait_timeout));

    auto entry = scheduler.get_downloading_file(location);
    ASSERT_TRUE(entry.has_value());
    ASSERT_TRUE(entry->is_complete());
    EXPECT_EQ(transport_->requested_offsets("clip"),
              (std::vector<uint64_t>{0, 1024, 2048, 2048}));

    auto artifact = store->get_artifact(*entry->file_key);
    ASSERT_TRUE(artifact.has_value());
    EXPECT_EQ(artifact->bytes.size(), content.size());
    EXPECT_EQ(artifact->bytes, content);
}

TEST_F(DownloadSchedulerTest, ExpiredReferenceRefreshesOwnerMessage) {
    transport_->add_remote_file("clip", make_bytes(3000));
    transport_->require_reference(make_reference("ref-2"));
    auto location = make_location("clip", 3000);

    auto scheduler = make_scheduler();
    ASSERT_TRUE(scheduler->download_file(900, location).has_value());
    ASSERT_TRUE(scheduler->wait_idle(wait_timeout));

    auto entry = scheduler->get_downloading_file(location);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->last_part, -1);
    EXPECT_FALSE(entry->downloading);

    auto refreshes = messages_->refresh_calls();
    ASSERT_EQ(refreshes.size(), 1u);
    EXPECT_EQ(refreshes[0].folder_id, folder_.id);
    EXPECT_EQ(refreshes[0].message_id, 900);
    EXPECT_EQ(refreshes[0].priority, 1);
    EXPECT_EQ(statistics_.snapshot().reference_expiries, 1u);

    // Caller re-issues the request with the refreshed reference
    location.file_reference = make_reference("ref-2");
    ASSERT_TRUE(scheduler->download_file(900, location).has_value());
    ASSERT_TRUE(scheduler->wait_idle(wait_timeout));

    entry = scheduler->get_downloading_file(location);
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->is_complete());
    EXPECT_EQ(entry->file_reference, make_reference("ref-2"));
}

TEST_F(DownloadSchedulerTest, ExpiryUsesFolderActiveAtRequestTime) {
    transport_->add_remote_file("clip", make_bytes(3000));
    transport_->require_reference(make_reference("ref-2"));
    transport_->set_download_delay(std::chrono::milliseconds(30));
    auto location = make_location("clip", 3000);

    auto scheduler = make_scheduler();
    ASSERT_TRUE(scheduler->download_file(900, location).has_value());
    messages_->set_active_folder(folder{7, "Other"});
    ASSERT_TRUE(scheduler->wait_idle(wait_timeout));

    auto refreshes = messages_->refresh_calls();
    ASSERT_EQ(refreshes.size(), 1u);
    EXPECT_EQ(refreshes[0].folder_id, folder_.id);
}

TEST_F(DownloadSchedulerTest, ExpiryWithoutActiveFolderSkipsRefresh) {
    messages_->set_active_folder(std::nullopt);
    transport_->add_remote_file("clip", make_bytes(100));
    transport_->require_reference(make_reference("ref-2"));
    auto location = make_location("clip", 100);

    auto scheduler = make_scheduler();
    ASSERT_TRUE(scheduler->download_file(900, location).has_value());
    ASSERT_TRUE(scheduler->wait_idle(wait_timeout));

    EXPECT_TRUE(messages_->refresh_calls().empty());
    EXPECT_FALSE(scheduler->get_downloading_file(location)->downloading);
}

// =============================================================================
// Pause and Reset
// =============================================================================

TEST_F(DownloadSchedulerTest, PauseStopsBeforeNextPart) {
    transport_->set_download_delay(std::chrono::milliseconds(20));
    transport_->add_remote_file("clip", make_bytes(10 * 1024));
    auto location = make_location("clip", 10 * 1024);

    auto scheduler = make_scheduler();
    ASSERT_TRUE(scheduler->download_file(900, location).has_value());
    std::this_thread::sleep_for(std::chrono::milliseconds(30));

    EXPECT_TRUE(scheduler->pause_downloading_file(location));
    ASSERT_TRUE(scheduler->wait_idle(wait_timeout));

    auto paused = scheduler->get_downloading_file(location);
    ASSERT_TRUE(paused.has_value());
    EXPECT_FALSE(paused->downloading);
    EXPECT_FALSE(paused->is_complete());
    EXPECT_LT(paused->last_part, 9);
    EXPECT_FALSE(scheduler->pause_downloading_file(location));

    ASSERT_TRUE(scheduler->download_file(900, location).has_value());
    ASSERT_TRUE(scheduler->wait_idle(wait_timeout));
    EXPECT_TRUE(scheduler->get_downloading_file(location)->is_complete());
    EXPECT_EQ(transport_->requested_offsets("clip").size(), 10u);
}

TEST_F(DownloadSchedulerTest, PauseOfUnknownFileReturnsFalse) {
    auto scheduler = make_scheduler();
    EXPECT_FALSE(scheduler->pause_downloading_file(make_location("nothing", 10)));
}

TEST_F(DownloadSchedulerTest, ResetRemovesEntryAndBytes) {
    transport_->set_download_delay(std::chrono::milliseconds(20));
    transport_->add_remote_file("clip", make_bytes(10 * 1024));
    auto location = make_location("clip", 10 * 1024);

    auto scheduler = make_scheduler();
    ASSERT_TRUE(scheduler->download_file(900, location).has_value());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    EXPECT_TRUE(scheduler->reset_downloading_file(location));
    ASSERT_TRUE(scheduler->wait_idle(wait_timeout));

    EXPECT_FALSE(scheduler->get_downloading_file(location).has_value());
    EXPECT_EQ(store_->accumulated_size(file_key_of(location)), 0u);
    EXPECT_FALSE(scheduler->reset_downloading_file(location));
}

TEST_F(DownloadSchedulerTest, DownloadAfterResetStartsOver) {
    transport_->add_remote_file("clip", make_bytes(3000));
    auto location = make_location("clip", 3000);
    auto scheduler = make_scheduler();

    ASSERT_TRUE(scheduler->download_file(900, location).has_value());
    ASSERT_TRUE(scheduler->wait_idle(wait_timeout));
    ASSERT_TRUE(scheduler->reset_downloading_file(location));

    ASSERT_TRUE(scheduler->download_file(900, location).has_value());
    ASSERT_TRUE(scheduler->wait_idle(wait_timeout));

    EXPECT_EQ(transport_->requested_offsets("clip"),
              (std::vector<uint64_t>{0, 1024, 2048, 0, 1024, 2048}));
    EXPECT_TRUE(scheduler->get_downloading_file(location)->is_complete());
}

TEST_F(DownloadSchedulerTest, ShutdownRejectsNewDownloads) {
    transport_->add_remote_file("clip", make_bytes(100));
    auto scheduler = make_scheduler();
    scheduler->shutdown();

    EXPECT_FALSE(scheduler->download_file(900, make_location("clip", 100)).has_value());
}

}  // namespace kcenon::media_transfer::test
