/**
 * @file test_queue_store.cpp
 * @brief Unit tests for upload queue persistence
 */

#include <gtest/gtest.h>

#include <upload_pipeline/client/queue_store.h>

#include <filesystem>
#include <fstream>

namespace upload_pipeline::test {

class QueueStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "upload_pipeline_test_store";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto write_source(const std::string& name, std::size_t size) -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << std::string(size, 'x');
        return path;
    }

    void write_raw(const std::filesystem::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::filesystem::path test_dir_;
};

TEST_F(QueueStoreTest, ItemJsonUsesCamelCaseKeys) {
    auto item = make_upload_item(std::make_shared<memory_byte_source>(std::vector<std::byte>(10)),
                                 "a.txt");
    item.status = upload_status::paused;
    item.uploaded_bytes = 5;
    item.progress = 50;
    item.server_session_id = "s-1";

    auto j = item_to_json(item);
    EXPECT_EQ(j["id"], item.id);
    EXPECT_EQ(j["fileName"], "a.txt");
    EXPECT_EQ(j["fileSize"], 10);
    EXPECT_EQ(j["fileType"], "text/plain");
    EXPECT_EQ(j["status"], "paused");
    EXPECT_EQ(j["uploadedBytes"], 5);
    EXPECT_EQ(j["progress"], 50);
    EXPECT_EQ(j["retryCount"], 0);
    EXPECT_EQ(j["serverSessionId"], "s-1");
    EXPECT_TRUE(j["error"].is_null());
    EXPECT_TRUE(j["sourcePath"].is_null());
    EXPECT_EQ(j["metadata"]["title"], "a.txt");
    EXPECT_FALSE(j.contains("file"));
}

TEST_F(QueueStoreTest, UploadingItemsComeBackQueued) {
    auto path = write_source("clip.mp4", 300);
    auto item = make_upload_item(path);
    ASSERT_TRUE(item.has_value());
    item.value().status = upload_status::uploading;
    item.value().uploaded_bytes = 200;
    item.value().server_session_id = "s-9";

    auto restored = item_from_json(item_to_json(item.value()));
    ASSERT_TRUE(restored.has_value()) << restored.error().message;
    EXPECT_EQ(restored.value().status, upload_status::queued);
    EXPECT_EQ(restored.value().uploaded_bytes, 200u);
    EXPECT_EQ(restored.value().progress, 67);
    EXPECT_EQ(restored.value().server_session_id.value_or(""), "s-9");
    ASSERT_NE(restored.value().file, nullptr);
    EXPECT_EQ(restored.value().file->size(), 300u);
}

TEST_F(QueueStoreTest, ChangedSourceIsNotReattached) {
    auto path = write_source("doc.pdf", 100);
    auto item = make_upload_item(path);
    ASSERT_TRUE(item.has_value());
    auto j = item_to_json(item.value());

    write_source("doc.pdf", 120);
    auto resized = item_from_json(j);
    ASSERT_TRUE(resized.has_value());
    EXPECT_EQ(resized.value().file, nullptr);
    EXPECT_TRUE(resized.value().source_path.has_value());

    std::filesystem::remove(path);
    auto missing = item_from_json(j);
    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ(missing.value().file, nullptr);
}

TEST_F(QueueStoreTest, InconsistentCountersAreRepaired) {
    auto j = nlohmann::json::parse(R"({
        "id": "x", "fileName": "a", "fileSize": 100, "status": "completed",
        "uploadedBytes": 500, "progress": 12
    })");

    auto item = item_from_json(j);
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item.value().uploaded_bytes, 100u);
    EXPECT_EQ(item.value().progress, 100);
}

TEST_F(QueueStoreTest, RejectsItemsWithoutIdOrStatus) {
    auto no_id = item_from_json(nlohmann::json::parse(R"({"status":"queued"})"));
    ASSERT_FALSE(no_id.has_value());
    EXPECT_EQ(no_id.error().code, error_code::store_error);

    auto bad_status = item_from_json(nlohmann::json::parse(R"({"id":"a","status":"done"})"));
    ASSERT_FALSE(bad_status.has_value());
    EXPECT_EQ(bad_status.error().code, error_code::store_error);
}

TEST_F(QueueStoreTest, FileStoreRoundTrip) {
    json_file_queue_store store(test_dir_ / "queue.json");
    EXPECT_TRUE(store.load().empty());

    auto first = make_upload_item(write_source("one.bin", 10));
    auto second = make_upload_item(write_source("two.bin", 20));
    ASSERT_TRUE(first.has_value() && second.has_value());
    second.value().status = upload_status::failed;
    second.value().retry_count = 5;
    second.value().error = "Upload failed after 5 attempts: boom";

    store.save({first.value(), second.value()});
    ASSERT_TRUE(std::filesystem::exists(store.path()));

    json_file_queue_store reopened(store.path());
    auto items = reopened.load();
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].id, first.value().id);
    EXPECT_EQ(items[1].status, upload_status::failed);
    EXPECT_EQ(items[1].retry_count, 5);
    EXPECT_EQ(items[1].error.value_or(""), "Upload failed after 5 attempts: boom");
}

TEST_F(QueueStoreTest, CorruptOrForeignFilesLoadEmpty) {
    auto path = test_dir_ / "queue.json";
    json_file_queue_store store(path);

    write_raw(path, "{ not json");
    EXPECT_TRUE(store.load().empty());

    write_raw(path, R"({"version": 2, "items": []})");
    EXPECT_TRUE(store.load().empty());

    write_raw(path, R"([1, 2, 3])");
    EXPECT_TRUE(store.load().empty());
}

TEST_F(QueueStoreTest, BadEntriesAreSkipped) {
    auto path = test_dir_ / "queue.json";
    write_raw(path, R"({"version": 1, "items": [
        {"id": "good", "fileName": "a", "fileSize": 1, "status": "queued"},
        {"fileName": "no id"},
        {"id": "bad", "status": "exploded"},
        {"id": "typed-size", "status": "queued", "fileSize": "12"},
        {"id": "typed-status", "status": 4},
        {"id": "typed-retries", "status": "failed", "retryCount": "five"},
        {"id": "typed-title", "status": "queued", "metadata": {"title": 5}}
    ]})");

    json_file_queue_store store(path);
    auto items = store.load();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].id, "good");
}

TEST_F(QueueStoreTest, MistypedDocumentFieldsLoadEmpty) {
    auto path = test_dir_ / "queue.json";
    json_file_queue_store store(path);

    write_raw(path, R"({"version": "1", "items": []})");
    EXPECT_TRUE(store.load().empty());

    write_raw(path, R"({"version": 1, "items": {"id": "a"}})");
    EXPECT_TRUE(store.load().empty());
}

TEST_F(QueueStoreTest, NonUtf8NamesAreSavedWithReplacement) {
    json_file_queue_store store(test_dir_ / "queue.json");
    auto item = make_upload_item(std::make_shared<memory_byte_source>(std::vector<std::byte>(3)),
                                 "caf\xe9.jpg");

    store.save({item});
    ASSERT_TRUE(std::filesystem::exists(store.path()));

    auto items = store.load();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].id, item.id);
    EXPECT_EQ(items[0].file_name, "caf\xef\xbf\xbd.jpg");
}

TEST_F(QueueStoreTest, MemoryStoreBehavesLikeRestart) {
    memory_queue_store store;
    EXPECT_TRUE(store.load().empty());
    EXPECT_EQ(store.save_count(), 0u);

    auto item = make_upload_item(std::make_shared<memory_byte_source>(std::vector<std::byte>(4)),
                                 "mem.bin");
    item.status = upload_status::uploading;
    store.save({item});

    EXPECT_EQ(store.save_count(), 1u);
    auto items = store.load();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].status, upload_status::queued);
    EXPECT_EQ(items[0].file, nullptr);
}

}  // namespace upload_pipeline::test
