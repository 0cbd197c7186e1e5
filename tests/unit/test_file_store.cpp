#include <gtest/gtest.h>
#include "nearfetch/storage/indexed_file_store.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace nearfetch::storage;
using nearfetch::transfer::TransferError;

class FileStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_dir_ = std::filesystem::temp_directory_path() / "nearfetch_file_store_test";
        std::filesystem::remove_all(base_dir_);

        config_ = StorageConfig(base_dir_);
        store_ = std::make_unique<IndexedFileStore>(config_);
        ASSERT_TRUE(store_->initialize());
    }

    void TearDown() override {
        store_.reset();
        std::filesystem::remove_all(base_dir_);
    }

    std::filesystem::path write_file(const std::filesystem::path& path, const std::string& content) {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path;
    }

    static std::string read_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::filesystem::path base_dir_;
    StorageConfig config_;
    std::unique_ptr<IndexedFileStore> store_;
};

TEST_F(FileStoreTest, InitializeCreatesLayout) {
    EXPECT_TRUE(std::filesystem::is_directory(config_.download_directory));
    EXPECT_TRUE(std::filesystem::is_directory(config_.incoming_directory));
    EXPECT_TRUE(std::filesystem::exists(config_.database_path));
}

TEST_F(FileStoreTest, SharedFileIsLocatable) {
    auto source = write_file(base_dir_ / "shared" / "photo.jpg", "jpegdata");

    EXPECT_FALSE(store_->exists("photo.jpg"));
    ASSERT_TRUE(store_->share_file("photo.jpg", source));

    EXPECT_TRUE(store_->exists("photo.jpg"));
    auto location = store_->locate("photo.jpg");
    ASSERT_TRUE(location.has_value());
    EXPECT_EQ(read_file(*location), "jpegdata");

    auto files = store_->list_shared_files();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].file_id, "photo.jpg");
    EXPECT_EQ(files[0].file_size, 8u);
}

TEST_F(FileStoreTest, ShareRejectsMissingFiles) {
    auto result = store_->share_file("ghost.txt", base_dir_ / "ghost.txt");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, TransferError::FILE_UNAVAILABLE);
    EXPECT_FALSE(store_->share_file("", base_dir_ / "ghost.txt"));
}

TEST_F(FileStoreTest, DeletedFileIsNoLongerAvailable) {
    auto source = write_file(base_dir_ / "shared" / "memo.txt", "memo");
    ASSERT_TRUE(store_->share_file("memo.txt", source));

    std::filesystem::remove(source);
    EXPECT_FALSE(store_->exists("memo.txt"));
    EXPECT_FALSE(store_->locate("memo.txt").has_value());
}

TEST_F(FileStoreTest, Unshare) {
    auto source = write_file(base_dir_ / "shared" / "memo.txt", "memo");
    ASSERT_TRUE(store_->share_file("memo.txt", source));

    EXPECT_EQ(store_->shared_file_count(), 1u);

    EXPECT_TRUE(store_->unshare_file("memo.txt"));
    EXPECT_FALSE(store_->exists("memo.txt"));
    EXPECT_FALSE(store_->unshare_file("memo.txt"));
    EXPECT_EQ(store_->shared_file_count(), 0u);
}

TEST_F(FileStoreTest, IndexSurvivesReopen) {
    ASSERT_TRUE(store_->share_file("a.txt", write_file(base_dir_ / "shared" / "a.txt", "a")));
    ASSERT_TRUE(store_->share_file("b.txt", write_file(base_dir_ / "shared" / "b.txt", "b")));
    ASSERT_TRUE(store_->share_file("a.txt", write_file(base_dir_ / "shared" / "a2.txt", "aa")));

    store_ = std::make_unique<IndexedFileStore>(config_);
    ASSERT_TRUE(store_->initialize());

    EXPECT_EQ(store_->shared_file_count(), 2u);
    auto location = store_->locate("a.txt");
    ASSERT_TRUE(location.has_value());
    EXPECT_EQ(read_file(*location), "aa");
}

TEST_F(FileStoreTest, CommitMovesIntoDownloads) {
    auto temp = write_file(config_.incoming_directory / "part-1", "payload");

    std::filesystem::path location;
    auto result = store_->commit(temp, "report.pdf", location);

    ASSERT_TRUE(result);
    EXPECT_EQ(location, config_.download_directory / "report.pdf");
    EXPECT_EQ(result.location, location);
    EXPECT_FALSE(std::filesystem::exists(temp));
    EXPECT_EQ(read_file(location), "payload");

    // Committed files can be served onwards.
    EXPECT_EQ(store_->locate("report.pdf"), location);
}

TEST_F(FileStoreTest, CommitNeverOverwrites) {
    write_file(config_.download_directory / "report.pdf", "original");

    std::filesystem::path first;
    ASSERT_TRUE(store_->commit(write_file(config_.incoming_directory / "a", "second"), "report.pdf", first));
    std::filesystem::path second;
    ASSERT_TRUE(store_->commit(write_file(config_.incoming_directory / "b", "third"), "report.pdf", second));

    EXPECT_EQ(first, config_.download_directory / "report (1).pdf");
    EXPECT_EQ(second, config_.download_directory / "report (2).pdf");
    EXPECT_EQ(read_file(config_.download_directory / "report.pdf"), "original");
    EXPECT_EQ(read_file(first), "second");
    EXPECT_EQ(read_file(second), "third");
}

TEST_F(FileStoreTest, CommitStripsDirectoriesFromName) {
    auto temp = write_file(config_.incoming_directory / "c", "data");

    std::filesystem::path location;
    ASSERT_TRUE(store_->commit(temp, "../../etc/passwd", location));
    EXPECT_EQ(location, config_.download_directory / "passwd");
}

TEST_F(FileStoreTest, CommitFailures) {
    std::filesystem::path location;

    auto missing = store_->commit(config_.incoming_directory / "nothing", "a.txt", location);
    EXPECT_EQ(missing.error, TransferError::STORAGE_COMMIT_FAILED);

    auto temp = write_file(config_.incoming_directory / "d", "data");
    auto unnamed = store_->commit(temp, "", location);
    EXPECT_EQ(unnamed.error, TransferError::STORAGE_COMMIT_FAILED);
    EXPECT_TRUE(std::filesystem::exists(temp));
    EXPECT_TRUE(location.empty());
}

TEST(StorageConfigTest, Layout) {
    StorageConfig config("/data/nf");
    EXPECT_TRUE(config.validate());
    EXPECT_EQ(config.get_download_path("x/y.txt"), std::filesystem::path("/data/nf/downloads/y.txt"));
    EXPECT_EQ(config.get_incoming_path("z.bin"), std::filesystem::path("/data/nf/incoming/z.bin"));

    config.incoming_directory = config.download_directory;
    EXPECT_FALSE(config.validate());
    EXPECT_FALSE(StorageConfig().validate());
}
