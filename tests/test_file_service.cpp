// EN: Unit tests for FileService
// FR: Tests unitaires pour FileService

#include <gtest/gtest.h>
#include "tnorm/fs/file_service.hpp"
#include "tnorm/core/errors.hpp"
#include "tnorm/infrastructure/logging/logger.hpp"

#include <filesystem>
#include <fstream>
#include <memory>

using namespace TNORM;
using namespace TNORM::FS;
namespace fs = std::filesystem;

class FileServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        base_ = fs::temp_directory_path() / "tnorm_file_service_test";
        fs::remove_all(base_);
        fs::create_directories(base_ / "root" / "data" / "nested");
        root_ = fs::weakly_canonical(base_ / "root");

        write("data/b.csv", "b\n");
        write("data/a.CSV", "a\n");
        write("data/readme.txt", "hello");
        write("data/nested/c.csv", "c\n");

        guard_ = std::make_unique<PathGuard>(std::vector<fs::path>{root_});
        writer_ = std::make_unique<AtomicFileWriter>(*guard_);
        service_ = std::make_unique<FileService>(*guard_, *writer_);
    }

    void TearDown() override {
        service_.reset();
        writer_.reset();
        guard_.reset();
        fs::remove_all(base_);
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
    }

    void write(const std::string& relative, const std::string& content) {
        std::ofstream(root_ / relative, std::ios::binary) << content;
    }

    fs::path base_;
    fs::path root_;
    std::unique_ptr<PathGuard> guard_;
    std::unique_ptr<AtomicFileWriter> writer_;
    std::unique_ptr<FileService> service_;
};

TEST_F(FileServiceTest, NormalizesExtensions) {
    EXPECT_EQ(FileService::normalizeExtensions({"csv", ".TSV", " txt ", ""}),
              (std::vector<std::string>{".csv", ".tsv", ".txt"}));
}

TEST_F(FileServiceTest, ParsesReadMode) {
    EXPECT_EQ(parseReadMode("TEXT"), ReadMode::TEXT);
    EXPECT_EQ(parseReadMode("head"), ReadMode::HEAD);
    EXPECT_FALSE(parseReadMode("bytes").has_value());
}

// EN: Listing
// FR: Listage

TEST_F(FileServiceTest, ListsSortedAndFiltersCaseInsensitively) {
    const FileListing listing = service_->list("data", {"csv"});

    ASSERT_EQ(listing.items.size(), 2u);
    EXPECT_EQ(listing.items[0].rel, "data/a.CSV");
    EXPECT_EQ(listing.items[1].rel, "data/b.csv");
    EXPECT_EQ(listing.items[1].name, "b.csv");
    EXPECT_EQ(listing.items[1].size, 2u);
    EXPECT_EQ(listing.base, root_ / "data");
}

TEST_F(FileServiceTest, ListsEverythingWithoutFilter) {
    EXPECT_EQ(service_->list("data").items.size(), 3u);
}

TEST_F(FileServiceTest, ListsRecursively) {
    const FileListing listing = service_->list("data", {".csv"}, true);
    ASSERT_EQ(listing.items.size(), 3u);
    EXPECT_EQ(listing.items[2].rel, "data/nested/c.csv");
}

TEST_F(FileServiceTest, ListHonorsLimit) {
    EXPECT_EQ(service_->list("data", {}, true, 2).items.size(), 2u);
}

TEST_F(FileServiceTest, ListRejectsBadDirectories) {
    EXPECT_THROW(service_->list("missing"), InputFileNotFoundError);
    EXPECT_THROW(service_->list("data/b.csv"), InputFileNotFoundError);
    EXPECT_THROW(service_->list("../"), PathOutsideAllowedRootsError);
}

TEST_F(FileServiceTest, ListingJsonShape) {
    const nlohmann::json json = service_->list("data", {"txt"}).toJson();
    EXPECT_EQ(json["count"], 1);
    EXPECT_EQ(json["items"][0]["name"], "readme.txt");
    EXPECT_TRUE(json["items"][0].contains("mtime"));
}

// EN: Reading
// FR: Lecture

TEST_F(FileServiceTest, ReadsWholeText) {
    const FileContent content = service_->read("data/readme.txt");
    EXPECT_EQ(content.text, "hello");
    EXPECT_FALSE(content.truncated);
    EXPECT_EQ(content.replacements, 0u);
}

TEST_F(FileServiceTest, ReadsHead) {
    const FileContent content = service_->read("data/readme.txt", ReadMode::HEAD, 3);
    EXPECT_EQ(content.text, "hel");
    EXPECT_TRUE(content.truncated);
    EXPECT_EQ(content.meta.size, 5u);

    EXPECT_FALSE(service_->read("data/readme.txt", ReadMode::HEAD, 100).truncated);
}

TEST_F(FileServiceTest, InvalidUtf8IsReplaced) {
    write("data/bad.txt", "a\xFF" "b");
    const FileContent content = service_->read("data/bad.txt");
    EXPECT_EQ(content.text, "a\xEF\xBF\xBD" "b");
    EXPECT_EQ(content.replacements, 1u);
    EXPECT_EQ(content.toJson()["replacements"], 1);
}

TEST_F(FileServiceTest, ReadMissingFile) {
    EXPECT_THROW(service_->read("data/none.txt"), InputFileNotFoundError);
}

// EN: Writing
// FR: Écriture

TEST_F(FileServiceTest, WritesAtomicallyWithBackup) {
    const WriteResult first = service_->write("notes/todo.txt", "one");
    EXPECT_FALSE(first.backup_path.has_value());
    EXPECT_EQ(readFileBytes(root_ / "notes" / "todo.txt"), "one");

    const WriteResult second = service_->write("notes/todo.txt", "two");
    ASSERT_TRUE(second.backup_path.has_value());
    EXPECT_EQ(readFileBytes(*second.backup_path), "one");

    const nlohmann::json json = writeResultToJson(second);
    EXPECT_EQ(json["ok"], true);
    EXPECT_EQ(json["size"], 3);
    EXPECT_TRUE(json["backup_path"].is_string());
}

TEST_F(FileServiceTest, WriteWithoutOverwriteFails) {
    EXPECT_THROW(service_->write("data/b.csv", "x", false), OutputExistsError);
    EXPECT_EQ(readFileBytes(root_ / "data" / "b.csv"), "b\n");
}

TEST_F(FileServiceTest, WriteOutsideRootsFails) {
    EXPECT_THROW(service_->write("../x.txt", "x"), PathOutsideAllowedRootsError);
}
