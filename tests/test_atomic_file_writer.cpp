// EN: Unit tests for AtomicFileWriter and file metadata helpers
// FR: Tests unitaires pour AtomicFileWriter et les utilitaires de métadonnées

#include <gtest/gtest.h>
#include "tnorm/fs/atomic_file_writer.hpp"
#include "tnorm/fs/file_meta.hpp"
#include "tnorm/core/errors.hpp"
#include "tnorm/infrastructure/logging/logger.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <set>
#include <stdexcept>

using namespace TNORM;
using namespace TNORM::FS;
namespace fs = std::filesystem;

class AtomicFileWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        base_ = fs::temp_directory_path() / "tnorm_atomic_writer_test";
        fs::remove_all(base_);
        fs::create_directories(base_ / "root");
        root_ = fs::weakly_canonical(base_ / "root");
        guard_ = std::make_unique<PathGuard>(std::vector<fs::path>{root_});
        writer_ = std::make_unique<AtomicFileWriter>(*guard_);
    }

    void TearDown() override {
        writer_.reset();
        guard_.reset();
        fs::remove_all(base_);
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
    }

    std::string slurp(const fs::path& path) {
        return readFileBytes(path);
    }

    std::size_t countEntries(const fs::path& directory) {
        std::size_t count = 0;
        for (const auto& entry : fs::directory_iterator(directory)) {
            (void)entry;
            ++count;
        }
        return count;
    }

    fs::path base_;
    fs::path root_;
    std::unique_ptr<PathGuard> guard_;
    std::unique_ptr<AtomicFileWriter> writer_;
};

// EN: Basic writes
// FR: Écritures de base

TEST_F(AtomicFileWriterTest, CreatesParentDirectoriesAndWrites) {
    const fs::path target = root_ / "out" / "nested" / "a.csv";
    const WriteResult result = writer_->write(target, "a,b\r\n1,2\r\n");

    EXPECT_EQ(slurp(target), "a,b\r\n1,2\r\n");
    EXPECT_EQ(result.meta.size, 10u);
    EXPECT_EQ(result.meta.path, target);
    EXPECT_FALSE(result.backup_path.has_value());
    EXPECT_EQ(countEntries(target.parent_path()), 1u);
}

TEST_F(AtomicFileWriterTest, EmptyContentIsWritten) {
    const fs::path target = root_ / "empty.csv";
    writer_->write(target, "");
    EXPECT_TRUE(fs::exists(target));
    EXPECT_EQ(fs::file_size(target), 0u);
}

TEST_F(AtomicFileWriterTest, RejectsTargetOutsideRoots) {
    EXPECT_THROW(writer_->write(base_ / "escape.csv", "x"), PathOutsideAllowedRootsError);
    EXPECT_FALSE(fs::exists(base_ / "escape.csv"));
}

TEST_F(AtomicFileWriterTest, RejectsSymlinkPointingOutside) {
    fs::create_directories(base_ / "elsewhere");
    std::error_code ec;
    fs::create_symlink(base_ / "elsewhere" / "victim.csv", root_ / "link.csv", ec);
    if (ec) {
        GTEST_SKIP() << "symlinks unavailable: " << ec.message();
    }
    EXPECT_THROW(writer_->write(root_ / "link.csv", "x"), PathOutsideAllowedRootsError);
    EXPECT_FALSE(fs::exists(base_ / "elsewhere" / "victim.csv"));
}

TEST_F(AtomicFileWriterTest, OverwriteDisabledKeepsExistingFile) {
    const fs::path target = root_ / "keep.csv";
    writer_->write(target, "original");

    WriteOptions options;
    options.overwrite = false;
    try {
        writer_->write(target, "new", options);
        FAIL() << "expected OutputExistsError";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::OUTPUT_EXISTS);
        EXPECT_EQ(e.status(), 409);
    }
    EXPECT_EQ(slurp(target), "original");
    EXPECT_EQ(countEntries(root_), 1u);
}

// EN: Backups
// FR: Sauvegardes

TEST_F(AtomicFileWriterTest, BackupPreservesPreviousBytes) {
    const fs::path target = root_ / "data.csv";
    const std::string previous("old\0content\xFF", 12);
    writer_->write(target, previous);

    const WriteResult result = writer_->write(target, "new");
    ASSERT_TRUE(result.backup_path.has_value());
    EXPECT_EQ(result.backup_path->parent_path(), root_);
    EXPECT_EQ(result.backup_path->extension(), ".bak");
    EXPECT_EQ(result.backup_path->filename().string().rfind("data.csv__", 0), 0u);
    EXPECT_EQ(slurp(*result.backup_path), previous);
    EXPECT_EQ(slurp(target), "new");
}

TEST_F(AtomicFileWriterTest, BackupDisabledLeavesNoCopy) {
    const fs::path target = root_ / "data.csv";
    writer_->write(target, "one");

    WriteOptions options;
    options.backup = false;
    const WriteResult result = writer_->write(target, "two", options);
    EXPECT_FALSE(result.backup_path.has_value());
    EXPECT_EQ(countEntries(root_), 1u);
}

TEST_F(AtomicFileWriterTest, BackupNamesNeverCollide) {
    const fs::path target = root_ / "same.csv";
    const auto now = std::chrono::system_clock::now();
    const fs::path first = AtomicFileWriter::backupPathFor(target, now);
    std::ofstream(first) << "taken";
    const fs::path second = AtomicFileWriter::backupPathFor(target, now);

    EXPECT_NE(first, second);
    EXPECT_EQ(second.filename().string(), first.stem().string() + "_1.bak");
}

// EN: Atomicity
// FR: Atomicité

TEST_F(AtomicFileWriterTest, FailureBeforeRenameLeavesTargetUntouched) {
    const fs::path target = root_ / "atomic.csv";
    writer_->write(target, "complete old content");

    fs::path seen_temp;
    writer_->setBeforeRenameHook([&](const fs::path& temp_path) {
        seen_temp = temp_path;
        EXPECT_EQ(temp_path.parent_path(), root_);
        EXPECT_EQ(readFileBytes(temp_path), "complete new content");
        throw std::runtime_error("injected crash");
    });

    WriteOptions options;
    options.backup = false;
    EXPECT_THROW(writer_->write(target, "complete new content", options), std::runtime_error);

    EXPECT_EQ(slurp(target), "complete old content");
    EXPECT_FALSE(seen_temp.empty());
    EXPECT_FALSE(fs::exists(seen_temp));
    EXPECT_EQ(countEntries(root_), 1u);
}

TEST_F(AtomicFileWriterTest, FailureBeforeRenameOfNewTargetLeavesNothing) {
    const fs::path target = root_ / "fresh.csv";
    writer_->setBeforeRenameHook([](const fs::path&) { throw std::runtime_error("injected crash"); });

    EXPECT_THROW(writer_->write(target, "data"), std::runtime_error);
    EXPECT_FALSE(fs::exists(target));
    EXPECT_EQ(countEntries(root_), 0u);
}

TEST_F(AtomicFileWriterTest, TempNamesAreUniquePerCall) {
    const fs::path target = root_ / "t.csv";
    std::set<fs::path> names;
    for (int i = 0; i < 50; ++i) {
        names.insert(AtomicFileWriter::tempPathFor(target));
    }
    EXPECT_GT(names.size(), 45u);
    EXPECT_EQ(names.begin()->parent_path(), root_);
}

// EN: Metadata helpers
// FR: Utilitaires de métadonnées

TEST_F(AtomicFileWriterTest, StatAndReadHelpers) {
    const fs::path target = root_ / "meta.csv";
    writer_->write(target, "0123456789");

    const FileMeta meta = statFile(target);
    EXPECT_EQ(meta.size, 10u);
    EXPECT_EQ(meta.mtime.size(), 19u);
    EXPECT_EQ(readFileHead(target, 4), "0123");
    EXPECT_EQ(readFileHead(target, 100), "0123456789");
    EXPECT_THROW(statFile(root_ / "absent.csv"), InputFileNotFoundError);
    EXPECT_THROW(readFileBytes(root_ / "absent.csv"), InputFileNotFoundError);
}
