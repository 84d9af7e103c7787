// EN: Unit tests for PathGuard
// FR: Tests unitaires pour PathGuard

#include <gtest/gtest.h>
#include "tnorm/fs/path_guard.hpp"
#include "tnorm/core/errors.hpp"
#include "tnorm/infrastructure/logging/logger.hpp"

#include <filesystem>
#include <fstream>

using namespace TNORM;
using namespace TNORM::FS;
namespace fs = std::filesystem;

class PathGuardTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        base_ = fs::temp_directory_path() / "tnorm_path_guard_test";
        fs::remove_all(base_);
        fs::create_directories(base_ / "root_a" / "in");
        fs::create_directories(base_ / "root_b" / "only_b");
        fs::create_directories(base_ / "outside");
        std::ofstream(base_ / "root_a" / "in" / "a.csv") << "x\n";
        std::ofstream(base_ / "outside" / "secret.csv") << "s\n";
        root_a_ = fs::weakly_canonical(base_ / "root_a");
        root_b_ = fs::weakly_canonical(base_ / "root_b");
    }

    void TearDown() override {
        fs::remove_all(base_);
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
    }

    fs::path base_;
    fs::path root_a_;
    fs::path root_b_;
};

// EN: Resolution
// FR: Résolution

TEST_F(PathGuardTest, ResolvesRelativePathInFirstRoot) {
    PathGuard guard({root_a_, root_b_});
    EXPECT_EQ(guard.resolve("in/a.csv"), root_a_ / "in" / "a.csv");
}

TEST_F(PathGuardTest, StripsLeadingSeparatorsAndBackslashes) {
    PathGuard guard({root_a_});
    EXPECT_EQ(guard.resolve("/in/a.csv"), root_a_ / "in" / "a.csv");
    EXPECT_EQ(guard.resolve("\\in\\a.csv"), root_a_ / "in" / "a.csv");
    EXPECT_EQ(PathGuard::stripSeparatorNoise("::/x\\y"), "x/y");
    EXPECT_EQ(PathGuard::stripSeparatorNoise("///"), "");
}

TEST_F(PathGuardTest, AcceptsAbsolutePathInsideRoot) {
    PathGuard guard({root_a_, root_b_});
    const fs::path inside = root_b_ / "only_b";
    EXPECT_EQ(guard.resolve(inside.string()), inside);
}

TEST_F(PathGuardTest, RejectsParentTraversal) {
    PathGuard guard({root_a_});
    EXPECT_THROW(guard.resolve("../outside/secret.csv"), PathOutsideAllowedRootsError);
    EXPECT_THROW(guard.resolve("in/../../outside/secret.csv"), PathOutsideAllowedRootsError);
}

TEST_F(PathGuardTest, RejectsAbsoluteEscape) {
    PathGuard guard({root_a_});
    const fs::path outside = fs::weakly_canonical(base_ / "outside") / "secret.csv";
    EXPECT_THROW(guard.resolve(outside.string()), PathOutsideAllowedRootsError);
    EXPECT_THROW(guard.resolve((root_a_ / ".." / "outside" / "secret.csv").string()), PathOutsideAllowedRootsError);
    EXPECT_THROW(guard.resolve("/etc/passwd"), PathOutsideAllowedRootsError);
    EXPECT_TRUE(guard.resolveAll(outside.string()).empty());

    // EN: Nothing was created under the root for the rejected inputs.
    // FR: Rien n'a été créé sous la racine pour les entrées rejetées.
    EXPECT_FALSE(fs::exists(root_a_ / "etc"));
    EXPECT_EQ(guard.resolve("/in/a.csv"), root_a_ / "in" / "a.csv");
}

TEST_F(PathGuardTest, RejectsSiblingWithSharedPrefix) {
    fs::create_directories(base_ / "root_a_evil");
    PathGuard guard({root_a_});
    EXPECT_FALSE(guard.isAllowed(base_ / "root_a_evil" / "x.csv"));
    EXPECT_THROW(guard.resolve("../root_a_evil/x.csv"), PathOutsideAllowedRootsError);
}

TEST_F(PathGuardTest, RejectsSymlinkEscape) {
    std::error_code ec;
    fs::create_directory_symlink(base_ / "outside", root_a_ / "link", ec);
    if (ec) {
        GTEST_SKIP() << "symlinks unavailable: " << ec.message();
    }
    PathGuard guard({root_a_});
    EXPECT_THROW(guard.resolve("link/secret.csv"), PathOutsideAllowedRootsError);
}

TEST_F(PathGuardTest, EmptyRootListThrows) {
    PathGuard guard({});
    EXPECT_THROW(guard.resolve("in/a.csv"), RootsNotConfiguredError);
    EXPECT_THROW(guard.resolveAll(""), RootsNotConfiguredError);

    try {
        guard.resolve("x");
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ROOTS_NOT_CONFIGURED);
    }
}

TEST_F(PathGuardTest, OutsideErrorCarries403) {
    PathGuard guard({root_a_});
    try {
        guard.resolve("../outside");
        FAIL() << "expected PathOutsideAllowedRootsError";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.status(), 403);
        EXPECT_EQ(e.path(), "../outside");
    }
}

// EN: Multi-root helpers
// FR: Utilitaires multi-racines

TEST_F(PathGuardTest, ResolveAllReturnsOneCandidatePerRoot) {
    PathGuard guard({root_a_, root_b_});
    const auto all = guard.resolveAll("");
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0], root_a_);
    EXPECT_EQ(all[1], root_b_);
    EXPECT_TRUE(guard.resolveAll("../outside").empty());
}

TEST_F(PathGuardTest, DuplicateRootsAreCollapsed) {
    PathGuard guard({root_a_, root_a_ / "", root_a_ / "in" / ".."});
    EXPECT_EQ(guard.roots().size(), 1u);
}

TEST_F(PathGuardTest, RelativeToReportsOwningRoot) {
    PathGuard guard({root_a_, root_b_});
    auto rooted = guard.relativeTo(root_b_ / "only_b" / "f.csv");
    ASSERT_TRUE(rooted.has_value());
    EXPECT_EQ(rooted->root, root_b_);
    EXPECT_EQ(rooted->relative.generic_string(), "only_b/f.csv");
    EXPECT_FALSE(guard.relativeTo(base_ / "outside").has_value());
    EXPECT_FALSE(guard.relativeTo(fs::path()).has_value());
}
