// EN: Unit tests for the bulk orchestrator
// FR: Tests unitaires pour l'orchestrateur de masse

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "tnorm/engine/bulk_normalizer.hpp"
#include "tnorm/core/errors.hpp"
#include "tnorm/infrastructure/logging/logger.hpp"

#include <filesystem>
#include <fstream>
#include <memory>

using namespace TNORM;
using namespace TNORM::Engine;
using ::testing::ElementsAre;
namespace fs = std::filesystem;

class BulkNormalizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        base_ = fs::temp_directory_path() / "tnorm_bulk_test";
        fs::remove_all(base_);
        fs::create_directories(base_ / "root" / "in" / "sub");
        fs::create_directories(base_ / "second" / "in");
        root_ = fs::weakly_canonical(base_ / "root");
        second_ = fs::weakly_canonical(base_ / "second");

        write(root_ / "in" / "a.csv", "sku,name\n1,x\n2,y\n");
        write(root_ / "in" / "b.csv", "code,name\n1,x\n");
        write(root_ / "in" / "c.csv", "sku,name\n3,z\n3,w\n");
        write(root_ / "in" / "notes.txt", "not a csv");
        write(root_ / "in" / "sub" / "d.csv", "sku,name\n4,v\n");
        write(second_ / "in" / "e.csv", "sku,name\n5,u\n");

        build({root_});
    }

    void TearDown() override {
        bulk_.reset();
        normalizer_.reset();
        writer_.reset();
        presets_.reset();
        guard_.reset();
        fs::remove_all(base_);
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
    }

    void build(const std::vector<fs::path>& roots) {
        bulk_.reset();
        normalizer_.reset();
        writer_.reset();
        presets_.reset();
        guard_.reset();

        settings_.allowed_roots = roots;
        settings_.presets_dir = base_ / "presets";
        guard_ = std::make_unique<FS::PathGuard>(settings_.allowed_roots);
        presets_ = std::make_unique<Preset::PresetStore>(settings_.presets_dir);
        writer_ = std::make_unique<FS::AtomicFileWriter>(*guard_);
        normalizer_ = std::make_unique<SingleFileNormalizer>(settings_, *guard_, *presets_, *writer_);
        bulk_ = std::make_unique<BulkNormalizer>(settings_, *guard_, *normalizer_);
    }

    static void write(const fs::path& path, const std::string& content) {
        std::ofstream(path, std::ios::binary) << content;
    }

    BulkRequest requireSku() {
        BulkRequest request;
        request.subpath = "in";
        request.overrides.required_headers = std::vector<std::string>{"sku"};
        return request;
    }

    fs::path base_;
    fs::path root_;
    fs::path second_;
    EngineSettings settings_;
    std::unique_ptr<FS::PathGuard> guard_;
    std::unique_ptr<Preset::PresetStore> presets_;
    std::unique_ptr<FS::AtomicFileWriter> writer_;
    std::unique_ptr<SingleFileNormalizer> normalizer_;
    std::unique_ptr<BulkNormalizer> bulk_;
};

// EN: Discovery
// FR: Découverte

TEST_F(BulkNormalizerTest, PatternMatching) {
    EXPECT_TRUE(BulkNormalizer::matchesPattern("a.csv", "*.csv"));
    EXPECT_FALSE(BulkNormalizer::matchesPattern("notes.txt", "*.csv"));
    EXPECT_TRUE(BulkNormalizer::matchesPattern("sales_2024.csv", "sales_*.csv"));
    EXPECT_TRUE(BulkNormalizer::matchesPattern("b.csv", "[ab].csv"));
    EXPECT_FALSE(BulkNormalizer::matchesPattern("c.csv", "[ab].csv"));
}

TEST_F(BulkNormalizerTest, DiscoverIsSortedAndNonRecursiveByDefault) {
    const auto matches = bulk_->discover("in", "*.csv", false);
    ASSERT_EQ(matches.size(), 3u);
    EXPECT_EQ(matches[0].relative, "in/a.csv");
    EXPECT_EQ(matches[1].relative, "in/b.csv");
    EXPECT_EQ(matches[2].relative, "in/c.csv");
    EXPECT_EQ(matches[0].root, root_);
}

TEST_F(BulkNormalizerTest, DiscoverRecursive) {
    const auto matches = bulk_->discover("in", "*.csv", true);
    ASSERT_EQ(matches.size(), 4u);
    EXPECT_EQ(matches[3].relative, "in/sub/d.csv");
}

TEST_F(BulkNormalizerTest, DiscoverAcrossRootsInRootOrder) {
    build({root_, second_});
    const auto matches = bulk_->discover("in", "*.csv", false);
    ASSERT_EQ(matches.size(), 4u);
    EXPECT_EQ(matches[3].relative, "in/e.csv");
    EXPECT_EQ(matches[3].root, second_);
}

TEST_F(BulkNormalizerTest, DiscoverNeverLeavesRoots) {
    EXPECT_TRUE(bulk_->discover("..", "*.csv", true).empty());
    EXPECT_TRUE(bulk_->discover("../second/in", "*.csv", false).empty());
}

// EN: Runs
// FR: Exécutions

TEST_F(BulkNormalizerTest, ContinuesPastFailedFile) {
    const BulkReport report = bulk_->run(requireSku());

    EXPECT_EQ(report.matched, 3u);
    EXPECT_EQ(report.succeeded, 2u);
    EXPECT_EQ(report.failed, 1u);
    EXPECT_FALSE(report.ok);
    ASSERT_EQ(report.items.size(), 3u);
    EXPECT_TRUE(report.items[0].ok);
    EXPECT_FALSE(report.items[1].ok);
    EXPECT_TRUE(report.items[2].ok);
    EXPECT_EQ(report.items[1].input, "in/b.csv");
    EXPECT_EQ(report.items[1].code, ErrorCode::MISSING_REQUIRED_HEADERS);

    EXPECT_TRUE(fs::exists(root_ / "out" / "a_norm.csv"));
    EXPECT_FALSE(fs::exists(root_ / "out" / "b_norm.csv"));
    EXPECT_TRUE(fs::exists(root_ / "out" / "c_norm.csv"));
    EXPECT_TRUE(fs::exists(root_ / "out" / "a__report.csv"));
    EXPECT_EQ(report.items[0].output, (root_ / "out" / "a_norm.csv").string());
}

TEST_F(BulkNormalizerTest, IssuesAreSummedAcrossSucceededFiles) {
    BulkRequest request = requireSku();
    CSV::ValidationRules rules;
    rules.unique_columns = {"sku"};
    request.overrides.validate = rules;
    const BulkReport report = bulk_->run(request);

    EXPECT_EQ(report.items[0].issues, 0u);
    EXPECT_EQ(report.items[2].issues, 2u);
    EXPECT_EQ(report.total_issues, 2u);
    ASSERT_TRUE(report.items[2].report.has_value());
    EXPECT_EQ(report.items[2].report->by_rule.at("unique"), 2u);
}

TEST_F(BulkNormalizerTest, FailFastStopsAtFirstFailure) {
    BulkRequest request = requireSku();
    request.fail_fast = true;
    const BulkReport report = bulk_->run(request);

    EXPECT_EQ(report.matched, 3u);
    EXPECT_EQ(report.items.size(), 2u);
    EXPECT_EQ(report.succeeded, 1u);
    EXPECT_EQ(report.failed, 1u);
    EXPECT_FALSE(fs::exists(root_ / "out" / "c_norm.csv"));
}

TEST_F(BulkNormalizerTest, DryRunTouchesNothing) {
    BulkRequest request = requireSku();
    request.dry_run = true;
    const BulkReport report = bulk_->run(request);

    EXPECT_TRUE(report.dry_run);
    EXPECT_THAT(report.preview, ElementsAre("in/a.csv", "in/b.csv", "in/c.csv"));
    EXPECT_TRUE(report.items.empty());
    EXPECT_FALSE(fs::exists(root_ / "out"));

    const nlohmann::json json = report.toJson();
    EXPECT_EQ(json.size(), 3u);
    EXPECT_EQ(json["matched"], 3);
    EXPECT_FALSE(json.contains("items"));
}

TEST_F(BulkNormalizerTest, CustomOutputLayoutAndNoReports) {
    BulkRequest request = requireSku();
    request.output_dir = "clean";
    request.out_suffix = ".normalized.csv";
    request.report_dir = "";
    const BulkReport report = bulk_->run(request);

    EXPECT_TRUE(fs::exists(root_ / "clean" / "a.normalized.csv"));
    EXPECT_FALSE(fs::exists(root_ / "out"));
    EXPECT_FALSE(report.items[0].report.has_value());
}

TEST_F(BulkNormalizerTest, EmptyMatchHandling) {
    BulkRequest request;
    request.subpath = "in";
    request.pattern = "*.tsv";
    const BulkReport report = bulk_->run(request);
    EXPECT_EQ(report.matched, 0u);
    EXPECT_TRUE(report.ok);

    request.require_matches = true;
    try {
        bulk_->run(request);
        FAIL() << "expected NoFilesMatchedError";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NO_FILES_MATCHED);
        EXPECT_EQ(e.status(), 404);
    }
}

TEST_F(BulkNormalizerTest, MissingPresetFailsEveryItem) {
    BulkRequest request;
    request.subpath = "in";
    request.preset = "absent";
    const BulkReport report = bulk_->run(request);

    EXPECT_EQ(report.failed, 3u);
    EXPECT_EQ(report.items[0].code, ErrorCode::PRESET_NOT_FOUND);
}

TEST_F(BulkNormalizerTest, NoRootsIsFatal) {
    build({});
    EXPECT_THROW(bulk_->run(requireSku()), RootsNotConfiguredError);
}

TEST_F(BulkNormalizerTest, ItemJsonShape) {
    const BulkReport report = bulk_->run(requireSku());
    const nlohmann::json json = report.toJson();

    EXPECT_EQ(json["succeeded"], 2);
    EXPECT_EQ(json["failed"], 1);
    EXPECT_EQ(json["items"][1]["ok"], false);
    EXPECT_EQ(json["items"][1]["code"], "MissingRequiredHeaders");
    EXPECT_FALSE(json["items"][1].contains("output"));
    EXPECT_EQ(json["items"][0]["issues"], 0);
}
