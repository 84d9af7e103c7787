// EN: Unit tests for PresetStore and PresetResolver
// FR: Tests unitaires pour PresetStore et PresetResolver

#include <gtest/gtest.h>
#include "tnorm/preset/preset_resolver.hpp"
#include "tnorm/preset/preset_store.hpp"
#include "tnorm/core/errors.hpp"
#include "tnorm/infrastructure/logging/logger.hpp"

#include <filesystem>
#include <fstream>

using namespace TNORM;
using namespace TNORM::Preset;
namespace fs = std::filesystem;

namespace {

const std::string kVendorPreset = R"(
header_map:
  JANコード: jan
  商品名: title
required_headers: [jan]
order: [jan, title, price]
trim_whitespace: false
encoding_out: cp932
newline_out: LF
validate:
  numeric_columns: [price]
  patterns:
    jan: "\\d{13}"
on_missing_order_column: error
)";

} // namespace

class PresetResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        dir_ = fs::temp_directory_path() / "tnorm_preset_test";
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        write("vendor.yaml", kVendorPreset);
        write("plain.json", R"({"order": ["a", "b"], "drop_empty_rows": false})");
        write("broken.yml", "header_map: [not, a, map]\n");
        write("notes.txt", "ignored");
    }

    void TearDown() override {
        fs::remove_all(dir_);
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
    }

    void write(const std::string& name, const std::string& content) {
        std::ofstream(dir_ / name) << content;
    }

    fs::path dir_;
};

// EN: Preset store
// FR: Magasin de presets

TEST_F(PresetResolverTest, ListsPresetStemsSorted) {
    PresetStore store(dir_);
    EXPECT_EQ(store.list(), (std::vector<std::string>{"broken", "plain", "vendor"}));
    EXPECT_TRUE(PresetStore(dir_ / "absent").list().empty());
}

TEST_F(PresetResolverTest, LoadsYamlPreset) {
    PresetStore store(dir_);
    const Preset::Preset preset = store.load("vendor");
    EXPECT_EQ(preset.name, "vendor");
    EXPECT_EQ(preset.source, dir_ / "vendor.yaml");
    ASSERT_TRUE(preset.fields.header_map.has_value());
    EXPECT_EQ(preset.fields.header_map->at("JANコード"), "jan");
    EXPECT_EQ(preset.fields.order, (std::vector<std::string>{"jan", "title", "price"}));
    EXPECT_EQ(preset.fields.trim_whitespace, false);
    EXPECT_FALSE(preset.fields.drop_empty_rows.has_value());
    ASSERT_TRUE(preset.fields.validate.has_value());
    EXPECT_EQ(preset.fields.validate->pattern_columns.at("jan"), "\\d{13}");
    EXPECT_EQ(preset.fields.on_missing_order_column, MissingColumnPolicy::ERROR);
}

TEST_F(PresetResolverTest, LoadsJsonPreset) {
    const Preset::Preset preset = PresetStore(dir_).load("plain");
    EXPECT_EQ(preset.fields.order, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(preset.fields.drop_empty_rows, false);
}

TEST_F(PresetResolverTest, MissingPresetIsNotFound) {
    try {
        PresetStore(dir_).load("nope");
        FAIL() << "expected PresetNotFoundError";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::PRESET_NOT_FOUND);
        EXPECT_EQ(e.status(), 404);
        EXPECT_EQ(e.details(), std::vector<std::string>{"nope"});
    }
}

TEST_F(PresetResolverTest, MalformedPresetIsLoadError) {
    EXPECT_THROW(PresetStore(dir_).load("broken"), PresetLoadError);
    EXPECT_THROW(PresetStore::parse("x", "on_missing_order_column: sometimes\n"), PresetLoadError);
}

TEST_F(PresetResolverTest, PresetNamesCannotEscapeDirectory) {
    PresetStore store(dir_);
    EXPECT_THROW(store.load("../vendor"), InvalidArgumentError);
    EXPECT_THROW(store.load("sub/vendor"), InvalidArgumentError);
    EXPECT_THROW(store.load(""), InvalidArgumentError);
}

// EN: Merge rules
// FR: Règles de fusion

TEST_F(PresetResolverTest, DefaultsWithoutPreset) {
    PresetStore store(dir_);
    PresetResolver resolver(store);
    const EffectiveConfig config = resolver.resolve(std::nullopt, {});

    EXPECT_FALSE(config.preset_name.has_value());
    EXPECT_TRUE(config.header_map.value.empty());
    EXPECT_TRUE(config.trim_whitespace.value);
    EXPECT_TRUE(config.drop_empty_rows.value);
    EXPECT_EQ(config.encoding_in.value, "auto");
    EXPECT_EQ(config.encoding_out.value, "utf-8-sig");
    EXPECT_EQ(config.newline_out.value, Text::NewlineStyle::CRLF);
    EXPECT_EQ(config.on_missing_order_column.value, MissingColumnPolicy::FILL);
    EXPECT_EQ(config.encoding_out.source, ValueSource::DEFAULT);
}

TEST_F(PresetResolverTest, CallerBeatsPresetBeatsDefault) {
    PresetStore store(dir_);
    PresetResolver resolver(store);

    PresetFields overrides;
    overrides.encoding_out = "UTF8";
    overrides.trim_whitespace = true;
    const EffectiveConfig config = resolver.resolve(std::string("vendor"), overrides);

    EXPECT_EQ(config.preset_name, "vendor");
    EXPECT_EQ(config.encoding_out.value, "utf-8");
    EXPECT_EQ(config.encoding_out.source, ValueSource::CALLER);
    EXPECT_TRUE(config.trim_whitespace.value);
    EXPECT_EQ(config.trim_whitespace.source, ValueSource::CALLER);
    EXPECT_EQ(config.newline_out.value, Text::NewlineStyle::LF);
    EXPECT_EQ(config.newline_out.source, ValueSource::PRESET);
    EXPECT_TRUE(config.drop_empty_rows.value);
    EXPECT_EQ(config.drop_empty_rows.source, ValueSource::DEFAULT);
}

TEST_F(PresetResolverTest, FalseOverrideIsNotTreatedAsUnset) {
    PresetStore store(dir_);
    PresetResolver resolver(store);

    PresetFields overrides;
    overrides.drop_empty_rows = false;
    overrides.order = std::vector<std::string>{};
    const EffectiveConfig config = resolver.resolve(std::string("vendor"), overrides);

    EXPECT_FALSE(config.drop_empty_rows.value);
    EXPECT_TRUE(config.order.value.empty());
    EXPECT_EQ(config.order.source, ValueSource::CALLER);
}

TEST_F(PresetResolverTest, HeaderMapIsUnionWithCallerWinning) {
    PresetStore store(dir_);
    PresetResolver resolver(store);

    PresetFields overrides;
    overrides.header_map = CSV::HeaderMap{{"商品名", "name"}, {"価格", "price"}};
    const EffectiveConfig config = resolver.resolve(std::string("vendor"), overrides);

    EXPECT_EQ(config.header_map.value.size(), 3u);
    EXPECT_EQ(config.header_map.value.at("JANコード"), "jan");
    EXPECT_EQ(config.header_map.value.at("商品名"), "name");
    EXPECT_EQ(config.header_map.value.at("価格"), "price");
    EXPECT_EQ(config.header_map.source, ValueSource::CALLER);
}

TEST_F(PresetResolverTest, RequiredHeadersBecomeEmptyForbiddenByDefault) {
    PresetFields overrides;
    overrides.required_headers = std::vector<std::string>{"sku"};
    const EffectiveConfig config = PresetResolver::merge(std::nullopt, overrides);
    EXPECT_EQ(config.validate.value.empty_forbidden_columns, std::vector<std::string>{"sku"});

    CSV::ValidationRules explicit_rules;
    explicit_rules.empty_forbidden_columns = {"name"};
    overrides.validate = explicit_rules;
    EXPECT_EQ(PresetResolver::merge(std::nullopt, overrides).validate.value.empty_forbidden_columns,
              std::vector<std::string>{"name"});
}

TEST_F(PresetResolverTest, ResolutionIsIdempotent) {
    PresetStore store(dir_);
    PresetResolver resolver(store);
    PresetFields overrides;
    overrides.order = std::vector<std::string>{"jan"};
    EXPECT_EQ(resolver.resolve(std::string("vendor"), overrides), resolver.resolve(std::string("vendor"), overrides));
}

TEST_F(PresetResolverTest, InvalidOverridesAreRejected) {
    PresetFields bad_newline;
    bad_newline.newline_out = "CR";
    EXPECT_THROW(PresetResolver::merge(std::nullopt, bad_newline), InvalidArgumentError);

    PresetFields bad_encoding;
    bad_encoding.encoding_out = "no-such-encoding-xyz";
    EXPECT_THROW(PresetResolver::merge(std::nullopt, bad_encoding), EngineError);

    PresetFields auto_out;
    auto_out.encoding_out = "auto";
    EXPECT_THROW(PresetResolver::merge(std::nullopt, auto_out), EngineError);
}
