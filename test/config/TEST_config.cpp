#include <filesystem>
#include <fstream>
#include <optional>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "shpure/Analyzer.hpp"
#include "shpure/Config.hpp"

namespace shpure::config::test {

using json = nlohmann::json;

TEST(ConfigTest, DefaultsAreStrict) {
  PurifyOptions options;
  EXPECT_TRUE(options.strict_idempotency_);
  EXPECT_TRUE(options.remove_non_deterministic_);
  EXPECT_TRUE(options.track_side_effects_);
  EXPECT_FALSE(options.type_check_);
  EXPECT_FALSE(options.format_.keepBlankLines());
  EXPECT_FALSE(options.format_.keepContinuations());
}

TEST(ConfigTest, ReadsKnownKeys) {
  auto object = json::parse(R"({
    "strict_idempotency": false,
    "type_check": true,
    "preserve_formatting": true,
    "max_line_length": 80,
    "disabled_categories": ["security", "side-effect"]
  })");

  auto options = options_from_json(object);
  ASSERT_TRUE(options.has_value()) << options.error();
  EXPECT_FALSE(options->strict_idempotency_);
  EXPECT_TRUE(options->type_check_);
  EXPECT_TRUE(options->format_.keepBlankLines());
  EXPECT_TRUE(options->format_.keepContinuations());
  EXPECT_EQ(options->format_.max_line_length_, std::optional<std::size_t>{80});
  ASSERT_EQ(options->disabled_categories_.size(), 2);
  EXPECT_EQ(options->disabled_categories_[0], core::Category::Security);
  EXPECT_EQ(options->disabled_categories_[1], core::Category::SideEffect);
}

TEST(ConfigTest, UnknownKeysAreIgnored) {
  auto options = options_from_json(json::parse(R"({"colour": "always"})"));
  ASSERT_TRUE(options.has_value());
  EXPECT_TRUE(options->strict_idempotency_);
}

TEST(ConfigTest, NullLineLengthMeansUnlimited) {
  auto options = options_from_json(json::parse(R"({"max_line_length": null})"));
  ASSERT_TRUE(options.has_value());
  EXPECT_FALSE(options->format_.max_line_length_.has_value());
}

TEST(ConfigTest, WrongTypesAreReported) {
  EXPECT_FALSE(options_from_json(json::parse(R"({"type_check": "yes"})")).has_value());
  EXPECT_FALSE(options_from_json(json::parse(R"({"max_line_length": 0})")).has_value());
  EXPECT_FALSE(options_from_json(json::parse(R"({"max_line_length": -5})")).has_value());
  EXPECT_FALSE(options_from_json(json::parse(R"({"disabled_categories": "security"})")).has_value());
  EXPECT_FALSE(options_from_json(json::parse(R"([1, 2])")).has_value());
}

TEST(ConfigTest, UnknownCategoryIsReported) {
  auto options = options_from_json(json::parse(R"({"disabled_categories": ["speed"]})"));
  ASSERT_FALSE(options.has_value());
  EXPECT_NE(options.error().find("speed"), std::string::npos);
}

TEST(ConfigTest, BaseOptionsAreKept) {
  PurifyOptions base;
  base.emit_guards_ = true;
  auto options      = options_from_json(json::parse(R"({"type_strict": true})"), base);
  ASSERT_TRUE(options.has_value());
  EXPECT_TRUE(options->emit_guards_);
  EXPECT_TRUE(options->type_strict_);
}

TEST(ConfigTest, LoadFromFile) {
  auto path = std::filesystem::temp_directory_path() / "shpure_config_test.json";
  {
    std::ofstream out{path};
    out << R"({"skip_blank_line_removal": true})";
  }
  auto options = load_options(path);
  std::filesystem::remove(path);

  ASSERT_TRUE(options.has_value()) << options.error();
  EXPECT_TRUE(options->format_.keepBlankLines());
  EXPECT_FALSE(options->format_.keepContinuations());
}

TEST(ConfigTest, LoadMissingFileFails) {
  auto options = load_options("/nonexistent/shpure.json");
  EXPECT_FALSE(options.has_value());
}

TEST(ConfigTest, AnalyzerCategoriesFollowOptions) {
  PurifyOptions options;
  options.strict_idempotency_       = false;
  options.remove_non_deterministic_ = false;
  options.disabled_categories_      = {core::Category::Security};

  auto cfg = analysis::AnalyzerConfig::from(options);
  EXPECT_FALSE(cfg.enabled(core::Category::Idempotency));
  EXPECT_FALSE(cfg.enabled(core::Category::Determinism));
  EXPECT_FALSE(cfg.enabled(core::Category::Reproducibility));
  EXPECT_FALSE(cfg.enabled(core::Category::Security));
  EXPECT_FALSE(cfg.enabled(core::Category::TypeSafety));
  EXPECT_TRUE(cfg.enabled(core::Category::Portability));
  EXPECT_TRUE(cfg.enabled(core::Category::SideEffect));
}

} // namespace shpure::config::test
