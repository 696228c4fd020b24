#include <array>
#include <expected>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "shpure/App.hpp"
#include "shpure/ArgParser.hpp"

namespace shpure::cli::test {

class ArgumentParserTest : public ::testing::Test {
protected:
  void SetUp() override {
    parser_ = std::make_unique<ArgumentParser>("test", "Test parser");
  }

  void TearDown() override {
    parser_.reset();
  }

  std::unique_ptr<ArgumentParser> parser_;
};

TEST_F(ArgumentParserTest, FlagOption) {
  parser_->add_argument("verbose", "v").desc("Enable verbose output");
  parser_->add_argument("help", "h").desc("Show help");

  auto argv   = std::array<char const*, 3>{"test", "--verbose", "--help"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->has("verbose"));
  EXPECT_TRUE(result->has("help"));
  EXPECT_EQ(result->get<std::string>("verbose"), "true");
}

TEST_F(ArgumentParserTest, PositionalArguments) {
  parser_->add_argument("verbose", "v").desc("Enable verbose output");

  auto argv   = std::array<char const*, 4>{"test", "build.sh", "--verbose", "Makefile"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->positional_.size(), 2);
  EXPECT_EQ(result->positional_[0], "build.sh");
  EXPECT_EQ(result->positional_[1], "Makefile");
}

TEST_F(ArgumentParserTest, OptionWithArguments) {
  parser_->add_argument("output", "o").value("file").desc("Output file");
  parser_->add_argument("report", "r").value().desc("Report format");

  auto argv   = std::array<char const*, 5>{"test", "-o", "out.sh", "--report", "json"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->get<std::string>("output"), "out.sh");
  EXPECT_EQ(result->get<std::string>("report"), "json");
}

TEST_F(ArgumentParserTest, UnknownOption) {
  parser_->add_argument("verbose", "v").desc("Enable verbose output");

  auto argv   = std::array<char const*, 2>{"test", "--unknown"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), "Unknown option: --unknown");
}

TEST_F(ArgumentParserTest, CombinedShortOptionsWithUnknown) {
  parser_->add_argument("verbose", "v").desc("Verbose mode");
  parser_->add_argument("help", "h").desc("Help");

  auto argv   = std::array<char const*, 2>{"test", "-vxh"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), "Unknown option: -x");
}

TEST_F(ArgumentParserTest, FlagWithValue) {
  parser_->add_argument("type-check").desc("Enable the gradual type check");

  auto argv   = std::array<char const*, 2>{"test", "--type-check=yes"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), "Flag option --type-check does not accept a value");
}

TEST_F(ArgumentParserTest, MissingArguments) {
  parser_->add_argument("output", "o").value("file").desc("Output file");

  auto argv   = std::array<char const*, 2>{"test", "--output"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), "Option --output requires a value");
}

TEST_F(ArgumentParserTest, ArgumentsStopAtNextOption) {
  parser_->add_argument("dialect", "d").value().desc("Dialect");
  parser_->add_argument("verbose", "v").desc("Verbose mode");

  auto argv   = std::array<char const*, 3>{"test", "-d", "-v"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), "Option -d requires a value");
}

TEST_F(ArgumentParserTest, ValueMustEndTheCluster) {
  parser_->add_argument("verbose", "v").desc("Verbose mode");
  parser_->add_argument("output", "o").value("file").desc("Output file");

  auto last   = std::array<char const*, 3>{"test", "-vo", "out.sh"};
  auto result = parser_->parse(last.size(), last.data());
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->get<std::string>("output"), "out.sh");

  auto middle = std::array<char const*, 3>{"test", "-ov", "out.sh"};
  EXPECT_FALSE(parser_->parse(middle.size(), middle.data()).has_value());
}

TEST_F(ArgumentParserTest, DefaultValues) {
  parser_->add_argument("report", "r").value().default_value("text").desc("Report format");

  auto argv   = std::array<char const*, 2>{"test", "in.sh"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->get<std::string>("report"), "text");
}

TEST_F(ArgumentParserTest, LongOptionWithEquals) {
  parser_->add_argument("max-line-length").value().desc("Wrap limit");

  auto argv   = std::array<char const*, 2>{"test", "--max-line-length=80"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->get<std::size_t>("max-line-length"), 80U);
  EXPECT_EQ(result->get<std::string>("max-line-length"), "80");
}

TEST_F(ArgumentParserTest, NumbersMustParseCompletely) {
  parser_->add_argument("max-line-length").value().desc("Wrap limit");

  auto argv   = std::array<char const*, 2>{"test", "--max-line-length=80x"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(result->get<std::size_t>("max-line-length").has_value());
}

TEST_F(ArgumentParserTest, DoubleHyphenEndsOptions) {
  parser_->add_argument("verbose", "v").desc("Verbose mode");

  auto argv   = std::array<char const*, 4>{"test", "-v", "--", "-weird-name.sh"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->positional_.size(), 1);
  EXPECT_EQ(result->positional_[0], "-weird-name.sh");
}

TEST_F(ArgumentParserTest, SingleDashIsPositional) {
  auto argv   = std::array<char const*, 2>{"test", "-"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->positional_.size(), 1);
  EXPECT_EQ(result->positional_[0], "-");
}

TEST_F(ArgumentParserTest, Help) {
  parser_->add_argument("output", "o").value("file").default_value("-").desc("Output file");
  auto text = parser_->help();
  EXPECT_TRUE(text.starts_with("Usage: test [OPTIONS]\n\nTest parser\n\n")) << text;
  EXPECT_NE(text.find("  -o, --output <file>\n    Output file (default: -)\n"), std::string::npos) << text;
}

TEST(DefaultParserTest, KnowsEveryFlag) {
  auto parser = create_default_arg_parser();
  auto argv   = std::array<char const*, 11>{
      "shpure",
      "--type-check",
      "--emit-guards",
      "--type-strict",
      "--no-side-effects",
      "--skip-consolidation",
      "-d",
      "make",
      "-r",
      "markdown",
      "Makefile",
  };
  auto result = parser.parse(argv.size(), argv.data());
  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_EQ(result->get<std::string>("dialect"), "make");
  EXPECT_EQ(result->get<std::string>("report"), "markdown");
  EXPECT_EQ(result->positional_, (std::vector<std::string>{"Makefile"}));
}

TEST_F(ArgumentParserTest, BoundFlagsWriteTheirField) {
  parser_->add_argument("type-check").sets(&config::PurifyOptions::type_check_, true);
  parser_->add_argument("keep-blank-lines").sets(&config::FormatOptions::skip_blank_line_removal_, true);
  parser_->add_argument("verbose", "v");

  auto argv = std::array<char const*, 4>{"test", "--keep-blank-lines", "-v", "in.sh"};
  auto args = parser_->parse(argv.size(), argv.data());
  ASSERT_TRUE(args.has_value());

  auto options = parser_->apply(*args);
  ASSERT_TRUE(options.has_value()) << options.error();
  EXPECT_FALSE(options->type_check_);
  EXPECT_TRUE(options->format_.skip_blank_line_removal_);
}

TEST_F(ArgumentParserTest, SetterReceivesTheValue) {
  parser_->add_argument("width", "w").value("columns").applies(
      [](config::PurifyOptions& options, std::string const& value) -> core::Result<void> {
        if (value == "none") {
          return std::unexpected(std::string{"width must be a number"});
        }
        options.format_.max_line_length_ = value.size();
        return {};
      }
  );

  auto argv = std::array<char const*, 3>{"test", "-w", "abcd"};
  auto args = parser_->parse(argv.size(), argv.data());
  ASSERT_TRUE(args.has_value());
  auto options = parser_->apply(*args);
  ASSERT_TRUE(options.has_value());
  EXPECT_EQ(options->format_.max_line_length_, 4U);

  auto bad    = std::array<char const*, 2>{"test", "--width=none"};
  auto parsed = parser_->parse(bad.size(), bad.data());
  ASSERT_TRUE(parsed.has_value());
  auto failed = parser_->apply(*parsed);
  ASSERT_FALSE(failed.has_value());
  EXPECT_EQ(failed.error(), "width must be a number");
}

TEST(DefaultParserApplyTest, FlagsOverrideTheBase) {
  auto parser = create_default_arg_parser();
  auto argv   = std::array<char const*, 6>{
      "shpure", "--no-idempotency", "--type-check", "--preserve-formatting", "--max-line-length=100", "in.sh"
  };
  auto args = parser.parse(argv.size(), argv.data());
  ASSERT_TRUE(args.has_value());

  config::PurifyOptions base;
  base.emit_guards_ = true;
  auto options      = parser.apply(*args, base);
  ASSERT_TRUE(options.has_value()) << options.error();
  EXPECT_FALSE(options->strict_idempotency_);
  EXPECT_TRUE(options->remove_non_deterministic_);
  EXPECT_TRUE(options->type_check_);
  EXPECT_TRUE(options->emit_guards_);
  EXPECT_TRUE(options->format_.preserve_formatting_);
  EXPECT_EQ(options->format_.max_line_length_, 100U);
}

TEST(DefaultParserApplyTest, EveryFormatFlagIsBound) {
  auto parser = create_default_arg_parser();
  auto argv   = std::array<char const*, 5>{
      "shpure", "--no-determinism", "--skip-blank-line-removal", "--skip-consolidation", "--type-strict"
  };
  auto args = parser.parse(argv.size(), argv.data());
  ASSERT_TRUE(args.has_value());

  auto options = parser.apply(*args);
  ASSERT_TRUE(options.has_value());
  EXPECT_FALSE(options->remove_non_deterministic_);
  EXPECT_TRUE(options->track_side_effects_);
  EXPECT_TRUE(options->type_strict_);
  EXPECT_TRUE(options->format_.skip_blank_line_removal_);
  EXPECT_TRUE(options->format_.skip_consolidation_);
  EXPECT_FALSE(options->format_.preserve_formatting_);
}

TEST(DefaultParserApplyTest, LineLengthMustBePositive) {
  auto parser = create_default_arg_parser();
  for (char const* value : {"--max-line-length=0", "--max-line-length=wide", "--max-line-length=80x"}) {
    auto argv = std::array<char const*, 3>{"shpure", value, "in.sh"};
    auto args = parser.parse(argv.size(), argv.data());
    ASSERT_TRUE(args.has_value());
    auto options = parser.apply(*args);
    ASSERT_FALSE(options.has_value()) << value;
    EXPECT_NE(options.error().find("--max-line-length"), std::string::npos);
  }
}

class AppTest : public ::testing::Test {
protected:
  std::filesystem::path dir_;

  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path()
         / ("shpure_app_" + std::string{::testing::UnitTest::GetInstance()->current_test_info()->name()});
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  auto write(std::string const& name, std::string const& content) const -> std::string {
    auto          path = dir_ / name;
    std::ofstream out{path, std::ios::binary};
    out << content;
    return path.string();
  }

  static auto read(std::string const& path) -> std::string {
    std::ifstream in{path, std::ios::binary};
    return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
  }
};

TEST_F(AppTest, PurifiesIntoTheOutputFile) {
  auto input  = write("setup.sh", "mkdir /tmp/work\n");
  auto output = (dir_ / "out.sh").string();
  auto argv   = std::array<char const*, 4>{"shpure", "-o", output.c_str(), input.c_str()};

  EXPECT_EQ(App{}.run(argv.size(), argv.data()), Success);
  EXPECT_EQ(read(output), "mkdir -p /tmp/work\n");
}

TEST_F(AppTest, DialectComesFromTheFileName) {
  auto input  = write("Makefile", "all: app\n\tcc -o app main.c\n");
  auto output = (dir_ / "out.mk").string();
  auto argv   = std::array<char const*, 4>{"shpure", "-o", output.c_str(), input.c_str()};

  EXPECT_EQ(App{}.run(argv.size(), argv.data()), Success);
  EXPECT_TRUE(read(output).starts_with(".PHONY: all\n")) << read(output);
}

TEST_F(AppTest, UsageErrors) {
  auto input = write("a.sh", "echo hi\n");

  auto none = std::array<char const*, 1>{"shpure"};
  EXPECT_EQ(App{}.run(none.size(), none.data()), UsageError);

  auto dialect = std::array<char const*, 4>{"shpure", "-d", "cobol", input.c_str()};
  EXPECT_EQ(App{}.run(dialect.size(), dialect.data()), UsageError);

  auto report = std::array<char const*, 4>{"shpure", "-r", "html", input.c_str()};
  EXPECT_EQ(App{}.run(report.size(), report.data()), UsageError);

  auto broken      = write("broken.sh", "if true; then echo\n");
  auto parse_error = std::array<char const*, 2>{"shpure", broken.c_str()};
  EXPECT_EQ(App{}.run(parse_error.size(), parse_error.data()), UsageError);
}

TEST_F(AppTest, IoErrors) {
  auto missing = (dir_ / "missing.sh").string();
  auto argv    = std::array<char const*, 2>{"shpure", missing.c_str()};
  EXPECT_EQ(App{}.run(argv.size(), argv.data()), IoError);

  auto input  = write("a.sh", "echo hi\n");
  auto config = (dir_ / "missing.json").string();
  auto args   = std::array<char const*, 4>{"shpure", "-c", config.c_str(), input.c_str()};
  EXPECT_EQ(App{}.run(args.size(), args.data()), IoError);
}

TEST_F(AppTest, ConfigFileIsApplied) {
  auto input  = write("setup.sh", "mkdir /tmp/work\n");
  auto config = write("shpure.json", R"({"strict_idempotency": false})");
  auto output = (dir_ / "out.sh").string();
  auto argv   = std::array<char const*, 6>{"shpure", "-c", config.c_str(), "-o", output.c_str(), input.c_str()};

  EXPECT_EQ(App{}.run(argv.size(), argv.data()), Success);
  EXPECT_EQ(read(output), "mkdir /tmp/work\n");
}

} // namespace shpure::cli::test
