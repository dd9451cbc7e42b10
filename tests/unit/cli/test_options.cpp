#include <gtest/gtest.h>
#include "options.hpp"

using namespace tessera;
using namespace tessera::cli;

namespace {

Result<Options, std::string> parse(std::initializer_list<const char*> args) {
    std::vector<std::string> list;
    for (const char* arg : args) {
        list.emplace_back(arg);
    }
    return parse_arguments(list);
}

} // namespace

TEST(OptionsTest, DefaultsWithInputOnly) {
    auto result = parse({"icons"});
    ASSERT_TRUE(result.is_ok()) << result.error();
    const Options& o = result.value();

    EXPECT_EQ(o.input_root, std::filesystem::path("icons"));
    EXPECT_EQ(o.config.columns, 20u);
    EXPECT_EQ(o.config.icon_sizes, (std::vector<u32>{16, 24, 32, 64}));
    EXPECT_EQ(o.config.supersample, 4u);
    EXPECT_EQ(o.config.output_root, std::filesystem::path("atlases"));
    EXPECT_FALSE(o.config.fixed_rows.has_value());
    EXPECT_FALSE(o.verbose);
    EXPECT_FALSE(o.quiet);
    EXPECT_FALSE(o.log_file.has_value());
}

TEST(OptionsTest, AllValueOptions) {
    auto result = parse({"-c", "10", "--sizes", "8,48", "-s", "2", "-o", "out",
                         "-r", "5", "-t", "3", "-j", "2", "--log-file", "run.log", "src"});
    ASSERT_TRUE(result.is_ok()) << result.error();
    const Options& o = result.value();

    EXPECT_EQ(o.config.columns, 10u);
    EXPECT_EQ(o.config.icon_sizes, (std::vector<u32>{8, 48}));
    EXPECT_EQ(o.config.supersample, 2u);
    EXPECT_EQ(o.config.output_root, std::filesystem::path("out"));
    EXPECT_EQ(o.config.fixed_rows, std::optional<u32>(5));
    EXPECT_EQ(o.config.worker_threads, 3u);
    EXPECT_EQ(o.config.parallel_jobs, 2u);
    EXPECT_EQ(o.log_file, std::optional<std::filesystem::path>("run.log"));
    EXPECT_EQ(o.input_root, std::filesystem::path("src"));
}

TEST(OptionsTest, LongFormsMatchShortForms) {
    auto result = parse({"--columns", "4", "--supersample", "1", "--output", "o",
                         "--rows", "2", "--threads", "1", "--jobs", "4", "--verbose", "in"});
    ASSERT_TRUE(result.is_ok()) << result.error();
    EXPECT_EQ(result.value().config.columns, 4u);
    EXPECT_EQ(result.value().config.parallel_jobs, 4u);
    EXPECT_TRUE(result.value().verbose);
}

TEST(OptionsTest, HelpNeedsNoInput) {
    auto result = parse({"--help"});
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().show_help);
}

TEST(OptionsTest, MissingInput) {
    auto result = parse({"-c", "4"});
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("no input"), std::string::npos);
}

TEST(OptionsTest, SecondPositionalIsRejected) {
    EXPECT_TRUE(parse({"a", "b"}).is_err());
}

TEST(OptionsTest, UnknownOption) {
    auto result = parse({"--frobnicate", "1", "in"});
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("--frobnicate"), std::string::npos);
}

TEST(OptionsTest, MissingValue) {
    auto result = parse({"in", "--columns"});
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("needs a value"), std::string::npos);
}

TEST(OptionsTest, InvalidNumbers) {
    EXPECT_TRUE(parse({"-c", "abc", "in"}).is_err());
    EXPECT_TRUE(parse({"-c", "-3", "in"}).is_err());
    EXPECT_TRUE(parse({"-c", "12px", "in"}).is_err());
    EXPECT_TRUE(parse({"--sizes", "16,,32", "in"}).is_err());
    EXPECT_TRUE(parse({"--sizes", "", "in"}).is_err());
}

// Zero passes parsing; PackerConfig::validate rejects it
TEST(OptionsTest, ZeroIsParsed) {
    auto result = parse({"-c", "0", "in"});
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().config.columns, 0u);
    EXPECT_TRUE(result.value().config.validate().is_err());
}

TEST(OptionsTest, VerboseAndQuietConflict) {
    EXPECT_TRUE(parse({"-v", "-q", "in"}).is_err());
}

TEST(OptionsTest, UsageNamesProgram) {
    std::string text = usage("tessera");
    EXPECT_NE(text.find("Usage: tessera"), std::string::npos);
    EXPECT_NE(text.find("--sizes"), std::string::npos);
}
