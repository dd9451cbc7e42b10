#include <gtest/gtest.h>
#include "tessera/atlas/config.hpp"

using namespace tessera;
using namespace tessera::atlas;

TEST(PackerConfigTest, Defaults) {
    PackerConfig config;
    EXPECT_EQ(config.columns, 20u);
    EXPECT_EQ(config.icon_sizes, (std::vector<u32>{16, 24, 32, 64}));
    EXPECT_EQ(config.supersample, 4u);
    EXPECT_EQ(config.output_root, std::filesystem::path("atlases"));
    EXPECT_FALSE(config.fixed_rows.has_value());
    EXPECT_EQ(config.fallback, Color::white());
    EXPECT_TRUE(config.validate().is_ok());
}

TEST(PackerConfigTest, RejectsNonPositiveValues) {
    auto expect_invalid = [](PackerConfig config) {
        auto result = config.validate();
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code, PackErrorCode::InvalidConfig);
    };

    PackerConfig c;
    c.columns = 0;
    expect_invalid(c);

    c = PackerConfig{};
    c.icon_sizes.clear();
    expect_invalid(c);

    c = PackerConfig{};
    c.icon_sizes = {16, 0};
    expect_invalid(c);

    c = PackerConfig{};
    c.supersample = 0;
    expect_invalid(c);

    c = PackerConfig{};
    c.fixed_rows = 0u;
    expect_invalid(c);

    c = PackerConfig{};
    c.parallel_jobs = 0;
    expect_invalid(c);

    c = PackerConfig{};
    c.output_root.clear();
    expect_invalid(c);
}

TEST(PackerConfigTest, CapacityOnlyWithFixedRows) {
    PackerConfig config;
    EXPECT_FALSE(config.capacity().has_value());

    config.fixed_rows = 16u;
    EXPECT_EQ(config.capacity(), 320u);
}

TEST(PackerConfigTest, DerivedGridAndAssemblerOptions) {
    PackerConfig config;
    config.columns = 8;
    config.supersample = 2;
    config.fixed_rows = 3u;
    config.worker_threads = 5;
    config.fallback = Color::black();

    GridConfig grid = config.grid_for(48);
    EXPECT_EQ(grid.columns, 8u);
    EXPECT_EQ(grid.icon_size, 48u);
    EXPECT_EQ(grid.supersample, 2u);
    EXPECT_EQ(grid.fixed_rows, 3u);

    AssemblerOptions options = config.assembler_options();
    EXPECT_EQ(options.worker_threads, 5u);
    EXPECT_EQ(options.fallback, Color::black());
}
