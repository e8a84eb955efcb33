// =============================================================================
// config_loader_test.cpp
// =============================================================================
// Unit tests for riskcore::parse_config() and riskcore::load_config().
//
// Validates:
//   - Missing keys keep their defaults
//   - Top-level and nested overrides
//   - Type errors, invariant violations and unreadable files raise
//     ConfigError
//
// Files are written to the system temp directory and removed by the
// fixture.
// =============================================================================

#include "riskcore/config/config_loader.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

using nlohmann::json;
using riskcore::ConfigError;

class ConfigLoaderTest : public ::testing::Test {
 protected:
  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  std::string writeFile(const std::string& contents) {
    std::ofstream out(path_);
    out << contents;
    return path_.string();
  }

  std::filesystem::path path_ = std::filesystem::temp_directory_path() /
                                "riskcore_config_loader_test.json";
};

// -----------------------------------------------------------------------------
// 1. An empty object yields the built-in defaults.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, EmptyObjectGivesDefaults) {
  auto cfg = riskcore::parse_config(json::object());

  EXPECT_DOUBLE_EQ(cfg.max_daily_loss_pct, 10.0);
  EXPECT_EQ(cfg.max_concurrent_positions, 10);
  EXPECT_DOUBLE_EQ(cfg.max_single_stock_pct, 15.0);
  EXPECT_DOUBLE_EQ(cfg.max_sector_pct, 30.0);
  EXPECT_EQ(cfg.default_regime, "sideways");
  EXPECT_TRUE(cfg.enable_correlation_guard);
  EXPECT_TRUE(cfg.enable_var_sizing);
  EXPECT_DOUBLE_EQ(cfg.correlation_config.max_pairwise_correlation, 0.80);
  EXPECT_EQ(cfg.correlation_config.max_cluster_size, 4);
  EXPECT_DOUBLE_EQ(cfg.var_config.confidence_level, 0.95);
  EXPECT_TRUE(cfg.var_config.use_cvar);
}

// -----------------------------------------------------------------------------
// 2. Overrides apply at both levels; untouched nested keys keep defaults.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, OverridesApply) {
  json j = json::parse(R"({
    "max_daily_loss_pct": 5.0,
    "default_regime": "bear",
    "enable_var_sizing": false,
    "correlation": {"max_pairwise_correlation": 0.9},
    "var": {"confidence_level": 0.99, "use_cvar": false}
  })");

  auto cfg = riskcore::parse_config(j);
  EXPECT_DOUBLE_EQ(cfg.max_daily_loss_pct, 5.0);
  EXPECT_EQ(cfg.default_regime, "bear");
  EXPECT_FALSE(cfg.enable_var_sizing);
  EXPECT_DOUBLE_EQ(cfg.correlation_config.max_pairwise_correlation, 0.9);
  EXPECT_DOUBLE_EQ(cfg.correlation_config.cluster_threshold, 0.70);
  EXPECT_DOUBLE_EQ(cfg.var_config.confidence_level, 0.99);
  EXPECT_FALSE(cfg.var_config.use_cvar);
}

// -----------------------------------------------------------------------------
// 3. A mistyped value is a ConfigError.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, TypeErrorIsConfigError) {
  EXPECT_THROW(riskcore::parse_config(json{{"max_concurrent_positions", "ten"}}),
               ConfigError);
  EXPECT_THROW(riskcore::parse_config(json::array()), ConfigError);
}

// -----------------------------------------------------------------------------
// 4. Invariant violations are ConfigErrors.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, InvalidValuesAreConfigErrors) {
  EXPECT_THROW(riskcore::parse_config(json{{"default_regime", "moon"}}),
               ConfigError);
  EXPECT_THROW(riskcore::parse_config(json::parse(
                   R"({"correlation": {"cluster_threshold": 0.95}})")),
               ConfigError);
  EXPECT_THROW(riskcore::parse_config(
                   json::parse(R"({"var": {"confidence_level": 0.0}})")),
               ConfigError);
}

// -----------------------------------------------------------------------------
// 5. load_config() reads a file from disk.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, LoadsFromFile) {
  const std::string path =
      writeFile(R"({"max_concurrent_positions": 3, "max_sector_pct": 20.0})");

  auto cfg = riskcore::load_config(path);
  EXPECT_EQ(cfg.max_concurrent_positions, 3);
  EXPECT_DOUBLE_EQ(cfg.max_sector_pct, 20.0);
}

// -----------------------------------------------------------------------------
// 6. Missing and unparsable files are ConfigErrors.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, BadFilesAreConfigErrors) {
  EXPECT_THROW(riskcore::load_config("/nonexistent/riskcore/config.json"),
               ConfigError);

  const std::string path = writeFile("{ not json");
  EXPECT_THROW(riskcore::load_config(path), ConfigError);
}
