// =============================================================================
// correlation_guard_test.cpp
// =============================================================================
// Unit tests for riskcore::CorrelationGuard and riskcore::CorrelationMatrix.
//
// Validates:
//   - Pearson correlation: diagonal, identical series, short and constant
//     series, unequal lengths
//   - Greedy seed-based clustering and the signed max_correlation
//   - check_new_trade(): pairwise limit, cluster limit, trivial approvals
//   - get_portfolio_concentration_score()
//   - Determinism of compute_matrix()
//
// Series helpers produce fixed, hand-checkable patterns so every expected
// correlation below is reproducible.
// =============================================================================

#include "riskcore/correlation/correlation_guard.hpp"
#include "riskcore/correlation/correlation_matrix.hpp"
#include "riskcore/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

using riskcore::CorrelationCheck;
using riskcore::CorrelationGuard;
using riskcore::CorrelationMatrix;
using riskcore::domain::CorrelationConfig;
using riskcore::domain::ReturnSeries;
using riskcore::domain::ReturnSeriesMap;

// Repeating -3%..+3% pattern, shifted by `offset` days.
static ReturnSeries deterministicReturns(int n = 30, int offset = 0) {
  ReturnSeries out;
  for (int i = 0; i < n; ++i) {
    out.push_back(0.01 * ((i + offset) % 7 - 3));
  }
  return out;
}

// `base` plus a small 3-periodic perturbation of amplitude `noise`.
static ReturnSeries correlatedReturns(const ReturnSeries& base, double noise) {
  ReturnSeries out;
  for (std::size_t i = 0; i < base.size(); ++i) {
    out.push_back(base[i] + noise * (static_cast<int>(i % 3) - 1));
  }
  return out;
}

// Pattern whose correlation with deterministicReturns() is about 0.16.
static ReturnSeries uncorrelatedReturns(int n = 30) {
  ReturnSeries out;
  for (int i = 0; i < n; ++i) {
    out.push_back(0.01 * ((i * 3 + 5) % 11 - 5));
  }
  return out;
}

class CorrelationGuardTest : public ::testing::Test {
 protected:
  CorrelationGuard guard;
};

// -----------------------------------------------------------------------------
// 1. A single-ticker matrix reports 1.0 on its diagonal.
// -----------------------------------------------------------------------------
TEST_F(CorrelationGuardTest, SelfCorrelationIsOne) {
  auto matrix = guard.compute_matrix({{"AAPL", deterministicReturns()}});

  ASSERT_EQ(matrix.size(), 1u);
  auto corr = matrix.get_correlation("AAPL", "AAPL");
  ASSERT_TRUE(corr.has_value());
  EXPECT_DOUBLE_EQ(*corr, 1.0);
  EXPECT_TRUE(matrix.clusters().empty());
}

// -----------------------------------------------------------------------------
// 2. Two identical series correlate at ~1.0.
// -----------------------------------------------------------------------------
TEST_F(CorrelationGuardTest, IdenticalSeriesCorrelateFully) {
  const auto a = deterministicReturns();
  auto matrix = guard.compute_matrix({{"A", a}, {"B", a}});

  EXPECT_NEAR(*matrix.get_correlation("A", "B"), 1.0, 1e-9);
  EXPECT_NEAR(matrix.max_correlation(), 1.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 3. Fewer common observations than min_data_points → 0.0, not missing.
// -----------------------------------------------------------------------------
TEST_F(CorrelationGuardTest, ShortSeriesReportZero) {
  const auto a = deterministicReturns(10);
  auto matrix = guard.compute_matrix({{"A", a}, {"B", a}});

  auto corr = matrix.get_correlation("A", "B");
  ASSERT_TRUE(corr.has_value());
  EXPECT_DOUBLE_EQ(*corr, 0.0);
}

// -----------------------------------------------------------------------------
// 4. A zero-variance series correlates 0.0 with anything.
// -----------------------------------------------------------------------------
TEST_F(CorrelationGuardTest, ConstantSeriesReportZero) {
  ReturnSeries flat(30, 0.002);
  EXPECT_DOUBLE_EQ(guard.pearson(flat, deterministicReturns()), 0.0);
}

// -----------------------------------------------------------------------------
// 5. Unequal lengths are compared over the most recent common window.
// -----------------------------------------------------------------------------
TEST_F(CorrelationGuardTest, UnequalLengthsUseLatestWindow) {
  // The last 30 values of a 37-day pattern are the 30-day pattern shifted
  // by 7 days, i.e. identical.
  const auto longer = deterministicReturns(37);
  const auto shorter = deterministicReturns(30);
  EXPECT_NEAR(guard.pearson(longer, shorter), 1.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 6. Empty input yields an empty matrix without throwing.
// -----------------------------------------------------------------------------
TEST_F(CorrelationGuardTest, EmptyInputGivesEmptyMatrix) {
  auto matrix = guard.compute_matrix({});
  EXPECT_TRUE(matrix.empty());
  EXPECT_TRUE(matrix.clusters().empty());
  EXPECT_DOUBLE_EQ(matrix.max_correlation(), 0.0);
  EXPECT_FALSE(matrix.get_correlation("A", "B").has_value());
}

// -----------------------------------------------------------------------------
// 7. max_correlation keeps its sign.
// -----------------------------------------------------------------------------
TEST_F(CorrelationGuardTest, MaxCorrelationIsSigned) {
  const auto a = deterministicReturns();
  ReturnSeries inverse;
  for (double r : a) {
    inverse.push_back(-r);
  }
  auto matrix = guard.compute_matrix({{"A", a}, {"Z", inverse}});
  EXPECT_NEAR(matrix.max_correlation(), -1.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 8. Highly correlated tickers form one cluster; the unrelated one does not
//    join it.
// -----------------------------------------------------------------------------
TEST_F(CorrelationGuardTest, CorrelatedTickersCluster) {
  const auto a = deterministicReturns();
  auto matrix = guard.compute_matrix({{"AAA", a},
                                      {"BBB", correlatedReturns(a, 0.001)},
                                      {"CCC", uncorrelatedReturns()}});

  ASSERT_EQ(matrix.clusters().size(), 1u);
  EXPECT_EQ(matrix.clusters()[0],
            (CorrelationMatrix::Cluster{"AAA", "BBB"}));
}

// -----------------------------------------------------------------------------
// 9. Identical input gives bit-identical matrices and clusters.
// -----------------------------------------------------------------------------
TEST_F(CorrelationGuardTest, ComputeMatrixIsDeterministic) {
  const auto a = deterministicReturns();
  ReturnSeriesMap input{{"AAA", a},
                        {"BBB", correlatedReturns(a, 0.01)},
                        {"CCC", uncorrelatedReturns()},
                        {"DDD", deterministicReturns(30, 2)}};
  const auto ts = riskcore::ms_to_timestamp(1'700'000'000'000);

  auto first = guard.compute_matrix(input, ts);
  auto second = guard.compute_matrix(input, ts);

  EXPECT_EQ(first.tickers(), second.tickers());
  EXPECT_EQ(first.rows(), second.rows());
  EXPECT_EQ(first.clusters(), second.clusters());
  EXPECT_EQ(first.max_correlation(), second.max_correlation());
  EXPECT_EQ(first.computed_at(), second.computed_at());
}

// -----------------------------------------------------------------------------
// 10. No holdings → approved regardless of the matrix.
// -----------------------------------------------------------------------------
TEST_F(CorrelationGuardTest, EmptyHoldingsAlwaysApproved) {
  const auto a = deterministicReturns();
  auto matrix = guard.compute_matrix({{"A", a}, {"B", a}});

  CorrelationCheck check = guard.check_new_trade("A", matrix, {});
  EXPECT_TRUE(check.approved);
  EXPECT_EQ(check.reason, "approved");
}

// -----------------------------------------------------------------------------
// 11. A ticker missing from the matrix is approved trivially.
// -----------------------------------------------------------------------------
TEST_F(CorrelationGuardTest, UnknownTickerApproved) {
  const auto a = deterministicReturns();
  auto matrix = guard.compute_matrix({{"A", a}, {"B", a}});

  EXPECT_TRUE(guard.check_new_trade("NEW", matrix, {"A", "B"}).approved);
}

// -----------------------------------------------------------------------------
// 12. |corr| above max_pairwise_correlation rejects with the pair named.
// -----------------------------------------------------------------------------
TEST_F(CorrelationGuardTest, PairwiseLimitRejects) {
  const auto a = deterministicReturns();
  auto matrix = guard.compute_matrix(
      {{"AAPL", a}, {"MSFT", correlatedReturns(a, 0.001)}});

  CorrelationCheck check = guard.check_new_trade("MSFT", matrix, {"AAPL"});
  EXPECT_FALSE(check.approved);
  EXPECT_NE(check.reason.find("exceeds limit"), std::string::npos);
  EXPECT_NE(check.reason.find("AAPL"), std::string::npos);
  EXPECT_NE(check.reason.find("0.80"), std::string::npos);
}

// -----------------------------------------------------------------------------
// 13. Adding to a ticker already held is rejected: its correlation with
//     itself is 1.0, above any pairwise limit below 1.
// -----------------------------------------------------------------------------
TEST_F(CorrelationGuardTest, AddingToHeldTickerRejects) {
  const auto a = deterministicReturns();
  auto matrix = guard.compute_matrix({{"AAPL", a}});

  CorrelationCheck check = guard.check_new_trade("AAPL", matrix, {"AAPL"});
  EXPECT_FALSE(check.approved);
  EXPECT_NE(check.reason.find("exceeds limit"), std::string::npos);

  auto mixed = guard.compute_matrix(
      {{"AAPL", a}, {"XOM", uncorrelatedReturns()}});
  EXPECT_FALSE(guard.check_new_trade("AAPL", mixed, {"XOM", "AAPL"}).approved);
}

// -----------------------------------------------------------------------------
// 14. Cluster limit: with max_cluster_size 2, joining a cluster that already
//     holds one member is rejected even though the pair is under the
//     pairwise limit.
// -----------------------------------------------------------------------------
TEST_F(CorrelationGuardTest, ClusterLimitRejects) {
  CorrelationConfig cfg;
  cfg.max_pairwise_correlation = 0.90;
  cfg.cluster_threshold = 0.70;
  cfg.max_cluster_size = 2;
  CorrelationGuard strict(cfg);

  const auto a = deterministicReturns();
  // corr ≈ 0.85: below 0.90, above 0.70.
  auto matrix = strict.compute_matrix(
      {{"AAA", a}, {"BBB", correlatedReturns(a, 0.015)}});
  ASSERT_EQ(matrix.clusters().size(), 1u);

  CorrelationCheck check = strict.check_new_trade("BBB", matrix, {"AAA"});
  EXPECT_FALSE(check.approved);
  EXPECT_NE(check.reason.find("correlated cluster"), std::string::npos);

  cfg.max_cluster_size = 3;
  CorrelationGuard relaxed(cfg);
  EXPECT_TRUE(relaxed.check_new_trade("BBB", matrix, {"AAA"}).approved);

  // Every holdings entry in the cluster counts, repeats included.
  EXPECT_FALSE(
      relaxed.check_new_trade("BBB", matrix, {"AAA", "AAA"}).approved);
}

// -----------------------------------------------------------------------------
// 15. Regression: cluster membership comes from the snapshot's greedy,
//     seed-based clusters. CCC correlates ~0.86 with BBB, but BBB was
//     absorbed by seed AAA (corr ~0.64) and CCC correlates only ~0.16 with
//     AAA, so CCC sits in no cluster and is approved.
// -----------------------------------------------------------------------------
TEST_F(CorrelationGuardTest, ClusterCheckUsesSnapshotClusters) {
  CorrelationConfig cfg;
  cfg.max_pairwise_correlation = 0.90;
  cfg.cluster_threshold = 0.60;
  cfg.max_cluster_size = 2;
  CorrelationGuard strict(cfg);

  const auto a = deterministicReturns();
  const auto u = uncorrelatedReturns();
  ReturnSeries mixed;
  for (std::size_t i = 0; i < a.size(); ++i) {
    mixed.push_back(a[i] + u[i]);
  }

  auto matrix =
      strict.compute_matrix({{"AAA", a}, {"BBB", mixed}, {"CCC", u}});
  ASSERT_EQ(matrix.clusters().size(), 1u);
  EXPECT_EQ(matrix.clusters()[0],
            (CorrelationMatrix::Cluster{"AAA", "BBB"}));
  EXPECT_GT(*matrix.get_correlation("CCC", "BBB"), cfg.cluster_threshold);

  EXPECT_TRUE(strict.check_new_trade("CCC", matrix, {"BBB"}).approved);
}

// -----------------------------------------------------------------------------
// 16. Concentration is 0 for fewer than two holdings.
// -----------------------------------------------------------------------------
TEST_F(CorrelationGuardTest, ConcentrationZeroForSingleHolding) {
  const auto a = deterministicReturns();
  auto matrix = guard.compute_matrix({{"A", a}, {"B", a}});

  EXPECT_DOUBLE_EQ(guard.get_portfolio_concentration_score(matrix, {"A"}),
                   0.0);
  EXPECT_DOUBLE_EQ(guard.get_portfolio_concentration_score(matrix, {}), 0.0);
}

// -----------------------------------------------------------------------------
// 17. Concentration averages |corr| over known pairs; unknown pairs are
//     skipped rather than counted as zero.
// -----------------------------------------------------------------------------
TEST_F(CorrelationGuardTest, ConcentrationSkipsUnknownPairs) {
  const auto a = deterministicReturns();
  auto matrix = guard.compute_matrix({{"A", a}, {"B", a}});

  EXPECT_NEAR(guard.get_portfolio_concentration_score(matrix, {"A", "B"}),
              100.0, 1e-6);
  EXPECT_NEAR(
      guard.get_portfolio_concentration_score(matrix, {"A", "B", "ZZZ"}),
      100.0, 1e-6);
  EXPECT_DOUBLE_EQ(
      guard.get_portfolio_concentration_score(matrix, {"A", "ZZZ"}), 0.0);
}

// -----------------------------------------------------------------------------
// 18. cluster_threshold above max_pairwise_correlation is refused.
// -----------------------------------------------------------------------------
TEST(CorrelationConfigTest, InvalidThresholdOrderingThrows) {
  CorrelationConfig cfg;
  cfg.max_pairwise_correlation = 0.6;
  cfg.cluster_threshold = 0.7;
  EXPECT_THROW(CorrelationGuard{cfg}, std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 19. CorrelationMatrix rejects a value array of the wrong size.
// -----------------------------------------------------------------------------
TEST(CorrelationMatrixTest, SizeMismatchThrows) {
  EXPECT_THROW(CorrelationMatrix({"A", "B"}, {1.0, 0.5, 0.5},
                                 {}, 0.5, riskcore::Timestamp{}),
               std::invalid_argument);
}
