#include "riskcore/correlation/correlation_matrix.hpp"

#include <stdexcept>
#include <utility>

namespace riskcore {

CorrelationMatrix::CorrelationMatrix(std::vector<std::string> tickers,
                                     std::vector<double> values,
                                     std::vector<Cluster> clusters,
                                     double max_correlation,
                                     Timestamp computed_at)
    : tickers_(std::move(tickers)),
      values_(std::move(values)),
      clusters_(std::move(clusters)),
      max_correlation_(max_correlation),
      computed_at_(computed_at) {
  if (values_.size() != tickers_.size() * tickers_.size()) {
    throw std::invalid_argument(
        "CorrelationMatrix: values must hold tickers.size()^2 entries");
  }

  index_.reserve(tickers_.size());
  for (std::size_t i = 0; i < tickers_.size(); ++i) {
    index_.emplace(tickers_[i], i);
  }
}

std::optional<double> CorrelationMatrix::get_correlation(
    const std::string& a, const std::string& b) const {
  auto it_a = index_.find(a);
  auto it_b = index_.find(b);
  if (it_a == index_.end() || it_b == index_.end()) {
    return std::nullopt;
  }
  return at(it_a->second, it_b->second);
}

bool CorrelationMatrix::contains(const std::string& ticker) const {
  return index_.count(ticker) != 0;
}

std::vector<std::vector<double>> CorrelationMatrix::rows() const {
  const std::size_t n = tickers_.size();
  std::vector<std::vector<double>> out(n);
  for (std::size_t i = 0; i < n; ++i) {
    out[i].assign(values_.begin() + static_cast<std::ptrdiff_t>(i * n),
                  values_.begin() + static_cast<std::ptrdiff_t>((i + 1) * n));
  }
  return out;
}

}  // namespace riskcore
