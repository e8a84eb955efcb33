#pragma once

#include <map>
#include <string>
#include <vector>

namespace riskcore {
namespace domain {

// Daily simple returns, oldest first (0.01 == +1%).
using ReturnSeries = std::vector<double>;

// Return histories keyed by ticker. std::map keeps tickers in lexicographic
// order, which is the processing order the correlation guard relies on.
using ReturnSeriesMap = std::map<std::string, ReturnSeries>;

}  // namespace domain
}  // namespace riskcore
