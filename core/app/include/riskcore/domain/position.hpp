#pragma once

#include <string>

namespace riskcore {
namespace domain {

// -----------------------------------------------------------------------------
// Position — one open holding as seen by the risk gate
// -----------------------------------------------------------------------------
//
// @brief  Snapshot of an open position supplied by the host pipeline with
//         every assessment request.
//
// @details
// The risk gate never mutates positions; it reads them to count open
// positions, to sum per-ticker exposure, and to derive the list of current
// holdings for the correlation guard and the portfolio VaR weights.
//
// Sign convention:
//   net_quantity  positive → long, negative → short, zero → flat
//   market_value  signed like net_quantity; exposure checks use the
//                 absolute value so shorts count against limits too.
//
// Several Position entries may share a symbol (e.g. separate lots); the
// single-stock check sums all of them.
//
// Thread model:
//   Plain value type. Copied into AssessmentRequest by the caller.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;          // Instrument identifier (e.g. "AAPL")
  double net_quantity{0.0};    // Signed: +long, -short, 0=flat
  double average_price{0.0};   // Weighted avg entry price
  double market_value{0.0};    // Signed mark-to-market value in account ccy
};

}  // namespace domain
}  // namespace riskcore
