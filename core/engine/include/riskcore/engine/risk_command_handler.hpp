#pragma once

#include "riskcore/engine/risk_context.hpp"

#include <functional>
#include <string>

namespace riskcore {

// -----------------------------------------------------------------------------
// RiskCommandHandler — text command protocol over a RiskContext
// -----------------------------------------------------------------------------
//
// @brief  Turns one command string into one JSON reply string. Bound to
//         IpcServer's REP socket by riskcore_server, and directly usable
//         from tests.
//
// @details
// Commands (verb and argument separated by the first space):
//
//   PING                 {"status":"ok","response":"PONG"}
//   STATUS               equity, starting_equity, daily_pnl, default_regime
//   ASSESS <json>        the assessment (see json_codec.hpp) under
//                        "assessment"; the same JSON is handed to the
//                        telemetry sink
//   RECORD_PNL <delta>   adds delta to the daily P&L
//   RESET_DAILY          starts a new trading day
//   SET_EQUITY <value>   sets account equity (clamped to >= 0)
//
// Anything malformed yields {"status":"error","response":<message>}.
// A bad request is never answered with an approval: the caller sees the
// error and must treat the trade as rejected.
//
// Thread model:
//   execute() is invoked on the IPC worker thread. RiskContext is
//   thread-safe, so the handler may also be driven from other threads.
//   The telemetry sink runs on the caller's thread of execute().
//
// Ownership:
//   Holds a reference to the RiskContext, which must outlive the handler.
// -----------------------------------------------------------------------------
class RiskCommandHandler {
 public:
  using TelemetrySink = std::function<void(const std::string&)>;

  explicit RiskCommandHandler(RiskContext& context,
                              TelemetrySink telemetry = {});

  RiskCommandHandler(const RiskCommandHandler&) = delete;
  RiskCommandHandler& operator=(const RiskCommandHandler&) = delete;

  // -------------------------------------------------------------------------
  // execute(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Handles one command and returns the JSON reply.
  //
  // Thread-safety: Safe to call from any thread.
  // Side-effects:  RECORD_PNL / RESET_DAILY / SET_EQUITY mutate the
  //                RiskContext; ASSESS publishes telemetry.
  // -------------------------------------------------------------------------
  std::string execute(const std::string& cmd);

 private:
  std::string handleAssess(const std::string& payload);

  RiskContext& context_;
  TelemetrySink telemetry_;
};

}  // namespace riskcore
