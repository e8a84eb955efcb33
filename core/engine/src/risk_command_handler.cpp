#include "riskcore/engine/risk_command_handler.hpp"

#include "riskcore/codec/json_codec.hpp"
#include "riskcore/domain/regime.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace riskcore {

namespace {

// Parses the whole of `arg` as a finite double; throws std::invalid_argument
// on trailing garbage, an empty argument, nan or inf.
double parse_number(const std::string& arg) {
  std::size_t consumed = 0;
  const double value = std::stod(arg, &consumed);
  if (consumed != arg.size() || !std::isfinite(value)) {
    throw std::invalid_argument("not a number: " + arg);
  }
  return value;
}

std::string error_reply(const std::string& message) {
  nlohmann::json response;
  response["status"] = "error";
  response["response"] = message;
  return response.dump();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
RiskCommandHandler::RiskCommandHandler(RiskContext& context,
                                       TelemetrySink telemetry)
    : context_(context), telemetry_(std::move(telemetry)) {}

// -----------------------------------------------------------------------------
// execute(): split verb/argument and dispatch
// -----------------------------------------------------------------------------
std::string RiskCommandHandler::execute(const std::string& cmd) {
  const auto space = cmd.find(' ');
  const std::string verb = cmd.substr(0, space);
  const std::string arg =
      space == std::string::npos ? std::string{} : cmd.substr(space + 1);

  nlohmann::json response;

  try {
    if (verb == "PING") {
      response["status"] = "ok";
      response["response"] = "PONG";
    } else if (verb == "STATUS") {
      const RiskSnapshot s = context_.snapshot();
      response["status"] = "ok";
      response["equity"] = s.equity;
      response["starting_equity"] = s.starting_equity;
      response["daily_pnl"] = s.daily_pnl;
      response["default_regime"] =
          domain::to_string(context_.regime_adapter().default_regime());
    } else if (verb == "ASSESS") {
      return handleAssess(arg);
    } else if (verb == "RECORD_PNL") {
      context_.record_pnl(parse_number(arg));
      response["status"] = "ok";
      response["daily_pnl"] = context_.daily_pnl();
    } else if (verb == "RESET_DAILY") {
      context_.reset_daily();
      response["status"] = "ok";
      response["response"] = "Daily counters reset";
    } else if (verb == "SET_EQUITY") {
      context_.set_equity(parse_number(arg));
      response["status"] = "ok";
      response["equity"] = context_.equity();
    } else {
      return error_reply("Unknown command: " + cmd);
    }
  } catch (const std::invalid_argument& e) {
    std::cerr << "[RiskCommandHandler] bad argument for " << verb << ": "
              << e.what() << "\n";
    return error_reply(std::string("Bad argument: ") + e.what());
  } catch (const std::out_of_range& e) {
    std::cerr << "[RiskCommandHandler] bad argument for " << verb << ": "
              << e.what() << "\n";
    return error_reply(std::string("Bad argument: ") + e.what());
  }

  return response.dump();
}

// -----------------------------------------------------------------------------
// handleAssess(): parse request, assess, reply and publish telemetry
// -----------------------------------------------------------------------------
std::string RiskCommandHandler::handleAssess(const std::string& payload) {
  domain::AssessmentRequest request;
  try {
    request = request_from_json(nlohmann::json::parse(payload));
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[RiskCommandHandler] malformed ASSESS payload: " << e.what()
              << "\n";
    return error_reply(std::string("Malformed request: ") + e.what());
  }

  const domain::UnifiedRiskAssessment assessment = context_.assess(request);
  const nlohmann::json assessment_json = assessment;

  if (telemetry_) {
    nlohmann::json event;
    event["type"] = "risk_assessment";
    event["assessment"] = assessment_json;
    telemetry_(event.dump());
  }

  nlohmann::json response;
  response["status"] = "ok";
  response["assessment"] = assessment_json;
  return response.dump();
}

}  // namespace riskcore
