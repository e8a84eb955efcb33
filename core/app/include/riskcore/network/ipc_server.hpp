#pragma once

#include "riskcore/concurrent/thread_safe_queue.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace riskcore {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ front door of the risk gate
// -----------------------------------------------------------------------------
//
// @brief  Runs a worker thread that answers commands on a REP socket and
//         broadcasts assessment telemetry on a PUB socket.
//
// @details
//   1. REP socket (default tcp://127.0.0.1:5556):
//      Each request string is passed to the command handler (bound to
//      RiskCommandHandler::execute()) and its JSON reply is sent back.
//      ZMQ_RCVTIMEO bounds each receive so the loop can check running_ and
//      drain telemetry.
//
//   2. PUB socket (default tcp://127.0.0.1:5557):
//      Publishes every string passed to pushTelemetry(), in push order.
//
// Thread model:
//   Constructed, started and stopped on the main thread. Both sockets live
//   on the worker thread only. pushTelemetry() may be called from any
//   thread; the string waits in a ThreadSafeQueue until the worker drains
//   it. The command handler runs on the worker thread.
//
// Ownership:
//   Owns the ZMQ context, both sockets, the telemetry queue and the worker
//   thread. Holds a copy of the command handler.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  command_handler  Invoked once per received command; returns the
  //                          JSON reply.
  // @param  cmd_endpoint     ZMQ endpoint for the REP socket.
  // @param  pub_endpoint     ZMQ endpoint for the PUB socket.
  //
  // No sockets are opened until start().
  // -------------------------------------------------------------------------
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  // RAII: stop() if still running.
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Creates the context, binds both sockets and spawns the worker.
  // Idempotent. Throws zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Clears running_, joins the worker (within kPollTimeoutMs) and closes
  // the sockets. Idempotent; safe if never started.
  // -------------------------------------------------------------------------
  void stop();

  bool isRunning() const { return running_.load(); }

  // Queues one telemetry message for the PUB socket. Any thread.
  void pushTelemetry(std::string message);

 private:
  static constexpr int kPollTimeoutMs = 50;

  // Worker loop: drain telemetry, then serve at most one command.
  void run();

  // Publishes everything currently queued. Worker thread only.
  void processTelemetry();

  // Waits up to kPollTimeoutMs for one command and replies to it.
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<std::string> telemetry_queue_;

  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace riskcore
