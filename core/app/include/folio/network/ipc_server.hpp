#pragma once

#include "folio/concurrent/thread_safe_queue.hpp"
#include "folio/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace folio {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ command and telemetry endpoint
// -----------------------------------------------------------------------------
//
// @brief  Runs one thread that answers JSON commands on a REP socket and
//         broadcasts order and holding events as JSON on a PUB socket.
//
// @details
// Two ZeroMQ sockets share the worker thread:
//
//   1. REP socket (commands, default tcp://127.0.0.1:5556):
//      Each request is passed to command_handler_ (bound to
//      WealthEngine::handleCommand()) and its return value sent back. The
//      socket has ZMQ_RCVTIMEO set so the loop keeps turning when no
//      client is talking.
//
//   2. PUB socket (telemetry, default tcp://127.0.0.1:5557):
//      Events arrive through pushTelemetry() from whichever thread
//      published them (submission threads, the fill worker). They are
//      buffered in a ThreadSafeQueue and serialized on the IPC thread, so
//      JSON formatting and socket I/O never run on the fill path.
//
// Errors:
//   A ZeroMQ error other than EINTR on recv is rethrown on the IPC thread.
//   Malformed commands never reach here as exceptions: the handler turns
//   them into an error reply.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any
//   thread. command_handler_ runs on the IPC thread.
//
// Ownership:
//   Owned by WealthEngine via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue, and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Creates the context, binds both sockets, and spawns the worker.
  // Idempotent. zmq::error_t from bind() propagates to the caller.
  // -------------------------------------------------------------------------
  void start();

  // Signals the worker, joins it, and closes the sockets. Telemetry still
  // queued is published before the worker exits. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  bool running() const { return running_.load(); }

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace folio
