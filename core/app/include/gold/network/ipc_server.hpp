#pragma once

#include "gold/concurrent/thread_safe_queue.hpp"
#include "gold/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace gold {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ audit feed and read-only query socket
// -----------------------------------------------------------------------------
//
// PUB socket (telemetry endpoint)
//   Every committed event handed to pushTelemetry() goes out as a two-frame
//   message:
//     frame 1: event type name ("BalanceUpdated", "OrderExecuted", ...)
//     frame 2: toJson(event).dump()
//   Subscribers filter with a ZMQ prefix subscription on the first frame,
//   e.g. "Order" for the settlement feed or "" for everything.
//
// REP socket (command endpoint)
//   One request string in, one reply string out. The reply comes from the
//   CommandHandler (CustodyEngine::executeCommand). A handler that throws
//   still produces a reply so the REP state machine never wedges.
//
// Thread model:
//   start()/stop() from the owning thread, pushTelemetry() from whichever
//   thread committed the unit of work. Sockets are touched only by the
//   worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string command_endpoint = "tcp://127.0.0.1:5556",
                     std::string telemetry_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. Throws zmq::error_t when an
  // endpoint cannot be bound; nothing is left running in that case.
  void start();

  // Joins the worker after a final telemetry drain. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  bool running() const { return running_.load(); }

  std::uint64_t commandsServed() const { return commands_served_.load(); }
  std::uint64_t eventsPublished() const { return events_published_.load(); }

  const std::string& commandEndpoint() const { return command_endpoint_; }
  const std::string& telemetryEndpoint() const { return telemetry_endpoint_; }

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();

  void publishPending();
  void serveOneCommand();

  std::string handle(const std::string& request);

  void closeSockets();

  CommandHandler command_handler_;
  std::string command_endpoint_;
  std::string telemetry_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> command_socket_;
  std::unique_ptr<zmq::socket_t> telemetry_socket_;

  ThreadSafeQueue<Event> outbox_;
  std::thread worker_;
  std::atomic<bool> running_{false};

  std::atomic<std::uint64_t> commands_served_{0};
  std::atomic<std::uint64_t> events_published_{0};
};

}  // namespace gold
