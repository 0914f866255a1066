#include "gold/network/ipc_server.hpp"
#include "gold/audit/json_format.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <exception>
#include <iostream>
#include <utility>

namespace gold {

IpcServer::IpcServer(CommandHandler command_handler,
                     std::string command_endpoint,
                     std::string telemetry_endpoint)
    : command_handler_(std::move(command_handler)),
      command_endpoint_(std::move(command_endpoint)),
      telemetry_endpoint_(std::move(telemetry_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  command_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  telemetry_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  command_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  command_socket_->set(zmq::sockopt::linger, 0);
  telemetry_socket_->set(zmq::sockopt::linger, 0);

  try {
    command_socket_->bind(command_endpoint_);
    telemetry_socket_->bind(telemetry_endpoint_);
  } catch (const zmq::error_t& e) {
    std::cerr << "[IpcServer] bind failed: " << e.what() << "\n";
    closeSockets();
    throw;
  }

  running_.store(true);
  worker_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] listening. commands=" << command_endpoint_
            << " telemetry=" << telemetry_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  const bool was_running = running_.exchange(false);
  if (worker_.joinable()) {
    worker_.join();
  }
  if (!was_running) {
    return;
  }

  closeSockets();

  std::cout << "[IpcServer] stopped. served=" << commands_served_.load()
            << " published=" << events_published_.load() << "\n";
}

void IpcServer::pushTelemetry(Event event) { outbox_.push(std::move(event)); }

// -----------------------------------------------------------------------------
// Worker loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    publishPending();
    serveOneCommand();
  }
  publishPending();
}

void IpcServer::publishPending() {
  while (auto event = outbox_.try_pop()) {
    const std::string topic = eventName(*event);
    const std::string payload = toJson(*event).dump();

    zmq::message_t topic_frame(topic.data(), topic.size());
    zmq::message_t payload_frame(payload.data(), payload.size());
    if (!telemetry_socket_->send(topic_frame, zmq::send_flags::sndmore |
                                                  zmq::send_flags::dontwait)) {
      continue;
    }
    telemetry_socket_->send(payload_frame, zmq::send_flags::dontwait);
    events_published_.fetch_add(1);
  }
}

void IpcServer::serveOneCommand() {
  zmq::message_t request;
  zmq::recv_result_t received;

  try {
    received = command_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!received) {
    return;  // Timed out; go back to telemetry.
  }

  const std::string response = handle(
      std::string(static_cast<const char*>(request.data()), request.size()));
  zmq::message_t reply(response.data(), response.size());
  command_socket_->send(reply, zmq::send_flags::none);
  commands_served_.fetch_add(1);
}

std::string IpcServer::handle(const std::string& request) {
  try {
    return command_handler_(request);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] command handler failed: " << e.what() << "\n";
    nlohmann::json reply;
    reply["status"] = "error";
    reply["kind"] = "Internal";
    reply["message"] = e.what();
    return reply.dump();
  }
}

void IpcServer::closeSockets() {
  command_socket_.reset();
  telemetry_socket_.reset();
  context_.reset();
}

}  // namespace gold
