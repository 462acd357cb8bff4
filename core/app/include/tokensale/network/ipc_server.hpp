#pragma once

#include "tokensale/concurrent/thread_safe_queue.hpp"
#include "tokensale/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace tokensale {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ command and notification gateway
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that answers JSON commands from external
//         clients (REP socket) and broadcasts committed notifications as
//         JSON (PUB socket).
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. REP socket (default tcp://127.0.0.1:5556):
//      Each request is one JSON object ({"op": "...", "caller": "...", ...}).
//      It is handed to command_handler_ (bound to SaleEngine::executeCommand)
//      and the handler's JSON string is sent back. ZMQ_RCVTIMEO keeps the
//      loop from blocking so the notification queue is drained regularly.
//
//   2. PUB socket (default tcp://127.0.0.1:5557):
//      Every notification handed to pushNotification() is encoded with
//      codec::toJson() and published. The queue decouples the thread that
//      committed the operation from ZMQ I/O.
//
// Thread model:
//   Constructed and destroyed by SaleEngine. start() spawns the worker;
//   stop() clears running_ and joins. pushNotification() is called from the
//   EventBus subscriber on whichever thread published.
//
//   command_handler_ runs on the IPC thread. A purchase submitted over IPC
//   therefore takes the engine's ReentrancyGuard from this thread.
//
// Ownership:
//   Owned by SaleEngine via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the notification queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // Stores parameters only. No sockets are opened until start().
  // -------------------------------------------------------------------------
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  // RAII: calls stop().
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Creates the ZMQ context, binds both sockets and spawns the
  //         worker thread.
  //
  // Idempotent: calling start() when already running is a no-op.
  //
  // Thread-safety: Call from the owning thread only.
  // Side-effects:  Binds two endpoints; throws zmq::error_t if either bind
  //                fails.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // @brief  Signals the worker to exit, joins it, closes the sockets.
  //
  // @details
  // The worker notices within kPollTimeoutMs, publishes whatever is still
  // queued, and exits.
  //
  // Idempotent. Blocks until the worker thread exits.
  // -------------------------------------------------------------------------
  void stop();

  // Enqueues a notification for the PUB socket. Safe from any thread.
  void pushNotification(Event event);

  bool running() const { return running_.load(); }

 private:
  static constexpr int kPollTimeoutMs = 50;

  // Worker loop: drain notifications, poll one command, repeat.
  void run();

  void processNotifications();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> notification_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace tokensale
