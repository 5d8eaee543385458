#pragma once

#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "config/config.hpp"
#include "network/connection_handler.hpp"
#include "store/store.hpp"

namespace lbft {
namespace network {

class TCP_Server {
public:

  // -- CONSTRUCTOR AND DESTRUCTOR ----
  TCP_Server(const uint16_t port, const std::string& address, store::Store& store,
             const config::ProtocolConfig& config);
  ~TCP_Server();


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  // Stops accepting, then stops and joins every connection thread
  void shutdown();


  // ---- GETTERS ----
  // Bound port, resolves port 0 to the port the system picked
  uint16_t port() const;
  bool is_running() const { return is_running_; }
  // Connections whose thread has not been reaped yet
  std::size_t active_connections();

private:

  // One accepted connection and the thread serving it
  struct Worker {
    std::shared_ptr<ConnectionHandler> handler;
    std::thread thread;
  };


  // ---- PARAMETERS ----
  // Network Parameters
  const uint16_t port_;
  const std::string address_;

  // Shared with every connection
  store::Store& store_;
  const config::ProtocolConfig& config_;

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  // Connection threads
  std::mutex workers_mutex_;
  std::vector<Worker> workers_;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Main listening loop that handles incoming connections
  void start_accept();


  // ---- CONNECTION THREADS ----
  void spawn_worker(std::shared_ptr<ConnectionHandler> handler);
  // Joins threads whose handler has finished, caller holds workers_mutex_
  void reap_finished_workers();
};

} // namespace network
} // namespace lbft
