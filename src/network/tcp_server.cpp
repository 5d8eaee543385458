#include "network/tcp_server.hpp"
#include <algorithm>

namespace lbft {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TCP_Server::TCP_Server(const uint16_t port, const std::string& address, store::Store& store,
                       const config::ProtocolConfig& config)
  : port_(port)
  , address_(address)
  , store_(store)
  , config_(config)
  , is_running_(false) {
  BOOST_LOG_TRIVIAL(info) << "TCP server: Initializing TCP server on " << address << ":" << port;
}

TCP_Server::~TCP_Server() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool TCP_Server::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "TCP server: Server already running";
    return false;
  }

  try {
    // A previous shutdown leaves the io_context stopped
    io_context_.restart();

    // Create endpoint
    boost::asio::ip::tcp::endpoint endpoint(
      boost::asio::ip::make_address(address_),
      port_
    );

    BOOST_LOG_TRIVIAL(debug) << "TCP server: Acceptor created";
    // Create acceptor
    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(
      io_context_,
      endpoint
    );

    is_running_ = true;

    // Start accepting connections
    BOOST_LOG_TRIVIAL(debug) << "TCP server: Starting to accept connections";
    start_accept();

    BOOST_LOG_TRIVIAL(debug) << "TCP server: Starting IO context";
    // Start io_context in a separate thread
    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        auto work_guard = boost::asio::make_work_guard(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "TCP server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "TCP server: Server started successfully on " << address_ << ":" << port();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP server: Failed to start server: " << e.what();
    acceptor_.reset();
    is_running_ = false;
    return false;
  }
}

void TCP_Server::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  // The handler owns the socket the connection is accepted into
  auto handler = std::make_shared<ConnectionHandler>(store_, config_);

  acceptor_->async_accept(handler->connection().get_socket(),
    [this, handler](const boost::system::error_code& error) {
      if (!error) {
        BOOST_LOG_TRIVIAL(info) << "TCP server: Accepted connection from "
                                << handler->connection().remote_address();
        spawn_worker(handler);
      } else if (error == boost::asio::error::operation_aborted) {
        return;
      } else {
        BOOST_LOG_TRIVIAL(error) << "TCP server: Accept error: " << error.message();
      }
      start_accept();  // Continue accepting new connections
    });
}

void TCP_Server::shutdown() {
  if (!is_running_ && !io_thread_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "TCP server: Initiating server shutdown";

  is_running_ = false;

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "TCP server: Error closing acceptor: " << ec.message();
    }
  }

  // Stop io_context
  io_context_.stop();

  // Wait for io_thread to finish
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();

  // Stop every connection and wait for its thread
  std::vector<Worker> workers;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers.swap(workers_);
  }
  for (auto& worker : workers) {
    worker.handler->stop();
  }
  for (auto& worker : workers) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }

  BOOST_LOG_TRIVIAL(info) << "TCP server: Server shutdown complete, stopped "
                          << workers.size() << " connections";
}


//==============================================
// CONNECTION THREADS
//==============================================

void TCP_Server::spawn_worker(std::shared_ptr<ConnectionHandler> handler) {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  reap_finished_workers();

  Worker worker;
  worker.handler = handler;
  worker.thread = std::thread([handler]() {
    handler->run();
  });
  workers_.push_back(std::move(worker));

  BOOST_LOG_TRIVIAL(debug) << "TCP server: " << workers_.size() << " active connections";
}

void TCP_Server::reap_finished_workers() {
  auto finished = std::partition(workers_.begin(), workers_.end(),
    [](const Worker& worker) { return !worker.handler->finished(); });

  for (auto it = finished; it != workers_.end(); ++it) {
    if (it->thread.joinable()) {
      it->thread.join();
    }
  }
  workers_.erase(finished, workers_.end());
}


//==============================================
// GETTERS
//==============================================

uint16_t TCP_Server::port() const {
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    auto endpoint = acceptor_->local_endpoint(ec);
    if (!ec) {
      return endpoint.port();
    }
  }
  return port_;
}

std::size_t TCP_Server::active_connections() {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  reap_finished_workers();
  return workers_.size();
}

} // namespace network
} // namespace lbft
