#pragma once

#include <boost/asio.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include "config/config.hpp"
#include "network/codec.hpp"
#include "network/request_handler.hpp"

namespace chunkd {
namespace network {

// Accepts connections on an io_context thread and serves each one on a
// worker pool. A connection carries a sequence of request/response pairs
// and is closed after idle_timeout without a request.
class TCP_Server {
public:
  // -- CONSTRUCTOR AND DESTRUCTOR ----
  TCP_Server(const config::ServerConfig& config, RequestHandler& handler);
  ~TCP_Server();


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  void shutdown();


  // ---- GETTERS ----
  // Bound port; differs from the configured one when port 0 was requested
  uint16_t local_port() const { return local_port_; }
  bool is_running() const { return is_running_; }
  std::size_t active_connections() const;

private:

  // ---- PARAMETERS ----
  const config::ServerConfig config_;

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_;
  std::atomic<uint16_t> local_port_;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::unique_ptr<boost::asio::thread_pool> workers_;

  // Open connections, closed on shutdown
  mutable std::mutex connections_mutex_;
  std::set<boost::asio::ip::tcp::iostream*> connections_;

  // System components
  RequestHandler& handler_;
  Codec codec_;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Main listening loop that handles incoming connections
  void start_accept();
  void close_connections();


  // ---- CONNECTION HANDLING ----
  // Request loop for one connection; runs on a worker thread
  void serve_connection(boost::asio::ip::tcp::socket socket);
  // Returns false when the connection should be closed
  bool serve_request(boost::asio::ip::tcp::iostream& stream, const std::string& remote);
};

} // namespace network
} // namespace chunkd
