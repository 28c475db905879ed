#include "network/tcp_server.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <sstream>

namespace chunkd {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TCP_Server::TCP_Server(const config::ServerConfig& config, RequestHandler& handler)
  : config_(config)
  , is_running_(false)
  , local_port_(0)
  , handler_(handler)
  , codec_(config.max_payload_size) {
  BOOST_LOG_TRIVIAL(info) << "TCP server: Initializing TCP server on " << config_.address << ":" << config_.port;
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
    // Create endpoint
    boost::asio::ip::tcp::endpoint endpoint(
      boost::asio::ip::make_address(config_.address),
      config_.port
    );

    // Create acceptor
    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_, endpoint);
    local_port_ = acceptor_->local_endpoint().port();
    BOOST_LOG_TRIVIAL(debug) << "TCP server: Acceptor bound to port " << local_port_;

    workers_ = std::make_unique<boost::asio::thread_pool>(std::max<std::size_t>(1, config_.worker_threads));

    is_running_ = true;
    io_context_.restart();

    // Start accepting connections
    start_accept();

    // Start io_context in a separate thread
    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        auto work = boost::asio::make_work_guard(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "TCP server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "TCP server: Server started successfully on " << config_.address << ":" << local_port_
                            << " with " << config_.worker_threads << " workers";
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP server: Failed to start server: " << e.what();
    acceptor_.reset();
    workers_.reset();
    is_running_ = false;
    return false;
  }
}

void TCP_Server::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  // Set up async accept operation
  acceptor_->async_accept(
    [this](const boost::system::error_code& error, boost::asio::ip::tcp::socket socket) {
      if (!error) {
        // Hand the connection to a worker so slow clients never stall accepting
        boost::asio::post(*workers_, [this, socket = std::move(socket)]() mutable {
          serve_connection(std::move(socket));
        });
      } else if (error != boost::asio::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(error) << "TCP server: Accept error: " << error.message();
      }

      if (is_running_) {
        start_accept();  // Continue accepting new connections
      }
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

  // Unblock workers waiting on idle connections, then wait for them
  close_connections();
  if (workers_) {
    workers_->join();
    workers_.reset();
  }

  BOOST_LOG_TRIVIAL(info) << "TCP server: Server shutdown complete";
}

void TCP_Server::close_connections() {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  for (auto* stream : connections_) {
    boost::system::error_code ec;
    stream->socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  }
}

std::size_t TCP_Server::active_connections() const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  return connections_.size();
}


//==============================================
// CONNECTION HANDLING
//==============================================

void TCP_Server::serve_connection(boost::asio::ip::tcp::socket socket) {
  boost::system::error_code ec;
  auto endpoint = socket.remote_endpoint(ec);
  std::ostringstream remote;
  if (!ec) {
    remote << endpoint;
  } else {
    remote << "unknown peer";
  }

  BOOST_LOG_TRIVIAL(debug) << "TCP server: Serving connection from " << remote.str();

  boost::asio::ip::tcp::iostream stream(std::move(socket));
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.insert(&stream);
  }

  while (is_running_ && serve_request(stream, remote.str())) {
  }

  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(&stream);
  }
  stream.close();
  BOOST_LOG_TRIVIAL(debug) << "TCP server: Closed connection from " << remote.str();
}

bool TCP_Server::serve_request(boost::asio::ip::tcp::iostream& stream, const std::string& remote) {
  stream.expires_after(config_.idle_timeout);

  RequestFrame request;
  try {
    request = codec_.deserialize_request(stream);
  }
  catch (const FrameError& e) {
    BOOST_LOG_TRIVIAL(warning) << "TCP server: Bad request from " << remote << ": " << e.what();
    try {
      codec_.serialize(RequestHandler::bad_request(e.what()), stream);
    } catch (const NetworkError& write_error) {
      BOOST_LOG_TRIVIAL(debug) << "TCP server: Could not report bad request: " << write_error.what();
    }
    return false;
  }
  catch (const StreamError& e) {
    if (stream.error() == boost::asio::error::timed_out) {
      BOOST_LOG_TRIVIAL(info) << "TCP server: Connection from " << remote << " idle, closing";
    } else {
      BOOST_LOG_TRIVIAL(debug) << "TCP server: Connection from " << remote << " ended: " << e.what();
    }
    return false;
  }

  ResponseFrame response = handler_.handle(request);

  try {
    codec_.serialize(response, stream);
  }
  catch (const NetworkError& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP server: Failed to send response to " << remote << ": " << e.what();
    return false;
  }
  return true;
}

} // namespace network
} // namespace chunkd
