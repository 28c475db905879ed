#ifndef CHUNKD_ENGINE_SESSION_SWEEPER_HPP
#define CHUNKD_ENGINE_SESSION_SWEEPER_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <boost/asio.hpp>
#include "engine/chunk_engine.hpp"

namespace chunkd {
namespace engine {

// Periodically collects abandoned sessions on its own io_context thread
class SessionSweeper {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  SessionSweeper(ChunkEngine& engine, std::chrono::seconds ttl, std::chrono::milliseconds interval);
  ~SessionSweeper();


  // ---- INITIALIZATION AND TEARDOWN ----
  // Returns false if already running or if expiry is disabled
  bool start();
  void shutdown();


  // ---- GETTERS ----
  bool is_running() const { return is_running_; }
  std::size_t get_sweep_count() const { return sweep_count_; }
  std::size_t get_collected_count() const { return collected_count_; }

private:
  // ---- PARAMETERS ----
  ChunkEngine& engine_;
  const std::chrono::seconds ttl_;
  const std::chrono::milliseconds interval_;

  // Timer state
  boost::asio::io_context io_context_;
  boost::asio::steady_timer timer_;
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_{false};
  std::atomic<std::size_t> sweep_count_{0};
  std::atomic<std::size_t> collected_count_{0};


  // ---- SWEEP LOOP ----
  void schedule_next();
  void on_timer(const boost::system::error_code& error);
};

} // namespace engine
} // namespace chunkd

#endif // CHUNKD_ENGINE_SESSION_SWEEPER_HPP
