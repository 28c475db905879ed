#include "engine/session_sweeper.hpp"
#include <boost/log/trivial.hpp>

namespace chunkd {
namespace engine {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SessionSweeper::SessionSweeper(ChunkEngine& engine, std::chrono::seconds ttl, std::chrono::milliseconds interval)
  : engine_(engine)
  , ttl_(ttl)
  , interval_(interval)
  , timer_(io_context_) {}

SessionSweeper::~SessionSweeper() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool SessionSweeper::start() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "Session sweeper: Already running";
    return false;
  }
  if (ttl_.count() <= 0 || interval_.count() <= 0) {
    BOOST_LOG_TRIVIAL(info) << "Session sweeper: Session expiry disabled";
    return false;
  }

  is_running_ = true;
  io_context_.restart();
  schedule_next();

  io_thread_ = std::make_unique<std::thread>([this]() {
    try {
      io_context_.run();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Session sweeper: IO context error: " << e.what();
      is_running_ = false;
    }
  });

  BOOST_LOG_TRIVIAL(info) << "Session sweeper: Started (ttl " << ttl_.count() << "s, interval "
                          << interval_.count() << "ms)";
  return true;
}

void SessionSweeper::shutdown() {
  if (!io_thread_) {
    return;
  }

  is_running_ = false;
  io_context_.stop();

  if (io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();

  // The io thread is gone, so the timer can be touched directly
  timer_.cancel();

  BOOST_LOG_TRIVIAL(info) << "Session sweeper: Stopped after " << sweep_count_ << " sweeps";
}


//==============================================
// SWEEP LOOP
//==============================================

void SessionSweeper::schedule_next() {
  timer_.expires_after(interval_);
  timer_.async_wait([this](const boost::system::error_code& error) { on_timer(error); });
}

void SessionSweeper::on_timer(const boost::system::error_code& error) {
  if (error == boost::asio::error::operation_aborted || !is_running_) {
    return;
  }
  if (error) {
    BOOST_LOG_TRIVIAL(error) << "Session sweeper: Timer error: " << error.message();
    return;
  }

  std::size_t collected = engine_.collect_expired_sessions(ttl_);
  collected_count_ += collected;
  ++sweep_count_;

  if (collected > 0) {
    BOOST_LOG_TRIVIAL(info) << "Session sweeper: Collected " << collected << " expired sessions";
  }

  schedule_next();
}

} // namespace engine
} // namespace chunkd
