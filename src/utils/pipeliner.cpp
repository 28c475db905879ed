#include "utils/pipeliner.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace chunkd {
namespace utils {

//==============================================
// CONSTRUCTOR
//==============================================

Pipeliner::Pipeliner(ProducerFn producer)
  : producer_(std::move(producer))
  , buffer_size_(8192)
  , drained_(false)
  , eof_(false) {}


//==============================================
// PIPELINE CONSTRUCTION METHODS
//==============================================

PipelinerPtr Pipeliner::create(ProducerFn producer) {
  return std::make_shared<Pipeliner>(std::move(producer));
}

PipelinerPtr Pipeliner::transform(TransformFn transform) {
  transforms_.push_back(std::move(transform));
  return shared_from_this();
}


//==============================================
// PIPELINE EXECUTION
//==============================================

bool Pipeliner::drain(const SinkFn& sink) {
  // Only process data once
  if (drained_) {
    last_error_ = "pipeline already drained";
    BOOST_LOG_TRIVIAL(error) << "Pipeliner: Attempt to restart a drained pipeline";
    return false;
  }
  drained_ = true;

  try {
    while (!eof_) {
      if (!fill_buffer()) {
        return false;
      }

      const std::string block = buffer_.str();
      buffer_.str("");
      buffer_.clear();

      if (!block.empty()) {
        sink(block.data(), block.size());
        total_size_ += block.size();
      }
    }
    return true;

  } catch (const std::exception& e) {
    last_error_ = e.what();
    BOOST_LOG_TRIVIAL(error) << "Pipeliner: Sink error: " << e.what();
    return false;
  }
}

bool Pipeliner::fill_buffer() {
  while (buffer_.tellp() < static_cast<std::streampos>(buffer_size_) && !eof_) {
    if (!pull_next_block() && !eof_) {
      return false;
    }
  }
  return true;
}

bool Pipeliner::pull_next_block() {
  try {
    std::stringstream block;

    // Get next block from producer
    if (!producer_(block)) {
      eof_ = true;
      return false;
    }

    // An empty block is legal; nothing to pass on
    std::string block_data = block.str();
    if (block_data.empty()) {
      return true;
    }

    // Process block through transforms
    std::stringstream current_stream(block_data);

    for (const auto& transform : transforms_) {
      std::stringstream next_stream;
      if (!transform(current_stream, next_stream)) {
        last_error_ = "transform failed";
        BOOST_LOG_TRIVIAL(error) << "Pipeliner: Transform failed in pipeline";
        return false;
      }
      current_stream = std::move(next_stream);
    }

    // Append transformed block to buffer
    const std::string transformed = current_stream.str();
    buffer_.write(transformed.data(), static_cast<std::streamsize>(transformed.size()));
    return true;

  } catch (const std::exception& e) {
    last_error_ = e.what();
    BOOST_LOG_TRIVIAL(error) << "Pipeliner: Chunk processing error: " << e.what();
    return false;
  }
}


//==============================================
// GETTERS AND SETTERS
//==============================================

void Pipeliner::set_buffer_size(std::size_t size) {
  if (size == 0) {
    throw std::invalid_argument("Pipeliner buffer size must be positive");
  }
  buffer_size_ = size;
}

} // namespace utils
} // namespace chunkd
