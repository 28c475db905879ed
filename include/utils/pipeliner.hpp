#ifndef CHUNKD_UTILS_PIPELINER_HPP
#define CHUNKD_UTILS_PIPELINER_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace chunkd {
namespace utils {

class Pipeliner;

// Producer writes the next block into the stream; returns false once exhausted
using ProducerFn = std::function<bool(std::stringstream&)>;
using TransformFn = std::function<bool(std::stringstream&, std::stringstream&)>;
using SinkFn = std::function<void(const char*, std::size_t)>;
using PipelinerPtr = std::shared_ptr<Pipeliner>;

// Pulls blocks from a lazy producer, runs them through transforms and hands
// buffered output to a sink. A pipeline runs once; it cannot be restarted.
class Pipeliner : public std::enable_shared_from_this<Pipeliner> {
public:

  // ---- CONSTRUCTOR ----
  explicit Pipeliner(ProducerFn producer);


  // ---- PIPELINE CONSTRUCTION METHODS ----
  // Creates pipeline with a producer function
  static PipelinerPtr create(ProducerFn producer);
  // Appends a transform; used in method chaining
  PipelinerPtr transform(TransformFn transform);


  // ---- PIPELINE EXECUTION ----
  // Runs the producer to exhaustion, flushing to the sink whenever the buffer
  // reaches buffer_size. Returns false on any producer, transform or sink failure.
  bool drain(const SinkFn& sink);


  // ---- GETTERS AND SETTERS ----
  std::size_t get_total_size() const { return total_size_; }
  std::size_t get_buffer_size() const { return buffer_size_; }
  bool is_drained() const { return drained_; }
  const std::string& last_error() const { return last_error_; }

  void set_buffer_size(std::size_t size);

private:
  // ---- PARAMETERS ----
  ProducerFn producer_;
  std::vector<TransformFn> transforms_;
  std::size_t buffer_size_;
  bool drained_;
  bool eof_;
  std::stringstream buffer_;
  std::size_t total_size_{0};
  std::string last_error_;


  // ---- PIPELINE EXECUTION ----
  // Processes blocks until buffer reaches target size or EOF
  bool fill_buffer();
  // Gets next block from producer, applies transforms,
  // and appends to buffer
  bool pull_next_block();
};

} // namespace utils
} // namespace chunkd

#endif // CHUNKD_UTILS_PIPELINER_HPP
