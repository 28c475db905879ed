#include "cli/cli.hpp"
#include <boost/log/trivial.hpp>
#include <chrono>
#include <fstream>
#include <sstream>

namespace chunkd {
namespace cli {

namespace {

// Parses a whole decimal argument into value
bool parse_integer(const std::string& text, int64_t& value) {
  try {
    std::size_t consumed = 0;
    long long parsed = std::stoll(text, &consumed);
    if (consumed != text.size()) {
      return false;
    }
    value = static_cast<int64_t>(parsed);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(engine::ChunkEngine& engine, std::istream& input, std::ostream& output)
  : running_(false)
  , engine_(engine)
  , input_(input)
  , output_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "CLI: Starting CLI loop";
  output_ << "chunkd> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    running_ = execute(line);

    if (running_) {
      output_ << "chunkd> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  if (!(iss >> command)) {
    return true;
  }
  if (command == "quit") {
    return false;
  }

  std::vector<std::string> args;
  std::string arg;
  while (iss >> arg) {
    args.push_back(arg);
  }

  process_command(command, args);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command << " with " << args.size() << " arguments";

  if (command == "help" && args.empty()) {
    handle_help_command();
  }
  else if (command == "sessions" && args.empty()) {
    handle_sessions_command();
  }
  else if (command == "artifacts" && args.empty()) {
    handle_artifacts_command();
  }
  else if (command == "status" && args.size() == 1) {
    handle_status_command(args[0]);
  }
  else if (command == "upload" && args.size() == 3) {
    handle_upload_command(args[0], args[1], args[2]);
  }
  else if (command == "merge" && args.size() == 3) {
    handle_merge_command(args[0], args[1], args[2]);
  }
  else if (command == "fetch" && args.size() == 2) {
    handle_fetch_command(args[0], args[1]);
  }
  else if (command == "gc" && args.empty()) {
    handle_gc_command();
  }
  else {
    output_ << "Unknown command or invalid arguments. Type 'help' for usage." << std::endl;
  }
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                              Display this help message" << std::endl;
  output_ << "  sessions                          List open upload sessions" << std::endl;
  output_ << "  artifacts                         List merged artifacts" << std::endl;
  output_ << "  status <session>                  Show received chunks of <session>" << std::endl;
  output_ << "  upload <session> <index> <file>   Store local <file> as chunk <index>" << std::endl;
  output_ << "  merge <session> <total> <name>    Merge chunks 0..total-1 into an artifact" << std::endl;
  output_ << "  fetch <artifact> <file>           Copy <artifact> to local <file>" << std::endl;
  output_ << "  gc                                Collect expired sessions" << std::endl;
  output_ << "  quit                              Exit the shell" << std::endl << std::endl;
}

void CLI::handle_sessions_command() {
  auto sessions = engine_.sessions();
  if (sessions.empty()) {
    output_ << "No sessions" << std::endl;
    return;
  }
  for (const auto& key : sessions) {
    output_ << "  " << key << std::endl;
  }
}

void CLI::handle_artifacts_command() {
  auto artifacts = engine_.artifacts();
  if (artifacts.empty()) {
    output_ << "No artifacts" << std::endl;
    return;
  }
  for (const auto& name : artifacts) {
    auto size = engine_.artifact_size(name);
    output_ << "  " << name << " (" << (size ? *size : 0) << " bytes)" << std::endl;
  }
}

void CLI::handle_status_command(const std::string& session_key) {
  auto status = engine_.session_status(session_key);
  if (!status) {
    output_ << "Unknown session: " << session_key << std::endl;
    return;
  }

  auto idle = std::chrono::duration_cast<std::chrono::seconds>(status->idle);
  output_ << "Session " << status->session_key << ": " << session::session_state_to_string(status->state)
          << ", " << status->received.size() << " chunks, " << status->uploads_in_flight
          << " uploads in flight, idle " << idle.count() << "s" << std::endl;

  if (!status->received.empty()) {
    output_ << "  received:";
    for (auto index : status->received) {
      output_ << " " << index;
    }
    output_ << std::endl;
  }
}

void CLI::handle_upload_command(const std::string& session_key, const std::string& index, const std::string& path) {
  int64_t chunk_index = 0;
  if (!parse_integer(index, chunk_index)) {
    output_ << "Invalid chunk index: " << index << std::endl;
    return;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    output_ << "Error opening file: " << path << std::endl;
    return;
  }

  auto result = engine_.upload_chunk(session_key, chunk_index, file);
  if (!result.ok()) {
    log_and_display_error("Upload failed", result.message);
    return;
  }
  output_ << result.message << " (" << result.bytes_stored << " bytes)" << std::endl;
}

void CLI::handle_merge_command(const std::string& session_key, const std::string& total, const std::string& filename) {
  int64_t total_chunks = 0;
  if (!parse_integer(total, total_chunks)) {
    output_ << "Invalid chunk count: " << total << std::endl;
    return;
  }

  auto result = engine_.merge(session_key, total_chunks, filename);
  if (!result.ok()) {
    log_and_display_error("Merge failed", result.message);
    return;
  }
  output_ << result.message << ": " << result.artifact_name << " (" << result.size << " bytes, sha256 "
          << result.sha256 << ")" << std::endl;
}

void CLI::handle_fetch_command(const std::string& artifact_name, const std::string& path) {
  auto result = engine_.fetch(artifact_name);
  if (!result.ok()) {
    log_and_display_error("Fetch failed", result.message);
    return;
  }

  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    output_ << "Error opening file: " << path << std::endl;
    return;
  }
  if (result.size > 0) {
    file << result.data->rdbuf();
  }
  if (!file) {
    log_and_display_error("Fetch failed", "could not write " + path);
    return;
  }
  output_ << "Wrote " << result.size << " bytes to " << path << std::endl;
}

void CLI::handle_gc_command() {
  const auto ttl = engine_.get_config().session_ttl;
  if (ttl.count() <= 0) {
    output_ << "Session expiry is disabled" << std::endl;
    return;
  }
  std::size_t collected = engine_.collect_expired_sessions(ttl);
  output_ << "Collected " << collected << " expired sessions" << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace chunkd
