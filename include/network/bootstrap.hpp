#pragma once

#include <memory>
#include "config/config.hpp"
#include "engine/chunk_engine.hpp"
#include "engine/session_sweeper.hpp"
#include "network/request_handler.hpp"
#include "network/tcp_server.hpp"

namespace chunkd {
namespace network {

// Builds and owns the service components in dependency order
class Bootstrap {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Bootstrap(const config::EngineConfig& engine_config, const config::ServerConfig& server_config);
  ~Bootstrap();

  // ---- INITIALIZATION AND DESTRUCTION METHODS ----
  // Starts listener and session sweeper
  bool start();
  // Terminates all components in reverse order of creation
  bool shutdown();


  // ---- GETTERS AND SETTERS ----
  engine::ChunkEngine& get_engine() { return *engine_; }
  TCP_Server& get_server() { return *tcp_server_; }

private:
  // ---- PARAMETERS ----
  config::EngineConfig engine_config_;
  config::ServerConfig server_config_;

  // System components
  std::unique_ptr<engine::ChunkEngine> engine_;
  std::unique_ptr<RequestHandler> handler_;
  std::unique_ptr<TCP_Server> tcp_server_;
  std::unique_ptr<engine::SessionSweeper> sweeper_;
};

} // namespace network
} // namespace chunkd
