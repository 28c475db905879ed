#include "network/bootstrap.hpp"
#include <boost/log/trivial.hpp>

namespace chunkd {
namespace network {

Bootstrap::Bootstrap(const config::EngineConfig& engine_config, const config::ServerConfig& server_config)
    : engine_config_(engine_config)
    , server_config_(server_config) {

    BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Initializing components";

    try {
        // Engine first (no dependencies); recovers persisted sessions
        engine_ = std::make_unique<engine::ChunkEngine>(engine_config_);
        BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: Chunk engine created successfully";

        handler_ = std::make_unique<RequestHandler>(*engine_, server_config_.max_payload_size);
        BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: Request handler created successfully";

        tcp_server_ = std::make_unique<TCP_Server>(server_config_, *handler_);
        BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: TCP Server created successfully";

        sweeper_ = std::make_unique<engine::SessionSweeper>(*engine_, engine_config_.session_ttl,
                                                            engine_config_.sweep_interval);
        BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: Session sweeper created successfully";

        BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Successfully created all components";
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Failed to initialize components: " << e.what();
        throw;
    }
}

bool Bootstrap::start() {
    try {
        // Start TCP server
        if (!tcp_server_->start_listener()) {
            BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Failed to start TCP server";
            return false;
        }

        // Expiry may be disabled; that is not a startup failure
        sweeper_->start();

        BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Bootstrap successfully started on port "
                                << tcp_server_->local_port();
        return true;
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Failed to start bootstrap: " << e.what();
        return false;
    }
}

bool Bootstrap::shutdown() {
    try {
        BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Initiating shutdown sequence";

        if (sweeper_) {
            BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: Shutting down Session sweeper";
            sweeper_->shutdown();
            sweeper_.reset();
        }

        // Server next so no request reaches the engine while it is torn down
        if (tcp_server_) {
            BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: Shutting down TCP Server";
            tcp_server_->shutdown();
            tcp_server_.reset();
        }

        handler_.reset();

        if (engine_) {
            BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: Shutting down Chunk engine";
            engine_.reset();
        }

        BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Shutdown complete";
        return true;
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Error during shutdown: " << e.what();
        return false;
    }
}

Bootstrap::~Bootstrap() {
    try {
        if (!this->shutdown()) {
            BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Failed to shutdown cleanly in destructor";
        }
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Error during destructor shutdown: " << e.what();
    }
}

} // namespace network
} // namespace chunkd
