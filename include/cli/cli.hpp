#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "engine/chunk_engine.hpp"

namespace chunkd {
namespace cli {

// Operator shell over a local ChunkEngine
class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit CLI(engine::ChunkEngine& engine, std::istream& input = std::cin, std::ostream& output = std::cout);


    // ---- STARTUP ----
    void run();
    // Executes one command line; returns false once the shell should exit
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    engine::ChunkEngine& engine_;
    std::istream& input_;
    std::ostream& output_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& args);
    void handle_help_command();
    void handle_sessions_command();
    void handle_artifacts_command();
    void handle_status_command(const std::string& session_key);
    void handle_upload_command(const std::string& session_key, const std::string& index, const std::string& path);
    void handle_merge_command(const std::string& session_key, const std::string& total, const std::string& filename);
    void handle_fetch_command(const std::string& artifact_name, const std::string& path);
    void handle_gc_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace chunkd
