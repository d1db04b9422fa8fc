#pragma once

#include "ConnectionAcceptor.h"
#include "FileSource.h"
#include "Logger.h"
#include "Result.h"

#include <cstddef>
#include <string>
#include <vector>

namespace Ferry {

/// Log file size in MiB before it is rotated
constexpr std::size_t DEFAULT_LOG_MAX_MB = 100;

struct ServerOptions {
    ConnectionAcceptor::Settings acceptor;
    LogLevel logLevel{LogLevel::INFO};
    std::string logFile;
    std::size_t logMaxMb{DEFAULT_LOG_MAX_MB};
    bool showHelp{false};
};

struct ClientOptions {
    FileSource::Settings source;
    LogLevel logLevel{LogLevel::INFO};
    bool showHelp{false};
};

/**
 * @brief Command line and config file handling for both executables
 *
 * Precedence, lowest first: built-in defaults, the --config file, flags.
 * Every rejected value is reported as INVALID_CONFIGURATION (or
 * INVALID_ADDRESS for addresses).
 *
 * Config file keys:
 *   server: listen_address, cert_path, key_path, output_dir, max_transfers,
 *           max_streams_per_session, chunk_size, idle_timeout_ms,
 *           keepalive_ms, log_level, log_file, log_max_mb
 *   client: file, server_address, server_name, ca_cert, chunk_size,
 *           idle_timeout_ms, keepalive_ms, log_level
 */
class Options {
public:
    static constexpr std::size_t MAX_CHUNK_SIZE = 16 * 1024 * 1024;
    static constexpr std::size_t MAX_TRANSFERS_LIMIT = 1024;
    static constexpr std::size_t MAX_LOG_MAX_MB = 10240;

    static Result<ServerOptions> parseServer(const std::vector<std::string>& args);
    static Result<ClientOptions> parseClient(const std::vector<std::string>& args);

    static std::string serverUsage(const std::string& program);
    static std::string clientUsage(const std::string& program);

    /**
     * @brief argv without the program name
     */
    static std::vector<std::string> collectArgs(int argc, char* argv[]);
};

} // namespace Ferry
