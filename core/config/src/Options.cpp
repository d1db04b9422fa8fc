#include "Options.h"
#include "Config.h"

#include <chrono>
#include <map>
#include <sstream>
#include <unordered_map>

namespace Ferry {

namespace {
    struct FlagSpec {
        std::string key;
        bool takesValue;
    };

    using FlagTable = std::map<std::string, FlagSpec>;

    const FlagTable& serverFlags() {
        static const FlagTable flags = {
            {"--config", {"", true}},
            {"--addr", {"listen_address", true}},
            {"--cert", {"cert_path", true}},
            {"--key", {"key_path", true}},
            {"--output", {"output_dir", true}},
            {"--max-transfers", {"max_transfers", true}},
            {"--chunk-size", {"chunk_size", true}},
            {"--idle-timeout", {"idle_timeout_ms", true}},
            {"--log-level", {"log_level", true}},
            {"--log-file", {"log_file", true}},
            {"--log-max-mb", {"log_max_mb", true}},
            {"--help", {"", false}},
        };
        return flags;
    }

    const FlagTable& clientFlags() {
        static const FlagTable flags = {
            {"--config", {"", true}},
            {"--file", {"file", true}},
            {"--server", {"server_address", true}},
            {"--server-name", {"server_name", true}},
            {"--ca-cert", {"ca_cert", true}},
            {"--chunk-size", {"chunk_size", true}},
            {"--idle-timeout", {"idle_timeout_ms", true}},
            {"--log-level", {"log_level", true}},
            {"--help", {"", false}},
        };
        return flags;
    }

    /**
     * Layers the config file and the flags over the defaults already in config.
     * Sets help when --help is present.
     */
    VoidResult layer(const std::vector<std::string>& args, const FlagTable& flags,
                     Config& config, bool& help) {
        std::unordered_map<std::string, std::string> overrides;
        std::string configPath;

        for (std::size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            auto it = flags.find(arg);
            if (it == flags.end()) {
                return Err(ErrorCode::INVALID_CONFIGURATION, "Unknown option: " + arg, "Options");
            }
            if (!it->second.takesValue) {
                help = true;
                continue;
            }
            if (i + 1 >= args.size()) {
                return Err(ErrorCode::INVALID_CONFIGURATION, "Missing value for " + arg, "Options");
            }
            const std::string& value = args[++i];
            if (arg == "--config") {
                configPath = value;
            } else {
                overrides[it->second.key] = value;
            }
        }

        if (help) {
            return Ok();
        }

        if (!configPath.empty()) {
            auto loaded = config.loadFromFile(configPath);
            if (!loaded) {
                return loaded;
            }
        }
        for (const auto& [key, value] : overrides) {
            config.set(key, value);
        }
        return Ok();
    }

    bool inRange(const std::string& value, std::size_t low, std::size_t high) {
        if (!Config::isUnsignedInteger(value)) return false;
        unsigned long long parsed = std::stoull(value);
        return parsed >= low && parsed <= high;
    }

    std::unordered_map<std::string, Config::Validator> commonSchema() {
        return {
            {"chunk_size", [](const std::string&, const std::string& v) {
                return inRange(v, 1, Options::MAX_CHUNK_SIZE);
            }},
            {"idle_timeout_ms", [](const std::string&, const std::string& v) {
                return inRange(v, 0, 24ull * 3600 * 1000);
            }},
            {"keepalive_ms", [](const std::string&, const std::string& v) {
                return inRange(v, 0, 24ull * 3600 * 1000);
            }},
            {"log_level", [](const std::string&, const std::string& v) {
                return Logger::parseLevel(v).has_value();
            }},
        };
    }

    VoidResult checkSchema(const Config& config, const std::unordered_map<std::string, Config::Validator>& schema) {
        std::string rejected = config.validate(schema);
        if (!rejected.empty()) {
            return Err(ErrorCode::INVALID_CONFIGURATION,
                       "Invalid value for " + rejected + ": '" + config.get(rejected) + "'", "Options");
        }
        return Ok();
    }

    SessionOptions sessionOptions(const Config& config) {
        SessionOptions options;
        options.idleTimeout = std::chrono::milliseconds(config.getSize("idle_timeout_ms", 30000));
        // Ping well inside the peer's idle timeout unless configured explicitly
        std::size_t keepAlive = static_cast<std::size_t>(options.idleTimeout.count() / 3);
        options.keepAlive = std::chrono::milliseconds(config.getSize("keepalive_ms", keepAlive));
        options.maxIncomingStreams = config.getSize("max_streams_per_session", options.maxIncomingStreams);
        return options;
    }
}

std::vector<std::string> Options::collectArgs(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return args;
}

Result<ServerOptions> Options::parseServer(const std::vector<std::string>& args) {
    Config config;
    config.set("listen_address", "0.0.0.0:4433");
    config.set("cert_path", "certs/server-cert.pem");
    config.set("key_path", "certs/server-key.pem");
    config.set("output_dir", "received");
    config.set("max_transfers", "16");
    config.set("max_streams_per_session", "16");
    config.set("chunk_size", std::to_string(StreamFramer::DEFAULT_CHUNK_SIZE));
    config.set("idle_timeout_ms", "30000");
    config.set("log_level", "info");
    config.set("log_max_mb", std::to_string(DEFAULT_LOG_MAX_MB));

    ServerOptions options;
    auto layered = layer(args, serverFlags(), config, options.showHelp);
    if (!layered) {
        return layered.error();
    }
    if (options.showHelp) {
        return options;
    }

    auto schema = commonSchema();
    schema["max_transfers"] = [](const std::string&, const std::string& v) {
        return inRange(v, 1, MAX_TRANSFERS_LIMIT);
    };
    schema["max_streams_per_session"] = [](const std::string&, const std::string& v) {
        return inRange(v, 1, MAX_TRANSFERS_LIMIT);
    };
    schema["log_max_mb"] = [](const std::string&, const std::string& v) {
        return inRange(v, 1, MAX_LOG_MAX_MB);
    };
    auto checked = checkSchema(config, schema);
    if (!checked) {
        return checked.error();
    }

    auto address = NetAddress::parse(config.get("listen_address"));
    if (!address) {
        return address.error();
    }

    for (const char* key : {"cert_path", "key_path", "output_dir"}) {
        if (config.get(key).empty()) {
            return Err(ErrorCode::INVALID_CONFIGURATION, std::string(key) + " must not be empty", "Options");
        }
    }

    auto& settings = options.acceptor;
    settings.listenAddress = address.value();
    settings.certPath = config.get("cert_path");
    settings.keyPath = config.get("key_path");
    settings.outputDir = config.get("output_dir");
    settings.maxTransfers = config.getSize("max_transfers", 16);
    settings.chunkSize = config.getSize("chunk_size", StreamFramer::DEFAULT_CHUNK_SIZE);
    settings.session = sessionOptions(config);

    options.logLevel = Logger::parseLevel(config.get("log_level")).value_or(LogLevel::INFO);
    options.logFile = config.get("log_file");
    options.logMaxMb = config.getSize("log_max_mb", DEFAULT_LOG_MAX_MB);
    return options;
}

Result<ClientOptions> Options::parseClient(const std::vector<std::string>& args) {
    Config config;
    config.set("server_address", "127.0.0.1:4433");
    config.set("server_name", "localhost");
    config.set("ca_cert", "certs/server-cert.pem");
    config.set("chunk_size", std::to_string(StreamFramer::DEFAULT_CHUNK_SIZE));
    config.set("idle_timeout_ms", "30000");
    config.set("log_level", "info");

    ClientOptions options;
    auto layered = layer(args, clientFlags(), config, options.showHelp);
    if (!layered) {
        return layered.error();
    }
    if (options.showHelp) {
        return options;
    }

    auto checked = checkSchema(config, commonSchema());
    if (!checked) {
        return checked.error();
    }

    if (config.get("file").empty()) {
        return Err(ErrorCode::INVALID_CONFIGURATION, "--file is required", "Options");
    }
    if (config.get("server_name").empty()) {
        return Err(ErrorCode::INVALID_CONFIGURATION, "server_name must not be empty", "Options");
    }

    auto address = NetAddress::parse(config.get("server_address"));
    if (!address) {
        return address.error();
    }

    auto& settings = options.source;
    settings.filePath = config.get("file");
    settings.server = address.value();
    settings.serverName = config.get("server_name");
    settings.caCertPath = config.get("ca_cert");
    settings.chunkSize = config.getSize("chunk_size", StreamFramer::DEFAULT_CHUNK_SIZE);
    settings.session = sessionOptions(config);

    options.logLevel = Logger::parseLevel(config.get("log_level")).value_or(LogLevel::INFO);
    return options;
}

std::string Options::serverUsage(const std::string& program) {
    std::ostringstream oss;
    oss << "Ferry server - receives files over QUIC streams\n"
        << "\nUsage: " << program << " [OPTIONS]\n"
        << "\nOptions:\n"
        << "  --config <FILE>          key=value config file\n"
        << "  --addr <HOST:PORT>       Listen address (default: 0.0.0.0:4433)\n"
        << "  --cert <PATH>            Certificate PEM, generated if missing (default: certs/server-cert.pem)\n"
        << "  --key <PATH>             Private key PEM (default: certs/server-key.pem)\n"
        << "  --output <DIR>           Directory for received files (default: received)\n"
        << "  --max-transfers <N>      Concurrent transfers before streams are refused (default: 16)\n"
        << "  --chunk-size <BYTES>     Read/write chunk size (default: 65536)\n"
        << "  --idle-timeout <MS>      Drop silent sessions after this long (default: 30000)\n"
        << "  --log-level <LEVEL>      debug, info, warn, error or critical (default: info)\n"
        << "  --log-file <PATH>        Also log to this file\n"
        << "  --log-max-mb <MB>        Rotate the log file at this size (default: " << DEFAULT_LOG_MAX_MB << ")\n"
        << "  --help                   Show this help message\n";
    return oss.str();
}

std::string Options::clientUsage(const std::string& program) {
    std::ostringstream oss;
    oss << "Ferry client - sends one file to a Ferry server\n"
        << "\nUsage: " << program << " --file <PATH> [OPTIONS]\n"
        << "\nOptions:\n"
        << "  --file <PATH>            File to send (required)\n"
        << "  --config <FILE>          key=value config file\n"
        << "  --server <HOST:PORT>     Server address (default: 127.0.0.1:4433)\n"
        << "  --server-name <NAME>     Name the server certificate must match (default: localhost)\n"
        << "  --ca-cert <PATH>         Trust anchor PEM (default: certs/server-cert.pem)\n"
        << "  --chunk-size <BYTES>     Read/write chunk size (default: 65536)\n"
        << "  --idle-timeout <MS>      Give up after this long without data (default: 30000)\n"
        << "  --log-level <LEVEL>      debug, info, warn, error or critical (default: info)\n"
        << "  --help                   Show this help message\n";
    return oss.str();
}

} // namespace Ferry
