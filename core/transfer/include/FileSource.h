#pragma once

#include "NetAddress.h"
#include "SecureSession.h"
#include "StreamFramer.h"
#include "Result.h"

#include <chrono>
#include <cstdint>
#include <string>

namespace Ferry {

/**
 * @brief Client-side driver: sends one file over one stream of one session
 */
class FileSource {
public:
    struct Settings {
        std::string filePath;
        NetAddress server;
        std::string serverName{"localhost"};
        std::string caCertPath;
        std::size_t chunkSize{StreamFramer::DEFAULT_CHUNK_SIZE};
        SessionOptions session;
    };

    struct Report {
        uint64_t bytesSent{0};
        std::chrono::milliseconds elapsed{0};
    };

    explicit FileSource(Settings settings);

    void setProgressCallback(StreamFramer::ProgressCallback callback) { progress_ = std::move(callback); }

    /**
     * @brief Transfer the file and wait for the server's acknowledgement
     *
     * The local file is opened and the trust anchor loaded before any
     * network activity.
     */
    Result<Report> run();

private:
    Settings settings_;
    StreamFramer::ProgressCallback progress_;
};

} // namespace Ferry
