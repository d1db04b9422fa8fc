#include <csignal>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include "ErrorCodes.h"
#include "FileSource.h"
#include "Logger.h"
#include "Options.h"

using namespace Ferry;

namespace {
    std::string formatRate(uint64_t bytes, std::chrono::milliseconds elapsed) {
        double seconds = elapsed.count() > 0 ? elapsed.count() / 1000.0 : 0.001;
        double mib = static_cast<double>(bytes) / (1024.0 * 1024.0);
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << (mib / seconds) << " MiB/s";
        return oss.str();
    }
}

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "ferry_client";

    auto parsed = Options::parseClient(Options::collectArgs(argc, argv));
    if (!parsed) {
        std::cerr << "Error: " << parsed.error().toString() << "\n\n" << Options::clientUsage(program);
        return exitStatusFor(parsed.error().code);
    }
    ClientOptions options = parsed.value();

    if (options.showHelp) {
        std::cout << Options::clientUsage(program);
        return 0;
    }

    auto& logger = Logger::instance();
    logger.setLevel(options.logLevel);
    logger.setComponent("Client");

    std::signal(SIGPIPE, SIG_IGN);

    FileSource source(options.source);
    uint64_t lastReported = 0;
    source.setProgressCallback([&logger, &lastReported](uint64_t bytesSoFar) {
        // One line per MiB
        if (bytesSoFar - lastReported >= 1024 * 1024) {
            lastReported = bytesSoFar;
            logger.debug("Sent " + std::to_string(bytesSoFar) + " bytes", "Client");
        }
    });

    auto report = source.run();
    if (!report) {
        logger.error("Transfer failed: " + report.error().toString(), "Client");
        std::cerr << "Error: " << report.error().toString() << std::endl;
        return exitStatusFor(report.error().code);
    }

    logger.info("Sent " + std::to_string(report.value().bytesSent) + " bytes in " +
                std::to_string(report.value().elapsed.count()) + "ms (" +
                formatRate(report.value().bytesSent, report.value().elapsed) + ")", "Client");
    return 0;
}
