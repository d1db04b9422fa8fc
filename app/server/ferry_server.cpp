#include <csignal>
#include <iostream>
#include <string>

#include "ConnectionAcceptor.h"
#include "ErrorCodes.h"
#include "Logger.h"
#include "Options.h"

using namespace Ferry;

namespace {
    volatile std::sig_atomic_t g_stopRequested = 0;

    void handleSignal(int) {
        g_stopRequested = 1;
    }
}

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "ferry_server";

    auto parsed = Options::parseServer(Options::collectArgs(argc, argv));
    if (!parsed) {
        std::cerr << "Error: " << parsed.error().toString() << "\n\n" << Options::serverUsage(program);
        return exitStatusFor(parsed.error().code);
    }
    ServerOptions options = parsed.value();

    if (options.showHelp) {
        std::cout << Options::serverUsage(program);
        return 0;
    }

    auto& logger = Logger::instance();
    logger.setLevel(options.logLevel);
    logger.setComponent("Server");
    if (!options.logFile.empty()) {
        logger.setLogFile(options.logFile);
        logger.setMaxFileSize(options.logMaxMb);
    }

    logger.info("=== Ferry Server Starting ===", "Server");

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);
    std::signal(SIGPIPE, SIG_IGN);

    ConnectionAcceptor acceptor(options.acceptor);
    auto started = acceptor.start();
    if (!started) {
        logger.critical("Failed to start: " + started.error().toString(), "Server");
        std::cerr << "Error: " << started.error().toString() << std::endl;
        return exitStatusFor(started.error().code);
    }

    logger.info("Listening on " + acceptor.localAddress().toString(), "Server");
    std::cout << "Listening on " << acceptor.localAddress().toString() << std::endl;

    auto outcome = acceptor.run([]() { return g_stopRequested != 0; });
    if (!outcome) {
        logger.critical("Server stopped on error: " + outcome.error().toString(), "Server");
        std::cerr << "Error: " << outcome.error().toString() << std::endl;
        return exitStatusFor(outcome.error().code);
    }

    logger.info("=== Ferry Server Stopped ===", "Server");
    return 0;
}
