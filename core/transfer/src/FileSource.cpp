#include "FileSource.h"
#include "FileIO.h"
#include "SecureEndpoint.h"
#include "TLSContext.h"
#include "Logger.h"

namespace Ferry {

FileSource::FileSource(Settings settings)
    : settings_(std::move(settings)) {}

Result<FileSource::Report> FileSource::run() {
    auto& logger = Logger::instance();
    auto started = std::chrono::steady_clock::now();

    auto opened = LocalFileReader::open(settings_.filePath);
    if (!opened) {
        return opened.error();
    }
    std::unique_ptr<LocalFileReader> reader = std::move(opened.value());

    TLSContext tls(TLSContext::Mode::CLIENT);
    auto initialized = tls.initialize();
    if (!initialized) {
        return initialized.error();
    }
    auto trusted = tls.loadTrustAnchor(settings_.caCertPath);
    if (!trusted) {
        return trusted.error();
    }

    logger.info("Sending " + settings_.filePath + " (" + std::to_string(reader->size()) + " bytes) to " +
                settings_.server.toString(), "FileSource");

    auto connected = connectSecure(settings_.server, settings_.serverName, tls, settings_.session);
    if (!connected) {
        return connected.error();
    }
    std::shared_ptr<SecureSession> session = connected.value();

    auto openedStream = session->openBidirectionalStream();
    if (!openedStream) {
        session->abort();
        return openedStream.error();
    }
    std::unique_ptr<Stream> stream = std::move(openedStream.value());

    StreamFramer framer(settings_.chunkSize);
    auto sent = framer.send(*stream, *reader, progress_);
    if (!sent) {
        stream.reset();
        session->close(ConnectionCloseCode::TRANSFER_FAILED, sent.error().message);
        return sent.error();
    }

    auto acknowledged = framer.awaitAcknowledgement(*stream);
    if (!acknowledged) {
        stream.reset();
        session->close(ConnectionCloseCode::TRANSFER_FAILED, acknowledged.error().message);
        return acknowledged.error();
    }

    stream.reset();
    session->close(ConnectionCloseCode::NO_ERROR);

    Report report;
    report.bytesSent = sent.value();
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return report;
}

} // namespace Ferry
