#include "OutputAllocator.h"
#include "PathValidator.h"
#include "Logger.h"
#include "LoggerMacros.h"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <iomanip>
#include <sstream>
#include <unistd.h>

namespace Ferry {

namespace fs = std::filesystem;

namespace {
    bool startsWith(const std::string& value, const std::string& prefix) {
        return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
    }

    bool endsWith(const std::string& value, const std::string& suffix) {
        return value.size() >= suffix.size() &&
               value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    std::optional<uint32_t> randomTag() {
        uint32_t tag = 0;
        if (RAND_bytes(reinterpret_cast<unsigned char*>(&tag), sizeof(tag)) != 1) {
            LOG_WARN_COMP("RAND_bytes failed (" + std::to_string(ERR_get_error()) +
                          "); naming by sequence number", "OutputAllocator");
            return std::nullopt;
        }
        return tag;
    }

    std::atomic<uint32_t> nameSequence{0};

    std::string describeErrno(const std::string& action, const fs::path& path) {
        return action + " " + path.string() + ": " + std::string(strerror(errno));
    }
}

// OutputFile

OutputFile::OutputFile(OutputAllocator& allocator, FdGuard fd, fs::path partialPath,
                       fs::path finalPath, uint64_t sessionId, uint64_t streamId)
    : allocator_(allocator)
    , fd_(std::move(fd))
    , partialPath_(std::move(partialPath))
    , finalPath_(std::move(finalPath))
    , sessionId_(sessionId)
    , streamId_(streamId) {}

OutputFile::~OutputFile() {
    discard();
}

VoidResult OutputFile::write(const uint8_t* data, std::size_t size) {
    if (!fd_) {
        return Err(ErrorCode::FILE_WRITE_FAILED, "Output file is closed", "OutputFile");
    }

    std::size_t offset = 0;
    while (offset < size) {
        ssize_t n = ::write(fd_.get(), data + offset, size - offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Err(ErrorCode::FILE_WRITE_FAILED, describeErrno("Write to", partialPath_), "OutputFile");
        }
        offset += static_cast<std::size_t>(n);
    }
    bytesWritten_ += size;
    return Ok();
}

VoidResult OutputFile::flush() {
    if (!fd_) {
        return Err(ErrorCode::FILE_WRITE_FAILED, "Output file is closed", "OutputFile");
    }
    if (::fsync(fd_.get()) != 0) {
        return Err(ErrorCode::FILE_WRITE_FAILED, describeErrno("fsync of", partialPath_), "OutputFile");
    }
    return Ok();
}

VoidResult OutputFile::commit() {
    if (committed_) {
        return Ok();
    }
    if (discarded_) {
        return Err(ErrorCode::FILE_PUBLISH_FAILED, "Output file was discarded", "OutputFile");
    }

    auto flushed = flush();
    if (!flushed) {
        return flushed;
    }
    if (fd_.close() != 0) {
        return Err(ErrorCode::FILE_WRITE_FAILED, describeErrno("Close of", partialPath_), "OutputFile");
    }
    return publish();
}

VoidResult OutputFile::publish() {
    auto& logger = Logger::instance();

    for (int attempt = 0; attempt < OutputAllocator::MAX_NAME_ATTEMPTS; ++attempt) {
        if (attempt > 0) {
            std::string name;
            finalPath_ = allocator_.candidatePath(sessionId_, streamId_, name);
            if (finalPath_.empty()) {
                return Err(ErrorCode::INTERNAL_ERROR, "Generated unsafe output name: " + name, "OutputFile");
            }
        }

        // link() never replaces an existing entry
        if (::link(partialPath_.c_str(), finalPath_.c_str()) == 0) {
            if (::unlink(partialPath_.c_str()) != 0) {
                logger.warn(describeErrno("Could not remove", partialPath_), "OutputFile");
            }
            committed_ = true;
            return Ok();
        }

        if (errno == EEXIST) {
            LOG_DEBUG_COMP_IF("Name collision on " + finalPath_.string(), "OutputFile");
            continue;
        }

        // Filesystems without hard links
        if (errno == EPERM || errno == EOPNOTSUPP || errno == EMLINK) {
            if (::renameat2(AT_FDCWD, partialPath_.c_str(), AT_FDCWD, finalPath_.c_str(), RENAME_NOREPLACE) == 0) {
                committed_ = true;
                return Ok();
            }
            if (errno == EEXIST) {
                continue;
            }
        }

        return Err(ErrorCode::FILE_PUBLISH_FAILED,
                   describeErrno("Cannot publish " + partialPath_.string() + " as", finalPath_), "OutputFile");
    }

    return Err(ErrorCode::NAME_ALLOCATION_EXHAUSTED,
               "No free output name after " + std::to_string(OutputAllocator::MAX_NAME_ATTEMPTS) + " attempts",
               "OutputFile");
}

void OutputFile::discard() {
    if (committed_ || discarded_) {
        return;
    }
    discarded_ = true;
    fd_.reset();
    if (::unlink(partialPath_.c_str()) != 0 && errno != ENOENT) {
        Logger::instance().warn(describeErrno("Could not remove", partialPath_), "OutputFile");
    }
}

// OutputAllocator

OutputAllocator::OutputAllocator(fs::path directory, NameGenerator generator)
    : directory_(std::move(directory)), generator_(std::move(generator)) {}

VoidResult OutputAllocator::prepare() {
    auto& logger = Logger::instance();

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        return Err(ErrorCode::OUTPUT_DIRECTORY_INVALID,
                   "Cannot create " + directory_.string() + ": " + ec.message(), "OutputAllocator");
    }
    if (!fs::is_directory(directory_, ec)) {
        return Err(ErrorCode::OUTPUT_DIRECTORY_INVALID,
                   directory_.string() + " is not a directory", "OutputAllocator");
    }
    if (::access(directory_.c_str(), W_OK | X_OK) != 0) {
        return Err(ErrorCode::OUTPUT_DIRECTORY_INVALID,
                   describeErrno("Cannot write to", directory_), "OutputAllocator");
    }

    std::size_t purged = purgeStaleParts();
    if (purged > 0) {
        logger.info("Removed " + std::to_string(purged) + " stale partial file(s) from " +
                    directory_.string(), "OutputAllocator");
    }
    return Ok();
}

fs::path OutputAllocator::candidatePath(uint64_t sessionId, uint64_t streamId, std::string& name) {
    name = generator_ ? generator_(sessionId, streamId) : defaultName(sessionId, streamId);
    return PathValidator::resolveInDirectory(directory_, name);
}

Result<std::unique_ptr<OutputFile>> OutputAllocator::allocate(uint64_t sessionId, uint64_t streamId) {
    for (int attempt = 0; attempt < MAX_NAME_ATTEMPTS; ++attempt) {
        std::string name;
        fs::path finalPath = candidatePath(sessionId, streamId, name);
        if (finalPath.empty()) {
            return Err(ErrorCode::INTERNAL_ERROR, "Generated unsafe output name: " + name, "OutputAllocator");
        }

        std::error_code ec;
        if (fs::exists(fs::symlink_status(finalPath, ec))) {
            LOG_DEBUG_COMP_IF("Output name in use: " + name, "OutputAllocator");
            continue;
        }

        fs::path partialPath = directory_ / ("." + name + PARTIAL_SUFFIX);
        FdGuard fd(::open(partialPath.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
        if (!fd) {
            if (errno == EEXIST) {
                LOG_DEBUG_COMP_IF("Partial name in use: " + partialPath.filename().string(), "OutputAllocator");
                continue;
            }
            return Err(ErrorCode::FILE_OPEN_FAILED, describeErrno("Cannot create", partialPath), "OutputAllocator");
        }

        return std::unique_ptr<OutputFile>(
            new OutputFile(*this, std::move(fd), partialPath, finalPath, sessionId, streamId));
    }

    return Err(ErrorCode::NAME_ALLOCATION_EXHAUSTED,
               "No free output name after " + std::to_string(MAX_NAME_ATTEMPTS) + " attempts",
               "OutputAllocator");
}

std::size_t OutputAllocator::purgeStaleParts() {
    std::size_t removed = 0;
    std::error_code ec;
    fs::directory_iterator end;
    for (fs::directory_iterator it(directory_, ec); !ec && it != end; it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        std::string name = entry.path().filename().string();
        if (!startsWith(name, PARTIAL_PREFIX) || !endsWith(name, PARTIAL_SUFFIX)) {
            continue;
        }
        std::error_code statusEc;
        if (!fs::is_regular_file(entry.symlink_status(statusEc))) {
            continue;
        }
        std::error_code removeEc;
        if (fs::remove(entry.path(), removeEc)) {
            ++removed;
        } else if (removeEc) {
            Logger::instance().warn("Cannot remove " + entry.path().string() + ": " + removeEc.message(),
                                    "OutputAllocator");
        }
    }
    if (ec) {
        Logger::instance().warn("Cannot scan " + directory_.string() + ": " + ec.message(), "OutputAllocator");
    }
    return removed;
}

std::string OutputAllocator::defaultName(uint64_t sessionId, uint64_t streamId) {
    return formatName(sessionId, streamId, randomTag());
}

std::string OutputAllocator::formatName(uint64_t sessionId, uint64_t streamId, std::optional<uint32_t> tag) {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm utc;
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << "transfer-" << std::put_time(&utc, "%Y%m%dT%H%M%SZ")
        << "-s" << sessionId << "-t" << streamId << "-"
        << std::hex << std::setw(8) << std::setfill('0') << (tag ? *tag : ++nameSequence);
    return oss.str();
}

} // namespace Ferry
