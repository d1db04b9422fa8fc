#pragma once

#include "FileIO.h"
#include "FdGuard.h"
#include "Result.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace Ferry {

class OutputAllocator;

/**
 * @brief Exclusively created partial file for one incoming transfer
 *
 * Bytes go to a hidden ".<name>.part" file. commit() publishes it under
 * the final name without replacing anything; every other exit path,
 * including destruction, deletes the partial file.
 */
class OutputFile : public IFileWriter {
public:
    ~OutputFile() override;

    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;

    VoidResult write(const uint8_t* data, std::size_t size) override;
    VoidResult flush() override;
    uint64_t bytesWritten() const override { return bytesWritten_; }

    /**
     * @brief Sync, close and publish under the final name
     *
     * If the final name was taken in the meantime a new one is generated.
     */
    VoidResult commit();

    /**
     * @brief Close and delete the partial file
     */
    void discard();

    bool committed() const { return committed_; }
    const std::filesystem::path& partialPath() const { return partialPath_; }
    const std::filesystem::path& finalPath() const { return finalPath_; }

private:
    friend class OutputAllocator;
    OutputFile(OutputAllocator& allocator, FdGuard fd, std::filesystem::path partialPath,
               std::filesystem::path finalPath, uint64_t sessionId, uint64_t streamId);

    VoidResult publish();

    OutputAllocator& allocator_;
    FdGuard fd_;
    std::filesystem::path partialPath_;
    std::filesystem::path finalPath_;
    uint64_t sessionId_;
    uint64_t streamId_;
    uint64_t bytesWritten_{0};
    bool committed_{false};
    bool discarded_{false};
};

/**
 * @brief Hands out fresh, collision-free output files in one directory
 *
 * Names have the form transfer-<UTC timestamp>-s<session>-t<stream>-<8 hex>.
 * Uniqueness is enforced by the filesystem (exclusive create, no-replace
 * publication), so concurrent transfers need no shared lock.
 */
class OutputAllocator {
public:
    using NameGenerator = std::function<std::string(uint64_t sessionId, uint64_t streamId)>;

    static constexpr int MAX_NAME_ATTEMPTS = 16;
    static constexpr const char* PARTIAL_PREFIX = ".transfer-";
    static constexpr const char* PARTIAL_SUFFIX = ".part";

    explicit OutputAllocator(std::filesystem::path directory, NameGenerator generator = nullptr);

    /**
     * @brief Create the directory if needed, check it is writable and
     *        remove partial files left by an earlier process
     */
    VoidResult prepare();

    /**
     * @brief Create a new partial file
     * @return NAME_ALLOCATION_EXHAUSTED after MAX_NAME_ATTEMPTS collisions
     */
    Result<std::unique_ptr<OutputFile>> allocate(uint64_t sessionId, uint64_t streamId);

    /**
     * @brief Delete stale partial files
     * @return Number of files removed
     */
    std::size_t purgeStaleParts();

    /**
     * @brief Default generator: timestamp, ids and 32 random bits
     */
    static std::string defaultName(uint64_t sessionId, uint64_t streamId);

    /**
     * @brief Name with an explicit tag; without one a process-wide sequence
     *        number takes its place (allocation still refuses existing names)
     */
    static std::string formatName(uint64_t sessionId, uint64_t streamId, std::optional<uint32_t> tag);

    const std::filesystem::path& directory() const { return directory_; }

private:
    friend class OutputFile;

    /// Validated final path for a newly generated name; empty if unsafe
    std::filesystem::path candidatePath(uint64_t sessionId, uint64_t streamId, std::string& name);

    std::filesystem::path directory_;
    NameGenerator generator_;
};

} // namespace Ferry
