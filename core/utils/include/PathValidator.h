#pragma once

#include <string>
#include <filesystem>

namespace Ferry {

/**
 * @brief Path checks that keep received data inside the output directory
 */
class PathValidator {
public:
    /**
     * @brief True if name is a single path component with no traversal,
     *        separators, control characters or leading '-'
     */
    static bool isPlainFileName(const std::string& name);

    /**
     * @brief Validates that a candidate path resolves inside baseDir
     * @param baseDir Directory the path must stay in
     * @param candidate Absolute or baseDir-relative path, need not exist
     */
    static bool isPathWithinDirectory(const std::filesystem::path& baseDir,
                                      const std::filesystem::path& candidate);

    /**
     * @brief Join a plain file name onto baseDir
     * @return Joined path, or an empty path if the name is unsafe
     */
    static std::filesystem::path resolveInDirectory(const std::filesystem::path& baseDir,
                                                    const std::string& name);
};

} // namespace Ferry
