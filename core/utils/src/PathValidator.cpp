#include "PathValidator.h"
#include "Logger.h"

namespace Ferry {

namespace fs = std::filesystem;

bool PathValidator::isPlainFileName(const std::string& name) {
    if (name.empty() || name.size() > 255) {
        return false;
    }
    if (name == "." || name == ".." || name[0] == '-') {
        return false;
    }
    for (unsigned char c : name) {
        if (c == '/' || c == '\\' || c < 0x20 || c == 0x7f) {
            return false;
        }
    }
    return true;
}

bool PathValidator::isPathWithinDirectory(const fs::path& baseDir, const fs::path& candidate) {
    try {
        fs::path absBase = fs::weakly_canonical(fs::absolute(baseDir));
        fs::path full = candidate.is_absolute() ? candidate : absBase / candidate;

        // weakly_canonical resolves symlinks of the existing prefix, so a
        // symlinked parent pointing elsewhere is caught here too
        fs::path resolved = fs::weakly_canonical(full.lexically_normal());

        auto relative = resolved.lexically_relative(absBase);
        if (relative.empty()) {
            return false;
        }
        auto first = *relative.begin();
        return first != ".." && first != "." && !relative.is_absolute();
    } catch (const fs::filesystem_error& e) {
        Logger::instance().error("Path validation error: " + std::string(e.what()), "PathValidator");
        return false;
    }
}

fs::path PathValidator::resolveInDirectory(const fs::path& baseDir, const std::string& name) {
    if (!isPlainFileName(name)) {
        Logger::instance().warn("Rejected unsafe file name: " + name, "PathValidator");
        return {};
    }
    fs::path joined = baseDir / name;
    if (!isPathWithinDirectory(baseDir, joined)) {
        Logger::instance().warn("Rejected path outside output directory: " + joined.string(), "PathValidator");
        return {};
    }
    return joined;
}

} // namespace Ferry
