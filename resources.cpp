#include "resources.hpp"
#include "logger.hpp"

#include <filesystem>

namespace fs = std::filesystem;

// -------------------------------------------------------------
// Locate resource root (prefer ./resources next to the binary's cwd)
// -------------------------------------------------------------
std::string getResourcePath() {
#if defined(OIKOS_RESOURCE_DIR)
    fs::path fixedPath = OIKOS_RESOURCE_DIR;
    if (fs::exists(fixedPath)) {
        LOG_PHASE("Resource path set", true);
        LOG_DEBUG("Resources", "Using fixed resource path: " + fixedPath.string());
        return fixedPath.string();
    }
#endif
    fs::path localPath   = fs::current_path() / "resources";
    fs::path projectPath = fs::current_path().parent_path() / "resources";

    if (fs::exists(localPath)) {
        LOG_PHASE("Resource path set", true);
        LOG_DEBUG("Resources", "Using resource path: " + localPath.string());
        return localPath.string();
    }
    if (fs::exists(projectPath)) {
        LOG_PHASE("Resource path set", true);
        LOG_DEBUG("Resources", "Using fallback resource path: " + projectPath.string());
        return projectPath.string();
    }

    // Last resort: current working directory
    LOG_PHASE("Resource path set", true);
    LOG_DEBUG("Resources", "Falling back to cwd: " + fs::current_path().string());
    return fs::current_path().string();
}
