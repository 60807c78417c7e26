#include "resources.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace streetwise {

// -------------------------------------------------------------
// Locate resource root (prefer repo/resources over build/resources)
// -------------------------------------------------------------
std::string getResourcePath() {
#if defined(STREETWISE_RESOURCE_DIR)
    fs::path configured = STREETWISE_RESOURCE_DIR;
    if (fs::exists(configured)) {
        LOG_DEBUG("Resources", "Using configured resource path: " + configured.string());
        return configured.string();
    }
#endif
    fs::path buildPath   = fs::current_path() / "resources";
    fs::path projectPath = fs::current_path().parent_path() / "resources";

    // 🔹 Prefer project resources first
    if (fs::exists(projectPath)) {
        LOG_DEBUG("Resources", "Using resource path: " + projectPath.string());
        return projectPath.string();
    }
    if (fs::exists(buildPath)) {
        LOG_DEBUG("Resources", "Using fallback resource path: " + buildPath.string());
        return buildPath.string();
    }

    // Last resort: current working directory
    LOG_DEBUG("Resources", "Falling back to cwd: " + fs::current_path().string());
    return fs::current_path().string();
}

// -------------------------------------------------------------
// Load and parse a JSON data file
// -------------------------------------------------------------
bool loadJsonResource(const fs::path& path, nlohmann::json& out, std::string* err) {
    std::ifstream f(path);
    if (!f) {
        auto e = ErrorManager::report("ERR_RESOURCE_MISSING", path.string());
        if (err) *err = e.message;
        LOG_PHASE("Load " + path.filename().string(), false);
        return false;
    }

    try {
        f >> out;
    } catch (const std::exception& ex) {
        auto e = ErrorManager::report("ERR_RESOURCE_PARSE", path.string() + ": " + ex.what());
        if (err) *err = e.message;
        LOG_PHASE("Load " + path.filename().string(), false);
        return false;
    }

    LOG_PHASE("Load " + path.filename().string(), true);
    return true;
}

} // namespace streetwise
