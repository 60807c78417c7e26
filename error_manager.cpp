#include "error_manager.hpp"
#include "bootstrap_config.hpp"
#include "logger.hpp"

#include <fstream>
#include <filesystem>

namespace streetwise {

nlohmann::json ErrorManager::errors;
nlohmann::json ErrorManager::root;

// Built-in codes are used until an errors.json has been loaded
static const nlohmann::json& table() {
    if (ErrorManager::root.is_null() || ErrorManager::root.empty()) {
        ErrorManager::loadFromJson(bootstrap_config::defaultErrors());
    }
    return ErrorManager::root;
}

void ErrorManager::loadFromJson(const nlohmann::json& j) {
    errors = j;
    if (errors.contains("errors") && errors["errors"].is_object()) {
        root = errors["errors"];
    } else {
        root = errors;
    }
}

bool ErrorManager::load(const std::string& path) {
    namespace fs = std::filesystem;

    std::ifstream in(path);
    if (!in) {
        LOG_ERROR("ErrorManager", "Could not open " + path);
        return false;
    }

    try {
        nlohmann::json j;
        in >> j;
        if (!j.is_object()) {
            LOG_ERROR("ErrorManager", path + " is not a JSON object");
            return false;
        }
        loadFromJson(j);
        LOG_DEBUG("ErrorManager", "Loaded " + std::to_string(root.size()) +
                                  " error codes from " + fs::absolute(path).string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("ErrorManager", "Failed to parse " + path + " -> " + e.what());
        return false;
    }
}

std::string ErrorManager::getUserMessage(const std::string& code) {
    const auto& t = table();
    if (t.contains(code) && t[code].contains("user") && t[code]["user"].is_string()) {
        return t[code]["user"].get<std::string>();
    }
    return "[Error] Unknown error code: " + code;
}

std::string ErrorManager::getDebugMessage(const std::string& code) {
    const auto& t = table();
    if (t.contains(code) && t[code].contains("debug") && t[code]["debug"].is_string()) {
        return t[code]["debug"].get<std::string>();
    }
    return "[Debug] No debug message for code: " + code;
}

EngineError ErrorManager::report(const std::string& code, const std::string& detail) {
    std::string debugMsg = getDebugMessage(code);
    if (!detail.empty()) {
        debugMsg += " (" + detail + ")";
    }
    LOG_ERROR("ErrorManager", code + " -> " + debugMsg);

    return { code, getUserMessage(code) };
}

} // namespace streetwise
