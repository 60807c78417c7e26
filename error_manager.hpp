#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace streetwise {

// Returned by ErrorManager::report so callers can surface the user text
struct EngineError {
    std::string code;
    std::string message;
};

// ------------------------------------------------------------
// ErrorManager
// ------------------------------------------------------------
namespace ErrorManager {
    // Load error codes from JSON (errors.json)
    bool load(const std::string& path);
    void loadFromJson(const nlohmann::json& j);

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);

    // Log the debug text for code (plus optional detail) and return the user text
    EngineError report(const std::string& code, const std::string& detail = "");

    // Internal storage
    extern nlohmann::json errors;
    extern nlohmann::json root;
}

} // namespace streetwise
