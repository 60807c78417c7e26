#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <filesystem>
#include "engine_config.hpp"

// Centralized config + error bootstrap
namespace streetwise::bootstrap_config {

    // Load errors.json and engine_config.json from resourceDir (creating/patching them)
    // and apply the logging settings. Returns the typed engine config.
    EngineConfig initAll(const std::filesystem::path& resourceDir,
                         const std::filesystem::path& configPath = {});

    // Generic loader → ensures defaults, patches missing keys, saves back
    bool loadConfig(const std::filesystem::path& path,
                    const nlohmann::json& defaults,
                    nlohmann::json& outConfig,
                    const std::string& name,
                    const std::string& errorCode = "");

    // Patch missing or wrong-typed keys of cfg from defs. Returns true if anything changed.
    bool mergeDefaults(nlohmann::json& cfg,
                       const nlohmann::json& defs,
                       int* patchedCount = nullptr);

    // Canonical defaults
    nlohmann::json defaultEngineConfig();
    nlohmann::json defaultErrors();
}
