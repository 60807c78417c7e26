#pragma once
#include <string>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>

namespace streetwise {

// ------------------------------------------------------------
// Resource loading
// ------------------------------------------------------------

// Locate the data directory (STREETWISE_RESOURCE_DIR, then ../resources, then ./resources)
std::string getResourcePath();

// Parse a JSON file. On failure reports ERR_RESOURCE_MISSING / ERR_RESOURCE_PARSE,
// fills *err and returns false.
bool loadJsonResource(const std::filesystem::path& path,
                      nlohmann::json& out,
                      std::string* err = nullptr);

} // namespace streetwise
