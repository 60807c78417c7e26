#include "nlp/intent_catalog.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <unordered_set>

namespace streetwise {

IntentCatalog::IntentCatalog() {
    ensureUnknown();
}

// ------------------------------------------------------------
// Loading
// ------------------------------------------------------------
bool IntentCatalog::loadFromFile(const std::string& path, std::string* err) {
    nlohmann::json j;
    if (!loadJsonResource(path, j, err)) {
        return false;
    }
    return loadFromJson(j, err);
}

bool IntentCatalog::loadFromString(const std::string& jsonText, std::string* err) {
    try {
        return loadFromJson(nlohmann::json::parse(jsonText), err);
    } catch (const std::exception& e) {
        if (err) *err = e.what();
        LOG_ERROR("Catalog", std::string("Failed to parse intents: ") + e.what());
        return false;
    }
}

bool IntentCatalog::loadFromJson(const nlohmann::json& j, std::string* err) {
    if (!j.is_object() || !j.contains("intents") || !j["intents"].is_array()) {
        if (err) *err = "intents.json: expected {\"intents\": [...]}";
        LOG_ERROR("Catalog", "intents.json has no intents array");
        return false;
    }

    try {
        std::vector<IntentDefinition> loaded;
        std::unordered_set<std::string> seen;
        for (auto& item : j["intents"]) {
            IntentDefinition def;
            def.id           = item.value("id", "");
            def.friendlyName = item.value("friendly_name", def.id);
            def.hint         = item.value("hint", "");
            def.exemplars    = item.value("exemplars", std::vector<std::string>{});
            def.keywords     = item.value("keywords", std::vector<std::string>{});

            if (def.id.empty()) {
                LOG_ERROR("Catalog", "Skipping intent without id");
                continue;
            }
            if (!seen.insert(def.id).second) {
                LOG_ERROR("Catalog", "Skipping duplicate intent: " + def.id);
                continue;
            }
            loaded.push_back(std::move(def));
        }

        intents = std::move(loaded);
        reindex();
        ensureUnknown();
    } catch (const std::exception& e) {
        if (err) *err = e.what();
        LOG_ERROR("Catalog", std::string("Bad intent entry: ") + e.what());
        return false;
    }

    LOG_DEBUG("Catalog", "Loaded " + std::to_string(intents.size()) + " intents");
    return true;
}

void IntentCatalog::ensureUnknown() {
    if (index.count(kUnknown)) return;
    IntentDefinition unknown;
    unknown.id = kUnknown;
    unknown.friendlyName = "Unknown";
    index[kUnknown] = intents.size();
    intents.push_back(std::move(unknown));
}

void IntentCatalog::reindex() {
    index.clear();
    for (size_t i = 0; i < intents.size(); i++) {
        index.emplace(intents[i].id, i);
    }
}

// ------------------------------------------------------------
// Lookup
// ------------------------------------------------------------
const IntentDefinition* IntentCatalog::find(const std::string& id) const {
    auto it = index.find(id);
    return it == index.end() ? nullptr : &intents[it->second];
}

std::string IntentCatalog::friendlyName(const std::string& id) const {
    const auto* def = find(id);
    return def ? def->friendlyName : id;
}

std::string IntentCatalog::hint(const std::string& id) const {
    const auto* def = find(id);
    if (def && !def->hint.empty()) return def->hint;
    return "Try rephrasing your question";
}

std::vector<std::string> IntentCatalog::ids() const {
    std::vector<std::string> out;
    out.reserve(intents.size());
    for (const auto& def : intents) out.push_back(def.id);
    return out;
}

bool IntentCatalog::addExemplar(const std::string& id, const std::string& phrase) {
    auto it = index.find(id);
    if (it == index.end()) return false;
    intents[it->second].exemplars.push_back(phrase);
    return true;
}

} // namespace streetwise
