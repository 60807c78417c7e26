#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include <nlohmann/json_fwd.hpp>

namespace streetwise {

struct IntentDefinition {
    std::string id;                        // stable key, e.g. "money_advice"
    std::string friendlyName;              // display name
    std::string hint;                      // one-line suggestion shown for clarification prompts
    std::vector<std::string> exemplars;    // example phrasings, in file order
    std::vector<std::string> keywords;     // salient words (fed to the typo vocabulary)
};

// Closed, ordered set of intents loaded from intents.json.
// The reserved "unknown" intent is always present.
class IntentCatalog {
public:
    static constexpr const char* kUnknown = "unknown";

    IntentCatalog();

    bool loadFromFile(const std::string& path, std::string* err = nullptr);
    bool loadFromString(const std::string& jsonText, std::string* err = nullptr);
    bool loadFromJson(const nlohmann::json& j, std::string* err = nullptr);

    const IntentDefinition* find(const std::string& id) const;
    bool contains(const std::string& id) const { return find(id) != nullptr; }

    std::string friendlyName(const std::string& id) const;
    std::string hint(const std::string& id) const;

    const std::vector<IntentDefinition>& all() const { return intents; }
    std::vector<std::string> ids() const;
    size_t size() const { return intents.size(); }

    // Append an exemplar phrase; false if the intent does not exist
    bool addExemplar(const std::string& id, const std::string& phrase);

private:
    void ensureUnknown();
    void reindex();

    std::vector<IntentDefinition> intents;
    std::unordered_map<std::string, size_t> index;
};

} // namespace streetwise
