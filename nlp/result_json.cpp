#include "nlp/result_json.hpp"

namespace streetwise {

void to_json(nlohmann::json& j, const IntentScore& s) {
    j = { {"intent", s.intent}, {"friendlyName", s.friendlyName}, {"score", s.score} };
}

void to_json(nlohmann::json& j, const Substitution& s) {
    j = { {"from", s.from}, {"to", s.to}, {"type", s.type} };
}

void to_json(nlohmann::json& j, const Correction& c) {
    j = { {"from", c.from}, {"to", c.to}, {"distance", c.distance} };
}

void to_json(nlohmann::json& j, const Entities& e) {
    j = nlohmann::json::object();
    if (!e.playerName.empty()) j["playerName"] = e.playerName;
    if (!e.numbers.empty())    j["numbers"] = e.numbers;
    for (const auto& [list, term] : e.terms) j[list] = term;
}

void to_json(nlohmann::json& j, const Preprocessed& p) {
    j = {
        {"original", p.original},
        {"normalized", p.normalized},
        {"corrected", p.corrected},
        {"wasModified", p.wasModified},
        {"changes", p.changes},
        {"corrections", p.corrections}
    };
}

void to_json(nlohmann::json& j, const ClassificationResult& r) {
    j = {
        {"intent", r.intent},
        {"confidence", r.confidence},
        {"friendlyName", r.friendlyName},
        {"source", r.source},
        {"preprocessed", r.preprocessed},
        {"topMatches", r.topMatches},
        {"fromCache", r.fromCache}
    };
}

void to_json(nlohmann::json& j, const Suggestion& s) {
    j = {
        {"intent", s.intent},
        {"friendlyName", s.friendlyName},
        {"confidence", s.confidence},
        {"suggestion", s.suggestion}
    };
}

void to_json(nlohmann::json& j, const Analysis& a) {
    // one change list, tagged by the stage that made it
    nlohmann::json changes = nlohmann::json::array();
    for (const auto& c : a.input.changes) {
        nlohmann::json item = c;
        item["stage"] = "normalize";
        changes.push_back(item);
    }
    for (const auto& c : a.input.corrections) {
        nlohmann::json item = c;
        item["stage"] = "typo";
        changes.push_back(item);
    }

    j = {
        {"input", {
            {"original", a.input.original},
            {"normalized", a.input.normalized},
            {"corrected", a.input.corrected},
            {"changes", changes}
        }},
        {"pattern", {
            {"intent", a.pattern.intent},
            {"confidence", a.pattern.confidence},
            {"entities", a.pattern.entities}
        }},
        {"semantic", {
            {"intent", a.semantic.intent},
            {"confidence", a.semantic.confidence},
            {"similarity", a.semantic.similarity},
            {"topMatches", a.semantic.topMatches}
        }},
        {"concepts", a.concepts},
        {"final", a.final}
    };
}

void to_json(nlohmann::json& j, const ClassifierEngine::Stats& s) {
    j = {
        {"totalClassifications", s.totalClassifications},
        {"cacheHits", s.cacheHits},
        {"patternHits", s.patternHits},
        {"semanticHits", s.semanticHits},
        {"combinedHits", s.combinedHits},
        {"cacheSize", s.cacheSize},
        {"hitRate", s.hitRate},
        {"patternRate", s.patternRate},
        {"semanticRate", s.semanticRate},
        {"combinedRate", s.combinedRate}
    };
}

std::string toJsonLine(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace streetwise
