#pragma once
#include <nlohmann/json.hpp>
#include "intent.hpp"
#include "nlp/classifier_engine.hpp"

// nlohmann::json conversions (found by ADL) for results handed to collaborators
namespace streetwise {

void to_json(nlohmann::json& j, const IntentScore& s);
void to_json(nlohmann::json& j, const Substitution& s);
void to_json(nlohmann::json& j, const Correction& c);
void to_json(nlohmann::json& j, const Entities& e);
void to_json(nlohmann::json& j, const Preprocessed& p);
void to_json(nlohmann::json& j, const ClassificationResult& r);
void to_json(nlohmann::json& j, const Suggestion& s);
void to_json(nlohmann::json& j, const Analysis& a);
void to_json(nlohmann::json& j, const ClassifierEngine::Stats& s);

// Compact single-line dump; bytes that are not valid UTF-8 become U+FFFD instead of throwing
std::string toJsonLine(const nlohmann::json& j);

} // namespace streetwise
