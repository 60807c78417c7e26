#pragma once
#include <string>
#include "intent.hpp"

namespace streetwise {

// A sub-classifier the combiner can consult. Input is already preprocessed.
class IntentClassifier {
public:
    virtual ~IntentClassifier() = default;

    virtual IntentGuess classifyIntent(const std::string& text) = 0;

    // Short label for logs ("pattern", "semantic")
    virtual const char* name() const = 0;
};

} // namespace streetwise
