#pragma once
#include <string>
#include "intent.hpp"
#include "nlp/text_normalizer.hpp"
#include "nlp/typo_corrector.hpp"

namespace streetwise {

// Normalizer followed by typo corrector; the text both classifiers consume
class Preprocessor {
public:
    Preprocessor(TextNormalizer normalizer, TypoCorrector corrector, int maxDistance = 2);

    Preprocessed run(const std::string& text);

    // run(text).corrected
    std::string prepare(const std::string& text);

    TextNormalizer& normalizer() { return norm; }
    const TextNormalizer& normalizer() const { return norm; }
    TypoCorrector& corrector() { return typo; }
    const TypoCorrector& corrector() const { return typo; }

private:
    TextNormalizer norm;
    TypoCorrector typo;
    int maxDistance;
};

} // namespace streetwise
