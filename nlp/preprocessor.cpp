#include "nlp/preprocessor.hpp"

#include <utility>

namespace streetwise {

Preprocessor::Preprocessor(TextNormalizer normalizer, TypoCorrector corrector, int maxDistance)
    : norm(std::move(normalizer)), typo(std::move(corrector)), maxDistance(maxDistance) {}

Preprocessed Preprocessor::run(const std::string& text) {
    Preprocessed out;
    out.original = text;

    NormalizationResult n = norm.normalize(text);
    CorrectionResult c = typo.correct(n.normalized, maxDistance);

    out.normalized  = n.normalized;
    out.corrected   = c.corrected;
    out.changes     = std::move(n.changes);
    out.corrections = std::move(c.corrections);
    out.wasModified = n.wasModified || c.wasModified;
    return out;
}

std::string Preprocessor::prepare(const std::string& text) {
    return run(text).corrected;
}

} // namespace streetwise
