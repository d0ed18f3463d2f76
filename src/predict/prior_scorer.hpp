#pragma once

#include <map>
#include <optional>
#include <string>

namespace pileup {

// Open feature payload handed to the prior scorer; its keys are scorer-defined
using FeatureMap = std::map<std::string, double>;

// Binary classifier answer
struct PriorResult {
    int prediction = 0;        // 1 = success expected
    double confidence = 0.5;   // 0-1, confidence in 'prediction'
};

/**
 * Pretrained prior (external collaborator)
 *
 * An empty optional means "no model available", which the predictor
 * answers with its default prior.
 */
class PriorScorer {
public:
    virtual ~PriorScorer() = default;

    virtual bool hasModel(const std::string& model_name) const = 0;
    virtual std::optional<PriorResult> predict(const std::string& model_name,
                                               const FeatureMap& features) const = 0;
};

} // namespace pileup
