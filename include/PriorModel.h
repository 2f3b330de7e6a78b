#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "ScreenConfig.h"

namespace chroma {

// Subject category -> prior probability of being condition-positive.
// Immutable after construction; safe to share between sessions.
class PriorModel {
public:
    PriorModel();
    explicit PriorModel(const PriorTable& table);

    // Category lookup is case-sensitive. Unknown category raises InvalidArgument.
    double priorFor(const std::string& category) const;

    bool hasCategory(const std::string& category) const;
    const std::vector<std::string>& categories() const { return names_; }

private:
    std::unordered_map<std::string, double> priors_;
    std::vector<std::string> names_;
};

} // namespace chroma
