#include "PriorModel.h"

#include "ScreenErrors.h"

#include <cmath>
#include <unordered_set>

namespace chroma {

namespace {
bool openUnit(double x) {
    return std::isfinite(x) && x > 0.0 && x < 1.0;
}
} // namespace

PriorModel::PriorModel() : PriorModel(defaultPriorTable()) {}

PriorModel::PriorModel(const PriorTable& table) {
    if (table.categories.empty()) {
        throwInvalidArgument("prior table has no categories");
    }

    // Pass 1: base categories.
    std::unordered_map<std::string, double> base;
    std::unordered_set<std::string> seen;
    for (const auto& c : table.categories) {
        if (c.name.empty()) {
            throwInvalidArgument("prior category with empty name");
        }
        if (!seen.insert(c.name).second) {
            throwInvalidArgument("duplicate prior category '" + c.name + "'");
        }
        if (!c.mixture.empty()) continue;
        if (!openUnit(c.base_rate)) {
            throwInvalidArgument("prior for '" + c.name + "' must lie in (0,1)");
        }
        base.emplace(c.name, c.base_rate);
    }

    // Pass 2: mixtures resolve against base categories only.
    for (const auto& c : table.categories) {
        if (c.mixture.empty()) {
            priors_.emplace(c.name, c.base_rate);
            names_.push_back(c.name);
            continue;
        }

        double weight_sum = 0.0;
        double weighted = 0.0;
        for (const auto& m : c.mixture) {
            const auto it = base.find(m.category);
            if (it == base.end()) {
                throwInvalidArgument("mixture '" + c.name + "' references unknown base category '" +
                                     m.category + "'");
            }
            if (!std::isfinite(m.weight) || m.weight < 0.0) {
                throwInvalidArgument("mixture '" + c.name + "' has a negative or non-finite weight");
            }
            weight_sum += m.weight;
            weighted += m.weight * it->second;
        }
        if (!(weight_sum > 0.0)) {
            throwInvalidArgument("mixture '" + c.name + "' has no positive weight");
        }

        // Normalised so weights need not sum to exactly 1.
        const double p = weighted / weight_sum;
        if (!openUnit(p)) {
            throwInvalidArgument("mixture '" + c.name + "' yields a prior outside (0,1)");
        }
        priors_.emplace(c.name, p);
        names_.push_back(c.name);
    }
}

double PriorModel::priorFor(const std::string& category) const {
    const auto it = priors_.find(category);
    if (it == priors_.end()) {
        throwInvalidArgument("unknown subject category '" + category + "'");
    }
    return it->second;
}

bool PriorModel::hasCategory(const std::string& category) const {
    return priors_.count(category) != 0;
}

} // namespace chroma
