// src/RuleEvaluator.cpp
#include <Kiln/RuleEvaluator.hpp>
#include <numeric>

namespace Kiln {

bool applyRule(bool decision, const Rule& rule, const PlatformInfo& platform) {
    switch (rule.action) {
        case RuleAction::ALLOW:
            if (!rule.os) return true;
            if (rule.os->name != platform.osName) return false;
            return !rule.os->arch || *rule.os->arch == platform.osArch;
        case RuleAction::DISALLOW:
            if (!rule.os) return false;
            if (rule.os->name == platform.osName) return false;
            return decision; // other OS, keep what we had
        default:
            return decision;
    }
}

bool evaluateRules(const std::vector<Rule>& rules, const PlatformInfo& platform) {
    return std::accumulate(rules.begin(), rules.end(), true,
                           [&platform](bool decision, const Rule& rule) {
                               return applyRule(decision, rule, platform);
                           });
}

} // namespace Kiln
