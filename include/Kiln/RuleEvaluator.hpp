// include/Kiln/RuleEvaluator.hpp
#ifndef KILN_RULE_EVALUATOR_HPP
#define KILN_RULE_EVALUATOR_HPP

#include <Kiln/Types/Rule.hpp>
#include <Kiln/Utils/OS.hpp>
#include <vector>

namespace Kiln {

    // Applies one rule to the running decision.
    bool applyRule(bool decision, const Rule& rule, const PlatformInfo& platform);

    // Left fold of applyRule over the rules, starting from true. No rules means included.
    bool evaluateRules(const std::vector<Rule>& rules, const PlatformInfo& platform);

} // namespace Kiln

#endif //KILN_RULE_EVALUATOR_HPP
