// ---------------------------------------------------------------------------
// assertion_rule.cpp
// ---------------------------------------------------------------------------

#include "equivalency/assertion_rule.hpp"

AssertionRuleStepAdapter::AssertionRuleStepAdapter(std::shared_ptr<const AssertionRule> rule)
    : rule_(std::move(rule))
{}

StepResult AssertionRuleStepAdapter::handle(const ComparisonContext& context) const {
    if (!rule_ || context.is_root()) {
        return StepResult{};
    }
    auto result = rule_->assert_equality(context);
    if (!result) {
        return StepResult{};
    }
    return *result;
}

std::string AssertionRuleStepAdapter::describe() const {
    return rule_ ? rule_->describe() : std::string{"<empty assertion rule>"};
}
