// ---------------------------------------------------------------------------
// ordering_rules.cpp
// ---------------------------------------------------------------------------

#include "equivalency/ordering_rules.hpp"

#include <format>

OrderStrictness ByteArrayOrderingRule::evaluate(const MemberInfo& member) const {
    if (member.compile_time_type.is_byte_sequence() || member.runtime_type.is_byte_sequence()) {
        return OrderStrictness::kStrict;
    }
    return OrderStrictness::kIrrelevant;
}

std::string ByteArrayOrderingRule::describe() const {
    return "Be strict about the order of items in byte arrays";
}

OrderStrictness MatchAllOrderingRule::evaluate(const MemberInfo& /*member*/) const {
    return OrderStrictness::kStrict;
}

std::string MatchAllOrderingRule::describe() const {
    return "Always be strict about the collection order";
}

PredicateBasedOrderingRule::PredicateBasedOrderingRule(MemberPredicate predicate)
    : predicate_(std::move(predicate))
{}

OrderStrictness PredicateBasedOrderingRule::evaluate(const MemberInfo& member) const {
    return predicate_(member) ? OrderStrictness::kStrict : OrderStrictness::kIrrelevant;
}

std::string PredicateBasedOrderingRule::describe() const {
    return std::format("Be strict about the order of collections when {}", predicate_.description());
}
