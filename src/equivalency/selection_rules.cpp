// ---------------------------------------------------------------------------
// selection_rules.cpp
// ---------------------------------------------------------------------------

#include "equivalency/selection_rules.hpp"

#include <algorithm>
#include <format>

std::vector<MemberInfo> AllPublicPropertiesSelectionRule::select(
    std::vector<MemberInfo> members,
    const SelectionContext& context) const
{
    const auto& candidates =
        context.use_runtime_typing ? context.runtime_members : context.declared_members;

    for (const auto& candidate : candidates) {
        if (candidate.kind != MemberKind::kProperty || !candidate.is_public) {
            continue;
        }
        const bool already_selected = std::any_of(
            members.begin(), members.end(),
            [&candidate](const MemberInfo& m) { return m.name == candidate.name; }
        );
        if (!already_selected) {
            members.push_back(candidate);
        }
    }
    return members;
}

std::string AllPublicPropertiesSelectionRule::describe() const {
    return "Include all non-private properties";
}

ExcludeMemberByPredicateSelectionRule::ExcludeMemberByPredicateSelectionRule(
    MemberPredicate predicate)
    : predicate_(std::move(predicate))
{}

std::vector<MemberInfo> ExcludeMemberByPredicateSelectionRule::select(
    std::vector<MemberInfo> members,
    const SelectionContext& /*context*/) const
{
    std::erase_if(members, [this](const MemberInfo& m) { return predicate_(m); });
    return members;
}

std::string ExcludeMemberByPredicateSelectionRule::describe() const {
    return std::format("Exclude member when {}", predicate_.description());
}
