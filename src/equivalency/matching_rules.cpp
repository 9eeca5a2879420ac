// ---------------------------------------------------------------------------
// matching_rules.cpp
// ---------------------------------------------------------------------------

#include "equivalency/matching_rules.hpp"

#include <algorithm>
#include <format>
#include <optional>

namespace {

[[nodiscard]] std::optional<MemberInfo> find_by_name(
    const std::string&          name,
    std::span<const MemberInfo> subject_members)
{
    const auto it = std::find_if(
        subject_members.begin(), subject_members.end(),
        [&name](const MemberInfo& m) { return m.name == name; }
    );
    if (it == subject_members.end()) {
        return std::nullopt;
    }
    return *it;
}

}  // namespace

MatchOutcome MustMatchByNameRule::match(
    const MemberInfo&           expectation_member,
    std::span<const MemberInfo> subject_members) const
{
    MatchOutcome outcome{};
    outcome.matched = find_by_name(expectation_member.name, subject_members);
    if (!outcome.matched) {
        outcome.error = ComparisonError{
            ComparisonErrorCode::kMissingMember,
            std::format("Expectation has member {} that the other object does not have.",
                        expectation_member.name),
            expectation_member.path
        };
    }
    return outcome;
}

std::string MustMatchByNameRule::describe() const {
    return "Match member by name (or throw)";
}

MatchOutcome TryMatchByNameRule::match(
    const MemberInfo&           expectation_member,
    std::span<const MemberInfo> subject_members) const
{
    MatchOutcome outcome{};
    outcome.matched = find_by_name(expectation_member.name, subject_members);
    return outcome;
}

std::string TryMatchByNameRule::describe() const {
    return "Try to match member by name";
}
