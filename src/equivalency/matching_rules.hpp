#pragma once

// ---------------------------------------------------------------------------
// matching_rules.hpp
//
// 기본 제공 일치(matching) 규칙. 둘 다 이름 기반이며 대소문자를 구분한다.
// 차이는 대응 멤버가 없을 때의 동작뿐이다.
// ---------------------------------------------------------------------------

#include <span>
#include <string>

#include "rule.hpp"

// 대응 멤버가 없으면 kMissingMember 오류를 보고한다 (기본 규칙).
class MustMatchByNameRule final : public MemberMatchingRule {
public:
    [[nodiscard]] MatchOutcome match(
        const MemberInfo&           expectation_member,
        std::span<const MemberInfo> subject_members) const override;

    [[nodiscard]] std::string describe() const override;
};

// 대응 멤버가 없으면 조용히 건너뛴다.
class TryMatchByNameRule final : public MemberMatchingRule {
public:
    [[nodiscard]] MatchOutcome match(
        const MemberInfo&           expectation_member,
        std::span<const MemberInfo> subject_members) const override;

    [[nodiscard]] std::string describe() const override;
};
