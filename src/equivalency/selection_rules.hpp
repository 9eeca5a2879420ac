#pragma once

// ---------------------------------------------------------------------------
// selection_rules.hpp
//
// 기본 제공 선택 규칙.
// ---------------------------------------------------------------------------

#include <string>
#include <vector>

#include "member_predicate.hpp"
#include "rule.hpp"

// ---------------------------------------------------------------------------
// AllPublicPropertiesSelectionRule
//   현재 노드 타입(선언 또는 런타임)의 public 프로퍼티를 모두 추가한다.
//   이미 선택된 멤버(같은 이름)는 중복 추가하지 않는다.
//   필드와 non-public 멤버는 추가하지 않는다.
// ---------------------------------------------------------------------------
class AllPublicPropertiesSelectionRule final : public MemberSelectionRule {
public:
    [[nodiscard]] std::vector<MemberInfo> select(
        std::vector<MemberInfo> members,
        const SelectionContext& context) const override;

    [[nodiscard]] std::string describe() const override;
};

// ---------------------------------------------------------------------------
// ExcludeMemberByPredicateSelectionRule
//   술어가 참인 멤버를 모두 제거한다.
// ---------------------------------------------------------------------------
class ExcludeMemberByPredicateSelectionRule final : public MemberSelectionRule {
public:
    explicit ExcludeMemberByPredicateSelectionRule(MemberPredicate predicate);

    [[nodiscard]] std::vector<MemberInfo> select(
        std::vector<MemberInfo> members,
        const SelectionContext& context) const override;

    [[nodiscard]] std::string describe() const override;

private:
    MemberPredicate predicate_;
};
