#pragma once

// ---------------------------------------------------------------------------
// ordering_rules.hpp
//
// 기본 제공 컬렉션 순서 규칙.
// 어떤 규칙도 kIrrelevant 외의 판정을 내리지 않으면 순서 무관 비교가 기본이다.
// ---------------------------------------------------------------------------

#include <string>

#include "member_predicate.hpp"
#include "rule.hpp"

// 바이트 시퀀스(std::vector<std::uint8_t>, std::vector<std::byte>)는 항상 순서 엄격.
// 생성 시 기본으로 등록된다.
class ByteArrayOrderingRule final : public OrderingRule {
public:
    [[nodiscard]] OrderStrictness evaluate(const MemberInfo& member) const override;
    [[nodiscard]] std::string describe() const override;
};

// 모든 컬렉션에 순서 엄격.
class MatchAllOrderingRule final : public OrderingRule {
public:
    [[nodiscard]] OrderStrictness evaluate(const MemberInfo& member) const override;
    [[nodiscard]] std::string describe() const override;
};

// 술어가 참인 멤버에만 순서 엄격.
class PredicateBasedOrderingRule final : public OrderingRule {
public:
    explicit PredicateBasedOrderingRule(MemberPredicate predicate);

    [[nodiscard]] OrderStrictness evaluate(const MemberInfo& member) const override;
    [[nodiscard]] std::string describe() const override;

private:
    MemberPredicate predicate_;
};
