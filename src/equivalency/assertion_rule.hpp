#pragma once

// ---------------------------------------------------------------------------
// assertion_rule.hpp
//
// "술어 P 가 참인 멤버에는 동작 A 로 비교한다" 형태의 사용자 오버라이드.
//
// [흐름]
//   EquivalencyOptions::using_action<T>(A).for_predicate(P)
//     → TypedAssertionRule<T>(P, A)
//     → AssertionRuleStepAdapter 로 감싸 user_equivalency_steps 맨 앞에 삽입
//
// [적용 조건]
// - 루트 객체에는 적용되지 않는다 (멤버 메타데이터가 없음).
// - subject/expectation 이 둘 다 정확히 T 를 담고 있어야 한다.
//   std::any 는 파생→기반 변환을 하지 않으므로, 다형 타입은 호출자가
//   기반 타입(예: std::shared_ptr<Base>)으로 담아야 한다.
// - 조건 불충족 시 거절(decline)하여 다음 스텝으로 넘긴다.
// ---------------------------------------------------------------------------

#include <any>
#include <format>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <typeinfo>
#include <utility>

#include "member_predicate.hpp"
#include "rule.hpp"

// ---------------------------------------------------------------------------
// AssertionContext<T>
//   사용자 동작에 전달되는 비교 대상. 실패는 fail()/expect() 로 보고한다.
//   여러 번 실패하면 사유를 "; " 로 이어 붙인다.
// ---------------------------------------------------------------------------
template <typename T>
class AssertionContext {
public:
    AssertionContext(const MemberInfo& subject_info, const T& subject, const T& expectation)
        : subject_info_(subject_info)
        , subject_(subject)
        , expectation_(expectation)
    {}

    [[nodiscard]] const MemberInfo& subject_info() const noexcept { return subject_info_; }
    [[nodiscard]] const T& subject() const noexcept { return subject_; }
    [[nodiscard]] const T& expectation() const noexcept { return expectation_; }

    void fail(const std::string& reason) {
        if (!failure_.empty()) {
            failure_ += "; ";
        }
        failure_ += reason;
        failed_ = true;
    }

    bool expect(bool condition, const std::string& reason) {
        if (!condition) {
            fail(reason);
        }
        return condition;
    }

    [[nodiscard]] bool failed() const noexcept { return failed_; }
    [[nodiscard]] const std::string& failure() const noexcept { return failure_; }

private:
    const MemberInfo& subject_info_;
    const T&          subject_;
    const T&          expectation_;
    bool              failed_{false};
    std::string       failure_{};
};

template <typename T>
using AssertionAction = std::function<void(AssertionContext<T>&)>;

// ---------------------------------------------------------------------------
// TypedAssertionRule<T>
// ---------------------------------------------------------------------------
template <typename T>
class TypedAssertionRule final : public AssertionRule {
public:
    // type_name: describe() 에 표시할 T 의 이름
    TypedAssertionRule(MemberPredicate    predicate,
                       AssertionAction<T> action,
                       std::string        type_name = typeid(T).name())
        : predicate_(std::move(predicate))
        , action_(std::move(action))
        , type_name_(std::move(type_name))
    {}

    [[nodiscard]] std::optional<StepResult> assert_equality(
        const ComparisonContext& context) const override
    {
        if (!action_ || context.is_root() || !predicate_(*context.member)) {
            return std::nullopt;
        }

        const T* subject     = std::any_cast<T>(&context.subject);
        const T* expectation = std::any_cast<T>(&context.expectation);
        if (subject == nullptr || expectation == nullptr) {
            return std::nullopt;
        }

        AssertionContext<T> assertion{*context.member, *subject, *expectation};
        action_(assertion);

        StepResult result{};
        result.step = describe();
        if (assertion.failed()) {
            result.outcome = StepOutcome::kNotEquivalent;
            result.reason  = assertion.failure();
        } else {
            result.outcome = StepOutcome::kEquivalent;
        }
        return result;
    }

    [[nodiscard]] std::string describe() const override {
        return std::format("Invoke Action<{}> when {}", type_name_, predicate_.description());
    }

private:
    MemberPredicate    predicate_;
    AssertionAction<T> action_;
    std::string        type_name_;
};

// ---------------------------------------------------------------------------
// AssertionRuleStepAdapter
//   AssertionRule 을 EquivalencyStep 으로 감싼다.
//   루트 객체에는 항상 거절한다.
// ---------------------------------------------------------------------------
class AssertionRuleStepAdapter final : public EquivalencyStep {
public:
    explicit AssertionRuleStepAdapter(std::shared_ptr<const AssertionRule> rule);

    [[nodiscard]] StepResult handle(const ComparisonContext& context) const override;
    [[nodiscard]] std::string describe() const override;

private:
    std::shared_ptr<const AssertionRule> rule_;
};
