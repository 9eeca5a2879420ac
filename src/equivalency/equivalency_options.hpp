#pragma once

// ---------------------------------------------------------------------------
// equivalency_options.hpp
//
// 구조적 등가성 비교 정책을 구성하는 가변 fluent 빌더.
//
// [체이닝 의미론]
// 모든 변경 메서드는 새 복사본이 아니라 같은 인스턴스의 참조를 반환한다.
// 나중 호출이 앞선 상태를 덮어쓴다.
//
// [삽입 위치: 우선순위 계약]
// - 선택 규칙 / 순서 규칙 : 꼬리에 추가 (먼저 등록된 규칙이 먼저 평가)
// - 일치 규칙 / 비교 스텝  : 머리에 삽입 (나중 등록이 먼저 평가되어
//                            기존 등록과 기본값을 덮어씀)
//
// [선택 규칙 재생성]
// using_all_declared_properties / using_all_runtime_properties 는
// 선택 규칙 목록을 처음부터 다시 만든다. 앞서 추가한 exclude_member /
// use(selection rule) 규칙도 모두 사라진다.
//
// [오류]
// 설정 시점 오류는 없다. 모든 메서드는 입력 전체에 대해 정의된다.
// null 규칙은 경고 로그와 함께 무시된다.
//
// [스레드 안전성]
// 동시 변경에 안전하지 않다. 설정 → snapshot() → 공유 순서로 사용한다.
// ---------------------------------------------------------------------------

#include <algorithm>
#include <memory>
#include <string>
#include <typeinfo>
#include <utility>

#include "assertion_rule.hpp"
#include "equivalency_policy.hpp"
#include "member_predicate.hpp"
#include "rule.hpp"

class EquivalencyOptions;

// ---------------------------------------------------------------------------
// Restriction<TMember>
//   using_action<T>(action) 이 반환하는 범위 한정 빌더.
//   대기 중인 동작 하나와 소유 정책의 참조만 보유한다.
// ---------------------------------------------------------------------------
template <typename TMember>
class Restriction {
public:
    Restriction(EquivalencyOptions&       options,
                AssertionAction<TMember>  action,
                std::string               member_type_name)
        : options_(options)
        , action_(std::move(action))
        , member_type_name_(std::move(member_type_name))
    {}

    // 런타임 타입이 TMemberType 이거나 이를 상속한 멤버에 동작을 적용한다.
    // type_name 은 describe() 에 표시된다.
    template <typename TMemberType>
    EquivalencyOptions& for_type(std::string type_name = typeid(TMemberType).name());

    // 술어가 참인 멤버에 동작을 적용한다.
    EquivalencyOptions& for_predicate(MemberPredicate predicate);

private:
    EquivalencyOptions&      options_;
    AssertionAction<TMember> action_;
    std::string              member_type_name_;
};

class EquivalencyOptions {
public:
    // 하드코딩 기본값: MustMatchByNameRule 1개, ByteArrayOrderingRule 1개,
    // 선택 규칙/스텝 없음, 모든 스위치 기본값.
    EquivalencyOptions();

    // 이전에 구성한 기본 정책으로부터 값 복제.
    // 이후 이 인스턴스를 변경해도 defaults 에는 영향이 없다.
    explicit EquivalencyOptions(const EquivalencyPolicy& defaults);

    ~EquivalencyOptions() = default;

    EquivalencyOptions(const EquivalencyOptions&)            = default;
    EquivalencyOptions& operator=(const EquivalencyOptions&) = default;
    EquivalencyOptions(EquivalencyOptions&&)                 = default;
    EquivalencyOptions& operator=(EquivalencyOptions&&)      = default;

    // 선언 타입 기준 public 프로퍼티 전체 포함 (선택 규칙 재생성)
    EquivalencyOptions& using_all_declared_properties();

    // 런타임 타입 기준 public 프로퍼티 전체 포함 (선택 규칙 재생성)
    EquivalencyOptions& using_all_runtime_properties();

    EquivalencyOptions& exclude_member(MemberPredicate predicate);

    // 일치 규칙 목록을 TryMatchByNameRule 하나로 교체
    EquivalencyOptions& allow_missing_members();

    // 일치 규칙 목록을 MustMatchByNameRule 하나로 교체
    EquivalencyOptions& require_exact_name_match();

    // type_name: describe() 의 "Invoke Action<...>" 에 표시할 TMember 이름
    template <typename TMember>
    Restriction<TMember> using_action(AssertionAction<TMember> action,
                                      std::string type_name = typeid(TMember).name()) {
        return Restriction<TMember>(*this, std::move(action), std::move(type_name));
    }

    EquivalencyOptions& include_nested_objects();
    EquivalencyOptions& exclude_nested_objects();
    EquivalencyOptions& ignore_cyclic_references();

    // include_nested_objects 일 때 최대 깊이 제한을 해제한다.
    EquivalencyOptions& allow_infinite_recursion();

    // 기본값을 포함한 모든 선택 규칙 제거. 선언 타입 모드 + 프로퍼티 포함으로 설정.
    void clear_selection_rules();

    // 기본값을 포함한 모든 일치 규칙 제거. 규칙 0개도 유효한 상태이다.
    void clear_matching_rules();

    EquivalencyOptions& use(std::shared_ptr<const MemberSelectionRule> rule);
    EquivalencyOptions& use(std::shared_ptr<const MemberMatchingRule> rule);
    EquivalencyOptions& use(std::shared_ptr<const OrderingRule> rule);
    EquivalencyOptions& use(std::shared_ptr<const EquivalencyStep> step);
    EquivalencyOptions& use(std::shared_ptr<const AssertionRule> rule);

    EquivalencyOptions& with_strict_ordering_for_all();
    EquivalencyOptions& with_strict_ordering_for(MemberPredicate predicate);

    EquivalencyOptions& comparing_enums_by_name();
    EquivalencyOptions& comparing_enums_by_value();

    // 특정 구체 타입의 선택 규칙만 제거 (나머지는 순서 유지)
    template <typename RuleT>
    void remove_selection_rules() {
        std::erase_if(state_.selection_rules,
                      [](const std::shared_ptr<const MemberSelectionRule>& rule) {
                          return dynamic_cast<const RuleT*>(rule.get()) != nullptr;
                      });
    }

    // AllPublicPropertiesSelectionRule 제거 + 선언 타입 모드 + 프로퍼티 포함
    void remove_standard_selection_rules();

    // 현재 상태의 불변 스냅샷 (목록은 값 복제)
    [[nodiscard]] std::shared_ptr<const EquivalencyPolicy> snapshot() const;

    [[nodiscard]] std::string describe() const;

private:
    void reconfigure_selection_rules();

    PolicyState state_{};
};

// ---------------------------------------------------------------------------
// Restriction<TMember> 멤버 정의 (EquivalencyOptions 완전 타입 필요)
// ---------------------------------------------------------------------------
template <typename TMember>
template <typename TMemberType>
EquivalencyOptions& Restriction<TMember>::for_type(std::string type_name) {
    return for_predicate(member_type_is<TMemberType>(std::move(type_name)));
}

template <typename TMember>
EquivalencyOptions& Restriction<TMember>::for_predicate(MemberPredicate predicate) {
    options_.use(std::shared_ptr<const AssertionRule>(
        std::make_shared<TypedAssertionRule<TMember>>(std::move(predicate), action_, member_type_name_)));
    return options_;
}
