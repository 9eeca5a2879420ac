// ---------------------------------------------------------------------------
// equivalency_options.cpp
//
// fluent 빌더 구현. 모든 메서드는 순수 데이터 변경이며 실패하지 않는다.
// ---------------------------------------------------------------------------

#include "equivalency/equivalency_options.hpp"

#include <spdlog/spdlog.h>

#include "equivalency/matching_rules.hpp"
#include "equivalency/ordering_rules.hpp"
#include "equivalency/selection_rules.hpp"

namespace {

// 머리 삽입: 가장 최근 등록이 가장 먼저 평가된다.
template <typename T>
void insert_at_head(std::vector<std::shared_ptr<const T>>& rules, std::shared_ptr<const T> rule) {
    rules.insert(rules.begin(), std::move(rule));
}

// 꼬리 추가: 먼저 등록된 규칙이 먼저 평가된다.
template <typename T>
void insert_at_tail(std::vector<std::shared_ptr<const T>>& rules, std::shared_ptr<const T> rule) {
    rules.push_back(std::move(rule));
}

}  // namespace

EquivalencyOptions::EquivalencyOptions() {
    insert_at_head<MemberMatchingRule>(state_.matching_rules, std::make_shared<MustMatchByNameRule>());
    insert_at_tail<OrderingRule>(state_.ordering_rules, std::make_shared<ByteArrayOrderingRule>());
}

EquivalencyOptions::EquivalencyOptions(const EquivalencyPolicy& defaults)
    : state_(defaults.state())
{}

EquivalencyOptions& EquivalencyOptions::using_all_declared_properties() {
    state_.use_runtime_typing = false;
    state_.include_properties = true;
    reconfigure_selection_rules();
    return *this;
}

EquivalencyOptions& EquivalencyOptions::using_all_runtime_properties() {
    state_.use_runtime_typing = true;
    state_.include_properties = true;
    reconfigure_selection_rules();
    return *this;
}

EquivalencyOptions& EquivalencyOptions::exclude_member(MemberPredicate predicate) {
    return use(std::shared_ptr<const MemberSelectionRule>(
        std::make_shared<ExcludeMemberByPredicateSelectionRule>(std::move(predicate))));
}

EquivalencyOptions& EquivalencyOptions::allow_missing_members() {
    state_.matching_rules.clear();
    insert_at_tail<MemberMatchingRule>(state_.matching_rules, std::make_shared<TryMatchByNameRule>());
    spdlog::debug("equivalency_options: matching rules replaced by '{}'",
                  state_.matching_rules.front()->describe());
    return *this;
}

EquivalencyOptions& EquivalencyOptions::require_exact_name_match() {
    state_.matching_rules.clear();
    insert_at_tail<MemberMatchingRule>(state_.matching_rules, std::make_shared<MustMatchByNameRule>());
    spdlog::debug("equivalency_options: matching rules replaced by '{}'",
                  state_.matching_rules.front()->describe());
    return *this;
}

EquivalencyOptions& EquivalencyOptions::include_nested_objects() {
    state_.is_recursive = true;
    return *this;
}

EquivalencyOptions& EquivalencyOptions::exclude_nested_objects() {
    state_.is_recursive = false;
    return *this;
}

EquivalencyOptions& EquivalencyOptions::ignore_cyclic_references() {
    state_.cyclic_reference_handling = CyclicReferenceHandling::kIgnore;
    return *this;
}

EquivalencyOptions& EquivalencyOptions::allow_infinite_recursion() {
    state_.allow_infinite_recursion = true;
    return *this;
}

void EquivalencyOptions::clear_selection_rules() {
    state_.selection_rules.clear();
    state_.use_runtime_typing = false;
    state_.include_properties = true;
}

void EquivalencyOptions::clear_matching_rules() {
    state_.matching_rules.clear();
    // 규칙 0개: 비교기는 모든 expectation 멤버를 "일치 없음" 으로 처리한다.
    spdlog::warn("equivalency_options: all matching rules cleared");
}

EquivalencyOptions& EquivalencyOptions::use(std::shared_ptr<const MemberSelectionRule> rule) {
    if (!rule) {
        spdlog::warn("equivalency_options: ignoring null selection rule");
        return *this;
    }
    insert_at_tail(state_.selection_rules, std::move(rule));
    return *this;
}

EquivalencyOptions& EquivalencyOptions::use(std::shared_ptr<const MemberMatchingRule> rule) {
    if (!rule) {
        spdlog::warn("equivalency_options: ignoring null matching rule");
        return *this;
    }
    insert_at_head(state_.matching_rules, std::move(rule));
    return *this;
}

EquivalencyOptions& EquivalencyOptions::use(std::shared_ptr<const OrderingRule> rule) {
    if (!rule) {
        spdlog::warn("equivalency_options: ignoring null ordering rule");
        return *this;
    }
    insert_at_tail(state_.ordering_rules, std::move(rule));
    return *this;
}

EquivalencyOptions& EquivalencyOptions::use(std::shared_ptr<const EquivalencyStep> step) {
    if (!step) {
        spdlog::warn("equivalency_options: ignoring null equivalency step");
        return *this;
    }
    insert_at_head(state_.user_equivalency_steps, std::move(step));
    return *this;
}

EquivalencyOptions& EquivalencyOptions::use(std::shared_ptr<const AssertionRule> rule) {
    if (!rule) {
        spdlog::warn("equivalency_options: ignoring null assertion rule");
        return *this;
    }
    return use(std::shared_ptr<const EquivalencyStep>(
        std::make_shared<AssertionRuleStepAdapter>(std::move(rule))));
}

EquivalencyOptions& EquivalencyOptions::with_strict_ordering_for_all() {
    return use(std::shared_ptr<const OrderingRule>(std::make_shared<MatchAllOrderingRule>()));
}

EquivalencyOptions& EquivalencyOptions::with_strict_ordering_for(MemberPredicate predicate) {
    return use(std::shared_ptr<const OrderingRule>(
        std::make_shared<PredicateBasedOrderingRule>(std::move(predicate))));
}

EquivalencyOptions& EquivalencyOptions::comparing_enums_by_name() {
    state_.enum_equivalency_handling = EnumEquivalencyHandling::kByName;
    return *this;
}

EquivalencyOptions& EquivalencyOptions::comparing_enums_by_value() {
    state_.enum_equivalency_handling = EnumEquivalencyHandling::kByValue;
    return *this;
}

void EquivalencyOptions::remove_standard_selection_rules() {
    remove_selection_rules<AllPublicPropertiesSelectionRule>();
    state_.use_runtime_typing = false;
    state_.include_properties = true;
}

std::shared_ptr<const EquivalencyPolicy> EquivalencyOptions::snapshot() const {
    return std::make_shared<const EquivalencyPolicy>(state_);
}

std::string EquivalencyOptions::describe() const {
    return EquivalencyPolicy(state_).describe();
}

// ---------------------------------------------------------------------------
// reconfigure_selection_rules
//   선택 규칙을 처음부터 다시 만든다 (추가/제거가 아닌 재구성).
//   include_properties 가 참이면 표준 규칙 하나만 남는다.
// ---------------------------------------------------------------------------
void EquivalencyOptions::reconfigure_selection_rules() {
    const auto dropped = state_.selection_rules.size();
    state_.selection_rules.clear();

    if (state_.include_properties) {
        insert_at_tail<MemberSelectionRule>(
            state_.selection_rules, std::make_shared<AllPublicPropertiesSelectionRule>());
    }

    spdlog::debug(
        "equivalency_options: selection rules regenerated (dropped={}, runtime_typing={})",
        dropped, state_.use_runtime_typing
    );
}
