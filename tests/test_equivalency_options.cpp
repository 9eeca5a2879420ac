// ---------------------------------------------------------------------------
// test_equivalency_options.cpp
//
// EquivalencyOptions (fluent 빌더) 단위 테스트.
//
// [테스트 범위]
// - 하드코딩 기본값
// - 삽입 위치: 선택/순서 규칙은 꼬리, 일치 규칙/스텝은 머리
// - 선택 규칙 재생성 (using_all_declared/runtime_properties)
// - 일치 규칙 교체 (require_exact_name_match / allow_missing_members)
// - 기본값 복제 후 값 독립성
// - describe() 순서와 스칼라 스위치 미표시
// - Restriction<T>: for_type / for_predicate 머리 삽입
// - clear_* / remove_* / null 규칙 무시
// ---------------------------------------------------------------------------

#include "equivalency/equivalency_options.hpp"
#include "equivalency/matching_rules.hpp"
#include "equivalency/ordering_rules.hpp"
#include "equivalency/selection_rules.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

// 이름만 다른 테스트용 규칙들. describe() 로 순서를 확인한다.
class NamedSelectionRule final : public MemberSelectionRule {
public:
    explicit NamedSelectionRule(std::string name) : name_(std::move(name)) {}

    std::vector<MemberInfo> select(std::vector<MemberInfo> members,
                                   const SelectionContext& /*context*/) const override {
        return members;
    }
    std::string describe() const override { return name_; }

private:
    std::string name_;
};

class NamedMatchingRule final : public MemberMatchingRule {
public:
    explicit NamedMatchingRule(std::string name) : name_(std::move(name)) {}

    MatchOutcome match(const MemberInfo& /*expectation_member*/,
                       std::span<const MemberInfo> /*subject_members*/) const override {
        return MatchOutcome{};
    }
    std::string describe() const override { return name_; }

private:
    std::string name_;
};

class NamedStep final : public EquivalencyStep {
public:
    explicit NamedStep(std::string name) : name_(std::move(name)) {}

    StepResult handle(const ComparisonContext& /*context*/) const override { return StepResult{}; }
    std::string describe() const override { return name_; }

private:
    std::string name_;
};

std::shared_ptr<const MemberSelectionRule> selection(const std::string& name) {
    return std::make_shared<NamedSelectionRule>(name);
}

std::shared_ptr<const MemberMatchingRule> matching(const std::string& name) {
    return std::make_shared<NamedMatchingRule>(name);
}

std::shared_ptr<const EquivalencyStep> step(const std::string& name) {
    return std::make_shared<NamedStep>(name);
}

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream       in(text);
    std::string              line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

template <typename Span>
std::vector<std::string> describe_all(const Span& rules) {
    std::vector<std::string> out;
    for (const auto& rule : rules) {
        out.push_back(rule->describe());
    }
    return out;
}

}  // namespace

// ===========================================================================
// 하드코딩 기본값
// ===========================================================================

TEST(EquivalencyOptions, Defaults_SeedOneMatchingAndOneOrderingRule) {
    const auto policy = EquivalencyOptions{}.snapshot();

    EXPECT_TRUE(policy->selection_rules().empty());
    ASSERT_EQ(policy->matching_rules().size(), 1u);
    EXPECT_NE(dynamic_cast<const MustMatchByNameRule*>(policy->matching_rules()[0].get()), nullptr);
    ASSERT_EQ(policy->ordering_rules().size(), 1u);
    EXPECT_NE(dynamic_cast<const ByteArrayOrderingRule*>(policy->ordering_rules()[0].get()), nullptr);
    EXPECT_TRUE(policy->user_equivalency_steps().empty());

    EXPECT_FALSE(policy->is_recursive());
    EXPECT_FALSE(policy->allow_infinite_recursion());
    EXPECT_EQ(policy->cyclic_reference_handling(), CyclicReferenceHandling::kThrowException);
    EXPECT_EQ(policy->enum_equivalency_handling(), EnumEquivalencyHandling::kByValue);
    EXPECT_FALSE(policy->use_runtime_typing());
    EXPECT_FALSE(policy->include_properties());
}

TEST(EquivalencyOptions, Defaults_Describe) {
    EXPECT_EQ(EquivalencyOptions{}.describe(),
              "- Use declared types and members\n"
              "- Match member by name (or throw)\n");
}

TEST(EquivalencyOptions, Chaining_ReturnsSameInstance) {
    EquivalencyOptions options;
    EquivalencyOptions& chained = options.include_nested_objects().ignore_cyclic_references();
    EXPECT_EQ(&chained, &options);
}

// ===========================================================================
// 선택 규칙: 꼬리 추가 + describe 순서
// ===========================================================================

TEST(EquivalencyOptions, SelectionRules_DescribedInInsertionOrderAfterTypingLine) {
    EquivalencyOptions options;
    options.use(selection("S1")).use(selection("S2")).use(selection("S3"));

    const auto lines = lines_of(options.describe());

    ASSERT_GE(lines.size(), 4u);
    EXPECT_EQ(lines[0], "- Use declared types and members");
    EXPECT_EQ(lines[1], "- S1");
    EXPECT_EQ(lines[2], "- S2");
    EXPECT_EQ(lines[3], "- S3");
}

TEST(EquivalencyOptions, Describe_SectionsInEvaluationOrder) {
    EquivalencyOptions options;
    options.use(step("Step")).use(matching("Match")).use(selection("Select"));

    EXPECT_EQ(options.describe(),
              "- Use declared types and members\n"
              "- Select\n"
              "- Match\n"
              "- Match member by name (or throw)\n"
              "- Step\n");
}

TEST(EquivalencyOptions, Describe_DoesNotListSwitches) {
    EquivalencyOptions options;
    const auto before = options.describe();

    options.ignore_cyclic_references()
        .include_nested_objects()
        .allow_infinite_recursion()
        .comparing_enums_by_name();

    EXPECT_EQ(options.describe(), before);
}

TEST(EquivalencyOptions, DuplicateRules_AreKept) {
    EquivalencyOptions options;
    auto rule = selection("Same");
    options.use(rule).use(rule);

    const auto policy = options.snapshot();
    EXPECT_EQ(policy->selection_rules().size(), 2u);
}

// ===========================================================================
// 일치 규칙 / 스텝: 머리 삽입
// ===========================================================================

TEST(EquivalencyOptions, MatchingRules_LastAddedEvaluatedFirst) {
    EquivalencyOptions options;
    options.use(matching("A")).use(matching("B"));

    const auto policy = options.snapshot();
    EXPECT_EQ(describe_all(policy->matching_rules()),
              (std::vector<std::string>{"B", "A", "Match member by name (or throw)"}));
}

TEST(EquivalencyOptions, Steps_LastAddedEvaluatedFirst) {
    EquivalencyOptions options;
    options.use(step("First")).use(step("Second"));

    const auto policy = options.snapshot();
    EXPECT_EQ(describe_all(policy->user_equivalency_steps()),
              (std::vector<std::string>{"Second", "First"}));
}

TEST(EquivalencyOptions, RequireThenAllow_LeavesOnlyAllowRule) {
    EquivalencyOptions options;
    options.require_exact_name_match().allow_missing_members();

    const auto policy = options.snapshot();
    ASSERT_EQ(policy->matching_rules().size(), 1u);
    EXPECT_NE(dynamic_cast<const TryMatchByNameRule*>(policy->matching_rules()[0].get()), nullptr);
}

TEST(EquivalencyOptions, AllowThenRequire_LeavesOnlyRequireRule) {
    EquivalencyOptions options;
    options.use(matching("Custom")).allow_missing_members().require_exact_name_match();

    const auto policy = options.snapshot();
    ASSERT_EQ(policy->matching_rules().size(), 1u);
    EXPECT_NE(dynamic_cast<const MustMatchByNameRule*>(policy->matching_rules()[0].get()), nullptr);
}

// ===========================================================================
// 선택 규칙 재생성
// ===========================================================================

TEST(EquivalencyOptions, RuntimeProperties_RegeneratesToSingleCanonicalRule) {
    EquivalencyOptions options;
    options.exclude_member(member_named("Id")).use(selection("Custom"));
    options.using_all_runtime_properties();

    const auto policy = options.snapshot();
    EXPECT_TRUE(policy->use_runtime_typing());
    EXPECT_TRUE(policy->include_properties());
    ASSERT_EQ(policy->selection_rules().size(), 1u);
    EXPECT_NE(dynamic_cast<const AllPublicPropertiesSelectionRule*>(
                  policy->selection_rules()[0].get()),
              nullptr);
}

TEST(EquivalencyOptions, DeclaredProperties_RegeneratesAndForcesDeclaredTyping) {
    EquivalencyOptions options;
    options.using_all_runtime_properties().use(selection("Custom")).using_all_declared_properties();

    const auto policy = options.snapshot();
    EXPECT_FALSE(policy->use_runtime_typing());
    ASSERT_EQ(policy->selection_rules().size(), 1u);
    EXPECT_EQ(lines_of(options.describe())[0], "- Use declared types and members");
}

TEST(EquivalencyOptions, ExclusionsAfterRegeneration_Survive) {
    EquivalencyOptions options;
    options.using_all_declared_properties().exclude_member(member_named("Id"));

    EXPECT_EQ(options.describe(),
              "- Use declared types and members\n"
              "- Include all non-private properties\n"
              "- Exclude member when member.name == \"Id\"\n"
              "- Match member by name (or throw)\n");
}

TEST(EquivalencyOptions, RuntimeProperties_DescribeShowsRuntimeTyping) {
    EquivalencyOptions options;
    options.using_all_runtime_properties();

    EXPECT_EQ(lines_of(options.describe())[0], "- Use runtime types and members");
}

// ===========================================================================
// 종단 시나리오
// ===========================================================================

TEST(EquivalencyOptions, ExcludeId_DescribeContainsOnlyThatSelectionLine) {
    EquivalencyOptions options;
    options.exclude_member(member_named("Id"));

    EXPECT_EQ(options.describe(),
              "- Use declared types and members\n"
              "- Exclude member when member.name == \"Id\"\n"
              "- Match member by name (or throw)\n");
}

TEST(EquivalencyOptions, StrictOrderingForAll_AppendsAfterByteArrayRule) {
    EquivalencyOptions options;
    options.with_strict_ordering_for_all();

    const auto policy = options.snapshot();
    ASSERT_EQ(policy->ordering_rules().size(), 2u);
    EXPECT_NE(dynamic_cast<const ByteArrayOrderingRule*>(policy->ordering_rules()[0].get()), nullptr);
    EXPECT_NE(dynamic_cast<const MatchAllOrderingRule*>(policy->ordering_rules()[1].get()), nullptr);
}

TEST(EquivalencyOptions, StrictOrderingFor_AppendsPredicateRule) {
    EquivalencyOptions options;
    options.with_strict_ordering_for(member_path("root.Lines"));

    const auto policy = options.snapshot();
    ASSERT_EQ(policy->ordering_rules().size(), 2u);
    EXPECT_EQ(policy->ordering_rules()[1]->describe(),
              "Be strict about the order of collections when member.path == \"root.Lines\"");
}

TEST(EquivalencyOptions, Enums_LastWriteWins) {
    EquivalencyOptions options;
    options.comparing_enums_by_name().comparing_enums_by_value();

    EXPECT_EQ(options.snapshot()->enum_equivalency_handling(), EnumEquivalencyHandling::kByValue);
}

TEST(EquivalencyOptions, NestedObjects_LastWriteWins) {
    EquivalencyOptions options;
    options.include_nested_objects().exclude_nested_objects();
    EXPECT_FALSE(options.snapshot()->is_recursive());

    options.include_nested_objects();
    EXPECT_TRUE(options.snapshot()->is_recursive());
}

// ===========================================================================
// 기본값 복제와 값 독립성
// ===========================================================================

TEST(EquivalencyOptions, CloneFromDefaults_MutationDoesNotAffectSource) {
    EquivalencyOptions source_options;
    source_options.exclude_member(member_named("Id")).include_nested_objects();
    const auto source = source_options.snapshot();
    const auto source_description = source->describe();

    EquivalencyOptions clone{*source};
    clone.use(matching("Extra"))
        .use(selection("Extra"))
        .with_strict_ordering_for_all()
        .exclude_nested_objects();
    clone.clear_matching_rules();

    EXPECT_EQ(source->describe(), source_description);
    EXPECT_EQ(source->matching_rules().size(), 1u);
    EXPECT_EQ(source->selection_rules().size(), 1u);
    EXPECT_EQ(source->ordering_rules().size(), 1u);
    EXPECT_TRUE(source->is_recursive());
}

TEST(EquivalencyOptions, CloneFromDefaults_CopiesEverySwitch) {
    EquivalencyOptions source_options;
    source_options.using_all_runtime_properties()
        .include_nested_objects()
        .allow_infinite_recursion()
        .ignore_cyclic_references()
        .comparing_enums_by_name();
    const auto source = source_options.snapshot();

    const auto clone = EquivalencyOptions{*source}.snapshot();

    EXPECT_TRUE(clone->use_runtime_typing());
    EXPECT_TRUE(clone->include_properties());
    EXPECT_TRUE(clone->is_recursive());
    EXPECT_TRUE(clone->allow_infinite_recursion());
    EXPECT_EQ(clone->cyclic_reference_handling(), CyclicReferenceHandling::kIgnore);
    EXPECT_EQ(clone->enum_equivalency_handling(), EnumEquivalencyHandling::kByName);
    EXPECT_EQ(clone->describe(), source->describe());
}

TEST(EquivalencyOptions, Snapshot_IsFrozen) {
    EquivalencyOptions options;
    const auto before = options.snapshot();

    options.use(matching("Later"));

    EXPECT_EQ(before->matching_rules().size(), 1u);
    EXPECT_EQ(options.snapshot()->matching_rules().size(), 2u);
}

// ===========================================================================
// clear / remove
// ===========================================================================

TEST(EquivalencyOptions, ClearSelectionRules_ForcesDeclaredTypingAndProperties) {
    EquivalencyOptions options;
    options.using_all_runtime_properties().exclude_member(member_named("Id"));
    options.clear_selection_rules();

    const auto policy = options.snapshot();
    EXPECT_TRUE(policy->selection_rules().empty());
    EXPECT_FALSE(policy->use_runtime_typing());
    EXPECT_TRUE(policy->include_properties());
}

TEST(EquivalencyOptions, ClearMatchingRules_LeavesZeroRules) {
    EquivalencyOptions options;
    options.clear_matching_rules();

    const auto policy = options.snapshot();
    EXPECT_TRUE(policy->matching_rules().empty());
    EXPECT_EQ(options.describe(), "- Use declared types and members\n");
}

TEST(EquivalencyOptions, RemoveStandardSelectionRules_KeepsCustomRulesInOrder) {
    EquivalencyOptions options;
    options.using_all_runtime_properties()
        .exclude_member(member_named("Id"))
        .use(selection("Custom"));
    options.remove_standard_selection_rules();

    const auto policy = options.snapshot();
    EXPECT_EQ(describe_all(policy->selection_rules()),
              (std::vector<std::string>{"Exclude member when member.name == \"Id\"", "Custom"}));
    EXPECT_FALSE(policy->use_runtime_typing());
    EXPECT_TRUE(policy->include_properties());
}

TEST(EquivalencyOptions, RemoveSelectionRulesByType_RemovesOnlyThatType) {
    EquivalencyOptions options;
    options.exclude_member(member_named("Id"))
        .use(selection("Custom"))
        .exclude_member(member_named("Version"));
    options.remove_selection_rules<ExcludeMemberByPredicateSelectionRule>();

    EXPECT_EQ(describe_all(options.snapshot()->selection_rules()),
              (std::vector<std::string>{"Custom"}));
}

TEST(EquivalencyOptions, NullRules_AreIgnored) {
    EquivalencyOptions options;
    const auto before = options.describe();

    options.use(std::shared_ptr<const MemberSelectionRule>{})
        .use(std::shared_ptr<const MemberMatchingRule>{})
        .use(std::shared_ptr<const OrderingRule>{})
        .use(std::shared_ptr<const EquivalencyStep>{})
        .use(std::shared_ptr<const AssertionRule>{});

    const auto policy = options.snapshot();
    EXPECT_EQ(options.describe(), before);
    EXPECT_EQ(policy->ordering_rules().size(), 1u);
    EXPECT_TRUE(policy->user_equivalency_steps().empty());
}

// ===========================================================================
// Restriction<T>
// ===========================================================================

namespace {

struct Shape {
    virtual ~Shape() = default;
    double area{0.0};
};
struct Circle : Shape {};

MemberInfo shape_member(const std::string& name, TypeRef runtime_type) {
    MemberInfo m{};
    m.name              = name;
    m.path              = "root." + name;
    m.compile_time_type = TypeRef::of<Shape>("Shape");
    m.runtime_type      = std::move(runtime_type);
    return m;
}

ComparisonContext make_context(const MemberInfo& member, std::any subject, std::any expectation) {
    ComparisonContext ctx{};
    ctx.member      = member;
    ctx.subject     = std::move(subject);
    ctx.expectation = std::move(expectation);
    ctx.depth       = 1;
    return ctx;
}

}  // namespace

TEST(Restriction, ForPredicate_InsertsStepAtHeadAndReturnsOptions) {
    EquivalencyOptions options;
    options.use(step("Existing"));

    EquivalencyOptions& returned =
        options.using_action<int>([](AssertionContext<int>&) {}).for_predicate(member_named("Qty"));

    EXPECT_EQ(&returned, &options);
    const auto policy = options.snapshot();
    ASSERT_EQ(policy->user_equivalency_steps().size(), 2u);
    EXPECT_EQ(policy->user_equivalency_steps()[0]->describe(),
              std::string("Invoke Action<") + typeid(int).name() + "> when member.name == \"Qty\"");
    EXPECT_EQ(policy->user_equivalency_steps()[1]->describe(), "Existing");
}

TEST(Restriction, DisplayNames_AppearInDescribe) {
    EquivalencyOptions options;
    options.using_action<int>([](AssertionContext<int>&) {}, "int").for_type<Shape>("Shape");

    const auto policy = options.snapshot();
    ASSERT_EQ(policy->user_equivalency_steps().size(), 1u);
    EXPECT_EQ(policy->user_equivalency_steps()[0]->describe(),
              "Invoke Action<int> when member.runtime_type is Shape");
}

TEST(Restriction, ForPredicate_ChainContinues) {
    EquivalencyOptions options;
    options.using_action<int>([](AssertionContext<int>&) {})
        .for_predicate(member_named("Qty"))
        .include_nested_objects();

    EXPECT_TRUE(options.snapshot()->is_recursive());
}

TEST(Restriction, ForType_AppliesToDerivedRuntimeType) {
    using Handle = std::shared_ptr<const Shape>;

    EquivalencyOptions options;
    options.using_action<Handle>([](AssertionContext<Handle>& ctx) {
               ctx.expect(ctx.subject()->area == ctx.expectation()->area, "area differs");
           })
        .for_type<Shape>();
    const auto policy = options.snapshot();

    auto a = std::make_shared<Circle>();
    auto b = std::make_shared<Circle>();
    a->area = 1.0;
    b->area = 2.0;

    const auto member = shape_member("Outline", TypeRef::of<Circle, Shape>("Circle"));
    const auto result = policy->run_user_steps(make_context(member, Handle{a}, Handle{b}));

    EXPECT_EQ(result.outcome, StepOutcome::kNotEquivalent);
    EXPECT_EQ(result.reason, "area differs");
}

TEST(Restriction, ForType_DeclinesForUnrelatedRuntimeType) {
    struct Unrelated {};
    EquivalencyOptions options;
    options.using_action<int>([](AssertionContext<int>& ctx) { ctx.fail("never"); })
        .for_type<Shape>();
    const auto policy = options.snapshot();

    auto member         = shape_member("Count", TypeRef::of<Unrelated>("Unrelated"));
    const auto result   = policy->run_user_steps(make_context(member, 1, 2));

    EXPECT_EQ(result.outcome, StepOutcome::kDeclined);
}

TEST(Restriction, DeclinesForRootObject) {
    EquivalencyOptions options;
    options.using_action<int>([](AssertionContext<int>& ctx) { ctx.fail("never"); })
        .for_predicate(MemberPredicate([](const MemberInfo&) { return true; }, "true"));
    const auto policy = options.snapshot();

    ComparisonContext root{};
    root.subject     = 1;
    root.expectation = 2;

    EXPECT_EQ(policy->run_user_steps(root).outcome, StepOutcome::kDeclined);
}

TEST(Restriction, LaterRestrictionOverridesEarlier) {
    EquivalencyOptions options;
    options.using_action<int>([](AssertionContext<int>& ctx) { ctx.fail("first"); })
        .for_predicate(member_named("Qty"));
    options.using_action<int>([](AssertionContext<int>&) {})
        .for_predicate(member_named("Qty"));
    const auto policy = options.snapshot();

    MemberInfo qty{};
    qty.name = "Qty";
    qty.path = "root.Qty";

    EXPECT_EQ(policy->run_user_steps(make_context(qty, 1, 2)).outcome, StepOutcome::kEquivalent);
}
