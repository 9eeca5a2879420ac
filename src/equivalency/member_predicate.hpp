#pragma once

// ---------------------------------------------------------------------------
// member_predicate.hpp
//
// MemberInfo 에 대한 1급 술어 값.
// 선택/순서/스텝 규칙이 "어떤 멤버에 적용되는가" 를 표현할 때 사용한다.
//
// [설계 원칙]
// - 술어는 멤버 메타데이터(이름, 선언 타입, 런타임 타입, 경로)만 본다.
//   값은 절대 보지 않는다.
// - description 은 describe() 출력에 그대로 들어가므로 사람이 읽을 수
//   있는 형태로 작성한다.
// - 비어있는 술어(fn 없음)는 어떤 멤버와도 일치하지 않는다.
//   &&, ||, ! 로 조합해도 마찬가지이다. 설정 시점 오류가 아니다.
// ---------------------------------------------------------------------------

#include <functional>
#include <typeinfo>
#include <string>
#include <typeindex>
#include <utility>

#include "common/types.hpp"

class MemberPredicate {
public:
    using Fn = std::function<bool(const MemberInfo&)>;

    MemberPredicate() = default;
    MemberPredicate(Fn fn, std::string description);

    // 술어 평가. fn 이 없으면 항상 false.
    [[nodiscard]] bool operator()(const MemberInfo& member) const;

    [[nodiscard]] const std::string& description() const noexcept { return description_; }
    [[nodiscard]] bool empty() const noexcept { return !fn_; }

private:
    Fn          fn_{};
    std::string description_{"<never>"};
};

MemberPredicate operator&&(const MemberPredicate& lhs, const MemberPredicate& rhs);
MemberPredicate operator||(const MemberPredicate& lhs, const MemberPredicate& rhs);
MemberPredicate operator!(const MemberPredicate& predicate);

// ---------------------------------------------------------------------------
// 팩토리
// ---------------------------------------------------------------------------

// member.name == name
[[nodiscard]] MemberPredicate member_named(std::string name);

// member.path == path
[[nodiscard]] MemberPredicate member_path(std::string path);

// member.path 가 prefix 이거나 그 하위 경로 (prefix + "." / prefix + "[")
[[nodiscard]] MemberPredicate member_path_starts_with(std::string prefix);

// 런타임 타입이 type 이거나 type 을 상속
[[nodiscard]] MemberPredicate member_type_is(std::type_index type, std::string type_name);

// type_name 은 describe() 용 표시 이름. 생략하면 typeid(T).name() (구현 정의).
template <typename T>
[[nodiscard]] MemberPredicate member_type_is(std::string type_name = typeid(T).name()) {
    return member_type_is(std::type_index(typeid(T)), std::move(type_name));
}
