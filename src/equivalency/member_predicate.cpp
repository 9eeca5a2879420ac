// ---------------------------------------------------------------------------
// member_predicate.cpp
// ---------------------------------------------------------------------------

#include "equivalency/member_predicate.hpp"

#include <format>

MemberPredicate::MemberPredicate(Fn fn, std::string description)
    : fn_(std::move(fn))
    , description_(std::move(description))
{}

bool MemberPredicate::operator()(const MemberInfo& member) const {
    if (!fn_) {
        return false;
    }
    return fn_(member);
}

// ---------------------------------------------------------------------------
// 조합 연산자
//   피연산자를 값으로 캡처하므로 원본 술어의 수명과 무관하다.
//   비어있는 술어는 조합해도 "일치 없음" 으로 남는다.
// ---------------------------------------------------------------------------
MemberPredicate operator&&(const MemberPredicate& lhs, const MemberPredicate& rhs) {
    if (lhs.empty() || rhs.empty()) {
        return MemberPredicate{};
    }
    return MemberPredicate(
        [lhs, rhs](const MemberInfo& m) { return lhs(m) && rhs(m); },
        std::format("({}) && ({})", lhs.description(), rhs.description())
    );
}

MemberPredicate operator||(const MemberPredicate& lhs, const MemberPredicate& rhs) {
    if (lhs.empty()) {
        return rhs;
    }
    if (rhs.empty()) {
        return lhs;
    }
    return MemberPredicate(
        [lhs, rhs](const MemberInfo& m) { return lhs(m) || rhs(m); },
        std::format("({}) || ({})", lhs.description(), rhs.description())
    );
}

MemberPredicate operator!(const MemberPredicate& predicate) {
    // 비어있는 술어의 부정도 비어있다 (어떤 멤버와도 일치하지 않음).
    if (predicate.empty()) {
        return MemberPredicate{};
    }
    return MemberPredicate(
        [predicate](const MemberInfo& m) { return !predicate(m); },
        std::format("!({})", predicate.description())
    );
}

MemberPredicate member_named(std::string name) {
    auto description = std::format("member.name == \"{}\"", name);
    return MemberPredicate(
        [name = std::move(name)](const MemberInfo& m) { return m.name == name; },
        std::move(description)
    );
}

MemberPredicate member_path(std::string path) {
    auto description = std::format("member.path == \"{}\"", path);
    return MemberPredicate(
        [path = std::move(path)](const MemberInfo& m) { return m.path == path; },
        std::move(description)
    );
}

// prefix 자신, 또는 prefix 뒤가 '.'(하위 멤버) / '['(컬렉션 원소) 인 경로만 일치.
// "root.Audit" 는 형제 "root.AuditTrail" 과 일치하지 않는다.
MemberPredicate member_path_starts_with(std::string prefix) {
    auto description = std::format("member.path starts with \"{}\"", prefix);
    return MemberPredicate(
        [prefix = std::move(prefix)](const MemberInfo& m) {
            if (!m.path.starts_with(prefix)) {
                return false;
            }
            if (m.path.size() == prefix.size()) {
                return true;
            }
            const char next = m.path[prefix.size()];
            return next == '.' || next == '[';
        },
        std::move(description)
    );
}

MemberPredicate member_type_is(std::type_index type, std::string type_name) {
    return MemberPredicate(
        [type](const MemberInfo& m) { return m.runtime_type.is_same_or_inherits(type); },
        std::format("member.runtime_type is {}", type_name)
    );
}
