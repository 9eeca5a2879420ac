#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// TypeRef
//   리플렉션 레이어가 넘겨주는 경량 런타임 타입 서술자.
//   lineage 는 자기 자신 → 기반 타입 순서로 저장한다.
//
//   [한계]
//   C++ 에는 런타임 상속 질의가 없으므로 기반 타입 목록은 호출자가
//   TypeRef::of<T, Bases...>() 로 명시해야 한다.
// ---------------------------------------------------------------------------
struct TypeRef {
    std::type_index              id{typeid(void)};
    std::string                  name{"void"};
    std::vector<std::type_index> lineage{};  // [0] == id

    template <typename T, typename... Bases>
    [[nodiscard]] static TypeRef of(std::string display_name = typeid(T).name()) {
        TypeRef ref{};
        ref.id      = std::type_index(typeid(T));
        ref.name    = std::move(display_name);
        ref.lineage = {std::type_index(typeid(T)), std::type_index(typeid(Bases))...};
        return ref;
    }

    [[nodiscard]] bool is_same_or_inherits(std::type_index other) const {
        if (id == other) {
            return true;
        }
        return std::find(lineage.begin(), lineage.end(), other) != lineage.end();
    }

    [[nodiscard]] bool is_byte_sequence() const {
        return id == std::type_index(typeid(std::vector<std::uint8_t>)) ||
               id == std::type_index(typeid(std::vector<std::byte>));
    }

    bool operator==(const TypeRef& other) const { return id == other.id; }
};

// ---------------------------------------------------------------------------
// MemberKind / MemberInfo
//   비교에 참여하는 멤버(필드/프로퍼티) 하나의 메타데이터.
//   규칙과 술어는 값이 아니라 이 메타데이터만 보고 판단한다.
//   path 는 비교 루트로부터의 접근 경로 (예: "root.Customer.Id").
// ---------------------------------------------------------------------------
enum class MemberKind : std::uint8_t {
    kProperty = 0,
    kField    = 1,
};

struct MemberInfo {
    std::string name{};
    std::string path{};
    TypeRef     declaring_type{};
    TypeRef     compile_time_type{};
    TypeRef     runtime_type{};
    MemberKind  kind{MemberKind::kProperty};
    bool        is_public{true};
};

// ---------------------------------------------------------------------------
// 전역 스위치 열거형
// ---------------------------------------------------------------------------
enum class CyclicReferenceHandling : std::uint8_t {
    kThrowException = 0,  // 기본값: 순환 참조 발견 시 비교 실패
    kIgnore         = 1,  // 재진입하지 않고 같은 것으로 간주
};

enum class EnumEquivalencyHandling : std::uint8_t {
    kByValue = 0,  // 기본값: 기저 정수값 비교
    kByName  = 1,
};

// 순서 규칙의 판정. kIrrelevant 는 "이 규칙은 해당 없음".
enum class OrderStrictness : std::uint8_t {
    kStrict     = 0,
    kNotStrict  = 1,
    kIrrelevant = 2,
};

// ---------------------------------------------------------------------------
// EnumValue
//   열거형 값 하나. 비교 모드에 따라 value 또는 name 이 사용된다.
// ---------------------------------------------------------------------------
struct EnumValue {
    std::int64_t value{0};
    std::string  name{};
};

// ---------------------------------------------------------------------------
// ComparisonErrorCode / ComparisonError
//   비교기(comparator) 실행 시점의 구분된 실패.
//   std::expected<T, ComparisonError> 패턴과 함께 사용한다.
//   설정(builder) 시점에는 절대 발생하지 않는다.
// ---------------------------------------------------------------------------
enum class ComparisonErrorCode : std::uint8_t {
    kCyclicReference = 0,
    kRecursionLimit  = 1,
    kMissingMember   = 2,
};

struct ComparisonError {
    ComparisonErrorCode code{ComparisonErrorCode::kMissingMember};
    std::string         message{};
    std::string         path{};
};

// 무한 재귀가 허용되지 않을 때 비교기가 강제하는 최대 깊이
inline constexpr std::size_t kMaxRecursionDepth = 10;
