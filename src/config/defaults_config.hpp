#pragma once

// ---------------------------------------------------------------------------
// defaults_config.hpp
//
// YAML 기본값 파일의 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/equivalency.yaml 에서 로드된다.
//
// [설계 원칙]
// - 이 헤더는 다른 헤더에 의존하지 않는다 (독립적).
// - 모든 멤버는 하드코딩 기본 정책과 같은 기본값을 갖는다.
//   즉 빈 파일은 EquivalencyOptions{} 와 같은 정책을 만든다.
// ---------------------------------------------------------------------------

#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// GlobalConfig
//   log_level: "debug"|"info"|"warn"|"error"
// ---------------------------------------------------------------------------
struct GlobalConfig {
    std::string log_level{"info"};
    std::string log_path{"/tmp/equivpolicy.log"};
};

// ---------------------------------------------------------------------------
// EquivalencyConfig
//   properties       : "none" | "declared" | "runtime"
//   cyclic_references: "throw" | "ignore"
//   enums            : "by_value" | "by_name"
//   missing_members  : "throw" | "ignore"
// ---------------------------------------------------------------------------
struct EquivalencyConfig {
    bool                     nested_objects{false};
    bool                     infinite_recursion{false};
    std::string              cyclic_references{"throw"};
    std::string              enums{"by_value"};
    std::string              properties{"none"};
    std::string              missing_members{"throw"};
    bool                     strict_ordering{false};
    std::vector<std::string> strict_ordering_for{};   // 멤버 경로
    std::vector<std::string> excluded_members{};      // 멤버 이름
    std::vector<std::string> excluded_paths{};        // 멤버 경로
};

// ---------------------------------------------------------------------------
// DefaultsConfig
//   기본값 파일의 루트 구조체. OptionsLoader::load 가 파싱한다.
// ---------------------------------------------------------------------------
struct DefaultsConfig {
    GlobalConfig      global{};
    EquivalencyConfig equivalency{};
};
