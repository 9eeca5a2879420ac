#pragma once

// ---------------------------------------------------------------------------
// options_loader.hpp
//
// YAML 기본값 파일을 DefaultsConfig 로 파싱하고, 이를 EquivalencyOptions 로
// 변환하는 로더.
//
// [설계 원칙]
// - All-or-nothing: 파일 없음, YAML 문법 오류, 최상위가 map 이 아님 →
//   std::unexpected(error_message). 부분 설정을 반환하지 않는다.
// - 키 누락 시 구조체 기본값 적용.
// - 알 수 없는 열거 값("by_nmae" 등)은 경고 로그 후 기본값으로 대체한다.
// - YAML 파일 전체를 로그에 출력하지 않는다.
//
// [순환 의존성]
// options_loader.hpp → defaults_config.hpp, equivalency_options.hpp (단방향)
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "defaults_config.hpp"
#include "equivalency/equivalency_options.hpp"

class OptionsLoader {
public:
    OptionsLoader()  = default;
    ~OptionsLoader() = default;

    OptionsLoader(const OptionsLoader&)            = default;
    OptionsLoader& operator=(const OptionsLoader&) = default;
    OptionsLoader(OptionsLoader&&)                 = default;
    OptionsLoader& operator=(OptionsLoader&&)      = default;

    // load
    //   지정된 경로의 YAML 파일을 읽어 DefaultsConfig 로 파싱한다.
    [[nodiscard]] static std::expected<DefaultsConfig, std::string>
    load(const std::filesystem::path& config_path);

    // load_string
    //   YAML 텍스트를 직접 파싱한다. 오류 규칙은 load() 와 같다.
    [[nodiscard]] static std::expected<DefaultsConfig, std::string>
    load_string(std::string_view yaml_text);

    // apply
    //   DefaultsConfig → EquivalencyOptions.
    //
    //   [적용 순서 (재생성 때문에 중요)]
    //   1. properties (선택 규칙 재생성)
    //   2. excluded_members / excluded_paths (재생성 이후 꼬리에 추가)
    //   3. missing_members (일치 규칙 교체)
    //   4. strict_ordering / strict_ordering_for
    //   5. 스칼라 스위치
    [[nodiscard]] static EquivalencyOptions apply(const DefaultsConfig& config);
};
