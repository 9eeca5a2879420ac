// ---------------------------------------------------------------------------
// options_loader.cpp
//
// YAML 기본값 파일을 로드하여 DefaultsConfig 구조체로 파싱하고,
// EquivalencyOptions 로 변환한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 설정을 반환하지 않는다.
// - 필드 누락 시 기본값(구조체 기본값)을 적용한다.
// - 잘못된 열거 값은 실패가 아니라 경고 + 기본값이다.
//   (정책 변경이 없는 쪽이 안전하다: 기본값 == 하드코딩 정책)
//
// [알려진 한계]
// - strict_ordering_for / excluded_paths 는 정확한 경로 일치만 지원한다.
//   하위 경로 전체 지정은 코드에서 member_path_starts_with 를 사용할 것.
// ---------------------------------------------------------------------------

#include "config/options_loader.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "equivalency/member_predicate.hpp"

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 벡터를 읽는다.
// 노드가 없거나 sequence 가 아니면 빈 벡터를 반환한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}

[[nodiscard]] bool read_bool(const YAML::Node& node, bool fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        spdlog::warn("options_loader: '{}' is not a boolean, using default {}",
                     node.Scalar(), fallback);
        return fallback;
    }
}

[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 열거형 문자열 검증. 허용 목록에 없으면 경고 후 fallback.
// ---------------------------------------------------------------------------
template <std::size_t N>
[[nodiscard]] std::string read_choice(const YAML::Node&                       node,
                                      const char*                             key,
                                      const std::array<std::string_view, N>&  allowed,
                                      const std::string&                      fallback) {
    const std::string value = read_string(node, fallback);
    if (std::find(allowed.begin(), allowed.end(), value) == allowed.end()) {
        spdlog::warn("options_loader: unknown value '{}' for '{}', defaulting to '{}'",
                     value, key, fallback);
        return fallback;
    }
    return value;
}

[[nodiscard]] GlobalConfig parse_global(const YAML::Node& global_node) {
    GlobalConfig cfg{};
    if (!global_node || !global_node.IsMap()) {
        return cfg;
    }

    constexpr std::array<std::string_view, 4> kLevels{"debug", "info", "warn", "error"};
    cfg.log_level = read_choice(global_node["log_level"], "global.log_level", kLevels, cfg.log_level);
    cfg.log_path  = read_string(global_node["log_path"], cfg.log_path);
    return cfg;
}

[[nodiscard]] EquivalencyConfig parse_equivalency(const YAML::Node& node) {
    EquivalencyConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }

    constexpr std::array<std::string_view, 2> kCyclic{"throw", "ignore"};
    constexpr std::array<std::string_view, 2> kEnums{"by_value", "by_name"};
    constexpr std::array<std::string_view, 3> kProperties{"none", "declared", "runtime"};
    constexpr std::array<std::string_view, 2> kMissing{"throw", "ignore"};

    cfg.nested_objects     = read_bool(node["nested_objects"], cfg.nested_objects);
    cfg.infinite_recursion = read_bool(node["infinite_recursion"], cfg.infinite_recursion);
    cfg.cyclic_references  = read_choice(node["cyclic_references"], "equivalency.cyclic_references",
                                         kCyclic, cfg.cyclic_references);
    cfg.enums              = read_choice(node["enums"], "equivalency.enums", kEnums, cfg.enums);
    cfg.properties         = read_choice(node["properties"], "equivalency.properties",
                                         kProperties, cfg.properties);
    cfg.missing_members    = read_choice(node["missing_members"], "equivalency.missing_members",
                                         kMissing, cfg.missing_members);
    cfg.strict_ordering    = read_bool(node["strict_ordering"], cfg.strict_ordering);

    cfg.strict_ordering_for = read_string_sequence(node["strict_ordering_for"]);
    cfg.excluded_members    = read_string_sequence(node["excluded_members"]);
    cfg.excluded_paths      = read_string_sequence(node["excluded_paths"]);
    return cfg;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 파싱된 루트 노드 → DefaultsConfig
// source 는 오류 메시지용 (파일 경로 또는 "<string>")
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<DefaultsConfig, std::string>
parse_root(const YAML::Node& root, const std::string& source) {
    if (!root || !root.IsMap()) {
        const std::string err = std::format(
            "options_loader: '{}' is not a valid YAML map (top-level)", source);
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    DefaultsConfig cfg{};
    try {
        cfg.global      = parse_global(root["global"]);
        cfg.equivalency = parse_equivalency(root["equivalency"]);
    } catch (const YAML::Exception& e) {
        const std::string err = std::format(
            "options_loader: error parsing '{}': {}", source, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info(
        "options_loader: defaults loaded from '{}' (properties={}, excluded={}, strict_ordering_for={})",
        source,
        cfg.equivalency.properties,
        cfg.equivalency.excluded_members.size() + cfg.equivalency.excluded_paths.size(),
        cfg.equivalency.strict_ordering_for.size()
    );
    return cfg;
}

}  // namespace

// ---------------------------------------------------------------------------
// OptionsLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<DefaultsConfig, std::string>
OptionsLoader::load(const std::filesystem::path& config_path) {
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = std::format(
            "options_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("options_loader: loading defaults from '{}'", canonical_path.string());

    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = std::format(
            "options_loader: cannot open file '{}': {}", canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = std::format(
            "options_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(),
            e.mark.line + 1,   // yaml-cpp는 0-based
            e.mark.column + 1,
            e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = std::format(
            "options_loader: YAML error in '{}': {}", canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    return parse_root(root, canonical_path.string());
}

std::expected<DefaultsConfig, std::string>
OptionsLoader::load_string(std::string_view yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml_text));
    } catch (const YAML::ParserException& e) {
        const std::string err = std::format(
            "options_loader: YAML parse error in '<string>' at line {}, col {}: {}",
            e.mark.line + 1, e.mark.column + 1, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = std::format("options_loader: YAML error in '<string>': {}", e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    return parse_root(root, "<string>");
}

// ---------------------------------------------------------------------------
// OptionsLoader::apply 구현
// ---------------------------------------------------------------------------
EquivalencyOptions OptionsLoader::apply(const DefaultsConfig& config) {
    const auto& eq = config.equivalency;
    EquivalencyOptions options{};

    // 1. 선택 규칙 재생성. 반드시 제외 규칙보다 먼저
    if (eq.properties == "declared") {
        options.using_all_declared_properties();
    } else if (eq.properties == "runtime") {
        options.using_all_runtime_properties();
    }

    // 2. 제외 규칙
    for (const auto& name : eq.excluded_members) {
        options.exclude_member(member_named(name));
    }
    for (const auto& path : eq.excluded_paths) {
        options.exclude_member(member_path(path));
    }

    // 3. 일치 규칙
    if (eq.missing_members == "ignore") {
        options.allow_missing_members();
    }

    // 4. 순서 규칙
    if (eq.strict_ordering) {
        options.with_strict_ordering_for_all();
    }
    for (const auto& path : eq.strict_ordering_for) {
        options.with_strict_ordering_for(member_path(path));
    }

    // 5. 스칼라 스위치
    if (eq.nested_objects) {
        options.include_nested_objects();
    }
    if (eq.infinite_recursion) {
        options.allow_infinite_recursion();
    }
    if (eq.cyclic_references == "ignore") {
        options.ignore_cyclic_references();
    }
    if (eq.enums == "by_name") {
        options.comparing_enums_by_name();
    }

    return options;
}
