#pragma once

// ---------------------------------------------------------------------------
// equivalency_defaults.hpp
//
// 프로세스 범위의 "기본 정책" 보관소.
// 사용 지점마다 make_options() 로 값 복제하여 잠금 없이 독립 구성한다.
//
// [싱글턴 금지]
// 전역 인스턴스를 두지 않는다. 호출자가 소유하고 필요한 곳에 주입한다.
//
// [Hot Reload]
// reload()/configure() 는 std::atomic<std::shared_ptr<...>> 교체로
// 진행 중인 읽기와 경쟁 없이 수행된다. 이미 스냅샷을 보유한 비교 실행은
// 이전 기본값으로 끝까지 진행한다 (shared_ptr 참조 카운트가 수명 보장).
// ---------------------------------------------------------------------------

#include <atomic>
#include <functional>
#include <memory>

#include "equivalency_options.hpp"
#include "equivalency_policy.hpp"

class EquivalencyDefaults {
public:
    using Configurator = std::function<void(EquivalencyOptions&)>;

    // 하드코딩 기본값으로 시작
    EquivalencyDefaults();

    // defaults 가 nullptr 이면 하드코딩 기본값으로 시작
    explicit EquivalencyDefaults(std::shared_ptr<const EquivalencyPolicy> defaults);

    ~EquivalencyDefaults() = default;

    // 복사/이동 금지 (atomic 은 복사 불가)
    EquivalencyDefaults(const EquivalencyDefaults&)            = delete;
    EquivalencyDefaults& operator=(const EquivalencyDefaults&) = delete;
    EquivalencyDefaults(EquivalencyDefaults&&)                 = delete;
    EquivalencyDefaults& operator=(EquivalencyDefaults&&)      = delete;

    // 현재 기본 정책 (항상 non-null)
    [[nodiscard]] std::shared_ptr<const EquivalencyPolicy> current() const;

    // 현재 기본 정책의 값 복제본. 반환값을 바꿔도 기본값은 그대로이다.
    [[nodiscard]] EquivalencyOptions make_options() const;

    // configure
    //   현재 기본값을 복제 → configurator 로 변경 → 동결 → 원자적 게시.
    //   동시에 configure 가 호출되어도 갱신이 유실되지 않도록 CAS 재시도한다.
    //   configurator 가 비어 있으면 아무 것도 하지 않는다.
    void configure(const Configurator& configurator);

    // reload
    //   원자적 교체. nullptr 이면 하드코딩 기본값으로 재설정.
    void reload(std::shared_ptr<const EquivalencyPolicy> defaults);

private:
    std::atomic<std::shared_ptr<const EquivalencyPolicy>> defaults_;
};
