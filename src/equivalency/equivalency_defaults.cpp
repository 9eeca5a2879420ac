// ---------------------------------------------------------------------------
// equivalency_defaults.cpp
// ---------------------------------------------------------------------------

#include "equivalency/equivalency_defaults.hpp"

#include <spdlog/spdlog.h>

namespace {

[[nodiscard]] std::shared_ptr<const EquivalencyPolicy> hard_coded_defaults() {
    return EquivalencyOptions{}.snapshot();
}

}  // namespace

EquivalencyDefaults::EquivalencyDefaults()
    : defaults_(hard_coded_defaults())
{}

EquivalencyDefaults::EquivalencyDefaults(std::shared_ptr<const EquivalencyPolicy> defaults)
    : defaults_(defaults ? std::move(defaults) : hard_coded_defaults())
{}

std::shared_ptr<const EquivalencyPolicy> EquivalencyDefaults::current() const {
    return defaults_.load();
}

EquivalencyOptions EquivalencyDefaults::make_options() const {
    const auto defaults = defaults_.load();
    return EquivalencyOptions{*defaults};
}

void EquivalencyDefaults::configure(const Configurator& configurator) {
    if (!configurator) {
        return;
    }

    auto expected = defaults_.load();
    for (;;) {
        EquivalencyOptions options{*expected};
        configurator(options);
        auto updated = options.snapshot();

        // 실패 시 expected 가 최신 값으로 갱신되므로 그 위에서 다시 적용한다.
        if (defaults_.compare_exchange_weak(expected, updated)) {
            break;
        }
    }

    spdlog::info("equivalency_defaults: defaults reconfigured");
}

void EquivalencyDefaults::reload(std::shared_ptr<const EquivalencyPolicy> defaults) {
    if (!defaults) {
        spdlog::warn("equivalency_defaults: reload with null policy, resetting to built-in defaults");
        defaults = hard_coded_defaults();
    }
    defaults_.store(std::move(defaults));
    spdlog::info("equivalency_defaults: defaults reloaded");
}
