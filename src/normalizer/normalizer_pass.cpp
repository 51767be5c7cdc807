#include "normalizer/normalizer_pass.hpp"

namespace exprc::normalizer {

auto tier_name(PrecedenceTier tier) -> const char* {
    switch (tier) {
    case PrecedenceTier::High:
        return "High";
    case PrecedenceTier::Medium:
        return "Medium";
    case PrecedenceTier::Low:
        return "Low";
    }
    return "Unknown";
}

auto runs_before(const NormalizerPass& a, const NormalizerPass& b) -> bool {
    if (a.tier() != b.tier()) {
        return a.tier() < b.tier();
    }
    if (a.binding_power() != b.binding_power()) {
        return a.binding_power() > b.binding_power();
    }
    return a.name() < b.name();
}

} // namespace exprc::normalizer
