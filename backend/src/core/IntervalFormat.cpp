#include "IntervalFormat.hpp"
#include <cmath>
#include <spdlog/fmt/fmt.h>

static constexpr double MINUTES_PER_DAY = 24.0 * 60.0;

double displayInterval(double days) {
    if (!std::isfinite(days) || days <= 0.0) return 0.0;
    if (days < 1.0) return std::round(days * MINUTES_PER_DAY) / MINUTES_PER_DAY;
    return std::round(days);
}

std::string formatInterval(double days) {
    double shown = displayInterval(days);
    if (shown <= 0.0) return "< 1 min";

    if (shown < 1.0) {
        long minutes = std::lround(shown * MINUTES_PER_DAY);
        if (minutes < 60) return fmt::format("{} min", minutes);
        return fmt::format("{} hr", std::lround(minutes / 60.0));
    }

    if (shown == 1.0) return "1 day";
    if (shown < 30.0) return fmt::format("{} days", static_cast<long>(shown));
    if (shown < 365.0) return fmt::format("{} mo", std::lround(shown / 30.0));
    return fmt::format("{:.1f} yr", shown / 365.0);
}
