/**
 * @file example_strategies.cc
 * @brief Strategy, chain and probability example
 *
 * Demonstrates:
 * - Historical volatility with fallback
 * - A theoretical chain over the listed strike ladder
 * - Straddle and iron condor summaries with payoff profiles
 */

#include "src/simple/simple.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace kumquat;

namespace {

std::string bound_str(const PayoffBound& bound) {
    if (bound.is_unlimited()) {
        return "unlimited";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << bound.value();
    return oss.str();
}

void print_strategy(const Strategy& s) {
    std::cout << "\n" << s.name << "\n" << std::string(50, '-') << "\n";
    std::cout << std::fixed << std::setprecision(2)
              << "Net premium: " << s.net_premium << " (" << s.premium_flow << ")\n"
              << "Breakevens:  " << s.breakevens[0] << " / " << s.breakevens[1] << "\n"
              << "Max profit:  " << bound_str(s.max_profit) << "\n"
              << "Max loss:    " << bound_str(s.max_loss) << "\n"
              << std::setprecision(3)
              << "P(profit):   " << s.probability_of_profit << "\n"
              << "Delta " << s.greeks.delta << "  Theta " << s.greeks.theta
              << "  Vega " << s.greeks.vega << "\n";

    auto profile = payoff_profile(s, 100.0, 0.10, 0.02);
    if (profile) {
        for (size_t i = 0; i < profile->prices.size(); ++i) {
            std::cout << "  S_T=" << std::setw(7) << std::setprecision(2) << profile->prices[i]
                      << "  P&L=" << std::setw(7) << profile->pnl[i] << "\n";
        }
    }
}

}  // namespace

int main() {
    std::vector<double> closes{100.0, 101.2, 99.8, 102.5, 101.9, 103.1, 100.7,
                               99.4, 100.9, 102.2, 101.5, 100.3, 99.1, 100.0};
    auto vol = simple::estimate_volatility(closes);
    std::cout << "Estimated vol " << std::setprecision(4) << vol.sigma
              << (vol.low_confidence ? " (low confidence)" : "")
              << (vol.used_fallback ? " (fallback)" : "") << "\n";

    auto chain = simple::chain(100.0, closes, 30);
    if (!chain) {
        std::cerr << "Chain failed: " << chain.error() << "\n";
        return 1;
    }
    std::cout << "\n" << std::setw(8) << "Strike" << std::setw(10) << "Call"
              << std::setw(10) << "Put" << std::setw(10) << "Money%\n";
    for (const auto& row : chain->rows) {
        std::cout << std::fixed << std::setprecision(2)
                  << std::setw(8) << row.strike
                  << std::setw(10) << row.call.price
                  << std::setw(10) << row.put.price
                  << std::setw(10) << row.moneyness_pct << "\n";
    }

    auto straddle = simple::straddle(100.0, vol.sigma, 30);
    auto condor = simple::standard_iron_condor(100.0, vol.sigma, 30);
    if (!straddle || !condor) {
        std::cerr << "Strategy failed\n";
        return 1;
    }
    print_strategy(*straddle);
    print_strategy(*condor);
    return 0;
}
