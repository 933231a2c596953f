/**
 * @file example_greeks_calculation.cc
 * @brief Greeks calculation example for European options
 *
 * Demonstrates:
 * - Validated pricing through EuropeanOptionSolver
 * - Greeks in desk units (theta per day, vega and rho per point)
 * - Greeks behaviour across moneyness
 * - Inverting a price back to implied volatility
 */

#include "src/option/european_option.hpp"
#include "src/option/iv_solver.hpp"
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace kumquat;

void print_greeks_profile(const std::string& title, OptionType type,
                          const std::vector<double>& spots, double strike,
                          int days, double volatility, double rate) {
    std::cout << "\n" << title << "\n";
    std::cout << std::string(82, '=') << "\n";
    std::cout << std::setw(10) << "Spot"
              << std::setw(12) << "Price"
              << std::setw(12) << "Delta"
              << std::setw(12) << "Gamma"
              << std::setw(12) << "Theta"
              << std::setw(12) << "Vega"
              << std::setw(12) << "Rho\n";
    std::cout << std::string(82, '-') << "\n";

    for (double spot : spots) {
        auto solver = EuropeanOptionSolver::create(
            OptionQuote(type, spot, strike, days, rate, volatility));
        if (!solver) {
            std::cout << std::setw(10) << spot << "  invalid: " << solver.error() << "\n";
            continue;
        }
        EuropeanOptionResult result = solver->solve();
        Greeks g = result.greeks();

        std::cout << std::fixed << std::setprecision(2)
                  << std::setw(10) << spot
                  << std::setprecision(4)
                  << std::setw(12) << result.value()
                  << std::setw(12) << g.delta
                  << std::setprecision(6)
                  << std::setw(12) << g.gamma
                  << std::setprecision(4)
                  << std::setw(12) << g.theta
                  << std::setw(12) << g.vega
                  << std::setw(12) << g.rho << "\n";
    }
    std::cout << std::string(82, '=') << "\n";
}

int main() {
    std::cout << "=== Greeks Calculation Example ===\n\n";

    const double strike = 100.0;
    const int days = 90;
    const double volatility = 0.30;
    const double rate = 0.05;

    std::cout << "Strike: " << strike << ", days: " << days
              << ", vol: " << volatility << ", rate: " << rate << "\n";

    std::vector<double> spots{80.0, 90.0, 95.0, 100.0, 105.0, 110.0, 120.0};
    print_greeks_profile("Call", OptionType::CALL, spots, strike, days, volatility, rate);
    print_greeks_profile("Put", OptionType::PUT, spots, strike, days, volatility, rate);

    // Round trip: price -> implied vol
    auto price = european_price(OptionQuote(OptionType::CALL, 100.0, strike, days, rate, volatility));
    if (!price) {
        std::cerr << "Pricing failed: " << price.error() << "\n";
        return 1;
    }
    auto iv = solve_implied_vol(IVQuery(OptionType::CALL, 100.0, strike, days, rate, *price));
    if (!iv) {
        std::cerr << "IV solve failed: " << iv.error() << "\n";
        return 1;
    }
    std::cout << "\nATM call price " << std::setprecision(4) << *price
              << " implies vol " << iv->implied_vol
              << " (" << iv->iterations << " iterations)\n";
    return 0;
}
