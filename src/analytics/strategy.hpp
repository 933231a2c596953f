// SPDX-License-Identifier: MIT
/**
 * @file strategy.hpp
 * @brief Multi-leg option strategies priced with Black-Scholes
 *
 * Composers build immutable Strategy values from a spot, one flat
 * volatility and the leg strikes:
 * - straddle: long call + long put at one strike
 * - strangle: long put below, long call above
 * - iron_condor: short put spread + short call spread
 *
 * Payoff figures are per unit of the strategy, in the same currency as
 * the option prices (no contract multiplier).
 */

#pragma once

#include "src/option/greeks.hpp"
#include "src/option/option_spec.hpp"
#include "src/support/error_types.hpp"
#include <expected>
#include <iosfwd>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kumquat {

enum class LegAction {
    BUY,
    SELL
};

enum class PremiumFlow {
    DEBIT,   ///< Net premium paid
    CREDIT   ///< Net premium received
};

/// Profit or loss bound that is either a finite amount or unlimited
class PayoffBound {
public:
    static PayoffBound finite(double amount) { return PayoffBound(amount); }
    static PayoffBound unlimited() { return PayoffBound(std::nullopt); }

    bool is_unlimited() const { return !amount_.has_value(); }

    /// Finite amount, or +infinity when unlimited
    double value() const {
        return amount_.value_or(std::numeric_limits<double>::infinity());
    }

    bool operator==(const PayoffBound&) const = default;

private:
    explicit PayoffBound(std::optional<double> amount) : amount_(amount) {}

    std::optional<double> amount_;
};

/// One leg of a strategy before pricing
struct StrategyLeg {
    OptionType type = OptionType::CALL;
    double strike = 0.0;
    LegAction action = LegAction::BUY;
    int quantity = 1;

    /// +quantity for long legs, -quantity for short legs
    int signed_quantity() const {
        return action == LegAction::BUY ? quantity : -quantity;
    }
};

/// Leg with its theoretical price and per-unit Greeks
struct PricedLeg : StrategyLeg {
    double price = 0.0;
    Greeks greeks;
};

struct Strategy {
    std::string name;
    std::vector<PricedLeg> legs;
    double net_premium = 0.0;                       ///< Magnitude, always >= 0
    PremiumFlow premium_flow = PremiumFlow::DEBIT;
    std::vector<double> breakevens;                 ///< Ascending
    PayoffBound max_profit = PayoffBound::finite(0.0);
    PayoffBound max_loss = PayoffBound::finite(0.0);
    Greeks greeks;                                  ///< Position Greeks
    double probability_of_profit = 0.0;
    bool degenerate = false;                        ///< max_loss clamped at zero

    /// Premium paid (positive) or received (negative)
    double net_cost() const {
        return premium_flow == PremiumFlow::DEBIT ? net_premium : -net_premium;
    }
};

/// P&L at expiry over a range of underlying prices
struct PayoffProfile {
    std::vector<double> prices;
    std::vector<double> pnl;
};

/// Price every leg with one flat volatility
///
/// Errors: InvalidSpotPrice, InvalidVolatility, InvalidMaturity, InvalidRate,
/// InvalidStrike and InvalidQuantity (quantity < 1) with the leg index.
std::expected<std::vector<PricedLeg>, ValidationError> price_legs(
    std::span<const StrategyLeg> legs, double spot, double sigma,
    int days_to_expiry, const PricingConfig& config = {});

/// Long call + long put at the same strike
///
/// Breakevens K -/+ premium; max loss is the premium, max profit unlimited.
std::expected<Strategy, ValidationError> straddle(
    double spot, double strike, double sigma, int days_to_expiry,
    const PricingConfig& config = {});

/// Long put at put_strike + long call at call_strike
///
/// Requires put_strike <= call_strike (StrikeOrdering otherwise).
std::expected<Strategy, ValidationError> strangle(
    double spot, double put_strike, double call_strike, double sigma,
    int days_to_expiry, const PricingConfig& config = {});

/// Buy put, sell put, sell call, buy call
///
/// Requires put_buy < put_sell < call_sell < call_buy (StrikeOrdering
/// otherwise; strikes are never reordered). Max loss is the wider wing
/// minus the credit, clamped at zero with degenerate set.
std::expected<Strategy, ValidationError> iron_condor(
    double spot, double put_buy_strike, double put_sell_strike,
    double call_sell_strike, double call_buy_strike, double sigma,
    int days_to_expiry, const PricingConfig& config = {});

/// P&L per unit if the underlying settles at spot_at_expiry
double payoff_at_expiry(const Strategy& strategy, double spot_at_expiry);

/// Upper bound on payoff_profile steps on each side of spot
inline constexpr int kMaxPayoffSteps = 10'000;

/// P&L at expiry for spot * (1 + i * step_pct), |i * step_pct| <= range_pct
///
/// Errors: InvalidSpotPrice, InvalidGridSize (step_pct <= 0, range_pct < 0,
/// or more than kMaxPayoffSteps steps each side).
std::expected<PayoffProfile, ValidationError> payoff_profile(
    const Strategy& strategy, double spot,
    double range_pct = 0.30, double step_pct = 0.02);

std::ostream& operator<<(std::ostream& os, PremiumFlow flow);

}  // namespace kumquat
