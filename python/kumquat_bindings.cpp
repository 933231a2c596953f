/**
 * @file kumquat_bindings.cpp
 * @brief Python bindings for the kumquat analytics library using pybind11
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "src/analytics/iv_surface.hpp"
#include "src/analytics/option_chain.hpp"
#include "src/analytics/probability.hpp"
#include "src/analytics/strategy.hpp"
#include "src/analytics/strike_ladder.hpp"
#include "src/analytics/volatility_estimator.hpp"
#include "src/option/european_option.hpp"
#include "src/option/iv_solver.hpp"
#include "src/simple/analytics.hpp"
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;

// Unwrap an expected result, raising ValueError with the streamed error
template <typename T, typename E>
T unwrap(std::expected<T, E>&& result) {
    if (!result.has_value()) {
        std::ostringstream oss;
        oss << result.error();
        throw py::value_error(oss.str());
    }
    return std::move(result.value());
}

PYBIND11_MODULE(kumquat_py, m) {
    m.doc() = "Python bindings for kumquat Black-Scholes pricing and strategy analytics";

    py::enum_<kumquat::OptionType>(m, "OptionType")
        .value("CALL", kumquat::OptionType::CALL)
        .value("PUT", kumquat::OptionType::PUT);

    py::enum_<kumquat::LegAction>(m, "LegAction")
        .value("BUY", kumquat::LegAction::BUY)
        .value("SELL", kumquat::LegAction::SELL);

    py::enum_<kumquat::PremiumFlow>(m, "PremiumFlow")
        .value("DEBIT", kumquat::PremiumFlow::DEBIT)
        .value("CREDIT", kumquat::PremiumFlow::CREDIT);

    py::class_<kumquat::PricingConfig>(m, "PricingConfig")
        .def(py::init<>())
        .def_readwrite("risk_free_rate", &kumquat::PricingConfig::risk_free_rate)
        .def_readwrite("days_per_year", &kumquat::PricingConfig::days_per_year)
        .def_readwrite("bid_ask_spread", &kumquat::PricingConfig::bid_ask_spread);

    py::class_<kumquat::SurfaceConfig, kumquat::PricingConfig>(m, "SurfaceConfig")
        .def(py::init<>())
        .def_readwrite("option_type", &kumquat::SurfaceConfig::option_type);

    py::class_<kumquat::VolatilityConfig>(m, "VolatilityConfig")
        .def(py::init<>())
        .def_readwrite("trading_days_per_year", &kumquat::VolatilityConfig::trading_days_per_year)
        .def_readwrite("subtract_mean", &kumquat::VolatilityConfig::subtract_mean);

    py::class_<kumquat::OptionSpec>(m, "OptionSpec")
        .def(py::init<>())
        .def_readwrite("type", &kumquat::OptionSpec::type)
        .def_readwrite("spot", &kumquat::OptionSpec::spot)
        .def_readwrite("strike", &kumquat::OptionSpec::strike)
        .def_readwrite("days_to_expiry", &kumquat::OptionSpec::days_to_expiry)
        .def_readwrite("rate", &kumquat::OptionSpec::rate);

    py::class_<kumquat::OptionQuote, kumquat::OptionSpec>(m, "OptionQuote")
        .def(py::init<>())
        .def(py::init<kumquat::OptionType, double, double, int, double, double>(),
             py::arg("type"), py::arg("spot"), py::arg("strike"),
             py::arg("days_to_expiry"), py::arg("rate"), py::arg("volatility"))
        .def_readwrite("volatility", &kumquat::OptionQuote::volatility)
        .def("__repr__", [](const kumquat::OptionQuote& q) {
            return "<OptionQuote " + std::string(q.type == kumquat::OptionType::CALL ? "CALL" : "PUT") +
                   " spot=" + std::to_string(q.spot) +
                   " strike=" + std::to_string(q.strike) +
                   " days=" + std::to_string(q.days_to_expiry) +
                   " rate=" + std::to_string(q.rate) +
                   " vol=" + std::to_string(q.volatility) + ">";
        });

    py::class_<kumquat::IVQuery, kumquat::OptionSpec>(m, "IVQuery")
        .def(py::init<>())
        .def(py::init<kumquat::OptionType, double, double, int, double, double>(),
             py::arg("type"), py::arg("spot"), py::arg("strike"),
             py::arg("days_to_expiry"), py::arg("rate"), py::arg("market_price"))
        .def_readwrite("market_price", &kumquat::IVQuery::market_price);

    py::class_<kumquat::Greeks>(m, "Greeks")
        .def(py::init<>())
        .def_readwrite("delta", &kumquat::Greeks::delta)
        .def_readwrite("gamma", &kumquat::Greeks::gamma)
        .def_readwrite("theta", &kumquat::Greeks::theta)
        .def_readwrite("vega", &kumquat::Greeks::vega)
        .def_readwrite("rho", &kumquat::Greeks::rho)
        .def("__repr__", [](const kumquat::Greeks& g) {
            return "<Greeks delta=" + std::to_string(g.delta) +
                   " gamma=" + std::to_string(g.gamma) +
                   " theta=" + std::to_string(g.theta) +
                   " vega=" + std::to_string(g.vega) +
                   " rho=" + std::to_string(g.rho) + ">";
        });

    // IVSuccess structure
    py::class_<kumquat::IVSuccess>(m, "IVSuccess")
        .def_readonly("implied_vol", &kumquat::IVSuccess::implied_vol)
        .def_readonly("iterations", &kumquat::IVSuccess::iterations)
        .def_readonly("final_error", &kumquat::IVSuccess::final_error)
        .def_readonly("vega", &kumquat::IVSuccess::vega);

    py::class_<kumquat::PriceRange>(m, "PriceRange")
        .def_readonly("low", &kumquat::PriceRange::low)
        .def_readonly("high", &kumquat::PriceRange::high);

    py::class_<kumquat::ProbabilityResult>(m, "ProbabilityResult")
        .def_readonly("prob_itm_call", &kumquat::ProbabilityResult::prob_itm_call)
        .def_readonly("prob_itm_put", &kumquat::ProbabilityResult::prob_itm_put)
        .def_readonly("prob_touch", &kumquat::ProbabilityResult::prob_touch)
        .def_readonly("expected_move", &kumquat::ProbabilityResult::expected_move)
        .def_readonly("expected_move_pct", &kumquat::ProbabilityResult::expected_move_pct)
        .def_readonly("one_std_dev_range", &kumquat::ProbabilityResult::one_std_dev_range);

    py::class_<kumquat::ChainLeg>(m, "ChainLeg")
        .def_readonly("quote", &kumquat::ChainLeg::quote)
        .def_readonly("price", &kumquat::ChainLeg::price)
        .def_readonly("bid", &kumquat::ChainLeg::bid)
        .def_readonly("ask", &kumquat::ChainLeg::ask)
        .def_readonly("greeks", &kumquat::ChainLeg::greeks);

    py::class_<kumquat::ChainRow>(m, "ChainRow")
        .def_readonly("strike", &kumquat::ChainRow::strike)
        .def_readonly("call", &kumquat::ChainRow::call)
        .def_readonly("put", &kumquat::ChainRow::put)
        .def_readonly("moneyness_pct", &kumquat::ChainRow::moneyness_pct)
        .def_readonly("itm", &kumquat::ChainRow::itm);

    py::class_<kumquat::OptionChain>(m, "OptionChain")
        .def_readonly("spot", &kumquat::OptionChain::spot)
        .def_readonly("volatility", &kumquat::OptionChain::volatility)
        .def_readonly("days_to_expiry", &kumquat::OptionChain::days_to_expiry)
        .def_readonly("rows", &kumquat::OptionChain::rows)
        .def("__len__", &kumquat::OptionChain::size);

    py::class_<kumquat::PayoffBound>(m, "PayoffBound")
        .def("is_unlimited", &kumquat::PayoffBound::is_unlimited)
        .def("value", &kumquat::PayoffBound::value)
        .def("__repr__", [](const kumquat::PayoffBound& b) {
            return b.is_unlimited() ? std::string("<PayoffBound unlimited>")
                                    : "<PayoffBound " + std::to_string(b.value()) + ">";
        });

    py::class_<kumquat::StrategyLeg>(m, "StrategyLeg")
        .def(py::init<>())
        .def_readwrite("type", &kumquat::StrategyLeg::type)
        .def_readwrite("strike", &kumquat::StrategyLeg::strike)
        .def_readwrite("action", &kumquat::StrategyLeg::action)
        .def_readwrite("quantity", &kumquat::StrategyLeg::quantity);

    py::class_<kumquat::PricedLeg, kumquat::StrategyLeg>(m, "PricedLeg")
        .def_readonly("price", &kumquat::PricedLeg::price)
        .def_readonly("greeks", &kumquat::PricedLeg::greeks);

    py::class_<kumquat::Strategy>(m, "Strategy")
        .def_readonly("name", &kumquat::Strategy::name)
        .def_readonly("legs", &kumquat::Strategy::legs)
        .def_readonly("net_premium", &kumquat::Strategy::net_premium)
        .def_readonly("premium_flow", &kumquat::Strategy::premium_flow)
        .def_readonly("breakevens", &kumquat::Strategy::breakevens)
        .def_readonly("max_profit", &kumquat::Strategy::max_profit)
        .def_readonly("max_loss", &kumquat::Strategy::max_loss)
        .def_readonly("greeks", &kumquat::Strategy::greeks)
        .def_readonly("probability_of_profit", &kumquat::Strategy::probability_of_profit)
        .def_readonly("degenerate", &kumquat::Strategy::degenerate);

    py::class_<kumquat::PayoffProfile>(m, "PayoffProfile")
        .def_readonly("prices", &kumquat::PayoffProfile::prices)
        .def_readonly("pnl", &kumquat::PayoffProfile::pnl);

    py::class_<kumquat::IVSurfacePoint>(m, "IVSurfacePoint")
        .def_readonly("expiry_days", &kumquat::IVSurfacePoint::expiry_days)
        .def_readonly("strike", &kumquat::IVSurfacePoint::strike)
        .def_readonly("theoretical_price", &kumquat::IVSurfacePoint::theoretical_price)
        .def_readonly("implied_vol", &kumquat::IVSurfacePoint::implied_vol);

    py::class_<kumquat::IVSurface>(m, "IVSurface")
        .def_readonly("spot", &kumquat::IVSurface::spot)
        .def_readonly("expiries", &kumquat::IVSurface::expiries)
        .def_readonly("strikes", &kumquat::IVSurface::strikes)
        .def_readonly("points", &kumquat::IVSurface::points)
        .def("at", &kumquat::IVSurface::at, py::arg("expiry_index"), py::arg("strike_index"),
             py::return_value_policy::copy);

    py::class_<kumquat::simple::VolatilityEstimate>(m, "VolatilityEstimate")
        .def_readonly("sigma", &kumquat::simple::VolatilityEstimate::sigma)
        .def_readonly("observations", &kumquat::simple::VolatilityEstimate::observations)
        .def_readonly("low_confidence", &kumquat::simple::VolatilityEstimate::low_confidence)
        .def_readonly("used_fallback", &kumquat::simple::VolatilityEstimate::used_fallback);

    // Pricing
    m.def("price", [](const kumquat::OptionQuote& quote, const kumquat::PricingConfig& config) {
            return unwrap(kumquat::european_price(quote, config));
        }, py::arg("quote"), py::arg("config") = kumquat::PricingConfig{},
        "Black-Scholes price; raises ValueError on invalid input");

    m.def("greeks", [](const kumquat::OptionQuote& quote, const kumquat::PricingConfig& config) {
            return unwrap(kumquat::european_greeks(quote, config));
        }, py::arg("quote"), py::arg("config") = kumquat::PricingConfig{},
        "Greeks in desk units (theta per day, vega and rho per point)");

    m.def("implied_vol", [](const kumquat::IVQuery& query) {
            return unwrap(kumquat::solve_implied_vol(query));
        }, py::arg("query"));

    // Analytics
    m.def("annualized_volatility",
        [](const std::vector<double>& prices, const kumquat::VolatilityConfig& config) {
            return unwrap(kumquat::annualized_volatility(prices, config));
        }, py::arg("prices"), py::arg("config") = kumquat::VolatilityConfig{});

    m.def("estimate_volatility", [](const std::vector<double>& closes) {
            return kumquat::simple::estimate_volatility(closes);
        }, py::arg("closes"), "Historical volatility with a 30% fallback");

    m.def("probabilities",
        [](double spot, double strike, double sigma, int days) {
            return unwrap(kumquat::probabilities(spot, strike, sigma, days));
        }, py::arg("spot"), py::arg("strike"), py::arg("sigma"), py::arg("days_to_expiry"));

    m.def("strike_ladder", &kumquat::strike_ladder,
          py::arg("spot"), py::arg("steps_each_side") = 10);

    m.def("generate_chain",
        [](double spot, double sigma, const std::vector<double>& strikes, int days,
           const kumquat::PricingConfig& config) {
            return unwrap(kumquat::generate_chain(spot, sigma, strikes, days, config));
        }, py::arg("spot"), py::arg("sigma"), py::arg("strikes"), py::arg("days_to_expiry"),
        py::arg("config") = kumquat::PricingConfig{});

    m.def("straddle",
        [](double spot, double strike, double sigma, int days, const kumquat::PricingConfig& config) {
            return unwrap(kumquat::straddle(spot, strike, sigma, days, config));
        }, py::arg("spot"), py::arg("strike"), py::arg("sigma"), py::arg("days_to_expiry"),
        py::arg("config") = kumquat::PricingConfig{});

    m.def("strangle",
        [](double spot, double put_strike, double call_strike, double sigma, int days,
           const kumquat::PricingConfig& config) {
            return unwrap(kumquat::strangle(spot, put_strike, call_strike, sigma, days, config));
        }, py::arg("spot"), py::arg("put_strike"), py::arg("call_strike"), py::arg("sigma"),
        py::arg("days_to_expiry"), py::arg("config") = kumquat::PricingConfig{});

    m.def("iron_condor",
        [](double spot, double put_buy, double put_sell, double call_sell, double call_buy,
           double sigma, int days, const kumquat::PricingConfig& config) {
            return unwrap(kumquat::iron_condor(spot, put_buy, put_sell, call_sell, call_buy,
                                               sigma, days, config));
        }, py::arg("spot"), py::arg("put_buy_strike"), py::arg("put_sell_strike"),
        py::arg("call_sell_strike"), py::arg("call_buy_strike"), py::arg("sigma"),
        py::arg("days_to_expiry"), py::arg("config") = kumquat::PricingConfig{});

    m.def("payoff_profile",
        [](const kumquat::Strategy& strategy, double spot, double range_pct, double step_pct) {
            return unwrap(kumquat::payoff_profile(strategy, spot, range_pct, step_pct));
        }, py::arg("strategy"), py::arg("spot"), py::arg("range_pct") = 0.30,
        py::arg("step_pct") = 0.02);

    m.def("generate_surface",
        [](double spot, double sigma, const std::vector<int>& expiries, size_t strike_count,
           const kumquat::SurfaceConfig& config) {
            return unwrap(kumquat::generate_surface(spot, sigma, expiries, strike_count, config));
        }, py::arg("spot"), py::arg("sigma"), py::arg("expiries_days"),
        py::arg("strike_count") = 11, py::arg("config") = kumquat::SurfaceConfig{});
}
