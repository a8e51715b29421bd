#include "yield/yield_calculator.hpp"
#include <cmath>

namespace {
double FiniteOrZero(long double v) {
  if (!std::isfinite(static_cast<double>(v)) || v < 0.0L) return 0.0;
  return static_cast<double>(v);
}
}

namespace Yield {
  double ComputeRate(double emission_per_block,
                     double blocks_per_year,
                     double allocation_weight,
                     double total_allocation_weight,
                     double reward_price_usd,
                     double pool_tvl_usd) {
    if (total_allocation_weight <= 0.0 || pool_tvl_usd <= 0.0) return 0.0;
    if (emission_per_block < 0.0 || blocks_per_year < 0.0 || allocation_weight < 0.0 || reward_price_usd < 0.0) {
      return 0.0;
    }
    const long double share = static_cast<long double>(allocation_weight) / total_allocation_weight;
    const long double annual = static_cast<long double>(emission_per_block) * blocks_per_year * share * reward_price_usd;
    return FiniteOrZero(100.0L * annual / pool_tvl_usd);
  }

  double CompoundedApy(double rate_per_block, double blocks_per_year) {
    if (rate_per_block <= 0.0 || blocks_per_year <= 0.0) return 0.0;
    const long double n = blocks_per_year;
    return FiniteOrZero(100.0L * std::expm1(n * std::log1p(static_cast<long double>(rate_per_block))));
  }

  double SimpleApr(double rate_per_block, double blocks_per_year) {
    if (rate_per_block <= 0.0 || blocks_per_year <= 0.0) return 0.0;
    return FiniteOrZero(100.0L * rate_per_block * blocks_per_year);
  }

  double VaultLendingApr(double total_deposited, double total_debt, double max_lending_rate) {
    if (total_deposited <= 0.0 || max_lending_rate <= 0.0) return 0.0;
    const long double idle = static_cast<long double>(total_deposited) - (total_debt > 0.0 ? total_debt : 0.0);
    return FiniteOrZero(100.0L * idle / total_deposited * max_lending_rate);
  }

  double Utilization(double total_borrows, double total_supply) {
    if (total_supply <= 0.0 || total_borrows <= 0.0) return 0.0;
    return FiniteOrZero(100.0L * total_borrows / total_supply);
  }
}
