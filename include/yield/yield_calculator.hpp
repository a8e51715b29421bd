#pragma once

// Annualized rates in percent. Every function returns 0 rather than a negative or
// non-finite rate when its inputs are degenerate.
namespace Yield {
  inline constexpr double kDefaultBlocksPerYear = 10512000.0;  // 3 s blocks
  inline constexpr double kDefaultMaxLendingRate = 0.15;

  // 100 * emission * blocks * (alloc / total_alloc) * reward_price / tvl.
  // 0 when total_alloc or tvl is 0, or when any input is negative.
  double ComputeRate(double emission_per_block,
                     double blocks_per_year,
                     double allocation_weight,
                     double total_allocation_weight,
                     double reward_price_usd,
                     double pool_tvl_usd);

  // MasterChef-style farm reward APR.
  inline double FarmApr(double reward_per_block, double blocks_per_year, double alloc_point,
                        double total_alloc_point, double reward_price_usd, double pool_tvl_usd) {
    return ComputeRate(reward_per_block, blocks_per_year, alloc_point, total_alloc_point, reward_price_usd, pool_tvl_usd);
  }

  // FairLaunch-style vault staking reward APR.
  inline double VaultRewardApr(double reward_per_block, double blocks_per_year, double alloc_point,
                               double total_alloc_point, double reward_price_usd, double staked_tvl_usd) {
    return ComputeRate(reward_per_block, blocks_per_year, alloc_point, total_alloc_point, reward_price_usd, staked_tvl_usd);
  }

  // 100 * ((1 + r)^n - 1), evaluated as expm1(n * log1p(r)) so tiny per-block rates keep precision.
  double CompoundedApy(double rate_per_block, double blocks_per_year = kDefaultBlocksPerYear);

  double SimpleApr(double rate_per_block, double blocks_per_year = kDefaultBlocksPerYear);

  // Lending side of a vault: 100 * (deposited - debt) / deposited * max_lending_rate, never below 0.
  double VaultLendingApr(double total_deposited, double total_debt,
                         double max_lending_rate = kDefaultMaxLendingRate);

  // Percent of supplied funds currently borrowed.
  double Utilization(double total_borrows, double total_supply);
}
