#pragma once
#include <string>

namespace BscConstants {
  inline constexpr int CHAIN_ID = 56;
  inline constexpr double BLOCKS_PER_YEAR = 10512000.0;  // 3 s blocks

  // Exchanges
  inline const std::string PANCAKESWAP_FACTORY = "0xcA143Ce32Fe78f1f7019d7d551a6402fC5350c73";  // V2 factory
  inline const std::string PANCAKESWAP_MASTERCHEF = "0x73feaa1eE314F8c655E354234017bE2193C9E24E";
  inline const std::string BISWAP_MASTERCHEF = "0xDbc1A13490deeF9c3C12b44FE77b503c1B061739";

  // Lending and vaults
  inline const std::string VENUS_COMPTROLLER = "0xfD36E2c2a6789Db23113685031d7F16329158384";
  inline const std::string VENUS_VBNB = "0xA07c5b74C9B40447a954e1466938b865b6BBea36";
  inline const std::string ALPACA_FAIRLAUNCH = "0xA625AB01B08ce023B2a342Dbb12a16f2C8489A8F";

  // Tokens
  inline const std::string BUSD = "0xe9e7CEA3DedcA5984780Bafc599bD69ADd087D56";
  inline const std::string USDT = "0x55d398326f99059fF775485246999027B3197955";
  inline const std::string WBNB = "0xbb4CdB9CBd36B01bD1cBaEBF2De08d9173bc095c";  // Wrapped native
  inline const std::string CAKE = "0x0E09FaBB73Bd3Ade0a17ECC321fD13a19e81cE82";
  inline const std::string BSW = "0x965F527D9159dCe6288a2219DB51fc6Eef120dD1";
  inline const std::string ALPACA = "0x8F0528cE5eF7B51152A59745bEfDD91D97091d2F";

  // Data services
  inline const std::string PANCAKESWAP_SUBGRAPH = "https://api.thegraph.com/subgraphs/name/pancakeswap/exchange-v2";
  inline const std::string DEFILLAMA_API = "https://api.llama.fi";
}
