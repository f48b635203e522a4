#ifndef DSC_DSC_HPP
#define DSC_DSC_HPP

// =============================================================================
// DSC - Over-Collateralized Debt Engine
//
// Components (leaf-first):
//   OracleAdapter      normalized USD prices from per-asset feeds
//   CollateralLedger   per-account, per-asset deposits
//   DebtLedger         per-account minted liability
//   RiskEngine         health factor and solvency invariant
//   LiquidationEngine  bonus-adjusted seizure of unhealthy positions
//   Custody            reentrancy guard and all external value movement
//   DSCEngine          public entry points
//
// =============================================================================

#include "types.hpp"
#include "log.hpp"
#include "token.hpp"
#include "oracle.hpp"
#include "registry.hpp"
#include "journal.hpp"
#include "ledger.hpp"
#include "risk.hpp"
#include "liquidation.hpp"
#include "custody.hpp"
#include "events.hpp"
#include "engine.hpp"
#include "config.hpp"

#endif // DSC_DSC_HPP
