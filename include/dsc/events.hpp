#ifndef DSC_EVENTS_HPP
#define DSC_EVENTS_HPP

#include <functional>
#include <string>

#include "types.hpp"

namespace dsc {

// =============================================================================
// Engine Events
// =============================================================================

enum class EventKind : uint8_t {
    COLLATERAL_DEPOSITED = 0,
    COLLATERAL_WITHDRAWN = 1,
    DEBT_MINTED = 2,
    DEBT_BURNED = 3,
    LIQUIDATION = 4
};

// Field use per kind:
//   COLLATERAL_DEPOSITED  account=depositor, asset, amount
//   COLLATERAL_WITHDRAWN  account=owner, counterparty=recipient, asset, amount
//   DEBT_MINTED           account, amount
//   DEBT_BURNED           account=debtor, counterparty=payer, amount
//   LIQUIDATION           account=target, counterparty=liquidator, asset,
//                         amount=debt covered, collateral=seized incl. bonus
struct Event {
    EventKind kind;
    Address account;
    Address asset;
    I128 amount_x18;
    Address counterparty;
    I128 collateral_x18;
};

using EventListener = std::function<void(const Event&)>;

const char* to_string(EventKind kind);

std::string describe(const Event& event);

} // namespace dsc

#endif // DSC_EVENTS_HPP
