// =============================================================================
// events.cpp - Event Formatting
// =============================================================================

#include "dsc/events.hpp"

namespace dsc {

const char* to_string(EventKind kind) {
    switch (kind) {
        case EventKind::COLLATERAL_DEPOSITED: return "CollateralDeposited";
        case EventKind::COLLATERAL_WITHDRAWN: return "CollateralWithdrawn";
        case EventKind::DEBT_MINTED: return "DebtMinted";
        case EventKind::DEBT_BURNED: return "DebtBurned";
        case EventKind::LIQUIDATION: return "Liquidation";
    }
    return "Unknown";
}

std::string describe(const Event& event) {
    std::string s = to_string(event.kind);
    s += " account=" + address::to_hex(event.account);

    switch (event.kind) {
        case EventKind::COLLATERAL_DEPOSITED:
            s += " asset=" + address::to_hex(event.asset);
            break;
        case EventKind::COLLATERAL_WITHDRAWN:
            s += " to=" + address::to_hex(event.counterparty);
            s += " asset=" + address::to_hex(event.asset);
            break;
        case EventKind::DEBT_MINTED:
            break;
        case EventKind::DEBT_BURNED:
            s += " payer=" + address::to_hex(event.counterparty);
            break;
        case EventKind::LIQUIDATION:
            s += " liquidator=" + address::to_hex(event.counterparty);
            s += " asset=" + address::to_hex(event.asset);
            s += " seized=" + x18::format(event.collateral_x18);
            break;
    }

    s += " amount=" + x18::format(event.amount_x18);
    return s;
}

} // namespace dsc
