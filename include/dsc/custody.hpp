#ifndef DSC_CUSTODY_HPP
#define DSC_CUSTODY_HPP

#include <string>

#include "types.hpp"
#include "journal.hpp"
#include "registry.hpp"
#include "token.hpp"

namespace dsc {

// =============================================================================
// ReentrancyGuard - Single-Entry Lock
// =============================================================================

class ReentrancyGuard {
public:
    ReentrancyGuard() = default;

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

    // Held for the lifetime of the scope. Entering while held throws
    // DSCError(REENTRANCY_BLOCKED) without waiting.
    class Scope {
    public:
        Scope(ReentrancyGuard& guard, const char* operation);
        ~Scope();

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        ReentrancyGuard& guard_;
    };

    bool entered() const { return entered_; }
    const char* holder() const { return holder_; }

private:
    bool entered_{false};
    const char* holder_{""};
};

// =============================================================================
// Custody - The Only Caller of External Value Movement
// =============================================================================

// Collaborator failures (false return or exception) surface as
// DSCError(TRANSFER_FAILED). A DSCError thrown from inside a collaborator,
// such as a blocked reentrant call, propagates unchanged.
//
// pull_collateral and burn_liability record a compensating call in the
// journal. push_collateral and mint_liability record nothing and must be the
// last interaction of an operation.
class Custody {
public:
    Custody(const Address& self, const AssetRegistry& registry, ILiabilityToken& liability);

    Custody(const Custody&) = delete;
    Custody& operator=(const Custody&) = delete;

    void pull_collateral(const Address& from, const Address& asset, I128 amount, Journal& journal);
    void push_collateral(const Address& to, const Address& asset, I128 amount);

    void burn_liability(const Address& from, I128 amount, Journal& journal);
    void mint_liability(const Address& to, I128 amount);

    const Address& self() const { return self_; }

private:
    template <typename Call>
    void invoke(const std::string& what, Call&& call);

    Address self_;
    const AssetRegistry& registry_;
    ILiabilityToken& liability_;
};

} // namespace dsc

#endif // DSC_CUSTODY_HPP
