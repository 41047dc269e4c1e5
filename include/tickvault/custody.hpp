#ifndef TICKVAULT_CUSTODY_HPP
#define TICKVAULT_CUSTODY_HPP

#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "types.hpp"

namespace tickvault {

// =============================================================================
// Settlement
//
// Custody movements produced by one transition. Applied all-or-nothing after
// the accounting succeeded.
// =============================================================================

enum class TransferKind : uint8_t {
    ASSET_IN,       // user -> protocol
    ASSET_OUT,      // protocol -> user
    USDN_MINT,      // new stable token to user
    USDN_LOCK,      // user -> protocol (held until burned or released)
    USDN_BURN,      // burn locked stable token
    USDN_RELEASE,   // locked stable token back to a user
    ETHER_IN,       // attached native value
    ETHER_OUT       // security deposit refunds, excess value
};

const char* to_string(TransferKind kind);

struct Transfer {
    TransferKind kind;
    Address account;
    I128 amount;
};

struct Settlement {
    std::vector<Transfer> transfers;

    void add(TransferKind kind, const Address& account, I128 amount) {
        if (amount != 0) transfers.push_back(Transfer{kind, account, amount});
    }

    bool empty() const { return transfers.empty(); }
};

// =============================================================================
// Custody Interface
// =============================================================================

class IAssetCustody {
public:
    virtual ~IAssetCustody() = default;

    // Throws ProtocolError(TRANSFER_FAILED / ETHER_REFUND_FAILED); nothing is
    // applied when it throws.
    virtual void settle(const Settlement& settlement) = 0;
};

// =============================================================================
// LedgerCustody - in-memory balances
// =============================================================================

class LedgerCustody : public IAssetCustody {
public:
    LedgerCustody() = default;

    // Non-copyable
    LedgerCustody(const LedgerCustody&) = delete;
    LedgerCustody& operator=(const LedgerCustody&) = delete;

    void settle(const Settlement& settlement) override;

    // Funding helpers
    void credit_asset(const Address& account, I128 amount);
    void credit_ether(const Address& account, I128 amount);
    void credit_usdn(const Address& account, I128 amount);

    // Addresses that refuse native value
    void set_rejects_ether(const Address& account, bool rejects);

    I128 asset_balance(const Address& account) const;
    I128 usdn_balance(const Address& account) const;
    I128 ether_balance(const Address& account) const;

    I128 protocol_asset() const;
    I128 protocol_usdn_locked() const;
    I128 protocol_ether() const;
    I128 usdn_total_supply() const;

private:
    struct Ledger {
        std::unordered_map<Address, I128, AddressHash> asset;
        std::unordered_map<Address, I128, AddressHash> usdn;
        std::unordered_map<Address, I128, AddressHash> ether;
        I128 protocol_asset = 0;
        I128 protocol_usdn_locked = 0;
        I128 protocol_ether = 0;
        I128 usdn_supply = 0;
    };

    static void apply(Ledger& ledger, const Transfer& transfer,
                      const std::unordered_set<Address, AddressHash>& rejects_ether);

    mutable std::shared_mutex mutex_;
    Ledger ledger_;
    std::unordered_set<Address, AddressHash> rejects_ether_;
};

} // namespace tickvault

#endif // TICKVAULT_CUSTODY_HPP
