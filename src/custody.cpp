// =============================================================================
// custody.cpp - In-memory asset ledger
// =============================================================================

#include "tickvault/custody.hpp"
#include "tickvault/errors.hpp"

#include <mutex>

namespace tickvault {

const char* to_string(TransferKind kind) {
    switch (kind) {
        case TransferKind::ASSET_IN: return "ASSET_IN";
        case TransferKind::ASSET_OUT: return "ASSET_OUT";
        case TransferKind::USDN_MINT: return "USDN_MINT";
        case TransferKind::USDN_LOCK: return "USDN_LOCK";
        case TransferKind::USDN_BURN: return "USDN_BURN";
        case TransferKind::USDN_RELEASE: return "USDN_RELEASE";
        case TransferKind::ETHER_IN: return "ETHER_IN";
        case TransferKind::ETHER_OUT: return "ETHER_OUT";
    }
    return "UNKNOWN";
}

namespace {

void debit(I128& balance, I128 amount, const Transfer& transfer) {
    if (balance < amount) {
        throw ProtocolError(Error::TRANSFER_FAILED,
                            std::string(to_string(transfer.kind)) + ": insufficient balance " +
                                x18::to_decimal_string(balance) + " < " + x18::to_decimal_string(amount),
                            {.user = transfer.account});
    }
    balance -= amount;
}

} // namespace

void LedgerCustody::apply(Ledger& ledger, const Transfer& transfer,
                          const std::unordered_set<Address, AddressHash>& rejects_ether) {
    if (transfer.amount < 0) {
        throw ProtocolError(Error::TRANSFER_FAILED, "negative transfer amount", {.user = transfer.account});
    }

    const Address& who = transfer.account;
    switch (transfer.kind) {
        case TransferKind::ASSET_IN:
            debit(ledger.asset[who], transfer.amount, transfer);
            ledger.protocol_asset += transfer.amount;
            break;
        case TransferKind::ASSET_OUT:
            debit(ledger.protocol_asset, transfer.amount, transfer);
            ledger.asset[who] += transfer.amount;
            break;
        case TransferKind::USDN_MINT:
            ledger.usdn[who] += transfer.amount;
            ledger.usdn_supply += transfer.amount;
            break;
        case TransferKind::USDN_LOCK:
            debit(ledger.usdn[who], transfer.amount, transfer);
            ledger.protocol_usdn_locked += transfer.amount;
            break;
        case TransferKind::USDN_BURN:
            debit(ledger.protocol_usdn_locked, transfer.amount, transfer);
            ledger.usdn_supply -= transfer.amount;
            break;
        case TransferKind::USDN_RELEASE:
            debit(ledger.protocol_usdn_locked, transfer.amount, transfer);
            ledger.usdn[who] += transfer.amount;
            break;
        case TransferKind::ETHER_IN:
            debit(ledger.ether[who], transfer.amount, transfer);
            ledger.protocol_ether += transfer.amount;
            break;
        case TransferKind::ETHER_OUT:
            if (rejects_ether.count(who) != 0) {
                throw ProtocolError(Error::ETHER_REFUND_FAILED, "recipient rejected native value",
                                    {.user = who});
            }
            debit(ledger.protocol_ether, transfer.amount, transfer);
            ledger.ether[who] += transfer.amount;
            break;
    }
}

void LedgerCustody::settle(const Settlement& settlement) {
    std::unique_lock lock(mutex_);

    Ledger draft = ledger_;
    for (const auto& transfer : settlement.transfers) {
        apply(draft, transfer, rejects_ether_);
    }
    ledger_ = std::move(draft);
}

void LedgerCustody::credit_asset(const Address& account, I128 amount) {
    std::unique_lock lock(mutex_);
    ledger_.asset[account] += amount;
}

void LedgerCustody::credit_ether(const Address& account, I128 amount) {
    std::unique_lock lock(mutex_);
    ledger_.ether[account] += amount;
}

void LedgerCustody::credit_usdn(const Address& account, I128 amount) {
    std::unique_lock lock(mutex_);
    ledger_.usdn[account] += amount;
    ledger_.usdn_supply += amount;
}

void LedgerCustody::set_rejects_ether(const Address& account, bool rejects) {
    std::unique_lock lock(mutex_);
    if (rejects) {
        rejects_ether_.insert(account);
    } else {
        rejects_ether_.erase(account);
    }
}

I128 LedgerCustody::asset_balance(const Address& account) const {
    std::shared_lock lock(mutex_);
    auto it = ledger_.asset.find(account);
    return it == ledger_.asset.end() ? 0 : it->second;
}

I128 LedgerCustody::usdn_balance(const Address& account) const {
    std::shared_lock lock(mutex_);
    auto it = ledger_.usdn.find(account);
    return it == ledger_.usdn.end() ? 0 : it->second;
}

I128 LedgerCustody::ether_balance(const Address& account) const {
    std::shared_lock lock(mutex_);
    auto it = ledger_.ether.find(account);
    return it == ledger_.ether.end() ? 0 : it->second;
}

I128 LedgerCustody::protocol_asset() const {
    std::shared_lock lock(mutex_);
    return ledger_.protocol_asset;
}

I128 LedgerCustody::protocol_usdn_locked() const {
    std::shared_lock lock(mutex_);
    return ledger_.protocol_usdn_locked;
}

I128 LedgerCustody::protocol_ether() const {
    std::shared_lock lock(mutex_);
    return ledger_.protocol_ether;
}

I128 LedgerCustody::usdn_total_supply() const {
    std::shared_lock lock(mutex_);
    return ledger_.usdn_supply;
}

} // namespace tickvault
