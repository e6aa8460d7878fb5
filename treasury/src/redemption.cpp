/**
 * Proportional burn-and-redeem across the basket, and the sender-gated
 * treasury transfer.
 *
 * @copyright defined in telos/LICENSE.txt
 */

#include <treasury/treasury.hpp>
#include <eosiolib/print.hpp>

void treasury::burnredeem(name redeemer, asset quantity) {
    require_initialized();
    require_auth(redeemer);
    eosio_assert(_config.redemption_active, "redemption is not active");

    inflight_guard guard(*this);

    backed_token_ledger managed(get_self(), _config.managed_token);

    //NOTE: supply is read before the burn is queued
    int64_t supply_before = managed.total_supply();
    eosio_assert(supply_before > 0, "divide by zero: managed token supply is zero");

    eosio_assert(quantity.is_valid(), "invalid quantity");
    eosio_assert(quantity.amount > 0, "must redeem positive quantity");
    eosio_assert(quantity.symbol == _config.managed_token.get_symbol(), "quantity is not the managed token");
    eosio_assert(managed.balance_of(redeemer) >= quantity.amount, "insufficient token balance");

    auto share = accounting::redemption_share(quantity.amount, supply_before);

    managed.burn_from(redeemer, quantity.amount, "burn for redemption");

    //NOTE: one view per distinct asset, so a repeated entry sees the earlier payout
    vector<token_ledger> ledgers;
    ledgers.reserve(_config.basket.size());

    for (const auto& id : _config.basket) {
        token_ledger* ledger = nullptr;
        for (auto& l : ledgers) {
            if (l.id() == id) {
                ledger = &l;
                break;
            }
        }

        if (ledger == nullptr) {
            ledgers.emplace_back(get_self(), id);
            ledger = &ledgers.back();
        }

        int64_t payout = accounting::basket_payout(ledger->balance_of(get_self()), share, _config.payout_percent);

        //NOTE: token ledgers reject empty transfers, truncated payouts stay in the treasury
        if (payout > 0) {
            ledger->transfer(redeemer, payout, "redemption payout");
        }
    }

    print("\nBurn and Redeem: SUCCESS");
}

void treasury::sendfunds(name sender, name to, extended_asset quantity, string memo) {
    require_initialized();
    require_auth(sender);
    eosio_assert(is_sender(sender), "unauthorized: account is not an approved sender");
    eosio_assert(quantity.quantity.is_valid(), "invalid quantity");

    token_ledger ledger(get_self(), extended_symbol(quantity.quantity.symbol, quantity.contract));
    ledger.transfer(to, quantity.quantity.amount, memo);

    print("\nTreasury Transfer: SUCCESS");
}
