/**
 * Reserve accounting and the mint gate.
 *
 * @copyright defined in telos/LICENSE.txt
 */

#include <treasury/treasury.hpp>
#include <eosiolib/print.hpp>

//NOTE: recomputed on every call, both reserve balance and supply move between calls
accounting::uint128 treasury::excess_reserves(const asset_ledger& reserve, const managed_ledger& managed) {
    return accounting::excess_reserves(reserve.balance_of(get_self()), managed.total_supply());
}

accounting::uint128 treasury::value_of(const extended_asset& quantity) {
    token_ledger ledger(get_self(), extended_symbol(quantity.quantity.symbol, quantity.contract));
    return accounting::normalize(quantity.quantity.amount, ledger.decimals(), _config.managed_token.get_symbol().precision());
}

void treasury::mint(name minter, name to, asset quantity) {
    require_initialized();
    require_auth(minter);
    eosio_assert(is_minter(minter), "unauthorized: account is not an approved minter");
    eosio_assert(is_account(to), "to account does not exist");
    eosio_assert(quantity.is_valid(), "invalid quantity");
    eosio_assert(quantity.amount > 0, "must mint positive quantity");
    eosio_assert(quantity.symbol == _config.managed_token.get_symbol(), "quantity is not the managed token");

    inflight_guard guard(*this);

    token_ledger reserve(get_self(), _config.reserve_asset);
    backed_token_ledger managed(get_self(), _config.managed_token);

    auto excess = excess_reserves(reserve, managed);
    eosio_assert(accounting::uint128(quantity.amount) <= excess, "insufficient backing: quantity exceeds excess reserves");

    managed.mint(to, quantity.amount, "mint against excess reserves");

    print("\nMint: SUCCESS");
}

void treasury::getexcess() {
    require_initialized();

    token_ledger reserve(get_self(), _config.reserve_asset);
    backed_token_ledger managed(get_self(), _config.managed_token);

    print("\nExcess Reserves: ", excess_reserves(reserve, managed));
}

void treasury::getvalue(extended_asset quantity) {
    require_initialized();
    eosio_assert(quantity.quantity.is_valid(), "invalid quantity");
    eosio_assert(quantity.quantity.symbol.precision() <= accounting::MAX_PRECISION, "asset precision too large");

    print("\nToken Value: ", value_of(quantity));
}
