/**
 * Asset ledger views over eosio.token compatible contracts.
 */

#include <treasury/ledger.hpp>

token_ledger::token_ledger(name treasury, const extended_symbol& id) : self(treasury), token_id(id) {
}

int64_t token_ledger::stored_balance(name holder) const {
    accounts accountstable(token_id.get_contract(), holder.value);
    auto itr = accountstable.find(token_id.get_symbol().code().raw());

    //NOTE: a holder without a balance row holds nothing
    if (itr == accountstable.end()) {
        return 0;
    }

    eosio_assert(itr->balance.symbol == token_id.get_symbol(), "symbol precision mismatch");
    return itr->balance.amount;
}

int64_t token_ledger::stored_supply() const {
    auto sym_code_raw = token_id.get_symbol().code().raw();
    stats statstable(token_id.get_contract(), sym_code_raw);
    const auto& st = statstable.get(sym_code_raw, "token with symbol does not exist");
    eosio_assert(st.supply.symbol == token_id.get_symbol(), "symbol precision mismatch");
    return st.supply.amount;
}

int64_t token_ledger::balance_of(name holder) const {
    int64_t balance = stored_balance(holder);

    auto itr = pending.find(holder.value);
    if (itr != pending.end()) {
        balance += itr->second;
    }

    return balance;
}

uint8_t token_ledger::decimals() const {
    return token_id.get_symbol().precision();
}

int64_t token_ledger::total_supply() const {
    return stored_supply() + pending_supply;
}

void token_ledger::transfer(name to, int64_t amount, const string& memo) {
    action(permission_level{self, name("active")}, token_id.get_contract(), name("transfer"),
        make_tuple(self, to, to_asset(amount), memo)
    ).send();

    queue(self, -amount, false);
    queue(to, amount, false);
}

void token_ledger::queue(name holder, int64_t delta, bool changes_supply) {
    pending[holder.value] += delta;
    if (changes_supply) {
        pending_supply += delta;
    }
}


backed_token_ledger::backed_token_ledger(name treasury, const extended_symbol& id) : base(treasury, id) {
}

void backed_token_ledger::mint(name to, int64_t amount, const string& memo) {
    action(permission_level{base.self, name("active")}, base.token_id.get_contract(), name("mint"),
        make_tuple(to, base.to_asset(amount), memo)
    ).send();

    base.queue(to, amount, true);
}

void backed_token_ledger::burn_from(name holder, int64_t amount, const string& memo) {
    action(permission_level{base.self, name("active")}, base.token_id.get_contract(), name("burnfrom"),
        make_tuple(base.self, holder, base.to_asset(amount), memo)
    ).send();

    base.queue(holder, -amount, true);
}
