/**
 * Implements a standard eosio.token contract with managed-token extensions.
 *
 * @copyright defined in telos/LICENSE.txt
 */

#include <backed.token/backed.token.hpp>

void backedtoken::create(name issuer, asset maximum_supply) {
    require_auth( _self );

    auto sym = maximum_supply.symbol;
    eosio_assert( sym.is_valid(), "invalid symbol name" );
    eosio_assert( maximum_supply.is_valid(), "invalid supply");
    eosio_assert( maximum_supply.amount > 0, "max-supply must be positive");

    stats statstable( _self, sym.code().raw() );
    auto existing = statstable.find( sym.code().raw() );
    eosio_assert( existing == statstable.end(), "token with symbol already exists" );

    statstable.emplace( _self, [&]( auto& s ) {
        s.supply.symbol = maximum_supply.symbol;
        s.max_supply    = maximum_supply;
        s.issuer        = issuer;
    });
}

void backedtoken::issue(name to, asset quantity, string memo) {
    auto sym = quantity.symbol;
    eosio_assert( sym.is_valid(), "invalid symbol name" );
    eosio_assert( memo.size() <= 256, "memo has more than 256 bytes" );

    stats statstable( _self, sym.code().raw() );
    auto existing = statstable.find( sym.code().raw() );
    eosio_assert( existing != statstable.end(), "token with symbol does not exist, create token before issue" );
    const auto& st = *existing;

    require_auth( st.issuer );
    eosio_assert( quantity.is_valid(), "invalid quantity" );
    eosio_assert( quantity.amount > 0, "must issue positive quantity" );

    eosio_assert( quantity.symbol == st.supply.symbol, "symbol precision mismatch" );
    eosio_assert( quantity.amount <= st.max_supply.amount - st.supply.amount, "quantity exceeds available supply");

    statstable.modify( st, same_payer, [&]( auto& s ) {
       s.supply += quantity;
    });

    add_balance( st.issuer, quantity, st.issuer );

    if( to != st.issuer ) {
        SEND_INLINE_ACTION( *this, transfer, { {st.issuer, "active"_n} },
                          { st.issuer, to, quantity, memo }
        );
    }
}

void backedtoken::retire(asset quantity, string memo) {
    eosio_assert(quantity.symbol.is_valid(), "invalid symbol name");
    eosio_assert(memo.size() <= 256, "memo has more than 256 bytes");

    auto sym_code_raw = quantity.symbol.code().raw();
    stats statstable(get_self(), sym_code_raw);
    const auto& st = statstable.get(sym_code_raw, "token with symbol does not exist");

    //NOTE: issuer burns from its own balance, no allowance involved
    require_auth(st.issuer);
    eosio_assert(quantity.is_valid(), "invalid quantity");
    eosio_assert(quantity.amount > 0, "must retire positive quantity");
    eosio_assert(quantity.symbol == st.supply.symbol, "symbol precision mismatch");

    statstable.modify(st, same_payer, [&]( auto& s ) {
        s.supply -= quantity;
    });

    sub_balance(st.issuer, quantity);
}

void backedtoken::transfer(name from, name to, asset quantity, string memo) {
    eosio_assert( from != to, "cannot transfer to self" );
    require_auth( from );
    eosio_assert( is_account( to ), "to account does not exist");
    auto sym = quantity.symbol.code();
    stats statstable( _self, sym.raw() );
    const auto& st = statstable.get( sym.raw() );

    require_recipient( from );
    require_recipient( to );

    eosio_assert(quantity.is_valid(), "invalid quantity" );
    eosio_assert(quantity.amount > 0, "must transfer positive quantity" );
    eosio_assert(quantity.symbol == st.supply.symbol, "symbol precision mismatch" );
    eosio_assert(memo.size() <= 256, "memo has more than 256 bytes" );

    auto payer = has_auth( to ) ? to : from;

    sub_balance(from, quantity);
    add_balance(to, quantity, payer);
}

void backedtoken::open(name owner, const symbol& symbol, name ram_payer) {
    require_auth(ram_payer);
    eosio_assert(is_account(owner), "owner account does not exist");

    auto sym_code_raw = symbol.code().raw();
    stats statstable(get_self(), sym_code_raw);
    const auto& st = statstable.get(sym_code_raw, "symbol does not exist");
    eosio_assert(st.supply.symbol == symbol, "symbol precision mismatch");

    accounts accountstable(get_self(), owner.value);
    if (accountstable.find(sym_code_raw) == accountstable.end()) {
        accountstable.emplace(ram_payer, [&]( auto& a ){
            a.balance = asset(0, symbol);
        });
    }
}

void backedtoken::close(name owner, const symbol& symbol) {
    require_auth(owner);

    accounts accountstable(get_self(), owner.value);
    auto itr = accountstable.find(symbol.code().raw());
    eosio_assert(itr != accountstable.end(), "balance row already deleted or never existed");
    eosio_assert(itr->balance.amount == 0, "cannot close because the balance is not zero");

    accountstable.erase(itr);
}

void backedtoken::mint(name to, asset quantity, string memo) {
    auto sym = quantity.symbol;
    eosio_assert( sym.is_valid(), "invalid symbol name" );
    eosio_assert( memo.size() <= 256, "memo has more than 256 bytes" );
    eosio_assert( is_account( to ), "to account does not exist");

    stats statstable( _self, sym.code().raw() );
    auto existing = statstable.find( sym.code().raw() );
    eosio_assert( existing != statstable.end(), "token with symbol does not exist, create token before mint" );
    const auto& st = *existing;

    require_auth( st.issuer ); //NOTE: only the issuer (the treasury) can mint new tokens
    require_recipient( to );

    eosio_assert( quantity.is_valid(), "invalid quantity" );
    eosio_assert( quantity.amount > 0, "must mint positive quantity" );
    eosio_assert( quantity.symbol == st.supply.symbol, "symbol precision mismatch" );
    eosio_assert( quantity.amount <= st.max_supply.amount - st.supply.amount, "minting would exceed allowed maximum supply");

    statstable.modify( st, same_payer, [&]( auto& s ) {
       s.supply += quantity;
    });

    add_balance( to, quantity, st.issuer );
}

void backedtoken::approve(name owner, name spender, asset quantity) {
    require_auth(owner);
    eosio_assert(is_account(spender), "spender account does not exist");
    eosio_assert(owner != spender, "cannot approve self");
    eosio_assert(quantity.is_valid(), "invalid quantity");
    eosio_assert(quantity.amount >= 0, "must approve non-negative quantity");

    auto sym_code_raw = quantity.symbol.code().raw();
    stats statstable(get_self(), sym_code_raw);
    const auto& st = statstable.get(sym_code_raw, "symbol does not exist");
    eosio_assert(quantity.symbol == st.supply.symbol, "symbol precision mismatch");

    allowances_table allowances(get_self(), owner.value);
    auto itr = allowances.find(spender.value);

    if (quantity.amount == 0) { //NOTE: revoking
        if (itr != allowances.end()) {
            allowances.erase(itr);
        }
    } else if (itr == allowances.end()) {
        allowances.emplace(owner, [&]( auto& a ){
            a.spender = spender;
            a.quantity = quantity;
        });
    } else {
        allowances.modify(itr, same_payer, [&]( auto& a ) {
            a.quantity = quantity;
        });
    }
}

void backedtoken::burnfrom(name burner, name owner, asset quantity, string memo) {
    require_auth(burner);
    eosio_assert( memo.size() <= 256, "memo has more than 256 bytes" );
    eosio_assert( quantity.is_valid(), "invalid quantity" );
    eosio_assert( quantity.amount > 0, "must burn positive quantity" );

    auto sym_code_raw = quantity.symbol.code().raw();
    stats statstable( _self, sym_code_raw );
    const auto& st = statstable.get( sym_code_raw, "token with symbol does not exist" );
    eosio_assert( quantity.symbol == st.supply.symbol, "symbol precision mismatch" );

    require_recipient( owner );

    if (burner != owner) {
        sub_allowance(owner, burner, quantity);
    }

    statstable.modify( st, same_payer, [&]( auto& s ) {
       s.supply -= quantity;
    });

    sub_balance( owner, quantity );
}


void backedtoken::sub_balance(name owner, asset value) {
    accounts from_acnts( _self, owner.value );

    const auto& from = from_acnts.get( value.symbol.code().raw(), "no balance object found" );
    eosio_assert( from.balance.amount >= value.amount, "overdrawn balance" );

    from_acnts.modify( from, same_payer, [&]( auto& a ) {
        a.balance -= value;
    });
}

void backedtoken::add_balance(name owner, asset value, name ram_payer) {
    accounts to_acnts( _self, owner.value );
    auto to = to_acnts.find( value.symbol.code().raw() );
    if(to == to_acnts.end()) {
        to_acnts.emplace( ram_payer, [&]( auto& a ){
            a.balance = value;
        });
    } else {
        to_acnts.modify( to, same_payer, [&]( auto& a ) {
            a.balance += value;
        });
    }
}

void backedtoken::sub_allowance(name owner, name spender, asset quantity) {
    allowances_table allowances(get_self(), owner.value);
    auto itr = allowances.find(spender.value);
    eosio_assert(itr != allowances.end(), "insufficient allowance");

    auto al = *itr;
    eosio_assert(al.quantity.symbol == quantity.symbol, "allowance symbol mismatch");
    eosio_assert(al.quantity.amount >= quantity.amount, "insufficient allowance");

    if(al.quantity.amount == quantity.amount) { //NOTE: erasing allowance since all of it is being spent
        allowances.erase(itr);
    } else {
        allowances.modify(itr, same_payer, [&]( auto& a ) {
            a.quantity -= quantity;
        });
    }
}

EOSIO_DISPATCH(backedtoken, (create)(issue)(retire)(transfer)(open)(close)
    (mint)(approve)(burnfrom))
