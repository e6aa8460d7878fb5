/**
 * Backed Token Interface. Standard eosio.token ledger extended with the
 * managed-token capabilities a treasury needs: issuer minting and delegated
 * burning against holder-granted allowances.
 *
 * @copyright defined in telos/LICENSE.txt
 */

#pragma once

#include <eosiolib/eosio.hpp>
#include <eosiolib/asset.hpp>

#include <string>

using namespace eosio;
using namespace std;

class [[eosio::contract("backed.token")]] backedtoken : public contract {

public:

    using contract::contract;

    [[eosio::action]]
    void create(name issuer, asset maximum_supply);

    [[eosio::action]]
    void issue(name to, asset quantity, string memo);

    [[eosio::action]]
    void retire(asset quantity, string memo);

    [[eosio::action]]
    void transfer(name from, name to, asset quantity, string memo);

    [[eosio::action]]
    void open(name owner, const symbol& symbol, name ram_payer);

    [[eosio::action]]
    void close(name owner, const symbol& symbol);

    //NOTE: credits recipient directly, supply grows by exactly quantity
    [[eosio::action]]
    void mint(name to, asset quantity, string memo);

    //NOTE: replaces any previous allowance, zero quantity removes it
    [[eosio::action]]
    void approve(name owner, name spender, asset quantity);

    [[eosio::action]]
    void burnfrom(name burner, name owner, asset quantity, string memo);

    //@scope owner.value (discoverable by owner)
    struct [[eosio::table]] allowance {
        name spender;
        asset quantity;

        uint64_t primary_key() const { return spender.value; }
        EOSLIB_SERIALIZE(allowance, (spender)(quantity))
    };

    struct [[eosio::table]] account {
        asset balance;

        uint64_t primary_key() const { return balance.symbol.code().raw(); }
    };

    struct [[eosio::table]] currency_stats {
        asset supply;
        asset max_supply;
        name issuer;

        uint64_t primary_key() const { return supply.symbol.code().raw(); }
    };

    typedef multi_index<name("allowances"), allowance> allowances_table;
    typedef eosio::multi_index<name("accounts"), account> accounts;
    typedef eosio::multi_index<name("stat"), currency_stats> stats;

private:

    void sub_balance(name owner, asset value);
    void add_balance(name owner, asset value, name ram_payer);

    void sub_allowance(name owner, name spender, asset quantity);
};
