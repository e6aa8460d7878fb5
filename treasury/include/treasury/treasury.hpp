/**
 * Reserve Treasury Interface
 *
 * Backs a managed token with a single reserve asset. Approved minters may mint
 * up to the excess reserves, and once redemption is enabled any holder can
 * burn managed tokens for a proportional payout from the asset basket.
 *
 * @copyright defined in telos/LICENSE.txt
 */

#pragma once

#include <treasury/accounting.hpp>
#include <treasury/ledger.hpp>

#include <eosiolib/eosio.hpp>
#include <eosiolib/asset.hpp>
#include <eosiolib/action.hpp>
#include <eosiolib/singleton.hpp>

#include <string>
#include <vector>

using namespace std;
using namespace eosio;

class [[eosio::contract("treasury")]] treasury : public contract {

public:

    treasury(name self, name code, datastream<const char*> ds);

    ~treasury();

    struct [[eosio::table]] config {
        name owner;
        extended_symbol managed_token;
        extended_symbol reserve_asset;
        bool redemption_active;
        uint8_t payout_percent;
        //NOTE: order sets payout sequence, duplicates allowed
        //NOTE: entries are not validated, one whose precision disagrees with the token fails every burnredeem until replaced
        vector<extended_symbol> basket;
        bool locked;

        EOSLIB_SERIALIZE(config, (owner)(managed_token)(reserve_asset)
            (redemption_active)(payout_percent)(basket)(locked))
    };

    //@scope get_self().value
    struct [[eosio::table]] role {
        name account;

        uint64_t primary_key() const { return account.value; }
        EOSLIB_SERIALIZE(role, (account))
    };

    typedef singleton<name("config"), config> config_singleton;
    typedef multi_index<name("minters"), role> minters_table;
    typedef multi_index<name("senders"), role> senders_table;

    config_singleton configs;
    config _config;

    #pragma region Admin_Actions

    /**
     * Sets the construction parameters. Callable once, by the contract account.
     * @param owner - administrative account
     * @param managed_token - token backed by this treasury, issued by this contract on a backed.token ledger
     * @param reserve_asset - asset whose balance determines mint capacity
    */
    [[eosio::action]]
    void init(name owner, extended_symbol managed_token, extended_symbol reserve_asset);

    [[eosio::action]]
    void transferown(name new_owner);

    /**
     * Enables redemption at the given payout percent. There is no way back to
     * inactive, only a new percent.
     * @param payout_percent - share of each pro rata payout released, below 100
    */
    [[eosio::action]]
    void setredeem(uint8_t payout_percent);

    [[eosio::action]]
    void setbasket(vector<extended_symbol> basket);

    [[eosio::action]]
    void addminter(name account);

    [[eosio::action]]
    void rmvminter(name account);

    [[eosio::action]]
    void addsender(name account);

    [[eosio::action]]
    void rmvsender(name account);

    //NOTE: existing reserve balance is not migrated
    [[eosio::action]]
    void setreserve(extended_symbol reserve_asset);

    #pragma endregion Admin_Actions

    #pragma region Treasury_Actions

    [[eosio::action]]
    void mint(name minter, name to, asset quantity);

    /**
     * Burns quantity of the redeemer's managed tokens and pays out the redeemed
     * share of every basket asset, throttled by the payout percent. The redeemer
     * must have approved this contract for at least quantity on the managed token.
     * @param redeemer - account burning managed tokens and receiving the payout
     * @param quantity - managed tokens to burn
    */
    [[eosio::action]]
    void burnredeem(name redeemer, asset quantity);

    [[eosio::action]]
    void sendfunds(name sender, name to, extended_asset quantity, string memo);

    [[eosio::action]]
    void getexcess();

    [[eosio::action]]
    void getvalue(extended_asset quantity);

    [[eosio::action]]
    void unlock();

    #pragma endregion Treasury_Actions

    #pragma region Events

    [[eosio::action]]
    void logredeem(uint8_t payout_percent);

    [[eosio::action]]
    void logbasket(vector<extended_symbol> basket);

    [[eosio::action]]
    void logminter(name account, bool approved);

    [[eosio::action]]
    void logsender(name account, bool approved);

    [[eosio::action]]
    void logreserve(extended_symbol reserve_asset);

    [[eosio::action]]
    void logowner(name owner);

    #pragma endregion Events

    #pragma region Helpers

    /**
     * Holds the in-flight flag for the lifetime of an action. Release is queued
     * as the last inline action, so the flag stays set while the action's own
     * transfers, mints and burns execute.
    */
    class inflight_guard {
    public:
        explicit inflight_guard(treasury& t);
        ~inflight_guard();

    private:
        treasury& parent;
    };

    config get_default_config();

    void require_initialized();

    bool is_minter(name account);

    bool is_sender(name account);

    accounting::uint128 excess_reserves(const asset_ledger& reserve, const managed_ledger& managed);

    accounting::uint128 value_of(const extended_asset& quantity);

    #pragma endregion Helpers
};
