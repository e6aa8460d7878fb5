/**
 * Asset ledger capabilities used by the treasury.
 *
 * A ledger is a view of one extended symbol on an eosio.token compatible
 * contract, held on behalf of the treasury account. Writes are sent as inline
 * actions, which only execute after the calling action returns, so each view
 * folds the effects it has already queued into later reads.
 */

#pragma once

#include <eosiolib/eosio.hpp>
#include <eosiolib/asset.hpp>
#include <eosiolib/action.hpp>

#include <map>
#include <string>

using namespace std;
using namespace eosio;

class asset_ledger {
public:

    virtual ~asset_ledger() {}

    virtual int64_t balance_of(name holder) const = 0;

    virtual uint8_t decimals() const = 0;

    virtual int64_t total_supply() const = 0;

    //NOTE: always moves funds out of the treasury
    virtual void transfer(name to, int64_t amount, const string& memo) = 0;
};

class managed_ledger : public asset_ledger {
public:

    virtual void mint(name to, int64_t amount, const string& memo) = 0;

    //NOTE: holder must have approved the treasury beforehand
    virtual void burn_from(name holder, int64_t amount, const string& memo) = 0;
};

/**
 * Plain asset on an eosio.token compatible contract.
 */
class token_ledger : public asset_ledger {
public:

    token_ledger(name treasury, const extended_symbol& id);

    int64_t balance_of(name holder) const override;

    uint8_t decimals() const override;

    int64_t total_supply() const override;

    void transfer(name to, int64_t amount, const string& memo) override;

    extended_symbol id() const { return token_id; }

private:

    friend class backed_token_ledger;

    //tables mirrored from the token contract
    struct account {
        asset balance;

        uint64_t primary_key() const { return balance.symbol.code().raw(); }
    };

    struct currency_stats {
        asset supply;
        asset max_supply;
        name issuer;

        uint64_t primary_key() const { return supply.symbol.code().raw(); }
    };

    typedef multi_index<name("accounts"), account> accounts;
    typedef multi_index<name("stat"), currency_stats> stats;

    asset to_asset(int64_t amount) const { return asset(amount, token_id.get_symbol()); }

    int64_t stored_balance(name holder) const;
    int64_t stored_supply() const;

    void queue(name holder, int64_t delta, bool changes_supply);

    name self;
    extended_symbol token_id;

    map<uint64_t, int64_t> pending; //NOTE: queued balance deltas by holder
    int64_t pending_supply = 0;
};

/**
 * Managed token on a backed.token contract, minted and burned by the treasury.
 */
class backed_token_ledger : public managed_ledger {
public:

    backed_token_ledger(name treasury, const extended_symbol& id);

    int64_t balance_of(name holder) const override { return base.balance_of(holder); }

    uint8_t decimals() const override { return base.decimals(); }

    int64_t total_supply() const override { return base.total_supply(); }

    void transfer(name to, int64_t amount, const string& memo) override { base.transfer(to, amount, memo); }

    void mint(name to, int64_t amount, const string& memo) override;

    void burn_from(name holder, int64_t amount, const string& memo) override;

private:

    token_ledger base;
};
