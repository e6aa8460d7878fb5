/**
 * Reserve Treasury Implementation. Configuration, roles and events live here,
 * minting and redemption in their own files.
 *
 * @copyright defined in telos/LICENSE.txt
 */

#include <treasury/treasury.hpp>
#include <eosiolib/print.hpp>

treasury::treasury(name self, name code, datastream<const char*> ds) : contract(self, code, ds), configs(self, self.value) {
    _config = configs.exists() ? configs.get() : get_default_config();
}

treasury::~treasury() {
    if (configs.exists()) configs.set(_config, get_self());
}

treasury::config treasury::get_default_config() {
    return config{
        get_self(), //owner
        extended_symbol(), //managed_token
        extended_symbol(), //reserve_asset
        false, //redemption_active
        uint8_t(0), //payout_percent
        vector<extended_symbol>(), //basket
        false //locked
    };
}

void treasury::init(name owner, extended_symbol managed_token, extended_symbol reserve_asset) {
    require_auth(get_self());
    eosio_assert(!configs.exists(), "treasury already initialized");
    eosio_assert(is_account(owner), "owner account does not exist");
    eosio_assert(managed_token.get_symbol().is_valid(), "invalid managed token symbol");
    eosio_assert(reserve_asset.get_symbol().is_valid(), "invalid reserve asset symbol");
    eosio_assert(managed_token.get_symbol().precision() <= accounting::MAX_PRECISION, "managed token precision too large");

    _config = get_default_config();
    _config.owner = owner;
    _config.managed_token = managed_token;
    _config.reserve_asset = reserve_asset;

    configs.set(_config, get_self());

    print("\nTreasury Initialization: SUCCESS");
}

void treasury::transferown(name new_owner) {
    require_initialized();
    require_auth(_config.owner);
    eosio_assert(is_account(new_owner), "new owner account does not exist");

    _config.owner = new_owner;

    SEND_INLINE_ACTION(*this, logowner, { {get_self(), "active"_n} }, { new_owner });
}

#pragma region Admin_Actions

void treasury::setredeem(uint8_t payout_percent) {
    require_initialized();
    require_auth(_config.owner);
    eosio_assert(payout_percent < accounting::PERCENT_BASE, "invalid percentage: payout percent must be less than 100");

    _config.redemption_active = true;
    _config.payout_percent = payout_percent;

    SEND_INLINE_ACTION(*this, logredeem, { {get_self(), "active"_n} }, { payout_percent });
}

void treasury::setbasket(vector<extended_symbol> basket) {
    require_initialized();
    require_auth(_config.owner);

    _config.basket = basket;

    SEND_INLINE_ACTION(*this, logbasket, { {get_self(), "active"_n} }, { basket });
}

void treasury::addminter(name account) {
    require_initialized();
    require_auth(_config.owner);

    minters_table minters(get_self(), get_self().value);
    auto itr = minters.find(account.value);

    if (itr == minters.end()) {
        minters.emplace(get_self(), [&](auto& row) {
            row.account = account;
        });
    }

    SEND_INLINE_ACTION(*this, logminter, { {get_self(), "active"_n} }, { account, true });
}

void treasury::rmvminter(name account) {
    require_initialized();
    require_auth(_config.owner);

    minters_table minters(get_self(), get_self().value);
    auto itr = minters.find(account.value);

    if (itr != minters.end()) {
        minters.erase(itr);
    }

    SEND_INLINE_ACTION(*this, logminter, { {get_self(), "active"_n} }, { account, false });
}

void treasury::addsender(name account) {
    require_initialized();
    require_auth(_config.owner);

    senders_table senders(get_self(), get_self().value);
    auto itr = senders.find(account.value);

    if (itr == senders.end()) {
        senders.emplace(get_self(), [&](auto& row) {
            row.account = account;
        });
    }

    SEND_INLINE_ACTION(*this, logsender, { {get_self(), "active"_n} }, { account, true });
}

void treasury::rmvsender(name account) {
    require_initialized();
    require_auth(_config.owner);

    senders_table senders(get_self(), get_self().value);
    auto itr = senders.find(account.value);

    if (itr != senders.end()) {
        senders.erase(itr);
    }

    SEND_INLINE_ACTION(*this, logsender, { {get_self(), "active"_n} }, { account, false });
}

void treasury::setreserve(extended_symbol reserve_asset) {
    require_initialized();
    require_auth(_config.owner);
    eosio_assert(reserve_asset.get_symbol().is_valid(), "invalid reserve asset symbol");

    _config.reserve_asset = reserve_asset;

    SEND_INLINE_ACTION(*this, logreserve, { {get_self(), "active"_n} }, { reserve_asset });
}

#pragma endregion Admin_Actions

#pragma region Events

void treasury::logredeem(uint8_t payout_percent) {
    require_auth(get_self());
    print("\nRedemption Activated: ", uint32_t(payout_percent), "%");
}

void treasury::logbasket(vector<extended_symbol> basket) {
    require_auth(get_self());
    print("\nBasket Replaced: ", uint64_t(basket.size()), " assets");
}

void treasury::logminter(name account, bool approved) {
    require_auth(get_self());
    print(approved ? "\nMinter Added: " : "\nMinter Removed: ", account);
}

void treasury::logsender(name account, bool approved) {
    require_auth(get_self());
    print(approved ? "\nSender Added: " : "\nSender Removed: ", account);
}

void treasury::logreserve(extended_symbol reserve_asset) {
    require_auth(get_self());
    print("\nReserve Asset Updated: ", reserve_asset.get_symbol(), "@", reserve_asset.get_contract());
}

void treasury::logowner(name owner) {
    require_auth(get_self());
    print("\nOwner Transferred: ", owner);
}

#pragma endregion Events

#pragma region Helpers

treasury::inflight_guard::inflight_guard(treasury& t) : parent(t) {
    eosio_assert(!parent._config.locked, "reentrant call rejected");
    parent._config.locked = true;
}

treasury::inflight_guard::~inflight_guard() {
    action(permission_level{parent.get_self(), "active"_n}, parent.get_self(), "unlock"_n,
        make_tuple()
    ).send();
}

void treasury::unlock() {
    require_auth(get_self());
    _config.locked = false;
}

void treasury::require_initialized() {
    eosio_assert(configs.exists(), "treasury is not initialized");
}

bool treasury::is_minter(name account) {
    minters_table minters(get_self(), get_self().value);
    return minters.find(account.value) != minters.end();
}

bool treasury::is_sender(name account) {
    senders_table senders(get_self(), get_self().value);
    return senders.find(account.value) != senders.end();
}

#pragma endregion Helpers

EOSIO_DISPATCH(treasury, (init)(transferown)
    (setredeem)(setbasket)(addminter)(rmvminter)(addsender)(rmvsender)(setreserve)
    (mint)(burnredeem)(sendfunds)(getexcess)(getvalue)(unlock)
    (logredeem)(logbasket)(logminter)(logsender)(logreserve)(logowner))
