/**
 * Test account contract that calls back into the treasury from inside a
 * token notification, while the treasury action that caused it is still open.
 *
 * @copyright defined in telos/LICENSE.txt
 */

#include <eosiolib/eosio.hpp>
#include <eosiolib/asset.hpp>
#include <eosiolib/action.hpp>
#include <eosiolib/singleton.hpp>

using namespace eosio;

class [[eosio::contract("reentrant")]] reentrant : public contract {

public:

    using contract::contract;

    struct [[eosio::table]] target {
        name treasury;
        name act;
        asset quantity;

        EOSLIB_SERIALIZE(target, (treasury)(act)(quantity))
    };

    typedef singleton<name("target"), target> target_singleton;

    //NOTE: act is burnredeem or mint, anything else disarms
    [[eosio::action]]
    void arm(name treasury, name act, asset quantity) {
        require_auth(get_self());

        target_singleton targets(get_self(), get_self().value);
        targets.set(target{treasury, act, quantity}, get_self());
    }

    void reenter() {
        target_singleton targets(get_self(), get_self().value);
        if (!targets.exists()) {
            return;
        }

        auto tg = targets.get();
        if (tg.act == name("burnredeem")) {
            action(permission_level{get_self(), name("active")}, tg.treasury, name("burnredeem"),
                make_tuple(get_self(), tg.quantity)
            ).send();
        } else if (tg.act == name("mint")) {
            action(permission_level{get_self(), name("active")}, tg.treasury, name("mint"),
                make_tuple(get_self(), get_self(), tg.quantity)
            ).send();
        }
    }
};

extern "C" {
    void apply(uint64_t self, uint64_t code, uint64_t action) {
        if (code == self && action == name("arm").value) {
            execute_action(name(self), name(code), &reentrant::arm);
        } else if (code != self) {
            //NOTE: every notification re-enters, whichever token sent it
            reentrant contract(name(self), name(code), datastream<const char*>(nullptr, 0));
            contract.reenter();
        }
    }
}
