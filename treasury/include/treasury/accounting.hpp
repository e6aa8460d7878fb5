/**
 * Reserve accounting math. Integer-only, every division truncates toward zero
 * so rounding loss always stays with the treasury.
 *
 * Kept free of chain headers so the figures can be checked off-chain.
 */

#pragma once

#include <cstdint>

namespace accounting {

    typedef __uint128_t uint128;

    //NOTE: fixed-point unit, 1.0 == 10^18
    static constexpr uint64_t SCALE = 1000000000000000000ull;

    //NOTE: 0.000001 reserve units back one managed unit (10^-6 at SCALE)
    static constexpr uint64_t BACKING_RATIO = 1000000000000ull;

    static constexpr uint8_t MAX_PRECISION = 18;

    static constexpr uint8_t PERCENT_BASE = 100;

    /**
     * Unsigned fixed-point number at SCALE. Construction from a ratio and
     * application to an amount both truncate.
     */
    class fixed_point {
    public:

        constexpr fixed_point() : raw(0) {}

        constexpr explicit fixed_point(uint128 raw_value) : raw(raw_value) {}

        //NOTE: caller guarantees denominator != 0
        static constexpr fixed_point from_ratio(uint128 numerator, uint128 denominator) {
            return fixed_point(numerator * SCALE / denominator);
        }

        constexpr uint128 apply(uint128 amount) const {
            return amount * raw / SCALE;
        }

        constexpr uint128 value() const { return raw; }

        constexpr bool operator==(const fixed_point& other) const { return raw == other.raw; }
        constexpr bool operator!=(const fixed_point& other) const { return raw != other.raw; }

    private:
        uint128 raw;
    };

    inline uint64_t pow10(uint8_t exponent) {
        uint64_t result = 1;
        for (uint8_t i = 0; i < exponent; i++) {
            result *= 10;
        }
        return result;
    }

    /**
     * Managed-token units backed by a reserve balance.
     * @param reserve_balance - reserve asset held by the treasury, base units
     */
    inline uint128 backed_value(int64_t reserve_balance) {
        if (reserve_balance <= 0) {
            return 0;
        }
        return uint128(reserve_balance) * SCALE / BACKING_RATIO;
    }

    /**
     * Mintable headroom: backed value minus current supply, floored at zero.
     * @param reserve_balance - reserve asset held by the treasury, base units
     * @param total_supply - current managed-token supply, base units
     */
    inline uint128 excess_reserves(int64_t reserve_balance, int64_t total_supply) {
        uint128 value = backed_value(reserve_balance);
        uint128 supply = total_supply > 0 ? uint128(total_supply) : 0;
        return value > supply ? value - supply : 0;
    }

    /**
     * Rescales an amount between decimal precisions,
     * amount * 10^to_precision / 10^from_precision.
     */
    inline uint128 normalize(int64_t amount, uint8_t from_precision, uint8_t to_precision) {
        if (amount <= 0) {
            return 0;
        }
        return uint128(amount) * pow10(to_precision) / pow10(from_precision);
    }

    //NOTE: caller guarantees supply_before > 0
    inline fixed_point redemption_share(int64_t amount, int64_t supply_before) {
        return fixed_point::from_ratio(uint128(amount), uint128(supply_before));
    }

    /**
     * Payout of one basket asset: the redeemed share of the treasury's balance,
     * then throttled by the payout percent. Truncates at both steps.
     */
    inline int64_t basket_payout(int64_t treasury_balance, const fixed_point& share, uint8_t payout_percent) {
        if (treasury_balance <= 0) {
            return 0;
        }
        uint128 raw = share.apply(uint128(treasury_balance));
        return int64_t(raw * payout_percent / PERCENT_BASE);
    }

}
