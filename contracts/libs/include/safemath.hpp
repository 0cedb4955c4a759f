#pragma once

#include <cstdint>
#include <limits>
#include <eosio/eosio.hpp>

namespace wasm { namespace safemath {

    // a * b / c, rounded toward zero
    inline int128_t mul_div_down(int128_t a, int128_t b, int128_t c) {
        eosio::check(c != 0, "[[200]] safemath: divide by zero");
        return a * b / c;
    }

    // a * b / c, rounded away from zero for non-negative operands
    inline int128_t mul_div_up(int128_t a, int128_t b, int128_t c) {
        eosio::check(c != 0, "[[200]] safemath: divide by zero");
        int128_t p = a * b;
        int128_t q = p / c;
        if (p % c != 0) q += 1;
        return q;
    }

    inline int64_t to_int64(int128_t v) {
        eosio::check(v >= std::numeric_limits<int64_t>::min() && v <= std::numeric_limits<int64_t>::max(),
                     "[[200]] safemath: int64 overflow");
        return (int64_t)v;
    }

    #define mul_down64(a, b, c) wasm::safemath::to_int64(wasm::safemath::mul_div_down(a, b, c))
    #define mul_up64(a, b, c) wasm::safemath::to_int64(wasm::safemath::mul_div_up(a, b, c))

} } //safemath
