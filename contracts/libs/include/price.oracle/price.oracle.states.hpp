#pragma once

#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/name.hpp>

#include <map>

namespace yieldfi {

using namespace std;
using namespace eosio;

#define SYMBOL(sym_code, precision) symbol(symbol_code(sym_code), precision)

// read-only view of the price.oracle contract's global table
struct price_global_t {
    name                    version             = "1.o.o"_n;
    map<name, uint64_t>     prices              = {};           //lowercase coin code -> quote price
    uint64_t                price_history_count = 10;
    name                    quote_code          = "usdt"_n;
    symbol                  quote_symbol        = SYMBOL("USDT", 4);

    price_global_t() {}
    EOSLIB_SERIALIZE(price_global_t, (version)(prices)(price_history_count)(quote_code)(quote_symbol))

    typedef eosio::singleton< "global"_n, price_global_t > idx_t;
};

} // namespace yieldfi
