#pragma once

#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/time.hpp>

#include <yield.alloc/alloc.types.hpp>

namespace yieldfi {

using namespace std;
using namespace eosio;

#define TBL struct [[eosio::table, eosio::contract("yield.alloc")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("yield.alloc")]]

NTBL("global") global_t {
    name                admin           = "yieldfi.adm"_n;
    name                keeper          = "yieldfi.kpr"_n;
    alloc_state         crate;
    bool                initialized     = false;

    EOSLIB_SERIALIZE( global_t, (admin)(keeper)(crate)(initialized) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

//scope: _self
TBL strategy_t {
    strategy_info   info;

    uint64_t primary_key()const { return info.strategy.value; }

    typedef multi_index<"strategies"_n, strategy_t> tbl_t;

    EOSLIB_SERIALIZE( strategy_t, (info) )
};

} //namespace yieldfi
