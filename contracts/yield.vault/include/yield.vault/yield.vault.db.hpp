#pragma once

#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/time.hpp>

#include <set>

#include <yield.vault/vault.types.hpp>

namespace yieldfi {

using namespace std;
using namespace eosio;

#define TBL struct [[eosio::table, eosio::contract("yield.vault")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("yield.vault")]]

NTBL("global") global_t {
    name                admin                   = "yieldfi.adm"_n;
    name                keeper                  = "yieldfi.kpr"_n;
    name                price_oracle_contract   = "price.oracle"_n;
    name                swap_contract;
    set<name>           exempt;                                 //no cap, no entry/exit fee
    vault_state         vault;
    asset_update_t      asset_update;                           //in flight between updateasset and assetcommit
    swap_deposit_t      swap_deposit;                           //in flight between a swapdeposit transfer and swapcommit
    bool                initialized             = false;

    EOSLIB_SERIALIZE( global_t, (admin)(keeper)(price_oracle_contract)(swap_contract)
                                (exempt)(vault)(asset_update)(swap_deposit)(initialized) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

//scope: _self
TBL share_t {
    name            owner;                  //PK
    asset           balance;

    share_t() {}
    share_t(const name& o): owner(o) {}

    uint64_t primary_key()const { return owner.value; }

    typedef multi_index<"shares"_n, share_t> tbl_t;

    EOSLIB_SERIALIZE( share_t, (owner)(balance) )
};

//scope: owner
TBL operator_t {
    name            op;                     //PK
    time_point_sec  approved_at;

    uint64_t primary_key()const { return op.value; }

    typedef multi_index<"operators"_n, operator_t> tbl_t;

    EOSLIB_SERIALIZE( operator_t, (op)(approved_at) )
};

//scope: _self
TBL input_t {
    uint64_t        slot;                   //PK, 0..7
    input_slot      input;

    uint64_t primary_key()const { return slot; }

    typedef multi_index<"inputs"_n, input_t> tbl_t;

    EOSLIB_SERIALIZE( input_t, (slot)(input) )
};

//scope: request_kind
TBL request_row_t {
    request_t       req;

    uint64_t primary_key()const { return req.controller.value; }

    typedef multi_index<"requests"_n, request_row_t> tbl_t;

    EOSLIB_SERIALIZE( request_row_t, (req) )
};

//scope: request_kind
TBL settlement_row_t {
    settlement_t    settlement;

    uint64_t primary_key()const { return settlement.last_request_id; }

    typedef multi_index<"settlements"_n, settlement_row_t> tbl_t;

    EOSLIB_SERIALIZE( settlement_row_t, (settlement) )
};

NTBL("inflight") inflight_t {
    alloc_plan      plan;

    EOSLIB_SERIALIZE( inflight_t, (plan) )
};
typedef eosio::singleton< "inflight"_n, inflight_t > inflight_singleton;

} //namespace yieldfi
