#pragma once

#include <eosio/asset.hpp>
#include <eosio/name.hpp>
#include <eosio/time.hpp>

#include <optional>
#include <string>
#include <vector>

namespace yieldfi {

using namespace std;
using namespace eosio;

struct strategy_info {
    name                strategy;                       //strategy contract, receives dispatched funds
    string              label;
    asset               max_deposit;                    //debt ceiling
    asset               debt;                           //capital owed back to the crate
    asset               total_assets_available;         //last self-reported by the strategy
    bool                whitelisted     = true;
    bool                panicked        = false;
    time_point_sec      added_at;
    time_point_sec      updated_at;

    EOSLIB_SERIALIZE( strategy_info, (strategy)(label)(max_deposit)(debt)(total_assets_available)
                                     (whitelisted)(panicked)(added_at)(updated_at) )
};

// a recall sent to a strategy, checked by recallchk once the funds are back
struct recall_t {
    name                strategy;
    asset               amount;
    asset               min_out;
    asset               balance_before;
    bool                panic           = false;

    EOSLIB_SERIALIZE( recall_t, (strategy)(amount)(min_out)(balance_before)(panic) )
};

struct alloc_state {
    extended_symbol     token;                          //crate token
    asset               total_chain_debt;               //sum of strategy debt
    std::optional<recall_t> recall;

    alloc_state() {}

    EOSLIB_SERIALIZE( alloc_state, (token)(total_chain_debt)(recall) )
};

} //namespace yieldfi
