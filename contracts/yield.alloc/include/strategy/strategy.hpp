#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>

#include <string>

namespace yieldfi_strategy {

using std::string;
using namespace eosio;

// memo of the token transfer that dispatches crate funds into a strategy
static const string     DISPATCH_MEMO   = "dispatch";

/**
 * Interface of a strategy fed by the allocator. A recall asks the strategy
 * to transfer `amount` back to the allocator, failing if it cannot return at
 * least `min_out`.
 */
class [[eosio::contract("yield.strategy")]] strategy : public contract {
public:
    using contract::contract;

    [[eosio::action]] void recall( const name& allocator, const asset& amount, const asset& min_out );

    using recall_action = action_wrapper<"recall"_n, &strategy::recall>;
};

} //namespace yieldfi_strategy
