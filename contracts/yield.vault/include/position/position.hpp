#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>

#include <string>

namespace yieldfi_position {

using std::string;
using namespace eosio;

static constexpr name   STANDARD_ABI    = "standard"_n;

// memos of the token transfers that open a position
static const string     STAKE_MEMO      = "stake";
static const string     STAKE_PAIR_MEMO = "stakepair";

/**
 * Interface of a position (protocol adapter) contract. Tokens are staked by
 * transferring them in with memo `stake` / `stakepair`; unstaked tokens are
 * transferred back to the owner.
 *
 * Standard adapters publish an `abiinfo` singleton and keep one `positions`
 * row per token under the owner's scope. Legacy adapters keep a single
 * `stakes` row per owner and unstake through `withdraw`.
 */
class [[eosio::contract("yield.position")]] position : public contract {
public:
    using contract::contract;

    [[eosio::action]] void unstake( const name& owner, const asset& quantity );
    [[eosio::action]] void unstakepair( const name& owner, const uint64_t& ratio );
    //legacy
    [[eosio::action]] void withdraw( const name& owner, const asset& quantity );

    using unstake_action        = action_wrapper<"unstake"_n,       &position::unstake>;
    using unstakepair_action    = action_wrapper<"unstakepair"_n,   &position::unstakepair>;
    using withdraw_action       = action_wrapper<"withdraw"_n,      &position::withdraw>;

    struct [[eosio::table("abiinfo"), eosio::contract("yield.position")]] abi_info_t {
        name        abi         = STANDARD_ABI;

        EOSLIB_SERIALIZE( abi_info_t, (abi) )
    };
    typedef eosio::singleton< "abiinfo"_n, abi_info_t > abi_info_t_singleton;

    //scope: owner
    struct [[eosio::table, eosio::contract("yield.position")]] position_t {
        asset       balance;

        uint64_t primary_key() const { return balance.symbol.code().raw(); }

        EOSLIB_SERIALIZE( position_t, (balance) )
    };
    typedef eosio::multi_index< "positions"_n, position_t > positions_tbl;

    //scope: self, legacy adapters
    struct [[eosio::table, eosio::contract("yield.position")]] stake_t {
        name        owner;
        asset       staked;

        uint64_t primary_key() const { return owner.value; }

        EOSLIB_SERIALIZE( stake_t, (owner)(staked) )
    };
    typedef eosio::multi_index< "stakes"_n, stake_t > stakes_tbl;

    //scope: self, pair adapters
    struct [[eosio::table("pool"), eosio::contract("yield.position")]] pool_t {
        asset       reserve0;
        asset       reserve1;

        EOSLIB_SERIALIZE( pool_t, (reserve0)(reserve1) )
    };
    typedef eosio::singleton< "pool"_n, pool_t > pool_singleton;
};

} //namespace yieldfi_position
