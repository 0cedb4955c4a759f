#pragma once

#include <yield.vault/vault.iface.hpp>
#include <yield.vault/share.ledger.hpp>
#include <yield.vault/request.queue.hpp>

namespace yieldfi {

enum class leg_step: uint8_t {
    OPEN        = 0,    //swap in / unstake
    ADVANCE     = 1,    //stake / swap out
    CLOSE       = 2,    //verify against the slippage floor
    DONE        = 3
};

/**
 * @brief weighted allocation of idle liquidity across up to eight inputs
 *
 * An invest or liquidate runs as begin -> per leg OPEN, ADVANCE, CLOSE ->
 * commit. Nothing in vault_state or the input book changes before commit,
 * and any leg below its slippage floor aborts the whole call. Paired inputs
 * (even/odd slots) are deployed together from the odd slot and withdrawn
 * together from the even slot.
 */
class allocation_engine {
public:
    allocation_engine( vault_state& state, input_book& inputs, share_ledger& ledger, request_queue& queue,
                       protocol_adapter& adapter, swapper& swaps, const price_source& prices,
                       const balance_reader& balances, vault_events& events );

    uint32_t        total_weight() const;
    asset           allocatable() const;
    asset           investable() const;
    int64_t         excess( uint8_t slot ) const;
    vector<asset>   preview_invest( const asset& amount ) const;
    vector<asset>   preview_liquidate( const asset& amount ) const;

    alloc_plan      begin_invest( const vector<asset>& amounts, const vector<string>& params,
                                  const time_point_sec& now );
    alloc_plan      begin_liquidate( const vector<asset>& amounts, const asset& min_liquidity, bool panic,
                                     const vector<string>& params );
    void            step( alloc_plan& plan, uint8_t leg_index );
    asset           commit( alloc_plan& plan, const time_point_sec& now );

    // every phase in one call, for collaborators that settle synchronously
    void            invest( const vector<asset>& amounts, const vector<string>& params, const time_point_sec& now );
    asset           liquidate( const vector<asset>& amounts, const asset& min_liquidity, bool panic,
                               const vector<string>& params, const time_point_sec& now );

    // caps deposits at zero, drops the liquidity floor and unwinds every input above dust
    std::optional<alloc_plan> begin_empty( const vector<string>& params );
    asset           empty( const vector<string>& params, const time_point_sec& now );

    void            sync();
    void            set_inputs( const vector<input_conf>& confs );
    void            set_weights( const vector<uint16_t>& weights );

    // idle balance is swapped into `token`, then re-denominated on commit
    asset_update_t  begin_asset_update( const extended_symbol& token, const string& params );
    void            commit_asset_update( const asset_update_t& update );

    // a foreign token is swapped into the asset, then deposited on commit
    swap_deposit_t  begin_swap_deposit( const name& caller, const extended_asset& input, const name& receiver,
                                        const asset& min_shares, const string& params,
                                        const time_point_sec& deadline, const time_point_sec& now );
    asset           commit_swap_deposit( const swap_deposit_t& deposit, const time_point_sec& now );

    // stray token balances leave after RESCUE_TIMELOCK, within RESCUE_VALIDITY
    void            request_rescue( const extended_symbol& token, const name& receiver, const time_point_sec& now );
    extended_asset  rescue( const extended_symbol& token, const time_point_sec& now );

    asset           to_input( const asset& assets, const input_slot& input ) const;
    asset           to_asset( const asset& amount, const input_slot& input ) const;

private:
    const input_slot&   _input( uint8_t slot ) const;
    bool                _is_asset( const input_slot& input ) const;
    bool                _is_pair_head( uint8_t slot ) const;
    bool                _is_pair_tail( uint8_t slot ) const;
    asset               _floor( const asset& amount, uint8_t legs ) const;
    bool                _per_leg() const;
    alloc_leg&          _leg_of( alloc_plan& plan, uint8_t slot );
    void                _check_params( const vector<asset>& amounts, const vector<string>& params ) const;
    void                _begin( alloc_plan& plan );
    void                _run( alloc_plan& plan );
    void                _check_rescuable( const extended_symbol& token ) const;

    void                _invest_open( alloc_plan& plan, alloc_leg& leg );
    void                _invest_advance( alloc_plan& plan, alloc_leg& leg );
    void                _invest_close( alloc_plan& plan, alloc_leg& leg );
    void                _liquidate_open( alloc_plan& plan, alloc_leg& leg );
    void                _liquidate_advance( alloc_plan& plan, alloc_leg& leg );
    void                _liquidate_close( alloc_plan& plan, alloc_leg& leg );

    vault_state&            _state;
    input_book&             _inputs;
    share_ledger&           _ledger;
    request_queue&          _queue;
    protocol_adapter&       _adapter;
    swapper&                _swaps;
    const price_source&     _prices;
    const balance_reader&   _balances;
    vault_events&           _events;
};

} //namespace yieldfi
