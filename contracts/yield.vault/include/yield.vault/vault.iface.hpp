#pragma once

#include <yield.vault/vault.types.hpp>

#include <utility>

namespace yieldfi {

// share balances and operator approvals
class share_registry {
public:
    virtual ~share_registry() {}
    virtual asset   balance_of( const name& owner ) const = 0;
    virtual void    credit( const name& owner, const asset& shares ) = 0;
    virtual void    debit( const name& owner, const asset& shares ) = 0;
    virtual bool    is_operator( const name& owner, const name& op ) const = 0;
    virtual bool    is_exempt( const name& account ) const = 0;
};

// pending/claimable requests, one per (kind, controller)
class request_store {
public:
    virtual ~request_store() {}
    virtual std::optional<request_t>    find( request_kind kind, const name& controller ) const = 0;
    virtual void                        put( request_kind kind, const request_t& req ) = 0;
    virtual void                        erase( request_kind kind, const name& controller ) = 0;
    // the oldest batch covering `request_id`
    virtual std::optional<settlement_t> settlement_for( request_kind kind, uint64_t request_id ) const = 0;
    virtual void                        put_settlement( request_kind kind, const settlement_t& s ) = 0;
    virtual void                        erase_settlement( request_kind kind, uint64_t last_request_id ) = 0;
};

class price_source {
public:
    virtual ~price_source() {}
    virtual bool    has_feed( const extended_symbol& token ) const = 0;
    virtual asset   convert( const extended_asset& from, const extended_symbol& to ) const = 0;
};

class swapper {
public:
    virtual ~swapper() {}
    /**
     * @brief swap `from` into `to`; proceeds land in the vault's balance
     * @param params opaque routing data supplied by the keeper
     */
    virtual void swap( const extended_asset& from, const extended_symbol& to, const string& params ) = 0;
};

/**
 * @brief one yield-bearing position per input slot
 *
 * position_value() is reported in input token units. Paired slots report
 * each leg separately on its own slot index.
 */
class protocol_adapter {
public:
    virtual ~protocol_adapter() {}
    virtual adapter_abi detect_abi( const name& position ) const = 0;
    virtual asset   position_value( uint8_t slot, const input_slot& input ) const = 0;
    virtual void    stake( uint8_t slot, const input_slot& input, const asset& amount ) = 0;
    virtual void    unstake( uint8_t slot, const input_slot& input, const asset& amount ) = 0;
    virtual void    stake_pair( uint8_t even_slot, const input_slot& in0, const asset& amount0,
                                const input_slot& in1, const asset& amount1 ) = 0;
    //ratio in RATIO_PRECISION of the whole pair position
    virtual void    unstake_pair( uint8_t even_slot, const input_slot& in0, const input_slot& in1,
                                  uint64_t ratio ) = 0;
    virtual std::pair<asset, asset> reserves( uint8_t even_slot, const input_slot& in0,
                                              const input_slot& in1 ) const = 0;
};

class balance_reader {
public:
    virtual ~balance_reader() {}
    virtual asset   balance_of( const extended_symbol& token ) const = 0;
};

class vault_events {
public:
    virtual ~vault_events() {}
    virtual void on_deposit( const name& caller, const name& receiver, const asset& assets, const asset& shares ) = 0;
    virtual void on_withdraw( const name& caller, const name& receiver, const name& owner,
                              const asset& assets, const asset& shares ) = 0;
    virtual void on_request( request_kind kind, const request_t& req ) = 0;
    virtual void on_request_canceled( request_kind kind, const request_t& req ) = 0;
    virtual void on_request_claimed( request_kind kind, const request_t& req, const name& receiver, const asset& out ) = 0;
    virtual void on_share_price( const asset& price, const asset& total_assets, const asset& total_supply ) = 0;
    virtual void on_fees_collected( const asset& perf, const asset& mgmt, const asset& entry_exit,
                                    const asset& shares ) = 0;
    virtual void on_fees_updated( const fees_t& fees ) = 0;
    virtual void on_max_total_assets( const asset& max_total_assets ) = 0;
    virtual void on_allocation( bool investing, uint8_t slot, const asset& target, const asset& realized ) = 0;
};

} //namespace yieldfi
