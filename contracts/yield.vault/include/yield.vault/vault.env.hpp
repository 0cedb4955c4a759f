#pragma once

#include <yield.vault/yield.vault.db.hpp>
#include <yield.vault/vault.iface.hpp>
#include <yield.vault/share.ledger.hpp>
#include <yield.vault/fee.engine.hpp>
#include <yield.vault/request.queue.hpp>
#include <yield.vault/allocation.engine.hpp>
#include <price.oracle/price.oracle.states.hpp>

#include <memory>

namespace yieldfi {

class table_share_registry : public share_registry {
public:
    table_share_registry( const name& self, const global_t& g );

    asset   balance_of( const name& owner ) const override;
    void    credit( const name& owner, const asset& shares ) override;
    void    debit( const name& owner, const asset& shares ) override;
    bool    is_operator( const name& owner, const name& op ) const override;
    bool    is_exempt( const name& account ) const override;

private:
    name                _self;
    const global_t&     _g;
    share_t::tbl_t      _shares;
};

class table_request_store : public request_store {
public:
    explicit table_request_store( const name& self ): _self(self) {}

    std::optional<request_t>    find( request_kind kind, const name& controller ) const override;
    void                        put( request_kind kind, const request_t& req ) override;
    void                        erase( request_kind kind, const name& controller ) override;
    std::optional<settlement_t> settlement_for( request_kind kind, uint64_t request_id ) const override;
    void                        put_settlement( request_kind kind, const settlement_t& s ) override;
    void                        erase_settlement( request_kind kind, uint64_t last_request_id ) override;

private:
    name    _self;
};

// prices from the price.oracle global table, quoted in its quote symbol
class oracle_price_source : public price_source {
public:
    explicit oracle_price_source( const name& oracle ): _oracle(oracle) {}

    bool    has_feed( const extended_symbol& token ) const override;
    asset   convert( const extended_asset& from, const extended_symbol& to ) const override;

private:
    const price_global_t& _price_conf() const;
    uint64_t              _price( const symbol& sym ) const;

    name                                            _oracle;
    mutable std::unique_ptr<price_global_t::idx_t>  _global_prices_tbl_ptr;
    mutable std::unique_ptr<price_global_t>         _global_prices_ptr;
};

class token_swapper : public swapper {
public:
    token_swapper( const name& self, const name& swap_contract ): _self(self), _swap_contract(swap_contract) {}

    void swap( const extended_asset& from, const extended_symbol& to, const string& params ) override;

private:
    name    _self;
    name    _swap_contract;
};

class position_adapter : public protocol_adapter {
public:
    explicit position_adapter( const name& self ): _self(self) {}

    adapter_abi detect_abi( const name& position ) const override;
    asset   position_value( uint8_t slot, const input_slot& input ) const override;
    void    stake( uint8_t slot, const input_slot& input, const asset& amount ) override;
    void    unstake( uint8_t slot, const input_slot& input, const asset& amount ) override;
    void    stake_pair( uint8_t even_slot, const input_slot& in0, const asset& amount0,
                        const input_slot& in1, const asset& amount1 ) override;
    void    unstake_pair( uint8_t even_slot, const input_slot& in0, const input_slot& in1,
                          uint64_t ratio ) override;
    std::pair<asset, asset> reserves( uint8_t even_slot, const input_slot& in0,
                                      const input_slot& in1 ) const override;

private:
    name    _self;
};

class token_balance_reader : public balance_reader {
public:
    explicit token_balance_reader( const name& self ): _self(self) {}

    asset   balance_of( const extended_symbol& token ) const override;

private:
    name    _self;
};

// vault events as self-notifying inline actions
class notify_events : public vault_events {
public:
    explicit notify_events( const name& self ): _self(self) {}

    void on_deposit( const name& caller, const name& receiver, const asset& assets, const asset& shares ) override;
    void on_withdraw( const name& caller, const name& receiver, const name& owner,
                      const asset& assets, const asset& shares ) override;
    void on_request( request_kind kind, const request_t& req ) override;
    void on_request_canceled( request_kind kind, const request_t& req ) override;
    void on_request_claimed( request_kind kind, const request_t& req, const name& receiver, const asset& out ) override;
    void on_share_price( const asset& price, const asset& total_assets, const asset& total_supply ) override;
    void on_fees_collected( const asset& perf, const asset& mgmt, const asset& entry_exit,
                            const asset& shares ) override;
    void on_fees_updated( const fees_t& fees ) override;
    void on_max_total_assets( const asset& max_total_assets ) override;
    void on_allocation( bool investing, uint8_t slot, const asset& target, const asset& realized ) override;

private:
    name    _self;
};

/**
 * @brief table- and action-backed collaborators wired to the core
 *
 * The input book is loaded from the `inputs` table on construction and
 * written back by save_inputs().
 */
class vault_env {
public:
    vault_env( const name& self, global_t& g );

    share_ledger&       ledger()    { return _ledger; }
    fee_engine&         fees()      { return _fees; }
    request_queue&      queue()     { return _queue; }
    allocation_engine&  engine()    { return _engine; }
    input_book&         inputs()    { return _inputs; }

    void                save_inputs();

private:
    name                    _self;
    global_t&               _g;
    input_book              _inputs;

    table_share_registry    _shares;
    table_request_store     _requests;
    oracle_price_source     _prices;
    token_swapper           _swaps;
    position_adapter        _adapter;
    token_balance_reader    _balances;
    notify_events           _events;

    share_ledger            _ledger;
    fee_engine              _fees;
    request_queue           _queue;
    allocation_engine       _engine;
};

} //namespace yieldfi
