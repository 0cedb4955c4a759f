#pragma once

#include <yield.alloc/alloc.types.hpp>

namespace yieldfi {

class strategy_store {
public:
    virtual ~strategy_store() {}
    virtual std::optional<strategy_info>    find( const name& strategy ) const = 0;
    virtual void                            put( const strategy_info& info ) = 0;
    virtual void                            erase( const name& strategy ) = 0;
    virtual vector<strategy_info>           all() const = 0;
};

/**
 * @brief moves crate funds
 *
 * send() hands capital to a strategy entry point, recall() asks a strategy
 * to return `amount`; the returned funds show up in the crate balance.
 */
class fund_router {
public:
    virtual ~fund_router() {}
    virtual void send( const name& strategy, const asset& amount ) = 0;
    virtual void recall( const name& strategy, const asset& amount, const asset& min_out ) = 0;
    virtual void pay( const name& to, const asset& amount ) = 0;
};

class crate_balance {
public:
    virtual ~crate_balance() {}
    virtual asset balance() const = 0;
};

class alloc_events {
public:
    virtual ~alloc_events() {}
    virtual void on_withdraw( const name& to, const asset& amount ) = 0;
    virtual void on_chain_debt( const asset& total_chain_debt ) = 0;
    virtual void on_strategy_added( const strategy_info& info ) = 0;
    virtual void on_max_deposit( const name& strategy, const asset& max_deposit ) = 0;
    virtual void on_position( const name& strategy, const asset& debt, const asset& assets_available ) = 0;
    virtual void on_strategy_update( const name& strategy, bool whitelisted, bool retired ) = 0;
    virtual void on_deposit( const name& strategy, const asset& amount ) = 0;
    virtual void on_losses( const name& strategy, const asset& loss ) = 0;
    virtual void on_panic_liquidate( const name& strategy, const asset& received ) = 0;
    virtual void on_panic( const name& strategy, bool panicked ) = 0;
};

} //namespace yieldfi
