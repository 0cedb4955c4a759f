#pragma once

#include <yield.alloc/yield.alloc.db.hpp>
#include <yield.alloc/strategy.book.hpp>

namespace yieldfi {

class table_strategy_store : public strategy_store {
public:
    explicit table_strategy_store( const name& self ): _self(self), _strategies(self, self.value) {}

    std::optional<strategy_info>    find( const name& strategy ) const override;
    void                            put( const strategy_info& info ) override;
    void                            erase( const name& strategy ) override;
    vector<strategy_info>           all() const override;

private:
    name                _self;
    strategy_t::tbl_t   _strategies;
};

class token_fund_router : public fund_router {
public:
    token_fund_router( const name& self, const extended_symbol& token ): _self(self), _token(token) {}

    void send( const name& strategy, const asset& amount ) override;
    void recall( const name& strategy, const asset& amount, const asset& min_out ) override;
    void pay( const name& to, const asset& amount ) override;

private:
    name                _self;
    extended_symbol     _token;
};

class token_crate_balance : public crate_balance {
public:
    token_crate_balance( const name& self, const extended_symbol& token ): _self(self), _token(token) {}

    asset balance() const override;

private:
    name                _self;
    extended_symbol     _token;
};

class notify_alloc_events : public alloc_events {
public:
    explicit notify_alloc_events( const name& self ): _self(self) {}

    void on_withdraw( const name& to, const asset& amount ) override;
    void on_chain_debt( const asset& total_chain_debt ) override;
    void on_strategy_added( const strategy_info& info ) override;
    void on_max_deposit( const name& strategy, const asset& max_deposit ) override;
    void on_position( const name& strategy, const asset& debt, const asset& assets_available ) override;
    void on_strategy_update( const name& strategy, bool whitelisted, bool retired ) override;
    void on_deposit( const name& strategy, const asset& amount ) override;
    void on_losses( const name& strategy, const asset& loss ) override;
    void on_panic_liquidate( const name& strategy, const asset& received ) override;
    void on_panic( const name& strategy, bool panicked ) override;

private:
    name    _self;
};

class alloc_env {
public:
    alloc_env( const name& self, alloc_state& state ):
        _store(self), _router(self, state.token), _crate(self, state.token), _events(self),
        _book(state, _store, _router, _crate, _events) {}

    strategy_book&  book()  { return _book; }

private:
    table_strategy_store    _store;
    token_fund_router       _router;
    token_crate_balance     _crate;
    notify_alloc_events     _events;
    strategy_book           _book;
};

} //namespace yieldfi
