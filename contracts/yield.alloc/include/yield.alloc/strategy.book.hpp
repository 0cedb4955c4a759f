#pragma once

#include <yield.alloc/alloc.iface.hpp>

namespace yieldfi {

/**
 * @brief debt accounting of the strategies fed by one crate
 *
 * total_chain_debt is kept equal to the sum of every strategy's debt.
 * Recalls run in two phases: begin_recall() asks the strategy for funds,
 * settle_recall() measures what came back.
 */
class strategy_book {
public:
    strategy_book( alloc_state& state, strategy_store& store, fund_router& router,
                   const crate_balance& crate, alloc_events& events );

    void            add_strategy( const name& strategy, const string& label, const asset& max_deposit,
                                  const time_point_sec& now );
    void            set_strategy( const name& strategy, bool whitelisted, const time_point_sec& now );
    void            set_max_deposit( const name& strategy, const asset& max_deposit, const time_point_sec& now );
    void            set_panic( const name& strategy, bool panicked, const time_point_sec& now );
    void            retire( const name& strategy );

    void            dispatch( const vector<asset>& amounts, const vector<name>& strategies, const time_point_sec& now );

    recall_t        begin_recall( const asset& amount, const asset& min_out, const name& strategy, bool panic );
    asset           settle_recall( const time_point_sec& now );

    // both phases, for routers that return funds synchronously
    asset           liquidate_strategy( const asset& amount, const asset& min_out, const name& strategy,
                                        const time_point_sec& now );
    asset           panic_liquidate( const asset& amount, const name& strategy, const time_point_sec& now );

    void            update_debt( const name& caller, const asset& debt, const asset& assets_available,
                                 const time_point_sec& now );
    void            withdraw( const name& to, const asset& amount );

    vector<strategy_info>   strategy_map() const;
    asset                   free_balance() const;

private:
    strategy_info   _get( const name& strategy ) const;
    void            _check_amount( const asset& amount ) const;

    alloc_state&            _state;
    strategy_store&         _store;
    fund_router&            _router;
    const crate_balance&    _crate;
    alloc_events&           _events;
};

} //namespace yieldfi
