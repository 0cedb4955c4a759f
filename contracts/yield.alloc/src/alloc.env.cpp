#include <yield.alloc/alloc.env.hpp>
#include <yield.alloc/yield.alloc.hpp>
#include <strategy/strategy.hpp>
#include <token/token.hpp>
#include <yieldfi/errors.hpp>

namespace yieldfi {

using yieldfi_token::active_perm;

#define NOTIFY(action_type, ...) \
    {   yield_alloc::action_type act{ _self, { {_self, active_perm} } };\
            act.send( __VA_ARGS__ );}

std::optional<strategy_info> table_strategy_store::find( const name& strategy ) const {
    auto itr = _strategies.find(strategy.value);
    if (itr == _strategies.end()) return std::nullopt;
    return itr->info;
}

void table_strategy_store::put( const strategy_info& info ) {
    auto itr = _strategies.find(info.strategy.value);
    if (itr == _strategies.end()) {
        _strategies.emplace(_self, [&]( auto& row ) { row.info = info; });
        return;
    }
    _strategies.modify(itr, same_payer, [&]( auto& row ) { row.info = info; });
}

void table_strategy_store::erase( const name& strategy ) {
    auto itr = _strategies.find(strategy.value);
    CHECKC( itr != _strategies.end(), err::RECORD_NOT_FOUND, "strategy not found: " + strategy.to_string() )
    _strategies.erase(itr);
}

vector<strategy_info> table_strategy_store::all() const {
    vector<strategy_info> infos;
    for (auto itr = _strategies.begin(); itr != _strategies.end(); itr++) {
        infos.push_back(itr->info);
    }
    return infos;
}

void token_fund_router::send( const name& strategy, const asset& amount ) {
    TRANSFER( _token.get_contract(), strategy, amount, yieldfi_strategy::DISPATCH_MEMO )
}

void token_fund_router::recall( const name& strategy, const asset& amount, const asset& min_out ) {
    yieldfi_strategy::strategy::recall_action act{ strategy, { {_self, active_perm} } };
    act.send( _self, amount, min_out );
}

void token_fund_router::pay( const name& to, const asset& amount ) {
    TRANSFER( _token.get_contract(), to, amount, "crate withdraw" )
}

asset token_crate_balance::balance() const {
    return yieldfi_token::token::get_balance(_token.get_contract(), _self, _token.get_symbol());
}

void notify_alloc_events::on_withdraw( const name& to, const asset& amount ) {
    NOTIFY( notifywdraw_action, to, amount )
}

void notify_alloc_events::on_chain_debt( const asset& total_chain_debt ) {
    NOTIFY( notifydebt_action, total_chain_debt )
}

void notify_alloc_events::on_strategy_added( const strategy_info& info ) {
    NOTIFY( notifyadded_action, info )
}

void notify_alloc_events::on_max_deposit( const name& strategy, const asset& max_deposit ) {
    NOTIFY( notifymaxdep_action, strategy, max_deposit )
}

void notify_alloc_events::on_position( const name& strategy, const asset& debt, const asset& assets_available ) {
    NOTIFY( notifypos_action, strategy, debt, assets_available )
}

void notify_alloc_events::on_strategy_update( const name& strategy, bool whitelisted, bool retired ) {
    NOTIFY( notifyupdate_action, strategy, whitelisted, retired )
}

void notify_alloc_events::on_deposit( const name& strategy, const asset& amount ) {
    NOTIFY( notifydepo_action, strategy, amount )
}

void notify_alloc_events::on_losses( const name& strategy, const asset& loss ) {
    NOTIFY( notifyloss_action, strategy, loss )
}

void notify_alloc_events::on_panic_liquidate( const name& strategy, const asset& received ) {
    NOTIFY( notifypanliq_action, strategy, received )
}

void notify_alloc_events::on_panic( const name& strategy, bool panicked ) {
    NOTIFY( notifypanic_action, strategy, panicked )
}

} //namespace yieldfi
