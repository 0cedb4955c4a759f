#include <yield.alloc/strategy.book.hpp>
#include <yieldfi/errors.hpp>

#include <map>

namespace yieldfi {

strategy_book::strategy_book( alloc_state& state, strategy_store& store, fund_router& router,
                              const crate_balance& crate, alloc_events& events ):
    _state(state), _store(store), _router(router), _crate(crate), _events(events) {}

strategy_info strategy_book::_get( const name& strategy ) const {
    auto info = _store.find(strategy);
    CHECKC( info, err::RECORD_NOT_FOUND, "strategy not found: " + strategy.to_string() )
    return *info;
}

void strategy_book::_check_amount( const asset& amount ) const {
    CHECKC( amount.symbol == _state.token.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch: " + amount.to_string() )
    CHECKC( amount.amount >= 0, err::PARAM_ERROR, "negative amount" )
}

asset strategy_book::free_balance() const {
    return _crate.balance();
}

void strategy_book::add_strategy( const name& strategy, const string& label, const asset& max_deposit,
                                  const time_point_sec& now ) {
    CHECKC( strategy != name(),         err::ADDRESS_IS_ZERO,   "strategy is empty" )
    CHECKC( !_store.find(strategy),     err::RECORD_EXISTING,   "strategy exists: " + strategy.to_string() )
    CHECKC( label.size() <= 64,         err::PARAM_ERROR,       "label too long" )
    _check_amount(max_deposit);

    strategy_info info;
    info.strategy                   = strategy;
    info.label                      = label;
    info.max_deposit                = max_deposit;
    info.debt                       = asset(0, max_deposit.symbol);
    info.total_assets_available     = asset(0, max_deposit.symbol);
    info.added_at                   = now;
    info.updated_at                 = now;
    _store.put(info);
    _events.on_strategy_added(info);
}

void strategy_book::set_strategy( const name& strategy, bool whitelisted, const time_point_sec& now ) {
    auto info           = _get(strategy);
    info.whitelisted    = whitelisted;
    info.updated_at     = now;
    _store.put(info);
    _events.on_strategy_update(strategy, whitelisted, false);
}

void strategy_book::set_max_deposit( const name& strategy, const asset& max_deposit, const time_point_sec& now ) {
    _check_amount(max_deposit);
    auto info           = _get(strategy);
    info.max_deposit    = max_deposit;
    info.updated_at     = now;
    _store.put(info);
    _events.on_max_deposit(strategy, max_deposit);
}

void strategy_book::set_panic( const name& strategy, bool panicked, const time_point_sec& now ) {
    auto info           = _get(strategy);
    info.panicked       = panicked;
    info.updated_at     = now;
    _store.put(info);
    _events.on_panic(strategy, panicked);
}

void strategy_book::retire( const name& strategy ) {
    auto info = _get(strategy);
    CHECKC( info.debt.amount == 0, err::CANT_UPDATE_CRATE, "strategy still owes " + info.debt.to_string() )
    CHECKC( !_state.recall || _state.recall->strategy != strategy, err::REENTRANT_CALL, "recall in flight" )
    _store.erase(strategy);
    _events.on_strategy_update(strategy, false, true);
}

void strategy_book::dispatch( const vector<asset>& amounts, const vector<name>& strategies, const time_point_sec& now ) {
    CHECKC( amounts.size() == strategies.size(), err::INCORRECT_ARRAY_LENGTHS, "amounts and strategies differ in length" )
    CHECKC( !amounts.empty(),                    err::PARAM_ERROR,             "nothing to dispatch" )
    CHECKC( !_state.recall,                      err::REENTRANT_CALL,          "recall in flight" )

    //validate every leg before moving funds
    map<name, strategy_info> infos;
    auto total = asset(0, _state.token.get_symbol());
    for (size_t i = 0; i < amounts.size(); i++) {
        _check_amount(amounts[i]);
        if (!infos.count(strategies[i])) infos[strategies[i]] = _get(strategies[i]);
        auto& info = infos[strategies[i]];
        CHECKC( info.whitelisted,   err::NOT_WHITELISTED,   "strategy not whitelisted: " + strategies[i].to_string() )
        CHECKC( !info.panicked,     err::STRATEGY_PANICKED, "strategy panicked: " + strategies[i].to_string() )
        info.debt += amounts[i];
        CHECKC( info.debt <= info.max_deposit, err::MAX_DEPOSIT_REACHED,
                "max deposit reached: " + strategies[i].to_string() )
        total += amounts[i];
    }
    CHECKC( total <= free_balance(), err::INSUFFICIENT_FUNDS, "crate holds " + free_balance().to_string() )

    for (size_t i = 0; i < amounts.size(); i++) {
        if (amounts[i].amount == 0) continue;
        _router.send(strategies[i], amounts[i]);
        _events.on_deposit(strategies[i], amounts[i]);
    }
    for (auto& item : infos) {
        auto& info      = item.second;
        info.updated_at = now;
        _store.put(info);
        _events.on_position(info.strategy, info.debt, info.total_assets_available);
    }
    _state.total_chain_debt += total;
    _events.on_chain_debt(_state.total_chain_debt);
}

recall_t strategy_book::begin_recall( const asset& amount, const asset& min_out, const name& strategy, bool panic ) {
    CHECKC( !_state.recall, err::REENTRANT_CALL, "recall in flight" )
    _check_amount(amount);
    _check_amount(min_out);
    CHECKC( amount.amount > 0, err::AMOUNT_TOO_LOW, "amount must be positive" )
    auto info = _get(strategy);
    if (panic)
        CHECKC( info.panicked, err::WRONG_REQUEST, "strategy not panicked: " + strategy.to_string() )

    recall_t recall;
    recall.strategy         = strategy;
    recall.amount           = amount;
    recall.min_out          = panic ? asset(0, amount.symbol) : min_out;
    recall.balance_before   = _crate.balance();
    recall.panic            = panic;
    _state.recall           = recall;

    _router.recall(strategy, amount, recall.min_out);
    return recall;
}

asset strategy_book::settle_recall( const time_point_sec& now ) {
    CHECKC( _state.recall, err::WRONG_REQUEST, "no recall in flight" )
    auto recall     = *_state.recall;
    auto received   = _crate.balance() - recall.balance_before;
    CHECKC( received.amount >= 0, err::SYSTEM_ERROR, "crate balance dropped during recall" )
    if (!recall.panic)
        CHECKC( received >= recall.min_out, err::AMOUNT_TOO_LOW, "recalled " + received.to_string() )

    auto info   = _get(recall.strategy);
    auto repaid = recall.amount < info.debt ? recall.amount : info.debt;
    info.debt                   -= repaid;
    info.updated_at             = now;
    _store.put(info);
    _state.total_chain_debt     -= repaid;
    _state.recall.reset();

    if (received < recall.amount)
        _events.on_losses(recall.strategy, recall.amount - received);
    if (recall.panic)
        _events.on_panic_liquidate(recall.strategy, received);
    _events.on_position(info.strategy, info.debt, info.total_assets_available);
    _events.on_chain_debt(_state.total_chain_debt);
    return received;
}

asset strategy_book::liquidate_strategy( const asset& amount, const asset& min_out, const name& strategy,
                                         const time_point_sec& now ) {
    begin_recall(amount, min_out, strategy, false);
    return settle_recall(now);
}

asset strategy_book::panic_liquidate( const asset& amount, const name& strategy, const time_point_sec& now ) {
    begin_recall(amount, asset(0, amount.symbol), strategy, true);
    return settle_recall(now);
}

void strategy_book::update_debt( const name& caller, const asset& debt, const asset& assets_available,
                                 const time_point_sec& now ) {
    auto info = _store.find(caller);
    CHECKC( info, err::UNAUTHORIZED, "not a registered strategy: " + caller.to_string() )
    _check_amount(debt);
    _check_amount(assets_available);
    if (!info->panicked)
        CHECKC( debt <= info->max_deposit, err::MAX_DEPOSIT_REACHED, "debt above max deposit: " + debt.to_string() )

    _state.total_chain_debt         = _state.total_chain_debt - info->debt + debt;
    info->debt                      = debt;
    info->total_assets_available    = assets_available;
    info->updated_at                = now;
    _store.put(*info);

    _events.on_position(caller, debt, assets_available);
    _events.on_chain_debt(_state.total_chain_debt);
}

void strategy_book::withdraw( const name& to, const asset& amount ) {
    CHECKC( to != name(),       err::ADDRESS_IS_ZERO,   "recipient is empty" )
    CHECKC( !_state.recall,     err::REENTRANT_CALL,    "recall in flight" )
    _check_amount(amount);
    CHECKC( amount.amount > 0,  err::AMOUNT_TOO_LOW,    "amount must be positive" )
    CHECKC( amount <= free_balance(), err::INSUFFICIENT_FUNDS, "crate holds " + free_balance().to_string() )
    _router.pay(to, amount);
    _events.on_withdraw(to, amount);
}

vector<strategy_info> strategy_book::strategy_map() const {
    return _store.all();
}

} //namespace yieldfi
