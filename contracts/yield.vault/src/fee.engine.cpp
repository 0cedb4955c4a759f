#include <yield.vault/fee.engine.hpp>
#include <yield.vault/share.ledger.hpp>
#include <yieldfi/errors.hpp>

#include "safemath.hpp"

namespace yieldfi {

using namespace wasm::safemath;

asset calc_fee( const asset& assets, uint16_t fee_bps ) {
    if (fee_bps == 0 || assets.amount <= 0) return asset(0, assets.symbol);
    return asset( mul_up64(assets.amount, fee_bps, PCT_BOOST), assets.symbol );
}

asset gross_up( const asset& net, uint16_t fee_bps ) {
    if (fee_bps == 0) return net;
    CHECKC( fee_bps < PCT_BOOST, err::PARAM_ERROR, "fee must be below 100%" )
    return asset( mul_up64(net.amount, PCT_BOOST, PCT_BOOST - fee_bps), net.symbol );
}

void check_fees( const fees_t& fees ) {
    CHECKC( fees.perf <= MAX_FEES.perf,     err::AMOUNT_TOO_HIGH, "perf fee above " + to_string(MAX_FEES.perf) )
    CHECKC( fees.mgmt <= MAX_FEES.mgmt,     err::AMOUNT_TOO_HIGH, "mgmt fee above " + to_string(MAX_FEES.mgmt) )
    CHECKC( fees.entry <= MAX_FEES.entry,   err::AMOUNT_TOO_HIGH, "entry fee above " + to_string(MAX_FEES.entry) )
    CHECKC( fees.exit <= MAX_FEES.exit,     err::AMOUNT_TOO_HIGH, "exit fee above " + to_string(MAX_FEES.exit) )
}

fee_engine::fee_engine( vault_state& state, share_ledger& ledger, vault_events& events ):
    _state(state), _ledger(ledger), _events(events) {}

void fee_engine::set_fees( const fees_t& fees ) {
    check_fees(fees);
    _state.fees = fees;
    _events.on_fees_updated(fees);
}

fee_quote fee_engine::preview( const time_point_sec& now ) const {
    const auto& sym = _state.asset_token.get_symbol();
    fee_quote quote;
    quote.perf          = asset(0, sym);
    quote.mgmt          = asset(0, sym);
    quote.entry_exit    = _state.claimable_asset_fees;
    quote.total         = _state.claimable_asset_fees;
    quote.due           = now.sec_since_epoch() >= _state.last_fee_collection.sec_since_epoch() + _state.profit_cooldown;
    if (_state.total_supply.amount == 0) return quote;

    auto ta         = _ledger.total_assets();
    //value of the supply at the last checkpoint price
    auto watermark  = mul_down64(_state.last_share_price.amount, _state.total_supply.amount, _ledger.wei_per_share());
    auto profit     = ta.amount - _state.claimable_asset_fees.amount - watermark;
    if (profit > 0)
        quote.perf  = asset( mul_down64(profit, _state.fees.perf, PCT_BOOST), sym );

    int64_t elapsed = 0;
    if (now > _state.last_fee_collection)
        elapsed     = now.sec_since_epoch() - _state.last_fee_collection.sec_since_epoch();
    quote.mgmt      = asset( mul_down64((int128_t)ta.amount * _state.fees.mgmt, elapsed, (int128_t)PCT_BOOST * YEAR_SECONDS), sym );

    quote.total     = quote.perf + quote.mgmt + quote.entry_exit;
    if (quote.total > ta) quote.total = ta;
    return quote;
}

asset fee_engine::collect( const time_point_sec& now ) {
    auto zero = asset(0, _state.share_sym);
    auto quote = preview(now);
    if (!quote.due) return zero;

    auto shares = zero;
    if (_state.total_supply.amount > 0 && quote.total.amount > 0) {
        CHECKC( _state.fee_collector != name(), err::ADDRESS_IS_ZERO, "fee collector not set" )
        shares = _ledger.convert_to_shares(quote.total, rounding::DOWN);
        if (shares.amount > 0)
            _ledger.issue(_state.fee_collector, shares);
        _state.claimable_asset_fees.amount = 0;
    }

    //checkpoint rounded up so price precision never shows up as profit
    auto ta = _ledger.total_assets();
    _state.last_share_price     = _state.total_supply.amount == 0 ? _ledger.share_price()
                                : asset( mul_up64(ta.amount, _ledger.wei_per_share(), _state.total_supply.amount), ta.symbol );
    _state.last_fee_collection  = now;

    _events.on_fees_collected(quote.perf, quote.mgmt, quote.entry_exit, shares);
    _ledger.emit_share_price();
    return shares;
}

} //namespace yieldfi
