#include <yield.vault/request.queue.hpp>
#include <yield.vault/fee.engine.hpp>
#include <yieldfi/errors.hpp>

#include "safemath.hpp"

namespace yieldfi {

using namespace wasm::safemath;

request_queue::request_queue( vault_state& state, share_ledger& ledger, share_registry& shares, request_store& store,
                              const price_source& prices, const input_book& inputs, vault_events& events ):
    _state(state), _ledger(ledger), _shares(shares), _store(store),
    _prices(prices), _inputs(inputs), _events(events) {}

void request_queue::check_oracles() const {
    bool foreign = false;
    for (const auto& input : _inputs) {
        if (!input || input->same_as(_state.asset_token)) continue;
        CHECKC( _prices.has_feed(input->token), err::MISSING_ORACLE,
                "missing oracle: " + input->token.get_symbol().code().to_string() )
        foreign = true;
    }
    if (foreign) {
        CHECKC( _prices.has_feed(_state.asset_token), err::MISSING_ORACLE,
                "missing oracle: " + _state.asset_token.get_symbol().code().to_string() )
    }
}

uint64_t request_queue::_next_id() {
    if (_state.last_request_id == std::numeric_limits<uint64_t>::max())
        _state.last_request_id = 0;
    return ++_state.last_request_id;
}

void request_queue::_check_no_request( request_kind kind, const name& controller ) const {
    CHECKC( !_store.find(kind, controller), err::WRONG_REQUEST,
            "request already open for " + controller.to_string() )
}

request_t request_queue::_pending( request_kind kind, const name& controller ) const {
    auto req = _store.find(kind, controller);
    CHECKC( req, err::WRONG_REQUEST, "no request for " + controller.to_string() )
    return *req;
}

bool request_queue::is_settled( request_kind kind, const request_t& req ) const {
    return (bool)_store.settlement_for(kind, req.id);
}

void request_queue::_reset_deposit_escrow() {
    const auto& sym = _state.asset_token.get_symbol();
    _state.total_deposit_request    = asset(0, sym);
    _state.exempt_deposit_request   = asset(0, sym);
    _state.deposit_token            = _state.asset_token;
}

void request_queue::_close_settlement( request_kind kind, settlement_t& s ) {
    if (s.open_requests <= 1) {
        _store.erase_settlement(kind, s.last_request_id);
        return;
    }
    s.open_requests--;
    _store.put_settlement(kind, s);
}

request_t request_queue::request_deposit( const name& controller, const name& owner, const asset& assets,
                                          const time_point_sec& now ) {
    CHECKC( !_state.paused,                 err::PAUSED,            "vault paused" )
    CHECKC( controller != name(),           err::ADDRESS_IS_ZERO,   "controller is empty" )
    CHECKC( assets.amount > 0,              err::AMOUNT_TOO_LOW,    "amount must be positive" )
    CHECKC( assets.symbol == _state.asset_token.get_symbol(), err::WRONG_TOKEN, "not the vault asset" )
    CHECKC( _state.total_deposit_request.amount == 0 || _state.deposit_token == _state.asset_token, err::WRONG_TOKEN,
            "deposit requests pending in a previous asset" )
    //funding someone else's request needs their operator approval
    _ledger.check_owner(owner, controller);
    _check_no_request(request_kind::DEPOSIT, controller);
    check_oracles();
    if (_state.total_deposit_request.amount == 0) _reset_deposit_escrow();

    auto exempt = _shares.is_exempt(owner);
    if (!exempt) {
        CHECKC( _ledger.seeded(), err::LIQUIDITY_TOO_LOW, "vault not seeded" )
        CHECKC( _ledger.total_assets() + _state.total_deposit_request + assets <= _state.max_total_assets,
                err::AMOUNT_TOO_HIGH, "exceeds max total assets: " + _state.max_total_assets.to_string() )
    }

    request_t req;
    req.id              = _next_id();
    req.controller      = controller;
    req.owner           = owner;
    req.amount          = assets;
    req.token           = _state.asset_token;
    req.requested_at    = now;
    req.exempt          = exempt;
    _store.put(request_kind::DEPOSIT, req);

    _state.total_deposit_request += assets;
    if (exempt) _state.exempt_deposit_request += assets;
    _state.pending_deposit_count++;
    _events.on_request(request_kind::DEPOSIT, req);
    return req;
}

request_t request_queue::request_redeem( const name& controller, const name& owner, const asset& shares,
                                         const time_point_sec& now ) {
    CHECKC( controller != name(),           err::ADDRESS_IS_ZERO,   "controller is empty" )
    CHECKC( shares.symbol == _state.share_sym, err::SYMBOL_MISMATCH, "share symbol mismatch" )
    CHECKC( shares.amount > 0,              err::AMOUNT_TOO_LOW,    "shares must be positive" )
    _ledger.check_owner(controller, owner);
    _check_no_request(request_kind::REDEEM, controller);
    check_oracles();
    CHECKC( shares <= _shares.balance_of(owner), err::AMOUNT_TOO_HIGH, "exceeds shares of " + owner.to_string() )

    _shares.debit(owner, shares);

    request_t req;
    req.id              = _next_id();
    req.controller      = controller;
    req.owner           = owner;
    req.amount          = shares;
    req.token           = _state.asset_token;
    req.requested_at    = now;
    req.exempt          = _shares.is_exempt(owner);
    _store.put(request_kind::REDEEM, req);

    _state.total_redemption_request += shares;
    if (req.exempt) _state.exempt_redemption_request += shares;
    _state.pending_redeem_count++;
    _events.on_request(request_kind::REDEEM, req);
    return req;
}

request_t request_queue::request_withdraw( const name& controller, const name& owner, const asset& assets,
                                           const time_point_sec& now ) {
    CHECKC( assets.symbol == _state.asset_token.get_symbol(), err::SYMBOL_MISMATCH, "asset symbol mismatch" )
    CHECKC( assets.amount > 0, err::AMOUNT_TOO_LOW, "amount must be positive" )
    auto shares = _ledger.preview_withdraw(assets, _shares.is_exempt(owner));
    return request_redeem(controller, owner, shares, now);
}

request_t request_queue::cancel_deposit( const name& controller ) {
    auto req = _pending(request_kind::DEPOSIT, controller);
    CHECKC( !is_settled(request_kind::DEPOSIT, req), err::WRONG_REQUEST, "request already settled" )

    _state.total_deposit_request -= req.amount;
    if (req.exempt) _state.exempt_deposit_request -= req.amount;
    _state.pending_deposit_count--;
    //escrow of a previous asset drained
    if (_state.total_deposit_request.amount == 0) _reset_deposit_escrow();

    _store.erase(request_kind::DEPOSIT, controller);
    _events.on_request_canceled(request_kind::DEPOSIT, req);
    return req;
}

request_t request_queue::cancel_redeem( const name& controller ) {
    auto req = _pending(request_kind::REDEEM, controller);
    CHECKC( !is_settled(request_kind::REDEEM, req), err::WRONG_REQUEST, "request already settled" )

    _state.total_redemption_request -= req.amount;
    if (req.exempt) _state.exempt_redemption_request -= req.amount;
    _state.pending_redeem_count--;
    _shares.credit(req.owner, req.amount);

    _store.erase(request_kind::REDEEM, controller);
    _events.on_request_canceled(request_kind::REDEEM, req);
    return req;
}

bool request_queue::settle( const time_point_sec& now ) {
    bool settled = false;
    const auto& sym = _state.asset_token.get_symbol();

    //escrow left in a previous asset is never booked, only canceled
    if (_state.total_deposit_request.amount > 0 && _state.deposit_token == _state.asset_token) {
        auto gross  = _state.total_deposit_request;
        auto fee    = calc_fee(gross - _state.exempt_deposit_request, _state.fees.entry);
        auto price  = _ledger.share_price();
        auto shares = _ledger.convert_to_shares(gross - fee, rounding::DOWN);

        settlement_t s;
        s.last_request_id   = _state.last_request_id;
        s.share_price       = price;
        s.assets            = gross - fee;
        s.shares            = shares;
        s.fee               = _state.fees.entry;
        s.open_requests     = _state.pending_deposit_count;
        s.settled_at        = now;

        _state.available                += gross;
        _state.claimable_asset_fees     += fee;
        _ledger.issue_escrow(shares);
        _state.total_claimable_deposit  += shares;
        _state.claimable_deposit_count  += _state.pending_deposit_count;
        _state.pending_deposit_count    = 0;
        _reset_deposit_escrow();

        _store.put_settlement(request_kind::DEPOSIT, s);
        settled = true;
    }

    if (_state.total_redemption_request.amount > 0) {
        auto shares = _state.total_redemption_request;
        auto gross  = _ledger.convert_to_assets(shares, rounding::DOWN);
        if (gross <= _state.available) {
            //rounded down here and up per claim, so the claims always fit the reserve
            auto exempt = mul_down64(_state.exempt_redemption_request.amount, gross.amount, shares.amount);
            auto fee    = asset( mul_down64(gross.amount - exempt, _state.fees.exit, PCT_BOOST), sym );
            auto net    = gross - fee;

            settlement_t s;
            s.last_request_id   = _state.last_request_id;
            s.share_price       = _ledger.share_price();
            s.assets            = gross;
            s.shares            = shares;
            s.fee               = _state.fees.exit;
            s.open_requests     = _state.pending_redeem_count;
            s.settled_at        = now;

            _state.available                    -= net;
            _state.claimable_asset_fees         += fee;
            _state.claimable_redemption_assets  += net;
            _ledger.burn_escrow(shares);
            _state.total_claimable_redemption   += shares;
            _state.claimable_redeem_count       += _state.pending_redeem_count;
            _state.pending_redeem_count         = 0;
            _state.total_redemption_request     = asset(0, _state.share_sym);
            _state.exempt_redemption_request    = asset(0, _state.share_sym);

            _store.put_settlement(request_kind::REDEEM, s);
            settled = true;
        }
    }

    if (settled) _ledger.emit_share_price();
    return settled;
}

asset request_queue::claim_deposit( const name& controller, const name& receiver,
                                    const time_point_sec& deadline, const time_point_sec& now ) {
    auto req = _pending(request_kind::DEPOSIT, controller);
    CHECKC( receiver != name(), err::ADDRESS_IS_ZERO, "receiver is empty" )
    CHECKC( now <= deadline, err::TRANSACTION_EXPIRED, "deadline passed" )

    auto settlement = _store.settlement_for(request_kind::DEPOSIT, req.id);
    if (!settlement) {
        CHECKC( req.token == _state.asset_token, err::WRONG_TOKEN, "vault asset changed, cancel the request" )
        CHECKC( false, err::WRONG_REQUEST, "request not settled yet" )
    }

    auto s      = *settlement;
    auto net    = req.exempt ? req.amount : req.amount - calc_fee(req.amount, s.fee);
    auto shares = asset( s.assets.amount == 0 ? 0 : mul_down64(net.amount, s.shares.amount, s.assets.amount),
                         _state.share_sym );
    _state.total_claimable_deposit -= shares;
    _shares.credit(receiver, shares);
    _store.erase(request_kind::DEPOSIT, controller);
    _close_settlement(request_kind::DEPOSIT, s);

    if (--_state.claimable_deposit_count == 0 && _state.total_claimable_deposit.amount > 0) {
        //rounding leftovers go back to the pool
        _ledger.burn_escrow(_state.total_claimable_deposit);
        _state.total_claimable_deposit.amount = 0;
    }

    _events.on_request_claimed(request_kind::DEPOSIT, req, receiver, shares);
    return shares;
}

asset request_queue::claim_redeem( const name& controller, const name& receiver,
                                   const time_point_sec& deadline, const time_point_sec& now ) {
    auto req = _pending(request_kind::REDEEM, controller);
    CHECKC( receiver != name(), err::ADDRESS_IS_ZERO, "receiver is empty" )
    CHECKC( now <= deadline, err::TRANSACTION_EXPIRED, "deadline passed" )

    auto settlement = _store.settlement_for(request_kind::REDEEM, req.id);
    CHECKC( settlement, err::INSUFFICIENT_FUNDS, "redemption not settled, liquidity pending" )

    auto s      = *settlement;
    auto gross  = asset( mul_down64(req.amount.amount, s.assets.amount, s.shares.amount),
                         _state.asset_token.get_symbol() );
    auto assets = req.exempt ? gross : gross - calc_fee(gross, s.fee);
    _state.claimable_redemption_assets  -= assets;
    _state.total_claimable_redemption   -= req.amount;
    _store.erase(request_kind::REDEEM, controller);
    _close_settlement(request_kind::REDEEM, s);

    if (--_state.claimable_redeem_count == 0) {
        _state.available                            += _state.claimable_redemption_assets;
        _state.claimable_redemption_assets.amount   = 0;
        _state.total_claimable_redemption.amount    = 0;
    }

    _events.on_request_claimed(request_kind::REDEEM, req, receiver, assets);
    return assets;
}

asset request_queue::pending_redemption_assets() const {
    if (_state.total_redemption_request.amount == 0) return asset(0, _state.asset_token.get_symbol());
    return _ledger.convert_to_assets(_state.total_redemption_request, rounding::DOWN);
}

asset request_queue::redemption_shortfall() const {
    auto pending = pending_redemption_assets();
    if (pending <= _state.available) return asset(0, pending.symbol);
    return pending - _state.available;
}

} //namespace yieldfi
