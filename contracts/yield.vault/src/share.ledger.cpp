#include <yield.vault/share.ledger.hpp>
#include <yield.vault/fee.engine.hpp>
#include <yieldfi/errors.hpp>
#include <yieldfi/utils.hpp>

#include "safemath.hpp"

namespace yieldfi {

using namespace wasm::safemath;

void init_vault_state( vault_state& state, const extended_symbol& asset_token, const symbol& share_sym,
                       const name& fee_collector, const asset& max_total_assets, const time_point_sec& now ) {
    const auto& sym = asset_token.get_symbol();
    CHECKC( sym.is_valid() && share_sym.is_valid(),       err::PARAM_ERROR,       "invalid symbol" )
    CHECKC( share_sym.precision() == sym.precision(),     err::SYMBOL_MISMATCH,   "share precision must match asset" )
    CHECKC( max_total_assets.symbol == sym,               err::SYMBOL_MISMATCH,   "max total assets symbol mismatch" )

    state.asset_token                   = asset_token;
    state.share_sym                     = share_sym;
    state.total_supply                  = asset(0, share_sym);
    state.available                     = asset(0, sym);
    state.max_total_assets              = max_total_assets;
    state.min_liquidity                 = asset(0, sym);
    state.dust                          = asset(0, sym);
    state.fee_collector                 = fee_collector;
    state.claimable_asset_fees          = asset(0, sym);
    state.last_share_price              = asset(power10(sym.precision()), sym);
    state.last_fee_collection           = now;
    state.total_deposit_request         = asset(0, sym);
    state.deposit_token                 = asset_token;
    state.exempt_deposit_request        = asset(0, sym);
    state.total_redemption_request      = asset(0, share_sym);
    state.exempt_redemption_request     = asset(0, share_sym);
    state.total_claimable_deposit       = asset(0, share_sym);
    state.total_claimable_redemption    = asset(0, share_sym);
    state.claimable_redemption_assets   = asset(0, sym);
}

reentrancy_guard::reentrancy_guard( vault_state& state, bool in_allocation ): _state(state) {
    CHECKC( !_state.locked, err::REENTRANT_CALL, "reentrant call" )
    if (in_allocation) {
        CHECKC( _state.allocating, err::WRONG_REQUEST, "no allocation in flight" )
    } else {
        CHECKC( !_state.allocating, err::REENTRANT_CALL, "allocation in flight" )
    }
    _state.locked = true;
}

reentrancy_guard::~reentrancy_guard() {
    _state.locked = false;
}

share_ledger::share_ledger( vault_state& state, const input_book& inputs, share_registry& shares,
                            vault_events& events, const name& vault ):
    _state(state), _inputs(inputs), _shares(shares), _events(events), _vault(vault) {}

int64_t share_ledger::wei_per_share() const {
    return power10(_state.asset_token.get_symbol().precision());
}

asset share_ledger::invested() const {
    auto total = asset(0, _state.asset_token.get_symbol());
    for (const auto& input : _inputs) {
        if (input) total += input->invested;
    }
    return total;
}

asset share_ledger::total_assets() const {
    return _state.available + invested();
}

asset share_ledger::share_price() const {
    const auto& sym = _state.asset_token.get_symbol();
    if (_state.total_supply.amount == 0) return asset(wei_per_share(), sym);
    return asset( mul_down64(total_assets().amount, wei_per_share(), _state.total_supply.amount), sym );
}

bool share_ledger::seeded() const {
    if (total_assets() < _state.min_liquidity) return false;
    return _state.total_supply.amount > 0 || _state.min_liquidity.amount == 0;
}

asset share_ledger::convert_to_shares( const asset& assets, rounding r ) const {
    _check_asset(assets);
    if (_state.total_supply.amount == 0) return asset(assets.amount, _state.share_sym);

    auto ta = total_assets();
    CHECKC( ta.amount > 0, err::LIQUIDITY_TOO_LOW, "vault holds no assets" )
    auto amount = r == rounding::UP ? mul_up64(assets.amount, _state.total_supply.amount, ta.amount)
                                    : mul_down64(assets.amount, _state.total_supply.amount, ta.amount);
    return asset(amount, _state.share_sym);
}

asset share_ledger::convert_to_assets( const asset& shares, rounding r ) const {
    _check_shares(shares);
    const auto& sym = _state.asset_token.get_symbol();
    if (_state.total_supply.amount == 0) return asset(shares.amount, sym);

    auto ta = total_assets();
    auto amount = r == rounding::UP ? mul_up64(shares.amount, ta.amount, _state.total_supply.amount)
                                    : mul_down64(shares.amount, ta.amount, _state.total_supply.amount);
    return asset(amount, sym);
}

asset share_ledger::preview_deposit( const asset& assets, bool exempt ) const {
    auto fee = exempt ? asset(0, assets.symbol) : calc_fee(assets, _state.fees.entry);
    return convert_to_shares(assets - fee, rounding::DOWN);
}

asset share_ledger::preview_mint( const asset& shares, bool exempt ) const {
    auto net = convert_to_assets(shares, rounding::UP);
    return exempt ? net : gross_up(net, _state.fees.entry);
}

asset share_ledger::preview_withdraw( const asset& assets, bool exempt ) const {
    auto gross = exempt ? assets : gross_up(assets, _state.fees.exit);
    return convert_to_shares(gross, rounding::UP);
}

asset share_ledger::preview_redeem( const asset& shares, bool exempt ) const {
    auto gross = convert_to_assets(shares, rounding::DOWN);
    return exempt ? gross : gross - calc_fee(gross, _state.fees.exit);
}

asset share_ledger::assets_of( const name& owner ) const {
    return convert_to_assets(_shares.balance_of(owner), rounding::DOWN);
}

asset share_ledger::max_withdraw( const name& owner ) const {
    auto out = preview_redeem(_shares.balance_of(owner), _shares.is_exempt(owner));
    return out < _state.available ? out : _state.available;
}

asset share_ledger::max_redeem( const name& owner ) const {
    auto balance = _shares.balance_of(owner);
    if (_state.available.amount == 0) return asset(0, _state.share_sym);
    //shares whose gross value the idle balance still covers
    auto cap = convert_to_shares(_state.available, rounding::DOWN);
    return balance < cap ? balance : cap;
}

void share_ledger::_check_asset( const asset& assets ) const {
    CHECKC( assets.symbol == _state.asset_token.get_symbol(), err::SYMBOL_MISMATCH, "asset symbol mismatch: " + assets.to_string() )
}

void share_ledger::_check_shares( const asset& shares ) const {
    CHECKC( shares.symbol == _state.share_sym, err::SYMBOL_MISMATCH, "share symbol mismatch: " + shares.to_string() )
}

void share_ledger::check_owner( const name& caller, const name& owner ) const {
    CHECKC( caller == owner || _shares.is_operator(owner, caller), err::UNAUTHORIZED,
            caller.to_string() + " is not an operator of " + owner.to_string() )
}

void share_ledger::_check_deposit( const name& caller, const asset& assets, const name& receiver, bool exempt ) const {
    _check_asset(assets);
    CHECKC( !_state.paused,                 err::PAUSED,            "vault paused" )
    CHECKC( assets.amount > 0,              err::AMOUNT_TOO_LOW,    "amount must be positive" )
    CHECKC( receiver != name(),             err::ADDRESS_IS_ZERO,   "receiver is empty" )
    CHECKC( receiver != _vault,             err::UNAUTHORIZED,      "vault cannot mint to itself" )
    if (exempt) return;

    CHECKC( seeded(),                       err::LIQUIDITY_TOO_LOW, "vault not seeded" )
    CHECKC( total_assets() + assets <= _state.max_total_assets, err::AMOUNT_TOO_HIGH,
            "exceeds max total assets: " + _state.max_total_assets.to_string() )
}

asset share_ledger::seed( const name& caller, const asset& assets, const name& receiver ) {
    _check_asset(assets);
    CHECKC( assets.amount > 0,                              err::AMOUNT_TOO_LOW,    "amount must be positive" )
    CHECKC( receiver != name() && receiver != _vault,       err::ADDRESS_IS_ZERO,   "invalid receiver" )
    CHECKC( total_assets() + assets >= _state.min_liquidity, err::LIQUIDITY_TOO_LOW,
            "seed below min liquidity: " + _state.min_liquidity.to_string() )

    auto shares = convert_to_shares(assets, rounding::DOWN);
    CHECKC( shares.amount > 0, err::AMOUNT_TOO_LOW, "zero shares" )

    _state.available    += assets;
    issue(receiver, shares);
    _events.on_deposit(caller, receiver, assets, shares);
    emit_share_price();
    return shares;
}

asset share_ledger::deposit( const name& caller, const asset& assets, const name& receiver ) {
    auto exempt = _shares.is_exempt(caller);
    _check_deposit(caller, assets, receiver, exempt);

    auto fee    = exempt ? asset(0, assets.symbol) : calc_fee(assets, _state.fees.entry);
    auto shares = convert_to_shares(assets - fee, rounding::DOWN);
    CHECKC( shares.amount > 0, err::AMOUNT_TOO_LOW, "zero shares" )

    _state.available            += assets;
    _state.claimable_asset_fees += fee;
    issue(receiver, shares);

    _events.on_deposit(caller, receiver, assets, shares);
    emit_share_price();
    return shares;
}

asset share_ledger::mint( const name& caller, const asset& shares, const name& receiver, const asset& paid ) {
    _check_shares(shares);
    CHECKC( shares.amount > 0, err::AMOUNT_TOO_LOW, "shares must be positive" )
    auto exempt = _shares.is_exempt(caller);
    auto net    = convert_to_assets(shares, rounding::UP);
    auto gross  = exempt ? net : gross_up(net, _state.fees.entry);
    CHECKC( gross <= paid, err::AMOUNT_TOO_LOW, "mint requires " + gross.to_string() )
    _check_deposit(caller, gross, receiver, exempt);

    _state.available            += gross;
    _state.claimable_asset_fees += gross - net;
    issue(receiver, shares);

    _events.on_deposit(caller, receiver, gross, shares);
    emit_share_price();
    return gross;
}

asset share_ledger::withdraw( const name& caller, const asset& assets, const name& receiver, const name& owner ) {
    _check_asset(assets);
    CHECKC( assets.amount > 0,      err::AMOUNT_TOO_LOW,    "amount must be positive" )
    CHECKC( receiver != name(),     err::ADDRESS_IS_ZERO,   "receiver is empty" )
    check_owner(caller, owner);

    auto exempt = _shares.is_exempt(owner);
    auto gross  = exempt ? assets : gross_up(assets, _state.fees.exit);
    auto shares = convert_to_shares(gross, rounding::UP);
    CHECKC( shares <= _shares.balance_of(owner), err::AMOUNT_TOO_HIGH,
            "exceeds assets of " + owner.to_string() )
    CHECKC( assets <= _state.available, err::INSUFFICIENT_FUNDS,
            "insufficient liquidity: " + _state.available.to_string() )

    _shares.debit(owner, shares);
    _state.total_supply         -= shares;
    _state.available            -= assets;
    _state.claimable_asset_fees += gross - assets;

    _events.on_withdraw(caller, receiver, owner, assets, shares);
    emit_share_price();
    return shares;
}

asset share_ledger::redeem( const name& caller, const asset& shares, const name& receiver, const name& owner ) {
    _check_shares(shares);
    CHECKC( shares.amount > 0,      err::AMOUNT_TOO_LOW,    "shares must be positive" )
    CHECKC( receiver != name(),     err::ADDRESS_IS_ZERO,   "receiver is empty" )
    check_owner(caller, owner);
    CHECKC( shares <= _shares.balance_of(owner), err::AMOUNT_TOO_HIGH, "exceeds shares of " + owner.to_string() )

    auto gross  = convert_to_assets(shares, rounding::DOWN);
    auto fee    = _shares.is_exempt(owner) ? asset(0, gross.symbol) : calc_fee(gross, _state.fees.exit);
    auto assets = gross - fee;
    CHECKC( assets.amount > 0,          err::AMOUNT_TOO_LOW,        "zero assets" )
    CHECKC( assets <= _state.available, err::INSUFFICIENT_FUNDS,
            "insufficient liquidity: " + _state.available.to_string() )

    _shares.debit(owner, shares);
    _state.total_supply         -= shares;
    _state.available            -= assets;
    _state.claimable_asset_fees += fee;

    _events.on_withdraw(caller, receiver, owner, assets, shares);
    emit_share_price();
    return assets;
}

asset share_ledger::safe_deposit( const name& caller, const asset& assets, const name& receiver,
                                  const asset& min_shares, const time_point_sec& deadline, const time_point_sec& now ) {
    CHECKC( now <= deadline, err::TRANSACTION_EXPIRED, "deadline passed" )
    auto shares = preview_deposit(assets, _shares.is_exempt(caller));
    CHECKC( shares >= min_shares, err::AMOUNT_TOO_LOW, "shares below minimum: " + shares.to_string() )
    return deposit(caller, assets, receiver);
}

asset share_ledger::safe_withdraw( const name& caller, const asset& assets, const name& receiver, const name& owner,
                                   const asset& max_shares, const time_point_sec& deadline, const time_point_sec& now ) {
    CHECKC( now <= deadline, err::TRANSACTION_EXPIRED, "deadline passed" )
    auto shares = preview_withdraw(assets, _shares.is_exempt(owner));
    CHECKC( shares <= max_shares, err::AMOUNT_TOO_HIGH, "shares above maximum: " + shares.to_string() )
    return withdraw(caller, assets, receiver, owner);
}

asset share_ledger::safe_redeem( const name& caller, const asset& shares, const name& receiver, const name& owner,
                                 const asset& min_assets, const time_point_sec& deadline, const time_point_sec& now ) {
    CHECKC( now <= deadline, err::TRANSACTION_EXPIRED, "deadline passed" )
    auto assets = preview_redeem(shares, _shares.is_exempt(owner));
    CHECKC( assets >= min_assets, err::AMOUNT_TOO_LOW, "assets below minimum: " + assets.to_string() )
    return redeem(caller, shares, receiver, owner);
}

void share_ledger::transfer( const name& from, const name& to, const asset& shares ) {
    _check_shares(shares);
    CHECKC( shares.amount > 0,                  err::AMOUNT_TOO_LOW,    "shares must be positive" )
    CHECKC( to != name(),                       err::ADDRESS_IS_ZERO,   "recipient is empty" )
    CHECKC( to != from,                         err::PARAM_ERROR,       "cannot transfer to self" )
    CHECKC( shares <= _shares.balance_of(from), err::AMOUNT_TOO_HIGH,   "overdrawn share balance" )
    _shares.debit(from, shares);
    _shares.credit(to, shares);
}

void share_ledger::set_max_total_assets( const asset& max_total_assets ) {
    _check_asset(max_total_assets);
    CHECKC( max_total_assets.amount >= 0, err::PARAM_ERROR, "negative max total assets" )
    _state.max_total_assets = max_total_assets;
    _events.on_max_total_assets(max_total_assets);
}

void share_ledger::issue( const name& owner, const asset& shares ) {
    _shares.credit(owner, shares);
    _state.total_supply += shares;
}

void share_ledger::issue_escrow( const asset& shares ) {
    _state.total_supply += shares;
}

void share_ledger::burn_escrow( const asset& shares ) {
    CHECKC( shares <= _state.total_supply, err::SYSTEM_ERROR, "burn exceeds supply" )
    _state.total_supply -= shares;
}

void share_ledger::emit_share_price() {
    _events.on_share_price(share_price(), total_assets(), _state.total_supply);
}

} //namespace yieldfi
