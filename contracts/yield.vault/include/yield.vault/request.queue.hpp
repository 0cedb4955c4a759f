#pragma once

#include <yield.vault/vault.iface.hpp>
#include <yield.vault/share.ledger.hpp>

namespace yieldfi {

/**
 * @brief asynchronous deposit/redeem requests
 *
 * NONE -> PENDING -> (CANCELED | CLAIMABLE) -> NONE, at most one request
 * per controller and kind. Pending requests are settled in batches by
 * settle(); each batch records the totals it settled at so that claims
 * pay out pro rata, and is dropped once its last request is claimed.
 * Owners that are fee exempt when they request pay no entry/exit fee.
 */
class request_queue {
public:
    request_queue( vault_state& state, share_ledger& ledger, share_registry& shares, request_store& store,
                   const price_source& prices, const input_book& inputs, vault_events& events );

    void        check_oracles() const;

    request_t   request_deposit( const name& controller, const name& owner, const asset& assets,
                                 const time_point_sec& now );
    request_t   request_redeem( const name& controller, const name& owner, const asset& shares,
                                const time_point_sec& now );
    // redeem request for the shares `assets` are worth now, exit fee included
    request_t   request_withdraw( const name& controller, const name& owner, const asset& assets,
                                  const time_point_sec& now );

    request_t   cancel_deposit( const name& controller );
    request_t   cancel_redeem( const name& controller );

    asset       claim_deposit( const name& controller, const name& receiver,
                               const time_point_sec& deadline, const time_point_sec& now );
    asset       claim_redeem( const name& controller, const name& receiver,
                              const time_point_sec& deadline, const time_point_sec& now );

    // returns true when anything was settled
    bool        settle( const time_point_sec& now );

    bool        is_settled( request_kind kind, const request_t& req ) const;
    asset       pending_redemption_assets() const;
    asset       redemption_shortfall() const;

private:
    request_t   _pending( request_kind kind, const name& controller ) const;
    void        _check_no_request( request_kind kind, const name& controller ) const;
    void        _reset_deposit_escrow();
    void        _close_settlement( request_kind kind, settlement_t& s );
    uint64_t    _next_id();

    vault_state&            _state;
    share_ledger&           _ledger;
    share_registry&         _shares;
    request_store&          _store;
    const price_source&     _prices;
    const input_book&       _inputs;
    vault_events&           _events;
};

} //namespace yieldfi
