#pragma once

#include <yield.vault/vault.iface.hpp>

namespace yieldfi {

enum class rounding: uint8_t {
    DOWN    = 0,
    UP      = 1
};

void init_vault_state( vault_state& state, const extended_symbol& asset_token, const symbol& share_sym,
                       const name& fee_collector, const asset& max_total_assets, const time_point_sec& now );

// holds vault_state::locked for the enclosing scope
class reentrancy_guard {
public:
    explicit reentrancy_guard( vault_state& state, bool in_allocation = false );
    ~reentrancy_guard();

    reentrancy_guard( const reentrancy_guard& ) = delete;
    reentrancy_guard& operator=( const reentrancy_guard& ) = delete;

private:
    vault_state& _state;
};

/**
 * @brief share/asset accounting of one vault
 *
 * Conversions round in favour of the pool: deposit and redeem round down,
 * mint and withdraw round up.
 */
class share_ledger {
public:
    share_ledger( vault_state& state, const input_book& inputs, share_registry& shares,
                  vault_events& events, const name& vault );

    int64_t wei_per_share() const;
    asset   invested() const;
    asset   total_assets() const;
    asset   share_price() const;
    bool    seeded() const;

    asset   convert_to_shares( const asset& assets, rounding r ) const;
    asset   convert_to_assets( const asset& shares, rounding r ) const;

    asset   preview_deposit( const asset& assets, bool exempt ) const;
    asset   preview_mint( const asset& shares, bool exempt ) const;
    asset   preview_withdraw( const asset& assets, bool exempt ) const;
    asset   preview_redeem( const asset& shares, bool exempt ) const;
    asset   assets_of( const name& owner ) const;
    asset   max_withdraw( const name& owner ) const;
    asset   max_redeem( const name& owner ) const;

    asset   seed( const name& caller, const asset& assets, const name& receiver );
    asset   deposit( const name& caller, const asset& assets, const name& receiver );
    asset   mint( const name& caller, const asset& shares, const name& receiver, const asset& paid );
    asset   withdraw( const name& caller, const asset& assets, const name& receiver, const name& owner );
    asset   redeem( const name& caller, const asset& shares, const name& receiver, const name& owner );

    asset   safe_deposit( const name& caller, const asset& assets, const name& receiver,
                          const asset& min_shares, const time_point_sec& deadline, const time_point_sec& now );
    asset   safe_withdraw( const name& caller, const asset& assets, const name& receiver, const name& owner,
                           const asset& max_shares, const time_point_sec& deadline, const time_point_sec& now );
    asset   safe_redeem( const name& caller, const asset& shares, const name& receiver, const name& owner,
                         const asset& min_assets, const time_point_sec& deadline, const time_point_sec& now );

    void    transfer( const name& from, const name& to, const asset& shares );

    // raw supply changes used by fee collection and request settlement
    void    issue( const name& owner, const asset& shares );
    void    issue_escrow( const asset& shares );
    void    burn_escrow( const asset& shares );

    void    set_max_total_assets( const asset& max_total_assets );

    void    check_owner( const name& caller, const name& owner ) const;
    void    emit_share_price();

private:
    void    _check_deposit( const name& caller, const asset& assets, const name& receiver, bool exempt ) const;
    void    _check_asset( const asset& assets ) const;
    void    _check_shares( const asset& shares ) const;

    vault_state&        _state;
    const input_book&   _inputs;
    share_registry&     _shares;
    vault_events&       _events;
    name                _vault;
};

} //namespace yieldfi
