#pragma once

#include <yield.vault/vault.iface.hpp>

namespace yieldfi {

class share_ledger;

// fee charged on top of `assets`, rounded in favour of the pool
asset calc_fee( const asset& assets, uint16_t fee_bps );

// gross amount whose net after `fee_bps` is at least `net`
asset gross_up( const asset& net, uint16_t fee_bps );

void check_fees( const fees_t& fees );

struct fee_quote {
    asset   perf;
    asset   mgmt;
    asset   entry_exit;
    asset   total;
    bool    due     = false;
};

/**
 * @brief performance/management fee accrual against the share ledger
 *
 * Fees are minted as shares to the fee collector. Collection is a no-op
 * until `profit_cooldown` has elapsed since the last checkpoint.
 */
class fee_engine {
public:
    fee_engine( vault_state& state, share_ledger& ledger, vault_events& events );

    void        set_fees( const fees_t& fees );
    fee_quote   preview( const time_point_sec& now ) const;
    asset       collect( const time_point_sec& now );

private:
    vault_state&    _state;
    share_ledger&   _ledger;
    vault_events&   _events;
};

} //namespace yieldfi
