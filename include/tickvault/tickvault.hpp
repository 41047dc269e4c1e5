#ifndef TICKVAULT_TICKVAULT_HPP
#define TICKVAULT_TICKVAULT_HPP

// =============================================================================
// TickVault - tick-bucketed long/vault accounting engine
//
//   types / errors / uint512     fixed point, error codes, 512-bit integers
//   tick_math / tick_bitmap      price <-> tick, populated tick index
//   liquidation_multiplier       funding adjustment of tick prices
//   positions / funding          long book, PnL and funding
//   liquidation / rebalancer     tick sweep, imbalance-driven position roll
//   pending_actions / protocol   two-step actions and the entry points
// =============================================================================

#include "types.hpp"
#include "errors.hpp"
#include "uint512.hpp"
#include "tick_math.hpp"
#include "tick_bitmap.hpp"
#include "liquidation_multiplier.hpp"
#include "config.hpp"
#include "log.hpp"
#include "events.hpp"
#include "state.hpp"
#include "positions.hpp"
#include "funding.hpp"
#include "liquidation.hpp"
#include "pending_actions.hpp"
#include "oracle.hpp"
#include "custody.hpp"
#include "rebalancer.hpp"
#include "protocol.hpp"

#endif // TICKVAULT_TICKVAULT_HPP
