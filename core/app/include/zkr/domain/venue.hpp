#pragma once

#include <optional>
#include <string_view>

namespace zkr {
namespace domain {

// -----------------------------------------------------------------------------
// Venue
// -----------------------------------------------------------------------------
// Responsibility: The closed set of external trading systems a claim can be
// made about.
//
// Adding a venue means adding an enumerator here; every switch over Venue is
// written without a default label so the compiler flags each site that has
// to learn about the new value (-Wswitch).
//
// Wire form: lowercase slug ("hyperliquid", "base", "solana", "polymarket").
// -----------------------------------------------------------------------------
enum class Venue {
  Hyperliquid,
  Base,
  Solana,
  Polymarket,
};

// -----------------------------------------------------------------------------
// ClaimType
// -----------------------------------------------------------------------------
// Responsibility: The kind of real-world event a receipt attests to.
// Wire form: upper snake case ("ORDER_PLACED", "TRADE_EXECUTED").
// -----------------------------------------------------------------------------
enum class ClaimType {
  OrderPlaced,
  TradeExecuted,
};

// All venues, in declaration order. Used by policy validation and by the
// executable to register one adapter per venue.
inline constexpr Venue kAllVenues[] = {
    Venue::Hyperliquid,
    Venue::Base,
    Venue::Solana,
    Venue::Polymarket,
};

// -------------------------------------------------------------------------
// venueToString / claimTypeToString
// -------------------------------------------------------------------------
// @brief  Canonical string forms used in hashes, policy documents and the
//         receipt wire shape.
// -------------------------------------------------------------------------
const char* venueToString(Venue venue);
const char* claimTypeToString(ClaimType claim_type);

// -------------------------------------------------------------------------
// parseVenue / parseClaimType
// -------------------------------------------------------------------------
// @brief  Inverse of the *ToString functions.
//
// @return std::nullopt if the text is not a canonical form. Matching is
//         exact (case-sensitive).
// -------------------------------------------------------------------------
std::optional<Venue> parseVenue(std::string_view text);
std::optional<ClaimType> parseClaimType(std::string_view text);

}  // namespace domain
}  // namespace zkr
