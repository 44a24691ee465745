#pragma once

#include <chrono>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/auction/auction_types.hpp"

namespace market::auction {

/*
  Clearing-price rules. One alternative per auction kind; Apply() on each
  receives the winner, every eligible bid and the reserve.
*/

// Winner pays its own quote.
struct FirstPrice {
  double Apply(const Bid& winner, const std::vector<Bid>& eligible, double reserve) const;
};

// Second-highest quote among eligible bids; the reserve when only one bid.
struct SecondPrice {
  double Apply(const Bid& winner, const std::vector<Bid>& eligible, double reserve) const;
};

// Winner's quote, floored at the reserve.
struct ReservePrice {
  double Apply(const Bid& winner, const std::vector<Bid>& eligible, double reserve) const;
};

using PricingRule = std::variant<FirstPrice, SecondPrice, ReservePrice>;

PricingRule RuleFor(market::v1::AuctionKind kind);

double ClearingPrice(const PricingRule& rule, const Bid& winner, const std::vector<Bid>& eligible, double reserve);

// 0.40 price + 0.30 reputation + 0.20 quality + 0.10 speed, each in [0,1].
double CompositeScore(double price, double max_price, double reputation, double quality, std::chrono::milliseconds estimated_completion,
                      std::chrono::milliseconds task_timeout);

std::string_view KindName(market::v1::AuctionKind kind);
std::string_view StatusName(market::v1::AuctionStatus status);

} // namespace market::auction
