#include "pricing.hpp"

#include <algorithm>
#include <functional>

namespace market::auction {

double FirstPrice::Apply(const Bid& winner, const std::vector<Bid>&, double) const {
  return winner.price;
}

double SecondPrice::Apply(const Bid&, const std::vector<Bid>& eligible, double reserve) const {
  if (eligible.size() < 2) {
    return reserve;
  }
  std::vector<double> prices;
  prices.reserve(eligible.size());
  for (const auto& bid : eligible) {
    prices.push_back(bid.price);
  }
  std::nth_element(prices.begin(), prices.begin() + 1, prices.end(), std::greater<>());
  return prices[1];
}

double ReservePrice::Apply(const Bid& winner, const std::vector<Bid>&, double reserve) const {
  return std::max(winner.price, reserve);
}

PricingRule RuleFor(market::v1::AuctionKind kind) {
  switch (kind) {
    case market::v1::AUCTION_KIND_FIRST_PRICE:
      return FirstPrice{};
    case market::v1::AUCTION_KIND_RESERVE:
      return ReservePrice{};
    case market::v1::AUCTION_KIND_SECOND_PRICE:
    default:
      return SecondPrice{};
  }
}

double ClearingPrice(const PricingRule& rule, const Bid& winner, const std::vector<Bid>& eligible, double reserve) {
  return std::visit([&](const auto& r) { return r.Apply(winner, eligible, reserve); }, rule);
}

double CompositeScore(double price, double max_price, double reputation, double quality, std::chrono::milliseconds estimated_completion,
                      std::chrono::milliseconds task_timeout) {
  const double price_score = max_price > 0.0 ? std::clamp(1.0 - price / max_price, 0.0, 1.0) : 0.0;
  const double rep_score   = std::clamp(reputation / 100.0, 0.0, 1.0);
  const double qual_score  = std::clamp(quality / 100.0, 0.0, 1.0);

  double speed_score = 0.0;
  if (estimated_completion.count() > 0 && task_timeout.count() > 0) {
    speed_score = std::max(0.0, 1.0 - static_cast<double>(estimated_completion.count()) / static_cast<double>(task_timeout.count()));
  }

  return 0.40 * price_score + 0.30 * rep_score + 0.20 * qual_score + 0.10 * speed_score;
}

std::string_view KindName(market::v1::AuctionKind kind) {
  switch (kind) {
    case market::v1::AUCTION_KIND_FIRST_PRICE:
      return "first_price";
    case market::v1::AUCTION_KIND_SECOND_PRICE:
      return "second_price";
    case market::v1::AUCTION_KIND_RESERVE:
      return "reserve";
    default:
      return "unspecified";
  }
}

std::string_view StatusName(market::v1::AuctionStatus status) {
  switch (status) {
    case market::v1::AUCTION_STATUS_OPEN:
      return "open";
    case market::v1::AUCTION_STATUS_CLOSED:
      return "closed";
    case market::v1::AUCTION_STATUS_AWARDED:
      return "awarded";
    case market::v1::AUCTION_STATUS_INSUFFICIENT_BIDDERS:
      return "insufficient_bidders";
    case market::v1::AUCTION_STATUS_EXPIRED:
      return "expired";
    case market::v1::AUCTION_STATUS_CANCELED:
      return "canceled";
    default:
      return "unspecified";
  }
}

} // namespace market::auction
