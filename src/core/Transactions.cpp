#include "Game.hpp"

#include <algorithm>
#include <format>

namespace tycoon::core
{
    auto GameImpl::BuyPending(PlyrIdxT const p) -> void
    {
        TYC_ASSERT(pending_purchase_.has_value(), "Buying with no pending purchase");
        SpaceIdxT const s = *pending_purchase_;
        Space const& sp = board_->At(s);
        ledger_.Debit(p, sp.Price());
        ledger_.Assign(s, p);
        pending_purchase_.reset();
        Note(std::format("{} buys {} for ${}", players_[p].name, sp.name, sp.Price()));
        if (report_) report_->purchase = PurchaseResult{.property = s, .buyer = p, .price = sp.Price()};
    }

    auto GameImpl::RunAuction(PlyrIdxT const decliner, DeclineAction const& d) -> void
    {
        using error::ViolationCode;
        TYC_ASSERT(pending_purchase_ == d.property, "Auction for a property that is not pending");

        AuctionResult result{.property = d.property};
        std::vector<bool> seen(players_.size(), false);
        std::vector<std::optional<MoneyT>> valid(players_.size());

        for (Bid const& b : d.bids)
        {
            TYC_ASSERT(b.bidder < players_.size(), "Bidder index validated upstream");
            std::optional<ViolationCode> reason{};
            if (seen[b.bidder]) reason = ViolationCode::Auction_DuplicateBidder;
            else if (players_[b.bidder].bankrupt) reason = ViolationCode::Auction_BidderBankrupt;
            else if (b.amount < cfg_.auction_min_bid) reason = ViolationCode::Auction_BelowMinimum;
            else if (b.amount > ledger_.Cash(b.bidder)) reason = ViolationCode::Auction_ExceedsCash;
            seen[b.bidder] = true;

            if (reason)
            {
                result.rejected.push_back(RejectedBid{.bid = b, .reason = *reason});
                Note(std::format("bid of ${} by {} rejected: {}", b.amount, players_[b.bidder].name,
                                 error::to_string(*reason)));
                continue;
            }
            valid[b.bidder] = b.amount;
        }

        // highest bid wins; ties go to the first bidder in turn order from the decliner
        PlyrIdxT seat = decliner;
        for (std::size_t k{}; k < players_.size(); ++k, seat = NextSeat(seat))
        {
            if (!valid[seat]) continue;
            if (!result.winner || *valid[seat] > result.price)
            {
                result.winner = seat;
                result.price = *valid[seat];
            }
        }

        Space const& sp = board_->At(d.property);
        if (result.winner)
        {
            ledger_.Debit(*result.winner, result.price);
            ledger_.Assign(d.property, *result.winner);
            Note(std::format("{} wins the auction for {} at ${}", players_[*result.winner].name, sp.name,
                             result.price));
        }
        else
        {
            Note(std::format("no valid bids; {} stays with the bank", sp.name));
        }
        pending_purchase_.reset();
        if (report_) report_->auction = std::move(result);
    }

    auto GameImpl::ExecuteTrade() -> void
    {
        TYC_ASSERT(pending_trade_.has_value(), "Executing a trade with none pending");
        PendingTrade const t = *pending_trade_;
        pending_trade_.reset();

        auto hand_over = [&](PlyrIdxT const from, PlyrIdxT const to, TradeBundle const& b)
        {
            for (SpaceIdxT const s : b.properties) ledger_.TransferProperty(s, to);
            if (b.cash > 0) ledger_.Transfer(from, to, b.cash);
            auto& src = players_[from].jail_cards;
            auto& dst = players_[to].jail_cards;
            TYC_ASSERT(src.size() >= b.jail_cards, "Trade moves more jail cards than held");
            for (std::uint8_t i{}; i < b.jail_cards; ++i)
            {
                dst.push_back(src.back());
                src.pop_back();
            }
        };

        hand_over(t.proposer, t.counterparty, t.give);
        hand_over(t.counterparty, t.proposer, t.take);
        Note(std::format("{} and {} complete a trade", players_[t.proposer].name, players_[t.counterparty].name));
    }
}
