#include "Game.hpp"

#include <algorithm>
#include <format>

namespace tycoon::core
{
    namespace
    {
        auto CreditorName(std::vector<PlayerState> const& players, std::optional<PlyrIdxT> const c) -> std::string_view
        {
            return c ? std::string_view{players[*c].name} : std::string_view{"the bank"};
        }
    }

    auto GameImpl::OwedBy(PlyrIdxT const p) const -> MoneyT
    {
        MoneyT total{};
        for (PendingDebt const& d : debts_)
        {
            if (d.debtor == p) total += d.amount;
        }
        return total;
    }

    auto GameImpl::Charge(PlyrIdxT const debtor, std::optional<PlyrIdxT> const creditor, MoneyT const amount,
                          std::string_view const reason) -> void
    {
        TYC_ASSERT(amount >= 0, "Negative charge");
        TYC_ASSERT(!creditor || *creditor != debtor, "Player charged by themselves");
        if (amount == 0 || players_[debtor].bankrupt || game_over_) return;

        PlayerState const& ps = players_[debtor];
        MoneyT const cash = ledger_.Cash(debtor);
        MoneyT const owed = OwedBy(debtor);

        if (owed == 0 && cash >= amount)
        {
            if (creditor) ledger_.Transfer(debtor, *creditor, amount);
            else ledger_.Debit(debtor, amount);
            Note(std::format("{} pays ${} to {} ({})", ps.name, amount, CreditorName(players_, creditor), reason));
            return;
        }

        if (cash + ledger_.LiquidationValue(debtor) >= owed + amount)
        {
            debts_.push_back(PendingDebt{.debtor = debtor, .creditor = creditor, .amount = amount});
            Note(std::format("{} owes ${} to {} ({}) and must raise cash", ps.name, amount,
                             CreditorName(players_, creditor), reason));
            return;
        }

        Note(std::format("{} cannot cover ${} to {} ({})", ps.name, amount, CreditorName(players_, creditor), reason));
        Bankrupt(debtor, creditor);
    }

    auto GameImpl::PayFrontDebt() -> void
    {
        TYC_ASSERT(!debts_.empty(), "Paying a debt with none pending");
        PendingDebt const d = debts_.front();
        if (d.creditor) ledger_.Transfer(d.debtor, *d.creditor, d.amount);
        else ledger_.Debit(d.debtor, d.amount);
        debts_.pop_front();
        Note(std::format("{} settles ${} with {}", players_[d.debtor].name, d.amount,
                         CreditorName(players_, d.creditor)));
    }

    auto GameImpl::Bankrupt(PlyrIdxT const p, std::optional<PlyrIdxT> creditor) -> void
    {
        PlayerState& ps = players_[p];
        TYC_ASSERT(!ps.bankrupt, "Player bankrupted twice");
        if (creditor && players_[*creditor].bankrupt) creditor.reset();

        std::erase_if(debts_, [p](PendingDebt const& d) { return d.debtor == p; });
        // money owed to the bankrupt player now goes to the bank
        for (PendingDebt& d : debts_)
        {
            if (d.creditor == p) d.creditor.reset();
        }

        MoneyT const cash = ledger_.Cash(p);
        std::vector<SpaceIdxT> const deeds = ledger_.PropertiesOf(p);
        if (creditor)
        {
            ledger_.Transfer(p, *creditor, cash);
            for (SpaceIdxT const s : deeds) ledger_.TransferProperty(s, *creditor);
            auto& to = players_[*creditor].jail_cards;
            to.insert(to.end(), ps.jail_cards.begin(), ps.jail_cards.end());
            ps.jail_cards.clear();
        }
        else
        {
            ledger_.Debit(p, cash);
            for (SpaceIdxT const s : deeds) ledger_.Release(s);
            while (!ps.jail_cards.empty()) SpendJailCard(p);
        }

        ps.bankrupt = true;
        ps.in_jail = false;
        ps.jail_turns = 0;
        if (pending_trade_ && (pending_trade_->proposer == p || pending_trade_->counterparty == p))
            pending_trade_.reset();
        if (p == current_) pending_purchase_.reset();

        Note(std::format("{} is bankrupt; ${} and {} properties go to {}", ps.name, cash, deeds.size(),
                         CreditorName(players_, creditor)));
        if (report_) report_->bankruptcies.push_back(Bankruptcy{.player = p, .creditor = creditor});

        CheckGameOver();
    }

    auto GameImpl::CheckGameOver() -> bool
    {
        if (game_over_) return true;
        if (LiveCount() > 1) return false;

        auto const it = std::ranges::find_if(players_, [](PlayerState const& ps) { return !ps.bankrupt; });
        TYC_ASSERT(it != players_.end(), "Every player bankrupt");
        game_over_ = true;
        winner_ = static_cast<PlyrIdxT>(std::distance(players_.begin(), it));
        debts_.clear();
        pending_trade_.reset();
        pending_purchase_.reset();
        Note(std::format("{} wins", it->name));
        return true;
    }
}
