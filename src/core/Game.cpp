#include "Game.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <ranges>
#include <utility>

#include "Util.hpp"

namespace tycoon::core
{
    namespace
    {
        // Keeps report_ pointing at a live report only while an action is applied.
        struct ReportScope
        {
            ReportScope(ActionReport*& slot, ActionReport& report) :
                slot_(slot)
            {
                slot_ = &report;
            }
            ~ReportScope() { slot_ = nullptr; }

            ReportScope(ReportScope const&) = delete;
            auto operator=(ReportScope const&) -> ReportScope& = delete;

        private:
            ActionReport*& slot_;
        };
    }

    GameImpl::GameImpl(Config const& config,
                       std::unique_ptr<Rules> rules,
                       std::vector<std::string> player_names,
                       std::unique_ptr<DiceSource> dice) :
        cfg_(config),
        rules_(std::move(rules)),
        dice_(std::move(dice)),
        rng_{cfg_.seed},
        board_(&Board::Classic()),
        ledger_(*board_, player_names.size(), cfg_.starting_cash),
        decks_{Deck{DeckKind::Chance, cfg_.shuffle_decks, rng_},
               Deck{DeckKind::CommunityChest, cfg_.shuffle_decks, rng_}}
    {
        TYC_ASSERT(rules_ != nullptr, "No rules while initialising session");
        TYC_ASSERT(player_names.size() >= constants::MinPlayers && player_names.size() <= constants::MaxPlayers,
                   "Player count outside 2-8 while initialising session");
        if (!dice_) dice_ = std::make_unique<RandomDice>(rng_());

        ledger_.SetUnmortgageRate(cfg_.unmortgage_rate_pct);
        players_.reserve(player_names.size());
        for (std::string& name : player_names)
        {
            players_.push_back(PlayerState{.name = std::move(name)});
        }
    }

    auto GameImpl::PhaseNow() const noexcept -> Phase
    {
        if (game_over_) return Phase::GameOver;
        if (!debts_.empty()) return Phase::AwaitingDebtSettlement;
        if (pending_trade_) return Phase::AwaitingTradeResponse;
        if (pending_purchase_) return Phase::AwaitingPurchaseDecision;
        return phase_;
    }

    auto GameImpl::ExpectedActor() const noexcept -> PlyrIdxT
    {
        if (!debts_.empty()) return debts_.front().debtor;
        if (pending_trade_) return pending_trade_->counterparty;
        return current_;
    }

    auto GameImpl::FindPlayer(std::string_view const name) const -> std::optional<PlyrIdxT>
    {
        for (std::size_t i{}; i < players_.size(); ++i)
        {
            if (util::IEquals(players_[i].name, name)) return static_cast<PlyrIdxT>(i);
        }
        return std::nullopt;
    }

    auto GameImpl::Snapshot() const -> std::shared_ptr<GameSnapshot const>
    {
        std::shared_ptr<GameSnapshot> snap = std::make_shared<GameSnapshot>();
        snap->players.reserve(players_.size());
        for (std::size_t i{}; i < players_.size(); ++i)
        {
            auto const p = static_cast<PlyrIdxT>(i);
            PlayerState const& ps = players_[i];
            snap->players.push_back(PlayerView{
                .name = ps.name,
                .cash = ledger_.Cash(p),
                .position = ps.position,
                .in_jail = ps.in_jail,
                .jail_turns = ps.jail_turns,
                .jail_cards = static_cast<std::uint8_t>(ps.jail_cards.size()),
                .bankrupt = ps.bankrupt,
                .properties = ledger_.PropertiesOf(p),
                .net_worth = ps.bankrupt ? 0 : ledger_.NetWorth(p)
            });
        }

        for (SpaceIdxT const s : board_->Ownables())
        {
            PropertyRecord const& r = ledger_.Record(s);
            snap->properties.push_back(PropertyView{
                .space = s, .owner = r.owner, .mortgaged = r.mortgaged, .buildings = r.buildings});
        }

        snap->current = current_;
        snap->expected_actor = ExpectedActor();
        snap->phase = PhaseNow();
        snap->game_over = game_over_;
        snap->winner = winner_;
        snap->house_pool = ledger_.HousePool();
        snap->hotel_pool = ledger_.HotelPool();
        snap->pending_purchase = pending_purchase_;
        snap->debts.assign(debts_.begin(), debts_.end());
        snap->pending_trade = pending_trade_;
        snap->last_dice = last_dice_;
        snap->doubles_streak = doubles_streak_;
        snap->jail_fine = cfg_.jail_fine;
        snap->auction_min_bid = cfg_.auction_min_bid;
        return snap;
    }

    auto GameImpl::PropertyDetailsFor(PlyrIdxT const p) const -> std::vector<PropertyDetail>
    {
        int const dice_sum = last_dice_ ? last_dice_->Sum() : 0;
        std::vector<PropertyDetail> out;
        for (SpaceIdxT const s : ledger_.PropertiesOf(p))
        {
            Space const& sp = board_->At(s);
            PropertyRecord const& r = ledger_.Record(s);
            out.push_back(PropertyDetail{
                .space = s,
                .name = std::string{sp.name},
                .kind = sp.Kind(),
                .group = sp.Group(),
                .price = sp.Price(),
                .buildings = r.buildings,
                .mortgaged = r.mortgaged,
                .mortgage_value = sp.MortgageValue(),
                .current_rent = ledger_.RentFor(s, dice_sum),
                .monopoly = ledger_.OwnsGroup(p, sp.Group())
            });
        }
        return out;
    }

    auto GameImpl::Submit(ActionRequest const& req) -> error::Result<ActionReport>
    {
        if (auto const ok = rules_->Validate(*this, req); !ok.has_value())
        {
            if (cfg_.log_rejections) std::print("{}\n", error::describe(ok.error()));
            return std::unexpected(ok.error());
        }

        ActionReport report{.actor = req.actor};
        MoneyT const cash_before = ledger_.Cash(req.actor);
        SpaceIdxT const pos_before = players_[req.actor].position;
        {
            ReportScope const scope{report_, report};
            rules_->Apply(*this, req);
            report.outcome = rules_->Advance(*this);
        }

        report.phase_after = PhaseNow();
        report.cash_delta = ledger_.Cash(req.actor) - cash_before;
        report.position_delta = static_cast<int>(players_[req.actor].position) - static_cast<int>(pos_before);
        report.game_over = game_over_;
        report.winner = winner_;
        return report;
    }

    auto GameImpl::Note(std::string line) -> void
    {
        if (report_) report_->events.push_back(std::move(line));
    }

    auto GameImpl::NextLivePlayer(PlyrIdxT const from) const -> PlyrIdxT
    {
        PlyrIdxT i{from};
        std::size_t const n = players_.size();
        for (std::size_t j{}; j < n; ++j)
        {
            i = NextSeat(i);
            if (!players_[i].bankrupt) return i;
        }
        TYC_THROW(error::Code::State, "No live players");
    }

    auto GameImpl::LiveCount() const -> std::size_t
    {
        return static_cast<std::size_t>(std::ranges::count_if(players_,
                                                               [](PlayerState const& p) { return !p.bankrupt; }));
    }

    auto GameImpl::EndTurn() -> void
    {
        PlyrIdxT const next = NextLivePlayer(current_);
        Note(std::format("{} ends the turn; {} is up", players_[current_].name, players_[next].name));
        current_ = next;
        phase_ = Phase::AwaitingRoll;
        doubles_streak_ = 0;
        pending_purchase_.reset();
    }
}
