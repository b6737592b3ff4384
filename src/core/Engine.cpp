#include "Engine.hpp"

#include <utility>

namespace tycoon::core
{
    using error::Result;
    using error::ViolationCode;
    using error::Viol;

    auto ResolveProperty(Board const& board, std::string_view const name) -> Result<SpaceIdxT>
    {
        if (auto const s = board.FindByName(name)) return *s;
        return std::unexpected(Viol(ViolationCode::Property_UnknownName).with_subject(std::string{name}));
    }

    auto ResolvePlayer(GameImpl const& game, std::string_view const name) -> Result<PlyrIdxT>
    {
        if (auto const p = game.FindPlayer(name)) return *p;
        return std::unexpected(Viol(ViolationCode::Player_NotFound).with_subject(std::string{name}));
    }

    namespace
    {
        auto ResolveBundle(GameImpl const& game, NamedBundle const& b) -> Result<TradeBundle>
        {
            TradeBundle out{.cash = b.cash, .jail_cards = b.jail_cards};
            for (std::string const& name : b.properties)
            {
                auto const s = ResolveProperty(game.BoardRef(), name);
                if (!s) return std::unexpected(s.error());
                out.properties.push_back(*s);
            }
            return out;
        }
    }

    Engine::Engine(Config defaults) :
        registry_(std::move(defaults))
    {
    }

    auto Engine::CreateSession(std::vector<std::string> names) -> Result<std::string>
    {
        return registry_.Create(std::move(names));
    }

    auto Engine::CreateSession(std::vector<std::string> names, Config const& cfg,
                               std::unique_ptr<DiceSource> dice) -> Result<std::string>
    {
        return registry_.Create(std::move(names), cfg, std::move(dice));
    }

    auto Engine::ListSessions() const -> std::vector<SessionSummary>
    {
        return registry_.List();
    }

    auto Engine::GetState(std::string_view const session) const -> Result<std::shared_ptr<GameSnapshot const>>
    {
        auto const s = registry_.Find(session);
        if (!s) return std::unexpected(s.error());
        return (*s)->Read([](GameImpl const& g) { return g.Snapshot(); });
    }

    auto Engine::GetPlayerProperties(std::string_view const session, std::string_view const player) const
        -> Result<std::vector<PropertyDetail>>
    {
        auto const s = registry_.Find(session);
        if (!s) return std::unexpected(s.error());
        return (*s)->Read([player](GameImpl const& g) -> Result<std::vector<PropertyDetail>>
        {
            auto const p = ResolvePlayer(g, player);
            if (!p) return std::unexpected(p.error());
            return g.PropertyDetailsFor(*p);
        });
    }

    template <typename MakeAction>
    auto Engine::Act(std::string_view const session, std::string_view const player, MakeAction&& make)
        -> Result<ActionReport>
    {
        auto const s = registry_.Find(session);
        if (!s) return std::unexpected(s.error());
        return (*s)->TryMutate([&](GameImpl& g) -> Result<ActionReport>
        {
            auto const p = ResolvePlayer(g, player);
            if (!p) return std::unexpected(p.error());
            Result<PlayerAction> action = make(std::as_const(g));
            if (!action) return std::unexpected(action.error());
            return g.Submit(ActionRequest{.actor = *p, .action = std::move(*action)});
        });
    }

    auto Engine::Roll(std::string_view const session, std::string_view const player) -> Result<ActionReport>
    {
        return Act(session, player, [](GameImpl const&) -> Result<PlayerAction> { return RollAction{}; });
    }

    auto Engine::PayJail(std::string_view const session, std::string_view const player) -> Result<ActionReport>
    {
        return Act(session, player, [](GameImpl const&) -> Result<PlayerAction> { return PayJailFineAction{}; });
    }

    auto Engine::UseJailCard(std::string_view const session, std::string_view const player) -> Result<ActionReport>
    {
        return Act(session, player, [](GameImpl const&) -> Result<PlayerAction> { return UseJailCardAction{}; });
    }

    auto Engine::Buy(std::string_view const session, std::string_view const player, std::string_view const property)
        -> Result<ActionReport>
    {
        return Act(session, player, [property](GameImpl const& g) -> Result<PlayerAction>
        {
            auto const s = ResolveProperty(g.BoardRef(), property);
            if (!s) return std::unexpected(s.error());
            return BuyAction{.property = *s};
        });
    }

    auto Engine::Decline(std::string_view const session, std::string_view const player,
                         std::string_view const property, std::vector<NamedBid> const& bids) -> Result<ActionReport>
    {
        return Act(session, player, [&](GameImpl const& g) -> Result<PlayerAction>
        {
            auto const s = ResolveProperty(g.BoardRef(), property);
            if (!s) return std::unexpected(s.error());
            DeclineAction d{.property = *s};
            for (NamedBid const& b : bids)
            {
                auto const bidder = g.FindPlayer(b.bidder);
                if (!bidder)
                    return std::unexpected(Viol(ViolationCode::Auction_UnknownBidder).with_subject(b.bidder));
                d.bids.push_back(Bid{.bidder = *bidder, .amount = b.amount});
            }
            return d;
        });
    }

    auto Engine::Mortgage(std::string_view const session, std::string_view const player,
                          std::string_view const property) -> Result<ActionReport>
    {
        return Act(session, player, [property](GameImpl const& g) -> Result<PlayerAction>
        {
            auto const s = ResolveProperty(g.BoardRef(), property);
            if (!s) return std::unexpected(s.error());
            return MortgageAction{.property = *s};
        });
    }

    auto Engine::Unmortgage(std::string_view const session, std::string_view const player,
                            std::string_view const property) -> Result<ActionReport>
    {
        return Act(session, player, [property](GameImpl const& g) -> Result<PlayerAction>
        {
            auto const s = ResolveProperty(g.BoardRef(), property);
            if (!s) return std::unexpected(s.error());
            return UnmortgageAction{.property = *s};
        });
    }

    auto Engine::Build(std::string_view const session, std::string_view const player,
                       std::string_view const property) -> Result<ActionReport>
    {
        return Act(session, player, [property](GameImpl const& g) -> Result<PlayerAction>
        {
            auto const s = ResolveProperty(g.BoardRef(), property);
            if (!s) return std::unexpected(s.error());
            return BuildAction{.property = *s};
        });
    }

    auto Engine::SellBuilding(std::string_view const session, std::string_view const player,
                              std::string_view const property) -> Result<ActionReport>
    {
        return Act(session, player, [property](GameImpl const& g) -> Result<PlayerAction>
        {
            auto const s = ResolveProperty(g.BoardRef(), property);
            if (!s) return std::unexpected(s.error());
            return SellBuildingAction{.property = *s};
        });
    }

    auto Engine::ProposeTrade(std::string_view const session, std::string_view const player,
                              std::string_view const counterparty, NamedBundle const& give,
                              NamedBundle const& take) -> Result<ActionReport>
    {
        return Act(session, player, [&](GameImpl const& g) -> Result<PlayerAction>
        {
            auto const other = g.FindPlayer(counterparty);
            if (!other)
                return std::unexpected(Viol(ViolationCode::Trade_UnknownCounterparty)
                                       .with_subject(std::string{counterparty}));
            auto g_bundle = ResolveBundle(g, give);
            if (!g_bundle) return std::unexpected(g_bundle.error());
            auto t_bundle = ResolveBundle(g, take);
            if (!t_bundle) return std::unexpected(t_bundle.error());
            return ProposeTradeAction{.counterparty = *other, .give = std::move(*g_bundle),
                                      .take = std::move(*t_bundle)};
        });
    }

    auto Engine::RespondTrade(std::string_view const session, std::string_view const player, bool const accept)
        -> Result<ActionReport>
    {
        return Act(session, player, [accept](GameImpl const&) -> Result<PlayerAction>
        {
            return RespondTradeAction{.accept = accept};
        });
    }

    auto Engine::PayDebt(std::string_view const session, std::string_view const player) -> Result<ActionReport>
    {
        return Act(session, player, [](GameImpl const&) -> Result<PlayerAction> { return PayDebtAction{}; });
    }

    auto Engine::DeclareBankruptcy(std::string_view const session, std::string_view const player)
        -> Result<ActionReport>
    {
        return Act(session, player, [](GameImpl const&) -> Result<PlayerAction> { return DeclareBankruptcyAction{}; });
    }

    auto Engine::EndTurn(std::string_view const session, std::string_view const player) -> Result<ActionReport>
    {
        return Act(session, player, [](GameImpl const&) -> Result<PlayerAction> { return EndTurnAction{}; });
    }

    auto Engine::Submit(std::string_view const session, ActionRequest const& req) -> Result<ActionReport>
    {
        auto const s = registry_.Find(session);
        if (!s) return std::unexpected(s.error());
        return (*s)->TryMutate([&req](GameImpl& g) { return g.Submit(req); });
    }

    auto Engine::BoardCatalog() -> std::vector<SpaceInfo>
    {
        std::vector<SpaceInfo> out;
        out.reserve(constants::BoardSize);
        for (Space const& sp : Board::Classic().Spaces())
        {
            SpaceInfo info{
                .index = sp.index,
                .name = std::string{sp.name},
                .kind = sp.Kind(),
                .group = sp.Group(),
                .price = sp.Price(),
                .mortgage_value = sp.MortgageValue(),
            };
            if (StreetSpace const* st = sp.Street())
            {
                info.house_cost = st->house_cost;
                info.rent = st->rent;
            }
            if (auto const* tax = std::get_if<TaxSpace>(&sp.detail)) info.tax = tax->amount;
            out.push_back(std::move(info));
        }
        return out;
    }
}
