#include "Codec.hpp"

#include <format>
#include <type_traits>
#include <utility>
#include <vector>

namespace tycoon::core::net
{
    namespace
    {
        static_assert(static_cast<int>(Phase::GameOver) == static_cast<int>(fb::Phase::GameOver));
        static_assert(static_cast<int>(MoveOutcome::GameEnded) == static_cast<int>(fb::Outcome::GameEnded));
        static_assert(static_cast<int>(DeckKind::CommunityChest) == static_cast<int>(fb::Deck::CommunityChest));

        template <typename T>
        auto OrNone(std::optional<T> const& v) -> std::int16_t
        {
            return v ? static_cast<std::int16_t>(*v) : std::int16_t{-1};
        }

        auto Fail(ParseError::Kind k, std::string msg) -> std::unexpected<ParseError>
        {
            return std::unexpected(ParseError{.kind = k, .message = std::move(msg)});
        }

        auto Unresolved(error::RuleViolation v) -> std::unexpected<ParseError>
        {
            std::string msg = error::describe(v);
            return std::unexpected(ParseError{
                .kind = ParseError::Kind::UnresolvedName, .message = std::move(msg), .violation = std::move(v)});
        }

        auto Verified(std::span<std::byte const> bytes) -> std::expected<fb::PlayerActionMsg const*, ParseError>
        {
            if (bytes.size() < sizeof(flatbuffers::uoffset_t))
                return Fail(ParseError::Kind::Truncated, "buffer too small");

            auto const* data = reinterpret_cast<std::uint8_t const*>(bytes.data());
            flatbuffers::Verifier verifier(data, bytes.size());
            if (!fb::VerifyEnvelopeBuffer(verifier))
                return Fail(ParseError::Kind::Unverified, "envelope failed verification");

            auto const* env = fb::GetEnvelope(data);
            if (env->message_type() != fb::Message::PlayerActionMsg)
                return Fail(ParseError::Kind::WrongMessage, "not a PlayerActionMsg");

            auto const* pam = env->message_as_PlayerActionMsg();
            if (!pam->session() || !pam->actor())
                return Fail(ParseError::Kind::MissingField, "session and actor are required");
            if (pam->action_type() != fb::Action::NONE && !pam->action())
                return Fail(ParseError::Kind::MissingField, "action body is required");
            return pam;
        }

        auto BuildBundle(flatbuffers::FlatBufferBuilder& fbb, TradeBundle const& b) -> flatbuffers::Offset<fb::Bundle>
        {
            auto const props = fbb.CreateVector(b.properties);
            return fb::CreateBundle(fbb, props, b.cash, b.jail_cards);
        }

        auto BuildNamedBundle(flatbuffers::FlatBufferBuilder& fbb, Board const& board, TradeBundle const& b)
            -> flatbuffers::Offset<fb::NamedBundle>
        {
            std::vector<std::string> names;
            names.reserve(b.properties.size());
            for (SpaceIdxT const s : b.properties) names.emplace_back(board.At(s).name);
            auto const props = fbb.CreateVectorOfStrings(names);
            return fb::CreateNamedBundle(fbb, props, b.cash, b.jail_cards);
        }

        auto Property(Board const& board, flatbuffers::String const* name) -> error::Result<SpaceIdxT>
        {
            if (!name) return std::unexpected(error::Viol(error::ViolationCode::Property_UnknownName));
            return ResolveProperty(board, name->string_view());
        }

        auto DecodeBundle(Board const& board, fb::NamedBundle const* b) -> error::Result<TradeBundle>
        {
            TradeBundle out{};
            if (!b) return out;
            out.cash = b->cash();
            out.jail_cards = b->jail_cards();
            if (auto const* props = b->properties())
            {
                for (auto const* name : *props)
                {
                    auto const s = Property(board, name);
                    if (!s) return std::unexpected(s.error());
                    out.properties.push_back(*s);
                }
            }
            return out;
        }

        template <typename ActionT, typename FbT>
        auto PropertyAction(Board const& board, FbT const* a) -> error::Result<PlayerAction>
        {
            auto const s = Property(board, a->property());
            if (!s) return std::unexpected(s.error());
            return ActionT{.property = *s};
        }
    }

    auto ToFbPhase(Phase const p) noexcept -> fb::Phase
    {
        return static_cast<fb::Phase>(std::to_underlying(p));
    }

    auto ToFbOutcome(MoveOutcome const m) noexcept -> fb::Outcome
    {
        return static_cast<fb::Outcome>(std::to_underlying(m));
    }

    // ---------- Snapshot ----------

    auto BuildSnapshot(GameSnapshot const& s, std::string_view const session, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<fb::PlayerView>> players;
        players.reserve(s.players.size());
        for (PlayerView const& p : s.players)
        {
            auto const name = fbb.CreateString(p.name);
            auto const props = fbb.CreateVector(p.properties);
            players.push_back(fb::CreatePlayerView(fbb, name, p.cash, p.position, p.in_jail, p.jail_turns,
                                                   p.jail_cards, p.bankrupt, props, p.net_worth));
        }
        auto const players_vec = fbb.CreateVector(players);

        std::vector<flatbuffers::Offset<fb::PropertyView>> props;
        props.reserve(s.properties.size());
        for (PropertyView const& pv : s.properties)
        {
            props.push_back(fb::CreatePropertyView(fbb, pv.space, OrNone(pv.owner), pv.mortgaged, pv.buildings));
        }
        auto const props_vec = fbb.CreateVector(props);

        std::vector<flatbuffers::Offset<fb::Debt>> debts;
        debts.reserve(s.debts.size());
        for (PendingDebt const& d : s.debts)
        {
            debts.push_back(fb::CreateDebt(fbb, d.debtor, OrNone(d.creditor), d.amount));
        }
        auto const debts_vec = fbb.CreateVector(debts);

        flatbuffers::Offset<fb::Trade> trade{};
        if (s.pending_trade)
        {
            auto const give = BuildBundle(fbb, s.pending_trade->give);
            auto const take = BuildBundle(fbb, s.pending_trade->take);
            trade = fb::CreateTrade(fbb, s.pending_trade->proposer, s.pending_trade->counterparty, give, take);
        }

        auto const session_str = fbb.CreateString(session);
        auto const view = fb::CreateGameView(
            fbb,
            /*schema_version*/ SchemaVersion,
            /*session*/ session_str,
            /*players*/ players_vec,
            /*properties*/ props_vec,
            /*current*/ s.current,
            /*expected_actor*/ s.expected_actor,
            /*phase*/ ToFbPhase(s.phase),
            /*game_over*/ s.game_over,
            /*winner*/ OrNone(s.winner),
            /*house_pool*/ static_cast<std::uint8_t>(s.house_pool),
            /*hotel_pool*/ static_cast<std::uint8_t>(s.hotel_pool),
            /*pending_purchase*/ OrNone(s.pending_purchase),
            /*debts*/ debts_vec,
            /*trade*/ trade,
            /*last_d1*/ s.last_dice ? s.last_dice->d1 : std::uint8_t{0},
            /*last_d2*/ s.last_dice ? s.last_dice->d2 : std::uint8_t{0},
            /*doubles_streak*/ s.doubles_streak
        );

        auto const sm = fb::CreateSnapshotMsg(fbb, msg_id, view);
        auto const env = fb::CreateEnvelope(fbb, fb::Message::SnapshotMsg, sm.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    // ---------- Report ----------

    auto BuildReport(ActionReport const& r, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<fb::RejectedBid>> rejected;
        if (r.auction)
        {
            for (RejectedBid const& rb : r.auction->rejected)
            {
                rejected.push_back(fb::CreateRejectedBid(fbb, rb.bid.bidder, rb.bid.amount,
                                                         std::to_underlying(rb.reason)));
            }
        }
        auto const rejected_vec = fbb.CreateVector(rejected);

        std::vector<flatbuffers::Offset<fb::CardDrawn>> cards;
        for (CardDrawn const& c : r.cards)
        {
            auto const text = fbb.CreateString(c.text);
            cards.push_back(fb::CreateCardDrawn(fbb, static_cast<fb::Deck>(std::to_underlying(c.deck)), text));
        }
        auto const cards_vec = fbb.CreateVector(cards);

        std::vector<flatbuffers::Offset<fb::Bankruptcy>> bankrupt;
        for (Bankruptcy const& b : r.bankruptcies)
        {
            bankrupt.push_back(fb::CreateBankruptcy(fbb, b.player, OrNone(b.creditor)));
        }
        auto const bankrupt_vec = fbb.CreateVector(bankrupt);
        auto const events_vec = fbb.CreateVectorOfStrings(r.events);

        auto const rep = fb::CreateReportMsg(
            fbb,
            msg_id,
            r.actor,
            ToFbOutcome(r.outcome),
            ToFbPhase(r.phase_after),
            r.dice ? r.dice->d1 : std::uint8_t{0},
            r.dice ? r.dice->d2 : std::uint8_t{0},
            r.doubles,
            OrNone(r.landed_on),
            r.passed_go,
            r.cash_delta,
            static_cast<std::int16_t>(r.position_delta),
            r.purchase ? static_cast<std::int16_t>(r.purchase->property) : std::int16_t{-1},
            r.purchase ? r.purchase->price : 0,
            r.auction ? static_cast<std::int16_t>(r.auction->property) : std::int16_t{-1},
            r.auction ? OrNone(r.auction->winner) : std::int16_t{-1},
            r.auction ? r.auction->price : 0,
            rejected_vec,
            cards_vec,
            bankrupt_vec,
            events_vec,
            r.game_over,
            OrNone(r.winner)
        );
        auto const env = fb::CreateEnvelope(fbb, fb::Message::ReportMsg, rep.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    // ---------- Violation ----------

    auto BuildViolation(error::RuleViolation const& v, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(error::describe(v));
        auto const vio = fb::CreateViolation(fbb, msg_id, std::to_underlying(v.kind()), std::to_underlying(v.code), txt);
        auto const env = fb::CreateEnvelope(fbb, fb::Message::Violation, vio.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    // ---------- Requests ----------

    auto BuildActionRequest(GameImpl const& g, std::string_view const session, ActionRequest const& req,
                            std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        Board const& board = g.BoardRef();
        auto prop = [&](SpaceIdxT const s) { return fbb.CreateString(board.At(s).name); };

        auto const [type, body] = std::visit(
            [&]<typename T0>(T0 const& a) -> std::pair<fb::Action, flatbuffers::Offset<void>>
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, RollAction>)
                    return {fb::Action::Action_Roll, fb::CreateAction_Roll(fbb).Union()};
                else if constexpr (std::is_same_v<T, PayJailFineAction>)
                    return {fb::Action::Action_PayJailFine, fb::CreateAction_PayJailFine(fbb).Union()};
                else if constexpr (std::is_same_v<T, UseJailCardAction>)
                    return {fb::Action::Action_UseJailCard, fb::CreateAction_UseJailCard(fbb).Union()};
                else if constexpr (std::is_same_v<T, BuyAction>)
                    return {fb::Action::Action_Buy, fb::CreateAction_Buy(fbb, prop(a.property)).Union()};
                else if constexpr (std::is_same_v<T, DeclineAction>)
                {
                    auto const p = prop(a.property);
                    std::vector<flatbuffers::Offset<fb::Bid>> bids;
                    for (Bid const& b : a.bids)
                    {
                        auto const who = fbb.CreateString(g.PlayerName(b.bidder));
                        bids.push_back(fb::CreateBid(fbb, who, b.amount));
                    }
                    auto const bids_vec = fbb.CreateVector(bids);
                    return {fb::Action::Action_Decline, fb::CreateAction_Decline(fbb, p, bids_vec).Union()};
                }
                else if constexpr (std::is_same_v<T, MortgageAction>)
                    return {fb::Action::Action_Mortgage, fb::CreateAction_Mortgage(fbb, prop(a.property)).Union()};
                else if constexpr (std::is_same_v<T, UnmortgageAction>)
                    return {fb::Action::Action_Unmortgage, fb::CreateAction_Unmortgage(fbb, prop(a.property)).Union()};
                else if constexpr (std::is_same_v<T, BuildAction>)
                    return {fb::Action::Action_Build, fb::CreateAction_Build(fbb, prop(a.property)).Union()};
                else if constexpr (std::is_same_v<T, SellBuildingAction>)
                    return {fb::Action::Action_SellBuilding,
                            fb::CreateAction_SellBuilding(fbb, prop(a.property)).Union()};
                else if constexpr (std::is_same_v<T, ProposeTradeAction>)
                {
                    auto const who = fbb.CreateString(g.PlayerName(a.counterparty));
                    auto const give = BuildNamedBundle(fbb, board, a.give);
                    auto const take = BuildNamedBundle(fbb, board, a.take);
                    return {fb::Action::Action_ProposeTrade,
                            fb::CreateAction_ProposeTrade(fbb, who, give, take).Union()};
                }
                else if constexpr (std::is_same_v<T, RespondTradeAction>)
                    return {fb::Action::Action_RespondTrade, fb::CreateAction_RespondTrade(fbb, a.accept).Union()};
                else if constexpr (std::is_same_v<T, PayDebtAction>)
                    return {fb::Action::Action_PayDebt, fb::CreateAction_PayDebt(fbb).Union()};
                else if constexpr (std::is_same_v<T, DeclareBankruptcyAction>)
                    return {fb::Action::Action_DeclareBankruptcy, fb::CreateAction_DeclareBankruptcy(fbb).Union()};
                else
                    return {fb::Action::Action_EndTurn, fb::CreateAction_EndTurn(fbb).Union()};
            },
            req.action);

        auto const session_str = fbb.CreateString(session);
        auto const actor = fbb.CreateString(g.PlayerName(req.actor));
        auto const pam = fb::CreatePlayerActionMsg(fbb, msg_id, session_str, actor, type, body);
        auto const env = fb::CreateEnvelope(fbb, fb::Message::PlayerActionMsg, pam.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    auto PeekRequest(std::span<std::byte const> const bytes) -> std::expected<RequestHeader, ParseError>
    {
        auto const pam = Verified(bytes);
        if (!pam) return std::unexpected(pam.error());
        return RequestHeader{.msg_id = (*pam)->msg_id(), .session = (*pam)->session()->str()};
    }

    auto DecodeActionRequest(GameImpl const& g, std::span<std::byte const> const bytes)
        -> std::expected<DecodedRequest, ParseError>
    {
        auto const verified = Verified(bytes);
        if (!verified) return std::unexpected(verified.error());
        fb::PlayerActionMsg const* pam = *verified;

        auto const actor = ResolvePlayer(g, pam->actor()->string_view());
        if (!actor) return Unresolved(actor.error());

        Board const& board = g.BoardRef();
        error::Result<PlayerAction> action;

        switch (pam->action_type())
        {
        case fb::Action::Action_Roll: action = RollAction{}; break;
        case fb::Action::Action_PayJailFine: action = PayJailFineAction{}; break;
        case fb::Action::Action_UseJailCard: action = UseJailCardAction{}; break;
        case fb::Action::Action_Buy:
            action = PropertyAction<BuyAction>(board, pam->action_as_Action_Buy());
            break;
        case fb::Action::Action_Decline:
        {
            auto const* d = pam->action_as_Action_Decline();
            auto const s = Property(board, d->property());
            if (!s) return Unresolved(s.error());
            DeclineAction out{.property = *s};
            if (auto const* bids = d->bids())
            {
                for (auto const* b : *bids)
                {
                    std::string_view const name = b->bidder() ? b->bidder()->string_view() : std::string_view{};
                    auto const who = g.FindPlayer(name);
                    if (!who)
                        return Unresolved(error::Viol(error::ViolationCode::Auction_UnknownBidder)
                                          .with_subject(std::string{name}));
                    out.bids.push_back(Bid{.bidder = *who, .amount = b->amount()});
                }
            }
            action = std::move(out);
            break;
        }
        case fb::Action::Action_Mortgage:
            action = PropertyAction<MortgageAction>(board, pam->action_as_Action_Mortgage());
            break;
        case fb::Action::Action_Unmortgage:
            action = PropertyAction<UnmortgageAction>(board, pam->action_as_Action_Unmortgage());
            break;
        case fb::Action::Action_Build:
            action = PropertyAction<BuildAction>(board, pam->action_as_Action_Build());
            break;
        case fb::Action::Action_SellBuilding:
            action = PropertyAction<SellBuildingAction>(board, pam->action_as_Action_SellBuilding());
            break;
        case fb::Action::Action_ProposeTrade:
        {
            auto const* t = pam->action_as_Action_ProposeTrade();
            std::string_view const name = t->counterparty() ? t->counterparty()->string_view() : std::string_view{};
            auto const other = g.FindPlayer(name);
            if (!other)
                return Unresolved(error::Viol(error::ViolationCode::Trade_UnknownCounterparty)
                                  .with_subject(std::string{name}));
            auto give = DecodeBundle(board, t->give());
            if (!give) return Unresolved(give.error());
            auto take = DecodeBundle(board, t->take());
            if (!take) return Unresolved(take.error());
            action = ProposeTradeAction{.counterparty = *other, .give = std::move(*give), .take = std::move(*take)};
            break;
        }
        case fb::Action::Action_RespondTrade:
            action = RespondTradeAction{.accept = pam->action_as_Action_RespondTrade()->accept()};
            break;
        case fb::Action::Action_PayDebt: action = PayDebtAction{}; break;
        case fb::Action::Action_DeclareBankruptcy: action = DeclareBankruptcyAction{}; break;
        case fb::Action::Action_EndTurn: action = EndTurnAction{}; break;
        default:
            return Fail(ParseError::Kind::UnknownAction,
                        std::format("unknown action variant {}", static_cast<int>(pam->action_type())));
        }

        if (!action) return Unresolved(action.error());
        return DecodedRequest{
            .msg_id = pam->msg_id(),
            .session = pam->session()->str(),
            .request = ActionRequest{.actor = *actor, .action = std::move(*action)},
        };
    }

    auto Dispatch(Engine& engine, std::span<std::byte const> const bytes)
        -> std::expected<flatbuffers::DetachedBuffer, ParseError>
    {
        auto const header = PeekRequest(bytes);
        if (!header) return std::unexpected(header.error());

        auto const session = engine.Registry().Find(header->session);
        if (!session) return BuildViolation(session.error(), header->msg_id);

        // names and the board never change, so decoding can run under a read lock
        auto decoded = (*session)->Read([bytes](GameImpl const& g) { return DecodeActionRequest(g, bytes); });
        if (!decoded)
        {
            if (decoded.error().violation) return BuildViolation(*decoded.error().violation, header->msg_id);
            return std::unexpected(std::move(decoded.error()));
        }

        auto const result = engine.Submit(decoded->session, decoded->request);
        if (!result) return BuildViolation(result.error(), decoded->msg_id);
        return BuildReport(*result, decoded->msg_id);
    }
}
