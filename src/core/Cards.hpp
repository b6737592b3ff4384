#ifndef TYCOON_CARDS_HPP
#define TYCOON_CARDS_HPP

#include <deque>
#include <random>
#include <span>
#include <string_view>
#include <variant>

#include "Types.hpp"

namespace tycoon::core::debug {struct Inspector;}
namespace tycoon::core
{
    namespace card
    {
        struct AdvanceTo
        {
            SpaceIdxT target{};
            bool collect_go{true};
        };

        // Railroad pays 2x table rent, utility pays 10x a fresh roll.
        struct AdvanceToNearest
        {
            SpaceKind kind{SpaceKind::Railroad};
        };

        struct MoveBack              { std::uint8_t spaces{}; };
        struct Collect               { MoneyT amount{}; };
        struct Pay                   { MoneyT amount{}; };
        struct PayEachPlayer         { MoneyT amount{}; };
        struct CollectFromEachPlayer { MoneyT amount{}; };
        struct GetOutOfJailFree      {};
        struct GoToJail              {};

        struct RepairAssessment
        {
            MoneyT per_house{};
            MoneyT per_hotel{};
        };
    }

    using CardEffect = std::variant<
        card::AdvanceTo, card::AdvanceToNearest, card::MoveBack,
        card::Collect, card::Pay, card::PayEachPlayer, card::CollectFromEachPlayer,
        card::GetOutOfJailFree, card::GoToJail, card::RepairAssessment>;

    using CardIdT = std::uint8_t;

    struct CardDef
    {
        std::string_view text;
        CardEffect effect;
    };

    // 16 definitions per deck, indexed by CardIdT.
    auto CardCatalog(DeckKind kind) -> std::span<CardDef const>;

    class Deck
    {
    public:
        Deck(DeckKind kind, bool shuffle, std::mt19937_64& rng);

        // Takes the top card. Every card except Get Out of Jail Free goes straight
        // back underneath; the jail card stays out until ReturnJailCard.
        auto Draw() -> CardDef const&;
        auto ReturnJailCard() -> void;

        [[nodiscard]]
        auto Kind() const noexcept -> DeckKind { return kind_; }
        [[nodiscard]]
        auto Size() const noexcept -> std::size_t { return order_.size(); }
        [[nodiscard]]
        auto JailCardOut() const noexcept -> bool { return order_.size() < constants::DeckSize; }

        friend struct debug::Inspector;

    private:
        DeckKind kind_;
        std::deque<CardIdT> order_;
        CardIdT jail_card_id_{};
    };

    auto to_string(DeckKind k) -> std::string_view;
}

#endif //TYCOON_CARDS_HPP
