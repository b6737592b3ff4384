#include "Cards.hpp"

#include <algorithm>
#include <array>
#include <numeric>
#include <vector>

#include "Exception.hpp"

namespace tycoon::core
{
    namespace
    {
        using namespace card;

        std::array<CardDef, constants::DeckSize> const ChanceCards{{
            {"Advance to Boardwalk", AdvanceTo{39, true}},
            {"Advance to GO (Collect $200)", AdvanceTo{0, true}},
            {"Advance to Illinois Avenue. If you pass GO, collect $200", AdvanceTo{24, true}},
            {"Advance to St. Charles Place. If you pass GO, collect $200", AdvanceTo{11, true}},
            {"Advance to the nearest Railroad. If owned, pay owner twice the rental", AdvanceToNearest{SpaceKind::Railroad}},
            {"Advance to the nearest Railroad. If owned, pay owner twice the rental", AdvanceToNearest{SpaceKind::Railroad}},
            {"Advance to the nearest Utility. If owned, throw dice and pay owner ten times the amount thrown", AdvanceToNearest{SpaceKind::Utility}},
            {"Bank pays you dividend of $50", Collect{50}},
            {"Get Out of Jail Free", GetOutOfJailFree{}},
            {"Go Back 3 Spaces", MoveBack{3}},
            {"Go to Jail. Do not pass GO, do not collect $200", GoToJail{}},
            {"Make general repairs on all your property: $25 per house, $100 per hotel", RepairAssessment{25, 100}},
            {"Speeding fine $15", Pay{15}},
            {"Take a trip to Reading Railroad. If you pass GO, collect $200", AdvanceTo{5, true}},
            {"You have been elected Chairman of the Board. Pay each player $50", PayEachPlayer{50}},
            {"Your building loan matures. Collect $150", Collect{150}},
        }};

        std::array<CardDef, constants::DeckSize> const CommunityChestCards{{
            {"Advance to GO (Collect $200)", AdvanceTo{0, true}},
            {"Bank error in your favor. Collect $200", Collect{200}},
            {"Doctor's fee. Pay $50", Pay{50}},
            {"From sale of stock you get $50", Collect{50}},
            {"Get Out of Jail Free", GetOutOfJailFree{}},
            {"Go to Jail. Do not pass GO, do not collect $200", GoToJail{}},
            {"Holiday fund matures. Receive $100", Collect{100}},
            {"Income tax refund. Collect $20", Collect{20}},
            {"It is your birthday. Collect $10 from every player", CollectFromEachPlayer{10}},
            {"Life insurance matures. Collect $100", Collect{100}},
            {"Pay hospital fees of $100", Pay{100}},
            {"Pay school fees of $50", Pay{50}},
            {"Receive $25 consultancy fee", Collect{25}},
            {"You are assessed for street repair: $40 per house, $115 per hotel", RepairAssessment{40, 115}},
            {"You have won second prize in a beauty contest. Collect $10", Collect{10}},
            {"You inherit $100", Collect{100}},
        }};
    }

    auto CardCatalog(DeckKind const kind) -> std::span<CardDef const>
    {
        return kind == DeckKind::Chance ? std::span<CardDef const>{ChanceCards}
                                        : std::span<CardDef const>{CommunityChestCards};
    }

    Deck::Deck(DeckKind const kind, bool const shuffle, std::mt19937_64& rng) :
        kind_(kind)
    {
        std::span<CardDef const> const defs = CardCatalog(kind_);
        std::vector<CardIdT> ids(defs.size());
        std::iota(ids.begin(), ids.end(), CardIdT{0});
        if (shuffle) std::ranges::shuffle(ids, rng);
        order_.assign(ids.begin(), ids.end());

        auto const it = std::ranges::find_if(defs, [](CardDef const& d)
        {
            return std::holds_alternative<card::GetOutOfJailFree>(d.effect);
        });
        TYC_ASSERT(it != defs.end(), "Deck has no Get Out of Jail Free card");
        jail_card_id_ = static_cast<CardIdT>(std::distance(defs.begin(), it));
    }

    auto Deck::Draw() -> CardDef const&
    {
        TYC_ASSERT(!order_.empty(), "Drawing from an empty deck");
        CardIdT const id = order_.front();
        order_.pop_front();
        if (id != jail_card_id_) order_.push_back(id);
        return CardCatalog(kind_)[id];
    }

    auto Deck::ReturnJailCard() -> void
    {
        TYC_ASSERT(JailCardOut(), "Jail card returned to a deck that still holds it");
        order_.push_back(jail_card_id_);
    }

    auto to_string(DeckKind const k) -> std::string_view
    {
        return k == DeckKind::Chance ? "Chance" : "Community Chest";
    }
}
