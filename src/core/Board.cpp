#include "Board.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <utility>

#include "Exception.hpp"
#include "Util.hpp"

namespace tycoon::core
{
    namespace
    {
        using CG = ColorGroup;

        auto Street(CG g, MoneyT price, MoneyT house, std::array<MoneyT, 6> rent) -> SpaceDetail
        {
            return StreetSpace{.group = g, .price = price, .house_cost = house, .rent = rent};
        }

        auto MakeSpaces() -> std::array<Space, constants::BoardSize>
        {
            return {{
                {0, "GO", GoSpace{}},
                {1, "Mediterranean Avenue", Street(CG::Brown, 60, 50, {2, 10, 30, 90, 160, 250})},
                {2, "Community Chest", CommunityChestSpace{}},
                {3, "Baltic Avenue", Street(CG::Brown, 60, 50, {4, 20, 60, 180, 320, 450})},
                {4, "Income Tax", TaxSpace{200}},
                {5, "Reading Railroad", RailroadSpace{200}},
                {6, "Oriental Avenue", Street(CG::LightBlue, 100, 50, {6, 30, 90, 270, 400, 550})},
                {7, "Chance", ChanceSpace{}},
                {8, "Vermont Avenue", Street(CG::LightBlue, 100, 50, {6, 30, 90, 270, 400, 550})},
                {9, "Connecticut Avenue", Street(CG::LightBlue, 120, 50, {8, 40, 100, 300, 450, 600})},
                {10, "Jail", JailSpace{}},
                {11, "St. Charles Place", Street(CG::Pink, 140, 100, {10, 50, 150, 450, 625, 750})},
                {12, "Electric Company", UtilitySpace{150}},
                {13, "States Avenue", Street(CG::Pink, 140, 100, {10, 50, 150, 450, 625, 750})},
                {14, "Virginia Avenue", Street(CG::Pink, 160, 100, {12, 60, 180, 500, 700, 900})},
                {15, "Pennsylvania Railroad", RailroadSpace{200}},
                {16, "St. James Place", Street(CG::Orange, 180, 100, {14, 70, 200, 550, 750, 950})},
                {17, "Community Chest", CommunityChestSpace{}},
                {18, "Tennessee Avenue", Street(CG::Orange, 180, 100, {14, 70, 200, 550, 750, 950})},
                {19, "New York Avenue", Street(CG::Orange, 200, 100, {16, 80, 220, 600, 800, 1000})},
                {20, "Free Parking", FreeParkingSpace{}},
                {21, "Kentucky Avenue", Street(CG::Red, 220, 150, {18, 90, 250, 700, 875, 1050})},
                {22, "Chance", ChanceSpace{}},
                {23, "Indiana Avenue", Street(CG::Red, 220, 150, {18, 90, 250, 700, 875, 1050})},
                {24, "Illinois Avenue", Street(CG::Red, 240, 150, {20, 100, 300, 750, 925, 1100})},
                {25, "B. & O. Railroad", RailroadSpace{200}},
                {26, "Atlantic Avenue", Street(CG::Yellow, 260, 150, {22, 110, 330, 800, 975, 1150})},
                {27, "Ventnor Avenue", Street(CG::Yellow, 260, 150, {22, 110, 330, 800, 975, 1150})},
                {28, "Water Works", UtilitySpace{150}},
                {29, "Marvin Gardens", Street(CG::Yellow, 280, 150, {24, 120, 360, 850, 1025, 1200})},
                {30, "Go To Jail", GoToJailSpace{}},
                {31, "Pacific Avenue", Street(CG::Green, 300, 200, {26, 130, 390, 900, 1100, 1275})},
                {32, "North Carolina Avenue", Street(CG::Green, 300, 200, {26, 130, 390, 900, 1100, 1275})},
                {33, "Community Chest", CommunityChestSpace{}},
                {34, "Pennsylvania Avenue", Street(CG::Green, 320, 200, {28, 150, 450, 1000, 1200, 1400})},
                {35, "Short Line", RailroadSpace{200}},
                {36, "Chance", ChanceSpace{}},
                {37, "Park Place", Street(CG::DarkBlue, 350, 200, {35, 175, 500, 1100, 1300, 1500})},
                {38, "Luxury Tax", TaxSpace{100}},
                {39, "Boardwalk", Street(CG::DarkBlue, 400, 200, {50, 200, 600, 1400, 1700, 2000})},
            }};
        }

    }

    auto Space::Kind() const noexcept -> SpaceKind
    {
        // variant order mirrors SpaceKind
        return static_cast<SpaceKind>(detail.index());
    }

    auto Space::IsOwnable() const noexcept -> bool
    {
        return std::holds_alternative<StreetSpace>(detail) ||
            std::holds_alternative<RailroadSpace>(detail) ||
            std::holds_alternative<UtilitySpace>(detail);
    }

    auto Space::Price() const noexcept -> MoneyT
    {
        if (auto const* s = std::get_if<StreetSpace>(&detail)) return s->price;
        if (auto const* r = std::get_if<RailroadSpace>(&detail)) return r->price;
        if (auto const* u = std::get_if<UtilitySpace>(&detail)) return u->price;
        return 0;
    }

    auto Space::Group() const noexcept -> ColorGroup
    {
        auto const* s = std::get_if<StreetSpace>(&detail);
        return s ? s->group : ColorGroup::None;
    }

    static_assert(std::variant_size_v<SpaceDetail> == static_cast<std::size_t>(SpaceKind::FreeParking) + 1);
    static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(SpaceKind::Tax), SpaceDetail>,
                                 TaxSpace>);

    Board::Board() :
        spaces_(MakeSpaces())
    {
        for (Space const& s : spaces_)
        {
            TYC_ASSERT(spaces_[s.index].index == s.index, "Board catalog out of order");
            switch (s.Kind())
            {
            case SpaceKind::Property:
                groups_[static_cast<std::size_t>(s.Group())].push_back(s.index);
                break;
            case SpaceKind::Railroad:
                railroads_.push_back(s.index);
                break;
            case SpaceKind::Utility:
                utilities_.push_back(s.index);
                break;
            default:
                break;
            }
            if (s.IsOwnable()) ownables_.push_back(s.index);
        }
        TYC_ASSERT(ownables_.size() == 28, "Board must carry 28 ownable spaces");
        TYC_ASSERT(railroads_.size() == 4 && utilities_.size() == 2, "Board railroad/utility count");
    }

    auto Board::Classic() -> Board const&
    {
        static Board const board{};
        return board;
    }

    auto Board::At(SpaceIdxT const idx) const -> Space const&
    {
        if (idx >= constants::BoardSize)
            TYC_THROW(error::Code::State, std::format("Space index {} off the board", static_cast<int>(idx)));
        return spaces_[idx];
    }

    auto Board::GroupMembers(ColorGroup const g) const -> std::span<SpaceIdxT const>
    {
        return groups_[static_cast<std::size_t>(g)];
    }

    auto Board::FindByName(std::string_view const name) const -> std::optional<SpaceIdxT>
    {
        for (SpaceIdxT const i : ownables_)
        {
            if (util::IEquals(spaces_[i].name, name)) return i;
        }
        return std::nullopt;
    }

    auto Board::NextOfKind(SpaceIdxT const from, SpaceKind const kind) const -> SpaceIdxT
    {
        for (std::size_t step = 1; step <= constants::BoardSize; ++step)
        {
            auto const idx = static_cast<SpaceIdxT>((from + step) % constants::BoardSize);
            if (spaces_[idx].Kind() == kind) return idx;
        }
        TYC_THROW(error::Code::State, "No space of requested kind on the board");
    }

    auto to_string(SpaceKind const k) -> std::string_view
    {
        switch (k)
        {
        case SpaceKind::Go: return "GO";
        case SpaceKind::Property: return "PROPERTY";
        case SpaceKind::Railroad: return "RAILROAD";
        case SpaceKind::Utility: return "UTILITY";
        case SpaceKind::Tax: return "TAX";
        case SpaceKind::Chance: return "CHANCE";
        case SpaceKind::CommunityChest: return "COMMUNITY_CHEST";
        case SpaceKind::Jail: return "JAIL";
        case SpaceKind::GoToJail: return "GO_TO_JAIL";
        case SpaceKind::FreeParking: return "FREE_PARKING";
        }
        return "?";
    }

    auto to_string(ColorGroup const g) -> std::string_view
    {
        switch (g)
        {
        case ColorGroup::None: return "none";
        case ColorGroup::Brown: return "brown";
        case ColorGroup::LightBlue: return "light_blue";
        case ColorGroup::Pink: return "pink";
        case ColorGroup::Orange: return "orange";
        case ColorGroup::Red: return "red";
        case ColorGroup::Yellow: return "yellow";
        case ColorGroup::Green: return "green";
        case ColorGroup::DarkBlue: return "dark_blue";
        }
        return "?";
    }
}
