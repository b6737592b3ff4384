#ifndef TYCOON_TYPES_HPP
#define TYCOON_TYPES_HPP

#define TYC_ENABLE_TEST_HOOKS true

#include <cstddef>
#include <cstdint>
#include <random>

namespace tycoon::core::constants
{
    inline constexpr std::size_t BoardSize = 40;
    inline constexpr std::size_t DeckSize = 16;

    inline constexpr std::uint8_t GoPosition = 0;
    inline constexpr std::uint8_t JailPosition = 10;
    inline constexpr std::uint8_t GoToJailPosition = 30;

    inline constexpr std::size_t MinPlayers = 2;
    inline constexpr std::size_t MaxPlayers = 8;

    inline constexpr std::uint8_t HotelLevel = 5;
    inline constexpr int HousesPerHotel = 4;
    inline constexpr int TotalHouses = 32;
    inline constexpr int TotalHotels = 12;

    inline constexpr std::uint8_t MaxJailAttempts = 3;
    inline constexpr std::uint8_t SpeedingDoubles = 3;

    inline constexpr int RailroadBaseRent = 25;
    inline constexpr int SingleUtilityMultiplier = 4;
    inline constexpr int BothUtilitiesMultiplier = 10;
}

namespace tycoon::core
{
    using PlyrIdxT = std::uint8_t;
    using SpaceIdxT = std::uint8_t;
    using MoneyT = std::int32_t;

    enum class SpaceKind : std::uint8_t
    {
        Go = 0,
        Property,
        Railroad,
        Utility,
        Tax,
        Chance,
        CommunityChest,
        Jail,
        GoToJail,
        FreeParking
    };

    enum class ColorGroup : std::uint8_t
    {
        None = 0,
        Brown,
        LightBlue,
        Pink,
        Orange,
        Red,
        Yellow,
        Green,
        DarkBlue
    };

    enum class DeckKind : std::uint8_t
    {
        Chance = 0,
        CommunityChest
    };

    struct DiceRoll
    {
        std::uint8_t d1{1};
        std::uint8_t d2{1};

        [[nodiscard]]
        auto Sum() const noexcept -> int { return d1 + d2; }
        [[nodiscard]]
        auto IsDoubles() const noexcept -> bool { return d1 == d2; }
    };

    struct Config
    {
        MoneyT   starting_cash{1500};
        MoneyT   go_salary{200};
        MoneyT   jail_fine{50};
        MoneyT   auction_min_bid{10};
        // unmortgage cost = mortgage value * pct / 100 (floored)
        MoneyT   unmortgage_rate_pct{110};
        bool     shuffle_decks{true};
        bool     log_rejections{false};
        std::uint64_t seed{std::random_device{}()};
    };
}

#endif //TYCOON_TYPES_HPP
