#ifndef TYCOON_CODEC_HPP
#define TYCOON_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/State.hpp"
#include "../core/Game.hpp"
#include "../core/Engine.hpp"
#include "../core/Exception.hpp"

#include "generated/flatbuffers/tycoon_net_generated.h"

namespace tycoon::core::net
{
    namespace fb = tycoon::gen::net;

    inline constexpr std::uint16_t SchemaVersion = 1;

    struct ParseError
    {
        enum class Kind : std::uint8_t
        {
            Truncated,
            Unverified,
            WrongMessage,
            MissingField,
            UnknownAction,
            UnresolvedName // names a player or property the session does not know
        };

        Kind kind{};
        std::string message;
        // set for UnresolvedName so callers can answer with a Violation
        std::optional<error::RuleViolation> violation{};
    };

    struct RequestHeader
    {
        std::uint64_t msg_id{};
        std::string session;
    };

    struct DecodedRequest
    {
        std::uint64_t msg_id{};
        std::string session;
        ActionRequest request;
    };

    auto ToFbPhase(Phase p) noexcept -> fb::Phase;
    auto ToFbOutcome(MoveOutcome m) noexcept -> fb::Outcome;

    // ---------- engine -> client ----------

    auto BuildSnapshot(GameSnapshot const& s, std::string_view session, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildReport(ActionReport const& r, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildViolation(error::RuleViolation const& v, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // ---------- client -> engine ----------

    // Encodes an index-addressed request with the names the session uses.
    auto BuildActionRequest(GameImpl const& g, std::string_view session, ActionRequest const& req,
                            std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // Verifies the buffer and returns the message id and the session it targets.
    auto PeekRequest(std::span<std::byte const> bytes) -> std::expected<RequestHeader, ParseError>;

    // Verifies the buffer and resolves actor/property names against `g`.
    auto DecodeActionRequest(GameImpl const& g, std::span<std::byte const> bytes)
        -> std::expected<DecodedRequest, ParseError>;

    // Full round: decode, submit, and answer with a ReportMsg or a Violation envelope.
    auto Dispatch(Engine& engine, std::span<std::byte const> bytes)
        -> std::expected<flatbuffers::DetachedBuffer, ParseError>;

    inline auto AsBytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
    }
}

#endif //TYCOON_CODEC_HPP
