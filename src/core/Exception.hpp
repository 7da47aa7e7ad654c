#ifndef MESHQUIZ_EXCEPTION_HPP
#define MESHQUIZ_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "State.hpp"
#include "Types.hpp"

namespace meshquiz::core::error
{
    // Internal faults. These never reach a message sender; they are logged at the
    // scheduler/transport boundary.
    enum class Code : unsigned
    {
        Unknown,
        State, // session engine misuse (not a rejected command)
        Grading, // scoring rules failed on a submission
        Persistence, // ledger write/read failure
        Schedule, // timer could not be armed
        Config, // bad configuration value
        Network, // transport failure
        Serialization, // FlatBuffers verification/build errors
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct GradingError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct PersistenceError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ScheduleError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConfigError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NetworkError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::Grading: throw GradingError(std::move(msg), c, loc);
        case Code::Persistence: throw PersistenceError(std::move(msg), c, loc);
        case Code::Schedule: throw ScheduleError(std::move(msg), c, loc);
        case Code::Config: throw ConfigError(std::move(msg), c, loc);
        case Code::Network: throw NetworkError(std::move(msg), c, loc);
        case Code::Serialization: throw SerializationError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define MQZ_THROW(code_enum, msg) ::meshquiz::core::error::fail((code_enum), (msg))
#define MQZ_ASSERT(cond, msg) do { if(!(cond)) ::meshquiz::core::error::fail(::meshquiz::core::error::Code::Assertion, (msg)); } while(0)

    // Reasons a command or submission is refused. Reported back to the sender only.
    enum class RejectCode : std::uint8_t
    {
        Unauthorized,
        InvalidState,
        Banned,
        NoOpenRound,
        DuplicateSubmission,
        UnknownCommand,
        InvalidArgument,
        InternalFault // logged server side; the sender only learns the command did not run
    };

    struct Rejection
    {
        RejectCode code{};
        std::optional<SessionState> state{};
        std::optional<RoundId> round{};
        std::optional<std::string> command{};
        std::optional<std::string> detail{};

        auto with_state(SessionState s) -> Rejection&
        {
            state = s;
            return *this;
        }

        auto with_round(RoundId r) -> Rejection&
        {
            round = r;
            return *this;
        }

        auto with_command(std::string c) -> Rejection&
        {
            command = std::move(c);
            return *this;
        }

        auto with_detail(std::string d) -> Rejection&
        {
            detail = std::move(d);
            return *this;
        }
    };

    inline auto Reject(RejectCode code) -> Rejection
    {
        return Rejection{.code = code};
    }

    inline auto to_string(RejectCode c) -> std::string_view
    {
        using E = RejectCode;
        switch (c)
        {
        case E::Unauthorized: return "Unauthorized";
        case E::InvalidState: return "InvalidState";
        case E::Banned: return "Banned";
        case E::NoOpenRound: return "NoOpenRound";
        case E::DuplicateSubmission: return "DuplicateSubmission";
        case E::UnknownCommand: return "UnknownCommand";
        case E::InvalidArgument: return "InvalidArgument";
        case E::InternalFault: return "InternalFault";
        }
        return "Unknown";
    }

    // Compact, reproducible text for logs and tests
    inline auto describe(Rejection const& r) -> std::string
    {
        auto s = std::format("{}", to_string(r.code));
        if (r.command) s += std::format(" | cmd={}", *r.command);
        if (r.state) s += std::format(" | state={}", core::to_string(*r.state));
        if (r.round) s += std::format(" | round={}", *r.round);
        if (r.detail) s += std::format(" | {}", *r.detail);
        return s;
    }

    template <typename T = void>
    using Outcome = std::expected<T, Rejection>;
}

#endif //MESHQUIZ_EXCEPTION_HPP
