#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace PV {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        NotFound,
        NotADirectory,
        ParentMissing,
        InvalidName,
        InvalidPath,
        IllegalTimestamp,
        ForbiddenMove,
        AlreadyExists,
        Conflict,
        PartialFailure,
        IOError,
        MalformedInput,
        Cancelled,
        Unavailable
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Error(Code c, std::string m, std::vector<Error> inner)
        : code(c), message(std::move(m)), causes(std::move(inner)) {}

    Code                       code;
    std::optional<std::string> message;
    std::vector<Error>         causes; // Populated for PartialFailure
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::NotADirectory:
        return "not_a_directory";
    case Error::Code::ParentMissing:
        return "parent_missing";
    case Error::Code::InvalidName:
        return "invalid_name";
    case Error::Code::InvalidPath:
        return "invalid_path";
    case Error::Code::IllegalTimestamp:
        return "illegal_timestamp";
    case Error::Code::ForbiddenMove:
        return "forbidden_move";
    case Error::Code::AlreadyExists:
        return "already_exists";
    case Error::Code::Conflict:
        return "conflict";
    case Error::Code::PartialFailure:
        return "partial_failure";
    case Error::Code::IOError:
        return "io_error";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::Cancelled:
        return "cancelled";
    case Error::Code::Unavailable:
        return "unavailable";
    }
    return "unknown_error";
}

// Client-correctable failures (4xx-equivalent). Everything else is operational.
[[nodiscard]] inline auto isClientError(Error::Code code) -> bool {
    switch (code) {
    case Error::Code::NotFound:
    case Error::Code::NotADirectory:
    case Error::Code::ParentMissing:
    case Error::Code::InvalidName:
    case Error::Code::InvalidPath:
    case Error::Code::IllegalTimestamp:
    case Error::Code::ForbiddenMove:
    case Error::Code::AlreadyExists:
    case Error::Code::Conflict:
        return true;
    default:
        return false;
    }
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const  label = errorCodeToString(error.code);
    std::string description{label};
    if (error.message && !error.message->empty()) {
        description.reserve(label.size() + 1 + error.message->size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
    }
    if (!error.causes.empty()) {
        description.append(" [");
        for (std::size_t i = 0; i < error.causes.size(); ++i) {
            if (i > 0)
                description.append("; ");
            description.append(describeError(error.causes[i]));
        }
        description.push_back(']');
    }
    return description;
}

} // namespace PV
