#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace pydust {

enum class ErrorKind {
    TypeMismatch,
    UnsupportedFeature,
    InvalidConfiguration,
    ManifestError,
};

constexpr std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::TypeMismatch:
        return "type mismatch";
    case ErrorKind::UnsupportedFeature:
        return "unsupported feature";
    case ErrorKind::InvalidConfiguration:
        return "invalid configuration";
    case ErrorKind::ManifestError:
        return "manifest error";
    }
    return "unknown error";
}

/**
 * @brief Error payload carried by every failing `Result`.
 */
struct Error {
    ErrorKind kind;
    std::string message;
};

template <typename T>
using Result = std::expected<T, Error>;

inline std::unexpected<Error> make_error(ErrorKind kind, std::string message) {
    return std::unexpected(Error{kind, std::move(message)});
}

} // namespace pydust

template <>
struct std::formatter<pydust::Error> : std::formatter<std::string_view> {
    auto format(const pydust::Error &err, std::format_context &ctx) const {
        return std::format_to(ctx.out(), "{}: {}", pydust::to_string(err.kind), err.message);
    }
};
