#pragma once

#include <expected>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace hudtext {

//-----------------------------------------------------------------------------
// Error - message with an optional chained cause
//-----------------------------------------------------------------------------
class Error {
public:
    explicit Error(std::string message) : _message(std::move(message)) {}

    Error(std::string message, const Error& cause)
        : _message(std::move(message)), _cause(std::make_shared<Error>(cause)) {}

    const std::string& message() const { return _message; }
    const Error* cause() const { return _cause.get(); }

    // "outer: inner: innermost"
    std::string chain() const {
        std::string out = _message;
        for (const Error* e = cause(); e; e = e->cause()) {
            out += ": ";
            out += e->message();
        }
        return out;
    }

private:
    std::string _message;
    std::shared_ptr<const Error> _cause;
};

template<typename T>
using Result = std::expected<T, Error>;

inline Result<void> Ok() {
    return {};
}

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T>
Result<T> Err(std::string message) {
    return std::unexpected(Error(std::move(message)));
}

template<typename T, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    return std::unexpected(Error(std::move(message), cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    if (result) return {};
    return result.error().chain();
}

} // namespace hudtext
