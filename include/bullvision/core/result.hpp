#pragma once

#include <cassert>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace bullvision {

// ---------------------------------------------------------------------------
// Result<T, E> — a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    // -- Factories ----------------------------------------------------------

    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    // -- Query --------------------------------------------------------------

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    // -- Access (const&) ----------------------------------------------------

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    // -- Access (&&) --------------------------------------------------------

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    // -- ValueOr ------------------------------------------------------------

    [[nodiscard]] T ValueOr(T default_value) const& {
        if (IsOk()) {
            return std::get<0>(storage_);
        }
        return default_value;
    }

    [[nodiscard]] T ValueOr(T default_value) && {
        if (IsOk()) {
            return std::get<0>(std::move(storage_));
        }
        return default_value;
    }

    // -- Monadic: AndThen ---------------------------------------------------
    // fn: T -> Result<U, E>

    template <typename Fn>
    auto AndThen(Fn&& fn) const& -> std::invoke_result_t<Fn, const T&> {
        using ReturnType = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(storage_));
        }
        return ReturnType::Err(std::get<1>(storage_));
    }

    template <typename Fn>
    auto AndThen(Fn&& fn) && -> std::invoke_result_t<Fn, T&&> {
        using ReturnType = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(std::move(storage_)));
        }
        return ReturnType::Err(std::get<1>(std::move(storage_)));
    }

    // -- Monadic: Map -------------------------------------------------------
    // fn: T -> U

    template <typename Fn>
    auto Map(Fn&& fn) const& -> Result<std::invoke_result_t<Fn, const T&>, E> {
        using U = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(storage_)));
        }
        return Result<U, E>::Err(std::get<1>(storage_));
    }

    template <typename Fn>
    auto Map(Fn&& fn) && -> Result<std::invoke_result_t<Fn, T&&>, E> {
        using U = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(std::move(storage_))));
        }
        return Result<U, E>::Err(std::get<1>(std::move(storage_)));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E> — specialization for operations that succeed with no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory — classifies errors for callers, logs and exit codes.
//
//   Connection / Timeout        launch or handshake failure (ConnectionError)
//   Protocol                    malformed traffic or dropped transport
//   NotReady / BackendRejected  tool-call outcomes (ToolExecutionError)
//   ToolCatalogUnavailable /
//   NoBackendsAvailable         a turn cannot proceed (DispatchError)
//   Cleanup                     teardown failure, logged only
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Connection,
    Protocol,
    Timeout,
    NotReady,
    BackendRejected,
    ToolCatalogUnavailable,
    NoBackendsAvailable,
    Cleanup,
    InvalidHandle,
    Config,
    Storage,
    Model,
    Internal,
};

// ---------------------------------------------------------------------------
// Error — structured error type shared by every module.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string target;                  // backend name, user id or path
    std::string message;
    ErrorCategory category = ErrorCategory::Internal;
    std::optional<int> rpc_code;         // JSON-RPC error code, if any
    std::optional<std::string> detail;   // backend payload, serialized

    static Error Make(ErrorCategory category,
                      std::string operation,
                      std::string target,
                      std::string message) {
        Error e;
        e.operation = std::move(operation);
        e.target = std::move(target);
        e.message = std::move(message);
        e.category = category;
        return e;
    }

    [[nodiscard]] bool Is(ErrorCategory c) const noexcept { return category == c; }

    /// True for the two DispatchError flavours.
    [[nodiscard]] bool IsDispatchError() const noexcept {
        return category == ErrorCategory::ToolCatalogUnavailable ||
               category == ErrorCategory::NoBackendsAvailable;
    }

    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::Config:                 return 2;
            case ErrorCategory::Connection:             return 3;
            case ErrorCategory::Timeout:                return 4;
            case ErrorCategory::Protocol:               return 5;
            case ErrorCategory::NotReady:               return 6;
            case ErrorCategory::BackendRejected:        return 7;
            case ErrorCategory::ToolCatalogUnavailable: return 8;
            case ErrorCategory::NoBackendsAvailable:    return 9;
            case ErrorCategory::InvalidHandle:          return 10;
            case ErrorCategory::Storage:                return 11;
            case ErrorCategory::Model:                  return 12;
            case ErrorCategory::Cleanup:                return 13;
            case ErrorCategory::Internal:               return 99;
        }
        return 99;
    }

    [[nodiscard]] std::string CategoryName() const {
        switch (category) {
            case ErrorCategory::Connection:             return "connection";
            case ErrorCategory::Protocol:               return "protocol";
            case ErrorCategory::Timeout:                return "timeout";
            case ErrorCategory::NotReady:               return "not_ready";
            case ErrorCategory::BackendRejected:        return "backend_rejected";
            case ErrorCategory::ToolCatalogUnavailable: return "tool_catalog_unavailable";
            case ErrorCategory::NoBackendsAvailable:    return "no_backends_available";
            case ErrorCategory::Cleanup:                return "cleanup";
            case ErrorCategory::InvalidHandle:          return "invalid_handle";
            case ErrorCategory::Config:                 return "config";
            case ErrorCategory::Storage:                return "storage";
            case ErrorCategory::Model:                  return "model";
            case ErrorCategory::Internal:               return "internal";
        }
        return "internal";
    }

    [[nodiscard]] std::string ToString() const {
        std::ostringstream oss;
        oss << operation;
        if (!target.empty()) {
            oss << " [" << target << "]";
        }
        if (rpc_code.has_value()) {
            oss << " (rpc " << *rpc_code << ")";
        }
        oss << ": " << message;
        return oss.str();
    }

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               target == other.target &&
               message == other.message &&
               category == other.category &&
               rpc_code == other.rpc_code &&
               detail == other.detail;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace bullvision
