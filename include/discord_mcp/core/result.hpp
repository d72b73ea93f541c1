#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace discord_mcp {

// ---------------------------------------------------------------------------
// Result<T, E>: a discriminated union that holds either a value or an error.
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

    // -- Access -------------------------------------------------------------

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
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
// Result<void, E>: specialization for operations that succeed with no value.
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
// ErrorCategory: the error kinds a tool invocation can end in.
//
// The first four are reported to MCP clients; Protocol is only produced on
// the client side (subprocess, pipe and JSON-RPC session failures).
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    InvalidParams,
    UnknownTool,
    DeliveryError,
    ConfigurationError,
    Protocol,
};

// JSON-RPC 2.0 error codes used on the wire.
inline constexpr int kJsonRpcParseError     = -32700;
inline constexpr int kJsonRpcInvalidRequest = -32600;
inline constexpr int kJsonRpcMethodNotFound = -32601;
inline constexpr int kJsonRpcInvalidParams  = -32602;
inline constexpr int kJsonRpcInternalError  = -32603;

/// Parse a category name as produced by Error::CategoryName().
std::optional<ErrorCategory> CategoryFromName(std::string_view name);

// ---------------------------------------------------------------------------
// Error: structured error for tool invocations and webhook delivery.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string endpoint;
    std::optional<int> http_status;
    std::string message;
    std::optional<std::string> response_body;
    ErrorCategory category = ErrorCategory::DeliveryError;

    /// Create a DeliveryError from a rejected webhook response. The message
    /// carries both the status code and the response body.
    static Error FromHttpStatus(const std::string& operation,
                                const std::string& endpoint,
                                int status_code,
                                const std::string& response_body = "");

    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::ConfigurationError: return 2;
            case ErrorCategory::InvalidParams:      return 1;
            case ErrorCategory::UnknownTool:        return 1;
            case ErrorCategory::DeliveryError:      return 1;
            case ErrorCategory::Protocol:           return 1;
        }
        return 1;
    }

    [[nodiscard]] int JsonRpcCode() const {
        switch (category) {
            case ErrorCategory::InvalidParams:      return kJsonRpcInvalidParams;
            case ErrorCategory::UnknownTool:        return kJsonRpcInvalidParams;
            case ErrorCategory::DeliveryError:      return kJsonRpcInternalError;
            case ErrorCategory::ConfigurationError: return kJsonRpcInternalError;
            case ErrorCategory::Protocol:           return kJsonRpcInternalError;
        }
        return kJsonRpcInternalError;
    }

    [[nodiscard]] std::string CategoryName() const {
        switch (category) {
            case ErrorCategory::InvalidParams:      return "InvalidParams";
            case ErrorCategory::UnknownTool:        return "UnknownTool";
            case ErrorCategory::DeliveryError:      return "DeliveryError";
            case ErrorCategory::ConfigurationError: return "ConfigurationError";
            case ErrorCategory::Protocol:           return "Protocol";
        }
        return "DeliveryError";
    }

    [[nodiscard]] std::string ToString() const;

    /// {"error":{"kind":...,"operation":...,"message":...,...}}
    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               endpoint == other.endpoint &&
               http_status == other.http_status &&
               message == other.message &&
               response_body == other.response_body &&
               category == other.category;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace discord_mcp
