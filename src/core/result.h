#pragma once

#include <cstdint>
#include <utility>
#include <variant>

namespace core {

/**
 * Kinds of failure reported by the core
 */
enum class Error {
    InvalidToken,
    Expired,
    AlreadyUsed,
    AlreadyVoted,
    ChainBroken,
    StorageUnavailable,
    ElectionNotFound,
    ElectionNotOpen,
    ElectionNotClosed,
    InvalidArgument
};

/**
 * Convert Error to string
 */
const char* error_to_string(Error error);

/**
 * A failed outcome. sequence_no is only meaningful for ChainBroken.
 */
struct Failure {
    Error code;
    uint64_t sequence_no = 0;
};

/**
 * Value or Failure
 *
 * Every fallible operation of the core returns one of these instead of
 * throwing, so callers can always tell the rejection kinds apart.
 */
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Failure failure) : data_(failure) {}
    Result(Error error) : data_(Failure{error}) {}

    [[nodiscard]] bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    [[nodiscard]] T& value() { return std::get<T>(data_); }
    [[nodiscard]] const T& value() const { return std::get<T>(data_); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() { return value(); }
    const T& operator*() const { return value(); }

    [[nodiscard]] const Failure& failure() const { return std::get<Failure>(data_); }
    [[nodiscard]] Error error() const { return failure().code; }

private:
    std::variant<T, Failure> data_;
};

struct Unit {};

using Status = Result<Unit>;

inline Status ok_status() {
    return Unit{};
}

} // namespace core
