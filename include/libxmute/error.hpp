#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace xmute
{
enum class error_kind
{
    Unaligned,      // Start address does not satisfy the target alignment
    InvalidValue,   // Bytes do not form a legal value of a constrained type
    SizeMismatch,   // Length rejected by a strict policy
    NotEnoughBytes  // Not even one element fits
};

enum class error_reason
{
    NotEnoughBytes,
    TooManyBytes,
    InexactByteCount,
    ZeroSizedTarget
};

std::string_view describe(error_reason reason);

struct guard_error
{
    std::size_t required{}; // Size of one element
    std::size_t actual{};   // Bytes the guard looked at
    error_reason reason{};
    // Leading bytes skipped to reach an aligned address before the check
    std::size_t misalignment{};

    // Bytes missing to reach the next whole element
    std::size_t deficit() const;
    // Bytes past the last element the policy would accept
    std::size_t surplus() const;

    bool operator==(const guard_error&) const = default;
};

struct unaligned_error
{
    // Bytes to discard from the front to reach an aligned address
    std::size_t offset{};
    std::size_t alignment{};

    bool operator==(const unaligned_error&) const = default;
};

struct invalid_value_error
{
    std::size_t offset{};
    std::byte value{};

    bool operator==(const invalid_value_error&) const = default;
};

class error : public std::runtime_error
{
public:
    using detail_type = std::variant<guard_error, unaligned_error, invalid_value_error>;

    [[noreturn]] static void send(const guard_error& err) { throw error{err}; }
    [[noreturn]] static void send(const unaligned_error& err) { throw error{err}; }
    [[noreturn]] static void send(const invalid_value_error& err) { throw error{err}; }

    error_kind kind() const;
    const detail_type& detail() const { return detail_; }

    const guard_error* guard() const { return std::get_if<guard_error>(&detail_); }
    const unaligned_error* unaligned() const { return std::get_if<unaligned_error>(&detail_); }
    const invalid_value_error* invalid_value() const { return std::get_if<invalid_value_error>(&detail_); }

private:
    explicit error(detail_type detail);

    detail_type detail_;
};
}
