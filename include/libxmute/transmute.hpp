#pragma once

#include <libxmute/align.hpp>
#include <libxmute/buffer.hpp>
#include <libxmute/error.hpp>
#include <libxmute/guard.hpp>
#include <libxmute/trivial.hpp>
#include <libxmute/validity.hpp>

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <span>
#include <type_traits>
#include <utility>

namespace xmute
{
namespace detail
{
// Alignment, then bit patterns of up to max_checked whole elements, then size
// policy. Returns how many elements may be exposed; throws xmute::error otherwise.
template <transmutable T>
guard_outcome check_layout(std::span<const std::byte> bytes, guard_policy policy, bool in_place = true,
                           std::size_t max_checked = std::dynamic_extent)
{
    if constexpr (alignof(T) > 1)
    {
        if (in_place)
        {
            guard_alignment(bytes, sizeof(T), alignof(T), policy);
        }
    }

    auto whole = std::min(bytes.size() / sizeof(T), max_checked);
    check_validity<T>(bytes.first(whole * sizeof(T)));
    return guard<T>(bytes.size(), policy);
}

inline void require_one(std::size_t length, std::size_t element_size, const guard_outcome& outcome)
{
    if (outcome.count == 0)
    {
        error::send(guard_error{element_size, length, error_reason::NotEnoughBytes});
    }
}
}

// Copies out the first T of bytes. SingleValue wants exactly sizeof(T)
// bytes, Exact a whole number of Ts, AtLeast ignores whatever follows.
template <transmutable T>
T transmute_one(std::span<const std::byte> bytes, guard_policy policy = guard_policy::SingleValue)
{
    auto outcome = detail::check_layout<T>(bytes, policy, true, 1);
    detail::require_one(bytes.size(), sizeof(T), outcome);

    T result;
    std::memcpy(&result, bytes.data(), sizeof(T));
    return result;
}

// Views bytes as Ts without copying. The view aliases bytes.
template <transmutable T>
std::span<const T> transmute_many(std::span<const std::byte> bytes, guard_policy policy = guard_policy::Exact)
{
    auto outcome = detail::check_layout<T>(bytes, policy);
    if (outcome.count == 0)
    {
        return {};
    }

    return {reinterpret_cast<const T*>(bytes.data()), outcome.count};
}

template <transmutable T>
std::span<T> transmute_many_mut(std::span<std::byte> bytes, guard_policy policy = guard_policy::Exact)
{
    auto outcome = detail::check_layout<T>(bytes, policy);
    if (outcome.count == 0)
    {
        return {};
    }

    return {reinterpret_cast<T*>(bytes.data()), outcome.count};
}

// Like transmute_many, but copies into fresh storage aligned for T, so it
// succeeds wherever the bytes happen to sit.
template <transmutable T>
buffer<T> copy_many(std::span<const std::byte> bytes, guard_policy policy = guard_policy::Exact)
{
    auto outcome = detail::check_layout<T>(bytes, policy, false);

    buffer<T> result(outcome.count);
    if (outcome.count != 0)
    {
        std::memcpy(result.data(), bytes.data(), outcome.count * sizeof(T));
    }
    return result;
}

// Takes over the allocation of bytes. On failure bytes is left untouched.
// Trailing bytes ignored under AtLeast stay allocated but outside size().
template <transmutable T>
buffer<T> transmute_vec(buffer<std::byte>&& bytes, guard_policy policy = guard_policy::Exact)
{
    auto outcome = detail::check_layout<T>(bytes.bytes(), policy);
    return detail::buffer_access::rebind<T>(std::move(bytes), outcome.count);
}

// Same-layout element change of an owned buffer. Layout mismatches are
// rejected at compile time; constrained targets still have their values checked.
template <transmutable T, typename S>
    requires(sizeof(S) == sizeof(T) && alignof(S) == alignof(T))
buffer<T> transmute_buffer(buffer<S>&& values)
{
    check_validity<T>(values.bytes());
    auto count = values.size();
    return detail::buffer_access::rebind<T>(std::move(values), count);
}

template <transmutable T>
std::span<const std::byte> transmute_to_bytes(const T& value)
{
    return std::as_bytes(std::span<const T, 1>{&value, 1});
}

template <typename T, std::size_t Extent>
    requires transmutable<std::remove_const_t<T>>
std::span<const std::byte> transmute_to_bytes(std::span<T, Extent> values)
{
    return std::as_bytes(values);
}

template <transmutable T>
buffer<std::byte> transmute_to_bytes(buffer<T>&& values)
{
    auto count = values.size_bytes();
    return detail::buffer_access::rebind<std::byte>(std::move(values), count);
}
}
