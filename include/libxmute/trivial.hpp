#pragma once

#include <array>
#include <cstddef>
#include <type_traits>

namespace xmute
{
// Opt-in marker: specialise to std::true_type for a type whose every bit
// pattern of sizeof(T) bytes is a valid value. The claim is not verified, only
// relied upon, so values of such types are never inspected before use.
template <typename T>
struct is_trivially_transmutable : std::false_type {};

template <typename T>
    requires(std::is_integral_v<T> && !std::is_same_v<std::remove_cv_t<T>, bool>)
struct is_trivially_transmutable<T> : std::true_type {};

template <> struct is_trivially_transmutable<std::byte> : std::true_type {};
template <> struct is_trivially_transmutable<float> : std::true_type {};
template <> struct is_trivially_transmutable<double> : std::true_type {};

template <typename T, std::size_t N>
struct is_trivially_transmutable<std::array<T, N>> : is_trivially_transmutable<T> {};

template <typename T>
inline constexpr bool is_trivially_transmutable_v = is_trivially_transmutable<T>::value;

template <typename T>
concept trivially_transmutable = is_trivially_transmutable_v<T> && std::is_trivially_copyable_v<T>;
}
