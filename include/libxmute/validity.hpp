#pragma once

#include <libxmute/error.hpp>
#include <libxmute/trivial.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <type_traits>

namespace xmute
{
// Bit pattern checks for types where only some patterns are values.
// A constrained specialisation sets constrained and provides
//     static std::optional<invalid_value_error> find_invalid(std::span<const std::byte>);
// which scans whole elements and reports the first offending byte.
template <typename T>
struct validity
{
    static constexpr bool constrained = false;
};

template <>
struct validity<bool>
{
    static constexpr bool constrained = true;
    static std::optional<invalid_value_error> find_invalid(std::span<const std::byte> bytes);
};

template <typename T, std::size_t N>
    requires validity<T>::constrained
struct validity<std::array<T, N>>
{
    static constexpr bool constrained = true;

    static std::optional<invalid_value_error> find_invalid(std::span<const std::byte> bytes)
    {
        for (std::size_t offset = 0; offset + sizeof(T) <= bytes.size(); offset += sizeof(T))
        {
            if (auto invalid = validity<T>::find_invalid(bytes.subspan(offset, sizeof(T))))
            {
                invalid->offset += offset;
                return invalid;
            }
        }

        return std::nullopt;
    }
};

template <typename T>
concept constrained_transmutable = validity<T>::constrained && std::is_trivially_copyable_v<T>;

template <typename T>
concept transmutable = trivially_transmutable<T> || constrained_transmutable<T>;

template <transmutable T>
void check_validity(std::span<const std::byte> bytes)
{
    if constexpr (constrained_transmutable<T>)
    {
        if (auto invalid = validity<T>::find_invalid(bytes))
        {
            error::send(*invalid);
        }
    }
}
}
