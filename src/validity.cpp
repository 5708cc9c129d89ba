#include <libxmute/validity.hpp>

#include <algorithm>
#include <bit>

namespace
{
static_assert(sizeof(bool) == 1, "unsupported platform: bool is not a single byte");

constexpr auto cFalse = std::bit_cast<std::byte>(false);
constexpr auto cTrue = std::bit_cast<std::byte>(true);
}

std::optional<xmute::invalid_value_error> xmute::validity<bool>::find_invalid(std::span<const std::byte> bytes)
{
    auto invalid = std::ranges::find_if(bytes, [](std::byte b) { return b != cFalse && b != cTrue; });
    if (invalid == bytes.end())
    {
        return std::nullopt;
    }

    return invalid_value_error{static_cast<std::size_t>(invalid - bytes.begin()), *invalid};
}
