#pragma once

#include <libxmute/error.hpp>

#include <cstddef>
#include <optional>
#include <span>

namespace xmute
{
enum class guard_policy
{
    Exact,      // At least one element and no trailing bytes ("pedantic")
    AtLeast,    // As many elements as fit, trailing bytes ignored ("permissive")
    SingleValue // Exactly one element
};

struct guard_outcome
{
    std::size_t count;  // Whole elements exposed
    std::size_t unused; // Trailing bytes left out
};

// All policies share this arithmetic so that deficit and surplus diagnostics
// are computed the same way whichever call produced them.
std::optional<guard_error> check_guard(std::size_t length, std::size_t element_size, guard_policy policy);

guard_outcome guard(std::size_t length, std::size_t element_size, guard_policy policy);

template <typename T>
guard_outcome guard(std::size_t length, guard_policy policy)
{
    return guard(length, sizeof(T), policy);
}

// Fails with Unaligned when bytes does not start on an alignment boundary, or
// with NotEnoughBytes when skipping to the boundary leaves less than one
// element. An empty buffer under AtLeast is accepted wherever it points.
void guard_alignment(std::span<const std::byte> bytes, std::size_t element_size, std::size_t alignment,
                     guard_policy policy);
}
