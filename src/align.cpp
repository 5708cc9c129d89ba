#include <libxmute/align.hpp>

xmute::alignment_check xmute::check_alignment(std::uintptr_t address, std::size_t alignment)
{
    if (alignment <= 1)
    {
        return {1, 0};
    }

    auto past_boundary = address % alignment;
    if (past_boundary == 0)
    {
        return {alignment, 0};
    }

    // Reverse the distance from "bytes past the boundary" to "bytes to the next one"
    return {alignment, alignment - past_boundary};
}

std::size_t xmute::usable_bytes(std::size_t length, const alignment_check& check)
{
    if (check.offset_to_next_valid >= length)
    {
        return 0;
    }

    return length - check.offset_to_next_valid;
}
