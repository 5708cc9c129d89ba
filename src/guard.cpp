#include <libxmute/guard.hpp>
#include <libxmute/align.hpp>

#include <cstdint>
#include <utility>

std::optional<xmute::guard_error> xmute::check_guard(std::size_t length, std::size_t element_size, guard_policy policy)
{
    if (element_size == 0)
    {
        return guard_error{0, length, error_reason::ZeroSizedTarget};
    }

    auto count = length / element_size;
    auto remainder = length % element_size;
    auto not_enough = guard_error{element_size, length, error_reason::NotEnoughBytes};

    switch (policy)
    {
        case guard_policy::Exact:
            if (count == 0)
            {
                return not_enough;
            }
            if (remainder != 0)
            {
                return guard_error{element_size, length, error_reason::InexactByteCount};
            }
            return std::nullopt;

        case guard_policy::AtLeast:
            // Zero elements is a valid sequence, a partial one is not
            if (length != 0 && count == 0)
            {
                return not_enough;
            }
            return std::nullopt;

        case guard_policy::SingleValue:
            if (count == 0)
            {
                return not_enough;
            }
            if (length != element_size)
            {
                return guard_error{element_size, length, error_reason::TooManyBytes};
            }
            return std::nullopt;
    }

    std::unreachable();
}

xmute::guard_outcome xmute::guard(std::size_t length, std::size_t element_size, guard_policy policy)
{
    if (auto failure = check_guard(length, element_size, policy))
    {
        error::send(*failure);
    }

    auto count = length / element_size;
    return {count, length - count * element_size};
}

void xmute::guard_alignment(std::span<const std::byte> bytes, std::size_t element_size, std::size_t alignment,
                            guard_policy policy)
{
    if (bytes.empty() && policy == guard_policy::AtLeast)
    {
        return;
    }

    auto check = check_alignment(reinterpret_cast<std::uintptr_t>(bytes.data()), alignment);
    if (check.is_aligned())
    {
        return;
    }

    auto usable = usable_bytes(bytes.size(), check);
    if (usable < element_size)
    {
        error::send(guard_error{element_size, usable, error_reason::NotEnoughBytes, check.offset_to_next_valid});
    }

    // Only suggest the skip when the realigned bytes would pass the policy
    if (auto failure = check_guard(usable, element_size, policy))
    {
        failure->misalignment = check.offset_to_next_valid;
        error::send(*failure);
    }

    error::send(unaligned_error{check.offset_to_next_valid, check.alignment});
}
