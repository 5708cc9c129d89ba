#include <libxmute/error.hpp>

#include <format>
#include <utility>

namespace
{
std::string format_detail(const xmute::error::detail_type& detail)
{
    struct formatter
    {
        std::string operator()(const xmute::guard_error& err) const
        {
            if (err.misalignment != 0)
            {
                return std::format("{} (required: {}, usable: {} after skipping {} unaligned bytes)",
                                   xmute::describe(err.reason), err.required, err.actual, err.misalignment);
            }
            return std::format("{} (required: {}, actual: {})", xmute::describe(err.reason), err.required, err.actual);
        }

        std::string operator()(const xmute::unaligned_error& err) const
        {
            return std::format("Data is unaligned (off by {} bytes for alignment {})", err.offset, err.alignment);
        }

        std::string operator()(const xmute::invalid_value_error& err) const
        {
            return std::format("Invalid target value {:#04x} at offset {}", std::to_integer<unsigned>(err.value), err.offset);
        }
    };

    return std::visit(formatter{}, detail);
}
}

std::string_view xmute::describe(error_reason reason)
{
    switch (reason)
    {
        case error_reason::NotEnoughBytes:
            return "Not enough bytes to fill type";
        case error_reason::TooManyBytes:
            return "Too many bytes for type";
        case error_reason::InexactByteCount:
            return "Not exactly the amount of bytes for type";
        case error_reason::ZeroSizedTarget:
            return "Target type has no size";
    }

    std::unreachable();
}

std::size_t xmute::guard_error::deficit() const
{
    switch (reason)
    {
        case error_reason::NotEnoughBytes:
            return required - actual;
        case error_reason::InexactByteCount:
            return required - actual % required;
        default:
            return 0;
    }
}

std::size_t xmute::guard_error::surplus() const
{
    switch (reason)
    {
        case error_reason::InexactByteCount:
            return actual % required;
        case error_reason::TooManyBytes:
            return actual - required;
        default:
            return 0;
    }
}

xmute::error::error(detail_type detail)
    : std::runtime_error{format_detail(detail)}, detail_{std::move(detail)}
{
}

xmute::error_kind xmute::error::kind() const
{
    if (auto err = guard())
    {
        return err->reason == error_reason::NotEnoughBytes ? error_kind::NotEnoughBytes : error_kind::SizeMismatch;
    }

    if (unaligned())
    {
        return error_kind::Unaligned;
    }

    return error_kind::InvalidValue;
}
