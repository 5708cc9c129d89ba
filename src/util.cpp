#include <libxmute/util.hpp>

#include <bit>

namespace
{
constexpr std::uint32_t cF32ExponentMask{0x7F80'0000};
constexpr std::uint32_t cF32QuietMask{0x0040'0000};
constexpr std::uint32_t cF32FractionMask{0x007F'FFFF};

constexpr std::uint64_t cF64ExponentMask{0x7FF0'0000'0000'0000};
constexpr std::uint64_t cF64QuietMask{0x0008'0000'0000'0000};
constexpr std::uint64_t cF64FractionMask{0x000F'FFFF'FFFF'FFFF};
}

float xmute::designalise_f32_bits(std::uint32_t bits)
{
    if ((bits & cF32ExponentMask) == cF32ExponentMask && (bits & cF32FractionMask) != 0)
    {
        bits |= cF32QuietMask;
    }

    return std::bit_cast<float>(bits);
}

double xmute::designalise_f64_bits(std::uint64_t bits)
{
    if ((bits & cF64ExponentMask) == cF64ExponentMask && (bits & cF64FractionMask) != 0)
    {
        bits |= cF64QuietMask;
    }

    return std::bit_cast<double>(bits);
}

float xmute::designalise(float value)
{
    return designalise_f32_bits(std::bit_cast<std::uint32_t>(value));
}

double xmute::designalise(double value)
{
    return designalise_f64_bits(std::bit_cast<std::uint64_t>(value));
}
