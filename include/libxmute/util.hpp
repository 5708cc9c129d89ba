#pragma once

#include <cstdint>

namespace xmute
{
// Floats read from untrusted bytes may hold signalling NaNs, which trap on
// some platforms when used. These set the quiet bit of any NaN and leave all
// other values bit-identical.
float designalise_f32_bits(std::uint32_t bits);
double designalise_f64_bits(std::uint64_t bits);

float designalise(float value);
double designalise(double value);
}
