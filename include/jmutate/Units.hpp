/**
 * @file Units.hpp
 * @brief Static unit conversion table
 *
 * Every unit belongs to one dimension and has a fixed factor to that
 * dimension's base unit (metre, gram, second, byte, litre). Converting
 * between two units multiplies by from_factor / to_factor. Units of
 * different dimensions never convert.
 *
 * Supported units:
 * - length: mm, cm, m, km, in, ft, yd, mi
 * - mass:   mg, g, kg, t, oz, lb
 * - time:   ms, s, min, h, d, wk
 * - data:   B, KB, MB, GB, TB (1024-based)
 * - volume: ml, l, gal (US)
 */

#ifndef JMUTATE_UNITS_HPP
#define JMUTATE_UNITS_HPP

#include <optional>
#include <string>

namespace jmutate {

/**
 * @brief Multiplier converting a quantity in @p from into @p to
 * @return The factor, or nullopt if either unit is unknown or the units
 *         measure different dimensions
 *
 * Examples:
 * ```cpp
 * conversion_factor("km", "m");   // 1000
 * conversion_factor("lb", "kg");  // 0.45359237
 * conversion_factor("m", "kg");   // nullopt
 * ```
 */
std::optional<double> conversion_factor(const std::string& from, const std::string& to);

} // namespace jmutate

#endif // JMUTATE_UNITS_HPP
