/**
 * @file Units.cpp
 * @brief Unit conversion table
 */

#include "jmutate/Units.hpp"

#include <map>

namespace jmutate {

namespace {

enum class Dimension { Length, Mass, Time, Data, Volume };

struct UnitInfo {
    Dimension dimension;
    double factor; ///< multiples of the dimension's base unit
};

const std::map<std::string, UnitInfo>& unit_table() {
    static const std::map<std::string, UnitInfo> table = {
        // length (metre)
        {"mm", {Dimension::Length, 0.001}},
        {"cm", {Dimension::Length, 0.01}},
        {"m", {Dimension::Length, 1.0}},
        {"km", {Dimension::Length, 1000.0}},
        {"in", {Dimension::Length, 0.0254}},
        {"ft", {Dimension::Length, 0.3048}},
        {"yd", {Dimension::Length, 0.9144}},
        {"mi", {Dimension::Length, 1609.344}},
        // mass (gram)
        {"mg", {Dimension::Mass, 0.001}},
        {"g", {Dimension::Mass, 1.0}},
        {"kg", {Dimension::Mass, 1000.0}},
        {"t", {Dimension::Mass, 1000000.0}},
        {"oz", {Dimension::Mass, 28.349523125}},
        {"lb", {Dimension::Mass, 453.59237}},
        // time (second)
        {"ms", {Dimension::Time, 0.001}},
        {"s", {Dimension::Time, 1.0}},
        {"min", {Dimension::Time, 60.0}},
        {"h", {Dimension::Time, 3600.0}},
        {"d", {Dimension::Time, 86400.0}},
        {"wk", {Dimension::Time, 604800.0}},
        // data (byte)
        {"B", {Dimension::Data, 1.0}},
        {"KB", {Dimension::Data, 1024.0}},
        {"MB", {Dimension::Data, 1048576.0}},
        {"GB", {Dimension::Data, 1073741824.0}},
        {"TB", {Dimension::Data, 1099511627776.0}},
        // volume (litre)
        {"ml", {Dimension::Volume, 0.001}},
        {"l", {Dimension::Volume, 1.0}},
        {"gal", {Dimension::Volume, 3.785411784}},
    };
    return table;
}

} // anonymous namespace

std::optional<double> conversion_factor(const std::string& from, const std::string& to) {
    const auto& table = unit_table();
    auto src = table.find(from);
    auto dst = table.find(to);
    if (src == table.end() || dst == table.end()) return std::nullopt;
    if (src->second.dimension != dst->second.dimension) return std::nullopt;
    if (from == to) return 1.0;
    return src->second.factor / dst->second.factor;
}

} // namespace jmutate
