#pragma once
#include <cmath>
#include <string>

#include "gdal.h"
#include "geogrid.h"

namespace GeoGrid
{
/**
 * @brief Check that a GDAL data type can back a grid
 *
 * Complex and unknown types are rejected.
 */
GEOGRID_DLL bool IsSupportedDataType(GDALDataType eType);

GEOGRID_DLL bool IsFloatingType(GDALDataType eType);

/**
 * @brief Short name of the type, e.g. "Int16" or "Float32"
 */
GEOGRID_DLL std::string DataTypeName(GDALDataType eType);

/**
 * @brief Round and saturate a value to what eType can represent
 *
 * NaN is kept for floating types and mapped to 0 for integral ones.
 */
GEOGRID_DLL double ClampToDataType(double value, GDALDataType eType);

/**
 * @brief NaN-aware equality for NoData values
 *
 * IEEE comparison says NaN != NaN, which makes a NaN NoData value fail to
 * match itself. Every NoData comparison in GeoGrid goes through here.
 */
inline bool NoDataEquals(double a, double b)
{
    if (std::isnan(a) || std::isnan(b))
        return std::isnan(a) && std::isnan(b);
    return a == b;
}

/**
 * @brief Optional NoData marker of a grid
 */
struct NoDataValue
{
    bool hasValue = false;
    double value = 0.0;

    NoDataValue() = default;
    NoDataValue(double v) : hasValue(true), value(v) {}

    bool Matches(double cell) const { return hasValue && NoDataEquals(cell, value); }

    bool operator==(const NoDataValue& other) const
    {
        if (hasValue != other.hasValue)
            return false;
        return !hasValue || NoDataEquals(value, other.value);
    }
    bool operator!=(const NoDataValue& other) const { return !(*this == other); }
};

/**
 * @brief NoData as it compares against values stored as eType
 *
 * Float32 NoData is rounded to float precision, as the stored cells are.
 * An integral NoData the type cannot hold is kept unchanged and so matches
 * no cell.
 */
GEOGRID_DLL NoDataValue NormalizeNoData(const NoDataValue& noData, GDALDataType eType);

GEOGRID_DLL bool IsRepresentable(double value, GDALDataType eType);

/**
 * @brief Linear transform from stored (unscaled) to display (scaled) values
 *
 * scaled = unscaled * scale + offset
 */
struct Scaling
{
    double scale = 1.0;
    double offset = 0.0;

    bool IsIdentity() const { return scale == 1.0 && offset == 0.0; }
    double Apply(double unscaled) const { return unscaled * scale + offset; }
    double Invert(double scaled) const { return (scaled - offset) / scale; }
};
}  // namespace GeoGrid
