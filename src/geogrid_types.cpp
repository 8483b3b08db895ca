#include "geogrid_types.h"

#include <cmath>
#include <limits>

#include "gdal.h"

namespace GeoGrid
{
bool IsSupportedDataType(GDALDataType eType)
{
    if (eType == GDT_Unknown || GDALDataTypeIsComplex(eType))
        return false;
    return GDALGetDataTypeSizeBytes(eType) > 0;
}

bool IsFloatingType(GDALDataType eType)
{
    return GDALDataTypeIsFloating(eType) && !GDALDataTypeIsComplex(eType);
}

std::string DataTypeName(GDALDataType eType)
{
    const char* pszName = GDALGetDataTypeName(eType);
    return pszName ? pszName : "Unknown";
}

double ClampToDataType(double value, GDALDataType eType)
{
    if (IsFloatingType(eType))
    {
        if (eType == GDT_Float32 && std::isfinite(value))
        {
            const double dfMax = std::numeric_limits<float>::max();
            if (value > dfMax)
                return std::numeric_limits<double>::infinity();
            if (value < -dfMax)
                return -std::numeric_limits<double>::infinity();
            return static_cast<double>(static_cast<float>(value));
        }
        return value;
    }

    if (std::isnan(value))
        return 0.0;

    double dfMin = 0.0;
    double dfMax = 0.0;
    switch (eType)
    {
        case GDT_Byte:
            dfMax = std::numeric_limits<GByte>::max();
            break;
        case GDT_Int8:
            dfMin = std::numeric_limits<GInt8>::min();
            dfMax = std::numeric_limits<GInt8>::max();
            break;
        case GDT_UInt16:
            dfMax = std::numeric_limits<GUInt16>::max();
            break;
        case GDT_Int16:
            dfMin = std::numeric_limits<GInt16>::min();
            dfMax = std::numeric_limits<GInt16>::max();
            break;
        case GDT_UInt32:
            dfMax = std::numeric_limits<GUInt32>::max();
            break;
        case GDT_Int32:
            dfMin = std::numeric_limits<GInt32>::min();
            dfMax = std::numeric_limits<GInt32>::max();
            break;
        case GDT_UInt64:
            dfMax = static_cast<double>(std::numeric_limits<GUInt64>::max());
            break;
        case GDT_Int64:
            dfMin = static_cast<double>(std::numeric_limits<GInt64>::min());
            dfMax = static_cast<double>(std::numeric_limits<GInt64>::max());
            break;
        default:
            return value;
    }

    const double rounded = std::round(value);
    if (rounded < dfMin)
        return dfMin;
    if (rounded > dfMax)
        return dfMax;
    return rounded;
}

bool IsRepresentable(double value, GDALDataType eType)
{
    if (IsFloatingType(eType))
        return true;
    return !std::isnan(value) && ClampToDataType(value, eType) == value;
}

NoDataValue NormalizeNoData(const NoDataValue& noData, GDALDataType eType)
{
    if (!noData.hasValue || std::isnan(noData.value) || !IsFloatingType(eType))
        return noData;
    return NoDataValue(ClampToDataType(noData.value, eType));
}
}  // namespace GeoGrid
