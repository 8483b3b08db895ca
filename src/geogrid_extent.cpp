#include "geogrid_extent.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include "cpl_conv.h"
#include "cpl_error.h"
#include "cpl_string.h"

namespace GeoGrid
{
// ============================================================================
// SpatialReference
// ============================================================================

SpatialReference SpatialReference::FromUserInput(const std::string& definition)
{
    auto poSRS = std::make_shared<OGRSpatialReference>();
    poSRS->SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

    CPLErrorHandlerPusher quiet(CPLQuietErrorHandler);
    if (poSRS->SetFromUserInput(definition.c_str()) != OGRERR_NONE)
    {
        throw std::invalid_argument("Cannot parse spatial reference: " + definition);
    }

    SpatialReference result;
    result.mSRS = std::move(poSRS);
    return result;
}

SpatialReference SpatialReference::FromOGR(const OGRSpatialReference* poSRS)
{
    SpatialReference result;
    if (poSRS && !poSRS->IsEmpty())
    {
        result.mSRS = std::make_shared<OGRSpatialReference>(*poSRS);
    }
    return result;
}

std::string SpatialReference::GetWkt() const
{
    if (!mSRS)
        return std::string();

    char* pszWkt = nullptr;
    const char* const apszOptions[] = {"FORMAT=WKT2_2019", nullptr};
    std::string wkt;
    if (mSRS->exportToWkt(&pszWkt, apszOptions) == OGRERR_NONE && pszWkt)
        wkt = pszWkt;
    CPLFree(pszWkt);
    return wkt;
}

std::string SpatialReference::GetLinearUnitName() const
{
    if (!mSRS)
        return std::string();

    const char* pszName = nullptr;
    mSRS->GetLinearUnits(&pszName);
    return pszName ? pszName : "";
}

double SpatialReference::GetLinearUnits() const
{
    if (!mSRS)
        return 1.0;
    return mSRS->GetLinearUnits(static_cast<const char**>(nullptr));
}

bool SpatialReference::IsCompatibleWith(const SpatialReference& other, double tolerance) const
{
    if (IsEmpty() || other.IsEmpty())
        return IsEmpty() && other.IsEmpty();

    const char* const apszOptions[] = {"IGNORE_DATA_AXIS_TO_SRS_AXIS_MAPPING=YES", nullptr};
    if (!mSRS->IsSame(other.mSRS.get(), apszOptions))
        return false;

    const double unitsA = GetLinearUnits();
    const double unitsB = other.GetLinearUnits();
    const double scale = std::max(std::fabs(unitsA), std::fabs(unitsB));
    return std::fabs(unitsA - unitsB) <= tolerance * (scale > 0.0 ? scale : 1.0);
}

// ============================================================================
// Extent
// ============================================================================

static bool IsKnownDimensions(const std::string& dimensions)
{
    return dimensions == "yx" || dimensions == "zyx" || dimensions == "tyx" ||
           dimensions == "tzyx";
}

Extent::Extent(const std::string& dimensions,
               const std::vector<size_t>& shape,
               const std::vector<double>& cellSizes,
               const std::vector<double>& origin)
    : mDimensions(dimensions), mShape(shape), mCellSizes(cellSizes), mOrigin(origin)
{
    if (!IsKnownDimensions(dimensions))
        throw std::invalid_argument("Unsupported dimensions '" + dimensions +
                                    "', expected yx, zyx, tyx or tzyx");

    if (shape.size() != dimensions.size() || cellSizes.size() != dimensions.size() ||
        origin.size() != dimensions.size())
        throw std::invalid_argument("Extent shape, cell sizes and origin must have one entry "
                                    "per dimension of '" + dimensions + "'");

    for (size_t i = 0; i < dimensions.size(); i++)
    {
        if (shape[i] == 0)
            throw std::invalid_argument(std::string("Extent has no cells along ") + dimensions[i]);
        if (!(std::isfinite(cellSizes[i]) && cellSizes[i] != 0.0))
            throw std::invalid_argument(std::string("Extent has an invalid cell size along ") +
                                        dimensions[i]);
        if (!std::isfinite(origin[i]))
            throw std::invalid_argument(std::string("Extent has a non-finite origin along ") +
                                        dimensions[i]);
    }
}

Extent Extent::Make2D(size_t rows, size_t cols, double cellSize, double xMin, double yMin)
{
    return Extent("yx", {rows, cols}, {cellSize, cellSize}, {yMin, xMin});
}

size_t Extent::GetCellCount() const
{
    if (mShape.empty())
        return 0;

    size_t count = 1;
    for (size_t n : mShape)
        count *= n;
    return count;
}

int Extent::GetAxis(char dimension) const
{
    const size_t pos = mDimensions.find(dimension);
    return pos == std::string::npos ? -1 : static_cast<int>(pos);
}

double Extent::GetEndCoord(size_t axis) const
{
    return mOrigin.at(axis) + mCellSizes.at(axis) * static_cast<double>(mShape.at(axis));
}

double Extent::GetCenterCoord(size_t axis, size_t index) const
{
    return mOrigin.at(axis) + mCellSizes.at(axis) * (static_cast<double>(index) + 0.5);
}

bool Extent::Contains(const std::vector<size_t>& origin, const std::vector<size_t>& shape) const
{
    if (origin.size() != mShape.size() || shape.size() != mShape.size())
        return false;

    for (size_t i = 0; i < mShape.size(); i++)
    {
        if (shape[i] == 0 || origin[i] >= mShape[i] || shape[i] > mShape[i] - origin[i])
            return false;
    }
    return true;
}

Extent Extent::Slice(const std::vector<size_t>& origin, const std::vector<size_t>& shape) const
{
    if (!Contains(origin, shape))
        throw std::out_of_range("Slice window " + std::to_string(origin.size()) +
                                "-D does not fit inside " + ToString());

    std::vector<double> sliceOrigin(mOrigin.size());
    for (size_t i = 0; i < mOrigin.size(); i++)
        sliceOrigin[i] = mOrigin[i] + mCellSizes[i] * static_cast<double>(origin[i]);

    return Extent(mDimensions, shape, mCellSizes, sliceOrigin);
}

bool Extent::IsIdenticalTo(const Extent& other, double tolerance) const
{
    if (mDimensions != other.mDimensions || mShape != other.mShape)
        return false;

    for (size_t i = 0; i < mShape.size(); i++)
    {
        const double cell = std::fabs(mCellSizes[i]);
        if (std::fabs(mCellSizes[i] - other.mCellSizes[i]) > tolerance * cell)
            return false;
        if (std::fabs(mOrigin[i] - other.mOrigin[i]) > tolerance * cell)
            return false;
    }
    return true;
}

std::string Extent::ToString() const
{
    std::ostringstream oss;
    oss << mDimensions << "[";
    for (size_t i = 0; i < mShape.size(); i++)
    {
        if (i)
            oss << ", ";
        oss << mDimensions[i] << "=" << mShape[i] << "@" << CPLSPrintf("%.17g", mOrigin[i])
            << "+" << CPLSPrintf("%.17g", mCellSizes[i]);
    }
    oss << "]";
    return oss.str();
}
}  // namespace GeoGrid
