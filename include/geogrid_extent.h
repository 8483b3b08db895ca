#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "geogrid.h"
#include "ogr_spatialref.h"

namespace GeoGrid
{
/**
 * @brief Immutable coordinate system of a grid
 *
 * Wraps an OGRSpatialReference. A default-constructed reference means the
 * grid has no coordinate system.
 */
class GEOGRID_DLL SpatialReference
{
  public:
    SpatialReference() = default;

    /**
     * @brief Build from anything OGRSpatialReference::SetFromUserInput accepts
     * @throws std::invalid_argument if the definition cannot be parsed
     */
    static SpatialReference FromUserInput(const std::string& definition);

    /**
     * @brief Copy an existing OGR reference (nullptr gives an empty one)
     */
    static SpatialReference FromOGR(const OGRSpatialReference* poSRS);

    bool IsEmpty() const { return !mSRS; }
    const OGRSpatialReference* Get() const { return mSRS.get(); }

    std::string GetWkt() const;
    std::string GetLinearUnitName() const;
    double GetLinearUnits() const;

    /**
     * @brief Check that both references denote the same coordinate system
     * @param other Reference to compare with
     * @param tolerance Relative tolerance on the linear unit
     */
    bool IsCompatibleWith(const SpatialReference& other, double tolerance = 1e-9) const;

  private:
    std::shared_ptr<const OGRSpatialReference> mSRS;
};

/**
 * @brief Footprint of a grid: dimensions, cell counts, cell sizes and origin
 *
 * Axes are ordered outermost first, following the dimensions string
 * ("yx", "zyx", "tyx" or "tzyx"). The origin is the outer corner of the
 * first cell along each axis. A negative cell size means coordinates
 * decrease with the index, as for the y axis of north-up rasters.
 */
class GEOGRID_DLL Extent
{
  public:
    Extent() = default;

    /**
     * @throws std::invalid_argument on unknown dimensions, length mismatch,
     *         empty axes or zero cell sizes
     */
    Extent(const std::string& dimensions,
           const std::vector<size_t>& shape,
           const std::vector<double>& cellSizes,
           const std::vector<double>& origin);

    /**
     * @brief Convenience for the common 2D case
     */
    static Extent Make2D(size_t rows, size_t cols,
                         double cellSize,
                         double xMin = 0.0, double yMin = 0.0);

    const std::string& GetDimensions() const { return mDimensions; }
    size_t GetRank() const { return mShape.size(); }
    const std::vector<size_t>& GetShape() const { return mShape; }
    const std::vector<double>& GetCellSizes() const { return mCellSizes; }
    const std::vector<double>& GetOrigin() const { return mOrigin; }

    size_t GetCellCount() const;

    /**
     * @brief Index of a dimension character in the axis order, or -1
     */
    int GetAxis(char dimension) const;

    double GetEndCoord(size_t axis) const;
    double GetCenterCoord(size_t axis, size_t index) const;

    /**
     * @brief Check that a window lies inside the extent
     */
    bool Contains(const std::vector<size_t>& origin, const std::vector<size_t>& shape) const;

    /**
     * @brief Extent of a sub-window
     * @throws std::out_of_range when the window does not fit
     */
    Extent Slice(const std::vector<size_t>& origin, const std::vector<size_t>& shape) const;

    bool IsIdenticalTo(const Extent& other, double tolerance = 1e-9) const;

    std::string ToString() const;

  private:
    std::string mDimensions;
    std::vector<size_t> mShape;
    std::vector<double> mCellSizes;
    std::vector<double> mOrigin;
};
}  // namespace GeoGrid
