#pragma once
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "gdal.h"
#include "geogrid.h"
#include "geogrid_extent.h"
#include "geogrid_types.h"

namespace GeoGrid
{
/**
 * @brief Cell values of a rectangular window of a grid
 *
 * Values are stored row-major, outermost dimension first, as doubles. The
 * origin is expressed in cell indices of the grid the block was read from.
 */
class GEOGRID_DLL GridBlock
{
  public:
    GridBlock() = default;
    GridBlock(const std::vector<size_t>& origin,
              const std::vector<size_t>& shape,
              GDALDataType eDataType,
              const NoDataValue& noData);

    const std::vector<size_t>& GetOrigin() const { return mOrigin; }
    const std::vector<size_t>& GetShape() const { return mShape; }
    size_t GetCellCount() const { return mValues.size(); }
    GDALDataType GetDataType() const { return mDataType; }
    const NoDataValue& GetNoDataValue() const { return mNoData; }
    void SetNoDataValue(const NoDataValue& noData) { mNoData = noData; }

    double GetValue(size_t i) const { return mValues[i]; }
    void SetValue(size_t i, double value) { mValues[i] = value; }
    bool IsNoData(size_t i) const { return mNoData.Matches(mValues[i]); }

    /**
     * @brief Value at indices relative to the block origin
     */
    double At(const std::vector<size_t>& indices) const;

    double* GetData() { return mValues.data(); }
    const double* GetData() const { return mValues.data(); }
    const std::vector<double>& GetValues() const { return mValues; }

    void Fill(double value);

    /**
     * @brief Copy the cells of another block that overlap this one
     *
     * Both blocks must come from the same grid index space.
     */
    void Paste(const GridBlock& other);

    /**
     * @brief Copy out a sub-window given in grid index space
     * @throws std::out_of_range when the window is not inside this block
     */
    GridBlock Extract(const std::vector<size_t>& origin, const std::vector<size_t>& shape) const;

    /**
     * @brief Cell-by-cell equality where NoData cells match NoData cells
     */
    bool SameValuesAs(const GridBlock& other) const;

  private:
    std::vector<size_t> mOrigin;
    std::vector<size_t> mShape;
    GDALDataType mDataType = GDT_Float64;
    NoDataValue mNoData;
    std::vector<double> mValues;
};

/**
 * @brief Metadata an adapter resolves once per grid
 */
struct GridMetadata
{
    std::string displayName;
    Extent extent;
    SpatialReference spatialReference;

    // Storage type and NoData as held by the backend
    GDALDataType unscaledDataType = GDT_Float64;
    NoDataValue unscaledNoData;

    // Display representation. Left unset, the grid derives them from the
    // unscaled values and the scaling.
    Scaling scaling;
    GDALDataType scaledDataType = GDT_Unknown;
    NoDataValue scaledNoData;
};

class Grid;
using GridPtr = std::shared_ptr<const Grid>;

/**
 * @brief An n-dimensional raster with a NoData marker and a coordinate system
 *
 * Subclasses implement LoadMetadata() and IReadBlock(). Metadata is resolved
 * on first access and cached for the lifetime of the grid. All public
 * methods are safe to call from several threads.
 */
class GEOGRID_DLL Grid
{
  public:
    virtual ~Grid();

    Grid(const Grid&) = delete;
    Grid& operator=(const Grid&) = delete;

    const std::string& GetDisplayName() const;
    const Extent& GetExtent() const;
    const SpatialReference& GetSpatialReference() const;

    /**
     * @brief Type of the values returned by ReadBlock()
     */
    GDALDataType GetDataType() const;
    GDALDataType GetUnscaledDataType() const;

    /**
     * @brief NoData of the values returned by ReadBlock()
     */
    const NoDataValue& GetNoDataValue() const;
    const NoDataValue& GetUnscaledNoDataValue() const;
    const Scaling& GetScaling() const;

    bool IsNoData(double value) const;

    /**
     * @brief Read a window of cells
     * @param origin First cell index per dimension
     * @param shape Cell count per dimension
     * @throws OutOfBoundsError if the window is not inside the extent
     * @throws BackendUnavailableError if the backend cannot be read
     */
    GridBlock ReadBlock(const std::vector<size_t>& origin, const std::vector<size_t>& shape) const;

    GridBlock ReadAll() const;

    /**
     * @brief Canonical identity of the data behind this grid
     *
     * Never derived from object addresses: two grids over the same data
     * report the same identity.
     */
    virtual std::string GetIdentity() const = 0;

    virtual std::vector<GridPtr> GetDependencies() const;

  protected:
    Grid() = default;

    virtual void LoadMetadata(GridMetadata& metadata) const = 0;

    /**
     * @brief Fill block (already sized to the window) with unscaled values
     */
    virtual void IReadBlock(GridBlock& block) const = 0;

    const GridMetadata& Metadata() const;

  private:
    mutable std::mutex mMetadataMutex;
    mutable std::atomic<bool> mMetadataLoaded{false};
    mutable GridMetadata mMetadata;
};
}  // namespace GeoGrid
