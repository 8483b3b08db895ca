#pragma once
#include <memory>
#include <string>
#include <vector>

#include "geogrid_grid.h"

namespace GeoGrid
{
/**
 * @brief Grid over an array held in memory
 *
 * The array is immutable once the grid is built, so reads need no locking.
 * The identity is a hash of the contents, extent, type, NoData and
 * coordinate system: two memory grids holding the same data share cache
 * entries.
 */
class GEOGRID_DLL MemoryGrid : public Grid
{
  public:
    /**
     * @param values Unscaled cell values, row-major, outermost dimension first
     * @throws std::invalid_argument if the value count does not match the
     *         extent or the data type is not supported
     */
    MemoryGrid(const std::string& displayName,
               const Extent& extent,
               GDALDataType eDataType,
               std::vector<double> values,
               const NoDataValue& noData = NoDataValue(),
               const SpatialReference& spatialReference = SpatialReference(),
               const Scaling& scaling = Scaling());

    /**
     * @brief Read every cell of another grid into memory
     */
    static std::shared_ptr<MemoryGrid> CreateFromGrid(const Grid& grid);

    std::string GetIdentity() const override { return mIdentity; }

  protected:
    void LoadMetadata(GridMetadata& metadata) const override;
    void IReadBlock(GridBlock& block) const override;

  private:
    GridMetadata mInitialMetadata;
    GridBlock mData;
    std::string mIdentity;
};
}  // namespace GeoGrid
