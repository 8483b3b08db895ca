#pragma once
#include <string>
#include <vector>

#include "geogrid_grid.h"

namespace GeoGrid
{
/**
 * @brief A window of another grid, read lazily through the parent
 *
 * The slice exposes the parent's scaled values with identity scaling, so
 * the parent's scaling is applied exactly once.
 */
class GEOGRID_DLL GridSlice : public Grid
{
  public:
    /**
     * @throws std::invalid_argument if parent is null
     * @throws std::out_of_range (from Extent::Slice) on first metadata
     *         access when the window does not fit the parent
     */
    GridSlice(GridPtr parent, const std::vector<size_t>& origin, const std::vector<size_t>& shape);

    const GridPtr& GetParent() const { return mParent; }
    const std::vector<size_t>& GetSliceOrigin() const { return mOrigin; }

    std::string GetIdentity() const override;
    std::vector<GridPtr> GetDependencies() const override;

  protected:
    void LoadMetadata(GridMetadata& metadata) const override;
    void IReadBlock(GridBlock& block) const override;

  private:
    GridPtr mParent;
    std::vector<size_t> mOrigin;
    std::vector<size_t> mShape;
};
}  // namespace GeoGrid
