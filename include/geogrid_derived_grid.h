#pragma once
#include <memory>
#include <string>
#include <vector>

#include "cpl_port.h"
#include "geogrid_derivation.h"
#include "geogrid_grid.h"
#include "geogrid_memory_grid.h"
#include "geogrid_result_cache.h"

namespace GeoGrid
{
using GridBlockCache = ResultCache<GridBlock>;

struct GEOGRID_DLL DerivedGridOptions
{
    // Tile edge along y and x; t and z tiles are one cell deep
    size_t blockSize = Config::DEFAULT_BLOCK_SIZE;

    // Explicit per-axis tile shape; overrides blockSize when not empty
    std::vector<size_t> blockShape;

    // Shared tile cache, may be null
    std::shared_ptr<GridBlockCache> cache;

    std::string displayName;

    static DerivedGridOptions FromConfig(CSLConstList papszOptions = nullptr);
};

/**
 * @brief Grid computed on read from other grids
 *
 * Construction validates the inputs and reads nothing. Reads are split into
 * tiles aligned on the grid origin; each tile reads the same window from
 * every input, evaluates the derivation and, when a cache is attached, is
 * stored under a key made of the grid identity and the tile window.
 */
class GEOGRID_DLL DerivedGrid : public Grid
{
  public:
    /**
     * @throws std::invalid_argument on a null derivation or input, or an
     *         input count different from the arity
     * @throws IncompatibleGridsError if extents or spatial references differ
     * @throws CyclicDerivationError if the grid would depend on itself
     */
    static std::shared_ptr<DerivedGrid> Create(DerivationPtr derivation,
                                               std::vector<GridPtr> inputs,
                                               const DerivedGridOptions& options =
                                                   DerivedGridOptions::FromConfig());

    const DerivationPtr& GetDerivation() const { return mDerivation; }
    const std::vector<size_t>& GetBlockShape() const { return mBlockShape; }

    std::string GetIdentity() const override { return mIdentity; }
    std::vector<GridPtr> GetDependencies() const override { return mInputs; }

    /**
     * @brief Evaluate every cell once and hold the result in memory
     */
    std::shared_ptr<MemoryGrid> Materialize() const;

  protected:
    void LoadMetadata(GridMetadata& metadata) const override;
    void IReadBlock(GridBlock& block) const override;

  private:
    DerivedGrid(DerivationPtr derivation,
                std::vector<GridPtr> inputs,
                const DerivedGridOptions& options);

    GridBlock ComputeTile(const std::vector<size_t>& origin, const std::vector<size_t>& shape) const;

    DerivationPtr mDerivation;
    std::vector<GridPtr> mInputs;
    std::shared_ptr<GridBlockCache> mCache;
    std::vector<size_t> mBlockShape;
    GridMetadata mResolvedMetadata;
    std::string mIdentity;
};
}  // namespace GeoGrid
