#pragma once
#include <string>
#include <vector>

#include "geogrid_collection.h"
#include "geogrid_grid.h"

namespace GeoGrid
{
/**
 * @brief Grids selected from a collection, stacked along a new t axis
 *
 * Every matching grid member becomes one time step, in listing order. The
 * members must share extent, spatial reference, data type and NoData; a
 * "yx" member gives a "tyx" stack and a "zyx" member a "tzyx" one.
 *
 * Construction reads nothing. The collection is queried on first metadata
 * access, and reads go to the member grids one t-slice at a time. Values
 * are the members' scaled values.
 */
class GEOGRID_DLL TimeSeriesGridStack : public Grid
{
  public:
    /**
     * @param collection Source of the time steps
     * @param filter Selects the members; only grids are stacked
     * @param tOrigin Coordinate of the start of the first time step
     * @param tStep Length of one time step
     * @throws std::invalid_argument on a null collection or a zero or
     *         non-finite tStep
     */
    TimeSeriesGridStack(CollectionPtr collection,
                        const MemberFilter& filter,
                        double tOrigin = 0.0,
                        double tStep = 1.0);

    size_t GetTimeStepCount() const;

    /**
     * @throws std::out_of_range when t is past the last time step
     */
    const GridPtr& GetTimeStep(size_t t) const;
    const std::string& GetTimeStepIdentifier(size_t t) const;

    std::string GetIdentity() const override;
    std::vector<GridPtr> GetDependencies() const override;

  protected:
    /**
     * @throws NotFoundError when no grid member matches
     * @throws IncompatibleGridsError when the members cannot be stacked
     */
    void LoadMetadata(GridMetadata& metadata) const override;
    void IReadBlock(GridBlock& block) const override;

  private:
    CollectionPtr mCollection;
    MemberFilter mFilter;
    double mTOrigin;
    double mTStep;

    // Filled once by LoadMetadata()
    mutable std::vector<GridPtr> mSteps;
    mutable std::vector<std::string> mStepIdentifiers;
    mutable std::string mIdentity;
};
}  // namespace GeoGrid
