#include "geogrid_time_series_stack.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "cpl_string.h"
#include "geogrid_cache_key.h"
#include "geogrid_config.h"
#include "geogrid_errors.h"
#include "geogrid_performance.h"

namespace GeoGrid
{
TimeSeriesGridStack::TimeSeriesGridStack(CollectionPtr collection,
                                         const MemberFilter& filter,
                                         double tOrigin,
                                         double tStep)
    : mCollection(std::move(collection)), mFilter(filter), mTOrigin(tOrigin), mTStep(tStep)
{
    if (!mCollection)
        throw std::invalid_argument("TimeSeriesGridStack needs a collection");
    if (!std::isfinite(tStep) || tStep == 0.0)
        throw std::invalid_argument(CPLSPrintf("TimeSeriesGridStack time step %g is not usable", tStep));
    mFilter.SetKind(MemberKind::Grid);
}

size_t TimeSeriesGridStack::GetTimeStepCount() const
{
    return GetExtent().GetShape()[0];
}

const GridPtr& TimeSeriesGridStack::GetTimeStep(size_t t) const
{
    Metadata();
    if (t >= mSteps.size())
        throw std::out_of_range(CPLSPrintf("Time step %llu is past the end of the stack",
                                           static_cast<unsigned long long>(t)));
    return mSteps[t];
}

const std::string& TimeSeriesGridStack::GetTimeStepIdentifier(size_t t) const
{
    GetTimeStep(t);
    return mStepIdentifiers[t];
}

std::string TimeSeriesGridStack::GetIdentity() const
{
    Metadata();
    return mIdentity;
}

std::vector<GridPtr> TimeSeriesGridStack::GetDependencies() const
{
    Metadata();
    return mSteps;
}

void TimeSeriesGridStack::LoadMetadata(GridMetadata& metadata) const
{
    GEOGRID_PERF_TIMER("TimeSeriesGridStack::LoadMetadata");

    std::vector<GridPtr> steps;
    std::vector<std::string> identifiers;
    for (const Member& member : mCollection->ResolveAll(mFilter))
    {
        steps.push_back(member.GetGrid());
        identifiers.push_back(member.GetIdentifier());
    }
    if (steps.empty())
        throw NotFoundError("No grid of collection '" + mCollection->GetDisplayName() +
                            "' matches the time series filter");

    const Grid& first = *steps.front();
    const Extent& extent = first.GetExtent();
    const std::string& dims = extent.GetDimensions();
    if (dims != "yx" && dims != "zyx")
        throw IncompatibleGridsError("Grid '" + identifiers.front() + "' has dimensions '" + dims +
                                     "'; only yx and zyx grids can be stacked in time");

    const double srsTolerance = Config::GetSrsTolerance();
    for (size_t t = 1; t < steps.size(); t++)
    {
        const Grid& step = *steps[t];
        const std::string context = "Time step '" + identifiers[t] + "' of collection '" +
                                    mCollection->GetDisplayName() + "'";
        if (!step.GetExtent().IsIdenticalTo(extent))
            throw IncompatibleGridsError(context + " has extent " + step.GetExtent().ToString() +
                                         ", expected " + extent.ToString());
        if (!step.GetSpatialReference().IsCompatibleWith(first.GetSpatialReference(), srsTolerance))
            throw IncompatibleGridsError(context + " has a different spatial reference");
        if (step.GetDataType() != first.GetDataType())
            throw IncompatibleGridsError(context + " has data type " + DataTypeName(step.GetDataType()) +
                                         ", expected " + DataTypeName(first.GetDataType()));
        if (step.GetNoDataValue() != first.GetNoDataValue())
            throw IncompatibleGridsError(context + " has a different NoData value");
    }

    std::vector<size_t> shape(1, steps.size());
    std::vector<double> cellSizes(1, mTStep);
    std::vector<double> origin(1, mTOrigin);
    shape.insert(shape.end(), extent.GetShape().begin(), extent.GetShape().end());
    cellSizes.insert(cellSizes.end(), extent.GetCellSizes().begin(), extent.GetCellSizes().end());
    origin.insert(origin.end(), extent.GetOrigin().begin(), extent.GetOrigin().end());

    metadata.displayName = "time series of " + mCollection->GetDisplayName();
    metadata.extent = Extent("t" + dims, shape, cellSizes, origin);
    metadata.spatialReference = first.GetSpatialReference();
    metadata.unscaledDataType = first.GetDataType();
    metadata.unscaledNoData = first.GetNoDataValue();

    // Steps enter by fingerprint, as derived inputs do
    CacheKey key("stack", mCollection->GetIdentity());
    key.AddParameter("tOrigin", mTOrigin);
    key.AddParameter("tStep", mTStep);
    for (size_t t = 0; t < steps.size(); t++)
    {
        const std::string stepId = steps[t]->GetIdentity();
        key.AddParameter(CPLSPrintf("t%06llu", static_cast<unsigned long long>(t)),
                         std::string(CPLSPrintf("%016llx:%llu",
                                                static_cast<unsigned long long>(
                                                    HashFNV1a(stepId.data(), stepId.size())),
                                                static_cast<unsigned long long>(stepId.size()))));
    }

    CPLDebug(ErrorHandler::DEBUG_KEY,
             "%s: %llu time steps of %s",
             metadata.displayName.c_str(),
             static_cast<unsigned long long>(steps.size()),
             extent.ToString().c_str());

    mIdentity = "stack:" + key.GetCanonical();
    mSteps = std::move(steps);
    mStepIdentifiers = std::move(identifiers);
}

void TimeSeriesGridStack::IReadBlock(GridBlock& block) const
{
    const std::vector<size_t>& origin = block.GetOrigin();
    const std::vector<size_t>& shape = block.GetShape();

    const std::vector<size_t> stepOrigin(origin.begin() + 1, origin.end());
    const std::vector<size_t> stepShape(shape.begin() + 1, shape.end());

    size_t offset = 0;
    for (size_t t = origin[0]; t < origin[0] + shape[0]; t++)
    {
        const GridBlock slab = mSteps[t]->ReadBlock(stepOrigin, stepShape);
        std::copy(slab.GetValues().begin(), slab.GetValues().end(), block.GetData() + offset);
        offset += slab.GetCellCount();
    }
}
}  // namespace GeoGrid
