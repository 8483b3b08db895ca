#include "geogrid_memory_grid.h"

#include <stdexcept>

#include "cpl_string.h"
#include "geogrid_cache_key.h"

namespace GeoGrid
{
MemoryGrid::MemoryGrid(const std::string& displayName,
                       const Extent& extent,
                       GDALDataType eDataType,
                       std::vector<double> values,
                       const NoDataValue& noData,
                       const SpatialReference& spatialReference,
                       const Scaling& scaling)
{
    if (!IsSupportedDataType(eDataType))
        throw std::invalid_argument("MemoryGrid '" + displayName + "' has unsupported data type " +
                                    DataTypeName(eDataType));

    if (values.size() != extent.GetCellCount())
        throw std::invalid_argument(CPLSPrintf("MemoryGrid '%s' needs %llu values, got %llu",
                                               displayName.c_str(),
                                               static_cast<unsigned long long>(extent.GetCellCount()),
                                               static_cast<unsigned long long>(values.size())));

    if (scaling.scale == 0.0)
        throw std::invalid_argument("MemoryGrid '" + displayName + "' has a zero scale factor");

    const NoDataValue storedNoData = NormalizeNoData(noData, eDataType);

    mInitialMetadata.displayName = displayName;
    mInitialMetadata.extent = extent;
    mInitialMetadata.spatialReference = spatialReference;
    mInitialMetadata.unscaledDataType = eDataType;
    mInitialMetadata.unscaledNoData = storedNoData;
    mInitialMetadata.scaling = scaling;

    mData = GridBlock(std::vector<size_t>(extent.GetRank(), 0), extent.GetShape(), eDataType, storedNoData);
    for (size_t i = 0; i < values.size(); i++)
        mData.SetValue(i, ClampToDataType(values[i], eDataType));

    uint64_t hash = HashFNV1a(mData.GetData(), mData.GetCellCount() * sizeof(double));
    const std::string header = extent.ToString() + "|" + DataTypeName(eDataType) + "|" +
                               (storedNoData.hasValue ? CPLSPrintf("%.17g", storedNoData.value) : "none") +
                               "|" + CPLSPrintf("%.17g,%.17g", scaling.scale, scaling.offset) +
                               "|" + spatialReference.GetWkt();
    hash = HashFNV1a(header.data(), header.size(), hash);
    mIdentity = CPLSPrintf("memory:%016llx", static_cast<unsigned long long>(hash));
}

std::shared_ptr<MemoryGrid> MemoryGrid::CreateFromGrid(const Grid& grid)
{
    GridBlock block = grid.ReadAll();
    return std::make_shared<MemoryGrid>(grid.GetDisplayName(),
                                        grid.GetExtent(),
                                        grid.GetDataType(),
                                        block.GetValues(),
                                        grid.GetNoDataValue(),
                                        grid.GetSpatialReference());
}

void MemoryGrid::LoadMetadata(GridMetadata& metadata) const
{
    metadata = mInitialMetadata;
}

void MemoryGrid::IReadBlock(GridBlock& block) const
{
    block.Paste(mData);
}
}  // namespace GeoGrid
