#include "geogrid_grid_slice.h"

#include <algorithm>
#include <stdexcept>

namespace GeoGrid
{
static std::string JoinIndices(const std::vector<size_t>& values)
{
    std::string text;
    for (size_t i = 0; i < values.size(); i++)
        text += (i ? "," : "") + std::to_string(values[i]);
    return text;
}

GridSlice::GridSlice(GridPtr parent, const std::vector<size_t>& origin, const std::vector<size_t>& shape)
    : mParent(std::move(parent)), mOrigin(origin), mShape(shape)
{
    if (!mParent)
        throw std::invalid_argument("GridSlice needs a parent grid");
    if (origin.size() != shape.size())
        throw std::invalid_argument("GridSlice origin and shape have different ranks");
}

std::string GridSlice::GetIdentity() const
{
    return "slice:" + mParent->GetIdentity() + "|origin=" + JoinIndices(mOrigin) +
           "|shape=" + JoinIndices(mShape);
}

std::vector<GridPtr> GridSlice::GetDependencies() const
{
    return {mParent};
}

void GridSlice::LoadMetadata(GridMetadata& metadata) const
{
    metadata.displayName = mParent->GetDisplayName() + "[" + JoinIndices(mOrigin) + "+" +
                           JoinIndices(mShape) + "]";
    metadata.extent = mParent->GetExtent().Slice(mOrigin, mShape);
    metadata.spatialReference = mParent->GetSpatialReference();
    metadata.unscaledDataType = mParent->GetDataType();
    metadata.unscaledNoData = mParent->GetNoDataValue();
}

void GridSlice::IReadBlock(GridBlock& block) const
{
    std::vector<size_t> parentOrigin(block.GetOrigin());
    for (size_t d = 0; d < parentOrigin.size(); d++)
        parentOrigin[d] += mOrigin[d];

    GridBlock parentBlock = mParent->ReadBlock(parentOrigin, block.GetShape());
    std::copy(parentBlock.GetValues().begin(), parentBlock.GetValues().end(), block.GetData());
}
}  // namespace GeoGrid
