#include "geogrid_grid.h"

#include <algorithm>
#include <cstring>
#include <limits>
#include <stdexcept>

#include "cpl_string.h"
#include "geogrid_errors.h"
#include "geogrid_performance.h"

namespace GeoGrid
{
// ============================================================================
// GridBlock
// ============================================================================

static std::vector<size_t> ComputeStrides(const std::vector<size_t>& shape)
{
    std::vector<size_t> strides(shape.size(), 1);
    for (size_t i = shape.size(); i-- > 1;)
        strides[i - 1] = strides[i] * shape[i];
    return strides;
}

static std::string FormatWindow(const std::vector<size_t>& origin, const std::vector<size_t>& shape)
{
    std::string text = "origin (";
    for (size_t i = 0; i < origin.size(); i++)
        text += (i ? ", " : "") + std::to_string(origin[i]);
    text += ") shape (";
    for (size_t i = 0; i < shape.size(); i++)
        text += (i ? ", " : "") + std::to_string(shape[i]);
    return text + ")";
}

GridBlock::GridBlock(const std::vector<size_t>& origin,
                     const std::vector<size_t>& shape,
                     GDALDataType eDataType,
                     const NoDataValue& noData)
    : mOrigin(origin), mShape(shape), mDataType(eDataType), mNoData(noData)
{
    if (origin.size() != shape.size())
        throw std::invalid_argument("Block origin and shape have different ranks");

    size_t count = shape.empty() ? 0 : 1;
    for (size_t n : shape)
        count *= n;
    mValues.assign(count, 0.0);
}

double GridBlock::At(const std::vector<size_t>& indices) const
{
    if (indices.size() != mShape.size())
        throw std::out_of_range("Block index has the wrong rank");

    const std::vector<size_t> strides = ComputeStrides(mShape);
    size_t offset = 0;
    for (size_t i = 0; i < indices.size(); i++)
    {
        if (indices[i] >= mShape[i])
            throw std::out_of_range("Block index out of range");
        offset += indices[i] * strides[i];
    }
    return mValues[offset];
}

void GridBlock::Fill(double value)
{
    std::fill(mValues.begin(), mValues.end(), value);
}

void GridBlock::Paste(const GridBlock& other)
{
    const size_t rank = mShape.size();
    if (rank == 0 || other.mShape.size() != rank)
        return;

    std::vector<size_t> lo(rank);
    std::vector<size_t> extent(rank);
    for (size_t d = 0; d < rank; d++)
    {
        lo[d] = std::max(mOrigin[d], other.mOrigin[d]);
        const size_t hi = std::min(mOrigin[d] + mShape[d], other.mOrigin[d] + other.mShape[d]);
        if (hi <= lo[d])
            return;
        extent[d] = hi - lo[d];
    }

    const std::vector<size_t> dstStrides = ComputeStrides(mShape);
    const std::vector<size_t> srcStrides = ComputeStrides(other.mShape);
    const size_t runLength = extent[rank - 1];

    // Walk every index of the overlap except the innermost axis, copying
    // one contiguous run per step.
    std::vector<size_t> idx(rank, 0);
    while (true)
    {
        size_t dst = 0;
        size_t src = 0;
        for (size_t d = 0; d < rank; d++)
        {
            const size_t step = (d + 1 == rank) ? 0 : idx[d];
            dst += (lo[d] + step - mOrigin[d]) * dstStrides[d];
            src += (lo[d] + step - other.mOrigin[d]) * srcStrides[d];
        }
        std::memcpy(&mValues[dst], &other.mValues[src], runLength * sizeof(double));

        if (rank == 1)
            break;
        size_t d = rank - 1;
        while (d-- > 0)
        {
            if (++idx[d] < extent[d])
                break;
            idx[d] = 0;
        }
        if (d == static_cast<size_t>(-1))
            break;
    }
}

GridBlock GridBlock::Extract(const std::vector<size_t>& origin, const std::vector<size_t>& shape) const
{
    if (origin.size() != mShape.size() || shape.size() != mShape.size())
        throw std::out_of_range("Extract window has the wrong rank");

    for (size_t d = 0; d < mShape.size(); d++)
    {
        if (shape[d] == 0 || origin[d] < mOrigin[d] ||
            origin[d] + shape[d] > mOrigin[d] + mShape[d])
            throw std::out_of_range("Extract window " + FormatWindow(origin, shape) +
                                    " is outside block " + FormatWindow(mOrigin, mShape));
    }

    GridBlock result(origin, shape, mDataType, mNoData);
    result.Paste(*this);
    return result;
}

bool GridBlock::SameValuesAs(const GridBlock& other) const
{
    if (mShape != other.mShape || mValues.size() != other.mValues.size())
        return false;

    for (size_t i = 0; i < mValues.size(); i++)
    {
        const bool noDataA = IsNoData(i);
        const bool noDataB = other.IsNoData(i);
        if (noDataA != noDataB)
            return false;
        if (!noDataA && !NoDataEquals(mValues[i], other.mValues[i]))
            return false;
    }
    return true;
}

// ============================================================================
// Grid
// ============================================================================

Grid::~Grid() = default;

std::vector<GridPtr> Grid::GetDependencies() const
{
    return {};
}

const GridMetadata& Grid::Metadata() const
{
    if (mMetadataLoaded.load(std::memory_order_acquire))
        return mMetadata;

    std::lock_guard<std::mutex> lock(mMetadataMutex);
    if (mMetadataLoaded.load(std::memory_order_relaxed))
        return mMetadata;

    // A failed load leaves nothing behind so the next call can retry.
    GridMetadata metadata;
    LoadMetadata(metadata);

    if (!IsSupportedDataType(metadata.unscaledDataType))
        throw Error("Grid '" + metadata.displayName + "' has unsupported data type " +
                    DataTypeName(metadata.unscaledDataType));

    if (metadata.unscaledNoData.hasValue &&
        !IsRepresentable(metadata.unscaledNoData.value, metadata.unscaledDataType))
        ErrorHandler::Warning(CPLSPrintf("NoData %.17g of grid '%s' is not a %s value; no cell will match it",
                                         metadata.unscaledNoData.value,
                                         metadata.displayName.c_str(),
                                         DataTypeName(metadata.unscaledDataType).c_str()));
    metadata.unscaledNoData = NormalizeNoData(metadata.unscaledNoData, metadata.unscaledDataType);

    if (metadata.scaledDataType == GDT_Unknown)
        metadata.scaledDataType =
            metadata.scaling.IsIdentity() ? metadata.unscaledDataType : GDT_Float64;

    if (!metadata.scaledNoData.hasValue && metadata.unscaledNoData.hasValue)
    {
        if (metadata.scaling.IsIdentity() || std::isnan(metadata.unscaledNoData.value))
            metadata.scaledNoData = metadata.unscaledNoData;
        else
            metadata.scaledNoData = NoDataValue(metadata.scaling.Apply(metadata.unscaledNoData.value));
    }
    metadata.scaledNoData = NormalizeNoData(metadata.scaledNoData, metadata.scaledDataType);

    mMetadata = std::move(metadata);
    mMetadataLoaded.store(true, std::memory_order_release);
    return mMetadata;
}

const std::string& Grid::GetDisplayName() const
{
    return Metadata().displayName;
}

const Extent& Grid::GetExtent() const
{
    return Metadata().extent;
}

const SpatialReference& Grid::GetSpatialReference() const
{
    return Metadata().spatialReference;
}

GDALDataType Grid::GetDataType() const
{
    return Metadata().scaledDataType;
}

GDALDataType Grid::GetUnscaledDataType() const
{
    return Metadata().unscaledDataType;
}

const NoDataValue& Grid::GetNoDataValue() const
{
    return Metadata().scaledNoData;
}

const NoDataValue& Grid::GetUnscaledNoDataValue() const
{
    return Metadata().unscaledNoData;
}

const Scaling& Grid::GetScaling() const
{
    return Metadata().scaling;
}

bool Grid::IsNoData(double value) const
{
    return GetNoDataValue().Matches(value);
}

GridBlock Grid::ReadBlock(const std::vector<size_t>& origin, const std::vector<size_t>& shape) const
{
    GEOGRID_PERF_TIMER("Grid::ReadBlock");

    const GridMetadata& md = Metadata();
    if (!md.extent.Contains(origin, shape))
        throw OutOfBoundsError("Window " + FormatWindow(origin, shape) + " exceeds extent " +
                               md.extent.ToString() + " of grid '" + md.displayName + "'");

    GridBlock raw(origin, shape, md.unscaledDataType, md.unscaledNoData);
    IReadBlock(raw);

    if (md.scaling.IsIdentity() && md.scaledDataType == md.unscaledDataType &&
        md.scaledNoData == md.unscaledNoData)
        return raw;

    GridBlock scaled(origin, shape, md.scaledDataType, md.scaledNoData);
    const double scaledNoData = md.scaledNoData.hasValue
                                    ? md.scaledNoData.value
                                    : std::numeric_limits<double>::quiet_NaN();
    for (size_t i = 0; i < raw.GetCellCount(); i++)
    {
        const double value = raw.GetValue(i);
        scaled.SetValue(i, md.unscaledNoData.Matches(value) ? scaledNoData
                                                           : md.scaling.Apply(value));
    }
    return scaled;
}

GridBlock Grid::ReadAll() const
{
    const Extent& extent = GetExtent();
    return ReadBlock(std::vector<size_t>(extent.GetRank(), 0), extent.GetShape());
}
}  // namespace GeoGrid
