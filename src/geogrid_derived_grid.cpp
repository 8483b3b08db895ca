#include "geogrid_derived_grid.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

#include "cpl_string.h"
#include "geogrid_cache_key.h"
#include "geogrid_derivation_graph.h"
#include "geogrid_errors.h"
#include "geogrid_performance.h"

namespace GeoGrid
{
DerivedGridOptions DerivedGridOptions::FromConfig(CSLConstList papszOptions)
{
    DerivedGridOptions options;
    options.blockSize = Config::GetBlockSize(papszOptions);
    return options;
}

static std::vector<size_t> ResolveBlockShape(const DerivedGridOptions& options, const Extent& extent)
{
    const std::string& dims = extent.GetDimensions();
    if (!options.blockShape.empty())
    {
        if (options.blockShape.size() != dims.size())
            throw std::invalid_argument("Block shape rank does not match dimensions '" + dims + "'");
        for (size_t n : options.blockShape)
        {
            if (n == 0)
                throw std::invalid_argument("Block shape entries must be at least 1");
        }
        return options.blockShape;
    }

    if (options.blockSize == 0)
        throw std::invalid_argument("Block size must be at least 1");

    std::vector<size_t> shape(dims.size());
    for (size_t d = 0; d < dims.size(); d++)
        shape[d] = (dims[d] == 'y' || dims[d] == 'x') ? options.blockSize : 1;
    return shape;
}

static NoDataValue ResolveOutputNoData(const Derivation& derivation, const std::vector<GridPtr>& inputs)
{
    const GDALDataType eType = derivation.GetOutputDataType();
    if (derivation.GetOutputNoData().hasValue)
        return NoDataValue(ClampToDataType(derivation.GetOutputNoData().value, eType));

    if (IsFloatingType(eType))
        return NoDataValue(std::numeric_limits<double>::quiet_NaN());

    for (const GridPtr& input : inputs)
    {
        const NoDataValue& noData = input->GetNoDataValue();
        if (noData.hasValue && !std::isnan(noData.value))
            return NoDataValue(ClampToDataType(noData.value, eType));
    }
    return NoDataValue();
}

std::shared_ptr<DerivedGrid> DerivedGrid::Create(DerivationPtr derivation,
                                                 std::vector<GridPtr> inputs,
                                                 const DerivedGridOptions& options)
{
    if (!derivation)
        throw std::invalid_argument("DerivedGrid needs a derivation");
    if (inputs.size() != derivation->GetArity())
        throw std::invalid_argument(CPLSPrintf("Derivation '%s' takes %llu inputs, got %llu",
                                               derivation->GetIdentity().c_str(),
                                               static_cast<unsigned long long>(derivation->GetArity()),
                                               static_cast<unsigned long long>(inputs.size())));
    for (const GridPtr& input : inputs)
    {
        if (!input)
            throw std::invalid_argument("DerivedGrid input must not be null");
    }

    return std::shared_ptr<DerivedGrid>(new DerivedGrid(std::move(derivation), std::move(inputs), options));
}

DerivedGrid::DerivedGrid(DerivationPtr derivation,
                         std::vector<GridPtr> inputs,
                         const DerivedGridOptions& options)
    : mDerivation(std::move(derivation)), mInputs(std::move(inputs)), mCache(options.cache)
{
    const Grid& first = *mInputs.front();
    const Extent& extent = first.GetExtent();
    const SpatialReference& srs = first.GetSpatialReference();
    const double srsTolerance = Config::GetSrsTolerance();

    for (size_t i = 1; i < mInputs.size(); i++)
    {
        const Grid& input = *mInputs[i];
        if (!input.GetExtent().IsIdenticalTo(extent))
            throw IncompatibleGridsError("Input '" + input.GetDisplayName() + "' has extent " +
                                         input.GetExtent().ToString() + ", expected " +
                                         extent.ToString() + " from '" + first.GetDisplayName() + "'");
        if (!input.GetSpatialReference().IsCompatibleWith(srs, srsTolerance))
            throw IncompatibleGridsError("Input '" + input.GetDisplayName() +
                                         "' has a spatial reference incompatible with '" +
                                         first.GetDisplayName() + "'");
    }

    CacheKey key("derived", mDerivation->GetIdentity());
    key.AddParameter("arity", mInputs.size());
    key.AddParameter("outputType", DataTypeName(mDerivation->GetOutputDataType()));
    const NoDataValue& declaredNoData = mDerivation->GetOutputNoData();
    key.AddParameter("outputNoData",
                     std::string(declaredNoData.hasValue ? CPLSPrintf("%.17g", declaredNoData.value) : "none"));
    key.AddParameter("handlesNoData", mDerivation->HandlesNoData());
    // Inputs enter by fingerprint so nested identities stay short
    for (size_t i = 0; i < mInputs.size(); i++)
    {
        const std::string inputId = mInputs[i]->GetIdentity();
        key.AddParameter(CPLSPrintf("input%04llu", static_cast<unsigned long long>(i)),
                         std::string(CPLSPrintf("%016llx:%llu",
                                                static_cast<unsigned long long>(
                                                    HashFNV1a(inputId.data(), inputId.size())),
                                                static_cast<unsigned long long>(inputId.size()))));
    }
    mIdentity = "derived:" + key.GetCanonical();

    DerivationGraph graph;
    for (const GridPtr& input : mInputs)
    {
        graph.AddEdge(mIdentity, input->GetIdentity());
        graph.AddGrid(*input);
    }
    const std::vector<std::string> cycle = graph.FindCycle();
    if (!cycle.empty())
    {
        std::string path;
        for (const std::string& node : cycle)
            path += (path.empty() ? "" : " -> ") + node;
        throw CyclicDerivationError("Derivation '" + mDerivation->GetIdentity() +
                                    "' would create a dependency cycle: " + path);
    }

    mBlockShape = ResolveBlockShape(options, extent);

    mResolvedMetadata.displayName =
        options.displayName.empty() ? mDerivation->GetIdentity() + "(" + first.GetDisplayName() + ")"
                                    : options.displayName;
    mResolvedMetadata.extent = extent;
    mResolvedMetadata.spatialReference = srs;
    mResolvedMetadata.unscaledDataType = mDerivation->GetOutputDataType();
    mResolvedMetadata.unscaledNoData = ResolveOutputNoData(*mDerivation, mInputs);

    if (!mResolvedMetadata.unscaledNoData.hasValue && !mDerivation->HandlesNoData())
    {
        for (const GridPtr& input : mInputs)
        {
            if (input->GetNoDataValue().hasValue)
                throw std::invalid_argument("Derivation '" + mDerivation->GetIdentity() +
                                            "' produces " + DataTypeName(mResolvedMetadata.unscaledDataType) +
                                            " cells but has no NoData value to mark cells where '" +
                                            input->GetDisplayName() + "' is NoData");
        }
    }

    CPLDebug(ErrorHandler::DEBUG_KEY, "Created derived grid %s over %llu inputs",
             mResolvedMetadata.displayName.c_str(), static_cast<unsigned long long>(mInputs.size()));
}

void DerivedGrid::LoadMetadata(GridMetadata& metadata) const
{
    metadata = mResolvedMetadata;
}

GridBlock DerivedGrid::ComputeTile(const std::vector<size_t>& origin, const std::vector<size_t>& shape) const
{
    GEOGRID_PERF_TIMER("DerivedGrid::ComputeTile");

    std::vector<GridBlock> blocks;
    blocks.reserve(mInputs.size());
    for (const GridPtr& input : mInputs)
        blocks.push_back(input->ReadBlock(origin, shape));

    std::vector<const GridBlock*> inputs;
    inputs.reserve(blocks.size());
    for (const GridBlock& block : blocks)
        inputs.push_back(&block);

    const GDALDataType eType = mResolvedMetadata.unscaledDataType;
    const NoDataValue& noData = mResolvedMetadata.unscaledNoData;
    const double fillValue = noData.hasValue ? noData.value : 0.0;

    GridBlock output(origin, shape, eType, noData);
    output.Fill(fillValue);

    std::vector<bool> validMask;
    if (!mDerivation->HandlesNoData())
    {
        validMask.assign(output.GetCellCount(), true);
        for (const GridBlock& block : blocks)
        {
            if (!block.GetNoDataValue().hasValue)
                continue;
            for (size_t i = 0; i < block.GetCellCount(); i++)
            {
                if (block.IsNoData(i))
                    validMask[i] = false;
            }
        }
    }

    mDerivation->Evaluate(inputs, validMask, output);

    for (size_t i = 0; i < output.GetCellCount(); i++)
    {
        if (!validMask.empty() && !validMask[i])
            output.SetValue(i, fillValue);
        else if (!output.IsNoData(i))
            output.SetValue(i, ClampToDataType(output.GetValue(i), eType));
    }
    return output;
}

void DerivedGrid::IReadBlock(GridBlock& block) const
{
    const std::vector<size_t>& origin = block.GetOrigin();
    const std::vector<size_t>& shape = block.GetShape();
    const std::vector<size_t>& extentShape = mResolvedMetadata.extent.GetShape();
    const size_t rank = origin.size();

    // Tile index range touched by the window along each axis
    std::vector<size_t> first(rank);
    std::vector<size_t> last(rank);
    for (size_t d = 0; d < rank; d++)
    {
        first[d] = origin[d] / mBlockShape[d];
        last[d] = (origin[d] + shape[d] - 1) / mBlockShape[d];
    }

    std::vector<size_t> tile(first);
    while (true)
    {
        std::vector<size_t> tileOrigin(rank);
        std::vector<size_t> tileShape(rank);
        for (size_t d = 0; d < rank; d++)
        {
            tileOrigin[d] = tile[d] * mBlockShape[d];
            tileShape[d] = std::min(mBlockShape[d], extentShape[d] - tileOrigin[d]);
        }

        if (mCache)
        {
            CacheKey key(mIdentity, "tile");
            key.AddParameter("origin", tileOrigin);
            key.AddParameter("shape", tileShape);
            std::shared_ptr<const GridBlock> cached = mCache->GetOrCompute(
                key, [&]() { return ComputeTile(tileOrigin, tileShape); });
            block.Paste(*cached);
        }
        else
        {
            block.Paste(ComputeTile(tileOrigin, tileShape));
        }

        size_t d = rank;
        while (d-- > 0)
        {
            if (++tile[d] <= last[d])
                break;
            tile[d] = first[d];
        }
        if (d == static_cast<size_t>(-1))
            break;
    }
}

std::shared_ptr<MemoryGrid> DerivedGrid::Materialize() const
{
    GEOGRID_PERF_TIMER("DerivedGrid::Materialize");
    return MemoryGrid::CreateFromGrid(*this);
}
}  // namespace GeoGrid
