#include "geogrid_derivation.h"

#include <stdexcept>
#include <utility>

#include "geogrid_errors.h"

namespace GeoGrid
{
Derivation::Derivation(const std::string& identity,
                       size_t arity,
                       GDALDataType eOutputType,
                       const NoDataValue& outputNoData,
                       bool handlesNoData)
    : mIdentity(identity),
      mArity(arity),
      mOutputType(eOutputType),
      mOutputNoData(outputNoData),
      mHandlesNoData(handlesNoData)
{
    if (identity.empty())
        throw std::invalid_argument("Derivation identity must not be empty");
    if (arity == 0)
        throw std::invalid_argument("Derivation '" + identity + "' must take at least one input");
    if (!IsSupportedDataType(eOutputType))
        throw std::invalid_argument("Derivation '" + identity + "' has unsupported output type " +
                                    DataTypeName(eOutputType));
}

Derivation::~Derivation() = default;

// ============================================================================
// CellDerivation
// ============================================================================

CellDerivation::CellDerivation(const std::string& identity,
                               size_t arity,
                               GDALDataType eOutputType,
                               CellFunction function,
                               const NoDataValue& outputNoData,
                               bool handlesNoData)
    : Derivation(identity, arity, eOutputType, outputNoData, handlesNoData),
      mFunction(std::move(function))
{
    if (!mFunction)
        throw std::invalid_argument("CellDerivation '" + identity + "' has no function");
}

void CellDerivation::Evaluate(const std::vector<const GridBlock*>& inputs,
                              const std::vector<bool>& validMask,
                              GridBlock& output) const
{
    std::vector<double> cell(inputs.size());
    for (size_t i = 0; i < output.GetCellCount(); i++)
    {
        if (!validMask.empty() && !validMask[i])
            continue;
        for (size_t k = 0; k < inputs.size(); k++)
            cell[k] = inputs[k]->GetValue(i);
        output.SetValue(i, mFunction(cell.data(), cell.size()));
    }
}

// ============================================================================
// BlockDerivation
// ============================================================================

BlockDerivation::BlockDerivation(const std::string& identity,
                                 size_t arity,
                                 GDALDataType eOutputType,
                                 BlockFunction function,
                                 const NoDataValue& outputNoData,
                                 bool handlesNoData)
    : Derivation(identity, arity, eOutputType, outputNoData, handlesNoData),
      mFunction(std::move(function))
{
    if (!mFunction)
        throw std::invalid_argument("BlockDerivation '" + identity + "' has no function");
}

void BlockDerivation::Evaluate(const std::vector<const GridBlock*>& inputs,
                               const std::vector<bool>& /* validMask */,
                               GridBlock& output) const
{
    mFunction(inputs, output);
}

// ============================================================================
// DerivationRegistry
// ============================================================================

void DerivationRegistry::Register(DerivationPtr derivation)
{
    if (!derivation)
        throw std::invalid_argument("Cannot register a null derivation");

    std::lock_guard<std::mutex> lock(mMutex);
    const std::string& identity = derivation->GetIdentity();
    if (!mDerivations.emplace(identity, derivation).second)
        throw std::invalid_argument("Derivation '" + identity + "' is already registered");

    CPLDebug(ErrorHandler::DEBUG_KEY, "Registered derivation %s", identity.c_str());
}

DerivationPtr DerivationRegistry::Find(const std::string& identity) const
{
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mDerivations.find(identity);
    return it == mDerivations.end() ? nullptr : it->second;
}

DerivationPtr DerivationRegistry::Get(const std::string& identity) const
{
    DerivationPtr derivation = Find(identity);
    if (!derivation)
        throw NotFoundError("No derivation named '" + identity + "'");
    return derivation;
}

std::vector<std::string> DerivationRegistry::GetIdentities() const
{
    std::lock_guard<std::mutex> lock(mMutex);
    std::vector<std::string> identities;
    identities.reserve(mDerivations.size());
    for (const auto& entry : mDerivations)
        identities.push_back(entry.first);
    return identities;
}
}  // namespace GeoGrid
