#pragma once
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "gdal.h"
#include "geogrid.h"
#include "geogrid_grid.h"
#include "geogrid_types.h"

namespace GeoGrid
{
/**
 * @brief A typed function that computes one grid from others
 *
 * The identity string names the function in cache keys and derivation
 * graphs, so two derivations with the same identity must compute the same
 * values.
 */
class GEOGRID_DLL Derivation
{
  public:
    virtual ~Derivation();

    const std::string& GetIdentity() const { return mIdentity; }
    size_t GetArity() const { return mArity; }
    GDALDataType GetOutputDataType() const { return mOutputType; }
    const NoDataValue& GetOutputNoData() const { return mOutputNoData; }

    /**
     * @brief When true the engine passes NoData cells through and keeps
     *        whatever the function writes for them
     */
    bool HandlesNoData() const { return mHandlesNoData; }

    /**
     * @brief Compute one tile
     * @param inputs One block per input, all covering the window of output
     * @param validMask Per cell, true when no input is NoData there. Empty
     *        when the derivation handles NoData itself.
     * @param output Block to fill; its NoData is already set
     */
    virtual void Evaluate(const std::vector<const GridBlock*>& inputs,
                          const std::vector<bool>& validMask,
                          GridBlock& output) const = 0;

  protected:
    Derivation(const std::string& identity,
               size_t arity,
               GDALDataType eOutputType,
               const NoDataValue& outputNoData,
               bool handlesNoData);

  private:
    std::string mIdentity;
    size_t mArity;
    GDALDataType mOutputType;
    NoDataValue mOutputNoData;
    bool mHandlesNoData;
};

using DerivationPtr = std::shared_ptr<const Derivation>;

/**
 * @brief Derivation applied cell by cell
 *
 * The function receives the input values of one cell and returns the
 * output value. Cells where an input is NoData are skipped unless the
 * derivation handles NoData.
 */
class GEOGRID_DLL CellDerivation : public Derivation
{
  public:
    using CellFunction = std::function<double(const double* values, size_t count)>;

    CellDerivation(const std::string& identity,
                   size_t arity,
                   GDALDataType eOutputType,
                   CellFunction function,
                   const NoDataValue& outputNoData = NoDataValue(),
                   bool handlesNoData = false);

    void Evaluate(const std::vector<const GridBlock*>& inputs,
                  const std::vector<bool>& validMask,
                  GridBlock& output) const override;

  private:
    CellFunction mFunction;
};

/**
 * @brief Derivation applied to a whole tile at once
 *
 * The function sees every cell of the tile. Unless the derivation handles
 * NoData, the engine overwrites the cells where an input is NoData after
 * the function returns.
 */
class GEOGRID_DLL BlockDerivation : public Derivation
{
  public:
    using BlockFunction =
        std::function<void(const std::vector<const GridBlock*>& inputs, GridBlock& output)>;

    BlockDerivation(const std::string& identity,
                    size_t arity,
                    GDALDataType eOutputType,
                    BlockFunction function,
                    const NoDataValue& outputNoData = NoDataValue(),
                    bool handlesNoData = false);

    void Evaluate(const std::vector<const GridBlock*>& inputs,
                  const std::vector<bool>& validMask,
                  GridBlock& output) const override;

  private:
    BlockFunction mFunction;
};

/**
 * @brief Lookup of derivations by identity
 */
class GEOGRID_DLL DerivationRegistry
{
  public:
    /**
     * @throws std::invalid_argument on a null derivation or a duplicate identity
     */
    void Register(DerivationPtr derivation);

    /**
     * @return The derivation, or nullptr when none has that identity
     */
    DerivationPtr Find(const std::string& identity) const;

    /**
     * @throws NotFoundError when no derivation has that identity
     */
    DerivationPtr Get(const std::string& identity) const;

    std::vector<std::string> GetIdentities() const;

  private:
    mutable std::mutex mMutex;
    std::map<std::string, DerivationPtr> mDerivations;
};
}  // namespace GeoGrid
