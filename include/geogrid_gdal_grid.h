#pragma once
#include <mutex>
#include <string>

#include "cpl_string.h"
#include "gdal_priv.h"
#include "geogrid_grid.h"

namespace GeoGrid
{
/**
 * @brief Grid over one band of any GDAL-readable raster
 *
 * NetCDF, HDF and other container formats are reached through their GDAL
 * subdataset names (e.g. NETCDF:"file.nc":sst). The dataset is opened on
 * first use and owned through GDALDatasetUniquePtr, so the handle is
 * released when the grid is destroyed or Close() is called, whatever path
 * the caller leaves by. Physical reads are serialised by a per-grid mutex
 * because GDAL dataset handles are not thread-safe.
 */
class GEOGRID_DLL GDALBandGrid : public Grid
{
  public:
    GDALBandGrid(const std::string& datasetName,
                 int nBand = 1,
                 CSLConstList papszOpenOptions = nullptr);
    ~GDALBandGrid() override;

    const std::string& GetDatasetName() const { return mDatasetName; }
    int GetBandNumber() const { return mBand; }

    std::string GetIdentity() const override;

    /**
     * @brief Release the GDAL handle; the next read reopens it
     */
    void Close() const;

    bool IsOpen() const;

  protected:
    void LoadMetadata(GridMetadata& metadata) const override;
    void IReadBlock(GridBlock& block) const override;

  private:
    GDALRasterBand* GetBandLocked() const;

    std::string mDatasetName;
    int mBand;
    CPLStringList mOpenOptions;

    mutable std::mutex mMutex;
    mutable GDALDatasetUniquePtr mDS;
    mutable std::string mIdentity;
};
}  // namespace GeoGrid
