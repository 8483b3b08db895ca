#include "geogrid_gdal_grid.h"

#include <cmath>

#include "cpl_error.h"
#include "geogrid_errors.h"
#include "geogrid_path_utils.h"
#include "geogrid_performance.h"

namespace GeoGrid
{
static const char* BACKEND_NAME = "GDAL";

GDALBandGrid::GDALBandGrid(const std::string& datasetName, int nBand, CSLConstList papszOpenOptions)
    : mDatasetName(datasetName), mBand(nBand), mOpenOptions(CSLDuplicate(papszOpenOptions))
{
    if (nBand < 1)
        throw std::invalid_argument(CPLSPrintf("Band numbers start at 1, got %d", nBand));
}

GDALBandGrid::~GDALBandGrid() = default;

std::string GDALBandGrid::GetIdentity() const
{
    std::lock_guard<std::mutex> lock(mMutex);
    if (mIdentity.empty())
    {
        std::string identity = "gdal:" + PathUtils::PathParser::FileIdentity(mDatasetName);
        const PathUtils::PathParser::ParsedPath parsed = PathUtils::PathParser::Parse(mDatasetName);
        if (parsed.isSubdataset)
            identity += "|" + parsed.driverPrefix + ":" + parsed.subdatasetName;
        identity += CPLSPrintf("|band=%d", mBand);
        for (int i = 0; i < mOpenOptions.Count(); i++)
            identity += std::string("|oo:") + mOpenOptions[i];
        mIdentity = identity;
    }
    return mIdentity;
}

void GDALBandGrid::Close() const
{
    std::lock_guard<std::mutex> lock(mMutex);
    if (mDS)
    {
        ErrorHandler::Debug("Closing " + mDatasetName);
        mDS.reset();
    }
}

bool GDALBandGrid::IsOpen() const
{
    std::lock_guard<std::mutex> lock(mMutex);
    return mDS != nullptr;
}

GDALRasterBand* GDALBandGrid::GetBandLocked() const
{
    if (!mDS)
    {
        GEOGRID_PERF_TIMER("GDALBandGrid::Open");

        CPLErrorReset();
        CPLErrorHandlerPusher quiet(CPLQuietErrorHandler);
        mDS.reset(GDALDataset::Open(mDatasetName.c_str(),
                                    GDAL_OF_RASTER | GDAL_OF_READONLY,
                                    nullptr,
                                    mOpenOptions.List(),
                                    nullptr));
        if (!mDS)
            ErrorHandler::ThrowBackendError(BACKEND_NAME, mDatasetName, "cannot open dataset");

        ErrorHandler::Debug("Opened " + mDatasetName);
    }

    if (mBand > mDS->GetRasterCount())
    {
        const int nCount = mDS->GetRasterCount();
        throw BackendUnavailableError(BACKEND_NAME,
                                      mDatasetName,
                                      CPLSPrintf("band %d requested but the dataset has %d",
                                                 mBand, nCount),
                                      CPLE_IllegalArg);
    }
    return mDS->GetRasterBand(mBand);
}

void GDALBandGrid::LoadMetadata(GridMetadata& metadata) const
{
    std::lock_guard<std::mutex> lock(mMutex);
    GDALRasterBand* poBand = GetBandLocked();

    double adfGeoTransform[6] = {0.0, 1.0, 0.0, 0.0, 0.0, 1.0};
    if (mDS->GetGeoTransform(adfGeoTransform) != CE_None)
    {
        ErrorHandler::Debug("No geotransform for " + mDatasetName + ", using pixel coordinates");
        adfGeoTransform[0] = 0.0;
        adfGeoTransform[1] = 1.0;
        adfGeoTransform[2] = 0.0;
        adfGeoTransform[3] = 0.0;
        adfGeoTransform[4] = 0.0;
        adfGeoTransform[5] = 1.0;
    }

    if (adfGeoTransform[2] != 0.0 || adfGeoTransform[4] != 0.0)
        throw Error("Dataset " + mDatasetName +
                    " has a rotated geotransform, which GeoGrid does not support");

    metadata.displayName = CPLSPrintf("band %d of %s", mBand, mDatasetName.c_str());
    metadata.extent = Extent("yx",
                             {static_cast<size_t>(mDS->GetRasterYSize()),
                              static_cast<size_t>(mDS->GetRasterXSize())},
                             {adfGeoTransform[5], adfGeoTransform[1]},
                             {adfGeoTransform[3], adfGeoTransform[0]});
    metadata.spatialReference = SpatialReference::FromOGR(mDS->GetSpatialRef());
    metadata.unscaledDataType = poBand->GetRasterDataType();

    int bHasNoData = FALSE;
    double dfNoData = 0.0;
    if (metadata.unscaledDataType == GDT_Int64)
        dfNoData = static_cast<double>(poBand->GetNoDataValueAsInt64(&bHasNoData));
    else if (metadata.unscaledDataType == GDT_UInt64)
        dfNoData = static_cast<double>(poBand->GetNoDataValueAsUInt64(&bHasNoData));
    else
        dfNoData = poBand->GetNoDataValue(&bHasNoData);
    if (bHasNoData)
        metadata.unscaledNoData = NoDataValue(dfNoData);

    int bHasScale = FALSE;
    int bHasOffset = FALSE;
    const double dfScale = poBand->GetScale(&bHasScale);
    const double dfOffset = poBand->GetOffset(&bHasOffset);
    if (bHasScale && dfScale != 0.0)
        metadata.scaling.scale = dfScale;
    if (bHasOffset)
        metadata.scaling.offset = dfOffset;

    CPLDebug(ErrorHandler::DEBUG_KEY,
             "%s: %s, type %s, nodata %s",
             metadata.displayName.c_str(),
             metadata.extent.ToString().c_str(),
             DataTypeName(metadata.unscaledDataType).c_str(),
             bHasNoData ? CPLSPrintf("%.17g", dfNoData) : "none");
}

void GDALBandGrid::IReadBlock(GridBlock& block) const
{
    const std::vector<size_t>& origin = block.GetOrigin();
    const std::vector<size_t>& shape = block.GetShape();

    std::lock_guard<std::mutex> lock(mMutex);
    GDALRasterBand* poBand = GetBandLocked();

    CPLErrorReset();
    CPLErrorHandlerPusher quiet(CPLQuietErrorHandler);
    const CPLErr eErr = poBand->RasterIO(GF_Read,
                                         static_cast<int>(origin[1]),
                                         static_cast<int>(origin[0]),
                                         static_cast<int>(shape[1]),
                                         static_cast<int>(shape[0]),
                                         block.GetData(),
                                         static_cast<int>(shape[1]),
                                         static_cast<int>(shape[0]),
                                         GDT_Float64,
                                         0,
                                         0,
                                         nullptr);
    if (eErr != CE_None)
    {
        // Drop the handle so that a later read starts from a fresh open.
        mDS.reset();
        ErrorHandler::ThrowBackendError(BACKEND_NAME,
                                        mDatasetName,
                                        CPLSPrintf("reading band %d failed", mBand));
    }
}
}  // namespace GeoGrid
