#pragma once
#include <cstddef>
#include <string>

#include "cpl_port.h"
#include "geogrid.h"

namespace GeoGrid
{
/**
 * @brief Configuration lookups
 *
 * Every option is read from a GDAL-style NAME=VALUE list first, then from
 * GDAL configuration options (which include environment variables), then
 * falls back to the documented default.
 *
 *   GEOGRID_BLOCK_SIZE      tile edge along y/x for derived grids (256)
 *   GEOGRID_CACHE_CAPACITY  result cache entry limit, 0 = unbounded (0)
 *   GEOGRID_CACHE_TTL       result cache time-to-live in seconds, 0 = none (0)
 *   GEOGRID_SRS_TOLERANCE   relative tolerance on linear units (1e-9)
 *   GEOGRID_PERF_THRESHOLD_MS  shortest timed scope that is logged (1)
 */
class GEOGRID_DLL Config
{
  public:
    static const char* GetOption(const char* pszName,
                                 const char* pszDefault,
                                 CSLConstList papszOptions = nullptr);

    static size_t GetBlockSize(CSLConstList papszOptions = nullptr);
    static size_t GetCacheCapacity(CSLConstList papszOptions = nullptr);
    static double GetCacheTTLSeconds(CSLConstList papszOptions = nullptr);
    static double GetSrsTolerance(CSLConstList papszOptions = nullptr);
    static double GetPerfThresholdMs(CSLConstList papszOptions = nullptr);

    static constexpr size_t DEFAULT_BLOCK_SIZE = 256;
};
}  // namespace GeoGrid
