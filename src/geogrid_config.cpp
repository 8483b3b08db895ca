#include "geogrid_config.h"

#include <cmath>

#include "cpl_conv.h"
#include "cpl_string.h"
#include "geogrid_errors.h"

namespace GeoGrid
{
const char* Config::GetOption(const char* pszName, const char* pszDefault, CSLConstList papszOptions)
{
    const char* pszValue = CSLFetchNameValue(papszOptions, pszName);
    if (pszValue)
        return pszValue;
    return CPLGetConfigOption(pszName, pszDefault);
}

static double GetNonNegative(const char* pszName,
                             const char* pszDefault,
                             CSLConstList papszOptions)
{
    const char* pszValue = Config::GetOption(pszName, pszDefault, papszOptions);
    const double value = CPLAtof(pszValue);
    if (!std::isfinite(value) || value < 0.0)
    {
        ErrorHandler::Warning(std::string("Ignoring invalid ") + pszName + "=" + pszValue +
                              ", using " + pszDefault);
        return CPLAtof(pszDefault);
    }
    return value;
}

size_t Config::GetBlockSize(CSLConstList papszOptions)
{
    const double value = GetNonNegative("GEOGRID_BLOCK_SIZE",
                                        CPLSPrintf("%d", static_cast<int>(DEFAULT_BLOCK_SIZE)),
                                        papszOptions);
    if (value < 1.0)
        return DEFAULT_BLOCK_SIZE;
    return static_cast<size_t>(value);
}

size_t Config::GetCacheCapacity(CSLConstList papszOptions)
{
    return static_cast<size_t>(GetNonNegative("GEOGRID_CACHE_CAPACITY", "0", papszOptions));
}

double Config::GetCacheTTLSeconds(CSLConstList papszOptions)
{
    return GetNonNegative("GEOGRID_CACHE_TTL", "0", papszOptions);
}

double Config::GetSrsTolerance(CSLConstList papszOptions)
{
    return GetNonNegative("GEOGRID_SRS_TOLERANCE", "1e-9", papszOptions);
}

double Config::GetPerfThresholdMs(CSLConstList papszOptions)
{
    return GetNonNegative("GEOGRID_PERF_THRESHOLD_MS", "1", papszOptions);
}
}  // namespace GeoGrid
