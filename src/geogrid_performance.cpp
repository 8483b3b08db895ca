#include "geogrid_performance.h"

#include "cpl_error.h"
#include "geogrid_config.h"

namespace GeoGrid
{
namespace PerformanceUtils
{
ScopedTimer::ScopedTimer(const char* pszOperation)
    : mOperation(pszOperation), mStart(std::chrono::steady_clock::now())
{
}

ScopedTimer::~ScopedTimer()
{
    const double elapsedMs = GetElapsedMilliseconds();
    if (elapsedMs >= Config::GetPerfThresholdMs())
        CPLDebug("GEOGRID_PERF", "%s took %.3f ms", mOperation, elapsedMs);
}

double ScopedTimer::GetElapsedMilliseconds() const
{
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - mStart).count();
}
}  // namespace PerformanceUtils
}  // namespace GeoGrid
