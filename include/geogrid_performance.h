#pragma once
#include <chrono>

#include "geogrid.h"

namespace GeoGrid
{
namespace PerformanceUtils
{
/**
 * @brief Logs the wall time of a scope under the GEOGRID_PERF debug key
 *
 * Scopes shorter than GEOGRID_PERF_THRESHOLD_MS (see Config) stay silent.
 */
class GEOGRID_DLL ScopedTimer
{
  public:
    explicit ScopedTimer(const char* pszOperation);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    double GetElapsedMilliseconds() const;

  private:
    const char* mOperation;
    std::chrono::steady_clock::time_point mStart;
};
}  // namespace PerformanceUtils
}  // namespace GeoGrid

#define GEOGRID_PERF_TIMER(op) GeoGrid::PerformanceUtils::ScopedTimer geogridPerfTimer(op)
