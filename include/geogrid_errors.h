#pragma once
#include <stdexcept>
#include <string>

#include "cpl_error.h"
#include "geogrid.h"

namespace GeoGrid
{
/**
 * @brief Base class of every error raised by the GeoGrid core
 */
class GEOGRID_DLL Error : public std::runtime_error
{
  public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief A read window does not fit inside the grid's extent
 */
class GEOGRID_DLL OutOfBoundsError : public Error
{
  public:
    using Error::Error;
};

/**
 * @brief The resource behind a grid, table or collection cannot be accessed
 *
 * Carries the diagnostic of the backend that failed so callers can tell a
 * missing file from a permission problem or a corrupt header.
 */
class GEOGRID_DLL BackendUnavailableError : public Error
{
  public:
    BackendUnavailableError(const std::string& backend,
                            const std::string& resource,
                            const std::string& detail,
                            CPLErrorNum backendErrorNo = CPLE_None);

    const std::string& GetBackend() const { return mBackend; }
    const std::string& GetResource() const { return mResource; }
    const std::string& GetDetail() const { return mDetail; }
    CPLErrorNum GetBackendErrorNo() const { return mBackendErrorNo; }

  private:
    std::string mBackend;
    std::string mResource;
    std::string mDetail;
    CPLErrorNum mBackendErrorNo;
};

/**
 * @brief Inputs of a derived grid disagree on extent or spatial reference
 */
class GEOGRID_DLL IncompatibleGridsError : public Error
{
  public:
    using Error::Error;
};

/**
 * @brief A derived grid would depend on itself
 */
class GEOGRID_DLL CyclicDerivationError : public IncompatibleGridsError
{
  public:
    using IncompatibleGridsError::IncompatibleGridsError;
};

class GEOGRID_DLL NotFoundError : public Error
{
  public:
    using Error::Error;
};

class GEOGRID_DLL AmbiguousIdentifierError : public Error
{
  public:
    using Error::Error;
};

/**
 * @brief Collection traversal re-entered a collection already on its path
 */
class GEOGRID_DLL CyclicCollectionError : public Error
{
  public:
    using Error::Error;
};

/**
 * @brief Centralized reporting for GeoGrid operations
 */
class GEOGRID_DLL ErrorHandler
{
  public:
    /**
     * @brief Throw BackendUnavailableError built from the last CPL error
     * @param backend Backend name, e.g. "GDAL"
     * @param resource The path or identifier that failed
     * @param context What the caller was doing
     */
    [[noreturn]] static void ThrowBackendError(const std::string& backend,
                                               const std::string& resource,
                                               const std::string& context);

    /**
     * @brief Emit a CE_Warning through CPLError
     * @param message The warning text
     */
    static void Warning(const std::string& message);

    /**
     * @brief Debug log with GEOGRID prefix
     * @param message The debug message
     */
    static void Debug(const std::string& message);

    static const char* DEBUG_KEY;
};
}  // namespace GeoGrid
