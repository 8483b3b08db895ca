#include "geogrid_errors.h"

#include "cpl_error.h"

namespace GeoGrid
{
const char* ErrorHandler::DEBUG_KEY = "GEOGRID";

static std::string FormatBackendMessage(const std::string& backend,
                                        const std::string& resource,
                                        const std::string& detail)
{
    std::string message = backend + " resource '" + resource + "' is unavailable";
    if (!detail.empty())
        message += ": " + detail;
    return message;
}

BackendUnavailableError::BackendUnavailableError(const std::string& backend,
                                                 const std::string& resource,
                                                 const std::string& detail,
                                                 CPLErrorNum backendErrorNo)
    : Error(FormatBackendMessage(backend, resource, detail)),
      mBackend(backend),
      mResource(resource),
      mDetail(detail),
      mBackendErrorNo(backendErrorNo)
{
}

void ErrorHandler::ThrowBackendError(const std::string& backend,
                                     const std::string& resource,
                                     const std::string& context)
{
    const CPLErrorNum errorNo = CPLGetLastErrorNo();
    const char* pszLastMsg = CPLGetLastErrorMsg();

    std::string detail = context;
    if (pszLastMsg && pszLastMsg[0] != '\0')
    {
        if (!detail.empty())
            detail += ": ";
        detail += pszLastMsg;
    }

    CPLDebug(DEBUG_KEY, "%s backend failure on %s (%d): %s",
             backend.c_str(), resource.c_str(), static_cast<int>(errorNo), detail.c_str());
    CPLErrorReset();

    throw BackendUnavailableError(backend, resource, detail, errorNo);
}

void ErrorHandler::Warning(const std::string& message)
{
    CPLError(CE_Warning, CPLE_AppDefined, "%s: %s", DEBUG_KEY, message.c_str());
}

void ErrorHandler::Debug(const std::string& message)
{
    CPLDebug(DEBUG_KEY, "%s", message.c_str());
}
}  // namespace GeoGrid
