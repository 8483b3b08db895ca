#include "geogrid_cache_key.h"

#include <stdexcept>

#include "cpl_string.h"

namespace GeoGrid
{
uint64_t HashFNV1a(const void* pData, size_t nBytes, uint64_t seed)
{
    const unsigned char* pabyData = static_cast<const unsigned char*>(pData);
    uint64_t hash = seed;
    for (size_t i = 0; i < nBytes; i++)
    {
        hash ^= pabyData[i];
        hash *= 1099511628211ULL;
    }
    return hash;
}

// Separators inside values are escaped so that distinct parameter sets can
// never serialise to the same text.
static std::string Escape(const std::string& value)
{
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value)
    {
        if (c == '\\' || c == '|' || c == '=')
            escaped += '\\';
        escaped += c;
    }
    return escaped;
}

CacheKey::CacheKey(const std::string& backend, const std::string& function)
    : mBackend(backend), mFunction(function)
{
}

CacheKey& CacheKey::SetBackend(const std::string& backend)
{
    mBackend = backend;
    return *this;
}

CacheKey& CacheKey::SetFunction(const std::string& function)
{
    mFunction = function;
    return *this;
}

CacheKey& CacheKey::AddParameter(const std::string& name, const std::string& value)
{
    if (!mParameters.emplace(name, value).second)
        throw std::invalid_argument("Cache key parameter '" + name + "' given twice");
    return *this;
}

CacheKey& CacheKey::AddParameter(const std::string& name, const char* value)
{
    return AddParameter(name, std::string(value ? value : ""));
}

CacheKey& CacheKey::AddParameter(const std::string& name, double value)
{
    return AddParameter(name, std::string(CPLSPrintf("%.17g", value)));
}

CacheKey& CacheKey::AddParameter(const std::string& name, long long value)
{
    return AddParameter(name, std::to_string(value));
}

CacheKey& CacheKey::AddParameter(const std::string& name, size_t value)
{
    return AddParameter(name, std::to_string(value));
}

CacheKey& CacheKey::AddParameter(const std::string& name, bool value)
{
    return AddParameter(name, std::string(value ? "true" : "false"));
}

CacheKey& CacheKey::AddParameter(const std::string& name, const std::vector<size_t>& value)
{
    std::string text = "[";
    for (size_t i = 0; i < value.size(); i++)
        text += (i ? "," : "") + std::to_string(value[i]);
    return AddParameter(name, text + "]");
}

std::string CacheKey::GetCanonical() const
{
    std::string text = "GeoGrid/1|backend=" + Escape(mBackend) + "|function=" + Escape(mFunction);
    for (const auto& param : mParameters)
        text += "|" + Escape(param.first) + "=" + Escape(param.second);
    return text;
}

std::string CacheKey::GetFingerprint() const
{
    const std::string canonical = GetCanonical();
    const uint64_t hash = HashFNV1a(canonical.data(), canonical.size());
    return CPLSPrintf("%016llx", static_cast<unsigned long long>(hash));
}

bool CacheKey::operator==(const CacheKey& other) const
{
    return mBackend == other.mBackend && mFunction == other.mFunction &&
           mParameters == other.mParameters;
}

bool CacheKey::operator<(const CacheKey& other) const
{
    return GetCanonical() < other.GetCanonical();
}
}  // namespace GeoGrid
