#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "geogrid.h"

namespace GeoGrid
{
/**
 * @brief 64-bit FNV-1a hash, stable across runs and platforms
 */
GEOGRID_DLL uint64_t HashFNV1a(const void* pData, size_t nBytes,
                               uint64_t seed = 14695981039346656037ULL);

/**
 * @brief Canonical fingerprint of a computation
 *
 * Built from the backend identity of the data, the identity of the function
 * applied to it, and named parameters. Parameters are kept sorted by name,
 * so the order in which they are added does not matter. Nothing in the key
 * depends on object addresses.
 */
class GEOGRID_DLL CacheKey
{
  public:
    CacheKey() = default;
    CacheKey(const std::string& backend, const std::string& function);

    CacheKey& SetBackend(const std::string& backend);
    CacheKey& SetFunction(const std::string& function);

    /**
     * @throws std::invalid_argument if the parameter was already added
     */
    CacheKey& AddParameter(const std::string& name, const std::string& value);
    CacheKey& AddParameter(const std::string& name, const char* value);
    CacheKey& AddParameter(const std::string& name, double value);
    CacheKey& AddParameter(const std::string& name, long long value);
    CacheKey& AddParameter(const std::string& name, size_t value);
    CacheKey& AddParameter(const std::string& name, bool value);
    CacheKey& AddParameter(const std::string& name, const std::vector<size_t>& value);

    const std::string& GetBackend() const { return mBackend; }
    const std::string& GetFunction() const { return mFunction; }
    const std::map<std::string, std::string>& GetParameters() const { return mParameters; }

    /**
     * @brief Serialised form; two keys are equal iff their canonical text is
     */
    std::string GetCanonical() const;

    /**
     * @brief 16 hex digit hash of the canonical text
     */
    std::string GetFingerprint() const;

    bool operator==(const CacheKey& other) const;
    bool operator!=(const CacheKey& other) const { return !(*this == other); }
    bool operator<(const CacheKey& other) const;

  private:
    std::string mBackend;
    std::string mFunction;
    std::map<std::string, std::string> mParameters;
};
}  // namespace GeoGrid
