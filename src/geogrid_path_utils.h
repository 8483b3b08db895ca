#pragma once
#include <string>

namespace GeoGrid
{
namespace PathUtils
{
/**
 * @brief Utility class for GDAL dataset names and file paths
 */
class PathParser
{
  public:
    struct ParsedPath
    {
        std::string driverPrefix;    // e.g. "NETCDF", empty for plain files
        std::string mainPath;        // file or URL holding the data
        std::string subdatasetName;  // e.g. variable name, empty if none
        bool isSubdataset = false;
        bool isVirtualPath = false;
    };

    /**
     * @brief Split a GDAL dataset name into components
     *
     * Handles plain paths, DRIVER:"path":name and DRIVER:path:name forms.
     * @param fullPath The input name to parse
     * @return ParsedPath structure with all components
     */
    static ParsedPath Parse(const std::string& fullPath);

    /**
     * @brief Check if a path is a URL or virtual file system path
     * @param path The path to check
     * @return true if URL or virtual path
     */
    static bool IsUrlOrVirtualPath(const std::string& path);

    /**
     * @brief Absolute, normalised form of a local path; others unchanged
     */
    static std::string Resolve(const std::string& path);

    /**
     * @brief Identity of the file behind a dataset name
     *
     * Resolved path plus size and modification time when the file can be
     * stat'ed, so the identity changes whenever the file does.
     */
    static std::string FileIdentity(const std::string& datasetName);

    /**
     * @brief Shell-style wildcard match supporting '*' and '?'
     */
    static bool MatchWildcard(const std::string& pattern, const std::string& text);

  private:
    static void NormalizeWindowsPath(std::string& path);
};
}  // namespace PathUtils
}  // namespace GeoGrid
