#include "geogrid_path_utils.h"

#include <algorithm>

#include "cpl_conv.h"
#include "cpl_string.h"
#include "cpl_vsi.h"

namespace GeoGrid
{
namespace PathUtils
{
    PathParser::ParsedPath PathParser::Parse(const std::string& fullPath)
    {
        ParsedPath result;

        // Look for a DRIVER: prefix. A single letter before the colon is a
        // Windows drive, and "://" belongs to a URL.
        size_t colonPos = fullPath.find(':');
        if (colonPos != std::string::npos && colonPos > 1 &&
            fullPath.compare(colonPos, 3, "://") != 0 &&
            fullPath.find('/') > colonPos && fullPath.find('\\') > colonPos)
        {
            result.driverPrefix = fullPath.substr(0, colonPos);
            std::string rest = fullPath.substr(colonPos + 1);

            // Quoted form: DRIVER:"path":name or DRIVER:"path"
            if (!rest.empty() && rest[0] == '\"')
            {
                size_t endQuote = rest.find('\"', 1);
                if (endQuote != std::string::npos)
                {
                    result.mainPath = rest.substr(1, endQuote - 1);
                    if (endQuote + 1 < rest.length() && rest[endQuote + 1] == ':')
                    {
                        result.subdatasetName = rest.substr(endQuote + 2);
                        result.isSubdataset = true;
                    }
                }
                else
                {
                    result.mainPath = rest.substr(1);
                }
            }
            else
            {
                // Unquoted form: DRIVER:path:name, the name being after the
                // last colon that is not part of a drive letter or URL.
                size_t lastColon = rest.rfind(':');
                if (lastColon != std::string::npos && lastColon > 1 &&
                    rest.compare(lastColon, 3, "://") != 0)
                {
                    result.mainPath = rest.substr(0, lastColon);
                    result.subdatasetName = rest.substr(lastColon + 1);
                    result.isSubdataset = true;
                }
                else
                {
                    result.mainPath = rest;
                }
            }
        }
        else
        {
            result.mainPath = fullPath;
        }

        result.isVirtualPath = IsUrlOrVirtualPath(result.mainPath);
        if (!result.isVirtualPath)
            NormalizeWindowsPath(result.mainPath);
        return result;
    }

    bool PathParser::IsUrlOrVirtualPath(const std::string& path)
    {
        // Check for URL schemes
        if (path.find("://") != std::string::npos)
        {
            return true;
        }

        // Check for GDAL virtual file systems
        if (STARTS_WITH_CI(path.c_str(), "/vsi"))
        {
            return true;
        }

        return false;
    }

    std::string PathParser::Resolve(const std::string& path)
    {
        if (path.empty() || IsUrlOrVirtualPath(path))
            return path;

        std::string resolved = path;
        if (CPLIsFilenameRelative(path.c_str()))
        {
            char* pszCurDir = CPLGetCurrentDir();
            if (pszCurDir)
            {
                resolved = CPLFormFilename(pszCurDir, path.c_str(), nullptr);
                CPLFree(pszCurDir);
            }
        }
        NormalizeWindowsPath(resolved);
        return resolved;
    }

    std::string PathParser::FileIdentity(const std::string& datasetName)
    {
        // The whole name may itself be a file; try that before parsing it.
        std::string filePath = datasetName;
        VSIStatBufL sStat;
        bool bStat = VSIStatL(filePath.c_str(), &sStat) == 0;
        if (!bStat)
        {
            ParsedPath parsed = Parse(datasetName);
            filePath = parsed.mainPath;
            bStat = VSIStatL(filePath.c_str(), &sStat) == 0;
        }

        std::string identity = Resolve(filePath);
        if (bStat)
        {
            identity += CPLSPrintf("|size=%llu|mtime=%lld",
                                   static_cast<unsigned long long>(sStat.st_size),
                                   static_cast<long long>(sStat.st_mtime));
        }
        return identity;
    }

    bool PathParser::MatchWildcard(const std::string& pattern, const std::string& text)
    {
        size_t p = 0;
        size_t t = 0;
        size_t starPos = std::string::npos;
        size_t matchPos = 0;

        while (t < text.size())
        {
            if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t]))
            {
                p++;
                t++;
            }
            else if (p < pattern.size() && pattern[p] == '*')
            {
                starPos = p++;
                matchPos = t;
            }
            else if (starPos != std::string::npos)
            {
                p = starPos + 1;
                t = ++matchPos;
            }
            else
            {
                return false;
            }
        }

        while (p < pattern.size() && pattern[p] == '*')
            p++;
        return p == pattern.size();
    }

    void PathParser::NormalizeWindowsPath(std::string& path)
    {
#ifdef _WIN32
        // Replace forward slashes with backslashes
        std::replace(path.begin(), path.end(), '/', '\\');

        // Remove leading slash if present in Windows paths (e.g., /C:/...)
        if (!path.empty() && path[0] == '\\' &&
            path.length() > 2 && path[1] != '\\' && path[2] == ':')
        {
            path = path.substr(1);
        }
#endif

        // Remove trailing separator unless it is the root
        while (path.length() > 1 && (path.back() == '/' || path.back() == '\\'))
        {
            path.pop_back();
        }
    }
}  // namespace PathUtils
}  // namespace GeoGrid
