#include "geogrid_gdal_collection.h"

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <utility>
#include <vector>

#include "cpl_conv.h"
#include "cpl_error.h"
#include "cpl_vsi.h"
#include "gdal_priv.h"
#include "geogrid_errors.h"
#include "geogrid_gdal_grid.h"
#include "geogrid_ogr_table.h"
#include "geogrid_path_utils.h"
#include "geogrid_performance.h"
#include "ogrsf_frmts.h"

namespace GeoGrid
{
namespace
{
class DescriptorListCursor : public MemberCursor
{
  public:
    explicit DescriptorListCursor(std::vector<MemberDescriptor> descriptors)
        : mDescriptors(std::move(descriptors))
    {
    }

    bool Next(MemberDescriptor& descriptor) override
    {
        if (mNext >= mDescriptors.size())
            return false;
        descriptor = mDescriptors[mNext++];
        return true;
    }

  private:
    std::vector<MemberDescriptor> mDescriptors;
    size_t mNext = 0;
};
}  // namespace

// ============================================================================
// GDALDatasetCollection
// ============================================================================

GDALDatasetCollection::GDALDatasetCollection(const std::string& datasetName, CSLConstList papszOpenOptions)
    : mDatasetName(datasetName), mOpenOptions(CSLDuplicate(papszOpenOptions))
{
}

std::string GDALDatasetCollection::GetIdentity() const
{
    std::string identity = "gdalds:" + PathUtils::PathParser::FileIdentity(mDatasetName);
    const PathUtils::PathParser::ParsedPath parsed = PathUtils::PathParser::Parse(mDatasetName);
    if (parsed.isSubdataset)
        identity += "|" + parsed.driverPrefix + ":" + parsed.subdatasetName;
    for (int i = 0; i < mOpenOptions.Count(); i++)
        identity += std::string("|oo:") + mOpenOptions[i];
    return identity;
}

std::unique_ptr<MemberCursor> GDALDatasetCollection::OpenCursor() const
{
    GEOGRID_PERF_TIMER("GDALDatasetCollection::List");

    GDALDatasetUniquePtr poDS;
    {
        CPLErrorHandlerPusher quiet(CPLQuietErrorHandler);
        CPLErrorReset();
        poDS.reset(GDALDataset::Open(mDatasetName.c_str(),
                                     GDAL_OF_RASTER | GDAL_OF_VECTOR | GDAL_OF_READONLY,
                                     nullptr, mOpenOptions.List(), nullptr));
    }
    if (!poDS)
        ErrorHandler::ThrowBackendError("GDAL", mDatasetName, "cannot open dataset");

    std::vector<MemberDescriptor> descriptors;

    for (int iBand = 1; iBand <= poDS->GetRasterCount(); iBand++)
    {
        GDALRasterBand* poBand = poDS->GetRasterBand(iBand);
        MemberDescriptor descriptor;
        descriptor.identifier = CPLSPrintf("band%d", iBand);
        descriptor.kind = MemberKind::Grid;
        descriptor.attributes["band"] = CPLSPrintf("%d", iBand);
        descriptor.attributes["dataType"] = GDALGetDataTypeName(poBand->GetRasterDataType());
        const char* pszDescription = poBand->GetDescription();
        if (pszDescription && pszDescription[0] != '\0')
            descriptor.attributes["description"] = pszDescription;
        descriptors.push_back(descriptor);
    }

    for (int iLayer = 0; iLayer < poDS->GetLayerCount(); iLayer++)
    {
        OGRLayer* poLayer = poDS->GetLayer(iLayer);
        if (!poLayer)
            continue;
        MemberDescriptor descriptor;
        descriptor.identifier = poLayer->GetName();
        descriptor.kind = MemberKind::Table;
        descriptor.attributes["geometryType"] = OGRGeometryTypeToName(poLayer->GetGeomType());
        descriptors.push_back(descriptor);
    }

    CSLConstList papszSubdatasets = poDS->GetMetadata("SUBDATASETS");
    for (int i = 1;; i++)
    {
        const char* pszName = CSLFetchNameValue(papszSubdatasets, CPLSPrintf("SUBDATASET_%d_NAME", i));
        if (!pszName)
            break;
        const std::string name = pszName;
        const char* pszDesc = CSLFetchNameValue(papszSubdatasets, CPLSPrintf("SUBDATASET_%d_DESC", i));

        const PathUtils::PathParser::ParsedPath parsed = PathUtils::PathParser::Parse(name);
        MemberDescriptor descriptor;
        descriptor.identifier = parsed.subdatasetName.empty() ? name : parsed.subdatasetName;
        descriptor.kind = MemberKind::Collection;
        descriptor.attributes["name"] = name;
        if (pszDesc)
            descriptor.attributes["description"] = pszDesc;
        descriptors.push_back(descriptor);
    }

    CPLDebug(ErrorHandler::DEBUG_KEY, "%s lists %d members",
             mDatasetName.c_str(), static_cast<int>(descriptors.size()));

    return std::unique_ptr<MemberCursor>(new DescriptorListCursor(std::move(descriptors)));
}

Member GDALDatasetCollection::OpenMember(const MemberDescriptor& descriptor) const
{
    switch (descriptor.kind)
    {
        case MemberKind::Grid:
        {
            auto it = descriptor.attributes.find("band");
            const std::string number = it != descriptor.attributes.end()
                                           ? it->second
                                           : descriptor.identifier.substr(std::min<size_t>(4, descriptor.identifier.size()));
            const int nBand = atoi(number.c_str());
            if (nBand < 1)
                throw NotFoundError("'" + descriptor.identifier + "' is not a band of " + mDatasetName);
            return Member(descriptor, GridPtr(std::make_shared<GDALBandGrid>(mDatasetName, nBand,
                                                                              mOpenOptions.List())));
        }
        case MemberKind::Table:
            return Member(descriptor, TablePtr(std::make_shared<OGRTable>(mDatasetName, descriptor.identifier,
                                                                           mOpenOptions.List())));
        case MemberKind::Collection:
        {
            auto it = descriptor.attributes.find("name");
            if (it == descriptor.attributes.end())
                throw NotFoundError("Subdataset '" + descriptor.identifier + "' of " + mDatasetName +
                                    " has no GDAL name");
            return Member(descriptor, CollectionPtr(std::make_shared<GDALDatasetCollection>(
                                          it->second, mOpenOptions.List())));
        }
    }
    throw NotFoundError("Unknown member kind for '" + descriptor.identifier + "'");
}

// ============================================================================
// DirectoryCollection
// ============================================================================

namespace
{
/**
 * @brief Describe one directory entry; false when it is not a member
 */
bool DescribeEntry(const std::string& directory, const std::string& name, MemberDescriptor& descriptor)
{
    if (name.empty() || name == "." || name == "..")
        return false;

    const std::string fullPath = CPLFormFilename(directory.c_str(), name.c_str(), nullptr);

    VSIStatBufL sStat;
    if (VSIStatL(fullPath.c_str(), &sStat) != 0)
    {
        // Dangling links and entries removed since the listing are skipped.
        CPLDebug(ErrorHandler::DEBUG_KEY, "Cannot stat %s, skipping", fullPath.c_str());
        return false;
    }

    descriptor = MemberDescriptor();
    descriptor.identifier = name;
    descriptor.kind = MemberKind::Collection;
    descriptor.attributes["name"] = name;

    if (VSI_ISDIR(sStat.st_mode))
    {
        descriptor.attributes["type"] = "directory";
        return true;
    }

    if (!VSI_ISREG(sStat.st_mode))
        return false;

    GDALDriverH hDriver = nullptr;
    {
        CPLErrorHandlerPusher quiet(CPLQuietErrorHandler);
        hDriver = GDALIdentifyDriver(fullPath.c_str(), nullptr);
        CPLErrorReset();
    }
    if (!hDriver)
        return false;

    descriptor.attributes["type"] = "dataset";
    descriptor.attributes["extension"] = CPLGetExtension(name.c_str());
    descriptor.attributes["driver"] = GDALGetDriverShortName(hDriver);
    return true;
}

class DirectoryCursor : public MemberCursor
{
  public:
    DirectoryCursor(const std::string& directory, std::vector<std::string> entries)
        : mDirectory(directory), mEntries(std::move(entries))
    {
    }

    bool Next(MemberDescriptor& descriptor) override
    {
        while (mNext < mEntries.size())
        {
            if (DescribeEntry(mDirectory, mEntries[mNext++], descriptor))
                return true;
        }
        return false;
    }

  private:
    std::string mDirectory;
    std::vector<std::string> mEntries;
    size_t mNext = 0;
};
}  // namespace

DirectoryCollection::DirectoryCollection(const std::string& path, CSLConstList papszOpenOptions)
    : mPath(path), mOpenOptions(CSLDuplicate(papszOpenOptions))
{
    VSIStatBufL sStat;
    if (VSIStatL(path.c_str(), &sStat) != 0)
        throw BackendUnavailableError("VSI", path, "no such directory", CPLE_OpenFailed);
    if (!VSI_ISDIR(sStat.st_mode))
        throw BackendUnavailableError("VSI", path, "not a directory", CPLE_OpenFailed);

    // In-memory and remote file systems report no inode; fall back to the path.
    if (sStat.st_ino != 0)
        mIdentity = CPLSPrintf("dir:%llu:%llu",
                               static_cast<unsigned long long>(sStat.st_dev),
                               static_cast<unsigned long long>(sStat.st_ino));
    else
        mIdentity = "dir:" + PathUtils::PathParser::Resolve(path);
}

std::unique_ptr<MemberCursor> DirectoryCollection::OpenCursor() const
{
    CPLStringList aosEntries(VSIReadDir(mPath.c_str()));
    if (aosEntries.List() == nullptr)
    {
        VSIStatBufL sStat;
        if (VSIStatL(mPath.c_str(), &sStat) != 0 || !VSI_ISDIR(sStat.st_mode))
            throw BackendUnavailableError("VSI", mPath, "directory is no longer readable", CPLE_OpenFailed);
    }

    std::vector<std::string> entries;
    for (int i = 0; i < aosEntries.Count(); i++)
        entries.push_back(aosEntries[i]);
    std::sort(entries.begin(), entries.end());

    return std::unique_ptr<MemberCursor>(new DirectoryCursor(mPath, std::move(entries)));
}

bool DirectoryCollection::FindDescriptor(const std::string& identifier, MemberDescriptor& descriptor) const
{
    if (identifier.find('/') != std::string::npos || identifier.find('\\') != std::string::npos)
        return false;
    return DescribeEntry(mPath, identifier, descriptor);
}

Member DirectoryCollection::OpenMember(const MemberDescriptor& descriptor) const
{
    const std::string fullPath = CPLFormFilename(mPath.c_str(), descriptor.identifier.c_str(), nullptr);

    auto it = descriptor.attributes.find("type");
    if (it != descriptor.attributes.end() && it->second == "directory")
        return Member(descriptor, CollectionPtr(std::make_shared<DirectoryCollection>(fullPath,
                                                                                       mOpenOptions.List())));

    return Member(descriptor, CollectionPtr(std::make_shared<GDALDatasetCollection>(fullPath,
                                                                                     mOpenOptions.List())));
}
}  // namespace GeoGrid
