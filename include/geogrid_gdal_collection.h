#pragma once
#include <string>

#include "cpl_string.h"
#include "geogrid_collection.h"

namespace GeoGrid
{
/**
 * @brief Members of one GDAL dataset
 *
 * Raster bands are listed as grids "band1", "band2"..., vector layers as
 * tables named after the layer, and the entries of the SUBDATASETS metadata
 * domain (NetCDF variables, HDF arrays) as nested collections named after
 * the subdataset component. Listing opens the dataset for the duration of
 * the scan only.
 */
class GEOGRID_DLL GDALDatasetCollection : public Collection
{
  public:
    explicit GDALDatasetCollection(const std::string& datasetName,
                                   CSLConstList papszOpenOptions = nullptr);

    const std::string& GetDatasetName() const { return mDatasetName; }

    std::string GetDisplayName() const override { return mDatasetName; }
    std::string GetIdentity() const override;

  protected:
    /**
     * @throws BackendUnavailableError when the dataset cannot be opened
     */
    std::unique_ptr<MemberCursor> OpenCursor() const override;
    Member OpenMember(const MemberDescriptor& descriptor) const override;

  private:
    std::string mDatasetName;
    CPLStringList mOpenOptions;
};

/**
 * @brief A directory tree, read through GDAL's virtual file layer
 *
 * Sub-directories are nested DirectoryCollections; files some GDAL driver
 * identifies are GDALDatasetCollections; everything else is skipped.
 * Members carry the attributes "name", "extension" and, for files, "driver".
 * The identity is the (device, inode) pair of the directory where the file
 * system reports one, so a symbolic link back to an ancestor is recognised
 * by Traverse().
 */
class GEOGRID_DLL DirectoryCollection : public Collection
{
  public:
    /**
     * @param papszOpenOptions Passed on to the datasets found in the tree
     * @throws BackendUnavailableError if path is not a readable directory
     */
    explicit DirectoryCollection(const std::string& path, CSLConstList papszOpenOptions = nullptr);

    const std::string& GetPath() const { return mPath; }

    std::string GetDisplayName() const override { return mPath; }
    std::string GetIdentity() const override { return mIdentity; }

  protected:
    std::unique_ptr<MemberCursor> OpenCursor() const override;
    Member OpenMember(const MemberDescriptor& descriptor) const override;
    bool FindDescriptor(const std::string& identifier, MemberDescriptor& descriptor) const override;

  private:
    std::string mPath;
    std::string mIdentity;
    CPLStringList mOpenOptions;
};
}  // namespace GeoGrid
