#pragma once
#include <mutex>
#include <string>
#include <vector>

#include "cpl_string.h"
#include "geogrid_table.h"

namespace GeoGrid
{
/**
 * @brief Table over one OGR vector layer (SQLite, GeoPackage, shapefile, CSV...)
 *
 * Field definitions are read once and cached. Every cursor opens its own
 * dataset handle, owned by the cursor, so concurrent selections never share
 * a GDAL handle and each handle is closed when its cursor is destroyed.
 */
class GEOGRID_DLL OGRTable : public Table
{
  public:
    /**
     * @param layerName Layer to read; empty selects the first layer
     */
    OGRTable(const std::string& datasetName,
             const std::string& layerName = std::string(),
             CSLConstList papszOpenOptions = nullptr);

    const std::string& GetDatasetName() const { return mDatasetName; }
    const std::string& GetLayerName() const { return mLayerName; }

    std::string GetDisplayName() const override;
    std::string GetIdentity() const override;

    /**
     * @throws BackendUnavailableError when the dataset or layer cannot be opened
     */
    const std::vector<Field>& GetFields() const override;
    size_t GetRowCount() const override;

  protected:
    /**
     * @throws std::invalid_argument on a NaN or infinite Real condition
     */
    std::unique_ptr<SelectCursor> ISelect(const std::vector<Condition>& conditions) const override;

  private:
    std::string mDatasetName;
    std::string mLayerName;
    CPLStringList mOpenOptions;

    mutable std::mutex mMutex;
    mutable bool mFieldsLoaded = false;
    mutable std::vector<Field> mFields;
};
}  // namespace GeoGrid
