#include "geogrid_ogr_table.h"

#include <cmath>
#include <stdexcept>
#include <utility>

#include "cpl_error.h"
#include "gdal_priv.h"
#include "geogrid_errors.h"
#include "geogrid_path_utils.h"
#include "geogrid_performance.h"
#include "ogrsf_frmts.h"

namespace GeoGrid
{
namespace
{
/**
 * @brief Dataset handle and the layer taken from it
 */
struct LayerHandle
{
    GDALDatasetUniquePtr poDS;
    OGRLayer* poLayer = nullptr;
};

LayerHandle OpenLayer(const std::string& datasetName,
                      const std::string& layerName,
                      CSLConstList papszOpenOptions)
{
    LayerHandle handle;
    {
        CPLErrorHandlerPusher quiet(CPLQuietErrorHandler);
        CPLErrorReset();
        handle.poDS.reset(GDALDataset::Open(datasetName.c_str(),
                                            GDAL_OF_VECTOR | GDAL_OF_READONLY,
                                            nullptr, papszOpenOptions, nullptr));
    }
    if (!handle.poDS)
        ErrorHandler::ThrowBackendError("OGR", datasetName, "Cannot open vector dataset");

    handle.poLayer = layerName.empty() ? handle.poDS->GetLayer(0)
                                       : handle.poDS->GetLayerByName(layerName.c_str());
    if (!handle.poLayer)
        throw BackendUnavailableError("OGR", datasetName,
                                      layerName.empty() ? "Dataset has no layer"
                                                        : "No layer named '" + layerName + "'",
                                      CPLE_IllegalArg);
    return handle;
}

// Quote chars inside the text are doubled
std::string Quote(const std::string& text, char chQuote)
{
    std::string quoted(1, chQuote);
    for (char c : text)
    {
        if (c == chQuote)
            quoted += chQuote;
        quoted += c;
    }
    return quoted + chQuote;
}

std::string BuildAttributeFilter(const std::vector<Field>& fields,
                                 const std::vector<Table::Condition>& conditions)
{
    std::string filter;
    for (const Table::Condition& condition : conditions)
    {
        if (!filter.empty())
            filter += " AND ";
        filter += Quote(fields[condition.first].name, '"');

        const FieldValue& value = condition.second;
        switch (value.GetKind())
        {
            case FieldValue::Kind::Null:
                filter += " IS NULL";
                break;
            case FieldValue::Kind::String:
                filter += " = " + Quote(value.AsString(), '\'');
                break;
            case FieldValue::Kind::Real:
                // OGR SQL has no literal for NaN or infinities
                if (!std::isfinite(value.AsReal()))
                    throw std::invalid_argument("Cannot filter field '" + fields[condition.first].name +
                                                "' on non-finite value " + value.ToString());
                filter += " = " + value.ToString();
                break;
            case FieldValue::Kind::Integer:
                filter += " = " + value.ToString();
                break;
        }
    }
    return filter;
}

FieldValue ReadFieldValue(OGRFeature& feature, int iField, OGRFieldType eType)
{
    if (!feature.IsFieldSetAndNotNull(iField))
        return FieldValue();

    switch (eType)
    {
        case OFTInteger:
        case OFTInteger64:
            return FieldValue::Integer(feature.GetFieldAsInteger64(iField));
        case OFTReal:
            return FieldValue::Real(feature.GetFieldAsDouble(iField));
        default:
            return FieldValue::String(feature.GetFieldAsString(iField));
    }
}

class OGRSelectCursor : public SelectCursor
{
  public:
    OGRSelectCursor(LayerHandle handle, std::vector<Field> fields)
        : mHandle(std::move(handle)), mFields(std::move(fields))
    {
    }

    bool Next(Row& row) override
    {
        OGRFeatureUniquePtr poFeature(mHandle.poLayer->GetNextFeature());
        if (!poFeature)
            return false;

        // Field order of the layer can differ from the cached definition if
        // the file changed; look fields up by name.
        OGRFeatureDefn* poDefn = poFeature->GetDefnRef();
        row.assign(mFields.size(), FieldValue());
        for (size_t i = 0; i < mFields.size(); i++)
        {
            const int iField = poDefn->GetFieldIndex(mFields[i].name.c_str());
            if (iField >= 0)
                row[i] = ReadFieldValue(*poFeature, iField, mFields[i].eType);
        }
        return true;
    }

  private:
    LayerHandle mHandle;
    std::vector<Field> mFields;
};
}  // namespace

OGRTable::OGRTable(const std::string& datasetName,
                   const std::string& layerName,
                   CSLConstList papszOpenOptions)
    : mDatasetName(datasetName), mLayerName(layerName), mOpenOptions(CSLDuplicate(papszOpenOptions))
{
}

std::string OGRTable::GetDisplayName() const
{
    return mLayerName.empty() ? mDatasetName : mDatasetName + ":" + mLayerName;
}

std::string OGRTable::GetIdentity() const
{
    std::string identity = "ogr:" + PathUtils::PathParser::FileIdentity(mDatasetName) +
                           "|layer=" + mLayerName;
    for (int i = 0; i < mOpenOptions.Count(); i++)
        identity += std::string("|oo:") + mOpenOptions[i];
    return identity;
}

const std::vector<Field>& OGRTable::GetFields() const
{
    std::lock_guard<std::mutex> lock(mMutex);
    if (mFieldsLoaded)
        return mFields;

    LayerHandle handle = OpenLayer(mDatasetName, mLayerName, mOpenOptions.List());
    OGRFeatureDefn* poDefn = handle.poLayer->GetLayerDefn();

    std::vector<Field> fields;
    for (int i = 0; i < poDefn->GetFieldCount(); i++)
    {
        const OGRFieldDefn* poField = poDefn->GetFieldDefn(i);
        Field field;
        field.name = poField->GetNameRef();
        field.eType = poField->GetType();
        fields.push_back(field);
    }

    CPLDebug(ErrorHandler::DEBUG_KEY, "Layer %s has %d fields",
             GetDisplayName().c_str(), static_cast<int>(fields.size()));

    mFields = std::move(fields);
    mFieldsLoaded = true;
    return mFields;
}

size_t OGRTable::GetRowCount() const
{
    LayerHandle handle = OpenLayer(mDatasetName, mLayerName, mOpenOptions.List());
    const GIntBig nCount = handle.poLayer->GetFeatureCount(TRUE);
    if (nCount < 0)
        ErrorHandler::ThrowBackendError("OGR", mDatasetName, "Cannot count features");
    return static_cast<size_t>(nCount);
}

std::unique_ptr<SelectCursor> OGRTable::ISelect(const std::vector<Condition>& conditions) const
{
    GEOGRID_PERF_TIMER("OGRTable::Select");

    const std::vector<Field>& fields = GetFields();
    const std::string filter = BuildAttributeFilter(fields, conditions);
    LayerHandle handle = OpenLayer(mDatasetName, mLayerName, mOpenOptions.List());

    if (!filter.empty())
    {
        CPLErrorHandlerPusher quiet(CPLQuietErrorHandler);
        CPLErrorReset();
        if (handle.poLayer->SetAttributeFilter(filter.c_str()) != OGRERR_NONE)
            ErrorHandler::ThrowBackendError("OGR", mDatasetName, "Cannot apply filter " + filter);
    }
    handle.poLayer->ResetReading();

    return std::unique_ptr<SelectCursor>(new OGRSelectCursor(std::move(handle), fields));
}
}  // namespace GeoGrid
