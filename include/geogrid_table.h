#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "geogrid.h"
#include "ogr_core.h"

namespace GeoGrid
{
struct Field
{
    std::string name;
    OGRFieldType eType = OFTString;
};

/**
 * @brief One cell of a table row: null, integer, real or string
 */
class GEOGRID_DLL FieldValue
{
  public:
    enum class Kind
    {
        Null,
        Integer,
        Real,
        String
    };

    FieldValue() = default;

    static FieldValue Integer(int64_t value);
    static FieldValue Real(double value);
    static FieldValue String(const std::string& value);

    Kind GetKind() const { return mKind; }
    bool IsNull() const { return mKind == Kind::Null; }

    /**
     * @throws std::logic_error when the value is not of a numeric kind
     */
    int64_t AsInteger() const;
    double AsReal() const;
    const std::string& AsString() const;

    std::string ToString() const;

    /**
     * @brief Integers and reals compare numerically; NaN equals NaN
     */
    bool operator==(const FieldValue& other) const;
    bool operator!=(const FieldValue& other) const { return !(*this == other); }

  private:
    Kind mKind = Kind::Null;
    int64_t mInteger = 0;
    double mReal = 0.0;
    std::string mString;
};

using Row = std::vector<FieldValue>;

/**
 * @brief Forward-only iterator over the rows of a selection
 */
class GEOGRID_DLL SelectCursor
{
  public:
    virtual ~SelectCursor();

    /**
     * @brief Fetch the next row
     * @return false once the selection is exhausted
     */
    virtual bool Next(Row& row) = 0;
};

/**
 * @brief Read-only tabular dataset
 */
class GEOGRID_DLL Table
{
  public:
    using Condition = std::pair<int, FieldValue>;

    virtual ~Table();

    Table(const Table&) = delete;
    Table& operator=(const Table&) = delete;

    virtual std::string GetDisplayName() const = 0;
    virtual std::string GetIdentity() const = 0;
    virtual const std::vector<Field>& GetFields() const = 0;
    virtual size_t GetRowCount() const = 0;

    /**
     * @return Index of the named field, or -1
     */
    int GetFieldIndex(const std::string& name) const;

    /**
     * @brief Rows whose fields equal the given values
     * @throws NotFoundError when a condition names an unknown field
     */
    std::unique_ptr<SelectCursor> Select(const std::map<std::string, FieldValue>& whereEquals = {}) const;

  protected:
    Table() = default;

    virtual std::unique_ptr<SelectCursor> ISelect(const std::vector<Condition>& conditions) const = 0;
};

using TablePtr = std::shared_ptr<const Table>;

/**
 * @brief Table held in memory
 */
class GEOGRID_DLL MemoryTable : public Table
{
  public:
    MemoryTable(const std::string& displayName, const std::vector<Field>& fields);

    /**
     * @throws std::invalid_argument when the row does not match the fields
     */
    void AddRow(const Row& row);

    std::string GetDisplayName() const override { return mDisplayName; }
    std::string GetIdentity() const override { return mIdentity; }
    const std::vector<Field>& GetFields() const override { return mFields; }
    size_t GetRowCount() const override;

  protected:
    std::unique_ptr<SelectCursor> ISelect(const std::vector<Condition>& conditions) const override;

  private:
    std::string mDisplayName;
    std::vector<Field> mFields;
    std::string mIdentity;

    mutable std::mutex mMutex;
    std::vector<Row> mRows;
};
}  // namespace GeoGrid
