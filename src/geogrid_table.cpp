#include "geogrid_table.h"

#include <atomic>
#include <stdexcept>

#include "cpl_string.h"
#include "geogrid_errors.h"
#include "geogrid_types.h"

namespace GeoGrid
{
// ============================================================================
// FieldValue
// ============================================================================

FieldValue FieldValue::Integer(int64_t value)
{
    FieldValue result;
    result.mKind = Kind::Integer;
    result.mInteger = value;
    return result;
}

FieldValue FieldValue::Real(double value)
{
    FieldValue result;
    result.mKind = Kind::Real;
    result.mReal = value;
    return result;
}

FieldValue FieldValue::String(const std::string& value)
{
    FieldValue result;
    result.mKind = Kind::String;
    result.mString = value;
    return result;
}

int64_t FieldValue::AsInteger() const
{
    if (mKind == Kind::Integer)
        return mInteger;
    if (mKind == Kind::Real)
        return static_cast<int64_t>(mReal);
    throw std::logic_error("Field value is not numeric");
}

double FieldValue::AsReal() const
{
    if (mKind == Kind::Real)
        return mReal;
    if (mKind == Kind::Integer)
        return static_cast<double>(mInteger);
    throw std::logic_error("Field value is not numeric");
}

const std::string& FieldValue::AsString() const
{
    if (mKind != Kind::String)
        throw std::logic_error("Field value is not a string");
    return mString;
}

std::string FieldValue::ToString() const
{
    switch (mKind)
    {
        case Kind::Null:
            return "NULL";
        case Kind::Integer:
            return CPLSPrintf(CPL_FRMT_GIB, static_cast<GIntBig>(mInteger));
        case Kind::Real:
            return CPLSPrintf("%.17g", mReal);
        case Kind::String:
            return mString;
    }
    return std::string();
}

bool FieldValue::operator==(const FieldValue& other) const
{
    if (mKind == Kind::Integer && other.mKind == Kind::Integer)
        return mInteger == other.mInteger;

    const bool numeric = mKind == Kind::Integer || mKind == Kind::Real;
    const bool otherNumeric = other.mKind == Kind::Integer || other.mKind == Kind::Real;
    if (numeric && otherNumeric)
        return NoDataEquals(AsReal(), other.AsReal());

    if (mKind != other.mKind)
        return false;
    return mKind == Kind::Null || mString == other.mString;
}

// ============================================================================
// Table
// ============================================================================

SelectCursor::~SelectCursor() = default;

Table::~Table() = default;

int Table::GetFieldIndex(const std::string& name) const
{
    const std::vector<Field>& fields = GetFields();
    for (size_t i = 0; i < fields.size(); i++)
    {
        if (EQUAL(fields[i].name.c_str(), name.c_str()))
            return static_cast<int>(i);
    }
    return -1;
}

std::unique_ptr<SelectCursor> Table::Select(const std::map<std::string, FieldValue>& whereEquals) const
{
    std::vector<Condition> conditions;
    for (const auto& entry : whereEquals)
    {
        const int index = GetFieldIndex(entry.first);
        if (index < 0)
            throw NotFoundError("Table '" + GetDisplayName() + "' has no field '" + entry.first + "'");
        conditions.emplace_back(index, entry.second);
    }
    return ISelect(conditions);
}

// ============================================================================
// MemoryTable
// ============================================================================

namespace
{
class MemorySelectCursor : public SelectCursor
{
  public:
    MemorySelectCursor(std::vector<Row> rows, std::vector<Table::Condition> conditions)
        : mRows(std::move(rows)), mConditions(std::move(conditions))
    {
    }

    bool Next(Row& row) override
    {
        while (mNext < mRows.size())
        {
            const Row& candidate = mRows[mNext++];
            bool matches = true;
            for (const Table::Condition& condition : mConditions)
            {
                if (candidate[condition.first] != condition.second)
                {
                    matches = false;
                    break;
                }
            }
            if (matches)
            {
                row = candidate;
                return true;
            }
        }
        return false;
    }

  private:
    std::vector<Row> mRows;
    std::vector<Table::Condition> mConditions;
    size_t mNext = 0;
};

bool IsIntegerField(OGRFieldType eType)
{
    return eType == OFTInteger || eType == OFTInteger64;
}

bool AcceptsValue(const Field& field, const FieldValue& value)
{
    switch (value.GetKind())
    {
        case FieldValue::Kind::Null:
            return true;
        case FieldValue::Kind::Integer:
            return IsIntegerField(field.eType) || field.eType == OFTReal;
        case FieldValue::Kind::Real:
            return field.eType == OFTReal;
        case FieldValue::Kind::String:
            return !IsIntegerField(field.eType) && field.eType != OFTReal;
    }
    return false;
}
}  // namespace

MemoryTable::MemoryTable(const std::string& displayName, const std::vector<Field>& fields)
    : mDisplayName(displayName), mFields(fields)
{
    static std::atomic<unsigned long long> nextSerial{1};
    mIdentity = CPLSPrintf("memtable:%llu", nextSerial.fetch_add(1));

    for (size_t i = 0; i < fields.size(); i++)
    {
        if (fields[i].name.empty())
            throw std::invalid_argument("MemoryTable '" + displayName + "' has an unnamed field");
        for (size_t j = 0; j < i; j++)
        {
            if (EQUAL(fields[i].name.c_str(), fields[j].name.c_str()))
                throw std::invalid_argument("MemoryTable '" + displayName + "' repeats field '" +
                                            fields[i].name + "'");
        }
    }
}

void MemoryTable::AddRow(const Row& row)
{
    if (row.size() != mFields.size())
        throw std::invalid_argument(CPLSPrintf("Row has %d values, table '%s' has %d fields",
                                               static_cast<int>(row.size()), mDisplayName.c_str(),
                                               static_cast<int>(mFields.size())));

    Row stored(row);
    for (size_t i = 0; i < row.size(); i++)
    {
        if (!AcceptsValue(mFields[i], row[i]))
            throw std::invalid_argument("Value '" + row[i].ToString() + "' does not fit field '" +
                                        mFields[i].name + "' of table '" + mDisplayName + "'");
        if (mFields[i].eType == OFTReal && row[i].GetKind() == FieldValue::Kind::Integer)
            stored[i] = FieldValue::Real(row[i].AsReal());
    }

    std::lock_guard<std::mutex> lock(mMutex);
    mRows.push_back(std::move(stored));
}

size_t MemoryTable::GetRowCount() const
{
    std::lock_guard<std::mutex> lock(mMutex);
    return mRows.size();
}

std::unique_ptr<SelectCursor> MemoryTable::ISelect(const std::vector<Condition>& conditions) const
{
    // Cursors work on a snapshot so rows added later do not disturb them.
    std::vector<Row> snapshot;
    {
        std::lock_guard<std::mutex> lock(mMutex);
        snapshot = mRows;
    }
    return std::unique_ptr<SelectCursor>(new MemorySelectCursor(std::move(snapshot), conditions));
}
}  // namespace GeoGrid
