#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "cpl_vsi.h"
#include "gdal.h"
#include "geogrid_errors.h"
#include "geogrid_ogr_table.h"
#include "geogrid_table.h"
#include "test_utils.h"

using namespace GeoGrid;

static void WriteVsiFile(const std::string& path, const std::string& content)
{
    VSILFILE* fp = VSIFOpenL(path.c_str(), "wb");
    if (!fp)
        throw std::runtime_error("Cannot create " + path);
    const size_t nWritten = VSIFWriteL(content.data(), 1, content.size(), fp);
    VSIFCloseL(fp);
    if (nWritten != content.size())
        throw std::runtime_error("Short write to " + path);
}

static std::vector<Row> ReadAllRows(SelectCursor& cursor)
{
    std::vector<Row> rows;
    Row row;
    while (cursor.Next(row))
        rows.push_back(row);
    return rows;
}

void testFieldValues()
{
    std::cout << "Testing field values..." << std::endl;

    assert(FieldValue().IsNull());
    assert(FieldValue::Integer(3) == FieldValue::Real(3.0));
    assert(FieldValue::Integer(3) != FieldValue::String("3"));
    assert(FieldValue() == FieldValue());
    assert(FieldValue() != FieldValue::Integer(0));
    assert(FieldValue::Real(std::numeric_limits<double>::quiet_NaN()) ==
           FieldValue::Real(std::numeric_limits<double>::quiet_NaN()));

    assert(FieldValue::Integer(-7).ToString() == "-7");
    assert(FieldValue::Real(0.5).ToString() == "0.5");
    assert(FieldValue().ToString() == "NULL");
    assert(FieldValue::Real(2.9).AsInteger() == 2);

    assert(Throws<std::logic_error>([] { FieldValue::String("x").AsReal(); }));
    assert(Throws<std::logic_error>([] { FieldValue::Integer(1).AsString(); }));

    std::cout << "  ✓ Numeric values compare across kinds" << std::endl;
}

void testMemoryTable()
{
    std::cout << "Testing MemoryTable..." << std::endl;

    MemoryTable table("stations", {{"id", OFTInteger}, {"name", OFTString}, {"depth", OFTReal}});
    table.AddRow({FieldValue::Integer(1), FieldValue::String("Brest"), FieldValue::Real(12.5)});
    table.AddRow({FieldValue::Integer(2), FieldValue::String("Roscoff"), FieldValue::Integer(30)});
    table.AddRow({FieldValue::Integer(3), FieldValue::String("Brest"), FieldValue()});

    assert(table.GetRowCount() == 3);
    assert(table.GetFieldIndex("NAME") == 1);
    assert(table.GetFieldIndex("missing") == -1);

    std::unique_ptr<SelectCursor> all = table.Select();
    const std::vector<Row> rows = ReadAllRows(*all);
    assert(rows.size() == 3);
    assert(rows[1][2].GetKind() == FieldValue::Kind::Real);
    assert(rows[1][2].AsReal() == 30.0);
    assert(rows[2][2].IsNull());

    std::unique_ptr<SelectCursor> brest = table.Select({{"name", FieldValue::String("Brest")}});
    assert(ReadAllRows(*brest).size() == 2);

    std::unique_ptr<SelectCursor> deep = table.Select({{"depth", FieldValue::Integer(30)}});
    const std::vector<Row> deepRows = ReadAllRows(*deep);
    assert(deepRows.size() == 1);
    assert(deepRows[0][0].AsInteger() == 2);

    std::unique_ptr<SelectCursor> unknownDepth = table.Select({{"depth", FieldValue()}});
    assert(ReadAllRows(*unknownDepth).size() == 1);

    assert(Throws<NotFoundError>([&] { table.Select({{"nope", FieldValue::Integer(1)}}); }));
    assert(Throws<std::invalid_argument>([&] { table.AddRow({FieldValue::Integer(4)}); }));
    assert(Throws<std::invalid_argument>(
        [&] { table.AddRow({FieldValue::String("4"), FieldValue::String("x"), FieldValue()}); }));
    assert(Throws<std::invalid_argument>([] { MemoryTable("dup", {{"a", OFTString}, {"A", OFTInteger}}); }));

    // Open cursors keep their snapshot
    std::unique_ptr<SelectCursor> snapshot = table.Select();
    table.AddRow({FieldValue::Integer(4), FieldValue::String("Morlaix"), FieldValue()});
    assert(ReadAllRows(*snapshot).size() == 3);
    assert(table.GetRowCount() == 4);

    std::cout << "  ✓ Rows are typed and selectable" << std::endl;
}

void testOGRTable()
{
    std::cout << "Testing OGRTable over a CSV layer..." << std::endl;

    const std::string csv = "/vsimem/geogrid_test_table/stations.csv";
    WriteVsiFile(csv,
                 "id,name,depth\n"
                 "1,Brest,12.5\n"
                 "2,Roscoff,30\n"
                 "3,O'Brien,\n");
    WriteVsiFile("/vsimem/geogrid_test_table/stations.csvt", "Integer,String,Real\n");

    OGRTable table(csv);
    const std::vector<Field>& fields = table.GetFields();
    assert(fields.size() == 3);
    assert(fields[0].name == "id");
    assert(fields[0].eType == OFTInteger);
    assert(fields[2].eType == OFTReal);
    assert(table.GetRowCount() == 3);
    assert(table.GetIdentity() == OGRTable(csv, "").GetIdentity());
    assert(table.GetIdentity() != OGRTable(csv, "stations").GetIdentity());

    std::unique_ptr<SelectCursor> all = table.Select();
    const std::vector<Row> rows = ReadAllRows(*all);
    assert(rows.size() == 3);
    assert(rows[0][1].AsString() == "Brest");
    assert(rows[1][2].AsReal() == 30.0);
    assert(rows[2][2].IsNull());

    std::unique_ptr<SelectCursor> quoted = table.Select({{"name", FieldValue::String("O'Brien")}});
    const std::vector<Row> quotedRows = ReadAllRows(*quoted);
    assert(quotedRows.size() == 1);
    assert(quotedRows[0][0].AsInteger() == 3);

    std::unique_ptr<SelectCursor> byId = table.Select({{"ID", FieldValue::Integer(2)}});
    assert(ReadAllRows(*byId).size() == 1);

    OGRTable named(csv, "stations");
    assert(named.GetRowCount() == 3);

    OGRTable wrongLayer(csv, "buoys");
    assert(Throws<BackendUnavailableError>([&] { wrongLayer.GetRowCount(); }));

    OGRTable missing("/vsimem/geogrid_test_table/missing.csv");
    assert(Throws<BackendUnavailableError>([&] { missing.GetFields(); }));

    // Real conditions OGR SQL cannot express are rejected before any read
    assert(Throws<std::invalid_argument>(
        [&] { table.Select({{"depth", FieldValue::Real(std::numeric_limits<double>::quiet_NaN())}}); }));
    assert(Throws<std::invalid_argument>(
        [&] { table.Select({{"depth", FieldValue::Real(std::numeric_limits<double>::infinity())}}); }));
    std::unique_ptr<SelectCursor> byDepth = table.Select({{"depth", FieldValue::Real(12.5)}});
    assert(ReadAllRows(*byDepth).size() == 1);

    VSIRmdirRecursive("/vsimem/geogrid_test_table");

    std::cout << "  ✓ OGR layers read as tables" << std::endl;
}

void testOGRTableQuotedFieldName()
{
    std::cout << "Testing OGRTable filters on a field name with a quote..." << std::endl;

    const std::string csv = "/vsimem/geogrid_test_quoted/casts.csv";
    WriteVsiFile(csv,
                 "id,\"depth \"\"m\"\"\",label\n"
                 "1,5,shallow\n"
                 "2,250,deep\n"
                 "3,250,\"deep \"\"b\"\"\"\n");
    WriteVsiFile("/vsimem/geogrid_test_quoted/casts.csvt", "Integer,Integer,String\n");

    OGRTable table(csv);
    const std::vector<Field>& fields = table.GetFields();
    assert(fields.size() == 3);
    assert(fields[1].name == "depth \"m\"");

    std::unique_ptr<SelectCursor> deep = table.Select({{"depth \"m\"", FieldValue::Integer(250)}});
    const std::vector<Row> rows = ReadAllRows(*deep);
    assert(rows.size() == 2);
    assert(rows[0][0].AsInteger() == 2);
    assert(rows[1][2].AsString() == "deep \"b\"");

    std::unique_ptr<SelectCursor> both = table.Select(
        {{"depth \"m\"", FieldValue::Integer(250)}, {"label", FieldValue::String("deep \"b\"")}});
    assert(ReadAllRows(*both).size() == 1);

    VSIRmdirRecursive("/vsimem/geogrid_test_quoted");

    std::cout << "  ✓ Quotes in field names are escaped in the attribute filter" << std::endl;
}

int main()
{
    std::cout << "=== Table Tests ===" << std::endl << std::endl;

    GDALAllRegister();

    try
    {
        testFieldValues();
        testMemoryTable();
        testOGRTable();
        testOGRTableQuotedFieldName();

        std::cout << std::endl << "🎉 All table tests passed!" << std::endl;
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
