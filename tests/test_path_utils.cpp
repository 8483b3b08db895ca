#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "cpl_vsi.h"
#include "gdal.h"
#include "geogrid_path_utils.h"

using GeoGrid::PathUtils::PathParser;

/**
 * @brief Unit tests for GDAL dataset name parsing and file identities
 */

void testSubdatasetParsing()
{
    std::cout << "Testing subdataset name parsing..." << std::endl;

    struct TestCase
    {
        std::string input;
        std::string expectedPrefix;
        std::string expectedMain;
        std::string expectedSub;
    };

    std::vector<TestCase> testCases = {
        {"NETCDF:\"/data/sst.nc\":analysed_sst", "NETCDF", "/data/sst.nc", "analysed_sst"},
        {"NETCDF:/data/sst.nc:analysed_sst", "NETCDF", "/data/sst.nc", "analysed_sst"},
        {"HDF5:\"/vsimem/chl.h5\"://geophysical/chlor_a", "HDF5", "/vsimem/chl.h5", "//geophysical/chlor_a"},
        {"NETCDF:\"https://example.org/sst.nc\":sst", "NETCDF", "https://example.org/sst.nc", "sst"},
    };

    for (const auto& testCase : testCases)
    {
        const PathParser::ParsedPath parsed = PathParser::Parse(testCase.input);
        assert(parsed.isSubdataset);
        assert(parsed.driverPrefix == testCase.expectedPrefix);
        assert(parsed.mainPath == testCase.expectedMain);
        assert(parsed.subdatasetName == testCase.expectedSub);
        std::cout << "  ✓ " << testCase.input << std::endl;
    }
}

void testPlainPaths()
{
    std::cout << "Testing plain paths..." << std::endl;

    const std::vector<std::string> plain = {
        "/data/sst.tif",
        "relative/sst.tif",
        "https://example.org/sst.tif",
        "/vsicurl/https://example.org/sst.tif",
        "/vsimem/sst.tif",
    };

    for (const std::string& input : plain)
    {
        const PathParser::ParsedPath parsed = PathParser::Parse(input);
        assert(!parsed.isSubdataset);
        assert(parsed.driverPrefix.empty());
        assert(parsed.mainPath == input);
    }

    assert(PathParser::Parse("https://example.org/sst.tif").isVirtualPath);
    assert(PathParser::Parse("/vsimem/sst.tif").isVirtualPath);
    assert(!PathParser::Parse("/data/sst.tif").isVirtualPath);

    // A drive letter is not a driver prefix
    const PathParser::ParsedPath drive = PathParser::Parse("C:/data/sst.tif");
    assert(drive.driverPrefix.empty());
    assert(!drive.isSubdataset);

    std::cout << "  ✓ Files, URLs and drive letters are left whole" << std::endl;
}

void testWildcards()
{
    std::cout << "Testing wildcard matching..." << std::endl;

    assert(PathParser::MatchWildcard("*.tif", "sst_2020.tif"));
    assert(!PathParser::MatchWildcard("*.tif", "sst_2020.tiff"));
    assert(PathParser::MatchWildcard("sst_20??_*", "sst_2021_01"));
    assert(!PathParser::MatchWildcard("sst_20??_*", "sst_201_01"));
    assert(PathParser::MatchWildcard("*", ""));
    assert(PathParser::MatchWildcard("", ""));
    assert(!PathParser::MatchWildcard("", "x"));
    assert(PathParser::MatchWildcard("a*b*c", "a123b456c"));
    assert(!PathParser::MatchWildcard("a*b*c", "a123b456"));

    std::cout << "  ✓ '*' and '?' match like a shell" << std::endl;
}

void testFileIdentity()
{
    std::cout << "Testing file identities..." << std::endl;

    const std::string path = "/vsimem/geogrid_test_identity.bin";
    const std::string missing = "/vsimem/geogrid_test_missing.bin";

    VSILFILE* fp = VSIFOpenL(path.c_str(), "wb");
    assert(fp != nullptr);
    VSIFWriteL("abc", 1, 3, fp);
    VSIFCloseL(fp);

    const std::string before = PathParser::FileIdentity(path);
    assert(before.find("size=3") != std::string::npos);
    assert(PathParser::FileIdentity(path) == before);
    assert(PathParser::FileIdentity("NETCDF:\"" + path + "\":sst") == before);

    fp = VSIFOpenL(path.c_str(), "wb");
    assert(fp != nullptr);
    VSIFWriteL("abcdef", 1, 6, fp);
    VSIFCloseL(fp);
    assert(PathParser::FileIdentity(path) != before);

    assert(PathParser::FileIdentity(missing) == missing);

    VSIUnlink(path.c_str());

    std::cout << "  ✓ Identities follow file content changes" << std::endl;
}

int main()
{
    std::cout << "=== Path Utility Tests ===" << std::endl << std::endl;

    GDALAllRegister();

    try
    {
        testSubdatasetParsing();
        testPlainPaths();
        testWildcards();
        testFileIdentity();

        std::cout << std::endl << "🎉 All path utility tests passed!" << std::endl;
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
