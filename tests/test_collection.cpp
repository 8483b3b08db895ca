#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "geogrid_collection.h"
#include "geogrid_errors.h"
#include "geogrid_table.h"
#include "test_utils.h"

using namespace GeoGrid;

static std::shared_ptr<MemoryCollection> MakeSeasonCollection()
{
    auto collection = std::make_shared<MemoryCollection>("sst");
    collection->AddGrid("sst_2020_01", MakeGrid2D("jan", 2, 2, GDT_Float32, Ramp(2, 2)),
                        {{"year", "2020"}, {"month", "01"}});
    collection->AddGrid("sst_2020_02", MakeGrid2D("feb", 2, 2, GDT_Float32, Ramp(2, 2, 10.0)),
                        {{"year", "2020"}, {"month", "02"}});
    collection->AddGrid("sst_2021_01", MakeGrid2D("jan21", 2, 2, GDT_Float32, Ramp(2, 2, 20.0)),
                        {{"year", "2021"}, {"month", "01"}});
    collection->AddTable("stations", std::make_shared<MemoryTable>(
                                         "stations", std::vector<Field>{{"id", OFTInteger}}));
    return collection;
}

void testListing()
{
    std::cout << "Testing member listing..." << std::endl;

    auto collection = MakeSeasonCollection();
    const std::vector<MemberDescriptor> all = collection->List().ToVector();
    assert(all.size() == 4);
    assert(all[0].identifier == "sst_2020_01");
    assert(all[3].kind == MemberKind::Table);

    // A sequence can be iterated more than once
    const MemberSequence grids = collection->List(MemberFilter().SetKind(MemberKind::Grid));
    size_t first = 0;
    for (const MemberDescriptor& descriptor : grids)
    {
        assert(descriptor.kind == MemberKind::Grid);
        first++;
    }
    size_t second = 0;
    for (auto it = grids.begin(); it != grids.end(); ++it)
        second++;
    assert(first == 3);
    assert(second == 3);

    // Two cursors over one sequence advance independently
    std::unique_ptr<MemberCursor> a = grids.Open();
    std::unique_ptr<MemberCursor> b = grids.Open();
    MemberDescriptor da;
    MemberDescriptor db;
    const bool aFirst = a->Next(da);
    const bool aSecond = a->Next(da);
    const bool bFirst = b->Next(db);
    assert(aFirst && aSecond && bFirst);
    assert(da.identifier == "sst_2020_02");
    assert(db.identifier == "sst_2020_01");

    std::cout << "  ✓ Listing is lazy and restartable" << std::endl;
}

void testFilters()
{
    std::cout << "Testing member filters..." << std::endl;

    auto collection = MakeSeasonCollection();
    assert(collection->List(MemberFilter::ByIdentifier("sst_2020_*")).ToVector().size() == 2);
    assert(collection->List(MemberFilter::ByIdentifier("sst_202?_01")).ToVector().size() == 2);
    assert(collection->List(MemberFilter::ByIdentifier("*")).ToVector().size() == 4);
    assert(collection->List(MemberFilter::ByIdentifier("nothing*")).ToVector().empty());

    MemberFilter january;
    january.AddAttribute("month", "01");
    assert(collection->List(january).ToVector().size() == 2);

    january.AddAttribute("year", "2021");
    const std::vector<MemberDescriptor> one = collection->List(january).ToVector();
    assert(one.size() == 1);
    assert(one[0].identifier == "sst_2021_01");

    MemberFilter tables;
    tables.SetKind(MemberKind::Table);
    assert(collection->List(tables).ToVector().size() == 1);

    std::cout << "  ✓ Wildcards, kinds and attributes combine" << std::endl;
}

void testResolve()
{
    std::cout << "Testing member resolution..." << std::endl;

    auto collection = MakeSeasonCollection();

    const Member feb = collection->Resolve("sst_2020_02");
    assert(feb.GetKind() == MemberKind::Grid);
    assert(feb.GetGrid()->GetDisplayName() == "feb");
    assert(Throws<std::logic_error>([&] { feb.GetTable(); }));

    const Member stations = collection->Resolve(MemberFilter().SetKind(MemberKind::Table));
    assert(stations.GetTable()->GetDisplayName() == "stations");

    assert(Throws<NotFoundError>([&] { collection->Resolve("sst_1999_01"); }));
    assert(Throws<NotFoundError>([&] { collection->Resolve(MemberFilter::ByIdentifier("x*")); }));
    assert(Throws<AmbiguousIdentifierError>([&] { collection->Resolve(MemberFilter::ByIdentifier("sst_*")); }));

    const std::vector<Member> grids = collection->ResolveAll(MemberFilter().SetKind(MemberKind::Grid));
    assert(grids.size() == 3);
    assert(grids[2].GetGrid()->ReadAll().GetValue(0) == 20.0);

    std::cout << "  ✓ Resolve reports missing and ambiguous members" << std::endl;
}

void testMembershipChecks()
{
    std::cout << "Testing membership checks..." << std::endl;

    MemoryCollection collection("checks");
    auto grid = MakeGrid2D("g", 1, 1, GDT_Byte, {1});
    collection.AddGrid("g", grid);

    assert(Throws<std::invalid_argument>([&] { collection.AddGrid("g", grid); }));
    assert(Throws<std::invalid_argument>([&] { collection.AddGrid("", grid); }));
    assert(Throws<std::invalid_argument>([&] { collection.AddGrid("null", nullptr); }));

    assert(collection.Remove("g"));
    assert(!collection.Remove("g"));
    assert(collection.List().ToVector().empty());

    MemoryCollection other("other");
    assert(collection.GetIdentity() != other.GetIdentity());

    std::cout << "  ✓ Identifiers are unique within a collection" << std::endl;
}

void testTraverse()
{
    std::cout << "Testing nested traversal..." << std::endl;

    auto root = std::make_shared<MemoryCollection>("root");
    auto year2020 = std::make_shared<MemoryCollection>("2020");
    auto deep = std::make_shared<MemoryCollection>("deep");

    deep->AddGrid("c", MakeGrid2D("c", 1, 1, GDT_Byte, {3}));
    year2020->AddGrid("a", MakeGrid2D("a", 1, 1, GDT_Byte, {1}));
    year2020->AddCollection("deep", deep);
    root->AddCollection("2020", year2020);
    root->AddGrid("b", MakeGrid2D("b", 1, 1, GDT_Byte, {2}));

    std::vector<std::string> visited;
    Traverse(*root,
             [&](const std::vector<std::string>& path, const Member& member)
             {
                 std::string full;
                 for (const std::string& step : path)
                     full += step + "/";
                 visited.push_back(full + member.GetIdentifier());
             });
    assert((visited == std::vector<std::string>{"2020", "2020/a", "2020/deep", "2020/deep/c", "b"}));

    // Filters select what is visited, not where traversal goes
    std::vector<std::string> grids;
    Traverse(*root,
             [&](const std::vector<std::string>&, const Member& member)
             { grids.push_back(member.GetIdentifier()); },
             MemberFilter().SetKind(MemberKind::Grid));
    assert((grids == std::vector<std::string>{"a", "c", "b"}));

    // The same collection twice on different branches is not a cycle
    root->AddCollection("again", deep);
    size_t count = 0;
    Traverse(*root, [&](const std::vector<std::string>&, const Member&) { count++; });
    assert(count == 7);

    std::cout << "  ✓ Traversal walks every nested member" << std::endl;
}

void testTraverseCycle()
{
    std::cout << "Testing cyclic collections..." << std::endl;

    auto root = std::make_shared<MemoryCollection>("root");
    auto child = std::make_shared<MemoryCollection>("child");
    root->AddCollection("child", child);
    child->AddCollection("up", root);

    assert(Throws<CyclicCollectionError>([&] { Traverse(*root, [](const std::vector<std::string>&, const Member&) {}); }));

    auto self = std::make_shared<MemoryCollection>("self");
    self->AddCollection("me", self);
    assert(Throws<CyclicCollectionError>([&] { Traverse(*self, [](const std::vector<std::string>&, const Member&) {}); }));

    // Break the reference loops
    child->Remove("up");
    self->Remove("me");

    std::cout << "  ✓ Cycles raise CyclicCollectionError" << std::endl;
}

int main()
{
    std::cout << "=== Collection Tests ===" << std::endl << std::endl;

    try
    {
        testListing();
        testFilters();
        testResolve();
        testMembershipChecks();
        testTraverse();
        testTraverseCycle();

        std::cout << std::endl << "🎉 All collection tests passed!" << std::endl;
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
