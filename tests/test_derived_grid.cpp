#include <atomic>
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "geogrid_derivation.h"
#include "geogrid_derivation_graph.h"
#include "geogrid_derived_grid.h"
#include "geogrid_errors.h"
#include "geogrid_memory_grid.h"
#include "test_utils.h"

using namespace GeoGrid;

static const double NaN = std::numeric_limits<double>::quiet_NaN();

/**
 * Pass-through grid that counts physical reads
 */
class CountingGrid : public Grid
{
  public:
    explicit CountingGrid(GridPtr inner) : mInner(std::move(inner)) {}

    std::string GetIdentity() const override { return "counting:" + mInner->GetIdentity(); }
    int GetReadCount() const { return mReads.load(); }

  protected:
    void LoadMetadata(GridMetadata& metadata) const override
    {
        metadata.displayName = "counting " + mInner->GetDisplayName();
        metadata.extent = mInner->GetExtent();
        metadata.spatialReference = mInner->GetSpatialReference();
        metadata.unscaledDataType = mInner->GetDataType();
        metadata.unscaledNoData = mInner->GetNoDataValue();
    }

    void IReadBlock(GridBlock& block) const override
    {
        mReads++;
        block.Paste(mInner->ReadBlock(block.GetOrigin(), block.GetShape()));
    }

  private:
    GridPtr mInner;
    mutable std::atomic<int> mReads{0};
};

/**
 * Grid with a fixed identity and dependencies set after construction
 */
class ProxyGrid : public Grid
{
  public:
    explicit ProxyGrid(const std::string& identity) : mIdentity(identity) {}

    void SetDependencies(std::vector<GridPtr> dependencies) { mDependencies = std::move(dependencies); }

    std::string GetIdentity() const override { return mIdentity; }
    std::vector<GridPtr> GetDependencies() const override { return mDependencies; }

  protected:
    void LoadMetadata(GridMetadata& metadata) const override
    {
        metadata.displayName = mIdentity;
        metadata.extent = Extent::Make2D(2, 2, 1.0);
    }

    void IReadBlock(GridBlock& block) const override { block.Fill(1.0); }

  private:
    std::string mIdentity;
    std::vector<GridPtr> mDependencies;
};

static DerivedGridOptions OptionsWithBlock(size_t rows, size_t cols)
{
    DerivedGridOptions options;
    options.blockShape = {rows, cols};
    return options;
}

static DerivationPtr MakeSum(GDALDataType eType, const NoDataValue& noData = NoDataValue())
{
    return std::make_shared<CellDerivation>(
        "sum", 2, eType, [](const double* v, size_t) { return v[0] + v[1]; }, noData);
}

void testNoDataPropagation()
{
    std::cout << "Testing NoData propagation over every window..." << std::endl;

    auto a = MakeGrid2D("a", 3, 4, GDT_Float32, {1, NaN, 3, 4, 5, 6, 7, 8, NaN, 10, 11, 12}, NoDataValue(NaN));
    auto b = MakeGrid2D("b", 3, 4, GDT_Float32, {1, 1, 1, -99, 1, 1, 1, 1, 1, 1, -99, 1}, NoDataValue(-99.0));

    auto sum = DerivedGrid::Create(MakeSum(GDT_Float32), {a, b}, OptionsWithBlock(2, 3));
    assert(sum->GetDataType() == GDT_Float32);
    assert(sum->GetNoDataValue().hasValue && std::isnan(sum->GetNoDataValue().value));

    const GridBlock whole = sum->ReadAll();
    const GridBlock inA = a->ReadAll();
    const GridBlock inB = b->ReadAll();
    for (size_t i = 0; i < whole.GetCellCount(); i++)
    {
        const bool expectNoData = inA.IsNoData(i) || inB.IsNoData(i);
        assert(whole.IsNoData(i) == expectNoData);
        if (!expectNoData)
            assert(whole.GetValue(i) == inA.GetValue(i) + inB.GetValue(i));
    }

    for (size_t r0 = 0; r0 < 3; r0++)
        for (size_t c0 = 0; c0 < 4; c0++)
            for (size_t rows = 1; r0 + rows <= 3; rows++)
                for (size_t cols = 1; c0 + cols <= 4; cols++)
                {
                    const GridBlock window = sum->ReadBlock({r0, c0}, {rows, cols});
                    assert(window.SameValuesAs(whole.Extract({r0, c0}, {rows, cols})));
                }

    std::cout << "  ✓ NoData in any input gives NoData in the output" << std::endl;
}

void testIntegerScenario()
{
    std::cout << "Testing the 10x10 integer sum with NoData -9999..." << std::endl;

    std::vector<double> valuesA = Ramp(10, 10);
    std::vector<double> valuesB(100, 1000.0);
    valuesA[0] = -9999.0;
    valuesA[55] = -9999.0;
    valuesB[9] = -9999.0;
    valuesB[55] = -9999.0;
    valuesB[99] = -9999.0;

    auto a = MakeGrid2D("a", 10, 10, GDT_Int32, valuesA, NoDataValue(-9999.0));
    auto b = MakeGrid2D("b", 10, 10, GDT_Int32, valuesB, NoDataValue(-9999.0));

    auto sum = DerivedGrid::Create(MakeSum(GDT_Int32), {a, b}, OptionsWithBlock(4, 4));
    assert(sum->GetNoDataValue() == NoDataValue(-9999.0));

    const GridBlock out = sum->ReadAll();
    for (size_t i = 0; i < 100; i++)
    {
        if (i == 0 || i == 9 || i == 55 || i == 99)
        {
            assert(out.GetValue(i) == -9999.0);
            assert(out.IsNoData(i));
        }
        else
        {
            assert(out.GetValue(i) == static_cast<double>(i) + 1000.0);
        }
    }

    std::cout << "  ✓ Sums are exact and NoData cells stay -9999" << std::endl;
}

void testBlockShapeIndependence()
{
    std::cout << "Testing block-shape independence..." << std::endl;

    const size_t rows = 37;
    const size_t cols = 23;
    std::vector<double> values(rows * cols);
    for (size_t i = 0; i < values.size(); i++)
        values[i] = (i % 13 == 0) ? -1.0 : std::sin(static_cast<double>(i)) * 100.0;
    auto a = MakeGrid2D("wave", rows, cols, GDT_Float64, values, NoDataValue(-1.0));

    auto scale = std::make_shared<CellDerivation>(
        "scale3", 1, GDT_Float64, [](const double* v, size_t) { return v[0] * 3.0 - 1.5; });

    const GridBlock reference = DerivedGrid::Create(scale, {a}, OptionsWithBlock(rows, cols))->ReadAll();

    const std::vector<std::vector<size_t>> shapes = {{1, 1}, {5, 7}, {16, 16}, {256, 256}, {37, 1}, {1, 23}};
    for (const std::vector<size_t>& shape : shapes)
    {
        auto derived = DerivedGrid::Create(scale, {a}, OptionsWithBlock(shape[0], shape[1]));
        assert(derived->ReadAll().SameValuesAs(reference));
    }

    // Whole read equals four quadrants reassembled
    auto derived = DerivedGrid::Create(scale, {a}, OptionsWithBlock(8, 8));
    GridBlock assembled({0, 0}, {rows, cols}, GDT_Float64, derived->GetNoDataValue());
    const size_t halfRows = rows / 2;
    const size_t halfCols = cols / 2;
    assembled.Paste(derived->ReadBlock({0, 0}, {halfRows, halfCols}));
    assembled.Paste(derived->ReadBlock({0, halfCols}, {halfRows, cols - halfCols}));
    assembled.Paste(derived->ReadBlock({halfRows, 0}, {rows - halfRows, halfCols}));
    assembled.Paste(derived->ReadBlock({halfRows, halfCols}, {rows - halfRows, cols - halfCols}));
    assert(assembled.SameValuesAs(derived->ReadAll()));
    assert(assembled.SameValuesAs(reference));

    std::cout << "  ✓ Results do not depend on tiling" << std::endl;
}

void testIncompatibleInputsFailBeforeReading()
{
    std::cout << "Testing incompatible inputs..." << std::endl;

    auto a = std::make_shared<CountingGrid>(MakeGrid2D("a", 4, 4, GDT_Float32, Ramp(4, 4)));
    auto wider = std::make_shared<CountingGrid>(MakeGrid2D("wider", 4, 5, GDT_Float32, Ramp(4, 5)));
    auto shifted = std::make_shared<CountingGrid>(std::make_shared<MemoryGrid>(
        "shifted", Extent::Make2D(4, 4, 1.0, 0.5, 0.0), GDT_Float32, Ramp(4, 4)));
    auto projected = std::make_shared<CountingGrid>(std::make_shared<MemoryGrid>(
        "projected", Extent::Make2D(4, 4, 1.0), GDT_Float32, Ramp(4, 4), NoDataValue(),
        SpatialReference::FromUserInput("EPSG:32633")));

    assert(Throws<IncompatibleGridsError>([&] { DerivedGrid::Create(MakeSum(GDT_Float32), {a, wider}); }));
    assert(Throws<IncompatibleGridsError>([&] { DerivedGrid::Create(MakeSum(GDT_Float32), {a, shifted}); }));
    assert(Throws<IncompatibleGridsError>([&] { DerivedGrid::Create(MakeSum(GDT_Float32), {a, projected}); }));

    assert(a->GetReadCount() == 0);
    assert(wider->GetReadCount() == 0);
    assert(shifted->GetReadCount() == 0);
    assert(projected->GetReadCount() == 0);

    assert(Throws<std::invalid_argument>([&] { DerivedGrid::Create(MakeSum(GDT_Float32), {a}); }));
    assert(Throws<std::invalid_argument>([&] { DerivedGrid::Create(nullptr, {a}); }));

    // Construction itself reads nothing
    auto ok = DerivedGrid::Create(MakeSum(GDT_Float32), {a, a});
    assert(a->GetReadCount() == 0);
    ok->ReadBlock({0, 0}, {1, 1});
    assert(a->GetReadCount() == 2);

    std::cout << "  ✓ Mismatches raise IncompatibleGridsError before any read" << std::endl;
}

void testCycleDetection()
{
    std::cout << "Testing derivation cycle detection..." << std::endl;

    DerivationGraph graph;
    graph.AddEdge("a", "b");
    graph.AddEdge("b", "c");
    graph.AddEdge("a", "c");
    assert(!graph.HasCycle());
    assert(graph.GetNodeCount() == 3);

    graph.AddEdge("c", "a");
    const std::vector<std::string> cycle = graph.FindCycle();
    assert(!cycle.empty());
    assert(cycle.front() == cycle.back());

    DerivationGraph selfLoop;
    selfLoop.AddEdge("x", "x");
    assert(selfLoop.HasCycle());

    auto x = std::make_shared<ProxyGrid>("x");
    auto y = std::make_shared<ProxyGrid>("y");
    x->SetDependencies({y});
    y->SetDependencies({x});

    auto identity = std::make_shared<CellDerivation>(
        "identity", 1, GDT_Float64, [](const double* v, size_t) { return v[0]; });
    assert(Throws<CyclicDerivationError>([&] { DerivedGrid::Create(identity, {x}); }));
    // A cycle is a kind of incompatibility
    assert(Throws<IncompatibleGridsError>([&] { DerivedGrid::Create(identity, {y}); }));

    x->SetDependencies({});
    y->SetDependencies({});

    // Deep acyclic chains are accepted
    GridPtr chain = MakeGrid2D("base", 2, 2, GDT_Float64, Ramp(2, 2));
    for (int i = 0; i < 50; i++)
        chain = DerivedGrid::Create(identity, {chain});
    assert(DerivationGraph::FromGrid(*chain).GetNodeCount() == 51);
    assert(chain->ReadAll().GetValue(3) == 3.0);

    std::cout << "  ✓ Cycles raise CyclicDerivationError" << std::endl;
}

void testHandlesNoDataItself()
{
    std::cout << "Testing derivations that handle NoData..." << std::endl;

    auto a = MakeGrid2D("a", 1, 4, GDT_Float64, {1, -1, 3, -1}, NoDataValue(-1.0));
    auto fill = std::make_shared<CellDerivation>(
        "fillzero", 1, GDT_Float64,
        [](const double* v, size_t) { return v[0] == -1.0 ? 0.0 : v[0]; },
        NoDataValue(), true);

    const GridBlock out = DerivedGrid::Create(fill, {a})->ReadAll();
    assert(out.GetValue(0) == 1.0);
    assert(out.GetValue(1) == 0.0);
    assert(out.GetValue(3) == 0.0);
    assert(!out.IsNoData(1));

    std::cout << "  ✓ Flagged derivations see NoData cells" << std::endl;
}

void testBlockDerivation()
{
    std::cout << "Testing block derivations..." << std::endl;

    auto a = MakeGrid2D("a", 3, 3, GDT_Int16, {1, 2, 3, 4, 0, 6, 7, 8, 9}, NoDataValue(0.0));
    auto twice = std::make_shared<BlockDerivation>(
        "twice", 1, GDT_Int16,
        [](const std::vector<const GridBlock*>& inputs, GridBlock& output)
        {
            for (size_t i = 0; i < output.GetCellCount(); i++)
                output.SetValue(i, inputs[0]->GetValue(i) * 2.0);
        },
        NoDataValue(-1.0));

    auto derived = DerivedGrid::Create(twice, {a}, OptionsWithBlock(2, 2));
    assert(derived->GetNoDataValue() == NoDataValue(-1.0));

    const GridBlock out = derived->ReadAll();
    assert(out.GetValue(0) == 2.0);
    assert(out.GetValue(4) == -1.0);
    assert(out.IsNoData(4));
    assert(out.GetValue(8) == 18.0);

    std::cout << "  ✓ Masked cells are overwritten after the block function" << std::endl;
}

void testClampingAndNoDataDefaults()
{
    std::cout << "Testing output clamping and NoData defaults..." << std::endl;

    auto a = MakeGrid2D("a", 1, 3, GDT_Float64, {1.2, 3.0, 250.0});
    auto times100 = std::make_shared<CellDerivation>(
        "times100", 1, GDT_Byte, [](const double* v, size_t) { return v[0] * 100.0; });

    const GridBlock out = DerivedGrid::Create(times100, {a})->ReadAll();
    assert(out.GetValue(0) == 120.0);
    assert(out.GetValue(1) == 255.0);
    assert(out.GetValue(2) == 255.0);

    // Integral output with NaN NoData input and nothing to mark it with
    auto nan = MakeGrid2D("nan", 1, 3, GDT_Float32, {1, NaN, 3}, NoDataValue(NaN));
    auto toInt = std::make_shared<CellDerivation>(
        "toint", 1, GDT_Int16, [](const double* v, size_t) { return v[0]; });
    assert(Throws<std::invalid_argument>([&] { DerivedGrid::Create(toInt, {nan}); }));

    auto toIntMarked = std::make_shared<CellDerivation>(
        "toint-marked", 1, GDT_Int16, [](const double* v, size_t) { return v[0]; }, NoDataValue(-32768.0));
    const GridBlock marked = DerivedGrid::Create(toIntMarked, {nan})->ReadAll();
    assert(marked.GetValue(1) == -32768.0);
    assert(marked.GetValue(2) == 3.0);

    std::cout << "  ✓ Values fit the output type" << std::endl;
}

void testResultCacheIntegration()
{
    std::cout << "Testing the tile cache..." << std::endl;

    std::atomic<int> evaluations{0};
    auto counted = std::make_shared<CellDerivation>(
        "counted", 1, GDT_Float64,
        [&evaluations](const double* v, size_t)
        {
            evaluations++;
            return v[0] + 1.0;
        });

    auto a = MakeGrid2D("a", 8, 8, GDT_Float64, Ramp(8, 8));
    DerivedGridOptions options = OptionsWithBlock(4, 4);
    options.cache = std::make_shared<GridBlockCache>(ResultCacheOptions());

    auto derived = DerivedGrid::Create(counted, {a}, options);
    const GridBlock first = derived->ReadAll();
    assert(evaluations.load() == 64);
    assert(options.cache->GetSize() == 4);

    const GridBlock second = derived->ReadAll();
    assert(evaluations.load() == 64);
    assert(second.SameValuesAs(first));

    // A second grid over the same inputs shares the cache entries
    auto twin = DerivedGrid::Create(counted, {MakeGrid2D("copy", 8, 8, GDT_Float64, Ramp(8, 8))}, options);
    assert(twin->GetIdentity() == derived->GetIdentity());
    twin->ReadBlock({5, 5}, {2, 2});
    assert(evaluations.load() == 64);
    assert(options.cache->GetStatistics().hits >= 5);

    std::cout << "  ✓ Tiles are computed once" << std::endl;
}

void testNoDataPolicyInIdentity()
{
    std::cout << "Testing NoData policy in derived identities..." << std::endl;

    auto a = MakeGrid2D("a", 1, 3, GDT_Int16, {1, -1, 3}, NoDataValue(-1.0));
    auto zeroFill = [](const double* v, size_t) { return v[0] == -1.0 ? 0.0 : v[0]; };

    // Same name and output type, different NoData handling
    auto masking = std::make_shared<CellDerivation>("fill", 1, GDT_Int16, zeroFill);
    auto passing = std::make_shared<CellDerivation>("fill", 1, GDT_Int16, zeroFill, NoDataValue(), true);
    auto marked = std::make_shared<CellDerivation>("fill", 1, GDT_Int16, zeroFill, NoDataValue(-7.0));

    DerivedGridOptions options;
    options.cache = std::make_shared<GridBlockCache>(ResultCacheOptions());
    auto maskingGrid = DerivedGrid::Create(masking, {a}, options);
    auto passingGrid = DerivedGrid::Create(passing, {a}, options);
    auto markedGrid = DerivedGrid::Create(marked, {a}, options);

    assert(maskingGrid->GetIdentity() != passingGrid->GetIdentity());
    assert(maskingGrid->GetIdentity() != markedGrid->GetIdentity());
    assert(passingGrid->GetIdentity() != markedGrid->GetIdentity());
    assert(maskingGrid->GetIdentity() == DerivedGrid::Create(masking, {a}, options)->GetIdentity());

    const GridBlock maskedOut = maskingGrid->ReadAll();
    const GridBlock passedOut = passingGrid->ReadAll();
    const GridBlock markedOut = markedGrid->ReadAll();
    assert(options.cache->GetSize() == 3);
    assert(maskedOut.IsNoData(1));
    assert(maskedOut.GetValue(1) == -1.0);
    assert(passedOut.GetValue(1) == 0.0);
    assert(markedOut.GetValue(1) == -7.0);

    std::cout << "  ✓ Grids differing only in NoData policy do not share tiles" << std::endl;
}

void testMaterializeAndNesting()
{
    std::cout << "Testing nested derivations and materialization..." << std::endl;

    auto a = MakeGrid2D("a", 5, 5, GDT_Float64, Ramp(5, 5), NoDataValue(12.0));
    auto b = MakeGrid2D("b", 5, 5, GDT_Float64, Ramp(5, 5, 100.0));
    auto sum = DerivedGrid::Create(MakeSum(GDT_Float64), {a, b}, OptionsWithBlock(2, 2));
    auto doubled = DerivedGrid::Create(MakeSum(GDT_Float64), {sum, sum}, OptionsWithBlock(3, 3));

    assert(doubled->GetDependencies().size() == 2);
    const GridBlock out = doubled->ReadAll();
    assert(out.GetValue(0) == 200.0);
    assert(out.IsNoData(12));
    assert(out.GetValue(24) == 2.0 * (24.0 + 124.0));

    auto materialized = doubled->Materialize();
    assert(materialized->ReadAll().SameValuesAs(out));
    assert(materialized->GetExtent().IsIdenticalTo(doubled->GetExtent()));

    std::cout << "  ✓ Derived grids compose" << std::endl;
}

void testDerivationRegistry()
{
    std::cout << "Testing the derivation registry..." << std::endl;

    DerivationRegistry registry;
    registry.Register(MakeSum(GDT_Float64));
    assert(registry.Find("sum") != nullptr);
    assert(registry.Get("sum")->GetArity() == 2);
    assert(registry.Find("missing") == nullptr);
    assert(Throws<NotFoundError>([&] { registry.Get("missing"); }));
    assert(Throws<std::invalid_argument>([&] { registry.Register(MakeSum(GDT_Int32)); }));
    assert(registry.GetIdentities() == std::vector<std::string>{"sum"});

    assert(Throws<std::invalid_argument>([] {
        CellDerivation("nullary", 0, GDT_Float64, [](const double*, size_t) { return 0.0; });
    }));

    std::cout << "  ✓ Derivations are looked up by identity" << std::endl;
}

int main()
{
    std::cout << "=== Derived Grid Tests ===" << std::endl << std::endl;

    try
    {
        testNoDataPropagation();
        testIntegerScenario();
        testBlockShapeIndependence();
        testIncompatibleInputsFailBeforeReading();
        testCycleDetection();
        testHandlesNoDataItself();
        testBlockDerivation();
        testClampingAndNoDataDefaults();
        testResultCacheIntegration();
        testNoDataPolicyInIdentity();
        testMaterializeAndNesting();
        testDerivationRegistry();

        std::cout << std::endl << "🎉 All derived grid tests passed!" << std::endl;
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
