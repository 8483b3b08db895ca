#pragma once
#include <map>
#include <set>
#include <string>
#include <vector>

#include "geogrid.h"
#include "geogrid_grid.h"

namespace GeoGrid
{
/**
 * @brief Directed dependency graph over grid identities
 *
 * An edge from A to B means A is computed from B. Nodes are identities, not
 * objects, so two grid instances over the same data are one node.
 */
class GEOGRID_DLL DerivationGraph
{
  public:
    void AddNode(const std::string& identity);
    void AddEdge(const std::string& from, const std::string& to);

    /**
     * @brief Add a grid and, transitively, everything it depends on
     *
     * Each identity is expanded once, so the walk terminates even when the
     * dependencies loop back.
     */
    void AddGrid(const Grid& grid);

    static DerivationGraph FromGrid(const Grid& grid);

    bool HasNode(const std::string& identity) const;
    size_t GetNodeCount() const { return mEdges.size(); }
    const std::set<std::string>& GetDependencies(const std::string& identity) const;

    bool HasCycle() const { return !FindCycle().empty(); }

    /**
     * @brief One cycle as a path whose first and last nodes are equal, or an
     *        empty vector when the graph is acyclic
     */
    std::vector<std::string> FindCycle() const;

  private:
    std::map<std::string, std::set<std::string>> mEdges;
};
}  // namespace GeoGrid
