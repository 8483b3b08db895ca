#include "geogrid_derivation_graph.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace GeoGrid
{
void DerivationGraph::AddNode(const std::string& identity)
{
    mEdges[identity];
}

void DerivationGraph::AddEdge(const std::string& from, const std::string& to)
{
    mEdges[from].insert(to);
    mEdges[to];
}

void DerivationGraph::AddGrid(const Grid& grid)
{
    const std::string rootId = grid.GetIdentity();
    AddNode(rootId);

    std::set<std::string> expanded{rootId};
    std::vector<GridPtr> pending;
    for (const GridPtr& dependency : grid.GetDependencies())
    {
        AddEdge(rootId, dependency->GetIdentity());
        pending.push_back(dependency);
    }

    while (!pending.empty())
    {
        GridPtr current = std::move(pending.back());
        pending.pop_back();

        const std::string id = current->GetIdentity();
        if (!expanded.insert(id).second)
            continue;

        for (const GridPtr& dependency : current->GetDependencies())
        {
            AddEdge(id, dependency->GetIdentity());
            pending.push_back(dependency);
        }
    }
}

DerivationGraph DerivationGraph::FromGrid(const Grid& grid)
{
    DerivationGraph graph;
    graph.AddGrid(grid);
    return graph;
}

bool DerivationGraph::HasNode(const std::string& identity) const
{
    return mEdges.find(identity) != mEdges.end();
}

const std::set<std::string>& DerivationGraph::GetDependencies(const std::string& identity) const
{
    auto it = mEdges.find(identity);
    if (it == mEdges.end())
        throw std::out_of_range("No node '" + identity + "' in derivation graph");
    return it->second;
}

std::vector<std::string> DerivationGraph::FindCycle() const
{
    // Iterative DFS: a node is on the stack while any of its descendants is
    // still being explored. Reaching an on-stack node closes a cycle.
    enum class State
    {
        Unvisited,
        OnStack,
        Done
    };

    std::map<std::string, State> state;
    for (const auto& node : mEdges)
        state[node.first] = State::Unvisited;

    using Frame = std::pair<const std::string*, std::set<std::string>::const_iterator>;

    for (const auto& root : mEdges)
    {
        if (state[root.first] != State::Unvisited)
            continue;

        std::vector<Frame> stack;
        stack.emplace_back(&root.first, root.second.begin());
        state[root.first] = State::OnStack;

        while (!stack.empty())
        {
            Frame& frame = stack.back();
            const std::set<std::string>& children = mEdges.at(*frame.first);
            if (frame.second == children.end())
            {
                state[*frame.first] = State::Done;
                stack.pop_back();
                continue;
            }

            const std::string& child = *frame.second;
            ++frame.second;

            const State childState = state[child];
            if (childState == State::OnStack)
            {
                std::vector<std::string> cycle;
                auto start = std::find_if(stack.begin(), stack.end(),
                                          [&child](const Frame& f) { return *f.first == child; });
                for (auto it = start; it != stack.end(); ++it)
                    cycle.push_back(*it->first);
                cycle.push_back(child);
                return cycle;
            }
            if (childState == State::Unvisited)
            {
                auto childIt = mEdges.find(child);
                state[child] = State::OnStack;
                stack.emplace_back(&childIt->first, childIt->second.begin());
            }
        }
    }
    return {};
}
}  // namespace GeoGrid
