#include "internal/graph/cycle_guard.hpp"

#include <algorithm>
#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace trailmap::graph {

CycleGuard::CycleGuard(std::shared_ptr<GraphStore> graph) : graph_(std::move(graph)) {
}

std::optional<std::vector<std::string>> CycleGuard::FindCyclePath(db::Transaction& tx, const std::string& source_id,
                                                                  const std::string& target_id) const {
  if (source_id == target_id) {
    return std::vector<std::string>{source_id};
  }

  // BFS from target; came_from doubles as the visited set
  std::unordered_map<std::string, std::string> came_from;
  std::deque<std::string>                      queue{target_id};
  came_from.emplace(target_id, std::string{});

  while (!queue.empty()) {
    auto node = std::move(queue.front());
    queue.pop_front();

    // straight from the repository: a snapshot may predate another process's commit
    for (const auto& edge : graph_->Store().GetDependencies(tx, node)) {
      if (!model::IsBlockingType(edge.type)) continue;

      const auto& next = edge.depends_on_id;
      if (next == source_id) {
        std::vector<std::string> path{source_id};
        for (auto at = node; !at.empty(); at = came_from.at(at)) {
          path.push_back(at);
        }
        std::reverse(path.begin(), path.end());
        return path;
      }

      if (came_from.emplace(next, node).second) {
        queue.push_back(next);
      }
    }
  }

  return std::nullopt;
}

std::vector<std::vector<std::string>> CycleGuard::DetectCycles(db::Transaction& tx, const std::string& project_id) const {
  std::unordered_map<std::string, std::vector<std::string>> adjacency;
  std::vector<std::string>                                  nodes;

  for (const auto& task : graph_->TasksInProject(tx, project_id)) {
    adjacency[task.id];
    nodes.push_back(task.id);
  }
  for (const auto& edge : graph_->EdgesInProject(tx, project_id)) {
    if (!model::IsBlockingType(edge.type)) continue;
    adjacency[edge.task_id].push_back(edge.depends_on_id);
  }

  // Iterative Tarjan; explicit frames keep deep chains off the call stack.
  struct Frame {
    std::string node;
    std::size_t next_edge = 0;
  };

  std::unordered_map<std::string, std::size_t> index;
  std::unordered_map<std::string, std::size_t> lowlink;
  std::unordered_set<std::string>              on_stack;
  std::vector<std::string>                     stack;
  std::vector<Frame>                           frames;
  std::size_t                                  counter = 0;

  std::vector<std::vector<std::string>> cycles;

  auto visit = [&](const std::string& node) {
    index[node]   = counter;
    lowlink[node] = counter;
    ++counter;
    stack.push_back(node);
    on_stack.insert(node);
    frames.push_back(Frame{node, 0});
  };

  for (const auto& root : nodes) {
    if (index.contains(root)) continue;
    visit(root);

    while (!frames.empty()) {
      const std::string node  = frames.back().node;
      const auto&       edges = adjacency[node];

      if (frames.back().next_edge < edges.size()) {
        const std::string next = edges[frames.back().next_edge++];
        if (!index.contains(next)) {
          visit(next);
        } else if (on_stack.contains(next)) {
          lowlink[node] = std::min(lowlink[node], index[next]);
        }
        continue;
      }

      if (lowlink[node] == index[node]) {
        std::vector<std::string> component;
        std::string              member;
        do {
          member = stack.back();
          stack.pop_back();
          on_stack.erase(member);
          component.push_back(member);
        } while (member != node);

        const bool self_loop = std::find(edges.begin(), edges.end(), node) != edges.end();
        if (component.size() > 1 || self_loop) {
          std::sort(component.begin(), component.end());
          cycles.push_back(std::move(component));
        }
      }

      frames.pop_back();
      if (!frames.empty()) {
        const auto& parent = frames.back().node;
        lowlink[parent]    = std::min(lowlink[parent], lowlink[node]);
      }
    }
  }

  std::sort(cycles.begin(), cycles.end());
  return cycles;
}

} // namespace trailmap::graph
