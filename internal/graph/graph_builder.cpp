#include "internal/graph/graph_builder.hpp"

#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "internal/util/errors.hpp"
#include "internal/util/tags.hpp"

namespace jobsrv::graph {

namespace {

enum class Color { kWhite, kGrey, kBlack };

std::string Key(const std::string& name, const std::string& target) {
  return name + '\0' + target;
}

std::string EffectiveTarget(const jobsrv::v1::GraphDescription& description, const jobsrv::v1::ProjectSpec& spec) {
  return spec.target().empty() ? description.target() : spec.target();
}

// Validates names, targets and tags, and indexes projects by (name, target).
std::unordered_map<std::string, size_t> IndexProjects(const jobsrv::v1::GraphDescription& description) {
  if (description.projects().empty()) {
    throw util::MalformedGraphError("graph has no projects");
  }

  std::unordered_map<std::string, size_t> index;
  for (int i = 0; i < description.projects_size(); ++i) {
    const auto& spec = description.projects(i);
    if (spec.name().empty()) {
      throw util::MalformedGraphError("project #" + std::to_string(i) + " has no name");
    }

    const auto target = EffectiveTarget(description, spec);
    if (target.empty()) {
      throw util::MalformedGraphError("project " + spec.name() + " has no target");
    }
    for (const auto& tag : spec.tags()) {
      if (!util::IsValidTag(tag)) {
        throw util::MalformedGraphError("project " + spec.name() + " has invalid tag '" + tag + "'");
      }
    }

    if (!index.emplace(Key(spec.name(), target), static_cast<size_t>(i)).second) {
      throw util::DuplicateProjectError("duplicate project " + spec.name() + " for target " + target);
    }
  }
  return index;
}

size_t ResolveDependency(const jobsrv::v1::GraphDescription&            description,
                         const std::unordered_map<std::string, size_t>& index,
                         const jobsrv::v1::ProjectSpec&                 spec,
                         const std::string&                             dependency) {
  auto it = index.find(Key(dependency, EffectiveTarget(description, spec)));
  if (it == index.end()) {
    throw util::MalformedGraphError("project " + spec.name() + " depends on unknown project " + dependency);
  }
  return it->second;
}

} // namespace

BuildGraph GraphBuilder::Build(const jobsrv::v1::GraphDescription& description) {
  const auto index = IndexProjects(description);

  BuildGraph graph;
  graph.target_ = description.target();
  graph.nodes_.resize(description.projects_size());

  for (size_t i = 0; i < graph.nodes_.size(); ++i) {
    const auto& spec = description.projects(static_cast<int>(i));
    auto&       node = graph.nodes_[i];
    node.project     = spec.name();
    node.target      = EffectiveTarget(description, spec);
    node.tags.assign(spec.tags().begin(), spec.tags().end());
    node.inputs_ref = spec.inputs_ref();

    std::unordered_set<size_t> seen;
    for (const auto& dependency : spec.dependencies()) {
      const size_t dep = ResolveDependency(description, index, spec, dependency);
      if (seen.insert(dep).second) {
        node.dependencies.push_back(dep);
      }
    }
  }

  for (size_t i = 0; i < graph.nodes_.size(); ++i) {
    for (size_t dep : graph.nodes_[i].dependencies) {
      graph.nodes_[dep].dependents.push_back(i);
    }
  }

  // Iterative three-colour DFS. Post-order yields dependencies first; a grey
  // node reached again closes a cycle made of the stack from it to the top.
  std::vector<Color>                       color(graph.nodes_.size(), Color::kWhite);
  std::vector<std::pair<size_t, size_t>>   stack; // node, next dependency slot
  graph.order_.reserve(graph.nodes_.size());

  for (size_t root = 0; root < graph.nodes_.size(); ++root) {
    if (color[root] != Color::kWhite) continue;

    color[root] = Color::kGrey;
    stack.emplace_back(root, 0);

    while (!stack.empty()) {
      auto& [node, next] = stack.back();
      const auto& deps   = graph.nodes_[node].dependencies;

      if (next == deps.size()) {
        color[node] = Color::kBlack;
        graph.order_.push_back(node);
        stack.pop_back();
        continue;
      }

      const size_t dep = deps[next++];
      if (color[dep] == Color::kWhite) {
        color[dep] = Color::kGrey;
        stack.emplace_back(dep, 0);
      } else if (color[dep] == Color::kGrey) {
        std::vector<std::string> members;
        bool                     on_cycle = false;
        for (const auto& frame : stack) {
          on_cycle = on_cycle || frame.first == dep;
          if (on_cycle) members.push_back(graph.nodes_[frame.first].project);
        }

        std::string message = "dependency cycle:";
        for (const auto& member : members) {
          message += ' ' + member + " ->";
        }
        message += ' ' + graph.nodes_[dep].project;
        throw util::GraphCycleError(message, std::move(members));
      }
    }
  }

  return graph;
}

BuildGraph GraphBuilder::BuildClosure(const jobsrv::v1::GraphDescription& description, const std::vector<std::string>& roots) {
  const auto index = IndexProjects(description);

  std::vector<bool>   keep(description.projects_size(), false);
  std::vector<size_t> pending;

  for (const auto& root : roots) {
    bool found = false;
    for (int i = 0; i < description.projects_size(); ++i) {
      if (description.projects(i).name() == root) {
        found = true;
        pending.push_back(static_cast<size_t>(i));
      }
    }
    if (!found) {
      throw util::MalformedGraphError("unknown root project " + root);
    }
  }

  while (!pending.empty()) {
    const size_t i = pending.back();
    pending.pop_back();
    if (keep[i]) continue;
    keep[i] = true;

    const auto& spec = description.projects(static_cast<int>(i));
    for (const auto& dependency : spec.dependencies()) {
      pending.push_back(ResolveDependency(description, index, spec, dependency));
    }
  }

  jobsrv::v1::GraphDescription closure;
  closure.set_target(description.target());
  for (int i = 0; i < description.projects_size(); ++i) {
    if (keep[static_cast<size_t>(i)]) {
      *closure.add_projects() = description.projects(i);
    }
  }
  return Build(closure);
}

BuildGraph GraphBuilder::FromSubmission(const jobsrv::v1::GraphDescription& description) {
  if (description.roots().empty()) {
    return Build(description);
  }
  return BuildClosure(description, {description.roots().begin(), description.roots().end()});
}

} // namespace jobsrv::graph
