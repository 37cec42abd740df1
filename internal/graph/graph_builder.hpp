#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "jobsrv/v1.hpp"

namespace jobsrv::graph {

/*
  One project of a validated build graph.

  Edges are node indices. dependencies keeps the declared order,
  dependents is the reverse index used for readiness and cascades.
*/
struct BuildNode {
  std::string              project;
  std::string              target;
  std::vector<std::string> tags;
  std::string              inputs_ref;

  std::vector<size_t> dependencies;
  std::vector<size_t> dependents;
};

/*
  Immutable DAG produced by GraphBuilder.

  TopologicalOrder() lists every node after all of its dependencies and is
  stable with respect to the submission order.
*/
class BuildGraph {
 public:
  const std::string& Target() const {
    return target_;
  }

  const std::vector<BuildNode>& Nodes() const {
    return nodes_;
  }

  const std::vector<size_t>& TopologicalOrder() const {
    return order_;
  }

  size_t size() const {
    return nodes_.size();
  }

 private:
  friend class GraphBuilder;

  std::string            target_;
  std::vector<BuildNode> nodes_;
  std::vector<size_t>    order_;
};

/*
  GraphBuilder

  Validates a submitted project description and turns it into a DAG.
  Pure: nothing is persisted here, so a rejected submission leaves no state.

  Errors (all util::ValidationError):
    GraphCycleError        dependency cycle, including self dependency
    DuplicateProjectError  same name and target listed twice
    MalformedGraphError    empty graph, missing name or target, invalid tag,
                           dependency or root naming an unknown project
*/
class GraphBuilder {
 public:
  static BuildGraph Build(const jobsrv::v1::GraphDescription& description);

  // Keeps only the transitive dependency closure of the named roots.
  static BuildGraph BuildClosure(const jobsrv::v1::GraphDescription& description, const std::vector<std::string>& roots);

  // Build, or BuildClosure when the description names roots.
  static BuildGraph FromSubmission(const jobsrv::v1::GraphDescription& description);
};

} // namespace jobsrv::graph
