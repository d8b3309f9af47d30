// File: src/detection/cluster_builder.hpp
#pragma once

#include "core/types.hpp"
#include "detection/duplicate_detector.hpp"
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace dedupe {

/// ClusterBuilder - Groups transitively related duplicates
///
/// Every entity with an id is compared against the other input entities at
/// the high-confidence threshold. Each reported match becomes an undirected
/// edge. Once all detections have finished, connected components of two or
/// more members become clusters.
class ClusterBuilder {
public:
    /// Undirected adjacency keyed by entity id
    using Graph = std::map<std::string, std::set<std::string>>;

    /// @throws std::invalid_argument if detector is null
    explicit ClusterBuilder(std::shared_ptr<const DuplicateDetector> detector);

    /// Build clusters over the given entities
    /// @return Clusters in discovery order, members sorted
    std::vector<DuplicateCluster> Cluster(const std::vector<DealRecord>& entities) const;

    /// Connected components via iterative depth-first traversal
    ///
    /// Traversal starts from the ids in `order`; nodes reachable only
    /// through edges still appear in the component of their first visitor.
    /// @param graph Undirected adjacency
    /// @param order Start order for the traversal
    /// @return Components with members in visit order
    static std::vector<std::vector<std::string>> ConnectedComponents(
        const Graph& graph,
        const std::vector<std::string>& order);

private:
    std::shared_ptr<const DuplicateDetector> detector_;
};

} // namespace dedupe
