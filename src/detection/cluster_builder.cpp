// File: src/detection/cluster_builder.cpp
#include "detection/cluster_builder.hpp"
#include "core/parallel.hpp"
#include <algorithm>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace dedupe {

namespace {

int64_t NowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

ClusterBuilder::ClusterBuilder(std::shared_ptr<const DuplicateDetector> detector)
    : detector_(std::move(detector)) {
    if (!detector_) {
        throw std::invalid_argument("ClusterBuilder requires a detector");
    }
}

// ============================================================================
// Clustering
// ============================================================================

std::vector<DuplicateCluster> ClusterBuilder::Cluster(const std::vector<DealRecord>& entities) const {
    const DetectorConfig& config = detector_->GetConfig();

    DetectOptions options;
    options.candidates = entities;
    options.threshold = config.thresholds.high_confidence;

    // Detect everything first; the graph is built only after all workers join
    std::vector<DetectionResult> detections(entities.size());
    ParallelFor(entities.size(), config.batch.worker_threads, [&](size_t i) {
        if (entities[i].HasId()) {
            detections[i] = detector_->Detect(entities[i], options);
        }
    });

    Graph graph;
    std::vector<std::string> order;

    auto add_node = [&graph, &order](const std::string& id) -> std::set<std::string>& {
        auto it = graph.find(id);
        if (it == graph.end()) {
            order.push_back(id);
            it = graph.emplace(id, std::set<std::string>{}).first;
        }
        return it->second;
    };

    for (size_t i = 0; i < entities.size(); ++i) {
        if (!entities[i].HasId() || !detections[i].is_duplicate) {
            continue;
        }
        const std::string& id = *entities[i].id;
        for (const auto& match : detections[i].matches) {
            add_node(id).insert(match.matched_entity_id);
            add_node(match.matched_entity_id).insert(id);
        }
    }

    std::vector<DuplicateCluster> clusters;
    for (auto& members : ConnectedComponents(graph, order)) {
        if (members.size() < 2) {
            continue;
        }

        std::sort(members.begin(), members.end());

        DuplicateCluster cluster;
        cluster.cluster_id = GenerateClusterId();
        cluster.cluster_key = MakeClusterKey(members);
        cluster.entity_type = EntityType::DEAL;
        cluster.entity_ids = std::move(members);
        // Placeholder until per-cluster confidence is derived from edge weights
        cluster.confidence_score = config.thresholds.high_confidence;
        cluster.created_at_ms = NowMillis();
        cluster.status = ClusterStatus::ACTIVE;
        clusters.push_back(std::move(cluster));
    }

    std::ostringstream msg;
    msg << "Built " << clusters.size() << " clusters from " << entities.size()
        << " entities (" << graph.size() << " linked)";
    detector_->LogDebug("ClusterBuilder", msg.str());

    return clusters;
}

std::vector<std::vector<std::string>> ClusterBuilder::ConnectedComponents(
        const Graph& graph,
        const std::vector<std::string>& order) {
    std::vector<std::vector<std::string>> components;
    std::unordered_set<std::string> visited;

    for (const auto& start : order) {
        if (visited.count(start) > 0) {
            continue;
        }

        std::vector<std::string> component;
        std::vector<std::string> stack{start};

        while (!stack.empty()) {
            std::string node = std::move(stack.back());
            stack.pop_back();

            if (!visited.insert(node).second) {
                continue;
            }
            component.push_back(node);

            auto it = graph.find(node);
            if (it == graph.end()) {
                continue;
            }
            for (const auto& neighbor : it->second) {
                if (visited.count(neighbor) == 0) {
                    stack.push_back(neighbor);
                }
            }
        }

        components.push_back(std::move(component));
    }

    return components;
}

} // namespace dedupe
