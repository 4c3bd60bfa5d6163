#pragma once

#include <graph_model/types.hpp>
#include <graph_placement/placement_constants.hpp>
#include <box2d/box2d.h>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace graph_placement {

struct PlacementParams {
    double min_separation = layout::min_separation;
    double ring_step = layout::ring_step;
    int max_rings = layout::max_rings;
    int min_angular_steps = layout::min_angular_steps;
};

struct PlacementResult {
    graph_model::Vec2 position;
    // False when the search bound was hit; position is then the least-overlapping candidate.
    bool is_free = true;
    // Deepest remaining intrusion into a neighbor's exclusion zone (0 when free).
    double overlap_depth = 0.0;
    int rings_searched = 0;
};

struct IndexedNode {
    std::string id;
    graph_model::Vec2 pos;
    double radius = 0.0;
};

// Node positions/radii backed by a box2d dynamic AABB tree, so neighborhood
// queries only touch nodes near the query point instead of every node in the view.
class SpatialIndex {
public:
    explicit SpatialIndex(const PlacementParams& params = {});
    ~SpatialIndex();

    SpatialIndex(const SpatialIndex&) = delete;
    SpatialIndex& operator=(const SpatialIndex&) = delete;

    const PlacementParams& params() const { return params_; }
    void set_params(const PlacementParams& params);

    // Inserts or replaces. Rejects non-positive/non-finite radius and non-finite positions.
    bool upsert(const std::string& id, graph_model::Vec2 pos, double radius);
    bool move(const std::string& id, graph_model::Vec2 pos);
    bool remove(const std::string& id);
    void clear();

    bool contains(const std::string& id) const;
    std::optional<IndexedNode> find(const std::string& id) const;
    std::size_t size() const { return entries_.size(); }
    // Ids in insertion order.
    const std::vector<std::string>& ids() const { return order_; }

    bool overlaps(graph_model::Vec2 candidate, double radius, const std::string& exclude_id = {}) const;
    PlacementResult nearest_free_position(graph_model::Vec2 desired, double radius,
        const std::string& exclude_id = {}) const;

    // Ids whose circles intersect the disc (center, reach), in insertion order.
    std::vector<std::string> query_nearby(graph_model::Vec2 center, double reach,
        const std::string& exclude_id = {}) const;
    // Ids whose centers lie inside the rect, in insertion order.
    std::vector<std::string> query_rect(const graph_model::Rect& rect) const;
    // Node under a world point; nearest center wins, earlier insertion breaks ties.
    std::optional<std::string> pick(graph_model::Vec2 world) const;

    // Bounding box of all node discs; nullopt when empty.
    std::optional<graph_model::Rect> content_bounds() const;
    // Pairs violating the separation invariant, each as (earlier id, later id).
    std::vector<std::pair<std::string, std::string>> overlapping_pairs() const;

private:
    struct Entry {
        graph_model::Vec2 pos;
        double radius = 0.0;
        int proxy_id = -1;
        std::size_t order = 0;
    };

    b2AABB make_aabb(graph_model::Vec2 center, double half_extent) const;
    std::vector<const Entry*> candidates_near(graph_model::Vec2 center, double reach,
        const std::string& exclude_id) const;
    double intrusion(graph_model::Vec2 candidate, double radius, const std::string& exclude_id) const;
    void sort_by_order(std::vector<std::string>& ids) const;

    PlacementParams params_;
    b2DynamicTree tree_;
    std::unordered_map<std::string, Entry> entries_;
    std::unordered_map<int, std::string> proxy_owner_;
    std::vector<std::string> order_;
    std::size_t next_order_ = 0;
    double max_radius_ = 0.0;
};

} // namespace graph_placement
