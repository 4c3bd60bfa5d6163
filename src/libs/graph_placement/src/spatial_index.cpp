#include <graph_placement/spatial_index.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace graph_placement {

namespace {

using graph_model::Vec2;

constexpr std::uint64_t kNodeCategory = 0x1;
constexpr double kTwoPi = 6.283185307179586476925286766559;

struct QueryContext {
    std::vector<int>* hits;
};

bool collect_proxy(int proxy_id, std::uint64_t /*user_data*/, void* context) {
    auto* ctx = static_cast<QueryContext*>(context);
    ctx->hits->push_back(proxy_id);
    return true;
}

bool valid_radius(double radius) {
    return std::isfinite(radius) && radius > 0.0;
}

int angular_steps_for_ring(double ring_radius, double step, int min_steps) {
    const double circumference = kTwoPi * ring_radius;
    const int steps = static_cast<int>(std::ceil(circumference / step));
    return std::max(min_steps, steps);
}

// Out-of-range values fall back to defaults or clamp into the supported search range.
PlacementParams sanitized(PlacementParams p) {
    if (!std::isfinite(p.min_separation) || p.min_separation < 0.0) p.min_separation = layout::min_separation;
    if (!std::isfinite(p.ring_step) || p.ring_step <= 0.0) p.ring_step = layout::ring_step;
    p.max_rings = std::clamp(p.max_rings, 1, layout::max_rings_limit);
    p.min_angular_steps = std::clamp(p.min_angular_steps, 1, layout::angular_steps_limit);
    return p;
}

} // namespace

SpatialIndex::SpatialIndex(const PlacementParams& params)
    : params_(sanitized(params))
    , tree_(b2DynamicTree_Create())
{
}

SpatialIndex::~SpatialIndex() {
    b2DynamicTree_Destroy(&tree_);
}

void SpatialIndex::set_params(const PlacementParams& params) {
    params_ = sanitized(params);
}

b2AABB SpatialIndex::make_aabb(Vec2 center, double half_extent) const {
    const double h = half_extent + layout::aabb_pad;
    b2AABB box;
    box.lowerBound = b2Vec2{static_cast<float>(center.x - h), static_cast<float>(center.y - h)};
    box.upperBound = b2Vec2{static_cast<float>(center.x + h), static_cast<float>(center.y + h)};
    return box;
}

bool SpatialIndex::upsert(const std::string& id, Vec2 pos, double radius) {
    if (id.empty() || !valid_radius(radius) || !graph_model::is_finite(pos)) return false;

    auto it = entries_.find(id);
    if (it != entries_.end()) {
        it->second.pos = pos;
        it->second.radius = radius;
        b2DynamicTree_MoveProxy(&tree_, it->second.proxy_id, make_aabb(pos, radius));
        if (radius > max_radius_) max_radius_ = radius;
        return true;
    }

    Entry e;
    e.pos = pos;
    e.radius = radius;
    e.order = next_order_++;
    e.proxy_id = b2DynamicTree_CreateProxy(&tree_, make_aabb(pos, radius), kNodeCategory, e.order);
    proxy_owner_[e.proxy_id] = id;
    entries_.emplace(id, e);
    order_.push_back(id);
    if (radius > max_radius_) max_radius_ = radius;
    return true;
}

bool SpatialIndex::move(const std::string& id, Vec2 pos) {
    if (!graph_model::is_finite(pos)) return false;
    auto it = entries_.find(id);
    if (it == entries_.end()) return false;
    it->second.pos = pos;
    b2DynamicTree_MoveProxy(&tree_, it->second.proxy_id, make_aabb(pos, it->second.radius));
    return true;
}

bool SpatialIndex::remove(const std::string& id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) return false;
    b2DynamicTree_DestroyProxy(&tree_, it->second.proxy_id);
    proxy_owner_.erase(it->second.proxy_id);
    entries_.erase(it);
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());

    max_radius_ = 0.0;
    for (const auto& kv : entries_) {
        if (kv.second.radius > max_radius_) max_radius_ = kv.second.radius;
    }
    return true;
}

void SpatialIndex::clear() {
    b2DynamicTree_Destroy(&tree_);
    tree_ = b2DynamicTree_Create();
    entries_.clear();
    proxy_owner_.clear();
    order_.clear();
    next_order_ = 0;
    max_radius_ = 0.0;
}

bool SpatialIndex::contains(const std::string& id) const {
    return entries_.find(id) != entries_.end();
}

std::optional<IndexedNode> SpatialIndex::find(const std::string& id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return IndexedNode{id, it->second.pos, it->second.radius};
}

std::vector<const SpatialIndex::Entry*> SpatialIndex::candidates_near(Vec2 center, double reach,
    const std::string& exclude_id) const
{
    std::vector<int> hits;
    QueryContext ctx{&hits};
    b2DynamicTree_Query(&tree_, make_aabb(center, reach), kNodeCategory, collect_proxy, &ctx);

    std::vector<const Entry*> out;
    out.reserve(hits.size());
    for (int proxy_id : hits) {
        auto owner = proxy_owner_.find(proxy_id);
        if (owner == proxy_owner_.end()) continue;
        if (!exclude_id.empty() && owner->second == exclude_id) continue;
        auto it = entries_.find(owner->second);
        if (it != entries_.end()) out.push_back(&it->second);
    }
    return out;
}

double SpatialIndex::intrusion(Vec2 candidate, double radius, const std::string& exclude_id) const {
    double deepest = -std::numeric_limits<double>::infinity();
    const double reach = radius + max_radius_ + params_.min_separation;
    for (const Entry* e : candidates_near(candidate, reach, exclude_id)) {
        const double required = radius + e->radius + params_.min_separation;
        const double depth = required - graph_model::distance(candidate, e->pos);
        if (depth > deepest) deepest = depth;
    }
    return deepest;
}

bool SpatialIndex::overlaps(Vec2 candidate, double radius, const std::string& exclude_id) const {
    if (!valid_radius(radius) || !graph_model::is_finite(candidate)) return true;
    return intrusion(candidate, radius, exclude_id) > 0.0;
}

PlacementResult SpatialIndex::nearest_free_position(Vec2 desired, double radius,
    const std::string& exclude_id) const
{
    PlacementResult result;
    result.position = desired;
    if (!valid_radius(radius) || !graph_model::is_finite(desired)) {
        result.is_free = false;
        return result;
    }

    const double start_depth = intrusion(desired, radius, exclude_id);
    if (start_depth <= 0.0) return result;

    Vec2 best = desired;
    double best_depth = start_depth;
    const double step = params_.ring_step;

    for (int ring = 1; ring <= params_.max_rings; ++ring) {
        const double ring_radius = step * static_cast<double>(ring);
        const int steps = angular_steps_for_ring(ring_radius, step, params_.min_angular_steps);
        for (int k = 0; k < steps; ++k) {
            const double angle = kTwoPi * static_cast<double>(k) / static_cast<double>(steps);
            const Vec2 candidate{desired.x + std::cos(angle) * ring_radius,
                desired.y + std::sin(angle) * ring_radius};
            const double depth = intrusion(candidate, radius, exclude_id);
            if (depth <= 0.0) {
                result.position = candidate;
                result.rings_searched = ring;
                return result;
            }
            if (depth < best_depth) {
                best_depth = depth;
                best = candidate;
            }
        }
    }

    result.position = best;
    result.is_free = false;
    result.overlap_depth = best_depth;
    result.rings_searched = params_.max_rings;
    return result;
}

void SpatialIndex::sort_by_order(std::vector<std::string>& ids) const {
    std::sort(ids.begin(), ids.end(), [&](const std::string& a, const std::string& b) {
        return entries_.at(a).order < entries_.at(b).order;
    });
}

std::vector<std::string> SpatialIndex::query_nearby(Vec2 center, double reach,
    const std::string& exclude_id) const
{
    std::vector<std::string> out;
    if (!graph_model::is_finite(center) || !(reach >= 0.0)) return out;
    for (const Entry* e : candidates_near(center, reach + max_radius_, exclude_id)) {
        if (graph_model::distance(center, e->pos) <= reach + e->radius) {
            out.push_back(proxy_owner_.at(e->proxy_id));
        }
    }
    sort_by_order(out);
    return out;
}

std::vector<std::string> SpatialIndex::query_rect(const graph_model::Rect& rect) const {
    std::vector<int> hits;
    QueryContext ctx{&hits};
    b2AABB box;
    box.lowerBound = b2Vec2{static_cast<float>(rect.x - layout::aabb_pad),
        static_cast<float>(rect.y - layout::aabb_pad)};
    box.upperBound = b2Vec2{static_cast<float>(rect.right() + layout::aabb_pad),
        static_cast<float>(rect.bottom() + layout::aabb_pad)};
    b2DynamicTree_Query(&tree_, box, kNodeCategory, collect_proxy, &ctx);

    std::vector<std::string> out;
    for (int proxy_id : hits) {
        auto owner = proxy_owner_.find(proxy_id);
        if (owner == proxy_owner_.end()) continue;
        const Entry& e = entries_.at(owner->second);
        if (rect.contains(e.pos)) out.push_back(owner->second);
    }
    sort_by_order(out);
    return out;
}

std::optional<std::string> SpatialIndex::pick(Vec2 world) const {
    if (!graph_model::is_finite(world) || entries_.empty()) return std::nullopt;

    std::vector<int> hits;
    QueryContext ctx{&hits};
    b2DynamicTree_Query(&tree_, make_aabb(world, max_radius_), kNodeCategory, collect_proxy, &ctx);

    const std::string* best_id = nullptr;
    double best_dist = 0.0;
    std::size_t best_order = 0;
    for (int proxy_id : hits) {
        auto owner = proxy_owner_.find(proxy_id);
        if (owner == proxy_owner_.end()) continue;
        const Entry& e = entries_.at(owner->second);
        const double d = graph_model::distance(world, e.pos);
        if (d > e.radius) continue;
        if (!best_id || d < best_dist || (d == best_dist && e.order < best_order)) {
            best_id = &owner->second;
            best_dist = d;
            best_order = e.order;
        }
    }
    if (!best_id) return std::nullopt;
    return *best_id;
}

std::optional<graph_model::Rect> SpatialIndex::content_bounds() const {
    if (entries_.empty()) return std::nullopt;
    double min_x = std::numeric_limits<double>::max();
    double min_y = std::numeric_limits<double>::max();
    double max_x = std::numeric_limits<double>::lowest();
    double max_y = std::numeric_limits<double>::lowest();
    for (const auto& kv : entries_) {
        const Entry& e = kv.second;
        min_x = std::min(min_x, e.pos.x - e.radius);
        min_y = std::min(min_y, e.pos.y - e.radius);
        max_x = std::max(max_x, e.pos.x + e.radius);
        max_y = std::max(max_y, e.pos.y + e.radius);
    }
    return graph_model::Rect{min_x, min_y, max_x - min_x, max_y - min_y};
}

std::vector<std::pair<std::string, std::string>> SpatialIndex::overlapping_pairs() const {
    std::vector<std::pair<std::string, std::string>> pairs;
    for (const auto& id : order_) {
        const Entry& a = entries_.at(id);
        const double reach = a.radius + max_radius_ + params_.min_separation;
        std::vector<std::string> later;
        for (const Entry* b : candidates_near(a.pos, reach, id)) {
            if (b->order <= a.order) continue;
            const double required = a.radius + b->radius + params_.min_separation;
            if (graph_model::distance(a.pos, b->pos) < required) {
                later.push_back(proxy_owner_.at(b->proxy_id));
            }
        }
        sort_by_order(later);
        for (auto& other : later) pairs.emplace_back(id, std::move(other));
    }
    return pairs;
}

} // namespace graph_placement
