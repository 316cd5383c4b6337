/**
 * @file QuadTree.cpp
 * @brief Quad-tree insertion, splitting and queries
 */

#include <VxTrace/Internal/QuadTree.h>

#include <algorithm>
#include <utility>

namespace Vx::Trace::Internal {

QuadTree::QuadTree(const Rect2d& bounds, int32_t capacity, int32_t maxDepth)
    : capacity_(std::max(1, capacity))
    , maxDepth_(std::max(0, maxDepth))
{
    Node root;
    root.bounds = bounds.IsEmpty() ? Rect2d(0.0, 0.0, 1.0, 1.0) : bounds;
    nodes_.push_back(root);
}

int32_t QuadTree::ChildFor(const Node& node, const Rect2d& box) const {
    const Point2d c = node.bounds.Center();
    const bool left = box.maxX < c.x;
    const bool right = box.minX >= c.x;
    const bool top = box.maxY < c.y;
    const bool bottom = box.minY >= c.y;

    if (top && left) return 0;
    if (top && right) return 1;
    if (bottom && left) return 2;
    if (bottom && right) return 3;
    return -1;
}

void QuadTree::Split(int32_t nodeIndex) {
    const Rect2d b = nodes_[nodeIndex].bounds;
    const Point2d c = b.Center();
    const int32_t depth = nodes_[nodeIndex].depth + 1;

    const Rect2d quads[4] = {
        {b.minX, b.minY, c.x, c.y},
        {c.x, b.minY, b.maxX, c.y},
        {b.minX, c.y, c.x, b.maxY},
        {c.x, c.y, b.maxX, b.maxY}
    };

    for (int32_t q = 0; q < 4; ++q) {
        Node child;
        child.bounds = quads[q];
        child.depth = depth;
        nodes_.push_back(child);
        // push_back may reallocate; index again each time
        nodes_[nodeIndex].children[q] = static_cast<int32_t>(nodes_.size()) - 1;
    }

    std::vector<Item> items = std::move(nodes_[nodeIndex].items);
    nodes_[nodeIndex].items.clear();
    for (auto& item : items) {
        int32_t q = ChildFor(nodes_[nodeIndex], item.box);
        if (q < 0) {
            nodes_[nodeIndex].items.push_back(item);
        } else {
            nodes_[nodes_[nodeIndex].children[q]].items.push_back(item);
        }
    }
}

void QuadTree::Insert(int32_t index, const Rect2d& box) {
    Item item{index, static_cast<uint32_t>(count_), box};
    ++count_;

    int32_t current = 0;
    while (true) {
        Node& node = nodes_[current];
        if (!node.bounds.Intersects(box) && current == 0) {
            node.items.push_back(item);
            return;
        }
        if (node.IsLeaf()) {
            node.items.push_back(item);
            if (static_cast<int32_t>(node.items.size()) > capacity_ && node.depth < maxDepth_) {
                Split(current);
            }
            return;
        }
        int32_t q = ChildFor(node, box);
        if (q < 0) {
            node.items.push_back(item);
            return;
        }
        current = node.children[q];
    }
}

void QuadTree::Query(const Rect2d& query, std::vector<int32_t>& out) const {
    out.clear();
    if (query.IsEmpty()) return;

    std::vector<const Item*> hits;
    std::vector<int32_t> stack{0};
    while (!stack.empty()) {
        const Node& node = nodes_[stack.back()];
        stack.pop_back();

        for (const auto& item : node.items) {
            if (item.box.Intersects(query)) {
                hits.push_back(&item);
            }
        }
        if (!node.IsLeaf()) {
            for (int32_t child : node.children) {
                if (nodes_[child].bounds.Intersects(query)) {
                    stack.push_back(child);
                }
            }
        }
    }

    std::sort(hits.begin(), hits.end(), [](const Item* a, const Item* b) {
        return a->sequence < b->sequence;
    });
    out.reserve(hits.size());
    for (const Item* item : hits) {
        out.push_back(item->index);
    }
}

} // namespace Vx::Trace::Internal
