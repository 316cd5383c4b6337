#pragma once

/**
 * @file QuadTree.h
 * @brief Region quadtree over axis-aligned boxes
 *
 * Stores indices into a caller-owned collection. Boxes that straddle a
 * split line stay in the parent node. Query results come back in insertion
 * order.
 */

#include <VxTrace/Core/Types.h>

#include <array>
#include <cstdint>
#include <vector>

namespace Vx::Trace::Internal {

class QuadTree {
public:
    /**
     * @param bounds Root region; boxes outside it are kept at the root
     * @param capacity Items per leaf before it splits
     * @param maxDepth Maximum subdivision depth
     */
    explicit QuadTree(const Rect2d& bounds, int32_t capacity = 8, int32_t maxDepth = 8);

    void Insert(int32_t index, const Rect2d& box);

    /**
     * @brief Indices whose box intersects query, in insertion order
     */
    void Query(const Rect2d& query, std::vector<int32_t>& out) const;

    size_t Size() const { return count_; }

private:
    struct Item {
        int32_t index;
        uint32_t sequence;
        Rect2d box;
    };

    struct Node {
        Rect2d bounds;
        int32_t depth = 0;
        std::array<int32_t, 4> children{{-1, -1, -1, -1}};
        std::vector<Item> items;

        bool IsLeaf() const { return children[0] < 0; }
    };

    void Split(int32_t nodeIndex);
    int32_t ChildFor(const Node& node, const Rect2d& box) const;

    std::vector<Node> nodes_;
    int32_t capacity_;
    int32_t maxDepth_;
    size_t count_ = 0;
};

} // namespace Vx::Trace::Internal
