#pragma once

/**
 * @file SkeletonGraph.h
 * @brief Arena graph over a one-pixel skeleton
 *
 * Nodes are end points, junction clusters and an anchor pixel for each pure
 * loop. Branches are the pixel chains between them. Both live in flat
 * vectors and refer to each other by index; removal only flags entries so
 * indices stay stable.
 */

#include <VxTrace/Core/Types.h>
#include <VxTrace/Core/VPath.h>

#include <cstdint>
#include <vector>

namespace Vx::Trace::Internal {

struct SkeletonNode {
    Point2d position;
    std::vector<int32_t> branches;      ///< Incident branch ids (a loop appears twice)
    bool removed = false;
};

struct SkeletonBranch {
    int32_t from = -1;
    int32_t to = -1;
    std::vector<Point2i> pixels;        ///< From node pixel to node pixel
    double length = 0.0;
    bool removed = false;

    bool IsLoop() const { return from == to; }
};

class SkeletonGraph {
public:
    SkeletonGraph() = default;

    /**
     * @brief Build from a thinned binary map (8-connectivity)
     */
    static SkeletonGraph Build(const BinaryMap& skeleton);

    const std::vector<SkeletonNode>& Nodes() const { return nodes_; }
    const std::vector<SkeletonBranch>& Branches() const { return branches_; }

    /// Live incident branch count (a loop counts twice)
    int32_t Degree(int32_t node) const;

    size_t LiveBranchCount() const;

    /**
     * @brief Iteratively remove spurs and isolated chains shorter than minLength
     *
     * A branch is a spur when one of its nodes has degree 1. Shortest
     * candidates go first; degrees are rechecked after every removal so
     * the main body of a junction is never removed together with all
     * its arms in one round.
     *
     * @return Number of branches removed
     */
    int32_t Prune(double minLength);

    /**
     * @brief Merge the two branches meeting at every degree-2 node
     * @return Number of nodes collapsed
     */
    int32_t CollapseDegreeTwo();

    /**
     * @brief Live branches as polylines (loops closed), in branch order
     */
    std::vector<VPath> ToPaths() const;

private:
    int32_t AddBranch(int32_t from, int32_t to, std::vector<Point2i>&& pixels);
    void RemoveBranch(int32_t id);

    std::vector<SkeletonNode> nodes_;
    std::vector<SkeletonBranch> branches_;
};

/**
 * @brief Join open paths whose end points face each other across a small gap
 *
 * Two end points are bridged when they are within maxGap and each end's
 * outward tangent points at the other within maxAngleDeg. Closest pairs are
 * joined first and every end point is used at most once. Joining both ends
 * of one path closes it.
 */
std::vector<VPath> BridgeEndpoints(const std::vector<VPath>& paths, double maxGap,
                                   double maxAngleDeg = 45.0);

} // namespace Vx::Trace::Internal
