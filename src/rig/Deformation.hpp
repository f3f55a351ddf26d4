// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <vector>
#include "rig/Bindings.hpp"
#include "rig/Skeleton.hpp"
#include "rig/Stroke.hpp"

namespace vrig
{
    /// @brief Difference between a bone's live pose and its rest pose
    struct BoneDelta
    {
        float angle = 0.0f;                 // live - rest angle
        glm::vec2 head{ 0.0f, 0.0f };       // live - rest head
        float axial_scale = 1.0f;           // live / rest length
        float perp_scale = 1.0f;            // 1 / sqrt(axial), volume preserving

        /// True if applying the delta would not visibly move anything
        bool negligible() const;
    };

    BoneDelta compute_bone_delta(const Bone& bone);

    /// @brief Move p from the bone's rest frame to its live frame.
    /// The offset from the rest head is squashed/stretched along a frame at
    /// frame_angle (the bone's rest angle for point deformation, 0 for layers),
    /// rotated by the angle delta and re-attached to the live head.
    glm::vec2 deform_point(const glm::vec2& p, const Bone& bone, const BoneDelta& delta, float frame_angle);

    /// @brief Deform bound points by their bones' pose deltas. Weighted displacements
    /// of all bones bound to a point are summed. Strokes derived from a bound stroke
    /// are displaced by the same bindings, matched by point index. Bezier handles
    /// move with their anchor.
    std::vector<Stroke> deform_strokes(
        const std::vector<Stroke>& strokes,
        const std::vector<Skeleton>& skeletons,
        const std::vector<BoundPoint>& bound_points);

    /// @brief Deform every stroke on a bound layer, or on any layer nested below it,
    /// with a world-axis frame pivoting at the bone's rest head. When several layer
    /// bindings reach the same layer, the one processed last applies.
    std::vector<Stroke> deform_bound_layer_strokes(
        const std::vector<Stroke>& strokes,
        const std::vector<LayerNode>& layers,
        const std::vector<Skeleton>& skeletons,
        const std::vector<BoundLayer>& bound_layers);

    /// Layer ids of root_layer and all layers nested below it, breadth-first
    std::vector<LayerId> collect_descendant_layers(const LayerId& root_layer, const std::vector<LayerNode>& layers);
}
