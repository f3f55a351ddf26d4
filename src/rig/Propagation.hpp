// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <cstdint>
#include <vector>
#include "rig/Bone.hpp"

namespace vrig
{
    enum class PropagationMode : uint8_t
    {
        /// Live-pose edit. Children keep their angle and length; their attachment
        /// point follows the parent's live tail and any independent offset they
        /// carry is preserved.
        Animate,
        /// Rest-pose edit. The parent's head/tail similarity transform is applied to
        /// the whole branch and written to both live and rest poses.
        Edit
    };

    /// @brief Recompute all descendants of changed_bone after its pose changed.
    /// @param bones Bones of one skeleton, with changed_bone already updated.
    /// @param previous Same bones as they were before the change. In Animate mode
    ///        a parent missing from previous is taken to have been at rest.
    /// @param min_bone_length Lower bound for bone lengths produced by Edit mode.
    /// Unknown changed_bone is a no-op. Each descendant is visited once, parents
    /// before children.
    void propagate_to_descendants(
        std::vector<Bone>& bones,
        const BoneId& changed_bone,
        PropagationMode mode,
        const std::vector<Bone>& previous,
        float min_bone_length);

    /// Where child's head sits on parent when the parent has parent_pose and the
    /// child carries no independent offset
    glm::vec2 attachment_point(const Bone& child, const Bone& parent, const BonePose& parent_pose);

    /// Animate-mode placement of a child after its parent moved from
    /// old_parent_pose to parent.pose. The child's offset from its old attachment
    /// point is kept.
    BonePose follow_parent(const Bone& child, const BonePose& old_parent_pose, const Bone& parent);

    /// Map p through the similarity transform taking old_parent's segment onto
    /// new_parent's segment, pivoting on the tail. Degenerate segments translate
    /// by the head delta.
    glm::vec2 transform_by_parent_delta(
        const glm::vec2& p,
        const BonePose& old_parent,
        const BonePose& new_parent);
}
