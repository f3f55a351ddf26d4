// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "rig/Propagation.hpp"
#include "rig/BoneGraph.hpp"
#include "geom/Geometry2D.hpp"

#include <algorithm>
#include <unordered_map>

namespace
{
    constexpr float degenerate_length = 1e-6f;

    void propagate_animate(
        std::vector<vrig::Bone>& bones,
        const vrig::BoneGraph& graph,
        size_t root,
        const std::vector<vrig::Bone>& previous)
    {
        std::unordered_map<vrig::BoneId, const vrig::Bone*> previous_by_id;
        for (const auto& bone : previous)
            previous_by_id.emplace(bone.id, &bone);

        auto branch = graph.get_branch_topdown(root);
        branch.pop_front();

        for (auto index : branch)
        {
            const auto& parent = bones[graph.get_parent(index)];

            // Without a recorded pre-change pose, measure against the rest pose
            auto old_parent_it = previous_by_id.find(parent.id);
            const vrig::BonePose& old_parent_pose = old_parent_it != previous_by_id.end()
                ? old_parent_it->second->pose
                : parent.rest;

            bones[index].pose = vrig::follow_parent(bones[index], old_parent_pose, parent);
        }
    }

    void propagate_edit(
        std::vector<vrig::Bone>& bones,
        const vrig::BoneGraph& graph,
        size_t root,
        const std::vector<vrig::Bone>& previous,
        float min_bone_length)
    {
        std::unordered_map<vrig::BoneId, const vrig::Bone*> previous_by_id;
        for (const auto& bone : previous)
            previous_by_id.emplace(bone.id, &bone);

        auto branch = graph.get_branch_topdown(root);
        branch.pop_front();

        for (auto index : branch)
        {
            const auto& new_parent = bones[graph.get_parent(index)];
            auto old_parent_it = previous_by_id.find(new_parent.id);
            auto old_child_it = previous_by_id.find(bones[index].id);
            if (old_parent_it == previous_by_id.end() || old_child_it == previous_by_id.end())
                continue;

            const auto& old_parent = old_parent_it->second->pose;
            const auto& old_child = old_child_it->second->pose;

            const glm::vec2 head = vrig::transform_by_parent_delta(old_child.head, old_parent, new_parent.pose);
            const glm::vec2 tail = vrig::transform_by_parent_delta(old_child.tail(), old_parent, new_parent.pose);

            auto& child = bones[index];
            child.pose.head = head;
            child.pose.angle = vrig::geom::angle_between(head, tail);
            child.pose.length = std::max(min_bone_length, vrig::geom::distance(head, tail));
            child.rest = child.pose;
        }
    }
}

namespace vrig
{
    glm::vec2 attachment_point(const Bone& child, const Bone& parent, const BonePose& parent_pose)
    {
        const glm::vec2 rest_offset = child.rest.head - parent.rest_tail();
        return parent_pose.tail() + geom::rotate(rest_offset, parent_pose.angle - parent.rest.angle);
    }

    BonePose follow_parent(const Bone& child, const BonePose& old_parent_pose, const Bone& parent)
    {
        const glm::vec2 independent_delta = child.pose.head - attachment_point(child, parent, old_parent_pose);

        BonePose pose = child.pose;
        pose.head = attachment_point(child, parent, parent.pose) + independent_delta;
        return pose;
    }

    glm::vec2 transform_by_parent_delta(
        const glm::vec2& p,
        const BonePose& old_parent,
        const BonePose& new_parent)
    {
        const glm::vec2 old_tail = old_parent.tail();
        const glm::vec2 new_tail = new_parent.tail();
        const glm::vec2 old_d = old_tail - old_parent.head;
        const glm::vec2 new_d = new_tail - new_parent.head;
        const float old_len = glm::length(old_d);
        const float new_len = glm::length(new_d);

        if (old_len < degenerate_length || new_len < degenerate_length)
            return p + (new_parent.head - old_parent.head);

        const glm::vec2 old_u = old_d / old_len;
        const glm::vec2 old_n{ -old_u.y, old_u.x };
        const glm::vec2 new_u = new_d / new_len;
        const glm::vec2 new_n{ -new_u.y, new_u.x };
        const float scale = new_len / old_len;

        const glm::vec2 rel = p - old_tail;
        const float along = glm::dot(rel, old_u) * scale;
        const float perp = glm::dot(rel, old_n) * scale;

        return new_tail + along * new_u + perp * new_n;
    }

    void propagate_to_descendants(
        std::vector<Bone>& bones,
        const BoneId& changed_bone,
        PropagationMode mode,
        const std::vector<Bone>& previous,
        float min_bone_length)
    {
        const BoneGraph graph(bones);
        const size_t root = graph.find(changed_bone);
        if (root == BoneGraph::npos)
            return;

        switch (mode)
        {
        case PropagationMode::Animate:
            propagate_animate(bones, graph, root, previous);
            break;
        case PropagationMode::Edit:
            propagate_edit(bones, graph, root, previous, min_bone_length);
            break;
        }
    }
}
