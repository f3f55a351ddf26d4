// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "rig/Deformation.hpp"
#include "geom/Geometry2D.hpp"

#include <cmath>
#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace
{
    constexpr float rotation_epsilon = 1e-5f;
    constexpr float translation_epsilon = 1e-3f;
    constexpr float scale_epsilon = 1e-3f;

    std::unordered_map<vrig::BoneId, const vrig::Bone*> index_bones(const std::vector<vrig::Skeleton>& skeletons)
    {
        std::unordered_map<vrig::BoneId, const vrig::Bone*> bones;
        for (const auto& skeleton : skeletons)
            for (const auto& bone : skeleton.bones)
                bones.emplace(bone.id, &bone);
        return bones;
    }
}

namespace vrig
{
    bool BoneDelta::negligible() const
    {
        return std::abs(angle) <= rotation_epsilon
            && std::abs(head.x) <= translation_epsilon
            && std::abs(head.y) <= translation_epsilon
            && std::abs(axial_scale - 1.0f) <= scale_epsilon;
    }

    BoneDelta compute_bone_delta(const Bone& bone)
    {
        BoneDelta delta;
        delta.angle = bone.pose.angle - bone.rest.angle;
        delta.head = bone.pose.head - bone.rest.head;
        delta.axial_scale = bone.rest.length > 0.0f ? bone.pose.length / bone.rest.length : 1.0f;
        delta.perp_scale = delta.axial_scale > 0.0f ? 1.0f / std::sqrt(std::abs(delta.axial_scale)) : 1.0f;
        return delta;
    }

    glm::vec2 deform_point(const glm::vec2& p, const Bone& bone, const BoneDelta& delta, float frame_angle)
    {
        // Offset in the (axial, perpendicular) frame
        glm::vec2 local = geom::rotate(p - bone.rest.head, -frame_angle);
        local.x *= delta.axial_scale;
        local.y *= delta.perp_scale;

        const glm::vec2 scaled = geom::rotate(local, frame_angle);
        return bone.pose.head + geom::rotate(scaled, delta.angle);
    }

    std::vector<Stroke> deform_strokes(
        const std::vector<Stroke>& strokes,
        const std::vector<Skeleton>& skeletons,
        const std::vector<BoundPoint>& bound_points)
    {
        std::vector<Stroke> result = strokes;
        if (bound_points.empty() || skeletons.empty())
            return result;

        const auto bones = index_bones(skeletons);

        // Source stroke id -> indices of strokes it drives (itself and derived strokes)
        std::unordered_map<StrokeId, std::vector<size_t>> driven_strokes;
        for (size_t i = 0; i < strokes.size(); i++)
        {
            driven_strokes[strokes[i].id].push_back(i);
            for (const auto& parent_id : strokes[i].parent_ids)
            {
                // A source listed more than once drives the stroke once
                auto& driven = driven_strokes[parent_id];
                if (driven.empty() || driven.back() != i)
                    driven.push_back(i);
            }
        }

        // Per stroke, per point accumulated displacement
        std::unordered_map<size_t, std::unordered_map<int, glm::vec2>> displacements;

        for (const auto& binding : bound_points)
        {
            auto bone_it = bones.find(binding.bone_id);
            if (bone_it == bones.end())
                continue;
            const Bone& bone = *bone_it->second;

            const BoneDelta delta = compute_bone_delta(bone);
            if (delta.negligible())
                continue;

            auto driven_it = driven_strokes.find(binding.stroke_id);
            if (driven_it == driven_strokes.end())
                continue;

            for (auto stroke_index : driven_it->second)
            {
                const auto& points = strokes[stroke_index].points;
                if (binding.point_index < 0 || static_cast<size_t>(binding.point_index) >= points.size())
                    continue;

                const glm::vec2& p = points[binding.point_index].pos;
                const glm::vec2 moved = deform_point(p, bone, delta, bone.rest.angle);

                auto [it, inserted] = displacements[stroke_index].try_emplace(binding.point_index, 0.0f, 0.0f);
                it->second += (moved - p) * binding.weight;
            }
        }

        for (const auto& [stroke_index, point_displacements] : displacements)
        {
            auto& points = result[stroke_index].points;
            for (const auto& [point_index, d] : point_displacements)
            {
                auto& pt = points[point_index];
                pt.pos += d;
                if (pt.cp1) *pt.cp1 += d;
                if (pt.cp2) *pt.cp2 += d;
            }
        }
        return result;
    }

    std::vector<LayerId> collect_descendant_layers(const LayerId& root_layer, const std::vector<LayerNode>& layers)
    {
        std::vector<LayerId> result{ root_layer };
        std::unordered_set<LayerId> visited{ root_layer };
        std::deque<LayerId> queue{ root_layer };

        while (!queue.empty())
        {
            const LayerId current = queue.front();
            queue.pop_front();
            for (const auto& layer : layers)
            {
                if (layer.parent_id != current || visited.contains(layer.id))
                    continue;
                visited.insert(layer.id);
                result.push_back(layer.id);
                queue.push_back(layer.id);
            }
        }
        return result;
    }

    std::vector<Stroke> deform_bound_layer_strokes(
        const std::vector<Stroke>& strokes,
        const std::vector<LayerNode>& layers,
        const std::vector<Skeleton>& skeletons,
        const std::vector<BoundLayer>& bound_layers)
    {
        std::vector<Stroke> result = strokes;
        if (bound_layers.empty() || skeletons.empty())
            return result;

        struct LayerTransform
        {
            const Bone* bone;
            BoneDelta delta;
        };
        std::unordered_map<LayerId, LayerTransform> layer_transforms;

        for (const auto& binding : bound_layers)
        {
            const Bone* bone = nullptr;
            for (const auto& skeleton : skeletons)
                if (skeleton.id == binding.skeleton_id)
                    bone = skeleton.find_bone(binding.bone_id);
            if (!bone)
                continue;

            const BoneDelta delta = compute_bone_delta(*bone);
            if (delta.negligible())
                continue;

            for (const auto& layer_id : collect_descendant_layers(binding.layer_id, layers))
                layer_transforms.insert_or_assign(layer_id, LayerTransform{ bone, delta });
        }

        if (layer_transforms.empty())
            return result;

        for (auto& stroke : result)
        {
            auto it = layer_transforms.find(stroke.layer_id);
            if (it == layer_transforms.end())
                continue;

            const auto& [bone, delta] = it->second;
            for (auto& pt : stroke.points)
            {
                pt.pos = deform_point(pt.pos, *bone, delta, 0.0f);
                if (pt.cp1) pt.cp1 = deform_point(*pt.cp1, *bone, delta, 0.0f);
                if (pt.cp2) pt.cp2 = deform_point(*pt.cp2, *bone, delta, 0.0f);
            }
        }
        return result;
    }
}
