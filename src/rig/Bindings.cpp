// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "rig/Bindings.hpp"
#include "geom/Geometry2D.hpp"

#include <algorithm>
#include <iterator>
#include <unordered_set>

namespace vrig
{
    void BindingTable::bind_point(const LayerId& layer_id, const BoundPoint& binding)
    {
        std::erase_if(bound_points, [&](const BoundPoint& bp)
            {
                return bp.stroke_id == binding.stroke_id
                    && bp.point_index == binding.point_index
                    && bp.bone_id == binding.bone_id;
            });
        bound_points.push_back(binding);

        unbind_layer(layer_id);
    }

    void BindingTable::unbind_point(const StrokeId& stroke_id, int point_index)
    {
        std::erase_if(bound_points, [&](const BoundPoint& bp)
            {
                return bp.stroke_id == stroke_id && bp.point_index == point_index;
            });
    }

    void BindingTable::unbind_stroke(const StrokeId& stroke_id)
    {
        std::erase_if(bound_points, [&](const BoundPoint& bp) { return bp.stroke_id == stroke_id; });
    }

    void BindingTable::bind_layer(const BoundLayer& binding, const std::vector<StrokeId>& strokes_on_layer)
    {
        unbind_layer(binding.layer_id);
        bound_layers.push_back(binding);

        const std::unordered_set<StrokeId> cleared(strokes_on_layer.begin(), strokes_on_layer.end());
        std::erase_if(bound_points, [&](const BoundPoint& bp) { return cleared.contains(bp.stroke_id); });
    }

    void BindingTable::unbind_layer(const LayerId& layer_id)
    {
        std::erase_if(bound_layers, [&](const BoundLayer& bl) { return bl.layer_id == layer_id; });
    }

    void BindingTable::remove_bone(const BoneId& bone_id)
    {
        auto points_of_bone = [&](const BoundPoint& bp) { return bp.bone_id == bone_id; };
        auto layers_of_bone = [&](const BoundLayer& bl) { return bl.bone_id == bone_id; };

        std::erase_if(bound_points, points_of_bone);
        std::erase_if(bound_layers, layers_of_bone);
        if (pre_flexi)
        {
            std::erase_if(pre_flexi->points, points_of_bone);
            std::erase_if(pre_flexi->layers, layers_of_bone);
        }
    }

    std::vector<BoundPoint> BindingTable::point_bindings(const StrokeId& stroke_id) const
    {
        std::vector<BoundPoint> result;
        std::copy_if(bound_points.begin(), bound_points.end(), std::back_inserter(result),
            [&](const BoundPoint& bp) { return bp.stroke_id == stroke_id; });
        return result;
    }

    const BoundLayer* BindingTable::layer_binding(const LayerId& layer_id) const
    {
        auto it = std::find_if(bound_layers.begin(), bound_layers.end(),
            [&](const BoundLayer& bl) { return bl.layer_id == layer_id; });
        return it == bound_layers.end() ? nullptr : &*it;
    }

    void BindingTable::assign(std::vector<BoundPoint> points, std::vector<BoundLayer> layers)
    {
        bound_points = std::move(points);
        bound_layers = std::move(layers);
        pre_flexi.reset();
    }

    void BindingTable::clear()
    {
        bound_points.clear();
        bound_layers.clear();
        pre_flexi.reset();
    }

    size_t BindingTable::enable_flexi_bind(const std::vector<Stroke>& strokes, const Skeleton& skeleton, float min_weight)
    {
        if (!pre_flexi)
            pre_flexi = Snapshot{ bound_points, bound_layers };

        auto new_bindings = compute_flexi_bind_weights(strokes, skeleton, min_weight);

        std::unordered_set<StrokeId> stroke_ids;
        for (const auto& stroke : strokes)
            stroke_ids.insert(stroke.id);
        std::erase_if(bound_points, [&](const BoundPoint& bp) { return stroke_ids.contains(bp.stroke_id); });

        // Layers now driven by point bindings lose their layer binding
        std::unordered_set<StrokeId> bound_strokes;
        for (const auto& bp : new_bindings)
            bound_strokes.insert(bp.stroke_id);
        for (const auto& stroke : strokes)
            if (bound_strokes.contains(stroke.id))
                unbind_layer(stroke.layer_id);

        bound_points.insert(bound_points.end(), new_bindings.begin(), new_bindings.end());
        return new_bindings.size();
    }

    void BindingTable::disable_flexi_bind()
    {
        if (!pre_flexi)
            return;
        bound_points = std::move(pre_flexi->points);
        bound_layers = std::move(pre_flexi->layers);
        pre_flexi.reset();
    }

    std::vector<BoundPoint> compute_flexi_bind_weights(
        const std::vector<Stroke>& strokes,
        const Skeleton& skeleton,
        float min_weight)
    {
        struct Influence
        {
            BoneId bone_id;
            float weight;
        };

        std::vector<BoundPoint> result;
        std::vector<Influence> influences;

        for (const auto& stroke : strokes)
        {
            for (size_t i = 0; i < stroke.points.size(); i++)
            {
                const glm::vec2& p = stroke.points[i].pos;
                influences.clear();
                float total_weight = 0.0f;

                for (const auto& bone : skeleton.bones)
                {
                    const float radius = bone.flexi_radius * bone.strength;
                    if (!(radius > 0.0f))
                        continue;

                    const float d = geom::point_to_segment_distance(p, bone.pose.head, bone.tail());
                    if (d >= radius)
                        continue;

                    const float falloff = 1.0f - d / radius;
                    const float w = falloff * falloff;
                    influences.push_back({ bone.id, w });
                    total_weight += w;
                }

                if (total_weight <= 0.0f)
                    continue;

                for (const auto& influence : influences)
                {
                    const float normalized = influence.weight / total_weight;
                    if (normalized > min_weight)
                        result.push_back({ stroke.id, static_cast<int>(i), influence.bone_id, normalized });
                }
            }
        }
        return result;
    }
}
