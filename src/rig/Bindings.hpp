// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <optional>
#include <vector>
#include "rig/Skeleton.hpp"
#include "rig/Stroke.hpp"

namespace vrig
{
    struct BoundPoint
    {
        StrokeId stroke_id;
        int point_index = 0;
        BoneId bone_id;
        float weight = 1.0f;

        bool operator==(const BoundPoint& other) const
        {
            return stroke_id == other.stroke_id && point_index == other.point_index
                && bone_id == other.bone_id && weight == other.weight;
        }
    };

    struct BoundLayer
    {
        LayerId layer_id;
        BoneId bone_id;
        SkeletonId skeleton_id;

        bool operator==(const BoundLayer& other) const
        {
            return layer_id == other.layer_id && bone_id == other.bone_id
                && skeleton_id == other.skeleton_id;
        }
    };

    /// @brief Point and layer bindings. A layer is driven either by its own layer
    /// binding or by point bindings on its strokes, never both.
    class BindingTable
    {
    public:
        /// Upsert on (stroke, point, bone). Clears the layer binding of layer_id.
        void bind_point(const LayerId& layer_id, const BoundPoint& binding);

        void unbind_point(const StrokeId& stroke_id, int point_index);

        void unbind_stroke(const StrokeId& stroke_id);

        /// Replace the layer's binding and clear point bindings of the strokes
        /// currently on that layer.
        void bind_layer(const BoundLayer& binding, const std::vector<StrokeId>& strokes_on_layer);

        void unbind_layer(const LayerId& layer_id);

        /// Drop all bindings to a bone, including those held by the flexi-bind snapshot
        void remove_bone(const BoneId& bone_id);

        std::vector<BoundPoint> point_bindings(const StrokeId& stroke_id) const;

        const BoundLayer* layer_binding(const LayerId& layer_id) const;

        const std::vector<BoundPoint>& points() const { return bound_points; }
        const std::vector<BoundLayer>& layers() const { return bound_layers; }

        void assign(std::vector<BoundPoint> points, std::vector<BoundLayer> layers);

        void clear();

        // --- Flexi-bind ---

        bool flexi_bind_enabled() const { return pre_flexi.has_value(); }

        /// @brief Replace point bindings of strokes by proximity weights to the bones
        /// of skeleton. The binding state before the first activation is kept so that
        /// disable_flexi_bind() can restore it.
        /// @return Number of point bindings created
        size_t enable_flexi_bind(const std::vector<Stroke>& strokes, const Skeleton& skeleton, float min_weight);

        /// Restore the pre-activation bindings. No-op when not enabled.
        void disable_flexi_bind();

    private:
        struct Snapshot
        {
            std::vector<BoundPoint> points;
            std::vector<BoundLayer> layers;
        };

        std::vector<BoundPoint> bound_points;
        std::vector<BoundLayer> bound_layers;   // In binding order
        std::optional<Snapshot> pre_flexi;
    };

    /// @brief Proximity weights of every stroke point to the live segments of the
    /// skeleton's bones. A bone influences a point closer than
    /// flexi_radius * strength with raw weight (1 - d/r)^2; weights are normalized
    /// per point and those <= min_weight are dropped.
    std::vector<BoundPoint> compute_flexi_bind_weights(
        const std::vector<Stroke>& strokes,
        const Skeleton& skeleton,
        float min_weight);
}
