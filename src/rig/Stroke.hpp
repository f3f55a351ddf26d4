// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <optional>
#include <vector>
#include <glm/glm.hpp>
#include "rig/Ids.h"

namespace vrig
{
    // Stroke geometry is owned by the host's tweening system. The rig only reads
    // per-frame copies and returns deformed copies.

    struct StrokePoint
    {
        glm::vec2 pos{ 0.0f, 0.0f };
        std::optional<glm::vec2> cp1; // Bezier handles
        std::optional<glm::vec2> cp2;

        bool operator==(const StrokePoint& other) const
        {
            return pos == other.pos && cp1 == other.cp1 && cp2 == other.cp2;
        }
    };

    struct Stroke
    {
        StrokeId id;
        LayerId layer_id;
        std::vector<StrokePoint> points;
        std::vector<StrokeId> parent_ids; // Source strokes this one was derived from

        bool derives_from(const StrokeId& stroke_id) const;

        bool operator==(const Stroke& other) const
        {
            return id == other.id && layer_id == other.layer_id
                && points == other.points && parent_ids == other.parent_ids;
        }
    };

    /// Node in the host's layer tree (groups and switch layers have children)
    struct LayerNode
    {
        LayerId id;
        LayerId parent_id; // invalid = top level
    };

    inline bool Stroke::derives_from(const StrokeId& stroke_id) const
    {
        for (const auto& parent_id : parent_ids)
            if (parent_id == stroke_id) return true;
        return false;
    }
}
