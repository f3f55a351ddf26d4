// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "rig/Bone.hpp"
#include "geom/Geometry2D.hpp"
#include <sstream>

namespace vrig
{
    glm::vec2 BonePose::tail() const
    {
        return head + length * geom::direction(angle);
    }

    void Bone::set_segment(const glm::vec2& head, const glm::vec2& tail)
    {
        pose.head = head;
        pose.angle = geom::angle_between(head, tail);
        pose.length = geom::distance(head, tail);
        rest = pose;
    }

    std::string to_string(const BonePose& p)
    {
        std::ostringstream oss;
        const auto t = p.tail();
        oss << "head (" << p.head.x << ", " << p.head.y << ")"
            << " tail (" << t.x << ", " << t.y << ")"
            << " angle " << p.angle
            << " length " << p.length;
        return oss.str();
    }

    std::string to_string(const Bone& b)
    {
        std::ostringstream oss;
        oss << b.name << " [" << b.id.to_string() << "]";
        if (b.has_parent())
            oss << " parent " << b.parent_id.to_string();
        oss << " live {" << to_string(b.pose) << "}"
            << " rest {" << to_string(b.rest) << "}";
        return oss.str();
    }
}
