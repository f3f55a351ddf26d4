// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "geom/Geometry2D.hpp"

#include <algorithm>
#include <cmath>

namespace vrig::geom
{
    float angle_between(const glm::vec2& a, const glm::vec2& b)
    {
        return std::atan2(b.y - a.y, b.x - a.x);
    }

    float distance(const glm::vec2& a, const glm::vec2& b)
    {
        return glm::length(b - a);
    }

    glm::vec2 direction(float angle)
    {
        return { std::cos(angle), std::sin(angle) };
    }

    glm::vec2 rotate(const glm::vec2& v, float angle)
    {
        const float c = std::cos(angle);
        const float s = std::sin(angle);
        return { v.x * c - v.y * s, v.x * s + v.y * c };
    }

    glm::vec2 rotate_point(const glm::vec2& p, const glm::vec2& pivot, float angle)
    {
        return pivot + rotate(p - pivot, angle);
    }

    float point_to_segment_distance(const glm::vec2& p, const glm::vec2& a, const glm::vec2& b)
    {
        const glm::vec2 ab = b - a;
        const float len_sq = glm::dot(ab, ab);
        if (len_sq == 0.0f)
            return distance(p, a);

        const float t = std::clamp(glm::dot(p - a, ab) / len_sq, 0.0f, 1.0f);
        return distance(p, a + t * ab);
    }

    float wrap_angle(float angle)
    {
        if (!std::isfinite(angle))
            return angle;
        angle = std::fmod(angle + pi, two_pi);
        if (angle <= 0.0f) angle += two_pi;
        return angle - pi;
    }

    float lerp_angle(float a, float b, float t)
    {
        return a + wrap_angle(b - a) * t;
    }
}
