// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <glm/glm.hpp>

namespace vrig::geom
{
    constexpr float pi = 3.14159265358979323846f;
    constexpr float two_pi = 2.0f * pi;

    /// World-space angle (radians) of the direction from a to b
    float angle_between(const glm::vec2& a, const glm::vec2& b);

    float distance(const glm::vec2& a, const glm::vec2& b);

    /// Unit direction for an angle
    glm::vec2 direction(float angle);

    /// Rotate v by angle around the origin
    glm::vec2 rotate(const glm::vec2& v, float angle);

    /// Rotate p by angle around pivot
    glm::vec2 rotate_point(const glm::vec2& p, const glm::vec2& pivot, float angle);

    /// Distance from p to the closed segment [a, b]. A zero-length segment
    /// degenerates to the distance to a.
    float point_to_segment_distance(const glm::vec2& p, const glm::vec2& a, const glm::vec2& b);

    /// Wrap an angle difference into (-pi, pi]
    float wrap_angle(float angle);

    /// Interpolate along the shortest arc from a to b
    float lerp_angle(float a, float b, float t);
}
