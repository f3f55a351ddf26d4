// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#ifndef Bone_hpp
#define Bone_hpp

#include <string>
#include <glm/glm.hpp>
#include "rig/Ids.h"

namespace vrig
{
    /// @brief Pose of a bone segment in world space. The tail is derived from
    /// head, angle and length and is never stored.
    struct BonePose
    {
        glm::vec2 head{ 0.0f, 0.0f };
        float angle{ 0.0f };    // World-space radians
        float length{ 0.0f };

        glm::vec2 tail() const;
    };

    struct Bone
    {
        BoneId id;
        std::string name{ "Bone" };
        BoneId parent_id; // Weak back-reference, invalid = root

        BonePose pose;    // Live pose
        BonePose rest;    // Rest pose baseline, changed by edit operations only

        std::string color{ "#f59e0b" };
        float strength{ 1.0f };
        float flexi_radius{ 120.0f };
        int z_order{ 0 };

        bool has_parent() const { return parent_id.valid(); }

        glm::vec2 tail() const { return pose.tail(); }
        glm::vec2 rest_tail() const { return rest.tail(); }

        /// Set both live and rest pose from a head/tail segment
        void set_segment(const glm::vec2& head, const glm::vec2& tail);
    };

    std::string to_string(const BonePose& p);
    std::string to_string(const Bone& b);
}

#endif // Bone_hpp
