// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#ifndef Skeleton_hpp
#define Skeleton_hpp

#include <string>
#include <vector>
#include "rig/Bone.hpp"

namespace vrig
{
    /// @brief Ordered collection of bones tied to one layer. The skeleton owns its
    /// bones; parent links between them are id references only.
    struct Skeleton
    {
        SkeletonId id;
        LayerId layer_id;
        std::string name{ "Skeleton" };
        std::vector<Bone> bones;

        Bone* find_bone(const BoneId& bone_id);
        const Bone* find_bone(const BoneId& bone_id) const;

        /// Index of bone in bones, or bones.size() if absent
        size_t bone_index(const BoneId& bone_id) const;

        bool contains(const BoneId& bone_id) const;
    };
}

#endif // Skeleton_hpp
