// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "rig/Skeleton.hpp"
#include <algorithm>

namespace vrig
{
    size_t Skeleton::bone_index(const BoneId& bone_id) const
    {
        auto it = std::find_if(bones.begin(), bones.end(),
            [&bone_id](const Bone& b) { return b.id == bone_id; });
        return static_cast<size_t>(std::distance(bones.begin(), it));
    }

    Bone* Skeleton::find_bone(const BoneId& bone_id)
    {
        const size_t index = bone_index(bone_id);
        return index < bones.size() ? &bones[index] : nullptr;
    }

    const Bone* Skeleton::find_bone(const BoneId& bone_id) const
    {
        const size_t index = bone_index(bone_id);
        return index < bones.size() ? &bones[index] : nullptr;
    }

    bool Skeleton::contains(const BoneId& bone_id) const
    {
        return bone_index(bone_id) < bones.size();
    }
}
