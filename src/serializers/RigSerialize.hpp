// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <stdexcept>
#include <string>

#include <glm/glm.hpp>

#include "rig/Ids.h"

namespace vrig
{
    class RigStore;
    class RigConfig;
    struct BonePose;
    struct Bone;
    struct Skeleton;
    struct BoundPoint;
    struct BoundLayer;
    struct BoneChannelRecord;

    /// Thrown when a rig document cannot be read
    class RigSerializationError : public std::runtime_error
    {
    public:
        explicit RigSerializationError(const std::string& what)
            : std::runtime_error(what) {}
    };

    // Ids are stored as strings, invalid ids as null
    template<class Tag>
    void to_json(nlohmann::json& j, const Id<Tag>& id);
    template<class Tag>
    void from_json(const nlohmann::json& j, Id<Tag>& id);

    void to_json(nlohmann::json& j, const BonePose& pose);
    void from_json(const nlohmann::json& j, BonePose& pose);
    void to_json(nlohmann::json& j, const Bone& bone);
    void from_json(const nlohmann::json& j, Bone& bone);
    void to_json(nlohmann::json& j, const Skeleton& skeleton);
    void from_json(const nlohmann::json& j, Skeleton& skeleton);
    void to_json(nlohmann::json& j, const BoundPoint& binding);
    void from_json(const nlohmann::json& j, BoundPoint& binding);
    void to_json(nlohmann::json& j, const BoundLayer& binding);
    void from_json(const nlohmann::json& j, BoundLayer& binding);
    void to_json(nlohmann::json& j, const BoneChannelRecord& record);
    void from_json(const nlohmann::json& j, BoneChannelRecord& record);
    void to_json(nlohmann::json& j, const RigConfig& config);
    void from_json(const nlohmann::json& j, RigConfig& config);
}

namespace vrig::serializers
{
    nlohmann::json serialize_vec2(const glm::vec2& v);

    /// Accepts [x, y] or {"x": x, "y": y}
    glm::vec2 deserialize_vec2(const nlohmann::json& j);

    /// Skeletons, bindings, keyframe records and config of the store
    nlohmann::json serialize_rig(const RigStore& store);

    /// Replace the store's content with a document written by serialize_rig.
    /// The store is left unchanged if the document is malformed.
    /// @throws RigSerializationError
    void deserialize_rig(const nlohmann::json& j, RigStore& store);
}
