// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "serializers/RigSerialize.hpp"

#include <nlohmann/json.hpp>

#include "rig/RigStore.hpp"

namespace vrig
{
    namespace
    {
        std::optional<KeyChannel> key_channel_from_string(const std::string& name)
        {
            for (auto channel : { KeyChannel::Translate, KeyChannel::Rotate, KeyChannel::Scale })
                if (name == to_string(channel)) return channel;
            return std::nullopt;
        }

        template<class T>
        void read_optional(const nlohmann::json& j, const char* key, std::optional<T>& value)
        {
            auto it = j.find(key);
            if (it == j.end() || it->is_null())
                value.reset();
            else
                value = it->template get<T>();
        }
    }

    template<class Tag>
    void to_json(nlohmann::json& j, const Id<Tag>& id)
    {
        if (id.valid())
            j = id.to_string();
        else
            j = nullptr;
    }

    template<class Tag>
    void from_json(const nlohmann::json& j, Id<Tag>& id)
    {
        if (j.is_null())
            id = Id<Tag>{};
        else
            id = Id<Tag>::from_string(j.get<std::string>());
    }

    template void to_json<BoneTag>(nlohmann::json&, const BoneId&);
    template void to_json<SkeletonTag>(nlohmann::json&, const SkeletonId&);
    template void to_json<StrokeTag>(nlohmann::json&, const StrokeId&);
    template void to_json<LayerTag>(nlohmann::json&, const LayerId&);
    template void from_json<BoneTag>(const nlohmann::json&, BoneId&);
    template void from_json<SkeletonTag>(const nlohmann::json&, SkeletonId&);
    template void from_json<StrokeTag>(const nlohmann::json&, StrokeId&);
    template void from_json<LayerTag>(const nlohmann::json&, LayerId&);

    void to_json(nlohmann::json& j, const BonePose& pose)
    {
        j = nlohmann::json{
            { "head", serializers::serialize_vec2(pose.head) },
            { "angle", pose.angle },
            { "length", pose.length }
        };
    }

    void from_json(const nlohmann::json& j, BonePose& pose)
    {
        pose.head = serializers::deserialize_vec2(j.at("head"));
        pose.angle = j.at("angle").get<float>();
        pose.length = j.at("length").get<float>();
    }

    void to_json(nlohmann::json& j, const Bone& bone)
    {
        j = nlohmann::json{
            { "id", bone.id },
            { "name", bone.name },
            { "parent_id", bone.parent_id },
            { "pose", bone.pose },
            { "rest", bone.rest },
            { "color", bone.color },
            { "strength", bone.strength },
            { "flexi_radius", bone.flexi_radius },
            { "z_order", bone.z_order }
        };
    }

    void from_json(const nlohmann::json& j, Bone& bone)
    {
        const Bone defaults;
        j.at("id").get_to(bone.id);
        bone.name = j.value("name", defaults.name);
        if (auto it = j.find("parent_id"); it != j.end())
            it->get_to(bone.parent_id);
        else
            bone.parent_id = BoneId{};
        j.at("pose").get_to(bone.pose);
        // Documents without a rest pose were saved at rest
        if (auto it = j.find("rest"); it != j.end())
            it->get_to(bone.rest);
        else
            bone.rest = bone.pose;
        bone.color = j.value("color", defaults.color);
        bone.strength = j.value("strength", defaults.strength);
        bone.flexi_radius = j.value("flexi_radius", defaults.flexi_radius);
        bone.z_order = j.value("z_order", defaults.z_order);
    }

    void to_json(nlohmann::json& j, const Skeleton& skeleton)
    {
        j = nlohmann::json{
            { "id", skeleton.id },
            { "layer_id", skeleton.layer_id },
            { "name", skeleton.name },
            { "bones", skeleton.bones }
        };
    }

    void from_json(const nlohmann::json& j, Skeleton& skeleton)
    {
        j.at("id").get_to(skeleton.id);
        j.at("layer_id").get_to(skeleton.layer_id);
        skeleton.name = j.value("name", std::string("Skeleton"));
        skeleton.bones = j.value("bones", std::vector<Bone>{});
    }

    void to_json(nlohmann::json& j, const BoundPoint& binding)
    {
        j = nlohmann::json{
            { "stroke_id", binding.stroke_id },
            { "point_index", binding.point_index },
            { "bone_id", binding.bone_id },
            { "weight", binding.weight }
        };
    }

    void from_json(const nlohmann::json& j, BoundPoint& binding)
    {
        j.at("stroke_id").get_to(binding.stroke_id);
        j.at("point_index").get_to(binding.point_index);
        j.at("bone_id").get_to(binding.bone_id);
        binding.weight = j.value("weight", 1.0f);
    }

    void to_json(nlohmann::json& j, const BoundLayer& binding)
    {
        j = nlohmann::json{
            { "layer_id", binding.layer_id },
            { "bone_id", binding.bone_id },
            { "skeleton_id", binding.skeleton_id }
        };
    }

    void from_json(const nlohmann::json& j, BoundLayer& binding)
    {
        j.at("layer_id").get_to(binding.layer_id);
        j.at("bone_id").get_to(binding.bone_id);
        j.at("skeleton_id").get_to(binding.skeleton_id);
    }

    void to_json(nlohmann::json& j, const BoneChannelRecord& record)
    {
        j = nlohmann::json::object();
        if (record.angle) j["angle"] = *record.angle;
        if (record.head_x) j["head_x"] = *record.head_x;
        if (record.head_y) j["head_y"] = *record.head_y;
        if (record.length) j["length"] = *record.length;

        auto keyed = nlohmann::json::array();
        for (auto channel : { KeyChannel::Translate, KeyChannel::Rotate, KeyChannel::Scale })
            if (record.keyed.contains(channel))
                keyed.push_back(to_string(channel));
        j["keyed"] = keyed;
    }

    void from_json(const nlohmann::json& j, BoneChannelRecord& record)
    {
        read_optional(j, "angle", record.angle);
        read_optional(j, "head_x", record.head_x);
        read_optional(j, "head_y", record.head_y);
        read_optional(j, "length", record.length);

        record.keyed = ChannelSet{};
        for (const auto& name : j.value("keyed", std::vector<std::string>{}))
        {
            auto channel = key_channel_from_string(name);
            if (!channel)
                throw RigSerializationError("Unknown key channel '" + name + "'");
            record.keyed.insert(*channel);
        }
    }

    void to_json(nlohmann::json& j, const RigConfig& config)
    {
        nlohmann::json flags = nlohmann::json::object();
        for (const auto& [flag, enabled] : config.all_flags())
            flags[to_string(flag)] = enabled;

        nlohmann::json values = nlohmann::json::object();
        for (const auto& [key, value] : config.all_values())
            values[to_string(key)] = value;

        j = nlohmann::json{ { "flags", flags }, { "values", values } };
    }

    void from_json(const nlohmann::json& j, RigConfig& config)
    {
        config.reset();

        // Unknown names are skipped so that newer documents still load
        if (auto it = j.find("flags"); it != j.end())
            for (const auto& [name, enabled] : it->items())
                if (auto flag = rig_flag_from_string(name))
                    config.set_flag(*flag, enabled.get<bool>());

        if (auto it = j.find("values"); it != j.end())
            for (const auto& [name, value] : it->items())
                if (auto key = rig_value_from_string(name))
                    config.set_value(*key, value.get<float>());
    }
}

namespace vrig::serializers
{
    nlohmann::json serialize_vec2(const glm::vec2& v)
    {
        return nlohmann::json::array({ v.x, v.y });
    }

    glm::vec2 deserialize_vec2(const nlohmann::json& j)
    {
        glm::vec2 v{ 0.0f, 0.0f };
        if (j.is_array())
        {
            if (j.size() > 0) v.x = j[0].get<float>();
            if (j.size() > 1) v.y = j[1].get<float>();
        }
        else if (j.is_object())
        {
            v.x = j.value("x", 0.0f);
            v.y = j.value("y", 0.0f);
        }
        return v;
    }

    nlohmann::json serialize_rig(const RigStore& store)
    {
        nlohmann::json keyframes = nlohmann::json::array();
        for (const auto& [skeleton_id, frames] : store.keyframes().records())
        {
            for (const auto& [frame_index, record] : frames)
            {
                nlohmann::json bones = nlohmann::json::array();
                for (const auto& [bone_id, channels] : record.bones)
                {
                    nlohmann::json jb = channels;
                    jb["bone_id"] = bone_id;
                    bones.push_back(std::move(jb));
                }
                keyframes.push_back(nlohmann::json{
                    { "skeleton_id", skeleton_id },
                    { "frame_index", frame_index },
                    { "bones", std::move(bones) } });
            }
        }

        return nlohmann::json{
            { "skeletons", store.skeletons() },
            { "bound_points", store.bindings().points() },
            { "bound_layers", store.bindings().layers() },
            { "keyframes", std::move(keyframes) },
            { "config", store.config() }
        };
    }

    void deserialize_rig(const nlohmann::json& j, RigStore& store)
    {
        try
        {
            auto skeletons = j.value("skeletons", std::vector<Skeleton>{});
            auto bound_points = j.value("bound_points", std::vector<BoundPoint>{});
            auto bound_layers = j.value("bound_layers", std::vector<BoundLayer>{});

            KeyframeStore keyframes;
            for (const auto& jk : j.value("keyframes", nlohmann::json::array()))
            {
                KeyframeRecord record;
                record.frame_index = jk.at("frame_index").get<int>();
                for (const auto& jb : jk.at("bones"))
                    record.bones[jb.at("bone_id").get<BoneId>()] = jb.get<BoneChannelRecord>();
                keyframes.insert(jk.at("skeleton_id").get<SkeletonId>(), std::move(record));
            }

            RigConfig config;
            if (auto it = j.find("config"); it != j.end())
                it->get_to(config);

            store.load(std::move(skeletons), std::move(bound_points), std::move(bound_layers), std::move(keyframes));
            store.config() = config;
        }
        catch (const nlohmann::json::exception& e)
        {
            throw RigSerializationError(std::string("Malformed rig document: ") + e.what());
        }
        catch (const std::invalid_argument& e)
        {
            throw RigSerializationError(std::string("Malformed rig document: ") + e.what());
        }
    }
}
