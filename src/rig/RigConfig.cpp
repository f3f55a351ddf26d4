// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "rig/RigConfig.hpp"

#include <array>

namespace
{
    using vrig::RigFlag;
    using vrig::RigValue;

    constexpr std::array flag_list{ RigFlag::InheritParent, RigFlag::KeyAllChannels };
    constexpr std::array value_list{
        RigValue::DefaultFlexiRadius,
        RigValue::MinBoneLength,
        RigValue::FlexiMinWeight,
        RigValue::MinCreateDistance };

    bool default_flag(RigFlag flag)
    {
        switch (flag)
        {
        case RigFlag::InheritParent: return true;
        case RigFlag::KeyAllChannels: return true;
        }
        return false;
    }

    float default_value(RigValue key)
    {
        switch (key)
        {
        case RigValue::DefaultFlexiRadius: return 120.0f;
        case RigValue::MinBoneLength: return 5.0f;
        case RigValue::FlexiMinWeight: return 0.01f;
        case RigValue::MinCreateDistance: return 5.0f;
        }
        return 0.0f;
    }
}

namespace vrig
{
    const char* to_string(RigFlag flag)
    {
        switch (flag)
        {
        case RigFlag::InheritParent: return "inherit_parent";
        case RigFlag::KeyAllChannels: return "key_all_channels";
        }
        return "unknown";
    }

    const char* to_string(RigValue value)
    {
        switch (value)
        {
        case RigValue::DefaultFlexiRadius: return "default_flexi_radius";
        case RigValue::MinBoneLength: return "min_bone_length";
        case RigValue::FlexiMinWeight: return "flexi_min_weight";
        case RigValue::MinCreateDistance: return "min_create_distance";
        }
        return "unknown";
    }

    std::optional<RigFlag> rig_flag_from_string(const std::string& name)
    {
        for (auto flag : flag_list)
            if (name == to_string(flag)) return flag;
        return std::nullopt;
    }

    std::optional<RigValue> rig_value_from_string(const std::string& name)
    {
        for (auto value : value_list)
            if (name == to_string(value)) return value;
        return std::nullopt;
    }

    RigConfig::RigConfig()
    {
        reset();
    }

    void RigConfig::set_flag(RigFlag flag, bool enabled)
    {
        flags[flag] = enabled;
    }

    bool RigConfig::get_flag(RigFlag flag) const
    {
        auto it = flags.find(flag);
        return it != flags.end() ? it->second : default_flag(flag);
    }

    void RigConfig::set_value(RigValue key, float new_value)
    {
        values[key] = new_value;
    }

    float RigConfig::get_value(RigValue key) const
    {
        auto it = values.find(key);
        return it != values.end() ? it->second : default_value(key);
    }

    void RigConfig::reset()
    {
        flags.clear();
        values.clear();
        for (auto flag : flag_list)
            flags[flag] = default_flag(flag);
        for (auto value : value_list)
            values[value] = default_value(value);
    }
}
