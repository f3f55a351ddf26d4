// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace vrig
{
    enum class RigFlag : uint8_t
    {
        InheritParent,      // Bone edits propagate to descendants
        KeyAllChannels,     // Drag sessions key every channel, not just the touched one
    };

    enum class RigValue : uint8_t
    {
        DefaultFlexiRadius,
        MinBoneLength,
        FlexiMinWeight,
        MinCreateDistance,
    };

    const char* to_string(RigFlag flag);
    const char* to_string(RigValue value);

    std::optional<RigFlag> rig_flag_from_string(const std::string& name);
    std::optional<RigValue> rig_value_from_string(const std::string& name);

    class RigConfig
    {
    public:
        RigConfig();

        void set_flag(RigFlag flag, bool enabled);

        bool get_flag(RigFlag flag) const;

        void set_value(RigValue key, float new_value);

        float get_value(RigValue key) const;

        /// Restore defaults
        void reset();

        const std::unordered_map<RigFlag, bool>& all_flags() const { return flags; }
        const std::unordered_map<RigValue, float>& all_values() const { return values; }

    private:
        std::unordered_map<RigFlag, bool> flags;
        std::unordered_map<RigValue, float> values;
    };
}
