// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>
#include "rig/Skeleton.hpp"

namespace vrig
{
    /// Independently animatable facet of a bone pose
    enum class KeyChannel : uint8_t
    {
        Translate = 1 << 0, // head
        Rotate = 1 << 1,    // angle
        Scale = 1 << 2      // length
    };

    class ChannelSet
    {
        uint8_t bits = 0;

    public:
        ChannelSet() = default;
        ChannelSet(std::initializer_list<KeyChannel> channels);

        static ChannelSet all();
        static ChannelSet from_bits(uint8_t bits);

        bool contains(KeyChannel channel) const;
        bool contains_all(const ChannelSet& other) const;
        bool empty() const { return bits == 0; }

        void insert(KeyChannel channel);
        void erase(KeyChannel channel);

        /// Union
        ChannelSet operator|(const ChannelSet& other) const;
        /// Channels of this set not in other
        ChannelSet operator-(const ChannelSet& other) const;

        bool operator==(const ChannelSet& other) const { return bits == other.bits; }
        bool operator!=(const ChannelSet& other) const { return bits != other.bits; }

        uint8_t to_bits() const { return bits; }
    };

    const char* to_string(KeyChannel channel);

    /// One bone's partial pose at one keyframe. Values outside the keyed set are
    /// not authoritative at this frame.
    struct BoneChannelRecord
    {
        std::optional<float> angle;
        std::optional<float> head_x;
        std::optional<float> head_y;
        std::optional<float> length;
        ChannelSet keyed;
    };

    struct KeyframeRecord
    {
        int frame_index = 0;
        std::unordered_map<BoneId, BoneChannelRecord> bones;

        /// True if no bone has any keyed channel left
        bool empty() const;
    };

    /// @brief Sparse per-channel keyframes, per skeleton, ordered by frame.
    class KeyframeStore
    {
    public:
        using FrameMap = std::map<int, KeyframeRecord>;

        /// Capture the live values of channels for every bone of skeleton at
        /// frame_index. Channels outside the set keep their previous value at that
        /// frame (or the rest value if there was none). Keyed markers accumulate.
        void record(const Skeleton& skeleton, int frame_index, ChannelSet channels = ChannelSet::all());

        /// Remove the given channel markers from every bone at the frame. Removing
        /// all channels (or passing nullopt) drops the frame's record entirely.
        void remove(const SkeletonId& skeleton_id, int frame_index, std::optional<ChannelSet> channels = std::nullopt);

        /// Drop every trace of a bone (after the bone was deleted)
        void remove_bone(const BoneId& bone_id);

        void remove_skeleton(const SkeletonId& skeleton_id);

        void clear();

        bool empty() const;

        bool has_keyframes(const SkeletonId& skeleton_id) const;

        const KeyframeRecord* find(const SkeletonId& skeleton_id, int frame_index) const;

        /// Frames holding a record for the skeleton, ascending
        std::vector<int> keyed_frames(const SkeletonId& skeleton_id) const;

        /// Frames where the bone has the channel keyed, ascending
        std::vector<int> keyed_frames(const SkeletonId& skeleton_id, const BoneId& bone_id, KeyChannel channel) const;

        /// Keyframe-evaluated live pose of a bone at frame_index. Channels never
        /// keyed for the bone resolve to its rest pose.
        BonePose evaluate_bone(const SkeletonId& skeleton_id, const Bone& bone, int frame_index) const;

        /// Overwrite every bone's live pose with its evaluated pose. Parent
        /// propagation is not applied here.
        void evaluate_skeleton(Skeleton& skeleton, int frame_index) const;

        const std::unordered_map<SkeletonId, FrameMap>& records() const { return skeleton_records; }

        /// Insert or replace a whole record (used when restoring a document)
        void insert(const SkeletonId& skeleton_id, KeyframeRecord record);

    private:
        std::unordered_map<SkeletonId, FrameMap> skeleton_records;
    };
}
