// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "rig/Keyframes.hpp"
#include "geom/Geometry2D.hpp"

#include <algorithm>

namespace
{
    using vrig::BoneChannelRecord;
    using vrig::KeyChannel;

    /// @brief Keyed records surrounding a frame for one bone channel.
    struct Bracket
    {
        const BoneChannelRecord* prev = nullptr;
        const BoneChannelRecord* next = nullptr;
        float t = 0.0f;
    };

    /// @brief Find the largest keyed frame <= frame_index and the smallest keyed
    /// frame >= frame_index. Outside the keyed range both ends clamp to the
    /// nearest key.
    std::optional<Bracket> find_bracket(
        const vrig::KeyframeStore::FrameMap& frames,
        const vrig::BoneId& bone_id,
        KeyChannel channel,
        int frame_index)
    {
        const BoneChannelRecord* first = nullptr;
        const BoneChannelRecord* last = nullptr;
        const BoneChannelRecord* prev = nullptr;
        const BoneChannelRecord* next = nullptr;
        int first_frame = 0, last_frame = 0, prev_frame = 0, next_frame = 0;

        for (const auto& [frame, record] : frames)
        {
            auto it = record.bones.find(bone_id);
            if (it == record.bones.end() || !it->second.keyed.contains(channel))
                continue;

            const BoneChannelRecord* entry = &it->second;
            if (!first) { first = entry; first_frame = frame; }
            last = entry; last_frame = frame;
            if (frame <= frame_index) { prev = entry; prev_frame = frame; }
            if (frame >= frame_index && !next) { next = entry; next_frame = frame; }
        }

        if (!first)
            return std::nullopt;
        if (!prev) { prev = first; prev_frame = first_frame; }
        if (!next) { next = last; next_frame = last_frame; }

        Bracket bracket{ prev, next, 0.0f };
        if (prev_frame != next_frame)
        {
            const float t = static_cast<float>(frame_index - prev_frame) / static_cast<float>(next_frame - prev_frame);
            bracket.t = std::clamp(t, 0.0f, 1.0f);
        }
        return bracket;
    }
}

namespace vrig
{
    // === ChannelSet ==========================================================

    ChannelSet::ChannelSet(std::initializer_list<KeyChannel> channels)
    {
        for (auto channel : channels)
            insert(channel);
    }

    ChannelSet ChannelSet::all()
    {
        return { KeyChannel::Translate, KeyChannel::Rotate, KeyChannel::Scale };
    }

    ChannelSet ChannelSet::from_bits(uint8_t bits)
    {
        ChannelSet set;
        set.bits = bits & all().bits;
        return set;
    }

    bool ChannelSet::contains(KeyChannel channel) const
    {
        return (bits & static_cast<uint8_t>(channel)) != 0;
    }

    bool ChannelSet::contains_all(const ChannelSet& other) const
    {
        return (bits & other.bits) == other.bits;
    }

    void ChannelSet::insert(KeyChannel channel)
    {
        bits |= static_cast<uint8_t>(channel);
    }

    void ChannelSet::erase(KeyChannel channel)
    {
        bits &= static_cast<uint8_t>(~static_cast<uint8_t>(channel));
    }

    ChannelSet ChannelSet::operator|(const ChannelSet& other) const
    {
        return from_bits(bits | other.bits);
    }

    ChannelSet ChannelSet::operator-(const ChannelSet& other) const
    {
        return from_bits(bits & static_cast<uint8_t>(~other.bits));
    }

    const char* to_string(KeyChannel channel)
    {
        switch (channel)
        {
        case KeyChannel::Translate: return "translate";
        case KeyChannel::Rotate: return "rotate";
        case KeyChannel::Scale: return "scale";
        }
        return "unknown";
    }

    // === KeyframeRecord ======================================================

    bool KeyframeRecord::empty() const
    {
        return std::all_of(bones.begin(), bones.end(),
            [](const auto& entry) { return entry.second.keyed.empty(); });
    }

    // === KeyframeStore =======================================================

    void KeyframeStore::record(const Skeleton& skeleton, int frame_index, ChannelSet channels)
    {
        auto& record = skeleton_records[skeleton.id][frame_index];
        record.frame_index = frame_index;

        for (const auto& bone : skeleton.bones)
        {
            auto& entry = record.bones[bone.id];

            if (channels.contains(KeyChannel::Translate))
            {
                entry.head_x = bone.pose.head.x;
                entry.head_y = bone.pose.head.y;
            }
            else
            {
                if (!entry.head_x) entry.head_x = bone.rest.head.x;
                if (!entry.head_y) entry.head_y = bone.rest.head.y;
            }

            if (channels.contains(KeyChannel::Rotate))
                entry.angle = bone.pose.angle;
            else if (!entry.angle)
                entry.angle = bone.rest.angle;

            if (channels.contains(KeyChannel::Scale))
                entry.length = bone.pose.length;
            else if (!entry.length)
                entry.length = bone.rest.length;

            entry.keyed = entry.keyed | channels;
        }
    }

    void KeyframeStore::remove(const SkeletonId& skeleton_id, int frame_index, std::optional<ChannelSet> channels)
    {
        auto skeleton_it = skeleton_records.find(skeleton_id);
        if (skeleton_it == skeleton_records.end())
            return;

        auto& frames = skeleton_it->second;
        auto frame_it = frames.find(frame_index);
        if (frame_it == frames.end())
            return;

        if (!channels || channels->contains_all(ChannelSet::all()))
        {
            frames.erase(frame_it);
            if (frames.empty())
                skeleton_records.erase(skeleton_it);
            return;
        }

        for (auto& [bone_id, entry] : frame_it->second.bones)
            entry.keyed = entry.keyed - *channels;
    }

    void KeyframeStore::remove_bone(const BoneId& bone_id)
    {
        for (auto& [skeleton_id, frames] : skeleton_records)
            for (auto& [frame, record] : frames)
                record.bones.erase(bone_id);
    }

    void KeyframeStore::remove_skeleton(const SkeletonId& skeleton_id)
    {
        skeleton_records.erase(skeleton_id);
    }

    void KeyframeStore::clear()
    {
        skeleton_records.clear();
    }

    bool KeyframeStore::empty() const
    {
        return skeleton_records.empty();
    }

    bool KeyframeStore::has_keyframes(const SkeletonId& skeleton_id) const
    {
        auto it = skeleton_records.find(skeleton_id);
        return it != skeleton_records.end() && !it->second.empty();
    }

    const KeyframeRecord* KeyframeStore::find(const SkeletonId& skeleton_id, int frame_index) const
    {
        auto skeleton_it = skeleton_records.find(skeleton_id);
        if (skeleton_it == skeleton_records.end())
            return nullptr;
        auto frame_it = skeleton_it->second.find(frame_index);
        return frame_it == skeleton_it->second.end() ? nullptr : &frame_it->second;
    }

    std::vector<int> KeyframeStore::keyed_frames(const SkeletonId& skeleton_id) const
    {
        std::vector<int> frames;
        auto it = skeleton_records.find(skeleton_id);
        if (it == skeleton_records.end())
            return frames;
        for (const auto& [frame, record] : it->second)
            frames.push_back(frame);
        return frames;
    }

    std::vector<int> KeyframeStore::keyed_frames(
        const SkeletonId& skeleton_id,
        const BoneId& bone_id,
        KeyChannel channel) const
    {
        std::vector<int> frames;
        auto it = skeleton_records.find(skeleton_id);
        if (it == skeleton_records.end())
            return frames;
        for (const auto& [frame, record] : it->second)
        {
            auto bone_it = record.bones.find(bone_id);
            if (bone_it != record.bones.end() && bone_it->second.keyed.contains(channel))
                frames.push_back(frame);
        }
        return frames;
    }

    BonePose KeyframeStore::evaluate_bone(const SkeletonId& skeleton_id, const Bone& bone, int frame_index) const
    {
        BonePose pose = bone.rest;

        auto it = skeleton_records.find(skeleton_id);
        if (it == skeleton_records.end())
            return pose;
        const auto& frames = it->second;

        if (auto b = find_bracket(frames, bone.id, KeyChannel::Translate, frame_index))
        {
            const glm::vec2 h0{
                b->prev->head_x.value_or(bone.rest.head.x),
                b->prev->head_y.value_or(bone.rest.head.y) };
            const glm::vec2 h1{
                b->next->head_x.value_or(bone.rest.head.x),
                b->next->head_y.value_or(bone.rest.head.y) };
            pose.head = glm::mix(h0, h1, b->t);
        }

        if (auto b = find_bracket(frames, bone.id, KeyChannel::Rotate, frame_index))
        {
            const float a0 = b->prev->angle.value_or(bone.rest.angle);
            const float a1 = b->next->angle.value_or(bone.rest.angle);
            pose.angle = geom::lerp_angle(a0, a1, b->t);
        }

        if (auto b = find_bracket(frames, bone.id, KeyChannel::Scale, frame_index))
        {
            const float l0 = b->prev->length.value_or(bone.rest.length);
            const float l1 = b->next->length.value_or(bone.rest.length);
            pose.length = glm::mix(l0, l1, b->t);
        }

        return pose;
    }

    void KeyframeStore::evaluate_skeleton(Skeleton& skeleton, int frame_index) const
    {
        for (auto& bone : skeleton.bones)
            bone.pose = evaluate_bone(skeleton.id, bone, frame_index);
    }

    void KeyframeStore::insert(const SkeletonId& skeleton_id, KeyframeRecord record)
    {
        const int frame_index = record.frame_index;
        skeleton_records[skeleton_id][frame_index] = std::move(record);
    }
}
