// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "rig/DragSession.hpp"
#include "geom/Geometry2D.hpp"

namespace vrig
{
    namespace
    {
        constexpr float min_scale_distance = 1e-6f;
    }

    DragSession::DragSession(RigStore& store)
        : store(store)
    {
    }

    bool DragSession::begin(DragKind kind, const glm::vec2& pos, const BoneId& bone_id)
    {
        is_active = false;
        applied = false;

        if (kind == DragKind::CreateBone)
        {
            if (!store.active_skeleton_ptr())
                return false;
            target = BoneId{};
        }
        else
        {
            const auto* skeleton = store.skeleton_of(bone_id);
            if (!skeleton)
                return false;
            store.set_active_skeleton(skeleton->id);
            target = bone_id;
        }

        drag_kind = kind;
        start_pos = pos;
        last_pos = pos;
        is_active = true;
        return true;
    }

    void DragSession::update(const glm::vec2& pos)
    {
        if (!is_active)
            return;

        switch (drag_kind)
        {
        case DragKind::CreateBone:
            break;

        case DragKind::Move:
            if (pos != last_pos)
            {
                store.move_bone(target, pos - last_pos);
                applied = true;
            }
            break;

        case DragKind::Rotate:
            store.rotate_bone(target, pos);
            applied = true;
            break;

        case DragKind::Scale:
        {
            const auto* bone = store.find_bone(target);
            if (!bone)
                break;
            const float d_prev = geom::distance(bone->pose.head, last_pos);
            const float d_now = geom::distance(bone->pose.head, pos);
            if (d_prev > min_scale_distance)
            {
                store.scale_bone(target, d_now / d_prev);
                applied = true;
            }
            break;
        }
        }

        last_pos = pos;
    }

    std::optional<BoneId> DragSession::end(const glm::vec2& pos, int frame_index)
    {
        if (!is_active)
            return std::nullopt;

        std::optional<BoneId> created;
        if (drag_kind == DragKind::CreateBone)
        {
            last_pos = pos;
            if (geom::distance(start_pos, pos) > store.config().get_value(RigValue::MinCreateDistance))
                created = store.add_bone(start_pos, pos, store.active_bone_id());
        }
        else
        {
            update(pos);
            if (applied && store.rig_mode() == RigMode::Animate)
            {
                const ChannelSet channels = store.config().get_flag(RigFlag::KeyAllChannels)
                    ? ChannelSet::all()
                    : ChannelSet{ touched_channel() };
                store.record_keyframe(frame_index, channels);
            }
        }

        is_active = false;
        return created;
    }

    void DragSession::cancel()
    {
        is_active = false;
        applied = false;
    }

    KeyChannel DragSession::touched_channel() const
    {
        switch (drag_kind)
        {
        case DragKind::Rotate: return KeyChannel::Rotate;
        case DragKind::Scale: return KeyChannel::Scale;
        default: return KeyChannel::Translate;
        }
    }
}
