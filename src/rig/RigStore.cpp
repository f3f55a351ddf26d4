// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "rig/RigStore.hpp"
#include "rig/BoneGraph.hpp"
#include "rig/Deformation.hpp"
#include "geom/Geometry2D.hpp"
#include "log/LogMacros.h"

#include <algorithm>
#include <unordered_map>
#include <utility>

namespace vrig
{
    RigStore::RigStore(std::shared_ptr<ILogManager> log_manager)
        : log_manager(std::move(log_manager))
    {
    }

    // === Skeletons ===========================================================

    SkeletonId RigStore::create_skeleton(const LayerId& layer_id, const std::string& name)
    {
        Skeleton skeleton;
        skeleton.id = SkeletonId::generate();
        skeleton.layer_id = layer_id;
        skeleton.name = name;
        skeleton_list.push_back(std::move(skeleton));

        active_skeleton = skeleton_list.back().id;
        VRIG_LOG_INFO(log_manager, "Created skeleton '%s' %s", name.c_str(), active_skeleton.to_string().c_str());
        return active_skeleton;
    }

    void RigStore::rename_skeleton(const SkeletonId& skeleton_id, const std::string& name)
    {
        if (auto* skeleton = find_skeleton_mut(skeleton_id))
            skeleton->name = name;
    }

    void RigStore::delete_skeleton(const SkeletonId& skeleton_id)
    {
        auto* skeleton = find_skeleton_mut(skeleton_id);
        if (!skeleton)
            return;

        for (const auto& bone : skeleton->bones)
        {
            binding_table.remove_bone(bone.id);
            selection.erase(bone.id);
            if (active_bone == bone.id)
                active_bone = BoneId{};
        }
        keyframe_store.remove_skeleton(skeleton_id);

        VRIG_LOG_INFO(log_manager, "Deleted skeleton '%s' (%zu bones)", skeleton->name.c_str(), skeleton->bones.size());
        std::erase_if(skeleton_list, [&](const Skeleton& s) { return s.id == skeleton_id; });

        if (active_skeleton == skeleton_id)
            active_skeleton = skeleton_list.empty() ? SkeletonId{} : skeleton_list.front().id;
    }

    void RigStore::set_active_skeleton(const SkeletonId& skeleton_id)
    {
        if (!skeleton_id.valid() || find_skeleton(skeleton_id))
            active_skeleton = skeleton_id;
    }

    const Skeleton* RigStore::active_skeleton_ptr() const
    {
        return find_skeleton(active_skeleton);
    }

    const Skeleton* RigStore::find_skeleton(const SkeletonId& skeleton_id) const
    {
        auto it = std::find_if(skeleton_list.begin(), skeleton_list.end(),
            [&](const Skeleton& s) { return s.id == skeleton_id; });
        return it == skeleton_list.end() ? nullptr : &*it;
    }

    Skeleton* RigStore::find_skeleton_mut(const SkeletonId& skeleton_id)
    {
        return const_cast<Skeleton*>(std::as_const(*this).find_skeleton(skeleton_id));
    }

    const Skeleton* RigStore::skeleton_for_layer(const LayerId& layer_id) const
    {
        auto it = std::find_if(skeleton_list.begin(), skeleton_list.end(),
            [&](const Skeleton& s) { return s.layer_id == layer_id; });
        return it == skeleton_list.end() ? nullptr : &*it;
    }

    // === Bones ===============================================================

    std::optional<BoneId> RigStore::add_bone(const glm::vec2& head, const glm::vec2& tail, const BoneId& parent_id)
    {
        auto* skeleton = find_skeleton_mut(active_skeleton);
        if (!skeleton)
            return std::nullopt;

        Bone bone;
        bone.id = BoneId::generate();
        bone.parent_id = skeleton->contains(parent_id) ? parent_id : BoneId{};
        bone.set_segment(head, tail);
        bone.flexi_radius = config_.get_value(RigValue::DefaultFlexiRadius);
        skeleton->bones.push_back(bone);

        active_bone = bone.id;
        selection = { bone.id };
        return bone.id;
    }

    void RigStore::update_bone_tail(const BoneId& bone_id, const glm::vec2& tail)
    {
        auto* skeleton = owner_of(bone_id);
        if (!skeleton)
            return;

        auto* bone = skeleton->find_bone(bone_id);
        bone->pose.angle = geom::angle_between(bone->pose.head, tail);
        bone->pose.length = geom::distance(bone->pose.head, tail);
        bone->rest.angle = bone->pose.angle;
        bone->rest.length = bone->pose.length;
    }

    const Bone* RigStore::find_bone(const BoneId& bone_id) const
    {
        for (const auto& skeleton : skeleton_list)
            if (const auto* bone = skeleton.find_bone(bone_id))
                return bone;
        return nullptr;
    }

    const Skeleton* RigStore::skeleton_of(const BoneId& bone_id) const
    {
        for (const auto& skeleton : skeleton_list)
            if (skeleton.contains(bone_id))
                return &skeleton;
        return nullptr;
    }

    Skeleton* RigStore::owner_of(const BoneId& bone_id)
    {
        return const_cast<Skeleton*>(std::as_const(*this).skeleton_of(bone_id));
    }

    void RigStore::set_bone_parent(const BoneId& child_id, const BoneId& parent_id)
    {
        auto* skeleton = owner_of(child_id);
        if (!skeleton)
            return;

        auto* child = skeleton->find_bone(child_id);
        if (!parent_id.valid())
        {
            child->parent_id = BoneId{};
            return;
        }

        const BoneGraph graph(skeleton->bones);
        const size_t child_index = graph.find(child_id);
        const size_t parent_index = graph.find(parent_id);
        if (parent_index == BoneGraph::npos)
        {
            VRIG_LOG_WARN(log_manager, "Parent %s is not in the skeleton of %s",
                parent_id.to_string().c_str(), child_id.to_string().c_str());
            return;
        }
        if (parent_index == child_index || graph.is_descendant_of(parent_index, child_index))
        {
            VRIG_LOG_WARN(log_manager, "Parenting %s to %s would create a cycle",
                child_id.to_string().c_str(), parent_id.to_string().c_str());
            return;
        }

        child->parent_id = parent_id;
    }

    void RigStore::delete_bones(const std::vector<BoneId>& bone_ids)
    {
        const std::unordered_set<BoneId> doomed(bone_ids.begin(), bone_ids.end());
        if (doomed.empty())
            return;

        for (auto& skeleton : skeleton_list)
        {
            std::unordered_map<BoneId, BoneId> parent_of;
            for (const auto& bone : skeleton.bones)
                parent_of.emplace(bone.id, bone.parent_id);

            // Nearest ancestor that survives the deletion
            auto surviving_ancestor = [&](BoneId id)
                {
                    size_t steps = 0;
                    while (id.valid() && doomed.contains(id) && steps++ < parent_of.size())
                    {
                        auto it = parent_of.find(id);
                        id = it == parent_of.end() ? BoneId{} : it->second;
                    }
                    return doomed.contains(id) ? BoneId{} : id;
                };

            for (auto& bone : skeleton.bones)
                if (!doomed.contains(bone.id) && doomed.contains(bone.parent_id))
                    bone.parent_id = surviving_ancestor(bone.parent_id);

            std::erase_if(skeleton.bones, [&](const Bone& b) { return doomed.contains(b.id); });
        }

        for (const auto& bone_id : doomed)
        {
            binding_table.remove_bone(bone_id);
            keyframe_store.remove_bone(bone_id);
            selection.erase(bone_id);
        }
        if (doomed.contains(active_bone))
            active_bone = BoneId{};
    }

    void RigStore::delete_selected_bones()
    {
        if (!find_skeleton(active_skeleton) || selection.empty())
            return;
        delete_bones(std::vector<BoneId>(selection.begin(), selection.end()));
        selection.clear();
        active_bone = BoneId{};
    }

    void RigStore::rename_bone(const BoneId& bone_id, const std::string& name)
    {
        if (auto* skeleton = owner_of(bone_id))
            skeleton->find_bone(bone_id)->name = name;
    }

    void RigStore::set_bone_color(const BoneId& bone_id, const std::string& color)
    {
        if (auto* skeleton = owner_of(bone_id))
            skeleton->find_bone(bone_id)->color = color;
    }

    void RigStore::set_bone_strength(const BoneId& bone_id, float strength)
    {
        if (auto* skeleton = owner_of(bone_id))
            skeleton->find_bone(bone_id)->strength = strength;
    }

    void RigStore::set_bone_flexi_radius(const BoneId& bone_id, float radius)
    {
        if (auto* skeleton = owner_of(bone_id))
            skeleton->find_bone(bone_id)->flexi_radius = radius;
    }

    void RigStore::set_bone_z_order(const BoneId& bone_id, int z_order)
    {
        if (auto* skeleton = owner_of(bone_id))
            skeleton->find_bone(bone_id)->z_order = z_order;
    }

    // === Selection ===========================================================

    void RigStore::select_bone(const BoneId& bone_id, bool multi)
    {
        if (!find_bone(bone_id))
            return;

        if (multi)
        {
            if (!selection.erase(bone_id))
                selection.insert(bone_id);
        }
        else
            selection = { bone_id };
        active_bone = bone_id;
    }

    void RigStore::select_bones(const std::vector<BoneId>& bone_ids, bool additive)
    {
        if (!additive)
            selection.clear();

        BoneId last;
        for (const auto& bone_id : bone_ids)
        {
            if (!find_bone(bone_id))
                continue;
            selection.insert(bone_id);
            last = bone_id;
        }
        active_bone = last;
    }

    void RigStore::clear_bone_selection()
    {
        selection.clear();
        active_bone = BoneId{};
    }

    bool RigStore::is_selected(const BoneId& bone_id) const
    {
        return selection.contains(bone_id);
    }

    // === Pose edits ==========================================================

    template<class F>
    void RigStore::apply_bone_update(const BoneId& bone_id, F&& updater, PropagationMode mode)
    {
        auto* skeleton = owner_of(bone_id);
        if (!skeleton)
            return;

        const bool inherit = config_.get_flag(RigFlag::InheritParent);
        std::vector<Bone> previous;
        if (inherit)
            previous = skeleton->bones;

        updater(*skeleton->find_bone(bone_id));

        if (inherit)
            propagate_to_descendants(
                skeleton->bones,
                bone_id,
                mode,
                previous,
                config_.get_value(RigValue::MinBoneLength));
    }

    void RigStore::edit_move_bone(const BoneId& bone_id, const glm::vec2& delta)
    {
        apply_bone_update(bone_id, [&](Bone& b)
            {
                b.pose.head += delta;
                b.rest.head += delta;
            }, PropagationMode::Edit);
    }

    void RigStore::edit_rotate_bone(const BoneId& bone_id, const glm::vec2& tail_target)
    {
        apply_bone_update(bone_id, [&](Bone& b)
            {
                const float angle = geom::angle_between(b.pose.head, tail_target);
                if (!(b.rest.length > 0.0f))
                    b.rest.length = geom::distance(b.pose.head, tail_target);
                b.pose.angle = angle;
                b.pose.length = b.rest.length;
                b.rest.angle = angle;
            }, PropagationMode::Edit);
    }

    void RigStore::edit_scale_bone(const BoneId& bone_id, float factor)
    {
        const float min_length = config_.get_value(RigValue::MinBoneLength);
        apply_bone_update(bone_id, [&](Bone& b)
            {
                const float length = std::max(min_length, b.pose.length * factor);
                b.pose.length = length;
                b.rest.length = length;
            }, PropagationMode::Edit);
    }

    void RigStore::animate_move_bone(const BoneId& bone_id, const glm::vec2& delta)
    {
        apply_bone_update(bone_id, [&](Bone& b) { b.pose.head += delta; }, PropagationMode::Animate);
    }

    void RigStore::animate_rotate_bone(const BoneId& bone_id, const glm::vec2& tail_target)
    {
        apply_bone_update(bone_id, [&](Bone& b)
            {
                b.pose.angle = geom::angle_between(b.pose.head, tail_target);
                if (!(b.pose.length > 0.0f))
                    b.pose.length = geom::distance(b.pose.head, tail_target);
            }, PropagationMode::Animate);
    }

    void RigStore::animate_scale_bone(const BoneId& bone_id, float factor)
    {
        const float min_length = config_.get_value(RigValue::MinBoneLength);
        apply_bone_update(bone_id, [&](Bone& b)
            {
                b.pose.length = std::max(min_length, b.pose.length * factor);
            }, PropagationMode::Animate);
    }

    void RigStore::reset_bone_pose(const BoneId& bone_id)
    {
        apply_bone_update(bone_id, [](Bone& b) { b.pose = b.rest; }, PropagationMode::Animate);
    }

    void RigStore::move_bone(const BoneId& bone_id, const glm::vec2& delta)
    {
        if (mode_ == RigMode::Edit) edit_move_bone(bone_id, delta);
        else animate_move_bone(bone_id, delta);
    }

    void RigStore::rotate_bone(const BoneId& bone_id, const glm::vec2& tail_target)
    {
        if (mode_ == RigMode::Edit) edit_rotate_bone(bone_id, tail_target);
        else animate_rotate_bone(bone_id, tail_target);
    }

    void RigStore::scale_bone(const BoneId& bone_id, float factor)
    {
        if (mode_ == RigMode::Edit) edit_scale_bone(bone_id, factor);
        else animate_scale_bone(bone_id, factor);
    }

    // === Bindings ============================================================

    void RigStore::bind_point(
        const LayerId& layer_id,
        const StrokeId& stroke_id,
        int point_index,
        const BoneId& bone_id,
        float weight)
    {
        if (!find_bone(bone_id))
            return;
        binding_table.bind_point(layer_id, BoundPoint{ stroke_id, point_index, bone_id, weight });
    }

    void RigStore::unbind_point(const StrokeId& stroke_id, int point_index)
    {
        binding_table.unbind_point(stroke_id, point_index);
    }

    void RigStore::unbind_stroke(const StrokeId& stroke_id)
    {
        binding_table.unbind_stroke(stroke_id);
    }

    void RigStore::bind_layer(
        const LayerId& layer_id,
        const BoneId& bone_id,
        const SkeletonId& skeleton_id,
        const std::vector<StrokeId>& strokes_on_layer)
    {
        const auto* skeleton = find_skeleton(skeleton_id);
        if (!skeleton || !skeleton->contains(bone_id))
            return;
        binding_table.bind_layer(BoundLayer{ layer_id, bone_id, skeleton_id }, strokes_on_layer);
    }

    void RigStore::unbind_layer(const LayerId& layer_id)
    {
        binding_table.unbind_layer(layer_id);
    }

    std::vector<BoundPoint> RigStore::point_bindings(const StrokeId& stroke_id) const
    {
        return binding_table.point_bindings(stroke_id);
    }

    const BoundLayer* RigStore::layer_binding(const LayerId& layer_id) const
    {
        return binding_table.layer_binding(layer_id);
    }

    size_t RigStore::enable_flexi_bind(const std::vector<Stroke>& strokes, const SkeletonId& skeleton_id)
    {
        const auto* skeleton = find_skeleton(skeleton_id.valid() ? skeleton_id : active_skeleton);
        if (!skeleton || skeleton->bones.empty())
            return 0;

        const size_t count = binding_table.enable_flexi_bind(
            strokes, *skeleton, config_.get_value(RigValue::FlexiMinWeight));
        VRIG_LOG_INFO(log_manager, "Flexi-bind: %zu point bindings to '%s'", count, skeleton->name.c_str());
        return count;
    }

    void RigStore::disable_flexi_bind()
    {
        if (!binding_table.flexi_bind_enabled())
            return;
        binding_table.disable_flexi_bind();
        VRIG_LOG_INFO(log_manager, "Flexi-bind disabled, previous bindings restored");
    }

    void RigStore::toggle_flexi_bind(const std::vector<Stroke>& strokes, const SkeletonId& skeleton_id)
    {
        if (binding_table.flexi_bind_enabled())
            disable_flexi_bind();
        else
            enable_flexi_bind(strokes, skeleton_id);
    }

    // === Keyframes ===========================================================

    void RigStore::record_keyframe(int frame_index, ChannelSet channels)
    {
        const auto* skeleton = find_skeleton(active_skeleton);
        if (!skeleton)
            return;

        keyframe_store.record(*skeleton, frame_index, channels);
        VRIG_LOG_INFO(log_manager, "Keyed '%s' at frame %d (channels 0x%x)",
            skeleton->name.c_str(), frame_index, static_cast<unsigned>(channels.to_bits()));
    }

    void RigStore::delete_keyframe(int frame_index, const SkeletonId& skeleton_id, std::optional<ChannelSet> channels)
    {
        if (!keyframe_store.find(skeleton_id, frame_index))
            return;

        keyframe_store.remove(skeleton_id, frame_index, channels);
        VRIG_LOG_INFO(log_manager, "Deleted keyframe at frame %d (channels 0x%x)",
            frame_index, static_cast<unsigned>(channels.value_or(ChannelSet::all()).to_bits()));
    }

    void RigStore::apply_pose_at_frame(int frame_index)
    {
        for (auto& skeleton : skeleton_list)
        {
            if (!keyframe_store.has_keyframes(skeleton.id))
                continue;

            keyframe_store.evaluate_skeleton(skeleton, frame_index);
            const std::vector<Bone> evaluated = skeleton.bones;

            // Parents before children. A keyed child head is measured against the
            // parent's evaluated pose, an unkeyed one sits at its rest attachment.
            const BoneGraph graph(skeleton.bones);
            for (auto index : graph.get_hierarchy_order())
            {
                const size_t parent_index = graph.get_parent(index);
                if (parent_index == BoneGraph::npos)
                    continue;

                auto& child = skeleton.bones[index];
                const auto& parent = skeleton.bones[parent_index];
                const bool head_keyed = !keyframe_store.keyed_frames(skeleton.id, child.id, KeyChannel::Translate).empty();
                const BonePose& reference = head_keyed ? evaluated[parent_index].pose : parent.rest;

                child.pose = follow_parent(child, reference, parent);
            }
        }
    }

    // === Deformation =========================================================

    std::vector<Stroke> RigStore::deform_strokes(const std::vector<Stroke>& strokes) const
    {
        return vrig::deform_strokes(strokes, skeleton_list, binding_table.points());
    }

    std::vector<Stroke> RigStore::deform_bound_layer_strokes(
        const std::vector<Stroke>& strokes,
        const std::vector<LayerNode>& layers) const
    {
        return vrig::deform_bound_layer_strokes(strokes, layers, skeleton_list, binding_table.layers());
    }

    // === Document ============================================================

    void RigStore::load(
        std::vector<Skeleton> skeletons,
        std::vector<BoundPoint> bound_points,
        std::vector<BoundLayer> bound_layers,
        KeyframeStore keyframes)
    {
        skeleton_list = std::move(skeletons);
        binding_table.assign(std::move(bound_points), std::move(bound_layers));
        keyframe_store = std::move(keyframes);

        selection.clear();
        active_bone = BoneId{};
        active_skeleton = skeleton_list.empty() ? SkeletonId{} : skeleton_list.front().id;

        VRIG_LOG_INFO(log_manager, "Loaded rig: %zu skeletons, %zu point bindings, %zu layer bindings",
            skeleton_list.size(), binding_table.points().size(), binding_table.layers().size());
    }

    void RigStore::clear()
    {
        skeleton_list.clear();
        binding_table.clear();
        keyframe_store.clear();
        selection.clear();
        active_bone = BoneId{};
        active_skeleton = SkeletonId{};
    }
}
