// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#ifndef RigStore_hpp
#define RigStore_hpp

#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "rig/Bindings.hpp"
#include "rig/Keyframes.hpp"
#include "rig/Propagation.hpp"
#include "rig/RigConfig.hpp"
#include "rig/Skeleton.hpp"
#include "rig/Stroke.hpp"

namespace vrig
{
    class ILogManager;

    enum class RigMode : uint8_t
    {
        Edit,       // Edits redefine the rest pose
        Animate     // Edits change the live pose only
    };

    /*
    Owner of all rig state:
    - Skeletons and their bones
    - Point and layer bindings, flexi-bind state
    - Per-channel bone keyframes
    - Bone selection, active skeleton, rig mode and config

    Operations that reference an unknown skeleton, bone or layer do nothing.
    Not thread-safe; callers serialize access.
    */
    class RigStore
    {
    public:
        explicit RigStore(std::shared_ptr<ILogManager> log_manager = nullptr);

        // --- Skeletons ---

        /// Create a skeleton on a layer and make it the active skeleton
        SkeletonId create_skeleton(const LayerId& layer_id, const std::string& name = "Skeleton");

        void rename_skeleton(const SkeletonId& skeleton_id, const std::string& name);

        /// Delete a skeleton together with its bindings and keyframes
        void delete_skeleton(const SkeletonId& skeleton_id);

        void set_active_skeleton(const SkeletonId& skeleton_id);

        SkeletonId active_skeleton_id() const { return active_skeleton; }

        const Skeleton* active_skeleton_ptr() const;

        const Skeleton* find_skeleton(const SkeletonId& skeleton_id) const;

        /// First skeleton owned by layer_id, or nullptr
        const Skeleton* skeleton_for_layer(const LayerId& layer_id) const;

        const std::vector<Skeleton>& skeletons() const { return skeleton_list; }

        // --- Bones ---

        /// Add a bone to the active skeleton with identical live and rest pose.
        /// The new bone becomes the active and only selected bone.
        /// @return Bone id, or nullopt if there is no active skeleton
        std::optional<BoneId> add_bone(const glm::vec2& head, const glm::vec2& tail, const BoneId& parent_id = BoneId{});

        /// Redefine a bone's angle and length (live and rest) from its head to tail
        void update_bone_tail(const BoneId& bone_id, const glm::vec2& tail);

        const Bone* find_bone(const BoneId& bone_id) const;

        const Skeleton* skeleton_of(const BoneId& bone_id) const;

        /// Set or clear (invalid parent_id) a bone's parent. Parents from another
        /// skeleton, and parents that would create a cycle, are rejected.
        void set_bone_parent(const BoneId& child_id, const BoneId& parent_id);

        /// Delete bones and everything bound to them. Surviving children are
        /// reparented to the nearest surviving ancestor.
        void delete_bones(const std::vector<BoneId>& bone_ids);

        void delete_selected_bones();

        void rename_bone(const BoneId& bone_id, const std::string& name);
        void set_bone_color(const BoneId& bone_id, const std::string& color);
        void set_bone_strength(const BoneId& bone_id, float strength);
        void set_bone_flexi_radius(const BoneId& bone_id, float radius);
        void set_bone_z_order(const BoneId& bone_id, int z_order);

        // --- Selection ---

        /// Select a bone and make it active. With multi, toggles its membership.
        void select_bone(const BoneId& bone_id, bool multi = false);

        void select_bones(const std::vector<BoneId>& bone_ids, bool additive);

        void clear_bone_selection();

        bool is_selected(const BoneId& bone_id) const;

        const std::unordered_set<BoneId>& selected_bones() const { return selection; }

        BoneId active_bone_id() const { return active_bone; }

        // --- Mode & config ---

        void set_rig_mode(RigMode mode) { mode_ = mode; }
        RigMode rig_mode() const { return mode_; }

        RigConfig& config() { return config_; }
        const RigConfig& config() const { return config_; }

        // --- Pose edits ---

        void edit_move_bone(const BoneId& bone_id, const glm::vec2& delta);
        void edit_rotate_bone(const BoneId& bone_id, const glm::vec2& tail_target);
        void edit_scale_bone(const BoneId& bone_id, float factor);

        void animate_move_bone(const BoneId& bone_id, const glm::vec2& delta);
        void animate_rotate_bone(const BoneId& bone_id, const glm::vec2& tail_target);
        void animate_scale_bone(const BoneId& bone_id, float factor);

        /// Return a bone's live pose to its rest pose
        void reset_bone_pose(const BoneId& bone_id);

        // Dispatch to the edit or animate variant according to the rig mode
        void move_bone(const BoneId& bone_id, const glm::vec2& delta);
        void rotate_bone(const BoneId& bone_id, const glm::vec2& tail_target);
        void scale_bone(const BoneId& bone_id, float factor);

        // --- Bindings ---

        /// Bind a point of a stroke on layer_id. Clears the layer's layer binding.
        void bind_point(
            const LayerId& layer_id,
            const StrokeId& stroke_id,
            int point_index,
            const BoneId& bone_id,
            float weight = 1.0f);

        void unbind_point(const StrokeId& stroke_id, int point_index);

        void unbind_stroke(const StrokeId& stroke_id);

        /// Bind a whole layer to a bone of skeleton_id, clearing the point
        /// bindings of the strokes currently on the layer
        void bind_layer(
            const LayerId& layer_id,
            const BoneId& bone_id,
            const SkeletonId& skeleton_id,
            const std::vector<StrokeId>& strokes_on_layer);

        void unbind_layer(const LayerId& layer_id);

        std::vector<BoundPoint> point_bindings(const StrokeId& stroke_id) const;

        const BoundLayer* layer_binding(const LayerId& layer_id) const;

        const BindingTable& bindings() const { return binding_table; }

        /// Auto-weight strokes to the given skeleton (active skeleton if invalid)
        /// @return Number of point bindings created
        size_t enable_flexi_bind(const std::vector<Stroke>& strokes, const SkeletonId& skeleton_id = SkeletonId{});

        void disable_flexi_bind();

        /// Disable if enabled, otherwise enable
        void toggle_flexi_bind(const std::vector<Stroke>& strokes, const SkeletonId& skeleton_id = SkeletonId{});

        bool flexi_bind_enabled() const { return binding_table.flexi_bind_enabled(); }

        // --- Keyframes ---

        /// Key the active skeleton's live pose at frame_index
        void record_keyframe(int frame_index, ChannelSet channels = ChannelSet::all());

        /// Delete channels (all if nullopt) of a skeleton's keyframe
        void delete_keyframe(int frame_index, const SkeletonId& skeleton_id, std::optional<ChannelSet> channels = std::nullopt);

        const KeyframeStore& keyframes() const { return keyframe_store; }

        /// Set every keyframed skeleton's live pose to its evaluated pose at
        /// frame_index, then re-attach children to their parents
        void apply_pose_at_frame(int frame_index);

        // --- Deformation ---

        std::vector<Stroke> deform_strokes(const std::vector<Stroke>& strokes) const;

        std::vector<Stroke> deform_bound_layer_strokes(
            const std::vector<Stroke>& strokes,
            const std::vector<LayerNode>& layers) const;

        // --- Document ---

        /// Replace all rig content. Session state (selection, flexi-bind snapshot)
        /// is reset and the first skeleton becomes active.
        void load(
            std::vector<Skeleton> skeletons,
            std::vector<BoundPoint> bound_points,
            std::vector<BoundLayer> bound_layers,
            KeyframeStore keyframes);

        void clear();

    private:
        Skeleton* find_skeleton_mut(const SkeletonId& skeleton_id);
        Skeleton* owner_of(const BoneId& bone_id);

        /// Apply updater to a bone, then propagate with mode if inheriting
        template<class F>
        void apply_bone_update(const BoneId& bone_id, F&& updater, PropagationMode mode);

        std::vector<Skeleton> skeleton_list;
        BindingTable binding_table;
        KeyframeStore keyframe_store;
        RigConfig config_;

        SkeletonId active_skeleton;
        BoneId active_bone;
        std::unordered_set<BoneId> selection;
        RigMode mode_ = RigMode::Edit;

        std::shared_ptr<ILogManager> log_manager;
    };
}

#endif // RigStore_hpp
