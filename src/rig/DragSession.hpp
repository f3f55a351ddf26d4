// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#ifndef DragSession_hpp
#define DragSession_hpp

#include <optional>

#include <glm/glm.hpp>

#include "rig/Keyframes.hpp"
#include "rig/RigStore.hpp"

namespace vrig
{
    enum class DragKind : uint8_t
    {
        CreateBone,
        Move,
        Rotate,
        Scale
    };

    /// @brief One pointer drag on the rig, from press to release.
    /// Edits are applied to the store as the pointer moves, using the store's rig
    /// mode. In Animate mode a single keyframe is recorded when the drag ends.
    class DragSession
    {
    public:
        explicit DragSession(RigStore& store);

        /// Start a drag. Move/Rotate/Scale need an existing bone, whose skeleton
        /// becomes active; CreateBone needs an active skeleton.
        /// @return false if the drag could not start
        bool begin(DragKind kind, const glm::vec2& pos, const BoneId& bone_id = BoneId{});

        void update(const glm::vec2& pos);

        /// Finish the drag at pos. Keys the active skeleton at frame_index when in
        /// Animate mode and the drag changed anything.
        /// @return The created bone for CreateBone drags
        std::optional<BoneId> end(const glm::vec2& pos, int frame_index);

        /// Drop the session without keying. Edits already applied stay.
        void cancel();

        bool active() const { return is_active; }
        DragKind kind() const { return drag_kind; }
        const BoneId& bone_id() const { return target; }
        const glm::vec2& start_position() const { return start_pos; }
        const glm::vec2& current_position() const { return last_pos; }

    private:
        KeyChannel touched_channel() const;

        RigStore& store;
        DragKind drag_kind = DragKind::Move;
        BoneId target;
        glm::vec2 start_pos{ 0.0f, 0.0f };
        glm::vec2 last_pos{ 0.0f, 0.0f };
        bool is_active = false;
        bool applied = false;
    };
}

#endif // DragSession_hpp
