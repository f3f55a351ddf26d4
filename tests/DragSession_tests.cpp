// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include <gtest/gtest.h>
#include "rig/DragSession.hpp"
#include "geom/Geometry2D.hpp"

using namespace vrig;

namespace
{
    constexpr float eps = 1e-4f;
}

// A (0,0)-(10,0) -> B (10,0)-(20,0)
class DragSessionTest : public ::testing::Test
{
protected:
    RigStore store;
    SkeletonId skeleton_id;
    BoneId a, b;

    void SetUp() override
    {
        skeleton_id = store.create_skeleton(LayerId::generate());
        a = *store.add_bone({ 0, 0 }, { 10, 0 });
        b = *store.add_bone({ 10, 0 }, { 20, 0 }, a);
    }

    const Bone& bone(const BoneId& id) const { return *store.find_bone(id); }
};

TEST_F(DragSessionTest, AnimateMoveKeysOncePerSession)
{
    store.set_rig_mode(RigMode::Animate);
    DragSession drag(store);

    ASSERT_TRUE(drag.begin(DragKind::Move, { 15, 0 }, b));
    drag.update({ 16, 0 });
    drag.update({ 17, 1 });
    drag.end({ 18, 2 }, 3);

    EXPECT_FALSE(drag.active());
    EXPECT_NEAR(bone(b).pose.head.x, 13.0f, eps);
    EXPECT_NEAR(bone(b).pose.head.y, 2.0f, eps);
    EXPECT_NEAR(bone(b).rest.head.x, 10.0f, eps);

    EXPECT_EQ(store.keyframes().keyed_frames(skeleton_id), std::vector<int>{ 3 });
    const auto* record = store.keyframes().find(skeleton_id, 3);
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->bones.at(b).keyed, ChannelSet::all());
}

TEST_F(DragSessionTest, AnimateMoveOfRootKeepsChildAttached)
{
    store.set_rig_mode(RigMode::Animate);
    DragSession drag(store);

    ASSERT_TRUE(drag.begin(DragKind::Move, { 5, 0 }, a));
    for (int i = 1; i <= 4; i++)
        drag.update({ 5.0f, static_cast<float>(i) });
    drag.end({ 5, 4 }, 0);

    EXPECT_NEAR(bone(a).tail().x, 10.0f, eps);
    EXPECT_NEAR(bone(a).tail().y, 4.0f, eps);
    EXPECT_NEAR(bone(b).pose.head.x, bone(a).tail().x, eps);
    EXPECT_NEAR(bone(b).pose.head.y, bone(a).tail().y, eps);
}

TEST_F(DragSessionTest, TouchedChannelOnlyWhenNotKeyingAll)
{
    store.set_rig_mode(RigMode::Animate);
    store.config().set_flag(RigFlag::KeyAllChannels, false);
    DragSession drag(store);

    drag.begin(DragKind::Rotate, { 10, 0 }, a);
    drag.update({ 5, 5 });
    drag.end({ 0, 10 }, 7);

    EXPECT_NEAR(bone(a).pose.angle, geom::pi / 2, eps);
    const auto* record = store.keyframes().find(skeleton_id, 7);
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->bones.at(a).keyed, ChannelSet{ KeyChannel::Rotate });
}

TEST_F(DragSessionTest, NoKeyWithoutChange)
{
    store.set_rig_mode(RigMode::Animate);
    DragSession drag(store);

    drag.begin(DragKind::Move, { 5, 0 }, a);
    drag.end({ 5, 0 }, 2);
    EXPECT_FALSE(store.keyframes().has_keyframes(skeleton_id));
}

TEST_F(DragSessionTest, EditModeDoesNotKey)
{
    store.set_rig_mode(RigMode::Edit);
    DragSession drag(store);

    drag.begin(DragKind::Scale, { 10, 0 }, a);
    drag.update({ 15, 0 });
    drag.end({ 20, 0 }, 1);

    EXPECT_NEAR(bone(a).rest.length, 20.0f, eps);
    EXPECT_NEAR(bone(b).rest.head.x, 20.0f, eps);
    EXPECT_TRUE(store.keyframes().empty());
}

TEST_F(DragSessionTest, CreateBoneRespectsMinimumDistance)
{
    DragSession drag(store);
    store.select_bone(b);

    ASSERT_TRUE(drag.begin(DragKind::CreateBone, { 20, 0 }));
    drag.update({ 22, 0 });
    EXPECT_FLOAT_EQ(drag.current_position().x, 22.0f);
    EXPECT_FALSE(drag.end({ 23, 0 }, 0).has_value());
    EXPECT_EQ(store.skeletons().front().bones.size(), 2u);

    drag.begin(DragKind::CreateBone, { 20, 0 });
    auto created = drag.end({ 20, 15 }, 0);
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(bone(*created).parent_id, b);
    EXPECT_NEAR(bone(*created).pose.length, 15.0f, eps);
    EXPECT_EQ(store.active_bone_id(), *created);
}

TEST_F(DragSessionTest, BeginRejectsMissingTargets)
{
    DragSession drag(store);
    EXPECT_FALSE(drag.begin(DragKind::Move, { 0, 0 }, BoneId::generate()));
    EXPECT_FALSE(drag.active());

    RigStore empty;
    DragSession create(empty);
    EXPECT_FALSE(create.begin(DragKind::CreateBone, { 0, 0 }));

    // Updates and end on an inactive session are ignored
    drag.update({ 5, 5 });
    EXPECT_FALSE(drag.end({ 5, 5 }, 0).has_value());
}

TEST_F(DragSessionTest, BeginActivatesBoneSkeleton)
{
    auto other = store.create_skeleton(LayerId::generate());
    EXPECT_EQ(store.active_skeleton_id(), other);

    DragSession drag(store);
    drag.begin(DragKind::Move, { 0, 0 }, a);
    EXPECT_EQ(store.active_skeleton_id(), skeleton_id);
    drag.cancel();
    EXPECT_FALSE(drag.active());
}
