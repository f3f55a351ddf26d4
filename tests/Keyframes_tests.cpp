// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include <gtest/gtest.h>
#include <cmath>
#include "rig/Keyframes.hpp"
#include "geom/Geometry2D.hpp"

using namespace vrig;

namespace
{
    constexpr float eps = 1e-4f;
}

TEST(ChannelSetTest, SetOperations)
{
    ChannelSet tr{ KeyChannel::Translate, KeyChannel::Rotate };
    ChannelSet s{ KeyChannel::Scale };

    EXPECT_TRUE(tr.contains(KeyChannel::Rotate));
    EXPECT_FALSE(tr.contains(KeyChannel::Scale));
    EXPECT_EQ(tr | s, ChannelSet::all());
    EXPECT_EQ(ChannelSet::all() - tr, s);
    EXPECT_TRUE(ChannelSet::all().contains_all(tr));
    EXPECT_FALSE(tr.contains_all(ChannelSet::all()));
    EXPECT_TRUE((tr - tr).empty());

    // Bits outside the known channels are dropped
    EXPECT_EQ(ChannelSet::from_bits(0xff), ChannelSet::all());
    EXPECT_STREQ(to_string(KeyChannel::Scale), "scale");
}

class KeyframeStoreTest : public ::testing::Test
{
protected:
    Skeleton skeleton;
    KeyframeStore store;

    void SetUp() override
    {
        skeleton.id = SkeletonId::generate();
        skeleton.layer_id = LayerId::generate();

        Bone bone;
        bone.id = BoneId::generate();
        bone.set_segment({ 0, 0 }, { 10, 0 });
        skeleton.bones.push_back(bone);
    }

    Bone& bone() { return skeleton.bones.front(); }
};

TEST_F(KeyframeStoreTest, RotateOnlyRecordEvaluatesRestForOtherChannels)
{
    bone().pose.angle = 1.0f;
    bone().pose.head = { 5, 0 };
    bone().pose.length = 30.0f;
    store.record(skeleton, 10, { KeyChannel::Rotate });

    const auto* record = store.find(skeleton.id, 10);
    ASSERT_NE(record, nullptr);
    const auto& entry = record->bones.at(bone().id);
    EXPECT_EQ(entry.keyed, ChannelSet{ KeyChannel::Rotate });
    EXPECT_FLOAT_EQ(*entry.angle, 1.0f);
    EXPECT_FLOAT_EQ(*entry.head_x, 0.0f);   // Rest value, not the live one

    auto pose = store.evaluate_bone(skeleton.id, bone(), 10);
    EXPECT_FLOAT_EQ(pose.angle, 1.0f);
    EXPECT_FLOAT_EQ(pose.head.x, 0.0f);
    EXPECT_FLOAT_EQ(pose.head.y, 0.0f);
    EXPECT_FLOAT_EQ(pose.length, 10.0f);
}

TEST_F(KeyframeStoreTest, InterpolatesAndClampsOutsideRange)
{
    store.record(skeleton, 0);
    bone().pose.angle = 1.0f;
    bone().pose.length = 20.0f;
    bone().pose.head = { 10, 4 };
    store.record(skeleton, 10);

    auto mid = store.evaluate_bone(skeleton.id, bone(), 5);
    EXPECT_NEAR(mid.angle, 0.5f, eps);
    EXPECT_NEAR(mid.length, 15.0f, eps);
    EXPECT_NEAR(mid.head.x, 5.0f, eps);
    EXPECT_NEAR(mid.head.y, 2.0f, eps);

    auto before = store.evaluate_bone(skeleton.id, bone(), -5);
    EXPECT_NEAR(before.angle, 0.0f, eps);
    EXPECT_NEAR(before.length, 10.0f, eps);

    auto after = store.evaluate_bone(skeleton.id, bone(), 50);
    EXPECT_NEAR(after.angle, 1.0f, eps);
    EXPECT_NEAR(after.length, 20.0f, eps);
}

TEST_F(KeyframeStoreTest, AngleInterpolationTakesShortestArc)
{
    bone().pose.angle = 170.0f * geom::pi / 180.0f;
    store.record(skeleton, 0, { KeyChannel::Rotate });
    bone().pose.angle = -170.0f * geom::pi / 180.0f;
    store.record(skeleton, 10, { KeyChannel::Rotate });

    auto mid = store.evaluate_bone(skeleton.id, bone(), 5);
    EXPECT_NEAR(std::cos(mid.angle), -1.0f, eps);
}

TEST_F(KeyframeStoreTest, ChannelsBracketIndependently)
{
    store.record(skeleton, 0);
    bone().pose.angle = 1.0f;
    bone().pose.length = 40.0f;
    store.record(skeleton, 10, { KeyChannel::Rotate });

    // Scale is only keyed at frame 0
    auto pose = store.evaluate_bone(skeleton.id, bone(), 5);
    EXPECT_NEAR(pose.angle, 0.5f, eps);
    EXPECT_NEAR(pose.length, 10.0f, eps);

    EXPECT_EQ(store.keyed_frames(skeleton.id, bone().id, KeyChannel::Rotate), (std::vector<int>{ 0, 10 }));
    EXPECT_EQ(store.keyed_frames(skeleton.id, bone().id, KeyChannel::Scale), (std::vector<int>{ 0 }));
}

TEST_F(KeyframeStoreTest, RecordingAccumulatesMarkers)
{
    bone().pose.angle = 0.5f;
    store.record(skeleton, 3, { KeyChannel::Rotate });
    bone().pose.length = 12.0f;
    store.record(skeleton, 3, { KeyChannel::Scale });

    const auto& entry = store.find(skeleton.id, 3)->bones.at(bone().id);
    EXPECT_EQ(entry.keyed, (ChannelSet{ KeyChannel::Rotate, KeyChannel::Scale }));
    EXPECT_FLOAT_EQ(*entry.angle, 0.5f);
    EXPECT_FLOAT_EQ(*entry.length, 12.0f);
}

TEST_F(KeyframeStoreTest, RemoveChannelsKeepsRecord)
{
    store.record(skeleton, 10);
    store.remove(skeleton.id, 10, ChannelSet{ KeyChannel::Rotate });

    const auto* record = store.find(skeleton.id, 10);
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->bones.at(bone().id).keyed, (ChannelSet{ KeyChannel::Translate, KeyChannel::Scale }));
    EXPECT_TRUE(store.keyed_frames(skeleton.id, bone().id, KeyChannel::Rotate).empty());

    // Rotation now falls back to rest
    bone().pose.angle = 2.0f;
    EXPECT_FLOAT_EQ(store.evaluate_bone(skeleton.id, bone(), 10).angle, 0.0f);
}

TEST_F(KeyframeStoreTest, RemoveAllChannelsDropsRecord)
{
    store.record(skeleton, 10);
    store.record(skeleton, 20);

    store.remove(skeleton.id, 10);
    EXPECT_EQ(store.find(skeleton.id, 10), nullptr);
    EXPECT_TRUE(store.has_keyframes(skeleton.id));

    store.remove(skeleton.id, 20, ChannelSet::all());
    EXPECT_FALSE(store.has_keyframes(skeleton.id));
    EXPECT_TRUE(store.empty());

    // Removing from unknown frames and skeletons is harmless
    store.remove(skeleton.id, 99);
    store.remove(SkeletonId::generate(), 0);
}

TEST_F(KeyframeStoreTest, EvaluateSkeletonOverwritesLivePose)
{
    bone().pose.angle = 0.75f;
    store.record(skeleton, 0, { KeyChannel::Rotate });

    bone().pose.angle = 0.0f;
    bone().pose.head = { 100, 100 };
    store.evaluate_skeleton(skeleton, 0);

    EXPECT_FLOAT_EQ(bone().pose.angle, 0.75f);
    EXPECT_FLOAT_EQ(bone().pose.head.x, 0.0f);
}

TEST_F(KeyframeStoreTest, RemoveBoneDropsEntries)
{
    store.record(skeleton, 0);
    store.remove_bone(bone().id);

    EXPECT_TRUE(store.find(skeleton.id, 0)->bones.empty());
    EXPECT_TRUE(store.keyed_frames(skeleton.id, bone().id, KeyChannel::Translate).empty());
}
