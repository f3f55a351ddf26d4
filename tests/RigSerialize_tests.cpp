// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "serializers/RigSerialize.hpp"
#include "rig/RigStore.hpp"

using namespace vrig;
using nlohmann::json;

class RigSerializeTest : public ::testing::Test
{
protected:
    RigStore store;
    LayerId layer = LayerId::generate();
    LayerId other_layer = LayerId::generate();
    StrokeId stroke = StrokeId::generate();
    SkeletonId skeleton_id;
    BoneId a, b;

    void SetUp() override
    {
        skeleton_id = store.create_skeleton(layer, "Arm");
        a = *store.add_bone({ 0, 0 }, { 10, 0 });
        b = *store.add_bone({ 10, 0 }, { 20, 0 }, a);
        store.set_bone_color(b, "#00ff00");
        store.set_bone_z_order(b, 2);

        store.bind_point(layer, stroke, 1, a, 0.25f);
        store.bind_layer(other_layer, b, skeleton_id, {});

        store.record_keyframe(0);
        store.animate_rotate_bone(a, { 0, 10 });
        store.record_keyframe(12, { KeyChannel::Rotate });

        store.config().set_value(RigValue::MinBoneLength, 2.0f);
    }
};

TEST_F(RigSerializeTest, DocumentRestoresStore)
{
    const json j = serializers::serialize_rig(store);

    RigStore restored;
    serializers::deserialize_rig(j, restored);

    ASSERT_EQ(restored.skeletons().size(), 1u);
    const auto& skeleton = restored.skeletons().front();
    EXPECT_EQ(skeleton.id, skeleton_id);
    EXPECT_EQ(skeleton.layer_id, layer);
    EXPECT_EQ(skeleton.name, "Arm");
    EXPECT_EQ(restored.active_skeleton_id(), skeleton_id);

    const auto* rb = restored.find_bone(b);
    ASSERT_NE(rb, nullptr);
    const auto* ob = store.find_bone(b);
    EXPECT_EQ(rb->parent_id, a);
    EXPECT_EQ(rb->color, "#00ff00");
    EXPECT_EQ(rb->z_order, 2);
    EXPECT_FLOAT_EQ(rb->pose.head.x, ob->pose.head.x);
    EXPECT_FLOAT_EQ(rb->pose.head.y, ob->pose.head.y);
    EXPECT_FLOAT_EQ(rb->rest.head.x, ob->rest.head.x);
    EXPECT_FALSE(restored.find_bone(a)->has_parent());

    EXPECT_EQ(restored.bindings().points(), store.bindings().points());
    EXPECT_EQ(restored.bindings().layers(), store.bindings().layers());

    EXPECT_EQ(restored.keyframes().keyed_frames(skeleton_id), (std::vector<int>{ 0, 12 }));
    const auto& entry = restored.keyframes().find(skeleton_id, 12)->bones.at(a);
    EXPECT_EQ(entry.keyed, ChannelSet{ KeyChannel::Rotate });
    EXPECT_FLOAT_EQ(*entry.angle, *store.keyframes().find(skeleton_id, 12)->bones.at(a).angle);

    EXPECT_FLOAT_EQ(restored.config().get_value(RigValue::MinBoneLength), 2.0f);
}

TEST_F(RigSerializeTest, DocumentLayout)
{
    const json j = serializers::serialize_rig(store);

    const auto& jb = j.at("skeletons").at(0).at("bones").at(0);
    EXPECT_EQ(jb.at("id").get<std::string>(), a.to_string());
    EXPECT_TRUE(jb.at("parent_id").is_null());
    EXPECT_TRUE(jb.at("pose").at("head").is_array());
    EXPECT_EQ(j.at("bound_points").at(0).at("point_index").get<int>(), 1);
    EXPECT_EQ(j.at("config").at("values").at("min_bone_length").get<float>(), 2.0f);
}

TEST_F(RigSerializeTest, MalformedDocumentThrowsAndKeepsStore)
{
    json bad_id = serializers::serialize_rig(store);
    bad_id["skeletons"][0]["id"] = "not-an-id";
    EXPECT_THROW(serializers::deserialize_rig(bad_id, store), RigSerializationError);

    json missing = serializers::serialize_rig(store);
    missing["skeletons"][0]["bones"][0].erase("pose");
    EXPECT_THROW(serializers::deserialize_rig(missing, store), RigSerializationError);

    json bad_channel = serializers::serialize_rig(store);
    bad_channel["keyframes"][0]["bones"][0]["keyed"] = json::array({ "shear" });
    EXPECT_THROW(serializers::deserialize_rig(bad_channel, store), RigSerializationError);

    EXPECT_EQ(store.skeletons().front().bones.size(), 2u);
}

TEST_F(RigSerializeTest, OptionalFieldsFallBack)
{
    json j = {
        { "skeletons", json::array({ {
            { "id", skeleton_id.to_string() },
            { "layer_id", layer.to_string() },
            { "bones", json::array({ {
                { "id", a.to_string() },
                { "pose", { { "head", { { "x", 1.0f }, { "y", 2.0f } } }, { "angle", 0.5f }, { "length", 8.0f } } } } }) } } }) } };

    RigStore restored;
    serializers::deserialize_rig(j, restored);

    const auto* bone = restored.find_bone(a);
    ASSERT_NE(bone, nullptr);
    EXPECT_FLOAT_EQ(bone->pose.head.x, 1.0f);
    EXPECT_FLOAT_EQ(bone->pose.head.y, 2.0f);
    EXPECT_FLOAT_EQ(bone->rest.length, 8.0f);   // Rest defaults to the live pose
    EXPECT_EQ(bone->name, "Bone");
    EXPECT_FLOAT_EQ(bone->flexi_radius, 120.0f);
    EXPECT_EQ(restored.skeletons().front().name, "Skeleton");
    EXPECT_TRUE(restored.keyframes().empty());
    EXPECT_TRUE(restored.config().get_flag(RigFlag::InheritParent));
}

TEST(RigConfigJsonTest, UnknownNamesAreSkipped)
{
    json j = { { "flags", { { "inherit_parent", false }, { "future_flag", true } } },
               { "values", { { "flexi_min_weight", 0.2f } } } };
    RigConfig config = j.get<RigConfig>();

    EXPECT_FALSE(config.get_flag(RigFlag::InheritParent));
    EXPECT_TRUE(config.get_flag(RigFlag::KeyAllChannels));
    EXPECT_FLOAT_EQ(config.get_value(RigValue::FlexiMinWeight), 0.2f);
}
