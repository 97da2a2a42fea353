#include <gtest/gtest.h>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <entt/entity/entity.hpp>

import Core;
import Graphics;

#include "TestSceneBuilders.h"

using namespace Graphics;

namespace
{
    class SceneGraphTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            m_Red = AddNamedMaterial(m_Renderer, "red", glm::vec4(1.0f, 0.0f, 0.0f, 1.0f));
            m_Blue = AddNamedMaterial(m_Renderer, "blue", glm::vec4(0.0f, 0.0f, 1.0f, 1.0f));
            AddQuadMesh(m_Renderer, "quad", "red");

            SceneGraphConfig config{};
            config.Label = "test";
            config.LightCapacity = 4;
            m_Graph = std::make_unique<SceneGraph>(m_Renderer, config);

            ASSERT_TRUE(m_Graph->RegisterModel("quad", "quad", "forward", 6).has_value());
            ASSERT_TRUE(m_Graph->CreateView("main", PerspectiveProjection{}).has_value());
        }

        [[nodiscard]] uint32_t ActiveInstances() const
        {
            const SceneModel* model = m_Graph->GetModel("quad");
            return m_Renderer.GetInstanceStore().GetAllocation(model->Allocation)->NumActive;
        }

        [[nodiscard]] uint32_t ActiveLights() const
        {
            return m_Graph->GetLightingStore().GetActiveCount();
        }

        [[nodiscard]] bool IsInstanceActive(NodeHandle node) const
        {
            const auto* model = std::get_if<ModelNode>(&m_Graph->GetNode(node)->Payload);
            return m_Renderer.GetInstanceStore().GetInstance(model->Instance)->InstanceSlot.has_value();
        }

        NodeHandle Model(const std::string& name)
        {
            return m_Graph->CreateModelNode("quad", {}, name).value();
        }

        NodeHandle Transform(const std::string& name)
        {
            return m_Graph->CreateTransformNode(name).value();
        }

        NodeHandle Light(const std::string& name)
        {
            return m_Graph->CreateLightNode(LightSourceDescriptor{}, {}, name).value();
        }

        Renderer m_Renderer{MakeTestRendererConfig()};
        std::unique_ptr<SceneGraph> m_Graph;
        MaterialId m_Red = 0;
        MaterialId m_Blue = 0;
    };
}

// -----------------------------------------------------------------------------
// Construction
// -----------------------------------------------------------------------------

TEST_F(SceneGraphTest, Construct_HasVisibleRoot)
{
    const NodeHandle root = m_Graph->GetRoot();
    ASSERT_TRUE(m_Graph->IsValidNode(root));
    EXPECT_EQ(m_Graph->GetNodeName(root), "root");
    EXPECT_EQ(m_Graph->GetNode(root)->GetType(), NodeType::Transform);
    EXPECT_TRUE(m_Graph->IsNodeVisible(root));
    EXPECT_EQ(m_Graph->GetNodeCount(), 1u);
    EXPECT_EQ(m_Graph->GetLabel(), "test");
}

TEST_F(SceneGraphTest, CreateModelNode_StartsDetachedAndInactive)
{
    const NodeHandle node = Model("a");

    EXPECT_FALSE(m_Graph->IsNodeVisible(node));
    EXPECT_FALSE(IsInstanceActive(node));
    EXPECT_EQ(ActiveInstances(), 0u);

    // The mesh's material is used unless one is named.
    const auto* payload = std::get_if<ModelNode>(&m_Graph->GetNode(node)->Payload);
    ASSERT_NE(payload, nullptr);
    EXPECT_EQ(payload->Material, m_Red);
    EXPECT_EQ(m_Renderer.GetMaterialStore().GetMaterial(m_Red)->Usage, 1u);
}

TEST_F(SceneGraphTest, CreateModelNode_NamedMaterialOverridesMesh)
{
    const NodeHandle node = *m_Graph->CreateModelNode("quad", std::string("blue"), "b");
    const auto* payload = std::get_if<ModelNode>(&m_Graph->GetNode(node)->Payload);
    EXPECT_EQ(payload->Material, m_Blue);
    EXPECT_EQ(payload->MaterialSlot, *m_Renderer.GetMaterialStore().GetMaterial(m_Blue)->Slot);
}

TEST_F(SceneGraphTest, CreateModelNode_Errors)
{
    EXPECT_EQ(m_Graph->CreateModelNode("nope").error(), Core::ErrorCode::InvalidHandle);
    EXPECT_EQ(m_Graph->CreateModelNode("quad", std::string("green")).error(), Core::ErrorCode::InvalidHandle);
    EXPECT_EQ(m_Graph->GetNodeCount(), 1u);
    EXPECT_EQ(m_Renderer.GetInstanceStore().GetInstanceCount(), 0u);
}

TEST_F(SceneGraphTest, RegisterModel_Errors)
{
    EXPECT_EQ(m_Graph->RegisterModel("quad", "quad", "forward", 1).error(), Core::ErrorCode::InvalidArgument);
    EXPECT_EQ(m_Graph->RegisterModel("other", "missing", "forward", 1).error(), Core::ErrorCode::InvalidHandle);
    EXPECT_EQ(m_Graph->RegisterModel("huge", "quad", "forward", 1000).error(), Core::ErrorCode::CapacityExceeded);
}

TEST_F(SceneGraphTest, CameraNode_OneCameraPerView)
{
    ASSERT_TRUE(m_Graph->CreateCameraNode("main", "cam").has_value());
    EXPECT_EQ(m_Graph->CreateCameraNode("main", "cam2").error(), Core::ErrorCode::InvalidArgument);
    EXPECT_EQ(m_Graph->CreateCameraNode("unknown").error(), Core::ErrorCode::InvalidHandle);
    EXPECT_EQ(m_Graph->CreateView("main", OrthographicProjection{}).error(), Core::ErrorCode::InvalidArgument);
}

// -----------------------------------------------------------------------------
// Attach / detach / visibility
// -----------------------------------------------------------------------------

TEST_F(SceneGraphTest, Attach_ActivatesExactlyVisibleSubtree)
{
    const NodeHandle group = Transform("group");
    const NodeHandle a = Model("a");
    const NodeHandle b = Model("b");
    const NodeHandle hidden = Model("hidden");
    const NodeHandle lamp = Light("lamp");
    ASSERT_TRUE(m_Graph->AttachNode(a, group).has_value());
    ASSERT_TRUE(m_Graph->AttachNode(b, group).has_value());
    ASSERT_TRUE(m_Graph->AttachNode(hidden, group).has_value());
    ASSERT_TRUE(m_Graph->AttachNode(lamp, group).has_value());
    ASSERT_TRUE(m_Graph->SetNodeVisibility(hidden, false).has_value());

    // Linking below a dormant parent activates nothing.
    EXPECT_EQ(ActiveInstances(), 0u);
    EXPECT_EQ(ActiveLights(), 0u);

    ASSERT_TRUE(m_Graph->AttachNode(group, m_Graph->GetRoot()).has_value());
    EXPECT_TRUE(IsInstanceActive(a));
    EXPECT_TRUE(IsInstanceActive(b));
    EXPECT_FALSE(IsInstanceActive(hidden));
    EXPECT_EQ(ActiveInstances(), 2u);
    EXPECT_EQ(ActiveLights(), 1u);
    EXPECT_EQ(m_Graph->GetNode(a)->Root, m_Graph->GetRoot());

    ASSERT_TRUE(m_Graph->DetachNode(group).has_value());
    EXPECT_EQ(ActiveInstances(), 0u);
    EXPECT_EQ(ActiveLights(), 0u);
    EXPECT_TRUE(m_Graph->GetNode(a)->Root == entt::null);

    ASSERT_TRUE(m_Graph->AttachNode(group, m_Graph->GetRoot()).has_value());
    EXPECT_EQ(ActiveInstances(), 2u);
    EXPECT_EQ(ActiveLights(), 1u);
    EXPECT_FALSE(IsInstanceActive(hidden));
}

TEST_F(SceneGraphTest, Detach_InnerNodeKeepsSiblingsActive)
{
    const NodeHandle group = Transform("group");
    const NodeHandle a = Model("a");
    const NodeHandle b = Model("b");
    ASSERT_TRUE(m_Graph->AttachNode(group, m_Graph->GetRoot()).has_value());
    ASSERT_TRUE(m_Graph->AttachNode(a, group).has_value());
    ASSERT_TRUE(m_Graph->AttachNode(b, group).has_value());
    EXPECT_EQ(ActiveInstances(), 2u);

    ASSERT_TRUE(m_Graph->DetachNode(a).has_value());
    EXPECT_FALSE(IsInstanceActive(a));
    EXPECT_TRUE(IsInstanceActive(b));
    EXPECT_EQ(m_Graph->GetChildren(group), std::vector<NodeHandle>{b});
}

TEST_F(SceneGraphTest, Attach_Errors)
{
    const NodeHandle parent = Transform("parent");
    const NodeHandle child = Transform("child");
    ASSERT_TRUE(m_Graph->AttachNode(child, parent).has_value());

    EXPECT_EQ(m_Graph->AttachNode(child, m_Graph->GetRoot()).error(), Core::ErrorCode::InvalidOperation);
    EXPECT_EQ(m_Graph->AttachNode(parent, child).error(), Core::ErrorCode::InvalidArgument);
    EXPECT_EQ(m_Graph->AttachNode(m_Graph->GetRoot(), child).error(), Core::ErrorCode::InvalidOperation);
    EXPECT_EQ(m_Graph->DetachNode(parent).error(), Core::ErrorCode::InvalidOperation);
    EXPECT_EQ(m_Graph->GetParent(child), parent);
}

TEST_F(SceneGraphTest, SetNodeVisibility_TogglesSubtree)
{
    const NodeHandle group = Transform("group");
    const NodeHandle a = Model("a");
    const NodeHandle lamp = Light("lamp");
    ASSERT_TRUE(m_Graph->AttachNode(a, group).has_value());
    ASSERT_TRUE(m_Graph->AttachNode(lamp, group).has_value());
    ASSERT_TRUE(m_Graph->AttachNode(group, m_Graph->GetRoot()).has_value());

    ASSERT_TRUE(m_Graph->SetNodeVisibility(group, false).has_value());
    EXPECT_FALSE(m_Graph->IsNodeVisible(a));
    EXPECT_EQ(ActiveInstances(), 0u);
    EXPECT_EQ(ActiveLights(), 0u);

    // Repeating a state is a no-op.
    ASSERT_TRUE(m_Graph->SetNodeVisibility(group, false).has_value());

    ASSERT_TRUE(m_Graph->SetNodeVisibility(group, true).has_value());
    EXPECT_TRUE(m_Graph->IsNodeVisible(a));
    EXPECT_EQ(ActiveInstances(), 1u);
    EXPECT_EQ(ActiveLights(), 1u);
}

TEST_F(SceneGraphTest, SetNodeVisibility_HiddenChildStaysHiddenUnderShownParent)
{
    const NodeHandle group = Transform("group");
    const NodeHandle a = Model("a");
    const NodeHandle b = Model("b");
    ASSERT_TRUE(m_Graph->AttachNode(a, group).has_value());
    ASSERT_TRUE(m_Graph->AttachNode(b, group).has_value());
    ASSERT_TRUE(m_Graph->AttachNode(group, m_Graph->GetRoot()).has_value());

    ASSERT_TRUE(m_Graph->SetNodeVisibility(a, false).has_value());
    ASSERT_TRUE(m_Graph->SetNodeVisibility(group, false).has_value());
    ASSERT_TRUE(m_Graph->SetNodeVisibility(group, true).has_value());

    EXPECT_FALSE(IsInstanceActive(a));
    EXPECT_TRUE(IsInstanceActive(b));
    EXPECT_EQ(ActiveInstances(), 1u);

    ASSERT_TRUE(m_Graph->SetNodeVisibility(a, true).has_value());
    EXPECT_EQ(ActiveInstances(), 2u);
}

TEST_F(SceneGraphTest, SetNodeVisibility_OnDetachedNodeOnlyStoresFlag)
{
    const NodeHandle a = Model("a");
    ASSERT_TRUE(m_Graph->SetNodeVisibility(a, false).has_value());
    EXPECT_FALSE(m_Graph->GetNode(a)->Visible);
    EXPECT_EQ(ActiveInstances(), 0u);

    ASSERT_TRUE(m_Graph->AttachNode(a, m_Graph->GetRoot()).has_value());
    EXPECT_FALSE(IsInstanceActive(a));
}

TEST_F(SceneGraphTest, LightBufferFull_ReportsButActivatesRest)
{
    const NodeHandle group = Transform("group");
    for (int i = 0; i < 5; ++i)
        ASSERT_TRUE(m_Graph->AttachNode(Light("lamp"), group).has_value());
    const NodeHandle a = Model("a");
    ASSERT_TRUE(m_Graph->AttachNode(a, group).has_value());

    auto attached = m_Graph->AttachNode(group, m_Graph->GetRoot());
    ASSERT_FALSE(attached.has_value());
    EXPECT_EQ(attached.error(), Core::ErrorCode::CapacityExceeded);
    EXPECT_EQ(ActiveLights(), 4u);
    EXPECT_TRUE(IsInstanceActive(a));

    ASSERT_TRUE(m_Graph->DetachNode(group).has_value());
    EXPECT_EQ(ActiveLights(), 0u);
    EXPECT_EQ(ActiveInstances(), 0u);
}

// -----------------------------------------------------------------------------
// Destroy and clone
// -----------------------------------------------------------------------------

TEST_F(SceneGraphTest, DestroyNode_RequiresDetachedNode)
{
    const NodeHandle a = Model("a");
    ASSERT_TRUE(m_Graph->AttachNode(a, m_Graph->GetRoot()).has_value());

    EXPECT_EQ(m_Graph->DestroyNode(a).error(), Core::ErrorCode::InvalidOperation);
    EXPECT_EQ(m_Graph->DestroyNode(m_Graph->GetRoot()).error(), Core::ErrorCode::InvalidOperation);
    EXPECT_TRUE(m_Graph->IsValidNode(a));
}

TEST_F(SceneGraphTest, DestroyNode_ReleasesInstancesMaterialsAndLights)
{
    const NodeHandle group = Transform("group");
    const NodeHandle a = Model("a");
    const NodeHandle lamp = Light("lamp");
    ASSERT_TRUE(m_Graph->AttachNode(a, group).has_value());
    ASSERT_TRUE(m_Graph->AttachNode(lamp, group).has_value());
    const LightId light = std::get<LightNode>(m_Graph->GetNode(lamp)->Payload).Light;
    ASSERT_EQ(m_Renderer.GetInstanceStore().GetInstanceCount(), 1u);

    ASSERT_TRUE(m_Graph->DestroyNode(group).has_value());

    EXPECT_FALSE(m_Graph->IsValidNode(group));
    EXPECT_FALSE(m_Graph->IsValidNode(a));
    EXPECT_EQ(m_Graph->GetNodeCount(), 1u);
    EXPECT_EQ(m_Renderer.GetInstanceStore().GetInstanceCount(), 0u);
    EXPECT_EQ(m_Graph->GetLightingStore().GetLightSource(light), nullptr);

    const Material* red = m_Renderer.GetMaterialStore().GetMaterial(m_Red);
    EXPECT_EQ(red->Usage, 0u);
    EXPECT_FALSE(red->Slot.has_value());
}

TEST_F(SceneGraphTest, DestroyNode_UnbindsCamera)
{
    const NodeHandle cam = *m_Graph->CreateCameraNode("main", "cam");
    ASSERT_TRUE(m_Graph->DestroyNode(cam).has_value());
    EXPECT_TRUE(m_Graph->GetView("main")->Node == entt::null);
    EXPECT_TRUE(m_Graph->CreateCameraNode("main", "cam2").has_value());
}

TEST_F(SceneGraphTest, CloneNode_CopiesDetachedSubtree)
{
    const NodeHandle group = Transform("group");
    const NodeHandle a = Model("a");
    const NodeHandle hidden = Model("hidden");
    LightSourceDescriptor spot{};
    spot.Type = LightType::Spot;
    spot.Cone = glm::vec2(0.9f, 0.7f);
    const NodeHandle lamp = *m_Graph->CreateLightNode(spot, {}, "lamp");
    const NodeHandle cam = *m_Graph->CreateCameraNode("main", "cam");
    ASSERT_TRUE(m_Graph->AttachNode(a, group).has_value());
    ASSERT_TRUE(m_Graph->AttachNode(hidden, group).has_value());
    ASSERT_TRUE(m_Graph->AttachNode(lamp, group).has_value());
    ASSERT_TRUE(m_Graph->AttachNode(cam, group).has_value());
    ASSERT_TRUE(m_Graph->SetNodeVisibility(hidden, false).has_value());
    ASSERT_TRUE(m_Graph->SetTranslation(a, glm::vec3(3.0f, 0.0f, 0.0f)).has_value());
    ASSERT_TRUE(m_Graph->AttachNode(group, m_Graph->GetRoot()).has_value());

    const NodeHandle copy = *m_Graph->CloneNode(group);

    EXPECT_NE(copy, group);
    EXPECT_TRUE(m_Graph->GetParent(copy) == entt::null);
    EXPECT_TRUE(m_Graph->GetNode(copy)->Root == entt::null);
    EXPECT_EQ(m_Graph->GetNodeCount(), 11u);

    const auto children = m_Graph->GetChildren(copy);
    ASSERT_EQ(children.size(), 4u);
    EXPECT_EQ(m_Graph->GetNodeName(children[0]), "a");
    EXPECT_FALSE(m_Graph->GetNode(children[1])->Visible);
    ExpectMatNear(*m_Graph->GetTransform(children[0]), *m_Graph->GetTransform(a));

    // New instance, same material, still inactive.
    const auto& original = std::get<ModelNode>(m_Graph->GetNode(a)->Payload);
    const auto& cloned = std::get<ModelNode>(m_Graph->GetNode(children[0])->Payload);
    EXPECT_NE(cloned.Instance, original.Instance);
    EXPECT_EQ(cloned.Material, original.Material);
    EXPECT_FALSE(IsInstanceActive(children[0]));
    EXPECT_EQ(ActiveInstances(), 1u);

    const auto& clonedLight = std::get<LightNode>(m_Graph->GetNode(children[2])->Payload);
    const LightSource* source = m_Graph->GetLightingStore().GetLightSource(clonedLight.Light);
    EXPECT_EQ(source->Type, LightType::Spot);
    EXPECT_EQ(source->Cone, glm::vec2(0.9f, 0.7f));
    EXPECT_TRUE(clonedLight.ViewName.empty());

    EXPECT_TRUE(std::get<CameraNode>(m_Graph->GetNode(children[3])->Payload).ViewName.empty());
    EXPECT_EQ(m_Graph->GetView("main")->Node, cam);

    ASSERT_TRUE(m_Graph->AttachNode(copy, m_Graph->GetRoot()).has_value());
    EXPECT_EQ(ActiveInstances(), 2u);
    EXPECT_EQ(ActiveLights(), 2u);
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------

TEST_F(SceneGraphTest, FindNode_PreOrderFirstMatch)
{
    const NodeHandle left = Transform("left");
    const NodeHandle right = Transform("right");
    const NodeHandle deep = Transform("target");
    const NodeHandle shallow = Transform("target");
    ASSERT_TRUE(m_Graph->AttachNode(deep, left).has_value());
    ASSERT_TRUE(m_Graph->AttachNode(left, m_Graph->GetRoot()).has_value());
    ASSERT_TRUE(m_Graph->AttachNode(shallow, right).has_value());
    ASSERT_TRUE(m_Graph->AttachNode(right, m_Graph->GetRoot()).has_value());

    EXPECT_EQ(m_Graph->FindNode("target"), deep);
    EXPECT_EQ(m_Graph->FindChildNode("target", right), shallow);
    EXPECT_TRUE(m_Graph->FindNode("missing") == entt::null);

    // Detached nodes are not reachable from the root.
    const NodeHandle loose = Transform("loose");
    EXPECT_TRUE(m_Graph->FindNode("loose") == entt::null);
    EXPECT_EQ(m_Graph->FindChildNode("loose", loose), loose);
}

TEST_F(SceneGraphTest, GetModelMatrix_ComposesParentChain)
{
    const NodeHandle parent = Transform("parent");
    const NodeHandle child = Transform("child");
    ASSERT_TRUE(m_Graph->AttachNode(child, parent).has_value());

    TrsTransform scale{};
    scale.Scale = glm::vec3(2.0f);
    ASSERT_TRUE(m_Graph->SetTransform(parent, scale).has_value());
    ASSERT_TRUE(m_Graph->SetTranslation(child, glm::vec3(1.0f, 0.0f, 0.0f)).has_value());

    EXPECT_EQ(m_Graph->GetModelMatrix(child).error(), Core::ErrorCode::InvalidOperation);

    ASSERT_TRUE(m_Graph->AttachNode(parent, m_Graph->GetRoot()).has_value());
    const glm::mat4 model = *m_Graph->GetModelMatrix(child);
    const glm::vec4 origin = model * glm::vec4(0.0f, 0.0f, 0.0f, 1.0f);
    EXPECT_FLOAT_EQ(origin.x, 2.0f);
}

TEST_F(SceneGraphTest, ApplyTransform_PostAndPreMultiply)
{
    const NodeHandle node = Transform("node");
    const glm::mat4 t = glm::translate(glm::mat4(1.0f), glm::vec3(1.0f, 0.0f, 0.0f));
    const glm::mat4 s = glm::scale(glm::mat4(1.0f), glm::vec3(3.0f));

    ASSERT_TRUE(m_Graph->SetTransform(node, MatrixTransform{t}).has_value());
    ASSERT_TRUE(m_Graph->ApplyTransform(node, MatrixTransform{s}).has_value());
    ExpectMatNear(*m_Graph->GetTransform(node), t * s);

    ASSERT_TRUE(m_Graph->SetTransform(node, MatrixTransform{t}).has_value());
    ASSERT_TRUE(m_Graph->ApplyPreTransform(node, MatrixTransform{s}).has_value());
    ExpectMatNear(*m_Graph->GetTransform(node), s * t);
}

TEST_F(SceneGraphTest, GetViewMatrix_RequiresCamera)
{
    EXPECT_EQ(m_Graph->GetViewMatrix("main").error(), Core::ErrorCode::InvalidOperation);
    EXPECT_EQ(m_Graph->GetViewMatrix("nope").error(), Core::ErrorCode::InvalidHandle);

    const NodeHandle cam = *m_Graph->CreateCameraNode("main", "cam");
    ASSERT_TRUE(m_Graph->SetTranslation(cam, glm::vec3(0.0f, 0.0f, 5.0f)).has_value());
    EXPECT_EQ(m_Graph->GetViewMatrix("main").error(), Core::ErrorCode::InvalidOperation);

    ASSERT_TRUE(m_Graph->AttachNode(cam, m_Graph->GetRoot()).has_value());
    ExpectMatNear(*m_Graph->GetViewMatrix("main"),
                  glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 0.0f, -5.0f)));
}

// -----------------------------------------------------------------------------
// Per-frame update
// -----------------------------------------------------------------------------

TEST_F(SceneGraphTest, UpdateModelViews_WritesViewTimesWorld)
{
    const NodeHandle cam = *m_Graph->CreateCameraNode("main", "cam");
    ASSERT_TRUE(m_Graph->SetTranslation(cam, glm::vec3(0.0f, 0.0f, 5.0f)).has_value());
    ASSERT_TRUE(m_Graph->AttachNode(cam, m_Graph->GetRoot()).has_value());

    const NodeHandle a = Model("a");
    ASSERT_TRUE(m_Graph->SetTranslation(a, glm::vec3(1.0f, 2.0f, 0.0f)).has_value());
    ASSERT_TRUE(m_Graph->AttachNode(a, m_Graph->GetRoot()).has_value());

    ASSERT_TRUE(m_Graph->UpdateModelViews("main").has_value());

    const glm::mat4 view = glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 0.0f, -5.0f));
    const glm::mat4 world = glm::translate(glm::mat4(1.0f), glm::vec3(1.0f, 2.0f, 0.0f));
    const auto& payload = std::get<ModelNode>(m_Graph->GetNode(a)->Payload);
    const auto data = m_Renderer.GetInstanceStore().ReadInstanceData(payload.Instance);
    ASSERT_TRUE(data.has_value());
    ExpectMatNear(data->ModelView, view * world);
    EXPECT_EQ(data->MaterialSlot, payload.MaterialSlot);

    ExpectMatNear(m_Graph->GetView("main")->ViewMatrix, view);

    const auto uniforms = m_Graph->GetUniformBuffer().ReadValue<GpuSceneUniforms>(0);
    ExpectMatNear(uniforms.View, view);
    ExpectMatNear(uniforms.Projection, m_Graph->GetView("main")->Projection);

    // Quad spans [-0.5, 0.5] around the node origin.
    const AABB& bounds = m_Graph->GetNode(a)->Bounds;
    EXPECT_FLOAT_EQ(bounds.Min.x, 0.5f);
    EXPECT_FLOAT_EQ(bounds.Max.y, 2.5f);
}

TEST_F(SceneGraphTest, UpdateModelViews_SkipsHiddenSubtrees)
{
    const NodeHandle cam = *m_Graph->CreateCameraNode("main", "cam");
    ASSERT_TRUE(m_Graph->AttachNode(cam, m_Graph->GetRoot()).has_value());
    const NodeHandle a = Model("a");
    ASSERT_TRUE(m_Graph->SetTranslation(a, glm::vec3(4.0f, 0.0f, 0.0f)).has_value());
    ASSERT_TRUE(m_Graph->AttachNode(a, m_Graph->GetRoot()).has_value());
    ASSERT_TRUE(m_Graph->SetNodeVisibility(a, false).has_value());

    ASSERT_TRUE(m_Graph->UpdateModelViews("main").has_value());

    const auto& payload = std::get<ModelNode>(m_Graph->GetNode(a)->Payload);
    ExpectMatNear(m_Renderer.GetInstanceStore().ReadInstanceData(payload.Instance)->ModelView, glm::mat4(1.0f));
}

TEST_F(SceneGraphTest, Update_UploadsLightsInViewSpace)
{
    const NodeHandle cam = *m_Graph->CreateCameraNode("main", "cam");
    ASSERT_TRUE(m_Graph->SetTranslation(cam, glm::vec3(0.0f, 0.0f, 5.0f)).has_value());
    ASSERT_TRUE(m_Graph->AttachNode(cam, m_Graph->GetRoot()).has_value());

    const NodeHandle lamp = Light("lamp");
    ASSERT_TRUE(m_Graph->SetTranslation(lamp, glm::vec3(0.0f, 3.0f, 0.0f)).has_value());
    ASSERT_TRUE(m_Graph->AttachNode(lamp, m_Graph->GetRoot()).has_value());

    ASSERT_TRUE(m_Graph->Update("main").has_value());

    const auto& buffer = m_Graph->GetLightingStore().GetBuffer();
    EXPECT_EQ(buffer.ReadValue<GpuLightingHeader>(0).Count, 1u);
    const auto record = buffer.ReadValue<GpuLightRecord>(kLightRecordsOffset);
    EXPECT_FLOAT_EQ(record.Position.y, 3.0f);
    EXPECT_FLOAT_EQ(record.Position.z, -5.0f);
    EXPECT_FALSE(buffer.IsDirty());
}

// -----------------------------------------------------------------------------
// Declarative construction and shared renderers
// -----------------------------------------------------------------------------

TEST_F(SceneGraphTest, FromDescriptor_BuildsAndActivatesTree)
{
    NodeDescriptor camera{};
    camera.Name = "camera";
    camera.Type = NodeType::Camera;
    camera.ViewName = "view";
    camera.Transform = TrsTransform{glm::vec3(0.0f, 0.0f, 10.0f), {}, {}, {}};

    NodeDescriptor first{};
    first.Name = "first";
    first.Type = NodeType::Model;
    first.ModelName = "tile";

    NodeDescriptor second = first;
    second.Name = "second";
    second.Material = "blue";
    second.Visible = false;

    NodeDescriptor root{};
    root.Name = "world";
    root.Children = {camera, first, second};

    SceneGraphDescriptor descriptor{};
    descriptor.Name = "declared";
    descriptor.Models = {{"tile", "quad", "forward", 4}};
    descriptor.Views = {{"view", ViewKind::Camera, PerspectiveProjection{}}};
    descriptor.Root = root;

    auto graph = CreateSceneGraphFromDescriptor(descriptor, m_Renderer);
    ASSERT_TRUE(graph.has_value());
    SceneGraph& scene = **graph;

    EXPECT_EQ(scene.GetLabel(), "declared");
    EXPECT_EQ(scene.GetNodeName(scene.GetRoot()), "root");
    EXPECT_EQ(scene.GetNodeCount(), 4u);
    EXPECT_EQ(scene.GetChildren(scene.GetRoot()).size(), 3u);

    const SceneModel* tile = scene.GetModel("tile");
    ASSERT_NE(tile, nullptr);
    EXPECT_EQ(m_Renderer.GetInstanceStore().GetAllocation(tile->Allocation)->NumActive, 1u);
    EXPECT_EQ(m_Renderer.GetInstanceStore().GetAllocation(tile->Allocation)->NumInstances, 2u);

    const NodeHandle second2 = scene.FindNode("second");
    EXPECT_EQ(std::get<ModelNode>(scene.GetNode(second2)->Payload).Material, m_Blue);

    ASSERT_TRUE(scene.UpdateModelViews("view").has_value());
    ExpectMatNear(*scene.GetViewMatrix("view"), glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 0.0f, -10.0f)));
}

TEST_F(SceneGraphTest, FromDescriptor_UnknownMeshFails)
{
    SceneGraphDescriptor descriptor{};
    descriptor.Models = {{"broken", "missing", "forward", 1}};

    auto graph = CreateSceneGraphFromDescriptor(descriptor, m_Renderer);
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error(), Core::ErrorCode::InvalidHandle);
}

TEST_F(SceneGraphTest, FromDescriptor_FailureReservesNoInstanceSlots)
{
    const uint32_t reserved = m_Renderer.GetInstanceStore().GetReservedCapacity();

    SceneGraphDescriptor unknownMesh{};
    unknownMesh.Models = {{"ok", "quad", "forward", 4}, {"broken", "missing", "forward", 1}};
    auto first = CreateSceneGraphFromDescriptor(unknownMesh, m_Renderer);
    ASSERT_FALSE(first.has_value());
    EXPECT_EQ(first.error(), Core::ErrorCode::InvalidHandle);
    EXPECT_EQ(m_Renderer.GetInstanceStore().GetReservedCapacity(), reserved);

    // 16 slots, 6 held by the fixture graph.
    SceneGraphDescriptor tooLarge{};
    tooLarge.Models = {{"a", "quad", "forward", 6}, {"b", "quad", "forward", 6}};
    auto second = CreateSceneGraphFromDescriptor(tooLarge, m_Renderer);
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error(), Core::ErrorCode::CapacityExceeded);
    EXPECT_EQ(m_Renderer.GetInstanceStore().GetReservedCapacity(), reserved);

    SceneGraphDescriptor duplicate{};
    duplicate.Models = {{"a", "quad", "forward", 1}, {"a", "quad", "forward", 1}};
    auto third = CreateSceneGraphFromDescriptor(duplicate, m_Renderer);
    ASSERT_FALSE(third.has_value());
    EXPECT_EQ(third.error(), Core::ErrorCode::InvalidArgument);
    EXPECT_EQ(m_Renderer.GetInstanceStore().GetReservedCapacity(), reserved);
}

TEST_F(SceneGraphTest, CreateNodeFromDescriptor_FailingChildReleasesBuiltNodes)
{
    const auto instancesBefore = m_Renderer.GetInstanceStore().GetInstanceCount();

    NodeDescriptor good{};
    good.Name = "good";
    good.Type = NodeType::Model;
    good.ModelName = "quad";

    NodeDescriptor bad{};
    bad.Name = "bad";
    bad.Type = NodeType::Model;
    bad.ModelName = "no-such-model";

    NodeDescriptor parent{};
    parent.Name = "parent";
    parent.Children = {good, bad};

    auto node = m_Graph->CreateNodeFromDescriptor(parent);
    ASSERT_FALSE(node.has_value());
    EXPECT_EQ(m_Renderer.GetInstanceStore().GetInstanceCount(), instancesBefore);
    EXPECT_EQ(m_Renderer.GetMaterialStore().GetMaterial(m_Red)->Usage, 0u);
}

TEST_F(SceneGraphTest, SharedRenderer_GraphsKeepSeparateAllocations)
{
    SceneGraph other(m_Renderer);
    ASSERT_TRUE(other.RegisterModel("quad", "quad", "forward", 2).has_value());
    EXPECT_NE(other.GetLabel(), m_Graph->GetLabel());

    ASSERT_TRUE(m_Graph->AttachNode(Model("mine"), m_Graph->GetRoot()).has_value());
    ASSERT_TRUE(other.AttachNode(*other.CreateModelNode("quad"), other.GetRoot()).has_value());
    ASSERT_TRUE(other.AttachNode(*other.CreateModelNode("quad"), other.GetRoot()).has_value());

    const auto& instances = m_Renderer.GetInstanceStore();
    EXPECT_EQ(instances.GetAllocation(m_Graph->GetModel("quad")->Allocation)->NumActive, 1u);
    EXPECT_EQ(instances.GetAllocation(other.GetModel("quad")->Allocation)->NumActive, 2u);
    EXPECT_EQ(m_Renderer.GetMaterialStore().GetMaterial(m_Red)->Usage, 3u);
}

TEST_F(SceneGraphTest, Destructor_ReturnsSharedResources)
{
    ASSERT_TRUE(m_Graph->AttachNode(Model("a"), m_Graph->GetRoot()).has_value());
    ASSERT_TRUE(m_Graph->AttachNode(Model("b"), m_Graph->GetRoot()).has_value());
    const NodeHandle loose = Model("loose");
    ASSERT_TRUE(m_Graph->AttachNode(Model("loose-child"), loose).has_value());
    ASSERT_EQ(m_Renderer.GetInstanceStore().GetInstanceCount(), 4u);

    m_Graph.reset();

    EXPECT_EQ(m_Renderer.GetInstanceStore().GetInstanceCount(), 0u);
    const Material* red = m_Renderer.GetMaterialStore().GetMaterial(m_Red);
    EXPECT_EQ(red->Usage, 0u);
    EXPECT_FALSE(red->Slot.has_value());
}
