module;

#include <optional>
#include <string>
#include <type_traits>
#include <variant>

#include <glm/glm.hpp>
#include <entt/entity/registry.hpp>

module Graphics:SceneGraph.Traversal;

import :SceneGraph;
import :Bounds;
import :GpuLayouts;
import :InstanceStore;
import :LightingStore;
import :MeshStore;
import :Renderer;
import :SceneNode;
import :View;
import Core;
import ECS;
import RHI;

namespace Graphics
{
    using ECS::Components::Transform::LocalMatrix;
    using ECS::Components::Transform::WorldMatrix;
    namespace Hierarchy = ECS::Components::Hierarchy;

    // -------------------------------------------------------------------------
    // Attach / detach / visibility
    // -------------------------------------------------------------------------

    Core::Result SceneGraph::AttachNode(NodeHandle node, NodeHandle parent)
    {
        SceneNode* sceneNode = FindSceneNode(node);
        const SceneNode* parentNode = FindSceneNode(parent);
        if (!sceneNode || !parentNode)
            return Core::Err(Core::ErrorCode::InvalidHandle);

        auto& registry = m_Scene.GetRegistry();
        if (sceneNode->Root != entt::null || registry.get<Hierarchy::Component>(node).Parent != entt::null)
        {
            Core::Log::Warn("SceneGraph[{}]: node '{}' is already attached", m_Label, GetNodeName(node));
            return Core::Err(Core::ErrorCode::InvalidOperation);
        }

        if (Hierarchy::IsAncestor(registry, node, parent))
        {
            Core::Log::Error("SceneGraph[{}]: attaching '{}' below '{}' would create a cycle",
                             m_Label, GetNodeName(node), GetNodeName(parent));
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        if (!Hierarchy::Attach(registry, node, parent))
            return Core::Err(Core::ErrorCode::InvalidState);

        // A dormant parent only links the subtree.
        const NodeHandle root = parentNode->Root;
        if (root == entt::null)
            return Core::Ok();

        SetRootRecursive(node, root);

        if (!IsNodeVisible(node))
            return Core::Ok();

        return ActivateSubtree(node);
    }

    Core::Result SceneGraph::DetachNode(NodeHandle node)
    {
        const SceneNode* sceneNode = FindSceneNode(node);
        if (!sceneNode)
            return Core::Err(Core::ErrorCode::InvalidHandle);

        auto& registry = m_Scene.GetRegistry();
        if (registry.get<Hierarchy::Component>(node).Parent == entt::null)
        {
            Core::Log::Warn("SceneGraph[{}]: node '{}' is not attached to a parent node", m_Label, GetNodeName(node));
            return Core::Err(Core::ErrorCode::InvalidOperation);
        }

        // Evaluated while the ancestors are still reachable.
        const bool wasVisible = IsNodeVisible(node);
        const bool wasRooted = sceneNode->Root != entt::null;

        Hierarchy::Detach(registry, node);

        if (!wasRooted)
            return Core::Ok();

        if (wasVisible)
            DeactivateSubtree(node);

        SetRootRecursive(node, entt::null);
        return Core::Ok();
    }

    Core::Result SceneGraph::SetNodeVisibility(NodeHandle node, bool visible)
    {
        SceneNode* sceneNode = FindSceneNode(node);
        if (!sceneNode)
            return Core::Err(Core::ErrorCode::InvalidHandle);

        if (sceneNode->Visible == visible)
            return Core::Ok();

        if (!visible)
        {
            // Deactivate while the flag still reports the subtree as visible.
            if (IsNodeVisible(node))
                DeactivateSubtree(node);
            sceneNode->Visible = false;
            return Core::Ok();
        }

        sceneNode->Visible = true;
        if (IsNodeVisible(node))
            return ActivateSubtree(node);
        return Core::Ok();
    }

    bool SceneGraph::IsNodeVisible(NodeHandle node) const
    {
        const SceneNode* sceneNode = FindSceneNode(node);
        if (!sceneNode || sceneNode->Root == entt::null)
            return false;

        const auto& registry = m_Scene.GetRegistry();
        for (NodeHandle ancestor = node; ancestor != entt::null;
             ancestor = registry.get<Hierarchy::Component>(ancestor).Parent)
        {
            if (!registry.get<SceneNode>(ancestor).Visible)
                return false;
        }
        return true;
    }

    Core::Result SceneGraph::ActivateSubtree(NodeHandle node)
    {
        auto& registry = m_Scene.GetRegistry();
        const SceneNode& sceneNode = registry.get<SceneNode>(node);
        if (!sceneNode.Visible)
            return Core::Ok();

        Core::Result status = Core::Ok();
        if (const auto* model = std::get_if<ModelNode>(&sceneNode.Payload))
            status = m_Renderer.GetInstanceStore().ActivateInstance(model->Instance);
        else if (const auto* light = std::get_if<LightNode>(&sceneNode.Payload))
            status = m_Lighting.Activate(light->Light);

        // Keep going on failure so the rest of the subtree stays consistent.
        Hierarchy::ForEachChild(registry, node, [&](NodeHandle child)
        {
            auto childStatus = ActivateSubtree(child);
            if (status && !childStatus)
                status = childStatus;
        });
        return status;
    }

    void SceneGraph::DeactivateSubtree(NodeHandle node)
    {
        auto& registry = m_Scene.GetRegistry();
        const SceneNode& sceneNode = registry.get<SceneNode>(node);
        if (!sceneNode.Visible)
            return;

        if (const auto* model = std::get_if<ModelNode>(&sceneNode.Payload))
        {
            if (const InstanceRecord* record = m_Renderer.GetInstanceStore().GetInstance(model->Instance);
                record && record->InstanceSlot)
                (void)m_Renderer.GetInstanceStore().DeactivateInstance(model->Instance);
        }
        else if (const auto* light = std::get_if<LightNode>(&sceneNode.Payload))
        {
            // May be inactive if the lighting buffer was full on activation.
            if (const LightSource* source = m_Lighting.GetLightSource(light->Light); source && source->Slot)
                (void)m_Lighting.Deactivate(light->Light);
        }

        Hierarchy::ForEachChild(registry, node, [&](NodeHandle child)
        {
            DeactivateSubtree(child);
        });
    }

    void SceneGraph::SetRootRecursive(NodeHandle node, NodeHandle root)
    {
        auto& registry = m_Scene.GetRegistry();
        registry.get<SceneNode>(node).Root = root;
        Hierarchy::ForEachChild(registry, node, [&](NodeHandle child)
        {
            SetRootRecursive(child, root);
        });
    }

    // -------------------------------------------------------------------------
    // Transforms
    // -------------------------------------------------------------------------

    Core::Result SceneGraph::SetTransform(NodeHandle node, const TransformDescriptor& transform)
    {
        if (!IsValidNode(node))
            return Core::Err(Core::ErrorCode::InvalidHandle);
        m_Scene.GetRegistry().get<LocalMatrix>(node).Matrix = ComputeMatrix(transform);
        return Core::Ok();
    }

    Core::Result SceneGraph::ApplyTransform(NodeHandle node, const TransformDescriptor& transform)
    {
        if (!IsValidNode(node))
            return Core::Err(Core::ErrorCode::InvalidHandle);
        glm::mat4& local = m_Scene.GetRegistry().get<LocalMatrix>(node).Matrix;
        local = local * ComputeMatrix(transform);
        return Core::Ok();
    }

    Core::Result SceneGraph::ApplyPreTransform(NodeHandle node, const TransformDescriptor& transform)
    {
        if (!IsValidNode(node))
            return Core::Err(Core::ErrorCode::InvalidHandle);
        glm::mat4& local = m_Scene.GetRegistry().get<LocalMatrix>(node).Matrix;
        local = ComputeMatrix(transform) * local;
        return Core::Ok();
    }

    Core::Result SceneGraph::SetTranslation(NodeHandle node, const glm::vec3& translation)
    {
        if (!IsValidNode(node))
            return Core::Err(Core::ErrorCode::InvalidHandle);
        glm::mat4& local = m_Scene.GetRegistry().get<LocalMatrix>(node).Matrix;
        local[3].x = translation.x;
        local[3].y = translation.y;
        local[3].z = translation.z;
        return Core::Ok();
    }

    std::optional<glm::mat4> SceneGraph::GetTransform(NodeHandle node) const
    {
        if (!IsValidNode(node))
            return std::nullopt;
        return m_Scene.GetRegistry().get<LocalMatrix>(node).Matrix;
    }

    Core::Expected<glm::mat4> SceneGraph::GetModelMatrix(NodeHandle node) const
    {
        const SceneNode* sceneNode = FindSceneNode(node);
        if (!sceneNode)
            return Core::Err<glm::mat4>(Core::ErrorCode::InvalidHandle);

        if (sceneNode->Root == entt::null)
        {
            Core::Log::Warn("SceneGraph[{}]: node '{}' is not attached to the scene graph", m_Label, GetNodeName(node));
            return Core::Err<glm::mat4>(Core::ErrorCode::InvalidOperation);
        }

        const auto& registry = m_Scene.GetRegistry();
        glm::mat4 model(1.0f);
        for (NodeHandle ancestor = node; ancestor != entt::null;
             ancestor = registry.get<Hierarchy::Component>(ancestor).Parent)
        {
            model = registry.get<LocalMatrix>(ancestor).Matrix * model;
        }
        return model;
    }

    Core::Expected<glm::mat4> SceneGraph::GetViewMatrix(const std::string& viewName) const
    {
        const View* view = GetView(viewName);
        if (!view)
            return Core::Err<glm::mat4>(Core::ErrorCode::InvalidHandle);

        if (view->Node == entt::null)
        {
            Core::Log::Warn("SceneGraph[{}]: view '{}' has no camera", m_Label, viewName);
            return Core::Err<glm::mat4>(Core::ErrorCode::InvalidOperation);
        }

        auto model = GetModelMatrix(view->Node);
        if (!model)
            return model;
        return glm::inverse(*model);
    }

    // -------------------------------------------------------------------------
    // Per-frame update
    // -------------------------------------------------------------------------

    Core::Result SceneGraph::UpdateModelViews(const std::string& viewName)
    {
        View* view = FindView(viewName);
        if (!view)
        {
            Core::Log::Error("SceneGraph[{}]: view '{}' does not exist", m_Label, viewName);
            return Core::Err(Core::ErrorCode::InvalidHandle);
        }

        auto viewMatrix = GetViewMatrix(viewName);
        if (!viewMatrix)
            return Core::Err(viewMatrix.error());

        view->ViewMatrix = *viewMatrix;

        GpuSceneUniforms uniforms{};
        uniforms.View = *viewMatrix;
        uniforms.Projection = view->Projection;
        m_Uniforms.WriteValue(0, uniforms);

        Traverse(m_Root, glm::mat4(1.0f), *viewMatrix);
        return Core::Ok();
    }

    void SceneGraph::Traverse(NodeHandle node, const glm::mat4& parentWorld, const glm::mat4& viewMatrix)
    {
        auto& registry = m_Scene.GetRegistry();
        SceneNode& sceneNode = registry.get<SceneNode>(node);
        if (!sceneNode.Visible)
            return;

        const glm::mat4 world = parentWorld * registry.get<LocalMatrix>(node).Matrix;
        registry.get<WorldMatrix>(node).Matrix = world;

        std::visit([&](const auto& payload)
        {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, ModelNode>)
            {
                InstanceData data{};
                data.ModelView = viewMatrix * world;
                data.MaterialSlot = payload.MaterialSlot;
                if (auto written = m_Renderer.GetInstanceStore().UpdateInstanceData(payload.Instance, data); !written)
                    Core::Log::Error("SceneGraph[{}]: lost instance {} of model '{}'", m_Label,
                                     payload.Instance, payload.ModelName);

                if (const SceneModel* model = GetModel(payload.ModelName))
                {
                    if (const MeshResource* mesh = m_Renderer.GetMeshStore().GetMesh(model->Mesh))
                        sceneNode.Bounds = Graphics::Transform(mesh->Bounds, world);
                }
            }
            else if constexpr (std::is_same_v<T, CameraNode>)
            {
                if (View* view = FindView(payload.ViewName))
                    view->ViewMatrix = glm::inverse(world);
            }
            else if constexpr (std::is_same_v<T, LightNode>)
            {
                (void)m_Lighting.ApplyTransform(payload.Light, world);
                if (View* view = FindView(payload.ViewName))
                    view->ViewMatrix = glm::inverse(world);
            }
        }, sceneNode.Payload);

        Hierarchy::ForEachChild(registry, node, [&](NodeHandle child)
        {
            Traverse(child, world, viewMatrix);
        });
    }

    Core::Result SceneGraph::Update(const std::string& viewName)
    {
        if (auto updated = UpdateModelViews(viewName); !updated)
            return updated;

        m_Lighting.UpdateBuffer(m_Views.at(viewName).ViewMatrix);
        m_Lighting.Flush();
        m_Uniforms.Flush();
        m_Renderer.Flush();
        return Core::Ok();
    }
}
