module;

#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include <glm/glm.hpp>
#include <entt/entity/registry.hpp>

#include "RHI.Vulkan.hpp"

module Graphics:SceneGraph.Impl;

import :SceneGraph;
import :DrawCallBatcher;
import :GpuLayouts;
import :InstanceStore;
import :LightingStore;
import :MaterialStore;
import :MeshStore;
import :Renderer;
import :SceneNode;
import :View;
import Core;
import ECS;
import RHI;

namespace Graphics
{
    namespace
    {
        uint32_t s_SceneGraphCount = 0;

        std::string MakeLabel(const std::string& label)
        {
            return label.empty() ? std::format("scene-graph-{}", s_SceneGraphCount++) : label;
        }
    }

    SceneGraph::SceneGraph(Renderer& renderer, const SceneGraphConfig& config)
        : m_Renderer(renderer)
        , m_Label(MakeLabel(config.Label))
        , m_Lighting(config.LightCapacity)
        , m_DrawCalls(renderer, m_Label)
        , m_Uniforms(std::format("SceneGraph[{}].Uniforms", m_Label), sizeof(GpuSceneUniforms),
                     VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT)
    {
        m_Root = CreateNode("root", TransformNode{});
        m_Scene.GetRegistry().get<SceneNode>(m_Root).Root = m_Root;
        m_Uniforms.WriteValue(0, GpuSceneUniforms{});
    }

    SceneGraph::~SceneGraph()
    {
        // Return instances and material uses to the shared renderer.
        if (IsNodeVisible(m_Root))
            DeactivateSubtree(m_Root);

        // Detached subtrees hold shared resources too.
        auto& registry = m_Scene.GetRegistry();
        std::vector<NodeHandle> tops;
        for (NodeHandle node : registry.view<SceneNode>())
        {
            if (registry.get<ECS::Components::Hierarchy::Component>(node).Parent == entt::null)
                tops.push_back(node);
        }
        for (NodeHandle node : tops)
            DestroySubtree(node);
    }

    // -------------------------------------------------------------------------
    // Models and views
    // -------------------------------------------------------------------------

    Core::Result SceneGraph::RegisterModel(const std::string& name, const std::string& meshName,
                                           const std::string& pipelineName, uint32_t maxInstances)
    {
        if (m_Models.contains(name))
        {
            Core::Log::Error("SceneGraph[{}]: model '{}' already registered", m_Label, name);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        const MeshResource* mesh = m_Renderer.GetMeshStore().FindMesh(meshName);
        if (!mesh)
        {
            Core::Log::Error("SceneGraph[{}]: model '{}' refers to unknown mesh '{}'", m_Label, name, meshName);
            return Core::Err(Core::ErrorCode::InvalidHandle);
        }

        auto allocation = m_Renderer.GetInstanceStore().RegisterAllocation(maxInstances);
        if (!allocation)
            return Core::Err(allocation.error());

        SceneModel model{};
        model.Name = name;
        model.Mesh = mesh->Id;
        model.PipelineName = pipelineName;
        model.Allocation = *allocation;
        model.DrawCallId = m_DrawCalls.AddModel(name, *mesh, pipelineName, *allocation);

        m_Models.emplace(name, std::move(model));
        return Core::Ok();
    }

    const SceneModel* SceneGraph::GetModel(const std::string& name) const
    {
        auto it = m_Models.find(name);
        return it != m_Models.end() ? &it->second : nullptr;
    }

    Core::Result SceneGraph::CreateView(const std::string& name, const ProjectionDescriptor& projection, ViewKind kind)
    {
        if (m_Views.contains(name))
        {
            Core::Log::Error("SceneGraph[{}]: view '{}' already exists", m_Label, name);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        View view{};
        view.Name = name;
        view.Kind = kind;
        view.Projection = ComputeProjection(projection);
        m_Views.emplace(name, std::move(view));
        return Core::Ok();
    }

    const View* SceneGraph::GetView(const std::string& name) const
    {
        auto it = m_Views.find(name);
        return it != m_Views.end() ? &it->second : nullptr;
    }

    View* SceneGraph::FindView(const std::string& name)
    {
        auto it = m_Views.find(name);
        return it != m_Views.end() ? &it->second : nullptr;
    }

    Core::Result SceneGraph::BindView(const std::string& viewName, ViewKind kind, NodeHandle node)
    {
        View* view = FindView(viewName);
        if (!view)
        {
            Core::Log::Error("SceneGraph[{}]: view '{}' does not exist", m_Label, viewName);
            return Core::Err(Core::ErrorCode::InvalidHandle);
        }

        if (view->Node != entt::null)
        {
            Core::Log::Error("SceneGraph[{}]: view '{}' is already bound to a node", m_Label, viewName);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        if (view->Kind != kind)
            Core::Log::Warn("SceneGraph[{}]: view '{}' bound to a node of another kind", m_Label, viewName);

        view->Node = node;
        return Core::Ok();
    }

    // -------------------------------------------------------------------------
    // Node creation
    // -------------------------------------------------------------------------

    NodeHandle SceneGraph::CreateNode(const std::string& name, NodePayload payload)
    {
        const entt::entity entity = m_Scene.CreateEntity(name);
        m_Scene.GetRegistry().emplace<SceneNode>(entity, SceneNode{std::move(payload)});
        return entity;
    }

    Core::Expected<NodeHandle> SceneGraph::CreateTransformNode(const std::string& name)
    {
        return CreateNode(name, TransformNode{});
    }

    Core::Expected<NodeHandle> SceneGraph::CreateModelNode(const std::string& modelName,
                                                           const std::optional<std::string>& materialName,
                                                           const std::string& name)
    {
        const SceneModel* model = GetModel(modelName);
        if (!model)
        {
            Core::Log::Error("SceneGraph[{}]: model '{}' does not exist", m_Label, modelName);
            return Core::Err<NodeHandle>(Core::ErrorCode::InvalidHandle);
        }

        std::string material;
        if (materialName)
        {
            material = *materialName;
        }
        else if (const MeshResource* mesh = m_Renderer.GetMeshStore().GetMesh(model->Mesh))
        {
            material = mesh->MaterialName;
        }

        const Material* found = m_Renderer.GetMaterialStore().FindMaterial(material);
        if (!found)
        {
            Core::Log::Error("SceneGraph[{}]: Invalid material name: '{}'", m_Label, material);
            return Core::Err<NodeHandle>(Core::ErrorCode::InvalidHandle);
        }

        return CreateModelNodeWithMaterial(modelName, found->Id, name);
    }

    Core::Expected<NodeHandle> SceneGraph::CreateModelNodeWithMaterial(const std::string& modelName,
                                                                       MaterialId materialId,
                                                                       const std::string& name)
    {
        const SceneModel* model = GetModel(modelName);
        if (!model)
            return Core::Err<NodeHandle>(Core::ErrorCode::InvalidHandle);

        MaterialStore& materials = m_Renderer.GetMaterialStore();
        auto slot = materials.Use(materialId);
        if (!slot)
            return Core::Err<NodeHandle>(slot.error());

        InstanceData data{};
        data.MaterialSlot = *slot;

        auto instance = m_Renderer.GetInstanceStore().AddInstance(model->Allocation, data, false);
        if (!instance)
        {
            (void)materials.Release(materialId);
            return Core::Err<NodeHandle>(instance.error());
        }

        ModelNode payload{};
        payload.ModelName = modelName;
        payload.Instance = *instance;
        payload.Material = materialId;
        payload.MaterialSlot = *slot;
        return CreateNode(name, std::move(payload));
    }

    Core::Expected<NodeHandle> SceneGraph::CreateCameraNode(const std::string& viewName, const std::string& name)
    {
        if (!viewName.empty())
        {
            const View* view = GetView(viewName);
            if (!view)
            {
                Core::Log::Error("SceneGraph[{}]: view '{}' does not exist", m_Label, viewName);
                return Core::Err<NodeHandle>(Core::ErrorCode::InvalidHandle);
            }
            if (view->Node != entt::null)
            {
                Core::Log::Error("SceneGraph[{}]: view '{}' already has a camera", m_Label, viewName);
                return Core::Err<NodeHandle>(Core::ErrorCode::InvalidArgument);
            }
        }

        const NodeHandle node = CreateNode(name, CameraNode{viewName});
        if (!viewName.empty())
        {
            if (auto bound = BindView(viewName, ViewKind::Camera, node); !bound)
            {
                m_Scene.DestroyEntity(node);
                return Core::Err<NodeHandle>(bound.error());
            }
        }
        return node;
    }

    Core::Expected<NodeHandle> SceneGraph::CreateLightNode(const LightSourceDescriptor& descriptor,
                                                           const std::string& viewName,
                                                           const std::string& name)
    {
        if (!viewName.empty())
        {
            const View* view = GetView(viewName);
            if (!view)
            {
                Core::Log::Error("SceneGraph[{}]: view '{}' does not exist", m_Label, viewName);
                return Core::Err<NodeHandle>(Core::ErrorCode::InvalidHandle);
            }
            if (view->Node != entt::null)
            {
                Core::Log::Error("SceneGraph[{}]: view '{}' is already bound to a node", m_Label, viewName);
                return Core::Err<NodeHandle>(Core::ErrorCode::InvalidArgument);
            }
        }

        const LightId light = m_Lighting.CreateLightSource(descriptor);
        const NodeHandle node = CreateNode(name, LightNode{light, viewName});
        if (!viewName.empty())
        {
            if (auto bound = BindView(viewName, ViewKind::Light, node); !bound)
            {
                m_Scene.DestroyEntity(node);
                (void)m_Lighting.RemoveLightSource(light);
                return Core::Err<NodeHandle>(bound.error());
            }
        }
        return node;
    }

    Core::Expected<NodeHandle> SceneGraph::CreateNodeFromDescriptor(const NodeDescriptor& descriptor)
    {
        Core::Expected<NodeHandle> created = Core::Err<NodeHandle>(Core::ErrorCode::InvalidArgument);
        switch (descriptor.Type)
        {
        case NodeType::Transform:
            created = CreateTransformNode(descriptor.Name);
            break;
        case NodeType::Model:
            created = CreateModelNode(descriptor.ModelName, descriptor.Material, descriptor.Name);
            break;
        case NodeType::Camera:
            created = CreateCameraNode(descriptor.ViewName, descriptor.Name);
            break;
        case NodeType::Light:
            created = CreateLightNode(descriptor.Light, descriptor.ViewName, descriptor.Name);
            break;
        }
        if (!created)
            return created;

        const NodeHandle node = *created;
        auto fail = [this, node](Core::ErrorCode code) -> Core::Expected<NodeHandle>
        {
            DestroySubtree(node);
            return Core::Err<NodeHandle>(code);
        };

        if (descriptor.Transform)
        {
            if (auto applied = SetTransform(node, *descriptor.Transform); !applied)
                return fail(applied.error());
        }

        for (const NodeDescriptor& childDescriptor : descriptor.Children)
        {
            auto child = CreateNodeFromDescriptor(childDescriptor);
            if (!child)
                return fail(child.error());

            // The new node is detached, so this only links the subtree.
            if (auto attached = AttachNode(*child, node); !attached)
            {
                DestroySubtree(*child);
                return fail(attached.error());
            }
        }

        if (descriptor.Visible)
        {
            if (auto shown = SetNodeVisibility(node, *descriptor.Visible); !shown)
                return fail(shown.error());
        }

        return node;
    }

    // -------------------------------------------------------------------------
    // Destruction and cloning
    // -------------------------------------------------------------------------

    Core::Result SceneGraph::DestroyNode(NodeHandle node)
    {
        const SceneNode* sceneNode = FindSceneNode(node);
        if (!sceneNode)
            return Core::Err(Core::ErrorCode::InvalidHandle);

        if (node == m_Root)
        {
            Core::Log::Warn("SceneGraph[{}]: the root node cannot be destroyed", m_Label);
            return Core::Err(Core::ErrorCode::InvalidOperation);
        }

        if (sceneNode->Root != entt::null || GetParent(node) != entt::null)
        {
            Core::Log::Warn("SceneGraph[{}]: node '{}' must be detached before it is destroyed",
                            m_Label, GetNodeName(node));
            return Core::Err(Core::ErrorCode::InvalidOperation);
        }

        DestroySubtree(node);
        return Core::Ok();
    }

    void SceneGraph::DestroySubtree(NodeHandle node)
    {
        auto& registry = m_Scene.GetRegistry();
        for (NodeHandle child : ECS::Components::Hierarchy::GetChildren(registry, node))
            DestroySubtree(child);

        const SceneNode& sceneNode = registry.get<SceneNode>(node);
        std::visit([&](const auto& payload)
        {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, ModelNode>)
            {
                if (auto removed = m_Renderer.GetInstanceStore().RemoveInstance(payload.Instance); !removed)
                    Core::Log::Error("SceneGraph[{}]: failed to remove instance {}: {}", m_Label,
                                     payload.Instance, Core::ErrorCodeToString(removed.error()));
                if (auto released = m_Renderer.GetMaterialStore().Release(payload.Material); !released)
                    Core::Log::Error("SceneGraph[{}]: failed to release material {}: {}", m_Label,
                                     payload.Material, Core::ErrorCodeToString(released.error()));
            }
            else if constexpr (std::is_same_v<T, CameraNode>)
            {
                if (View* view = FindView(payload.ViewName); view && view->Node == node)
                    view->Node = entt::null;
            }
            else if constexpr (std::is_same_v<T, LightNode>)
            {
                if (View* view = FindView(payload.ViewName); view && view->Node == node)
                    view->Node = entt::null;
                (void)m_Lighting.RemoveLightSource(payload.Light);
            }
        }, sceneNode.Payload);

        m_Scene.DestroyEntity(node);
    }

    Core::Expected<NodeHandle> SceneGraph::CloneNode(NodeHandle node)
    {
        if (!IsValidNode(node))
            return Core::Err<NodeHandle>(Core::ErrorCode::InvalidHandle);
        return CloneSubtree(node);
    }

    Core::Expected<NodeHandle> SceneGraph::CloneSubtree(NodeHandle node)
    {
        // Copied: creating nodes below may grow the component pools.
        const NodePayload source = m_Scene.GetRegistry().get<SceneNode>(node).Payload;
        const std::string name = GetNodeName(node);

        Core::Expected<NodeHandle> created = std::visit([&](const auto& payload) -> Core::Expected<NodeHandle>
        {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, TransformNode>)
                return CreateTransformNode(name);
            else if constexpr (std::is_same_v<T, ModelNode>)
                return CreateModelNodeWithMaterial(payload.ModelName, payload.Material, name);
            else if constexpr (std::is_same_v<T, CameraNode>)
                return CreateCameraNode({}, name);
            else
            {
                LightSourceDescriptor descriptor{};
                if (const LightSource* light = m_Lighting.GetLightSource(payload.Light))
                {
                    descriptor.Type = light->Type;
                    descriptor.Position = light->Position;
                    descriptor.Direction = light->Direction;
                    descriptor.Attenuation = light->Attenuation;
                    descriptor.Ambient = light->Ambient;
                    descriptor.Diffuse = light->Diffuse;
                    descriptor.Specular = light->Specular;
                    descriptor.Cone = light->Cone;
                }
                return CreateLightNode(descriptor, {}, name);
            }
        }, source);

        if (!created)
            return created;

        const NodeHandle clone = *created;
        auto& registry = m_Scene.GetRegistry();
        registry.get<ECS::Components::Transform::LocalMatrix>(clone).Matrix =
            registry.get<ECS::Components::Transform::LocalMatrix>(node).Matrix;
        registry.get<SceneNode>(clone).Visible = registry.get<SceneNode>(node).Visible;

        for (NodeHandle child : GetChildren(node))
        {
            auto childClone = CloneSubtree(child);
            if (!childClone)
            {
                DestroySubtree(clone);
                return childClone;
            }
            if (auto attached = AttachNode(*childClone, clone); !attached)
            {
                DestroySubtree(*childClone);
                DestroySubtree(clone);
                return Core::Err<NodeHandle>(attached.error());
            }
        }
        return clone;
    }

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    bool SceneGraph::IsValidNode(NodeHandle node) const
    {
        const auto& registry = m_Scene.GetRegistry();
        return registry.valid(node) && registry.all_of<SceneNode>(node);
    }

    SceneNode* SceneGraph::FindSceneNode(NodeHandle node)
    {
        auto& registry = m_Scene.GetRegistry();
        return registry.valid(node) ? registry.try_get<SceneNode>(node) : nullptr;
    }

    const SceneNode* SceneGraph::FindSceneNode(NodeHandle node) const
    {
        const auto& registry = m_Scene.GetRegistry();
        return registry.valid(node) ? registry.try_get<SceneNode>(node) : nullptr;
    }

    const SceneNode* SceneGraph::GetNode(NodeHandle node) const
    {
        return FindSceneNode(node);
    }

    std::string SceneGraph::GetNodeName(NodeHandle node) const
    {
        if (!IsValidNode(node))
            return {};
        return m_Scene.GetRegistry().get<ECS::Components::NameTag::Component>(node).Name;
    }

    NodeHandle SceneGraph::GetParent(NodeHandle node) const
    {
        if (!IsValidNode(node))
            return entt::null;
        return m_Scene.GetRegistry().get<ECS::Components::Hierarchy::Component>(node).Parent;
    }

    std::vector<NodeHandle> SceneGraph::GetChildren(NodeHandle node) const
    {
        if (!IsValidNode(node))
            return {};
        return ECS::Components::Hierarchy::GetChildren(m_Scene.GetRegistry(), node);
    }

    NodeHandle SceneGraph::FindNode(const std::string& name) const
    {
        return FindChildNode(name, m_Root);
    }

    NodeHandle SceneGraph::FindChildNode(const std::string& name, NodeHandle node) const
    {
        if (!IsValidNode(node))
            return entt::null;

        if (GetNodeName(node) == name)
            return node;

        for (NodeHandle child : GetChildren(node))
        {
            const NodeHandle match = FindChildNode(name, child);
            if (match != entt::null)
                return match;
        }
        return entt::null;
    }

    void SceneGraph::Bind(RHI::VulkanDevice& device)
    {
        m_Lighting.Bind(device);
        m_Uniforms.Bind(device);
    }

    // -------------------------------------------------------------------------
    // Declarative construction
    // -------------------------------------------------------------------------

    void SceneGraph::ReplaceRoot(NodeHandle node)
    {
        const NodeHandle previous = m_Root;
        m_Root = node;
        m_Scene.GetRegistry().get<ECS::Components::NameTag::Component>(node).Name = "root";

        // The default root never had children when this runs.
        DestroySubtree(previous);

        SetRootRecursive(node, node);
        if (auto activated = ActivateSubtree(node); !activated)
            Core::Log::Error("SceneGraph[{}]: scene activation incomplete: {}", m_Label,
                             Core::ErrorCodeToString(activated.error()));
    }

    namespace
    {
        // Instance reservations cannot be returned, so the model list is
        // checked as a whole before the first one is registered.
        Core::Result ValidateModels(const SceneGraphDescriptor& descriptor, const Renderer& renderer)
        {
            std::unordered_set<std::string> names;
            uint64_t requested = 0;
            for (const ModelDescriptor& model : descriptor.Models)
            {
                if (!names.insert(model.Name).second)
                {
                    Core::Log::Error("SceneGraph[{}]: model '{}' listed twice", descriptor.Name, model.Name);
                    return Core::Err(Core::ErrorCode::InvalidArgument);
                }
                if (!renderer.GetMeshStore().FindMesh(model.Mesh))
                {
                    Core::Log::Error("SceneGraph[{}]: model '{}' refers to unknown mesh '{}'", descriptor.Name,
                                     model.Name, model.Mesh);
                    return Core::Err(Core::ErrorCode::InvalidHandle);
                }
                requested += model.MaxInstances;
            }

            const InstanceStore& instances = renderer.GetInstanceStore();
            const uint64_t available = instances.GetCapacity() - instances.GetReservedCapacity();
            if (requested > available)
            {
                Core::Log::Error("SceneGraph[{}]: models need {} instance slots, {} available", descriptor.Name,
                                 requested, available);
                return Core::Err(Core::ErrorCode::CapacityExceeded);
            }
            return Core::Ok();
        }
    }

    Core::Expected<std::unique_ptr<SceneGraph>> CreateSceneGraphFromDescriptor(
        const SceneGraphDescriptor& descriptor, Renderer& renderer)
    {
        if (auto valid = ValidateModels(descriptor, renderer); !valid)
            return Core::Err<std::unique_ptr<SceneGraph>>(valid.error());

        SceneGraphConfig config{};
        config.Label = descriptor.Name;
        auto sceneGraph = std::make_unique<SceneGraph>(renderer, config);

        for (const ViewDescriptor& view : descriptor.Views)
        {
            if (auto created = sceneGraph->CreateView(view.Name, view.Projection, view.Kind); !created)
                return Core::Err<std::unique_ptr<SceneGraph>>(created.error());
        }

        for (const ModelDescriptor& model : descriptor.Models)
        {
            if (auto registered = sceneGraph->RegisterModel(model.Name, model.Mesh, model.Pipeline, model.MaxInstances);
                !registered)
                return Core::Err<std::unique_ptr<SceneGraph>>(registered.error());
        }

        if (descriptor.Root)
        {
            auto root = sceneGraph->CreateNodeFromDescriptor(*descriptor.Root);
            if (!root)
                return Core::Err<std::unique_ptr<SceneGraph>>(root.error());
            sceneGraph->ReplaceRoot(*root);
        }

        Core::Log::Info("SceneGraph[{}]: {} models, {} views, {} nodes", sceneGraph->GetLabel(),
                        descriptor.Models.size(), descriptor.Views.size(), sceneGraph->GetNodeCount());
        return sceneGraph;
    }
}
