module;

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>
#include <entt/entity/registry.hpp>

#include "RHI.Vulkan.hpp"

export module Graphics:SceneGraph;

import :DrawCallBatcher;
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

export namespace Graphics
{
    struct SceneGraphConfig
    {
        std::string Label;            // generated when empty
        uint32_t LightCapacity = 16;
    };

    // A mesh registered for instancing in one scene graph.
    struct SceneModel
    {
        std::string Name;
        MeshId Mesh = 0;
        std::string PipelineName;
        AllocationId Allocation = 0;
        uint32_t DrawCallId = 0;
    };

    class SceneGraph;

    // Registers the models, then the views, then builds the node tree. A
    // descriptor root replaces the default root node.
    [[nodiscard]] Core::Expected<std::unique_ptr<SceneGraph>> CreateSceneGraphFromDescriptor(
        const SceneGraphDescriptor& descriptor, Renderer& renderer);

    // Tree of transform/model/camera/light nodes over an ECS::Scene.
    //
    // Nodes are created detached. Attaching a subtree below a rooted node
    // activates every effectively visible model instance and light in it;
    // detaching deactivates exactly the same set. A node is effectively
    // visible when it is rooted and neither it nor any ancestor is hidden.
    //
    // Several scene graphs may share one Renderer. Each owns its lights, its
    // uniform block and the draw calls of the models it registered.
    class SceneGraph
    {
    public:
        explicit SceneGraph(Renderer& renderer, const SceneGraphConfig& config = {});
        ~SceneGraph();

        SceneGraph(const SceneGraph&) = delete;
        SceneGraph& operator=(const SceneGraph&) = delete;

        // --- Models and views ---------------------------------------------

        Core::Result RegisterModel(const std::string& name, const std::string& meshName,
                                   const std::string& pipelineName, uint32_t maxInstances);
        [[nodiscard]] const SceneModel* GetModel(const std::string& name) const;

        Core::Result CreateView(const std::string& name, const ProjectionDescriptor& projection,
                                ViewKind kind = ViewKind::Camera);
        [[nodiscard]] const View* GetView(const std::string& name) const;

        // --- Node creation --------------------------------------------------

        [[nodiscard]] Core::Expected<NodeHandle> CreateTransformNode(const std::string& name = {});
        // Uses the mesh's material unless one is named. The instance starts
        // inactive.
        [[nodiscard]] Core::Expected<NodeHandle> CreateModelNode(const std::string& modelName,
                                                                 const std::optional<std::string>& materialName = {},
                                                                 const std::string& name = {});
        // An empty view name leaves the camera unbound.
        [[nodiscard]] Core::Expected<NodeHandle> CreateCameraNode(const std::string& viewName,
                                                                  const std::string& name = {});
        [[nodiscard]] Core::Expected<NodeHandle> CreateLightNode(const LightSourceDescriptor& descriptor,
                                                                 const std::string& viewName = {},
                                                                 const std::string& name = {});
        [[nodiscard]] Core::Expected<NodeHandle> CreateNodeFromDescriptor(const NodeDescriptor& descriptor);

        // --- Structure ------------------------------------------------------

        Core::Result AttachNode(NodeHandle node, NodeHandle parent);
        Core::Result DetachNode(NodeHandle node);
        Core::Result SetNodeVisibility(NodeHandle node, bool visible);
        [[nodiscard]] bool IsNodeVisible(NodeHandle node) const;

        // The node must be detached. Removes the whole subtree together with
        // its instances, material uses, light sources and view bindings.
        Core::Result DestroyNode(NodeHandle node);

        // Detached deep copy. Cloned cameras and lights are not bound to views.
        [[nodiscard]] Core::Expected<NodeHandle> CloneNode(NodeHandle node);

        // --- Transforms -----------------------------------------------------

        Core::Result SetTransform(NodeHandle node, const TransformDescriptor& transform);
        // local = local * transform
        Core::Result ApplyTransform(NodeHandle node, const TransformDescriptor& transform);
        // local = transform * local
        Core::Result ApplyPreTransform(NodeHandle node, const TransformDescriptor& transform);
        Core::Result SetTranslation(NodeHandle node, const glm::vec3& translation);
        [[nodiscard]] std::optional<glm::mat4> GetTransform(NodeHandle node) const;

        // --- Queries --------------------------------------------------------

        [[nodiscard]] NodeHandle GetRoot() const { return m_Root; }
        [[nodiscard]] bool IsValidNode(NodeHandle node) const;
        [[nodiscard]] const SceneNode* GetNode(NodeHandle node) const;
        [[nodiscard]] std::string GetNodeName(NodeHandle node) const;
        [[nodiscard]] NodeHandle GetParent(NodeHandle node) const;
        [[nodiscard]] std::vector<NodeHandle> GetChildren(NodeHandle node) const;
        [[nodiscard]] size_t GetNodeCount() const { return m_Scene.Size(); }

        // First pre-order match below (and including) the root, or entt::null.
        [[nodiscard]] NodeHandle FindNode(const std::string& name) const;
        [[nodiscard]] NodeHandle FindChildNode(const std::string& name, NodeHandle node) const;

        // Product of the local transforms up the parent chain. The node must
        // be attached.
        [[nodiscard]] Core::Expected<glm::mat4> GetModelMatrix(NodeHandle node) const;
        [[nodiscard]] Core::Expected<glm::mat4> GetViewMatrix(const std::string& viewName) const;

        // --- Per frame ------------------------------------------------------

        // Recomputes the world transform of every visible node and writes
        // model-view matrices, view matrices, light transforms and the
        // uniform block for the given view.
        Core::Result UpdateModelViews(const std::string& viewName);

        // UpdateModelViews, then uploads lights and flushes every dirty buffer.
        Core::Result Update(const std::string& viewName);

        // --- Collaborators --------------------------------------------------

        [[nodiscard]] const std::string& GetLabel() const { return m_Label; }
        [[nodiscard]] Renderer& GetRenderer() { return m_Renderer; }
        [[nodiscard]] LightingStore& GetLightingStore() { return m_Lighting; }
        [[nodiscard]] const LightingStore& GetLightingStore() const { return m_Lighting; }
        [[nodiscard]] const DrawCallBatcher& GetDrawCalls() const { return m_DrawCalls; }
        [[nodiscard]] const RHI::MirroredBuffer& GetUniformBuffer() const { return m_Uniforms; }
        [[nodiscard]] const ECS::Scene& GetScene() const { return m_Scene; }

        // Creates the GPU side of the lighting and uniform buffers.
        void Bind(RHI::VulkanDevice& device);

    private:
        friend Core::Expected<std::unique_ptr<SceneGraph>> CreateSceneGraphFromDescriptor(
            const SceneGraphDescriptor& descriptor, Renderer& renderer);

        [[nodiscard]] SceneNode* FindSceneNode(NodeHandle node);
        [[nodiscard]] const SceneNode* FindSceneNode(NodeHandle node) const;
        [[nodiscard]] View* FindView(const std::string& name);

        NodeHandle CreateNode(const std::string& name, NodePayload payload);
        [[nodiscard]] Core::Expected<NodeHandle> CreateModelNodeWithMaterial(const std::string& modelName,
                                                                             MaterialId material,
                                                                             const std::string& name);
        [[nodiscard]] Core::Result BindView(const std::string& viewName, ViewKind kind, NodeHandle node);
        [[nodiscard]] Core::Expected<NodeHandle> CloneSubtree(NodeHandle node);

        // Activation helpers; only called on effective-visibility changes.
        Core::Result ActivateSubtree(NodeHandle node);
        void DeactivateSubtree(NodeHandle node);
        void SetRootRecursive(NodeHandle node, NodeHandle root);
        void DestroySubtree(NodeHandle node);
        void ReplaceRoot(NodeHandle node);

        void Traverse(NodeHandle node, const glm::mat4& parentWorld, const glm::mat4& viewMatrix);

        Renderer& m_Renderer;
        std::string m_Label;

        ECS::Scene m_Scene;
        NodeHandle m_Root = entt::null;

        std::unordered_map<std::string, SceneModel> m_Models;
        std::unordered_map<std::string, View> m_Views;

        LightingStore m_Lighting;
        DrawCallBatcher m_DrawCalls;
        RHI::MirroredBuffer m_Uniforms;
    };
}
