module;

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <entt/entity/entity.hpp>

export module Graphics:SceneNode;

import :Bounds;
import :InstanceStore;
import :LightingStore;
import :MaterialStore;
import :View;

export namespace Graphics
{
    using NodeHandle = entt::entity;

    enum class NodeType : uint8_t
    {
        Transform,
        Model,
        Camera,
        Light
    };

    struct TransformNode
    {
    };

    struct ModelNode
    {
        std::string ModelName;
        InstanceId Instance = 0;
        MaterialId Material = 0;
        uint32_t MaterialSlot = 0;
    };

    struct CameraNode
    {
        std::string ViewName; // empty = not bound to a view
    };

    struct LightNode
    {
        LightId Light = 0;
        std::string ViewName;
    };

    using NodePayload = std::variant<TransformNode, ModelNode, CameraNode, LightNode>;

    // Scene-graph specific state of a node entity. The name, the local and
    // world matrices and the parent/child links live in the ECS components.
    struct SceneNode
    {
        NodePayload Payload;
        bool Visible = true;
        NodeHandle Root = entt::null; // entt::null while detached
        AABB Bounds;                  // world space, models only

        [[nodiscard]] NodeType GetType() const { return static_cast<NodeType>(Payload.index()); }
    };

    // ---------------------------------------------------------------------
    // Transform descriptors
    // ---------------------------------------------------------------------

    struct MatrixTransform
    {
        glm::mat4 Matrix{1.0f};
    };

    // Rotation comes from RotationQuat if set, else from RotationEulerDegrees
    // (applied around X, then Y, then Z).
    struct TrsTransform
    {
        std::optional<glm::vec3> Translation;
        std::optional<glm::quat> RotationQuat;
        std::optional<glm::vec3> RotationEulerDegrees;
        std::optional<glm::vec3> Scale;
    };

    // Places the node on a sphere: lifted by Radius along +Y, then rotated so
    // +Y points at the given latitude/longitude.
    struct GlobeTransform
    {
        glm::vec2 CoordsDegrees{0.0f}; // latitude, longitude
        float Radius = 1.0f;
    };

    using TransformDescriptor = std::variant<MatrixTransform, TrsTransform, GlobeTransform>;

    [[nodiscard]] glm::mat4 ComputeMatrix(const TransformDescriptor& descriptor);

    // ---------------------------------------------------------------------
    // Declarative construction
    // ---------------------------------------------------------------------

    struct NodeDescriptor
    {
        std::string Name;
        NodeType Type = NodeType::Transform;
        std::optional<TransformDescriptor> Transform;
        std::vector<NodeDescriptor> Children;
        std::optional<bool> Visible;

        // Model nodes
        std::string ModelName;
        std::optional<std::string> Material; // defaults to the mesh's material

        // Camera and light nodes
        std::string ViewName;

        // Light nodes
        LightSourceDescriptor Light;
    };

    struct ModelDescriptor
    {
        std::string Name;
        std::string Mesh;
        std::string Pipeline;
        uint32_t MaxInstances = 0;
    };

    struct ViewDescriptor
    {
        std::string Name;
        ViewKind Kind = ViewKind::Camera;
        ProjectionDescriptor Projection;
    };

    struct SceneGraphDescriptor
    {
        std::string Name;
        std::vector<ModelDescriptor> Models;
        std::vector<ViewDescriptor> Views;
        std::optional<NodeDescriptor> Root;
    };
}
