module;

#include <cstdint>
#include <limits>
#include <string>
#include <variant>

#include <glm/glm.hpp>
#include <entt/entity/entity.hpp>

export module Graphics:View;

export namespace Graphics
{
    enum class ViewKind : uint8_t
    {
        Camera,
        Light
    };

    struct PerspectiveProjection
    {
        float FovyDegrees = 90.0f;
        float Aspect = 1.0f;
        float Near = 0.001f;
        float Far = std::numeric_limits<float>::infinity(); // infinite far plane allowed
    };

    struct OrthographicProjection
    {
        float Left = -1.0f;
        float Right = 1.0f;
        float Bottom = -1.0f;
        float Top = 1.0f;
        float Near = 0.0f;
        float Far = 1.0f;
    };

    using ProjectionDescriptor = std::variant<PerspectiveProjection, OrthographicProjection>;

    // Right-handed, depth 0..1, Y flipped for Vulkan clip space.
    [[nodiscard]] glm::mat4 ComputeProjection(const ProjectionDescriptor& descriptor);

    // Named projection + view matrix. Driven by at most one camera or light
    // node, which writes the inverse of its world transform every update.
    struct View
    {
        std::string Name;
        ViewKind Kind = ViewKind::Camera;
        glm::mat4 Projection{1.0f};
        glm::mat4 ViewMatrix{1.0f};
        entt::entity Node = entt::null;
    };
}
