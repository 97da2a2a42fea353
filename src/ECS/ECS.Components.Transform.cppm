module;
#include <glm/glm.hpp>

export module ECS:Components.Transform;

export namespace ECS::Components::Transform
{
    // Node-relative transform. Arbitrary affine matrix; not necessarily TRS.
    struct LocalMatrix
    {
        glm::mat4 Matrix{1.0f};
    };

    // Cached parent-chain product, rewritten by the scene traversal.
    struct WorldMatrix
    {
        glm::mat4 Matrix{1.0f};
    };
}
