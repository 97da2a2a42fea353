module;

#include <cfloat>

#include <glm/glm.hpp>

export module Graphics:Bounds;

export namespace Graphics
{
    // Axis-aligned box. Default constructed boxes are empty (Min > Max).
    struct AABB
    {
        glm::vec3 Min = glm::vec3(FLT_MAX);
        glm::vec3 Max = glm::vec3(-FLT_MAX);

        [[nodiscard]] bool IsValid() const
        {
            return (Min.x <= Max.x) && (Min.y <= Max.y) && (Min.z <= Max.z);
        }

        [[nodiscard]] glm::vec3 GetCenter() const
        {
            return (Min + Max) * 0.5f;
        }

        [[nodiscard]] glm::vec3 GetSize() const
        {
            return Max - Min;
        }
    };

    AABB Union(const AABB& aabb, const glm::vec3& point)
    {
        AABB result;
        result.Min = glm::min(aabb.Min, point);
        result.Max = glm::max(aabb.Max, point);
        return result;
    }

    AABB Union(const AABB& aabb, const AABB& other)
    {
        if (!other.IsValid()) return aabb;
        if (!aabb.IsValid()) return other;

        AABB result;
        result.Min = glm::min(aabb.Min, other.Min);
        result.Max = glm::max(aabb.Max, other.Max);
        return result;
    }

    // Box enclosing the eight transformed corners.
    AABB Transform(const AABB& aabb, const glm::mat4& matrix)
    {
        if (!aabb.IsValid()) return aabb;

        AABB result;
        for (int i = 0; i < 8; ++i)
        {
            const glm::vec3 corner{
                (i & 1) ? aabb.Max.x : aabb.Min.x,
                (i & 2) ? aabb.Max.y : aabb.Min.y,
                (i & 4) ? aabb.Max.z : aabb.Min.z};
            result = Union(result, glm::vec3(matrix * glm::vec4(corner, 1.0f)));
        }
        return result;
    }
}
