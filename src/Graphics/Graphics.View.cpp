module;

#include <cmath>
#include <type_traits>
#include <variant>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

module Graphics:View.Impl;

import :View;

namespace Graphics
{
    namespace
    {
        glm::mat4 Perspective(const PerspectiveProjection& p)
        {
            const float fovy = glm::radians(p.FovyDegrees);
            if (std::isfinite(p.Far))
                return glm::perspectiveRH_ZO(fovy, p.Aspect, p.Near, p.Far);

            // Limit of perspectiveRH_ZO as far -> infinity.
            const float f = 1.0f / std::tan(fovy * 0.5f);
            glm::mat4 result(0.0f);
            result[0][0] = f / p.Aspect;
            result[1][1] = f;
            result[2][2] = -1.0f;
            result[2][3] = -1.0f;
            result[3][2] = -p.Near;
            return result;
        }
    }

    glm::mat4 ComputeProjection(const ProjectionDescriptor& descriptor)
    {
        glm::mat4 projection = std::visit([](const auto& p) -> glm::mat4
        {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, PerspectiveProjection>)
                return Perspective(p);
            else
                return glm::orthoRH_ZO(p.Left, p.Right, p.Bottom, p.Top, p.Near, p.Far);
        }, descriptor);

        projection[1][1] *= -1;
        return projection;
    }
}
