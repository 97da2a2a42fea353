module;

#include <cmath>
#include <type_traits>
#include <variant>

#define GLM_ENABLE_EXPERIMENTAL
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtx/quaternion.hpp>

module Graphics:SceneNode.Impl;

import :SceneNode;

namespace Graphics
{
    namespace
    {
        glm::vec3 LatLonToUnitVector(const glm::vec2& latLon)
        {
            const float lat = latLon.x;
            const float lon = latLon.y;
            return {std::cos(lon) * std::cos(lat), std::sin(lat), std::sin(lon) * std::cos(lat)};
        }

        glm::mat4 FromTrs(const TrsTransform& t)
        {
            glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
            if (t.RotationQuat)
            {
                rotation = *t.RotationQuat;
            }
            else if (t.RotationEulerDegrees)
            {
                const glm::vec3 r = glm::radians(*t.RotationEulerDegrees);
                rotation = glm::angleAxis(r.z, glm::vec3(0, 0, 1)) *
                           glm::angleAxis(r.y, glm::vec3(0, 1, 0)) *
                           glm::angleAxis(r.x, glm::vec3(1, 0, 0));
            }

            glm::mat4 m = glm::translate(glm::mat4(1.0f), t.Translation.value_or(glm::vec3(0.0f)));
            m = m * glm::toMat4(rotation);
            m = glm::scale(m, t.Scale.value_or(glm::vec3(1.0f)));
            return m;
        }

        glm::mat4 FromGlobe(const GlobeTransform& g)
        {
            const glm::mat4 lift = glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, g.Radius, 0.0f));
            const glm::vec3 up = LatLonToUnitVector(glm::radians(g.CoordsDegrees));
            const glm::quat rotation = glm::rotation(glm::vec3(0.0f, 1.0f, 0.0f), up);
            return glm::toMat4(rotation) * lift;
        }
    }

    glm::mat4 ComputeMatrix(const TransformDescriptor& descriptor)
    {
        return std::visit([](const auto& d) -> glm::mat4
        {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, MatrixTransform>)
                return d.Matrix;
            else if constexpr (std::is_same_v<T, TrsTransform>)
                return FromTrs(d);
            else
                return FromGlobe(d);
        }, descriptor);
    }
}
