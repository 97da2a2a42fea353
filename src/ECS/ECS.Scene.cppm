module;
#include <cstddef>
#include <string>
#include <entt/entity/registry.hpp>

export module ECS:Scene;

export namespace ECS
{
    // Owns the entity arena. Every entity created through the scene carries
    // a name, a hierarchy link and local/world matrices.
    class Scene
    {
    public:
        Scene() = default;
        ~Scene() = default;

        Scene(const Scene&) = delete;
        Scene& operator=(const Scene&) = delete;

        entt::entity CreateEntity(const std::string& name);

        // Unlinks the entity from its parent and destroys it. Children are
        // not touched; callers destroy subtrees bottom-up.
        void DestroyEntity(entt::entity entity);

        entt::registry& GetRegistry() { return m_Registry; }
        [[nodiscard]] const entt::registry& GetRegistry() const { return m_Registry; }

        [[nodiscard]] size_t Size() const;

    private:
        entt::registry m_Registry;
    };
}
