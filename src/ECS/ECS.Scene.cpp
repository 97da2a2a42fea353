module;
#include <cstddef>
#include <string>
#include <entt/entity/registry.hpp>

module ECS:Scene.Impl;
import :Scene;
import :Components;

namespace ECS
{
    entt::entity Scene::CreateEntity(const std::string& name)
    {
        entt::entity e = m_Registry.create();
        m_Registry.emplace<Components::NameTag::Component>(e, name);
        m_Registry.emplace<Components::Hierarchy::Component>(e);
        m_Registry.emplace<Components::Transform::LocalMatrix>(e);
        m_Registry.emplace<Components::Transform::WorldMatrix>(e);
        return e;
    }

    void Scene::DestroyEntity(entt::entity entity)
    {
        if (!m_Registry.valid(entity)) return;

        Components::Hierarchy::Detach(m_Registry, entity);
        m_Registry.destroy(entity);
    }

    size_t Scene::Size() const
    {
        return m_Registry.view<Components::NameTag::Component>().size();
    }
}
