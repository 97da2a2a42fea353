module;

#include <cstdint>
#include <vector>
#include <entt/entity/registry.hpp>

module ECS:Components.Hierarchy.Impl;
import :Components.Hierarchy;
import Core;

namespace ECS::Components::Hierarchy::Detail
{
    using namespace ECS::Components::Hierarchy;

    void AttachHelper(entt::registry& registry, entt::entity child, Component& childComp,
                      entt::entity parent, Component& parentComp)
    {
        // 1. Set Parent
        childComp.Parent = parent;

        // 2. Append at Tail of Parent's list
        childComp.PrevSibling = parentComp.LastChild;
        childComp.NextSibling = entt::null;

        if (parentComp.LastChild != entt::null)
        {
            auto& oldTail = registry.get<Component>(parentComp.LastChild);
            oldTail.NextSibling = child;
        }
        else
        {
            parentComp.FirstChild = child;
        }

        parentComp.LastChild = child;
        parentComp.ChildCount++;
    }

    void DetachHelper(entt::registry& registry, Component& childComp)
    {
        entt::entity parent = childComp.Parent;
        auto& parentComp = registry.get<Component>(parent);

        // 1. Fix Previous Sibling or Parent Head
        if (childComp.PrevSibling != entt::null)
        {
            auto& prev = registry.get<Component>(childComp.PrevSibling);
            prev.NextSibling = childComp.NextSibling;
        }
        else
        {
            parentComp.FirstChild = childComp.NextSibling;
        }

        // 2. Fix Next Sibling or Parent Tail
        if (childComp.NextSibling != entt::null)
        {
            auto& next = registry.get<Component>(childComp.NextSibling);
            next.PrevSibling = childComp.PrevSibling;
        }
        else
        {
            parentComp.LastChild = childComp.PrevSibling;
        }

        // 3. Update Parent Data
        parentComp.ChildCount--;

        // 4. Clear Child Data
        childComp.Parent = entt::null;
        childComp.NextSibling = entt::null;
        childComp.PrevSibling = entt::null;
    }
}

namespace ECS::Components::Hierarchy
{
    bool IsAncestor(const entt::registry& registry, entt::entity ancestor, entt::entity entity)
    {
        entt::entity current = entity;
        while (current != entt::null && registry.valid(current))
        {
            if (current == ancestor) return true;

            const auto* comp = registry.try_get<Component>(current);
            if (!comp) break;
            current = comp->Parent;
        }
        return false;
    }

    bool Attach(entt::registry& registry, entt::entity child, entt::entity newParent)
    {
        if (!registry.valid(child) || !registry.valid(newParent)) return false;

        auto& childComp = registry.get_or_emplace<Component>(child);
        if (childComp.Parent != entt::null) return false;

        // Parenting A under its own descendant would close a loop.
        if (IsAncestor(registry, child, newParent))
        {
            Core::Log::Warn("Hierarchy::Attach -- cycle detected: cannot attach entity {} to its own descendant {}",
                            static_cast<uint32_t>(child), static_cast<uint32_t>(newParent));
            return false;
        }

        auto& parentComp = registry.get_or_emplace<Component>(newParent);
        Detail::AttachHelper(registry, child, childComp, newParent, parentComp);
        return true;
    }

    bool Detach(entt::registry& registry, entt::entity child)
    {
        if (!registry.valid(child)) return false;

        auto* childComp = registry.try_get<Component>(child);
        if (!childComp || childComp->Parent == entt::null) return false;

        Detail::DetachHelper(registry, *childComp);
        return true;
    }

    std::vector<entt::entity> GetChildren(const entt::registry& registry, entt::entity parent)
    {
        std::vector<entt::entity> children;
        if (const auto* comp = registry.try_get<Component>(parent))
        {
            children.reserve(comp->ChildCount);
        }
        ForEachChild(registry, parent, [&](entt::entity child) { children.push_back(child); });
        return children;
    }
}
