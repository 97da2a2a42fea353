module;
#include <cstdint>
#include <vector>
#include <entt/entity/registry.hpp>

export module ECS:Components.Hierarchy;

export namespace ECS::Components::Hierarchy
{
    // Intrusive doubly-linked child list. Children keep attach order:
    // new children are appended after LastChild.
    struct Component
    {
        entt::entity Parent = entt::null;
        entt::entity FirstChild = entt::null;
        entt::entity LastChild = entt::null;
        entt::entity NextSibling = entt::null;
        entt::entity PrevSibling = entt::null;
        uint32_t ChildCount = 0;
    };

    // Links child as the last child of newParent. Returns false (and leaves
    // both lists untouched) if child already has a parent, if either entity is
    // invalid, or if newParent lies in child's subtree.
    [[nodiscard]] bool Attach(entt::registry& registry, entt::entity child, entt::entity newParent);

    // Unlinks child from its parent. Returns false if it had none.
    bool Detach(entt::registry& registry, entt::entity child);

    // True if 'ancestor' is 'entity' or appears on its parent chain.
    [[nodiscard]] bool IsAncestor(const entt::registry& registry, entt::entity ancestor, entt::entity entity);

    // Children in attach order.
    [[nodiscard]] std::vector<entt::entity> GetChildren(const entt::registry& registry, entt::entity parent);

    template<typename Fn>
    void ForEachChild(const entt::registry& registry, entt::entity parent, Fn&& fn)
    {
        const auto* comp = registry.try_get<Component>(parent);
        if (!comp) return;

        entt::entity child = comp->FirstChild;
        while (child != entt::null)
        {
            // Fetch the sibling before the callback so it may unlink 'child'.
            const entt::entity next = registry.get<Component>(child).NextSibling;
            fn(child);
            child = next;
        }
    }
}
