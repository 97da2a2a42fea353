#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

import Core;
import RHI;
import Graphics;

using namespace Core;

namespace
{
    struct Vertex
    {
        glm::vec3 Position;
        glm::vec3 Normal;
        glm::vec2 Uv;
        glm::vec4 Tangent;
        glm::vec4 Color;
    };
    static_assert(sizeof(Vertex) == RHI::SceneVertexLayout::VertexStride);

    // Unit cube, flat colour, one shared vertex per corner.
    void BuildCube(std::vector<Vertex>& vertices, std::vector<uint32_t>& indices)
    {
        for (int i = 0; i < 8; ++i)
        {
            const glm::vec3 p{(i & 1) ? 0.5f : -0.5f, (i & 2) ? 0.5f : -0.5f, (i & 4) ? 0.5f : -0.5f};
            vertices.push_back({p, glm::normalize(p), glm::vec2(0.0f), glm::vec4(1, 0, 0, 1), glm::vec4(1.0f)});
        }

        indices = {0, 2, 1, 1, 2, 3,  4, 5, 6, 5, 7, 6,
                   0, 1, 4, 1, 5, 4,  2, 6, 3, 3, 6, 7,
                   0, 4, 2, 2, 4, 6,  1, 3, 5, 3, 7, 5};
    }

    Graphics::NodeDescriptor MakeCubeNode(std::string_view name, const glm::vec3& position)
    {
        Graphics::NodeDescriptor node{};
        node.Name = name;
        node.Type = Graphics::NodeType::Model;
        node.ModelName = "cube";
        node.Transform = Graphics::TrsTransform{.Translation = position};
        return node;
    }
}

int main(int argc, char** argv)
{
    const bool useGpu = argc > 1 && std::string_view(argv[1]) == "--gpu";

    // Created first so every GPU buffer is released before the device.
    std::unique_ptr<RHI::VulkanContext> context;
    std::unique_ptr<RHI::VulkanDevice> device;
    if (useGpu)
    {
        context = std::make_unique<RHI::VulkanContext>(RHI::ContextConfig{"SceneDemo", true});
        if (context->IsValid())
            device = std::make_unique<RHI::VulkanDevice>(*context);

        if (!device || !device->IsValid())
        {
            Log::Warn("No usable Vulkan device, staying headless");
            device.reset();
        }
    }

    Graphics::RendererConfig config{};
    config.InstanceCapacity = 256;
    config.Atlas.LayerWidth = 1024;
    config.Atlas.LayerHeight = 1024;
    config.Atlas.Layers = 1;

    Graphics::Renderer renderer(config);

    // Assets would normally come from the loader.
    std::vector<Vertex> vertices;
    std::vector<uint32_t> indices;
    BuildCube(vertices, indices);

    auto mesh = renderer.GetMeshStore().AddMesh("cube", static_cast<uint32_t>(vertices.size()),
                                                std::as_bytes(std::span<const Vertex>(vertices)), indices,
                                                "red");
    if (!mesh)
    {
        Log::Error("Failed to add cube mesh: {}", ErrorCodeToString(mesh.error()));
        return 1;
    }

    Graphics::MaterialDescriptor red{};
    red.Name = "red";
    red.Diffuse = glm::vec4(1.0f, 0.1f, 0.1f, 1.0f);
    red.Shininess = 32.0f;
    if (auto material = renderer.GetMaterialStore().CreateMaterial(red); !material)
    {
        Log::Error("Failed to create material: {}", ErrorCodeToString(material.error()));
        return 1;
    }

    Graphics::MaterialDescriptor blue{};
    blue.Name = "blue";
    blue.Diffuse = glm::vec4(0.1f, 0.1f, 1.0f, 1.0f);
    if (auto material = renderer.GetMaterialStore().CreateMaterial(blue); !material)
    {
        Log::Error("Failed to create material: {}", ErrorCodeToString(material.error()));
        return 1;
    }

    renderer.RegisterPipeline("forward", RHI::PipelineHandle{});

    // Declarative scene: a camera, a sun and a row of cubes.
    Graphics::SceneGraphDescriptor descriptor{};
    descriptor.Name = "demo";
    descriptor.Models.push_back({"cube", "cube", "forward", 64});
    descriptor.Views.push_back({"main", Graphics::ViewKind::Camera,
                                Graphics::PerspectiveProjection{.FovyDegrees = 60.0f, .Aspect = 16.0f / 9.0f}});

    Graphics::NodeDescriptor root{};
    root.Name = "root";

    Graphics::NodeDescriptor camera{};
    camera.Name = "camera";
    camera.Type = Graphics::NodeType::Camera;
    camera.ViewName = "main";
    camera.Transform = Graphics::TrsTransform{.Translation = glm::vec3(0.0f, 2.0f, 10.0f)};
    root.Children.push_back(camera);

    Graphics::NodeDescriptor sun{};
    sun.Name = "sun";
    sun.Type = Graphics::NodeType::Light;
    sun.Light.Type = Graphics::LightType::Directional;
    sun.Transform = Graphics::TrsTransform{.RotationEulerDegrees = glm::vec3(-45.0f, 30.0f, 0.0f)};
    root.Children.push_back(sun);

    Graphics::NodeDescriptor row{};
    row.Name = "row";
    for (int i = 0; i < 5; ++i)
        row.Children.push_back(MakeCubeNode("cube-" + std::to_string(i), glm::vec3(2.0f * i - 4.0f, 0.0f, 0.0f)));
    root.Children.push_back(row);

    descriptor.Root = root;

    auto sceneGraph = Graphics::CreateSceneGraphFromDescriptor(descriptor, renderer);
    if (!sceneGraph)
    {
        Log::Error("Failed to build scene graph: {}", ErrorCodeToString(sceneGraph.error()));
        return 1;
    }
    Graphics::SceneGraph& scene = **sceneGraph;

    // Extra cube with a material override, attached after construction.
    if (auto extra = scene.CreateModelNode("cube", std::string("blue"), "extra"))
    {
        if (auto moved = scene.SetTranslation(*extra, glm::vec3(0.0f, 2.0f, 0.0f)); !moved)
            Log::Warn("Could not move extra cube: {}", ErrorCodeToString(moved.error()));
        if (auto attached = scene.AttachNode(*extra, scene.GetRoot()); !attached)
            Log::Warn("Could not attach extra cube: {}", ErrorCodeToString(attached.error()));
    }

    // Hide the middle of the row; its draw count drops by one.
    if (auto hidden = scene.SetNodeVisibility(scene.FindNode("cube-2"), false); !hidden)
        Log::Warn("Could not hide cube-2: {}", ErrorCodeToString(hidden.error()));

    if (device)
    {
        renderer.BindDevice(*device);
        scene.Bind(*device);
    }

    for (int frame = 0; frame < 3; ++frame)
    {
        if (device) device->FlushDeletionQueue(static_cast<uint32_t>(frame));

        auto spun = scene.ApplyTransform(scene.FindNode("row"),
                                         Graphics::TrsTransform{.RotationEulerDegrees = glm::vec3(0.0f, 15.0f, 0.0f)});
        if (!spun)
        {
            Log::Error("Frame {}: could not rotate row: {}", frame, ErrorCodeToString(spun.error()));
            return 1;
        }

        if (auto updated = scene.Update("main"); !updated)
        {
            Log::Error("Frame {} failed: {}", frame, ErrorCodeToString(updated.error()));
            return 1;
        }
    }

    for (const auto& call : scene.GetDrawCalls().Submissions())
    {
        Log::Info("{}: {} indices x {} instances (first index {}, instance offset {} B)",
                  call.Label, call.IndexCount, call.InstanceCount, call.IndexOffset, call.InstancePointer);
    }
    Log::Info("Lights active: {}", scene.GetLightingStore().GetActiveCount());

    return 0;
}
