export module Graphics;

export import :Bounds;
export import :DrawCallBatcher;
export import :GpuLayouts;
export import :InstanceStore;
export import :LightingStore;
export import :MaterialStore;
export import :MeshStore;
export import :Renderer;
export import :SceneGraph;
export import :SceneNode;
export import :TextureAtlas;
export import :View;
