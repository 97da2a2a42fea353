module;

#include <cstdint>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>

#include "RHI.Vulkan.hpp"

export module Graphics:TextureAtlas;

import :GpuLayouts;
import Core;
import RHI;

export namespace Graphics
{
    // Sub-texture ids start at 1. Id 0 is reserved for "no texture" in
    // material records, and metadata record 0 stays zero.
    using SubTextureId = uint32_t;
    constexpr SubTextureId kNoSubTexture = 0;

    struct TextureAtlasConfig
    {
        uint32_t Capacity = 1000;     // max sub-textures
        uint32_t LayerWidth = 8192;
        uint32_t LayerHeight = 8192;
        uint32_t Layers = 3;
        uint32_t MipLevels = 6;
        uint32_t CellSize = 64;       // placement grid step, in texels
    };

    struct SubTexture
    {
        SubTextureId Id = kNoSubTexture;
        std::string Label;
        uint32_t Layer = 0;

        // Inner image, in texels of mip 0.
        uint32_t X = 0;
        uint32_t Y = 0;
        uint32_t Width = 0;
        uint32_t Height = 0;

        // Reserved footprint. Twice the image size when wrappable.
        uint32_t RegionX = 0;
        uint32_t RegionY = 0;
        uint32_t RegionWidth = 0;
        uint32_t RegionHeight = 0;

        bool Wrappable = false;
    };

    // Decoded RGBA8 image handed over by the asset collaborator. Rows are
    // tightly packed, top row first.
    struct DecodedImage
    {
        uint32_t Width = 0;
        uint32_t Height = 0;
        std::span<const uint8_t> Pixels;
    };

    // One rectangle of texels to copy into the atlas image.
    struct AtlasUpload
    {
        uint32_t Layer = 0;
        uint32_t MipLevel = 0;
        uint32_t X = 0;
        uint32_t Y = 0;
        uint32_t Width = 0;
        uint32_t Height = 0;
        std::vector<uint8_t> Pixels; // RGBA8, Width * Height * 4 bytes
    };

    // Cell-grid bin packer over a square, power-of-two layer array.
    //
    // The atlas owns placement and the metadata buffer; the image itself is
    // owned by the GPU collaborator, which drains TakePendingUploads().
    class TextureAtlas
    {
    public:
        explicit TextureAtlas(const TextureAtlasConfig& config);

        TextureAtlas(const TextureAtlas&) = delete;
        TextureAtlas& operator=(const TextureAtlas&) = delete;

        [[nodiscard]] static Core::Result ValidateConfig(const TextureAtlasConfig& config);
        [[nodiscard]] bool IsValid() const { return m_IsValid; }

        [[nodiscard]] Core::Expected<SubTextureId> AddSubTexture(uint32_t width, uint32_t height,
                                                                 const std::string& label, bool wrappable = false);

        // Queues the image and its mip chain (and wrap padding) for upload.
        Core::Result CopyImageToSubTexture(SubTextureId id, const DecodedImage& image);

        [[nodiscard]] const SubTexture* GetSubTexture(SubTextureId id) const;
        [[nodiscard]] const SubTexture* FindSubTexture(const std::string& label) const;
        [[nodiscard]] size_t GetSubTextureCount() const { return m_SubTextures.size(); }

        [[nodiscard]] std::vector<AtlasUpload> TakePendingUploads();
        [[nodiscard]] size_t GetPendingUploadCount() const { return m_PendingUploads.size(); }

        [[nodiscard]] const TextureAtlasConfig& GetConfig() const { return m_Config; }
        [[nodiscard]] RHI::MirroredBuffer& GetMetadataBuffer() { return m_MetadataBuffer; }
        [[nodiscard]] const RHI::MirroredBuffer& GetMetadataBuffer() const { return m_MetadataBuffer; }

        void Bind(RHI::VulkanDevice& device);
        void Flush();

    private:
        struct Placement
        {
            uint32_t Layer = 0;
            uint32_t X = 0;
            uint32_t Y = 0;
        };

        [[nodiscard]] bool FindSpace(uint32_t width, uint32_t height, Placement& out) const;
        [[nodiscard]] bool IsFree(uint32_t layer, uint32_t x, uint32_t y, uint32_t width, uint32_t height) const;
        void WriteMetadata(const SubTexture& subTexture);

        TextureAtlasConfig m_Config;
        bool m_IsValid = true;

        std::vector<SubTexture> m_SubTextures; // index = id - 1
        std::unordered_map<std::string, SubTextureId> m_SubTexturesByLabel;
        std::vector<AtlasUpload> m_PendingUploads;

        RHI::MirroredBuffer m_MetadataBuffer;
    };
}
