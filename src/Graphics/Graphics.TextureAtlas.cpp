module;

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

#include "RHI.Vulkan.hpp"

module Graphics:TextureAtlas.Impl;

import :TextureAtlas;
import :GpuLayouts;

import Core;
import RHI;

namespace Graphics
{
    namespace
    {
        constexpr uint32_t kMinLayerSize = 256;
        constexpr uint32_t kBytesPerTexel = 4;

        [[nodiscard]] bool IsPowerOfTwo(uint32_t v)
        {
            return v != 0 && (v & (v - 1)) == 0;
        }

        struct MipImage
        {
            uint32_t Width = 0;
            uint32_t Height = 0;
            std::vector<uint8_t> Pixels;
        };

        // 2x2 box filter; odd edges reuse the last row/column.
        MipImage Downsample(const MipImage& src)
        {
            MipImage dst;
            dst.Width = std::max(1u, src.Width / 2);
            dst.Height = std::max(1u, src.Height / 2);
            dst.Pixels.resize(size_t(dst.Width) * dst.Height * kBytesPerTexel);

            for (uint32_t y = 0; y < dst.Height; ++y)
            {
                const uint32_t y0 = std::min(2 * y, src.Height - 1);
                const uint32_t y1 = std::min(2 * y + 1, src.Height - 1);
                for (uint32_t x = 0; x < dst.Width; ++x)
                {
                    const uint32_t x0 = std::min(2 * x, src.Width - 1);
                    const uint32_t x1 = std::min(2 * x + 1, src.Width - 1);
                    for (uint32_t c = 0; c < kBytesPerTexel; ++c)
                    {
                        const uint32_t sum =
                            src.Pixels[(size_t(y0) * src.Width + x0) * kBytesPerTexel + c] +
                            src.Pixels[(size_t(y0) * src.Width + x1) * kBytesPerTexel + c] +
                            src.Pixels[(size_t(y1) * src.Width + x0) * kBytesPerTexel + c] +
                            src.Pixels[(size_t(y1) * src.Width + x1) * kBytesPerTexel + c];
                        dst.Pixels[(size_t(y) * dst.Width + x) * kBytesPerTexel + c] = static_cast<uint8_t>((sum + 2) / 4);
                    }
                }
            }
            return dst;
        }

        // Copies a width x height window starting at (srcX, srcY), wrapping
        // around the image edges in both axes.
        std::vector<uint8_t> ExtractWrapped(const MipImage& image, int64_t srcX, int64_t srcY, uint32_t width, uint32_t height)
        {
            std::vector<uint8_t> out(size_t(width) * height * kBytesPerTexel);
            const int64_t w = image.Width;
            const int64_t h = image.Height;

            for (uint32_t y = 0; y < height; ++y)
            {
                const int64_t sy = ((srcY + y) % h + h) % h;
                for (uint32_t x = 0; x < width; ++x)
                {
                    const int64_t sx = ((srcX + x) % w + w) % w;
                    const size_t s = (size_t(sy) * image.Width + size_t(sx)) * kBytesPerTexel;
                    const size_t d = (size_t(y) * width + x) * kBytesPerTexel;
                    std::copy_n(image.Pixels.begin() + static_cast<std::ptrdiff_t>(s), kBytesPerTexel,
                                out.begin() + static_cast<std::ptrdiff_t>(d));
                }
            }
            return out;
        }
    }

    TextureAtlas::TextureAtlas(const TextureAtlasConfig& config)
        : m_Config(config)
        , m_MetadataBuffer("TextureAtlas.Metadata", (size_t(config.Capacity) + 1) * sizeof(GpuAtlasRecord),
                           VK_BUFFER_USAGE_STORAGE_BUFFER_BIT)
    {
        if (auto valid = ValidateConfig(config); !valid)
        {
            Core::Log::Error("TextureAtlas: invalid configuration {}x{}x{} (mips {}, cell {}): {}",
                             config.LayerWidth, config.LayerHeight, config.Layers, config.MipLevels,
                             config.CellSize, Core::ErrorCodeToString(valid.error()));
            m_IsValid = false;
        }
    }

    Core::Result TextureAtlas::ValidateConfig(const TextureAtlasConfig& config)
    {
        if (config.LayerWidth != config.LayerHeight || !IsPowerOfTwo(config.LayerWidth))
            return Core::Err(Core::ErrorCode::InvalidArgument); // layers must be square and of power-of-2 size
        if (config.LayerWidth < kMinLayerSize)
            return Core::Err(Core::ErrorCode::InvalidArgument);
        if (config.Layers == 0 || config.Capacity == 0 || config.CellSize == 0)
            return Core::Err(Core::ErrorCode::InvalidArgument);
        if (config.MipLevels == 0 || config.MipLevels > 32 || (config.LayerWidth >> (config.MipLevels - 1)) == 0)
            return Core::Err(Core::ErrorCode::InvalidArgument);
        return Core::Ok();
    }

    Core::Expected<SubTextureId> TextureAtlas::AddSubTexture(uint32_t width, uint32_t height,
                                                             const std::string& label, bool wrappable)
    {
        if (!m_IsValid)
            return Core::Err<SubTextureId>(Core::ErrorCode::InvalidState);
        if (width == 0 || height == 0)
            return Core::Err<SubTextureId>(Core::ErrorCode::InvalidArgument);

        if (m_SubTextures.size() >= m_Config.Capacity)
        {
            Core::Log::Error("TextureAtlas: atlas is full ({} sub-textures)", m_Config.Capacity);
            return Core::Err<SubTextureId>(Core::ErrorCode::OutOfResources);
        }

        // Checked before doubling so the padded size cannot wrap around.
        const uint32_t maxWidth = wrappable ? m_Config.LayerWidth / 2 : m_Config.LayerWidth;
        const uint32_t maxHeight = wrappable ? m_Config.LayerHeight / 2 : m_Config.LayerHeight;
        if (width > maxWidth || height > maxHeight)
        {
            Core::Log::Warn("TextureAtlas: sub-texture '{}' ({}x{}{}) exceeds the {}x{} layer", label, width,
                            height, wrappable ? ", wrappable" : "", m_Config.LayerWidth, m_Config.LayerHeight);
            return Core::Err<SubTextureId>(Core::ErrorCode::OutOfResources);
        }

        const uint32_t regionWidth = wrappable ? width * 2 : width;
        const uint32_t regionHeight = wrappable ? height * 2 : height;

        Placement placement{};
        if (!FindSpace(regionWidth, regionHeight, placement))
        {
            Core::Log::Warn("TextureAtlas: No space in atlas for sub-texture '{}' ({}x{}{})",
                            label, width, height, wrappable ? ", wrappable" : "");
            return Core::Err<SubTextureId>(Core::ErrorCode::OutOfResources);
        }

        SubTexture subTexture{};
        subTexture.Id = static_cast<SubTextureId>(m_SubTextures.size() + 1);
        subTexture.Label = label;
        subTexture.Layer = placement.Layer;
        subTexture.RegionX = placement.X;
        subTexture.RegionY = placement.Y;
        subTexture.RegionWidth = regionWidth;
        subTexture.RegionHeight = regionHeight;
        subTexture.X = wrappable ? placement.X + width / 2 : placement.X;
        subTexture.Y = wrappable ? placement.Y + height / 2 : placement.Y;
        subTexture.Width = width;
        subTexture.Height = height;
        subTexture.Wrappable = wrappable;

        WriteMetadata(subTexture);

        if (!label.empty())
            m_SubTexturesByLabel[label] = subTexture.Id;

        Core::Log::Debug("TextureAtlas: added '{}' (id {}) at ({}, {}) layer {}",
                         label, subTexture.Id, subTexture.RegionX, subTexture.RegionY, subTexture.Layer);

        m_SubTextures.push_back(std::move(subTexture));
        return m_SubTextures.back().Id;
    }

    bool TextureAtlas::FindSpace(uint32_t width, uint32_t height, Placement& out) const
    {
        if (width > m_Config.LayerWidth || height > m_Config.LayerHeight)
            return false;

        const uint32_t step = m_Config.CellSize;
        for (uint32_t layer = 0; layer < m_Config.Layers; ++layer)
        {
            for (uint32_t y = 0; y + height <= m_Config.LayerHeight; y += step)
            {
                for (uint32_t x = 0; x + width <= m_Config.LayerWidth; x += step)
                {
                    if (IsFree(layer, x, y, width, height))
                    {
                        out = {layer, x, y};
                        return true;
                    }
                }
            }
        }
        return false;
    }

    bool TextureAtlas::IsFree(uint32_t layer, uint32_t x, uint32_t y, uint32_t width, uint32_t height) const
    {
        for (const SubTexture& st : m_SubTextures)
        {
            if (st.Layer != layer)
                continue;

            const bool overlaps = x < st.RegionX + st.RegionWidth && x + width > st.RegionX &&
                                  y < st.RegionY + st.RegionHeight && y + height > st.RegionY;
            if (overlaps)
                return false;
        }
        return true;
    }

    void TextureAtlas::WriteMetadata(const SubTexture& subTexture)
    {
        GpuAtlasRecord record{};
        record.Region = glm::vec4(float(subTexture.X) / float(m_Config.LayerWidth),
                                  float(subTexture.Y) / float(m_Config.LayerHeight),
                                  float(subTexture.Width) / float(m_Config.LayerWidth),
                                  float(subTexture.Height) / float(m_Config.LayerHeight));
        record.Layer = subTexture.Layer;
        m_MetadataBuffer.WriteValue(size_t(subTexture.Id) * sizeof(GpuAtlasRecord), record);
    }

    Core::Result TextureAtlas::CopyImageToSubTexture(SubTextureId id, const DecodedImage& image)
    {
        const SubTexture* subTexture = GetSubTexture(id);
        if (!subTexture)
            return Core::Err(Core::ErrorCode::InvalidHandle);

        if (image.Width != subTexture->Width || image.Height != subTexture->Height ||
            image.Pixels.size() != size_t(image.Width) * image.Height * kBytesPerTexel)
        {
            Core::Log::Error("TextureAtlas: image {}x{} ({} bytes) does not match sub-texture '{}' ({}x{})",
                             image.Width, image.Height, image.Pixels.size(),
                             subTexture->Label, subTexture->Width, subTexture->Height);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        MipImage level{image.Width, image.Height, std::vector<uint8_t>(image.Pixels.begin(), image.Pixels.end())};

        for (uint32_t mip = 0; mip < m_Config.MipLevels; ++mip)
        {
            if (mip > 0)
                level = Downsample(level);

            const uint32_t ix = subTexture->X >> mip;
            const uint32_t iy = subTexture->Y >> mip;

            m_PendingUploads.push_back({subTexture->Layer, mip, ix, iy, level.Width, level.Height, level.Pixels});

            if (!subTexture->Wrappable)
                continue;

            // Padding strips take the texels the sampler would reach by
            // wrapping: left <- right half, right <- left half, and so on.
            const uint32_t rx = subTexture->RegionX >> mip;
            const uint32_t ry = subTexture->RegionY >> mip;
            const uint32_t rw = std::max(1u, subTexture->RegionWidth >> mip);
            const uint32_t rh = std::max(1u, subTexture->RegionHeight >> mip);

            const uint32_t padLeft = ix - rx;
            const uint32_t padTop = iy - ry;
            const uint32_t padRight = (rx + rw > ix + level.Width) ? rx + rw - (ix + level.Width) : 0;
            const uint32_t padBottom = (ry + rh > iy + level.Height) ? ry + rh - (iy + level.Height) : 0;
            const uint32_t paddedWidth = padLeft + level.Width + padRight;

            auto queue = [&](uint32_t x, uint32_t y, uint32_t w, uint32_t h, int64_t srcX, int64_t srcY) {
                if (w == 0 || h == 0) return;
                m_PendingUploads.push_back({subTexture->Layer, mip, x, y, w, h, ExtractWrapped(level, srcX, srcY, w, h)});
            };

            queue(rx, iy, padLeft, level.Height, -int64_t(padLeft), 0);
            queue(ix + level.Width, iy, padRight, level.Height, 0, 0);
            // Top and bottom strips span the corners as well.
            queue(rx, ry, paddedWidth, padTop, -int64_t(padLeft), -int64_t(padTop));
            queue(rx, iy + level.Height, paddedWidth, padBottom, -int64_t(padLeft), 0);
        }

        return Core::Ok();
    }

    const SubTexture* TextureAtlas::GetSubTexture(SubTextureId id) const
    {
        if (id == kNoSubTexture || id > m_SubTextures.size())
            return nullptr;
        return &m_SubTextures[id - 1];
    }

    const SubTexture* TextureAtlas::FindSubTexture(const std::string& label) const
    {
        auto it = m_SubTexturesByLabel.find(label);
        return it != m_SubTexturesByLabel.end() ? GetSubTexture(it->second) : nullptr;
    }

    std::vector<AtlasUpload> TextureAtlas::TakePendingUploads()
    {
        return std::exchange(m_PendingUploads, {});
    }

    void TextureAtlas::Bind(RHI::VulkanDevice& device)
    {
        m_MetadataBuffer.Bind(device);
    }

    void TextureAtlas::Flush()
    {
        m_MetadataBuffer.Flush();
    }
}
