#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

import Core;
import Graphics;

using namespace Graphics;

namespace
{
    TextureAtlasConfig SingleLayer(uint32_t mipLevels = 1)
    {
        TextureAtlasConfig config{};
        config.Capacity = 8;
        config.LayerWidth = 256;
        config.LayerHeight = 256;
        config.Layers = 1;
        config.MipLevels = mipLevels;
        config.CellSize = 64;
        return config;
    }

    // RGBA8 image whose red channel is the column and green channel the row.
    std::vector<uint8_t> MakeGradient(uint32_t width, uint32_t height)
    {
        std::vector<uint8_t> pixels(size_t(width) * height * 4);
        for (uint32_t y = 0; y < height; ++y)
        {
            for (uint32_t x = 0; x < width; ++x)
            {
                const size_t i = (size_t(y) * width + x) * 4;
                pixels[i + 0] = static_cast<uint8_t>(x);
                pixels[i + 1] = static_cast<uint8_t>(y);
                pixels[i + 2] = 0;
                pixels[i + 3] = 255;
            }
        }
        return pixels;
    }
}

// -----------------------------------------------------------------------------
// Configuration
// -----------------------------------------------------------------------------

TEST(GraphicsTextureAtlas, ValidateConfig_RequiresSquarePowerOfTwoLayers)
{
    EXPECT_TRUE(TextureAtlas::ValidateConfig(SingleLayer()).has_value());

    TextureAtlasConfig rect = SingleLayer();
    rect.LayerHeight = 512;
    EXPECT_EQ(TextureAtlas::ValidateConfig(rect).error(), Core::ErrorCode::InvalidArgument);

    TextureAtlasConfig npot = SingleLayer();
    npot.LayerWidth = npot.LayerHeight = 300;
    EXPECT_EQ(TextureAtlas::ValidateConfig(npot).error(), Core::ErrorCode::InvalidArgument);

    TextureAtlasConfig tiny = SingleLayer();
    tiny.LayerWidth = tiny.LayerHeight = 128;
    EXPECT_EQ(TextureAtlas::ValidateConfig(tiny).error(), Core::ErrorCode::InvalidArgument);
}

TEST(GraphicsTextureAtlas, InvalidAtlas_RefusesSubTextures)
{
    TextureAtlasConfig rect = SingleLayer();
    rect.LayerHeight = 512;
    TextureAtlas atlas(rect);

    EXPECT_FALSE(atlas.IsValid());
    EXPECT_EQ(atlas.AddSubTexture(16, 16, "any").error(), Core::ErrorCode::InvalidState);
}

// -----------------------------------------------------------------------------
// Placement
// -----------------------------------------------------------------------------

TEST(GraphicsTextureAtlas, AddSubTexture_FirstIdIsOneAtOrigin)
{
    TextureAtlas atlas(SingleLayer());

    auto id = atlas.AddSubTexture(64, 64, "first");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, 1u);

    const SubTexture* st = atlas.GetSubTexture(*id);
    ASSERT_NE(st, nullptr);
    EXPECT_EQ(st->X, 0u);
    EXPECT_EQ(st->Y, 0u);
    EXPECT_EQ(atlas.FindSubTexture("first"), st);
    EXPECT_EQ(atlas.GetSubTexture(kNoSubTexture), nullptr);
}

TEST(GraphicsTextureAtlas, AddSubTexture_NoSpaceIsOutOfResources)
{
    TextureAtlas atlas(SingleLayer());
    ASSERT_TRUE(atlas.AddSubTexture(64, 64, "small").has_value());

    auto big = atlas.AddSubTexture(200, 200, "big");
    ASSERT_FALSE(big.has_value());
    EXPECT_EQ(big.error(), Core::ErrorCode::OutOfResources);
    EXPECT_EQ(atlas.GetSubTextureCount(), 1u);
}

TEST(GraphicsTextureAtlas, AddSubTexture_DoesNotOverlap)
{
    TextureAtlas atlas(SingleLayer());
    const SubTexture a = *atlas.GetSubTexture(*atlas.AddSubTexture(100, 100, "a"));
    const SubTexture b = *atlas.GetSubTexture(*atlas.AddSubTexture(100, 100, "b"));

    const bool overlaps = a.RegionX < b.RegionX + b.RegionWidth && b.RegionX < a.RegionX + a.RegionWidth &&
                          a.RegionY < b.RegionY + b.RegionHeight && b.RegionY < a.RegionY + a.RegionHeight;
    EXPECT_FALSE(overlaps);
    EXPECT_EQ(b.RegionX % 64u, 0u);
    EXPECT_EQ(b.RegionY % 64u, 0u);
}

TEST(GraphicsTextureAtlas, AddSubTexture_WritesNormalizedMetadata)
{
    TextureAtlas atlas(SingleLayer());
    ASSERT_TRUE(atlas.AddSubTexture(64, 64, "a").has_value());
    const SubTextureId id = *atlas.AddSubTexture(128, 64, "b");
    const SubTexture* st = atlas.GetSubTexture(id);

    const auto record = atlas.GetMetadataBuffer().ReadValue<GpuAtlasRecord>(size_t(id) * sizeof(GpuAtlasRecord));
    EXPECT_FLOAT_EQ(record.Region.x, float(st->X) / 256.0f);
    EXPECT_FLOAT_EQ(record.Region.z, 0.5f);
    EXPECT_FLOAT_EQ(record.Region.w, 0.25f);
    EXPECT_EQ(record.Layer, 0u);

    const auto none = atlas.GetMetadataBuffer().ReadValue<GpuAtlasRecord>(0);
    EXPECT_EQ(none.Region, glm::vec4(0.0f));
}

TEST(GraphicsTextureAtlas, Wrappable_ReservesDoubleRegionAndCentresImage)
{
    TextureAtlas atlas(SingleLayer());
    const SubTextureId id = *atlas.AddSubTexture(32, 32, "tile", true);
    const SubTexture* st = atlas.GetSubTexture(id);

    EXPECT_TRUE(st->Wrappable);
    EXPECT_EQ(st->RegionWidth, 64u);
    EXPECT_EQ(st->RegionHeight, 64u);
    EXPECT_EQ(st->X, st->RegionX + 16u);
    EXPECT_EQ(st->Y, st->RegionY + 16u);
}

TEST(GraphicsTextureAtlas, Wrappable_RejectsRequestsWiderThanHalfALayer)
{
    TextureAtlas atlas(SingleLayer());

    // Doubling 2^31 would wrap to zero and fit anywhere.
    auto huge = atlas.AddSubTexture(0x80000000u, 16, "huge", true);
    ASSERT_FALSE(huge.has_value());
    EXPECT_EQ(huge.error(), Core::ErrorCode::OutOfResources);

    auto wide = atlas.AddSubTexture(129, 16, "wide", true);
    ASSERT_FALSE(wide.has_value());
    EXPECT_EQ(wide.error(), Core::ErrorCode::OutOfResources);
    EXPECT_EQ(atlas.GetSubTextureCount(), 0u);

    const SubTextureId half = *atlas.AddSubTexture(128, 128, "half", true);
    EXPECT_EQ(atlas.GetSubTexture(half)->RegionWidth, 256u);
}

// -----------------------------------------------------------------------------
// Uploads
// -----------------------------------------------------------------------------

TEST(GraphicsTextureAtlas, CopyImage_QueuesOneUploadPerMip)
{
    TextureAtlas atlas(SingleLayer(3));
    const SubTextureId id = *atlas.AddSubTexture(64, 64, "tex");
    const auto pixels = MakeGradient(64, 64);

    ASSERT_TRUE(atlas.CopyImageToSubTexture(id, {64, 64, pixels}).has_value());

    const auto uploads = atlas.TakePendingUploads();
    ASSERT_EQ(uploads.size(), 3u);
    EXPECT_EQ(uploads[0].Width, 64u);
    EXPECT_EQ(uploads[1].Width, 32u);
    EXPECT_EQ(uploads[1].MipLevel, 1u);
    EXPECT_EQ(uploads[2].Height, 16u);
    EXPECT_EQ(uploads[2].Pixels.size(), 16u * 16u * 4u);
    EXPECT_EQ(atlas.GetPendingUploadCount(), 0u);
}

TEST(GraphicsTextureAtlas, CopyImage_WrappablePaddingRepeatsOppositeEdge)
{
    TextureAtlas atlas(SingleLayer());
    const SubTextureId id = *atlas.AddSubTexture(32, 32, "tile", true);
    const SubTexture st = *atlas.GetSubTexture(id);
    const auto pixels = MakeGradient(32, 32);

    ASSERT_TRUE(atlas.CopyImageToSubTexture(id, {32, 32, pixels}).has_value());
    const auto uploads = atlas.TakePendingUploads();
    ASSERT_EQ(uploads.size(), 5u); // image + left, right, top, bottom strips

    const AtlasUpload& left = uploads[1];
    EXPECT_EQ(left.X, st.RegionX);
    EXPECT_EQ(left.Width, 16u);
    EXPECT_EQ(left.Pixels[0], 16u); // first column repeats column 16

    const AtlasUpload& right = uploads[2];
    EXPECT_EQ(right.X, st.X + 32u);
    EXPECT_EQ(right.Pixels[0], 0u);

    const AtlasUpload& top = uploads[3];
    EXPECT_EQ(top.Width, 64u);
    EXPECT_EQ(top.Pixels[1], 16u); // first row repeats row 16
}

TEST(GraphicsTextureAtlas, CopyImage_RejectsSizeMismatch)
{
    TextureAtlas atlas(SingleLayer());
    const SubTextureId id = *atlas.AddSubTexture(32, 32, "tex");
    const auto pixels = MakeGradient(16, 16);

    EXPECT_EQ(atlas.CopyImageToSubTexture(id, {16, 16, pixels}).error(), Core::ErrorCode::InvalidArgument);
    EXPECT_EQ(atlas.CopyImageToSubTexture(99, {16, 16, pixels}).error(), Core::ErrorCode::InvalidHandle);
    EXPECT_EQ(atlas.GetPendingUploadCount(), 0u);
}
