#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <string>

#include <glm/glm.hpp>

import Core;
import Graphics;

using namespace Graphics;

namespace
{
    TextureAtlasConfig SmallAtlas()
    {
        TextureAtlasConfig config{};
        config.Capacity = 4;
        config.LayerWidth = 256;
        config.LayerHeight = 256;
        config.Layers = 1;
        config.MipLevels = 1;
        return config;
    }

    GpuMaterialRecord ReadRecord(const MaterialStore& store, uint32_t slot)
    {
        return store.GetBuffer().ReadValue<GpuMaterialRecord>(size_t(slot) * sizeof(GpuMaterialRecord));
    }
}

// -----------------------------------------------------------------------------
// Creation and descriptors
// -----------------------------------------------------------------------------

TEST(GraphicsMaterialStore, CreateMaterial_StartsInactiveWithDefaults)
{
    TextureAtlas atlas(SmallAtlas());
    MaterialStore store(2, atlas);

    MaterialDescriptor descriptor{};
    descriptor.Name = "red";
    descriptor.Diffuse = glm::vec4(1.0f, 0.0f, 0.0f, 1.0f);
    const MaterialId id = *store.CreateMaterial(descriptor);

    const Material* material = store.GetMaterial(id);
    ASSERT_NE(material, nullptr);
    EXPECT_EQ(material->Name, "red");
    EXPECT_FALSE(material->Slot.has_value());
    EXPECT_EQ(material->Usage, 0u);
    EXPECT_EQ(material->Diffuse, glm::vec4(1.0f, 0.0f, 0.0f, 1.0f));
    EXPECT_EQ(material->Specular, glm::vec4(1.0f));
    EXPECT_EQ(store.FindMaterial("red"), material);
    EXPECT_EQ(store.GetActiveCount(), 0u);
}

TEST(GraphicsMaterialStore, ApplyDescriptor_UnknownTextureLeavesMaterialUntouched)
{
    TextureAtlas atlas(SmallAtlas());
    MaterialStore store(2, atlas);
    const MaterialId id = *store.CreateMaterial({});

    MaterialDescriptor descriptor{};
    descriptor.Shininess = 32.0f;
    descriptor.Textures.Color = "missing";

    EXPECT_EQ(store.ApplyDescriptor(id, descriptor).error(), Core::ErrorCode::InvalidArgument);
    EXPECT_FLOAT_EQ(store.GetMaterial(id)->Shininess, 0.0f);
}

TEST(GraphicsMaterialStore, ApplyTextures_ResolvesAndClearsChannels)
{
    TextureAtlas atlas(SmallAtlas());
    const SubTextureId bricks = *atlas.AddSubTexture(32, 32, "bricks");
    const SubTextureId bump = *atlas.AddSubTexture(32, 32, "bricks-normal");
    MaterialStore store(2, atlas);
    const MaterialId id = *store.CreateMaterial({});

    MaterialTexturesDescriptor textures{};
    textures.Color = "bricks";
    textures.Normal = "bricks-normal";
    ASSERT_TRUE(store.ApplyTextures(id, textures).has_value());

    const Material* material = store.GetMaterial(id);
    EXPECT_EQ(material->Textures[size_t(TextureChannel::Color)], bricks);
    EXPECT_EQ(material->Textures[size_t(TextureChannel::Normal)], bump);

    MaterialTexturesDescriptor clear{};
    clear.Normal = "";
    ASSERT_TRUE(store.ApplyTextures(id, clear).has_value());
    EXPECT_EQ(material->Textures[size_t(TextureChannel::Color)], bricks);
    EXPECT_EQ(material->Textures[size_t(TextureChannel::Normal)], kNoSubTexture);
}

// -----------------------------------------------------------------------------
// Slots
// -----------------------------------------------------------------------------

TEST(GraphicsMaterialStore, Activate_WritesRecordIntoSlot)
{
    TextureAtlas atlas(SmallAtlas());
    MaterialStore store(2, atlas);
    MaterialDescriptor descriptor{};
    descriptor.Diffuse = glm::vec4(0.25f);
    descriptor.Shininess = 8.0f;
    const MaterialId id = *store.CreateMaterial(descriptor);

    ASSERT_TRUE(store.Activate(id).has_value());
    const uint32_t slot = *store.GetMaterial(id)->Slot;

    const GpuMaterialRecord record = ReadRecord(store, slot);
    EXPECT_EQ(record.Diffuse, glm::vec4(0.25f));
    EXPECT_FLOAT_EQ(record.Shininess, 8.0f);
    EXPECT_EQ(store.Activate(id).error(), Core::ErrorCode::InvalidOperation);
}

TEST(GraphicsMaterialStore, Activate_FailsWhenBufferFull)
{
    TextureAtlas atlas(SmallAtlas());
    MaterialStore store(1, atlas);
    const MaterialId a = *store.CreateMaterial({});
    const MaterialId b = *store.CreateMaterial({});

    ASSERT_TRUE(store.Activate(a).has_value());
    EXPECT_EQ(store.Activate(b).error(), Core::ErrorCode::CapacityExceeded);
    EXPECT_FALSE(store.GetMaterial(b)->Slot.has_value());
}

TEST(GraphicsMaterialStore, Deactivate_ZeroesSlotAndRefusesWhileInUse)
{
    TextureAtlas atlas(SmallAtlas());
    MaterialStore store(2, atlas);
    MaterialDescriptor descriptor{};
    descriptor.Diffuse = glm::vec4(0.5f);
    const MaterialId id = *store.CreateMaterial(descriptor);

    const uint32_t slot = *store.Use(id);
    EXPECT_EQ(store.Deactivate(id).error(), Core::ErrorCode::InvalidOperation);
    EXPECT_TRUE(store.GetMaterial(id)->Slot.has_value());

    ASSERT_TRUE(store.Release(id, false).has_value());
    ASSERT_TRUE(store.Deactivate(id).has_value());
    EXPECT_EQ(ReadRecord(store, slot).Diffuse, glm::vec4(0.0f));
    EXPECT_EQ(store.Deactivate(id).error(), Core::ErrorCode::InvalidOperation);
}

TEST(GraphicsMaterialStore, UseRelease_CountsUsers)
{
    TextureAtlas atlas(SmallAtlas());
    MaterialStore store(2, atlas);
    MaterialDescriptor descriptor{};
    descriptor.Name = "shared";
    const MaterialId id = *store.CreateMaterial(descriptor);

    const uint32_t first = *store.UseByName("shared");
    const uint32_t second = *store.Use(id);
    EXPECT_EQ(first, second);
    EXPECT_EQ(store.GetMaterial(id)->Usage, 2u);

    ASSERT_TRUE(store.ReleaseByName("shared").has_value());
    EXPECT_TRUE(store.GetMaterial(id)->Slot.has_value());
    ASSERT_TRUE(store.Release(id).has_value());
    EXPECT_FALSE(store.GetMaterial(id)->Slot.has_value());
    EXPECT_EQ(store.Release(id).error(), Core::ErrorCode::InvalidOperation);

    EXPECT_EQ(store.UseByName("unknown").error(), Core::ErrorCode::InvalidHandle);
}

TEST(GraphicsMaterialStore, FreedSlotIsReusedWithoutMovingOthers)
{
    TextureAtlas atlas(SmallAtlas());
    MaterialStore store(3, atlas);
    const MaterialId a = *store.CreateMaterial({});
    const MaterialId b = *store.CreateMaterial({});
    const MaterialId c = *store.CreateMaterial({});

    ASSERT_TRUE(store.Activate(a).has_value());
    ASSERT_TRUE(store.Activate(b).has_value());
    const uint32_t slotA = *store.GetMaterial(a)->Slot;
    const uint32_t slotB = *store.GetMaterial(b)->Slot;

    ASSERT_TRUE(store.Deactivate(a).has_value());
    EXPECT_EQ(*store.GetMaterial(b)->Slot, slotB);

    ASSERT_TRUE(store.Activate(c).has_value());
    EXPECT_EQ(*store.GetMaterial(c)->Slot, slotA);
}

TEST(GraphicsMaterialStore, Activate_TakesLowestFreeSlot)
{
    TextureAtlas atlas(SmallAtlas());
    MaterialStore store(3, atlas);
    const MaterialId a = *store.CreateMaterial({});
    const MaterialId b = *store.CreateMaterial({});
    const MaterialId c = *store.CreateMaterial({});
    const MaterialId d = *store.CreateMaterial({});

    ASSERT_TRUE(store.Activate(a).has_value());
    ASSERT_TRUE(store.Activate(b).has_value());
    ASSERT_TRUE(store.Activate(c).has_value());

    // Freed in the order 0 then 1; the next activation still gets 0.
    ASSERT_TRUE(store.Deactivate(a).has_value());
    ASSERT_TRUE(store.Deactivate(b).has_value());
    ASSERT_TRUE(store.Activate(d).has_value());
    EXPECT_EQ(*store.GetMaterial(d)->Slot, 0u);
    EXPECT_EQ(*store.GetMaterial(c)->Slot, 2u);
}

TEST(GraphicsMaterialStore, Update_RefreshesActiveRecord)
{
    TextureAtlas atlas(SmallAtlas());
    MaterialStore store(2, atlas);
    const MaterialId id = *store.CreateMaterial({});
    ASSERT_TRUE(store.Activate(id).has_value());
    const uint32_t slot = *store.GetMaterial(id)->Slot;

    MaterialDescriptor edit{};
    edit.Emissive = glm::vec4(2.0f);
    ASSERT_TRUE(store.ApplyDescriptor(id, edit).has_value());
    EXPECT_NE(ReadRecord(store, slot).Emissive, glm::vec4(2.0f));

    ASSERT_TRUE(store.Update(id).has_value());
    EXPECT_EQ(ReadRecord(store, slot).Emissive, glm::vec4(2.0f));
}
