//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <array>
#include <cstddef>
#include <cstdint>

#include <glm/vec4.hpp>

#include <Photon/Testing/GTest.h>

#include <Photon/Material/PickInfo.h>
#include <Photon/Material/PointsMaterial.h>
#include <Photon/Material/UniformBuffer.h>

using photon::PickLayoutConfig;
using photon::material::ByteRange;
using photon::material::DecodePick;
using photon::material::PointsMaterial;
using photon::material::UniformBuffer;
using photon::material::UniformLayout;
using photon::material::UniformType;
using photon::material::UnpackBitfield;

namespace {

//=== UniformLayout ===-------------------------------------------------------//

NOLINT_TEST(UniformLayoutTest, PointsLayout_ColorThenSize)
{
  // Act
  const auto layout = PointsMaterial::MakeUniformLayout();

  // Assert
  const auto* color = layout.Find("color");
  const auto* size = layout.Find("size");
  ASSERT_NE(color, nullptr);
  ASSERT_NE(size, nullptr);
  EXPECT_EQ(color->offset, 0U);
  EXPECT_EQ(color->size, 16U);
  EXPECT_EQ(size->offset, 16U);
  EXPECT_EQ(size->size, 4U);
  EXPECT_EQ(layout.GetSize(), 32U);
  EXPECT_EQ(layout.Find("missing"), nullptr);
}

NOLINT_TEST(UniformLayoutTest, Vec4AfterScalar_IsRealigned)
{
  // Act
  const auto layout = UniformLayout::Builder {}
                        .Add("opacity", UniformType::kFloat32)
                        .Add("tint", UniformType::kVec4F32)
                        .Add("gamma", UniformType::kFloat32)
                        .Build();

  // Assert
  EXPECT_EQ(layout.Find("opacity")->offset, 0U);
  EXPECT_EQ(layout.Find("tint")->offset, 16U);
  EXPECT_EQ(layout.Find("gamma")->offset, 32U);
  EXPECT_EQ(layout.GetSize(), 48U);
}

//=== UniformBuffer ===-------------------------------------------------------//

class UniformBufferTest : public testing::Test {
protected:
  UniformBuffer buffer_ { PointsMaterial::MakeUniformLayout() };
};

NOLINT_TEST_F(UniformBufferTest, NewBuffer_IsZeroedAndFullyPending)
{
  // Assert
  ASSERT_EQ(buffer_.GetData().size(), 32U);
  for (const auto byte : buffer_.GetData()) {
    EXPECT_EQ(byte, std::byte { 0 });
  }
  EXPECT_EQ(buffer_.GetPendingRange(), (ByteRange { 0, 32 }));
}

NOLINT_TEST_F(UniformBufferTest, WriteSize_PendingCoversSizeOnly)
{
  // Arrange
  buffer_.ClearPending();
  ASSERT_FALSE(buffer_.HasPendingFlush());

  // Act
  buffer_.Write("size", 6.5F);

  // Assert
  EXPECT_EQ(buffer_.GetPendingRange(), (ByteRange { 16, 4 }));
  EXPECT_EQ(buffer_.Read<float>("size"), 6.5F);
}

NOLINT_TEST_F(UniformBufferTest, ClearThenWriteColor_PendingCoversColorOnly)
{
  // Arrange
  buffer_.ClearPending();
  buffer_.Write("size", 2.0F);
  buffer_.ClearPending();

  // Act
  buffer_.Write("color", glm::vec4 { 0.1F, 0.2F, 0.3F, 0.4F });

  // Assert
  EXPECT_EQ(buffer_.GetPendingRange(), (ByteRange { 0, 16 }));
  EXPECT_EQ(buffer_.Read<glm::vec4>("color"), glm::vec4(0.1F, 0.2F, 0.3F, 0.4F));
}

NOLINT_TEST_F(UniformBufferTest, SuccessiveWrites_MergeIntoCoveringRange)
{
  // Arrange
  buffer_.ClearPending();

  // Act
  buffer_.Write("size", 1.0F);
  buffer_.Write("color", glm::vec4 { 1.0F });

  // Assert
  const auto pending = buffer_.GetPendingRange();
  ASSERT_TRUE(pending.has_value());
  EXPECT_EQ(pending->offset, 0U);
  EXPECT_EQ(pending->End(), 20U);
}

NOLINT_TEST_F(UniformBufferTest, MarkRange_IsClampedToBuffer)
{
  // Arrange
  buffer_.ClearPending();

  // Act
  buffer_.MarkRange({ .offset = 24, .size = 100 });
  const auto first = buffer_.GetPendingRange();
  buffer_.ClearPending();
  buffer_.MarkRange({ .offset = 64, .size = 4 });

  // Assert
  EXPECT_EQ(first, (ByteRange { 24, 8 }));
  EXPECT_FALSE(buffer_.HasPendingFlush());
}

NOLINT_TEST_F(UniformBufferTest, MarkRange_HugeSizeIsClampedNotDropped)
{
  // Arrange
  buffer_.ClearPending();

  // Act
  buffer_.MarkRange({ .offset = 8, .size = SIZE_MAX });

  // Assert
  EXPECT_EQ(buffer_.GetPendingRange(), (ByteRange { 8, 24 }));
}

//=== Pick decoding ===-------------------------------------------------------//

NOLINT_TEST(PickDecodeTest, DecodesDocumentedBitLayout)
{
  // Arrange
  constexpr uint64_t kPickValue = 7ULL | (123456ULL << 20) | (300ULL << 46)
    | (200ULL << 55);

  // Act
  const auto info = DecodePick(kPickValue);

  // Assert
  EXPECT_EQ(info.wobject_id, 7U);
  EXPECT_EQ(info.vertex_index, 123456U);
  EXPECT_FLOAT_EQ(info.point_coord.x, 44.0F);
  EXPECT_FLOAT_EQ(info.point_coord.y, -56.0F);
  EXPECT_EQ(PointsMaterial::GetPickInfo(kPickValue).vertex_index, 123456U);
}

NOLINT_TEST(PickDecodeTest, UnpackBitfield_IsLeastSignificantFirst)
{
  // Act
  constexpr auto kFields
    = UnpackBitfield(0b1'0110'11ULL, std::array<uint32_t, 3> { 2, 4, 1 });

  // Assert
  static_assert(kFields[0] == 0b11);
  static_assert(kFields[1] == 0b0110);
  static_assert(kFields[2] == 0b1);
  SUCCEED();
}

NOLINT_TEST(PickDecodeTest, UnpackBitfield_IgnoresBitsBeyondFields)
{
  // Act
  const auto fields
    = UnpackBitfield(~0ULL, std::array<uint32_t, 2> { 3, 5 });

  // Assert
  EXPECT_EQ(fields[0], 0b111U);
  EXPECT_EQ(fields[1], 0b11111U);
}

NOLINT_TEST(PickDecodeTest, CustomLayout_IsHonored)
{
  // Arrange
  const PickLayoutConfig layout {
    .wobject_id_bits = 8,
    .index_bits = 8,
    .coord_x_bits = 8,
    .coord_y_bits = 8,
    .coord_bias = 128.0F,
  };
  constexpr uint64_t kPickValue = 0x01U | (0x02U << 8) | (0x80U << 16)
    | (0x00U << 24);

  // Act
  const auto info = DecodePick(kPickValue, layout);

  // Assert
  EXPECT_EQ(info.wobject_id, 1U);
  EXPECT_EQ(info.vertex_index, 2U);
  EXPECT_FLOAT_EQ(info.point_coord.x, 0.0F);
  EXPECT_FLOAT_EQ(info.point_coord.y, -128.0F);
}

} // namespace
