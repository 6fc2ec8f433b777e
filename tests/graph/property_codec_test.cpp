/**
 * @file property_codec_test.cpp
 * @brief Unit tests for property value JSON encoding
 */

#include "graph/property_codec.h"

#include <gtest/gtest.h>

#include <limits>

using namespace graphvault::graph;
using graphvault::utils::ErrorCode;
using json = nlohmann::json;

// ========== Encoding ==========

TEST(PropertyCodecTest, ScalarsEncodeAsJsonScalars) {
  EXPECT_EQ(PropertyValueToJson(PropertyValue(std::string("Alice"))), json("Alice"));
  EXPECT_EQ(PropertyValueToJson(PropertyValue(int64_t{42})), json(42));
  EXPECT_EQ(PropertyValueToJson(PropertyValue(2.5)), json(2.5));
  EXPECT_EQ(PropertyValueToJson(PropertyValue(true)), json(true));
}

TEST(PropertyCodecTest, TimestampEncodesAsTaggedObject) {
  auto encoded = PropertyValueToJson(PropertyValue(Timestamp{"2025-06-23T19:04:59.000000Z"}));
  EXPECT_EQ(encoded, json({{"$timestamp", "2025-06-23T19:04:59.000000Z"}}));
}

TEST(PropertyCodecTest, ListEncodesAsArray) {
  ScalarList list{ScalarValue(int64_t{1}), ScalarValue(std::string("two")), ScalarValue(Timestamp{"2024-01-01T00:00:00Z"})};
  auto encoded = PropertyValueToJson(PropertyValue(list));
  ASSERT_TRUE(encoded.is_array());
  ASSERT_EQ(encoded.size(), 3U);
  EXPECT_EQ(encoded[0], json(1));
  EXPECT_EQ(encoded[1], json("two"));
  EXPECT_EQ(encoded[2]["$timestamp"], "2024-01-01T00:00:00Z");
}

// ========== Decoding ==========

TEST(PropertyCodecTest, DecodesScalars) {
  auto text = PropertyValueFromJson(json("Bob"));
  ASSERT_TRUE(text);
  EXPECT_EQ(std::get<std::string>(*text), "Bob");

  auto integer = PropertyValueFromJson(json(-7));
  ASSERT_TRUE(integer);
  EXPECT_EQ(std::get<int64_t>(*integer), -7);

  auto real = PropertyValueFromJson(json(0.125));
  ASSERT_TRUE(real);
  EXPECT_DOUBLE_EQ(std::get<double>(*real), 0.125);

  auto flag = PropertyValueFromJson(json(false));
  ASSERT_TRUE(flag);
  EXPECT_FALSE(std::get<bool>(*flag));
}

TEST(PropertyCodecTest, UnsignedWithinRangeBecomesSignedInteger) {
  auto value = PropertyValueFromJson(json(static_cast<uint64_t>(100)));
  ASSERT_TRUE(value);
  EXPECT_EQ(std::get<int64_t>(*value), 100);
}

TEST(PropertyCodecTest, UnsignedOutOfRangeIsRejected) {
  auto value = PropertyValueFromJson(json(std::numeric_limits<uint64_t>::max()), "big");
  ASSERT_FALSE(value);
  EXPECT_EQ(value.error().code(), ErrorCode::kSnapshotUnsupportedValue);
  EXPECT_NE(value.error().message().find("big"), std::string::npos);
}

TEST(PropertyCodecTest, DecodesTaggedTimestamp) {
  auto value = PropertyValueFromJson(json({{"$timestamp", "2025-01-02T03:04:05Z"}}));
  ASSERT_TRUE(value);
  EXPECT_EQ(std::get<Timestamp>(*value).iso8601, "2025-01-02T03:04:05Z");
}

TEST(PropertyCodecTest, DecodesList) {
  auto value = PropertyValueFromJson(json::array({"a", "b"}));
  ASSERT_TRUE(value);
  const auto& list = std::get<ScalarList>(*value);
  ASSERT_EQ(list.size(), 2U);
  EXPECT_EQ(std::get<std::string>(list[1]), "b");
}

TEST(PropertyCodecTest, RejectsNestedMap) {
  auto value = PropertyValueFromJson(json({{"street", "Main"}, {"city", "Oslo"}}), "address");
  ASSERT_FALSE(value);
  EXPECT_EQ(value.error().code(), ErrorCode::kSnapshotUnsupportedValue);
  EXPECT_NE(value.error().message().find("address"), std::string::npos);
}

TEST(PropertyCodecTest, RejectsNull) {
  auto value = PropertyValueFromJson(json(nullptr), "missing");
  ASSERT_FALSE(value);
  EXPECT_EQ(value.error().code(), ErrorCode::kSnapshotUnsupportedValue);
}

TEST(PropertyCodecTest, RejectsNestedList) {
  auto value = PropertyValueFromJson(json::array({json::array({1, 2})}), "matrix");
  ASSERT_FALSE(value);
  EXPECT_EQ(value.error().code(), ErrorCode::kSnapshotUnsupportedValue);
}

TEST(PropertyCodecTest, RejectsMixedList) {
  auto value = PropertyValueFromJson(json::array({1, "a"}), "mixed");
  ASSERT_FALSE(value);
  EXPECT_EQ(value.error().code(), ErrorCode::kSnapshotUnsupportedValue);
  EXPECT_NE(value.error().message().find("mixed"), std::string::npos);

  auto numbers = PropertyValueFromJson(json::array({1, 2.5}), "scores");
  ASSERT_FALSE(numbers);
  EXPECT_EQ(numbers.error().code(), ErrorCode::kSnapshotUnsupportedValue);
}

// ========== Maps ==========

TEST(PropertyCodecTest, MapRoundTripKeepsEveryType) {
  PropertyMap properties;
  properties["name"] = std::string("Alice");
  properties["age"] = int64_t{30};
  properties["score"] = 9.5;
  properties["active"] = true;
  properties["joined"] = Timestamp{"2020-05-01T10:00:00.000000Z"};
  properties["tags"] = ScalarList{ScalarValue(std::string("x")), ScalarValue(std::string("y"))};

  auto decoded = PropertyMapFromJson(PropertyMapToJson(properties));
  ASSERT_TRUE(decoded);
  EXPECT_EQ(*decoded, properties);
}

TEST(PropertyCodecTest, NullMapIsEmpty) {
  auto decoded = PropertyMapFromJson(json());
  ASSERT_TRUE(decoded);
  EXPECT_TRUE(decoded->empty());
}

TEST(PropertyCodecTest, NonObjectMapIsRejected) {
  auto decoded = PropertyMapFromJson(json::array({1}));
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().code(), ErrorCode::kSnapshotUnsupportedValue);
}

TEST(PropertyCodecTest, MapReportsOffendingKey) {
  auto decoded = PropertyMapFromJson(json({{"ok", 1}, {"bad", {{"nested", true}}}}));
  ASSERT_FALSE(decoded);
  EXPECT_NE(decoded.error().message().find("'bad'"), std::string::npos);
}
