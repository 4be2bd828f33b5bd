// Tests for core/json_helpers.h -- JsonWriter serialization.

#include "core/json_helpers.h"

#include <gtest/gtest.h>

#include <cmath>
#include <string>

namespace continuo {
namespace {

TEST(JsonWriterTest, EmptyContainers) {
  JsonWriter object_writer;
  object_writer.beginObject();
  object_writer.endObject();
  EXPECT_EQ(object_writer.toString(), "{}");

  JsonWriter array_writer;
  array_writer.beginArray();
  array_writer.endArray();
  EXPECT_EQ(array_writer.toString(), "[]");
}

TEST(JsonWriterTest, ObjectMembersAreCommaSeparated) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("soprano");
  writer.value(67);
  writer.key("name");
  writer.value("G4");
  writer.key("valid");
  writer.value(true);
  writer.endObject();
  EXPECT_EQ(writer.toString(), R"({"soprano":67,"name":"G4","valid":true})");
}

TEST(JsonWriterTest, NestedArrayOfObjects) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("voicings");
  writer.beginArray();
  for (int idx = 0; idx < 2; ++idx) {
    writer.beginObject();
    writer.key("index");
    writer.value(idx);
    writer.endObject();
  }
  writer.endArray();
  writer.key("count");
  writer.value(static_cast<size_t>(2));
  writer.endObject();
  EXPECT_EQ(writer.toString(),
            R"({"voicings":[{"index":0},{"index":1}],"count":2})");
}

TEST(JsonWriterTest, NonFiniteDoublesBecomeNull) {
  JsonWriter writer;
  writer.beginArray();
  writer.value(std::nan(""));
  writer.value(1.5);
  writer.value(-HUGE_VAL);
  writer.endArray();
  EXPECT_EQ(writer.toString(), "[null,1.5,null]");
}

TEST(JsonWriterTest, EscapesSpecialCharacters) {
  JsonWriter writer;
  writer.beginArray();
  writer.value("a\"b\\c\n");
  writer.endArray();
  EXPECT_EQ(writer.toString(), R"(["a\"b\\c\n"])");
}

}  // namespace
}  // namespace continuo
