#include <gtest/gtest.h>
#include <string>
#include <variant>
#include "apps/presence_events.hpp"

using namespace presence::app;
using presence::supervisor::EventKind;

TEST(PresenceEvents, LocationWithWorld) {
  auto ev = DecodePresenceEvent(EventKind::kLocation, R"({
    "userId": "usr_a", "user": {"id": "usr_a", "displayName": "Alice"},
    "location": "wrld_1:1234",
    "world": {"id": "wrld_1", "name": "The Lobby", "thumbnailImageUrl": "https://img/1.png"}
  })");
  ASSERT_TRUE(ev.has_value());
  const auto* loc = std::get_if<LocationEvent>(&*ev);
  ASSERT_NE(loc, nullptr);
  EXPECT_EQ(loc->entity_id, "usr_a");
  EXPECT_EQ(loc->display_name, "Alice");
  EXPECT_EQ(loc->location, "wrld_1:1234");
  ASSERT_TRUE(loc->world.has_value());
  EXPECT_EQ(loc->world->name, "The Lobby");
  EXPECT_EQ(loc->world->thumbnail_url, std::optional<std::string>("https://img/1.png"));
}

TEST(PresenceEvents, LocationWithoutWorld) {
  auto ev = DecodePresenceEvent(EventKind::kLocation,
      R"({"userId":"usr_a","user":{"id":"usr_a","displayName":"Alice"},"location":"private"})");
  ASSERT_TRUE(ev.has_value());
  EXPECT_FALSE(std::get<LocationEvent>(*ev).world.has_value());
}

TEST(PresenceEvents, MalformedWorldIsDroppedNotTheEvent) {
  auto ev = DecodePresenceEvent(EventKind::kLocation,
      R"({"userId":"usr_a","user":{"id":"usr_a","displayName":"Alice"},"location":"w:1","world":{"id":5}})");
  ASSERT_TRUE(ev.has_value());
  EXPECT_FALSE(std::get<LocationEvent>(*ev).world.has_value());
}

TEST(PresenceEvents, LocationRejectsMissingFields) {
  EXPECT_FALSE(DecodePresenceEvent(EventKind::kLocation,
      R"({"user":{"id":"usr_a","displayName":"Alice"},"location":"w:1"})").has_value());
  EXPECT_FALSE(DecodePresenceEvent(EventKind::kLocation,
      R"({"userId":"usr_a","location":"w:1"})").has_value());
  EXPECT_FALSE(DecodePresenceEvent(EventKind::kLocation,
      R"({"userId":"usr_a","user":{"id":"usr_a"},"location":"w:1"})").has_value());
  EXPECT_FALSE(DecodePresenceEvent(EventKind::kLocation,
      R"({"userId":"usr_a","user":{"id":"usr_a","displayName":"Alice"}})").has_value());
  EXPECT_FALSE(DecodePresenceEvent(EventKind::kLocation,
      R"({"userId":"usr_a","user":{"id":"usr_a","displayName":"Alice"},"location":7})").has_value());
}

TEST(PresenceEvents, OnlineAndOffline) {
  auto on = DecodePresenceEvent(EventKind::kOnline,
      R"({"userId":"usr_b","user":{"id":"usr_b","displayName":"Bob"}})");
  ASSERT_TRUE(on.has_value());
  EXPECT_EQ(std::get<OnlineEvent>(*on).display_name, "Bob");

  auto off = DecodePresenceEvent(EventKind::kOffline, R"({"userId":"usr_b"})");
  ASSERT_TRUE(off.has_value());
  EXPECT_EQ(std::get<OfflineEvent>(*off).entity_id, "usr_b");

  EXPECT_FALSE(DecodePresenceEvent(EventKind::kOnline, R"({"userId":"usr_b"})").has_value());
  EXPECT_FALSE(DecodePresenceEvent(EventKind::kOffline, R"({"userId":null})").has_value());
}

TEST(PresenceEvents, GarbageAndNonPresenceKinds) {
  EXPECT_FALSE(DecodePresenceEvent(EventKind::kLocation, "not json").has_value());
  EXPECT_FALSE(DecodePresenceEvent(EventKind::kOffline, R"(["usr_b"])").has_value());
  EXPECT_FALSE(DecodePresenceEvent(EventKind::kClose, R"({"userId":"usr_b"})").has_value());
}
