#include <gtest/gtest.h>

#include <persistency/key_value_storage_backend.hpp>
#include <presence/per/document_storage.hpp>

#include <filesystem>
#include <string>
#include "fakes.hpp"

namespace fs = std::filesystem;
using presence::core::Errc;
using presence::per::DocumentStorage;
using presence::persistency::KeyValueStorageBackend;

TEST(PersistencyKV, KeyValue_BasicSetGetRemove) {
  presence::test::TempDir tmp("presence_kv_basic");
  KeyValueStorageBackend kv(tmp.file("session"));

  SCOPED_TRACE("SetValue");
  ASSERT_TRUE(kv.SetValue("session", "sess-42").HasValue());

  SCOPED_TRACE("GetValue");
  auto get = kv.GetValue("session");
  ASSERT_TRUE(get.HasValue());
  EXPECT_EQ(get.Value(), "sess-42");

  auto has = kv.HasKey("session");
  ASSERT_TRUE(has.HasValue());
  EXPECT_TRUE(has.Value());

  SCOPED_TRACE("RemoveKey");
  ASSERT_TRUE(kv.RemoveKey("session").HasValue());
  EXPECT_FALSE(kv.HasKey("session").Value());
  EXPECT_EQ(kv.GetValue("session").Error().value, Errc::kNotFound);
  EXPECT_EQ(kv.RemoveKey("session").Error().value, Errc::kNotFound);
}

TEST(PersistencyKV, KeyValue_OverwriteReplacesValue) {
  presence::test::TempDir tmp("presence_kv_overwrite");
  KeyValueStorageBackend kv(tmp.path().string());

  ASSERT_TRUE(kv.SetValue("session", "old").HasValue());
  ASSERT_TRUE(kv.SetValue("session", "new").HasValue());
  EXPECT_EQ(kv.GetValue("session").Value(), "new");
  EXPECT_FALSE(fs::exists(tmp.path() / "session.tmp"));
}

TEST(PersistencyKV, KeyValue_RejectsKeysOutsideBase) {
  presence::test::TempDir tmp("presence_kv_keys");
  KeyValueStorageBackend kv(tmp.path().string());

  for (const char* bad : {"", "../escape", "a/b", "a\\b"}) {
    auto r = kv.SetValue(bad, "x");
    ASSERT_FALSE(r.HasValue()) << bad;
    EXPECT_EQ(r.Error().value, Errc::kPermissionDenied);
  }
}

TEST(PersistencyDoc, Document_MissingIsNotFound) {
  presence::test::TempDir tmp("presence_doc_missing");
  DocumentStorage doc(tmp.file("nested/dir/states.json"));

  auto r = doc.Read();
  ASSERT_FALSE(r.HasValue());
  EXPECT_EQ(r.Error().value, Errc::kNotFound);
  // parent directories exist ahead of the first write
  EXPECT_TRUE(fs::is_directory(tmp.path() / "nested/dir"));
}

TEST(PersistencyDoc, Document_WriteThenRead) {
  presence::test::TempDir tmp("presence_doc_rw");
  DocumentStorage doc(tmp.file("states.json"));

  ASSERT_TRUE(doc.Write("{\"entities\":{}}").HasValue());
  ASSERT_TRUE(doc.Write("{\"entities\":{\"a\":1}}").HasValue());

  auto r = doc.Read();
  ASSERT_TRUE(r.HasValue());
  EXPECT_EQ(r.Value(), "{\"entities\":{\"a\":1}}");
  EXPECT_FALSE(fs::exists(tmp.path() / "states.json.tmp"));
}

TEST(PersistencyDoc, Document_DirectoryInTheWayIsAnError) {
  presence::test::TempDir tmp("presence_doc_dir");
  fs::create_directories(tmp.path() / "states.json");
  DocumentStorage doc(tmp.file("states.json"));

  EXPECT_FALSE(doc.Read().HasValue());
  EXPECT_FALSE(doc.Write("{}").HasValue());
}
