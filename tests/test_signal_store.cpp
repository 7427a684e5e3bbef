// Tests for the file and in-memory signal repositories.
#include "orvibo/orvibo.h"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <string>

namespace {

class FileSignalStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    directory_ = std::filesystem::temp_directory_path() /
                 ("orvibo-signals-" + std::to_string(stamp));
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(directory_, ec);
  }

  std::filesystem::path directory_;
};

}  // namespace

TEST_F(FileSignalStoreTest, SaveThenLoad) {
  orvibo::FileSignalStore store(directory_.string());
  const orvibo::Bytes signal = {0x00, 0x01, 0xfe, 0xff, 0x0a, 0x0d};
  ASSERT_TRUE(store.Save("tv_power", signal));
  EXPECT_EQ(store.Load("tv_power"), signal);

  const orvibo::Bytes replaced = {0x42};
  ASSERT_TRUE(store.Save("tv_power", replaced));
  EXPECT_EQ(store.Load("tv_power"), replaced);
}

TEST_F(FileSignalStoreTest, ListReturnsSortedLabels) {
  orvibo::FileSignalStore store(directory_.string());
  ASSERT_TRUE(store.Save("tv_v-", {0x01}));
  ASSERT_TRUE(store.Save("amp_on", {0x02}));
  const std::vector<std::string> expected = {"amp_on", "tv_v-"};
  EXPECT_EQ(store.List(), expected);
}

TEST_F(FileSignalStoreTest, MissingLabelThrows) {
  orvibo::FileSignalStore store(directory_.string());
  EXPECT_THROW(store.Load("nothing"), orvibo::SignalNotFoundError);
  EXPECT_TRUE(store.List().empty());
}

TEST_F(FileSignalStoreTest, RejectsUnsafeLabels) {
  orvibo::FileSignalStore store(directory_.string());
  EXPECT_FALSE(store.Save("../escape", {0x01}));
  EXPECT_FALSE(store.Save(".hidden", {0x01}));
  EXPECT_FALSE(store.Save("", {0x01}));
  EXPECT_THROW(store.Load("../escape"), orvibo::SignalNotFoundError);
  EXPECT_TRUE(orvibo::FileSignalStore::IsValidLabel("tv_p-.ir"));
}

TEST(MemorySignalStoreTest, SaveLoadAndMissing) {
  orvibo::MemorySignalStore store;
  EXPECT_THROW(store.Load("a"), orvibo::SignalNotFoundError);
  ASSERT_TRUE(store.Save("a", {0x01, 0x02}));
  EXPECT_TRUE(store.Contains("a"));
  EXPECT_EQ(store.Load("a"), (orvibo::Bytes{0x01, 0x02}));
  EXPECT_FALSE(store.Save("", {0x01}));
  EXPECT_EQ(store.size(), 1u);
}
