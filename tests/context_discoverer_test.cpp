#include <surveyor/context_discoverer.h>

#include <filesystem>
#include <sstream>
#include <system_error>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_project.h"

namespace surveyor {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

std::vector<std::string> Names(const DiscoveryResult &result) {
  std::vector<std::string> names;
  for (const auto &root : result.roots) {
    names.push_back(root.QualifiedName());
  }
  return names;
}

class ContextDiscovererTest : public ::testing::Test {
protected:
  test::TemporaryProject project_;
  ContextDiscoverer discoverer_;
};

TEST_F(ContextDiscovererTest, SingleProjectIsItsOwnRoot) {
  const auto root = project_.AddProject("app");
  project_.AddProject("app/third_party/lib");

  const auto result = discoverer_.Discover({root});

  ASSERT_EQ(result.roots.size(), 1u);
  EXPECT_FALSE(result.expanded);
  EXPECT_FALSE(result.roots.front().sub_root);
  EXPECT_EQ(result.roots.front().Name(), "app");
  EXPECT_EQ(result.roots.front().QualifiedName(), "app");
}

TEST_F(ContextDiscovererTest, ExpandsContainerIntoVisibleSubdirectories) {
  project_.AddDirectory("a/b");
  project_.AddDirectory("a/.git");
  project_.AddFile("a/README.md", "notes");

  const auto result = discoverer_.Discover({project_.root() / "a"});

  EXPECT_TRUE(result.expanded);
  EXPECT_EQ(result.container, project_.root() / "a");
  ASSERT_EQ(result.roots.size(), 1u);
  EXPECT_TRUE(result.roots.front().sub_root);
  EXPECT_EQ(result.roots.front().parent_name, "a");
  EXPECT_EQ(result.roots.front().QualifiedName(), "a/b");
}

TEST_F(ContextDiscovererTest, OrdersSubRootsByNameAndIndexesThem) {
  project_.AddDirectory("ws/zeta");
  project_.AddDirectory("ws/alpha");
  project_.AddProject("ws/mid");

  const auto result = discoverer_.Discover({project_.root() / "ws/"});

  EXPECT_THAT(Names(result), ElementsAre("ws/alpha", "ws/mid", "ws/zeta"));
  for (std::size_t i = 0; i < result.roots.size(); ++i) {
    EXPECT_EQ(result.roots[i].index, i);
  }
}

TEST_F(ContextDiscovererTest, DiscoveryIsRepeatable) {
  project_.AddDirectory("ws/one");
  project_.AddDirectory("ws/two");

  const auto first = discoverer_.Discover({project_.root() / "ws"});
  const auto second = discoverer_.Discover({project_.root() / "ws"});

  EXPECT_EQ(Names(first), Names(second));
}

TEST_F(ContextDiscovererTest, MultipleInputsAreUsedAsGiven) {
  const auto first = project_.AddDirectory("one");
  const auto second = project_.AddProject("two");
  project_.AddDirectory("one/child");

  const auto result = discoverer_.Discover({second, first});

  EXPECT_FALSE(result.expanded);
  EXPECT_THAT(Names(result), ElementsAre("two", "one"));
  EXPECT_EQ(result.roots[1].index, 1u);
}

TEST_F(ContextDiscovererTest, RecordsInvalidInputsAndKeepsGoing) {
  std::ostringstream log;
  ContextDiscoverer discoverer("CMakeLists.txt",
                               MakeLogger({LogLevel::kWarn}, log));
  const auto file = project_.AddFile("notes.txt", "x");
  const auto valid = project_.AddProject("valid");

  const auto result =
      discoverer.Discover({project_.root() / "missing", file, valid});

  ASSERT_EQ(result.errors.size(), 2u);
  EXPECT_EQ(result.errors[0].reason, "path does not exist");
  EXPECT_EQ(result.errors[1].reason, "path is not a directory");
  EXPECT_THAT(Names(result), ElementsAre("valid"));
  EXPECT_THAT(log.str(), HasSubstr("discovery.error"));
}

TEST_F(ContextDiscovererTest, UnlistableContainerIsANonFatalError) {
  namespace fs = std::filesystem;
  const auto container = project_.AddDirectory("locked");
  project_.AddDirectory("locked/inner");
  fs::permissions(container, fs::perms::owner_write | fs::perms::owner_exec);
  std::error_code listing_error;
  fs::directory_iterator listing(container, listing_error);
  if (!listing_error) {
    fs::permissions(container, fs::perms::owner_all);
    GTEST_SKIP() << "directory permissions are not enforced for this user";
  }

  DiscoveryResult result;
  EXPECT_NO_THROW(result = discoverer_.Discover({container}));
  fs::permissions(container, fs::perms::owner_all);

  EXPECT_TRUE(result.roots.empty());
  EXPECT_TRUE(result.expanded);
  ASSERT_EQ(result.errors.size(), 1u);
  EXPECT_EQ(result.errors.front().path, container);
  EXPECT_EQ(result.errors.front().reason, "cannot list directory");
}

TEST_F(ContextDiscovererTest, EmptyInputYieldsNothing) {
  const auto result = discoverer_.Discover({});

  EXPECT_TRUE(result.roots.empty());
  EXPECT_TRUE(result.errors.empty());
  EXPECT_EQ(result.Total(), 0u);
}

TEST_F(ContextDiscovererTest, UsesTheConfiguredManifest) {
  project_.AddFile("repo/meson.build", "");
  project_.AddDirectory("repo/sub");
  const ContextDiscoverer meson("meson.build");

  EXPECT_TRUE(meson.IsProject(project_.root() / "repo"));
  EXPECT_FALSE(discoverer_.IsProject(project_.root() / "repo"));
  EXPECT_EQ(meson.Discover({project_.root() / "repo"}).roots.size(), 1u);
}

} // namespace
} // namespace surveyor
