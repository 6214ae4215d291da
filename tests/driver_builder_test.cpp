#include <surveyor/driver_builder.h>

#include <memory>
#include <sstream>
#include <stdexcept>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/fake_analysis_engine.h"
#include "test_support/temporary_project.h"

namespace surveyor {
namespace {

using ::testing::ElementsAre;

class DriverBuilderTest : public ::testing::Test {
protected:
  DriverBuilder MakeBuilder() {
    DriverBuilder builder;
    VisitorOptions options;
    options.out = &out_;
    builder.WithEngine(std::make_unique<test::FakeAnalysisEngine>(projects_))
        .WithPreparer(std::make_unique<test::RecordingPreparer>(projects_))
        .WithVisitorOptions(options);
    return builder;
  }

  std::ostringstream out_;
  std::shared_ptr<test::FakeProjects> projects_ =
      std::make_shared<test::FakeProjects>();
};

TEST_F(DriverBuilderTest, FallsBackToTheDefaultVisitor) {
  auto driver = MakeBuilder().Build();

  EXPECT_EQ(driver.VisitorCount(), 1u);
}

TEST_F(DriverBuilderTest, CombinesInstancesAndNamedVisitors) {
  auto journal = std::make_shared<std::vector<std::string>>();
  auto builder = MakeBuilder();
  builder.WithVisitor(std::make_shared<test::RecordingVisitor>("rec", journal))
      .WithVisitorName("errors")
      .WithVisitorName("identifiers");

  auto driver = builder.Build();

  EXPECT_EQ(driver.VisitorCount(), 3u);
}

TEST_F(DriverBuilderTest, UnknownVisitorNameFails) {
  auto builder = MakeBuilder();
  builder.WithVisitorName("metrics");

  EXPECT_THROW(builder.Build(), std::invalid_argument);
}

TEST_F(DriverBuilderTest, UsesTheConfiguredManifestName) {
  test::TemporaryProject project;
  project.AddFile("repo/BUILD.surveyor", "");
  project.AddFile("repo/CMakeLists.txt", "");
  project.AddDirectory("repo/nested");
  auto driver = MakeBuilder().WithManifestName("BUILD.surveyor").Build();
  RunConfiguration config;
  config.paths = {project.root() / "repo"};

  const auto result = driver.Run(config);

  EXPECT_EQ(result.statistics.roots_discovered, 1u);
  EXPECT_THAT(projects_->opened, ElementsAre("repo"));
}

} // namespace
} // namespace surveyor
