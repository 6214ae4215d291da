#include <surveyor/error_surveyor.h>
#include <surveyor/identifier_surveyor.h>
#include <surveyor/visitor_registry.h>

#include <memory>
#include <sstream>
#include <stdexcept>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace surveyor {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

class NamedVisitor : public Visitor {
public:
  explicit NamedVisitor(std::string name) : name_(std::move(name)) {}
  std::string Name() const override { return name_; }

private:
  std::string name_;
};

TEST(VisitorRegistryTest, FirstRegistrationBecomesDefault) {
  VisitorRegistry registry;
  registry.RegisterVisitor("first", [](const VisitorOptions &) {
    return std::make_shared<NamedVisitor>("first");
  });
  registry.RegisterVisitor("second", [](const VisitorOptions &) {
    return std::make_shared<NamedVisitor>("second");
  });

  EXPECT_EQ(registry.DefaultVisitorName(), "first");
  EXPECT_EQ(registry.CreateVisitor("", {})->Name(), "first");
  EXPECT_EQ(registry.CreateVisitor("second", {})->Name(), "second");
  EXPECT_THAT(registry.VisitorNames(), ElementsAre("first", "second"));
}

TEST(VisitorRegistryTest, RejectsInvalidRegistrations) {
  VisitorRegistry registry;
  const auto factory = [](const VisitorOptions &) {
    return std::make_shared<NamedVisitor>("x");
  };
  registry.RegisterVisitor("x", factory);

  EXPECT_THROW(registry.RegisterVisitor("x", factory), std::invalid_argument);
  EXPECT_THROW(registry.RegisterVisitor("", factory), std::invalid_argument);
  EXPECT_THROW(registry.RegisterVisitor("y", nullptr), std::invalid_argument);
}

TEST(VisitorRegistryTest, UnknownNameListsRegisteredVisitors) {
  const auto registry = MakeVisitorRegistryWithDefaults();

  try {
    registry.CreateVisitor("metrics", {});
    FAIL() << "expected invalid_argument";
  } catch (const std::invalid_argument &error) {
    EXPECT_THAT(error.what(), HasSubstr("Unknown visitor 'metrics'"));
    EXPECT_THAT(error.what(), HasSubstr("errors, identifiers"));
  }
}

TEST(VisitorRegistryTest, EmptyRegistryHasNoDefault) {
  VisitorRegistry registry;

  EXPECT_THROW(registry.CreateVisitor("", {}), std::invalid_argument);
}

TEST(VisitorRegistryTest, DefaultsProvideErrorAndIdentifierSurveyors) {
  const auto registry = MakeVisitorRegistryWithDefaults();
  std::ostringstream out;
  VisitorOptions options;
  options.out = &out;

  EXPECT_EQ(registry.DefaultVisitorName(), "errors");
  EXPECT_NE(std::dynamic_pointer_cast<ErrorSurveyor>(
                registry.CreateVisitor("errors", options)),
            nullptr);
  const auto identifiers = std::dynamic_pointer_cast<IdentifierSurveyor>(
      registry.CreateVisitor("identifiers", options));
  ASSERT_NE(identifiers, nullptr);
  EXPECT_EQ(identifiers->AllOccurrences().size(),
            IdentifierSurveyor::DefaultIdentifiers().size());
}

TEST(VisitorRegistryTest, PassesIdentifiersToTheIdentifierSurveyor) {
  std::ostringstream out;
  VisitorOptions options;
  options.out = &out;
  options.identifiers = {"sealed"};

  const auto visitor = std::dynamic_pointer_cast<IdentifierSurveyor>(
      GlobalVisitorRegistry().CreateVisitor("identifiers", options));

  ASSERT_NE(visitor, nullptr);
  EXPECT_EQ(visitor->AllOccurrences().count("sealed"), 1u);
  EXPECT_EQ(visitor->AllOccurrences().size(), 1u);
}

} // namespace
} // namespace surveyor
