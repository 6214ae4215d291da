#include <surveyor/identifier_surveyor.h>

#include <memory>
#include <sstream>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace surveyor {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

SyntaxNode Declaration(const std::string &spelling, std::size_t offset) {
  SyntaxNode node;
  node.kind = "VarDecl";
  node.spelling = spelling;
  node.offset = offset;
  node.declaration = true;
  return node;
}

SyntaxNode Reference(const std::string &spelling, std::size_t offset) {
  SyntaxNode node;
  node.kind = "DeclRefExpr";
  node.spelling = spelling;
  node.offset = offset;
  node.reference = true;
  return node;
}

class IdentifierSurveyorTest : public ::testing::Test {
protected:
  void EnterRoot(const std::string &name, std::size_t progress) {
    roots_.push_back(std::make_unique<AnalysisRoot>());
    roots_.back()->path = "/work/" + name;
    surveyor_.PreAnalysis({*roots_.back(), false, progress, 2});
    surveyor_.SetFilePath("/work/" + name + "/src/main.cpp");
    surveyor_.SetLineInfo(std::make_shared<const LineInfo>(
        LineInfo::FromContent("int module = 0;\nint x = module;\n")));
  }

  std::ostringstream out_;
  IdentifierSurveyor surveyor_{out_, {"module", "import"}, "/work"};
  std::vector<std::unique_ptr<AnalysisRoot>> roots_;
};

TEST_F(IdentifierSurveyorTest, CountsDeclarationsAndReferences) {
  EnterRoot("widgets-1.2.0", 1);

  surveyor_.VisitNode(Declaration("module", 4));
  surveyor_.VisitNode(Reference("module", 24));
  surveyor_.VisitNode(Reference("unrelated", 0));

  const auto &occurrences = surveyor_.AllOccurrences().at("module");
  EXPECT_EQ(occurrences.declarations, 1u);
  EXPECT_EQ(occurrences.references, 1u);
  EXPECT_THAT(occurrences.projects, ElementsAre("widgets"));
  EXPECT_THAT(surveyor_.Reports(), ElementsAre("widgets-1.2.0/src/main.cpp:1:5",
                                               "widgets-1.2.0/src/main.cpp:2:9"));
  EXPECT_THAT(out_.str(), HasSubstr("found 'module' (decl) • "
                                    "widgets-1.2.0/src/main.cpp:1:5\n"));
  EXPECT_THAT(out_.str(),
              HasSubstr("found 'module' • widgets-1.2.0/src/main.cpp:2:9\n"));
}

TEST_F(IdentifierSurveyorTest, IgnoresNodesThatAreNeitherDeclNorReference) {
  EnterRoot("plain", 1);
  SyntaxNode node;
  node.kind = "IntegerLiteral";
  node.spelling = "module";

  surveyor_.VisitNode(node);

  EXPECT_TRUE(surveyor_.Reports().empty());
  EXPECT_EQ(surveyor_.RootHits(), 0u);
}

TEST_F(IdentifierSurveyorTest, ResetsPerRootStateOnEachRoot) {
  EnterRoot("first", 1);
  surveyor_.VisitNode(Declaration("import", 4));
  EXPECT_EQ(surveyor_.RootHits(), 1u);

  EnterRoot("second", 2);

  EXPECT_EQ(surveyor_.RootHits(), 0u);
  EXPECT_EQ(surveyor_.AllOccurrences().at("import").declarations, 1u);
}

TEST_F(IdentifierSurveyorTest, SummarizesOccurrencesAtTheEnd) {
  EnterRoot("alpha-2", 1);
  surveyor_.VisitNode(Declaration("module", 4));
  EnterRoot("beta", 2);
  surveyor_.VisitNode(Reference("module", 24));
  out_.str("");

  surveyor_.OnRunFinished();

  EXPECT_EQ(out_.str(), "Found 2 occurrences in 2 projects:\n"
                        "alpha-2/src/main.cpp:1:5\n"
                        "beta/src/main.cpp:2:9\n"
                        "import: [0 decl, 0 ref]\n"
                        "module: [1 decl, 1 ref]\n"
                        "  alpha\n"
                        "  beta\n");
}

TEST(IdentifierSurveyorNamesTest, ProjectNameDropsVersionSuffix) {
  EXPECT_EQ(IdentifierSurveyor::ProjectName("widgets-1.2.0"), "widgets");
  EXPECT_EQ(IdentifierSurveyor::ProjectName("plain"), "plain");
  EXPECT_THAT(IdentifierSurveyor::DefaultIdentifiers(),
              ElementsAre("final", "import", "module", "override"));
}

} // namespace
} // namespace surveyor
