#include "mcphub/utils/error.hpp"
#include "mcphub/utils/uri_template.hpp"

#include <gtest/gtest.h>

using namespace mcphub;

class UriTemplateTest : public ::testing::Test {
protected:
  nlohmann::json vars_ = {
      {"var", "value"},
      {"hello", "Hello World!"},
      {"path", "/foo/bar"},
      {"list", {"red", "green", "blue"}},
      {"keys", {{"semi", ";"}, {"dot", "."}, {"comma", ","}}},
      {"x", "1024"},
      {"y", "768"},
      {"empty", ""},
  };
};

TEST_F(UriTemplateTest, SimpleExpansionEncodesReservedCharacters) {
  EXPECT_EQ(uri_template::expand("{var}", vars_), "value");
  EXPECT_EQ(uri_template::expand("{hello}", vars_), "Hello%20World%21");
  EXPECT_EQ(uri_template::expand("{x,y}", vars_), "1024,768");
  EXPECT_EQ(uri_template::expand("{var:3}", vars_), "val");
}

TEST_F(UriTemplateTest, ReservedAndFragmentExpansionKeepReservedCharacters) {
  EXPECT_EQ(uri_template::expand("{+path}/here", vars_), "/foo/bar/here");
  EXPECT_EQ(uri_template::expand("{+hello}", vars_), "Hello%20World!");
  EXPECT_EQ(uri_template::expand("{#path}", vars_), "#/foo/bar");
}

TEST_F(UriTemplateTest, OperatorsWithLists) {
  EXPECT_EQ(uri_template::expand("{/list*}", vars_), "/red/green/blue");
  EXPECT_EQ(uri_template::expand("{/list}", vars_), "/red,green,blue");
  EXPECT_EQ(uri_template::expand("X{.list*}", vars_), "X.red.green.blue");
  EXPECT_EQ(uri_template::expand("{;list}", vars_), ";list=red,green,blue");
  EXPECT_EQ(uri_template::expand("{?list*}", vars_),
            "?list=red&list=green&list=blue");
}

TEST_F(UriTemplateTest, QueryExpansion) {
  EXPECT_EQ(uri_template::expand("{?x,y}", vars_), "?x=1024&y=768");
  EXPECT_EQ(uri_template::expand("?fixed=yes{&x}", vars_),
            "?fixed=yes&x=1024");
  EXPECT_EQ(uri_template::expand("{?empty}", vars_), "?empty=");
  EXPECT_EQ(uri_template::expand("{;empty}", vars_), ";empty");
}

TEST_F(UriTemplateTest, ExplodedObjectsExpandToPairs) {
  // Keys come out in the object's iteration order
  EXPECT_EQ(uri_template::expand("{?keys*}", vars_),
            "?comma=%2C&dot=.&semi=%3B");
  EXPECT_EQ(uri_template::expand("{keys}", vars_), "comma,%2C,dot,.,semi,%3B");
}

TEST_F(UriTemplateTest, UndefinedVariablesAreSkipped) {
  EXPECT_EQ(uri_template::expand("{?missing}", vars_), "");
  EXPECT_EQ(uri_template::expand("{?missing,x}", vars_), "?x=1024");
  EXPECT_EQ(uri_template::expand("file:///{missing}", nlohmann::json::object()),
            "file:///");
}

TEST_F(UriTemplateTest, NonStringScalarsUseTheirJsonText) {
  EXPECT_EQ(uri_template::expand("page/{n}", {{"n", 3}}), "page/3");
}

TEST_F(UriTemplateTest, UnterminatedExpressionThrows) {
  EXPECT_THROW(uri_template::expand("file:///{path", vars_), ProtocolException);
  EXPECT_THROW(uri_template::variableNames("{a}{b"), ProtocolException);
}

TEST_F(UriTemplateTest, VariableNamesAreUniqueAndOrdered) {
  auto names =
      uri_template::variableNames("repo://{owner}/{repo}{?owner,page}");
  ASSERT_EQ(names.size(), 3u);
  EXPECT_EQ(names[0], "owner");
  EXPECT_EQ(names[1], "repo");
  EXPECT_EQ(names[2], "page");
}

TEST_F(UriTemplateTest, IsTemplate) {
  EXPECT_TRUE(uri_template::isTemplate("file:///{path}"));
  EXPECT_FALSE(uri_template::isTemplate("file:///plain.txt"));
  EXPECT_FALSE(uri_template::isTemplate("file:///{}"));
}

TEST_F(UriTemplateTest, MatchExtractsVariables) {
  auto vars = uri_template::match("repo://{owner}/{repo}/issues{?state}",
                                  "repo://acme/hub/issues?state=open");
  ASSERT_TRUE(vars.has_value());
  EXPECT_EQ((*vars)["owner"], "acme");
  EXPECT_EQ((*vars)["repo"], "hub");
  EXPECT_EQ((*vars)["state"], "open");

  auto without_query = uri_template::match(
      "repo://{owner}/{repo}/issues{?state}", "repo://acme/hub/issues");
  ASSERT_TRUE(without_query.has_value());
  EXPECT_FALSE(without_query->contains("state"));
}

TEST_F(UriTemplateTest, MatchDecodesAndSplitsExplodedValues) {
  auto path = uri_template::match("file:///{+path}", "file:///a/b%20c.txt");
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ((*path)["path"], "a/b c.txt");

  auto tags = uri_template::match("tags{/tag*}", "tags/a/b");
  ASSERT_TRUE(tags.has_value());
  EXPECT_EQ((*tags)["tag"], nlohmann::json({"a", "b"}));
}

TEST_F(UriTemplateTest, MatchRejectsOtherUris) {
  EXPECT_FALSE(uri_template::match("repo://{owner}", "other://x").has_value());
  EXPECT_FALSE(
      uri_template::match("repo://{owner}", "repo://a/b").has_value());
}

TEST_F(UriTemplateTest, ExpandedUriMatchesBack) {
  const std::string tmpl = "db://{table}/rows{?limit}";
  auto uri = uri_template::expand(tmpl, {{"table", "users"}, {"limit", "10"}});
  EXPECT_EQ(uri, "db://users/rows?limit=10");
  auto vars = uri_template::match(tmpl, uri);
  ASSERT_TRUE(vars.has_value());
  EXPECT_EQ((*vars)["table"], "users");
  EXPECT_EQ((*vars)["limit"], "10");
}
