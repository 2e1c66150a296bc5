#include "errors.hpp"
#include "glob_pattern.hpp"
#include "ignore.hpp"
#include "temp_dir.hpp"
#include <catch2/catch_test_macros.hpp>

using kushn::GlobPattern;
using kushn::IgnoreMatcher;

TEST_CASE("Single-character and run wildcards") {
  GlobPattern q("?.txt");
  REQUIRE(q.matches("a.txt"));
  REQUIRE_FALSE(q.matches("ab.txt"));
  REQUIRE_FALSE(q.matches(".txt"));

  GlobPattern star("*.log");
  REQUIRE(star.matches("app.log"));
  REQUIRE(star.matches(".log"));
  // '*' is not stopped by separators.
  REQUIRE(star.matches("nested/debug.log"));
  REQUIRE_FALSE(star.matches("app.log.1"));
}

TEST_CASE("Recursive wildcards span whole components") {
  GlobPattern lead("**/skip");
  REQUIRE(lead.matches("skip"));
  REQUIRE(lead.matches("a/b/skip"));
  REQUIRE_FALSE(lead.matches("noskip"));
  REQUIRE_FALSE(lead.matches("a/skip/x"));

  GlobPattern tail("skip/**");
  REQUIRE(tail.matches("skip/"));
  REQUIRE(tail.matches("skip/a/b.txt"));
  REQUIRE_FALSE(tail.matches("skip"));
  REQUIRE_FALSE(tail.matches("skipper/a"));

  GlobPattern mid("a/**/b");
  REQUIRE(mid.matches("a/b"));
  REQUIRE(mid.matches("a/x/y/b"));
  REQUIRE_FALSE(mid.matches("a/xb"));

  REQUIRE(GlobPattern("**").matches("any/thing/at/all"));
}

TEST_CASE("Character classes") {
  GlobPattern set("[abc].txt");
  REQUIRE(set.matches("b.txt"));
  REQUIRE_FALSE(set.matches("d.txt"));

  GlobPattern neg("[!abc].txt");
  REQUIRE(neg.matches("d.txt"));
  REQUIRE_FALSE(neg.matches("a.txt"));

  GlobPattern range("[a-c]x");
  REQUIRE(range.matches("bx"));
  REQUIRE_FALSE(range.matches("dx"));

  REQUIRE(GlobPattern("[]]").matches("]"));
  REQUIRE(GlobPattern("[!]]").matches("a"));
  REQUIRE_FALSE(GlobPattern("[!]]").matches("]"));
  REQUIRE(GlobPattern("[-+]").matches("+"));
}

TEST_CASE("Literal characters are matched exactly and case-sensitively") {
  REQUIRE(GlobPattern("a+b(c)$.txt").matches("a+b(c)$.txt"));
  REQUIRE_FALSE(GlobPattern("file.txt").matches("fileXtxt"));
  REQUIRE_FALSE(GlobPattern("*.LOG").matches("app.log"));
  REQUIRE(GlobPattern("*.LOG").matches("APP.LOG"));
}

TEST_CASE("Invalid globs are rejected") {
  for (const char* bad : {"***", "a**", "**a", "a/**b", "[abc", "[!]", "[]"}) {
    INFO(bad);
    REQUIRE_THROWS_AS(GlobPattern(bad), kushn::PatternError);
  }
}

TEST_CASE("Directory rules prune the directory and everything under it") {
  IgnoreMatcher m({"skip"});

  REQUIRE(m.excludes("skip", true));
  REQUIRE(m.excludes("skip/ignored.txt", false));
  REQUIRE(m.excludes("skip/deep/er.txt", false));
  REQUIRE_FALSE(m.excludes("keep.txt", false));
  REQUIRE_FALSE(m.excludes("skipper", true));
  // A file named like the rule is caught by the file form anywhere.
  REQUIRE(m.excludes("skip", false));
  REQUIRE(m.excludes("docs/skip", false));
}

TEST_CASE("Directory rules are anchored at the root") {
  IgnoreMatcher m({"skip"});
  REQUIRE_FALSE(m.excludes("nested/skip", true));
  REQUIRE_FALSE(m.excludes("nested/skip/file.txt", false));

  IgnoreMatcher nested({"nested/skip"});
  REQUIRE(nested.excludes("nested/skip", true));
  REQUIRE(nested.excludes("nested/skip/file.txt", false));
}

TEST_CASE("File rules apply across the whole tree") {
  IgnoreMatcher m({"*.log"});
  REQUIRE(m.excludes("app.log", false));
  REQUIRE(m.excludes("nested/debug.log", false));
  REQUIRE_FALSE(m.excludes("app.txt", false));
  REQUIRE_FALSE(m.excludes("logs", true));
}

TEST_CASE("Separators are normalized in rules and queried paths") {
  IgnoreMatcher m({"build\\out"});
  REQUIRE(m.excludes("build/out", true));
  REQUIRE(m.excludes("build\\out\\a.o", false));
  REQUIRE(m.excludes("build/out/a.o", false));
  REQUIRE_FALSE(m.excludes("build/other.o", false));
}

TEST_CASE("Trailing slashes and blank rules") {
  IgnoreMatcher m({"build/", ""});
  REQUIRE(m.rules() == std::vector<std::string>{"build"});
  REQUIRE(m.excludes("build", true));
  REQUIRE(m.excludes("build/x.o", false));

  IgnoreMatcher none;
  REQUIRE(none.empty());
  REQUIRE_FALSE(none.excludes("anything", false));
  REQUIRE_FALSE(none.excludes("anything", true));
}

TEST_CASE("A bad rule fails construction and names the rule") {
  try {
    IgnoreMatcher m({"ok", "a**"});
    FAIL("expected PatternError");
  } catch (const kushn::PatternError& e) {
    REQUIRE(e.kind() == kushn::ErrorKind::GlobPattern);
    REQUIRE(e.pattern() == "a**");
  }
}

TEST_CASE("Ignore files are trimmed line by line") {
  TempDir dir;
  auto file = dir.write(".kushnignore", "node_modules\n  *.log  \n\n\t\nbuild\\out\r\n");

  auto rules = kushn::load_ignore_file(file);
  REQUIRE(rules == std::vector<std::string>{"node_modules", "*.log", "build\\out"});

  REQUIRE_THROWS_AS(kushn::load_ignore_file(dir.path() / "absent"), kushn::IoError);
}
