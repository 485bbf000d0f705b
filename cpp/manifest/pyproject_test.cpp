#include "manifest/pyproject.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;
using ::testing::Not;
using manifest::Dependency;
using manifest::PyprojectManifest;

/*
 * Dependency::Parse
 */

// NOLINTNEXTLINE
TEST(Dependency, ParseBareName) {
  Dependency dependency = Dependency::Parse("requests");
  EXPECT_EQ(dependency.name, "requests");
  EXPECT_EQ(dependency.version_constraints, "");
}

// NOLINTNEXTLINE
TEST(Dependency, ParseWithConstraints) {
  Dependency dependency = Dependency::Parse("typing-extensions<5");
  EXPECT_EQ(dependency.name, "typing-extensions");
  EXPECT_EQ(dependency.version_constraints, "<5");

  dependency = Dependency::Parse("numpy>=2,<3");
  EXPECT_EQ(dependency.name, "numpy");
  EXPECT_EQ(dependency.version_constraints, ">=2,<3");

  dependency = Dependency::Parse("pandas~=2.2");
  EXPECT_EQ(dependency.name, "pandas");
  EXPECT_EQ(dependency.version_constraints, "~=2.2");
}

// NOLINTNEXTLINE
TEST(Dependency, ParseExtrasAndMarkers) {
  Dependency dependency = Dependency::Parse("httpx[http2]>=0.27");
  EXPECT_EQ(dependency.name, "httpx");
  EXPECT_EQ(dependency.version_constraints, "[http2]>=0.27");

  dependency = Dependency::Parse("uvloop; sys_platform != 'win32'");
  EXPECT_EQ(dependency.name, "uvloop");
  EXPECT_EQ(dependency.version_constraints, "; sys_platform != 'win32'");
}

/*
 * PyprojectManifest
 */

// NOLINTNEXTLINE
TEST(PyprojectManifest, Defaults) {
  PyprojectManifest manifest(std::vector<Dependency>{});
  EXPECT_EQ(manifest.Title(), "my-project");
  EXPECT_EQ(manifest.PythonMinVersion(), "3.13");
  EXPECT_EQ(manifest.PythonMaxVersion(), "4");
  EXPECT_EQ(manifest.ToString(),
            "[project]\n"
            "name = \"my-project\"\n"
            "version = \"0.1.0\"\n"
            "description = \"Add your description here\"\n"
            "requires-python = \">=3.13,<4\"\n"
            "dependencies = [\n"
            "]\n");
}

// NOLINTNEXTLINE
TEST(PyprojectManifest, Dependencies) {
  PyprojectManifest manifest(
      {{"typing-extensions", "<5"}, {"numpy", ">=2"}, {"rich", ""}},
      "test-project", "3.11", "3.14");
  EXPECT_EQ(manifest.ToString(),
            "[project]\n"
            "name = \"test-project\"\n"
            "version = \"0.1.0\"\n"
            "description = \"Add your description here\"\n"
            "requires-python = \">=3.11,<3.14\"\n"
            "dependencies = [\n"
            "    \"typing-extensions<5\",\n"
            "    \"numpy>=2\",\n"
            "    \"rich\",\n"
            "]\n");
}

// NOLINTNEXTLINE
TEST(PyprojectManifest, EscapesStrings) {
  PyprojectManifest manifest({{"pkg", "; python_version > \"3.12\""}},
                             "my \"quoted\" \\ project");
  std::string text = manifest.ToString();
  EXPECT_THAT(text, HasSubstr("name = \"my \\\"quoted\\\" \\\\ project\"\n"));
  EXPECT_THAT(text,
              HasSubstr("    \"pkg; python_version > \\\"3.12\\\"\",\n"));
}

// NOLINTNEXTLINE
TEST(PyprojectManifest, SingleQuotesAreKeptVerbatim) {
  PyprojectManifest manifest(
      std::vector<Dependency>{{"uvloop", "; sys_platform != 'win32'"}});
  std::string text = manifest.ToString();
  EXPECT_THAT(text, HasSubstr("'win32'"));
  EXPECT_THAT(text, Not(HasSubstr("\\'")));
}

}  // namespace
