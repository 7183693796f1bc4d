#include "lcov2html/Paths.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>
//---------------------------------------------------------------------------
// lcov tracefile to html converter
// (c) 2017 Thomas Neumann
// SPDX-License-Identifier: GPL-2.0-or-later
//---------------------------------------------------------------------------
using namespace std;
using namespace lcov2html;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
TEST(Paths, DisplayPath) {
   EXPECT_EQ(getDisplayPath("/p/src/a.c", "/p/"), "src/a.c");
   EXPECT_EQ(getDisplayPath("/p/src/a.c", "/p"), "src/a.c");
   EXPECT_EQ(getDisplayPath("/p/./src/./a.c", "/p/"), "src/a.c");
   EXPECT_EQ(getDisplayPath("/q/a.c", "/p/"), "/q/a.c");
   EXPECT_EQ(getDisplayPath("./a.c", ""), "a.c");
   EXPECT_EQ(getDisplayPath("src/a.c", ""), "src/a.c");
}
//---------------------------------------------------------------------------
TEST(Paths, DirectoryName) {
   EXPECT_EQ(getDirectoryName("a.c"), ".");
   EXPECT_EQ(getDirectoryName("src/a.c"), "src");
   EXPECT_EQ(getDirectoryName("src/sub/a.c"), "src/sub");
   EXPECT_EQ(getDirectoryName("/a.c"), "/");
}
//---------------------------------------------------------------------------
TEST(Paths, ProjectRoot) {
   EXPECT_EQ(findProjectRoot(vector<string>{"/p/src/a.c", "/p/src/b.c"}), "/p/src/");
   EXPECT_EQ(findProjectRoot(vector<string>{"/p/src/a.c", "/p/lib/b.c"}), "/p/");
   EXPECT_EQ(findProjectRoot(vector<string>{"/p/src/a.c", "/q/b.c"}), "/");
   EXPECT_EQ(findProjectRoot(vector<string>{"a.c"}), "");
   EXPECT_EQ(findProjectRoot(vector<string>{}), "");
}
//---------------------------------------------------------------------------
TEST(Paths, ResolveSourcePath) {
   EXPECT_EQ(resolveSourcePath("src/a.c", "/p/"), "/p/src/a.c");
   EXPECT_EQ(resolveSourcePath("/abs/a.c", "/p/"), "/abs/a.c");
   EXPECT_EQ(resolveSourcePath("src/a.c", ""), "src/a.c");
}
//---------------------------------------------------------------------------
TEST(Paths, OutputPathStaysInside) {
   EXPECT_EQ(getOutputPath("src/sub"), "src/sub");
   EXPECT_EQ(getOutputPath("/usr/include"), "usr/include");
   EXPECT_EQ(getOutputPath("../other"), "__/other");
   EXPECT_EQ(getOutputPath("."), "_");
   EXPECT_EQ(getOutputPath("/"), "_");
}
//---------------------------------------------------------------------------
TEST(Paths, RelativeBase) {
   EXPECT_EQ(getRelativeBase(""), "");
   EXPECT_EQ(getRelativeBase("_"), "../");
   EXPECT_EQ(getRelativeBase("fs/mm"), "../../");
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
