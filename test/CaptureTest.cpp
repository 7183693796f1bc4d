#include "lcov2html/Capture.hpp"
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
using llvm::StringRef;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
TEST(Capture, TrivialCode) {
   EXPECT_TRUE(isTrivialCode(""));
   EXPECT_TRUE(isTrivialCode("   "));
   EXPECT_TRUE(isTrivialCode(";"));
   EXPECT_TRUE(isTrivialCode("   }"));
   EXPECT_TRUE(isTrivialCode("};"));
   EXPECT_TRUE(isTrivialCode("{"));
   EXPECT_FALSE(isTrivialCode("return 0;"));
   EXPECT_FALSE(isTrivialCode("} else {"));
}
//---------------------------------------------------------------------------
TEST(Capture, ExclusionMarkers) {
   vector<StringRef> lines{
      "int a;",
      "int b; // LCOV_EXCL_LINE",
      "// LCOV_EXCL_START",
      "int c;",
      "// LCOV_EXCL_STOP",
      "int d;",
      "unreachable(); // NOTREACHED",
   };
   auto excluded = findExcludedLines(lines, vector<string>{"NOTREACHED"});
   ASSERT_EQ(excluded.size(), 8u);
   EXPECT_EQ(excluded, (vector<bool>{false, false, true, true, true, true, false, true}));

   auto plain = findExcludedLines(lines, {});
   EXPECT_FALSE(plain[7]);
}
//---------------------------------------------------------------------------
TEST(Capture, UnterminatedExclusionBlock) {
   vector<StringRef> lines{"a", "LCOV_EXCL_START", "b", "c"};
   auto excluded = findExcludedLines(lines, {});
   EXPECT_EQ(excluded, (vector<bool>{false, false, true, true, true}));
}
//---------------------------------------------------------------------------
TEST(Capture, MissingInputsFail) {
   Diagnostics diag;
   auto result = captureLlvmCoverage("/nonexistent/binary", "/nonexistent/default.profdata", CaptureOptions(), diag);
   ASSERT_FALSE(static_cast<bool>(result));
   EXPECT_NE(llvm::toString(result.takeError()).find("unable to load profile"), string::npos);
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
