#include "lcov2html/Diagnostics.hpp"
#include <llvm/Support/raw_ostream.h>
#include <gtest/gtest.h>
#include <string>
#include <thread>
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
TEST(Diagnostics, CountsAndFatal) {
   Diagnostics diag;
   EXPECT_FALSE(diag.hasFatal());
   diag.report(DiagKind::ParseWarning, "a.info", 3, "bad record");
   diag.report(DiagKind::MissingSource, "x.c", 0, "not found");
   EXPECT_EQ(diag.warningCount(), 2u);
   EXPECT_EQ(diag.count(DiagKind::ParseWarning), 1u);
   EXPECT_FALSE(diag.hasFatal());
   diag.report(DiagKind::StructuralError, "b.info", 0, "broken");
   EXPECT_TRUE(diag.hasFatal());
   EXPECT_EQ(diag.warningCount(), 2u);
}
//---------------------------------------------------------------------------
TEST(Diagnostics, EntriesAreSorted) {
   Diagnostics diag;
   diag.report(DiagKind::ParseWarning, "b", 1, "");
   diag.report(DiagKind::ParseWarning, "a", 7, "");
   diag.report(DiagKind::ChecksumMismatch, "a", 2, "");
   auto entries = diag.getEntries();
   ASSERT_EQ(entries.size(), 3u);
   EXPECT_EQ(entries[0].file, "a");
   EXPECT_EQ(entries[0].line, 2u);
   EXPECT_EQ(entries[1].line, 7u);
   EXPECT_EQ(entries[2].file, "b");
}
//---------------------------------------------------------------------------
TEST(Diagnostics, Print) {
   Diagnostics diag;
   diag.report(DiagKind::ParseWarning, "a.info", 3, "unknown record 'X'");
   diag.report(DiagKind::StructuralError, "b.info", 0, "unreadable");
   string text;
   llvm::raw_string_ostream out(text);
   diag.print(out, false);
   out.flush();
   EXPECT_EQ(text, "warning: parse warning: a.info:3: unknown record 'X'\n"
                   "error: structural error: b.info: unreadable\n"
                   "1 warning reported\n");
}
//---------------------------------------------------------------------------
TEST(Diagnostics, PrintedCountMatchesWarningCount) {
   Diagnostics diag;
   diag.report(DiagKind::ChecksumMismatch, "a.c", 4, "differs");
   diag.report(DiagKind::SourceMismatch, "a.c", 9, "changed");
   diag.report(DiagKind::MissingSource, "b.c", 0, "not found");
   diag.report(DiagKind::StructuralError, "c.info", 0, "broken");
   diag.report(DiagKind::StructuralError, "d.info", 0, "broken");
   string text;
   llvm::raw_string_ostream out(text);
   diag.print(out, false);
   out.flush();
   EXPECT_EQ(diag.warningCount(), 3u);
   EXPECT_NE(text.find("\n3 warnings reported\n"), string::npos);

   // Errors alone are not counted
   Diagnostics errorsOnly;
   errorsOnly.report(DiagKind::StructuralError, "c.info", 0, "broken");
   string errorText;
   llvm::raw_string_ostream errorOut(errorText);
   errorsOnly.print(errorOut, false);
   errorOut.flush();
   EXPECT_EQ(errorsOnly.warningCount(), 0u);
   EXPECT_EQ(errorText, "error: structural error: c.info: broken\n");
}
//---------------------------------------------------------------------------
TEST(Diagnostics, ConcurrentReports) {
   Diagnostics diag;
   vector<thread> threads;
   for (unsigned t = 0; t < 4; ++t)
      threads.emplace_back([&diag, t] {
         for (unsigned index = 0; index < 100; ++index)
            diag.report(DiagKind::ParseWarning, "f" + to_string(t), index + 1, "w");
      });
   for (auto& t : threads)
      t.join();
   EXPECT_EQ(diag.count(DiagKind::ParseWarning), 400u);
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
