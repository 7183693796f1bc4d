#include "lcov2html/TracefileParser.hpp"
#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/raw_ostream.h>
#include <gtest/gtest.h>
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
Tracefile parseOk(llvm::StringRef text, Diagnostics& diag, bool strict = true) {
   auto result = parseTracefile(text, "test.info", strict, diag);
   EXPECT_TRUE(static_cast<bool>(result)) << (result ? "" : llvm::toString(result.takeError()));
   return result ? move(*result) : Tracefile();
}
//---------------------------------------------------------------------------
TEST(TracefileParser, SingleSection) {
   Diagnostics diag;
   auto t = parseOk(R"(TN:unit
SF:/src/a.c
FN:3,main
FNDA:1,main
FNF:1
FNH:1
BRDA:4,0,0,2
BRDA:4,0,1,-
BRF:2
BRH:1
DA:3,1
DA:4,1
DA:5,0
LF:3
LH:2
end_of_record
)",
                    diag);
   EXPECT_EQ(diag.getEntries().size(), 0u);
   EXPECT_EQ(t.testName, "unit");
   ASSERT_EQ(t.files.size(), 1u);
   auto* f = t.findFile("/src/a.c");
   ASSERT_NE(f, nullptr);
   EXPECT_EQ(f->path, "/src/a.c");
   ASSERT_EQ(f->lines.size(), 3u);
   EXPECT_EQ(f->lines.at(3).hits, 1u);
   EXPECT_EQ(f->lines.at(5).hits, 0u);
   ASSERT_EQ(f->functions.size(), 1u);
   EXPECT_EQ(f->functions.at("main").line, 3u);
   EXPECT_EQ(f->functions.at("main").calls, 1u);
   ASSERT_EQ(f->branches.size(), 2u);
   EXPECT_EQ(f->branches.at(BranchKey{4, 0, 0}).taken, optional<uint64_t>(2));
   EXPECT_FALSE(f->branches.at(BranchKey{4, 0, 1}).taken.has_value());
}
//---------------------------------------------------------------------------
TEST(TracefileParser, EmptyInput) {
   Diagnostics diag;
   auto t = parseOk("", diag);
   EXPECT_TRUE(t.files.empty());
   EXPECT_TRUE(t.testName.empty());
   EXPECT_EQ(diag.getEntries().size(), 0u);
}
//---------------------------------------------------------------------------
TEST(TracefileParser, RepeatedSectionsAreMerged) {
   Diagnostics diag;
   auto t = parseOk("SF:a.c\nDA:1,2\nFNDA:1,f\nend_of_record\nSF:a.c\nDA:1,3\nDA:2,0\nFNDA:4,f\nend_of_record\n", diag);
   ASSERT_EQ(t.files.size(), 1u);
   auto& f = t.files.at("a.c");
   EXPECT_EQ(f.lines.at(1).hits, 5u);
   EXPECT_EQ(f.lines.at(2).hits, 0u);
   EXPECT_EQ(f.functions.at("f").calls, 5u);
}
//---------------------------------------------------------------------------
TEST(TracefileParser, NegativeCountsAreClamped) {
   Diagnostics diag;
   auto t = parseOk("SF:a.c\nDA:1,-5\nFNDA:-1,f\nend_of_record\n", diag);
   auto& f = t.files.at("a.c");
   EXPECT_EQ(f.lines.at(1).hits, 0u);
   EXPECT_EQ(f.functions.at("f").calls, 0u);
   EXPECT_EQ(diag.count(DiagKind::ParseWarning), 2u);
   EXPECT_FALSE(diag.hasFatal());
}
//---------------------------------------------------------------------------
TEST(TracefileParser, MalformedRecordsAreSkipped) {
   Diagnostics diag;
   auto t = parseOk("SF:a.c\nDA:x,1\nDA:0,1\nDA:2,abc\nBRDA:1,0,1\nFOO:bar\nDA:3,7\nend_of_record\n", diag);
   auto& f = t.files.at("a.c");
   ASSERT_EQ(f.lines.size(), 1u);
   EXPECT_EQ(f.lines.at(3).hits, 7u);
   EXPECT_TRUE(f.branches.empty());
   EXPECT_EQ(diag.count(DiagKind::ParseWarning), 5u);
   for (auto& d : diag.getEntries())
      EXPECT_EQ(d.file, "test.info");
}
//---------------------------------------------------------------------------
TEST(TracefileParser, WarningsCarryTheLineNumber) {
   Diagnostics diag;
   parseOk("SF:a.c\nDA:1,1\nBOGUS\nend_of_record\n", diag);
   auto entries = diag.getEntries();
   ASSERT_EQ(entries.size(), 1u);
   EXPECT_EQ(entries[0].line, 3u);
   EXPECT_EQ(entries[0].kind, DiagKind::ParseWarning);
}
//---------------------------------------------------------------------------
TEST(TracefileParser, RecordOutsideSection) {
   Diagnostics diag;
   auto t = parseOk("DA:1,1\nend_of_record\nSF:a.c\nDA:2,1\nend_of_record\n", diag);
   EXPECT_EQ(diag.count(DiagKind::ParseWarning), 2u);
   ASSERT_EQ(t.files.size(), 1u);
   EXPECT_EQ(t.files.at("a.c").lines.count(1), 0u);
}
//---------------------------------------------------------------------------
TEST(TracefileParser, UnterminatedFinalSection) {
   Diagnostics diag;
   auto t = parseOk("SF:a.c\nDA:1,1\nDA:2,0", diag);
   ASSERT_EQ(t.files.size(), 1u);
   EXPECT_EQ(t.files.at("a.c").lines.size(), 2u);
   EXPECT_FALSE(diag.hasFatal());
}
//---------------------------------------------------------------------------
TEST(TracefileParser, NestedSectionIsStructural) {
   Diagnostics diag;
   auto result = parseTracefile("SF:a.c\nDA:1,1\nSF:b.c\nDA:1,1\nend_of_record\n", "test.info", true, diag);
   ASSERT_FALSE(static_cast<bool>(result));
   auto message = llvm::toString(result.takeError());
   EXPECT_NE(message.find("b.c"), string::npos);
}
//---------------------------------------------------------------------------
TEST(TracefileParser, CarriageReturnsAndBlankLines) {
   Diagnostics diag;
   auto t = parseOk("TN:\r\nSF:a.c\r\n\r\nDA:1,4\r\nend_of_record\r\n", diag);
   EXPECT_EQ(diag.getEntries().size(), 0u);
   EXPECT_EQ(t.files.at("a.c").lines.at(1).hits, 4u);
}
//---------------------------------------------------------------------------
TEST(TracefileParser, TestNameIsSanitized) {
   Diagnostics diag;
   auto t = parseOk("TN:my test-1\nSF:a.c\nDA:1,1\nend_of_record\n", diag);
   EXPECT_EQ(t.testName, "my_test_1");
   EXPECT_EQ(diag.count(DiagKind::ParseWarning), 1u);
}
//---------------------------------------------------------------------------
TEST(TracefileParser, Checksums) {
   Diagnostics diag;
   auto t = parseOk("SF:a.c\nDA:1,1,abc\nDA:2,0\nend_of_record\n", diag);
   auto& f = t.files.at("a.c");
   EXPECT_EQ(f.lines.at(1).checksum, "abc");
   EXPECT_TRUE(f.lines.at(2).checksum.empty());
}
//---------------------------------------------------------------------------
TEST(TracefileParser, ConflictingChecksumWithinSection) {
   Diagnostics strictDiag;
   auto strict = parseOk("SF:a.c\nDA:1,1,xyz\nDA:1,2,abc\nend_of_record\n", strictDiag);
   EXPECT_EQ(strictDiag.count(DiagKind::ChecksumMismatch), 1u);
   EXPECT_EQ(strict.files.at("a.c").lines.at(1).hits, 1u);
   EXPECT_EQ(strict.files.at("a.c").lines.at(1).checksum, "xyz");

   Diagnostics relaxedDiag;
   auto relaxed = parseOk("SF:a.c\nDA:1,1,xyz\nDA:1,2,abc\nend_of_record\n", relaxedDiag, false);
   EXPECT_EQ(relaxedDiag.count(DiagKind::ChecksumMismatch), 1u);
   EXPECT_EQ(relaxed.files.at("a.c").lines.at(1).hits, 3u);
   EXPECT_EQ(relaxed.files.at("a.c").lines.at(1).checksum, "abc");
}
//---------------------------------------------------------------------------
TEST(TracefileParser, FunctionWithoutDeclaration) {
   Diagnostics diag;
   auto t = parseOk("SF:a.c\nFNDA:3,g\nend_of_record\n", diag);
   auto& g = t.files.at("a.c").functions.at("g");
   EXPECT_EQ(g.line, 0u);
   EXPECT_EQ(g.calls, 3u);
}
//---------------------------------------------------------------------------
TEST(TracefileParser, ReadFromDisk) {
   llvm::SmallString<128> dir;
   ASSERT_FALSE(llvm::sys::fs::createUniqueDirectory("lcov2html-parser-test", dir));
   llvm::SmallString<128> file(dir);
   llvm::sys::path::append(file, "cov.info");
   {
      error_code ec;
      llvm::raw_fd_ostream out(file, ec);
      ASSERT_FALSE(ec);
      out << "SF:x.c\nDA:1,1\nend_of_record\n";
   }
   Diagnostics diag;
   auto t = readTracefile(file, true, diag);
   ASSERT_TRUE(static_cast<bool>(t));
   EXPECT_EQ(t->files.size(), 1u);

   llvm::SmallString<128> missing(dir);
   llvm::sys::path::append(missing, "missing.info");
   auto m = readTracefile(missing, true, diag);
   EXPECT_FALSE(static_cast<bool>(m));
   llvm::consumeError(m.takeError());

   llvm::sys::fs::remove_directories(dir);
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
