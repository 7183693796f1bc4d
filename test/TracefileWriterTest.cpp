#include "lcov2html/TracefileParser.hpp"
#include "lcov2html/TracefileWriter.hpp"
#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Path.h>
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
Tracefile makeSample() {
   Tracefile t;
   t.testName = "sample";
   auto& a = t.getFile("/src/b.c");
   a.addLine(1, 3, "cs1");
   a.addLine(2, 0);
   a.addFunction("second", 9);
   a.addFunctionCalls("second", 0);
   a.addFunction("first", 1);
   a.addFunctionCalls("first", 3);
   a.addFunctionCalls("orphan", 2);
   a.addBranch(2, 0, 0, 1);
   a.addBranch(2, 0, 1, 0);
   a.addBranch(2, 1, 0, nullopt);
   auto& b = t.getFile("/src/a.c");
   b.addLine(5, 1);
   return t;
}
//---------------------------------------------------------------------------
TEST(TracefileWriter, RecordOrder) {
   auto text = serializeTracefile(makeSample());
   const char* expected = R"(TN:sample
SF:/src/a.c
FNF:0
FNH:0
DA:5,1
LF:1
LH:1
end_of_record
TN:sample
SF:/src/b.c
FN:1,first
FN:9,second
FNDA:2,orphan
FNDA:3,first
FNDA:0,second
FNF:3
FNH:2
BRDA:2,0,0,1
BRDA:2,0,1,0
BRDA:2,1,0,-
BRF:3
BRH:1
DA:1,3,cs1
DA:2,0
LF:2
LH:1
end_of_record
)";
   EXPECT_EQ(text, expected);
}
//---------------------------------------------------------------------------
TEST(TracefileWriter, EmptyModel) {
   EXPECT_EQ(serializeTracefile(Tracefile()), "");
}
//---------------------------------------------------------------------------
TEST(TracefileWriter, ParseWriteParse) {
   auto original = makeSample();
   Diagnostics diag;
   auto parsed = parseTracefile(serializeTracefile(original), "roundtrip", true, diag);
   ASSERT_TRUE(static_cast<bool>(parsed));
   EXPECT_EQ(*parsed, original);
   EXPECT_EQ(diag.getEntries().size(), 0u);

   // A second pass is byte identical
   EXPECT_EQ(serializeTracefile(*parsed), serializeTracefile(original));
}
//---------------------------------------------------------------------------
TEST(TracefileWriter, EmptyFileSurvives) {
   Tracefile t;
   t.getFile("empty.c");
   Diagnostics diag;
   auto parsed = parseTracefile(serializeTracefile(t), "roundtrip", true, diag);
   ASSERT_TRUE(static_cast<bool>(parsed));
   ASSERT_EQ(parsed->files.size(), 1u);
   EXPECT_TRUE(parsed->files.at("empty.c").empty());
}
//---------------------------------------------------------------------------
TEST(TracefileWriter, SaveToDisk) {
   llvm::SmallString<128> dir;
   ASSERT_FALSE(llvm::sys::fs::createUniqueDirectory("lcov2html-writer-test", dir));
   llvm::SmallString<128> file(dir);
   llvm::sys::path::append(file, "merged.info");

   auto sample = makeSample();
   ASSERT_FALSE(static_cast<bool>(saveTracefile(file, sample)));
   auto buffer = llvm::MemoryBuffer::getFile(file);
   ASSERT_TRUE(static_cast<bool>(buffer));
   EXPECT_EQ((*buffer)->getBuffer().str(), serializeTracefile(sample));

   llvm::sys::fs::remove_directories(dir);
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
