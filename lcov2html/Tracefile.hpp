#ifndef LCOV2HTML_TRACEFILE_HPP
#define LCOV2HTML_TRACEFILE_HPP
#include <llvm/ADT/StringRef.h>
#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
//---------------------------------------------------------------------------
// lcov tracefile to html converter
// (c) 2017 Thomas Neumann
// SPDX-License-Identifier: GPL-2.0-or-later
//---------------------------------------------------------------------------
namespace lcov2html {
//---------------------------------------------------------------------------
/// Add two execution counts, sticking at the maximum instead of wrapping
inline uint64_t addCounts(uint64_t a, uint64_t b) { return (a + b < a) ? ~uint64_t(0) : a + b; }
//---------------------------------------------------------------------------
/// The checksum of a source line as used in tracefiles (base64 encoded MD5 without padding)
std::string computeLineChecksum(llvm::StringRef line);
//---------------------------------------------------------------------------
/// Coverage of a single source line
struct LineRecord {
   /// The execution count
   uint64_t hits = 0;
   /// Fingerprint of the line content, empty if unknown
   std::string checksum;

   bool operator==(const LineRecord&) const = default;
};
//---------------------------------------------------------------------------
/// Coverage of a function
struct FunctionRecord {
   /// The (possibly mangled) name
   std::string name;
   /// The first line of the function, 0 if unknown
   unsigned line = 0;
   /// The number of calls
   uint64_t calls = 0;

   bool operator==(const FunctionRecord&) const = default;
};
//---------------------------------------------------------------------------
/// Identity of a branch
struct BranchKey {
   unsigned line = 0, block = 0, branch = 0;

   auto operator<=>(const BranchKey&) const = default;
};
//---------------------------------------------------------------------------
/// Coverage of a branch
struct BranchRecord {
   unsigned line = 0, block = 0, branch = 0;
   /// How often the branch was taken. Empty if the branch was never reached
   std::optional<uint64_t> taken;

   /// The identity
   BranchKey getKey() const { return BranchKey{line, block, branch}; }
   /// Was the branch taken at least once?
   bool isHit() const { return taken && *taken; }

   bool operator==(const BranchRecord&) const = default;
};
//---------------------------------------------------------------------------
/// All coverage data of one source file
struct SourceFile {
   /// The path as written in the tracefile
   std::string path;
   /// Line number -> coverage
   std::map<unsigned, LineRecord> lines;
   /// Function name -> coverage
   std::map<std::string, FunctionRecord> functions;
   /// Branch identity -> coverage
   std::map<BranchKey, BranchRecord> branches;

   /// Add to the count of a line
   void addLine(unsigned line, uint64_t hits, std::string checksum = {});
   /// Declare a function
   void addFunction(const std::string& name, unsigned line);
   /// Add to the call count of a function
   void addFunctionCalls(const std::string& name, uint64_t calls);
   /// Add to the taken count of a branch
   void addBranch(unsigned line, unsigned block, unsigned branch, std::optional<uint64_t> taken);

   /// Does the file contain any data?
   bool empty() const { return lines.empty() && functions.empty() && branches.empty(); }

   bool operator==(const SourceFile&) const = default;
};
//---------------------------------------------------------------------------
/// Coverage data of a set of source files, as found in a tracefile
struct Tracefile {
   /// The test name, empty if none
   std::string testName;
   /// Path -> coverage
   std::map<std::string, SourceFile> files;

   /// Find or create the entry for a path
   SourceFile& getFile(const std::string& path);
   /// Find the entry for a path
   const SourceFile* findFile(const std::string& path) const;

   bool operator==(const Tracefile&) const = default;
};
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
