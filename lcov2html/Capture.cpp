#include "lcov2html/Capture.hpp"
#include <llvm/ADT/SmallVector.h>
#include <llvm/Config/llvm-config.h>
#include <llvm/ProfileData/Coverage/CoverageMapping.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/VirtualFileSystem.h>
#include <algorithm>
#include <map>
#include <optional>
#include <regex>
//---------------------------------------------------------------------------
// lcov tracefile to html converter
// (c) 2017 Thomas Neumann
// SPDX-License-Identifier: GPL-2.0-or-later
//---------------------------------------------------------------------------
using namespace std;
using llvm::StringRef;
//---------------------------------------------------------------------------
namespace lcov2html {
//---------------------------------------------------------------------------
static llvm::Expected<unique_ptr<llvm::coverage::CoverageMapping>> loadCoverage(StringRef objectFile, StringRef profileFile) {
   StringRef objectFiles[1] = {objectFile};
#if LLVM_VERSION_MAJOR >= 17
   auto fs = llvm::vfs::getRealFileSystem();
   auto res = llvm::coverage::CoverageMapping::load(objectFiles, profileFile, *fs);
#else
   auto res = llvm::coverage::CoverageMapping::load(objectFiles, profileFile);
#endif
   if (!res)
      return llvm::createStringError(std::errc::invalid_argument, "unable to load profile %s for %s: %s", profileFile.str().c_str(), objectFile.str().c_str(), llvm::toString(res.takeError()).c_str());
   return move(*res);
}
//---------------------------------------------------------------------------
bool isTrivialCode(StringRef code)
// Check for trivial code
{
   static const auto trivialRegex = [] {
      return regex(
         // Completely empty
         R"(^\s*$)"
         "|"
         // Noop ;
         R"(^\s*;\s*$)"
         "|"
         // Brackets
         R"(^\s*[{}]*\s*;?\s*$)");
   }();
   return regex_match(code.begin(), code.end(), trivialRegex);
}
//---------------------------------------------------------------------------
vector<bool> findExcludedLines(llvm::ArrayRef<StringRef> lines, llvm::ArrayRef<string> extraIgnore)
// Interpret the exclusion markers
{
   vector<bool> excluded(lines.size() + 1, false);
   bool ignoreBlock = false;
   for (unsigned index = 0; index < lines.size(); ++index) {
      StringRef s = lines[index];
      bool ignoreLine = false;
      if (ignoreBlock) {
         ignoreLine = true;
         if (s.contains("LCOV_EXCL_STOP"))
            ignoreBlock = false;
      } else if (s.contains("LCOV_EXCL_START")) {
         ignoreLine = true;
         ignoreBlock = true;
      } else if (s.contains("LCOV_EXCL_LINE")) {
         ignoreLine = true;
      } else if (any_of(extraIgnore.begin(), extraIgnore.end(), [&](const string& extra) { return (!extra.empty()) && s.contains(extra); })) {
         ignoreLine = true;
      }
      excluded[index + 1] = ignoreLine;
   }
   return excluded;
}
//---------------------------------------------------------------------------
/// The source text of a captured file
struct SourceText {
   unique_ptr<llvm::MemoryBuffer> buffer;
   vector<StringRef> lines;
   vector<bool> excluded;

   /// Is a line dropped from the coverage data?
   bool isExcluded(unsigned line) const { return (line < excluded.size()) && excluded[line]; }
   /// Is a line without executable code?
   bool isTrivial(unsigned line) const { return (line >= 1) && (line <= lines.size()) && isTrivialCode(lines[line - 1]); }
};
//---------------------------------------------------------------------------
static optional<SourceText> readSource(StringRef file, const CaptureOptions& options, Diagnostics& diag)
// Read a source file and find its excluded lines
{
   auto buffer = llvm::MemoryBuffer::getFile(file);
   if (!buffer) {
      diag.report(DiagKind::MissingSource, file, 0, "unable to read source (" + buffer.getError().message() + "), keeping all lines");
      return nullopt;
   }
   SourceText result;
   result.buffer = move(*buffer);
   StringRef text = result.buffer->getBuffer();
   if (text.endswith("\n"))
      text = text.drop_back();
   if (!result.buffer->getBuffer().empty()) {
      llvm::SmallVector<StringRef, 0> parts;
      text.split(parts, '\n');
      for (auto l : parts)
         result.lines.push_back(l.rtrim("\r"));
   }
   result.excluded = findExcludedLines(result.lines, options.extraIgnore);
   return result;
}
//---------------------------------------------------------------------------
static void captureFile(llvm::coverage::CoverageMapping& coverage, StringRef fileName, const CaptureOptions& options, Diagnostics& diag, SourceFile& file)
// Translate the coverage of one file
{
   auto source = readSource(fileName, options, diag);
   auto keep = [&](unsigned line) { return (!source) || (!source->isExcluded(line)); };

   // Lines
   auto data = coverage.getCoverageForFile(fileName);
   llvm::coverage::LineCoverageIterator iter{data, 1}, end = iter.getEnd();
   for (; iter != end; ++iter) {
      auto& stats = *iter;
      unsigned line = stats.getLine();
      if ((!stats.isMapped()) || (!keep(line))) continue;
      if (source && source->isTrivial(line)) continue;
      string checksum;
      if (options.checksum && source && (line <= source->lines.size()))
         checksum = computeLineChecksum(source->lines[line - 1]);
      file.addLine(line, stats.getExecutionCount(), move(checksum));
   }

   // Functions, a template can have several instantiations with the same name
   for (auto& f : coverage.getCoveredFunctions(fileName)) {
      if (f.CountedRegions.empty()) continue;
      unsigned line = f.CountedRegions.front().LineStart;
      if (!keep(line)) continue;
      file.addFunction(f.Name, line);
      file.addFunctionCalls(f.Name, f.ExecutionCount);
   }

   // Branches, every branch region has a true and a false side
   map<unsigned, unsigned> branchesPerLine;
   for (auto& b : data.getBranches()) {
      unsigned line = b.LineStart;
      if (!keep(line)) continue;
      unsigned index = branchesPerLine[line]++;
      bool reached = b.ExecutionCount || b.FalseExecutionCount;
      file.addBranch(line, 0, 2 * index, reached ? optional<uint64_t>(b.ExecutionCount) : nullopt);
      file.addBranch(line, 0, 2 * index + 1, reached ? optional<uint64_t>(b.FalseExecutionCount) : nullopt);
   }
}
//---------------------------------------------------------------------------
llvm::Expected<Tracefile> captureLlvmCoverage(StringRef objectFile, StringRef profileFile, const CaptureOptions& options, Diagnostics& diag)
// Build a tracefile from LLVM source based coverage
{
   auto coverage = loadCoverage(objectFile, profileFile);
   if (!coverage)
      return coverage.takeError();

   Tracefile result;
   for (auto& f : (*coverage)->getUniqueSourceFiles())
      captureFile(**coverage, f, options, diag, result.getFile(f.str()));
   return result;
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
