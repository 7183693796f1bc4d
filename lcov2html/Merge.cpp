#include "lcov2html/Merge.hpp"
#include "lcov2html/Paths.hpp"
#include <llvm/ADT/Twine.h>
#include <llvm/Support/GlobPattern.h>
#include <algorithm>
#include <string>
#include <vector>
//---------------------------------------------------------------------------
// lcov tracefile to html converter
// (c) 2017 Thomas Neumann
// SPDX-License-Identifier: GPL-2.0-or-later
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace lcov2html {
//---------------------------------------------------------------------------
bool mergeSourceFile(SourceFile& target, const SourceFile& source, bool strictChecksum, Diagnostics& diag)
// Add the counts of source to target
{
   if (target.path.empty())
      target.path = source.path;

   // Only two present checksums can disagree
   unsigned mismatches = 0, firstMismatch = 0;
   for (auto& [line, r] : source.lines) {
      if (r.checksum.empty()) continue;
      auto iter = target.lines.find(line);
      if ((iter != target.lines.end()) && (!iter->second.checksum.empty()) && (iter->second.checksum != r.checksum))
         if (!mismatches++) firstMismatch = line;
   }
   if (mismatches) {
      diag.report(DiagKind::ChecksumMismatch, source.path, firstMismatch, (llvm::Twine(mismatches) + (mismatches == 1 ? " line differs" : " lines differ") + (strictChecksum ? " between merge inputs, file not merged" : " between merge inputs, counts summed anyway")).str());
      if (strictChecksum)
         return false;
   }

   for (auto& [line, r] : source.lines) {
      auto& t = target.lines[line];
      t.hits = addCounts(t.hits, r.hits);
      if (t.checksum.empty() || ((!r.checksum.empty()) && (r.checksum < t.checksum)))
         t.checksum = r.checksum;
   }
   for (auto& [name, f] : source.functions) {
      auto [iter, inserted] = target.functions.try_emplace(name, f);
      if (inserted) continue;
      auto& t = iter->second;
      if (t.line && f.line && (t.line != f.line))
         diag.report(DiagKind::ParseWarning, source.path, max(t.line, f.line), (llvm::Twine("function ") + name + " starts at line " + llvm::Twine(t.line) + " and at line " + llvm::Twine(f.line) + ", keeping the smaller one").str());
      if ((!t.line) || (f.line && (f.line < t.line)))
         t.line = f.line;
      t.calls = addCounts(t.calls, f.calls);
   }
   for (auto& b : source.branches)
      target.addBranch(b.second.line, b.second.block, b.second.branch, b.second.taken);
   return true;
}
//---------------------------------------------------------------------------
void mergeInto(Tracefile& target, const Tracefile& source, bool strictChecksum, Diagnostics& diag)
// Merge all files of source into target
{
   if (target.testName.empty())
      target.testName = source.testName;
   else if ((!source.testName.empty()) && (source.testName != target.testName))
      target.testName.clear();

   for (auto& [path, file] : source.files) {
      auto iter = target.files.find(path);
      if (iter == target.files.end()) {
         target.files.emplace(path, file);
      } else {
         mergeSourceFile(iter->second, file, strictChecksum, diag);
      }
   }
}
//---------------------------------------------------------------------------
Tracefile merge(const Tracefile& a, const Tracefile& b, bool strictChecksum, Diagnostics& diag) {
   Tracefile result = a;
   mergeInto(result, b, strictChecksum, diag);
   return result;
}
//---------------------------------------------------------------------------
Tracefile mergeAll(vector<Tracefile> inputs, bool strictChecksum, Diagnostics& diag) {
   Tracefile result;
   if (inputs.empty()) return result;
   result = move(inputs.front());
   for (unsigned index = 1; index < inputs.size(); ++index)
      mergeInto(result, inputs[index], strictChecksum, diag);
   return result;
}
//---------------------------------------------------------------------------
static bool isBelow(llvm::StringRef path, llvm::StringRef dir)
// Is the path inside the directory?
{
   dir = dir.rtrim('/');
   if (dir.empty()) return false;
   return path.startswith(dir) && ((path.size() == dir.size()) || (path[dir.size()] == '/'));
}
//---------------------------------------------------------------------------
unsigned filterFiles(Tracefile& tracefile, llvm::ArrayRef<string> excludedDirs, llvm::StringRef sourceRoot)
// Drop all files below one of the excluded directories
{
   unsigned removed = 0;
   for (auto iter = tracefile.files.begin(); iter != tracefile.files.end();) {
      auto displayPath = getDisplayPath(iter->first, sourceRoot);
      bool skip = any_of(excludedDirs.begin(), excludedDirs.end(), [&](const string& dir) {
         return isBelow(iter->first, dir) || isBelow(displayPath, dir);
      });
      if (skip) {
         iter = tracefile.files.erase(iter);
         ++removed;
      } else {
         ++iter;
      }
   }
   return removed;
}
//---------------------------------------------------------------------------
static llvm::Expected<unsigned> dropFiles(Tracefile& tracefile, llvm::ArrayRef<string> patterns, bool keepMatches)
// Drop all files that match (or do not match) one of the patterns. Only '*' and '?' are wildcards
{
   // The compiled patterns refer to their text
   vector<string> texts;
   for (auto& p : patterns) {
      string text;
      for (char c : p) {
         if ((c == '[') || (c == ']') || (c == '\\')) text += '\\';
         text += c;
      }
      texts.push_back(move(text));
   }
   vector<llvm::GlobPattern> globs;
   for (unsigned index = 0; index < texts.size(); ++index) {
      auto glob = llvm::GlobPattern::create(texts[index]);
      if (!glob)
         return llvm::createStringError(std::errc::invalid_argument, "invalid pattern '%s': %s", patterns[index].c_str(), llvm::toString(glob.takeError()).c_str());
      globs.push_back(move(*glob));
   }

   unsigned removed = 0;
   for (auto iter = tracefile.files.begin(); iter != tracefile.files.end();) {
      bool matches = any_of(globs.begin(), globs.end(), [&](const llvm::GlobPattern& g) { return g.match(iter->first); });
      if (matches != keepMatches) {
         iter = tracefile.files.erase(iter);
         ++removed;
      } else {
         ++iter;
      }
   }
   return removed;
}
//---------------------------------------------------------------------------
llvm::Expected<unsigned> extractFiles(Tracefile& tracefile, llvm::ArrayRef<string> patterns) {
   return dropFiles(tracefile, patterns, true);
}
//---------------------------------------------------------------------------
llvm::Expected<unsigned> removeFiles(Tracefile& tracefile, llvm::ArrayRef<string> patterns) {
   return dropFiles(tracefile, patterns, false);
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
