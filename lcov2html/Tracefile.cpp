#include "lcov2html/Tracefile.hpp"
#include <llvm/Support/Base64.h>
#include <llvm/Support/MD5.h>
//---------------------------------------------------------------------------
// lcov tracefile to html converter
// (c) 2017 Thomas Neumann
// SPDX-License-Identifier: GPL-2.0-or-later
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace lcov2html {
//---------------------------------------------------------------------------
string computeLineChecksum(llvm::StringRef line)
// The checksum of a source line
{
   llvm::MD5 md5;
   md5.update(line);
   llvm::MD5::MD5Result digest;
   md5.final(digest);
   string bytes;
   for (unsigned index = 0; index < 16; ++index)
      bytes += static_cast<char>(digest[index]);
   auto result = llvm::encodeBase64(bytes);
   while ((!result.empty()) && (result.back() == '='))
      result.pop_back();
   return result;
}
//---------------------------------------------------------------------------
void SourceFile::addLine(unsigned line, uint64_t hits, string checksum)
// Add to the count of a line. An existing checksum is kept, conflicts are the caller's business
{
   auto& r = lines[line];
   r.hits = addCounts(r.hits, hits);
   if (r.checksum.empty())
      r.checksum = move(checksum);
}
//---------------------------------------------------------------------------
void SourceFile::addFunction(const string& name, unsigned line) {
   auto& f = functions[name];
   f.name = name;
   if ((!f.line) || (line && (line < f.line)))
      f.line = line;
}
//---------------------------------------------------------------------------
void SourceFile::addFunctionCalls(const string& name, uint64_t calls) {
   auto& f = functions[name];
   f.name = name;
   f.calls = addCounts(f.calls, calls);
}
//---------------------------------------------------------------------------
void SourceFile::addBranch(unsigned line, unsigned block, unsigned branch, optional<uint64_t> taken)
// Add to the taken count of a branch. "Not reached" is the neutral element
{
   auto [iter, inserted] = branches.try_emplace(BranchKey{line, block, branch}, BranchRecord{line, block, branch, taken});
   if (inserted || !taken) return;
   auto& r = iter->second;
   r.taken = r.taken ? addCounts(*r.taken, *taken) : *taken;
}
//---------------------------------------------------------------------------
SourceFile& Tracefile::getFile(const string& path) {
   auto& f = files[path];
   f.path = path;
   return f;
}
//---------------------------------------------------------------------------
const SourceFile* Tracefile::findFile(const string& path) const {
   auto iter = files.find(path);
   return (iter != files.end()) ? &iter->second : nullptr;
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
