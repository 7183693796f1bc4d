#include "lcov2html/TracefileWriter.hpp"
#include "lcov2html/OutputFile.hpp"
#include <algorithm>
#include <tuple>
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
static void writeSection(llvm::raw_ostream& out, const string& testName, const string& path, const SourceFile& file)
// Write one section
{
   out << "TN:" << testName << "\n";
   out << "SF:" << path << "\n";

   // Functions, ordered by start line
   vector<const FunctionRecord*> functions;
   for (auto& f : file.functions)
      functions.push_back(&f.second);
   stable_sort(functions.begin(), functions.end(), [](const FunctionRecord* a, const FunctionRecord* b) { return tie(a->line, a->name) < tie(b->line, b->name); });
   unsigned functionsHit = 0;
   for (auto f : functions)
      if (f->line)
         out << "FN:" << f->line << "," << f->name << "\n";
   for (auto f : functions) {
      out << "FNDA:" << f->calls << "," << f->name << "\n";
      if (f->calls) ++functionsHit;
   }
   out << "FNF:" << functions.size() << "\n";
   out << "FNH:" << functionsHit << "\n";

   // Branches
   if (!file.branches.empty()) {
      unsigned branchesHit = 0;
      for (auto& b : file.branches) {
         auto& r = b.second;
         out << "BRDA:" << r.line << "," << r.block << "," << r.branch << ",";
         if (r.taken)
            out << *r.taken;
         else
            out << "-";
         out << "\n";
         if (r.isHit()) ++branchesHit;
      }
      out << "BRF:" << file.branches.size() << "\n";
      out << "BRH:" << branchesHit << "\n";
   }

   // Lines
   unsigned linesHit = 0;
   for (auto& l : file.lines) {
      out << "DA:" << l.first << "," << l.second.hits;
      if (!l.second.checksum.empty())
         out << "," << l.second.checksum;
      out << "\n";
      if (l.second.hits) ++linesHit;
   }
   out << "LF:" << file.lines.size() << "\n";
   out << "LH:" << linesHit << "\n";
   out << "end_of_record\n";
}
//---------------------------------------------------------------------------
void writeTracefile(llvm::raw_ostream& out, const Tracefile& tracefile) {
   for (auto& f : tracefile.files)
      writeSection(out, tracefile.testName, f.first, f.second);
}
//---------------------------------------------------------------------------
string serializeTracefile(const Tracefile& tracefile) {
   string result;
   llvm::raw_string_ostream out(result);
   writeTracefile(out, tracefile);
   out.flush();
   return result;
}
//---------------------------------------------------------------------------
llvm::Error saveTracefile(llvm::StringRef fileName, const Tracefile& tracefile) {
   return writeFileAtomic(fileName, serializeTracefile(tracefile));
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
