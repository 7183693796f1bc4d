#include "lcov2html/Summary.hpp"
#include "lcov2html/Paths.hpp"
#include <map>
#include <utility>
//---------------------------------------------------------------------------
// lcov tracefile to html converter
// (c) 2017 Thomas Neumann
// SPDX-License-Identifier: GPL-2.0-or-later
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace lcov2html {
//---------------------------------------------------------------------------
unsigned Counts::getPerMille() const
// Compute percentage (x10)
{
   if ((!hit) || (!total))
      return 0;
   unsigned perc = hit * 1000 / total;
   if (!perc) perc = 1;
   if ((perc >= 1000) && (hit < total)) perc = 999;
   return perc;
}
//---------------------------------------------------------------------------
string Counts::formatRate() const {
   unsigned perc = getPerMille();
   return to_string(perc / 10) + "." + to_string(perc % 10);
}
//---------------------------------------------------------------------------
Classification classify(const Counts& counts, const ReportConfig& config)
// Classify a rate using the configured thresholds
{
   unsigned perc = counts.getPerMille();
   if (perc >= config.highThreshold * 10)
      return Classification::High;
   if (perc >= config.mediumThreshold * 10)
      return Classification::Medium;
   return Classification::Low;
}
//---------------------------------------------------------------------------
CoverageSummary summarizeFile(const SourceFile& file)
// Summarize a single file
{
   CoverageSummary s;
   for (auto& l : file.lines) {
      s.lines.total++;
      if (l.second.hits) s.lines.hit++;
   }
   for (auto& f : file.functions) {
      s.functions.total++;
      if (f.second.calls) s.functions.hit++;
   }
   for (auto& b : file.branches) {
      s.branches.total++;
      if (b.second.isHit()) s.branches.hit++;
   }
   return s;
}
//---------------------------------------------------------------------------
SummaryTree::SummaryTree(const Tracefile& tracefile, llvm::StringRef sourceRoot)
   : sourceRoot(sourceRoot.str())
// Build the tree
{
   nodes.push_back(SummaryNode{SummaryNode::Kind::Project, "", {}, {}, nullptr});

   // Group the files by directory
   map<string, map<string, const SourceFile*>> directories;
   for (auto& f : tracefile.files) {
      auto displayPath = getDisplayPath(f.first, sourceRoot);
      auto& dir = directories[getDirectoryName(displayPath)];
      // Distinct recorded paths can share a display path, every file keeps its own node
      if (dir.count(displayPath)) {
         displayPath = f.first;
         for (unsigned suffix = 2; dir.count(displayPath); ++suffix)
            displayPath = f.first + " (" + to_string(suffix) + ")";
      }
      dir[displayPath] = &f.second;
   }

   // Create the nodes, file summaries come directly from the records
   for (auto& d : directories) {
      unsigned dirIndex = nodes.size();
      nodes.push_back(SummaryNode{SummaryNode::Kind::Directory, d.first, {}, {}, nullptr});
      nodes.front().children.push_back(dirIndex);
      for (auto& f : d.second) {
         unsigned fileIndex = nodes.size();
         nodes.push_back(SummaryNode{SummaryNode::Kind::File, f.first, summarizeFile(*f.second), {}, f.second});
         nodes[dirIndex].children.push_back(fileIndex);
      }
   }

   // All file summaries are complete, now compute the aggregates
   aggregate(0);
}
//---------------------------------------------------------------------------
void SummaryTree::aggregate(unsigned node)
// Post-order pass: a parent is always the sum of its children
{
   if (nodes[node].kind == SummaryNode::Kind::File)
      return;
   CoverageSummary sum;
   for (unsigned child : nodes[node].children) {
      aggregate(child);
      sum += nodes[child].summary;
   }
   nodes[node].summary = sum;
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
