#ifndef LCOV2HTML_SUMMARY_HPP
#define LCOV2HTML_SUMMARY_HPP
#include "lcov2html/Config.hpp"
#include "lcov2html/Tracefile.hpp"
#include <llvm/ADT/StringRef.h>
#include <cstdint>
#include <string>
#include <vector>
//---------------------------------------------------------------------------
// lcov tracefile to html converter
// (c) 2017 Thomas Neumann
// SPDX-License-Identifier: GPL-2.0-or-later
//---------------------------------------------------------------------------
namespace lcov2html {
//---------------------------------------------------------------------------
/// Hit and total number of one kind of coverage item
struct Counts {
   uint64_t hit = 0, total = 0;

   /// Add the counts of a child
   Counts& operator+=(const Counts& other) {
      hit += other.hit;
      total += other.total;
      return *this;
   }
   bool operator==(const Counts&) const = default;

   /// The rate in tenths of a percent. 0 if there are no items, never 0 if something was hit,
   /// and never 1000 if something was missed
   unsigned getPerMille() const;
   /// The rate as text with one decimal, e.g. "70.0"
   std::string formatRate() const;
};
//---------------------------------------------------------------------------
/// Coverage summary of a file, directory, or project
struct CoverageSummary {
   Counts lines, functions, branches;

   CoverageSummary& operator+=(const CoverageSummary& other) {
      lines += other.lines;
      functions += other.functions;
      branches += other.branches;
      return *this;
   }
   bool operator==(const CoverageSummary&) const = default;
};
//---------------------------------------------------------------------------
/// The coverage classes
enum class Classification { Low, Medium, High };
//---------------------------------------------------------------------------
/// Classify a rate using the configured thresholds
Classification classify(const Counts& counts, const ReportConfig& config);
/// Summarize a single file
CoverageSummary summarizeFile(const SourceFile& file);
//---------------------------------------------------------------------------
/// A node of the summary tree
struct SummaryNode {
   enum class Kind { Project, Directory, File };
   Kind kind;
   /// The display name (display path for files and directories)
   std::string name;
   /// The summary, for directories and the project the sum of the children
   CoverageSummary summary;
   /// Child indices into the tree
   std::vector<unsigned> children;
   /// The coverage data of file nodes
   const SourceFile* file = nullptr;
};
//---------------------------------------------------------------------------
/// The project -> directory -> file summary hierarchy. Nodes live in an arena, the project is node 0
class SummaryTree {
   private:
   /// All nodes
   std::vector<SummaryNode> nodes;
   /// The source root used for display paths
   std::string sourceRoot;

   /// Compute the aggregates of a node and its descendants
   void aggregate(unsigned node);

   public:
   /// Build the tree. The tracefile must outlive the tree
   SummaryTree(const Tracefile& tracefile, llvm::StringRef sourceRoot);

   /// The project node
   const SummaryNode& getRoot() const { return nodes.front(); }
   /// Access a node
   const SummaryNode& getNode(unsigned index) const { return nodes[index]; }
   /// The number of nodes
   unsigned size() const { return nodes.size(); }
   /// The source root
   const std::string& getSourceRoot() const { return sourceRoot; }
};
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
