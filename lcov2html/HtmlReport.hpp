#ifndef LCOV2HTML_HTMLREPORT_HPP
#define LCOV2HTML_HTMLREPORT_HPP
#include "lcov2html/Config.hpp"
#include "lcov2html/Diagnostics.hpp"
#include "lcov2html/Summary.hpp"
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
//---------------------------------------------------------------------------
// lcov tracefile to html converter
// (c) 2017 Thomas Neumann
// SPDX-License-Identifier: GPL-2.0-or-later
//---------------------------------------------------------------------------
namespace lcov2html {
//---------------------------------------------------------------------------
/// Write a string, escaping HTML as needed
void escapeHtml(std::ostream& out, llvm::StringRef s);
/// Percent-encode a relative page path for use in a link
std::string encodeLink(llvm::StringRef path);
//---------------------------------------------------------------------------
/// The row order of an index page
enum class SortOrder { Line, Name, Functions, Branches };
/// The file name of the index page with the given row order
const char* getIndexPageName(SortOrder order);
//---------------------------------------------------------------------------
/// Renders a summary tree into a set of static HTML pages
class HtmlReport {
   private:
   /// The summaries
   const SummaryTree& tree;
   /// The configuration
   const ReportConfig config;
   /// The report options
   const ReportOptions options;
   /// The diagnostics sink
   Diagnostics& diag;
   /// The page of every node, relative to the target directory
   std::vector<std::string> pagePaths;

   /// Choose the output location of every page
   void assignPagePaths();
   /// Write the page header. Index pages get a search field and the rating legend
   void writeHeader(std::ostream& out, llvm::StringRef base, llvm::StringRef view, const CoverageSummary& summary, bool isIndex) const;
   /// Write the legend row of the header
   void writeLegend(std::ostream& out, bool isIndex) const;
   /// Write the page footer
   void writeFooter(std::ostream& out, bool hasSearch) const;
   /// Write a table of child nodes in the given order, linked relative to the page of node from
   void writeNodeTable(std::ostream& out, llvm::StringRef heading, const std::vector<unsigned>& children, unsigned from, SortOrder order) const;
   /// Write the function table of a file
   void writeFunctionTable(std::ostream& out, const SourceFile& file) const;
   /// Write the annotated lines of a file. source is empty if the file could not be read
   void writeSource(std::ostream& out, const SourceFile& file, const std::optional<std::vector<llvm::StringRef>>& source) const;

   public:
   /// Constructor
   HtmlReport(const SummaryTree& tree, ReportConfig config, ReportOptions options, Diagnostics& diag);

   /// The page of a node, relative to the target directory
   const std::string& getPagePath(unsigned node) const { return pagePaths[node]; }
   /// The index page of the project or a directory node in the given order
   std::string getIndexPath(unsigned node, SortOrder order) const;
   /// The orders for which index pages are written
   std::vector<SortOrder> getSortOrders() const;

   /// Render the project index
   void renderProjectIndex(std::ostream& out, SortOrder order = SortOrder::Line) const;
   /// Render the index of a directory node
   void renderDirectoryIndex(unsigned node, std::ostream& out, SortOrder order = SortOrder::Line) const;
   /// Render the annotated source of a file node, reading the source from disk
   void renderSourcePage(unsigned node, std::ostream& out) const;
   /// Render the annotated source of a file node from the given source text, nullopt if unavailable
   void renderSourcePage(unsigned node, std::optional<llvm::StringRef> sourceText, std::ostream& out) const;

   /// Write the stylesheet and all pages into the target directory
   llvm::Error write() const;
};
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
