#ifndef LCOV2HTML_CONFIG_HPP
#define LCOV2HTML_CONFIG_HPP
#include <llvm/Support/Error.h>
#include <string>
//---------------------------------------------------------------------------
// lcov tracefile to html converter
// (c) 2017 Thomas Neumann
// SPDX-License-Identifier: GPL-2.0-or-later
//---------------------------------------------------------------------------
namespace lcov2html {
//---------------------------------------------------------------------------
/// Settings that influence summaries and rendering. Passed by value, never global
struct ReportConfig {
   /// Rates at or above this percentage are classified high
   unsigned highThreshold = 90;
   /// Rates at or above this percentage (and below high) are classified medium
   unsigned mediumThreshold = 75;
   /// Show branch columns and branch markers
   bool showBranches = true;
   /// Show function columns and function tables
   bool showFunctions = true;
   /// Abort the merge of a file when two inputs disagree about a line checksum
   bool strictChecksum = true;

   /// Check the thresholds
   llvm::Error validate() const;
};
//---------------------------------------------------------------------------
/// Driver level settings of the report
struct ReportOptions {
   /// The output directory
   std::string targetDir;
   /// Relative source paths are resolved against this directory
   std::string sourceRoot;
   /// The report title
   std::string title = "lcov2html";
   /// Text of the "generated at" footer, omitted when empty
   std::string timestamp;
   /// Number of worker threads, 0 means hardware concurrency
   unsigned jobs = 0;
   /// Also write index pages sorted by name, function rate and branch rate
   bool sortViews = true;
   /// Explain the colors and markers in the page header
   bool legend = false;
};
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
