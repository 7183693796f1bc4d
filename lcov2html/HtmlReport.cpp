#include "lcov2html/HtmlReport.hpp"
#include "lcov2html/OutputFile.hpp"
#include "lcov2html/Paths.hpp"
#include <llvm/ADT/SmallString.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/ThreadPool.h>
#include <llvm/Support/Threading.h>
#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <set>
#include <sstream>
#include <string_view>
#include <tuple>
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
static const char stylesheetName[] = "lcov2html.css";
//---------------------------------------------------------------------------
void escapeHtml(ostream& out, StringRef s)
// Write a string, escaping HTML as needed
{
   const char *current = s.data(), *end = s.data();
   for (char c : s) {
      StringRef escaped;
      switch (c) {
         case '<': escaped = "&lt;"; break;
         case '>': escaped = "&gt;"; break;
         case '&': escaped = "&amp;"; break;
         case '\"': escaped = "&quot;"; break;
         case '\n':
         case '\r': escaped = " "; break;
         default: ++end; continue;
      }
      out << string_view(current, end - current) << string_view(escaped);
      current = end = end + 1;
   }
   out << string_view(current, end - current);
}
//---------------------------------------------------------------------------
string encodeLink(StringRef path)
// Percent-encode the characters that have a meaning in URLs
{
   static const char hex[] = "0123456789ABCDEF";
   string result;
   for (char c : path) {
      auto u = static_cast<unsigned char>(c);
      if ((u <= 0x20) || (u >= 0x7F) || (c == '%') || (c == '#') || (c == '?') || (c == '"') || (c == '<') || (c == '>') || (c == '\\')) {
         result += '%';
         result += hex[u >> 4];
         result += hex[u & 15];
      } else {
         result += c;
      }
   }
   return result;
}
//---------------------------------------------------------------------------
const char* getIndexPageName(SortOrder order) {
   switch (order) {
      case SortOrder::Line: return "index.html";
      case SortOrder::Name: return "index-sort-n.html";
      case SortOrder::Functions: return "index-sort-f.html";
      case SortOrder::Branches: return "index-sort-b.html";
   }
   return "index.html";
}
//---------------------------------------------------------------------------
static void highlightFilename(ostream& out, StringRef s) {
   auto pos = s.find_last_of('/') + 1;
   escapeHtml(out, s.substr(0, pos));
   out << "<span class=\"filename\">";
   escapeHtml(out, s.substr(pos));
   out << "</span>";
}
//---------------------------------------------------------------------------
static const char* getClassSuffix(Classification c) {
   switch (c) {
      case Classification::High: return "Hi";
      case Classification::Medium: return "Med";
      case Classification::Low: return "Lo";
   }
   return "Lo";
}
//---------------------------------------------------------------------------
static const char* getBarColor(Classification c) {
   switch (c) {
      case Classification::High: return "var(--highcov)";
      case Classification::Medium: return "var(--medcov)";
      case Classification::Low: return "var(--lowcov)";
   }
   return "var(--lowcov)";
}
//---------------------------------------------------------------------------
static string formatCount(uint64_t count)
// Abbreviate large execution counts
{
   stringstream ss;
   if (count < 1000) {
      ss << count;
   } else if (count < 1000000) {
      ss << (count / 1000) << "K";
   } else if (count < 1000000000) {
      ss << (count / 1000000) << "M";
   } else {
      ss << (count / 1000000000) << "G";
   }
   return ss.str();
}
//---------------------------------------------------------------------------
static void writePadded(ostream& out, const string& s, unsigned width)
// Right-align a string
{
   for (unsigned index = s.length(); index < width; ++index)
      out << " ";
   out << s;
}
//---------------------------------------------------------------------------
static string joinPath(StringRef a, StringRef b) {
   llvm::SmallString<256> result(a);
   llvm::sys::path::append(result, b);
   return string(result.str());
}
//---------------------------------------------------------------------------
static StringRef getPageDir(StringRef pagePath)
// The directory of a page, relative to the target directory
{
   auto pos = pagePath.rfind('/');
   return (pos == StringRef::npos) ? StringRef() : pagePath.substr(0, pos);
}
//---------------------------------------------------------------------------
static void constructBar(ostream& out, const Counts& counts, Classification c)
// Construct a percentage bar
{
   unsigned width = (counts.getPerMille() + 5) / 10;
   const char* color = getBarColor(c);

   char buffer[300];
   if (width < 1) {
      snprintf(buffer, sizeof(buffer), "<div style=\"background-color:white;width:%dpx;height:10px\"></div>", 100);
   } else if (width >= 100) {
      snprintf(buffer, sizeof(buffer), "<div style=\"background-color:%s;width:%dpx;height:10px\"></div>", color, 100);
   } else {
      snprintf(buffer, sizeof(buffer), "<div style=\"display:inline-block;background-color:%s;width:%upx;height:10px\"></div><div style=\"display:inline-block;background-color:white;width:%upx;height:10px\"></div>", color, width, 100 - width);
   }
   out << buffer;
}
//---------------------------------------------------------------------------
HtmlReport::HtmlReport(const SummaryTree& tree, ReportConfig config, ReportOptions options, Diagnostics& diag)
   : tree(tree), config(config), options(move(options)), diag(diag) {
   assignPagePaths();
}
//---------------------------------------------------------------------------
void HtmlReport::assignPagePaths()
// Every directory gets a subdirectory with an index, every file a page within its directory
{
   pagePaths.assign(tree.size(), string());
   pagePaths[0] = "index.html";
   set<string> usedDirs;
   for (unsigned dir : tree.getRoot().children) {
      string dirOut = getOutputPath(tree.getNode(dir).name);
      while (usedDirs.count(dirOut))
         dirOut += "_";
      usedDirs.insert(dirOut);
      pagePaths[dir] = dirOut + "/index.html";

      set<string> usedPages;
      for (unsigned file : tree.getNode(dir).children) {
         string base = llvm::sys::path::filename(tree.getNode(file).name).str();
         string page = base + ".gcov.html";
         for (unsigned suffix = 2; usedPages.count(page); ++suffix)
            page = base + "." + to_string(suffix) + ".gcov.html";
         usedPages.insert(page);
         pagePaths[file] = dirOut + "/" + page;
      }
   }
}
//---------------------------------------------------------------------------
string HtmlReport::getIndexPath(unsigned node, SortOrder order) const
// Index pages of all orders share the directory of the line ordered one
{
   StringRef dir = getPageDir(pagePaths[node]);
   return dir.empty() ? string(getIndexPageName(order)) : dir.str() + "/" + getIndexPageName(order);
}
//---------------------------------------------------------------------------
vector<SortOrder> HtmlReport::getSortOrders() const {
   vector<SortOrder> orders{SortOrder::Line};
   if (options.sortViews) {
      orders.push_back(SortOrder::Name);
      if (config.showFunctions) orders.push_back(SortOrder::Functions);
      if (config.showBranches) orders.push_back(SortOrder::Branches);
   }
   return orders;
}
//---------------------------------------------------------------------------
void HtmlReport::writeHeader(ostream& out, StringRef base, StringRef view, const CoverageSummary& summary, bool isIndex) const
// Write the HTML header. view is HTML text
{
   out << R"(<!DOCTYPE html>
<html>
<head>
   <title>)";
   escapeHtml(out, options.title);
   out << R"(</title>
   <link rel="stylesheet" type="text/css" href=")"
       << string_view(base) << stylesheetName << R"("/>
</head>
<body>
<table width="100%" border="0" cellspacing="0" cellpadding="0">
<tr><td class="title">Coverage Report</td></tr>
<tr><td class="ruler"></td></tr>
<tr>
<td width="100%">
   <table cellpadding="1" border="0" width="100%">
      <tr>
         <td class="headerItem" width="10%">Current&nbsp;view:</td>
         <td class="headerValue" width="45%">)"
       << string_view(view) << R"(</td>
         <td width="5%"></td>
         <td width="10%"></td>
         <td class="headerCovTableHead" width="10%">Hit</td>
         <td class="headerCovTableHead" width="10%">Total</td>
         <td class="headerCovTableHead" width="10%">Coverage</td>
      </tr>)"
       << endl;

   auto writeRow = [&](const char* label, const char* item, const Counts& counts) {
      out << R"(      <tr>
         <td class="headerItem">)"
          << label << R"(</td>
         <td class="headerValue">)";
      if (*label)
         escapeHtml(out, options.title);
      out << R"(</td>
         <td></td>
         <td class="headerItem">)"
          << item << R"(:</td>
         <td class="headerCovTableEntry">)"
          << counts.hit << R"(</td>
         <td class="headerCovTableEntry">)"
          << counts.total << "</td>" << endl;
      if (counts.total) {
         out << R"(         <td class="headerCovTableEntry)" << getClassSuffix(classify(counts, config)) << "\">" << counts.formatRate() << "&nbsp;%</td>" << endl;
      } else {
         out << R"(         <td class="headerCovTableEntry">-</td>)" << endl;
      }
      out << "      </tr>" << endl;
   };
   writeRow("Test:", "Lines", summary.lines);
   if (config.showFunctions)
      writeRow("", "Functions", summary.functions);
   if (config.showBranches)
      writeRow("", "Branches", summary.branches);
   if (options.legend)
      writeLegend(out, isIndex);
   if (isIndex)
      out << R"(      <tr><td class="headerItem">Search:</td><td colspan="6"><input type="text" id="search" value="" /></td></tr>)" << endl;

   out << R"(   </table>
</td>
</tr>
<tr><td class="ruler"></td></tr>
</table>)"
       << endl;
}
//---------------------------------------------------------------------------
void HtmlReport::writeLegend(ostream& out, bool isIndex) const
// Index pages explain the rating colors, source pages the line and branch markers
{
   out << R"(      <tr><td class="headerItem">Legend:</td><td class="headerValueLeg" colspan="6">)";
   if (isIndex) {
      out << "Rating: <span class=\"coverLegendLo\">low: &lt; " << config.mediumThreshold << " %</span> "
          << "<span class=\"coverLegendMed\">medium: &gt;= " << config.mediumThreshold << " %</span> "
          << "<span class=\"coverLegendHi\">high: &gt;= " << config.highThreshold << " %</span>";
   } else {
      out << "Lines: <span class=\"coverLegendCov\">hit</span> <span class=\"coverLegendNoCov\">not hit</span>";
      if (config.showBranches)
         out << " | Branches: <span class=\"coverLegendCov\">+</span> taken "
             << "<span class=\"coverLegendNoCov\">-</span> not taken "
             << "<span class=\"coverLegendNoCov\">#</span> not executed";
   }
   out << "</td></tr>" << endl;
}
//---------------------------------------------------------------------------
void HtmlReport::writeFooter(ostream& out, bool hasSearch) const
// Write the HTML footer. The timestamp is confined to its own line
{
   out << R"(<table width="100%" border="0" cellspacing="0" cellpadding="0">
<tr><td class="ruler"></td></tr>
<tr><td class="versionInfo">Generated by: lcov2html</td></tr>)"
       << endl;
   if (!options.timestamp.empty()) {
      out << R"(<tr><td class="versionInfo">Generated at: )";
      escapeHtml(out, options.timestamp);
      out << "</td></tr>" << endl;
   }
   out << R"(</table>
<br/>)"
       << (hasSearch ? R"(
<script>
   // Build lookup table with all entries by parsing html table
   const mainTable = document.getElementById("main");
   let files = {}
   for (let el of mainTable.getElementsByClassName("coverFile")) {
       const name = el.innerText.toLowerCase();
       files[name] = el.parentNode;
   }

   // Add search oninput to field
   const search = (needle) => {
       for (let key in files) {
           const found = needle.toLowerCase().split(" ").map(el => key.includes(el)).every(t => t);
           files[key].style.display = found ? "table-row" : "none";
       }
   };

   document.getElementById("search").addEventListener("input", (e) => {
       search(e.value || e.target.value);
   });

   // Hitting return opens the first in the list
   document.getElementById("search").addEventListener("keydown", (e) => {
      if(e.keyCode == 13) { // Enter
         mainTable.querySelector('tr:not([style*="display: none"]) a').click();
      }
   });

   // Focus on search field on load
   document.addEventListener('DOMContentLoaded', (e) => {
      document.getElementById("search").focus();
   });
</script>)" :
                       "")
       << R"(
</body>
</html>)"
       << endl;
}
//---------------------------------------------------------------------------
void HtmlReport::writeNodeTable(ostream& out, StringRef heading, const vector<unsigned>& children, unsigned from, SortOrder order) const
// Write a table with one row per child node
{
   auto getRate = [order](const SummaryNode& n) {
      switch (order) {
         case SortOrder::Functions: return n.summary.functions.getPerMille();
         case SortOrder::Branches: return n.summary.branches.getPerMille();
         default: return n.summary.lines.getPerMille();
      }
   };
   vector<unsigned> rows = children;
   stable_sort(rows.begin(), rows.end(), [&](unsigned a, unsigned b) {
      auto& na = tree.getNode(a);
      auto& nb = tree.getNode(b);
      if (order != SortOrder::Name) {
         unsigned perc1 = getRate(na), perc2 = getRate(nb);
         if (perc1 != perc2)
            return perc1 < perc2;
      }
      return na.name < nb.name;
   });

   // Column heads link to the other orders of this page
   auto orders = getSortOrders();
   auto writeHead = [&](StringRef colspan, StringRef text, SortOrder target) {
      out << "      <td class=\"tableHead\"" << string_view(colspan) << ">";
      if ((target != order) && (find(orders.begin(), orders.end(), target) != orders.end())) {
         out << "<a href=\"" << getIndexPageName(target) << "\">" << string_view(text) << "</a>";
      } else {
         out << string_view(text);
      }
      out << "</td>" << endl;
   };
   out << R"(<center>
<table id="main" width="80%" cellpadding="2" cellspacing="1" border="0">
   <tr>)"
       << endl;
   writeHead("", heading, SortOrder::Name);
   writeHead(" colspan=\"3\"", "Line Coverage", SortOrder::Line);
   if (config.showFunctions)
      writeHead(" colspan=\"2\"", "Functions", SortOrder::Functions);
   if (config.showBranches)
      writeHead(" colspan=\"2\"", "Branches", SortOrder::Branches);
   out << "   </tr>" << endl;

   StringRef fromDir = getPageDir(pagePaths[from]);
   auto writeCounts = [&](const Counts& counts, const char* what) {
      if (!counts.total) {
         out << R"(      <td class="coverPer coverNone">-</td>
      <td class="coverNone">-</td>)"
             << endl;
         return;
      }
      const char* qc = getClassSuffix(classify(counts, config));
      out << R"(      <td class="coverPer cover)" << qc << "\">" << counts.formatRate() << R"(&nbsp;%</td>
      <td class="cover)"
          << qc << "\">" << counts.hit << "&nbsp;/&nbsp;" << counts.total << "&nbsp;" << what << "</td>" << endl;
   };

   for (unsigned row : rows) {
      auto& node = tree.getNode(row);
      string target = (node.kind == SummaryNode::Kind::Directory) ? getIndexPath(row, order) : pagePaths[row];
      StringRef link = target;
      if ((!fromDir.empty()) && link.startswith(fromDir) && (link.size() > fromDir.size()) && (link[fromDir.size()] == '/'))
         link = link.substr(fromDir.size() + 1);
      out << R"(   <tr>
      <td class="coverFile"><a href=")";
      escapeHtml(out, encodeLink(link));
      out << "\">";
      highlightFilename(out, (node.kind == SummaryNode::Kind::File) ? llvm::sys::path::filename(node.name) : StringRef(node.name));
      out << R"(</a></td>
      <td class="coverBar" align="center">
         <table border="0" cellspacing="0" cellpadding="1"><tr><td class="coverBarOutline">)";
      constructBar(out, node.summary.lines, classify(node.summary.lines, config));
      out << R"(</td></tr></table>
      </td>)"
          << endl;
      writeCounts(node.summary.lines, "lines");
      if (config.showFunctions)
         writeCounts(node.summary.functions, "functions");
      if (config.showBranches)
         writeCounts(node.summary.branches, "branches");
      out << "   </tr>" << endl;
   }
   out << "</table>" << endl
       << "</center>" << endl
       << "<br/>" << endl;
}
//---------------------------------------------------------------------------
void HtmlReport::renderProjectIndex(ostream& out, SortOrder order) const
// The top level index lists all directories
{
   auto& root = tree.getRoot();
   writeHeader(out, "", "top level", root.summary, true);
   writeNodeTable(out, "Directory", root.children, 0, order);
   writeFooter(out, true);
}
//---------------------------------------------------------------------------
void HtmlReport::renderDirectoryIndex(unsigned node, ostream& out, SortOrder order) const
// A directory index lists its files
{
   auto& dir = tree.getNode(node);
   string base = getRelativeBase(getPageDir(pagePaths[node]));
   stringstream view;
   view << "<a href=\"" << base << getIndexPageName(order) << "\">top level</a> - ";
   escapeHtml(view, dir.name);
   writeHeader(out, base, view.str(), dir.summary, true);
   writeNodeTable(out, "File", dir.children, node, order);
   writeFooter(out, true);
}
//---------------------------------------------------------------------------
void HtmlReport::writeFunctionTable(ostream& out, const SourceFile& file) const
// List the functions of a file, ordered by start line
{
   vector<const FunctionRecord*> functions;
   for (auto& f : file.functions)
      functions.push_back(&f.second);
   stable_sort(functions.begin(), functions.end(), [](const FunctionRecord* a, const FunctionRecord* b) { return tie(a->line, a->name) < tie(b->line, b->name); });

   out << R"(<center>
<table width="60%" cellpadding="1" cellspacing="1" border="0">
   <tr>
      <td class="tableHead" width="80%">Function Name</td>
      <td class="tableHead" width="20%">Hit count</td>
   </tr>)"
       << endl;
   for (auto f : functions) {
      out << R"(   <tr>
      <td class="coverFn">)";
      if (f->line) out << "<a href=\"#" << f->line << "\">";
      escapeHtml(out, f->name);
      if (f->line) out << "</a>";
      out << R"(</td>
      <td class="coverFn)"
          << (f->calls ? "Hi" : "Lo") << "\">" << f->calls << "</td>" << endl
          << "   </tr>" << endl;
   }
   out << "</table>" << endl
       << "</center>" << endl
       << "<br/>" << endl;
}
//---------------------------------------------------------------------------
/// The branch markers of a single line
struct BranchCell {
   string html;
   unsigned width = 0;
};
//---------------------------------------------------------------------------
static BranchCell formatBranches(const SourceFile& file, unsigned line)
// Markers for all branches of a line, grouped by block
{
   BranchCell cell;
   auto iter = file.branches.lower_bound(BranchKey{line, 0, 0}), end = file.branches.end();
   while ((iter != end) && (iter->first.line == line)) {
      unsigned block = iter->first.block;
      cell.html += "[";
      cell.width++;
      for (; (iter != end) && (iter->first.line == line) && (iter->first.block == block); ++iter) {
         auto& b = iter->second;
         const char *klass, *text;
         string title = "Branch " + to_string(b.branch);
         if (!b.taken) {
            klass = "branchNoExec";
            text = " # ";
            title += " was not executed";
         } else if (!*b.taken) {
            klass = "branchNoCov";
            text = " - ";
            title += " was not taken";
         } else {
            klass = "branchCov";
            text = " + ";
            title += " was taken " + to_string(*b.taken) + ((*b.taken > 1) ? " times" : " time");
         }
         cell.html += string("<span class=\"") + klass + "\" title=\"" + title + "\">" + text + "</span>";
         cell.width += 3;
      }
      cell.html += "]";
      cell.width++;
   }
   return cell;
}
//---------------------------------------------------------------------------
void HtmlReport::writeSource(ostream& out, const SourceFile& file, const optional<vector<StringRef>>& source) const
// Write the annotated lines
{
   // Show the whole source plus every recorded line, records past the end of the source only individually
   set<unsigned> lineNumbers;
   for (auto& l : file.lines)
      lineNumbers.insert(l.first);
   for (auto& b : file.branches)
      lineNumbers.insert(b.first.line);
   if (source)
      for (unsigned line = 1; line <= source->size(); ++line)
         lineNumbers.insert(line);

   // The branch column is as wide as the widest line
   bool showBranches = config.showBranches && (!file.branches.empty());
   unsigned branchWidth = 0;
   if (showBranches)
      for (unsigned line : lineNumbers)
         branchWidth = max(branchWidth, formatBranches(file, line).width);

   out << R"(<pre class="source">)" << endl;
   for (unsigned lineNo : lineNumbers) {
      StringRef text;
      if (source)
         text = (lineNo <= source->size()) ? (*source)[lineNo - 1] : StringRef("/* EOF */");

      out << "<a name=\"" << lineNo << "\"><span class=\"lineNum\">" << setw(5) << lineNo << "</span>";
      if (showBranches) {
         auto cell = formatBranches(file, lineNo);
         out << " ";
         for (unsigned index = cell.width; index < branchWidth; ++index)
            out << " ";
         out << cell.html;
      }

      auto iter = file.lines.find(lineNo);
      if (iter == file.lines.end()) {
         out << R"(             : )";
         escapeHtml(out, text);
      } else {
         const char* klass = iter->second.hits ? "lineCov" : "lineNoCov";
         out << "<span class=\"" << klass << "\">";
         writePadded(out, formatCount(iter->second.hits), 12);
         out << " : ";
         escapeHtml(out, text);
         out << "</span>";
      }
      out << "</a>" << endl;
   }
   out << "</pre>" << endl;
}
//---------------------------------------------------------------------------
void HtmlReport::renderSourcePage(unsigned node, optional<StringRef> sourceText, ostream& out) const
// Render the annotated source of a file node
{
   auto& n = tree.getNode(node);
   auto& file = *n.file;
   string dir = getDirectoryName(n.name);
   string base = getRelativeBase(getPageDir(pagePaths[node]));

   stringstream view;
   view << "<a href=\"" << base << "index.html\">top level</a> - <a href=\"index.html\">";
   escapeHtml(view, dir);
   view << "</a> - ";
   escapeHtml(view, llvm::sys::path::filename(n.name));
   writeHeader(out, base, view.str(), n.summary, false);

   if (config.showFunctions && (!file.functions.empty()))
      writeFunctionTable(out, file);

   if (!sourceText) {
      out << "<br/><h4>No source code found!</h4><br/>" << endl;
      writeSource(out, file, nullopt);
   } else {
      // Split into lines, a trailing newline does not start a new line
      StringRef text = *sourceText;
      if (text.endswith("\n"))
         text = text.drop_back();
      vector<StringRef> lines;
      if (!sourceText->empty()) {
         llvm::SmallVector<StringRef, 0> parts;
         text.split(parts, '\n');
         for (auto l : parts)
            lines.push_back(l.rtrim("\r"));
      }

      // Does the source still match the coverage data?
      unsigned mismatches = 0, firstMismatch = 0;
      for (auto& l : file.lines)
         if ((!l.second.checksum.empty()) && (l.first <= lines.size()) && (computeLineChecksum(lines[l.first - 1]) != l.second.checksum))
            if (!mismatches++) firstMismatch = l.first;
      if (mismatches)
         diag.report(DiagKind::SourceMismatch, file.path, firstMismatch, to_string(mismatches) + ((mismatches == 1) ? " line does" : " lines do") + " not match the recorded checksum");

      writeSource(out, file, lines);
   }
   writeFooter(out, false);
}
//---------------------------------------------------------------------------
void HtmlReport::renderSourcePage(unsigned node, ostream& out) const
// Render the annotated source of a file node, reading the source from disk
{
   auto& file = *tree.getNode(node).file;
   string path = resolveSourcePath(file.path, tree.getSourceRoot());
   auto buffer = llvm::MemoryBuffer::getFile(path);
   if (!buffer) {
      diag.report(DiagKind::MissingSource, file.path, 0, "unable to read " + path + " (" + buffer.getError().message() + "), writing a placeholder page");
      renderSourcePage(node, nullopt, out);
      return;
   }
   renderSourcePage(node, (*buffer)->getBuffer(), out);
}
//---------------------------------------------------------------------------
static const char stylesheet[] = R"(/* Based upon the lcov CSS style, style files can be reused */
:root {
   --lowcov: #cc3232;
   --medcov: #e7b416;
   --highcov: #99c140;

   --lowcovtext: #b91f40;
   --medcovtext: #f08000;
   --highcovtext: #006400;
   --lowcovtextbg: color-mix(in srgb, var(--lowcovtext), white 90%);
   --medcovtextbg: color-mix(in srgb, var(--medcovtext), white 90%);
   --highcovtextbg: inherit;

   --tablebg: #eee8d5;
   --linenum: #8080a0;
   --highlight: #6687D4;
   --bg: #fff;
   --code: #000;
   --fg: #000;
}
@media (prefers-color-scheme: dark) {
   :root {
      --lowcov: #7a1e1e;--medcov: #8a6b0d;--highcov: #5d7526;
      --lowcovtext: #cc3232;--medcovtext: #e7b416;--highcovtext: #99c140;
      --lowcovtextbg: rgba(204, 50, 50, 0.33);
      --medcovtextbg: rgba(231, 180, 22, 0.33);
      --highcovtextbg: inherit;
      --tablebg: #073642;
      --highlight: #cb4b16;
      --bg: #002b36;
      --fg:#FFF;
      --code: #93a1a1;
      --linenum: var(--code);
   }
}
body { color: var(--fg); background-color: var(--bg); }
a:link { color: var(--code); text-decoration: underline; }
a:visited { color: #859900; }
a:active { color: #dc322f; }
td.title { text-align: center; padding-bottom: 10px; font-size: 20pt; font-weight: bold; }
td.ruler { background-color: var(--highlight); height: 3px; }
td.headerItem { text-align: right; padding-right: 6px; font-family: sans-serif; font-weight: bold; }
td.headerValue { text-align: left; color: var(--highlight); font-family: sans-serif; font-weight: bold; }
td.headerCovTableHead { text-align: center; padding-right: 6px; padding-left: 6px; font-family: sans-serif; font-size: 80%; }
td.headerCovTableEntry { text-align: right; color: var(--highlight); font-family: sans-serif; font-weight: bold; padding-left: 12px; padding-right: 4px; background-color: var(--tablebg); }
td.headerCovTableEntryHi { text-align: right; font-family: sans-serif; font-weight: bold; padding-left: 12px; padding-right: 4px; background-color: var(--highcov); }
td.headerCovTableEntryMed { text-align: right; font-family: sans-serif; font-weight: bold; padding-left: 12px; padding-right: 4px; background-color: var(--medcov); }
td.headerCovTableEntryLo { text-align: right; font-family: sans-serif; font-weight: bold; padding-left: 12px; padding-right: 4px; background-color: var(--lowcov); }
td.headerValueLeg { text-align: left; font-family: sans-serif; font-size: 80%; }
span.coverLegendHi { padding-left: 10px; padding-right: 10px; background-color: var(--highcov); }
span.coverLegendMed { padding-left: 10px; padding-right: 10px; background-color: var(--medcov); }
span.coverLegendLo { padding-left: 10px; padding-right: 10px; background-color: var(--lowcov); }
span.coverLegendCov { padding-left: 10px; padding-right: 10px; color: var(--highcovtext); background-color: var(--highcovtextbg); }
span.coverLegendNoCov { padding-left: 10px; padding-right: 10px; color: var(--lowcovtext); background-color: var(--lowcovtextbg); }
td.versionInfo { text-align: center; padding-top:  2px; }
pre.source { font-family: monospace; white-space: pre; color: var(--code); }
span.lineNum { color: var(--linenum); background-color: var(--tablebg); }
span.lineCov { color: var(--highcovtext); background-color: var(--highcovtextbg); }
span.lineNoCov { color: var(--lowcovtext); background-color: var(--lowcovtextbg); }
span.branchCov { color: var(--highcovtext); }
span.branchNoCov { color: var(--lowcovtext); }
span.branchNoExec { color: var(--lowcovtext); font-weight: bold; }
td.tableHead { text-align: center; color: var(--fg); background-color: var(--highlight); font-family: sans-serif; font-size: 120%; font-weight: bold; }
td.coverFile { text-align: left; padding-left: 10px; padding-right: 20px; color: var(--fg); background-color: var(--tablebg); font-family: monospace; }
td.coverBar { padding-left: 10px; padding-right: 10px; background-color: var(--tablebg); }
td.coverBarOutline { background-color: #000000; }
td.coverPer { font-weight: bold; }
td.coverHi { text-align: right; padding-left: 10px; padding-right: 10px; background-color: var(--highcov); }
td.coverMed { text-align: right; padding-left: 10px; padding-right: 10px; background-color: var(--medcov); }
td.coverLo { text-align: right; padding-left: 10px; padding-right: 10px; background-color: var(--lowcov); color: var(--fg); }
td.coverNone { text-align: right; padding-left: 10px; padding-right: 10px; background-color: var(--tablebg); }
td.coverFn { text-align: left; padding-left: 10px; padding-right: 20px; color: var(--fg); background-color: var(--tablebg); font-family: monospace; }
td.coverFnHi { text-align: right; padding-left: 10px; padding-right: 10px; background-color: var(--highcov); font-weight: bold; }
td.coverFnLo { text-align: right; padding-left: 10px; padding-right: 10px; background-color: var(--lowcov); font-weight: bold; }
span.filename { font-weight: bold; })";
//---------------------------------------------------------------------------
llvm::Error HtmlReport::write() const
// Write the stylesheet and all pages
{
   if (auto err = createDirectories(options.targetDir))
      return err;
   if (auto err = writeFileAtomic(joinPath(options.targetDir, stylesheetName), stylesheet))
      return err;

   // Create the directories up front, the workers only write files
   for (unsigned dir : tree.getRoot().children)
      if (auto err = createDirectories(joinPath(options.targetDir, getPageDir(pagePaths[dir]))))
         return err;

   // The pages are independent of each other
   {
      llvm::ThreadPool pool(llvm::hardware_concurrency(options.jobs));
      auto orders = getSortOrders();
      for (unsigned node = 1; node < tree.size(); ++node) {
         pool.async([this, node, &orders] {
            auto writePage = [&](const string& page, const stringstream& out) {
               string fileName = joinPath(options.targetDir, page);
               if (auto err = writeFileAtomic(fileName, out.str()))
                  diag.report(DiagKind::StructuralError, fileName, 0, llvm::toString(move(err)));
            };
            if (tree.getNode(node).kind == SummaryNode::Kind::Directory) {
               for (auto order : orders) {
                  stringstream out;
                  renderDirectoryIndex(node, out, order);
                  writePage(getIndexPath(node, order), out);
               }
            } else {
               stringstream out;
               renderSourcePage(node, out);
               writePage(pagePaths[node], out);
            }
         });
      }
      pool.wait();
   }
   if (diag.hasFatal())
      return llvm::createStringError(std::errc::io_error, "unable to write the report to %s", options.targetDir.c_str());

   // The line ordered project index comes last, its presence marks a complete report
   for (auto order : getSortOrders()) {
      if (order == SortOrder::Line) continue;
      stringstream out;
      renderProjectIndex(out, order);
      if (auto err = writeFileAtomic(joinPath(options.targetDir, getIndexPageName(order)), out.str()))
         return err;
   }
   stringstream out;
   renderProjectIndex(out);
   return writeFileAtomic(joinPath(options.targetDir, pagePaths[0]), out.str());
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
