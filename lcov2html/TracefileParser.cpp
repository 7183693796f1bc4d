#include "lcov2html/TracefileParser.hpp"
#include "lcov2html/Merge.hpp"
#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/Twine.h>
#include <llvm/Support/MemoryBuffer.h>
#include <cctype>
#include <optional>
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
/// The outcome of parsing a count field
enum class CountResult { Ok, Negative, Invalid };
//---------------------------------------------------------------------------
static CountResult parseCount(StringRef s, uint64_t& count)
// Parse an execution count. Negative counts are clamped to 0
{
   s = s.trim();
   if (s.startswith("-")) {
      int64_t v;
      if (s.getAsInteger(10, v)) return CountResult::Invalid;
      count = 0;
      return CountResult::Negative;
   }
   if (s.getAsInteger(10, count)) return CountResult::Invalid;
   return CountResult::Ok;
}
//---------------------------------------------------------------------------
static bool parseLineNumber(StringRef s, unsigned& line)
// Parse a (positive) line number
{
   return (!s.trim().getAsInteger(10, line)) && (line > 0);
}
//---------------------------------------------------------------------------
/// Parser state for one tracefile
class TracefileParser {
   private:
   /// The tracefile name for diagnostics
   StringRef name;
   bool strictChecksum;
   Diagnostics& diag;
   /// The result
   Tracefile result;
   /// The currently open section, if any
   optional<SourceFile> section;
   /// The current line within the tracefile
   unsigned lineNo = 0;

   /// Report a skipped record
   void warn(const llvm::Twine& message);
   /// Report a negative count
   void warnNegative() { warn("negative count clamped to 0"); }
   /// Close the current section
   void closeSection();

   /// Handle the individual records
   void handleTestName(StringRef value);
   llvm::Error handleSourceFile(StringRef value);
   void handleLine(StringRef value);
   void handleFunction(StringRef value);
   void handleFunctionCalls(StringRef value);
   void handleBranch(StringRef value);

   public:
   /// Constructor
   TracefileParser(StringRef name, bool strictChecksum, Diagnostics& diag) : name(name), strictChecksum(strictChecksum), diag(diag) {}

   /// Parse the text
   llvm::Expected<Tracefile> parse(StringRef text);
};
//---------------------------------------------------------------------------
void TracefileParser::warn(const llvm::Twine& message) {
   diag.report(DiagKind::ParseWarning, name, lineNo, message.str());
}
//---------------------------------------------------------------------------
void TracefileParser::closeSection()
// Close the current section. Repeated sections for the same file are merged
{
   if (!section) return;
   auto path = section->path;
   auto& target = result.getFile(path);
   mergeSourceFile(target, *section, strictChecksum, diag);
   section.reset();
}
//---------------------------------------------------------------------------
void TracefileParser::handleTestName(StringRef value)
// The test name must consist of word characters only
{
   string testName = value.str();
   bool changed = false;
   for (auto& c : testName)
      if ((!isalnum(static_cast<unsigned char>(c))) && (c != '_')) {
         c = '_';
         changed = true;
      }
   if (changed)
      warn("invalid characters replaced in test name '" + value + "'");
   result.testName = move(testName);
}
//---------------------------------------------------------------------------
llvm::Error TracefileParser::handleSourceFile(StringRef value) {
   if (section)
      return llvm::createStringError(std::errc::invalid_argument, "%s:%u: section for '%s' starts before the section for '%s' ended", name.str().c_str(), lineNo, value.str().c_str(), section->path.c_str());
   if (value.empty()) {
      warn("source file record without a path");
      return llvm::Error::success();
   }
   section.emplace();
   section->path = value.str();
   return llvm::Error::success();
}
//---------------------------------------------------------------------------
void TracefileParser::handleLine(StringRef value)
// DA:<line>,<count>[,<checksum>]
{
   auto [lineStr, rest] = value.split(',');
   auto [countStr, checksum] = rest.split(',');
   unsigned line;
   uint64_t count;
   if (!parseLineNumber(lineStr, line))
      return warn("invalid line number in line record '" + value + "'");
   auto res = parseCount(countStr, count);
   if (res == CountResult::Invalid)
      return warn("invalid execution count in line record '" + value + "'");
   if (res == CountResult::Negative)
      warnNegative();

   // A line that repeats within a section must describe the same content
   checksum = checksum.trim();
   auto iter = section->lines.find(line);
   if ((iter != section->lines.end()) && (!checksum.empty()) && (!iter->second.checksum.empty()) && (iter->second.checksum != checksum)) {
      diag.report(DiagKind::ChecksumMismatch, section->path, line, ("checksum " + checksum + " differs from " + iter->second.checksum + " in " + name).str());
      if (strictChecksum) return;
      if (checksum < iter->second.checksum)
         iter->second.checksum = checksum.str();
   }
   section->addLine(line, count, checksum.str());
}
//---------------------------------------------------------------------------
void TracefileParser::handleFunction(StringRef value)
// FN:<line>,<name>
{
   auto [lineStr, function] = value.split(',');
   unsigned line;
   if (!parseLineNumber(lineStr, line))
      return warn("invalid line number in function record '" + value + "'");
   if (function.empty())
      return warn("function record without a name");
   section->addFunction(function.str(), line);
}
//---------------------------------------------------------------------------
void TracefileParser::handleFunctionCalls(StringRef value)
// FNDA:<count>,<name>
{
   auto [countStr, function] = value.split(',');
   uint64_t count;
   auto res = parseCount(countStr, count);
   if (res == CountResult::Invalid)
      return warn("invalid call count in function record '" + value + "'");
   if (function.empty())
      return warn("function call record without a name");
   if (res == CountResult::Negative)
      warnNegative();
   section->addFunctionCalls(function.str(), count);
}
//---------------------------------------------------------------------------
void TracefileParser::handleBranch(StringRef value)
// BRDA:<line>,<block>,<branch>,<taken or ->
{
   llvm::SmallVector<StringRef, 4> fields;
   value.split(fields, ',');
   if (fields.size() != 4)
      return warn("branch record '" + value + "' does not have 4 fields");
   unsigned line, block, branch;
   if (!parseLineNumber(fields[0], line))
      return warn("invalid line number in branch record '" + value + "'");
   if (fields[1].trim().getAsInteger(10, block) || fields[2].trim().getAsInteger(10, branch))
      return warn("invalid block or branch id in branch record '" + value + "'");
   optional<uint64_t> taken;
   if (fields[3].trim() != "-") {
      uint64_t count;
      auto res = parseCount(fields[3], count);
      if (res == CountResult::Invalid)
         return warn("invalid taken count in branch record '" + value + "'");
      if (res == CountResult::Negative)
         warnNegative();
      taken = count;
   }
   section->addBranch(line, block, branch, taken);
}
//---------------------------------------------------------------------------
llvm::Expected<Tracefile> TracefileParser::parse(StringRef text)
// Parse the text
{
   while (!text.empty()) {
      StringRef line;
      tie(line, text) = text.split('\n');
      ++lineNo;
      line = line.rtrim("\r");
      if (line.trim().empty()) continue;

      if (line == "end_of_record") {
         if (!section)
            warn("end of record without a section");
         closeSection();
         continue;
      }

      auto [tag, value] = line.split(':');
      if (tag == "TN") {
         handleTestName(value);
      } else if (tag == "SF") {
         if (auto err = handleSourceFile(value))
            return move(err);
      } else if ((tag == "DA") || (tag == "FN") || (tag == "FNDA") || (tag == "BRDA") || (tag == "LF") || (tag == "LH") || (tag == "FNF") || (tag == "FNH") || (tag == "BRF") || (tag == "BRH")) {
         if (!section) {
            warn("record '" + line + "' outside of a section");
            continue;
         }
         if (tag == "DA")
            handleLine(value);
         else if (tag == "FN")
            handleFunction(value);
         else if (tag == "FNDA")
            handleFunctionCalls(value);
         else if (tag == "BRDA")
            handleBranch(value);
         // The summary records are recomputed from the data
      } else {
         warn("unknown record '" + line + "'");
      }
   }

   // A missing terminator is tolerated for the final section
   closeSection();
   return move(result);
}
//---------------------------------------------------------------------------
llvm::Expected<Tracefile> parseTracefile(StringRef text, StringRef name, bool strictChecksum, Diagnostics& diag) {
   TracefileParser parser(name, strictChecksum, diag);
   return parser.parse(text);
}
//---------------------------------------------------------------------------
llvm::Expected<Tracefile> readTracefile(StringRef fileName, bool strictChecksum, Diagnostics& diag) {
   auto buffer = llvm::MemoryBuffer::getFile(fileName);
   if (!buffer)
      return llvm::createStringError(buffer.getError(), "unable to read tracefile %s", fileName.str().c_str());
   return parseTracefile((*buffer)->getBuffer(), fileName, strictChecksum, diag);
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
