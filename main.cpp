#include "lcov2html/Capture.hpp"
#include "lcov2html/Config.hpp"
#include "lcov2html/Diagnostics.hpp"
#include "lcov2html/HtmlReport.hpp"
#include "lcov2html/Merge.hpp"
#include "lcov2html/Paths.hpp"
#include "lcov2html/Summary.hpp"
#include "lcov2html/TracefileParser.hpp"
#include "lcov2html/TracefileWriter.hpp"
#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/ThreadPool.h>
#include <llvm/Support/Threading.h>
#include <llvm/Support/WithColor.h>
#include <llvm/Support/raw_ostream.h>
#include <ctime>
#include <string>
#include <vector>
#include <sys/stat.h>
//---------------------------------------------------------------------------
// lcov tracefile to html converter
// (c) 2017 Thomas Neumann
// SPDX-License-Identifier: GPL-2.0-or-later
//---------------------------------------------------------------------------
using namespace std;
using namespace lcov2html;
using llvm::StringRef;
//---------------------------------------------------------------------------
static string getFileTimestamp(const string& file)
// Get the timestamp of a file
{
   struct stat s;
   if (stat(file.c_str(), &s) != 0)
      return "";
   time_t t = s.st_mtime;
   string result = ctime(&t);
   while ((!result.empty()) && (result.back() == '\n'))
      result.pop_back();
   return result;
}
//---------------------------------------------------------------------------
static bool parseUnsigned(StringRef option, StringRef value, unsigned& result)
// Interpret a numeric option
{
   if (value.getAsInteger(10, result)) {
      llvm::WithColor::error() << "invalid value '" << value << "' for " << option << "\n";
      return false;
   }
   return true;
}
//---------------------------------------------------------------------------
static vector<string> splitList(StringRef list)
// Split a comma separated list
{
   llvm::SmallVector<StringRef, 8> parts;
   list.split(parts, ',', -1, false);
   vector<string> result;
   for (auto p : parts)
      result.push_back(p.str());
   return result;
}
//---------------------------------------------------------------------------
static vector<Tracefile> readInputs(const vector<string>& inputs, const ReportConfig& config, unsigned jobs, Diagnostics& diag)
// Parse all tracefiles, in parallel
{
   vector<Tracefile> result(inputs.size());
   llvm::ThreadPool pool(llvm::hardware_concurrency(jobs));
   for (unsigned index = 0; index < inputs.size(); ++index) {
      pool.async([&, index] {
         auto tracefile = readTracefile(inputs[index], config.strictChecksum, diag);
         if (!tracefile) {
            diag.report(DiagKind::StructuralError, inputs[index], 0, llvm::toString(tracefile.takeError()));
            return;
         }
         result[index] = move(*tracefile);
      });
   }
   pool.wait();
   return result;
}
//---------------------------------------------------------------------------
int main(int argc, char** argv) {
   // Interpret the arguments
   ReportConfig config;
   ReportOptions options;
   CaptureOptions captureOptions;
   vector<string> excludedDirs, extractPatterns, removePatterns;
   string outputTracefile, llvmObject, llvmProfile;
   bool hasSourceRoot = false, quiet = false;

   vector<string> args;
   for (int index = 1; index < argc; ++index) {
      if (argv[index][0] == '-') {
         StringRef a = argv[index];
         if (a == "--") {
            for (++index; index != argc; ++index)
               args.push_back(argv[index]);
            break;
         } else if (a.consume_front("--source-root=")) {
            options.sourceRoot = a.str();
            if ((!options.sourceRoot.empty()) && (options.sourceRoot.back() != '/'))
               options.sourceRoot += '/';
            hasSourceRoot = true;
         } else if (a.consume_front("--high=")) {
            if (!parseUnsigned("--high", a, config.highThreshold)) return 1;
         } else if (a.consume_front("--medium=")) {
            if (!parseUnsigned("--medium", a, config.mediumThreshold)) return 1;
         } else if (a.consume_front("--jobs=")) {
            if (!parseUnsigned("--jobs", a, options.jobs)) return 1;
         } else if (a == "--no-branches") {
            config.showBranches = false;
         } else if (a == "--no-functions") {
            config.showFunctions = false;
         } else if (a == "--no-strict-checksum") {
            config.strictChecksum = false;
         } else if (a.consume_front("--title=")) {
            options.title = a.str();
         } else if (a.consume_front("--exclude-dir=")) {
            excludedDirs = splitList(a);
         } else if (a.consume_front("--extract=")) {
            extractPatterns = splitList(a);
         } else if (a.consume_front("--remove=")) {
            removePatterns = splitList(a);
         } else if (a == "--no-sort") {
            options.sortViews = false;
         } else if (a == "--legend") {
            options.legend = true;
         } else if (a.consume_front("--exclude-line=")) {
            captureOptions.extraIgnore.push_back(a.str());
         } else if (a.consume_front("--llvm-coverage=")) {
            auto parts = a.split(',');
            if (parts.second.empty()) {
               llvm::WithColor::error() << "--llvm-coverage expects object,profdata\n";
               return 1;
            }
            llvmObject = parts.first.str();
            llvmProfile = parts.second.str();
         } else if (a == "--checksum") {
            captureOptions.checksum = true;
         } else if (a.consume_front("--output-tracefile=")) {
            outputTracefile = a.str();
         } else if (a == "--quiet") {
            quiet = true;
         } else {
            llvm::WithColor::warning() << "unknown option " << a << "\n";
         }
      } else {
         args.push_back(argv[index]);
      }
   }
   if (args.empty() || ((args.size() < 2) && llvmObject.empty())) {
      llvm::errs() << "usage: " << argv[0] << " [options] targetDir tracefile..." << "\n";
      return 1;
   }
   if (auto err = config.validate()) {
      llvm::WithColor::error() << llvm::toString(move(err)) << "\n";
      return 1;
   }
   options.targetDir = args[0];
   vector<string> inputs(args.begin() + 1, args.end());
   options.timestamp = getFileTimestamp(inputs.empty() ? llvmProfile : inputs.front());

   // Load the coverage
   Diagnostics diag;
   auto tracefiles = readInputs(inputs, config, options.jobs, diag);
   if (!llvmObject.empty()) {
      auto captured = captureLlvmCoverage(llvmObject, llvmProfile, captureOptions, diag);
      if (!captured) {
         diag.report(DiagKind::StructuralError, llvmProfile, 0, llvm::toString(captured.takeError()));
      } else {
         tracefiles.push_back(move(*captured));
      }
   }
   if (diag.hasFatal()) {
      diag.print(llvm::errs());
      return 1;
   }
   if (!quiet)
      llvm::outs() << "read " << tracefiles.size() << (tracefiles.size() == 1 ? " tracefile" : " tracefiles") << "\n";
   Tracefile merged = mergeAll(move(tracefiles), config.strictChecksum, diag);

   // Restrict the data to the requested files
   auto applyPatterns = [&](llvm::Expected<unsigned> removed) {
      if (!removed) {
         llvm::WithColor::error() << llvm::toString(removed.takeError()) << "\n";
         return false;
      }
      if (*removed && (!quiet))
         llvm::outs() << "filtered " << *removed << (*removed == 1 ? " file" : " files") << "\n";
      return true;
   };
   if ((!extractPatterns.empty()) && (!applyPatterns(extractFiles(merged, extractPatterns))))
      return 1;
   if ((!removePatterns.empty()) && (!applyPatterns(removeFiles(merged, removePatterns))))
      return 1;

   if (!outputTracefile.empty()) {
      if (auto err = saveTracefile(outputTracefile, merged)) {
         diag.report(DiagKind::StructuralError, outputTracefile, 0, llvm::toString(move(err)));
         diag.print(llvm::errs());
         return 1;
      }
   }

   // Compute the project root
   if (!hasSourceRoot) {
      vector<string> paths;
      for (auto& f : merged.files)
         paths.push_back(f.first);
      options.sourceRoot = findProjectRoot(paths);
   }
   if (unsigned removed = filterFiles(merged, excludedDirs, options.sourceRoot); removed && (!quiet))
      llvm::outs() << "excluded " << removed << (removed == 1 ? " file" : " files") << "\n";

   // Write the report
   SummaryTree tree(merged, options.sourceRoot);
   HtmlReport report(tree, config, options, diag);
   if (!quiet)
      llvm::outs() << "writing " << tree.size() << " pages to " << options.targetDir << "\n";
   auto err = report.write();
   diag.print(llvm::errs());
   if (err) {
      llvm::WithColor::error() << llvm::toString(move(err)) << "\n";
      return 1;
   }

   auto& lines = tree.getRoot().summary.lines;
   llvm::outs() << "coverage: " << lines.formatRate() << "%, " << (lines.total - lines.hit) << " lines not reached\n";
   return 0;
}
//---------------------------------------------------------------------------
