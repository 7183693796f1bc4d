#include "lcov2html/Diagnostics.hpp"
#include <llvm/Support/WithColor.h>
#include <algorithm>
#include <tuple>
//---------------------------------------------------------------------------
// lcov tracefile to html converter
// (c) 2017 Thomas Neumann
// SPDX-License-Identifier: GPL-2.0-or-later
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace lcov2html {
//---------------------------------------------------------------------------
llvm::StringRef getDiagKindName(DiagKind kind) {
   switch (kind) {
      case DiagKind::ParseWarning: return "parse warning";
      case DiagKind::ChecksumMismatch: return "checksum mismatch";
      case DiagKind::MissingSource: return "missing source";
      case DiagKind::SourceMismatch: return "source mismatch";
      case DiagKind::StructuralError: return "structural error";
   }
   return "unknown";
}
//---------------------------------------------------------------------------
void Diagnostics::report(DiagKind kind, llvm::StringRef file, unsigned line, llvm::StringRef message) {
   report(Diagnostic{kind, file.str(), line, message.str()});
}
//---------------------------------------------------------------------------
void Diagnostics::report(Diagnostic diag) {
   lock_guard<std::mutex> lock(guard);
   entries.push_back(move(diag));
}
//---------------------------------------------------------------------------
unsigned Diagnostics::count(DiagKind kind) const {
   lock_guard<std::mutex> lock(guard);
   return count_if(entries.begin(), entries.end(), [kind](const Diagnostic& d) { return d.kind == kind; });
}
//---------------------------------------------------------------------------
static bool isWarning(const Diagnostic& d)
// Everything except structural errors lets the run continue
{
   return d.kind != DiagKind::StructuralError;
}
//---------------------------------------------------------------------------
unsigned Diagnostics::warningCount() const {
   lock_guard<std::mutex> lock(guard);
   return count_if(entries.begin(), entries.end(), isWarning);
}
//---------------------------------------------------------------------------
vector<Diagnostic> Diagnostics::getEntries() const
// Worker threads report in arbitrary order, sort to get a reproducible listing
{
   vector<Diagnostic> result;
   {
      lock_guard<std::mutex> lock(guard);
      result = entries;
   }
   stable_sort(result.begin(), result.end(), [](const Diagnostic& a, const Diagnostic& b) {
      return tie(a.file, a.line, a.kind) < tie(b.file, b.line, b.kind);
   });
   return result;
}
//---------------------------------------------------------------------------
void Diagnostics::print(llvm::raw_ostream& out, bool useColor) const
// Print all entries followed by a warning count
{
   auto mode = useColor ? llvm::ColorMode::Auto : llvm::ColorMode::Disable;
   auto entries = getEntries();
   for (auto& d : entries) {
      if (isWarning(d)) {
         llvm::WithColor(out, llvm::HighlightColor::Warning, mode).get() << "warning: ";
      } else {
         llvm::WithColor(out, llvm::HighlightColor::Error, mode).get() << "error: ";
      }
      out << getDiagKindName(d.kind) << ": ";
      if (!d.file.empty()) {
         out << d.file;
         if (d.line) out << ":" << d.line;
         out << ": ";
      }
      out << d.message << "\n";
   }
   // The count matches the listed entries even when workers are still reporting
   unsigned warnings = count_if(entries.begin(), entries.end(), isWarning);
   if (warnings)
      out << warnings << (warnings == 1 ? " warning" : " warnings") << " reported\n";
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
