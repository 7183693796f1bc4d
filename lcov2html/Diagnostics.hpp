#ifndef LCOV2HTML_DIAGNOSTICS_HPP
#define LCOV2HTML_DIAGNOSTICS_HPP
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/raw_ostream.h>
#include <mutex>
#include <string>
#include <vector>
//---------------------------------------------------------------------------
// lcov tracefile to html converter
// (c) 2017 Thomas Neumann
// SPDX-License-Identifier: GPL-2.0-or-later
//---------------------------------------------------------------------------
namespace lcov2html {
//---------------------------------------------------------------------------
/// The kinds of problems we report
enum class DiagKind {
   /// An unknown or malformed tracefile record, skipped
   ParseWarning,
   /// Two merge inputs disagree about the content of a line
   ChecksumMismatch,
   /// The source of an annotated page is not on disk
   MissingSource,
   /// The source on disk does not match the recorded line checksums
   SourceMismatch,
   /// The run cannot continue
   StructuralError
};
//---------------------------------------------------------------------------
/// The name of a kind
llvm::StringRef getDiagKindName(DiagKind kind);
//---------------------------------------------------------------------------
/// A single problem
struct Diagnostic {
   DiagKind kind;
   /// The affected file (tracefile or source file)
   std::string file;
   /// The affected line, 0 if not applicable
   unsigned line;
   std::string message;
};
//---------------------------------------------------------------------------
/// Collects problems from all pipeline stages. Safe to use from worker threads
class Diagnostics {
   private:
   mutable std::mutex guard;
   std::vector<Diagnostic> entries;

   public:
   /// Report a problem
   void report(DiagKind kind, llvm::StringRef file, unsigned line, llvm::StringRef message);
   /// Report a problem
   void report(Diagnostic diag);

   /// Number of entries of the given kind
   unsigned count(DiagKind kind) const;
   /// Number of recoverable entries
   unsigned warningCount() const;
   /// Did something fatal happen?
   bool hasFatal() const { return count(DiagKind::StructuralError) != 0; }
   /// A sorted copy of all entries
   std::vector<Diagnostic> getEntries() const;

   /// Print all entries followed by a warning count
   void print(llvm::raw_ostream& out, bool useColor = true) const;
};
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
