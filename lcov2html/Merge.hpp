#ifndef LCOV2HTML_MERGE_HPP
#define LCOV2HTML_MERGE_HPP
#include "lcov2html/Diagnostics.hpp"
#include "lcov2html/Tracefile.hpp"
#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>
#include <string>
#include <vector>
//---------------------------------------------------------------------------
// lcov tracefile to html converter
// (c) 2017 Thomas Neumann
// SPDX-License-Identifier: GPL-2.0-or-later
//---------------------------------------------------------------------------
namespace lcov2html {
//---------------------------------------------------------------------------
/// Add the counts of source to target, both describing the same file.
/// Returns false if the merge was aborted because of a strict checksum mismatch, target is unchanged then
bool mergeSourceFile(SourceFile& target, const SourceFile& source, bool strictChecksum, Diagnostics& diag);
/// Merge all files of source into target
void mergeInto(Tracefile& target, const Tracefile& source, bool strictChecksum, Diagnostics& diag);
/// Merge two tracefiles. Commutative and associative for all counts
Tracefile merge(const Tracefile& a, const Tracefile& b, bool strictChecksum, Diagnostics& diag);
/// Merge a list of tracefiles
Tracefile mergeAll(std::vector<Tracefile> inputs, bool strictChecksum, Diagnostics& diag);
/// Drop all files below one of the excluded directories. Directories are relative to sourceRoot
/// unless absolute. Returns the number of removed files
unsigned filterFiles(Tracefile& tracefile, llvm::ArrayRef<std::string> excludedDirs, llvm::StringRef sourceRoot);
/// Keep only the files whose whole recorded path matches one of the wildcard patterns ('*' and '?').
/// Returns the number of removed files
llvm::Expected<unsigned> extractFiles(Tracefile& tracefile, llvm::ArrayRef<std::string> patterns);
/// Drop the files whose whole recorded path matches one of the wildcard patterns ('*' and '?').
/// Returns the number of removed files
llvm::Expected<unsigned> removeFiles(Tracefile& tracefile, llvm::ArrayRef<std::string> patterns);
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
