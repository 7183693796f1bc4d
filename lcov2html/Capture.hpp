#ifndef LCOV2HTML_CAPTURE_HPP
#define LCOV2HTML_CAPTURE_HPP
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
/// Settings of a capture run
struct CaptureOptions {
   /// Lines containing one of these strings are excluded, like LCOV_EXCL_LINE
   std::vector<std::string> extraIgnore;
   /// Attach line checksums
   bool checksum = false;
};
//---------------------------------------------------------------------------
/// Is a source line free of executable code?
bool isTrivialCode(llvm::StringRef code);
/// Compute the excluded lines of a source file (1-based, index 0 is unused)
std::vector<bool> findExcludedLines(llvm::ArrayRef<llvm::StringRef> lines, llvm::ArrayRef<std::string> extraIgnore);
/// Build a tracefile from an instrumented object and its merged raw profile
llvm::Expected<Tracefile> captureLlvmCoverage(llvm::StringRef objectFile, llvm::StringRef profileFile, const CaptureOptions& options, Diagnostics& diag);
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
