#ifndef LCOV2HTML_TRACEFILEPARSER_HPP
#define LCOV2HTML_TRACEFILEPARSER_HPP
#include "lcov2html/Diagnostics.hpp"
#include "lcov2html/Tracefile.hpp"
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>
//---------------------------------------------------------------------------
// lcov tracefile to html converter
// (c) 2017 Thomas Neumann
// SPDX-License-Identifier: GPL-2.0-or-later
//---------------------------------------------------------------------------
namespace lcov2html {
//---------------------------------------------------------------------------
/// Parse the text of a tracefile. Broken records are reported to diag and skipped,
/// only structural problems fail. name is used in diagnostics
llvm::Expected<Tracefile> parseTracefile(llvm::StringRef text, llvm::StringRef name, bool strictChecksum, Diagnostics& diag);
/// Read and parse a tracefile
llvm::Expected<Tracefile> readTracefile(llvm::StringRef fileName, bool strictChecksum, Diagnostics& diag);
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
