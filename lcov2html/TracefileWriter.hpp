#ifndef LCOV2HTML_TRACEFILEWRITER_HPP
#define LCOV2HTML_TRACEFILEWRITER_HPP
#include "lcov2html/Tracefile.hpp"
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>
#include <string>
//---------------------------------------------------------------------------
// lcov tracefile to html converter
// (c) 2017 Thomas Neumann
// SPDX-License-Identifier: GPL-2.0-or-later
//---------------------------------------------------------------------------
namespace lcov2html {
//---------------------------------------------------------------------------
/// Serialize a tracefile. Sections are ordered by path, records by line
void writeTracefile(llvm::raw_ostream& out, const Tracefile& tracefile);
/// Serialize a tracefile into a string
std::string serializeTracefile(const Tracefile& tracefile);
/// Write a tracefile to disk
llvm::Error saveTracefile(llvm::StringRef fileName, const Tracefile& tracefile);
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
