#ifndef LCOV2HTML_OUTPUTFILE_HPP
#define LCOV2HTML_OUTPUTFILE_HPP
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>
//---------------------------------------------------------------------------
// lcov tracefile to html converter
// (c) 2017 Thomas Neumann
// SPDX-License-Identifier: GPL-2.0-or-later
//---------------------------------------------------------------------------
namespace lcov2html {
//---------------------------------------------------------------------------
/// Write a file via a temporary file in the same directory and a rename, readers never see partial content
llvm::Error writeFileAtomic(llvm::StringRef fileName, llvm::StringRef content);
/// Create a directory and its parents
llvm::Error createDirectories(llvm::StringRef dir);
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
