#ifndef LCOV2HTML_PATHS_HPP
#define LCOV2HTML_PATHS_HPP
#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>
#include <string>
//---------------------------------------------------------------------------
// lcov tracefile to html converter
// (c) 2017 Thomas Neumann
// SPDX-License-Identifier: GPL-2.0-or-later
//---------------------------------------------------------------------------
namespace lcov2html {
//---------------------------------------------------------------------------
/// The path shown in the report: relative to the source root if below it, unchanged otherwise
std::string getDisplayPath(llvm::StringRef path, llvm::StringRef sourceRoot);
/// The directory part of a display path, "." if there is none
std::string getDirectoryName(llvm::StringRef displayPath);
/// The longest common directory of all paths (with trailing slash), empty if there is none
std::string findProjectRoot(llvm::ArrayRef<std::string> paths);
/// Where the source of a tracefile path can be found
std::string resolveSourcePath(llvm::StringRef path, llvm::StringRef sourceRoot);
/// Map a display path to a relative location inside the output directory
std::string getOutputPath(llvm::StringRef displayPath);
/// The prefix that leads from a relative output directory back to the output root
std::string getRelativeBase(llvm::StringRef outputDir);
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
#endif
