#include "lcov2html/Paths.hpp"
#include <llvm/ADT/SmallString.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/Support/Path.h>
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
static string stripDotSegments(string s)
// Remove "/./" and a leading "./"
{
   while (s.find("/./") != string::npos) {
      auto split = s.find("/./");
      s = s.substr(0, split) + s.substr(split + 2);
   }
   while (s.substr(0, 2) == "./")
      s = s.substr(2);
   return s;
}
//---------------------------------------------------------------------------
string getDisplayPath(StringRef path, StringRef sourceRoot)
// The path shown in the report
{
   string root = stripDotSegments(sourceRoot.str());
   if ((!root.empty()) && (root.back() != '/'))
      root += '/';
   string name = stripDotSegments(path.str());
   if ((!root.empty()) && (root != "./") && (name.size() > root.size()) && (name.substr(0, root.size()) == root))
      return name.substr(root.size());
   return name;
}
//---------------------------------------------------------------------------
string getDirectoryName(StringRef displayPath) {
   auto pos = displayPath.rfind('/');
   if (pos == StringRef::npos) return ".";
   if (pos == 0) return "/";
   return displayPath.substr(0, pos).str();
}
//---------------------------------------------------------------------------
string findProjectRoot(llvm::ArrayRef<string> paths)
// Compute the longest common directory
{
   if (paths.empty()) return {};
   string s = paths.front();
   if (s.rfind('/') == string::npos) return {};
   s = s.substr(0, s.rfind('/') + 1);
   for (auto& c : paths) {
      while (c.substr(0, s.length()) != s) {
         if (s.length() < 2) {
            s.clear();
            break;
         }
         if (s.back() == '/')
            s.resize(s.size() - 1);
         if (s.rfind('/') == string::npos) {
            s.clear();
            break;
         }
         s = s.substr(0, s.rfind('/') + 1);
      }
      if (s.empty())
         break;
   }
   return s;
}
//---------------------------------------------------------------------------
string resolveSourcePath(StringRef path, StringRef sourceRoot) {
   if (sourceRoot.empty() || llvm::sys::path::is_absolute(path))
      return path.str();
   llvm::SmallString<256> result(sourceRoot);
   llvm::sys::path::append(result, path);
   return string(result.str());
}
//---------------------------------------------------------------------------
string getOutputPath(StringRef displayPath)
// Map a display path into the output directory. Parent references and roots must not escape it
{
   llvm::SmallVector<StringRef, 16> parts;
   displayPath.split(parts, '/', -1, false);
   string result;
   for (auto p : parts) {
      if (p == ".") continue;
      if (!result.empty()) result += '/';
      if (p == "..")
         result += "__";
      else
         result += p.str();
   }
   if (result.empty()) result = "_";
   return result;
}
//---------------------------------------------------------------------------
string getRelativeBase(StringRef outputDir)
// Example: "fs/mm" -> "../../"
{
   string result;
   llvm::SmallVector<StringRef, 16> parts;
   outputDir.split(parts, '/', -1, false);
   for (auto p : parts)
      if (p != ".") result += "../";
   return result;
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
