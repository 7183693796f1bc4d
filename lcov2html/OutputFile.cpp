#include "lcov2html/OutputFile.hpp"
#include <llvm/ADT/SmallString.h>
#include <llvm/ADT/Twine.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/raw_ostream.h>
//---------------------------------------------------------------------------
// lcov tracefile to html converter
// (c) 2017 Thomas Neumann
// SPDX-License-Identifier: GPL-2.0-or-later
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace lcov2html {
//---------------------------------------------------------------------------
llvm::Error writeFileAtomic(llvm::StringRef fileName, llvm::StringRef content)
// Write via a temporary file and a rename
{
   llvm::SmallString<256> model(fileName);
   model += ".tmp-%%%%%%%%";
   int fd;
   llvm::SmallString<256> tempName;
   if (auto ec = llvm::sys::fs::createUniqueFile(model, fd, tempName))
      return llvm::createStringError(ec, "unable to create a temporary file for %s", fileName.str().c_str());

   {
      llvm::raw_fd_ostream out(fd, /*shouldClose=*/true);
      out << content;
      out.close();
      if (out.has_error()) {
         auto ec = out.error();
         out.clear_error();
         llvm::sys::fs::remove(tempName);
         return llvm::createStringError(ec, "unable to write %s", fileName.str().c_str());
      }
   }

   if (auto ec = llvm::sys::fs::rename(tempName, fileName)) {
      llvm::sys::fs::remove(tempName);
      return llvm::createStringError(ec, "unable to rename %s to %s", tempName.c_str(), fileName.str().c_str());
   }
   return llvm::Error::success();
}
//---------------------------------------------------------------------------
llvm::Error createDirectories(llvm::StringRef dir) {
   if (auto ec = llvm::sys::fs::create_directories(dir))
      return llvm::createStringError(ec, "unable to create directory %s", dir.str().c_str());
   return llvm::Error::success();
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
