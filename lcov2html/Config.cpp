#include "lcov2html/Config.hpp"
//---------------------------------------------------------------------------
// lcov tracefile to html converter
// (c) 2017 Thomas Neumann
// SPDX-License-Identifier: GPL-2.0-or-later
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace lcov2html {
//---------------------------------------------------------------------------
llvm::Error ReportConfig::validate() const
// Check the thresholds
{
   if (highThreshold > 100)
      return llvm::createStringError(std::errc::invalid_argument, "high threshold %u is above 100%%", highThreshold);
   if (mediumThreshold > highThreshold)
      return llvm::createStringError(std::errc::invalid_argument, "medium threshold %u exceeds high threshold %u", mediumThreshold, highThreshold);
   return llvm::Error::success();
}
//---------------------------------------------------------------------------
}
//---------------------------------------------------------------------------
