///////////////////////////////////////////////////////////////////////////////
// FILE:          Error.cpp
// PROJECT:       SpecimenScope
// SUBSYSTEM:     ScopeCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Exception class for the motion core facade
//
// COPYRIGHT:     SpecimenScope contributors, 2026
//
// LICENSE:       This file is distributed under the "Lesser GPL" (LGPL) license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.

#include "Error.h"

#include <sstream>


CScopeError::CScopeError(const std::string& msg, Code code) :
   message_(msg),
   code_(code == SCOPEERR_OK ? SCOPEERR_GENERIC : code)
{
   UpdateWhat();
}


CScopeError::CScopeError(const char* msg, Code code) :
   message_(msg ? msg : "(null message)"),
   code_(code == SCOPEERR_OK ? SCOPEERR_GENERIC : code)
{
   UpdateWhat();
}


CScopeError::CScopeError(const std::string& msg, Code code,
      const CScopeError& underlyingError) :
   message_(msg),
   code_(code == SCOPEERR_OK ? SCOPEERR_GENERIC : code),
   underlying_(new CScopeError(underlyingError))
{
   UpdateWhat();
}


CScopeError::CScopeError(const CScopeError& other) :
   std::exception(other),
   message_(other.message_),
   code_(other.code_),
   underlying_(other.underlying_ ?
         new CScopeError(*other.underlying_) : nullptr),
   what_(other.what_)
{}


CScopeError&
CScopeError::operator=(const CScopeError& rhs)
{
   if (this == &rhs)
      return *this;
   message_ = rhs.message_;
   code_ = rhs.code_;
   underlying_.reset(rhs.underlying_ ?
         new CScopeError(*rhs.underlying_) : nullptr);
   what_ = rhs.what_;
   return *this;
}


std::string
CScopeError::getMsg() const
{
   if (!message_.empty())
      return message_;
   return scope::GetErrorText(code_);
}


std::string
CScopeError::getFullMsg() const
{
   std::ostringstream oss;
   oss << getMsg();
   for (const CScopeError* e = underlying_.get(); e;
         e = e->getUnderlyingError())
   {
      oss << " [ " << e->getMsg() << " ]";
   }
   return oss.str();
}


void
CScopeError::UpdateWhat()
{
   what_ = getFullMsg();
}
