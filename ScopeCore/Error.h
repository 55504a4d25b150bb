///////////////////////////////////////////////////////////////////////////////
// FILE:          Error.h
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

#pragma once

#include "ErrorCodes.h"

#include <exception>
#include <memory>
#include <string>


/// Core error class. Exceptions thrown by the core public API are of this type.
/**
 * Exceptions can be chained: an error can carry a copy of the error that
 * caused it, so that the full story can be reported with getFullMsg().
 */
class CScopeError : public std::exception
{
public:
   typedef int Code;

   /// Construct with error message and optionally an error code.
   /**
    * If the code is not given (or is SCOPEERR_OK), SCOPEERR_GENERIC is used.
    */
   explicit CScopeError(const std::string& msg, Code code = SCOPEERR_GENERIC);

   /// Construct with error message (as C string).
   explicit CScopeError(const char* msg, Code code = SCOPEERR_GENERIC);

   /// Construct with an underlying (chained) error.
   CScopeError(const std::string& msg, Code code,
         const CScopeError& underlyingError);

   CScopeError(const CScopeError& other);
   CScopeError& operator=(const CScopeError& rhs);

   virtual ~CScopeError() {}

   /// Implements std::exception interface; same as getFullMsg().
   virtual const char* what() const noexcept { return what_.c_str(); }

   /// Get the error message for this error, without underlying errors.
   virtual std::string getMsg() const;

   /// Get the error messages of this and all chained errors.
   virtual std::string getFullMsg() const;

   /// Get the error code for this error.
   virtual Code getCode() const { return code_; }

   /// Access the underlying error; returns null if there is none.
   virtual const CScopeError* getUnderlyingError() const
   { return underlying_.get(); }

private:
   void UpdateWhat();

   std::string message_;
   Code code_;
   std::unique_ptr<CScopeError> underlying_;
   std::string what_;
};
