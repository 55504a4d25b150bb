///////////////////////////////////////////////////////////////////////////////
// FILE:          SpecimenStore.h
// PROJECT:       SpecimenScope
// SUBSYSTEM:     ScopeCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Access to the stored per-specimen defaults
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

#include "Logging/Logger.h"

#include <string>

namespace scope
{

struct SpecimenRecord
{
   std::string name;
   std::string location;
   std::string collector;
   std::string chem;
   std::string mapImage;
   std::string edsImage;
   std::string qrCodeImage;
   long defaultZoom;
   long defaultFocus;
   long defaultRotationOffset;

   static SpecimenRecord Defaults(int specimen);
};

class SpecimenStore
{
public:
   virtual ~SpecimenStore() {}

   /**
    * Never throws. A missing or malformed record yields the defaults.
    */
   virtual SpecimenRecord LoadSpecimen(int specimen) = 0;
};

/**
 * Reads specimen_<n>.json files from a directory.
 */
class JsonSpecimenStore : public SpecimenStore
{
   std::string directory_;
   logging::Logger logger_;

public:
   JsonSpecimenStore(const std::string& directory, logging::Logger logger);

   SpecimenRecord LoadSpecimen(int specimen) override;

   std::string PathFor(int specimen) const;
};

} // namespace scope
