///////////////////////////////////////////////////////////////////////////////
// FILE:          JsonSpecimenStore.cpp
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

#include "SpecimenStore.h"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>

namespace scope
{

namespace
{

std::string StringField(const nlohmann::json& doc, const char* key,
      const std::string& fallback)
{
   auto it = doc.find(key);
   if (it == doc.end() || !it->is_string())
      return fallback;
   return it->get<std::string>();
}

// Numbers, and strings holding a number, are accepted; anything else
// (including null and false) reads as 0.
long IntegerField(const nlohmann::json& doc, const char* key)
{
   auto it = doc.find(key);
   if (it == doc.end())
      return 0;
   if (it->is_number_integer())
      return it->get<long>();
   if (it->is_number_float())
      return static_cast<long>(std::trunc(it->get<double>()));
   if (it->is_string())
   {
      const std::string s = it->get<std::string>();
      char* end = nullptr;
      errno = 0;
      long value = std::strtol(s.c_str(), &end, 10);
      if (end == s.c_str() || errno == ERANGE)
         return 0;
      return value;
   }
   return 0;
}

} // anonymous namespace

SpecimenRecord
SpecimenRecord::Defaults(int specimen)
{
   SpecimenRecord r;
   r.name = "Specimen " + std::to_string(specimen);
   r.location = "Unknown";
   r.collector = "Unknown";
   r.chem = "Unknown";
   r.mapImage = "placeholder.png";
   r.edsImage = "placeholder.png";
   r.qrCodeImage = "placeholder.png";
   r.defaultZoom = 0;
   r.defaultFocus = 0;
   r.defaultRotationOffset = 0;
   return r;
}


JsonSpecimenStore::JsonSpecimenStore(const std::string& directory,
      logging::Logger logger) :
   directory_(directory),
   logger_(logger)
{}


std::string
JsonSpecimenStore::PathFor(int specimen) const
{
   std::string filename = "specimen_" + std::to_string(specimen) + ".json";
   if (directory_.empty())
      return filename;
   if (directory_.back() == '/')
      return directory_ + filename;
   return directory_ + "/" + filename;
}


SpecimenRecord
JsonSpecimenStore::LoadSpecimen(int specimen)
{
   SpecimenRecord record = SpecimenRecord::Defaults(specimen);
   const std::string path = PathFor(specimen);

   std::ifstream in(path);
   if (!in)
   {
      LOG_DEBUG(logger_) << "No record file " << path << "; using defaults";
      return record;
   }

   nlohmann::json doc;
   try
   {
      doc = nlohmann::json::parse(in);
   }
   catch (const nlohmann::json::exception& e)
   {
      LOG_WARNING(logger_) << "Cannot parse " << path << ": " << e.what() <<
         "; using defaults";
      return record;
   }

   if (!doc.is_object())
   {
      LOG_WARNING(logger_) << path << " does not hold a JSON object; using defaults";
      return record;
   }

   record.name = StringField(doc, "name", record.name);
   record.location = StringField(doc, "location", record.location);
   record.collector = StringField(doc, "collector", record.collector);
   record.chem = StringField(doc, "chem", record.chem);
   record.mapImage = StringField(doc, "map_image", record.mapImage);
   record.edsImage = StringField(doc, "eds_image", record.edsImage);
   record.qrCodeImage = StringField(doc, "qr_code_image", record.qrCodeImage);
   record.defaultZoom = IntegerField(doc, "default_zoom");
   record.defaultFocus = IntegerField(doc, "default_focus");
   record.defaultRotationOffset = IntegerField(doc, "default_rotation_offset");

   LOG_INFO(logger_) << "Loaded " << path << " -> zoom=" << record.defaultZoom <<
      " focus=" << record.defaultFocus << " offset=" <<
      record.defaultRotationOffset;
   return record;
}

} // namespace scope
