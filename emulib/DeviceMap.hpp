//++
// DeviceMap.hpp -> Device Code to Device Mapping class
//
//   COPYRIGHT (C) 2015-2025 BY SPARE TIME GIZMOS.  ALL RIGHTS RESERVED.
//
// LICENSE:
//    This file is part of the emulator library project.  EMULIB is free
// software; you may redistribute it and/or modify it under the terms of
// the GNU Affero General Public License as published by the Free Software
// Foundation, either version 3 of the License, or (at your option) any
// later version.
//
//    EMULIB is distributed in the hope that it will be useful, but WITHOUT
// ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE.  See the GNU Affero General Public License
// for more details.  You should have received a copy of the GNU Affero General
// Public License along with EMULIB.  If not, see http://www.gnu.org/licenses/.
//
// DESCRIPTION:
//   A CDeviceMap object is a container for a set of CDevice objects, keyed
// by their device codes.  This is the "device bus" that the XIO instruction
// uses to find the device addressed by an IOCC.  The map OWNS the devices
// installed in it - Remove() and RemoveAll() delete them!
//
// REVISION HISTORY:
//  4-JUL-22  RLA   Split out of CCPU ...
//  3-MAR-25  RLA   One device per code; drop the port ranges and unique set.
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include <string>               // C++ string functions
#include <map>                  // C++ std::map template
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Device.hpp"           // CDevice class delcarations
using std::string;              // ...
using std::map;                 // ...
using std::pair;                // ...


class CDeviceMap {
  //++
  // Map device codes to devices ...
  //--

  // Constructors and destructors...
public:
  CDeviceMap() {m_Map.clear();}
  virtual ~CDeviceMap() {RemoveAll();}
private:
  // Disallow copy and assignments!
  CDeviceMap (const CDeviceMap&) = delete;
  CDeviceMap& operator= (CDeviceMap const &) = delete;

  // Special types ...
public:
  typedef map<address_t, CDevice *> DEVICE_MAP;
  typedef DEVICE_MAP::iterator MAP_ITERATOR;
  typedef DEVICE_MAP::const_iterator CONST_MAP_ITERATOR;

  // CDeviceMap iterators ...
public:
  inline MAP_ITERATOR       MapBegin() {return m_Map.begin();}
  inline MAP_ITERATOR       MapEnd()   {return m_Map.end();}
  inline CONST_MAP_ITERATOR MapBegin() const {return m_Map.begin();}
  inline CONST_MAP_ITERATOR MapEnd()   const {return m_Map.end();}

  // CDeviceMap properties ...
public:
  // Find a device by name or device code ...
  CDevice *Find (const string sName) const;
  CDevice *Find (address_t nDevice) const;
  // Test whether any device is installed with the given code ...
  bool IsInstalled (address_t nDevice) const {return Find(nDevice) != NULL;}
  // Test whether a particular device is already installed ...
  bool IsInstalled (const CDevice *pDevice) const;
  // Return the total number of devices installed ...
  address_t GetCount() const {return (address_t) m_Map.size();}

  // CDeviceMap device methods ...
public:
  // Add a device to the map using its own device code ...
  bool Install (CDevice *pDevice);
  // Remove (and delete!) a device ...
  bool Remove (address_t nDevice);
  // Remove (and delete) ALL devices from the map ...
  void RemoveAll();
  // Call the ClearDevice() method for all devices in the map ...
  void ClearAll() const;

  // Private member data...
protected:
  DEVICE_MAP  m_Map;          // mapping of device codes to device pointers
};
