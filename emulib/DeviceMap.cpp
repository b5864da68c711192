//++
// DeviceMap.cpp -> Device Code to Device Mapping class
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
//   The 1130 has exactly one device per device code (well, more or less -
// real hardware has a few multi-unit devices, but we don't emulate those),
// so a simple std::map from code to device is all we need here.  The map
// is sorted by device code, which makes the "show devices" output neat.
//
//   Once a device is installed, the map owns it.  Removing a device, either
// explicitly or by destroying the map, deletes the CDevice object too.
//
// REVISION HISTORY:
//  4-JUL-22  RLA   Split out of CCPU ...
//  5-JUL-22  RLA   Revise to use map rather than vector ...
//  3-MAR-25  RLA   One device per code and the map owns its devices.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdlib.h>             // exit(), system(), etc ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <assert.h>             // assert() (what else??)
#include <map>                  // C++ std::map template
#include "EMULIB.hpp"           // emulator library definitions
#include "LogFile.hpp"          // emulator library message logging facility
#include "MemoryTypes.h"        // address_t and word_t data types
#include "Device.hpp"           // basic I/O device emulation declarations ...
#include "DeviceMap.hpp"        // declarations for this module


CDevice *CDeviceMap::Find (address_t nDevice) const
{
  //++
  //   Return a pointer to the device with the specified code, or NULL if
  // nothing is installed there ...
  //--
  CONST_MAP_ITERATOR it = m_Map.find(nDevice);
  return (it == MapEnd()) ? NULL : it->second;
}

CDevice *CDeviceMap::Find (const string sName) const
{
  //++
  // Search the map for a device with this name ...
  //--
  for (CONST_MAP_ITERATOR it = MapBegin();  it != MapEnd();  ++it) {
    if (it->second->GetName() == sName) return it->second;
  }
  return NULL;
}

bool CDeviceMap::IsInstalled (const CDevice *pDevice) const
{
  //++
  // Return TRUE if pDevice is in the map ...
  //--
  for (CONST_MAP_ITERATOR it = MapBegin();  it != MapEnd();  ++it)
    if (it->second == pDevice) return true;
  return false;
}

bool CDeviceMap::Install (CDevice *pDevice)
{
  //++
  //   Install the device using its own device code.  If some other device
  // already has that code then return FALSE and do nothing.  In that case
  // the caller still owns pDevice!
  //--
  assert(pDevice != NULL);
  address_t nDevice = pDevice->GetDeviceCode();
  if (IsInstalled(nDevice)) {
    LOGF(ERROR, "device code %02X already assigned to %s", nDevice, Find(nDevice)->GetName());
    return false;
  }
  m_Map.insert(pair<address_t, CDevice *>(nDevice, pDevice));
  LOGF(DEBUG, "device %s installed at code %02X", pDevice->GetName(), nDevice);
  return true;
}

bool CDeviceMap::Remove (address_t nDevice)
{
  //++
  //   Remove and delete the device with this code.  Returns FALSE if there
  // was no such device ...
  //--
  MAP_ITERATOR it = m_Map.find(nDevice);
  if (it == MapEnd()) return false;
  CDevice *pDevice = it->second;
  m_Map.erase(it);
  delete pDevice;
  return true;
}

void CDeviceMap::RemoveAll()
{
  //++
  // Remove and delete every device ...
  //--
  for (MAP_ITERATOR it = MapBegin();  it != MapEnd();  ++it)
    delete it->second;
  m_Map.clear();
}

void CDeviceMap::ClearAll() const
{
  //++
  // Call the ClearDevice() method for every device in the map ...
  //--
  for (CONST_MAP_ITERATOR it = MapBegin();  it != MapEnd();  ++it)
    it->second->ClearDevice();
}
