/*

  Copyright (c) 2021 Jose Vicente Campos Martinez - <josevcm@gmail.com>

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.

*/

#ifndef EBUS_PACKETRULE_H
#define EBUS_PACKETRULE_H

#include <map>
#include <string>
#include <vector>

#include <rt/ByteBuffer.h>

namespace ebus {

enum FieldTransform
{
   // raw unsigned integer
   IntegerField = 0,

   // integer multiplied by scale factor
   ScaledField = 1,

   // bit field mapped to label
   EnumField = 2,

   // six bytes: year since 2000, month, day, hour, minute, second
   DateTimeField = 3,

   // integer percentage
   PercentField = 4,

   // integer count of unitSeconds
   DurationField = 5,

   // switch byte, stateful press / hold / release transitions
   ButtonField = 6
};

struct FieldExtractor
{
   std::string name;

   // byte range within packet
   unsigned int offset = 0;
   unsigned int width = 1;

   FieldTransform transform = IntegerField;

   rt::ByteBuffer::Endianness endian = rt::ByteBuffer::LittleEndian;

   double scale = 1;

   std::string unit;

   // enum extraction, (value >> shift) & mask, mask 0 means full value
   unsigned int shift = 0;
   unsigned int mask = 0;
   std::map<long long, std::string> labels;

   // seconds per integer unit for durations
   long long unitSeconds = 60;
};

struct PacketRule
{
   // matches any command of the identifier
   static constexpr int AnyCommand = -1;

   std::string name;

   // device id
   unsigned int identifier = 0;

   // first two packet bytes, big endian
   int command = AnyCommand;

   // exact packet contents, when not empty the rule only applies to identical packets
   std::vector<unsigned char> match;

   std::vector<FieldExtractor> fields;
};

}

#endif
