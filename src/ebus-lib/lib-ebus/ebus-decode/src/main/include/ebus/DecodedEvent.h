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

#ifndef EBUS_DECODEDEVENT_H
#define EBUS_DECODEDEVENT_H

#include <string>
#include <vector>

#include <ebus/FieldValue.h>

namespace ebus {

struct DecodedEvent
{
   unsigned int identifier;
   unsigned int command;
   std::string name;
   FieldValue value;
   std::string unit;

   // false if any frame of the packet failed its checksum or sequence
   bool valid;

   double timeStart;
   double dateTime;
};

struct FieldError
{
   std::string field;
   std::string reason;
};

struct DecodeResult
{
   std::vector<DecodedEvent> events;
   std::vector<FieldError> errors;

   // a rule exists for the packet
   bool known = false;

   // rule is a known static packet without fields
   bool ignored = false;
};

}

#endif
