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

#ifndef EBUS_FIELDVALUE_H
#define EBUS_FIELDVALUE_H

#include <chrono>
#include <string>
#include <variant>

namespace ebus {

/*
 * Calendar date and time as reported by the display, no time zone
 */
struct DateTime
{
   int year;
   int month;
   int day;
   int hour;
   int minute;
   int second;

   bool operator==(const DateTime &other) const
   {
      return year == other.year && month == other.month && day == other.day && hour == other.hour && minute == other.minute && second == other.second;
   }

   bool operator!=(const DateTime &other) const
   {
      return !operator==(other);
   }
};

// integer, real, label, date time or duration
using FieldValue = std::variant<long long, double, std::string, DateTime, std::chrono::seconds>;

}

#endif
