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

#ifndef EBUS_FRAMECHECK_H
#define EBUS_FRAMECHECK_H

#include <ebus/Bus.h>
#include <ebus/BusFrame.h>

namespace ebus {

class FrameCheck
{
   public:

      /*
       * Validate frame checksum, sets or clears CrcError flag and returns true if frame is verified.
       * Frames without payload carry no checksum and are flagged as ShortFrame instead.
       */
      static bool check(BusFrame &frame);

      /*
       * Checksum of bytes from identifier to last payload byte, register seeded with preamble
       */
      static unsigned int checksum(const unsigned char *data, unsigned int length);

      static unsigned int crc8(const unsigned char *data, unsigned int length, unsigned int init);
};

}

#endif
