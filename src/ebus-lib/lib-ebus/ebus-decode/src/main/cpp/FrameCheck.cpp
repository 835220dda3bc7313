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

#include <rt/Logger.h>

#include <ebus/FrameCheck.h>

namespace ebus {

static rt::Logger *logger = rt::Logger::getLogger("ebus.FrameCheck");

bool FrameCheck::check(BusFrame &frame)
{
   frame.clearFrameFlags(CrcError | ShortFrame);

   // preamble, identifier and one trailing byte but no payload, nothing to verify
   if (frame.limit() <= 3)
   {
      frame.setFrameFlags(ShortFrame);
      return false;
   }

   unsigned int crc = checksum(frame.data(), frame.limit() - 1);

   if (crc != frame.checksum())
   {
      logger->debug("checksum error in frame {}, expected {02x} found {02x}", {static_cast<const rt::ByteBuffer &>(frame), crc, frame.checksum()});

      frame.setFrameFlags(CrcError);

      return false;
   }

   return true;
}

unsigned int FrameCheck::checksum(const unsigned char *data, unsigned int length)
{
   // register seed absorbs the preamble, remaining bytes are covered by the checksum
   unsigned int init = crc8(data, 1, EBUS_CRC_SEED);

   return crc8(data + 1, length - 1, init);
}

unsigned int FrameCheck::crc8(const unsigned char *data, unsigned int length, unsigned int init)
{
   unsigned int crc = init & 0xff;

   for (unsigned int i = 0; i < length; i++)
   {
      crc ^= data[i];

      for (int b = 0; b < 8; b++)
      {
         crc = (crc & 0x80) ? ((crc << 1) ^ EBUS_CRC_POLY) : (crc << 1);
      }

      crc &= 0xff;
   }

   return crc;
}

}
