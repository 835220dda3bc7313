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

#ifndef EBUS_BUSPACKET_H
#define EBUS_BUSPACKET_H

#include <rt/ByteBuffer.h>

namespace ebus {

/*
 * Application data of one device, joined from one or more data frames
 */
class BusPacket : public rt::ByteBuffer
{
      struct Impl;

   public:

      BusPacket();

      explicit BusPacket(unsigned int identifier);

      BusPacket(unsigned int identifier, std::initializer_list<unsigned char> data);

      BusPacket(const BusPacket &other);

      BusPacket &operator=(const BusPacket &other);

      operator bool() const;

      bool hasCrcError() const;

      bool hasSequenceError() const;

      unsigned int identifier() const;

      // first two data bytes, big endian, -1 if packet is shorter
      int command() const;

      unsigned int frameFlags() const;

      void setFrameFlags(unsigned int frameFlags);

      unsigned int frameCount() const;

      void setFrameCount(unsigned int frameCount);

      double timeStart() const;

      void setTimeStart(double timeStart);

      double timeEnd() const;

      void setTimeEnd(double timeEnd);

      double dateTime() const;

      void setDateTime(double dateTime);

   private:

      std::shared_ptr<Impl> impl;
};

}

#endif
