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

#ifndef EBUS_BUSFRAME_H
#define EBUS_BUSFRAME_H

#include <rt/ByteBuffer.h>

namespace ebus {

/*
 * One bus frame: preamble, identifier, payload and checksum bytes
 */
class BusFrame : public rt::ByteBuffer
{
      struct Impl;

   public:

      BusFrame();

      explicit BusFrame(int size);

      BusFrame(std::initializer_list<unsigned char> data);

      BusFrame(const BusFrame &other);

      BusFrame &operator=(const BusFrame &other);

      bool operator==(const BusFrame &other) const;

      bool operator!=(const BusFrame &other) const;

      operator bool() const;

      bool isShortFrame() const;

      bool hasCrcError() const;

      unsigned int preamble() const;

      unsigned int identifier() const;

      unsigned int checksum() const;

      unsigned int frameFlags() const;

      void setFrameFlags(unsigned int frameFlags);

      void clearFrameFlags(unsigned int frameFlags);

      double timeStart() const;

      void setTimeStart(double timeStart);

      double timeEnd() const;

      void setTimeEnd(double timeEnd);

      double dateTime() const;

      void setDateTime(double dateTime);

      unsigned long long sampleStart() const;

      void setSampleStart(unsigned long long sampleStart);

      unsigned long long sampleEnd() const;

      void setSampleEnd(unsigned long long sampleEnd);

   private:

      std::shared_ptr<Impl> impl;
};

}

#endif
