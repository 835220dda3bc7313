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

#include <ebus/Bus.h>
#include <ebus/BusFrame.h>

namespace ebus {

struct BusFrame::Impl
{
   unsigned int frameFlags = 0;
   unsigned long long sampleStart = 0;
   unsigned long long sampleEnd = 0;
   double timeStart = 0;
   double timeEnd = 0;
   double dateTime = 0;
};

BusFrame::BusFrame() : rt::ByteBuffer(), impl(std::make_shared<Impl>())
{
}

BusFrame::BusFrame(int size) : rt::ByteBuffer(size), impl(std::make_shared<Impl>())
{
}

BusFrame::BusFrame(std::initializer_list<unsigned char> data) : rt::ByteBuffer(data), impl(std::make_shared<Impl>())
{
}

BusFrame::BusFrame(const BusFrame &other) : rt::ByteBuffer(other)
{
   impl = other.impl;
}

BusFrame &BusFrame::operator=(const BusFrame &other)
{
   if (this == &other)
      return *this;

   rt::ByteBuffer::operator=(other);

   impl = other.impl;

   return *this;
}

bool BusFrame::operator==(const BusFrame &other) const
{
   if (this == &other)
      return true;

   if (impl->frameFlags != other.impl->frameFlags ||
       impl->sampleStart != other.impl->sampleStart ||
       impl->sampleEnd != other.impl->sampleEnd)
      return false;

   return rt::ByteBuffer::operator==(other);
}

bool BusFrame::operator!=(const BusFrame &other) const
{
   return !operator==(other);
}

BusFrame::operator bool() const
{
   return Buffer::operator bool();
}

bool BusFrame::isShortFrame() const
{
   return impl->frameFlags & FrameFlags::ShortFrame;
}

bool BusFrame::hasCrcError() const
{
   return impl->frameFlags & FrameFlags::CrcError;
}

unsigned int BusFrame::preamble() const
{
   return limit() > 0 ? (*this)[0] : 0;
}

unsigned int BusFrame::identifier() const
{
   return limit() > 1 ? (*this)[1] : 0;
}

unsigned int BusFrame::checksum() const
{
   return limit() > 0 ? (*this)[limit() - 1] : 0;
}

unsigned int BusFrame::frameFlags() const
{
   return impl->frameFlags;
}

void BusFrame::setFrameFlags(unsigned int frameFlags)
{
   impl->frameFlags |= frameFlags;
}

void BusFrame::clearFrameFlags(unsigned int frameFlags)
{
   impl->frameFlags &= ~frameFlags;
}

double BusFrame::timeStart() const
{
   return impl->timeStart;
}

void BusFrame::setTimeStart(double timeStart)
{
   impl->timeStart = timeStart;
}

double BusFrame::timeEnd() const
{
   return impl->timeEnd;
}

void BusFrame::setTimeEnd(double timeEnd)
{
   impl->timeEnd = timeEnd;
}

double BusFrame::dateTime() const
{
   return impl->dateTime;
}

void BusFrame::setDateTime(double dateTime)
{
   impl->dateTime = dateTime;
}

unsigned long long BusFrame::sampleStart() const
{
   return impl->sampleStart;
}

void BusFrame::setSampleStart(unsigned long long sampleStart)
{
   impl->sampleStart = sampleStart;
}

unsigned long long BusFrame::sampleEnd() const
{
   return impl->sampleEnd;
}

void BusFrame::setSampleEnd(unsigned long long sampleEnd)
{
   impl->sampleEnd = sampleEnd;
}

}
