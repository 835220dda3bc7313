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
#include <ebus/BusPacket.h>

namespace ebus {

struct BusPacket::Impl
{
   unsigned int identifier = 0;
   unsigned int frameFlags = 0;
   unsigned int frameCount = 0;
   double timeStart = 0;
   double timeEnd = 0;
   double dateTime = 0;
};

BusPacket::BusPacket() : rt::ByteBuffer(), impl(std::make_shared<Impl>())
{
}

BusPacket::BusPacket(unsigned int identifier) : rt::ByteBuffer(EBUS_MAX_PACKET_SIZE), impl(std::make_shared<Impl>())
{
   impl->identifier = identifier;
}

BusPacket::BusPacket(unsigned int identifier, std::initializer_list<unsigned char> data) : rt::ByteBuffer(data), impl(std::make_shared<Impl>())
{
   impl->identifier = identifier;
   impl->frameCount = 1;
}

BusPacket::BusPacket(const BusPacket &other) : rt::ByteBuffer(other)
{
   impl = other.impl;
}

BusPacket &BusPacket::operator=(const BusPacket &other)
{
   if (this == &other)
      return *this;

   rt::ByteBuffer::operator=(other);

   impl = other.impl;

   return *this;
}

BusPacket::operator bool() const
{
   return Buffer::operator bool();
}

bool BusPacket::hasCrcError() const
{
   return impl->frameFlags & FrameFlags::CrcError;
}

bool BusPacket::hasSequenceError() const
{
   return impl->frameFlags & FrameFlags::SequenceError;
}

unsigned int BusPacket::identifier() const
{
   return impl->identifier;
}

int BusPacket::command() const
{
   if (limit() < 2)
      return -1;

   return static_cast<int>(peekInt(0, 2, BigEndian));
}

unsigned int BusPacket::frameFlags() const
{
   return impl->frameFlags;
}

void BusPacket::setFrameFlags(unsigned int frameFlags)
{
   impl->frameFlags |= frameFlags;
}

unsigned int BusPacket::frameCount() const
{
   return impl->frameCount;
}

void BusPacket::setFrameCount(unsigned int frameCount)
{
   impl->frameCount = frameCount;
}

double BusPacket::timeStart() const
{
   return impl->timeStart;
}

void BusPacket::setTimeStart(double timeStart)
{
   impl->timeStart = timeStart;
}

double BusPacket::timeEnd() const
{
   return impl->timeEnd;
}

void BusPacket::setTimeEnd(double timeEnd)
{
   impl->timeEnd = timeEnd;
}

double BusPacket::dateTime() const
{
   return impl->dateTime;
}

void BusPacket::setDateTime(double dateTime)
{
   impl->dateTime = dateTime;
}

}
