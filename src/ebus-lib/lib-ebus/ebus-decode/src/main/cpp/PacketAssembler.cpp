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

#include <map>
#include <vector>

#include <rt/Logger.h>

#include <ebus/Bus.h>
#include <ebus/PacketAssembler.h>

namespace ebus {

// offset of transport control byte and application data within a data frame
constexpr unsigned int TRANSPORT_OFFSET = 3;
constexpr unsigned int DATA_OFFSET = 4;
constexpr unsigned int DATA_LENGTH = 3;

struct PartialPacket
{
   std::vector<unsigned char> data;
   unsigned int counter = 0;
   unsigned int flags = 0;
   unsigned int frames = 0;
   double timeStart = 0;
   double dateTime = 0;
};

struct PacketAssembler::Impl
{
   rt::Logger *log = rt::Logger::getLogger("ebus.PacketAssembler");

   std::map<unsigned int, PartialPacket> partials;

   bool push(const BusFrame &frame, BusPacket &packet)
   {
      TransportHeader header = PacketAssembler::header(frame);

      if (!header.present)
         return false;

      switch (header.type)
      {
         case FirstFrame:
         {
            if (partials.count(header.device))
               log->debug("device {02x}, unfinished packet replaced", {header.device});

            PartialPacket &partial = partials[header.device] = start(frame, header);

            partial.frames = 1;

            return false;
         }

         case ConsecutiveFrame:
         case LastFrame:
         {
            auto it = partials.find(header.device);

            if (it == partials.end())
            {
               log->trace("device {02x}, frame without first frame ignored", {header.device});
               return false;
            }

            PartialPacket &partial = it->second;

            if (header.counter != ((partial.counter + 1) & 0x1f))
            {
               log->debug("device {02x}, sequence counter {} after {}", {header.device, header.counter, partial.counter});

               partial.flags |= SequenceError;
            }

            append(partial, frame, header);

            if (partial.data.size() > EBUS_MAX_PACKET_SIZE)
            {
               log->warn("device {02x}, packet exceeds {} bytes, dropped", {header.device, EBUS_MAX_PACKET_SIZE});

               partials.erase(it);

               return false;
            }

            if (header.type == ConsecutiveFrame)
               return false;

            packet = build(header.device, partial, frame);

            partials.erase(it);

            return true;
         }

         case SingleFrame:
         {
            partials.erase(header.device);

            PartialPacket single = start(frame, header);

            single.frames = 1;

            packet = build(header.device, single, frame);

            return true;
         }

         default:
            return false;
      }
   }

   static PartialPacket start(const BusFrame &frame, const TransportHeader &header)
   {
      PartialPacket partial;

      partial.data.assign(frame.data() + DATA_OFFSET, frame.data() + DATA_OFFSET + DATA_LENGTH);
      partial.counter = header.counter;
      partial.flags = frame.hasCrcError() ? CrcError : 0;
      partial.timeStart = frame.timeStart();
      partial.dateTime = frame.dateTime();

      return partial;
   }

   static void append(PartialPacket &partial, const BusFrame &frame, const TransportHeader &header)
   {
      partial.data.insert(partial.data.end(), frame.data() + DATA_OFFSET, frame.data() + DATA_OFFSET + DATA_LENGTH);
      partial.counter = header.counter;
      partial.frames++;

      if (frame.hasCrcError())
         partial.flags |= CrcError;
   }

   static BusPacket build(unsigned int device, const PartialPacket &partial, const BusFrame &last)
   {
      BusPacket packet(device);

      packet.put(partial.data.data(), partial.data.size());
      packet.flip();

      packet.setFrameFlags(partial.flags);
      packet.setFrameCount(partial.frames);
      packet.setTimeStart(partial.timeStart);
      packet.setTimeEnd(last.timeEnd());
      packet.setDateTime(partial.dateTime);

      return packet;
   }
};

PacketAssembler::PacketAssembler() : impl(std::make_shared<Impl>())
{
}

TransportHeader PacketAssembler::header(const BusFrame &frame)
{
   TransportHeader header {false, 0, 0, 0, 0};

   if (frame.limit() != EBUS_DATA_FRAME_SIZE)
      return header;

   switch (frame.preamble())
   {
      case Broadcast:
         // display broadcast carries the device id in first payload byte
         header.device = frame.identifier() == BROADCAST_ID ? frame[2] & 0x3f : frame.identifier() & 0x3f;
         break;

      case Reply:
         header.device = frame.identifier() & 0x3f;
         break;

      default:
         return header;
   }

   const unsigned int control = frame[TRANSPORT_OFFSET];

   header.present = true;
   header.type = (control >> 6) & 0x03;
   header.reserved = (control >> 5) & 0x01;
   header.counter = control & 0x1f;

   return header;
}

bool PacketAssembler::push(const BusFrame &frame, BusPacket &packet)
{
   return impl->push(frame, packet);
}

void PacketAssembler::reset()
{
   impl->partials.clear();
}

unsigned int PacketAssembler::pendingCount() const
{
   return static_cast<unsigned int>(impl->partials.size());
}

}
