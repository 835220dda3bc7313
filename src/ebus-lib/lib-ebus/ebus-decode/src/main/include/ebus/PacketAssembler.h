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

#ifndef EBUS_PACKETASSEMBLER_H
#define EBUS_PACKETASSEMBLER_H

#include <memory>

#include <ebus/BusFrame.h>
#include <ebus/BusPacket.h>

namespace ebus {

/*
 * Transport header of a data frame
 */
struct TransportHeader
{
   // false for frames without transport control (short frames, link control)
   bool present;

   // source device id, 6 bits
   unsigned int device;

   // frame type, see TransportType
   unsigned int type;

   // sequence counter, 5 bits
   unsigned int counter;

   unsigned int reserved;
};

/*
 * Joins application data of consecutive data frames into packets, one partial packet per device
 */
class PacketAssembler
{
      struct Impl;

   public:

      PacketAssembler();

      static TransportHeader header(const BusFrame &frame);

      // returns true when frame completes a packet
      bool push(const BusFrame &frame, BusPacket &packet);

      void reset();

      // number of devices with an unfinished packet
      unsigned int pendingCount() const;

   private:

      std::shared_ptr<Impl> impl;
};

}

#endif
