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

#ifndef EBUS_BUS_H
#define EBUS_BUS_H

// Sample rate of the raw capture in Hz
constexpr unsigned int EBUS_SAMPLE_RATE = 5000000;

// Frequency of the bus carrier in Hz
constexpr unsigned int EBUS_CARRIER_FREQUENCY = 1000000;

// Line bit rate in bits per second
constexpr unsigned int EBUS_BIT_RATE = 500000;

// Minimum envelope swing to consider carrier modulation present
constexpr float EBUS_SIGNAL_THRESHOLD = 0.05f;

// Maximum fractional bit error accepted between two edges
constexpr float EBUS_JITTER_TOLERANCE = 0.35f;

// Bit periods without carrier before losing symbol lock
constexpr unsigned int EBUS_IDLE_BITS = 72;

// Time constant of envelope baseline tracking, in seconds
constexpr float EBUS_BASELINE_TAU = 1E-3;

// Time constant of envelope level trackers, in seconds
constexpr float EBUS_LEVEL_TAU = 200E-6;

// Threshold hysteresis, fraction of the envelope swing
constexpr float EBUS_HYSTERESIS = 0.10f;

// Maximum frame size, preamble and checksum included
constexpr unsigned int EBUS_MAX_FRAME_SIZE = 16;

// Maximum number of frame candidates tracked at the same time
constexpr unsigned int EBUS_MAX_CANDIDATES = 8;

// Payload bytes of a data frame
constexpr unsigned int EBUS_DATA_PAYLOAD = 5;

// Total size of a data frame
constexpr unsigned int EBUS_DATA_FRAME_SIZE = EBUS_DATA_PAYLOAD + 3;

// Maximum size of a reassembled packet
constexpr unsigned int EBUS_MAX_PACKET_SIZE = 64;

// CRC-8 polynomial x^8 + x^2 + x + 1
constexpr unsigned char EBUS_CRC_POLY = 0x07;

// CRC-8 register seed, applied before the preamble byte
constexpr unsigned char EBUS_CRC_SEED = 0x6F;

namespace ebus {

enum Preamble
{
   Broadcast = 0xCC,
   Reply = 0xCE,
   LinkControl = 0xCF
};

enum FrameFlags
{
   CrcError = 1 << 0,
   ShortFrame = 1 << 1,
   SequenceError = 1 << 2
};

enum SymbolFlags
{
   SyncStart = 1 << 0,
   BurstEnd = 1 << 1
};

enum TransportType
{
   ConsecutiveFrame = 0,
   LastFrame = 1,
   FirstFrame = 2,
   SingleFrame = 3
};

// identifier sent by the display in broadcast frames, real device id goes in first payload byte
constexpr unsigned int BROADCAST_ID = 0x40;

}

#endif
