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

#ifndef EBUS_BUSDECODER_H
#define EBUS_BUSDECODER_H

#include <memory>
#include <variant>
#include <vector>

#include <hw/SignalDevice.h>

#include <ebus/BusFrame.h>
#include <ebus/BusPacket.h>
#include <ebus/DecodedEvent.h>
#include <ebus/RuleTable.h>

namespace ebus {

// frame trace, assembled packet or decoded field
using BusRecord = std::variant<BusFrame, BusPacket, DecodedEvent>;

/*
 * Full decoding pipeline from raw samples to decoded records
 */
class BusDecoder
{
      struct Impl;

   public:

      explicit BusDecoder(hw::SignalDevice &device);

      // apply configuration and reset pipeline status, must be called before first record
      void initialize();

      // next record in stream order, false at end of samples
      bool nextRecord(BusRecord &record);

      // rule table, may be extended before initialize
      RuleTable &rules();

      unsigned int sampleRate() const;

      void setSampleRate(unsigned int sampleRate);

      unsigned int carrierFrequency() const;

      void setCarrierFrequency(unsigned int carrierFrequency);

      unsigned int bitRate() const;

      void setBitRate(unsigned int bitRate);

      float signalThreshold() const;

      void setSignalThreshold(float value);

      float jitterTolerance() const;

      void setJitterTolerance(float value);

      unsigned int idleBits() const;

      void setIdleBits(unsigned int value);

      unsigned int maxFrameSize() const;

      void setMaxFrameSize(unsigned int value);

      std::vector<unsigned int> preambles() const;

      void setPreambles(const std::vector<unsigned int> &preambles);

      void setFrameLength(unsigned int identifier, unsigned int payloadLength);

      unsigned long long sampleLimit() const;

      void setSampleLimit(unsigned long long sampleLimit);

      // samples consumed so far
      unsigned long long sampleCount() const;

      double streamTime() const;

      void setStreamTime(double streamTime);

      unsigned long long frameCount() const;

      unsigned long long crcErrorCount() const;

      unsigned long long packetCount() const;

      unsigned long long eventCount() const;

      unsigned int resyncCount() const;

   private:

      std::shared_ptr<Impl> impl;
};

}

#endif
