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

#include <deque>

#include <rt/Logger.h>

#include <ebus/Bus.h>
#include <ebus/BusDecoder.h>
#include <ebus/EnvelopeDetector.h>
#include <ebus/BitDecoder.h>
#include <ebus/FrameSync.h>
#include <ebus/PacketAssembler.h>
#include <ebus/PacketDecoder.h>
#include <ebus/DecoderContext.h>

namespace ebus {

struct BusDecoder::Impl
{
   rt::Logger *log = rt::Logger::getLogger("ebus.BusDecoder");

   // rule table, read only once decoding starts
   RuleTable table = RuleTable::standard();

   // pipeline stages
   EnvelopeDetector envelope;
   BitDecoder bits;
   FrameSync sync;
   PacketAssembler assembler;
   PacketDecoder decoder;

   // button states, recreated on initialize
   std::unique_ptr<DecoderContext> context;

   // records ready for delivery
   std::deque<BusRecord> pending;

   unsigned long long packetCount = 0;
   unsigned long long eventCount = 0;

   explicit Impl(hw::SignalDevice &device) : envelope(device), bits(envelope), sync(bits)
   {
      rt::Variant sampleRate = device.get(hw::SignalDevice::PARAM_SAMPLE_RATE, -1);
      rt::Variant streamTime = device.get(hw::SignalDevice::PARAM_STREAM_TIME, -1);

      // device parameters are the defaults
      if (auto rate = std::get_if<unsigned int>(&sampleRate))
         setSampleRate(*rate);

      if (auto time = std::get_if<long long>(&streamTime))
         sync.setStreamTime(static_cast<double>(*time));
   }

   void setSampleRate(unsigned int sampleRate)
   {
      envelope.setSampleRate(sampleRate);
      bits.setSampleRate(sampleRate);
      sync.setSampleRate(sampleRate);
   }

   void initialize()
   {
      envelope.initialize();
      bits.initialize();
      sync.initialize();
      assembler.reset();
      pending.clear();

      context = std::make_unique<DecoderContext>(table);

      packetCount = 0;
      eventCount = 0;

      log->info("decoder initialized with {} rules", {table.size()});
   }

   bool nextRecord(BusRecord &record)
   {
      while (pending.empty())
      {
         BusFrame frame;

         if (!sync.next(frame))
         {
            log->info("end of stream: {} frames, {} checksum errors, {} packets, {} events, {} resyncs", {sync.frameCount(), sync.crcErrorCount(), packetCount, eventCount, bits.resyncCount()});

            return false;
         }

         pending.emplace_back(frame);

         BusPacket packet;

         if (assembler.push(frame, packet))
         {
            packetCount++;

            pending.emplace_back(packet);

            DecodeResult result = decoder.decode(*context, packet);

            for (auto &event: result.events)
            {
               eventCount++;

               pending.emplace_back(event);
            }
         }
      }

      record = pending.front();

      pending.pop_front();

      return true;
   }
};

BusDecoder::BusDecoder(hw::SignalDevice &device) : impl(std::make_shared<Impl>(device))
{
   impl->initialize();
}

void BusDecoder::initialize()
{
   impl->initialize();
}

bool BusDecoder::nextRecord(BusRecord &record)
{
   return impl->nextRecord(record);
}

RuleTable &BusDecoder::rules()
{
   return impl->table;
}

unsigned int BusDecoder::sampleRate() const
{
   return impl->envelope.sampleRate();
}

void BusDecoder::setSampleRate(unsigned int sampleRate)
{
   impl->setSampleRate(sampleRate);
}

unsigned int BusDecoder::carrierFrequency() const
{
   return impl->envelope.carrierFrequency();
}

void BusDecoder::setCarrierFrequency(unsigned int carrierFrequency)
{
   impl->envelope.setCarrierFrequency(carrierFrequency);
}

unsigned int BusDecoder::bitRate() const
{
   return impl->bits.bitRate();
}

void BusDecoder::setBitRate(unsigned int bitRate)
{
   impl->bits.setBitRate(bitRate);
}

float BusDecoder::signalThreshold() const
{
   return impl->bits.signalThreshold();
}

void BusDecoder::setSignalThreshold(float value)
{
   impl->bits.setSignalThreshold(value);
}

float BusDecoder::jitterTolerance() const
{
   return impl->bits.jitterTolerance();
}

void BusDecoder::setJitterTolerance(float value)
{
   impl->bits.setJitterTolerance(value);
}

unsigned int BusDecoder::idleBits() const
{
   return impl->bits.idleBits();
}

void BusDecoder::setIdleBits(unsigned int value)
{
   impl->bits.setIdleBits(value);
}

unsigned int BusDecoder::maxFrameSize() const
{
   return impl->sync.maxFrameSize();
}

void BusDecoder::setMaxFrameSize(unsigned int value)
{
   impl->sync.setMaxFrameSize(value);
}

std::vector<unsigned int> BusDecoder::preambles() const
{
   return impl->sync.preambles();
}

void BusDecoder::setPreambles(const std::vector<unsigned int> &preambles)
{
   impl->sync.setPreambles(preambles);
}

void BusDecoder::setFrameLength(unsigned int identifier, unsigned int payloadLength)
{
   impl->sync.setFrameLength(identifier, payloadLength);
}

unsigned long long BusDecoder::sampleLimit() const
{
   return impl->envelope.sampleLimit();
}

void BusDecoder::setSampleLimit(unsigned long long sampleLimit)
{
   impl->envelope.setSampleLimit(sampleLimit);
}

unsigned long long BusDecoder::sampleCount() const
{
   return impl->envelope.sampleCount();
}

double BusDecoder::streamTime() const
{
   return impl->sync.streamTime();
}

void BusDecoder::setStreamTime(double streamTime)
{
   impl->sync.setStreamTime(streamTime);
}

unsigned long long BusDecoder::frameCount() const
{
   return impl->sync.frameCount();
}

unsigned long long BusDecoder::crcErrorCount() const
{
   return impl->sync.crcErrorCount();
}

unsigned long long BusDecoder::packetCount() const
{
   return impl->packetCount;
}

unsigned long long BusDecoder::eventCount() const
{
   return impl->eventCount;
}

unsigned int BusDecoder::resyncCount() const
{
   return impl->bits.resyncCount();
}

}
