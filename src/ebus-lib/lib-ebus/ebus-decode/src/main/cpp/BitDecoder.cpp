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

#include <cmath>

#include <rt/Logger.h>

#include <ebus/Bus.h>
#include <ebus/BitDecoder.h>

namespace ebus {

struct BitDecoder::Impl
{
   rt::Logger *log = rt::Logger::getLogger("ebus.BitDecoder");

   Source<EnvelopeSample> &input;

   // decoder parameters
   unsigned int sampleRate = EBUS_SAMPLE_RATE;
   unsigned int bitRate = EBUS_BIT_RATE;
   float signalThreshold = EBUS_SIGNAL_THRESHOLD;
   float jitterTolerance = EBUS_JITTER_TOLERANCE;
   unsigned int idleBits = EBUS_IDLE_BITS;

   // nominal bit period in samples
   double period = 0;

   // factor for level trackers release
   float levelW1 = 0;

   // envelope levels
   float high = 0;
   float low = 0;

   // classified line level
   unsigned int level = 0;

   // timing recovery status
   int state = Idle;
   double lastEdge = 0;
   double nextCenter = 0;
   unsigned int zeroRun = 0;
   bool syncPending = false;

   // statistics
   unsigned int resyncCount = 0;
   unsigned long long symbolCount = 0;

   explicit Impl(Source<EnvelopeSample> &input) : input(input)
   {
   }

   void initialize()
   {
      period = static_cast<double>(sampleRate) / bitRate;

      levelW1 = static_cast<float>(1.0 / (EBUS_LEVEL_TAU * sampleRate));

      high = 0;
      low = 0;
      level = 0;
      state = Idle;
      lastEdge = 0;
      nextCenter = 0;
      zeroRun = 0;
      syncPending = false;
      resyncCount = 0;
      symbolCount = 0;

      log->info("bit decoder, bit rate {} period {.2} samples, threshold {.3} jitter {.2} idle {} bits", {bitRate, period, signalThreshold, jitterTolerance, idleBits});
   }

   bool next(BitSymbol &symbol)
   {
      EnvelopeSample sample {};

      while (input.next(sample))
      {
         if (process(sample, symbol))
            return true;
      }

      return false;
   }

   bool process(const EnvelopeSample &sample, BitSymbol &symbol)
   {
      const float value = sample.value;

      // fast attack, slow release
      high = value > high ? value : high + (value - high) * levelW1;
      low = value < low ? value : low + (value - low) * levelW1;

      const float range = high - low;
      const bool present = range > signalThreshold;

      unsigned int current = level;

      if (!present)
      {
         current = 0;
      }
      else
      {
         const float middle = (high + low) / 2;
         const float hysteresis = range * EBUS_HYSTERESIS / 2;

         if (level == 0 && value > middle + hysteresis)
            current = 1;
         else if (level == 1 && value < middle - hysteresis)
            current = 0;
      }

      const bool edge = current != level;

      level = current;

      if (state == Idle)
      {
         if (edge && level == 1)
            lock(sample.clock);

         return false;
      }

      if (!present)
      {
         log->debug("signal lost at {}, {} symbols", {sample.clock, symbolCount});

         state = Idle;

         return false;
      }

      if (edge)
      {
         rephase(sample.clock);

         return false;
      }

      // sample at bit center
      if (sample.clock >= nextCenter)
      {
         symbol.value = level;
         symbol.start = static_cast<unsigned long long>(std::llround(nextCenter - period / 2));
         symbol.length = static_cast<unsigned int>(std::lround(period));
         symbol.flags = syncPending ? SyncStart : 0;

         syncPending = false;
         nextCenter += period;
         symbolCount++;

         if (level)
         {
            zeroRun = 0;
         }
         else if (++zeroRun >= idleBits)
         {
            log->trace("line idle at {}", {sample.clock});

            // this symbol and the zero run before it are idle line
            symbol.flags |= BurstEnd;

            state = Idle;
         }

         return true;
      }

      return false;
   }

   void lock(unsigned long long clock)
   {
      log->trace("symbol lock at {}", {clock});

      state = Locked;
      lastEdge = static_cast<double>(clock);
      nextCenter = lastEdge + period / 2;
      zeroRun = 0;
      syncPending = true;
   }

   void rephase(unsigned long long clock)
   {
      const double interval = static_cast<double>(clock) - lastEdge;
      const double bits = interval / period;
      const double count = std::round(bits);

      if (count < 1 || std::fabs(bits - count) > jitterTolerance)
      {
         log->debug("timing violation at {}, edge interval {.2} bits", {clock, bits});

         resyncCount++;
         syncPending = true;
      }

      lastEdge = static_cast<double>(clock);
      nextCenter = lastEdge + period / 2;
   }
};

BitDecoder::BitDecoder(Source<EnvelopeSample> &input) : impl(std::make_shared<Impl>(input))
{
   impl->initialize();
}

void BitDecoder::initialize()
{
   impl->initialize();
}

bool BitDecoder::next(BitSymbol &symbol)
{
   return impl->next(symbol);
}

unsigned int BitDecoder::sampleRate() const
{
   return impl->sampleRate;
}

void BitDecoder::setSampleRate(unsigned int sampleRate)
{
   impl->sampleRate = sampleRate;
}

unsigned int BitDecoder::bitRate() const
{
   return impl->bitRate;
}

void BitDecoder::setBitRate(unsigned int bitRate)
{
   impl->bitRate = bitRate;
}

float BitDecoder::signalThreshold() const
{
   return impl->signalThreshold;
}

void BitDecoder::setSignalThreshold(float value)
{
   impl->signalThreshold = value;
}

float BitDecoder::jitterTolerance() const
{
   return impl->jitterTolerance;
}

void BitDecoder::setJitterTolerance(float value)
{
   impl->jitterTolerance = value;
}

unsigned int BitDecoder::idleBits() const
{
   return impl->idleBits;
}

void BitDecoder::setIdleBits(unsigned int value)
{
   impl->idleBits = value;
}

int BitDecoder::state() const
{
   return impl->state;
}

unsigned int BitDecoder::resyncCount() const
{
   return impl->resyncCount;
}

unsigned long long BitDecoder::symbolCount() const
{
   return impl->symbolCount;
}

}
