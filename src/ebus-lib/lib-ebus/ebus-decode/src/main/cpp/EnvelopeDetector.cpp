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

#include <hw/SignalType.h>

#include <ebus/Bus.h>
#include <ebus/EnvelopeDetector.h>

// moving average ring size, must be power of 2^n
#define WINDOW_BUFFER 64

namespace ebus {

struct EnvelopeDetector::Impl
{
   rt::Logger *log = rt::Logger::getLogger("ebus.EnvelopeDetector");

   hw::SignalDevice &device;

   unsigned int blockSize;
   unsigned int sampleRate = EBUS_SAMPLE_RATE;
   unsigned int carrierFrequency = EBUS_CARRIER_FREQUENCY;
   unsigned long long sampleLimit = 0;

   // current sample block
   hw::SignalBuffer block;

   // stream status
   bool eof = false;
   bool primed = false;
   unsigned long long clock = 0;

   // factors for exponential baseline
   float baselineW0 = 0;
   float baselineW1 = 0;
   float baseline = 0;

   // moving average over one carrier period
   unsigned int window = 0;
   double windowSum = 0;
   float windowData[WINDOW_BUFFER] {0,};

   Impl(hw::SignalDevice &device, unsigned int blockSize) : device(device), blockSize(blockSize)
   {
   }

   void initialize()
   {
      window = static_cast<unsigned int>(std::lround(static_cast<double>(sampleRate) / carrierFrequency));

      if (window < 1)
         window = 1;

      if (window > WINDOW_BUFFER)
         window = WINDOW_BUFFER;

      baselineW1 = static_cast<float>(1.0 / (EBUS_BASELINE_TAU * sampleRate));
      baselineW0 = 1.0f - baselineW1;

      eof = false;
      primed = false;
      clock = 0;
      baseline = 0;
      windowSum = 0;
      block = {};

      for (auto &v: windowData)
         v = 0;

      log->info("envelope detector, sample rate {} carrier {} window {} samples", {sampleRate, carrierFrequency, window});
   }

   bool next(EnvelopeSample &sample)
   {
      if (sampleLimit && clock >= sampleLimit)
      {
         if (!eof)
            log->info("sample limit {} reached", {sampleLimit});

         eof = true;

         return false;
      }

      if (!block || block.isEmpty())
      {
         if (eof || !refill())
            return false;
      }

      float value = block.get();

      // start baseline at first sample to avoid a long settle transient
      if (!primed)
      {
         baseline = value;
         primed = true;
      }

      // slow DC tracking
      baseline = baseline * baselineW0 + value * baselineW1;

      // rectify and integrate over one carrier period
      float rectified = std::fabs(value - baseline);

      unsigned int index = clock & (WINDOW_BUFFER - 1);
      unsigned int delay = (clock - window) & (WINDOW_BUFFER - 1);

      windowData[index] = rectified;
      windowSum += rectified;

      if (clock >= window)
         windowSum -= windowData[delay];

      sample.value = static_cast<float>(windowSum / window);
      sample.clock = clock++;

      return true;
   }

   bool refill()
   {
      hw::SignalBuffer buffer(blockSize, sampleRate, clock, hw::SIGNAL_TYPE_RAW_SAMPLES);

      long samples = device.read(buffer);

      if (samples <= 0)
      {
         log->info("end of sample stream after {} samples", {clock});
         eof = true;
         return false;
      }

      if (buffer.sampleRate() && buffer.sampleRate() != sampleRate)
         log->warn("device sample rate {} does not match configured rate {}", {buffer.sampleRate(), sampleRate});

      block = buffer;

      return true;
   }
};

EnvelopeDetector::EnvelopeDetector(hw::SignalDevice &device, unsigned int blockSize) : impl(std::make_shared<Impl>(device, blockSize))
{
   impl->initialize();
}

void EnvelopeDetector::initialize()
{
   impl->initialize();
}

bool EnvelopeDetector::next(EnvelopeSample &sample)
{
   return impl->next(sample);
}

unsigned int EnvelopeDetector::sampleRate() const
{
   return impl->sampleRate;
}

void EnvelopeDetector::setSampleRate(unsigned int sampleRate)
{
   impl->sampleRate = sampleRate;
}

unsigned int EnvelopeDetector::carrierFrequency() const
{
   return impl->carrierFrequency;
}

void EnvelopeDetector::setCarrierFrequency(unsigned int carrierFrequency)
{
   impl->carrierFrequency = carrierFrequency;
}

unsigned int EnvelopeDetector::windowSize() const
{
   return impl->window;
}

unsigned long long EnvelopeDetector::sampleCount() const
{
   return impl->clock;
}

unsigned long long EnvelopeDetector::sampleLimit() const
{
   return impl->sampleLimit;
}

void EnvelopeDetector::setSampleLimit(unsigned long long sampleLimit)
{
   impl->sampleLimit = sampleLimit;
}

}
