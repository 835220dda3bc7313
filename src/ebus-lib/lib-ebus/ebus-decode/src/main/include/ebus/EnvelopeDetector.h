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

#ifndef EBUS_ENVELOPEDETECTOR_H
#define EBUS_ENVELOPEDETECTOR_H

#include <memory>

#include <hw/SignalDevice.h>

#include <ebus/BitSymbol.h>
#include <ebus/Source.h>

namespace ebus {

/*
 * Carrier magnitude extraction: rectify around a slow DC baseline and average over one carrier period
 */
class EnvelopeDetector : public Source<EnvelopeSample>
{
      struct Impl;

   public:

      explicit EnvelopeDetector(hw::SignalDevice &device, unsigned int blockSize = 65536);

      void initialize();

      bool next(EnvelopeSample &sample) override;

      unsigned int sampleRate() const;

      void setSampleRate(unsigned int sampleRate);

      unsigned int carrierFrequency() const;

      void setCarrierFrequency(unsigned int carrierFrequency);

      // moving average window in samples
      unsigned int windowSize() const;

      // total samples consumed from device
      unsigned long long sampleCount() const;

      // stop after this number of samples, 0 for whole stream
      unsigned long long sampleLimit() const;

      void setSampleLimit(unsigned long long sampleLimit);

   private:

      std::shared_ptr<Impl> impl;
};

}

#endif
