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

#ifndef EBUS_BITDECODER_H
#define EBUS_BITDECODER_H

#include <memory>

#include <ebus/BitSymbol.h>
#include <ebus/Source.h>

namespace ebus {

/*
 * Symbol clock recovery from carrier envelope, one BitSymbol per bit period while locked
 */
class BitDecoder : public Source<BitSymbol>
{
      struct Impl;

   public:

      enum State
      {
         Idle = 0,
         Locked = 1
      };

   public:

      explicit BitDecoder(Source<EnvelopeSample> &input);

      void initialize();

      bool next(BitSymbol &symbol) override;

      unsigned int sampleRate() const;

      void setSampleRate(unsigned int sampleRate);

      unsigned int bitRate() const;

      void setBitRate(unsigned int bitRate);

      float signalThreshold() const;

      void setSignalThreshold(float value);

      float jitterTolerance() const;

      void setJitterTolerance(float value);

      unsigned int idleBits() const;

      void setIdleBits(unsigned int value);

      int state() const;

      // number of timing violations that forced a resynchronization
      unsigned int resyncCount() const;

      unsigned long long symbolCount() const;

   private:

      std::shared_ptr<Impl> impl;
};

}

#endif
