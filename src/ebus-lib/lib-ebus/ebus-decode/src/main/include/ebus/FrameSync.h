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

#ifndef EBUS_FRAMESYNC_H
#define EBUS_FRAMESYNC_H

#include <memory>
#include <vector>

#include <ebus/BitSymbol.h>
#include <ebus/BusFrame.h>
#include <ebus/Source.h>

namespace ebus {

/*
 * Preamble search and byte alignment over recovered symbols, emits checked frames
 */
class FrameSync : public Source<BusFrame>
{
      struct Impl;

   public:

      explicit FrameSync(Source<BitSymbol> &input);

      void initialize();

      bool next(BusFrame &frame) override;

      unsigned int sampleRate() const;

      void setSampleRate(unsigned int sampleRate);

      double streamTime() const;

      void setStreamTime(double streamTime);

      unsigned int maxFrameSize() const;

      void setMaxFrameSize(unsigned int maxFrameSize);

      std::vector<unsigned int> preambles() const;

      void setPreambles(const std::vector<unsigned int> &preambles);

      // payload bytes carried by frames with this identifier
      unsigned int frameLength(unsigned int identifier) const;

      void setFrameLength(unsigned int identifier, unsigned int payloadLength);

      unsigned long long frameCount() const;

      unsigned long long crcErrorCount() const;

      unsigned long long discardCount() const;

   private:

      std::shared_ptr<Impl> impl;
};

}

#endif
