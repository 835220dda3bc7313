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
#include <list>

#include <rt/Logger.h>

#include <ebus/Bus.h>
#include <ebus/FrameCheck.h>
#include <ebus/FrameSync.h>

namespace ebus {

/*
 * partial frame aligned to one preamble occurrence
 */
struct FrameCandidate
{
   std::vector<unsigned char> bytes;

   // bits accumulated for next byte, MSB first
   unsigned int current = 0;
   unsigned int bits = 0;

   // expected frame size, known once identifier is received
   unsigned int expected = 0;

   unsigned long long sampleStart = 0;
};

struct FrameSync::Impl
{
   rt::Logger *log = rt::Logger::getLogger("ebus.FrameSync");

   Source<BitSymbol> &input;

   unsigned int sampleRate = EBUS_SAMPLE_RATE;
   unsigned int maxFrameSize = EBUS_MAX_FRAME_SIZE;
   double streamTime = 0;

   // preamble lookup and payload length by identifier
   bool preambleTable[256] {false,};
   unsigned int lengthTable[256] {0,};

   // symbol shift register and start clock of last 8 symbols
   unsigned int shift = 0;
   unsigned long long shiftCount = 0;
   unsigned long long shiftStart[8] {0,};

   // frames in progress, oldest first
   std::list<FrameCandidate> candidates;

   // frames ready for delivery
   std::deque<BusFrame> ready;

   // corrupt frame waiting for overlapping candidates to resolve
   BusFrame held;

   // zero symbols since last carrier bit, and its value when held frame completed
   unsigned int idleRun = 0;
   unsigned int heldIdle = 0;

   // statistics
   unsigned long long frameCount = 0;
   unsigned long long crcErrorCount = 0;
   unsigned long long discardCount = 0;

   explicit Impl(Source<BitSymbol> &input) : input(input)
   {
      preambleTable[Broadcast] = true;
      preambleTable[Reply] = true;
      preambleTable[LinkControl] = true;

      for (unsigned int id = 0; id < 256; id++)
      {
         // remote requests carry no payload
         lengthTable[id] = (id == 0x7F || (id >= 0x80 && id <= 0xBF)) ? 0 : EBUS_DATA_PAYLOAD;
      }
   }

   void initialize()
   {
      shift = 0;
      shiftCount = 0;
      candidates.clear();
      ready.clear();
      held = BusFrame();
      idleRun = 0;
      heldIdle = 0;
      frameCount = 0;
      crcErrorCount = 0;
      discardCount = 0;

      log->info("frame sync, max frame size {}, stream time {.3}", {maxFrameSize, streamTime});
   }

   bool next(BusFrame &frame)
   {
      while (ready.empty())
      {
         BitSymbol symbol {};

         if (!input.next(symbol))
         {
            abandon("end of stream");

            release();

            if (ready.empty())
               return false;

            break;
         }

         process(symbol);
      }

      frame = ready.front();

      ready.pop_front();

      return true;
   }

   void process(const BitSymbol &symbol)
   {
      if (symbol.flags & BurstEnd)
      {
         log->debug("burst end at {}", {symbol.start});

         abandon("burst end");

         release();

         shift = 0;
         shiftCount = 0;
         idleRun = 0;

         return;
      }

      if (symbol.flags & SyncStart)
      {
         abandon("synchronization restart");

         release();

         shift = 0;
         shiftCount = 0;
      }

      if (symbol.value & 1)
      {
         idleRun = 0;

         // carrier seen after held frame, its trailing zeros were part of the burst
         heldIdle = 0;
      }
      else
      {
         idleRun++;
      }

      // feed frames in progress
      for (auto it = candidates.begin(); it != candidates.end();)
      {
         it->current = (it->current << 1) | (symbol.value & 1);

         if (++it->bits < 8)
         {
            ++it;
            continue;
         }

         it->bytes.push_back(it->current & 0xff);
         it->current = 0;
         it->bits = 0;

         // identifier received, resolve frame size
         if (it->bytes.size() == 2)
         {
            it->expected = lengthTable[it->bytes[1]] + 3;

            if (it->expected > maxFrameSize)
            {
               log->debug("frame size {} exceeds maximum for identifier {02x}", {it->expected, static_cast<unsigned int>(it->bytes[1])});

               discardCount++;

               it = candidates.erase(it);

               continue;
            }
         }

         if (it->bytes.size() < it->expected)
         {
            ++it;
            continue;
         }

         if (complete(it, symbol.start + symbol.length))
            break;

         it = candidates.erase(it);
      }

      settle();

      startCandidate(symbol);
   }

   /*
    * resolve completed candidate, returns true if the frame supersedes every other candidate
    */
   bool complete(std::list<FrameCandidate>::iterator it, unsigned long long sampleEnd)
   {
      BusFrame frame(static_cast<int>(it->bytes.size()));

      frame.put(it->bytes.data(), it->bytes.size());
      frame.flip();

      frame.setSampleStart(it->sampleStart);
      frame.setSampleEnd(sampleEnd);
      frame.setTimeStart(static_cast<double>(it->sampleStart) / sampleRate);
      frame.setTimeEnd(static_cast<double>(sampleEnd) / sampleRate);
      frame.setDateTime(streamTime + frame.timeStart());

      const bool oldest = it == candidates.begin();

      if (FrameCheck::check(frame))
      {
         if (overlaps(frame))
            supersede();
         else
            release();

         emit(frame);

         candidates.clear();

         return true;
      }

      if (frame.isShortFrame())
      {
         // no checksum, accepted only if it does not overlap an older frame
         if (oldest && !overlaps(frame))
         {
            release();

            emit(frame);
         }
         else
         {
            discardCount++;
         }

         return false;
      }

      // older than held frame, or last byte made of idle line zeros
      if (held && (frame.sampleStart() < held.sampleStart() || idleRun >= 8))
      {
         log->trace("discard invalid frame {}, held frame {} takes precedence", {static_cast<const rt::ByteBuffer &>(frame), static_cast<const rt::ByteBuffer &>(held)});

         discardCount++;

         return false;
      }

      // the later match wins over an overlapping corrupt frame
      if (overlaps(frame))
         supersede();
      else
         release();

      held = frame;
      heldIdle = idleRun;

      return false;
   }

   /*
    * deliver held frame once no newer overlapping candidate can replace it
    */
   void settle()
   {
      // last byte made of idle line zeros, wait for carrier or burst end
      if (!held || heldIdle >= 8)
         return;

      for (const auto &candidate: candidates)
      {
         if (candidate.sampleStart > held.sampleStart() && candidate.sampleStart < held.sampleEnd())
            return;
      }

      // remaining candidates started before held frame and overlap it
      for (auto it = candidates.begin(); it != candidates.end();)
      {
         if (it->sampleStart < held.sampleStart())
         {
            discardCount++;

            it = candidates.erase(it);
         }
         else
         {
            ++it;
         }
      }

      release();
   }

   /*
    * emit held frame as corrupt, unless its last byte was completed by idle line
    */
   void release()
   {
      if (!held)
         return;

      if (heldIdle < 8)
      {
         crcErrorCount++;

         emit(held);
      }
      else
      {
         log->debug("discard frame {}, completed by idle line", {static_cast<const rt::ByteBuffer &>(held)});

         discardCount++;
      }

      held = BusFrame();
      heldIdle = 0;
   }

   void supersede()
   {
      log->trace("discard invalid frame {}, newer frame in progress", {static_cast<const rt::ByteBuffer &>(held)});

      discardCount++;

      held = BusFrame();
      heldIdle = 0;
   }

   bool overlaps(const BusFrame &frame) const
   {
      return held && frame.sampleStart() < held.sampleEnd();
   }

   void abandon(const char *reason)
   {
      if (candidates.empty())
         return;

      log->debug("{} at symbol {}, discard {} frames in progress", {reason, shiftCount, candidates.size()});

      discardCount += candidates.size();

      candidates.clear();
   }

   void startCandidate(const BitSymbol &symbol)
   {
      shift = ((shift << 1) | (symbol.value & 1)) & 0xff;

      shiftStart[shiftCount & 7] = symbol.start;

      shiftCount++;

      if (shiftCount < 8 || !preambleTable[shift])
         return;

      if (candidates.size() >= EBUS_MAX_CANDIDATES)
      {
         log->trace("too many frames in progress, ignore preamble {02x} at {}", {shift, symbol.start});
         return;
      }

      FrameCandidate candidate;

      candidate.bytes.reserve(maxFrameSize);
      candidate.bytes.push_back(shift);

      // first preamble bit, 8 symbols back
      candidate.sampleStart = shiftStart[shiftCount & 7];

      candidates.push_back(candidate);
   }

   void emit(const BusFrame &frame)
   {
      frameCount++;

      log->debug("frame {} at {.6}", {static_cast<const rt::ByteBuffer &>(frame), frame.timeStart()});

      ready.push_back(frame);
   }
};

FrameSync::FrameSync(Source<BitSymbol> &input) : impl(std::make_shared<Impl>(input))
{
}

void FrameSync::initialize()
{
   impl->initialize();
}

bool FrameSync::next(BusFrame &frame)
{
   return impl->next(frame);
}

unsigned int FrameSync::sampleRate() const
{
   return impl->sampleRate;
}

void FrameSync::setSampleRate(unsigned int sampleRate)
{
   impl->sampleRate = sampleRate;
}

double FrameSync::streamTime() const
{
   return impl->streamTime;
}

void FrameSync::setStreamTime(double streamTime)
{
   impl->streamTime = streamTime;
}

unsigned int FrameSync::maxFrameSize() const
{
   return impl->maxFrameSize;
}

void FrameSync::setMaxFrameSize(unsigned int maxFrameSize)
{
   impl->maxFrameSize = maxFrameSize;
}

std::vector<unsigned int> FrameSync::preambles() const
{
   std::vector<unsigned int> result;

   for (unsigned int i = 0; i < 256; i++)
   {
      if (impl->preambleTable[i])
         result.push_back(i);
   }

   return result;
}

void FrameSync::setPreambles(const std::vector<unsigned int> &preambles)
{
   for (auto &entry: impl->preambleTable)
      entry = false;

   for (auto value: preambles)
      impl->preambleTable[value & 0xff] = true;
}

unsigned int FrameSync::frameLength(unsigned int identifier) const
{
   return impl->lengthTable[identifier & 0xff];
}

void FrameSync::setFrameLength(unsigned int identifier, unsigned int payloadLength)
{
   impl->lengthTable[identifier & 0xff] = payloadLength;
}

unsigned long long FrameSync::frameCount() const
{
   return impl->frameCount;
}

unsigned long long FrameSync::crcErrorCount() const
{
   return impl->crcErrorCount;
}

unsigned long long FrameSync::discardCount() const
{
   return impl->discardCount;
}

}
