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

#include <iostream>
#include <string>
#include <vector>

#include <rt/Logger.h>

#include <ebus/Bus.h>
#include <ebus/BusFrame.h>
#include <ebus/FrameCheck.h>
#include <ebus/FrameSync.h>

using namespace rt;

Logger *logger = Logger::getLogger("test.frame", Logger::INFO_LEVEL);

static int failures = 0;

static void expect(bool condition, const std::string &message)
{
   if (condition)
      return;

   logger->error("FAILED: {}", {message});

   failures++;
}

static std::vector<unsigned char> sealed(std::vector<unsigned char> bytes)
{
   bytes.push_back(static_cast<unsigned char>(ebus::FrameCheck::checksum(bytes.data(), bytes.size())));

   return bytes;
}

static ebus::BusFrame frameOf(const std::vector<unsigned char> &bytes)
{
   ebus::BusFrame frame(static_cast<int>(bytes.size()));

   frame.put(bytes.data(), bytes.size());
   frame.flip();

   return frame;
}

/*
 * Symbol stream for byte sequence, 10 samples per bit, one idle byte ahead and two behind
 */
static ebus::ListSource<ebus::BitSymbol> symbolsOf(const std::vector<unsigned char> &bytes, unsigned int syncAt = 0)
{
   std::vector<unsigned char> line = {0x00};

   line.insert(line.end(), bytes.begin(), bytes.end());
   line.push_back(0x00);
   line.push_back(0x00);

   ebus::ListSource<ebus::BitSymbol> source;

   unsigned int index = 0;

   for (auto byte: line)
   {
      for (int b = 7; b >= 0; b--, index++)
      {
         source.push({static_cast<unsigned int>((byte >> b) & 1), index * 10ULL, 10, index == syncAt ? static_cast<unsigned int>(ebus::SyncStart) : 0});
      }
   }

   return source;
}

/*
 * Symbol stream for one carrier burst, followed by the idle run that closes it as the bit decoder does
 */
static ebus::ListSource<ebus::BitSymbol> burstOf(const std::vector<unsigned char> &bytes)
{
   std::vector<unsigned char> line = {0x00};

   line.insert(line.end(), bytes.begin(), bytes.end());

   ebus::ListSource<ebus::BitSymbol> source;

   unsigned int index = 0;
   unsigned int zeroRun = 0;

   for (auto byte: line)
   {
      for (int b = 7; b >= 0; b--, index++)
      {
         const unsigned int value = (byte >> b) & 1;

         zeroRun = value ? 0 : zeroRun + 1;

         source.push({value, index * 10ULL, 10, 0});
      }
   }

   while (++zeroRun <= EBUS_IDLE_BITS)
   {
      source.push({0, index * 10ULL, 10, zeroRun == EBUS_IDLE_BITS ? static_cast<unsigned int>(ebus::BurstEnd) : 0});

      index++;
   }

   return source;
}

static std::vector<ebus::BusFrame> readAll(ebus::FrameSync &sync)
{
   std::vector<ebus::BusFrame> frames;

   ebus::BusFrame frame;

   while (sync.next(frame))
      frames.push_back(frame);

   return frames;
}

static bool sameBytes(const ebus::BusFrame &frame, const std::vector<unsigned char> &bytes)
{
   if (frame.limit() != bytes.size())
      return false;

   for (unsigned int i = 0; i < bytes.size(); i++)
   {
      if (frame[i] != bytes[i])
         return false;
   }

   return true;
}

const std::vector<unsigned char> battery = {0xce, 0x1a, 0x81, 0xc3, 0x26, 0x42, 0x55, 0xf1};

void testChecksum()
{
   logger->info("test frame checksum");

   expect(ebus::FrameCheck::checksum(battery.data(), battery.size() - 1) == 0xf1, "checksum of battery frame");

   const std::vector<unsigned char> distance = {0xcc, 0x0d, 0x00, 0xc1, 0x48, 0x08, 0x0a};

   expect(ebus::FrameCheck::checksum(distance.data(), distance.size()) == 0x7a, "checksum of distance frame");

   ebus::BusFrame frame = frameOf(battery);

   expect(ebus::FrameCheck::check(frame), "valid frame must verify");
   expect(!frame.hasCrcError(), "valid frame without error flag");
   expect(frame.checksum() == 0xf1, "checksum byte accessor");
   expect(frame.preamble() == ebus::Reply, "preamble accessor");
   expect(frame.identifier() == 0x1a, "identifier accessor");

   // any single bit error after the preamble must be detected
   for (unsigned int i = 1; i < battery.size(); i++)
   {
      for (unsigned int b = 0; b < 8; b++)
      {
         std::vector<unsigned char> corrupted = battery;

         corrupted[i] ^= 1 << b;

         ebus::BusFrame bad = frameOf(corrupted);

         expect(!ebus::FrameCheck::check(bad), "bit " + std::to_string(b) + " of byte " + std::to_string(i) + " must break checksum");
         expect(bad.hasCrcError(), "corrupted frame must be flagged");
      }
   }

   // preamble takes part in the register seed
   std::vector<unsigned char> other = battery;

   other[0] = ebus::Broadcast;

   expect(ebus::FrameCheck::checksum(other.data(), other.size() - 1) != 0xf1, "preamble must change checksum");

   ebus::BusFrame request = frameOf({0xcf, 0x7f, 0x81});

   expect(!ebus::FrameCheck::check(request), "short frame is not verified");
   expect(request.isShortFrame(), "short frame must be flagged");
   expect(!request.hasCrcError(), "short frame is not a checksum error");
}

void testFrameSync()
{
   logger->info("test frame synchronization");

   auto source = symbolsOf(battery);

   ebus::FrameSync sync(source);

   sync.setStreamTime(100.0);
   sync.initialize();

   auto frames = readAll(sync);

   expect(frames.size() == 1, "one frame expected, found " + std::to_string(frames.size()));
   expect(sync.frameCount() == 1, "frame count");
   expect(sync.crcErrorCount() == 0, "checksum error count");

   if (!frames.empty())
   {
      expect(sameBytes(frames[0], battery), "frame content");
      expect(frames[0].sampleStart() == 80, "frame starts at first preamble bit");
      expect(frames[0].sampleEnd() == 80 + 64 * 10, "frame ends after checksum byte");
      expect(frames[0].timeStart() == 80 / 5E6, "frame start time");
      expect(frames[0].dateTime() == 100.0 + 80 / 5E6, "frame date time");
      expect(!frames[0].hasCrcError(), "frame checksum flag");
   }
}

void testPreambleInPayload()
{
   logger->info("test preamble pattern inside payload");

   const std::vector<unsigned char> bytes = sealed({0xcc, 0x0d, 0x00, 0xcc, 0xce, 0xcf, 0xcc});

   std::vector<unsigned char> line = battery;

   line.insert(line.end(), bytes.begin(), bytes.end());

   auto source = symbolsOf(line);

   ebus::FrameSync sync(source);

   auto frames = readAll(sync);

   expect(frames.size() == 2, "two frames expected, found " + std::to_string(frames.size()));
   expect(sync.crcErrorCount() == 0, "payload preambles must not produce checksum errors");

   if (frames.size() == 2)
   {
      expect(sameBytes(frames[0], battery), "first frame content");
      expect(sameBytes(frames[1], bytes), "second frame content");
      expect(frames[1].sampleStart() == 720, "second frame start");
   }
}

void testChecksumError()
{
   logger->info("test frame with checksum error");

   std::vector<unsigned char> corrupted = battery;

   corrupted[5] ^= 0x01;

   auto source = symbolsOf(corrupted);

   ebus::FrameSync sync(source);

   auto frames = readAll(sync);

   expect(frames.size() == 1, "corrupted frame must be reported");
   expect(sync.crcErrorCount() == 1, "checksum error count");

   if (!frames.empty())
   {
      expect(frames[0].hasCrcError(), "corrupted frame flag");
      expect(sameBytes(frames[0], corrupted), "corrupted frame content");
   }
}

void testShortFrame()
{
   logger->info("test short frames");

   std::vector<unsigned char> line = {0xcf, 0x7f, 0x81};

   line.insert(line.end(), battery.begin(), battery.end());

   auto source = symbolsOf(line);

   ebus::FrameSync sync(source);

   auto frames = readAll(sync);

   expect(frames.size() == 2, "short frame and data frame expected, found " + std::to_string(frames.size()));

   if (frames.size() == 2)
   {
      expect(frames[0].isShortFrame(), "request frame flag");
      expect(!frames[0].hasCrcError(), "request frame is not a checksum error");
      expect(sameBytes(frames[0], {0xcf, 0x7f, 0x81}), "request frame content");
      expect(sameBytes(frames[1], battery), "data frame after request");
      expect(frames[1].sampleStart() == 320, "data frame start");
   }
}

void testSyncRestart()
{
   logger->info("test synchronization restart");

   // restart in the middle of the identifier
   auto source = symbolsOf(battery, 20);

   ebus::FrameSync sync(source);

   auto frames = readAll(sync);

   expect(frames.empty(), "frame in progress must be discarded on restart");
   expect(sync.discardCount() >= 1, "discarded frames must be counted");
}

void testFrameLength()
{
   logger->info("test frame length table");

   auto source = symbolsOf(battery);

   ebus::FrameSync sync(source);

   expect(sync.frameLength(0x1a) == EBUS_DATA_PAYLOAD, "default payload length");
   expect(sync.frameLength(0x81) == 0, "request identifiers carry no payload");

   // identifier 1a now announces a frame larger than allowed
   sync.setFrameLength(0x1a, 20);

   auto frames = readAll(sync);

   expect(frames.empty(), "oversized frame must be abandoned");
   expect(sync.discardCount() >= 1, "abandoned frame must be counted");
}

void testPreambleTable()
{
   logger->info("test preamble table");

   auto source = symbolsOf(battery);

   ebus::FrameSync sync(source);

   expect(sync.preambles() == std::vector<unsigned int>({0xcc, 0xce, 0xcf}), "default preambles");

   sync.setPreambles({0xcc});

   auto frames = readAll(sync);

   expect(frames.empty(), "disabled preamble must not start frames");
}

void testIdleTail()
{
   logger->info("test idle line after burst");

   // checksum 33 followed by idle zeros forms preamble cc two bits after the frame
   const std::vector<unsigned char> bytes = sealed({0xce, 0x1a, 0xc3, 0x26, 0x42, 0x10, 0x00});

   expect(bytes.back() == 0x33, "checksum of test frame");

   auto source = burstOf(bytes);

   ebus::FrameSync sync(source);

   auto frames = readAll(sync);

   expect(frames.size() == 1, "idle line must not complete frames, found " + std::to_string(frames.size()));
   expect(sync.crcErrorCount() == 0, "idle line must not raise checksum errors");

   if (!frames.empty())
      expect(sameBytes(frames[0], bytes), "frame content before idle line");

   // without burst end, a stream ending in idle line must not emit the idle completed frame either
   std::vector<unsigned char> line = bytes;

   line.insert(line.end(), 9, 0x00);

   auto longSource = symbolsOf(line);

   ebus::FrameSync longSync(longSource);

   frames = readAll(longSync);

   expect(frames.size() == 1 && longSync.crcErrorCount() == 0, "frame completed by trailing zeros must be discarded at end of stream");
}

void testCorruptFrameBeforeIdle()
{
   logger->info("test corrupt frame followed by idle line");

   // payload holds preamble cc, the newer candidate only completes with idle zeros
   std::vector<unsigned char> bytes = sealed({0xce, 0x1a, 0xc3, 0xcc, 0x42, 0x55, 0x00});

   bytes[5] ^= 0x01;

   auto source = burstOf(bytes);

   ebus::FrameSync sync(source);

   auto frames = readAll(sync);

   expect(frames.size() == 1, "corrupt frame must be reported, found " + std::to_string(frames.size()));
   expect(sync.crcErrorCount() == 1, "one checksum error expected");

   if (!frames.empty())
   {
      expect(sameBytes(frames[0], bytes), "reported frame is the transmitted one");
      expect(frames[0].hasCrcError(), "reported frame checksum flag");
      expect(frames[0].sampleStart() == 80, "reported frame start");
   }

   // trailing zero bits of a real frame still complete it
   std::vector<unsigned char> zeroTail = sealed({0xcc, 0x40, 0x07, 0x02, 0x1b, 0x00, 0x00});

   expect(zeroTail.back() == 0x70, "checksum with trailing zero bits");

   zeroTail[3] ^= 0x10;

   auto tailSource = burstOf(zeroTail);

   ebus::FrameSync tailSync(tailSource);

   frames = readAll(tailSync);

   expect(frames.size() == 1 && frames[0].hasCrcError() && sameBytes(frames[0], zeroTail), "corrupt frame ending in zero bits must be reported");
}

void testPartialPreamble()
{
   logger->info("test partial frame followed by complete frame");

   std::vector<unsigned char> line = {0xce, 0x1a, 0x81, 0xc3};

   line.insert(line.end(), battery.begin(), battery.end());

   auto source = burstOf(line);

   ebus::FrameSync sync(source);

   auto frames = readAll(sync);

   expect(frames.size() == 1, "only the complete frame expected, found " + std::to_string(frames.size()));
   expect(sync.crcErrorCount() == 0, "truncated frame must not be reported");

   if (!frames.empty())
   {
      expect(sameBytes(frames[0], battery), "complete frame content");
      expect(frames[0].sampleStart() == 400, "complete frame start");
   }
}

int main(int argc, char *argv[])
{
   Logger::init(std::cout);

   Logger::setRootLevel(Logger::WARN_LEVEL);

   logger->info("***********************************************************************");
   logger->info("E-Bus laboratory, frame tests");
   logger->info("***********************************************************************");

   testChecksum();
   testFrameSync();
   testPreambleInPayload();
   testChecksumError();
   testShortFrame();
   testSyncRestart();
   testFrameLength();
   testPreambleTable();
   testIdleTail();
   testCorruptFrameBeforeIdle();
   testPartialPreamble();

   if (failures)
      logger->error("{} checks failed", {failures});
   else
      logger->info("all checks passed");

   Logger::flush();

   return failures ? 1 : 0;
}
