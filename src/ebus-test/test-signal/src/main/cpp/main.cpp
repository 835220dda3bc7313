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
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include <rt/Logger.h>

#include <hw/MemoryDevice.h>

#include <ebus/Bus.h>
#include <ebus/BitDecoder.h>
#include <ebus/BusDecoder.h>
#include <ebus/EnvelopeDetector.h>
#include <ebus/DecoderContext.h>
#include <ebus/FrameCheck.h>
#include <ebus/PacketAssembler.h>
#include <ebus/PacketDecoder.h>

using namespace rt;

Logger *logger = Logger::getLogger("test.signal", Logger::INFO_LEVEL);

static int failures = 0;

static void expect(bool condition, const std::string &message)
{
   if (condition)
      return;

   logger->error("FAILED: {}", {message});

   failures++;
}

/*
 * Synthetic line capture: 1 MHz carrier keyed on for each one bit, 10 samples per bit at 5 MSps
 */
struct Modulator
{
   std::vector<unsigned char> samples;

   double amplitude = 0.8;

   // DC level shift in sample units, initial value and change per sample
   double offset = 0;
   double drift = 0;

   // uniform noise amplitude in sample units
   int noise = 0;

   std::minstd_rand generator {1};

   unsigned int bitSamples = EBUS_SAMPLE_RATE / EBUS_BIT_RATE;

   void carrier(bool on, unsigned int count)
   {
      for (unsigned int i = 0; i < count; i++)
      {
         const auto n = static_cast<double>(samples.size());

         double value = 127.5 + offset + drift * n;

         if (on)
            value += amplitude * 127.5 * std::sin(2 * M_PI * n / 5 + 0.3);

         if (noise)
            value += static_cast<int>(generator() % (2 * noise + 1)) - noise;

         samples.push_back(static_cast<unsigned char>(std::lround(std::fmin(255.0, std::fmax(0.0, value)))));
      }
   }

   void silence(unsigned int count)
   {
      carrier(false, count);
   }

   void frame(const std::vector<unsigned char> &bytes)
   {
      for (auto byte: bytes)
      {
         for (int b = 7; b >= 0; b--)
            carrier((byte >> b) & 1, bitSamples);
      }
   }
};

static std::vector<unsigned char> sealed(std::vector<unsigned char> bytes)
{
   bytes.push_back(static_cast<unsigned char>(ebus::FrameCheck::checksum(bytes.data(), bytes.size())));

   return bytes;
}

struct Capture
{
   std::vector<ebus::BusFrame> frames;
   std::vector<ebus::BusPacket> packets;
   std::vector<ebus::DecodedEvent> events;

   unsigned long long crcErrors = 0;
};

static Capture decodeSamples(ebus::BusDecoder &decoder)
{
   Capture capture;

   ebus::BusRecord record;

   while (decoder.nextRecord(record))
   {
      if (auto frame = std::get_if<ebus::BusFrame>(&record))
         capture.frames.push_back(*frame);
      else if (auto packet = std::get_if<ebus::BusPacket>(&record))
         capture.packets.push_back(*packet);
      else if (auto event = std::get_if<ebus::DecodedEvent>(&record))
         capture.events.push_back(*event);
   }

   capture.crcErrors = decoder.crcErrorCount();

   return capture;
}

static Capture decodeModulated(const Modulator &modulator)
{
   hw::MemoryDevice device(modulator.samples);

   device.open(hw::MemoryDevice::Read);

   ebus::BusDecoder decoder(device);

   return decodeSamples(decoder);
}

/*
 * square envelope for timing tests, one sample per clock
 */
static ebus::ListSource<ebus::EnvelopeSample> squareEnvelope(const std::vector<std::pair<float, unsigned int>> &levels)
{
   ebus::ListSource<ebus::EnvelopeSample> source;

   unsigned long long clock = 0;

   for (unsigned int i = 0; i < 10; i++)
      source.push({0.0f, clock++});

   for (const auto &level: levels)
   {
      for (unsigned int i = 0; i < level.second; i++)
         source.push({level.first, clock++});
   }

   return source;
}

void testEnvelope()
{
   logger->info("test envelope detector");

   Modulator modulator;

   modulator.silence(500);
   modulator.carrier(true, 500);
   modulator.silence(500);

   hw::MemoryDevice device(modulator.samples);

   device.open(hw::MemoryDevice::Read);

   ebus::EnvelopeDetector envelope(device, 256);

   expect(envelope.windowSize() == 5, "envelope window must cover one carrier period");

   std::vector<float> values;

   ebus::EnvelopeSample sample {};

   while (envelope.next(sample))
   {
      expect(sample.clock == values.size(), "envelope clock must count input samples");

      values.push_back(sample.value);
   }

   expect(values.size() == modulator.samples.size(), "envelope must produce one value per sample");
   expect(envelope.sampleCount() == modulator.samples.size(), "envelope sample count");

   // carrier magnitude is 2 * A / pi for a rectified sine
   const float expected = static_cast<float>(2 * modulator.amplitude / M_PI);

   expect(values[250] < 0.02f, "envelope must be near zero before carrier");
   expect(std::fabs(values[750] - expected) < 0.08f, "envelope must track carrier magnitude");
   expect(values[1400] < 0.05f, "envelope must decay after carrier");
}

void testBitRecovery()
{
   logger->info("test bit recovery");

   // 1 0 11 0 1 then idle line
   auto source = squareEnvelope({{1.0f, 10}, {0.0f, 10}, {1.0f, 20}, {0.0f, 10}, {1.0f, 10}, {0.0f, 800}});

   ebus::BitDecoder decoder(source);

   std::vector<ebus::BitSymbol> symbols;

   ebus::BitSymbol symbol {};

   while (decoder.next(symbol))
      symbols.push_back(symbol);

   expect(symbols.size() == 6 + EBUS_IDLE_BITS, "decoder must stop after idle run, found " + std::to_string(symbols.size()));
   expect(decoder.state() == ebus::BitDecoder::Idle, "decoder must return to idle");
   expect(decoder.resyncCount() == 0, "clean signal must not resync");

   const unsigned int expected[] = {1, 0, 1, 1, 0, 1, 0, 0};

   for (unsigned int i = 0; i < 8 && i < symbols.size(); i++)
   {
      expect(symbols[i].value == expected[i], "symbol " + std::to_string(i) + " value");
      expect(symbols[i].start == 10 + i * 10, "symbol " + std::to_string(i) + " start");
      expect(symbols[i].length == 10, "symbol " + std::to_string(i) + " length");
   }

   if (!symbols.empty())
   {
      expect(symbols[0].flags & ebus::SyncStart, "first symbol must start synchronization");
      expect(!(symbols[1].flags & ebus::SyncStart), "second symbol must not start synchronization");
      expect(symbols.back().flags & ebus::BurstEnd, "last idle symbol must close the burst");
      expect(!(symbols[symbols.size() - 2].flags & ebus::BurstEnd), "burst end flagged once");
   }
}

void testResync()
{
   logger->info("test resynchronization");

   // one and a half bit pulse breaks the symbol grid
   auto source = squareEnvelope({{1.0f, 10}, {0.0f, 10}, {1.0f, 20}, {0.0f, 10}, {1.0f, 15}, {0.0f, 10}, {1.0f, 10}, {0.0f, 800}});

   ebus::BitDecoder decoder(source);

   std::vector<ebus::BitSymbol> symbols;

   ebus::BitSymbol symbol {};

   while (decoder.next(symbol))
      symbols.push_back(symbol);

   expect(decoder.resyncCount() == 1, "timing violation must be counted, found " + std::to_string(decoder.resyncCount()));

   unsigned int syncs = 0;

   for (const auto &s: symbols)
   {
      if (s.flags & ebus::SyncStart)
         syncs++;
   }

   expect(syncs == 2, "symbol after violation must restart synchronization");

   if (symbols.size() > 6)
   {
      expect(symbols[6].flags & ebus::SyncStart, "resync flag on first symbol after violation");
      expect(symbols[6].start == 75, "symbol grid realigned to violating edge");
   }
}

void testNoSignal()
{
   logger->info("test noise floor");

   // below threshold variations never lock
   auto source = squareEnvelope({{0.02f, 10}, {0.0f, 10}, {0.03f, 20}, {0.0f, 500}});

   ebus::BitDecoder decoder(source);

   ebus::BitSymbol symbol {};

   expect(!decoder.next(symbol), "no symbols without carrier");
   expect(decoder.symbolCount() == 0, "symbol count without carrier");
}

void testDecodeCapture()
{
   logger->info("test end to end decoding");

   Modulator modulator;

   modulator.silence(200);
   modulator.frame(sealed({0xce, 0x1a, 0x81, 0xc3, 0x26, 0x42, 0x55}));
   modulator.silence(1000);
   modulator.frame(sealed({0xcc, 0x0d, 0x00, 0xc1, 0x48, 0x08, 0x0a}));
   modulator.silence(1000);

   hw::MemoryDevice device(modulator.samples);

   device.set(hw::SignalDevice::PARAM_STREAM_TIME, 1700000000LL);

   device.open(hw::MemoryDevice::Read);

   ebus::BusDecoder decoder(device);

   Capture capture = decodeSamples(decoder);

   const auto &frames = capture.frames;
   const auto &packets = capture.packets;
   const auto &events = capture.events;

   expect(frames.size() == 2, "two frames expected, found " + std::to_string(frames.size()));
   expect(decoder.crcErrorCount() == 0, "no checksum errors expected");
   expect(decoder.resyncCount() == 0, "no timing violations expected");

   if (frames.size() == 2)
   {
      expect(static_cast<const ByteBuffer &>(frames[0]) == ByteBuffer({0xce, 0x1a, 0x81, 0xc3, 0x26, 0x42, 0x55, 0xf1}), "first frame content");
      expect(static_cast<const ByteBuffer &>(frames[1]) == ByteBuffer({0xcc, 0x0d, 0x00, 0xc1, 0x48, 0x08, 0x0a, 0x7a}), "second frame content");

      // preamble starts at sample 200, envelope delay is below one bit
      expect(frames[0].sampleStart() >= 195 && frames[0].sampleStart() <= 210, "first frame start sample");
      expect(std::fabs(frames[0].timeStart() - frames[0].sampleStart() / 5E6) < 1E-9, "frame time from sample clock");
      expect(std::fabs(frames[0].dateTime() - (1700000000 + frames[0].timeStart())) < 1E-6, "frame date from stream time");
      expect(frames[0].sampleEnd() > frames[0].sampleStart() + 630, "frame end sample");
   }

   expect(packets.size() == 2, "two single frame packets expected");

   if (!packets.empty())
   {
      expect(packets[0].identifier() == 0x1a, "battery packet device");
      expect(packets[0].command() == 0x2642, "battery packet command");
   }

   // second packet is truncated for trip distance and raises a field error only
   expect(events.size() == 1, "one event expected, found " + std::to_string(events.size()));

   if (!events.empty())
   {
      expect(events[0].name == "battery", "battery event name");
      expect(events[0].valid, "battery event valid");
      expect(std::get<long long>(events[0].value) == 85, "battery level");
      expect(events[0].unit == "%", "battery unit");
   }

   // same frames decoded at byte level must give the same packets and events
   ebus::RuleTable table = ebus::RuleTable::standard();
   ebus::DecoderContext context(table);
   ebus::PacketAssembler assembler;
   ebus::PacketDecoder packetDecoder;

   std::vector<ebus::BusPacket> bytePackets;
   std::vector<ebus::DecodedEvent> byteEvents;

   for (const auto &bytes: {sealed({0xce, 0x1a, 0x81, 0xc3, 0x26, 0x42, 0x55}), sealed({0xcc, 0x0d, 0x00, 0xc1, 0x48, 0x08, 0x0a})})
   {
      ebus::BusFrame frame(static_cast<int>(bytes.size()));

      frame.put(bytes.data(), bytes.size());
      frame.flip();

      ebus::FrameCheck::check(frame);

      ebus::BusPacket packet;

      if (!assembler.push(frame, packet))
         continue;

      bytePackets.push_back(packet);

      ebus::DecodeResult result = packetDecoder.decode(context, packet);

      byteEvents.insert(byteEvents.end(), result.events.begin(), result.events.end());
   }

   expect(packets.size() == bytePackets.size(), "same packet count at byte level");

   for (unsigned int i = 0; i < packets.size() && i < bytePackets.size(); i++)
   {
      expect(packets[i].identifier() == bytePackets[i].identifier(), "packet " + std::to_string(i) + " device matches byte level");
      expect(static_cast<const ByteBuffer &>(packets[i]) == static_cast<const ByteBuffer &>(bytePackets[i]), "packet " + std::to_string(i) + " content matches byte level");
      expect(packets[i].frameFlags() == bytePackets[i].frameFlags(), "packet " + std::to_string(i) + " flags match byte level");
   }

   expect(events.size() == byteEvents.size(), "same event count at byte level");

   for (unsigned int i = 0; i < events.size() && i < byteEvents.size(); i++)
   {
      expect(events[i].identifier == byteEvents[i].identifier && events[i].command == byteEvents[i].command, "event " + std::to_string(i) + " key matches byte level");
      expect(events[i].name == byteEvents[i].name && events[i].unit == byteEvents[i].unit, "event " + std::to_string(i) + " field matches byte level");
      expect(events[i].value == byteEvents[i].value && events[i].valid == byteEvents[i].valid, "event " + std::to_string(i) + " value matches byte level");
   }
}

void testIdleAfterBurst()
{
   logger->info("test idle line after last frame");

   // checksum 33 and the idle zeros after it form preamble cc
   const std::vector<unsigned char> bytes = sealed({0xce, 0x1a, 0xc3, 0x26, 0x42, 0x10, 0x00});

   Modulator modulator;

   modulator.silence(200);
   modulator.frame(bytes);
   modulator.silence(2000);

   Capture capture = decodeModulated(modulator);

   expect(capture.frames.size() == 1, "idle line must not complete frames, found " + std::to_string(capture.frames.size()));
   expect(capture.crcErrors == 0, "idle line must not raise checksum errors");

   if (!capture.frames.empty())
      expect(static_cast<const ByteBuffer &>(capture.frames[0]) == ByteBuffer(bytes.data(), bytes.size()), "frame content before idle line");

   // corrupted frame with preamble cc in payload, the newer candidate only completes with idle line
   std::vector<unsigned char> corrupted = sealed({0xce, 0x1a, 0xc3, 0xcc, 0x42, 0x55, 0x00});

   corrupted[5] ^= 0x01;

   Modulator corruptedModulator;

   corruptedModulator.silence(200);
   corruptedModulator.frame(corrupted);
   corruptedModulator.silence(2000);

   capture = decodeModulated(corruptedModulator);

   expect(capture.frames.size() == 1, "corrupt frame must be reported, found " + std::to_string(capture.frames.size()));
   expect(capture.crcErrors == 1, "one checksum error expected");

   if (!capture.frames.empty())
   {
      expect(static_cast<const ByteBuffer &>(capture.frames[0]) == ByteBuffer(corrupted.data(), corrupted.size()), "transmitted frame reported");
      expect(capture.frames[0].hasCrcError(), "reported frame checksum flag");
   }
}

void testDcOffsetAndNoise()
{
   logger->info("test DC offset and noise");

   const std::vector<std::vector<unsigned char>> lines = {
      sealed({0xce, 0x1a, 0x81, 0xc3, 0x26, 0x42, 0x55}),
      sealed({0xcc, 0x0d, 0x00, 0xc1, 0x48, 0x08, 0x0a}),
      sealed({0xce, 0x1a, 0xc3, 0x26, 0x42, 0x10, 0x00})
   };

   // fixed offset, then a slow downward drift of 40 sample units over the capture
   const std::pair<double, double> levels[] = {{30.0, 0.0}, {0.0, -40.0 / 6000}};

   for (const auto &level: levels)
   {
      Modulator modulator;

      modulator.offset = level.first;
      modulator.drift = level.second;
      modulator.noise = 4;

      modulator.silence(200);

      for (const auto &line: lines)
      {
         modulator.frame(line);
         modulator.silence(1000);
      }

      Capture capture = decodeModulated(modulator);

      expect(capture.frames.size() == lines.size(), "all frames expected with offset " + std::to_string(level.first) + " drift " + std::to_string(level.second) + ", found " + std::to_string(capture.frames.size()));
      expect(capture.crcErrors == 0, "no checksum errors expected with DC offset and noise");

      for (unsigned int i = 0; i < capture.frames.size() && i < lines.size(); i++)
      {
         expect(static_cast<const ByteBuffer &>(capture.frames[i]) == ByteBuffer(lines[i].data(), lines[i].size()), "frame " + std::to_string(i) + " content with DC offset and noise");
      }
   }
}

void testSampleLimit()
{
   logger->info("test sample limit");

   const std::vector<unsigned char> first = sealed({0xce, 0x1a, 0x81, 0xc3, 0x26, 0x42, 0x55});
   const std::vector<unsigned char> second = sealed({0xcc, 0x0d, 0x00, 0xc1, 0x48, 0x08, 0x0a});

   Modulator modulator;

   modulator.silence(200);
   modulator.frame(first);
   modulator.silence(1000);
   modulator.frame(second);
   modulator.silence(1000);

   hw::MemoryDevice device(modulator.samples);

   device.open(hw::MemoryDevice::Read);

   ebus::BusDecoder decoder(device);

   // stop inside the gap between both frames
   decoder.setSampleLimit(1700);

   Capture capture = decodeSamples(decoder);

   expect(decoder.sampleCount() == 1700, "decoding must stop at sample limit, read " + std::to_string(decoder.sampleCount()));
   expect(capture.frames.size() == 1, "only frames before sample limit expected, found " + std::to_string(capture.frames.size()));

   if (!capture.frames.empty())
      expect(static_cast<const ByteBuffer &>(capture.frames[0]) == ByteBuffer(first.data(), first.size()), "frame before sample limit");
}

int main(int argc, char *argv[])
{
   Logger::init(std::cout);

   Logger::setRootLevel(Logger::WARN_LEVEL);

   logger->info("***********************************************************************");
   logger->info("E-Bus laboratory, signal chain tests");
   logger->info("***********************************************************************");

   testEnvelope();
   testBitRecovery();
   testResync();
   testNoSignal();
   testDecodeCapture();
   testIdleAfterBurst();
   testDcOffsetAndNoise();
   testSampleLimit();

   if (failures)
      logger->error("{} checks failed", {failures});
   else
      logger->info("all checks passed");

   Logger::flush();

   return failures ? 1 : 0;
}
