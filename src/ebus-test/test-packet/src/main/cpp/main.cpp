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
#include <stdexcept>
#include <string>
#include <vector>

#include <rt/Logger.h>

#include <ebus/Bus.h>
#include <ebus/BusFrame.h>
#include <ebus/BusPacket.h>
#include <ebus/DecoderConfig.h>
#include <ebus/DecoderContext.h>
#include <ebus/PacketAssembler.h>
#include <ebus/PacketDecoder.h>
#include <ebus/RuleTable.h>

using namespace rt;

Logger *logger = Logger::getLogger("test.packet", Logger::INFO_LEVEL);

static int failures = 0;

static void expect(bool condition, const std::string &message)
{
   if (condition)
      return;

   logger->error("FAILED: {}", {message});

   failures++;
}

/*
 * Data frame for device with transport control byte and three data bytes, checksum is not verified here
 */
static ebus::BusFrame dataFrame(unsigned int preamble, unsigned int identifier, unsigned int control, unsigned char d0, unsigned char d1, unsigned char d2, unsigned int flags = 0)
{
   ebus::BusFrame frame({static_cast<unsigned char>(preamble), static_cast<unsigned char>(identifier), 0x00, static_cast<unsigned char>(control), d0, d1, d2, 0x00});

   frame.setFrameFlags(flags);

   return frame;
}

static ebus::BusPacket packetOf(unsigned int identifier, const std::vector<unsigned char> &bytes, unsigned int flags = 0)
{
   ebus::BusPacket packet(identifier);

   packet.put(bytes.data(), bytes.size());
   packet.flip();
   packet.setFrameFlags(flags);
   packet.setFrameCount(1);

   return packet;
}

void testTransportHeader()
{
   logger->info("test transport header");

   ebus::TransportHeader header = ebus::PacketAssembler::header(dataFrame(ebus::Reply, 0x1a, 0x85, 0x26, 0x42, 0x55));

   expect(header.present, "reply frame carries transport header");
   expect(header.device == 0x1a, "reply device");
   expect(header.type == ebus::FirstFrame, "first frame type");
   expect(header.counter == 5, "sequence counter");
   expect(header.reserved == 0, "reserved bit clear");

   header = ebus::PacketAssembler::header(dataFrame(ebus::Broadcast, 0x4d, 0xe1, 0x00, 0x00, 0x00));

   expect(header.present && header.device == 0x0d, "broadcast device from identifier");
   expect(header.type == ebus::SingleFrame && header.reserved == 1 && header.counter == 1, "control byte fields");

   ebus::BusFrame display({0xcc, 0x40, 0x26, 0xc0, 0x04, 0x00, 0x00, 0x00});

   header = ebus::PacketAssembler::header(display);

   expect(header.present && header.device == 0x26, "display broadcast device from first payload byte");

   header = ebus::PacketAssembler::header(dataFrame(ebus::LinkControl, 0x1a, 0xc0, 0x00, 0x00, 0x00));

   expect(!header.present, "link control frames carry no transport header");

   header = ebus::PacketAssembler::header(ebus::BusFrame({0xcf, 0x7f, 0x81}));

   expect(!header.present, "short frames carry no transport header");
}

void testAssembler()
{
   logger->info("test packet assembler");

   ebus::PacketAssembler assembler;
   ebus::BusPacket packet;

   expect(!assembler.push(dataFrame(ebus::Broadcast, 0x0d, 0x80, 0x48, 0x08, 0x0a), packet), "first frame starts packet");
   expect(assembler.pendingCount() == 1, "one packet in progress");
   expect(!assembler.push(dataFrame(ebus::Broadcast, 0x0d, 0x01, 0x00, 0x00, 0x00), packet), "consecutive frame appends");
   expect(assembler.push(dataFrame(ebus::Broadcast, 0x0d, 0x42, 0x00, 0x00, 0x00), packet), "last frame completes packet");
   expect(assembler.pendingCount() == 0, "no packet in progress");

   expect(packet.identifier() == 0x0d, "packet device");
   expect(packet.limit() == 9, "packet size");
   expect(packet.command() == 0x4808, "packet command");
   expect(packet.frameCount() == 3, "packet frame count");
   expect(!packet.hasSequenceError() && !packet.hasCrcError(), "packet without errors");

   // counter jump
   assembler.push(dataFrame(ebus::Broadcast, 0x0d, 0x80, 0x48, 0x08, 0x0a), packet);

   expect(assembler.push(dataFrame(ebus::Broadcast, 0x0d, 0x43, 0x00, 0x00, 0x00), packet), "packet with gap completes");
   expect(packet.hasSequenceError(), "sequence gap must be flagged");

   // checksum error propagates
   assembler.push(dataFrame(ebus::Broadcast, 0x0d, 0x80, 0x48, 0x08, 0x0a), packet);

   expect(assembler.push(dataFrame(ebus::Broadcast, 0x0d, 0x41, 0x00, 0x00, 0x00, ebus::CrcError), packet), "packet with bad frame completes");
   expect(packet.hasCrcError() && !packet.hasSequenceError(), "checksum error must be flagged");

   // orphan consecutive frame
   expect(!assembler.push(dataFrame(ebus::Broadcast, 0x0d, 0x41, 0x00, 0x00, 0x00), packet), "last frame without first frame ignored");

   // single frame completes at once and drops any packet in progress
   assembler.push(dataFrame(ebus::Reply, 0x1a, 0x80, 0x01, 0x02, 0x03), packet);

   expect(assembler.push(dataFrame(ebus::Reply, 0x1a, 0xc3, 0x26, 0x42, 0x55), packet), "single frame completes packet");
   expect(packet.limit() == 3 && packet[2] == 0x55, "single frame packet content");
   expect(assembler.pendingCount() == 0, "single frame discards packet in progress");

   // packets from different devices interleave
   assembler.push(dataFrame(ebus::Broadcast, 0x0d, 0x80, 0x16, 0x28, 0x05), packet);
   assembler.push(dataFrame(ebus::Reply, 0x1a, 0x80, 0x16, 0x2a, 0x07), packet);

   expect(assembler.pendingCount() == 2, "two devices in progress");
   expect(assembler.push(dataFrame(ebus::Broadcast, 0x0d, 0x41, 0x00, 0x00, 0x00), packet), "first device completes");
   expect(packet.identifier() == 0x0d && packet[2] == 0x05, "first device packet");
   expect(assembler.push(dataFrame(ebus::Reply, 0x1a, 0x41, 0x00, 0x00, 0x00), packet), "second device completes");
   expect(packet.identifier() == 0x1a && packet[2] == 0x07, "second device packet");

   // packets longer than allowed are dropped
   assembler.push(dataFrame(ebus::Broadcast, 0x0d, 0x80, 0x00, 0x00, 0x00), packet);

   for (unsigned int counter = 1; counter <= 21; counter++)
      expect(!assembler.push(dataFrame(ebus::Broadcast, 0x0d, counter & 0x1f, 0x00, 0x00, 0x00), packet), "oversized packet never completes");

   expect(assembler.pendingCount() == 0, "oversized packet dropped");

   assembler.push(dataFrame(ebus::Broadcast, 0x0d, 0x80, 0x00, 0x00, 0x00), packet);
   assembler.reset();

   expect(assembler.pendingCount() == 0, "reset drops packets in progress");
}

void testRuleTable()
{
   logger->info("test rule table");

   ebus::RuleTable table = ebus::RuleTable::standard();

   expect(table.size() > 30, "standard rules loaded");

   const ebus::PacketRule *rule = table.find(0x0d, 0x3c08, ByteBuffer({0x3c, 0x08, 0xfd, 0x00}));

   expect(rule && rule->name == "speed", "speed rule for drive unit");

   rule = table.find(0x1a, 0x3c08, ByteBuffer({0x3c, 0x08, 0xfd, 0x00}));

   expect(!rule, "drive unit command is not a display command");

   rule = table.find(0x0d, 0x4a0c, ByteBuffer({0x4a, 0x0c, 0xff}));

   expect(rule && rule->fields.empty(), "static packet rule");

   rule = table.find(0x0d, 0x4a0c, ByteBuffer({0x4a, 0x0c, 0xfe}));

   expect(!rule, "static rule requires identical packet");

   ebus::PacketRule any;

   any.name = "any";
   any.identifier = 0x0d;
   any.command = ebus::PacketRule::AnyCommand;

   table.add(any);

   rule = table.find(0x0d, 0x4a0c, ByteBuffer({0x4a, 0x0c, 0xfe}));

   expect(rule && rule->name == "any", "wildcard rule as fallback");

   rule = table.find(0x0d, 0x3c08, ByteBuffer({0x3c, 0x08, 0xfd, 0x00}));

   expect(rule && rule->name == "speed", "exact command before wildcard");
}

void testDecoder()
{
   logger->info("test packet decoder");

   ebus::RuleTable table = ebus::RuleTable::standard();
   ebus::DecoderContext context(table);
   ebus::PacketDecoder decoder;

   ebus::DecodeResult result = decoder.decode(context, packetOf(0x0d, {0x48, 0x08, 0x0a, 0x00, 0x00, 0x00}));

   expect(result.known && result.events.size() == 1, "trip distance decoded");

   if (!result.events.empty())
   {
      expect(result.events[0].name == "trip distance", "trip distance name");
      expect(std::get<long long>(result.events[0].value) == 10, "trip distance value");
      expect(result.events[0].unit == "m", "trip distance unit");
      expect(result.events[0].valid, "trip distance valid");
      expect(result.events[0].command == 0x4808, "trip distance command");
   }

   result = decoder.decode(context, packetOf(0x0d, {0x3c, 0x08, 0xfd, 0x00}));

   expect(result.events.size() == 1 && std::fabs(std::get<double>(result.events[0].value) - 25.3) < 1E-9, "scaled speed");

   result = decoder.decode(context, packetOf(0x1a, {0x16, 0x02, 0x02, 0x00}));

   expect(result.events.size() == 1 && std::get<std::string>(result.events[0].value) == "trail", "assist mode label");

   result = decoder.decode(context, packetOf(0x1a, {0x16, 0x02, 0x07, 0x00}));

   expect(result.events.size() == 1 && std::get<long long>(result.events[0].value) == 7, "assist mode without label");

   result = decoder.decode(context, packetOf(0x0d, {0x16, 0x28, 0x05, 0x00, 0x00, 0x00}));

   expect(result.events.size() == 1 && std::get<std::chrono::seconds>(result.events[0].value) == std::chrono::seconds(300), "trip time in minutes");

   result = decoder.decode(context, packetOf(0x3f, {0x4a, 0x00, 0x18, 0x05, 0x0c, 0x0a, 0x1e, 0x00}));

   expect(result.events.size() == 1 && std::get<ebus::DateTime>(result.events[0].value) == ebus::DateTime {2024, 5, 12, 10, 30, 0}, "date time");

   result = decoder.decode(context, packetOf(0x3f, {0x4a, 0x00, 0x18, 0x0d, 0x0c, 0x0a, 0x1e, 0x00}));

   expect(result.known && result.events.empty() && result.errors.size() == 1, "invalid month is a field error");

   result = decoder.decode(context, packetOf(0x0d, {0x16, 0x20, 0x64, 0x00, 0x78, 0x00, 0x8c, 0x00}));

   expect(result.events.size() == 3, "range reports three fields");

   if (result.events.size() == 3)
   {
      expect(result.events[0].name == "range boost" && std::get<long long>(result.events[0].value) == 100, "range boost");
      expect(result.events[1].name == "range trail" && std::get<long long>(result.events[1].value) == 120, "range trail");
      expect(result.events[2].name == "range eco" && std::get<long long>(result.events[2].value) == 140, "range eco");
   }

   result = decoder.decode(context, packetOf(0x0d, {0x48, 0x08, 0x0a}));

   expect(result.known && result.events.empty() && result.errors.size() == 1, "short packet is a field error");

   result = decoder.decode(context, packetOf(0x0d, {0x4a, 0x0c, 0xff}));

   expect(result.known && result.ignored && result.events.empty(), "static packet ignored");

   result = decoder.decode(context, packetOf(0x2a, {0x12, 0x34, 0x56}));

   expect(!result.known && result.events.empty() && result.errors.empty(), "unknown packet");

   result = decoder.decode(context, packetOf(0x1a, {0x26, 0x42, 0x55}, ebus::SequenceError));

   expect(result.events.size() == 1 && !result.events[0].valid, "sequence error invalidates event");

   result = decoder.decode(context, packetOf(0x1a, {0x26, 0x42, 0x55}, ebus::CrcError));

   expect(result.events.size() == 1 && !result.events[0].valid, "checksum error invalidates event");

   // extractors added by code bypass configuration checks, out of range parameters are field errors
   ebus::PacketRule rule;

   rule.name = "malformed";
   rule.identifier = 0x2b;

   ebus::FieldExtractor wrapped;
   wrapped.name = "wrapped offset";
   wrapped.offset = 0xffffffff;
   wrapped.width = 2;

   ebus::FieldExtractor shifted;
   shifted.name = "wide shift";
   shifted.offset = 2;
   shifted.transform = ebus::EnumField;
   shifted.shift = 64;

   ebus::FieldExtractor plain;
   plain.name = "plain";
   plain.offset = 2;

   rule.fields = {wrapped, shifted, plain};

   ebus::RuleTable custom;

   custom.add(rule);

   ebus::DecoderContext customContext(custom);

   result = decoder.decode(customContext, packetOf(0x2b, {0x11, 0x22, 0x33}));

   expect(result.known && result.errors.size() == 2, "out of range extractors are field errors, found " + std::to_string(result.errors.size()));
   expect(result.events.size() == 1 && std::get<long long>(result.events[0].value) == 0x33, "valid extractor still runs");
}

void testButtons()
{
   logger->info("test switch events");

   ebus::RuleTable table = ebus::RuleTable::standard();
   ebus::DecoderContext context(table);
   ebus::PacketDecoder decoder;

   std::vector<std::string> values;

   // pressed, repeat, repeat, released on upper button
   for (unsigned char code: {0x00, 0x20, 0x20, 0x10})
   {
      ebus::DecodeResult result = decoder.decode(context, packetOf(0x26, {0x04, 0x00, code}));

      for (const auto &event: result.events)
      {
         expect(event.name == "switch upper", "upper button name");

         values.push_back(std::get<std::string>(event.value));
      }
   }

   expect(values == std::vector<std::string>({"pressed", "held", "released from hold"}), "held button sequence");
   expect(context.buttonState(0x26, 0) == ebus::Released, "upper button released");

   values.clear();

   // short press on lower button
   for (unsigned char code: {0x01, 0x11})
   {
      ebus::DecodeResult result = decoder.decode(context, packetOf(0x26, {0x04, 0x00, code}));

      for (const auto &event: result.events)
      {
         expect(event.name == "switch lower", "lower button name");

         values.push_back(std::get<std::string>(event.value));
      }
   }

   expect(values == std::vector<std::string>({"pressed", "released"}), "short press sequence");

   // buttons are tracked per device
   decoder.decode(context, packetOf(0x0d, {0x04, 0x00, 0x00}));

   expect(context.buttonState(0x0d, 0) == ebus::Pressed, "drive unit button pressed");
   expect(context.buttonState(0x26, 0) == ebus::Released, "display button unaffected");
}

void testConfig()
{
   logger->info("test rule configuration");

   ebus::DecoderConfig config = ebus::DecoderConfig::fromString(R"(
      {
         "rules": [
            {
               "name": "motor temperature",
               "id": "0d",
               "command": "5a10",
               "fields": [
                  {"name": "temperature", "offset": 2, "width": 2, "type": "scaled", "scale": 0.5, "unit": "C", "endian": "big"}
               ]
            },
            {
               "name": "light",
               "id": "1a",
               "command": "5a20",
               "fields": [
                  {"offset": 2, "type": "enum", "shift": 4, "mask": "0f", "labels": {"0": "off", "1": "on"}}
               ]
            },
            {
               "id": "26",
               "match": "5a3001"
            }
         ],
         "frameFilter": ["cf7f81"]
      }
   )");

   auto rules = config.rules();

   expect(rules.size() == 3, "three configured rules");

   if (rules.size() == 3)
   {
      expect(rules[0].identifier == 0x0d && rules[0].command == 0x5a10, "rule key");
      expect(rules[1].fields.size() == 1 && rules[1].fields[0].name == "light", "field name defaults to rule name");
      expect(rules[2].command == 0x5a30 && rules[2].match.size() == 3, "static rule command from match");
   }

   expect(config.frameFilter().size() == 1, "configured frame filter");

   ebus::RuleTable table = ebus::RuleTable::standard();

   for (const auto &rule: rules)
      table.add(rule);

   ebus::DecoderContext context(table);
   ebus::PacketDecoder decoder;

   ebus::DecodeResult result = decoder.decode(context, packetOf(0x0d, {0x5a, 0x10, 0x00, 0x51}));

   expect(result.events.size() == 1 && std::fabs(std::get<double>(result.events[0].value) - 40.5) < 1E-9, "big endian scaled field");

   result = decoder.decode(context, packetOf(0x1a, {0x5a, 0x20, 0x13}));

   expect(result.events.size() == 1 && std::get<std::string>(result.events[0].value) == "on", "shifted enum field");

   result = decoder.decode(context, packetOf(0x26, {0x5a, 0x30, 0x01}));

   expect(result.known && result.ignored, "configured static packet");

   // a bare array is a rule list
   expect(ebus::DecoderConfig::fromString(R"([{"id": "13", "command": "1234"}])").rules().size() == 1, "bare rule list");

   expect(ebus::DecoderConfig().frameFilter().size() == 6, "default frame filter");

   const char *invalid[] = {
      "{ not json",
      R"({"rules": [{"name": "no id"}]})",
      R"({"rules": [{"id": "zz"}]})",
      R"({"rules": [{"id": "0d", "fields": [{"offset": 2, "type": "complex"}]}]})",
      R"({"rules": [{"id": "0d", "fields": [{"offset": 2, "endian": "middle"}]}]})",
      R"({"rules": [{"id": "0d", "fields": [{"offset": 2, "type": "enum", "labels": {"one": "x"}}]}]})",
      R"({"frameFilter": ["c"]})",
      R"("rules")",
      R"({"rules": [{"id": "4d"}]})",
      R"({"rules": [{"id": "100000004"}]})",
      R"({"rules": [{"id": 77}]})",
      R"({"rules": [{"id": "0d", "fields": [{"offset": 4294967295, "width": 2}]}]})",
      R"({"rules": [{"id": "0d", "fields": [{"offset": 64}]}]})",
      R"({"rules": [{"id": "0d", "fields": [{"offset": 2, "width": 9}]}]})",
      R"({"rules": [{"id": "0d", "fields": [{"offset": 2, "type": "enum", "shift": 64}]}]})"
   };

   for (const char *text: invalid)
   {
      bool rejected = false;

      try
      {
         ebus::DecoderConfig::fromString(text);
      }
      catch (const std::runtime_error &e)
      {
         logger->info("rejected configuration: {}", {std::string(e.what())});

         rejected = true;
      }

      expect(rejected, std::string("configuration must be rejected: ") + text);
   }

   bool missing = false;

   try
   {
      ebus::DecoderConfig::fromFile("/nonexistent/ebus-config.json");
   }
   catch (const std::runtime_error &)
   {
      missing = true;
   }

   expect(missing, "missing configuration file must be rejected");

   bool badLevel = false;

   try
   {
      ebus::DecoderConfig::fromString(R"({"logging": {"root": "loud"}})").applyLogging();
   }
   catch (const std::runtime_error &)
   {
      badLevel = true;
   }

   expect(badLevel, "invalid logging level must be rejected");
}

int main(int argc, char *argv[])
{
   Logger::init(std::cout);

   Logger::setRootLevel(Logger::WARN_LEVEL);

   logger->info("***********************************************************************");
   logger->info("E-Bus laboratory, packet tests");
   logger->info("***********************************************************************");

   testTransportHeader();
   testAssembler();
   testRuleTable();
   testDecoder();
   testButtons();
   testConfig();

   if (failures)
      logger->error("{} checks failed", {failures});
   else
      logger->info("all checks passed");

   Logger::flush();

   return failures ? 1 : 0;
}
