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

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include <rt/Logger.h>

#include <ebus/Bus.h>
#include <ebus/DecoderConfig.h>

using json = nlohmann::json;

namespace ebus {

static rt::Logger *logger = rt::Logger::getLogger("ebus.DecoderConfig");

// link control and noise frames hidden from frame trace by default
static const char *DEFAULT_FRAME_FILTER[] = {"cf7f81", "cc809a", "cc8d01", "cc9301", "cf7f80", "cc80a6"};

static unsigned int parseHex(const json &value, const std::string &what)
{
   if (value.is_number_unsigned())
   {
      if (value.get<unsigned long long>() > 0xffffffffULL)
         throw std::runtime_error(what + ": value out of range");

      return value.get<unsigned int>();
   }

   if (!value.is_string())
      throw std::runtime_error(what + ": expected hex string or number");

   const std::string text = value.get<std::string>();

   std::size_t end = 0;

   unsigned long result = 0;

   try
   {
      result = std::stoul(text, &end, 16);
   }
   catch (const std::logic_error &)
   {
      throw std::runtime_error(what + ": invalid hex value [" + text + "]");
   }

   if (end != text.length() || result > 0xffffffffUL)
      throw std::runtime_error(what + ": invalid hex value [" + text + "]");

   return static_cast<unsigned int>(result);
}

static std::vector<unsigned char> parseBytes(const json &value, const std::string &what)
{
   if (!value.is_string())
      throw std::runtime_error(what + ": expected hex string");

   std::string text;

   // spaces between bytes are allowed
   for (char c: value.get<std::string>())
   {
      if (c != ' ')
         text.push_back(c);
   }

   if (text.empty() || text.length() % 2)
      throw std::runtime_error(what + ": invalid hex bytes [" + text + "]");

   std::vector<unsigned char> result;

   for (std::size_t i = 0; i < text.length(); i += 2)
   {
      result.push_back(static_cast<unsigned char>(parseHex(text.substr(i, 2), what)));
   }

   return result;
}

static FieldTransform parseTransform(const std::string &type)
{
   if (type == "integer")
      return IntegerField;

   if (type == "scaled")
      return ScaledField;

   if (type == "enum")
      return EnumField;

   if (type == "datetime")
      return DateTimeField;

   if (type == "percent")
      return PercentField;

   if (type == "duration")
      return DurationField;

   if (type == "button")
      return ButtonField;

   throw std::runtime_error("unknown field type [" + type + "]");
}

static FieldExtractor parseField(const json &entry, const std::string &ruleName)
{
   FieldExtractor field;

   field.name = entry.value("name", ruleName);
   field.offset = entry.at("offset").get<unsigned int>();
   field.width = entry.value("width", 1u);
   field.transform = parseTransform(entry.value("type", std::string("integer")));
   field.unit = entry.value("unit", std::string());
   field.scale = entry.value("scale", 1.0);
   field.shift = entry.value("shift", 0u);
   field.unitSeconds = entry.value("unitSeconds", 60ll);

   if (field.width < 1 || field.width > 8)
      throw std::runtime_error("field " + field.name + ": width must be between 1 and 8 bytes");

   // packets never exceed maximum size, rejects offsets that would wrap the range check
   if (field.offset >= EBUS_MAX_PACKET_SIZE || field.offset + field.width > EBUS_MAX_PACKET_SIZE)
      throw std::runtime_error("field " + field.name + ": offset " + std::to_string(field.offset) + " beyond maximum packet size");

   if (field.shift >= 64)
      throw std::runtime_error("field " + field.name + ": shift " + std::to_string(field.shift) + " out of range");

   if (entry.contains("mask"))
      field.mask = parseHex(entry["mask"], "field " + field.name + " mask");

   if (entry.contains("endian"))
   {
      const std::string endian = entry["endian"].get<std::string>();

      if (endian == "little")
         field.endian = rt::ByteBuffer::LittleEndian;
      else if (endian == "big")
         field.endian = rt::ByteBuffer::BigEndian;
      else
         throw std::runtime_error("field " + field.name + ": invalid endian [" + endian + "]");
   }

   if (entry.contains("labels"))
   {
      for (const auto &[key, label]: entry["labels"].items())
      {
         try
         {
            field.labels[std::stoll(key)] = label.get<std::string>();
         }
         catch (const std::logic_error &)
         {
            throw std::runtime_error("field " + field.name + ": invalid label key [" + key + "]");
         }
      }
   }

   return field;
}

static PacketRule parseRule(const json &entry)
{
   PacketRule rule;

   rule.name = entry.value("name", std::string("unnamed"));
   rule.identifier = parseHex(entry.at("id"), "rule " + rule.name + " id");

   // device ids are 6 bits wide
   if (rule.identifier > 0x3f)
      throw std::runtime_error("rule " + rule.name + ": device id " + std::to_string(rule.identifier) + " out of range");

   if (entry.contains("command"))
      rule.command = static_cast<int>(parseHex(entry["command"], "rule " + rule.name + " command") & 0xffff);

   if (entry.contains("match"))
   {
      rule.match = parseBytes(entry["match"], "rule " + rule.name + " match");

      if (rule.match.size() >= 2 && !entry.contains("command"))
         rule.command = (rule.match[0] << 8) | rule.match[1];
   }

   if (entry.contains("fields"))
   {
      for (const auto &field: entry["fields"])
      {
         rule.fields.push_back(parseField(field, rule.name));
      }
   }

   return rule;
}

struct DecoderConfig::Impl
{
   json document = json::object();
};

DecoderConfig::DecoderConfig() : impl(std::make_shared<Impl>())
{
}

DecoderConfig DecoderConfig::fromFile(const std::string &path)
{
   std::ifstream input(path);

   if (!input.is_open())
      throw std::runtime_error("unable to open configuration file [" + path + "]");

   std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());

   logger->info("read configuration from [{}]", {path});

   return fromString(text);
}

DecoderConfig DecoderConfig::fromString(const std::string &text)
{
   DecoderConfig config;

   try
   {
      json document = json::parse(text);

      // a bare array is a rule list
      if (document.is_array())
         document = json {{"rules", document}};

      if (!document.is_object())
         throw std::runtime_error("configuration must be a JSON object");

      config.impl->document = document;

      // validate rules early so errors are reported at load time
      config.rules();
      config.frameFilter();
   }
   catch (const json::exception &e)
   {
      throw std::runtime_error(std::string("invalid configuration: ") + e.what());
   }

   return config;
}

void DecoderConfig::apply(BusDecoder &decoder) const
{
   const json &document = impl->document;

   try
   {
      if (document.contains("decoder"))
      {
         const json &config = document["decoder"];

         if (config.contains("sampleRate"))
            decoder.setSampleRate(config["sampleRate"].get<unsigned int>());

         if (config.contains("carrierFrequency"))
            decoder.setCarrierFrequency(config["carrierFrequency"].get<unsigned int>());

         if (config.contains("bitRate"))
            decoder.setBitRate(config["bitRate"].get<unsigned int>());

         if (config.contains("signalThreshold"))
            decoder.setSignalThreshold(config["signalThreshold"].get<float>());

         if (config.contains("jitterTolerance"))
            decoder.setJitterTolerance(config["jitterTolerance"].get<float>());

         if (config.contains("idleBits"))
            decoder.setIdleBits(config["idleBits"].get<unsigned int>());

         if (config.contains("maxFrameSize"))
            decoder.setMaxFrameSize(config["maxFrameSize"].get<unsigned int>());

         if (config.contains("streamTime"))
            decoder.setStreamTime(config["streamTime"].get<double>());

         if (config.contains("preambles"))
         {
            std::vector<unsigned int> preambles;

            for (const auto &value: config["preambles"])
               preambles.push_back(parseHex(value, "preamble") & 0xff);

            decoder.setPreambles(preambles);
         }

         if (config.contains("frameLength"))
         {
            for (const auto &[key, value]: config["frameLength"].items())
               decoder.setFrameLength(parseHex(key, "frame length identifier") & 0xff, value.get<unsigned int>());
         }

         logger->info("decoder config: {}", {config.dump()});
      }
   }
   catch (const json::exception &e)
   {
      throw std::runtime_error(std::string("invalid decoder configuration: ") + e.what());
   }

   for (const auto &rule: rules())
   {
      logger->debug("add rule [{}] for device {02x} command {04x}", {rule.name, rule.identifier, rule.command});

      decoder.rules().add(rule);
   }
}

void DecoderConfig::applyLogging() const
{
   const json &document = impl->document;

   if (!document.contains("logging"))
      return;

   try
   {
      const json &config = document["logging"];

      if (config.contains("root"))
      {
         const std::string level = config["root"].get<std::string>();

         if (rt::Logger::parseLevel(level) < 0)
            throw std::runtime_error("invalid root logging level [" + level + "]");

         rt::Logger::setRootLevel(level);
      }

      if (config.contains("levels"))
      {
         for (const auto &[target, value]: config["levels"].items())
         {
            const std::string level = value.get<std::string>();

            if (rt::Logger::parseLevel(level) < 0)
               throw std::runtime_error("invalid logging level [" + level + "] for [" + target + "]");

            rt::Logger::setLoggerLevel(target, level);
         }
      }
   }
   catch (const json::exception &e)
   {
      throw std::runtime_error(std::string("invalid logging configuration: ") + e.what());
   }
}

std::vector<PacketRule> DecoderConfig::rules() const
{
   std::vector<PacketRule> result;

   const json &document = impl->document;

   if (!document.contains("rules"))
      return result;

   try
   {
      for (const auto &entry: document["rules"])
      {
         result.push_back(parseRule(entry));
      }
   }
   catch (const json::exception &e)
   {
      throw std::runtime_error(std::string("invalid rule definition: ") + e.what());
   }

   return result;
}

std::vector<std::vector<unsigned char>> DecoderConfig::frameFilter() const
{
   std::vector<std::vector<unsigned char>> result;

   const json &document = impl->document;

   if (!document.contains("frameFilter"))
   {
      for (const auto *entry: DEFAULT_FRAME_FILTER)
         result.push_back(parseBytes(entry, "frame filter"));

      return result;
   }

   try
   {
      for (const auto &entry: document["frameFilter"])
      {
         result.push_back(parseBytes(entry, "frame filter"));
      }
   }
   catch (const json::exception &e)
   {
      throw std::runtime_error(std::string("invalid frame filter: ") + e.what());
   }

   return result;
}

}
