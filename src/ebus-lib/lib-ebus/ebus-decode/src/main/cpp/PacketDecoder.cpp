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

#include <rt/Logger.h>

#include <ebus/PacketDecoder.h>

namespace ebus {

static rt::Logger *logger = rt::Logger::getLogger("ebus.PacketDecoder");

static DecodedEvent event(const BusPacket &packet, const FieldExtractor &field, const FieldValue &value)
{
   return {
      packet.identifier(),
      static_cast<unsigned int>(packet.command()),
      field.name,
      value,
      field.unit,
      !packet.hasCrcError() && !packet.hasSequenceError(),
      packet.timeStart(),
      packet.dateTime()
   };
}

DecodeResult PacketDecoder::decode(DecoderContext &context, const BusPacket &packet) const
{
   DecodeResult result;

   const PacketRule *rule = context.rules().find(packet.identifier(), packet.command(), packet);

   if (!rule)
   {
      logger->trace("no rule for device {02x} packet {}", {packet.identifier(), static_cast<const rt::ByteBuffer &>(packet)});

      return result;
   }

   result.known = true;

   if (rule->fields.empty())
   {
      result.ignored = true;

      return result;
   }

   for (const auto &field: rule->fields)
   {
      if (!extract(context, packet, field, result))
      {
         logger->warn("device {02x} rule [{}] field [{}]: {}", {packet.identifier(), rule->name, field.name, result.errors.back().reason});
      }
   }

   return result;
}

bool PacketDecoder::extract(DecoderContext &context, const BusPacket &packet, const FieldExtractor &field, DecodeResult &result) const
{
   if (field.width < 1 || field.width > 8)
   {
      result.errors.push_back({field.name, "unsupported field width " + std::to_string(field.width)});
      return false;
   }

   if (field.shift >= 64)
   {
      result.errors.push_back({field.name, "unsupported field shift " + std::to_string(field.shift)});
      return false;
   }

   if (field.offset > packet.limit() || field.width > packet.limit() - field.offset)
   {
      result.errors.push_back({field.name, "packet too short, " + std::to_string(packet.limit()) + " bytes"});
      return false;
   }

   switch (field.transform)
   {
      case IntegerField:
      case PercentField:
      {
         auto value = static_cast<long long>(packet.peekLong(field.offset, field.width, field.endian));

         result.events.push_back(event(packet, field, value));

         return true;
      }

      case ScaledField:
      {
         auto value = static_cast<double>(packet.peekLong(field.offset, field.width, field.endian)) * field.scale;

         result.events.push_back(event(packet, field, value));

         return true;
      }

      case EnumField:
      {
         auto value = static_cast<long long>(packet.peekLong(field.offset, field.width, field.endian) >> field.shift);

         if (field.mask)
            value &= field.mask;

         auto label = field.labels.find(value);

         if (label != field.labels.end())
            result.events.push_back(event(packet, field, label->second));
         else
            result.events.push_back(event(packet, field, value));

         return true;
      }

      case DurationField:
      {
         auto value = static_cast<long long>(packet.peekLong(field.offset, field.width, field.endian));

         result.events.push_back(event(packet, field, std::chrono::seconds(value * field.unitSeconds)));

         return true;
      }

      case DateTimeField:
      {
         if (field.width != 6)
         {
            result.errors.push_back({field.name, "date time requires 6 bytes"});
            return false;
         }

         const unsigned int offset = field.offset;

         DateTime value {
            2000 + packet[offset + 0],
            packet[offset + 1],
            packet[offset + 2],
            packet[offset + 3],
            packet[offset + 4],
            packet[offset + 5]
         };

         if (value.month < 1 || value.month > 12 || value.day < 1 || value.day > 31 || value.hour > 23 || value.minute > 59 || value.second > 59)
         {
            result.errors.push_back({field.name, "invalid date time"});
            return false;
         }

         result.events.push_back(event(packet, field, value));

         return true;
      }

      case ButtonField:
      {
         return button(context, packet, field, result);
      }
   }

   result.errors.push_back({field.name, "unknown transform " + std::to_string(static_cast<int>(field.transform))});

   return false;
}

/*
 * Switch byte: bit 0 selects button, bits 5:4 carry pressed / released / repeat code
 */
bool PacketDecoder::button(DecoderContext &context, const BusPacket &packet, const FieldExtractor &field, DecodeResult &result) const
{
   const unsigned int value = packet[field.offset];
   const unsigned int which = value & 0x01;
   const unsigned int code = (value >> 4) & 0x03;

   const int state = context.buttonState(packet.identifier(), which);

   FieldExtractor named = field;

   named.name = field.name + (which ? " lower" : " upper");

   switch (state)
   {
      case Released:
      {
         if (code == ButtonPressed)
         {
            context.setButtonState(packet.identifier(), which, Pressed);
            result.events.push_back(event(packet, named, std::string("pressed")));
         }

         break;
      }

      case Pressed:
      {
         if (code == ButtonRepeat)
         {
            context.setButtonState(packet.identifier(), which, Held);
            result.events.push_back(event(packet, named, std::string("held")));
         }
         else if (code == ButtonReleased)
         {
            context.setButtonState(packet.identifier(), which, Released);
            result.events.push_back(event(packet, named, std::string("released")));
         }

         break;
      }

      case Held:
      {
         if (code == ButtonReleased)
         {
            context.setButtonState(packet.identifier(), which, Released);
            result.events.push_back(event(packet, named, std::string("released from hold")));
         }

         break;
      }

      default:
         break;
   }

   return true;
}

}
