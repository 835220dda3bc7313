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

#include <cstring>

#include <ebus/RuleTable.h>

namespace ebus {

/*
 * Helpers to describe standard field layouts
 */
static FieldExtractor integer(const std::string &name, unsigned int offset, unsigned int width, const std::string &unit)
{
   FieldExtractor field;

   field.name = name;
   field.offset = offset;
   field.width = width;
   field.transform = IntegerField;
   field.unit = unit;

   return field;
}

static FieldExtractor scaled(const std::string &name, unsigned int offset, unsigned int width, double scale, const std::string &unit)
{
   FieldExtractor field = integer(name, offset, width, unit);

   field.transform = ScaledField;
   field.scale = scale;

   return field;
}

static FieldExtractor enumerated(const std::string &name, unsigned int offset, unsigned int width, const std::map<long long, std::string> &labels)
{
   FieldExtractor field = integer(name, offset, width, "");

   field.transform = EnumField;
   field.labels = labels;

   return field;
}

static FieldExtractor typed(const std::string &name, unsigned int offset, unsigned int width, FieldTransform type, const std::string &unit)
{
   FieldExtractor field = integer(name, offset, width, unit);

   field.transform = type;

   return field;
}

static PacketRule rule(const std::string &name, unsigned int identifier, int command, const std::vector<FieldExtractor> &fields)
{
   PacketRule rule;

   rule.name = name;
   rule.identifier = identifier;
   rule.command = command;
   rule.fields = fields;

   return rule;
}

static PacketRule known(unsigned int identifier, const std::vector<unsigned char> &match)
{
   PacketRule rule;

   rule.name = "static";
   rule.identifier = identifier;
   rule.command = (match[0] << 8) | match[1];
   rule.match = match;

   return rule;
}

void RuleTable::add(const PacketRule &rule)
{
   index.emplace(key(rule.identifier, rule.command), table.size());

   table.push_back(rule);
}

const PacketRule *RuleTable::find(unsigned int identifier, int command, const rt::ByteBuffer &data) const
{
   if (command >= 0)
   {
      if (const PacketRule *rule = search(key(identifier, command), data))
         return rule;
   }

   return search(key(identifier, PacketRule::AnyCommand), data);
}

const PacketRule *RuleTable::search(unsigned int key, const rt::ByteBuffer &data) const
{
   auto range = index.equal_range(key);

   // multimap keeps insertion order for equal keys
   for (auto it = range.first; it != range.second; ++it)
   {
      const PacketRule &rule = table[it->second];

      if (rule.match.empty())
         return &rule;

      if (rule.match.size() == data.remaining() && std::memcmp(rule.match.data(), data.ptr(), data.remaining()) == 0)
         return &rule;
   }

   return nullptr;
}

const std::vector<PacketRule> &RuleTable::rules() const
{
   return table;
}

unsigned int RuleTable::size() const
{
   return static_cast<unsigned int>(table.size());
}

unsigned int RuleTable::key(unsigned int identifier, int command)
{
   return (identifier & 0xff) << 17 | (command < 0 ? 0x10000 : command & 0xffff);
}

RuleTable RuleTable::standard()
{
   RuleTable rules;

   // static packets without known meaning
   rules.add(known(0x0D, {0x4A, 0x0C, 0xFF}));
   rules.add(known(0x1A, {0x01, 0x02, 0xFF}));
   rules.add(known(0x26, {0x01, 0x02, 0xFF}));
   rules.add(known(0x3F, {0x02, 0x00, 0x40}));
   rules.add(known(0x3F, {0x02, 0x08, 0x01}));

   // drive unit (0D) and display (1A) report the same values with different commands
   rules.add(rule("max speed", 0x0D, 0x1638, {scaled("max speed", 2, 2, 0.1, "km/h")}));
   rules.add(rule("max speed", 0x1A, 0x163A, {scaled("max speed", 2, 2, 0.1, "km/h")}));

   rules.add(rule("datetime", 0x3F, 0x4A00, {typed("datetime", 2, 6, DateTimeField, "")}));
   rules.add(rule("datetime", 0x1A, 0x4A0E, {typed("datetime", 2, 6, DateTimeField, "")}));

   const std::vector<FieldExtractor> range = {
      integer("range boost", 2, 2, "km"),
      integer("range trail", 4, 2, "km"),
      integer("range eco", 6, 2, "km")
   };

   rules.add(rule("range", 0x0D, 0x1620, range));
   rules.add(rule("range", 0x1A, 0x1622, range));

   rules.add(rule("speed", 0x0D, 0x3C08, {scaled("speed", 2, 2, 0.1, "km/h")}));
   rules.add(rule("speed", 0x1A, 0x3C0A, {scaled("speed", 2, 2, 0.1, "km/h")}));

   rules.add(rule("trip distance", 0x0D, 0x4808, {integer("trip distance", 2, 4, "m")}));
   rules.add(rule("trip distance", 0x1A, 0x480A, {integer("trip distance", 2, 4, "m")}));

   rules.add(rule("odometer", 0x0D, 0x4828, {integer("odometer", 2, 4, "m")}));
   rules.add(rule("odometer", 0x1A, 0x482A, {integer("odometer", 2, 4, "m")}));

   rules.add(rule("cadence", 0x0D, 0x3848, {integer("cadence", 4, 1, "rpm")}));
   rules.add(rule("cadence", 0x1A, 0x384A, {integer("cadence", 4, 1, "rpm")}));

   rules.add(rule("trip time", 0x0D, 0x1628, {typed("trip time", 2, 4, DurationField, "min")}));
   rules.add(rule("trip time", 0x1A, 0x162A, {typed("trip time", 2, 4, DurationField, "min")}));

   rules.add(rule("average speed", 0x0D, 0x1630, {scaled("average speed", 2, 2, 0.1, "km/h")}));
   rules.add(rule("average speed", 0x1A, 0x1632, {scaled("average speed", 2, 2, 0.1, "km/h")}));

   const std::map<long long, std::string> assist = {{0, "off"}, {1, "eco"}, {2, "trail"}, {3, "boost"}};

   rules.add(rule("assist mode", 0x0D, 0x1600, {enumerated("assist mode", 2, 2, assist)}));
   rules.add(rule("assist mode", 0x1A, 0x1602, {enumerated("assist mode", 2, 2, assist)}));

   const std::map<long long, std::string> walk = {{0, "off"}, {1, "on"}, {2, "active"}};

   rules.add(rule("walk mode", 0x0D, 0x1660, {enumerated("walk mode", 2, 1, walk)}));
   rules.add(rule("walk mode", 0x1A, 0x1662, {enumerated("walk mode", 2, 1, walk)}));
   rules.add(rule("walk mode", 0x13, 0x1660, {enumerated("walk mode", 2, 1, walk)}));
   rules.add(rule("walk mode", 0x26, 0x1662, {enumerated("walk mode", 2, 1, walk)}));

   rules.add(rule("switch", 0x0D, 0x0400, {typed("switch", 2, 1, ButtonField, "")}));
   rules.add(rule("switch", 0x26, 0x0400, {typed("switch", 2, 1, ButtonField, "")}));

   rules.add(rule("battery", 0x0D, 0x2640, {typed("battery", 2, 1, PercentField, "%")}));
   rules.add(rule("battery", 0x1A, 0x2642, {typed("battery", 2, 1, PercentField, "%")}));

   return rules;
}

}
