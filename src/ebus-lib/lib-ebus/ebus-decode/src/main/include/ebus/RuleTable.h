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

#ifndef EBUS_RULETABLE_H
#define EBUS_RULETABLE_H

#include <map>
#include <vector>

#include <rt/ByteBuffer.h>

#include <ebus/PacketRule.h>

namespace ebus {

/*
 * Append only table of packet rules indexed by identifier and command
 */
class RuleTable
{
   public:

      // register rule after existing ones
      void add(const PacketRule &rule);

      /*
       * Find rule for identifier and command, exact command rules take precedence over any command rules.
       * Rules with exact match bytes apply only to identical packet contents.
       */
      const PacketRule *find(unsigned int identifier, int command, const rt::ByteBuffer &data) const;

      const std::vector<PacketRule> &rules() const;

      unsigned int size() const;

      // rules for the known drive unit, display and switch packets
      static RuleTable standard();

   private:

      static unsigned int key(unsigned int identifier, int command);

      const PacketRule *search(unsigned int key, const rt::ByteBuffer &data) const;

   private:

      std::vector<PacketRule> table;

      std::multimap<unsigned int, std::size_t> index;
};

}

#endif
