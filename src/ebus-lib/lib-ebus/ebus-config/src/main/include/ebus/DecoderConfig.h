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

#ifndef EBUS_DECODERCONFIG_H
#define EBUS_DECODERCONFIG_H

#include <memory>
#include <string>
#include <vector>

#include <ebus/BusDecoder.h>
#include <ebus/PacketRule.h>

namespace ebus {

/*
 * JSON configuration for decoder parameters, extra rules, logging levels and trace filter.
 * Malformed documents raise std::runtime_error.
 */
class DecoderConfig
{
      struct Impl;

   public:

      DecoderConfig();

      static DecoderConfig fromFile(const std::string &path);

      static DecoderConfig fromString(const std::string &text);

      // set decoder parameters and append configured rules
      void apply(BusDecoder &decoder) const;

      // set root and per logger levels
      void applyLogging() const;

      std::vector<PacketRule> rules() const;

      // three byte frame prefixes excluded from frame trace
      std::vector<std::vector<unsigned char>> frameFilter() const;

   private:

      std::shared_ptr<Impl> impl;
};

}

#endif
