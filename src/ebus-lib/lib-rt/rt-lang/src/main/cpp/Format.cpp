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

#include <cctype>
#include <cstdio>
#include <regex>
#include <type_traits>

#include <rt/Format.h>

namespace rt {

static const char *ws = " \t\n\r\f\v";

/*
 * printf conversion for integer types, mode overrides default conversion ("x", "X")
 */
template <typename T>
static std::string integer(const std::string &opts, const std::string &mode, T value)
{
   char buffer[64];

   std::string length;

   if constexpr (std::is_same_v<T, long long> || std::is_same_v<T, unsigned long long>)
      length = "ll";
   else if constexpr (std::is_same_v<T, long> || std::is_same_v<T, unsigned long>)
      length = "l";

   std::string conversion = mode.empty() ? (std::is_signed_v<T> ? "d" : "u") : mode;

   snprintf(buffer, sizeof(buffer), ("%" + opts + length + conversion).c_str(), value);

   return buffer;
}

/*
 * format byte buffer as hex string "00 00 00 ..."
 */
static std::string hexdump(const ByteBuffer &value, bool upper)
{
   std::string result;

   char buffer[4];

   for (unsigned int i = value.position(); i < value.limit(); ++i)
   {
      snprintf(buffer, sizeof(buffer), upper ? "%02X" : "%02x", static_cast<unsigned int>(value[i]));

      if (!result.empty())
         result += ' ';

      result += buffer;
   }

   return result;
}

std::string Format::format(const std::string &fmt, const std::vector<Variant> &parameters)
{
   static const std::regex token(R"(\{(['\-+0]?\.?[0-9]*)?([xXt])?\})");

   std::string content = fmt;

   std::string::size_type offset = 0;

   for (const auto &parameter: parameters)
   {
      std::smatch match;

      std::string tail = content.substr(offset);

      if (!std::regex_search(tail, match, token))
         break;

      std::string opts = match[1];
      std::string mode = match[2];

      std::string text = std::visit([&](auto &&value) -> std::string {

         using V = std::decay_t<decltype(value)>;

         char buffer[512];

         if constexpr (std::is_same_v<V, bool>)
         {
            return value ? "true" : "false";
         }
         else if constexpr (std::is_same_v<V, char>)
         {
            snprintf(buffer, sizeof(buffer), ("%" + opts + (mode.empty() ? "c" : mode)).c_str(), value);
            return buffer;
         }
         else if constexpr (std::is_integral_v<V>)
         {
            return integer(opts, mode, value);
         }
         else if constexpr (std::is_floating_point_v<V>)
         {
            snprintf(buffer, sizeof(buffer), ("%" + opts + "f").c_str(), static_cast<double>(value));
            return buffer;
         }
         else if constexpr (std::is_same_v<V, const char *>)
         {
            snprintf(buffer, sizeof(buffer), ("%" + opts + "s").c_str(), value ? value : "(null)");
            return buffer;
         }
         else if constexpr (std::is_same_v<V, std::string>)
         {
            return value;
         }
         else if constexpr (std::is_same_v<V, std::vector<int>>)
         {
            // format as: {n, n, .... n}
            std::string list = "{";

            for (std::size_t i = 0; i < value.size(); i++)
            {
               if (i > 0)
                  list += ", ";

               list += std::to_string(value[i]);
            }

            return list + "}";
         }
         else
         {
            return hexdump(value, mode == "X");
         }

      }, parameter);

      content.replace(offset + match.position(), match.length(), text);

      // continue after replaced text so parameters containing "{}" are not expanded again
      offset += match.position() + text.length();
   }

   return content;
}

}
