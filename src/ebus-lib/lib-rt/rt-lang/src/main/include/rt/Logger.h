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

#ifndef RT_LOGGER_H
#define RT_LOGGER_H

#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

#include <rt/Variant.h>

namespace rt {

class Logger
{
   Logger(std::string name, int level);

   public:

      enum Level
      {
         NONE_LEVEL = 0,
         ERROR_LEVEL = 1,
         WARN_LEVEL = 2,
         INFO_LEVEL = 3,
         DEBUG_LEVEL = 4,
         TRACE_LEVEL = 5
      };

      void trace(const std::string &format, std::vector<Variant> params = {}) const;

      void debug(const std::string &format, std::vector<Variant> params = {}) const;

      void info(const std::string &format, std::vector<Variant> params = {}) const;

      void warn(const std::string &format, std::vector<Variant> params = {}) const;

      void error(const std::string &format, std::vector<Variant> params = {}) const;

      bool isEnabled(int level) const;

   public: // public static methods

      static void init(std::ostream &stream, int level = WARN_LEVEL);

      static void flush();

      static void setRootLevel(int level);

      static void setRootLevel(const std::string &level);

      static void setLoggerLevel(const std::string &target, int level);

      static void setLoggerLevel(const std::string &target, const std::string &level);

      static Logger *getLogger(const std::string &name, int level = NONE_LEVEL);

      static int parseLevel(const std::string &name);

   private: // private static methods

      static std::mutex &getMutex();

      static std::map<std::string, int> &getLevels();

      static std::map<std::string, std::unique_ptr<Logger>> &getLoggers();

   private:

      int level;

      std::string name;
};

}

#endif
