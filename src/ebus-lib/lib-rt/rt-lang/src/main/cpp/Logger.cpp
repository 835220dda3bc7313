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

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iterator>
#include <sstream>

#include <rt/Logger.h>
#include <rt/Format.h>

namespace rt {

static const char *tags[] = {
   "NONE", // 0
   "ERROR", // 1
   "WARN", // 2
   "INFO", // 3
   "DEBUG", // 4
   "TRACE" // 5
};

static std::vector<std::string> tokenize(const std::string &text, char delimiter)
{
   std::string token;

   std::vector<std::string> tokens;

   std::istringstream input(text);

   while (std::getline(input, token, delimiter))
   {
      tokens.push_back(token);
   }

   return tokens;
}

/*
 * check if dotted logger name is matched by dotted filter, "*" matches any token
 */
static bool matches(const std::string &name, const std::string &filter)
{
   const std::vector<std::string> tokens = tokenize(name, '.');
   const std::vector<std::string> filters = tokenize(filter, '.');

   if (filters.size() > tokens.size())
      return false;

   for (std::size_t i = 0; i < filters.size(); i++)
   {
      if (filters[i] != "*" && filters[i] != tokens[i])
         return false;
   }

   return true;
}

// single synchronous writer, all logging events go to the same stream
struct Writer
{
   // global writer level
   int level;

   // output stream
   std::ostream &stream;

   // serialize writes from different threads
   std::mutex mutex;

   Writer(std::ostream &stream, int level) : level(level), stream(stream)
   {
   }

   void write(int level, const std::string &logger, const std::string &format, const std::vector<Variant> &params)
   {
      tm timeinfo {};
      char date[32];

      auto now = std::chrono::system_clock::now();

      const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
      const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

      localtime_r(&seconds, &timeinfo);

      strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &timeinfo);

      std::string message = Format::format(format, params);

      char header[96];

      snprintf(header, sizeof(header), "%s.%03d %-5s (%s) ", date, static_cast<int>(millis), tags[level], logger.c_str());

      std::lock_guard lock(mutex);

      stream << header << message << '\n';
   }
};

// global writer instance
static std::unique_ptr<Writer> writer;

// global mutex for logger instances (using construct-on-first-use to avoid static initialization order fiasco)
std::mutex &Logger::getMutex()
{
   static std::mutex instance;
   return instance;
}

// global levels map
std::map<std::string, int> &Logger::getLevels()
{
   static std::map<std::string, int> instance;
   return instance;
}

// global loggers map, loggers live until process exit
std::map<std::string, std::unique_ptr<Logger>> &Logger::getLoggers()
{
   static std::map<std::string, std::unique_ptr<Logger>> instance;
   return instance;
}

Logger::Logger(std::string name, int level) : level(level), name(std::move(name))
{
}

void Logger::trace(const std::string &format, std::vector<Variant> params) const
{
   if (isEnabled(TRACE_LEVEL))
      writer->write(TRACE_LEVEL, name, format, params);
}

void Logger::debug(const std::string &format, std::vector<Variant> params) const
{
   if (isEnabled(DEBUG_LEVEL))
      writer->write(DEBUG_LEVEL, name, format, params);
}

void Logger::info(const std::string &format, std::vector<Variant> params) const
{
   if (isEnabled(INFO_LEVEL))
      writer->write(INFO_LEVEL, name, format, params);
}

void Logger::warn(const std::string &format, std::vector<Variant> params) const
{
   if (isEnabled(WARN_LEVEL))
      writer->write(WARN_LEVEL, name, format, params);
}

void Logger::error(const std::string &format, std::vector<Variant> params) const
{
   if (isEnabled(ERROR_LEVEL))
      writer->write(ERROR_LEVEL, name, format, params);
}

bool Logger::isEnabled(int value) const
{
   return writer && (level >= value || writer->level >= value);
}

Logger *Logger::getLogger(const std::string &name, int level)
{
   std::lock_guard lock(getMutex());

   auto &loggers = getLoggers();

   auto it = loggers.find(name);

   if (it != loggers.end())
      return it->second.get();

   auto logger = std::unique_ptr<Logger>(new Logger(name, level));

   // apply levels already configured for matching targets
   for (const auto &[target, value]: getLevels())
   {
      if (matches(name, target))
         logger->level = value;
   }

   return loggers.emplace(name, std::move(logger)).first->second.get();
}

int Logger::parseLevel(const std::string &name)
{
   std::string value = name;

   // convert to uppercase (as TAGs are uppercase)
   std::transform(value.begin(), value.end(), value.begin(), ::toupper);

   for (int i = 0; i < static_cast<int>(std::size(tags)); i++)
   {
      if (value == tags[i])
         return i;
   }

   return -1;
}

void Logger::setRootLevel(int level)
{
   if (writer)
      writer->level = level;
}

void Logger::setRootLevel(const std::string &level)
{
   int value = parseLevel(level);

   if (value >= 0)
      setRootLevel(value);
}

void Logger::setLoggerLevel(const std::string &target, int level)
{
   std::lock_guard lock(getMutex());

   // add or update level for future loggers
   getLevels()[target] = level;

   // and update already created loggers
   for (const auto &[name, logger]: getLoggers())
   {
      if (matches(name, target))
         logger->level = level;
   }
}

void Logger::setLoggerLevel(const std::string &target, const std::string &level)
{
   int value = parseLevel(level);

   if (value >= 0)
      setLoggerLevel(target, value);
}

void Logger::init(std::ostream &stream, int level)
{
   writer = std::make_unique<Writer>(stream, level);
}

void Logger::flush()
{
   if (writer)
   {
      std::lock_guard lock(writer->mutex);

      writer->stream.flush();
   }
}

}
