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

#include <signal.h>
#include <unistd.h>
#include <getopt.h>

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <cmath>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <rt/Logger.h>

#include <hw/RawDevice.h>

#include <ebus/Bus.h>
#include <ebus/BusDecoder.h>
#include <ebus/DecoderConfig.h>
#include <ebus/PacketAssembler.h>

struct Main
{
   rt::Logger *log = rt::Logger::getLogger("app.main");

   // transport frame type catalog
   const std::map<unsigned int, std::string> transportType {
      {ebus::ConsecutiveFrame, "CF"},
      {ebus::LastFrame, "LF"},
      {ebus::FirstFrame, "FF"},
      {ebus::SingleFrame, "SF"}
   };

   std::atomic_bool terminate = false;

   // trace selection
   bool demodEnabled = true;
   bool decodEnabled = true;

   // frames excluded from demod trace
   std::vector<std::vector<unsigned char>> frameFilter;

   void finish()
   {
      terminate = true;
   }

   static std::string formatTime(double dateTime)
   {
      char date[32];
      char buffer[48];
      struct tm timeinfo {};

      auto seconds = static_cast<std::time_t>(dateTime);
      auto micros = static_cast<int>(std::lround((dateTime - std::floor(dateTime)) * 1E6));

      if (micros >= 1000000)
      {
         seconds++;
         micros -= 1000000;
      }

      localtime_r(&seconds, &timeinfo);

      strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &timeinfo);

      snprintf(buffer, sizeof(buffer), "%s.%06d", date, micros);

      return buffer;
   }

   static std::string formatBytes(const unsigned char *data, unsigned int length, const char *format)
   {
      std::string result;
      char item[16];

      for (unsigned int i = 0; i < length; i++)
      {
         if (i > 0)
            result += ' ';

         snprintf(item, sizeof(item), format, static_cast<unsigned int>(data[i]));

         result += item;
      }

      return result;
   }

   static std::string formatBinary(const unsigned char *data, unsigned int length)
   {
      std::string result;

      for (unsigned int i = 0; i < length; i++)
      {
         if (i > 0)
            result += ' ';

         for (int b = 7; b >= 0; b--)
            result += (data[i] >> b) & 1 ? '1' : '0';
      }

      return result;
   }

   static std::string formatAscii(const unsigned char *data, unsigned int length)
   {
      std::string result;

      for (unsigned int i = 0; i < length; i++)
         result += data[i] >= 32 && data[i] < 127 ? static_cast<char>(data[i]) : '.';

      return result;
   }

   static std::string formatValue(const ebus::DecodedEvent &event)
   {
      char buffer[64];

      if (auto value = std::get_if<long long>(&event.value))
      {
         snprintf(buffer, sizeof(buffer), "%lld", *value);
      }
      else if (auto value = std::get_if<double>(&event.value))
      {
         snprintf(buffer, sizeof(buffer), "%.1f", *value);
      }
      else if (auto value = std::get_if<std::string>(&event.value))
      {
         return *value;
      }
      else if (auto value = std::get_if<ebus::DateTime>(&event.value))
      {
         snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d %02d:%02d:%02d", value->year, value->month, value->day, value->hour, value->minute, value->second);
      }
      else if (auto value = std::get_if<std::chrono::seconds>(&event.value))
      {
         // durations are shown in the unit of the rule
         long long count = value->count();

         if (event.unit == "min")
            count /= 60;
         else if (event.unit == "h")
            count /= 3600;

         snprintf(buffer, sizeof(buffer), "%lld", count);
      }
      else
      {
         return "?";
      }

      return buffer;
   }

   bool isFiltered(const ebus::BusFrame &frame) const
   {
      for (const auto &prefix: frameFilter)
      {
         if (frame.limit() >= prefix.size() && std::memcmp(frame.data(), prefix.data(), prefix.size()) == 0)
            return true;
      }

      return false;
   }

   void printFrame(const ebus::BusFrame &frame) const
   {
      if (!demodEnabled || isFiltered(frame))
         return;

      const ebus::TransportHeader header = ebus::PacketAssembler::header(frame);

      const char *crc = frame.isShortFrame() ? "N/A" : frame.hasCrcError() ? "ERR" : "OK ";

      std::string line = formatTime(frame.dateTime());

      char prefix[64];

      snprintf(prefix, sizeof(prefix), " [demod] ID %02x | CRC %s | ", header.present ? header.device : 0, crc);

      line += prefix;
      line += formatBytes(frame.data(), frame.limit(), "%02x");
      line += " | ";

      if (!header.present)
      {
         line += formatBinary(frame.data(), frame.limit());
      }
      else
      {
         // transport control and application data, without checksum
         const unsigned char *data = frame.data() + 3;
         const unsigned int length = frame.limit() - 4;

         char trailer[32];

         snprintf(trailer, sizeof(trailer), " | %s | %2u | %u", transportType.at(header.type).c_str(), header.counter, header.reserved);

         line += formatBinary(data, length);
         line += " | ";
         line += formatBytes(data, length, "%3u");
         line += " | ";
         line += formatAscii(data, length);
         line += trailer;
      }

      fprintf(stdout, "%s\n", line.c_str());
   }

   void printPacket(const ebus::RuleTable &rules, const ebus::BusPacket &packet) const
   {
      if (!decodEnabled)
         return;

      std::string time = formatTime(packet.dateTime());

      std::string hex = formatBytes(packet.data(), packet.limit(), "%02x");

      fprintf(stdout, "%s [decod] ID %02x | packet: %s\n", time.c_str(), packet.identifier(), hex.c_str());

      if (!rules.find(packet.identifier(), packet.command(), packet))
      {
         std::string ascii = formatAscii(packet.data(), packet.limit());

         fprintf(stdout, "%s [decod] ID %02x | unknown: %s | %s\n", time.c_str(), packet.identifier(), hex.c_str(), ascii.c_str());
      }
   }

   void printEvent(const ebus::DecodedEvent &event) const
   {
      if (!decodEnabled)
         return;

      std::string time = formatTime(event.dateTime);
      std::string value = formatValue(event);

      fprintf(stdout, "%s [decod] ID %02x | %s: %s%s%s%s\n",
              time.c_str(),
              event.identifier,
              event.name.c_str(),
              value.c_str(),
              event.unit.empty() ? "" : " ",
              event.unit.c_str(),
              event.valid ? "" : " (invalid)");
   }

   int run(const int argc, char *argv[])
   {
      int opt;
      int verbose = 0;
      long long limit = -1;
      char *endptr = nullptr;

      std::string input = "-";
      std::string configFile;
      std::string rulesFile;

      static struct option long_options[] = {
         {"help",    no_argument,       nullptr, 'h'},
         {"input",   required_argument, nullptr, 'i'},
         {"config",  required_argument, nullptr, 'c'},
         {"rules",   required_argument, nullptr, 'r'},
         {"verbose", no_argument,       nullptr, 'v'},
         {"trace",   required_argument, nullptr, 't'},
         {"samples", required_argument, nullptr, 'n'},
         {nullptr, 0, nullptr, 0}
      };

      int option_index = 0;
      while ((opt = getopt_long(argc, argv, "hi:c:r:vt:n:", long_options, &option_index)) != -1)
      {
         switch (opt)
         {
            case 'h':
            {
               printUsage(argc > 0 ? argv[0] : "ebus-dump");
               return 0;
            }

            case 'i':
            {
               input = optarg;
               break;
            }

            case 'c':
            {
               configFile = optarg;
               break;
            }

            case 'r':
            {
               rulesFile = optarg;
               break;
            }

            case 'v':
            {
               verbose++;
               break;
            }

            case 't':
            {
               std::string traces = optarg;
               demodEnabled = traces.find("demod") != std::string::npos;
               decodEnabled = traces.find("decod") != std::string::npos;
               break;
            }

            case 'n':
            {
               limit = strtoll(optarg, &endptr, 10);

               if (endptr == optarg || limit <= 0)
               {
                  fprintf(stderr, "Invalid value for 'n' argument\n");
                  showUsage();
                  return -1;
               }

               break;
            }

            default:
               showUsage();
               return -1;
         }
      }

      ebus::DecoderConfig config;
      ebus::DecoderConfig extraRules;

      try
      {
         if (!configFile.empty())
            config = ebus::DecoderConfig::fromFile(configFile);

         if (!rulesFile.empty())
            extraRules = ebus::DecoderConfig::fromFile(rulesFile);

         config.applyLogging();
      }
      catch (const std::runtime_error &e)
      {
         log->error("configuration error: {}", {std::string(e.what())});
         fprintf(stderr, "%s\n", e.what());
         return -1;
      }

      // command line verbosity overrides configured root level
      if (verbose > 0)
         rt::Logger::setRootLevel(verbose == 1 ? rt::Logger::INFO_LEVEL : verbose == 2 ? rt::Logger::DEBUG_LEVEL : rt::Logger::TRACE_LEVEL);

      frameFilter = config.frameFilter();

      hw::RawDevice device(input, EBUS_SAMPLE_RATE);

      if (!device.open(hw::RawDevice::Read))
      {
         fprintf(stderr, "Unable to open input [%s]\n", input.c_str());
         return -1;
      }

      ebus::BusDecoder decoder(device);

      try
      {
         config.apply(decoder);
         extraRules.apply(decoder);
      }
      catch (const std::runtime_error &e)
      {
         log->error("configuration error: {}", {std::string(e.what())});
         fprintf(stderr, "%s\n", e.what());
         return -1;
      }

      if (limit > 0)
         decoder.setSampleLimit(static_cast<unsigned long long>(limit));

      decoder.initialize();

      log->info("ebus-dump started, input [{}], {} rules", {input, decoder.rules().size()});

      ebus::BusRecord record;

      while (!terminate && decoder.nextRecord(record))
      {
         if (auto frame = std::get_if<ebus::BusFrame>(&record))
         {
            printFrame(*frame);
         }
         else if (auto packet = std::get_if<ebus::BusPacket>(&record))
         {
            printPacket(decoder.rules(), *packet);
         }
         else if (auto event = std::get_if<ebus::DecodedEvent>(&record))
         {
            printEvent(*event);
         }
      }

      fflush(stdout);

      fprintf(stderr, "samples: %llu, frames: %llu, crc errors: %llu\n", decoder.sampleCount(), decoder.frameCount(), decoder.crcErrorCount());

      device.close();

      rt::Logger::flush();

      return 0;
   }

   static void printUsage(const char *programName)
   {
      std::cout << "E-Bus Laboratory " << PROJECT_VERSION << " - bus capture decoder" << std::endl;
      std::cout << std::endl;
      std::cout << "Usage: " << programName << " [OPTIONS]" << std::endl;
      std::cout << std::endl;
      std::cout << "Description:" << std::endl;
      std::cout << "  Decodes raw unsigned 8 bit samples captured at 5 MSps from the bike bus line." << std::endl;
      std::cout << std::endl;
      std::cout << "Options:" << std::endl;
      std::cout << "  -h, --help            Show this help message and exit" << std::endl;
      std::cout << "  -i, --input PATH      Read samples from file, '-' for stdin (default)" << std::endl;
      std::cout << "  -c, --config PATH     JSON configuration file" << std::endl;
      std::cout << "  -r, --rules PATH      JSON file with additional packet rules" << std::endl;
      std::cout << "  -v, --verbose         Enable logging to stderr, repeat for more detail" << std::endl;
      std::cout << "  -t, --trace LIST      Comma separated traces: demod, decod (default both)" << std::endl;
      std::cout << "  -n, --samples COUNT   Stop after COUNT samples" << std::endl;
      std::cout << std::endl;
      std::cout << "Output:" << std::endl;
      std::cout << "  <time> [demod] ID 1a | CRC OK  | ce 1a ... | <bin> | <dec> | <ascii> | SF |  3 | 0" << std::endl;
      std::cout << "  <time> [decod] ID 1a | speed: 25.3 km/h" << std::endl;
      std::cout << std::endl;
   }

   static void showUsage()
   {
      printUsage("ebus-dump");
   }

} *app;

void intHandler(int sig)
{
   fprintf(stderr, "Terminate on signal %d\n", sig);
   app->finish();
}

int main(int argc, char *argv[])
{
   // send logging events to stderr
   rt::Logger::init(std::cerr);

   // disable logging at all (can be enabled with -v option)
   rt::Logger::setRootLevel(rt::Logger::NONE_LEVEL);

   signal(SIGINT, intHandler);
   signal(SIGTERM, intHandler);

   // create main object
   Main main;

   // set global pointer for signal handlers
   app = &main;

   // and run
   return main.run(argc, argv);
}
