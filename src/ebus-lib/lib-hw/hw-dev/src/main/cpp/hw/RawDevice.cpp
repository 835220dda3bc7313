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

#include <chrono>
#include <fstream>
#include <iostream>

#include <rt/Logger.h>

#include <hw/SignalType.h>
#include <hw/RawDevice.h>

#define BUFFER_SIZE (4096)

namespace hw {

struct RawDevice::Impl
{
   rt::Logger *log = rt::Logger::getLogger("hw.RawDevice");

   std::string name;
   unsigned int sampleRate;
   unsigned long long samplesRead = 0;
   long long streamTime = 0;

   std::ifstream file;
   std::istream *input = nullptr;

   Impl(std::string name, unsigned int sampleRate) : name(std::move(name)), sampleRate(sampleRate)
   {
      log->debug("created RawDevice for name [{}]", {this->name});
   }

   ~Impl()
   {
      close();
   }

   bool open(Mode mode)
   {
      if (mode != Read)
      {
         log->warn("RawDevice [{}] only supports read mode", {name});
         return false;
      }

      close();

      samplesRead = 0;

      if (name == "-")
      {
         input = &std::cin;
      }
      else
      {
         file.open(name, std::ios::in | std::ios::binary);

         if (!file.is_open())
         {
            log->error("unable to open file [{}]", {name});
            return false;
         }

         input = &file;
      }

      streamTime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();

      log->info("opened raw sample stream [{}], sample rate {}", {name, sampleRate});

      return true;
   }

   void close()
   {
      if (input)
      {
         log->debug("close RawDevice for name [{}], {} samples read", {name, samplesRead});

         if (file.is_open())
            file.close();

         input = nullptr;
      }
   }

   bool isEof() const
   {
      return !input || input->eof();
   }

   long read(SignalBuffer &buffer)
   {
      if (!input)
         return -1;

      unsigned char block[BUFFER_SIZE];

      // default block size when caller provides no storage
      const unsigned int capacity = buffer.capacity() ? buffer.capacity() : BUFFER_SIZE;

      SignalBuffer result(capacity, sampleRate, samplesRead, SIGNAL_TYPE_RAW_SAMPLES);

      while (!result.isFull() && *input)
      {
         unsigned int count = result.capacity() - result.position();

         input->read(reinterpret_cast<char *>(block), count < BUFFER_SIZE ? count : BUFFER_SIZE);

         const auto samples = static_cast<unsigned int>(input->gcount());

         float *dst = result.push(samples);

         for (unsigned int i = 0; i < samples; i++)
            dst[i] = normalize(block[i]);
      }

      result.flip();

      samplesRead += result.limit();

      buffer = result;

      return static_cast<long>(result.limit());
   }
};

RawDevice::RawDevice(const std::string &name, unsigned int sampleRate) : impl(std::make_shared<Impl>(name, sampleRate))
{
}

RawDevice::~RawDevice() = default;

bool RawDevice::open(Mode mode)
{
   return impl->open(mode);
}

void RawDevice::close()
{
   impl->close();
}

rt::Variant RawDevice::get(int id, int channel) const
{
   switch (id)
   {
      case PARAM_DEVICE_NAME:
         return impl->name;

      case PARAM_SAMPLE_RATE:
         return impl->sampleRate;

      case PARAM_SAMPLE_SIZE:
         return static_cast<unsigned int>(SAMPLE_SIZE_8);

      case PARAM_SAMPLE_TYPE:
         return static_cast<unsigned int>(SAMPLE_TYPE_INTEGER);

      case PARAM_STREAM_TIME:
         return impl->streamTime;

      case PARAM_SAMPLES_READ:
         return impl->samplesRead;

      default:
         return {};
   }
}

bool RawDevice::set(int id, const rt::Variant &value, int channel)
{
   switch (id)
   {
      case PARAM_SAMPLE_RATE:
      {
         if (auto v = std::get_if<unsigned int>(&value))
         {
            impl->sampleRate = *v;
            return true;
         }

         impl->log->warn("invalid value type for PARAM_SAMPLE_RATE");
         return false;
      }

      case PARAM_STREAM_TIME:
      {
         if (auto v = std::get_if<long long>(&value))
         {
            impl->streamTime = *v;
            return true;
         }

         impl->log->warn("invalid value type for PARAM_STREAM_TIME");
         return false;
      }

      default:
         impl->log->warn("unknown or unsupported configuration id {}", {id});
         return false;
   }
}

bool RawDevice::isOpen() const
{
   return impl->input != nullptr;
}

bool RawDevice::isEof() const
{
   return impl->isEof();
}

long RawDevice::read(SignalBuffer &buffer)
{
   return impl->read(buffer);
}

}
