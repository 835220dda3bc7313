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

#include <hw/SignalType.h>
#include <hw/MemoryDevice.h>

#define BUFFER_SIZE (4096)

namespace hw {

struct MemoryDevice::Impl
{
   rt::Logger *log = rt::Logger::getLogger("hw.MemoryDevice");

   unsigned int sampleRate;
   long long streamTime = 0;
   unsigned long long readOffset = 0;
   bool opened = false;

   std::vector<unsigned char> samples;

   Impl(std::vector<unsigned char> samples, unsigned int sampleRate) : sampleRate(sampleRate), samples(std::move(samples))
   {
   }
};

MemoryDevice::MemoryDevice(const std::vector<unsigned char> &samples, unsigned int sampleRate) : impl(std::make_shared<Impl>(samples, sampleRate))
{
}

bool MemoryDevice::open(Mode mode)
{
   impl->opened = true;
   impl->readOffset = 0;

   impl->log->debug("opened memory stream with {} samples", {static_cast<unsigned long long>(impl->samples.size())});

   return true;
}

void MemoryDevice::close()
{
   impl->opened = false;
}

rt::Variant MemoryDevice::get(int id, int channel) const
{
   switch (id)
   {
      case PARAM_DEVICE_NAME:
         return std::string("memory");

      case PARAM_SAMPLE_RATE:
         return impl->sampleRate;

      case PARAM_SAMPLE_SIZE:
         return static_cast<unsigned int>(SAMPLE_SIZE_8);

      case PARAM_SAMPLE_TYPE:
         return static_cast<unsigned int>(SAMPLE_TYPE_INTEGER);

      case PARAM_STREAM_TIME:
         return impl->streamTime;

      case PARAM_SAMPLES_READ:
         return impl->readOffset;

      default:
         return {};
   }
}

bool MemoryDevice::set(int id, const rt::Variant &value, int channel)
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

bool MemoryDevice::isOpen() const
{
   return impl->opened;
}

bool MemoryDevice::isEof() const
{
   return impl->readOffset >= impl->samples.size();
}

long MemoryDevice::read(SignalBuffer &buffer)
{
   if (!impl->opened)
      return -1;

   const unsigned int capacity = buffer.capacity() ? buffer.capacity() : BUFFER_SIZE;

   const unsigned long long available = impl->samples.size() - impl->readOffset;

   const auto count = static_cast<unsigned int>(available < capacity ? available : capacity);

   SignalBuffer result(capacity, impl->sampleRate, impl->readOffset, SIGNAL_TYPE_RAW_SAMPLES);

   float *dst = result.push(count);

   for (unsigned int i = 0; i < count; i++)
      dst[i] = normalize(impl->samples[impl->readOffset + i]);

   result.flip();

   impl->readOffset += count;

   buffer = result;

   return count;
}

}
