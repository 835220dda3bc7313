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

#ifndef DEV_SIGNALDEVICE_H
#define DEV_SIGNALDEVICE_H

#include <hw/Device.h>
#include <hw/SignalBuffer.h>

namespace hw {

/*
 * Source of single channel unsigned 8 bit samples, delivered as normalized floats (value - 127.5) / 127.5
 */
class SignalDevice : public Device<SignalBuffer>
{
   public:

      enum Params
      {
         // sampling parameters
         PARAM_SAMPLE_RATE = 100,
         PARAM_SAMPLE_SIZE = 101,
         PARAM_SAMPLE_TYPE = 102,

         // stream parameters
         PARAM_STREAM_TIME = 104,
         PARAM_SAMPLES_READ = 105,
      };

      // raw sample conversion shared by all devices
      static float normalize(unsigned char value)
      {
         return (static_cast<float>(value) - 127.5f) / 127.5f;
      }
};

}
#endif
