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

#ifndef DEV_DEVICE_H
#define DEV_DEVICE_H

#include <string>

#include <rt/Variant.h>

namespace hw {

template <typename BufferType>
class Device
{
   public:

      enum Mode
      {
         Read = 1
      };

      enum Params
      {
         PARAM_DEVICE_NAME = 2,
      };

   public:

      virtual ~Device() = default;

      virtual bool open(Mode mode) = 0;

      virtual void close() = 0;

      template <typename V>
      V get(int id) const
      {
         return std::get<V>(this->get(id, -1));
      }

      virtual bool set(int id, const rt::Variant &value)
      {
         return this->set(id, value, -1);
      }

      virtual rt::Variant get(int id, int channel) const = 0;

      virtual bool set(int id, const rt::Variant &value, int channel) = 0;

      virtual bool isOpen() const = 0;

      virtual bool isEof() const = 0;

      virtual long read(BufferType &buffer) = 0;
};

}
#endif
