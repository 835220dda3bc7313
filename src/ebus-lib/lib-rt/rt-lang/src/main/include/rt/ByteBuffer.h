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

#ifndef RT_BYTEBUFFER_H
#define RT_BYTEBUFFER_H

#include <rt/Buffer.h>

namespace rt {

class ByteBuffer : public Buffer<unsigned char>
{
   public:

      enum Endianness
      {
         BigEndian = 0,
         LittleEndian = 1,
      };

   public:

      ByteBuffer() = default;

      ByteBuffer(const ByteBuffer &other) = default;

      ByteBuffer(const std::initializer_list<unsigned char> &data) : Buffer(data)
      {
      }

      explicit ByteBuffer(unsigned int capacity) : Buffer(capacity)
      {
      }

      ByteBuffer(const unsigned char *data, unsigned int capacity) : Buffer(data, capacity)
      {
      }

      ByteBuffer &operator=(const ByteBuffer &other) = default;

      /*
       * read integer of "size" bytes at absolute offset, without update head pointer
       */
      unsigned long long peekLong(unsigned int offset, unsigned int size, Endianness endianness = LittleEndian) const
      {
         assert(offset + size <= state.limit);

         unsigned long long value = 0;

         if (endianness == LittleEndian)
         {
            for (unsigned int i = 0; i < size; ++i)
               value |= static_cast<unsigned long long>(alloc[offset + i]) << (i * 8);
         }
         else
         {
            for (unsigned int i = 0; i < size; ++i)
               value = (value << 8) | alloc[offset + i];
         }

         return value;
      }

      unsigned int peekInt(unsigned int offset, unsigned int size, Endianness endianness = LittleEndian) const
      {
         assert(size <= 4);

         return static_cast<unsigned int>(peekLong(offset, size, endianness));
      }
};

}

#endif
