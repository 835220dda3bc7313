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

#ifndef RT_BUFFER_H
#define RT_BUFFER_H

#include <cassert>
#include <cstring>
#include <memory>
#include <initializer_list>

namespace rt {

template <class T>
class Buffer
{
   protected:

      std::shared_ptr<T[]> alloc;

      struct State
      {
         unsigned int position; // current data position
         unsigned int capacity; // buffer data capacity
         unsigned int limit; // buffer data limit
      } state;

      struct Attrs
      {
         unsigned int type; // data type
         unsigned int stride; // data stride, how many data has in one chunk for all channels
      } attrs;

   public:

      Buffer() : state {0, 0, 0}, attrs {0, 1}
      {
      }

      Buffer(const Buffer &other) = default;

      explicit Buffer(unsigned int capacity, unsigned int type = 0, unsigned int stride = 1) : alloc(new T[capacity > 0 ? capacity : 1]()), state {0, capacity, capacity}, attrs {type, stride}
      {
      }

      Buffer(const T *data, unsigned int capacity, unsigned int type = 0, unsigned int stride = 1) : Buffer(capacity, type, stride)
      {
         if (data && capacity)
         {
            put(data, capacity);
            flip();
         }
      }

      Buffer(std::initializer_list<T> data, unsigned int type = 0, unsigned int stride = 1) : Buffer(data.size(), type, stride)
      {
         put(data);
         flip();
      }

      ~Buffer() = default;

      Buffer &operator=(const Buffer &other) = default;

      bool operator==(const Buffer &other) const
      {
         if (this == &other)
            return true;

         if (remaining() != other.remaining())
            return false;

         if (remaining() == 0)
            return true;

         return std::memcmp(ptr(), other.ptr(), remaining() * sizeof(T)) == 0;
      }

      bool operator!=(const Buffer &other) const
      {
         return !operator==(other);
      }

      explicit operator bool() const
      {
         return alloc != nullptr;
      }

      void reset()
      {
         alloc.reset();
         state = {0, 0, 0};
         attrs = {0, 1};
      }

      bool isEmpty() const
      {
         return state.position == state.limit;
      }

      bool isFull() const
      {
         return state.position == state.capacity;
      }

      unsigned int position() const
      {
         return state.position;
      }

      unsigned int limit() const
      {
         return state.limit;
      }

      unsigned int capacity() const
      {
         return state.capacity;
      }

      unsigned int remaining() const
      {
         return state.limit - state.position;
      }

      unsigned int stride() const
      {
         return attrs.stride;
      }

      unsigned int size() const
      {
         return state.limit;
      }

      unsigned int type() const
      {
         return attrs.type;
      }

      T *data() const
      {
         assert(alloc != nullptr);
         return alloc.get();
      }

      T *ptr() const
      {
         assert(alloc != nullptr);
         return alloc.get() + state.position;
      }

      Buffer &clear()
      {
         assert(alloc != nullptr);

         state.limit = state.capacity;
         state.position = 0;

         return *this;
      }

      Buffer &flip()
      {
         assert(alloc != nullptr);

         state.limit = state.position;
         state.position = 0;

         return *this;
      }

      /*
       * extract one element from head
       */
      T get()
      {
         assert(alloc != nullptr);
         assert(state.position < state.limit);

         return alloc[state.position++];
      }

      /*
       * add one element to tail
       */
      Buffer &put(const T &value)
      {
         assert(alloc != nullptr);
         assert(state.position < state.limit);

         alloc[state.position++] = value;

         return *this;
      }

      Buffer &put(std::initializer_list<T> data)
      {
         for (auto b: data)
            put(b);

         return *this;
      }

      /*
       * add elements to tail
       */
      Buffer &put(const T *data, unsigned int elements)
      {
         assert(alloc != nullptr);
         assert(elements <= state.limit - state.position);

         std::memcpy(alloc.get() + state.position, data, elements * sizeof(T));

         state.position += elements;

         return *this;
      }

      /*
       * add remaining elements from other buffer
       */
      Buffer &put(const Buffer &other)
      {
         return put(other.ptr(), other.remaining());
      }

      /*
       * extract elements from head
       */
      Buffer &get(T *data, unsigned int elements)
      {
         assert(alloc != nullptr);
         assert(elements <= state.limit - state.position);

         std::memcpy(data, alloc.get() + state.position, elements * sizeof(T));

         state.position += elements;

         return *this;
      }

      /*
       * reserve space for elements and return pointer to first one
       */
      T *push(unsigned int elements)
      {
         assert(alloc != nullptr);
         assert(state.position + elements <= state.capacity);

         state.position += elements;

         return alloc.get() + state.position - elements;
      }

      T &operator[](unsigned int index)
      {
         assert(alloc != nullptr);
         assert(index < state.capacity);

         return alloc[index];
      }

      const T &operator[](unsigned int index) const
      {
         assert(alloc != nullptr);
         assert(index < state.capacity);

         return alloc[index];
      }
};

}

#endif
