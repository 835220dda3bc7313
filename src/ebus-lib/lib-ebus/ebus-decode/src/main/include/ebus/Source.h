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

#ifndef EBUS_SOURCE_H
#define EBUS_SOURCE_H

#include <list>

namespace ebus {

/*
 * Pull based producer, next() returns false when the stream is exhausted
 */
template <typename T>
class Source
{
   public:

      virtual ~Source() = default;

      virtual bool next(T &value) = 0;
};

/*
 * Finite source over a list of prepared values
 */
template <typename T>
class ListSource : public Source<T>
{
   public:

      ListSource() = default;

      explicit ListSource(std::list<T> values) : values(std::move(values))
      {
      }

      void push(const T &value)
      {
         values.push_back(value);
      }

      bool next(T &value) override
      {
         if (values.empty())
            return false;

         value = values.front();

         values.pop_front();

         return true;
      }

   private:

      std::list<T> values;
};

}

#endif
