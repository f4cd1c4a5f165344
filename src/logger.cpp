// Copyright (C) 2015 Jonas Kümmerlin <rgcjonas@gmail.com>
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.


#ifndef NDEBUG

#include <algorithm>
#include <cctype>
#include <sstream>

#include "logger.hpp"
#include "util.hpp"

#include <windows.h>

namespace {
    inline bool is_space(char c)
    {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    inline std::string trim(const std::string &s)
    {
        auto first = std::find_if_not(s.begin(), s.end(), is_space);
        auto last  = std::find_if_not(s.rbegin(), s.rend(), is_space).base();

        return first < last ? std::string(first, last) : std::string();
    }

    class DebugLogBuffer : public std::stringbuf {
    public:
        virtual int sync()
        {
            std::string u8 = trim(this->str());
            this->str(std::string());

            if (u8.empty())
                return 0;

            std::wstring u16 = std::wstring(L"deskdup DEBUG LOG: ") + util::utf8_to_utf16(u8) + std::wstring(L"\r\n");

            OutputDebugStringW(u16.c_str());

            return 0;
        }
    };
}

std::ostream& operator<<(std::ostream& os, const RECT& r)
{
    os << "RECT[(" << r.left << ", " << r.top << "),(" << r.right << "," << r.bottom << ")]";

    return os;
}

std::ostream* get_logger()
{
    static __thread DebugLogBuffer *my_buf = nullptr;
    static __thread std::ostream   *my_stream = nullptr;

    if (!my_buf)
        my_buf = new DebugLogBuffer;
    if (!my_stream)
        my_stream = new std::ostream(my_buf);

    return my_stream;
}

#endif // NDEBUG
