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

#pragma once

#include <windows.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>
#include <utility>

namespace util {
    ///////////////////////////////////////////////////////////////
    // Free-standing, independent utility functions
    ///////////////////////////////////////////////////////////////
    template <typename T>
    inline T clamp(const T& lower, const T& n, const T& upper) {
        return std::max(lower, std::min(n, upper));
    }

    inline std::wstring utf8_to_utf16(const std::string& str)
    {
        int needed_buffer = MultiByteToWideChar(CP_UTF8, 0, str.c_str(), -1, nullptr, 0);
        if (needed_buffer <= 1)
            return std::wstring();

        std::wstring wide(needed_buffer, 0);
        MultiByteToWideChar(CP_UTF8, 0, str.c_str(), -1, &wide[0], needed_buffer);
        wide.resize(needed_buffer - 1); // drop the terminator

        return wide;
    }

    inline std::string wcsdup_to_utf8(const wchar_t *utf16)
    {
        if (!utf16)
            return std::string();

        int needed_buffer = WideCharToMultiByte(CP_UTF8, 0, utf16, -1, nullptr, 0, nullptr, nullptr);
        if (needed_buffer <= 1)
            return std::string();

        std::string utf8(needed_buffer, 0);
        WideCharToMultiByte(CP_UTF8, 0, utf16, -1, &utf8[0], needed_buffer, nullptr, nullptr);
        utf8.resize(needed_buffer - 1);

        return utf8;
    }

    /**
     * Renders a status code for the log: the system message if there is one,
     * always followed by the hex value (DXGI codes often have no message).
     */
    inline std::string hresult_to_utf8(HRESULT hr)
    {
        wchar_t *buffer = nullptr;
        std::string utf8;

        DWORD len = FormatMessageW(
            FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
            NULL,
            hr,
            MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
            reinterpret_cast<LPWSTR>(&buffer),
            0,
            nullptr);

        if (len && buffer) {
            utf8 = wcsdup_to_utf8(buffer);
            utf8 += ' ';
        }
        if (buffer)
            LocalFree(buffer);

        char hex[16];
        snprintf(hex, sizeof(hex), "0x%08lX", static_cast<unsigned long>(hr));

        return utf8 + "(" + hex + ")";
    }

    /**
     * Converts a duration to the millisecond timeout the DXGI wait functions
     * take. Fractions of a millisecond are truncated, negative values become 0
     * and anything that does not fit is capped below INFINITE.
     */
    template<typename TRep, typename TPeriod>
    inline UINT to_timeout_msecs(std::chrono::duration<TRep, TPeriod> timeout)
    {
        auto msecs = std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count();

        return static_cast<UINT>(clamp<long long>(0, msecs, static_cast<long long>(INFINITE) - 1));
    }

    /**
     * A value that is shared between threads and only touched under its own lock.
     *
     * Hold it through a std::shared_ptr when several owners need it. with()
     * holds the lock for the duration of the call and nothing more.
     */
    template<typename T>
    class locked
    {
        std::mutex m_mutex;
        T          m_value;

    public:
        explicit locked(T &&value)
            : m_value(std::move(value))
        {}

        locked(const locked& other) = delete;
        locked& operator=(const locked& other) = delete;

        template<typename TFunc>
        auto with(TFunc&& func) -> decltype(func(std::declval<T&>()))
        {
            std::lock_guard<std::mutex> guard(m_mutex);

            return func(m_value);
        }
    };

    /**
     * A stdcall function looked up in a DLL at run time.
     *
     * The DLL stays loaded as long as this object lives. Check operator bool
     * before calling.
     */
    template<typename TFunc> class dll_func;

    template<typename TReturn, typename... TArgs>
    class dll_func<TReturn(TArgs...)>
    {
        typedef TReturn(__stdcall *func_type)(TArgs...);

        HMODULE   m_module = 0;
        func_type m_function = nullptr;

    public:
        dll_func(const wchar_t *dll, const char *function)
        {
            m_module = LoadLibraryW(dll);
            if (!m_module) return;

            m_function = reinterpret_cast<func_type>(GetProcAddress(m_module, function));
        }
        dll_func(const dll_func& other) = delete;
        dll_func(dll_func&& other) = delete;

        dll_func& operator=(const dll_func& other) = delete;
        dll_func& operator=(dll_func&& other) = delete;

        explicit operator bool() const
        {
            return m_module && m_function;
        }

        TReturn operator()(TArgs... args)
        {
            return m_function(std::forward<TArgs>(args)...);
        }

        ~dll_func()
        {
            if (m_module)
                FreeLibrary(m_module);
        }
    };
}
