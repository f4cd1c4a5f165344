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

#ifndef NOMINMAX
#  define NOMINMAX
#endif
#ifndef WIN32_LEAN_AND_MEAN
#  define WIN32_LEAN_AND_MEAN
#endif

#include <windows.h>
#include <unknwn.h>

#include <utility>

namespace com {
    template<typename TInterface> class ptr;

    template<typename TInterface> TInterface **out_arg(ptr<TInterface> &ptr);
    template<typename T> ptr<T> take_ptr(T *raw);

    /**
     * Maps an interface type to its interface id.
     *
     * The default uses the id the compiler attached to the type. Types that
     * merely look like COM interfaces (the test mocks, for instance) specialize
     * this instead of carrying a __declspec(uuid).
     */
    template<typename TInterface>
    struct interface_traits
    {
        static REFIID uuid()
        {
            return __uuidof(TInterface);
        }
    };

    /**
     * Owns exactly one reference to a COM object.
     *
     * Unlike a shared smart pointer, there is never more than one com::ptr
     * for an object: it cannot be copied, and the only ways to fill it are
     * com::take_ptr, com::out_arg and com::query_interface. All of them adopt
     * a reference the caller already owns, none of them calls AddRef.
     * The destructor is the only place that calls Release.
     *
     * A default constructed or moved-from instance is empty and releases nothing.
     */
    template<typename TInterface>
    class ptr
    {
        TInterface *p { nullptr };

    public:
        inline void reset()
        {
            if (p)
                p->Release();

            p = nullptr;
        }

        inline ptr() = default;

        inline ~ptr()
        {
            reset();
        }

        ptr(const ptr &other) = delete;
        ptr& operator=(const ptr &other) = delete;

        /**
         * Move constructor: Transfer the reference (clearing the old smart pointer)
         */
        inline ptr(ptr &&other) noexcept
        {
            std::swap(p, other.p);
        }

        inline ptr& operator=(ptr &&other) noexcept
        {
            if (this != &other) {
                reset();
                std::swap(p, other.p);
            }

            return *this;
        }

        explicit operator bool() const
        {
            return p != nullptr;
        }

        TInterface& operator*() const
        {
            return *p;
        }

        TInterface* operator->() const
        {
            return p;
        }

        /**
         * Borrow the raw pointer, e.g. to pass it as an input argument.
         * Ownership stays with this instance.
         */
        TInterface *get() const
        {
            return p;
        }

        /**
         * Give up ownership. The caller is now responsible for the reference.
         */
        TInterface *release()
        {
            TInterface *tmp = p;
            p = nullptr;
            return tmp;
        }

        static REFIID uuid()
        {
            return interface_traits<TInterface>::uuid();
        }

        // FRIENDS
        template<typename T> friend T **out_arg(ptr<T> &ptr);
        template<typename T> friend ptr<T> take_ptr(T *raw);
    };

    /**
     * Wrap a dumb pointer into a com::ptr, adopting the original reference
     *
     * The pointer must not be null and no other com::ptr may own it.
     * Nothing checks this.
     */
    template<typename T>
    ptr<T> take_ptr(T *raw)
    {
        ptr<T> smart;
        smart.p = raw;

        return smart;
    }

    /**
     * Improves memory safety when dealing with com-style output arguments
     *
     * The smart pointer is cleared first, then its storage is handed to the
     * callee, which stores a reference the smart pointer will adopt.
     */
    template<typename TInterface>
    TInterface **out_arg(ptr<TInterface> &smart)
    {
        smart.reset();
        return &smart.p;
    }

    /**
     * Only use this when you can't pass a typed pointer
     */
    template<typename TInterface>
    void **out_arg_void(ptr<TInterface> &smart)
    {
        return reinterpret_cast<void**>(out_arg(smart));
    }

    /**
     * Trade @param self for a pointer to interface T2 on the same object.
     *
     * @param self is consumed in every case: its reference is released before
     * this returns. On success @param result holds the reference created by
     * QueryInterface, so the net reference count of the object is unchanged.
     * On failure @param result is empty and the QueryInterface status is
     * returned.
     */
    template<typename T2, typename T>
    HRESULT query_interface(ptr<T> &&self, ptr<T2> &result)
    {
        ptr<T> consumed(std::move(self));

        if (!consumed) {
            result.reset();
            return E_POINTER;
        }

        HRESULT hr = consumed->QueryInterface(ptr<T2>::uuid(), out_arg_void(result));
        if (FAILED(hr))
            result.release(); // a failing QueryInterface must not hand out a reference

        return hr;
    }
}; // namespace com
