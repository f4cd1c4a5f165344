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

#include "com.hpp"

#include <dxgi.h>

namespace deskdup {
    /**
     * Walks the outputs of one adapter that are attached to the desktop.
     *
     * Outputs are fetched one at a time, on demand, by probing
     * TAdapter::EnumOutputs(0, 1, 2, ...). The walk ends at the first index
     * that fails; DXGI_ERROR_NOT_FOUND is the usual end marker and is not an
     * error. Outputs whose description says they are detached are skipped.
     *
     * An enumerator runs once. Enumerate again to see hot-plugged outputs.
     * The adapter must outlive the enumerator.
     */
    template<typename TAdapter, typename TOutput>
    class basic_output_enumerator
    {
        TAdapter *m_adapter;
        UINT      m_index { 0 };
        bool      m_done { false };

    public:
        explicit basic_output_enumerator(TAdapter *adapter)
            : m_adapter(adapter)
        {
            m_done = (m_adapter == nullptr);
        }

        /**
         * Fetch the next attached output into @param output.
         *
         * @returns false once the adapter has no more outputs; @param output is empty then
         */
        bool next(com::ptr<TOutput> &output)
        {
            while (!m_done) {
                if FAILED(m_adapter->EnumOutputs(m_index++, com::out_arg(output))) {
                    output.reset();
                    m_done = true;
                    break;
                }

                DXGI_OUTPUT_DESC desc;
                if SUCCEEDED(output->GetDesc(&desc)) {
                    if (desc.AttachedToDesktop)
                        return true;
                }
            }

            output.reset();
            return false;
        }

        UINT probed() const { return m_index; }
    };

    template<typename TOutput, typename TAdapter>
    basic_output_enumerator<TAdapter, TOutput> enumerate_outputs(TAdapter *adapter)
    {
        return basic_output_enumerator<TAdapter, TOutput>(adapter);
    }

    typedef basic_output_enumerator<IDXGIAdapter1, IDXGIOutput> output_enumerator;

    inline output_enumerator enumerate_outputs(IDXGIAdapter1 *adapter)
    {
        return output_enumerator(adapter);
    }
} // namespace deskdup
