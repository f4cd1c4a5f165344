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
#include "deskdup-outputs.hpp"
#include "deskdup-duplication.hpp"

#include <dxgi.h>

#include <utility>
#include <vector>

namespace deskdup {
    /**
     * Create a DXGI 1.1 factory.
     *
     * @returns E_NOTIMPL if dxgi.dll or CreateDXGIFactory1 is not available
     */
    HRESULT create_factory(com::ptr<IDXGIFactory1> &factory);

    /**
     * Walks the adapters of a factory, one EnumAdapters1 call per step,
     * until the first index that fails (DXGI_ERROR_NOT_FOUND at the end).
     */
    class adapter_enumerator
    {
        IDXGIFactory1 *m_factory;
        UINT           m_index { 0 };
        bool           m_done { false };

    public:
        explicit adapter_enumerator(IDXGIFactory1 *factory);

        bool next(com::ptr<IDXGIAdapter1> &adapter);
    };

    inline adapter_enumerator enumerate_adapters(IDXGIFactory1 *factory)
    {
        return adapter_enumerator(factory);
    }

    /**
     * Start a duplication session on @param device for each of @param outputs,
     * appending the output and its session to @param duplications.
     *
     * An output that can't be duplicated is logged and skipped, the remaining
     * ones are still tried. DXGI_ERROR_UNSUPPORTED is common here on hybrid
     * graphics, where the output is driven by the other GPU.
     *
     * The handles in @param outputs are consumed.
     *
     * @returns S_OK, or the status of the first output that failed
     */
    template<typename TDevice, typename TOutput, typename TOutput1, typename TDuplication>
    HRESULT duplicate_outputs(TDevice *device,
                              std::vector<com::ptr<TOutput>> &outputs,
                              std::vector<std::pair<com::ptr<TOutput1>, com::ptr<TDuplication>>> &duplications)
    {
        HRESULT firstFailure = S_OK;

        for (auto &output : outputs) {
            DXGI_OUTPUT_DESC desc;
            std::memset(&desc, 0, sizeof(desc));
            if SUCCEEDED(output->GetDesc(&desc))
                logger << "Attempting to duplicate output " << desc.DesktopCoordinates << std::endl;

            com::ptr<TOutput1> output1;
            HRESULT hr = com::query_interface(std::move(output), output1);
            if FAILED(hr) {
                logger << "Skipped output " << desc.DesktopCoordinates << ": QueryInterface<IDXGIOutput1>: " << util::hresult_to_utf8(hr) << std::endl;
                if SUCCEEDED(firstFailure)
                    firstFailure = hr;
                continue;
            }

            com::ptr<TDuplication> duplication;
            hr = output1->DuplicateOutput(device, com::out_arg(duplication));
            if FAILED(hr) {
                logger << "Skipped output " << desc.DesktopCoordinates << ": DuplicateOutput: " << util::hresult_to_utf8(hr) << std::endl;
                if SUCCEEDED(firstFailure)
                    firstFailure = hr;
                continue;
            }

            duplications.emplace_back(std::move(output1), std::move(duplication));
        }

        return firstFailure;
    }

    /**
     * Duplicate every attached output of @param adapter and append the
     * results to @param outputs.
     *
     * All outputs of the adapter share one device and immediate context.
     * An adapter without attached outputs appends nothing and creates no device.
     *
     * @returns S_OK, the device creation status, or the status of the first
     *          output that could not be duplicated. The outputs that could be
     *          duplicated are appended either way.
     */
    HRESULT duplicate_adapter(IDXGIAdapter1 *adapter, std::vector<duplicated_output> &outputs);

    /**
     * duplicate_adapter() for every adapter of a fresh factory.
     *
     * A failing adapter doesn't stop the walk.
     *
     * @returns S_OK, the factory creation status, or the first failure
     *          reported by duplicate_adapter()
     */
    HRESULT duplicate_all(std::vector<duplicated_output> &outputs);
} // namespace deskdup
