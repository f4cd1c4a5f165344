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


#include "deskdup-session.hpp"
#include "util.hpp"
#include "logger.hpp"

#include <d3d11.h>

#include <utility>

namespace deskdup {
    namespace {
        typedef HRESULT (d3d11_create_device_type)(IDXGIAdapter *,
                                                   D3D_DRIVER_TYPE,
                                                   HMODULE,
                                                   UINT,
                                                   const D3D_FEATURE_LEVEL *,
                                                   UINT,
                                                   UINT,
                                                   ID3D11Device **,
                                                   D3D_FEATURE_LEVEL *,
                                                   ID3D11DeviceContext **);

        typedef HRESULT (create_dxgi_factory1_type)(REFIID, void **);

        HRESULT create_device(IDXGIAdapter1 *adapter,
                              com::ptr<ID3D11Device> &device,
                              com::ptr<ID3D11DeviceContext> &context)
        {
            static util::dll_func<d3d11_create_device_type> d3dCreator { L"d3d11.dll", "D3D11CreateDevice" };

            if (!d3dCreator) {
                logger << "Failed: d3d11.dll does not export D3D11CreateDevice" << std::endl;
                return E_NOTIMPL;
            }

            D3D_FEATURE_LEVEL receivedLevel;
            HRESULT hr = d3dCreator(adapter,
                                    D3D_DRIVER_TYPE_UNKNOWN, // required when an adapter is given
                                    nullptr,
                                    0,
                                    nullptr, 0,
                                    D3D11_SDK_VERSION,
                                    com::out_arg(device),
                                    &receivedLevel,
                                    com::out_arg(context));
            if FAILED(hr) {
                logger << "Failed: D3D11CreateDevice: " << util::hresult_to_utf8(hr) << std::endl;
                return hr;
            }

            logger << "Created device with feature level 0x" << std::hex << receivedLevel << std::dec << std::endl;

            return S_OK;
        }
    }

    HRESULT create_factory(com::ptr<IDXGIFactory1> &factory)
    {
        static util::dll_func<create_dxgi_factory1_type> factoryCreator { L"dxgi.dll", "CreateDXGIFactory1" };

        if (!factoryCreator) {
            logger << "Failed: dxgi.dll does not export CreateDXGIFactory1" << std::endl;
            return E_NOTIMPL;
        }

        HRESULT hr = factoryCreator(com::ptr<IDXGIFactory1>::uuid(), com::out_arg_void(factory));
        if FAILED(hr)
            logger << "Failed: CreateDXGIFactory1: " << util::hresult_to_utf8(hr) << std::endl;

        return hr;
    }

    adapter_enumerator::adapter_enumerator(IDXGIFactory1 *factory)
        : m_factory(factory)
    {
        m_done = (m_factory == nullptr);
    }

    bool adapter_enumerator::next(com::ptr<IDXGIAdapter1> &adapter)
    {
        if (m_done)
            return false;

        if FAILED(m_factory->EnumAdapters1(m_index++, com::out_arg(adapter))) {
            adapter.reset();
            m_done = true;
            return false;
        }

        return true;
    }

    HRESULT duplicate_adapter(IDXGIAdapter1 *adapter, std::vector<duplicated_output> &outputs)
    {
        HRESULT hr = S_OK;

        if (!adapter)
            return E_INVALIDARG;

        std::vector<com::ptr<IDXGIOutput>> attached;
        {
            auto enumerator = enumerate_outputs(adapter);
            com::ptr<IDXGIOutput> output;
            while (enumerator.next(output))
                attached.push_back(std::move(output));
        }

        if (attached.empty())
            return S_OK; // nothing to duplicate, don't bother creating a device

        com::ptr<ID3D11Device>        device;
        com::ptr<ID3D11DeviceContext> context;
        hr = create_device(adapter, device, context);
        if FAILED(hr)
            return hr;

        // Duplicate everything before the device goes behind its lock
        std::vector<std::pair<com::ptr<IDXGIOutput1>, com::ptr<IDXGIOutputDuplication>>> duplications;
        hr = duplicate_outputs(device.get(), attached, duplications);

        if (duplications.empty())
            return hr;

        auto sharedDevice  = std::make_shared<util::locked<com::ptr<ID3D11Device>>>(std::move(device));
        auto sharedContext = std::make_shared<util::locked<com::ptr<ID3D11DeviceContext>>>(std::move(context));

        for (auto &duplication : duplications) {
            outputs.emplace_back(sharedDevice,
                                 sharedContext,
                                 std::move(duplication.first),
                                 std::move(duplication.second));
        }

        return hr;
    }

    HRESULT duplicate_all(std::vector<duplicated_output> &outputs)
    {
        HRESULT hr;

        com::ptr<IDXGIFactory1> factory;
        hr = create_factory(factory);
        if FAILED(hr)
            return hr;

        HRESULT firstFailure = S_OK;

        auto adapters = enumerate_adapters(factory.get());
        com::ptr<IDXGIAdapter1> adapter;
        while (adapters.next(adapter)) {
            hr = duplicate_adapter(adapter.get(), outputs);
            if (FAILED(hr) && SUCCEEDED(firstFailure))
                firstFailure = hr;
        }

        return firstFailure;
    }
} // namespace deskdup
