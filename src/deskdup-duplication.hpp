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
#include "util.hpp"
#include "logger.hpp"

#include <dxgi.h>
#include <dxgi1_2.h>
#include <d3d11.h>

#include <chrono>
#include <cstring>
#include <memory>

namespace deskdup {
    typedef BOOL (WINAPI *monitor_info_func)(HMONITOR, LPMONITORINFO);

    /**
     * @returns true if @param monitor is the primary monitor of the desktop,
     *          as reported by @param get_info (GetMonitorInfoW by default).
     *          A monitor whose info can't be read is not primary.
     */
    bool is_primary_monitor(HMONITOR monitor, monitor_info_func get_info = &GetMonitorInfoW);

    /**
     * Derive the description of a texture the CPU can read back from the
     * description of a desktop image: staging usage, no bind flags, CPU read
     * access and no misc flags. Size, format, mips and sampling are kept.
     */
    D3D11_TEXTURE2D_DESC make_staging_desc(const D3D11_TEXTURE2D_DESC &source);

    /**
     * The interfaces basic_duplicated_output talks to.
     *
     * In D3D11 the desktop image, its texture, its resource and its surface
     * are all the same object, seen through different interfaces.
     */
    struct d3d11_api
    {
        typedef ID3D11Device           device;
        typedef ID3D11DeviceContext    device_context;
        typedef IDXGIOutput1           output;
        typedef IDXGIOutputDuplication duplication;
        typedef IDXGIResource          frame_resource;
        typedef ID3D11Texture2D        texture;
        typedef ID3D11Resource         resource;
        typedef IDXGISurface1          surface;
    };

    /**
     * One output (one monitor) and the duplication session pulling its frames.
     *
     * The device and its immediate context are shared by every output of the
     * same adapter, each behind its own lock. The locks are only held for the
     * single call that needs them, never from get_frame() to release_frame(),
     * so the outputs of one adapter can have frames in flight at the same time.
     *
     * Every successful get_frame() must be followed by exactly one
     * release_frame() before the next get_frame(). Nothing here enforces it;
     * the duplication session reports misuse through its status codes.
     * get_frame() does no cleanup of its own: if it fails after the frame was
     * acquired, the frame is still held by the duplication session.
     *
     * One output must not be driven from two threads at the same time.
     */
    template<typename TApi>
    class basic_duplicated_output
    {
    public:
        typedef typename TApi::device         device_type;
        typedef typename TApi::device_context device_context_type;
        typedef typename TApi::output         output_type;
        typedef typename TApi::duplication    duplication_type;
        typedef typename TApi::frame_resource frame_resource_type;
        typedef typename TApi::texture        texture_type;
        typedef typename TApi::resource       resource_type;
        typedef typename TApi::surface        surface_type;

        typedef std::shared_ptr<util::locked<com::ptr<device_type>>>         shared_device;
        typedef std::shared_ptr<util::locked<com::ptr<device_context_type>>> shared_device_context;

        basic_duplicated_output(shared_device device,
                                shared_device_context context,
                                com::ptr<output_type> output,
                                com::ptr<duplication_type> duplication,
                                monitor_info_func monitor_info = &GetMonitorInfoW)
            : m_device(std::move(device))
            , m_context(std::move(context))
            , m_output(std::move(output))
            , m_duplication(std::move(duplication))
            , m_monitorInfo(monitor_info)
        {}

        basic_duplicated_output(basic_duplicated_output &&other) = default;
        basic_duplicated_output& operator=(basic_duplicated_output &&other) = default;

        DXGI_OUTPUT_DESC get_desc() const
        {
            DXGI_OUTPUT_DESC desc;
            std::memset(&desc, 0, sizeof(desc));

            HRESULT hr = m_output->GetDesc(&desc);
            if FAILED(hr) {
                logger << "Failed: IDXGIOutput::GetDesc: " << util::hresult_to_utf8(hr) << std::endl;
                std::memset(&desc, 0, sizeof(desc));
            }

            return desc;
        }

        /**
         * Wait up to @param timeout for the next desktop image and copy it into
         * a new texture the CPU can map.
         *
         * On success @param surface holds the copy and the frame stays acquired
         * until release_frame(). The surface belongs to the caller and does not
         * need to be dropped before the frame is released.
         *
         * @param frame_info optionally receives the frame's metadata
         * @returns S_OK, or the unchanged status of the first call that failed,
         *          e.g. DXGI_ERROR_WAIT_TIMEOUT if no new image arrived in time
         */
        template<typename TRep, typename TPeriod>
        HRESULT get_frame(std::chrono::duration<TRep, TPeriod> timeout,
                          com::ptr<surface_type> &surface,
                          DXGI_OUTDUPL_FRAME_INFO *frame_info = nullptr)
        {
            return acquire(util::to_timeout_msecs(timeout), surface, frame_info);
        }

        /**
         * Hand the frame acquired by the last successful get_frame() back to
         * the duplication session.
         */
        HRESULT release_frame()
        {
            HRESULT hr = m_duplication->ReleaseFrame();
            if FAILED(hr)
                logger << "Failed: IDXGIOutputDuplication::ReleaseFrame: " << util::hresult_to_utf8(hr) << std::endl;

            return hr;
        }

        bool is_primary() const
        {
            DXGI_OUTPUT_DESC desc = get_desc();

            return is_primary_monitor(desc.Monitor, m_monitorInfo);
        }

    private:
        HRESULT acquire(UINT timeout_msecs, com::ptr<surface_type> &surface, DXGI_OUTDUPL_FRAME_INFO *frame_info)
        {
            HRESULT hr;

            surface.reset();

            DXGI_OUTDUPL_FRAME_INFO info;
            std::memset(&info, 0, sizeof(info));

            com::ptr<frame_resource_type> frame;
            hr = m_duplication->AcquireNextFrame(timeout_msecs, &info, com::out_arg(frame));
            if (hr == DXGI_ERROR_WAIT_TIMEOUT)
                return hr; // the screen is idle, happens all the time
            if FAILED(hr) {
                logger << "Failed: AcquireNextFrame: " << util::hresult_to_utf8(hr) << std::endl;
                return hr;
            }

            // The frame stays acquired if the copy fails, releasing it is up to the caller
            hr = copyFrame(std::move(frame), surface);
            if FAILED(hr) {
                surface.reset();
                return hr;
            }

            if (frame_info)
                *frame_info = info;

            return S_OK;
        }

        HRESULT copyFrame(com::ptr<frame_resource_type> frame, com::ptr<surface_type> &surface)
        {
            HRESULT hr;

            com::ptr<texture_type> frameTexture;
            hr = com::query_interface(std::move(frame), frameTexture);
            if FAILED(hr) {
                logger << "Failed: QueryInterface<ID3D11Texture2D> on the desktop image: " << util::hresult_to_utf8(hr) << std::endl;
                return hr;
            }

            D3D11_TEXTURE2D_DESC texdsc;
            frameTexture->GetDesc(&texdsc);
            texdsc = make_staging_desc(texdsc);

            com::ptr<texture_type> readable;
            hr = m_device->with([&](com::ptr<device_type> &device) {
                return device->CreateTexture2D(&texdsc, nullptr, com::out_arg(readable));
            });
            if FAILED(hr) {
                logger << "Failed: CreateTexture2D (staging): " << util::hresult_to_utf8(hr) << std::endl;
                return hr;
            }

            // Keeps the driver from paging the texture between frames, which
            // makes capture latency jump around on some systems.
            readable->SetEvictionPriority(DXGI_RESOURCE_PRIORITY_MAXIMUM);

            com::ptr<resource_type> readableResource;
            hr = com::query_interface(std::move(readable), readableResource);
            if FAILED(hr) {
                logger << "Failed: QueryInterface<ID3D11Resource> on the staging texture: " << util::hresult_to_utf8(hr) << std::endl;
                return hr;
            }

            com::ptr<resource_type> frameResource;
            hr = com::query_interface(std::move(frameTexture), frameResource);
            if FAILED(hr) {
                logger << "Failed: QueryInterface<ID3D11Resource> on the desktop image: " << util::hresult_to_utf8(hr) << std::endl;
                return hr;
            }

            m_context->with([&](com::ptr<device_context_type> &context) {
                context->CopyResource(readableResource.get(), frameResource.get());
            });

            hr = com::query_interface(std::move(readableResource), surface);
            if FAILED(hr)
                logger << "Failed: QueryInterface<IDXGISurface1> on the staging texture: " << util::hresult_to_utf8(hr) << std::endl;

            return hr;
        }

        shared_device            m_device;
        shared_device_context    m_context;
        com::ptr<output_type>      m_output;
        com::ptr<duplication_type> m_duplication;
        monitor_info_func        m_monitorInfo;
    };

    typedef basic_duplicated_output<d3d11_api> duplicated_output;
} // namespace deskdup
