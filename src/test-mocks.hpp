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

// In-process stand-ins for the DXGI/D3D11 objects basic_duplicated_output and
// basic_output_enumerator talk to. Every object counts its references so the
// tests can check that nothing leaks and nothing is released twice.

#include "com.hpp"
#include "deskdup-duplication.hpp"

#include <windows.h>
#include <dxgi.h>
#include <dxgi1_2.h>
#include <d3d11.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace mock {
    // {6C1E58D0-6F3A-4C7D-9E0B-1A2B3C4D5E01} .. 08
    const IID IID_frame_resource = { 0x6c1e58d0, 0x6f3a, 0x4c7d, { 0x9e, 0x0b, 0x1a, 0x2b, 0x3c, 0x4d, 0x5e, 0x01 } };
    const IID IID_texture        = { 0x6c1e58d0, 0x6f3a, 0x4c7d, { 0x9e, 0x0b, 0x1a, 0x2b, 0x3c, 0x4d, 0x5e, 0x02 } };
    const IID IID_resource       = { 0x6c1e58d0, 0x6f3a, 0x4c7d, { 0x9e, 0x0b, 0x1a, 0x2b, 0x3c, 0x4d, 0x5e, 0x03 } };
    const IID IID_surface        = { 0x6c1e58d0, 0x6f3a, 0x4c7d, { 0x9e, 0x0b, 0x1a, 0x2b, 0x3c, 0x4d, 0x5e, 0x04 } };
    const IID IID_output         = { 0x6c1e58d0, 0x6f3a, 0x4c7d, { 0x9e, 0x0b, 0x1a, 0x2b, 0x3c, 0x4d, 0x5e, 0x05 } };
    const IID IID_adapter        = { 0x6c1e58d0, 0x6f3a, 0x4c7d, { 0x9e, 0x0b, 0x1a, 0x2b, 0x3c, 0x4d, 0x5e, 0x06 } };

    /**
     * Reference counting and QueryInterface for the mocks.
     *
     * Objects are owned by the test, not by their reference count: reaching
     * zero does not delete anything, so the counters stay readable afterwards.
     */
    class unknown
    {
        std::atomic<long> m_refs { 0 };
        std::atomic<long> m_addRefs { 0 };
        std::atomic<long> m_releases { 0 };
        std::atomic<long> m_overReleases { 0 };

    protected:
        /**
         * The interface pointer for @param iid, or nullptr if it isn't supported.
         * The reference count is unaffected.
         */
        virtual void *_queryInterface(REFIID iid)
        {
            (void)iid;
            return nullptr;
        }

    public:
        virtual ~unknown() = default;

        HRESULT QueryInterface(REFIID riid, void **ppvObject)
        {
            if (!ppvObject)
                return E_POINTER;

            *ppvObject = _queryInterface(riid);
            if (!*ppvObject)
                return E_NOINTERFACE;

            AddRef();
            return S_OK;
        }

        ULONG AddRef()
        {
            ++m_addRefs;
            return ULONG(++m_refs);
        }

        ULONG Release()
        {
            ++m_releases;

            long refs = --m_refs;
            if (refs < 0)
                ++m_overReleases;

            return ULONG(refs < 0 ? 0 : refs);
        }

        long refs() const         { return m_refs; }
        long add_refs() const     { return m_addRefs; }
        long releases() const     { return m_releases; }
        long over_releases() const { return m_overReleases; }

        // Hand out a reference, the way a creating or enumerating call does
        template<typename T>
        T *hand_out(T *iface)
        {
            AddRef();
            return iface;
        }
    };

    /**
     * Detects calls that overlap in time. Each guarded call lingers a little
     * so that unsynchronized callers really do collide.
     */
    class overlap_detector
    {
        std::atomic<int>  m_inside { 0 };
        std::atomic<long> m_overlaps { 0 };
        std::atomic<long> m_calls { 0 };

    public:
        class scope
        {
            overlap_detector &m_detector;
        public:
            explicit scope(overlap_detector &detector)
                : m_detector(detector)
            {
                if (++m_detector.m_inside > 1)
                    ++m_detector.m_overlaps;

                ++m_detector.m_calls;
                std::this_thread::sleep_for(std::chrono::microseconds(200));
            }

            ~scope()
            {
                --m_detector.m_inside;
            }
        };

        long overlaps() const { return m_overlaps; }
        long calls() const    { return m_calls; }
    };

    // The interfaces of the desktop image, seen from different angles
    struct frame_resource : public virtual unknown {};
    struct resource : public virtual unknown {};
    struct surface : public virtual unknown {};
    struct texture : public virtual unknown
    {
        virtual void GetDesc(D3D11_TEXTURE2D_DESC *pDesc) = 0;
        virtual void SetEvictionPriority(UINT EvictionPriority) = 0;
    };

    /**
     * A 2D texture that answers to all four texture interfaces, like a D3D11
     * texture does. Single interfaces can be made to fail.
     */
    class texture_object final : public frame_resource, public texture, public resource, public surface
    {
        D3D11_TEXTURE2D_DESC m_desc;
        UINT                 m_evictionPriority { 0 };
        std::vector<IID>     m_refused;

    protected:
        void *_queryInterface(REFIID iid) override
        {
            for (const IID &refused : m_refused) {
                if (refused == iid)
                    return nullptr;
            }

            if (iid == IID_frame_resource) return static_cast<frame_resource*>(this);
            if (iid == IID_texture)        return static_cast<texture*>(this);
            if (iid == IID_resource)       return static_cast<resource*>(this);
            if (iid == IID_surface)        return static_cast<surface*>(this);

            return nullptr;
        }

    public:
        explicit texture_object(const D3D11_TEXTURE2D_DESC &desc)
            : m_desc(desc)
        {}

        void refuse(REFIID iid) { m_refused.push_back(iid); }

        void GetDesc(D3D11_TEXTURE2D_DESC *pDesc) override
        {
            *pDesc = m_desc;
        }

        void SetEvictionPriority(UINT EvictionPriority) override
        {
            m_evictionPriority = EvictionPriority;
        }

        const D3D11_TEXTURE2D_DESC &desc() const { return m_desc; }
        UINT eviction_priority() const { return m_evictionPriority; }
    };

    /**
     * A desktop image as the duplication API delivers it: a default usage
     * texture bound as render target and shader resource, shared.
     */
    inline D3D11_TEXTURE2D_DESC desktop_image_desc(UINT width = 1920, UINT height = 1080)
    {
        D3D11_TEXTURE2D_DESC texdsc;
        std::memset(&texdsc, 0, sizeof(texdsc));

        texdsc.Width              = width;
        texdsc.Height             = height;
        texdsc.MipLevels          = 1;
        texdsc.ArraySize          = 1;
        texdsc.Format             = DXGI_FORMAT_B8G8R8A8_UNORM;
        texdsc.SampleDesc.Count   = 1;
        texdsc.SampleDesc.Quality = 0;
        texdsc.Usage              = D3D11_USAGE_DEFAULT;
        texdsc.BindFlags          = D3D11_BIND_RENDER_TARGET | D3D11_BIND_SHADER_RESOURCE;
        texdsc.CPUAccessFlags     = 0;
        texdsc.MiscFlags          = D3D11_RESOURCE_MISC_SHARED | D3D11_RESOURCE_MISC_GDI_COMPATIBLE;

        return texdsc;
    }

    class device : public unknown
    {
        std::mutex                                   m_mutex;
        std::vector<std::unique_ptr<texture_object>> m_created;
        D3D11_TEXTURE2D_DESC                         m_lastDesc;
        overlap_detector                             m_detector;

    public:
        HRESULT createResult { S_OK };

        HRESULT CreateTexture2D(const D3D11_TEXTURE2D_DESC *pDesc,
                                const D3D11_SUBRESOURCE_DATA *pInitialData,
                                texture **ppTexture2D)
        {
            overlap_detector::scope scope(m_detector);
            (void)pInitialData;

            std::lock_guard<std::mutex> guard(m_mutex);
            m_lastDesc = *pDesc;

            if FAILED(createResult) {
                *ppTexture2D = nullptr;
                return createResult;
            }

            m_created.emplace_back(new texture_object(*pDesc));
            *ppTexture2D = m_created.back()->hand_out(static_cast<texture*>(m_created.back().get()));

            return S_OK;
        }

        std::size_t created_count()
        {
            std::lock_guard<std::mutex> guard(m_mutex);
            return m_created.size();
        }

        texture_object &created(std::size_t index)
        {
            std::lock_guard<std::mutex> guard(m_mutex);
            return *m_created.at(index);
        }

        D3D11_TEXTURE2D_DESC last_desc()
        {
            std::lock_guard<std::mutex> guard(m_mutex);
            return m_lastDesc;
        }

        const overlap_detector &detector() const { return m_detector; }
    };

    class device_context : public unknown
    {
        std::mutex                                         m_mutex;
        std::vector<std::pair<resource*, resource*>>       m_copies;
        overlap_detector                                   m_detector;

    public:
        void CopyResource(resource *pDstResource, resource *pSrcResource)
        {
            overlap_detector::scope scope(m_detector);

            std::lock_guard<std::mutex> guard(m_mutex);
            m_copies.emplace_back(pDstResource, pSrcResource);
        }

        std::vector<std::pair<resource*, resource*>> copies()
        {
            std::lock_guard<std::mutex> guard(m_mutex);
            return m_copies;
        }

        const overlap_detector &detector() const { return m_detector; }
    };

    /**
     * Follows the duplication API's pairing rules: acquiring while a frame is
     * acquired, or releasing while none is, is DXGI_ERROR_INVALID_CALL.
     */
    class duplication : public unknown
    {
        std::mutex     m_mutex;
        texture_object m_desktopImage { desktop_image_desc() };
        bool           m_acquired { false };
        UINT           m_lastTimeout { 0 };
        long           m_acquisitions { 0 };

    public:
        HRESULT acquireResult { S_OK };

        HRESULT AcquireNextFrame(UINT TimeoutInMilliseconds,
                                 DXGI_OUTDUPL_FRAME_INFO *pFrameInfo,
                                 frame_resource **ppDesktopResource)
        {
            std::lock_guard<std::mutex> guard(m_mutex);

            m_lastTimeout = TimeoutInMilliseconds;
            *ppDesktopResource = nullptr;

            if (m_acquired)
                return DXGI_ERROR_INVALID_CALL;

            if FAILED(acquireResult)
                return acquireResult;

            ++m_acquisitions;
            std::memset(pFrameInfo, 0, sizeof(*pFrameInfo));
            pFrameInfo->LastPresentTime.QuadPart = m_acquisitions;
            pFrameInfo->AccumulatedFrames = 1;

            m_acquired = true;
            *ppDesktopResource = m_desktopImage.hand_out(static_cast<frame_resource*>(&m_desktopImage));

            return S_OK;
        }

        HRESULT ReleaseFrame()
        {
            std::lock_guard<std::mutex> guard(m_mutex);

            if (!m_acquired)
                return DXGI_ERROR_INVALID_CALL;

            m_acquired = false;
            return S_OK;
        }

        bool acquired()
        {
            std::lock_guard<std::mutex> guard(m_mutex);
            return m_acquired;
        }

        UINT last_timeout()
        {
            std::lock_guard<std::mutex> guard(m_mutex);
            return m_lastTimeout;
        }

        texture_object &desktop_image() { return m_desktopImage; }
    };

    /**
     * An output that duplicates into a configured duplication mock, or fails
     * with duplicateResult.
     */
    class output : public unknown
    {
    protected:
        void *_queryInterface(REFIID iid) override
        {
            return iid == IID_output ? static_cast<output*>(this) : nullptr;
        }

    public:
        DXGI_OUTPUT_DESC desc;
        HRESULT          descResult { S_OK };

        output(bool attached, HMONITOR monitor = nullptr, RECT coordinates = RECT { 0, 0, 1920, 1080 })
        {
            std::memset(&desc, 0, sizeof(desc));
            desc.AttachedToDesktop = attached ? TRUE : FALSE;
            desc.Monitor = monitor;
            desc.DesktopCoordinates = coordinates;
        }

        HRESULT GetDesc(DXGI_OUTPUT_DESC *pDesc)
        {
            if FAILED(descResult)
                return descResult;

            *pDesc = desc;
            return S_OK;
        }

        mock::duplication *duplicationTarget { nullptr };
        HRESULT            duplicateResult { S_OK };
        unknown           *duplicatedFor { nullptr };

        HRESULT DuplicateOutput(unknown *pDevice, duplication **ppOutputDuplication)
        {
            duplicatedFor = pDevice;
            *ppOutputDuplication = nullptr;

            if FAILED(duplicateResult)
                return duplicateResult;
            if (!duplicationTarget)
                return DXGI_ERROR_UNSUPPORTED;

            *ppOutputDuplication = duplicationTarget->hand_out(duplicationTarget);
            return S_OK;
        }
    };

    /**
     * Hands out its outputs by index and answers DXGI_ERROR_NOT_FOUND past
     * the end, unless another status is configured for an index.
     */
    class adapter : public unknown
    {
        std::vector<output*> m_outputs;
        std::vector<UINT>    m_probed;

    protected:
        void *_queryInterface(REFIID iid) override
        {
            return iid == IID_adapter ? static_cast<adapter*>(this) : nullptr;
        }

    public:
        UINT    failIndex { UINT(-1) };
        HRESULT failResult { DXGI_ERROR_NOT_FOUND };

        explicit adapter(std::vector<output*> outputs)
            : m_outputs(std::move(outputs))
        {}

        HRESULT EnumOutputs(UINT Output, output **ppOutput)
        {
            m_probed.push_back(Output);

            if (Output == failIndex) {
                *ppOutput = nullptr;
                return failResult;
            }

            if (Output >= m_outputs.size()) {
                *ppOutput = nullptr;
                return DXGI_ERROR_NOT_FOUND;
            }

            *ppOutput = m_outputs[Output]->hand_out(m_outputs[Output]);
            return S_OK;
        }

        const std::vector<UINT> &probed() const { return m_probed; }
    };

} // namespace mock

namespace com {
    template<> struct interface_traits<mock::frame_resource> { static REFIID uuid() { return mock::IID_frame_resource; } };
    template<> struct interface_traits<mock::texture>        { static REFIID uuid() { return mock::IID_texture; } };
    template<> struct interface_traits<mock::resource>       { static REFIID uuid() { return mock::IID_resource; } };
    template<> struct interface_traits<mock::surface>        { static REFIID uuid() { return mock::IID_surface; } };
    template<> struct interface_traits<mock::output>         { static REFIID uuid() { return mock::IID_output; } };
    template<> struct interface_traits<mock::adapter>        { static REFIID uuid() { return mock::IID_adapter; } };
}

namespace mock {
    struct api
    {
        typedef mock::device         device;
        typedef mock::device_context device_context;
        typedef mock::output         output;
        typedef mock::duplication    duplication;
        typedef mock::frame_resource frame_resource;
        typedef mock::texture        texture;
        typedef mock::resource       resource;
        typedef mock::surface        surface;
    };

    typedef deskdup::basic_duplicated_output<api> duplicated_output;

    /**
     * One adapter's worth of shared device and context, the way the session
     * setup hands them to its outputs. The shared cells hold references to
     * the mocks owned here.
     */
    struct shared_adapter
    {
        mock::device         device;
        mock::device_context context;

        duplicated_output::shared_device shared_device()
        {
            if (!m_device)
                m_device = std::make_shared<util::locked<com::ptr<mock::device>>>(com::take_ptr(device.hand_out(&device)));
            return m_device;
        }

        duplicated_output::shared_device_context shared_context()
        {
            if (!m_context)
                m_context = std::make_shared<util::locked<com::ptr<mock::device_context>>>(com::take_ptr(context.hand_out(&context)));
            return m_context;
        }

        duplicated_output make_output(mock::output &out, mock::duplication &dupl,
                                      deskdup::monitor_info_func monitor_info = &GetMonitorInfoW)
        {
            return duplicated_output(shared_device(),
                                     shared_context(),
                                     com::take_ptr(out.hand_out(&out)),
                                     com::take_ptr(dupl.hand_out(&dupl)),
                                     monitor_info);
        }

    private:
        duplicated_output::shared_device         m_device;
        duplicated_output::shared_device_context m_context;
    };
} // namespace mock
