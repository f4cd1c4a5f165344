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


// Runs against the real DXGI/D3D11 stack. Skipped on machines that can't
// duplicate the desktop (no GPU, remote sessions, services).

#include "deskdup-session.hpp"
#include "util.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <vector>

using namespace std::chrono;

namespace {
    bool is_unavailable(HRESULT hr)
    {
        return hr == E_NOTIMPL
            || hr == DXGI_ERROR_UNSUPPORTED
            || hr == DXGI_ERROR_NOT_CURRENTLY_AVAILABLE
            || hr == E_ACCESSDENIED;
    }
}

TEST(Capture, AdaptersAreEnumeratedUntilNotFound)
{
    com::ptr<IDXGIFactory1> factory;
    HRESULT hr = deskdup::create_factory(factory);
    if (is_unavailable(hr))
        GTEST_SKIP() << "DXGI is not available: " << util::hresult_to_utf8(hr);
    ASSERT_EQ(S_OK, hr);

    auto adapters = deskdup::enumerate_adapters(factory.get());
    com::ptr<IDXGIAdapter1> adapter;
    UINT count = 0;
    while (adapters.next(adapter)) {
        ++count;

        auto outputs = deskdup::enumerate_outputs(adapter.get());
        com::ptr<IDXGIOutput> output;
        while (outputs.next(output)) {
            DXGI_OUTPUT_DESC desc;
            ASSERT_EQ(S_OK, output->GetDesc(&desc));
            EXPECT_TRUE(desc.AttachedToDesktop);
        }
    }

    // the basic render driver is always there
    EXPECT_GE(count, 1u);
    EXPECT_FALSE(adapters.next(adapter));
}

TEST(Capture, EveryOutputCanBeCaptured)
{
    std::vector<deskdup::duplicated_output> outputs;
    HRESULT hr = deskdup::duplicate_all(outputs);
    if (outputs.empty()) {
        if (SUCCEEDED(hr) || is_unavailable(hr))
            GTEST_SKIP() << "Desktop duplication is not available: " << util::hresult_to_utf8(hr);
        FAIL() << util::hresult_to_utf8(hr);
    }

    // Hybrid graphics can refuse single outputs, the rest must still work
    if FAILED(hr) {
        EXPECT_TRUE(is_unavailable(hr)) << util::hresult_to_utf8(hr);
    }

    int primaries = 0;
    for (auto &output : outputs) {
        if (output.is_primary())
            ++primaries;
    }
    if SUCCEEDED(hr) {
        EXPECT_EQ(1, primaries);
    } else {
        EXPECT_LE(primaries, 1);
    }

    for (auto &output : outputs) {
        DXGI_OUTPUT_DESC desc = output.get_desc();
        EXPECT_TRUE(desc.AttachedToDesktop);

        // The first frame after duplicating may take a moment; an idle
        // desktop may not produce one at all, which is fine.
        com::ptr<IDXGISurface1> surface;
        hr = output.get_frame(milliseconds(500), surface);
        if (hr == DXGI_ERROR_WAIT_TIMEOUT)
            continue;
        ASSERT_EQ(S_OK, hr) << util::hresult_to_utf8(hr);
        ASSERT_TRUE(surface);

        DXGI_SURFACE_DESC surfaceDesc;
        ASSERT_EQ(S_OK, surface->GetDesc(&surfaceDesc));
        EXPECT_GT(surfaceDesc.Width, 0u);
        EXPECT_GT(surfaceDesc.Height, 0u);

        DXGI_MAPPED_RECT mapped;
        ASSERT_EQ(S_OK, surface->Map(&mapped, DXGI_MAP_READ));
        EXPECT_NE(nullptr, mapped.pBits);
        EXPECT_GT(mapped.Pitch, 0);
        EXPECT_EQ(S_OK, surface->Unmap());

        EXPECT_EQ(S_OK, output.release_frame());
        EXPECT_EQ(DXGI_ERROR_INVALID_CALL, output.release_frame());
    }
}
