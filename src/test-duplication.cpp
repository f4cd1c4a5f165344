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


#include "deskdup-duplication.hpp"
#include "test-mocks.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

using namespace std::chrono;

namespace {
    HMONITOR fake_monitor(UINT_PTR id)
    {
        return reinterpret_cast<HMONITOR>(id);
    }

    // Monitor 1 is the primary one, monitor 99 doesn't exist
    BOOL WINAPI fake_monitor_info(HMONITOR monitor, LPMONITORINFO info)
    {
        if (monitor == fake_monitor(99))
            return FALSE;

        if (info->cbSize != sizeof(MONITORINFO))
            return FALSE;

        info->dwFlags = (monitor == fake_monitor(1)) ? MONITORINFOF_PRIMARY : 0;
        return TRUE;
    }

    class DuplicatedOutputTest : public ::testing::Test
    {
    protected:
        mock::shared_adapter adapter;
        mock::output         output { true, fake_monitor(1) };
        mock::duplication    duplication;
    };
}

TEST_F(DuplicatedOutputTest, GetFrameCopiesIntoAReadableSurface)
{
    auto dupl = adapter.make_output(output, duplication);

    com::ptr<mock::surface> surface;
    DXGI_OUTDUPL_FRAME_INFO info;
    ASSERT_EQ(S_OK, dupl.get_frame(milliseconds(100), surface, &info));
    ASSERT_TRUE(surface);
    EXPECT_EQ(1u, info.AccumulatedFrames);
    EXPECT_TRUE(duplication.acquired());

    ASSERT_EQ(1u, adapter.device.created_count());
    mock::texture_object &staging = adapter.device.created(0);
    EXPECT_EQ(static_cast<mock::surface*>(&staging), surface.get());
    EXPECT_EQ(UINT(DXGI_RESOURCE_PRIORITY_MAXIMUM), staging.eviction_priority());

    auto copies = adapter.context.copies();
    ASSERT_EQ(1u, copies.size());
    EXPECT_EQ(static_cast<mock::resource*>(&staging), copies[0].first);
    EXPECT_EQ(static_cast<mock::resource*>(&duplication.desktop_image()), copies[0].second);

    EXPECT_EQ(S_OK, dupl.release_frame());
    EXPECT_FALSE(duplication.acquired());
}

TEST_F(DuplicatedOutputTest, ReferencesAreBalanced)
{
    auto dupl = adapter.make_output(output, duplication);

    {
        com::ptr<mock::surface> surface;
        ASSERT_EQ(S_OK, dupl.get_frame(milliseconds(0), surface));

        // the desktop image is only borrowed for the copy
        EXPECT_EQ(0, duplication.desktop_image().refs());
        EXPECT_EQ(1, adapter.device.created(0).refs());

        EXPECT_EQ(S_OK, dupl.release_frame());
    }

    EXPECT_EQ(0, adapter.device.created(0).refs());
    EXPECT_EQ(0, adapter.device.created(0).over_releases());
    EXPECT_EQ(0, duplication.desktop_image().over_releases());
}

TEST_F(DuplicatedOutputTest, StagingDescriptionIsDerivedFromTheDesktopImage)
{
    auto dupl = adapter.make_output(output, duplication);

    com::ptr<mock::surface> surface;
    ASSERT_EQ(S_OK, dupl.get_frame(milliseconds(10), surface));
    ASSERT_EQ(S_OK, dupl.release_frame());

    D3D11_TEXTURE2D_DESC desc = adapter.device.last_desc();
    D3D11_TEXTURE2D_DESC source = duplication.desktop_image().desc();

    EXPECT_EQ(D3D11_USAGE_STAGING, desc.Usage);
    EXPECT_EQ(0u, desc.BindFlags);
    EXPECT_EQ(UINT(D3D11_CPU_ACCESS_READ), desc.CPUAccessFlags);
    EXPECT_EQ(0u, desc.MiscFlags);
    EXPECT_EQ(source.Width, desc.Width);
    EXPECT_EQ(source.Height, desc.Height);
    EXPECT_EQ(source.Format, desc.Format);
}

TEST_F(DuplicatedOutputTest, TimeoutIsPassedInMilliseconds)
{
    auto dupl = adapter.make_output(output, duplication);
    com::ptr<mock::surface> surface;

    ASSERT_EQ(S_OK, dupl.get_frame(milliseconds(250), surface));
    EXPECT_EQ(250u, duplication.last_timeout());
    ASSERT_EQ(S_OK, dupl.release_frame());

    ASSERT_EQ(S_OK, dupl.get_frame(microseconds(1999), surface));
    EXPECT_EQ(1u, duplication.last_timeout());
    ASSERT_EQ(S_OK, dupl.release_frame());

    ASSERT_EQ(S_OK, dupl.get_frame(seconds(2), surface));
    EXPECT_EQ(2000u, duplication.last_timeout());
    ASSERT_EQ(S_OK, dupl.release_frame());
}

TEST_F(DuplicatedOutputTest, AcquisitionTimeoutIsReturnedUnchanged)
{
    auto dupl = adapter.make_output(output, duplication);
    duplication.acquireResult = DXGI_ERROR_WAIT_TIMEOUT;

    com::ptr<mock::surface> surface;
    EXPECT_EQ(DXGI_ERROR_WAIT_TIMEOUT, dupl.get_frame(milliseconds(5), surface));
    EXPECT_FALSE(surface);
    EXPECT_FALSE(duplication.acquired());
    EXPECT_EQ(0u, adapter.device.created_count());

    // a retry by the caller works once frames arrive again
    duplication.acquireResult = S_OK;
    EXPECT_EQ(S_OK, dupl.get_frame(milliseconds(5), surface));
    EXPECT_EQ(S_OK, dupl.release_frame());
}

TEST_F(DuplicatedOutputTest, AccessLostIsReturnedUnchanged)
{
    auto dupl = adapter.make_output(output, duplication);
    duplication.acquireResult = DXGI_ERROR_ACCESS_LOST;

    com::ptr<mock::surface> surface;
    EXPECT_EQ(DXGI_ERROR_ACCESS_LOST, dupl.get_frame(milliseconds(5), surface));
    EXPECT_FALSE(surface);
}

TEST_F(DuplicatedOutputTest, ReleaseWithoutFrameFails)
{
    auto dupl = adapter.make_output(output, duplication);

    EXPECT_EQ(DXGI_ERROR_INVALID_CALL, dupl.release_frame());

    // and doesn't break the next pair
    com::ptr<mock::surface> surface;
    EXPECT_EQ(S_OK, dupl.get_frame(milliseconds(5), surface));
    EXPECT_EQ(S_OK, dupl.release_frame());
}

TEST_F(DuplicatedOutputTest, SecondGetFrameWithoutReleaseFails)
{
    auto dupl = adapter.make_output(output, duplication);

    com::ptr<mock::surface> first;
    ASSERT_EQ(S_OK, dupl.get_frame(milliseconds(5), first));

    com::ptr<mock::surface> second;
    EXPECT_EQ(DXGI_ERROR_INVALID_CALL, dupl.get_frame(milliseconds(5), second));
    EXPECT_FALSE(second);
    EXPECT_TRUE(first);

    // the first frame is still acquired and can be released normally
    EXPECT_EQ(S_OK, dupl.release_frame());
    EXPECT_EQ(DXGI_ERROR_INVALID_CALL, dupl.release_frame());

    EXPECT_EQ(S_OK, dupl.get_frame(milliseconds(5), second));
    EXPECT_EQ(S_OK, dupl.release_frame());
}

TEST_F(DuplicatedOutputTest, FailedStagingTextureKeepsTheFrameAcquired)
{
    auto dupl = adapter.make_output(output, duplication);
    adapter.device.createResult = E_OUTOFMEMORY;

    com::ptr<mock::surface> surface;
    EXPECT_EQ(E_OUTOFMEMORY, dupl.get_frame(milliseconds(5), surface));
    EXPECT_FALSE(surface);
    EXPECT_TRUE(duplication.acquired());
    EXPECT_TRUE(adapter.context.copies().empty());
    EXPECT_EQ(0, duplication.desktop_image().refs());

    // the caller still owns the frame and has to hand it back
    EXPECT_EQ(S_OK, dupl.release_frame());
    EXPECT_FALSE(duplication.acquired());

    adapter.device.createResult = S_OK;
    EXPECT_EQ(S_OK, dupl.get_frame(milliseconds(5), surface));
    EXPECT_TRUE(surface);
    EXPECT_EQ(S_OK, dupl.release_frame());
}

TEST_F(DuplicatedOutputTest, FailedCopyBlocksTheNextAcquisitionUntilReleased)
{
    auto dupl = adapter.make_output(output, duplication);
    adapter.device.createResult = E_OUTOFMEMORY;

    com::ptr<mock::surface> surface;
    ASSERT_EQ(E_OUTOFMEMORY, dupl.get_frame(milliseconds(5), surface));

    adapter.device.createResult = S_OK;
    EXPECT_EQ(DXGI_ERROR_INVALID_CALL, dupl.get_frame(milliseconds(5), surface));
    EXPECT_FALSE(surface);

    EXPECT_EQ(S_OK, dupl.release_frame());
    EXPECT_EQ(S_OK, dupl.get_frame(milliseconds(5), surface));
    EXPECT_EQ(S_OK, dupl.release_frame());
}

TEST_F(DuplicatedOutputTest, DesktopImageWithoutTextureInterfaceFails)
{
    duplication.desktop_image().refuse(mock::IID_texture);
    auto dupl = adapter.make_output(output, duplication);

    com::ptr<mock::surface> surface;
    EXPECT_EQ(E_NOINTERFACE, dupl.get_frame(milliseconds(5), surface));
    EXPECT_FALSE(surface);
    EXPECT_TRUE(duplication.acquired());
    EXPECT_EQ(0u, adapter.device.created_count());
    EXPECT_EQ(0, duplication.desktop_image().refs());
    EXPECT_EQ(0, duplication.desktop_image().over_releases());

    EXPECT_EQ(S_OK, dupl.release_frame());
    EXPECT_FALSE(duplication.acquired());
}

TEST_F(DuplicatedOutputTest, GetDescReturnsTheOutputDescription)
{
    output.desc.DesktopCoordinates = RECT { 1920, 0, 3840, 1080 };
    auto dupl = adapter.make_output(output, duplication);

    DXGI_OUTPUT_DESC desc = dupl.get_desc();
    EXPECT_EQ(1920, desc.DesktopCoordinates.left);
    EXPECT_EQ(3840, desc.DesktopCoordinates.right);
    EXPECT_TRUE(desc.AttachedToDesktop);
}

TEST_F(DuplicatedOutputTest, GetDescIsZeroedOnFailure)
{
    output.descResult = E_FAIL;
    auto dupl = adapter.make_output(output, duplication);

    DXGI_OUTPUT_DESC desc = dupl.get_desc();
    EXPECT_FALSE(desc.AttachedToDesktop);
    EXPECT_EQ(nullptr, desc.Monitor);
}

TEST_F(DuplicatedOutputTest, DroppingTheOutputReleasesItsObjects)
{
    {
        auto dupl = adapter.make_output(output, duplication);
        EXPECT_EQ(1, output.refs());
        EXPECT_EQ(1, duplication.refs());
        EXPECT_EQ(1, adapter.device.refs());
    }

    EXPECT_EQ(0, output.refs());
    EXPECT_EQ(0, duplication.refs());
    // the shared device cell is still held by the adapter fixture
    EXPECT_EQ(1, adapter.device.refs());
}

TEST(PrimaryMonitor, FlagBitZeroDecides)
{
    EXPECT_TRUE(deskdup::is_primary_monitor(fake_monitor(1), &fake_monitor_info));
    EXPECT_FALSE(deskdup::is_primary_monitor(fake_monitor(2), &fake_monitor_info));
}

TEST(PrimaryMonitor, UnknownMonitorIsNotPrimary)
{
    EXPECT_FALSE(deskdup::is_primary_monitor(fake_monitor(99), &fake_monitor_info));
    EXPECT_FALSE(deskdup::is_primary_monitor(nullptr, &fake_monitor_info));
}

TEST(PrimaryMonitor, ExactlyOneOfSeveralOutputsIsPrimary)
{
    mock::shared_adapter gpu0;
    mock::shared_adapter gpu1;
    mock::output o1(true, fake_monitor(2));
    mock::output o2(true, fake_monitor(1));
    mock::output o3(true, fake_monitor(3));
    mock::duplication d1, d2, d3;

    std::vector<mock::duplicated_output> outputs;
    outputs.push_back(gpu0.make_output(o1, d1, &fake_monitor_info));
    outputs.push_back(gpu0.make_output(o2, d2, &fake_monitor_info));
    outputs.push_back(gpu1.make_output(o3, d3, &fake_monitor_info));

    int primaries = 0;
    for (auto &out : outputs) {
        if (out.is_primary())
            ++primaries;
    }

    EXPECT_EQ(1, primaries);
    EXPECT_TRUE(outputs[1].is_primary());
}

TEST(StagingDesc, ClearsBindAndMiscFlags)
{
    D3D11_TEXTURE2D_DESC source = mock::desktop_image_desc(800, 600);
    source.BindFlags      = D3D11_BIND_RENDER_TARGET | D3D11_BIND_SHADER_RESOURCE | D3D11_BIND_UNORDERED_ACCESS;
    source.MiscFlags      = D3D11_RESOURCE_MISC_SHARED | D3D11_RESOURCE_MISC_GENERATE_MIPS;
    source.CPUAccessFlags = D3D11_CPU_ACCESS_WRITE;
    source.Usage          = D3D11_USAGE_DYNAMIC;

    D3D11_TEXTURE2D_DESC staging = deskdup::make_staging_desc(source);

    EXPECT_EQ(D3D11_USAGE_STAGING, staging.Usage);
    EXPECT_EQ(0u, staging.BindFlags);
    EXPECT_EQ(UINT(D3D11_CPU_ACCESS_READ), staging.CPUAccessFlags);
    EXPECT_EQ(0u, staging.MiscFlags);

    EXPECT_EQ(800u, staging.Width);
    EXPECT_EQ(600u, staging.Height);
    EXPECT_EQ(source.MipLevels, staging.MipLevels);
    EXPECT_EQ(source.ArraySize, staging.ArraySize);
    EXPECT_EQ(source.Format, staging.Format);
    EXPECT_EQ(source.SampleDesc.Count, staging.SampleDesc.Count);
}

TEST(StagingDesc, AlreadyStagingStaysStaging)
{
    D3D11_TEXTURE2D_DESC source = mock::desktop_image_desc();
    source.Usage          = D3D11_USAGE_STAGING;
    source.BindFlags      = 0;
    source.CPUAccessFlags = D3D11_CPU_ACCESS_READ | D3D11_CPU_ACCESS_WRITE;
    source.MiscFlags      = 0;

    D3D11_TEXTURE2D_DESC staging = deskdup::make_staging_desc(source);

    EXPECT_EQ(D3D11_USAGE_STAGING, staging.Usage);
    EXPECT_EQ(UINT(D3D11_CPU_ACCESS_READ), staging.CPUAccessFlags);
}

TEST(SharedDevice, ConcurrentCapturesDoNotOverlapOnTheContext)
{
    const int frames = 50;

    mock::shared_adapter adapter;
    mock::output o1(true, fake_monitor(1));
    mock::output o2(true, fake_monitor(2));
    mock::duplication d1, d2;

    auto first  = adapter.make_output(o1, d1);
    auto second = adapter.make_output(o2, d2);

    auto capture = [frames](mock::duplicated_output &dupl, int &failures) {
        for (int i = 0; i < frames; ++i) {
            com::ptr<mock::surface> surface;
            if FAILED(dupl.get_frame(milliseconds(5), surface))
                ++failures;
            if FAILED(dupl.release_frame())
                ++failures;
        }
    };

    int failures1 = 0;
    int failures2 = 0;
    std::thread t1(capture, std::ref(first), std::ref(failures1));
    std::thread t2(capture, std::ref(second), std::ref(failures2));
    t1.join();
    t2.join();

    EXPECT_EQ(0, failures1);
    EXPECT_EQ(0, failures2);

    EXPECT_EQ(2 * frames, adapter.context.detector().calls());
    EXPECT_EQ(0, adapter.context.detector().overlaps());
    EXPECT_EQ(2 * frames, adapter.device.detector().calls());
    EXPECT_EQ(0, adapter.device.detector().overlaps());
}

TEST(SharedDevice, OutputsOfOneAdapterCanHoldFramesAtTheSameTime)
{
    mock::shared_adapter adapter;
    mock::output o1(true), o2(true);
    mock::duplication d1, d2;

    auto first  = adapter.make_output(o1, d1);
    auto second = adapter.make_output(o2, d2);

    com::ptr<mock::surface> s1, s2;
    ASSERT_EQ(S_OK, first.get_frame(milliseconds(5), s1));
    ASSERT_EQ(S_OK, second.get_frame(milliseconds(5), s2));

    EXPECT_TRUE(d1.acquired());
    EXPECT_TRUE(d2.acquired());

    EXPECT_EQ(S_OK, second.release_frame());
    EXPECT_EQ(S_OK, first.release_frame());
}
