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


#include "com.hpp"
#include "test-mocks.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace {
    D3D11_TEXTURE2D_DESC small_desc()
    {
        return mock::desktop_image_desc(64, 64);
    }
}

TEST(ComPtr, DroppingReleasesExactlyOnce)
{
    mock::texture_object object(small_desc());

    {
        auto texture = com::take_ptr(object.hand_out(static_cast<mock::texture*>(&object)));
        EXPECT_TRUE(texture);
        EXPECT_EQ(1, object.refs());
        EXPECT_EQ(0, object.releases());
    }

    EXPECT_EQ(0, object.refs());
    EXPECT_EQ(1, object.add_refs());
    EXPECT_EQ(1, object.releases());
    EXPECT_EQ(0, object.over_releases());
}

TEST(ComPtr, TakePtrDoesNotAddRef)
{
    mock::texture_object object(small_desc());
    object.AddRef();

    auto texture = com::take_ptr(static_cast<mock::texture*>(&object));
    EXPECT_EQ(1, object.refs());
    EXPECT_EQ(1, object.add_refs());
}

TEST(ComPtr, MovedFromHandleReleasesNothing)
{
    mock::texture_object object(small_desc());

    {
        auto first = com::take_ptr(object.hand_out(static_cast<mock::texture*>(&object)));
        com::ptr<mock::texture> second(std::move(first));

        EXPECT_FALSE(first);
        EXPECT_TRUE(second);
        EXPECT_EQ(&object, static_cast<mock::texture_object*>(second.get()));

        com::ptr<mock::texture> third;
        third = std::move(second);
        EXPECT_FALSE(second);
        EXPECT_EQ(1, object.refs());
    }

    EXPECT_EQ(1, object.releases());
    EXPECT_EQ(0, object.over_releases());
}

TEST(ComPtr, MoveAssignmentReleasesThePreviousObject)
{
    mock::texture_object a(small_desc());
    mock::texture_object b(small_desc());

    auto pa = com::take_ptr(a.hand_out(static_cast<mock::texture*>(&a)));
    auto pb = com::take_ptr(b.hand_out(static_cast<mock::texture*>(&b)));

    pa = std::move(pb);

    EXPECT_EQ(0, a.refs());
    EXPECT_EQ(1, a.releases());
    EXPECT_EQ(1, b.refs());
    EXPECT_EQ(0, b.releases());
}

TEST(ComPtr, OutArgClearsBeforeHandingOutStorage)
{
    mock::texture_object previous(small_desc());

    auto out = com::take_ptr(previous.hand_out(static_cast<mock::texture*>(&previous)));
    mock::texture **storage = com::out_arg(out);

    EXPECT_EQ(nullptr, *storage);
    EXPECT_EQ(0, previous.refs());
    EXPECT_FALSE(out);
}

TEST(ComPtr, ReleaseGivesUpOwnership)
{
    mock::texture_object object(small_desc());

    mock::texture *raw = nullptr;
    {
        auto texture = com::take_ptr(object.hand_out(static_cast<mock::texture*>(&object)));
        raw = texture.release();
        EXPECT_FALSE(texture);
    }

    EXPECT_EQ(1, object.refs());
    EXPECT_EQ(0, object.releases());

    raw->Release();
}

TEST(ComPtr, QueryInterfaceKeepsTheNetReferenceCount)
{
    mock::texture_object object(small_desc());

    {
        auto texture = com::take_ptr(object.hand_out(static_cast<mock::texture*>(&object)));

        com::ptr<mock::surface> surface;
        HRESULT hr = com::query_interface(std::move(texture), surface);

        EXPECT_EQ(S_OK, hr);
        EXPECT_FALSE(texture);
        ASSERT_TRUE(surface);
        EXPECT_EQ(static_cast<mock::surface*>(&object), surface.get());
        EXPECT_EQ(1, object.refs());
    }

    EXPECT_EQ(0, object.refs());
    EXPECT_EQ(2, object.add_refs());
    EXPECT_EQ(2, object.releases());
    EXPECT_EQ(0, object.over_releases());
}

TEST(ComPtr, FailedQueryInterfaceStillConsumesTheHandle)
{
    mock::texture_object object(small_desc());
    object.refuse(mock::IID_surface);

    auto texture = com::take_ptr(object.hand_out(static_cast<mock::texture*>(&object)));

    com::ptr<mock::surface> surface;
    HRESULT hr = com::query_interface(std::move(texture), surface);

    EXPECT_EQ(E_NOINTERFACE, hr);
    EXPECT_FALSE(texture);
    EXPECT_FALSE(surface);

    // one decrement, and no increment besides the one that created the handle
    EXPECT_EQ(0, object.refs());
    EXPECT_EQ(1, object.add_refs());
    EXPECT_EQ(1, object.releases());
    EXPECT_EQ(0, object.over_releases());
}

TEST(ComPtr, QueryInterfaceOnEmptyHandle)
{
    com::ptr<mock::texture> texture;
    com::ptr<mock::surface> surface;

    EXPECT_EQ(E_POINTER, com::query_interface(std::move(texture), surface));
    EXPECT_FALSE(surface);
}

TEST(ComPtr, CanBeMovedToAnotherThread)
{
    mock::texture_object object(small_desc());
    auto texture = com::take_ptr(object.hand_out(static_cast<mock::texture*>(&object)));

    std::thread worker([owned = std::move(texture)]() mutable {
        D3D11_TEXTURE2D_DESC desc;
        owned->GetDesc(&desc);
        EXPECT_EQ(64u, desc.Width);
    });
    worker.join();

    EXPECT_EQ(0, object.refs());
    EXPECT_EQ(1, object.releases());
}

TEST(ComPtr, MovesDoNotThrow)
{
    EXPECT_TRUE(std::is_nothrow_move_constructible<com::ptr<mock::texture>>::value);
    EXPECT_TRUE(std::is_nothrow_move_assignable<com::ptr<mock::texture>>::value);
    EXPECT_TRUE(std::is_nothrow_move_constructible<mock::duplicated_output>::value);
    EXPECT_TRUE(std::is_nothrow_move_assignable<mock::duplicated_output>::value);
}

TEST(ComPtr, VectorGrowthKeepsEveryReference)
{
    std::vector<std::unique_ptr<mock::texture_object>> objects;
    for (int i = 0; i < 16; ++i)
        objects.emplace_back(new mock::texture_object(small_desc()));

    {
        std::vector<com::ptr<mock::texture>> textures;
        for (auto &object : objects) {
            textures.push_back(com::take_ptr(object->hand_out(static_cast<mock::texture*>(object.get()))));
            EXPECT_EQ(1, object->refs());
        }

        for (std::size_t i = 0; i < objects.size(); ++i)
            EXPECT_EQ(static_cast<mock::texture*>(objects[i].get()), textures[i].get());
    }

    for (auto &object : objects) {
        EXPECT_EQ(0, object->refs());
        EXPECT_EQ(1, object->releases());
        EXPECT_EQ(0, object->over_releases());
    }
}
