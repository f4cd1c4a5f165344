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


#include "deskdup-outputs.hpp"
#include "test-mocks.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace {
    std::vector<mock::output*> collect(mock::adapter &adapter)
    {
        std::vector<mock::output*> result;

        auto outputs = deskdup::enumerate_outputs<mock::output>(&adapter);
        com::ptr<mock::output> output;
        while (outputs.next(output)) {
            result.push_back(output.get());
            EXPECT_TRUE(output->desc.AttachedToDesktop);
        }

        return result;
    }
}

TEST(OutputEnumerator, SkipsDetachedOutputsAndStopsAtNotFound)
{
    mock::output first(true);
    mock::output second(true);
    mock::output detached(false);
    mock::adapter adapter({ &first, &second, &detached });

    auto outputs = collect(adapter);

    ASSERT_EQ(2u, outputs.size());
    EXPECT_EQ(&first, outputs[0]);
    EXPECT_EQ(&second, outputs[1]);

    // indices 0, 1 and 2 are outputs, 3 is the end marker
    EXPECT_EQ((std::vector<UINT> { 0, 1, 2, 3 }), adapter.probed());
}

TEST(OutputEnumerator, DetachedOutputsInBetweenAreSkipped)
{
    mock::output detached1(false);
    mock::output attached(true);
    mock::output detached2(false);
    mock::output last(true);
    mock::adapter adapter({ &detached1, &attached, &detached2, &last });

    auto outputs = collect(adapter);

    ASSERT_EQ(2u, outputs.size());
    EXPECT_EQ(&attached, outputs[0]);
    EXPECT_EQ(&last, outputs[1]);
}

TEST(OutputEnumerator, EveryOutputIsReleased)
{
    mock::output first(true);
    mock::output detached(false);
    mock::adapter adapter({ &first, &detached });

    collect(adapter);

    EXPECT_EQ(0, first.refs());
    EXPECT_EQ(1, first.releases());
    EXPECT_EQ(0, detached.refs());
    EXPECT_EQ(1, detached.releases());
    EXPECT_EQ(0, first.over_releases());
    EXPECT_EQ(0, detached.over_releases());
}

TEST(OutputEnumerator, IsLazy)
{
    mock::output first(true);
    mock::output second(true);
    mock::adapter adapter({ &first, &second });

    auto outputs = deskdup::enumerate_outputs<mock::output>(&adapter);
    EXPECT_TRUE(adapter.probed().empty());

    com::ptr<mock::output> output;
    ASSERT_TRUE(outputs.next(output));
    EXPECT_EQ(&first, output.get());
    EXPECT_EQ(1u, adapter.probed().size());
    EXPECT_EQ(1u, outputs.probed());
}

TEST(OutputEnumerator, DoesNotRestartAfterTheEnd)
{
    mock::output first(true);
    mock::adapter adapter({ &first });

    auto outputs = deskdup::enumerate_outputs<mock::output>(&adapter);
    com::ptr<mock::output> output;

    EXPECT_TRUE(outputs.next(output));
    EXPECT_FALSE(outputs.next(output));
    EXPECT_FALSE(output);

    std::size_t probes = adapter.probed().size();
    EXPECT_FALSE(outputs.next(output));
    EXPECT_EQ(probes, adapter.probed().size());
}

TEST(OutputEnumerator, OtherFailuresEndTheSequenceQuietly)
{
    mock::output first(true);
    mock::output second(true);
    mock::adapter adapter({ &first, &second });
    adapter.failIndex  = 1;
    adapter.failResult = E_FAIL;

    auto outputs = collect(adapter);

    ASSERT_EQ(1u, outputs.size());
    EXPECT_EQ(&first, outputs[0]);
    EXPECT_EQ((std::vector<UINT> { 0, 1 }), adapter.probed());
}

TEST(OutputEnumerator, OutputsWithoutDescriptionAreSkipped)
{
    mock::output broken(true);
    broken.descResult = E_FAIL;
    mock::output good(true);
    mock::adapter adapter({ &broken, &good });

    auto outputs = collect(adapter);

    ASSERT_EQ(1u, outputs.size());
    EXPECT_EQ(&good, outputs[0]);
    EXPECT_EQ(0, broken.refs());
}

TEST(OutputEnumerator, AdapterWithoutOutputs)
{
    mock::adapter adapter({});

    EXPECT_TRUE(collect(adapter).empty());
    EXPECT_EQ((std::vector<UINT> { 0 }), adapter.probed());
}

TEST(OutputEnumerator, NullAdapterYieldsNothing)
{
    auto outputs = deskdup::enumerate_outputs<mock::output>(static_cast<mock::adapter*>(nullptr));
    com::ptr<mock::output> output;

    EXPECT_FALSE(outputs.next(output));
}

TEST(OutputEnumerator, CountMatchesAReferenceEnumeration)
{
    mock::output o0(true), o1(false), o2(true), o3(true), o4(false);
    mock::adapter adapter({ &o0, &o1, &o2, &o3, &o4 });

    // reference: count attached outputs up to the first failing index
    std::size_t expected = 0;
    for (mock::output *o : { &o0, &o1, &o2, &o3, &o4 }) {
        if (o->desc.AttachedToDesktop)
            ++expected;
    }

    EXPECT_EQ(expected, collect(adapter).size());
}
