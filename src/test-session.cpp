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
#include "test-mocks.hpp"

#include <gtest/gtest.h>

#include <utility>
#include <vector>

namespace {
    typedef std::vector<std::pair<com::ptr<mock::output>, com::ptr<mock::duplication>>> duplication_list;

    class DuplicateOutputsTest : public ::testing::Test
    {
    protected:
        mock::device      device;
        mock::output      left   { true, nullptr, RECT { 0, 0, 1920, 1080 } };
        mock::output      middle { true, nullptr, RECT { 1920, 0, 3840, 1080 } };
        mock::output      right  { true, nullptr, RECT { 3840, 0, 5760, 1080 } };
        mock::duplication leftDuplication;
        mock::duplication middleDuplication;
        mock::duplication rightDuplication;

        void SetUp() override
        {
            left.duplicationTarget   = &leftDuplication;
            middle.duplicationTarget = &middleDuplication;
            right.duplicationTarget  = &rightDuplication;
        }

        std::vector<com::ptr<mock::output>> attached()
        {
            std::vector<com::ptr<mock::output>> outputs;
            outputs.push_back(com::take_ptr(left.hand_out(&left)));
            outputs.push_back(com::take_ptr(middle.hand_out(&middle)));
            outputs.push_back(com::take_ptr(right.hand_out(&right)));
            return outputs;
        }
    };
}

TEST_F(DuplicateOutputsTest, EveryOutputIsDuplicatedOnTheSameDevice)
{
    auto outputs = attached();
    duplication_list duplications;

    EXPECT_EQ(S_OK, deskdup::duplicate_outputs(&device, outputs, duplications));

    ASSERT_EQ(3u, duplications.size());
    EXPECT_EQ(&left, duplications[0].first.get());
    EXPECT_EQ(&leftDuplication, duplications[0].second.get());
    EXPECT_EQ(&right, duplications[2].first.get());
    EXPECT_EQ(&rightDuplication, duplications[2].second.get());

    EXPECT_EQ(static_cast<mock::unknown*>(&device), left.duplicatedFor);
    EXPECT_EQ(static_cast<mock::unknown*>(&device), middle.duplicatedFor);
    EXPECT_EQ(static_cast<mock::unknown*>(&device), right.duplicatedFor);
}

TEST_F(DuplicateOutputsTest, UnsupportedOutputIsSkipped)
{
    middle.duplicateResult = DXGI_ERROR_UNSUPPORTED;

    auto outputs = attached();
    duplication_list duplications;

    EXPECT_EQ(DXGI_ERROR_UNSUPPORTED, deskdup::duplicate_outputs(&device, outputs, duplications));

    // the outputs after the failing one are still duplicated
    ASSERT_EQ(2u, duplications.size());
    EXPECT_EQ(&left, duplications[0].first.get());
    EXPECT_EQ(&right, duplications[1].first.get());
    EXPECT_EQ(&rightDuplication, duplications[1].second.get());

    // the skipped output isn't held on to
    EXPECT_EQ(0, middle.refs());
    EXPECT_EQ(0, middleDuplication.refs());
    EXPECT_EQ(0, middle.over_releases());
    EXPECT_EQ(1, left.refs());
    EXPECT_EQ(1, right.refs());
}

TEST_F(DuplicateOutputsTest, FirstFailureIsReported)
{
    left.duplicateResult  = E_ACCESSDENIED;
    right.duplicateResult = DXGI_ERROR_UNSUPPORTED;

    auto outputs = attached();
    duplication_list duplications;

    EXPECT_EQ(E_ACCESSDENIED, deskdup::duplicate_outputs(&device, outputs, duplications));
    ASSERT_EQ(1u, duplications.size());
    EXPECT_EQ(&middle, duplications[0].first.get());
}

TEST_F(DuplicateOutputsTest, NoOutputCanBeDuplicated)
{
    left.duplicateResult   = DXGI_ERROR_UNSUPPORTED;
    middle.duplicateResult = DXGI_ERROR_UNSUPPORTED;
    right.duplicateResult  = DXGI_ERROR_UNSUPPORTED;

    auto outputs = attached();
    duplication_list duplications;

    EXPECT_EQ(DXGI_ERROR_UNSUPPORTED, deskdup::duplicate_outputs(&device, outputs, duplications));
    EXPECT_TRUE(duplications.empty());
    EXPECT_EQ(0, left.refs());
    EXPECT_EQ(0, middle.refs());
    EXPECT_EQ(0, right.refs());
}

TEST_F(DuplicateOutputsTest, OutputsAreConsumed)
{
    auto outputs = attached();
    duplication_list duplications;

    ASSERT_EQ(S_OK, deskdup::duplicate_outputs(&device, outputs, duplications));
    for (auto &output : outputs)
        EXPECT_FALSE(output);

    duplications.clear();
    EXPECT_EQ(0, left.refs());
    EXPECT_EQ(0, leftDuplication.refs());
    EXPECT_EQ(0, rightDuplication.over_releases());
}
