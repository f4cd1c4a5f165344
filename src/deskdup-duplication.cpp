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

namespace deskdup {
    bool is_primary_monitor(HMONITOR monitor, monitor_info_func get_info)
    {
        if (!monitor || !get_info)
            return false;

        MONITORINFO info;
        std::memset(&info, 0, sizeof(info));
        info.cbSize = sizeof(MONITORINFO);

        if (!get_info(monitor, &info)) {
            logger << "Failed: GetMonitorInfo: " << util::hresult_to_utf8(HRESULT_FROM_WIN32(GetLastError())) << std::endl;
            return false;
        }

        return (info.dwFlags & MONITORINFOF_PRIMARY) != 0;
    }

    D3D11_TEXTURE2D_DESC make_staging_desc(const D3D11_TEXTURE2D_DESC &source)
    {
        D3D11_TEXTURE2D_DESC texdsc = source;

        texdsc.Usage          = D3D11_USAGE_STAGING;
        texdsc.BindFlags      = 0;
        texdsc.CPUAccessFlags = D3D11_CPU_ACCESS_READ;
        texdsc.MiscFlags      = 0;

        return texdsc;
    }
} // namespace deskdup
