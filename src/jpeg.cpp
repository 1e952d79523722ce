//-----------------------------------------------------------------------------
// Copyright 2021 Eight Brains Studios, LLC
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to
// deal in the Software without restriction, including without limitation the
// rights to use, copy, modify, merge, publish, distribute, sublicense, and/or
// sell copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
// FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS
// IN THE SOFTWARE.
//-----------------------------------------------------------------------------

#include "scriptdraw_private.h"

#include <stdio.h>  // jpeglib.h needs FILE
#include <jpeglib.h>
#include <setjmp.h>
#include <string.h>

#include <algorithm>
#include <vector>

namespace SD_NAMESPACE {

namespace {

// libjpeg reports errors by calling error_exit(), which by default prints
// and exits, so errors jump back to the decode instead.
struct JPEGDecoder
{
    jpeg_decompress_struct info;
    jpeg_error_mgr errors;
    jmp_buf onError;

    JPEGDecoder()
    {
        memset(&info, 0, sizeof(info));
        info.err = jpeg_std_error(&errors);
        info.client_data = this;  // jpeg_create_decompress() keeps this
        errors.error_exit = [](j_common_ptr common) {
            auto *decoder = (JPEGDecoder*)common->client_data;
            longjmp(decoder->onError, 1);
        };
        errors.emit_message = [](j_common_ptr, int) {};
    }
};

} // namespace

ImageData readJPEG(const uint8_t *jpegdata, int size)
{
    if (size < 3 || jpegdata[0] != 0xff || jpegdata[1] != 0xd8) {  // SOI marker
        return ImageData();
    }

    JPEGDecoder decoder;
    ImageData img;
    std::vector<JSAMPROW> rows;  // before setjmp(), so the jump skips no destructor
    if (setjmp(decoder.onError)) {
        jpeg_destroy_decompress(&decoder.info);
        return ImageData();
    }
    jpeg_create_decompress(&decoder.info);
    jpeg_mem_src(&decoder.info, (unsigned char*)jpegdata, (unsigned long)size);
    if (jpeg_read_header(&decoder.info, TRUE) != JPEG_HEADER_OK) {
        jpeg_destroy_decompress(&decoder.info);
        return ImageData();
    }

    // JPEG has no alpha: libjpeg-turbo writes 0xff into the A of BGRA, so
    // the rows are already opaque premultiplied pixels.
    decoder.info.out_color_space = JCS_EXT_BGRA;
    jpeg_start_decompress(&decoder.info);

    img = ImageData(int(decoder.info.output_width), int(decoder.info.output_height));
    size_t rowBytes = size_t(4 * img.width);
    rows.resize(size_t(std::max(1, decoder.info.rec_outbuf_height)));
    while (decoder.info.output_scanline < decoder.info.output_height) {
        JDIMENSION first = decoder.info.output_scanline;
        for (size_t i = 0;  i < rows.size();  ++i) {
            size_t y = std::min(size_t(first) + i, size_t(img.height - 1));
            rows[i] = img.bgra.data() + y * rowBytes;
        }
        jpeg_read_scanlines(&decoder.info, rows.data(), JDIMENSION(rows.size()));
    }

    jpeg_finish_decompress(&decoder.info);
    jpeg_destroy_decompress(&decoder.info);
    return img;
}

} // namespace $SD_NAMESPACE
