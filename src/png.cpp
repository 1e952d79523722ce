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

#include <png.h>
#include <string.h>

namespace SD_NAMESPACE {

ImageData readPNG(const uint8_t *pngdata, int size)
{
    const png_size_t kSignatureLength = 8;
    if (size < int(kSignatureLength) || png_sig_cmp(pngdata, 0, kSignatureLength) != 0) {
        return ImageData();
    }

    // libpng's simplified API keeps its errors in image.message instead of
    // printing them, which suits readImage() trying each format in turn.
    png_image image;
    memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;
    if (!png_image_begin_read_from_memory(&image, pngdata, png_size_t(size))) {
        return ImageData();
    }

    // Palettes, grey, tRNS and 16-bit channels all come out as 8-bit BGRA
    image.format = PNG_FORMAT_BGRA;
    if (image.width == 0 || image.height == 0 ||
        PNG_IMAGE_SIZE(image) != png_alloc_size_t(4) * image.width * image.height) {
        png_image_free(&image);
        return ImageData();
    }

    ImageData img(int(image.width), int(image.height));
    if (!png_image_finish_read(&image, nullptr, img.bgra.data(), 0 /* packed rows */,
                               nullptr)) {
        printError(std::string("png: ") + image.message);
        png_image_free(&image);
        return ImageData();
    }
    premultiplyBGRA(img.bgra.data(), img.width, img.height);
    return img;
}

} // namespace $SD_NAMESPACE
