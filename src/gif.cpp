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

#include <gif_lib.h>
#include <string.h>

#include <algorithm>
#include <array>

namespace SD_NAMESPACE {

namespace {

struct GifInput
{
    const uint8_t *data;
    int size;
    int pos;
};

int readGifInput(GifFileType *gif, GifByteType *dest, int len)
{
    auto *input = (GifInput*)gif->UserData;
    len = std::max(0, std::min(len, input->size - input->pos));
    memcpy(dest, input->data + input->pos, size_t(len));
    input->pos += len;
    return len;
}

} // namespace

ImageData readGIF(const uint8_t *gifdata, int size)
{
    if (size < 6 || memcmp(gifdata, "GIF", 3) != 0) {
        return ImageData();
    }

    GifInput input = { gifdata, size, 0 };
    int err;
    GifFileType *gif = DGifOpen(&input, readGifInput, &err);
    if (!gif) {
        return ImageData();
    }
    if (DGifSlurp(gif) == GIF_ERROR || gif->ImageCount < 1 ||
        gif->SWidth <= 0 || gif->SHeight <= 0) {
        DGifCloseFile(gif, &err);
        return ImageData();
    }

    // An animation is drawn as its first frame
    const SavedImage &frame = gif->SavedImages[0];
    const GifImageDesc &desc = frame.ImageDesc;
    const ColorMapObject *colors = (desc.ColorMap ? desc.ColorMap : gif->SColorMap);
    if (!colors) {
        DGifCloseFile(gif, &err);
        return ImageData();
    }
    GraphicsControlBlock control;
    if (DGifSavedExtensionToGCB(gif, 0, &control) == GIF_ERROR) {
        control.TransparentColor = NO_TRANSPARENT_COLOR;
    }

    // Index -> premultiplied BGRA. Unused and transparent entries stay clear.
    std::array<uint32_t, 256> palette;
    palette.fill(0);
    for (int i = 0;  i < std::min(colors->ColorCount, 256);  ++i) {
        if (i != control.TransparentColor) {
            const GifColorType &c = colors->Colors[i];
            palette[i] = uint32_t(c.Blue) | (uint32_t(c.Green) << 8) |
                         (uint32_t(c.Red) << 16) | 0xff000000u;
        }
    }

    // The frame may cover only part of the logical screen
    ImageData img(gif->SWidth, gif->SHeight);
    int x0 = std::max(0, desc.Left), x1 = std::min(img.width, desc.Left + desc.Width);
    int y0 = std::max(0, desc.Top), y1 = std::min(img.height, desc.Top + desc.Height);
    for (int y = y0;  y < y1;  ++y) {
        const GifByteType *src = frame.RasterBits + (y - desc.Top) * desc.Width;
        uint8_t *dst = img.bgra.data() + 4 * (y * img.width + x0);
        for (int x = x0;  x < x1;  ++x) {
            uint32_t bgra = palette[src[x - desc.Left]];
            *dst++ = uint8_t(bgra & 0xff);
            *dst++ = uint8_t((bgra >> 8) & 0xff);
            *dst++ = uint8_t((bgra >> 16) & 0xff);
            *dst++ = uint8_t(bgra >> 24);
        }
    }

    DGifCloseFile(gif, &err);
    return img;
}

} // namespace $SD_NAMESPACE
