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

#ifndef _SCRIPT_DRAW_PRIVATE_H
#define _SCRIPT_DRAW_PRIVATE_H

#include "scriptdraw.h"

#include <string>
#include <vector>

namespace SD_NAMESPACE {

void printError(const std::string& message);

constexpr char32_t kSoftHyphen = 0x00ad;
constexpr char32_t kNoBreakSpace = 0x00a0;

struct BezierPath::Impl
{
    std::vector<BezierPath::Element> elements;
    Point subpathStart;
    Point currentPoint;
    bool hasCurrentPoint = false;
};

// Returns the number of bytes in this code point. (Useful for incrementing
// over characters if you do not need to know the actual value.)
int nBytesForUtf8Char(const char* utf8);

// Returns an array such that out[i], where i is a character (code point)
// index, gives the byte index into utf8. There is one extra entry for
// the end of the string.
std::vector<int> utf8IndicesForCharIndices(const std::string& utf8);

std::u32string utf32FromUtf8(const std::string& utf8);
std::string utf8FromUtf32(const std::u32string& utf32);
std::string utf8FromCodePoint(char32_t c);

// ----- image functions -----
struct ImageData
{
    int width = 0;
    int height = 0;
    std::vector<uint8_t> bgra;  // premultiplied, 4 bytes per pixel, no padding

    ImageData() {}
    ImageData(int w, int h) : width(w), height(h), bgra(4 * w * h, 0) {}

    bool isValid() const { return (width > 0 && height > 0); }
};

void premultiplyBGRA(uint8_t *bgra, int width, int height);

std::vector<uint8_t> readFile(const char *path);

// Requires libpng, giflib, and libjpeg-turbo (libjpeg also works but is slower)
// Reads an image using the functions below. Returns an invalid ImageData if
// the data is not an image in any of the formats.
ImageData readImage(const uint8_t *imgdata, int size);

// Requires libjpeg-turbo (libjpeg will work, too, but is slower)
// Returns an invalid image if this data is not, in fact, JPEG data.
// JPEG does not support alpha, so alpha is always 0xff.
ImageData readJPEG(const uint8_t *jpegdata, int size);

// Requires libpng. Returns an invalid image if this data is not, in fact,
// PNG data.
ImageData readPNG(const uint8_t *pngdata, int size);

// Requires giflib. Returns an invalid image if this data is not, in fact, GIF
// data. (GIFs can have a transparent color, even though they do not have an
// alpha channel.)
ImageData readGIF(const uint8_t *gifdata, int size);

} // namespace $SD_NAMESPACE
#endif // _SCRIPT_DRAW_PRIVATE_H
