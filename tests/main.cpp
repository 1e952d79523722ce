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

#ifndef SD_NAMESPACE
#define SD_NAMESPACE sd
#endif // SD_NAMESPACE

#include "../src/scriptdraw.h"
#include "../src/scriptdraw_private.h"

#include <cairo/cairo.h>

#include <algorithm>
#include <cstdlib>  // getenv()
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>

#include <stdio.h>

// include isatty
#if defined(_WIN32) || defined(_WIN64)
#include <io.h>
#define isatty _isatty
#define STDOUT_FILENO 0
#else
#include <unistd.h>
#endif // windows

using namespace SD_NAMESPACE;

static std::string kRed = "\033[31m";
static std::string kGreen = "\033[32m";
static std::string kNormal = "\033[0m";

// 8x12 RGB: red upper left, green upper right, blue lower left,
// white lower right.
std::vector<uint8_t> kPngRGB = {
    0x89, 0x50, 0x4e, 0x47, 0x0d, 0x0a, 0x1a, 0x0a, 0x00, 0x00, 0x00, 0x0d, 0x49, 0x48, 0x44, 0x52,
    0x00, 0x00, 0x00, 0x08, 0x00, 0x00, 0x00, 0x0c, 0x08, 0x02, 0x00, 0x00, 0x00, 0xd0, 0xfc, 0x6b,
    0xca, 0x00, 0x00, 0x00, 0x09, 0x70, 0x48, 0x59, 0x73, 0x00, 0x00, 0x2e, 0x23, 0x00, 0x00, 0x2e,
    0x23, 0x01, 0x78, 0xa5, 0x3f, 0x76, 0x00, 0x00, 0x00, 0x07, 0x74, 0x49, 0x4d, 0x45, 0x07, 0xe6,
    0x0c, 0x1b, 0x02, 0x11, 0x0f, 0x8e, 0xc3, 0x85, 0x4f, 0x00, 0x00, 0x00, 0x1f, 0x49, 0x44, 0x41,
    0x54, 0x18, 0xd3, 0x63, 0xfc, 0xcf, 0x80, 0x00, 0x8c, 0x48, 0x1c, 0x26, 0x06, 0x1c, 0x80, 0x1e,
    0x12, 0x8c, 0x0c, 0x0c, 0x08, 0xa7, 0xfc, 0x1f, 0x2c, 0xae, 0x02, 0x00, 0xf9, 0x05, 0x05, 0x13,
    0xa0, 0x6e, 0xed, 0x77, 0x00, 0x00, 0x00, 0x00, 0x49, 0x45, 0x4e, 0x44, 0xae, 0x42, 0x60, 0x82};

// 1x1, white and black palette, index 0 is the transparent color
std::vector<uint8_t> kGifTransparent = {
    0x47, 0x49, 0x46, 0x38, 0x39, 0x61, 0x01, 0x00, 0x01, 0x00, 0x80, 0x00, 0x00, 0xff, 0xff, 0xff,
    0x00, 0x00, 0x00, 0x21, 0xf9, 0x04, 0x01, 0x00, 0x00, 0x00, 0x00, 0x2c, 0x00, 0x00, 0x00, 0x00,
    0x01, 0x00, 0x01, 0x00, 0x00, 0x02, 0x02, 0x44, 0x01, 0x00, 0x3b};

// Same, but without transparency
std::vector<uint8_t> kGifOpaque = {
    0x47, 0x49, 0x46, 0x38, 0x39, 0x61, 0x01, 0x00, 0x01, 0x00, 0x80, 0x00, 0x00, 0xff, 0xff, 0xff,
    0x00, 0x00, 0x00, 0x21, 0xf9, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00, 0x2c, 0x00, 0x00, 0x00, 0x00,
    0x01, 0x00, 0x01, 0x00, 0x00, 0x02, 0x02, 0x44, 0x01, 0x00, 0x3b};

//-----------------------------------------------------------------------------
// A fixed set of fonts, so that the tests do not depend on what is installed.
class FakeFontResolver : public FontResolver
{
public:
    bool hasFont(const std::string& name) const override
    {
        return (name == "DejaVu Sans" || name == "Helvetica" || name == "Times");
    }

    long glyphForName(const std::string& fontName,
                      const std::string& glyphName) const override
    {
        static const std::map<std::string, long> kGlyphs = {
            { "ampersand", 9 }, { "A.sc", 42 }, { "uni2192", 77 } };
        if (!hasFont(fontName)) {
            return -1;
        }
        auto it = kGlyphs.find(glyphName);
        return (it != kGlyphs.end() ? it->second : -1);
    }

    FontMetrics metrics(const std::string&, const PicaPt& size) const override
    {
        FontMetrics fm;
        fm.ascent = 0.8f * size;
        fm.descent = 0.2f * size;
        fm.leading = 0.2f * size;
        fm.xHeight = 0.5f * size;
        fm.capHeight = 0.7f * size;
        fm.lineHeight = fm.ascent + fm.descent + fm.leading;
        return fm;
    }

    std::vector<std::string> openTypeFeatureTags(const std::string& fontName) const override
    {
        if (fontName == "Times") {
            return { "kern", "liga", "smcp" };
        }
        return { "kern", "liga" };
    }
};

// Every character is 0.5 em wide (a soft hyphen is 0 wide), lines are
// 1.2 em high, and lines may break after a space, a soft hyphen or '-'.
class MonospaceTypesetter : public Typesetter
{
public:
    Size measure(const FormattedString& text) const override
    {
        auto chars = utf32FromUtf8(text.text());
        PicaPt w(0.0f), h(0.0f);
        for (long i = 0;  i < long(chars.size());  ++i) {
            w += advance(text, chars, i);
            h = std::max(h, lineHeight(text, i));
        }
        return Size(w, h);
    }

    long suggestLineBreak(const FormattedString& text, long start,
                          const PicaPt& width) const override
    {
        auto chars = utf32FromUtf8(text.text());
        long n = long(chars.size());
        if (start >= n) {
            return 0;
        }
        PicaPt x(0.0f);
        long lastBreak = 0;
        for (long i = start;  i < n;  ++i) {
            auto c = chars[i];
            if (c == '\n') {
                return i - start + 1;
            }
            auto w = advance(text, chars, i);
            if (x + w > width) {
                if (lastBreak > 0) {
                    return lastBreak;
                }
                return std::max(1L, i - start);
            }
            x += w;
            if (c == ' ' || c == kSoftHyphen || c == '-') {
                lastBreak = i - start + 1;
            }
        }
        return n - start;
    }

    PicaPt lineHeight(const FormattedString& text, long index) const override
    {
        if (index >= text.length()) {
            return PicaPt(0.0f);
        }
        auto &style = text.runAt(index).style;
        if (style.lineHeight.isSet) {
            return style.lineHeight.value;
        }
        return 1.2f * style.fontSize;
    }

    // Each visible character is a box 0.7 em high on the baseline.
    void appendOutlines(BezierPath *path, const FormattedString& text,
                        const Point& origin, const Size& box) const override
    {
        auto chars = utf32FromUtf8(text.text());
        long n = long(chars.size());
        long start = 0;
        PicaPt top = origin.y;
        while (start < n) {
            long len = n - start;
            if (box.width > PicaPt(0.0f)) {
                len = suggestLineBreak(text, start, box.width);
            }
            PicaPt size = text.runAt(start).style.fontSize;
            PicaPt baseline = origin.y;
            if (box.width > PicaPt(0.0f)) {
                baseline = top - 0.8f * size;
            }
            PicaPt x = origin.x;
            for (long i = start;  i < start + len;  ++i) {
                auto w = advance(text, chars, i);
                if (chars[i] != ' ' && chars[i] != '\n' && w > PicaPt(0.0f)) {
                    path->rect(Rect(x, baseline, w, 0.7f * size));
                }
                x += w;
            }
            top -= lineHeight(text, start);
            start += len;
        }
    }

private:
    PicaPt advance(const FormattedString& text, const std::u32string& chars,
                   long i) const
    {
        if (chars[i] == kSoftHyphen || chars[i] == '\n') {
            return PicaPt(0.0f);
        }
        return 0.5f * text.runAt(i).style.fontSize;
    }
};

//-----------------------------------------------------------------------------
class Test
{
public:
    Test(const std::string& name)
        : mName(name)
    {}
    virtual ~Test() {}

    const std::string& name() const { return mName; }

    virtual void setup() {}
    virtual std::string run() = 0;
    virtual void teardown() {}

    std::string createFloatError(const std::string& msg, float expected,
                                 float got, std::string units = "")
    {
        if (!units.empty()) {
            units = std::string(" ") + units;
        }
        std::stringstream err;
        err << msg << ": expected " << expected << units << ", got " << got
            << units;
        return err.str();
    }

    std::string createColorError(const std::string& msg, const Color& expected,
                                 const Color& got)
    {
        std::stringstream err;
        err << msg << ": expected " << expected.toHexString() << ", got "
            << got.toHexString();
        return err.str();
    }

    std::string createStringError(const std::string& msg, const std::string& expected,
                                  const std::string& got)
    {
        return msg + ": expected '" + expected + "', got '" + got + "'";
    }

protected:
    std::string mName;
};

// Draws into a PrintBackend, so the test can check what the backend was
// asked to do.
class ContextTest : public Test
{
public:
    ContextTest(const std::string& name) : Test(name) {}

    void setup() override
    {
        mOut.str("");
        mOut.clear();
        mFonts = std::make_shared<FakeFontResolver>();
        mContext = std::make_shared<DrawContext>(RenderBackend::createPrintBackend(mOut),
                                                 mFonts,
                                                 std::make_shared<MonospaceTypesetter>());
        mContext->warnings().setSink(nullptr);
    }

    void teardown() override
    {
        mContext.reset();
    }

protected:
    std::stringstream mOut;
    std::shared_ptr<FontResolver> mFonts;
    std::shared_ptr<DrawContext> mContext;

    std::vector<std::string> outputLines() const
    {
        std::vector<std::string> lines;
        std::stringstream in(mOut.str());
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    std::string checkOutput(const std::vector<std::string>& expected) const
    {
        auto lines = outputLines();
        for (size_t i = 0;  i < expected.size();  ++i) {
            if (i >= lines.size()) {
                return "missing output line '" + expected[i] + "'";
            }
            if (lines[i] != expected[i]) {
                return "line " + std::to_string(i + 1) + ": expected '" +
                       expected[i] + "', got '" + lines[i] + "'";
            }
        }
        if (lines.size() > expected.size()) {
            return "unexpected output line '" + lines[expected.size()] + "'";
        }
        return "";
    }
};

//----------------------------------- Colors ----------------------------------
class ColorTest : public Test
{
public:
    ColorTest() : Test("colors") {}

    std::string run() override
    {
        auto grey = Color::fromComponents({ 0.5f });
        if (grey.red() != 0.5f || grey.blue() != 0.5f || grey.alpha() != 1.0f) {
            return createColorError("grey", Color(0.5f), grey);
        }
        auto greyAlpha = Color::fromComponents({ 0.0f, 0.5f });
        if (greyAlpha.alpha() != 0.5f) {
            return createFloatError("grey alpha", 0.5f, greyAlpha.alpha());
        }
        auto rgb = Color::fromComponents({ 1.0f, 0.0f, 0.0f });
        if (rgb.toRGBA() != Color::kRed.toRGBA()) {
            return createColorError("rgb", Color::kRed, rgb);
        }
        if (Color(1.0f, 0.5f, 0.0f, 1.0f).toHexString() != "ff8000ff") {
            return createStringError("toHexString()", "ff8000ff",
                                     Color(1.0f, 0.5f, 0.0f, 1.0f).toHexString());
        }

        try {
            Color::fromComponents({ 0.1f, 0.2f, 0.3f, 0.4f, 0.5f });
            return "five components did not throw";
        } catch (const InvalidColorError&) {
            ;  // expected
        }
        try {
            Color::fromList({ { 1.0f }, {} });
            return "empty component list did not throw";
        } catch (const InvalidParameterError&) {
            ;  // expected (InvalidColorError is an InvalidParameterError)
        }
        if (Color::fromList({ { 0.0f }, { 1.0f, 1.0f, 1.0f } }).size() != 2) {
            return "fromList() returned the wrong number of colors";
        }
        return "";
    }
};

class CMYKColorTest : public Test
{
public:
    CMYKColorTest() : Test("cmyk colors") {}

    std::string run() override
    {
        auto black = CMYKColor(0.0f, 0.0f, 0.0f, 1.0f).toRGB();
        if (black.toRGBA() != Color::kBlack.toRGBA()) {
            return createColorError("k=1", Color::kBlack, black);
        }
        auto white = CMYKColor(0.0f, 0.0f, 0.0f, 0.0f).toRGB();
        if (white.toRGBA() != Color::kWhite.toRGBA()) {
            return createColorError("no ink", Color::kWhite, white);
        }
        auto cyan = CMYKColor(1.0f, 0.0f, 0.0f, 0.0f, 0.5f).toRGB();
        Color expected(0.0f, 1.0f, 1.0f, 0.5f);
        if (cyan.toRGBA() != expected.toRGBA()) {
            return createColorError("cyan", expected, cyan);
        }
        auto c = CMYKColor::fromComponents({ 0.0f, 1.0f, 0.0f, 0.0f, 0.25f });
        if (c.alpha() != 0.25f) {
            return createFloatError("fromComponents() alpha", 0.25f, c.alpha());
        }
        try {
            CMYKColor::fromComponents({ 0.0f, 1.0f, 0.0f });
            return "three components did not throw";
        } catch (const InvalidColorError&) {
            ;  // expected
        }
        return "";
    }
};

class GradientTest : public Test
{
public:
    GradientTest() : Test("gradients") {}

    std::string run() override
    {
        Gradient g("radial", Point(0.0f, 0.0f), Point(10.0f, 0.0f),
                   { Color::kRed, Color::kGreen, Color::kBlue });
        if (g.type() != kGradientRadial) {
            return "expected a radial gradient";
        }
        if (g.positions() != std::vector<float>({ 0.0f, 0.5f, 1.0f })) {
            return "colors should be spaced evenly when no positions are given";
        }

        try {
            Gradient bad("conic", Point(), Point(), { Color::kRed, Color::kBlue });
            return "an unknown gradient type did not throw";
        } catch (const InvalidGradientError&) {
            ;  // expected
        }
        try {
            Gradient bad(kGradientLinear, Point(), Point(), { Color::kRed });
            return "a single color did not throw";
        } catch (const InvalidGradientError&) {
            ;  // expected
        }
        try {
            Gradient bad(kGradientLinear, Point(), Point(),
                         { Color::kRed, Color::kBlue }, { 0.0f, 0.5f, 1.0f });
            return "mismatched positions did not throw";
        } catch (const InvalidGradientError&) {
            ;  // expected
        }
        return "";
    }
};

//----------------------------------- Paths -----------------------------------
class BezierPathTest : public Test
{
public:
    BezierPathTest() : Test("bezier path") {}

    std::string run() override
    {
        BezierPath path;
        try {
            path.lineTo(Point(1.0f, 1.0f));
            return "lineTo() without a current point did not throw";
        } catch (const DrawingStateError&) {
            ;  // expected
        }

        path.rect(Rect(0.0f, 0.0f, 10.0f, 20.0f));
        if (path.elements().size() != 5 || path.elements().back().action != BezierPath::kClosePath) {
            return "rect() should be moveTo, 3 x lineTo, closePath";
        }
        if (path.onCurvePoints().size() != 4 || !path.offCurvePoints().empty()) {
            return "rect() has the wrong on/off curve points";
        }
        if (!path.pointInside(Point(5.0f, 5.0f)) || path.pointInside(Point(11.0f, 5.0f))) {
            return "pointInside() is wrong for a rect";
        }

        path.oval(Rect(20.0f, 0.0f, 10.0f, 10.0f));
        auto contours = path.contours();
        if (contours.size() != 2) {
            return "expected 2 contours, got " + std::to_string(contours.size());
        }
        if (path.offCurvePoints().size() != 8) {
            return "an oval should have 8 control points";
        }
        Rect bounds;
        if (!path.bounds(&bounds)) {
            return "bounds() failed";
        }
        if (std::abs(bounds.maxX().asFloat() - 30.0f) > 0.01f ||
            std::abs(bounds.maxY().asFloat() - 20.0f) > 0.01f ||
            bounds.x.asFloat() != 0.0f || bounds.y.asFloat() != 0.0f) {
            return "bad bounds";
        }
        if (!path.pointInside(Point(25.0f, 5.0f)) || path.pointInside(Point(20.5f, 0.5f))) {
            return "pointInside() is wrong for an oval";
        }

        BezierPath empty;
        if (empty.bounds(&bounds)) {
            return "an empty path should not have bounds";
        }

        BezierPath copy = path;
        copy.lineTo(Point(0.0f, 0.0f));
        if (copy == path || path.elements().size() != 11) {
            return "a copy should not share elements";
        }

        // Collinear arcTo() degenerates to a line
        BezierPath arc;
        arc.moveTo(Point(0.0f, 0.0f));
        arc.arcTo(Point(10.0f, 0.0f), Point(20.0f, 0.0f), PicaPt(5.0f));
        if (arc.elements().size() != 2 || arc.elements()[1].action != BezierPath::kLineTo) {
            return "collinear arcTo() should be a lineTo";
        }

        // A right-angle corner: line to the tangent point, then a quarter circle
        BezierPath corner;
        corner.moveTo(Point(0.0f, 0.0f));
        corner.arcTo(Point(10.0f, 0.0f), Point(10.0f, 10.0f), PicaPt(5.0f));
        auto &elems = corner.elements();
        if (elems.size() != 3 || elems[1].action != BezierPath::kLineTo ||
            elems[2].action != BezierPath::kCurveTo) {
            return "arcTo() should be lineTo + curveTo";
        }
        auto &tangent1 = elems[1].points[0];
        auto &tangent2 = elems[2].points[2];
        if (std::abs(tangent1.x.asFloat() - 5.0f) > 0.001f ||
            std::abs(tangent2.x.asFloat() - 10.0f) > 0.001f ||
            std::abs(tangent2.y.asFloat() - 5.0f) > 0.001f) {
            return "arcTo() tangent points are wrong";
        }

        BezierPath trailing;
        trailing.moveTo(Point(0.0f, 0.0f));
        trailing.lineTo(Point(1.0f, 0.0f));
        trailing.moveTo(Point(5.0f, 5.0f));
        trailing.optimize();
        if (trailing.elements().size() != 2) {
            return "optimize() should remove a trailing moveTo";
        }
        return "";
    }
};

class TextPathTest : public Test
{
public:
    TextPathTest() : Test("text outlines") {}

    std::string run() override
    {
        auto fonts = std::make_shared<FakeFontResolver>();
        MonospaceTypesetter typesetter;
        FormattedString text(fonts, nullptr, "ab");

        BezierPath path;
        path.text(text, typesetter, Point(10.0f, 20.0f));
        if (path.contours().size() != 2) {
            return "expected one contour per glyph";
        }
        Rect bounds;
        path.bounds(&bounds);
        if (std::abs(bounds.x.asFloat() - 10.0f) > 0.001f ||
            std::abs(bounds.y.asFloat() - 20.0f) > 0.001f ||
            std::abs(bounds.width.asFloat() - 10.0f) > 0.001f ||
            std::abs(bounds.height.asFloat() - 7.0f) > 0.001f) {
            return "glyphs should sit on the baseline at the offset";
        }

        // The first line starts at the top of the box
        BezierPath boxed;
        boxed.text(text + " cd", typesetter, Rect(0.0f, 0.0f, 15.0f, 100.0f));
        boxed.bounds(&bounds);
        if (std::abs(bounds.maxY().asFloat() - 99.0f) > 0.001f) {
            return createFloatError("top of the first line", 99.0f, bounds.maxY().asFloat());
        }
        if (boxed.contours().size() != 4) {
            return "expected 4 glyph contours in the box";
        }
        return "";
    }
};

//---------------------------------- Context ----------------------------------
class PageTest : public ContextTest
{
public:
    PageTest() : ContextTest("pages") {}

    std::string run() override
    {
        try {
            mContext->saveImage("/tmp/never.png");
            return "saveImage() without a page did not throw";
        } catch (const NoPageError& e) {
            if (std::string(e.what()) != "can't save image when no page is set") {
                return createStringError("NoPageError message",
                                         "can't save image when no page is set", e.what());
            }
        }
        try {
            mContext->newPage();
            return "newPage() without a size did not throw";
        } catch (const MissingDimensionError&) {
            ;  // expected
        }

        mContext->size(PicaPt(100.0f), PicaPt(200.0f));
        mContext->newPage();
        mContext->newPage(PicaPt(50.0f), PicaPt(60.0f));
        mContext->frameDuration(0.5f);
        mContext->saveImage("out.gif", true);
        if (mContext->backend().pageCount() != 2) {
            return "expected 2 pages, got " + std::to_string(mContext->backend().pageCount());
        }
        auto err = checkOutput({ "newPage 100 200",
                                 "newPage 50 60",
                                 "frameDuration 0.5",
                                 "saveImage out.gif true" });
        if (!err.empty()) {
            return err;
        }

        mContext->reset();
        if (mContext->hasPage() || mContext->width().isSet || mContext->backend().pageCount() != 0) {
            return "reset() should forget the pages and the size";
        }
        try {
            mContext->printImage();
            return "printImage() after reset() did not throw";
        } catch (const NoPageError&) {
            ;  // expected
        }
        return "";
    }
};

class DrawPathTest : public ContextTest
{
public:
    DrawPathTest() : ContextTest("draw paths") {}

    std::string run() override
    {
        try {
            mContext->moveTo(Point(0.0f, 0.0f));
            return "moveTo() without newPath() did not throw";
        } catch (const DrawingStateError& e) {
            if (std::string(e.what()) != "Create a new path first") {
                return createStringError("message", "Create a new path first", e.what());
            }
        }

        mContext->rect(Rect(1.0f, 2.0f, 3.0f, 4.0f));
        mContext->newPath();
        mContext->moveTo(Point(0.0f, 0.0f));
        mContext->lineTo(Point(10.0f, 0.0f));
        mContext->curveTo(Point(10.0f, 5.0f), Point(5.0f, 10.0f), Point(0.0f, 10.0f));
        mContext->closePath();
        mContext->drawPath();
        mContext->clipPath();
        return checkOutput({ "drawPath M 1 2 L 4 2 L 4 6 L 1 6 Z",
                             "drawPath M 0 0 L 10 0 C 10 5 5 10 0 10 Z",
                             "clipPath M 0 0 L 10 0 C 10 5 5 10 0 10 Z" });
    }
};

class SaveRestoreTest : public ContextTest
{
public:
    SaveRestoreTest() : ContextTest("save/restore") {}

    std::string run() override
    {
        mContext->fill(Color::kRed);
        mContext->strokeWidth(PicaPt(2.0f));
        mContext->newPath();
        mContext->moveTo(Point(1.0f, 1.0f));
        auto before = mContext->state();

        mContext->save();
        mContext->fill(Color::kBlue);
        mContext->strokeWidth(PicaPt(5.0f));
        mContext->lineTo(Point(2.0f, 2.0f));
        mContext->font("Times", PicaPt(24.0f));
        mContext->translate(PicaPt(5.0f), PicaPt(6.0f));
        if (mContext->stackDepth() != 1) {
            return "expected a stack depth of 1";
        }
        mContext->restore();

        if (mContext->state() != before) {
            return "restore() did not bring back the saved state";
        }
        if (mContext->state().path->elements().size() != 1) {
            return "the saved path should not see changes made after save()";
        }
        auto err = checkOutput({ "save", "transform [1, 0, 0, 1, 5, 6]", "restore" });
        if (!err.empty()) {
            return err;
        }

        try {
            mContext->restore();
            return "an unbalanced restore() did not throw";
        } catch (const UnbalancedStateError& e) {
            std::string expected = "can't restore graphics state: no matching save()";
            if (e.what() != expected) {
                return createStringError("message", expected, e.what());
            }
        }
        return "";
    }
};

class PaintTest : public ContextTest
{
public:
    PaintTest() : ContextTest("fill, stroke and gradients") {}

    std::string run() override
    {
        auto &state = mContext->state();
        if (!state.fillColor.isSet || state.fillColor.value != Color::kBlack) {
            return "the default fill should be black";
        }
        if (state.strokeColor.isSet) {
            return "there should be no stroke by default";
        }

        mContext->cmykFill(CMYKColor(0.0f, 1.0f, 1.0f, 0.0f));
        if (state.fillColor.isSet || !state.cmykFillColor.isSet) {
            return "cmykFill() should replace the RGB fill";
        }
        auto fill = state.effectiveFillColor();
        if (!fill.isSet || fill.value.toRGBA() != Color::kRed.toRGBA()) {
            return "the CMYK fill should composite as red";
        }
        mContext->fill(Color::kGreen);
        if (state.cmykFillColor.isSet) {
            return "fill() should replace the CMYK fill";
        }

        mContext->linearGradient(Point(0.0f, 0.0f), Point(10.0f, 0.0f),
                                 { Color::kRed, Color::kBlue });
        if (!state.gradient.isSet || state.fillColor.isSet) {
            return "a gradient should replace the fill";
        }
        mContext->fill(Color::kBlue);
        if (state.gradient.isSet) {
            return "fill() should clear the gradient";
        }
        mContext->radialGradient(Point(0.0f, 0.0f), Point(0.0f, 0.0f),
                                 { Color::kRed, Color::kBlue });
        if (state.gradient.value.endRadius() != PicaPt(100.0f)) {
            return "the default end radius should be 100";
        }
        mContext->radialGradient(nullptr);
        if (state.gradient.isSet || !state.fillColor.isSet ||
            state.fillColor.value.toRGBA() != Color::kBlack.toRGBA()) {
            return "clearing the gradient should reset the fill to black";
        }

        mContext->stroke(Color::kRed);
        mContext->stroke(nullptr);
        if (state.strokeColor.isSet || state.cmykStrokeColor.isSet) {
            return "stroke(nullptr) should remove the stroke";
        }

        mContext->cmykShadow(Point(2.0f, -2.0f), PicaPt(3.0f), CMYKColor(0.0f, 0.0f, 0.0f, 1.0f));
        if (!state.shadow.isSet || !state.shadow.value.cmykColor().isSet ||
            state.shadow.value.color().toRGBA() != Color::kBlack.toRGBA()) {
            return "cmykShadow() should set both colors";
        }
        mContext->shadow(nullptr);
        if (state.shadow.isSet) {
            return "shadow(nullptr) should remove the shadow";
        }
        return "";
    }
};

class CMYKGradientTest : public ContextTest
{
public:
    CMYKGradientTest() : ContextTest("cmyk gradients") {}

    std::string run() override
    {
        auto &state = mContext->state();
        std::vector<CMYKColor> redBlue = { CMYKColor(0.0f, 1.0f, 1.0f, 0.0f),
                                           CMYKColor(1.0f, 1.0f, 0.0f, 0.0f) };
        mContext->cmykLinearGradient(Point(0.0f, 0.0f), Point(10.0f, 0.0f),
                                     redBlue, { 0.0f, 1.0f });
        if (!state.gradient.isSet || state.fillColor.isSet || state.cmykFillColor.isSet) {
            return "a CMYK gradient should replace the fill";
        }
        auto &g = state.gradient.value;
        if (g.type() != kGradientLinear || g.colors().size() != 2 ||
            g.colors()[0].toRGBA() != Color::kRed.toRGBA() ||
            g.colors()[1].toRGBA() != Color::kBlue.toRGBA()) {
            return "the RGB colors should be converted from CMYK";
        }
        if (g.cmykColors() != redBlue) {
            return "the CMYK colors should be kept";
        }

        try {
            mContext->cmykLinearGradient(Point(0.0f, 0.0f), Point(10.0f, 0.0f),
                                         redBlue, { 0.5f });
            return "mismatched positions did not throw";
        } catch (const InvalidGradientError&) {
            ;  // expected
        }
        if (state.gradient.value.positions() != std::vector<float>({ 0.0f, 1.0f })) {
            return "a failed gradient should not change the state";
        }

        std::vector<CMYKColor> blackWhite = { CMYKColor(0.0f, 0.0f, 0.0f, 1.0f),
                                              CMYKColor(0.0f, 0.0f, 0.0f, 0.0f) };
        mContext->cmykRadialGradient(Point(5.0f, 5.0f), Point(5.0f, 5.0f), blackWhite,
                                     {}, PicaPt(2.0f), PicaPt(50.0f));
        auto &r = state.gradient.value;
        if (r.type() != kGradientRadial || r.startRadius() != PicaPt(2.0f) ||
            r.endRadius() != PicaPt(50.0f)) {
            return "bad radial gradient geometry";
        }
        if (r.colors()[0].toRGBA() != Color::kBlack.toRGBA() ||
            r.colors()[1].toRGBA() != Color::kWhite.toRGBA() ||
            r.cmykColors() != blackWhite) {
            return "bad radial gradient colors";
        }
        try {
            mContext->cmykRadialGradient(Point(0.0f, 0.0f), Point(0.0f, 0.0f),
                                         { blackWhite[0] });
            return "a one color gradient did not throw";
        } catch (const InvalidGradientError&) {
            ;  // expected
        }
        return "";
    }
};

class LineStyleTest : public ContextTest
{
public:
    LineStyleTest() : ContextTest("line joins, caps and dashes") {}

    std::string run() override
    {
        auto &state = mContext->state();
        mContext->lineJoin("round");
        mContext->lineCap("square");
        if (state.lineJoin.value != kJoinRound || state.lineCap.value != kEndCapSquare) {
            return "lineJoin()/lineCap() did not set the style";
        }
        try {
            mContext->lineJoin("pointy");
            return "a bad join did not throw";
        } catch (const InvalidParameterError& e) {
            std::string expected = "lineJoin() argument must be 'bevel', 'miter' or 'round'";
            if (e.what() != expected) {
                return createStringError("message", expected, e.what());
            }
        }
        try {
            mContext->lineCap("flat");
            return "a bad cap did not throw";
        } catch (const InvalidParameterError&) {
            ;  // expected
        }
        if (state.lineJoin.value != kJoinRound) {
            return "a bad join should leave the join alone";
        }

        mContext->lineDash({ PicaPt(3.0f), PicaPt(1.0f) });
        if (!state.lineDash.isSet || state.lineDash.value.size() != 2) {
            return "lineDash() did not set the dashes";
        }
        mContext->lineDash(std::vector<PicaPt>());
        if (state.lineDash.isSet) {
            return "an empty dash pattern should turn dashing off";
        }
        mContext->lineJoin(nullptr);
        if (state.lineJoin.isSet) {
            return "lineJoin(nullptr) should unset the join";
        }
        return "";
    }
};

class TransformTest : public ContextTest
{
public:
    TransformTest() : ContextTest("transforms") {}

    std::string run() override
    {
        auto p = Transform::rotation(90.0f).apply(Point(1.0f, 0.0f));
        if (std::abs(p.x.asFloat()) > 0.0001f || std::abs(p.y.asFloat() - 1.0f) > 0.0001f) {
            return "rotating (1, 0) by 90 degrees should give (0, 1)";
        }
        p = Transform::skewing(45.0f, 0.0f).apply(Point(0.0f, 2.0f));
        if (std::abs(p.x.asFloat() - 2.0f) > 0.0001f) {
            return createFloatError("skewed x", 2.0f, p.x.asFloat());
        }

        mContext->scale(2.0f, 3.0f);
        mContext->transform(Transform(1.0f, 2.0f, 3.0f, 4.0f, 5.0f, 6.0f));
        return checkOutput({ "transform [2, 0, 0, 3, 0, 0]",
                             "transform [1, 2, 3, 4, 5, 6]" });
    }
};

//----------------------------------- Text ------------------------------------
class FontSubstitutionTest : public ContextTest
{
public:
    FontSubstitutionTest() : ContextTest("font substitution") {}

    std::string run() override
    {
        mContext->font("NoSuchFont");
        mContext->fontMetrics();
        auto &warnings = mContext->warnings();
        if (warnings.count(kWarnFontSubstitution) != 1) {
            return "expected one substitution warning";
        }
        std::string expected = "font: NoSuchFont is not installed, back to the fallback font: DejaVu Sans";
        if (warnings.warnings()[0].message != expected) {
            return createStringError("warning", expected, warnings.warnings()[0].message);
        }
        if (mContext->state().text.fontName() != "DejaVu Sans") {
            return "the missing font should be replaced by the fallback";
        }

        try {
            mContext->fallbackFont("Missing");
            return "a missing fallback font did not throw";
        } catch (const InvalidFontError& e) {
            std::string msg = "Fallback font 'Missing' is not available";
            if (e.what() != msg) {
                return createStringError("message", msg, e.what());
            }
        }

        mContext->fallbackFont("Times");
        mContext->font("Nope", PicaPt(12.0f));
        auto fm = mContext->fontMetrics();
        if (warnings.warnings().back().message.find("fallback font: Times") == std::string::npos) {
            return "the substitute should be the fallback font";
        }
        if (fm.ascent != PicaPt(0.8f * 12.0f)) {
            return createFloatError("ascent", 9.6f, fm.ascent.asFloat());
        }
        if (mContext->listOpenTypeFeatures().size() != 3) {
            return "expected the feature tags of the fallback font";
        }
        return "";
    }
};

class FormattedStringTest : public ContextTest
{
public:
    FormattedStringTest() : ContextTest("formatted string runs") {}

    std::string run() override
    {
        auto fs = mContext->formattedString("Hello", StyleOverrides().setFill(Color::kRed));
        fs.append(" world", StyleOverrides().setFontSize(PicaPt(20.0f)));
        if (fs.text() != "Hello world" || fs.length() != 11) {
            return createStringError("text", "Hello world", fs.text());
        }
        auto &runs = fs.runs();
        if (runs.size() != 2 || runs[1].startIndex != 5 || runs[1].length != 6) {
            return "expected two runs";
        }
        if (runs[1].style.fill.value != Color::kRed || runs[1].style.fontSize != PicaPt(20.0f) ||
            runs[0].style.fontSize != PicaPt(10.0f)) {
            return "the running style should carry over to the next append";
        }
        if (runs[0].style.font != "DejaVu Sans") {
            return createStringError("default font", "DejaVu Sans", runs[0].style.font);
        }

        auto sub = fs.slice(3, 8);
        if (sub.text() != "lo wo" || sub.runs().size() != 2 ||
            sub.runs()[0].length != 2 || sub.runs()[1].startIndex != 2) {
            return "bad slice(3, 8)";
        }
        if (fs.slice(-5).text() != "world") {
            return createStringError("slice(-5)", "world", fs.slice(-5).text());
        }
        if (fs.slice(20, 30).length() != 0) {
            return "an out of range slice should be empty";
        }

        auto ab = mContext->formattedString("A", StyleOverrides().setFill(Color::kRed));
        ab.append("B", StyleOverrides().setFill(Color::kGreen));
        if (ab.runs().size() != 2) {
            return "a new fill should start a new run";
        }
        auto a = ab.slice(0, 1), b = ab.slice(1, 2);
        if (a.runs().size() != 1 || a.runs()[0].style.fill.value != Color::kRed ||
            b.runs().size() != 1 || b.runs()[0].style.fill.value != Color::kGreen) {
            return "slices should keep the fill of their run";
        }

        auto both = fs + "!";
        if (both.runs().size() != 3 || both.runs()[2].style.fontSize != PicaPt(20.0f)) {
            return "appending a string should use the running style";
        }
        auto twice = fs + fs;
        if (twice.runs().size() != 4 || twice.runs()[2].startIndex != 11) {
            return "appending a formatted string should keep its runs";
        }

        fs.insertText(1, "X");
        if (fs.text() != "HXello world" || fs.runs()[0].length != 6 || fs.runs()[1].startIndex != 6) {
            return "insertText() should extend the run of the previous character";
        }
        fs.eraseText(0, 6);
        if (fs.text() != " world" || fs.runs().size() != 1 || fs.runs()[0].startIndex != 0) {
            return "eraseText() should drop the emptied run";
        }
        try {
            fs.runAt(100);
            return "runAt() out of range did not throw";
        } catch (const InvalidParameterError&) {
            ;  // expected
        }

        auto cmyk = mContext->formattedString("a", StyleOverrides().setCMYKFill(CMYKColor(0.0f, 0.0f, 0.0f, 1.0f)));
        auto &style = cmyk.runs()[0].style;
        if (style.fill.isSet || !style.cmykFill.isSet) {
            return "a CMYK fill should replace the RGB fill";
        }

        auto utf8 = mContext->formattedString("h\xc3\xa9llo");
        if (utf8.length() != 5 || utf8.slice(1, 2).text() != "\xc3\xa9") {
            return "indices should count characters, not bytes";
        }
        return "";
    }
};

class AttributedStringTest : public ContextTest
{
public:
    AttributedStringTest() : ContextTest("attributed string from state") {}

    std::string run() override
    {
        mContext->font("Helvetica", PicaPt(14.0f));
        mContext->stroke(Color::kBlue);
        mContext->strokeWidth(PicaPt(0.5f));
        mContext->fill(nullptr);
        mContext->tracking(PicaPt(1.0f));
        mContext->openTypeFeatures({ { "smcp", true } });
        mContext->openTypeFeatures({ { "liga", false } });
        auto fs = mContext->attributedString("abc", Alignment::kHCenter);
        if (fs.runs().size() != 1) {
            return "expected a single run";
        }
        auto &style = fs.runs()[0].style;
        if (style.font != "Helvetica" || style.fontSize != PicaPt(14.0f)) {
            return "font not taken from the state";
        }
        if (style.fill.isSet || style.cmykFill.isSet) {
            return "there should be no fill";
        }
        if (!style.stroke.isSet || style.stroke.value != Color::kBlue ||
            style.strokeWidth != PicaPt(0.5f)) {
            return "stroke not taken from the state";
        }
        if (style.align != Alignment::kHCenter || !style.tracking.isSet) {
            return "alignment/tracking not set";
        }
        if (openTypeFeatureSettings(style.openTypeFeatures) != "liga=0,smcp=1") {
            return createStringError("features", "liga=0,smcp=1",
                                     openTypeFeatureSettings(style.openTypeFeatures));
        }
        if (openTypeFeatureSettings({ { "notatag", true } }) != "") {
            return "unknown feature tags should be ignored";
        }
        return "";
    }
};

class GlyphTest : public ContextTest
{
public:
    GlyphTest() : ContextTest("glyphs by name") {}

    std::string run() override
    {
        auto fs = mContext->formattedString();
        fs.font("Times");
        fs.appendGlyph({ "ampersand", "nope", "A.sc" });
        if (fs.runs().size() != 2 || fs.length() != 2) {
            return "expected one placeholder per known glyph";
        }
        if (!fs.runs()[0].glyph.isSet || fs.runs()[0].glyph.value != 9 ||
            fs.runs()[1].glyph.value != 42) {
            return "wrong glyph ids";
        }
        auto &warnings = mContext->warnings();
        std::string expected = "font Times has no glyph with the name nope";
        if (warnings.count(kWarnMissingGlyph) != 1 ||
            warnings.warnings().back().message != expected) {
            return "expected the missing glyph warning";
        }

        // Text inserted after a glyph gets a run of its own
        fs.insertText(1, "x");
        if (fs.runs().size() != 3 || fs.runs()[1].glyph.isSet) {
            return "text inserted next to a glyph should not be a glyph";
        }
        return "";
    }
};

class HyphenationTest : public ContextTest
{
public:
    HyphenationTest() : ContextTest("hyphenation") {}

    std::string run() override
    {
        auto points = Hyphenator::createDefault()->hyphenationPoints(U"hyphenation");
        if (points != std::vector<long>({ 5, 7 })) {
            return "expected hyphenation points at 5 and 7";
        }
        if (!Hyphenator::createDefault()->hyphenationPoints(U"cat").empty()) {
            return "short words should not hyphenate";
        }

        auto hyphenated = mContext->hyphenateAttributedString(
                                mContext->attributedString("hyphenation"), PicaPt(40.0f));
        if (hyphenated.text() != "hyphe-nation") {
            return createStringError("hyphenated", "hyphe-nation", hyphenated.text());
        }
        // The soft hyphens that were not used must not be left behind
        auto wide = mContext->hyphenateAttributedString(
                                mContext->attributedString("hyphenation"), PicaPt(200.0f));
        if (wide.text() != "hyphenation") {
            return createStringError("not hyphenated", "hyphenation", wide.text());
        }
        return "";
    }
};

class ClippedTextTest : public ContextTest
{
public:
    ClippedTextTest() : ContextTest("clipped text") {}

    std::string run() override
    {
        Rect oneLine(0.0f, 0.0f, 30.0f, 13.0f);
        auto clipped = mContext->clippedText("hello world", oneLine);
        if (clipped != "world") {
            return createStringError("clipped", "world", clipped);
        }
        if (mContext->clippedText("hello world", Rect(0.0f, 0.0f, 30.0f, 25.0f)) != "") {
            return "everything should fit in two lines";
        }

        mContext->hyphenation(true);
        clipped = mContext->clippedText("hyphenation", Rect(0.0f, 0.0f, 40.0f, 13.0f));
        if (clipped != "nation") {
            return createStringError("clipped with hyphenation", "nation", clipped);
        }

        auto fs = mContext->formattedString("hello world");
        auto rest = mContext->clippedText(fs, oneLine);
        if (rest.text() != "world" || rest.runs().size() != 1) {
            return "a formatted string should clip to a formatted string";
        }

        auto size = mContext->textSize("abcd");
        if (size.width != PicaPt(20.0f)) {
            return createFloatError("textSize() width", 20.0f, size.width.asFloat());
        }
        if (std::abs(size.height.asFloat() - 12.0f) > 0.001f) {
            return createFloatError("textSize() height", 12.0f, size.height.asFloat());
        }
        return "";
    }
};

class TextBoxTest : public ContextTest
{
public:
    TextBoxTest() : ContextTest("text box") {}

    std::string run() override
    {
        mContext->newPath();
        mContext->moveTo(Point(0.0f, 0.0f));
        mContext->textBox("hi", Rect(0.0f, 0.0f, 100.0f, 20.0f));
        if (mContext->state().path) {
            return "textBox() should end the current path";
        }
        try {
            mContext->lineTo(Point(1.0f, 1.0f));
            return "lineTo() after textBox() did not throw";
        } catch (const DrawingStateError&) {
            ;  // expected
        }

        mContext->hyphenation(true);
        mContext->textBox("hyphenation", Rect(0.0f, 0.0f, 40.0f, 24.0f), Alignment::kRight);

        auto fs = mContext->formattedString("x", StyleOverrides().setAlign(Alignment::kHCenter));
        mContext->textBox(fs, Rect(1.0f, 2.0f, 3.0f, 4.0f), Alignment::kLeft);

        return checkOutput({ "textBox hi [0, 0, 100, 20] left",
                             "textBox hyphe-nation [0, 0, 40, 24] right",
                             "textBox x [1, 2, 3, 4] center" });
    }
};

//----------------------------------- Images ----------------------------------
class ImageDecodeTest : public Test
{
public:
    ImageDecodeTest() : Test("image decoding") {}

    std::string run() override
    {
        auto png = readImage(kPngRGB.data(), int(kPngRGB.size()));
        if (png.width != 8 || png.height != 12) {
            return "expected an 8x12 PNG, got " + std::to_string(png.width) + "x" +
                   std::to_string(png.height);
        }
        auto pixel = [&png](int x, int y) {
            const uint8_t *bgra = png.bgra.data() + 4 * (y * png.width + x);
            return (uint32_t(bgra[0]) << 24) | (uint32_t(bgra[1]) << 16) |
                   (uint32_t(bgra[2]) << 8) | uint32_t(bgra[3]);
        };
        if (pixel(0, 0) != 0x0000ffff || pixel(7, 0) != 0x00ff00ff ||
            pixel(0, 11) != 0xff0000ff || pixel(7, 11) != 0xffffffff) {
            return "bad PNG pixels";
        }

        auto transparent = readImage(kGifTransparent.data(), int(kGifTransparent.size()));
        if (!transparent.isValid() || transparent.bgra != std::vector<uint8_t>({ 0, 0, 0, 0 })) {
            return "the transparent GIF pixel should be all zeros";
        }
        auto opaque = readImage(kGifOpaque.data(), int(kGifOpaque.size()));
        if (!opaque.isValid() || opaque.bgra != std::vector<uint8_t>({ 0xff, 0xff, 0xff, 0xff })) {
            return "the opaque GIF pixel should be white";
        }

        std::string notAnImage = "this is not an image, it is only text";
        auto bad = readImage((const uint8_t*)notAnImage.data(), int(notAnImage.size()));
        if (bad.isValid()) {
            return "text should not decode as an image";
        }
        return "";
    }
};

//------------------------------- Cairo output --------------------------------
class CairoTest : public Test
{
public:
    // If `systemFonts` is true, text goes through the installed fonts
    // (Pango/HarfBuzz) instead of the fakes.
    CairoTest(const std::string& name, float dpi = 72.0f, bool systemFonts = false)
        : Test(name), mDPI(dpi), mSystemFonts(systemFonts)
    {}

    void setup() override
    {
        mPrintOut.str("");
        mBackend = RenderBackend::createCairoPreviewBackend(mDPI, &mPrintOut);
        if (mSystemFonts) {
            mFonts = FontResolver::platformResolver();
            mTypesetter = Typesetter::platformTypesetter(mFonts);
        } else {
            mFonts = std::make_shared<FakeFontResolver>();
            mTypesetter = std::make_shared<MonospaceTypesetter>();
        }
        mContext = std::make_shared<DrawContext>(mBackend, mFonts, mTypesetter);
        mContext->warnings().setSink(nullptr);
    }

    void teardown() override
    {
        mContext.reset();
        mTypesetter.reset();
        mFonts.reset();
        mBackend.reset();
    }

protected:
    float mDPI;
    bool mSystemFonts;
    std::stringstream mPrintOut;
    std::shared_ptr<RenderBackend> mBackend;
    std::shared_ptr<FontResolver> mFonts;
    std::shared_ptr<Typesetter> mTypesetter;
    std::shared_ptr<DrawContext> mContext;

    // Number of pixels in the rect (image coordinates) that are not clear
    int countInked(const std::vector<uint32_t>& pixels, int imageWidth,
                   int x0, int y0, int x1, int y1)
    {
        int n = 0;
        for (int y = y0;  y < y1;  ++y) {
            for (int x = x0;  x < x1;  ++x) {
                if ((pixels[y * imageWidth + x] & 0xff000000) != 0) {
                    ++n;
                }
            }
        }
        return n;
    }

    // Returns the page as ARGB32 pixels, top row first.
    std::vector<uint32_t> rasterize(int pageIndex, int width, int height)
    {
        auto *page = (cairo_surface_t*)mBackend->nativePage(pageIndex);
        std::vector<uint32_t> pixels;
        if (!page) {
            return pixels;
        }
        auto *image = cairo_image_surface_create(CAIRO_FORMAT_ARGB32, width, height);
        auto *gc = cairo_create(image);
        cairo_set_source_surface(gc, page, 0.0, 0.0);
        cairo_paint(gc);
        cairo_destroy(gc);
        cairo_surface_flush(image);
        auto *data = cairo_image_surface_get_data(image);
        int stride = cairo_image_surface_get_stride(image);
        for (int y = 0;  y < height;  ++y) {
            auto *row = (const uint32_t*)(data + y * stride);
            pixels.insert(pixels.end(), row, row + width);
        }
        cairo_surface_destroy(image);
        return pixels;
    }

    std::string createPixelError(const std::string& msg, int x, int y,
                                 uint32_t expected, uint32_t got)
    {
        std::stringstream err;
        err << msg << " (" << x << ", " << y << "): expected 0x" << std::hex
            << expected << ", got 0x" << got;
        return err.str();
    }
};

class CairoFillTest : public CairoTest
{
public:
    CairoFillTest() : CairoTest("cairo fill (y-up)") {}

    std::string run() override
    {
        const uint32_t kARGBRed = 0xffff0000;
        mContext->newPage(PicaPt(20.0f), PicaPt(20.0f));
        mContext->fill(Color::kRed);
        mContext->rect(Rect(0.0f, 0.0f, 10.0f, 5.0f));
        mContext->save();
        mContext->translate(PicaPt(10.0f), PicaPt(10.0f));
        mContext->rect(Rect(0.0f, 0.0f, 5.0f, 5.0f));
        mContext->restore();

        auto pixels = rasterize(0, 20, 20);
        if (pixels.size() != 400) {
            return "could not rasterize the page";
        }
        // The rect at the bottom of the page is at the bottom of the image
        if (pixels[17 * 20 + 2] != kARGBRed) {
            return createPixelError("bottom rect", 2, 17, kARGBRed, pixels[17 * 20 + 2]);
        }
        if (pixels[2 * 20 + 2] != 0) {
            return createPixelError("top of the page", 2, 2, 0, pixels[2 * 20 + 2]);
        }
        // Translated rect covers x 10-15, page y 10-15 = image rows 5-10
        if (pixels[7 * 20 + 12] != kARGBRed) {
            return createPixelError("translated rect", 12, 7, kARGBRed, pixels[7 * 20 + 12]);
        }
        if (pixels[7 * 20 + 17] != 0) {
            return createPixelError("right of the translated rect", 17, 7, 0, pixels[7 * 20 + 17]);
        }
        return "";
    }
};

class CairoPageStateTest : public CairoTest
{
public:
    CairoPageStateTest() : CairoTest("cairo save/restore across pages") {}

    std::string run() override
    {
        const uint32_t kARGBRed = 0xffff0000;
        mContext->newPage(PicaPt(20.0f), PicaPt(20.0f));
        mContext->save();
        mContext->translate(PicaPt(10.0f), PicaPt(10.0f));
        mContext->newPage(PicaPt(20.0f), PicaPt(20.0f));
        mContext->restore();
        mContext->fill(Color::kRed);
        mContext->rect(Rect(0.0f, 0.0f, 10.0f, 5.0f));

        mContext->save();
        mContext->newPage(PicaPt(20.0f), PicaPt(20.0f));
        mContext->save();
        mContext->restore();
        mContext->restore();
        mContext->rect(Rect(0.0f, 0.0f, 10.0f, 5.0f));

        for (int page = 1;  page <= 2;  ++page) {
            auto pixels = rasterize(page, 20, 20);
            if (pixels.size() != 400) {
                return "could not rasterize page " + std::to_string(page);
            }
            // The translation was on the previous page, so the rect is at
            // the bottom left.
            if (pixels[17 * 20 + 2] != kARGBRed) {
                return createPixelError("rect on page " + std::to_string(page),
                                        2, 17, kARGBRed, pixels[17 * 20 + 2]);
            }
        }
        return "";
    }
};

class CairoShadowTest : public CairoTest
{
public:
    CairoShadowTest() : CairoTest("cairo shadows") {}

    std::string run() override
    {
        const uint32_t kARGBRed = 0xffff0000;
        const uint32_t kARGBBlue = 0xff0000ff;

        // Offset shadow, no blur
        mContext->newPage(PicaPt(60.0f), PicaPt(60.0f));
        mContext->fill(Color::kRed);
        mContext->shadow(Point(15.0f, 0.0f), PicaPt::kZero, Color::kBlue);
        mContext->rect(Rect(20.0f, 20.0f, 10.0f, 10.0f));
        auto pixels = rasterize(0, 60, 60);
        if (pixels.size() != 3600) {
            return "could not rasterize the page";
        }
        if (pixels[35 * 60 + 25] != kARGBRed) {
            return createPixelError("rect", 25, 35, kARGBRed, pixels[35 * 60 + 25]);
        }
        if (pixels[35 * 60 + 37] != kARGBBlue) {
            return createPixelError("shadow", 37, 35, kARGBBlue, pixels[35 * 60 + 37]);
        }
        if (pixels[35 * 60 + 32] != 0) {
            return createPixelError("between rect and shadow", 32, 35, 0, pixels[35 * 60 + 32]);
        }

        // Blurred shadow under the rect spreads past its edges
        mContext->newPage(PicaPt(60.0f), PicaPt(60.0f));
        mContext->fill(Color::kRed);
        mContext->shadow(Point(0.0f, 0.0f), PicaPt(8.0f), Color::kBlue);
        mContext->rect(Rect(20.0f, 20.0f, 20.0f, 20.0f));
        pixels = rasterize(1, 60, 60);
        if (pixels[30 * 60 + 30] != kARGBRed) {
            return createPixelError("blurred: rect", 30, 30, kARGBRed, pixels[30 * 60 + 30]);
        }
        uint32_t edge = pixels[30 * 60 + 18];
        if ((edge & 0xff000000) == 0 || (edge & 0x000000ff) == 0 ||
            (edge & 0x00ff0000) != 0 || edge == kARGBBlue) {
            return createPixelError("blurred: should be partly blue", 18, 30, 0x80000080, edge);
        }
        if (pixels[2 * 60 + 2] != 0) {
            return createPixelError("blurred: far corner", 2, 2, 0, pixels[2 * 60 + 2]);
        }
        return "";
    }
};

class PangoTextTest : public CairoTest
{
public:
    PangoTextTest() : CairoTest("pango text", 72.0f, true) {}

    std::string run() override
    {
        const std::string kFont = "DejaVu Sans";
        if (!mFonts->hasFont(kFont)) {
            return "'" + kFont + "' needs to be installed";
        }

        auto features = mContext->listOpenTypeFeatures(kFont);
        if (std::find(features.begin(), features.end(), "kern") == features.end()) {
            return "expected 'kern' in the features of " + kFont;
        }

        auto &warnings = mContext->warnings();
        mContext->font("NoSuchFont Regular Bold");
        auto fm = mContext->fontMetrics();
        if (warnings.count(kWarnFontSubstitution) != 1 ||
            mContext->state().text.fontName() != kFont) {
            return "a missing font should fall back to " + kFont + " with a warning";
        }
        if (fm.ascent <= PicaPt::kZero || fm.descent <= PicaPt::kZero ||
            fm.capHeight <= fm.xHeight || fm.lineHeight < fm.ascent + fm.descent) {
            return "implausible font metrics";
        }

        mContext->font(kFont, PicaPt(20.0f));
        auto hello = mContext->formattedString("Hello");
        auto helloWorld = mContext->formattedString("Hello world");
        auto size = mTypesetter->measure(helloWorld);
        if (size.width <= mTypesetter->measure(hello).width ||
            size.height < PicaPt(10.0f)) {
            return "measure() of 'Hello world' is too small";
        }
        long n = mTypesetter->suggestLineBreak(helloWorld, 0, PicaPt(40.0f));
        if (n < 1 || n >= 11) {
            return "expected a line break for a narrow width, got " + std::to_string(n);
        }
        if (mTypesetter->suggestLineBreak(helloWorld, 0, PicaPt(1000.0f)) != 11) {
            return "a wide line should hold all the text";
        }
        if (mTypesetter->visibleLength(helloWorld, Size(PicaPt(1000.0f), PicaPt(1000.0f))) != 11) {
            return "all the text should be visible in a large box";
        }

        auto glyphs = mContext->formattedString();
        glyphs.appendGlyph({ "ampersand", "no-such-glyph-name" });
        if (glyphs.runs().size() != 1 || !glyphs.runs()[0].glyph.isSet ||
            glyphs.runs()[0].glyph.value <= 0) {
            return "expected the glyph id of 'ampersand'";
        }
        if (warnings.count(kWarnMissingGlyph) != 1) {
            return "expected a missing glyph warning";
        }

        mContext->newPage(PicaPt(100.0f), PicaPt(40.0f));
        mContext->textBox("Hello", Rect(0.0f, 0.0f, 100.0f, 40.0f));
        mContext->newPage(PicaPt(100.0f), PicaPt(40.0f));
        mContext->textBox(glyphs, Rect(0.0f, 0.0f, 100.0f, 40.0f));
        for (int page = 0;  page <= 1;  ++page) {
            auto pixels = rasterize(page, 100, 40);
            if (pixels.size() != 4000) {
                return "could not rasterize page " + std::to_string(page);
            }
            if (countInked(pixels, 100, 0, 0, 100, 40) == 0) {
                return "nothing was drawn on page " + std::to_string(page);
            }
        }
        return "";
    }
};

class CairoOutputTest : public CairoTest
{
public:
    CairoOutputTest() : CairoTest("cairo png and postscript output", 144.0f) {}

    std::string run() override
    {
        mContext->newPage(PicaPt(20.0f), PicaPt(10.0f));
        mContext->fill(Color::kBlue);
        mContext->oval(Rect(0.0f, 0.0f, 20.0f, 10.0f));

        std::string path = "/tmp/scriptdraw_test.png";
        mContext->saveImage(path);
        auto data = readFile(path.c_str());
        remove(path.c_str());
        auto img = readImage(data.data(), int(data.size()));
        if (img.width != 40 || img.height != 20) {
            return "the PNG should be rasterized at 144 dpi";
        }

        mContext->printImage();
        if (mPrintOut.str().compare(0, 4, "%!PS") != 0) {
            return "printImage() should write PostScript to the print stream";
        }

        auto noStream = std::make_shared<DrawContext>(RenderBackend::createCairoPDFBackend(),
                                                      std::make_shared<FakeFontResolver>(),
                                                      std::make_shared<MonospaceTypesetter>());
        noStream->newPage(PicaPt(10.0f), PicaPt(10.0f));
        try {
            noStream->printImage();
            return "printImage() without a stream did not throw";
        } catch (const OutputError&) {
            ;  // expected
        }
        return "";
    }
};

//-----------------------------------------------------------------------------
int main(int argc, char *argv[])
{
    std::vector<std::shared_ptr<Test>> tests = {
        std::make_shared<ColorTest>(),
        std::make_shared<CMYKColorTest>(),
        std::make_shared<GradientTest>(),
        std::make_shared<BezierPathTest>(),
        std::make_shared<TextPathTest>(),
        std::make_shared<PageTest>(),
        std::make_shared<DrawPathTest>(),
        std::make_shared<SaveRestoreTest>(),
        std::make_shared<PaintTest>(),
        std::make_shared<CMYKGradientTest>(),
        std::make_shared<LineStyleTest>(),
        std::make_shared<TransformTest>(),
        std::make_shared<FontSubstitutionTest>(),
        std::make_shared<FormattedStringTest>(),
        std::make_shared<AttributedStringTest>(),
        std::make_shared<GlyphTest>(),
        std::make_shared<HyphenationTest>(),
        std::make_shared<ClippedTextTest>(),
        std::make_shared<TextBoxTest>(),
        std::make_shared<ImageDecodeTest>(),
        std::make_shared<CairoFillTest>(),
        std::make_shared<CairoPageStateTest>(),
        std::make_shared<CairoShadowTest>(),
        std::make_shared<PangoTextTest>(),
        std::make_shared<CairoOutputTest>()
    };

    const char *TERM = std::getenv("TERM");
    if (!isatty(STDOUT_FILENO) || !TERM || TERM[0] == '\0') {
        kNormal = kRed = kGreen = "";
    }

    auto runTest = [](Test& t) -> int {
        int failed = 0;
        t.setup();
        std::string err;
        try {
            err = t.run();
        } catch (const std::exception& e) {
            err = std::string("unexpected exception: ") + e.what();
        }

        std::cout << "[";
        if (!err.empty()) {
            failed = 1;
            std::cout << kRed << "FAIL" << kNormal;
        } else {
            std::cout << kGreen << "pass" << kNormal;
        }
        std::cout << "] " << t.name() << std::endl;

        if (failed) {
            std::cout << "       " << err << std::endl;
        }

        t.teardown();
        return failed;
    };

    int nFailed = 0;
    for (auto t : tests) {
        nFailed += runTest(*t);
    }

    if (nFailed == 0) {
        std::cout << kGreen << "All tests passed!" << kNormal << std::endl;
    } else {
        std::cout << kRed << nFailed << " test" << (nFailed == 1 ? "" : "s")
                  << " FAILED" << kNormal << std::endl;
    }

    return nFailed;  // 0 = success
}
