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

#include "scriptdraw.h"
#include "scriptdraw_private.h"

#include <ctype.h>

#include <algorithm>
#include <iostream>
#include <sstream>

namespace SD_NAMESPACE {

//-----------------------------------------------------------------------------
GraphicsState::GraphicsState()
    : fillColor(Color(0.0f, 0.0f, 0.0f, 1.0f))
    , strokeWidth(1.0f)
    , miterLimit(10.0f)
{
}

GraphicsState::GraphicsState(const GraphicsState& s)
{
    *this = s;
}

GraphicsState& GraphicsState::operator=(const GraphicsState& rhs)
{
    if (this == &rhs) {
        return *this;
    }
    fillColor = rhs.fillColor;
    cmykFillColor = rhs.cmykFillColor;
    strokeColor = rhs.strokeColor;
    cmykStrokeColor = rhs.cmykStrokeColor;
    shadow = rhs.shadow;
    gradient = rhs.gradient;
    strokeWidth = rhs.strokeWidth;
    lineDash = rhs.lineDash;
    lineCap = rhs.lineCap;
    lineJoin = rhs.lineJoin;
    miterLimit = rhs.miterLimit;
    text = rhs.text;
    if (rhs.path) {
        path = std::make_shared<BezierPath>(*rhs.path);
    } else {
        path.reset();
    }
    return *this;
}

Attr<Color> GraphicsState::effectiveFillColor() const
{
    if (fillColor.isSet) {
        return fillColor;
    } else if (cmykFillColor.isSet) {
        return Attr<Color>(cmykFillColor.value.toRGB());
    }
    return Attr<Color>();
}

Attr<Color> GraphicsState::effectiveStrokeColor() const
{
    if (strokeColor.isSet) {
        return strokeColor;
    } else if (cmykStrokeColor.isSet) {
        return Attr<Color>(cmykStrokeColor.value.toRGB());
    }
    return Attr<Color>();
}

bool GraphicsState::operator==(const GraphicsState& rhs) const
{
    bool samePath = ((!path && !rhs.path) ||
                     (path && rhs.path && *path == *rhs.path));
    return (samePath &&
            fillColor == rhs.fillColor && cmykFillColor == rhs.cmykFillColor &&
            strokeColor == rhs.strokeColor &&
            cmykStrokeColor == rhs.cmykStrokeColor &&
            shadow == rhs.shadow && gradient == rhs.gradient &&
            strokeWidth == rhs.strokeWidth && lineDash == rhs.lineDash &&
            lineCap == rhs.lineCap && lineJoin == rhs.lineJoin &&
            miterLimit == rhs.miterLimit && text == rhs.text);
}

//-------------------------------- PrintBackend -------------------------------
namespace {

std::string pathDescription(const std::shared_ptr<BezierPath>& path)
{
    if (!path) {
        return "None";
    }
    std::ostringstream s;
    bool first = true;
    for (auto &e : path->elements()) {
        if (!first) {
            s << " ";
        }
        first = false;
        switch (e.action) {
            case BezierPath::kMoveTo:    s << "M";  break;
            case BezierPath::kLineTo:    s << "L";  break;
            case BezierPath::kCurveTo:   s << "C";  break;
            case BezierPath::kClosePath: s << "Z";  break;
        }
        for (auto &p : e.points) {
            s << " " << p.x.asFloat() << " " << p.y.asFloat();
        }
    }
    return s.str();
}

// Logs each primitive instead of rendering it.
class PrintBackend : public RenderBackend
{
public:
    explicit PrintBackend(std::ostream& out) : mOut(out) {}

    void newPage(const PicaPt& width, const PicaPt& height) override
    {
        mOut << "newPage " << width.asFloat() << " " << height.asFloat() << std::endl;
        ++mPageCount;
    }

    void save() override { mOut << "save" << std::endl; }

    void restore() override { mOut << "restore" << std::endl; }

    void drawPath(const GraphicsState& state) override
    {
        mOut << "drawPath " << pathDescription(state.path) << std::endl;
    }

    void clipPath(const GraphicsState& state) override
    {
        mOut << "clipPath " << pathDescription(state.path) << std::endl;
    }

    void transform(const Transform& m) override
    {
        mOut << "transform [" << m.a << ", " << m.b << ", " << m.c << ", "
             << m.d << ", " << m.tx << ", " << m.ty << "]" << std::endl;
    }

    void renderTextBox(const FormattedString& text, const Rect& box,
                       int alignment) override
    {
        mOut << "textBox " << text.text() << " [" << box.x.asFloat() << ", "
             << box.y.asFloat() << ", " << box.width.asFloat() << ", "
             << box.height.asFloat() << "] " << Alignment::name(alignment)
             << std::endl;
    }

    void renderImage(const std::string& path, const Point& position,
                     float alpha) override
    {
        mOut << "image " << path << " " << position.x.asFloat() << " "
             << position.y.asFloat() << " " << alpha << std::endl;
    }

    void setFrameDuration(float seconds) override
    {
        mOut << "frameDuration " << seconds << std::endl;
    }

    void saveImage(const std::string& path, bool multipage) override
    {
        mOut << "saveImage " << path << " " << (multipage ? "true" : "false")
             << std::endl;
    }

    void printImage(const std::string& documentPath) override
    {
        mOut << "printImage " << documentPath << std::endl;
    }

    void reset() override
    {
        mOut << "reset" << std::endl;
        mPageCount = 0;
    }

    int pageCount() const override { return mPageCount; }

    void* nativePage(int) const override { return nullptr; }

private:
    std::ostream& mOut;
    int mPageCount = 0;
};

} // namespace

std::shared_ptr<RenderBackend> RenderBackend::createPrintBackend(std::ostream& out)
{
    return std::make_shared<PrintBackend>(out);
}

//-------------------------------- DrawContext --------------------------------
namespace {

bool isWordChar(char32_t c)
{
    if (c < 0x80) {
        return (isalnum(int(c)) != 0);
    }
    return (c != kSoftHyphen && c != kNoBreakSpace && c != 0x3000 &&
            !(c >= 0x2000 && c <= 0x206f));
}

std::vector<Color> rgbColors(const std::vector<CMYKColor>& colors)
{
    std::vector<Color> rgb;
    rgb.reserve(colors.size());
    for (auto &c : colors) {
        rgb.push_back(c.toRGB());
    }
    return rgb;
}

} // namespace

DrawContext::DrawContext(std::shared_ptr<RenderBackend> backend,
                         std::shared_ptr<FontResolver> fonts,
                         std::shared_ptr<Typesetter> typesetter,
                         std::shared_ptr<Hyphenator> hyphenator /*= nullptr*/)
    : mBackend(backend), mFonts(fonts), mTypesetter(typesetter)
    , mHyphenator(hyphenator ? hyphenator : Hyphenator::createDefault())
    , mWarnings(std::make_shared<WarningLog>())
{
    mStateStack.emplace_back();
}

DrawContext::~DrawContext()
{
}

void DrawContext::reset()
{
    mStateStack.clear();
    mStateStack.emplace_back();
    mWidth.reset();
    mHeight.reset();
    mHasPage = false;
    mBackend->reset();
}

BezierPath& DrawContext::currentPath()
{
    auto &path = currentState().path;
    if (!path) {
        throw DrawingStateError("Create a new path first");
    }
    return *path;
}

// ----- pages -----
void DrawContext::size(const PicaPt& width, const PicaPt& height)
{
    mWidth = width;
    mHeight = height;
}

void DrawContext::startPage(const Attr<PicaPt>& width, const Attr<PicaPt>& height)
{
    if (!width.isSet) {
        throw MissingDimensionError("A page must have a width");
    }
    if (!height.isSet) {
        throw MissingDimensionError("A page must have a height");
    }
    mHasPage = true;
    mBackend->newPage(width.value, height.value);
}

void DrawContext::newPage()
{
    startPage(mWidth, mHeight);
}

void DrawContext::newPage(const PicaPt& width, const PicaPt& height)
{
    startPage(Attr<PicaPt>(width), Attr<PicaPt>(height));
}

void DrawContext::frameDuration(float seconds)
{
    mBackend->setFrameDuration(seconds);
}

void DrawContext::saveImage(const std::string& path, bool multipage /*= false*/)
{
    if (!mHasPage) {
        throw NoPageError("can't save image when no page is set");
    }
    mBackend->saveImage(path, multipage);
}

void DrawContext::printImage(const std::string& documentPath /*= ""*/)
{
    if (!mHasPage) {
        throw NoPageError("can't print image when no page is set");
    }
    mBackend->printImage(documentPath);
}

// ----- state stack -----
void DrawContext::save()
{
    GraphicsState copy = mStateStack.back();
    mStateStack.push_back(copy);
    mBackend->save();
}

void DrawContext::restore()
{
    if (mStateStack.size() <= 1) {
        throw UnbalancedStateError("can't restore graphics state: no matching save()");
    }
    mStateStack.pop_back();
    mBackend->restore();
}

// ----- paths -----
void DrawContext::rect(const Rect& r)
{
    BezierPath path;
    path.rect(r);
    drawPath(path);
}

void DrawContext::oval(const Rect& r)
{
    BezierPath path;
    path.oval(r);
    drawPath(path);
}

void DrawContext::newPath()
{
    currentState().path = std::make_shared<BezierPath>();
}

void DrawContext::moveTo(const Point& p) { currentPath().moveTo(p); }

void DrawContext::lineTo(const Point& p) { currentPath().lineTo(p); }

void DrawContext::curveTo(const Point& cp1, const Point& cp2, const Point& end)
{
    currentPath().curveTo(cp1, cp2, end);
}

void DrawContext::arcTo(const Point& p1, const Point& p2, const PicaPt& radius)
{
    currentPath().arcTo(p1, p2, radius);
}

void DrawContext::closePath() { currentPath().closePath(); }

void DrawContext::drawPath()
{
    mBackend->drawPath(currentState());
}

void DrawContext::drawPath(const BezierPath& path)
{
    currentState().path = std::make_shared<BezierPath>(path);
    mBackend->drawPath(currentState());
}

void DrawContext::clipPath()
{
    mBackend->clipPath(currentState());
}

void DrawContext::clipPath(const BezierPath& path)
{
    currentState().path = std::make_shared<BezierPath>(path);
    mBackend->clipPath(currentState());
}

// ----- paint -----
void DrawContext::fill(const Color& color)
{
    auto &s = currentState();
    s.fillColor = color;
    s.cmykFillColor.reset();
    s.gradient.reset();
}

void DrawContext::fill(std::nullptr_t)
{
    auto &s = currentState();
    s.fillColor.reset();
    s.cmykFillColor.reset();
}

void DrawContext::stroke(const Color& color)
{
    auto &s = currentState();
    s.strokeColor = color;
    s.cmykStrokeColor.reset();
}

void DrawContext::stroke(std::nullptr_t)
{
    auto &s = currentState();
    s.strokeColor.reset();
    s.cmykStrokeColor.reset();
}

void DrawContext::cmykFill(const CMYKColor& color)
{
    auto &s = currentState();
    s.cmykFillColor = color;
    s.fillColor.reset();
    s.gradient.reset();
}

void DrawContext::cmykFill(std::nullptr_t) { fill(nullptr); }

void DrawContext::cmykStroke(const CMYKColor& color)
{
    auto &s = currentState();
    s.cmykStrokeColor = color;
    s.strokeColor.reset();
}

void DrawContext::cmykStroke(std::nullptr_t) { stroke(nullptr); }

void DrawContext::shadow(const Point& offset, const PicaPt& blur, const Color& color)
{
    currentState().shadow = Shadow(offset, blur, color);
}

void DrawContext::shadow(std::nullptr_t)
{
    currentState().shadow.reset();
}

void DrawContext::cmykShadow(const Point& offset, const PicaPt& blur,
                             const CMYKColor& color)
{
    Shadow s(offset, blur, color.toRGB());
    s.setCMYKColor(color);
    currentState().shadow = s;
}

void DrawContext::linearGradient(const Point& start, const Point& end,
                                 const std::vector<Color>& colors,
                                 const std::vector<float>& positions /*= {}*/)
{
    Gradient g(kGradientLinear, start, end, colors, positions);
    currentState().gradient = g;
    fill(nullptr);
}

void DrawContext::linearGradient(std::nullptr_t)
{
    currentState().gradient.reset();
    fill(Color(0.0f));
}

void DrawContext::cmykLinearGradient(const Point& start, const Point& end,
                                     const std::vector<CMYKColor>& colors,
                                     const std::vector<float>& positions /*= {}*/)
{
    Gradient g(kGradientLinear, start, end, rgbColors(colors), positions);
    g.setCMYKColors(colors);
    currentState().gradient = g;
    fill(nullptr);
}

void DrawContext::radialGradient(const Point& start, const Point& end,
                                 const std::vector<Color>& colors,
                                 const std::vector<float>& positions /*= {}*/,
                                 const PicaPt& startRadius /*= PicaPt(0.0f)*/,
                                 const PicaPt& endRadius /*= PicaPt(100.0f)*/)
{
    Gradient g(kGradientRadial, start, end, colors, positions, startRadius, endRadius);
    currentState().gradient = g;
    fill(nullptr);
}

void DrawContext::radialGradient(std::nullptr_t)
{
    linearGradient(nullptr);
}

void DrawContext::cmykRadialGradient(const Point& start, const Point& end,
                                     const std::vector<CMYKColor>& colors,
                                     const std::vector<float>& positions /*= {}*/,
                                     const PicaPt& startRadius /*= PicaPt(0.0f)*/,
                                     const PicaPt& endRadius /*= PicaPt(100.0f)*/)
{
    Gradient g(kGradientRadial, start, end, rgbColors(colors), positions,
               startRadius, endRadius);
    g.setCMYKColors(colors);
    currentState().gradient = g;
    fill(nullptr);
}

void DrawContext::strokeWidth(const PicaPt& width)
{
    currentState().strokeWidth = width;
}

void DrawContext::miterLimit(float limit)
{
    currentState().miterLimit = limit;
}

void DrawContext::lineJoin(const std::string& join)
{
    if (join == "miter") {
        currentState().lineJoin = kJoinMiter;
    } else if (join == "round") {
        currentState().lineJoin = kJoinRound;
    } else if (join == "bevel") {
        currentState().lineJoin = kJoinBevel;
    } else {
        throw InvalidParameterError("lineJoin() argument must be 'bevel', 'miter' or 'round'");
    }
}

void DrawContext::lineJoin(std::nullptr_t)
{
    currentState().lineJoin.reset();
}

void DrawContext::lineCap(const std::string& cap)
{
    if (cap == "butt") {
        currentState().lineCap = kEndCapButt;
    } else if (cap == "square") {
        currentState().lineCap = kEndCapSquare;
    } else if (cap == "round") {
        currentState().lineCap = kEndCapRound;
    } else {
        throw InvalidParameterError("lineCap() argument must be 'butt', 'square' or 'round'");
    }
}

void DrawContext::lineCap(std::nullptr_t)
{
    currentState().lineCap.reset();
}

void DrawContext::lineDash(const std::vector<PicaPt>& pattern)
{
    if (pattern.empty()) {
        currentState().lineDash.reset();
    } else {
        currentState().lineDash = pattern;
    }
}

void DrawContext::lineDash(std::nullptr_t)
{
    currentState().lineDash.reset();
}

// ----- transforms -----
void DrawContext::transform(const Transform& matrix)
{
    mBackend->transform(matrix);
}

void DrawContext::translate(const PicaPt& dx, const PicaPt& dy)
{
    transform(Transform::translation(dx, dy));
}

void DrawContext::rotate(float degrees)
{
    transform(Transform::rotation(degrees));
}

void DrawContext::scale(float sx, float sy)
{
    transform(Transform::scaling(sx, sy));
}

void DrawContext::skew(float xDegrees, float yDegrees /*= 0.0f*/)
{
    transform(Transform::skewing(xDegrees, yDegrees));
}

// ----- text -----
void DrawContext::font(const std::string& name)
{
    currentState().text.setFontName(name);
}

void DrawContext::font(const std::string& name, const PicaPt& size)
{
    currentState().text.setFontName(name);
    currentState().text.setFontSize(size);
}

void DrawContext::fallbackFont(const std::string& name)
{
    currentState().text.setFallbackFontName(name, *mFonts);
}

void DrawContext::fontSize(const PicaPt& size)
{
    currentState().text.setFontSize(size);
}

void DrawContext::lineHeight(const PicaPt& height)
{
    currentState().text.setLineHeight(Attr<PicaPt>(height));
}

void DrawContext::lineHeight(std::nullptr_t)
{
    currentState().text.setLineHeight(Attr<PicaPt>());
}

void DrawContext::tracking(const PicaPt& tracking)
{
    currentState().text.setTracking(Attr<PicaPt>(tracking));
}

void DrawContext::tracking(std::nullptr_t)
{
    currentState().text.setTracking(Attr<PicaPt>());
}

void DrawContext::hyphenation(bool on)
{
    currentState().text.setHyphenation(on);
}

void DrawContext::openTypeFeatures(const OpenTypeFeatures& features,
                                   bool resetFeatures /*= false*/)
{
    auto &text = currentState().text;
    OpenTypeFeatures f = (resetFeatures ? OpenTypeFeatures() : text.openTypeFeatures());
    for (auto &kv : features) {
        f[kv.first] = kv.second;
    }
    text.setOpenTypeFeatures(f);
}

std::vector<std::string> DrawContext::listOpenTypeFeatures(const std::string& fontName /*= ""*/)
{
    if (fontName.empty()) {
        return mFonts->openTypeFeatureTags(currentState().text.font(*mFonts, *mWarnings));
    }
    return mFonts->openTypeFeatureTags(fontName);
}

FontMetrics DrawContext::fontMetrics()
{
    auto &text = currentState().text;
    return mFonts->metrics(text.font(*mFonts, *mWarnings), text.fontSize());
}

FormattedString DrawContext::formattedString(const std::string& utf8 /*= ""*/,
                                             const StyleOverrides& style /*= StyleOverrides()*/) const
{
    return FormattedString(mFonts, mWarnings, utf8, style);
}

FormattedString DrawContext::attributedString(const std::string& txt,
                                              int alignment /*= Alignment::kNone*/)
{
    auto &s = currentState();
    StyleOverrides style;
    style.setFont(s.text.font(*mFonts, *mWarnings))
         .setFontSize(s.text.fontSize())
         .setStrokeWidth(s.strokeWidth)
         .setAlign(alignment)
         .setOpenTypeFeatures(s.text.openTypeFeatures());
    if (!s.text.fallbackFontName().empty()) {
        style.setFallbackFont(s.text.fallbackFontName());
    }
    if (s.fillColor.isSet) {
        style.setFill(s.fillColor.value);
    } else if (s.cmykFillColor.isSet) {
        style.setCMYKFill(s.cmykFillColor.value);
    }
    if (s.strokeColor.isSet) {
        style.setStroke(s.strokeColor.value);
    } else if (s.cmykStrokeColor.isSet) {
        style.setCMYKStroke(s.cmykStrokeColor.value);
    }
    style.lineHeight = s.text.lineHeight();
    style.tracking = s.text.tracking();

    FormattedString fs(mFonts, mWarnings);
    // The state's paint replaces the default black fill entirely
    fs.fill(nullptr);
    fs.stroke(nullptr);
    fs.append(txt, style);
    return fs;
}

FormattedString DrawContext::attributedString(const FormattedString& txt,
                                              int /*alignment*/)
{
    return txt;
}

FormattedString DrawContext::hyphenateAttributedString(const FormattedString& txt,
                                                       const PicaPt& width) const
{
    FormattedString attr = txt;
    const std::string softHyphen = utf8FromCodePoint(kSoftHyphen);

    // Mark the hyphenation points of every word with a soft hyphen, walking
    // backwards so that earlier indices stay valid.
    std::u32string chars = utf32FromUtf8(attr.text());
    long n = long(chars.size());
    long wordStart = n;
    while (wordStart > 2) {
        long idx = wordStart - 2;
        long start = idx;
        long end = idx + 1;
        if (isWordChar(chars[idx])) {
            while (start > 0 && isWordChar(chars[start - 1])) {
                --start;
            }
            while (end < n && isWordChar(chars[end])) {
                ++end;
            }
        }
        wordStart = start;
        auto points = mHyphenator->hyphenationPoints(chars.substr(size_t(start), size_t(end - start)));
        for (auto it = points.rbegin();  it != points.rend();  ++it) {
            attr.insertText(start + *it, softHyphen);
        }
    }

    // Lay out the lines. A line that breaks at a soft hyphen gets a real
    // hyphen if there is room for it; otherwise the soft hyphen is removed
    // and the line is laid out again.
    const long textLength = attr.length();
    long location = 0;
    while (location < textLength) {
        long breakIndex = mTypesetter->suggestLineBreak(attr, location, width);
        if (breakIndex <= 0) {
            break;
        }
        FormattedString sub = attr.slice(location, location + breakIndex);
        location += breakIndex;

        auto subChars = utf32FromUtf8(sub.text());
        if (!subChars.empty() && subChars.back() == kSoftHyphen) {
            FormattedString hyphen = sub.slice(0, 1);
            hyphen.insertText(1, "-");
            hyphen.eraseText(0, 1);
            PicaPt hyphenWidth = mTypesetter->measure(hyphen).width;
            if (mTypesetter->measure(sub).width + hyphenWidth < width) {
                attr.insertText(location, "-");
                location += 1;
            } else {
                attr.eraseText(location - 1, 1);
                location -= breakIndex;
            }
        }
    }

    chars = utf32FromUtf8(attr.text());
    for (long i = long(chars.size()) - 1;  i >= 0;  --i) {
        if (chars[i] == kSoftHyphen) {
            attr.eraseText(i, 1);
        }
    }
    return attr;
}

FormattedString DrawContext::textForBox(const FormattedString& txt, const Rect& box,
                                        int /*alignment*/)
{
    if (currentState().text.hyphenation()) {
        return hyphenateAttributedString(txt, box.width);
    }
    return txt;
}

long DrawContext::clippedLength(const FormattedString& txt, const Rect& box,
                                int alignment)
{
    bool hyphenate = currentState().text.hyphenation();
    std::vector<long> hyphenIndices;
    if (hyphenate) {
        auto chars = utf32FromUtf8(txt.text());
        for (size_t i = 0;  i < chars.size();  ++i) {
            if (chars[i] == '-') {
                hyphenIndices.push_back(long(i));
            }
        }
    }

    FormattedString attr = textForBox(txt, box, alignment);
    long clip = mTypesetter->visibleLength(attr, box.size());

    if (hyphenate) {
        // The visible range counts the hyphens that hyphenation added, but
        // the caller's text does not have them.
        auto chars = utf32FromUtf8(attr.text());
        long nHyphens = 0;
        for (long i = 0;  i < clip && i < long(chars.size());  ++i) {
            if (chars[i] == '-') {
                ++nHyphens;
            }
        }
        for (auto i : hyphenIndices) {
            if (i < clip) {
                ++clip;
            } else {
                break;
            }
        }
        clip -= nHyphens;
    }
    return clip;
}

std::string DrawContext::clippedText(const std::string& txt, const Rect& box,
                                     int alignment /*= Alignment::kLeft*/)
{
    long clip = clippedLength(attributedString(txt, alignment), box, alignment);
    auto chars = utf32FromUtf8(txt);
    clip = std::max(0L, std::min(long(chars.size()), clip));
    return utf8FromUtf32(chars.substr(size_t(clip)));
}

FormattedString DrawContext::clippedText(const FormattedString& txt, const Rect& box,
                                         int alignment /*= Alignment::kLeft*/)
{
    long clip = clippedLength(txt, box, alignment);
    return txt.slice(clip);
}

Size DrawContext::textSize(const std::string& txt, int alignment /*= Alignment::kLeft*/)
{
    return mTypesetter->measure(attributedString(txt, alignment));
}

Size DrawContext::textSize(const FormattedString& txt, int /*alignment = Alignment::kLeft*/)
{
    return mTypesetter->measure(txt);
}

void DrawContext::textBox(const std::string& txt, const Rect& box,
                          int alignment /*= Alignment::kLeft*/)
{
    currentState().path.reset();
    auto attr = textForBox(attributedString(txt, alignment), box, alignment);
    mBackend->renderTextBox(attr, box, alignment);
}

void DrawContext::textBox(const FormattedString& txt, const Rect& box,
                          int alignment /*= Alignment::kLeft*/)
{
    currentState().path.reset();
    if (!txt.runs().empty() && txt.runs()[0].style.align != Alignment::kNone) {
        alignment = txt.runs()[0].style.align;
    }
    auto attr = textForBox(txt, box, alignment);
    mBackend->renderTextBox(attr, box, alignment);
}

void DrawContext::image(const std::string& path, const Point& position,
                        float alpha /*= 1.0f*/)
{
    mBackend->renderImage(path, position, alpha);
}

} // namespace $SD_NAMESPACE
