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

#ifndef _SCRIPT_DRAW_H
#define _SCRIPT_DRAW_H

#ifndef SD_NAMESPACE
#define SD_NAMESPACE sd
#endif // SD_NAMESPACE

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace SD_NAMESPACE {

/// This is a typographical "point", which is a unit of measurement equal to
/// 1/72 inch. Pages, paths and font sizes are all measured in PicaPt; a
/// 72 dpi preview maps one PicaPt to one pixel.
struct PicaPt
{
    static const PicaPt kZero;

    PicaPt() : pt(0.0f) {}
    explicit PicaPt(float pt_) : pt(pt_) {}

    static PicaPt fromPixels(float pixels, float dpi) {
        return PicaPt(pixels * 72.0f / dpi);
    }

    float asFloat() const { return pt; }
    float toPixels(float dpi) const { return pt * dpi / 72.0f; }

    PicaPt operator-() const { return PicaPt(-pt); }
    PicaPt operator+(const PicaPt& v) const { return PicaPt(pt + v.pt); }
    PicaPt operator-(const PicaPt& v) const { return PicaPt(pt - v.pt); }
    PicaPt operator*(float v) const { return PicaPt(pt * v); }
    float operator/(const PicaPt& v) const { return pt / v.pt; } // length/length is unitless
    PicaPt operator/(float v) const { return PicaPt(pt / v); }
    PicaPt& operator+=(const PicaPt& v) { pt += v.pt; return *this; }
    PicaPt& operator-=(const PicaPt& v) { pt -= v.pt; return *this; }
    PicaPt& operator*=(float v) { pt *= v; return *this; }

    bool operator==(const PicaPt& rhs) const { return (pt == rhs.pt); }
    bool operator!=(const PicaPt& rhs) const { return (pt != rhs.pt); }
    bool operator<(const PicaPt& rhs) const { return (pt < rhs.pt); }
    bool operator<=(const PicaPt& rhs) const { return (pt <= rhs.pt); }
    bool operator>(const PicaPt& rhs) const { return (pt > rhs.pt); }
    bool operator>=(const PicaPt& rhs) const { return (pt >= rhs.pt); }

    float pt;
};

PicaPt operator*(float lhs, const PicaPt& rhs);

struct Point
{
    static const Point kZero;

    Point() : x(PicaPt(0.0f)), y(PicaPt(0.0f)) {}
    explicit Point(const PicaPt& x_, const PicaPt& y_)
        : x(x_), y(y_)
    {}
    explicit Point(float x_, float y_)
        : x(PicaPt(x_)), y(PicaPt(y_))
    {}

    Point operator+(const Point& rhs) const
        { return Point(x + rhs.x, y + rhs.y); }
    Point& operator+=(const Point& rhs)
        { x += rhs.x; y += rhs.y; return *this; }

    Point operator-(const Point& rhs) const
        { return Point(x - rhs.x, y - rhs.y); }
    Point& operator-=(const Point& rhs)
        { x -= rhs.x; y -= rhs.y; return *this; }

    bool operator==(const Point& rhs) const
        { return (x == rhs.x && y == rhs.y); }
    bool operator!=(const Point& rhs) const
        { return (x != rhs.x || y != rhs.y); }

    PicaPt x;
    PicaPt y;
};

Point operator*(float lhs, const Point& rhs);

struct Size
{
    static const Size kZero;

    Size() : width(PicaPt(0.0f)), height(PicaPt(0.0f)) {}
    Size(const PicaPt& w, const PicaPt& h)
        : width(w), height(h)
    {}

    bool operator==(const Size& rhs) const
        { return (width == rhs.width && height == rhs.height); }

    PicaPt width;
    PicaPt height;
};

/// Rectangles are in page coordinates, which have +y going up, so (x, y) is
/// the lower left corner.
struct Rect
{
    static const Rect kZero;

    Rect()
        : x(PicaPt(0.0f)), y(PicaPt(0.0f))
        , width(PicaPt(0.0f)), height(PicaPt(0.0f))
    {}

    Rect(const Point& origin, const Size& size)
        : x(origin.x), y(origin.y), width(size.width), height(size.height)
    {}

    Rect(const PicaPt& x_, const PicaPt& y_,
         const PicaPt& width_, const PicaPt& height_)
        : x(x_), y(y_), width(width_), height(height_)
    {}

    Rect(float x_, float y_, float width_, float height_)
        : x(PicaPt(x_)), y(PicaPt(y_)), width(PicaPt(width_)), height(PicaPt(height_))
    {}

    bool isEmpty() const
        { return (width <= PicaPt(0.0f) || height <= PicaPt(0.0f)); }

    bool contains(const Point& p) const {
        return (p.x >= x && p.x <= x + width && p.y >= y && p.y <= y + height);
    }

    Size size() const { return Size(width, height); }

    PicaPt minX() const { return x; }
    PicaPt midX() const { return x + 0.5f * width; }
    PicaPt maxX() const { return x + width; }
    PicaPt minY() const { return y; }
    PicaPt midY() const { return y + 0.5f * height; }
    PicaPt maxY() const { return y + height; }

    bool operator==(const Rect& rhs) const
        { return (x == rhs.x && y == rhs.y && width == rhs.width && height == rhs.height); }
    bool operator!=(const Rect& rhs) const { return !this->operator==(rhs); }

    PicaPt x;
    PicaPt y;
    PicaPt width;
    PicaPt height;
};

/// Affine transform [a b c d tx ty], applied as
///   x' = a*x + c*y + tx,  y' = b*x + d*y + ty
struct Transform
{
    float a = 1.0f;
    float b = 0.0f;
    float c = 0.0f;
    float d = 1.0f;
    float tx = 0.0f;
    float ty = 0.0f;

    Transform() {}
    Transform(float a_, float b_, float c_, float d_, float tx_, float ty_)
        : a(a_), b(b_), c(c_), d(d_), tx(tx_), ty(ty_)
    {}

    static Transform translation(const PicaPt& dx, const PicaPt& dy);
    static Transform rotation(float degrees);
    static Transform scaling(float sx, float sy);
    static Transform skewing(float xDegrees, float yDegrees);

    Point apply(const Point& p) const;

    bool operator==(const Transform& rhs) const
        { return (a == rhs.a && b == rhs.b && c == rhs.c && d == rhs.d &&
                  tx == rhs.tx && ty == rhs.ty); }
};

//---------------------------------- Errors -----------------------------------
class Error : public std::runtime_error
{
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/// An operation needs a path or page that was never started.
class DrawingStateError : public Error
{
public:
    explicit DrawingStateError(const std::string& what) : Error(what) {}
};

class MissingDimensionError : public DrawingStateError
{
public:
    explicit MissingDimensionError(const std::string& what) : DrawingStateError(what) {}
};

class NoPageError : public DrawingStateError
{
public:
    explicit NoPageError(const std::string& what) : DrawingStateError(what) {}
};

class UnbalancedStateError : public Error
{
public:
    explicit UnbalancedStateError(const std::string& what) : Error(what) {}
};

class InvalidParameterError : public Error
{
public:
    explicit InvalidParameterError(const std::string& what) : Error(what) {}
};

class InvalidColorError : public InvalidParameterError
{
public:
    explicit InvalidColorError(const std::string& what) : InvalidParameterError(what) {}
};

class InvalidGradientError : public InvalidParameterError
{
public:
    explicit InvalidGradientError(const std::string& what) : InvalidParameterError(what) {}
};

class InvalidFontError : public InvalidParameterError
{
public:
    explicit InvalidFontError(const std::string& what) : InvalidParameterError(what) {}
};

/// A backend could not write its output.
class OutputError : public Error
{
public:
    explicit OutputError(const std::string& what) : Error(what) {}
};

//--------------------------------- Warnings ----------------------------------
enum WarningType { kWarnFontSubstitution = 0, kWarnMissingGlyph };

struct Warning
{
    WarningType type;
    std::string message;
};

/// Collects the non-fatal warnings of one script run. Each warning is kept
/// and also passed to the sink, which by default prints to std::cerr.
class WarningLog
{
public:
    using Sink = std::function<void(const Warning&)>;

    WarningLog();

    void warn(WarningType type, const std::string& message);

    const std::vector<Warning>& warnings() const { return mWarnings; }
    bool empty() const { return mWarnings.empty(); }
    size_t count(WarningType type) const;
    void clear() { mWarnings.clear(); }

    /// Passing nullptr silences the log (warnings are still recorded).
    void setSink(Sink sink) { mSink = sink; }

private:
    std::vector<Warning> mWarnings;
    Sink mSink;
};

//--------------------------------- Attr<T> -----------------------------------
/// A value that may be unset. Unlike a plain value, an unset Attr does not
/// mean "default", it means "not specified"; overrideWith() only copies set
/// values, which is how style overrides are merged.
template <typename T>
struct Attr
{
    T value;     // the value of the attribute, only valid if isSet is true
    bool isSet;  // true if the user specifically set it

    Attr() : value(T()), isSet(false) {}
    explicit Attr(const T& val) : value(val), isSet(true) {}

    Attr& operator=(const T& newVal) {
        value = newVal;
        isSet = true;
        return *this;
    }

    void overrideWith(const Attr& rhs) {
        if (rhs.isSet) {
            value = rhs.value;
            isSet = true;
        }
    }

    void reset() {
        value = T();
        isSet = false;
    }

    bool operator==(const Attr& rhs) const {
        return (isSet == rhs.isSet && (!isSet || value == rhs.value));
    }
    bool operator!=(const Attr& rhs) const { return !this->operator==(rhs); }
};

//---------------------------------- Colors -----------------------------------
class Color
{
public:
    /// Note that because these are static variable, they cannot be
    /// used to initialize other static variables, as they may not
    /// be constructed yet.
    static const Color kTransparent;
    static const Color kBlack;
    static const Color kWhite;
    static const Color kRed;
    static const Color kGreen;
    static const Color kBlue;

public:
    Color() {
        _rgba[0] = 0.0f;
        _rgba[1] = 0.0f;
        _rgba[2] = 0.0f;
        _rgba[3] = 0.0f;
    }

    /// Grey
    explicit Color(float grey) {
        _rgba[0] = grey;
        _rgba[1] = grey;
        _rgba[2] = grey;
        _rgba[3] = 1.0f;
    }

    /// Grey with alpha
    Color(float grey, float a) {
        _rgba[0] = grey;
        _rgba[1] = grey;
        _rgba[2] = grey;
        _rgba[3] = a;
    }

    Color(float r, float g, float b, float a = 1.0f) {
        _rgba[0] = r;
        _rgba[1] = g;
        _rgba[2] = b;
        _rgba[3] = a;
    }

    Color(const Color& rgb, float a) {
        _rgba[0] = rgb.red();
        _rgba[1] = rgb.green();
        _rgba[2] = rgb.blue();
        _rgba[3] = a;
    }

    /// Accepts 1 (grey), 2 (grey, alpha), 3 (rgb), or 4 (rgba) components;
    /// throws InvalidColorError otherwise.
    static Color fromComponents(const std::vector<float>& components);
    static std::vector<Color> fromList(const std::vector<std::vector<float>>& list);

    float red() const { return _rgba[0]; }
    float green() const { return _rgba[1]; }
    float blue() const { return _rgba[2]; }
    float alpha() const { return _rgba[3]; }
    const float* rgba() const { return _rgba; }

    void setAlpha(float a) { _rgba[3] = a; }

    uint32_t toRGBA() const {
        uint32_t rgba = (uint32_t(std::round(red() * 255.0f)) << 24) |
                        (uint32_t(std::round(green() * 255.0f)) << 16) |
                        (uint32_t(std::round(blue() * 255.0f)) << 8) |
                        (uint32_t(std::round(alpha() * 255.0f)));
        return rgba;
    }

    std::string toHexString() const;

    // This compares the stored values exactly, which is what state
    // comparisons want. It is not useful for comparing rendered colors.
    bool operator==(const Color& rhs) const {
        return (_rgba[0] == rhs._rgba[0] && _rgba[1] == rhs._rgba[1] &&
                _rgba[2] == rhs._rgba[2] && _rgba[3] == rhs._rgba[3]);
    }
    bool operator!=(const Color& rhs) const { return !this->operator==(rhs); }

private:
    float _rgba[4];
};

/// Device CMYK. The color is kept as given for output that supports it;
/// toRGB() is used for everything that composites on screen.
class CMYKColor
{
public:
    CMYKColor()
    {
        _cmyka[0] = 0.0f;
        _cmyka[1] = 0.0f;
        _cmyka[2] = 0.0f;
        _cmyka[3] = 0.0f;
        _cmyka[4] = 1.0f;
    }

    CMYKColor(float c, float m, float y, float k, float a = 1.0f)
    {
        _cmyka[0] = c;
        _cmyka[1] = m;
        _cmyka[2] = y;
        _cmyka[3] = k;
        _cmyka[4] = a;
    }

    /// Accepts 4 (cmyk) or 5 (cmyka) components.
    static CMYKColor fromComponents(const std::vector<float>& components);
    static std::vector<CMYKColor> fromList(const std::vector<std::vector<float>>& list);

    float cyan() const { return _cmyka[0]; }
    float magenta() const { return _cmyka[1]; }
    float yellow() const { return _cmyka[2]; }
    float black() const { return _cmyka[3]; }
    float alpha() const { return _cmyka[4]; }

    /// r = (1 - c)(1 - k), g = (1 - m)(1 - k), b = (1 - y)(1 - k)
    Color toRGB() const;

    bool operator==(const CMYKColor& rhs) const {
        for (int i = 0;  i < 5;  ++i) {
            if (_cmyka[i] != rhs._cmyka[i]) {
                return false;
            }
        }
        return true;
    }
    bool operator!=(const CMYKColor& rhs) const { return !this->operator==(rhs); }

private:
    float _cmyka[5];
};

//------------------------------ Paint attributes -----------------------------
enum GradientType { kGradientLinear = 0, kGradientRadial };

class Gradient
{
public:
    Gradient();
    /// `type` must be "linear" or "radial". If `positions` is empty the
    /// colors are spaced evenly from 0 to 1. Throws InvalidGradientError.
    Gradient(const std::string& type, const Point& start, const Point& end,
             const std::vector<Color>& colors,
             const std::vector<float>& positions = {},
             const PicaPt& startRadius = PicaPt::kZero,
             const PicaPt& endRadius = PicaPt::kZero);
    Gradient(GradientType type, const Point& start, const Point& end,
             const std::vector<Color>& colors,
             const std::vector<float>& positions = {},
             const PicaPt& startRadius = PicaPt::kZero,
             const PicaPt& endRadius = PicaPt::kZero);

    GradientType type() const { return mType; }
    const Point& start() const { return mStart; }
    const Point& end() const { return mEnd; }
    const std::vector<Color>& colors() const { return mColors; }
    const std::vector<float>& positions() const { return mPositions; }
    const PicaPt& startRadius() const { return mStartRadius; }
    const PicaPt& endRadius() const { return mEndRadius; }

    /// Parallel CMYK colors for print output. Must match colors() in length.
    const std::vector<CMYKColor>& cmykColors() const { return mCMYKColors; }
    void setCMYKColors(const std::vector<CMYKColor>& colors);

    bool operator==(const Gradient& rhs) const;
    bool operator!=(const Gradient& rhs) const { return !this->operator==(rhs); }

private:
    GradientType mType;
    Point mStart;
    Point mEnd;
    std::vector<Color> mColors;
    std::vector<float> mPositions;
    std::vector<CMYKColor> mCMYKColors;
    PicaPt mStartRadius;
    PicaPt mEndRadius;

    void init(const std::vector<float>& positions);
};

class Shadow
{
public:
    Shadow();
    Shadow(const Point& offset, const PicaPt& blur, const Color& color);

    const Point& offset() const { return mOffset; }
    const PicaPt& blur() const { return mBlur; }
    const Color& color() const { return mColor; }

    const Attr<CMYKColor>& cmykColor() const { return mCMYKColor; }
    void setCMYKColor(const CMYKColor& color);

    bool operator==(const Shadow& rhs) const;
    bool operator!=(const Shadow& rhs) const { return !this->operator==(rhs); }

private:
    Point mOffset;
    PicaPt mBlur;
    Color mColor;
    Attr<CMYKColor> mCMYKColor;
};

// Design note:
// Q: Why not use enum classes?
// A: We want to be able to export to straight C easily. For C++ they are still
//    in the $SD_NAMESPACE namespace so they aren't actually global.
enum JoinStyle { kJoinMiter = 0, kJoinRound = 1, kJoinBevel = 2 };
enum EndCapStyle { kEndCapButt = 0, kEndCapRound = 1, kEndCapSquare = 2 };

// Design note:
// Q: This is strange?
// A: Enums do not OR together well. This gives enum class syntax at the
//    call site, but also permits ORing. The tradeoff is that the type
//    information at the definition (int) is not very helpful.
struct Alignment {
    static const int kNone = 0;
    static const int kLeft = (1 << 0);
    static const int kHCenter = (1 << 1);
    static const int kRight = (1 << 2);
    static const int kJustify = (1 << 3);
    static const int kHorizMask = 0b00001111;

    /// "left", "center", "right", "justified"; "" is kLeft.
    /// Throws InvalidParameterError for anything else.
    static int fromName(const std::string& name);
    static std::string name(int alignment);
};

//---------------------------------- Fonts ------------------------------------
/// Maps OpenType feature tag (e.g. "liga", "smcp") -> enabled
typedef std::map<std::string, bool> OpenTypeFeatures;

/// Returns true if `tag` is in the table of features that are passed to the
/// shaper. Other tags are ignored.
bool isKnownOpenTypeFeature(const std::string& tag);
/// Returns the shaper feature string ("liga=0,smcp=1") for the known tags.
std::string openTypeFeatureSettings(const OpenTypeFeatures& features);

/// The font used when a font is not installed and no fallback is set.
extern const char *kDefaultFallbackFont;
extern const float kDefaultFontSize;

struct FontMetrics
{
    PicaPt ascent;
    PicaPt descent;    // positive
    PicaPt leading;
    PicaPt xHeight;
    PicaPt capHeight;
    PicaPt lineHeight;  // ascent + descent + leading
};

/// Answers questions about installed fonts.
class FontResolver
{
public:
    virtual ~FontResolver() {}

    virtual bool hasFont(const std::string& name) const = 0;
    /// Returns the glyph id, or -1 if the font has no glyph with that name.
    virtual long glyphForName(const std::string& fontName,
                              const std::string& glyphName) const = 0;
    virtual FontMetrics metrics(const std::string& fontName,
                                const PicaPt& pointSize) const = 0;
    virtual std::vector<std::string> openTypeFeatureTags(const std::string& fontName) const = 0;

    /// Returns the resolver for installed system fonts (Pango/HarfBuzz).
    static std::shared_ptr<FontResolver> platformResolver();
};

/// Returns `name` if installed, otherwise warns and returns the fallback
/// (or kDefaultFallbackFont if `fallback` is empty). Throws InvalidFontError
/// if the fallback is needed but is not installed either.
std::string resolveFontName(const FontResolver& fonts, WarningLog& warnings,
                            const std::string& name, const std::string& fallback);

/// The text style of a graphics state. There is no text here, only the
/// attributes that text drawn with this state gets.
class Text
{
public:
    Text();

    const std::string& fontName() const { return mFontName; }
    void setFontName(const std::string& name) { mFontName = name; }

    const std::string& fallbackFontName() const { return mFallbackFontName; }
    /// Throws InvalidFontError if `fonts` does not have the font.
    void setFallbackFontName(const std::string& name, const FontResolver& fonts);
    void clearFallbackFontName() { mFallbackFontName.clear(); }

    const PicaPt& fontSize() const { return mFontSize; }
    void setFontSize(const PicaPt& size) { mFontSize = size; }

    const Attr<PicaPt>& lineHeight() const { return mLineHeight; }
    void setLineHeight(const Attr<PicaPt>& h) { mLineHeight = h; }

    const Attr<PicaPt>& tracking() const { return mTracking; }
    void setTracking(const Attr<PicaPt>& t) { mTracking = t; }

    bool hyphenation() const { return mHyphenation; }
    void setHyphenation(bool on) { mHyphenation = on; }

    const OpenTypeFeatures& openTypeFeatures() const { return mFeatures; }
    void setOpenTypeFeatures(const OpenTypeFeatures& f) { mFeatures = f; }

    /// Returns the installed font to use. If the font is not installed,
    /// warns and also replaces fontName() with the substitute.
    std::string font(const FontResolver& fonts, WarningLog& warnings);

    bool operator==(const Text& rhs) const;
    bool operator!=(const Text& rhs) const { return !this->operator==(rhs); }

private:
    std::string mFontName;
    std::string mFallbackFontName;
    PicaPt mFontSize;
    Attr<PicaPt> mLineHeight;
    Attr<PicaPt> mTracking;
    bool mHyphenation = false;
    OpenTypeFeatures mFeatures;
};

//------------------------------ Formatted text -------------------------------
/// The full set of attributes of a span of formatted text. Fill and
/// cmykFill (and stroke and cmykStroke) are never both set.
struct TextStyle
{
    std::string font;           // "" is the default font
    std::string fallbackFont;
    PicaPt fontSize;
    Attr<Color> fill;
    Attr<CMYKColor> cmykFill;
    Attr<Color> stroke;
    Attr<CMYKColor> cmykStroke;
    PicaPt strokeWidth;
    int align = Alignment::kNone;
    Attr<PicaPt> lineHeight;
    Attr<PicaPt> tracking;
    OpenTypeFeatures openTypeFeatures;

    TextStyle();

    /// The RGB color to composite with (converting cmykFill if necessary)
    Attr<Color> effectiveFill() const;
    Attr<Color> effectiveStroke() const;

    bool operator==(const TextStyle& rhs) const;
    bool operator!=(const TextStyle& rhs) const { return !this->operator==(rhs); }
};

/// Attributes to change for one append(). Anything unset keeps the value of
/// the running style.
struct StyleOverrides
{
    Attr<std::string> font;
    Attr<std::string> fallbackFont;
    Attr<PicaPt> fontSize;
    Attr<Color> fill;
    Attr<CMYKColor> cmykFill;
    Attr<Color> stroke;
    Attr<CMYKColor> cmykStroke;
    Attr<PicaPt> strokeWidth;
    Attr<int> align;
    Attr<PicaPt> lineHeight;
    Attr<PicaPt> tracking;
    Attr<OpenTypeFeatures> openTypeFeatures;

    StyleOverrides& setFont(const std::string& f) { font = f; return *this; }
    StyleOverrides& setFallbackFont(const std::string& f) { fallbackFont = f; return *this; }
    StyleOverrides& setFontSize(const PicaPt& s) { fontSize = s; return *this; }
    StyleOverrides& setFill(const Color& c) { fill = c; return *this; }
    StyleOverrides& setCMYKFill(const CMYKColor& c) { cmykFill = c; return *this; }
    StyleOverrides& setStroke(const Color& c) { stroke = c; return *this; }
    StyleOverrides& setCMYKStroke(const CMYKColor& c) { cmykStroke = c; return *this; }
    StyleOverrides& setStrokeWidth(const PicaPt& w) { strokeWidth = w; return *this; }
    StyleOverrides& setAlign(int a) { align = a; return *this; }
    StyleOverrides& setLineHeight(const PicaPt& h) { lineHeight = h; return *this; }
    StyleOverrides& setTracking(const PicaPt& t) { tracking = t; return *this; }
    StyleOverrides& setOpenTypeFeatures(const OpenTypeFeatures& f) { openTypeFeatures = f; return *this; }
};

struct TextRun
{
    TextStyle style;   // style.font is the installed font actually used
    Attr<long> glyph;  // if set, the run is one placeholder drawn as this glyph

    int startIndex = 0;  // byte index into the UTF-8 text
    int length = 0;      // in bytes
};

/// Rich text built by appending. Each append freezes the running style onto
/// the appended span, so changing the style later only affects text
/// appended after the change. The text is UTF-8; run indices are bytes, but
/// the public indices (slice(), length(), insertText(), ...) are characters
/// (code points).
class FormattedString
{
public:
    explicit FormattedString(std::shared_ptr<FontResolver> fonts,
                             std::shared_ptr<WarningLog> warnings = nullptr);
    FormattedString(std::shared_ptr<FontResolver> fonts,
                    std::shared_ptr<WarningLog> warnings,
                    const std::string& utf8,
                    const StyleOverrides& style = StyleOverrides());

    void append(const std::string& utf8,
                const StyleOverrides& style = StyleOverrides());
    /// Appends the runs of `other` as they are.
    void append(const FormattedString& other);
    /// Appends one placeholder per glyph, drawn as the named glyph of the
    /// current font. Unknown glyph names are skipped with a warning.
    void appendGlyph(const std::vector<std::string>& glyphNames);

    FormattedString operator+(const std::string& utf8) const;
    FormattedString operator+(const FormattedString& other) const;
    FormattedString& operator+=(const std::string& utf8);
    FormattedString& operator+=(const FormattedString& other);

    /// Characters [start, stop). Negative indices count from the end and
    /// out-of-range indices are clamped.
    FormattedString slice(long start, long stop) const;
    FormattedString slice(long start) const;

    const std::string& text() const { return mText; }
    long length() const;
    bool empty() const { return mText.empty(); }

    const std::vector<TextRun>& runs() const { return mRuns; }
    /// The run containing character `index`.
    const TextRun& runAt(long index) const;

    /// Inserts text that takes the style of the character before `index`
    /// (or of the first character if `index` is 0).
    void insertText(long index, const std::string& utf8);
    void eraseText(long index, long nChars);

    // Running style; these affect text appended afterwards.
    const TextStyle& currentStyle() const { return mStyle; }
    void font(const std::string& name);
    void font(const std::string& name, const PicaPt& size);
    /// Throws InvalidFontError if the font is not installed.
    void fallbackFont(const std::string& name);
    void fontSize(const PicaPt& size);
    void fill(const Color& color);
    void fill(std::nullptr_t);
    void cmykFill(const CMYKColor& color);
    void cmykFill(std::nullptr_t);
    void stroke(const Color& color);
    void stroke(std::nullptr_t);
    void cmykStroke(const CMYKColor& color);
    void cmykStroke(std::nullptr_t);
    void strokeWidth(const PicaPt& width);
    void align(int alignment);
    void lineHeight(const PicaPt& height);
    void lineHeight(std::nullptr_t);
    void tracking(const PicaPt& tracking);
    void tracking(std::nullptr_t);
    void openTypeFeatures(const OpenTypeFeatures& features, bool resetFeatures = false);

    /// Feature tags of `fontName`, or of the current font if empty.
    std::vector<std::string> listOpenTypeFeatures(const std::string& fontName = "") const;

    FontMetrics fontMetrics() const;
    PicaPt fontAscender() const { return fontMetrics().ascent; }
    PicaPt fontDescender() const { return -fontMetrics().descent; }
    PicaPt fontXHeight() const { return fontMetrics().xHeight; }
    PicaPt fontCapHeight() const { return fontMetrics().capHeight; }
    PicaPt fontLeading() const { return fontMetrics().leading; }
    /// The line height if set, otherwise the font's natural line height.
    PicaPt fontLineHeight() const;

    const std::shared_ptr<FontResolver>& fonts() const { return mFonts; }
    const std::shared_ptr<WarningLog>& warnings() const { return mWarnings; }

    /// Compares text and runs, not the running style.
    bool operator==(const FormattedString& rhs) const;
    bool operator!=(const FormattedString& rhs) const { return !this->operator==(rhs); }

private:
    std::shared_ptr<FontResolver> mFonts;
    std::shared_ptr<WarningLog> mWarnings;
    std::string mText;
    std::vector<TextRun> mRuns;
    TextStyle mStyle;

    std::string resolvedFont() const;
    void appendRun(const std::string& utf8, const TextStyle& style);
    int runIndexForByte(int byteIndex) const;
};

//----------------------------------- Paths -----------------------------------
class Typesetter;

class BezierPath
{
public:
    enum Action { kMoveTo = 0, kLineTo, kCurveTo, kClosePath };

    struct Element
    {
        Action action;
        std::vector<Point> points;  // 1 for move/line, 3 for curve, 0 for close

        bool operator==(const Element& rhs) const
            { return (action == rhs.action && points == rhs.points); }
        bool operator!=(const Element& rhs) const { return !this->operator==(rhs); }
    };

    /// A contour is the point lists of the elements of one subpath.
    typedef std::vector<std::vector<Point>> Contour;

    BezierPath();
    BezierPath(const BezierPath& p);
    BezierPath& operator=(const BezierPath& rhs);
    ~BezierPath();

    void moveTo(const Point& p);
    /// lineTo(), curveTo(), arcTo(), and closePath() throw DrawingStateError
    /// if there is no current point.
    void lineTo(const Point& end);
    void curveTo(const Point& cp1, const Point& cp2, const Point& end);
    /// Draws a line to the tangent point on the line from the current point
    /// to p1, and then an arc of `radius` tangent to both (current, p1)
    /// and (p1, p2).
    void arcTo(const Point& p1, const Point& p2, const PicaPt& radius);
    void closePath();

    void rect(const Rect& r);
    void oval(const Rect& r);

    /// Appends the outlines of the glyphs. The baseline of the last line is
    /// at `offset`.
    void text(const FormattedString& txt, const Typesetter& typesetter,
              const Point& offset);
    /// Appends the outlines of the glyphs, wrapped within `box`.
    void text(const FormattedString& txt, const Typesetter& typesetter,
              const Rect& box);

    void appendPath(const BezierPath& path);

    bool isEmpty() const;
    bool hasCurrentPoint() const;
    const std::vector<Element>& elements() const;

    std::vector<Point> points() const;
    std::vector<Point> onCurvePoints() const;
    std::vector<Point> offCurvePoints() const;
    std::vector<Contour> contours() const;

    /// Returns false if the path is empty; the bounds of a curve include
    /// its extrema but not its control points.
    bool bounds(Rect *r) const;
    /// Like bounds(), but includes off-curve control points.
    bool controlPointBounds(Rect *r) const;

    /// Non-zero winding rule
    bool pointInside(const Point& p) const;

    /// Removes a trailing moveTo that has no segments.
    void optimize();
    BezierPath copy() const { return *this; }

    bool operator==(const BezierPath& rhs) const;
    bool operator!=(const BezierPath& rhs) const { return !this->operator==(rhs); }

    struct Impl;
private:
    std::unique_ptr<Impl> mImpl;
};

//------------------------------- Text layout ---------------------------------
/// Lays out formatted text. Units are PicaPt throughout.
class Typesetter
{
public:
    virtual ~Typesetter() {}

    /// The size of the text laid out without wrapping.
    virtual Size measure(const FormattedString& text) const = 0;

    /// Returns the number of characters starting at `start` that make up
    /// the line that a box `width` wide would break at. Returns 0 if
    /// `start` is at or past the end of the text.
    virtual long suggestLineBreak(const FormattedString& text, long start,
                                  const PicaPt& width) const = 0;

    /// The height of a line starting at character `index`
    virtual PicaPt lineHeight(const FormattedString& text, long index) const = 0;

    /// The number of characters that are visible when the text is laid out
    /// in `box`. The default implementation breaks lines with
    /// suggestLineBreak() and stacks lines until they no longer fit.
    virtual long visibleLength(const FormattedString& text, const Size& box) const;

    /// Appends the glyph outlines to `path`. If box.width is zero the text
    /// is not wrapped and the baseline of the last line is at `origin`;
    /// otherwise the text wraps at box.width and the top of the first line
    /// is at `origin`. `origin` is in page (y-up) coordinates.
    virtual void appendOutlines(BezierPath *path, const FormattedString& text,
                                const Point& origin, const Size& box) const = 0;

    static std::shared_ptr<Typesetter> platformTypesetter(std::shared_ptr<FontResolver> fonts);
};

/// Finds hyphenation points of single words.
class Hyphenator
{
public:
    virtual ~Hyphenator() {}

    /// Returns the character offsets (ascending) within `word` at which a
    /// hyphen may be inserted.
    virtual std::vector<long> hyphenationPoints(const std::u32string& word) const = 0;

    /// Rule-based English hyphenation.
    static std::shared_ptr<Hyphenator> createDefault();
};

//------------------------------ Graphics state -------------------------------
struct GraphicsState
{
    Attr<Color> fillColor;
    Attr<CMYKColor> cmykFillColor;
    Attr<Color> strokeColor;
    Attr<CMYKColor> cmykStrokeColor;
    Attr<Shadow> shadow;
    Attr<Gradient> gradient;
    PicaPt strokeWidth;
    Attr<std::vector<PicaPt>> lineDash;
    Attr<EndCapStyle> lineCap;
    Attr<JoinStyle> lineJoin;
    float miterLimit;
    Text text;
    std::shared_ptr<BezierPath> path;  // nullptr if there is no current path

    GraphicsState();
    /// Copies deeply: the copy does not share the path.
    GraphicsState(const GraphicsState& s);
    GraphicsState& operator=(const GraphicsState& rhs);

    /// The RGB color to composite with (converting CMYK if necessary)
    Attr<Color> effectiveFillColor() const;
    Attr<Color> effectiveStrokeColor() const;

    bool operator==(const GraphicsState& rhs) const;
    bool operator!=(const GraphicsState& rhs) const { return !this->operator==(rhs); }
};

//--------------------------------- Backends ----------------------------------
/// The primitive operations of an output target. The DrawContext keeps all
/// the state; backends only render it.
class RenderBackend
{
public:
    virtual ~RenderBackend() {}

    virtual void newPage(const PicaPt& width, const PicaPt& height) = 0;
    virtual void save() = 0;
    virtual void restore() = 0;
    /// Renders state.path (if any) with the paint attributes of `state`.
    virtual void drawPath(const GraphicsState& state) = 0;
    /// Intersects the clip with state.path.
    virtual void clipPath(const GraphicsState& state) = 0;
    virtual void transform(const Transform& matrix) = 0;
    virtual void renderTextBox(const FormattedString& text, const Rect& box,
                               int alignment) = 0;
    virtual void renderImage(const std::string& path, const Point& position,
                             float alpha) = 0;
    virtual void setFrameDuration(float seconds) = 0;
    virtual void saveImage(const std::string& path, bool multipage) = 0;
    virtual void printImage(const std::string& documentPath) = 0;
    virtual void reset() = 0;

    virtual int pageCount() const = 0;
    /// Returns the native page (a cairo_surface_t* for the Cairo backends),
    /// or nullptr if the backend does not keep pages.
    virtual void* nativePage(int index) const = 0;

    /// Writes one line per call to `out` (which must outlive the backend).
    static std::shared_ptr<RenderBackend> createPrintBackend(std::ostream& out);
    /// Pages are rasterized at `dpi` when saved. printImage("") writes
    /// PostScript to `printStream`, which must outlive the backend.
    static std::shared_ptr<RenderBackend> createCairoPreviewBackend(float dpi = 72.0f,
                                                                    std::ostream *printStream = nullptr);
    static std::shared_ptr<RenderBackend> createCairoPDFBackend(std::ostream *printStream = nullptr);
};

//-------------------------------- DrawContext --------------------------------
/// The drawing surface of a script. Keeps the graphics state (and the stack
/// of saved states), builds paths and text, and forwards everything that
/// renders to the backend.
/// Coordinates have the origin in the lower left of the page, +y is up.
class DrawContext
{
public:
    DrawContext(std::shared_ptr<RenderBackend> backend,
                std::shared_ptr<FontResolver> fonts,
                std::shared_ptr<Typesetter> typesetter,
                std::shared_ptr<Hyphenator> hyphenator = nullptr);
    virtual ~DrawContext();

    static std::shared_ptr<DrawContext> createPreview(float dpi = 72.0f);
    static std::shared_ptr<DrawContext> createPDF();
    static std::shared_ptr<DrawContext> createPrint(std::ostream& out);

    RenderBackend& backend() const { return *mBackend; }
    const std::shared_ptr<FontResolver>& fonts() const { return mFonts; }
    const Typesetter& typesetter() const { return *mTypesetter; }
    WarningLog& warnings() const { return *mWarnings; }
    const std::shared_ptr<WarningLog>& warningLog() const { return mWarnings; }

    const GraphicsState& state() const { return mStateStack.back(); }
    /// Number of save()s without a matching restore()
    size_t stackDepth() const { return mStateStack.size() - 1; }

    /// Fresh state, no page, no size.
    void reset();

    // ----- pages -----
    void size(const PicaPt& width, const PicaPt& height);
    void setWidth(const PicaPt& width) { mWidth = width; }
    void setHeight(const PicaPt& height) { mHeight = height; }
    const Attr<PicaPt>& width() const { return mWidth; }
    const Attr<PicaPt>& height() const { return mHeight; }

    /// Throws MissingDimensionError if no size has been set.
    void newPage();
    void newPage(const PicaPt& width, const PicaPt& height);
    bool hasPage() const { return mHasPage; }
    void frameDuration(float seconds);
    /// Throws NoPageError if no page has been started.
    void saveImage(const std::string& path, bool multipage = false);
    void printImage(const std::string& documentPath = "");

    // ----- state stack -----
    void save();
    /// Throws UnbalancedStateError if there is no matching save().
    void restore();

    // ----- paths -----
    void rect(const Rect& r);
    void oval(const Rect& r);

    void newPath();
    /// These throw DrawingStateError if newPath() has not been called.
    void moveTo(const Point& p);
    void lineTo(const Point& p);
    void curveTo(const Point& cp1, const Point& cp2, const Point& end);
    void arcTo(const Point& p1, const Point& p2, const PicaPt& radius);
    void closePath();

    void drawPath();
    /// Replaces the current path with `path` and draws it.
    void drawPath(const BezierPath& path);
    void clipPath();
    void clipPath(const BezierPath& path);

    // ----- paint -----
    void fill(const Color& color);
    void fill(std::nullptr_t);
    void stroke(const Color& color);
    void stroke(std::nullptr_t);
    void cmykFill(const CMYKColor& color);
    void cmykFill(std::nullptr_t);
    void cmykStroke(const CMYKColor& color);
    void cmykStroke(std::nullptr_t);

    void shadow(const Point& offset, const PicaPt& blur, const Color& color);
    void shadow(std::nullptr_t);
    void cmykShadow(const Point& offset, const PicaPt& blur, const CMYKColor& color);

    void linearGradient(const Point& start, const Point& end,
                        const std::vector<Color>& colors,
                        const std::vector<float>& positions = {});
    /// Clears the gradient and resets the fill to black.
    void linearGradient(std::nullptr_t);
    void cmykLinearGradient(const Point& start, const Point& end,
                            const std::vector<CMYKColor>& colors,
                            const std::vector<float>& positions = {});
    void radialGradient(const Point& start, const Point& end,
                        const std::vector<Color>& colors,
                        const std::vector<float>& positions = {},
                        const PicaPt& startRadius = PicaPt(0.0f),
                        const PicaPt& endRadius = PicaPt(100.0f));
    void radialGradient(std::nullptr_t);
    void cmykRadialGradient(const Point& start, const Point& end,
                            const std::vector<CMYKColor>& colors,
                            const std::vector<float>& positions = {},
                            const PicaPt& startRadius = PicaPt(0.0f),
                            const PicaPt& endRadius = PicaPt(100.0f));

    void strokeWidth(const PicaPt& width);
    void miterLimit(float limit);
    /// "miter", "round", or "bevel"; throws InvalidParameterError otherwise
    void lineJoin(const std::string& join);
    void lineJoin(std::nullptr_t);
    /// "butt", "square", or "round"; throws InvalidParameterError otherwise
    void lineCap(const std::string& cap);
    void lineCap(std::nullptr_t);
    /// An empty pattern turns dashing off.
    void lineDash(const std::vector<PicaPt>& pattern);
    void lineDash(std::nullptr_t);

    // ----- transforms -----
    void transform(const Transform& matrix);
    void translate(const PicaPt& dx, const PicaPt& dy);
    void rotate(float degrees);
    void scale(float sx, float sy);
    void skew(float xDegrees, float yDegrees = 0.0f);

    // ----- text -----
    void font(const std::string& name);
    void font(const std::string& name, const PicaPt& size);
    /// Throws InvalidFontError if the font is not installed.
    void fallbackFont(const std::string& name);
    void fontSize(const PicaPt& size);
    void lineHeight(const PicaPt& height);
    void lineHeight(std::nullptr_t);
    void tracking(const PicaPt& tracking);
    void tracking(std::nullptr_t);
    void hyphenation(bool on);
    void openTypeFeatures(const OpenTypeFeatures& features, bool resetFeatures = false);
    std::vector<std::string> listOpenTypeFeatures(const std::string& fontName = "");
    FontMetrics fontMetrics();

    /// An empty FormattedString sharing this context's fonts and warnings.
    FormattedString formattedString(const std::string& utf8 = "",
                                    const StyleOverrides& style = StyleOverrides()) const;
    /// Builds a single run from the current text style and paint.
    FormattedString attributedString(const std::string& txt,
                                     int alignment = Alignment::kNone);
    /// Returns `txt` as is; its runs already have their styles.
    FormattedString attributedString(const FormattedString& txt,
                                     int alignment = Alignment::kNone);
    FormattedString hyphenateAttributedString(const FormattedString& txt,
                                              const PicaPt& width) const;

    /// Returns the part of the text that does not fit in `box`.
    std::string clippedText(const std::string& txt, const Rect& box,
                            int alignment = Alignment::kLeft);
    FormattedString clippedText(const FormattedString& txt, const Rect& box,
                                int alignment = Alignment::kLeft);

    Size textSize(const std::string& txt, int alignment = Alignment::kLeft);
    Size textSize(const FormattedString& txt, int alignment = Alignment::kLeft);

    void textBox(const std::string& txt, const Rect& box,
                 int alignment = Alignment::kLeft);
    void textBox(const FormattedString& txt, const Rect& box,
                 int alignment = Alignment::kLeft);

    /// The backend reports images that cannot be read.
    void image(const std::string& path, const Point& position, float alpha = 1.0f);

protected:
    std::shared_ptr<RenderBackend> mBackend;
    std::shared_ptr<FontResolver> mFonts;
    std::shared_ptr<Typesetter> mTypesetter;
    std::shared_ptr<Hyphenator> mHyphenator;
    std::shared_ptr<WarningLog> mWarnings;

    std::vector<GraphicsState> mStateStack;  // back() is the current state
    Attr<PicaPt> mWidth;
    Attr<PicaPt> mHeight;
    bool mHasPage = false;

    GraphicsState& currentState() { return mStateStack.back(); }
    BezierPath& currentPath();
    void startPage(const Attr<PicaPt>& width, const Attr<PicaPt>& height);
    FormattedString textForBox(const FormattedString& txt, const Rect& box, int alignment);
    long clippedLength(const FormattedString& txt, const Rect& box, int alignment);
};

} // namespace $SD_NAMESPACE
#endif // _SCRIPT_DRAW_H
