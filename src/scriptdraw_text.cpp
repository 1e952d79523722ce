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

#include <algorithm>
#include <set>

namespace SD_NAMESPACE {

#if defined(__APPLE__)
const char *kDefaultFallbackFont = "LucidaGrande";
#else
const char *kDefaultFallbackFont = "DejaVu Sans";
#endif
const float kDefaultFontSize = 10.0f;

namespace {

// Tags the shaper is given; anything else in a feature map is ignored.
static const std::set<std::string> gKnownFeatures = {
    "aalt", "afrc", "c2pc", "c2sc", "calt", "case", "clig", "cpsp", "cswh",
    "dlig", "dnom", "frac", "hist", "hlig", "kern", "liga", "lnum", "mgrk",
    "nalt", "numr", "onum", "ordn", "ornm", "pcap", "pnum", "salt", "sinf",
    "smcp", "ss01", "ss02", "ss03", "ss04", "ss05", "ss06", "ss07", "ss08",
    "ss09", "ss10", "ss11", "ss12", "ss13", "ss14", "ss15", "ss16", "ss17",
    "ss18", "ss19", "ss20", "subs", "sups", "swsh", "titl", "tnum", "unic",
    "zero"
};

std::string formatMessage(const char *fmt, const std::string& a, const std::string& b)
{
    // Only two "%s" substitutions are ever needed
    std::string msg = fmt;
    auto pos = msg.find("%s");
    if (pos != std::string::npos) {
        msg.replace(pos, 2, a);
        pos = msg.find("%s", pos + a.size());
        if (pos != std::string::npos) {
            msg.replace(pos, 2, b);
        }
    }
    return msg;
}

void warnFontSubstitution(WarningLog& warnings, const std::string& name,
                          const std::string& fallback)
{
    warnings.warn(kWarnFontSubstitution,
                  formatMessage("font: %s is not installed, back to the fallback font: %s",
                                name, fallback));
}

bool runsEqual(const TextRun& a, const TextRun& b)
{
    return (a.style == b.style && a.glyph == b.glyph &&
            a.startIndex == b.startIndex && a.length == b.length);
}

long clampIndex(long idx, long n)
{
    if (idx < 0) {
        idx += n;
    }
    return std::max(0L, std::min(n, idx));
}

} // namespace

bool isKnownOpenTypeFeature(const std::string& tag)
{
    return (gKnownFeatures.find(tag) != gKnownFeatures.end());
}

std::string openTypeFeatureSettings(const OpenTypeFeatures& features)
{
    std::string settings;
    for (auto &kv : features) {
        if (!isKnownOpenTypeFeature(kv.first)) {
            continue;
        }
        if (!settings.empty()) {
            settings += ",";
        }
        settings += kv.first + (kv.second ? "=1" : "=0");
    }
    return settings;
}

std::string resolveFontName(const FontResolver& fonts, WarningLog& warnings,
                            const std::string& name, const std::string& fallback)
{
    if (!name.empty() && fonts.hasFont(name)) {
        return name;
    }
    std::string ff = (fallback.empty() ? std::string(kDefaultFallbackFont) : fallback);
    if (!fallback.empty() && !fonts.hasFont(fallback)) {
        throw InvalidFontError("Fallback font '" + fallback + "' is not available");
    }
    if (!name.empty()) {
        warnFontSubstitution(warnings, name, ff);
    }
    return ff;
}

//-----------------------------------------------------------------------------
Text::Text()
    : mFontName(kDefaultFallbackFont), mFontSize(kDefaultFontSize)
{
}

void Text::setFallbackFontName(const std::string& name, const FontResolver& fonts)
{
    if (!name.empty() && !fonts.hasFont(name)) {
        throw InvalidFontError("Fallback font '" + name + "' is not available");
    }
    mFallbackFontName = name;
}

std::string Text::font(const FontResolver& fonts, WarningLog& warnings)
{
    auto name = resolveFontName(fonts, warnings, mFontName, mFallbackFontName);
    mFontName = name;
    return name;
}

bool Text::operator==(const Text& rhs) const
{
    return (mFontName == rhs.mFontName &&
            mFallbackFontName == rhs.mFallbackFontName &&
            mFontSize == rhs.mFontSize &&
            mLineHeight == rhs.mLineHeight &&
            mTracking == rhs.mTracking &&
            mHyphenation == rhs.mHyphenation &&
            mFeatures == rhs.mFeatures);
}

//-----------------------------------------------------------------------------
TextStyle::TextStyle()
    : fontSize(kDefaultFontSize)
    , fill(Color(0.0f, 0.0f, 0.0f, 1.0f))
    , strokeWidth(1.0f)
{
}

Attr<Color> TextStyle::effectiveFill() const
{
    if (fill.isSet) {
        return fill;
    } else if (cmykFill.isSet) {
        return Attr<Color>(cmykFill.value.toRGB());
    }
    return Attr<Color>();
}

Attr<Color> TextStyle::effectiveStroke() const
{
    if (stroke.isSet) {
        return stroke;
    } else if (cmykStroke.isSet) {
        return Attr<Color>(cmykStroke.value.toRGB());
    }
    return Attr<Color>();
}

bool TextStyle::operator==(const TextStyle& rhs) const
{
    return (font == rhs.font && fallbackFont == rhs.fallbackFont &&
            fontSize == rhs.fontSize && fill == rhs.fill &&
            cmykFill == rhs.cmykFill && stroke == rhs.stroke &&
            cmykStroke == rhs.cmykStroke && strokeWidth == rhs.strokeWidth &&
            align == rhs.align && lineHeight == rhs.lineHeight &&
            tracking == rhs.tracking && openTypeFeatures == rhs.openTypeFeatures);
}

//-----------------------------------------------------------------------------
FormattedString::FormattedString(std::shared_ptr<FontResolver> fonts,
                                 std::shared_ptr<WarningLog> warnings /*= nullptr*/)
    : mFonts(fonts)
    , mWarnings(warnings ? warnings : std::make_shared<WarningLog>())
{
}

FormattedString::FormattedString(std::shared_ptr<FontResolver> fonts,
                                 std::shared_ptr<WarningLog> warnings,
                                 const std::string& utf8,
                                 const StyleOverrides& style /*= StyleOverrides()*/)
    : FormattedString(fonts, warnings)
{
    append(utf8, style);
}

std::string FormattedString::resolvedFont() const
{
    if (mStyle.font.empty()) {
        return kDefaultFallbackFont;
    }
    return resolveFontName(*mFonts, *mWarnings, mStyle.font, mStyle.fallbackFont);
}

void FormattedString::appendRun(const std::string& utf8, const TextStyle& style)
{
    TextRun run;
    run.style = style;
    run.startIndex = int(mText.size());
    run.length = int(utf8.size());
    mText += utf8;
    mRuns.push_back(run);
}

void FormattedString::append(const std::string& utf8,
                             const StyleOverrides& style /*= StyleOverrides()*/)
{
    // The overrides become the running style
    if (style.font.isSet) { mStyle.font = style.font.value; }
    if (style.fallbackFont.isSet) { mStyle.fallbackFont = style.fallbackFont.value; }
    if (style.fontSize.isSet) { mStyle.fontSize = style.fontSize.value; }
    if (style.fill.isSet) {
        mStyle.fill = style.fill.value;
        mStyle.cmykFill.reset();
    } else if (style.cmykFill.isSet) {
        mStyle.cmykFill = style.cmykFill.value;
        mStyle.fill.reset();
    }
    if (style.stroke.isSet) {
        mStyle.stroke = style.stroke.value;
        mStyle.cmykStroke.reset();
    } else if (style.cmykStroke.isSet) {
        mStyle.cmykStroke = style.cmykStroke.value;
        mStyle.stroke.reset();
    }
    if (style.strokeWidth.isSet) { mStyle.strokeWidth = style.strokeWidth.value; }
    if (style.align.isSet) { mStyle.align = style.align.value; }
    mStyle.lineHeight.overrideWith(style.lineHeight);
    mStyle.tracking.overrideWith(style.tracking);
    if (style.openTypeFeatures.isSet) {
        mStyle.openTypeFeatures = style.openTypeFeatures.value;
    }

    if (utf8.empty()) {
        return;
    }
    TextStyle runStyle = mStyle;
    runStyle.font = resolvedFont();
    appendRun(utf8, runStyle);
}

void FormattedString::append(const FormattedString& other)
{
    int offset = int(mText.size());
    mText += other.mText;
    for (auto run : other.mRuns) {
        run.startIndex += offset;
        mRuns.push_back(run);
    }
}

void FormattedString::appendGlyph(const std::vector<std::string>& glyphNames)
{
    std::string fontName;
    if (!mStyle.font.empty() && mFonts->hasFont(mStyle.font)) {
        fontName = mStyle.font;
    } else {
        fontName = kDefaultFallbackFont;
        if (!mStyle.font.empty()) {
            warnFontSubstitution(*mWarnings, mStyle.font, fontName);
        }
    }

    // The glyph must come from this font, so the fallback is not used.
    TextStyle glyphStyle = mStyle;
    glyphStyle.font = fontName;
    glyphStyle.fallbackFont.clear();

    std::string placeholder = utf8FromCodePoint(kNoBreakSpace);
    for (auto &name : glyphNames) {
        long glyph = mFonts->glyphForName(fontName, name);
        if (glyph > 0) {
            appendRun(placeholder, glyphStyle);
            mRuns.back().glyph = glyph;
        } else {
            mWarnings->warn(kWarnMissingGlyph,
                            formatMessage("font %s has no glyph with the name %s",
                                          fontName, name));
        }
    }
}

FormattedString FormattedString::operator+(const std::string& utf8) const
{
    FormattedString s(*this);
    s.append(utf8);
    return s;
}

FormattedString FormattedString::operator+(const FormattedString& other) const
{
    FormattedString s(*this);
    s.append(other);
    return s;
}

FormattedString& FormattedString::operator+=(const std::string& utf8)
{
    append(utf8);
    return *this;
}

FormattedString& FormattedString::operator+=(const FormattedString& other)
{
    append(other);
    return *this;
}

long FormattedString::length() const
{
    long n = 0;
    for (auto c : mText) {
        if ((c & 0b11000000) != 0b10000000) {
            ++n;
        }
    }
    return n;
}

FormattedString FormattedString::slice(long start, long stop) const
{
    auto indices = utf8IndicesForCharIndices(mText);
    long n = long(indices.size()) - 1;
    start = clampIndex(start, n);
    stop = std::max(start, clampIndex(stop, n));
    int b0 = indices[start];
    int b1 = indices[stop];

    FormattedString s(mFonts, mWarnings);
    s.mStyle = mStyle;
    s.mText = mText.substr(size_t(b0), size_t(b1 - b0));
    for (auto &run : mRuns) {
        int runStart = std::max(b0, run.startIndex);
        int runEnd = std::min(b1, run.startIndex + run.length);
        if (runEnd > runStart) {
            TextRun r = run;
            r.startIndex = runStart - b0;
            r.length = runEnd - runStart;
            s.mRuns.push_back(r);
        }
    }
    return s;
}

FormattedString FormattedString::slice(long start) const
{
    return slice(start, length());
}

int FormattedString::runIndexForByte(int byteIndex) const
{
    for (size_t i = 0;  i < mRuns.size();  ++i) {
        if (byteIndex >= mRuns[i].startIndex &&
            byteIndex < mRuns[i].startIndex + mRuns[i].length) {
            return int(i);
        }
    }
    return -1;
}

const TextRun& FormattedString::runAt(long index) const
{
    auto indices = utf8IndicesForCharIndices(mText);
    if (index < 0 || index >= long(indices.size()) - 1) {
        throw InvalidParameterError("character index " + std::to_string(index) + " is out of range");
    }
    int runIdx = runIndexForByte(indices[index]);
    if (runIdx < 0) {
        throw InvalidParameterError("character index " + std::to_string(index) + " has no run");
    }
    return mRuns[runIdx];
}

void FormattedString::insertText(long index, const std::string& utf8)
{
    if (mRuns.empty()) {
        append(utf8);
        return;
    }
    if (utf8.empty()) {
        return;
    }

    auto indices = utf8IndicesForCharIndices(mText);
    long n = long(indices.size()) - 1;
    index = std::max(0L, std::min(n, index));
    int byteIdx = indices[index];
    int styleByte = (index > 0 ? indices[index - 1] : 0);
    int runIdx = runIndexForByte(styleByte);
    if (runIdx < 0) {
        runIdx = (index > 0 ? int(mRuns.size()) - 1 : 0);
    }
    int nBytes = int(utf8.size());

    mText.insert(size_t(byteIdx), utf8);
    // A glyph run is a single placeholder, so text inserted next to it gets
    // a run of its own in the same style.
    if (mRuns[runIdx].glyph.isSet) {
        TextRun run;
        run.style = mRuns[runIdx].style;
        run.startIndex = byteIdx;
        run.length = nBytes;
        int insertAt = (index > 0 ? runIdx + 1 : runIdx);
        for (size_t i = size_t(insertAt);  i < mRuns.size();  ++i) {
            mRuns[i].startIndex += nBytes;
        }
        mRuns.insert(mRuns.begin() + insertAt, run);
    } else {
        mRuns[runIdx].length += nBytes;
        for (size_t i = size_t(runIdx) + 1;  i < mRuns.size();  ++i) {
            mRuns[i].startIndex += nBytes;
        }
    }
}

void FormattedString::eraseText(long index, long nChars)
{
    auto indices = utf8IndicesForCharIndices(mText);
    long n = long(indices.size()) - 1;
    index = std::max(0L, std::min(n, index));
    long end = std::max(index, std::min(n, index + nChars));
    int b0 = indices[index];
    int b1 = indices[end];
    int nRemoved = b1 - b0;
    if (nRemoved <= 0) {
        return;
    }

    mText.erase(size_t(b0), size_t(nRemoved));
    std::vector<TextRun> runs;
    runs.reserve(mRuns.size());
    for (auto run : mRuns) {
        int s = run.startIndex;
        int e = s + run.length;
        int newStart = (s < b0 ? s : std::max(b0, s - nRemoved));
        int newEnd = (e <= b0 ? e : std::max(b0, e - nRemoved));
        if (newEnd > newStart) {
            run.startIndex = newStart;
            run.length = newEnd - newStart;
            runs.push_back(run);
        }
    }
    mRuns.swap(runs);
}

void FormattedString::font(const std::string& name) { mStyle.font = name; }

void FormattedString::font(const std::string& name, const PicaPt& size)
{
    mStyle.font = name;
    mStyle.fontSize = size;
}

void FormattedString::fallbackFont(const std::string& name)
{
    if (!name.empty() && !mFonts->hasFont(name)) {
        throw InvalidFontError("Fallback font '" + name + "' is not available");
    }
    mStyle.fallbackFont = name;
}

void FormattedString::fontSize(const PicaPt& size) { mStyle.fontSize = size; }

void FormattedString::fill(const Color& color)
{
    mStyle.fill = color;
    mStyle.cmykFill.reset();
}

void FormattedString::fill(std::nullptr_t)
{
    mStyle.fill.reset();
    mStyle.cmykFill.reset();
}

void FormattedString::cmykFill(const CMYKColor& color)
{
    mStyle.cmykFill = color;
    mStyle.fill.reset();
}

void FormattedString::cmykFill(std::nullptr_t) { fill(nullptr); }

void FormattedString::stroke(const Color& color)
{
    mStyle.stroke = color;
    mStyle.cmykStroke.reset();
}

void FormattedString::stroke(std::nullptr_t)
{
    mStyle.stroke.reset();
    mStyle.cmykStroke.reset();
}

void FormattedString::cmykStroke(const CMYKColor& color)
{
    mStyle.cmykStroke = color;
    mStyle.stroke.reset();
}

void FormattedString::cmykStroke(std::nullptr_t) { stroke(nullptr); }

void FormattedString::strokeWidth(const PicaPt& width) { mStyle.strokeWidth = width; }

void FormattedString::align(int alignment) { mStyle.align = alignment; }

void FormattedString::lineHeight(const PicaPt& height) { mStyle.lineHeight = height; }

void FormattedString::lineHeight(std::nullptr_t) { mStyle.lineHeight.reset(); }

void FormattedString::tracking(const PicaPt& tracking) { mStyle.tracking = tracking; }

void FormattedString::tracking(std::nullptr_t) { mStyle.tracking.reset(); }

void FormattedString::openTypeFeatures(const OpenTypeFeatures& features,
                                       bool resetFeatures /*= false*/)
{
    if (resetFeatures) {
        mStyle.openTypeFeatures.clear();
    }
    for (auto &kv : features) {
        mStyle.openTypeFeatures[kv.first] = kv.second;
    }
}

std::vector<std::string> FormattedString::listOpenTypeFeatures(const std::string& fontName /*= ""*/) const
{
    return mFonts->openTypeFeatureTags(fontName.empty() ? resolvedFont() : fontName);
}

FontMetrics FormattedString::fontMetrics() const
{
    return mFonts->metrics(resolvedFont(), mStyle.fontSize);
}

PicaPt FormattedString::fontLineHeight() const
{
    if (mStyle.lineHeight.isSet) {
        return mStyle.lineHeight.value;
    }
    return fontMetrics().lineHeight;
}

bool FormattedString::operator==(const FormattedString& rhs) const
{
    if (mText != rhs.mText || mRuns.size() != rhs.mRuns.size()) {
        return false;
    }
    for (size_t i = 0;  i < mRuns.size();  ++i) {
        if (!runsEqual(mRuns[i], rhs.mRuns[i])) {
            return false;
        }
    }
    return true;
}

//-----------------------------------------------------------------------------
long Typesetter::visibleLength(const FormattedString& text, const Size& box) const
{
    long n = text.length();
    long start = 0;
    PicaPt y(0.0f);
    while (start < n) {
        PicaPt h = lineHeight(text, start);
        if (y + h > box.height) {
            break;
        }
        long len = suggestLineBreak(text, start, box.width);
        if (len <= 0) {
            break;
        }
        y += h;
        start += len;
    }
    return start;
}

//-----------------------------------------------------------------------------
namespace {

class RuleHyphenator : public Hyphenator
{
public:
    std::vector<long> hyphenationPoints(const std::u32string& word) const override
    {
        std::vector<long> points;
        const long n = long(word.size());
        if (n < kMinWordLength) {
            return points;
        }

        std::string w;
        w.reserve(word.size());
        for (auto c : word) {
            if (c >= 'A' && c <= 'Z') {
                c = c - 'A' + 'a';
            }
            if (c < 'a' || c > 'z') {
                return points;
            }
            w += char(c);
        }

        // Leave at least two letters before and three after
        for (long i = 2;  i <= n - 3;  ++i) {
            bool vcv = (isVowel(w, i - 1) && !isVowel(w, i) && isVowel(w, i + 1));
            bool vccv = (isVowel(w, i - 2) && !isVowel(w, i - 1) &&
                         !isVowel(w, i) && isVowel(w, i + 1) &&
                         !isDigraph(w[i - 1], w[i]));
            if (vcv || vccv) {
                points.push_back(i);
            }
        }
        return points;
    }

private:
    static const long kMinWordLength = 5;

    static bool isVowel(const std::string& w, long i)
    {
        char c = w[size_t(i)];
        if (c == 'y') {
            return (i > 0);
        }
        return (c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u');
    }

    static bool isDigraph(char c1, char c2)
    {
        static const char *kDigraphs[] = { "ch", "sh", "th", "ph", "ck", "ng", "wh", "gh" };
        for (auto *d : kDigraphs) {
            if (d[0] == c1 && d[1] == c2) {
                return true;
            }
        }
        return false;
    }
};

} // namespace

std::shared_ptr<Hyphenator> Hyphenator::createDefault()
{
    return std::make_shared<RuleHyphenator>();
}

} // namespace $SD_NAMESPACE
