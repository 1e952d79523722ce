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

#include <cairo/cairo.h>
#include <cairo/cairo-pdf.h>
#include <cairo/cairo-ps.h>
#include <pango/pangocairo.h>
#include <hb.h>
#include <hb-ot.h>

#include <string.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <set>

#define kDebugDraw	0

namespace SD_NAMESPACE {

namespace {

static const float kDefaultPageSize = 1000.0f;
static constexpr float kInvPangoScale = 1.0f / float(PANGO_SCALE);

void setCairoSourceColor(cairo_t *gc, const Color& color)
{
    cairo_set_source_rgba(gc, double(color.red()), double(color.green()),
                          double(color.blue()), double(color.alpha()));
}

std::string lowercase(const std::string& s)
{
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return char(tolower(c)); });
    return lower;
}

// This class exists so that the PangoContext will be automatically destroyed.
// This is not strictly necessary, as exiting would obviously free it,
// but it does prevent unnecesary noise in leak detectors.
class TextContext
{
public:
    TextContext()
    {
        mContext = pango_font_map_create_context(pango_cairo_font_map_get_default());
    }

    ~TextContext()
    {
        g_object_unref(mContext);
    }

    PangoContext* context() { return mContext; }

private:
    PangoContext *mContext = nullptr;
};
TextContext gPangoContext;

PangoFontDescription* createFontDescription(const std::string& name,
                                            const std::string& fallback,
                                            const PicaPt& size)
{
    auto *desc = pango_font_description_from_string(name.c_str());
    if (!fallback.empty()) {
        // Pango takes a comma-separated list of families to try in order
        const char *family = pango_font_description_get_family(desc);
        std::string families = (family ? std::string(family) : name) + "," + fallback;
        pango_font_description_set_family(desc, families.c_str());
    }
    // Pango appears to assume the DPI is 96.0, so therefore the conversion
    // of one pica-pt is 96 pixels instead of 72. To undo that, multiply
    // the 72 dpi value by 72/96 = 0.75.
    pango_font_description_set_size(desc, int(std::round(0.75f * size.asFloat() * float(PANGO_SCALE))));
    return desc;
}

// Pango is only given the attributes that change the layout; the foreground
// "color" of a run is really the index of its TextRun, which is how a drawn
// run finds its fill, stroke and glyph override again.
int runIndexOf(PangoLayoutRun *run)
{
    auto *attrs = run->item->analysis.extra_attrs;
    while (attrs) {
        auto *attr = (PangoAttribute*)attrs->data;
        if (attr->klass->type == PANGO_ATTR_FOREGROUND) {
            auto *colorAttr = (PangoAttrColor*)attr;
            unsigned int lower = (unsigned int)(colorAttr->color.red);
            unsigned int upper = ((unsigned int)(colorAttr->color.green)) << 16;
            return int(upper | lower);
        }
        attrs = attrs->next;
    }
    return -1;
}

PangoLayout* createLayout(const FormattedString& text, const PicaPt& width,
                          int alignment)
{
    static const int kNullTerminated = -1;

    // Note that pango_cairo_create_layout() creates a new PangoContext
    // for every layout, which is why we are not using it.
    auto *layout = pango_layout_new(gPangoContext.context());
    pango_layout_set_text(layout, text.text().c_str(), kNullTerminated);
    if (width > PicaPt::kZero) {
        pango_layout_set_width(layout, int(std::ceil(width.asFloat() * PANGO_SCALE)));
        pango_layout_set_wrap(layout, PANGO_WRAP_WORD_CHAR);
    }
    switch (alignment & Alignment::kHorizMask) {
        default:
        case Alignment::kLeft:
            pango_layout_set_alignment(layout, PANGO_ALIGN_LEFT);
            break;
        case Alignment::kHCenter:
            pango_layout_set_alignment(layout, PANGO_ALIGN_CENTER);
            break;
        case Alignment::kRight:
            pango_layout_set_alignment(layout, PANGO_ALIGN_RIGHT);
            break;
        case Alignment::kJustify:
            pango_layout_set_alignment(layout, PANGO_ALIGN_LEFT);
            pango_layout_set_justify(layout, TRUE);
            break;
    }

    auto &runs = text.runs();
    if (!runs.empty()) {
        auto *attrList = pango_attr_list_new();
        auto add = [attrList](PangoAttribute *a, const TextRun& run) {
            a->start_index = guint(run.startIndex);
            a->end_index = guint(run.startIndex + run.length);
            // "insert" means "append" here, "insertBefore" is "insert"
            pango_attr_list_insert(attrList, a);
        };
        for (size_t i = 0;  i < runs.size();  ++i) {
            auto &run = runs[i];
            auto &style = run.style;
            auto *desc = createFontDescription(style.font, style.fallbackFont,
                                               style.fontSize);
            add(pango_attr_font_desc_new(desc), run);
            pango_font_description_free(desc);

            auto features = openTypeFeatureSettings(style.openTypeFeatures);
            if (!features.empty()) {
                add(pango_attr_font_features_new(features.c_str()), run);
            }
            if (style.tracking.isSet && style.tracking.value != PicaPt::kZero) {
                auto spacing = int(std::round(style.tracking.value.asFloat() * PANGO_SCALE));
                add(pango_attr_letter_spacing_new(spacing), run);
            }
            if (style.lineHeight.isSet) {
                auto h = int(std::round(style.lineHeight.value.asFloat() * PANGO_SCALE));
                add(pango_attr_line_height_new_absolute(h), run);
            }

            guint16 r = guint16(i & 0x0000ffff);
            guint16 g = guint16((i & 0xffff0000) >> 16);
            add(pango_attr_foreground_new(r, g, 0), run);
        }
        pango_layout_set_attributes(layout, attrList);
        pango_attr_list_unref(attrList);
    }

    // Placeholders of appended glyphs are drawn as the requested glyph.
    PangoLayoutIter *it = pango_layout_get_iter(layout);
    do {
        PangoLayoutRun *run = pango_layout_iter_get_run(it);
        if (run) {  // end of line always has a NULL run
            int runIdx = runIndexOf(run);
            if (runIdx >= 0 && runIdx < int(runs.size()) && runs[runIdx].glyph.isSet) {
                for (int j = 0;  j < run->glyphs->num_glyphs;  ++j) {
                    run->glyphs->glyphs[j].glyph = PangoGlyph(runs[runIdx].glyph.value);
                }
            }
        }
    } while (pango_layout_iter_next_run(it));
    pango_layout_iter_free(it);

    return layout;
}

// Converts a UTF-8 byte offset in `utf8` to a character offset
long charIndexForByte(const std::string& utf8, int byteIndex)
{
    long n = 0;
    int end = std::min(byteIndex, int(utf8.size()));
    for (int i = 0;  i < end;  ++i) {
        if ((utf8[i] & 0b11000000) != 0b10000000) {
            ++n;
        }
    }
    return n;
}

} // namespace

//---------------------------------- Fonts ------------------------------------
class PangoFontResolver : public FontResolver
{
public:
    bool hasFont(const std::string& name) const override
    {
        if (!mNamesInitialized) {
            loadNames();
        }
        return (mNames.find(lowercase(name)) != mNames.end());
    }

    long glyphForName(const std::string& fontName,
                      const std::string& glyphName) const override
    {
        long glyph = -1;
        PangoFont *font = loadFont(fontName);
        if (font) {
            hb_font_t *hbfont = pango_font_get_hb_font(font);  // owned by font
            hb_codepoint_t g;
            if (hbfont && hb_font_get_glyph_from_name(hbfont, glyphName.c_str(),
                                                      -1, &g)) {
                glyph = long(g);
            }
            g_object_unref(font);
        }
        return glyph;
    }

    FontMetrics metrics(const std::string& fontName,
                        const PicaPt& pointSize) const override
    {
        auto key = std::make_pair(fontName, pointSize.asFloat());
        auto it = mMetrics.find(key);
        if (it != mMetrics.end()) {
            return it->second;
        }

        FontMetrics fm;
        auto *desc = createFontDescription(fontName, "", pointSize);
        auto *metrics = pango_context_get_metrics(gPangoContext.context(), desc,
                                                  pango_language_get_default());
        if (metrics) {
            fm.ascent = PicaPt(float(pango_font_metrics_get_ascent(metrics)) * kInvPangoScale);
            fm.descent = PicaPt(float(pango_font_metrics_get_descent(metrics)) * kInvPangoScale);
            // Pango's height is the baseline-to-baseline distance, so
            // whatever is left over after the ascent and descent is leading.
            PicaPt height(float(pango_font_metrics_get_height(metrics)) * kInvPangoScale);
            fm.leading = std::max(PicaPt::kZero, height - fm.ascent - fm.descent);
            pango_font_metrics_unref(metrics);

            // cap-height is for flat letters (H,I but not A,O, etc. which
            // may extend above)
            PangoRectangle ink;
            auto *layout = pango_layout_new(gPangoContext.context());
            pango_layout_set_text(layout, "H", -1 /* null terminated*/);
            pango_layout_set_font_description(layout, desc);
            pango_layout_get_extents(layout, &ink, nullptr);
            g_object_unref(layout);
            fm.capHeight = PicaPt(float(ink.height) * kInvPangoScale);

            // x-height is obviously height of "x"
            layout = pango_layout_new(gPangoContext.context());
            pango_layout_set_text(layout, "x", -1 /* null terminated*/);
            pango_layout_set_font_description(layout, desc);
            pango_layout_get_extents(layout, &ink, nullptr);
            g_object_unref(layout);
            fm.xHeight = PicaPt(float(ink.height) * kInvPangoScale);

            fm.lineHeight = fm.ascent + fm.descent + fm.leading;
        } else {
            printError("could not get the metrics of font '" + fontName + "'");
        }
        pango_font_description_free(desc);

        mMetrics[key] = fm;
        return fm;
    }

    std::vector<std::string> openTypeFeatureTags(const std::string& fontName) const override
    {
        std::set<std::string> tags;
        PangoFont *font = loadFont(fontName);
        if (font) {
            hb_font_t *hbfont = pango_font_get_hb_font(font);
            hb_face_t *face = (hbfont ? hb_font_get_face(hbfont) : nullptr);
            if (face) {
                for (hb_tag_t table : { HB_OT_TAG_GSUB, HB_OT_TAG_GPOS }) {
                    unsigned int n = hb_ot_layout_table_get_feature_tags(face, table, 0, nullptr, nullptr);
                    std::vector<hb_tag_t> tableTags(n);
                    hb_ot_layout_table_get_feature_tags(face, table, 0, &n, tableTags.data());
                    for (unsigned int i = 0;  i < n;  ++i) {
                        char tag[5] = { 0, 0, 0, 0, 0 };
                        hb_tag_to_string(tableTags[i], tag);
                        tags.insert(tag);
                    }
                }
            }
            g_object_unref(font);
        }
        return std::vector<std::string>(tags.begin(), tags.end());
    }

private:
    mutable bool mNamesInitialized = false;
    mutable std::set<std::string> mNames;  // lowercase
    mutable std::map<std::pair<std::string, float>, FontMetrics> mMetrics;

    void loadNames() const
    {
        PangoFontFamily **families = nullptr;
        int nFamilies = 0;
        pango_font_map_list_families(pango_cairo_font_map_get_default(),
                                     &families, &nFamilies);
        for (int i = 0;  i < nFamilies;  ++i) {
            mNames.insert(lowercase(pango_font_family_get_name(families[i])));

            PangoFontFace **faces = nullptr;
            int nFaces = 0;
            pango_font_family_list_faces(families[i], &faces, &nFaces);
            for (int j = 0;  j < nFaces;  ++j) {
                auto *desc = pango_font_face_describe(faces[j]);
                char *name = pango_font_description_to_string(desc);
                mNames.insert(lowercase(name));
                g_free(name);
                pango_font_description_free(desc);
            }
            g_free(faces);
        }
        g_free(families);
        mNamesInitialized = true;
    }

    PangoFont* loadFont(const std::string& fontName) const
    {
        auto *desc = createFontDescription(fontName, "", PicaPt(kDefaultFontSize));
        PangoFont *font = pango_font_map_load_font(pango_cairo_font_map_get_default(),
                                                   gPangoContext.context(), desc);
        pango_font_description_free(desc);
        if (!font) {
            printError("could not load font '" + fontName + "'");
        }
        return font;
    }
};

std::shared_ptr<FontResolver> FontResolver::platformResolver()
{
    static std::shared_ptr<FontResolver> gResolver = std::make_shared<PangoFontResolver>();
    return gResolver;
}

//------------------------------- Typesetter ----------------------------------
class PangoTypesetter : public Typesetter
{
public:
    Size measure(const FormattedString& text) const override
    {
        if (text.empty()) {
            return Size::kZero;
        }
        auto *layout = createLayout(text, PicaPt::kZero, Alignment::kLeft);
        PangoRectangle logical;
        pango_layout_get_extents(layout, nullptr, &logical);
        g_object_unref(layout);
        return Size(PicaPt(float(logical.width) * kInvPangoScale),
                    PicaPt(float(logical.height) * kInvPangoScale));
    }

    long suggestLineBreak(const FormattedString& text, long start,
                          const PicaPt& width) const override
    {
        auto sub = text.slice(start);
        if (sub.empty()) {
            return 0;
        }
        long nChars = sub.length();
        auto *layout = createLayout(sub, width, Alignment::kLeft);
        if (pango_layout_get_line_count(layout) > 1) {
            // The second line starts after any line separator of the first
            PangoLayoutLine *line = pango_layout_get_line_readonly(layout, 1);
            nChars = charIndexForByte(sub.text(), line->start_index);
        }
        g_object_unref(layout);
        return std::max(1L, nChars);
    }

    PicaPt lineHeight(const FormattedString& text, long index) const override
    {
        auto sub = text.slice(index);
        if (sub.empty()) {
            return PicaPt::kZero;
        }
        auto *layout = createLayout(sub, PicaPt::kZero, Alignment::kLeft);
        PangoLayoutIter *it = pango_layout_get_iter(layout);
        int y0, y1;
        pango_layout_iter_get_line_yrange(it, &y0, &y1);
        pango_layout_iter_free(it);
        g_object_unref(layout);
        return PicaPt(float(y1 - y0) * kInvPangoScale);
    }

    long visibleLength(const FormattedString& text, const Size& box) const override
    {
        if (text.empty()) {
            return 0;
        }
        auto *layout = createLayout(text, box.width, Alignment::kLeft);
        int maxY = int(std::floor(box.height.asFloat() * PANGO_SCALE));
        int visibleBytes = 0;
        PangoLayoutIter *it = pango_layout_get_iter(layout);
        do {
            int y0, y1;
            pango_layout_iter_get_line_yrange(it, &y0, &y1);
            if (y1 > maxY) {
                break;
            }
            PangoLayoutLine *line = pango_layout_iter_get_line_readonly(it);
            visibleBytes = line->start_index + line->length;
        } while (pango_layout_iter_next_line(it));
        pango_layout_iter_free(it);
        g_object_unref(layout);

        // Include the line separator after the last visible line
        long n = charIndexForByte(text.text(), visibleBytes);
        auto chars = utf32FromUtf8(text.text());
        if (n < long(chars.size()) && n > 0 && chars[n] == '\n') {
            ++n;
        }
        return n;
    }

    void appendOutlines(BezierPath *path, const FormattedString& text,
                        const Point& origin, const Size& box) const override
    {
        if (text.empty()) {
            return;
        }
        auto *layout = createLayout(text, box.width, Alignment::kLeft);
        auto *surface = cairo_recording_surface_create(CAIRO_CONTENT_COLOR_ALPHA, nullptr);
        auto *gc = cairo_create(surface);

        int lastBaseline = 0;
        PangoLayoutIter *it = pango_layout_get_iter(layout);
        do {
            PangoLayoutRun *run = pango_layout_iter_get_run(it);
            if (run) {
                PangoRectangle extents;
                pango_layout_iter_get_run_extents(it, nullptr, &extents);
                lastBaseline = pango_layout_iter_get_baseline(it);
                cairo_move_to(gc, double(float(extents.x) * kInvPangoScale),
                              double(float(lastBaseline) * kInvPangoScale));
                pango_cairo_glyph_string_path(gc, run->item->analysis.font,
                                              run->glyphs);
            }
        } while (pango_layout_iter_next_run(it));
        pango_layout_iter_free(it);

        // Layout coordinates have +y down from the top of the first line.
        float yOffset = origin.y.asFloat();
        if (box.width <= PicaPt::kZero) {
            yOffset += float(lastBaseline) * kInvPangoScale;
        }
        float xOffset = origin.x.asFloat();
        auto toPage = [xOffset, yOffset](const cairo_path_data_t& p) {
            return Point(xOffset + float(p.point.x), yOffset - float(p.point.y));
        };

        cairo_path_t *outlines = cairo_copy_path(gc);
        if (outlines->status == CAIRO_STATUS_SUCCESS) {
            for (int i = 0;  i < outlines->num_data;  i += outlines->data[i].header.length) {
                auto *data = &outlines->data[i];
                switch (data->header.type) {
                    case CAIRO_PATH_MOVE_TO:
                        path->moveTo(toPage(data[1]));
                        break;
                    case CAIRO_PATH_LINE_TO:
                        path->lineTo(toPage(data[1]));
                        break;
                    case CAIRO_PATH_CURVE_TO:
                        path->curveTo(toPage(data[1]), toPage(data[2]), toPage(data[3]));
                        break;
                    case CAIRO_PATH_CLOSE_PATH:
                        path->closePath();
                        break;
                }
            }
        } else {
            printError(std::string("could not get text outlines: ") + cairo_status_to_string(outlines->status));
        }
        cairo_path_destroy(outlines);

        cairo_destroy(gc);
        cairo_surface_destroy(surface);
        g_object_unref(layout);
    }
};

std::shared_ptr<Typesetter> Typesetter::platformTypesetter(std::shared_ptr<FontResolver> /*fonts*/)
{
    return std::make_shared<PangoTypesetter>();
}

//------------------------------ CairoBackend ---------------------------------
namespace {

cairo_status_t writeToStream(void *closure, const unsigned char *data,
                             unsigned int length)
{
    auto *out = (std::ostream*)closure;
    out->write((const char*)data, std::streamsize(length));
    return (out->good() ? CAIRO_STATUS_SUCCESS : CAIRO_STATUS_WRITE_ERROR);
}

void appendCairoPath(cairo_t *gc, const BezierPath& path)
{
    // Count the number of data needed
    int num_data = 0;
    for (auto& e : path.elements()) {
        switch (e.action) {
            case BezierPath::kClosePath:
                num_data += 1;
                break;
            case BezierPath::kMoveTo:
            case BezierPath::kLineTo:
                num_data += 2;
                break;
            case BezierPath::kCurveTo:
                num_data += 4;
                break;
        }
    }

    std::vector<cairo_path_data_t> data(size_t(num_data));
    int dataIdx = 0;
    auto addPoint = [&data, &dataIdx](const Point& p) {
        data[dataIdx].point.x = double(p.x.asFloat());
        data[dataIdx].point.y = double(p.y.asFloat());
        dataIdx += 1;
    };
    for (auto& e : path.elements()) {
        switch (e.action) {
            case BezierPath::kMoveTo:
                data[dataIdx].header.type = CAIRO_PATH_MOVE_TO;
                data[dataIdx].header.length = 2;
                dataIdx += 1;
                addPoint(e.points[0]);
                break;
            case BezierPath::kLineTo:
                data[dataIdx].header.type = CAIRO_PATH_LINE_TO;
                data[dataIdx].header.length = 2;
                dataIdx += 1;
                addPoint(e.points[0]);
                break;
            case BezierPath::kCurveTo:
                data[dataIdx].header.type = CAIRO_PATH_CURVE_TO;
                data[dataIdx].header.length = 4;
                dataIdx += 1;
                addPoint(e.points[0]);
                addPoint(e.points[1]);
                addPoint(e.points[2]);
                break;
            case BezierPath::kClosePath:
                data[dataIdx].header.type = CAIRO_PATH_CLOSE_PATH;
                data[dataIdx].header.length = 1;
                dataIdx += 1;
                break;
        }
    }

    cairo_path_t cpath;
    cpath.status = CAIRO_STATUS_SUCCESS;
    cpath.data = data.data();
    cpath.num_data = num_data;
    cairo_append_path(gc, &cpath);
}

void setStrokeAttributes(cairo_t *gc, const GraphicsState& state)
{
    cairo_set_line_width(gc, double(state.strokeWidth.asFloat()));
    cairo_set_miter_limit(gc, double(state.miterLimit));
    switch (state.lineCap.isSet ? state.lineCap.value : kEndCapButt) {
        case kEndCapButt:
            cairo_set_line_cap(gc, CAIRO_LINE_CAP_BUTT);
            break;
        case kEndCapRound:
            cairo_set_line_cap(gc, CAIRO_LINE_CAP_ROUND);
            break;
        case kEndCapSquare:
            cairo_set_line_cap(gc, CAIRO_LINE_CAP_SQUARE);
            break;
    }
    switch (state.lineJoin.isSet ? state.lineJoin.value : kJoinMiter) {
        case kJoinMiter:
            cairo_set_line_join(gc, CAIRO_LINE_JOIN_MITER);
            break;
        case kJoinRound:
            cairo_set_line_join(gc, CAIRO_LINE_JOIN_ROUND);
            break;
        case kJoinBevel:
            cairo_set_line_join(gc, CAIRO_LINE_JOIN_BEVEL);
            break;
    }
    if (state.lineDash.isSet) {
        std::vector<double> dashes;
        dashes.reserve(state.lineDash.value.size());
        for (auto length : state.lineDash.value) {
            dashes.push_back(double(length.asFloat()));
        }
        cairo_set_dash(gc, dashes.data(), int(dashes.size()), 0.0);
    } else {
        cairo_set_dash(gc, nullptr, 0, 0.0);
    }
}

cairo_pattern_t* createGradientPattern(const Gradient& g)
{
    cairo_pattern_t *pattern;
    if (g.type() == kGradientRadial) {
        pattern = cairo_pattern_create_radial(
                    double(g.start().x.asFloat()), double(g.start().y.asFloat()),
                    double(g.startRadius().asFloat()),
                    double(g.end().x.asFloat()), double(g.end().y.asFloat()),
                    double(g.endRadius().asFloat()));
    } else {
        pattern = cairo_pattern_create_linear(
                    double(g.start().x.asFloat()), double(g.start().y.asFloat()),
                    double(g.end().x.asFloat()), double(g.end().y.asFloat()));
    }
    for (size_t i = 0;  i < g.colors().size();  ++i) {
        auto &c = g.colors()[i];
        cairo_pattern_add_color_stop_rgba(pattern, double(g.positions()[i]),
                                          double(c.red()), double(c.green()),
                                          double(c.blue()), double(c.alpha()));
    }
    cairo_pattern_set_extend(pattern, CAIRO_EXTEND_PAD);
    return pattern;
}

// Approximates a Gaussian blur (sigma = blur / 2) with three passes of an
// extended box filter in each direction, which has a fractional weight on
// the outermost taps. See "Theoretical Foundations of Gaussian Convolution
// by Extended Box Filtering" by Gwosdek et al.
void blurAlpha(std::vector<float>& alpha, int width, int height, float blur)
{
    float sigmaSquared = 0.25f * blur * blur;
    int radius = int(0.5f * std::sqrt(4.0f * sigmaSquared + 1.0f) - 0.5f);
    float tail = float(2 * radius + 1) * (float(radius * (radius + 1)) - sigmaSquared) /
                 (2.0f * sigmaSquared - float(6 * (radius + 1) * (radius + 1)));
    float divisor = 2.0f * (tail + float(radius)) + 1.0f;
    float innerWeight = 1.0f / divisor;
    float tailWeight = tail / divisor;

    std::vector<float> line(size_t(std::max(width, height)));
    auto blurLine = [&](size_t start, size_t step, int n) {
        auto at = [&line, n](int i) { return (i >= 0 && i < n ? line[i] : 0.0f); };
        for (int pass = 0;  pass < 3;  ++pass) {
            for (int i = 0;  i < n;  ++i) {
                line[i] = alpha[start + size_t(i) * step];
            }
            for (int i = 0;  i < n;  ++i) {
                float sum = tailWeight * (at(i - radius - 1) + at(i + radius + 1));
                for (int j = i - radius;  j <= i + radius;  ++j) {
                    sum += innerWeight * at(j);
                }
                alpha[start + size_t(i) * step] = sum;
            }
        }
    };
    for (int y = 0;  y < height;  ++y) {
        blurLine(size_t(y) * size_t(width), 1, width);
    }
    for (int x = 0;  x < width;  ++x) {
        blurLine(size_t(x), size_t(width), height);
    }
}

std::string numberedPath(const std::string& path, int n)
{
    auto slash = path.rfind('/');
    auto dot = path.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return path + "_" + std::to_string(n);
    }
    return path.substr(0, dot) + "_" + std::to_string(n) + path.substr(dot);
}

} // namespace

// Each page is recorded on a recording surface, so that it can be replayed
// to whatever output is saved, at whatever resolution.
class CairoBackend : public RenderBackend
{
public:
    explicit CairoBackend(std::ostream *printStream) : mPrintStream(printStream) {}

    ~CairoBackend()
    {
        clearPages();
    }

    void newPage(const PicaPt& width, const PicaPt& height) override
    {
#if kDebugDraw
        std::cout << "[debug] newPage(" << width.asFloat() << ", "
                  << height.asFloat() << ")" << std::endl;
#endif
        cairo_rectangle_t extents = { 0.0, 0.0, double(width.asFloat()),
                                      double(height.asFloat()) };
        Page page;
        page.width = width;
        page.height = height;
        page.surface = cairo_recording_surface_create(CAIRO_CONTENT_COLOR_ALPHA,
                                                      &extents);
        page.gc = cairo_create(page.surface);
        // Page coordinates have +y up from the bottom left
        cairo_translate(page.gc, 0.0, double(height.asFloat()));
        cairo_scale(page.gc, 1.0, -1.0);
        // The state stack spans pages, but a cairo_t does not, so the new
        // page starts with as many saves as are open.
        for (int i = 0;  i < mSaveDepth;  ++i) {
            cairo_save(page.gc);
        }
        mPages.push_back(page);
        mGC = page.gc;
    }

    void save() override
    {
        cairo_save(gc());
        ++mSaveDepth;
    }

    void restore() override
    {
        if (mSaveDepth > 0) {
            cairo_restore(gc());
            --mSaveDepth;
        }
    }

    void drawPath(const GraphicsState& state) override
    {
        if (!state.path || state.path->isEmpty()) {
            return;
        }
#if kDebugDraw
        std::cout << "[debug] drawPath(): " << state.path->elements().size()
                  << " elements" << std::endl;
#endif
        auto *gc = this->gc();
        auto fill = state.effectiveFillColor();
        auto stroke = state.effectiveStrokeColor();
        bool isStroked = (stroke.isSet && state.strokeWidth > PicaPt::kZero);
        bool isFilled = (fill.isSet || state.gradient.isSet);

        cairo_save(gc);
        setStrokeAttributes(gc, state);

        if (state.shadow.isSet && state.shadow.value.blur() > PicaPt::kZero) {
            drawBlurredShadow(gc, state, isFilled, isStroked);
        } else if (state.shadow.isSet) {
            auto &shadow = state.shadow.value;
            cairo_push_group(gc);
            appendCairoPath(gc, *state.path);
            setCairoSourceColor(gc, shadow.color());
            if (isFilled) {
                cairo_fill_preserve(gc);
            }
            if (isStroked) {
                cairo_stroke_preserve(gc);
            }
            cairo_new_path(gc);
            cairo_pattern_t *group = cairo_pop_group(gc);
            cairo_save(gc);
            cairo_translate(gc, double(shadow.offset().x.asFloat()),
                            double(shadow.offset().y.asFloat()));
            cairo_set_source(gc, group);
            cairo_paint(gc);
            cairo_restore(gc);
            cairo_pattern_destroy(group);
        }

        appendCairoPath(gc, *state.path);
        if (state.gradient.isSet) {
            cairo_pattern_t *pattern = createGradientPattern(state.gradient.value);
            cairo_set_source(gc, pattern);
            cairo_fill_preserve(gc);
            cairo_pattern_destroy(pattern);
        } else if (fill.isSet) {
            setCairoSourceColor(gc, fill.value);
            cairo_fill_preserve(gc);
        }
        if (isStroked) {
            setCairoSourceColor(gc, stroke.value);
            cairo_stroke_preserve(gc);
        }
        cairo_new_path(gc);
        cairo_restore(gc);
    }

    void clipPath(const GraphicsState& state) override
    {
        if (!state.path) {
            return;
        }
        auto *gc = this->gc();
        appendCairoPath(gc, *state.path);
        cairo_clip(gc);
    }

    void transform(const Transform& m) override
    {
        cairo_matrix_t matrix;
        cairo_matrix_init(&matrix, double(m.a), double(m.b), double(m.c),
                          double(m.d), double(m.tx), double(m.ty));
        cairo_transform(gc(), &matrix);
    }

    void renderTextBox(const FormattedString& text, const Rect& box,
                       int alignment) override
    {
        if (text.empty()) {
            return;
        }
#if kDebugDraw
        std::cout << "[debug] renderTextBox(" << text.text() << ")" << std::endl;
#endif
        auto *gc = this->gc();
        auto *layout = createLayout(text, box.width, alignment);
        int maxY = int(std::ceil(box.height.asFloat() * PANGO_SCALE));

        cairo_save(gc);
        // Pango lays out with +y down from the top of the box
        cairo_translate(gc, double(box.x.asFloat()), double(box.maxY().asFloat()));
        cairo_scale(gc, 1.0, -1.0);

        PangoLayoutIter *it = pango_layout_get_iter(layout);
        do {
            int y0, y1;
            pango_layout_iter_get_line_yrange(it, &y0, &y1);
            if (y1 > maxY) {
                break;  // lines that do not fit are not drawn
            }
            PangoLayoutRun *run = pango_layout_iter_get_run(it);
            if (!run) {  // end of line always has a NULL run
                continue;
            }
            int runIdx = runIndexOf(run);
            if (runIdx < 0 || runIdx >= int(text.runs().size())) {
                continue;
            }
            auto &style = text.runs()[runIdx].style;
            PangoRectangle extents;
            pango_layout_iter_get_run_extents(it, nullptr, &extents);
            double x = double(float(extents.x) * kInvPangoScale);
            double y = double(float(pango_layout_iter_get_baseline(it)) * kInvPangoScale);
            auto *font = run->item->analysis.font;

            cairo_translate(gc, x, y);
            auto fill = style.effectiveFill();
            if (fill.isSet && fill.value.alpha() > 0.0f) {
                setCairoSourceColor(gc, fill.value);
                pango_cairo_show_glyph_string(gc, font, run->glyphs);
            }
            auto stroke = style.effectiveStroke();
            if (stroke.isSet && style.strokeWidth > PicaPt::kZero) {
                cairo_new_path(gc);
                cairo_move_to(gc, 0.0, 0.0);
                pango_cairo_glyph_string_path(gc, font, run->glyphs);
                setCairoSourceColor(gc, stroke.value);
                cairo_set_line_width(gc, double(style.strokeWidth.asFloat()));
                cairo_stroke(gc);
            }
            cairo_translate(gc, -x, -y);
        } while (pango_layout_iter_next_run(it));
        pango_layout_iter_free(it);

        cairo_restore(gc);
        g_object_unref(layout);
    }

    void renderImage(const std::string& path, const Point& position,
                     float alpha) override
    {
        auto data = readFile(path.c_str());
        if (data.empty()) {
            printError("could not read image '" + path + "'");
            return;
        }
        ImageData image = readImage(data.data(), int(data.size()));
        if (!image.isValid()) {
            printError("could not decode image '" + path + "'");
            return;
        }

        auto *surface = cairo_image_surface_create(CAIRO_FORMAT_ARGB32,
                                                   image.width, image.height);
        if (cairo_surface_status(surface) != CAIRO_STATUS_SUCCESS) {
            printError(std::string("could not create image surface: ") +
                       cairo_status_to_string(cairo_surface_status(surface)));
            cairo_surface_destroy(surface);
            return;
        }
        cairo_surface_flush(surface);
        // Cairo's ARGB32 is premultiplied and native-endian, which is BGRA
        // in memory on little-endian machines.
        unsigned char *dst = cairo_image_surface_get_data(surface);
        int stride = cairo_image_surface_get_stride(surface);
        size_t rowBytes = size_t(4 * image.width);
        for (int y = 0;  y < image.height;  ++y) {
            memcpy(dst + y * stride, image.bgra.data() + size_t(y) * rowBytes, rowBytes);
        }
        cairo_surface_mark_dirty(surface);

        auto *gc = this->gc();
        cairo_save(gc);
        // The image's bottom left is at `position`, but its rows go down
        cairo_translate(gc, double(position.x.asFloat()),
                        double(position.y.asFloat()) + double(image.height));
        cairo_scale(gc, 1.0, -1.0);
        cairo_set_source_surface(gc, surface, 0.0, 0.0);
        cairo_paint_with_alpha(gc, double(alpha));
        cairo_restore(gc);
        cairo_surface_destroy(surface);
    }

    void setFrameDuration(float seconds) override
    {
        gc();  // ensures a page
        mPages.back().frameDuration = seconds;
    }

    void printImage(const std::string& documentPath) override
    {
        if (mPages.empty()) {
            printError("printImage(): there are no pages to print");
            return;
        }
        cairo_surface_t *ps;
        auto w = double(mPages[0].width.asFloat());
        auto h = double(mPages[0].height.asFloat());
        if (!documentPath.empty()) {
            ps = cairo_ps_surface_create(documentPath.c_str(), w, h);
        } else if (mPrintStream) {
            ps = cairo_ps_surface_create_for_stream(writeToStream, mPrintStream, w, h);
        } else {
            throw OutputError("printImage(): no document path was given and no print stream is attached");
        }
        writePages(ps, cairo_ps_surface_set_size,
                   documentPath.empty() ? std::string("print stream") : documentPath);
    }

    void reset() override
    {
        clearPages();
    }

    int pageCount() const override { return int(mPages.size()); }

    void* nativePage(int index) const override
    {
        if (index < 0 || index >= int(mPages.size())) {
            return nullptr;
        }
        return mPages[index].surface;
    }

protected:
    struct Page
    {
        cairo_surface_t *surface = nullptr;
        cairo_t *gc = nullptr;
        PicaPt width;
        PicaPt height;
        float frameDuration = 0.0f;
    };
    std::vector<Page> mPages;
    cairo_t *mGC = nullptr;  // of the current page
    int mSaveDepth = 0;
    std::ostream *mPrintStream;

    // The shadow is rasterized in user space into an alpha mask, blurred,
    // and painted through the mask in the shadow color, so the blur is a
    // bitmap even in the vector outputs.
    void drawBlurredShadow(cairo_t *gc, const GraphicsState& state,
                           bool isFilled, bool isStroked)
    {
        const double kMaskScale = 2.0;  // mask pixels per point
        const double kMaxMaskSize = 4096.0;
        auto &shadow = state.shadow.value;

        double x0, y0, x1, y1;
        appendCairoPath(gc, *state.path);
        if (isStroked) {
            cairo_stroke_extents(gc, &x0, &y0, &x1, &y1);
        } else {
            cairo_fill_extents(gc, &x0, &y0, &x1, &y1);
        }
        cairo_new_path(gc);
        if (x1 <= x0 || y1 <= y0) {
            return;
        }

        double scale = kMaskScale;
        double blur = double(shadow.blur().asFloat());
        double maxSide = std::max(x1 - x0, y1 - y0) + 4.0 * blur;
        if (maxSide * scale > kMaxMaskSize) {
            scale = kMaxMaskSize / maxSide;
        }
        float blurPx = float(blur * scale);
        int radius = int(0.5f * std::sqrt(blurPx * blurPx + 1.0f) - 0.5f);
        int border = 3 * (radius + 1);
        int width = int(std::ceil((x1 - x0) * scale)) + 2 * border;
        int height = int(std::ceil((y1 - y0) * scale)) + 2 * border;

        auto *mask = cairo_image_surface_create(CAIRO_FORMAT_A8, width, height);
        if (cairo_surface_status(mask) != CAIRO_STATUS_SUCCESS) {
            printError(std::string("could not create shadow mask: ") +
                       cairo_status_to_string(cairo_surface_status(mask)));
            cairo_surface_destroy(mask);
            return;
        }
        // Mask pixel (px, py) is user point (x0, y0) + ((px, py) - border) / scale
        auto *maskGC = cairo_create(mask);
        cairo_translate(maskGC, double(border), double(border));
        cairo_scale(maskGC, scale, scale);
        cairo_translate(maskGC, -x0, -y0);
        setStrokeAttributes(maskGC, state);
        appendCairoPath(maskGC, *state.path);
        cairo_set_source_rgba(maskGC, 0.0, 0.0, 0.0, 1.0);
        if (isFilled) {
            cairo_fill_preserve(maskGC);
        }
        if (isStroked) {
            cairo_stroke_preserve(maskGC);
        }
        cairo_destroy(maskGC);

        cairo_surface_flush(mask);
        unsigned char *data = cairo_image_surface_get_data(mask);
        int stride = cairo_image_surface_get_stride(mask);
        std::vector<float> alpha(size_t(width) * size_t(height));
        for (int y = 0;  y < height;  ++y) {
            for (int x = 0;  x < width;  ++x) {
                alpha[size_t(y) * size_t(width) + size_t(x)] = float(data[y * stride + x]) / 255.0f;
            }
        }
        blurAlpha(alpha, width, height, blurPx);
        for (int y = 0;  y < height;  ++y) {
            for (int x = 0;  x < width;  ++x) {
                float a = alpha[size_t(y) * size_t(width) + size_t(x)];
                data[y * stride + x] = (unsigned char)std::max(0.0f, std::min(255.0f, std::round(255.0f * a)));
            }
        }
        cairo_surface_mark_dirty(mask);

        cairo_save(gc);
        cairo_translate(gc, double(shadow.offset().x.asFloat()),
                        double(shadow.offset().y.asFloat()));
        cairo_translate(gc, x0, y0);
        cairo_scale(gc, 1.0 / scale, 1.0 / scale);
        cairo_translate(gc, -double(border), -double(border));
        setCairoSourceColor(gc, shadow.color());
        cairo_mask_surface(gc, mask, 0.0, 0.0);
        cairo_restore(gc);
        cairo_surface_destroy(mask);
    }

    // Drawing without a page starts a default one.
    cairo_t* gc()
    {
        if (!mGC) {
            newPage(PicaPt(kDefaultPageSize), PicaPt(kDefaultPageSize));
        }
        return mGC;
    }

    void clearPages()
    {
        for (auto &page : mPages) {
            cairo_destroy(page.gc);
            cairo_surface_destroy(page.surface);
        }
        mPages.clear();
        mGC = nullptr;
        mSaveDepth = 0;
    }

    // Replays every page onto a multi-page document surface and finishes it.
    // Takes ownership of `doc`.
    void writePages(cairo_surface_t *doc,
                    void (*setPageSize)(cairo_surface_t*, double, double),
                    const std::string& name)
    {
        auto status = cairo_surface_status(doc);
        if (status == CAIRO_STATUS_SUCCESS) {
            for (auto &page : mPages) {
                setPageSize(doc, double(page.width.asFloat()),
                            double(page.height.asFloat()));
                auto *gc = cairo_create(doc);
                cairo_set_source_surface(gc, page.surface, 0.0, 0.0);
                cairo_paint(gc);
                cairo_show_page(gc);
                cairo_destroy(gc);
            }
            cairo_surface_finish(doc);
            status = cairo_surface_status(doc);
        }
        cairo_surface_destroy(doc);
        if (status != CAIRO_STATUS_SUCCESS) {
            throw OutputError("could not write '" + name + "': " + cairo_status_to_string(status));
        }
    }
};

class CairoPreviewBackend : public CairoBackend
{
public:
    CairoPreviewBackend(float dpi, std::ostream *printStream)
        : CairoBackend(printStream), mDPI(dpi)
    {}

    void saveImage(const std::string& path, bool multipage) override
    {
        if (mPages.empty()) {
            printError("saveImage(): there are no pages to save");
            return;
        }
        if (multipage) {
            for (size_t i = 0;  i < mPages.size();  ++i) {
                writePNG(mPages[i], numberedPath(path, int(i) + 1));
            }
        } else {
            writePNG(mPages.back(), path);
        }
    }

private:
    float mDPI;

    void writePNG(const Page& page, const std::string& path)
    {
        int width = int(std::ceil(page.width.toPixels(mDPI)));
        int height = int(std::ceil(page.height.toPixels(mDPI)));
        auto *image = cairo_image_surface_create(CAIRO_FORMAT_ARGB32, width, height);
        auto *gc = cairo_create(image);
        cairo_scale(gc, double(mDPI / 72.0f), double(mDPI / 72.0f));
        cairo_set_source_surface(gc, page.surface, 0.0, 0.0);
        cairo_paint(gc);
        cairo_destroy(gc);
        auto status = cairo_surface_write_to_png(image, path.c_str());
        cairo_surface_destroy(image);
        if (status != CAIRO_STATUS_SUCCESS) {
            throw OutputError("could not write '" + path + "': " + cairo_status_to_string(status));
        }
    }
};

class CairoPDFBackend : public CairoBackend
{
public:
    explicit CairoPDFBackend(std::ostream *printStream) : CairoBackend(printStream) {}

    // A PDF is always all the pages
    void saveImage(const std::string& path, bool /*multipage*/) override
    {
        if (mPages.empty()) {
            printError("saveImage(): there are no pages to save");
            return;
        }
        auto *pdf = cairo_pdf_surface_create(path.c_str(),
                                             double(mPages[0].width.asFloat()),
                                             double(mPages[0].height.asFloat()));
        writePages(pdf, cairo_pdf_surface_set_size, path);
    }
};

std::shared_ptr<RenderBackend> RenderBackend::createCairoPreviewBackend(
            float dpi /*= 72.0f*/, std::ostream *printStream /*= nullptr*/)
{
    return std::make_shared<CairoPreviewBackend>(dpi, printStream);
}

std::shared_ptr<RenderBackend> RenderBackend::createCairoPDFBackend(
            std::ostream *printStream /*= nullptr*/)
{
    return std::make_shared<CairoPDFBackend>(printStream);
}

//----------------------------- DrawContext -----------------------------------
std::shared_ptr<DrawContext> DrawContext::createPreview(float dpi /*= 72.0f*/)
{
    auto fonts = FontResolver::platformResolver();
    return std::make_shared<DrawContext>(RenderBackend::createCairoPreviewBackend(dpi),
                                         fonts, Typesetter::platformTypesetter(fonts));
}

std::shared_ptr<DrawContext> DrawContext::createPDF()
{
    auto fonts = FontResolver::platformResolver();
    return std::make_shared<DrawContext>(RenderBackend::createCairoPDFBackend(),
                                         fonts, Typesetter::platformTypesetter(fonts));
}

std::shared_ptr<DrawContext> DrawContext::createPrint(std::ostream& out)
{
    auto fonts = FontResolver::platformResolver();
    return std::make_shared<DrawContext>(RenderBackend::createPrintBackend(out),
                                         fonts, Typesetter::platformTypesetter(fonts));
}

} // namespace $SD_NAMESPACE
