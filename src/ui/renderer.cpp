// src/ui/renderer.cpp
#include "uttt/ui/renderer.h"
#include <stdexcept>
#include <utility>

namespace uttt {
namespace ui {

namespace {

void checkSize(int width, int height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Drawing size must be positive, got " +
                                    std::to_string(width) + "x" + std::to_string(height));
    }
}

} // namespace

std::shared_ptr<Renderer> Renderer::createSvgRenderer(int width, int height) {
    return std::make_shared<SvgRenderer>(width, height);
}

SvgRenderer::SvgRenderer(int width, int height)
    : width_(width), height_(height) {
    checkSize(width, height);
}

void SvgRenderer::begin(int width, int height) {
    checkSize(width, height);
    width_ = width;
    height_ = height;
    elements_.str("");
    elements_.clear();
}

void SvgRenderer::line(int x1, int y1, int x2, int y2, const Stroke& stroke) {
    elements_ << "  <line x1=\"" << x1 << "\" y1=\"" << y1
              << "\" x2=\"" << x2 << "\" y2=\"" << y2
              << "\" stroke=\"" << escape(stroke.color)
              << "\" stroke-width=\"" << stroke.width << "\"/>\n";
}

void SvgRenderer::rect(int x, int y, int width, int height,
                       const std::string& fill, const Stroke& outline) {
    elements_ << "  <rect x=\"" << x << "\" y=\"" << y
              << "\" width=\"" << width << "\" height=\"" << height
              << "\" fill=\"" << (fill.empty() ? std::string("none") : escape(fill)) << "\"";
    if (outline.width > 0) {
        elements_ << " stroke=\"" << escape(outline.color)
                  << "\" stroke-width=\"" << outline.width << "\"";
    }
    elements_ << "/>\n";
}

void SvgRenderer::text(int x, int y, const std::string& content, const TextStyle& style) {
    elements_ << "  <text x=\"" << x << "\" y=\"" << y
              << "\" font-family=\"sans-serif\" font-size=\"" << style.size
              << "\" fill=\"" << escape(style.color) << "\"";
    if (style.centered) {
        elements_ << " text-anchor=\"middle\" dominant-baseline=\"central\"";
    }
    elements_ << ">" << escape(content) << "</text>\n";
}

void SvgRenderer::finish() {
    if (onFinish_) {
        onFinish_(getSvg());
    }
}

std::string SvgRenderer::getSvg() const {
    std::ostringstream doc;
    doc << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << width_
        << "\" height=\"" << height_ << "\" viewBox=\"0 0 " << width_ << " " << height_ << "\">\n"
        << elements_.str()
        << "</svg>\n";
    return doc.str();
}

void SvgRenderer::setOutputCallback(std::function<void(const std::string&)> callback) {
    onFinish_ = std::move(callback);
}

std::string SvgRenderer::escape(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (char ch : raw) {
        switch (ch) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += ch; break;
        }
    }
    return out;
}

} // namespace ui
} // namespace uttt
