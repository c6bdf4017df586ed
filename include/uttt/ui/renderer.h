// include/uttt/ui/renderer.h
#ifndef UTTT_RENDERER_H
#define UTTT_RENDERER_H

#include <string>
#include <memory>
#include <functional>
#include <sstream>

namespace uttt {
namespace ui {

struct Stroke {
    std::string color = "black";
    int width = 1;  // 0 draws no outline
};

struct TextStyle {
    int size = 12;
    std::string color = "black";
    bool centered = false;  // Anchor the text at its centre instead of its baseline start
};

/**
 * @brief Abstract drawing surface
 *
 * A drawing is framed by begin() and finish(); primitives in between are
 * painted in call order, later ones on top.
 */
class Renderer {
public:
    virtual ~Renderer() = default;

    /**
     * @brief Start a new drawing, discarding anything drawn before
     *
     * @throws std::invalid_argument if either dimension is not positive
     */
    virtual void begin(int width, int height) = 0;

    virtual void line(int x1, int y1, int x2, int y2, const Stroke& stroke) = 0;

    /**
     * @brief Axis-aligned rectangle
     *
     * @param fill Fill colour, empty for none
     */
    virtual void rect(int x, int y, int width, int height,
                      const std::string& fill, const Stroke& outline) = 0;

    virtual void text(int x, int y, const std::string& content, const TextStyle& style) = 0;

    /**
     * @brief Hand the finished drawing to its destination
     */
    virtual void finish() = 0;

    virtual int getWidth() const = 0;
    virtual int getHeight() const = 0;

    static std::shared_ptr<Renderer> createSvgRenderer(int width, int height);
};

/**
 * @brief Renderer producing a standalone SVG document
 */
class SvgRenderer : public Renderer {
public:
    SvgRenderer(int width = 600, int height = 640);

    void begin(int width, int height) override;
    void line(int x1, int y1, int x2, int y2, const Stroke& stroke) override;
    void rect(int x, int y, int width, int height,
              const std::string& fill, const Stroke& outline) override;
    void text(int x, int y, const std::string& content, const TextStyle& style) override;
    void finish() override;

    int getWidth() const override { return width_; }
    int getHeight() const override { return height_; }

    // Document built so far, closed with </svg>
    std::string getSvg() const;

    // Receives the document on every finish()
    void setOutputCallback(std::function<void(const std::string&)> callback);

private:
    int width_;
    int height_;
    std::ostringstream elements_;
    std::function<void(const std::string&)> onFinish_;

    static std::string escape(const std::string& raw);
};

} // namespace ui
} // namespace uttt

#endif // UTTT_RENDERER_H
