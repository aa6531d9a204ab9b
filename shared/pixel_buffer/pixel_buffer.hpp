/*========================  pixel_buffer.hpp  ========================

   Fixed-size pixel storage for the cutout editor.
   --------------------------------------------------------------------
   • PixelBuffer: RGBA samples (source image, backgrounds, composites)
   • MaskBuffer:  single-channel alpha mask (0 = removed, 255 = visible)
   • every at()/set() is bounds checked and throws OutOfBounds
   • backed by cv::Mat so the compositor can hand rows to OpenCV

=====================================================================*/
#pragma once
#include <opencv2/core.hpp>
#include <cstdint>

namespace cutout {

struct Rgba
{
    std::uint8_t r {0};
    std::uint8_t g {0};
    std::uint8_t b {0};
    std::uint8_t a {255};

    bool operator==(const Rgba& o) const { return r == o.r && g == o.g && b == o.b && a == o.a; }
    bool operator!=(const Rgba& o) const { return !(*this == o); }
};

/**
 * @brief RGBA image. Stored as CV_8UC4 in OpenCV's BGRA channel order;
 *        the accessors speak RGBA.
 */
class PixelBuffer
{
public:
    PixelBuffer() = default;
    PixelBuffer(int width, int height, Rgba fill = Rgba{0, 0, 0, 0});

    // Copies own their pixels (cv::Mat copies would share them)
    PixelBuffer(const PixelBuffer& o) : mat_(o.mat_.clone()) {}
    PixelBuffer& operator=(const PixelBuffer& o) { if (this != &o) mat_ = o.mat_.clone(); return *this; }
    PixelBuffer(PixelBuffer&&) = default;
    PixelBuffer& operator=(PixelBuffer&&) = default;

    /**
     * @brief Wraps a decoded image. Accepts 8-bit GRAY, BGR or BGRA mats
     *        (what cv::imread returns) and converts to BGRA.
     *        Throws DecodeFailure for empty or non-8-bit input.
     */
    static PixelBuffer fromMat(const cv::Mat& img);

    int width() const { return mat_.cols; }
    int height() const { return mat_.rows; }
    cv::Size size() const { return mat_.size(); }
    bool empty() const { return mat_.empty(); }
    bool contains(int x, int y) const { return x >= 0 && y >= 0 && x < mat_.cols && y < mat_.rows; }

    Rgba at(int x, int y) const;
    void set(int x, int y, const Rgba& px);
    void fill(const Rgba& px);

    PixelBuffer clone() const;

    // Raw BGRA view for OpenCV operations
    const cv::Mat& mat() const { return mat_; }
    cv::Mat& mat() { return mat_; }

private:
    void checkBounds(int x, int y) const;
    cv::Mat mat_;
};

/**
 * @brief Single-channel alpha mask (CV_8UC1).
 */
class MaskBuffer
{
public:
    MaskBuffer() = default;
    MaskBuffer(int width, int height, std::uint8_t fill = 255);

    MaskBuffer(const MaskBuffer& o) : mat_(o.mat_.clone()) {}
    MaskBuffer& operator=(const MaskBuffer& o) { if (this != &o) mat_ = o.mat_.clone(); return *this; }
    MaskBuffer(MaskBuffer&&) = default;
    MaskBuffer& operator=(MaskBuffer&&) = default;

    // Mask seeded from the alpha channel of a segmented result
    static MaskBuffer fromAlpha(const PixelBuffer& segmented);

    int width() const { return mat_.cols; }
    int height() const { return mat_.rows; }
    cv::Size size() const { return mat_.size(); }
    bool empty() const { return mat_.empty(); }
    bool contains(int x, int y) const { return x >= 0 && y >= 0 && x < mat_.cols && y < mat_.rows; }

    std::uint8_t at(int x, int y) const;
    void set(int x, int y, std::uint8_t v);
    void fill(std::uint8_t v);

    MaskBuffer clone() const;
    // Copies contents; sizes must agree (DimensionMismatch otherwise)
    void assign(const MaskBuffer& other);

    // Byte-for-byte comparison
    bool operator==(const MaskBuffer& o) const;
    bool operator!=(const MaskBuffer& o) const { return !(*this == o); }

    const cv::Mat& mat() const { return mat_; }
    cv::Mat& mat() { return mat_; }

private:
    void checkBounds(int x, int y) const;
    cv::Mat mat_;
};

}
