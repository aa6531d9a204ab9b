#pragma once
#include <gtest/gtest.h>
#include <utility>
#include "pixel_buffer.hpp"
#include "util/EditorError.hpp"

namespace cutout_test {

// Runs fn and returns the kind of the EditorError it throws; fails the test otherwise
template <class F>
cutout::ErrorKind errorKindOf(F&& fn)
{
    try
    {
        std::forward<F>(fn)();
    }
    catch (const cutout::EditorError& e)
    {
        return e.kind();
    }
    ADD_FAILURE() << "expected cutout::EditorError";
    return cutout::ErrorKind::DecodeFailure;
}

inline cutout::PixelBuffer solid(int w, int h, cutout::Rgba c)
{
    return cutout::PixelBuffer(w, h, c);
}

const cutout::Rgba kRed   {255, 0, 0, 255};
const cutout::Rgba kGreen {0, 255, 0, 255};
const cutout::Rgba kBlue  {0, 0, 255, 255};
const cutout::Rgba kWhite {255, 255, 255, 255};

}

namespace cutout {
inline void PrintTo(const Rgba& c, std::ostream* os)
{
    *os << "rgba(" << int(c.r) << "," << int(c.g) << "," << int(c.b) << "," << int(c.a) << ")";
}
}
