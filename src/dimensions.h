#pragma once
#include <cstddef>
#include <cstdint>

// Width x height of a cell grid
struct Dimensions {
    uint32_t width = 0;
    uint32_t height = 0;

    size_t area() const { return (size_t)width * height; }
    bool empty() const { return width == 0 || height == 0; }

    bool operator==(const Dimensions& o) const { return width == o.width && height == o.height; }
    bool operator!=(const Dimensions& o) const { return !(*this == o); }
};
