#pragma once

#include "sds_tensor.h"

#include <string>
#include <vector>

namespace sds {

struct RgbImage {
    int width = 0;
    int height = 0;
    std::vector<unsigned char> rgb;
};

// Approximate preview of [B,4,H,W] SD latents via a fixed linear projection,
// one H x W image per batch item.
std::vector<RgbImage> latents_to_rgb(const FloatTensor & latents);

bool write_ppm(const std::string & path, int w, int h, const std::vector<unsigned char> & rgb);
bool write_png(const std::string & path, int w, int h, const std::vector<unsigned char> & rgb);

}
