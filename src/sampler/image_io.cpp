#include "image_io.h"

#include "sds_error.h"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>

namespace sds {

// rows: latent channel, cols: r, g, b
static const float kLatentRgbFactors[4][3] = {
    { 0.3512f,  0.2297f,  0.3227f},
    { 0.3250f,  0.4974f,  0.2350f},
    {-0.2829f,  0.1762f,  0.2721f},
    {-0.2120f, -0.2616f, -0.7177f},
};

static unsigned char to_byte(float v) {
    const float x = (v / 2.0f + 0.5f) * 255.0f;
    return (unsigned char) std::min(255.0f, std::max(0.0f, x));
}

std::vector<RgbImage> latents_to_rgb(const FloatTensor & latents) {
    if (latents.rank() != 4 || latents.dim(1) != 4) {
        throw ShapeError("latent preview needs [B,4,H,W], got " + shape_to_string(latents.shape()));
    }
    const int64_t B = latents.dim(0);
    const int64_t H = latents.dim(2);
    const int64_t W = latents.dim(3);
    const size_t plane = (size_t)(H * W);

    std::vector<RgbImage> out;
    out.reserve((size_t)B);
    for (int64_t b = 0; b < B; ++b) {
        RgbImage img;
        img.width = (int)W;
        img.height = (int)H;
        img.rgb.resize(plane * 3);
        const float * src = latents.data() + (size_t)b * 4 * plane;
        for (size_t p = 0; p < plane; ++p) {
            for (int c = 0; c < 3; ++c) {
                float v = 0.0f;
                for (int k = 0; k < 4; ++k) v += src[k * plane + p] * kLatentRgbFactors[k][c];
                img.rgb[p * 3 + c] = to_byte(v);
            }
        }
        out.push_back(std::move(img));
    }
    return out;
}

static bool write_file(const std::string & path, const unsigned char * data, size_t n) {
    FILE * f = std::fopen(path.c_str(), "wb");
    if (!f) return false;
    const bool ok = std::fwrite(data, 1, n, f) == n;
    return std::fclose(f) == 0 && ok;
}

bool write_ppm(const std::string & path, int w, int h, const std::vector<unsigned char> & rgb) {
    if (w <= 0 || h <= 0 || rgb.size() < (size_t)w * h * 3) return false;
    char header[64];
    const int len = std::snprintf(header, sizeof(header), "P6\n%d %d\n255\n", w, h);
    std::vector<unsigned char> out(header, header + len);
    out.insert(out.end(), rgb.begin(), rgb.begin() + (size_t)w * h * 3);
    return write_file(path, out.data(), out.size());
}

static void put_be32(std::vector<unsigned char> & out, uint32_t v) {
    out.push_back((unsigned char)(v >> 24));
    out.push_back((unsigned char)(v >> 16));
    out.push_back((unsigned char)(v >> 8));
    out.push_back((unsigned char)v);
}

static uint32_t crc32(const unsigned char * data, size_t len) {
    static const std::array<uint32_t, 256> table = [] {
        std::array<uint32_t, 256> t{};
        for (uint32_t i = 0; i < 256; ++i) {
            uint32_t c = i;
            for (int k = 0; k < 8; ++k) c = (c & 1) ? 0xEDB88320u ^ (c >> 1) : (c >> 1);
            t[i] = c;
        }
        return t;
    }();
    uint32_t c = 0xFFFFFFFFu;
    for (size_t i = 0; i < len; ++i) c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
    return c ^ 0xFFFFFFFFu;
}

static uint32_t adler32(const std::vector<unsigned char> & data) {
    uint32_t a = 1, b = 0;
    for (unsigned char v : data) {
        a = (a + v) % 65521;
        b = (b + a) % 65521;
    }
    return (b << 16) | a;
}

// length, type, payload, crc(type + payload)
static void put_chunk(std::vector<unsigned char> & png, const char type[4], const std::vector<unsigned char> & payload) {
    put_be32(png, (uint32_t)payload.size());
    const size_t start = png.size();
    png.insert(png.end(), type, type + 4);
    png.insert(png.end(), payload.begin(), payload.end());
    put_be32(png, crc32(&png[start], png.size() - start));
}

// zlib stream made of stored (uncompressed) deflate blocks
static std::vector<unsigned char> zlib_stored(const std::vector<unsigned char> & raw) {
    std::vector<unsigned char> z = {0x78, 0x01};
    size_t pos = 0;
    do {
        const size_t n = std::min<size_t>(65535, raw.size() - pos);
        const bool last = pos + n == raw.size();
        const uint16_t len = (uint16_t)n;
        const uint16_t nlen = (uint16_t)~len;
        z.push_back(last ? 1 : 0);
        z.push_back((unsigned char)(len & 0xFF));
        z.push_back((unsigned char)(len >> 8));
        z.push_back((unsigned char)(nlen & 0xFF));
        z.push_back((unsigned char)(nlen >> 8));
        z.insert(z.end(), raw.begin() + pos, raw.begin() + pos + n);
        pos += n;
    } while (pos < raw.size());
    put_be32(z, adler32(raw));
    return z;
}

bool write_png(const std::string & path, int w, int h, const std::vector<unsigned char> & rgb) {
    if (w <= 0 || h <= 0 || rgb.size() < (size_t)w * h * 3) return false;

    std::vector<unsigned char> png = {137, 80, 78, 71, 13, 10, 26, 10};

    std::vector<unsigned char> ihdr;
    put_be32(ihdr, (uint32_t)w);
    put_be32(ihdr, (uint32_t)h);
    // 8-bit RGB, deflate, no filter, no interlace
    ihdr.insert(ihdr.end(), {8, 2, 0, 0, 0});
    put_chunk(png, "IHDR", ihdr);

    const size_t stride = (size_t)w * 3;
    std::vector<unsigned char> raw;
    raw.reserve((stride + 1) * (size_t)h);
    for (int y = 0; y < h; ++y) {
        raw.push_back(0);
        raw.insert(raw.end(), rgb.begin() + (size_t)y * stride, rgb.begin() + (size_t)(y + 1) * stride);
    }
    put_chunk(png, "IDAT", zlib_stored(raw));
    put_chunk(png, "IEND", {});

    return write_file(path, png.data(), png.size());
}

}
