#include "gtest/gtest.h"

#include "image_io.h"
#include "sds_error.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

using namespace sds;

static std::vector<unsigned char> read_bytes(const std::string & path) {
    std::ifstream f(path, std::ios::binary);
    return std::vector<unsigned char>((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

TEST(LatentPreviewTest, ZeroLatentIsMidGray) {
    const FloatTensor latents(Shape{2, 4, 3, 5});
    const std::vector<RgbImage> images = latents_to_rgb(latents);
    ASSERT_EQ(images.size(), 2u);
    EXPECT_EQ(images[0].width, 5);
    EXPECT_EQ(images[0].height, 3);
    ASSERT_EQ(images[0].rgb.size(), 45u);
    for (unsigned char v : images[1].rgb) EXPECT_EQ(v, 127);
}

TEST(LatentPreviewTest, ProjectsChannelsAndClamps) {
    FloatTensor latents(Shape{1, 4, 1, 2});
    // pixel 0: channel 0 only, pixel 1: large channel 3 value
    latents.set({0, 0, 0, 0}, 1.0f);
    latents.set({0, 3, 0, 1}, 10.0f);
    const std::vector<RgbImage> images = latents_to_rgb(latents);
    const std::vector<unsigned char> & rgb = images[0].rgb;
    EXPECT_EQ(rgb[0], (unsigned char)((0.3512f / 2.0f + 0.5f) * 255.0f));
    EXPECT_EQ(rgb[1], (unsigned char)((0.2297f / 2.0f + 0.5f) * 255.0f));
    EXPECT_EQ(rgb[3], 0);
    EXPECT_EQ(rgb[5], 0);
}

TEST(LatentPreviewTest, RejectsNonLatentShapes) {
    EXPECT_THROW(latents_to_rgb(FloatTensor(Shape{1, 3, 4, 4})), ShapeError);
    EXPECT_THROW(latents_to_rgb(FloatTensor(Shape{4, 4, 4})), ShapeError);
}

TEST(ImageWriteTest, PpmHeaderAndPayload) {
    const std::string path = (fs::temp_directory_path() / "sds_test_preview.ppm").string();
    const std::vector<unsigned char> rgb = {255, 0, 0, 0, 255, 0};
    ASSERT_TRUE(write_ppm(path, 2, 1, rgb));
    const std::vector<unsigned char> bytes = read_bytes(path);
    fs::remove(path);

    const std::string header = "P6\n2 1\n255\n";
    ASSERT_EQ(bytes.size(), header.size() + rgb.size());
    EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + header.size()), header);
    EXPECT_EQ(bytes.back(), 0);
}

TEST(ImageWriteTest, PngSignatureAndChunks) {
    const std::string path = (fs::temp_directory_path() / "sds_test_preview.png").string();
    const std::vector<unsigned char> rgb(4 * 3 * 3, 200);
    ASSERT_TRUE(write_png(path, 4, 3, rgb));
    const std::vector<unsigned char> bytes = read_bytes(path);
    fs::remove(path);

    const unsigned char sig[8] = {137, 80, 78, 71, 13, 10, 26, 10};
    ASSERT_GT(bytes.size(), 8u + 25u + 12u);
    EXPECT_TRUE(std::equal(sig, sig + 8, bytes.begin()));
    EXPECT_EQ(std::string(bytes.begin() + 12, bytes.begin() + 16), "IHDR");
    // width, height big-endian
    EXPECT_EQ(bytes[19], 4);
    EXPECT_EQ(bytes[23], 3);
    EXPECT_EQ(std::string(bytes.end() - 8, bytes.end() - 4), "IEND");
}

TEST(ImageWriteTest, RejectsShortBuffers) {
    const std::vector<unsigned char> rgb(5, 0);
    EXPECT_FALSE(write_png("unused.png", 2, 2, rgb));
    EXPECT_FALSE(write_ppm("unused.ppm", 2, 2, rgb));
    EXPECT_FALSE(write_png("unused.png", 0, 2, rgb));
}
