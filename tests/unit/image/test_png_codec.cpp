#include <gtest/gtest.h>
#include "tessera/image/png_codec.hpp"
#include <filesystem>

using namespace tessera;
using namespace tessera::image;

namespace {

Image make_pattern() {
    Image img(5, 3);
    for (u32 y = 0; y < 3; ++y) {
        for (u32 x = 0; x < 5; ++x) {
            img.set_pixel(x, y, Color(static_cast<u8>(x * 50), static_cast<u8>(y * 80),
                                      7, static_cast<u8>(x * 60 + y)));
        }
    }
    return img;
}

} // namespace

TEST(PngCodecTest, EncodeDecodeKeepsPixels) {
    Image original = make_pattern();

    auto encoded = encode_png(original);
    ASSERT_TRUE(encoded.is_ok()) << encoded.error().to_string();

    // PNG signature
    ASSERT_GE(encoded.value().size(), 8u);
    EXPECT_EQ(encoded.value()[1], 'P');
    EXPECT_EQ(encoded.value()[2], 'N');
    EXPECT_EQ(encoded.value()[3], 'G');

    auto decoded = decode_png(encoded.value());
    ASSERT_TRUE(decoded.is_ok()) << decoded.error().to_string();
    EXPECT_EQ(decoded.value(), original);
}

TEST(PngCodecTest, EncodingIsDeterministic) {
    Image img = make_pattern();
    auto a = encode_png(img);
    auto b = encode_png(img);
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_EQ(a.value(), b.value());
}

TEST(PngCodecTest, EmptyImageIsWriteError) {
    auto encoded = encode_png(Image());
    ASSERT_TRUE(encoded.is_err());
    EXPECT_EQ(encoded.error().code, PackErrorCode::WriteError);
}

TEST(PngCodecTest, GarbageIsReadError) {
    std::vector<u8> garbage{1, 2, 3, 4, 5, 6, 7, 8, 9};
    auto decoded = decode_png(garbage);
    ASSERT_TRUE(decoded.is_err());
    EXPECT_EQ(decoded.error().code, PackErrorCode::ReadError);
}

TEST(PngCodecTest, FileRoundTrip) {
    auto path = std::filesystem::temp_directory_path() / "tessera_png_codec_test.png";
    Image original = make_pattern();

    auto written = write_png(path, original);
    ASSERT_TRUE(written.is_ok()) << written.error().to_string();

    auto read = read_png(path);
    ASSERT_TRUE(read.is_ok()) << read.error().to_string();
    EXPECT_EQ(read.value(), original);

    std::filesystem::remove(path);
}

TEST(PngCodecTest, MissingFileIsReadError) {
    auto read = read_png("/nonexistent/tessera/missing.png");
    ASSERT_TRUE(read.is_err());
    EXPECT_EQ(read.error().code, PackErrorCode::ReadError);
}

TEST(PngCodecTest, UnwritablePathIsWriteError) {
    auto written = write_png("/nonexistent/tessera/out.png", Image(1, 1, Color::white()));
    ASSERT_TRUE(written.is_err());
    EXPECT_EQ(written.error().code, PackErrorCode::WriteError);
}
