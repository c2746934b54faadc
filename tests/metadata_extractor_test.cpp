#include "test_base.hpp"
#include "core/hash_utils.hpp"
#include "core/metadata_extractor.hpp"
#include <filesystem>

class MetadataExtractorTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        config_.min_size_bytes = 1;
    }

    DedupConfig config_;
};

TEST_F(MetadataExtractorTest, DHashBitOrder)
{
    // Brightness rising left to right: every bit set
    cv::Mat rising(8, 9, CV_8UC1);
    for (int y = 0; y < 8; y++)
        for (int x = 0; x < 9; x++)
            rising.at<uint8_t>(y, x) = static_cast<uint8_t>(x * 20);
    EXPECT_EQ(MetadataExtractor::computeDHash(rising), ~0ULL);

    cv::Mat falling;
    cv::flip(rising, falling, 1);
    EXPECT_EQ(MetadataExtractor::computeDHash(falling), 0ULL);

    // Only the first row rising: the top byte
    cv::Mat first_row = cv::Mat::zeros(8, 9, CV_8UC1);
    for (int x = 0; x < 9; x++)
        first_row.at<uint8_t>(0, x) = static_cast<uint8_t>(x * 20);
    EXPECT_EQ(MetadataExtractor::computeDHash(first_row), 0xFF00000000000000ULL);
}

TEST_F(MetadataExtractorTest, DHashRejectsEmptyImage)
{
    EXPECT_THROW(MetadataExtractor::computeDHash(cv::Mat()), std::invalid_argument);
}

TEST_F(MetadataExtractorTest, ExtractsMetadata)
{
    cv::Mat image = makePattern(120, 80);
    std::string file = writeImage("photo.png", image);

    MetadataExtractor extractor(config_);
    auto metadata = extractor.extract(file);
    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->path, file);
    EXPECT_EQ(metadata->resolution, 120u * 80u);
    EXPECT_EQ(metadata->size, std::filesystem::file_size(file));
    EXPECT_GT(metadata->mod_time, 0.0);
    EXPECT_EQ(metadata->hash, MetadataExtractor::computeDHash(image));
}

TEST_F(MetadataExtractorTest, SamePixelsSameHashAcrossFormats)
{
    cv::Mat image = makePattern(96, 64, 2);
    std::string png = writeImage("a.png", image);
    std::string bmp = writeImage("b.bmp", image);
    std::string tiff = writeImage("c.tiff", image);

    MetadataExtractor extractor(config_);
    auto m_png = extractor.extract(png);
    auto m_bmp = extractor.extract(bmp);
    auto m_tiff = extractor.extract(tiff);
    ASSERT_TRUE(m_png && m_bmp && m_tiff);
    EXPECT_EQ(m_png->hash, m_bmp->hash);
    EXPECT_EQ(m_png->hash, m_tiff->hash);
    EXPECT_NE(m_png->size, m_bmp->size);
}

TEST_F(MetadataExtractorTest, ResizedAndRecompressedCopyIsClose)
{
    cv::Mat image = makePattern(400, 300, 1);
    cv::Mat smaller;
    cv::resize(image, smaller, cv::Size(200, 150), 0, 0, cv::INTER_AREA);

    MetadataExtractor extractor(config_);
    auto original = extractor.extract(writeImage("big.png", image));
    auto copy = extractor.extract(writeImage("small.jpg", smaller));
    ASSERT_TRUE(original && copy);
    EXPECT_LE(HashUtils::hammingDistance(original->hash, copy->hash), 5);
    EXPECT_GT(original->resolution, copy->resolution);
}

TEST_F(MetadataExtractorTest, DifferentImagesAreFar)
{
    cv::Mat image = makePattern(160, 120);
    cv::Mat other;
    cv::flip(image, other, 1);

    MetadataExtractor extractor(config_);
    auto a = extractor.extract(writeImage("a.png", image));
    auto b = extractor.extract(writeImage("b.png", other));
    ASSERT_TRUE(a && b);
    EXPECT_GT(HashUtils::hammingDistance(a->hash, b->hash), 20);
}

TEST_F(MetadataExtractorTest, BelowMinimumSizeIsExcluded)
{
    std::string file = writeImage("photo.png", makePattern(64, 64));
    config_.min_size_bytes = std::filesystem::file_size(file) + 1;

    MetadataExtractor extractor(config_);
    EXPECT_FALSE(extractor.extract(file).has_value());

    config_.min_size_bytes = std::filesystem::file_size(file);
    EXPECT_TRUE(MetadataExtractor(config_).extract(file).has_value());
}

TEST_F(MetadataExtractorTest, CorruptOrMissingFilesFail)
{
    MetadataExtractor extractor(config_);
    EXPECT_FALSE(extractor.extract(writeFile("broken.jpg", 4096)).has_value());
    EXPECT_FALSE(extractor.extract(writeFile("broken.dng", 4096)).has_value());
    EXPECT_FALSE(extractor.extract(path("missing.png")).has_value());
}

TEST_F(MetadataExtractorTest, TruncatedImageFails)
{
    std::string good = writeImage("good.png", makePattern(200, 200));
    auto size = std::filesystem::file_size(good);
    std::filesystem::resize_file(good, size / 4);

    MetadataExtractor extractor(config_);
    EXPECT_FALSE(extractor.extract(good).has_value());
}

TEST_F(MetadataExtractorTest, FunctionWrapperMatchesExtract)
{
    std::string file = writeImage("photo.png", makePattern(50, 40));
    MetadataExtractor extractor(config_);
    auto fn = extractor.asFunction();
    auto direct = extractor.extract(file);
    auto wrapped = fn(file);
    ASSERT_TRUE(direct && wrapped);
    EXPECT_EQ(direct->hash, wrapped->hash);
}

TEST_F(MetadataExtractorTest, TruncatedJpegFails)
{
    std::string jpeg = writeImage("cut.jpg", makePattern(200, 200, 4));
    ASSERT_TRUE(MetadataExtractor::hasJpegEndMarker(jpeg));
    ASSERT_TRUE(MetadataExtractor(config_).extract(jpeg).has_value());

    std::filesystem::resize_file(jpeg, std::filesystem::file_size(jpeg) / 4);
    EXPECT_FALSE(MetadataExtractor::hasJpegEndMarker(jpeg));
    EXPECT_FALSE(MetadataExtractor(config_).extract(jpeg).has_value());

    // The same truncated data under another JPEG extension
    std::string jfif = path("cut.jfif");
    std::filesystem::copy_file(jpeg, jfif);
    EXPECT_FALSE(MetadataExtractor(config_).extract(jfif).has_value());
}

TEST_F(MetadataExtractorTest, JpegWithTrailingPaddingIsAccepted)
{
    std::string jpeg = writeImage("padded.jpeg", makePattern(160, 120, 2));
    {
        std::ofstream out(jpeg, std::ios::binary | std::ios::app);
        std::string padding(64, '\0');
        out.write(padding.data(), static_cast<std::streamsize>(padding.size()));
    }
    EXPECT_TRUE(MetadataExtractor::hasJpegEndMarker(jpeg));
    EXPECT_TRUE(MetadataExtractor(config_).extract(jpeg).has_value());
}

TEST_F(MetadataExtractorTest, JpegEndMarkerOnRawBytes)
{
    std::string ends = writeFile("ends.jpg", 100, '\x11');
    {
        std::ofstream out(ends, std::ios::binary | std::ios::app);
        out.put(static_cast<char>(0xFF));
        out.put(static_cast<char>(0xD9));
    }
    EXPECT_TRUE(MetadataExtractor::hasJpegEndMarker(ends));
    EXPECT_FALSE(MetadataExtractor::hasJpegEndMarker(writeFile("no_marker.jpg", 5000, '\xFF')));
    EXPECT_FALSE(MetadataExtractor::hasJpegEndMarker(writeFile("tiny.jpg", 2, '\xFF')));
    EXPECT_FALSE(MetadataExtractor::hasJpegEndMarker(path("missing.jpg")));

    EXPECT_TRUE(MetadataExtractor::isJpegExtension("jfif"));
    EXPECT_FALSE(MetadataExtractor::isJpegExtension("png"));
}
