#include "core/metadata_extractor.hpp"
#include "core/file_utils.hpp"
#include "core/hash_utils.hpp"
#include "logging/logger.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <libraw/libraw.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace
{
    // RAII wrapper for a LibRaw processor and its output image
    class LibRawRAII
    {
    public:
        LibRawRAII() : raw_(std::make_unique<LibRaw>()), img_(nullptr) {}

        ~LibRawRAII()
        {
            if (img_)
                LibRaw::dcraw_clear_mem(img_);
            raw_->recycle();
        }

        LibRawRAII(const LibRawRAII &) = delete;
        LibRawRAII &operator=(const LibRawRAII &) = delete;

        LibRaw *getRaw() { return raw_.get(); }
        libraw_processed_image_t *getImg() { return img_; }
        void setImg(libraw_processed_image_t *i) { img_ = i; }

    private:
        std::unique_ptr<LibRaw> raw_;
        libraw_processed_image_t *img_;
    };

    std::string fileName(const std::string &file_path)
    {
        return std::filesystem::path(file_path).filename().string();
    }
}

MetadataExtractor::MetadataExtractor(const DedupConfig &config)
    : config_(config)
{
}

MetadataExtractor::ExtractFunction MetadataExtractor::asFunction() const
{
    return [extractor = *this](const std::string &file_path)
    {
        return extractor.extract(file_path);
    };
}

std::optional<FileMetadata> MetadataExtractor::extract(const std::string &file_path) const
{
    try
    {
        auto stat = FileUtils::getFileStat(file_path);
        if (!stat)
        {
            Logger::warn("Could not read file information: " + fileName(file_path));
            return std::nullopt;
        }

        if (stat->size < config_.min_size_bytes)
        {
            Logger::debug("Skipping file below minimum size (" + std::to_string(stat->size) + " bytes): " + fileName(file_path));
            return std::nullopt;
        }

        auto decoded = decode(file_path);
        if (!decoded)
        {
            Logger::warn("Could not open or verify image: " + fileName(file_path));
            return std::nullopt;
        }

        uint64_t hash = computeDHash(decoded->pixels);
        if (Logger::isEnabled(Logger::Level::TRACE))
            Logger::trace("dHash " + HashUtils::toHex(hash) + " for " + file_path);

        return FileMetadata(file_path, hash, decoded->resolution, stat->size, stat->mod_time);
    }
    catch (const cv::Exception &e)
    {
        Logger::warn("Could not process file " + fileName(file_path) + ": " + std::string(e.what()));
    }
    catch (const std::exception &e)
    {
        Logger::warn("Could not process file " + fileName(file_path) + ": " + std::string(e.what()));
    }
    return std::nullopt;
}

std::optional<DecodedImage> MetadataExtractor::decode(const std::string &file_path) const
{
    std::string ext = FileUtils::getFileExtension(file_path);
    if (config_.isRawExtension(ext))
        return decodeWithLibRaw(file_path);

    if (isJpegExtension(ext) && !hasJpegEndMarker(file_path))
    {
        Logger::debug("JPEG end marker missing, file is truncated: " + file_path);
        return std::nullopt;
    }
    return decodeWithOpenCV(file_path);
}

bool MetadataExtractor::isJpegExtension(const std::string &ext)
{
    return ext == "jpg" || ext == "jpeg" || ext == "jfif";
}

bool MetadataExtractor::hasJpegEndMarker(const std::string &file_path)
{
    std::ifstream in(file_path, std::ios::binary | std::ios::ate);
    if (!in)
        return false;

    std::streamoff size = in.tellg();
    if (size < 4)
        return false;

    std::streamoff tail = std::min<std::streamoff>(size, static_cast<std::streamoff>(kJpegTailBytes));
    std::vector<char> buffer(static_cast<size_t>(tail));
    in.seekg(size - tail);
    if (!in.read(buffer.data(), tail))
        return false;

    // Entropy-coded data never contains FF D9, it is byte-stuffed
    for (size_t i = buffer.size() - 1; i > 0; --i)
    {
        if (static_cast<unsigned char>(buffer[i - 1]) == 0xFF && static_cast<unsigned char>(buffer[i]) == 0xD9)
            return true;
    }
    return false;
}

std::optional<DecodedImage> MetadataExtractor::decodeWithOpenCV(const std::string &file_path)
{
    cv::Mat image = cv::imread(file_path, cv::IMREAD_COLOR);
    if (image.empty())
        return std::nullopt;

    DecodedImage decoded;
    decoded.resolution = static_cast<uint64_t>(image.cols) * static_cast<uint64_t>(image.rows);
    decoded.pixels = image;
    return decoded;
}

std::optional<DecodedImage> MetadataExtractor::decodeWithLibRaw(const std::string &file_path)
{
    LibRawRAII libraw_raii;
    LibRaw *raw = libraw_raii.getRaw();

    // A half-size decode is plenty for a 9x8 thumbnail
    raw->imgdata.params.half_size = 1;
    raw->imgdata.params.use_camera_wb = 1;
    raw->imgdata.params.output_bps = 8;
    raw->imgdata.params.output_color = 1; // sRGB

    int rc = raw->open_file(file_path.c_str());
    if (rc != LIBRAW_SUCCESS)
    {
        Logger::debug("LibRaw open_file failed: " + std::string(libraw_strerror(rc)) + " for: " + file_path);
        return std::nullopt;
    }

    DecodedImage decoded;
    decoded.resolution = static_cast<uint64_t>(raw->imgdata.sizes.width) * static_cast<uint64_t>(raw->imgdata.sizes.height);

    rc = raw->unpack();
    if (rc != LIBRAW_SUCCESS)
    {
        Logger::debug("LibRaw unpack failed: " + std::string(libraw_strerror(rc)) + " for: " + file_path);
        return std::nullopt;
    }

    rc = raw->dcraw_process();
    if (rc != LIBRAW_SUCCESS)
    {
        Logger::debug("LibRaw dcraw_process failed: " + std::string(libraw_strerror(rc)) + " for: " + file_path);
        return std::nullopt;
    }

    libraw_processed_image_t *img = raw->dcraw_make_mem_image(&rc);
    if (!img || rc != LIBRAW_SUCCESS)
    {
        Logger::debug("LibRaw dcraw_make_mem_image failed: " + std::string(libraw_strerror(rc)) + " for: " + file_path);
        return std::nullopt;
    }
    libraw_raii.setImg(img);

    if (img->type != LIBRAW_IMAGE_BITMAP || img->bits != 8 || img->width == 0 || img->height == 0 ||
        (img->colors != 1 && img->colors != 3))
    {
        Logger::debug("Unsupported LibRaw output image for: " + file_path);
        return std::nullopt;
    }

    int type = img->colors == 3 ? CV_8UC3 : CV_8UC1;
    cv::Mat wrapped(img->height, img->width, type, img->data);
    if (img->colors == 3)
        cv::cvtColor(wrapped, decoded.pixels, cv::COLOR_RGB2BGR);
    else
        decoded.pixels = wrapped.clone();

    if (decoded.resolution == 0)
        decoded.resolution = static_cast<uint64_t>(img->width) * static_cast<uint64_t>(img->height);
    return decoded;
}

uint64_t MetadataExtractor::computeDHash(const cv::Mat &image)
{
    if (image.empty())
        throw std::invalid_argument("Cannot hash an empty image");

    cv::Mat gray;
    if (image.channels() == 3)
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    else if (image.channels() == 4)
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    else
        gray = image;

    if (gray.depth() != CV_8U)
        gray.convertTo(gray, CV_8U);

    cv::Mat resized;
    cv::resize(gray, resized, cv::Size(9, 8), 0, 0, cv::INTER_AREA);

    uint64_t hash = 0;
    for (int y = 0; y < 8; y++)
    {
        for (int x = 0; x < 8; x++)
        {
            uint8_t left = resized.at<uint8_t>(y, x);
            uint8_t right = resized.at<uint8_t>(y, x + 1);
            hash = (hash << 1) | (right > left ? 1u : 0u);
        }
    }
    return hash;
}
