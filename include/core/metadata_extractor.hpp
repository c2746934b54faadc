#pragma once

#include "core/dedup_config.hpp"
#include "core/file_metadata.hpp"
#include <opencv2/core.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

// Decoded pixels plus the true pixel count of the source image
struct DecodedImage
{
    cv::Mat pixels;
    uint64_t resolution = 0;
};

/**
 * @brief Validates and perceptually hashes a single candidate file
 *
 * Stateless apart from its configuration; safe to call from several worker
 * threads at once. Every failure is logged and reported as std::nullopt.
 */
class MetadataExtractor
{
public:
    using ExtractFunction = std::function<std::optional<FileMetadata>(const std::string &)>;

    explicit MetadataExtractor(const DedupConfig &config);

    /**
     * @brief Build the metadata of one file
     * @param file_path Absolute path of the candidate
     * @return Metadata, or std::nullopt if the file is too small, unreadable or corrupt
     */
    std::optional<FileMetadata> extract(const std::string &file_path) const;

    /**
     * @brief Wrap extract() as a plain callable for the pipeline
     */
    ExtractFunction asFunction() const;

    /**
     * @brief 64-bit difference hash of an image
     *
     * The image is reduced to a 9x8 grayscale thumbnail; each bit is set when
     * a pixel is brighter than its left neighbour. Bits are packed row by
     * row, most significant first.
     *
     * @param image 8-bit gray, BGR or BGRA image, must not be empty
     * @return Hash value
     */
    static uint64_t computeDHash(const cv::Mat &image);

    /**
     * @brief Decode an image with OpenCV, or LibRaw for RAW extensions
     * @return Decoded image, or std::nullopt if decoding failed
     */
    std::optional<DecodedImage> decode(const std::string &file_path) const;

    /**
     * @brief Whether a JPEG file ends with the EOI marker (FF D9)
     *
     * The decoder only warns about a premature end of data and returns a
     * partly grey image, so truncation has to be detected up front. Only the
     * last kJpegTailBytes are searched, allowing trailing padding.
     */
    static bool hasJpegEndMarker(const std::string &file_path);

    static bool isJpegExtension(const std::string &ext);

    static constexpr size_t kJpegTailBytes = 1024;

private:
    DedupConfig config_;

    static std::optional<DecodedImage> decodeWithOpenCV(const std::string &file_path);
    static std::optional<DecodedImage> decodeWithLibRaw(const std::string &file_path);
};
