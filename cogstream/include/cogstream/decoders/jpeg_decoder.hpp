#pragma once

#include <csetjmp>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include <jpeglib.h>
#include "../image_decoder.hpp"
#include "../raster.hpp"
#include "../types/result.hpp"
#include "../types/tiff_spec.hpp"

namespace cogstream {

namespace detail {

struct JpegErrorManager {
    jpeg_error_mgr base;
    std::jmp_buf jump;
    char message[JMSG_LENGTH_MAX];
};

extern "C" inline void cogstream_jpeg_error_exit(j_common_ptr cinfo) {
    auto* manager = reinterpret_cast<JpegErrorManager*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, manager->message);
    std::longjmp(manager->jump, 1);
}

extern "C" inline void cogstream_jpeg_silence(j_common_ptr, int) {}

enum class JpegStatus {
    Ok,
    LibraryError,
    SizeMismatch,
    UnsupportedPrecision
};

/// Decode a complete JPEG stream into `output` (height * width * samples bytes).
/// Holds only trivially destructible locals: libjpeg reports errors through longjmp.
inline JpegStatus decode_jpeg_stream(
    const unsigned char* data,
    std::size_t size,
    unsigned char* output,
    uint32_t width,
    uint32_t height,
    uint16_t samples,
    J_COLOR_SPACE stored_space,
    char* message) noexcept {

    jpeg_decompress_struct cinfo;
    JpegErrorManager errors;
    cinfo.err = jpeg_std_error(&errors.base);
    errors.base.error_exit = cogstream_jpeg_error_exit;
    errors.base.emit_message = cogstream_jpeg_silence;
    errors.message[0] = '\0';

    if (setjmp(errors.jump)) {
        std::snprintf(message, JMSG_LENGTH_MAX, "%s", errors.message);
        jpeg_destroy_decompress(&cinfo);
        return JpegStatus::LibraryError;
    }

    jpeg_create_decompress(&cinfo);
    jpeg_mem_src(&cinfo, const_cast<unsigned char*>(data), static_cast<unsigned long>(size));
    jpeg_read_header(&cinfo, TRUE);

    if (cinfo.data_precision != 8) {
        jpeg_destroy_decompress(&cinfo);
        return JpegStatus::UnsupportedPrecision;
    }
    if (cinfo.image_width != width || cinfo.image_height != height ||
        cinfo.num_components != static_cast<int>(samples)) {
        std::snprintf(message, JMSG_LENGTH_MAX, "JPEG stream is %ux%u with %d components",
                      static_cast<unsigned>(cinfo.image_width), static_cast<unsigned>(cinfo.image_height),
                      cinfo.num_components);
        jpeg_destroy_decompress(&cinfo);
        return JpegStatus::SizeMismatch;
    }

    if (samples == 3) {
        cinfo.jpeg_color_space = stored_space;
        cinfo.out_color_space = JCS_RGB;
    } else if (samples == 1) {
        cinfo.out_color_space = JCS_GRAYSCALE;
    } else {
        // CMYK or RGBA written as-is
        cinfo.jpeg_color_space = cinfo.num_components == 4 ? JCS_CMYK : JCS_UNKNOWN;
        cinfo.out_color_space = cinfo.jpeg_color_space;
    }

    jpeg_start_decompress(&cinfo);
    const std::size_t row_size = static_cast<std::size_t>(width) * samples;
    while (cinfo.output_scanline < cinfo.output_height) {
        JSAMPROW row = output + static_cast<std::size_t>(cinfo.output_scanline) * row_size;
        jpeg_read_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_decompress(&cinfo);
    jpeg_destroy_decompress(&cinfo);
    return JpegStatus::Ok;
}

} // namespace detail

/**
 * @brief JPEG tile decoder on top of libjpeg
 *
 * Decodes 8-bit baseline or progressive JPEG tiles. The tile stream must be
 * complete: abbreviated streams are merged with the IFD's JPEGTables before
 * they get here.
 *
 * Three-sample tiles are returned as RGB. Stored YCbCr is converted; with
 * PhotometricInterpretation RGB the components are read without conversion.
 */
class JpegDecoder final : public ImageDecoder {
private:
    std::optional<uint16_t> photometric_;

public:
    JpegDecoder() = default;

    explicit JpegDecoder(std::optional<uint16_t> photometric) noexcept
        : photometric_(photometric) {}

    [[nodiscard]] Result<RasterBuffer> decode(
        std::span<const std::byte> bytes,
        uint32_t width,
        uint32_t height,
        uint16_t samples) const override {

        const J_COLOR_SPACE stored_space =
            photometric_ == static_cast<uint16_t>(PhotometricInterpretation::RGB) ? JCS_RGB : JCS_YCbCr;

        RasterBuffer buffer(DataType::UInt8, height, width, samples);
        char message[JMSG_LENGTH_MAX] = {};
        const auto status = detail::decode_jpeg_stream(
            reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(),
            reinterpret_cast<unsigned char*>(buffer.bytes().data()),
            width, height, samples, stored_space, message);

        switch (status) {
            case detail::JpegStatus::Ok:
                return Ok(std::move(buffer));
            case detail::JpegStatus::LibraryError:
                return Err(Error::Code::CorruptTile, std::string("libjpeg: ") + message);
            case detail::JpegStatus::SizeMismatch:
                return Err(Error::Code::CorruptTile,
                           std::string(message) + ", expected " + std::to_string(width) + "x" +
                           std::to_string(height) + " with " + std::to_string(samples));
            case detail::JpegStatus::UnsupportedPrecision:
                return Err(Error::Code::UnsupportedFeature, "Only 8-bit JPEG tiles are supported");
        }
        return Err(Error::Code::CorruptTile, "libjpeg: unknown failure");
    }
};

} // namespace cogstream
