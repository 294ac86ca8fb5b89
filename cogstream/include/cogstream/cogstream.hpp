#pragma once

// Types
#include "types/byte_order.hpp"
#include "types/result.hpp"
#include "types/tiff_spec.hpp"

// Byte sources
#include "byte_source.hpp"
#include "sources/file_source.hpp"
#include "sources/memory_source.hpp"

// Configuration and logging
#include "log.hpp"
#include "options.hpp"

// Container parsing
#include "header.hpp"
#include "directory_reader.hpp"
#include "tag.hpp"
#include "ifd.hpp"
#include "ifd_chain.hpp"
#include "image_info.hpp"

// Georeferencing
#include "geokeys.hpp"
#include "overview.hpp"

// Decoding
#include "raster.hpp"
#include "predictor.hpp"
#include "image_decoder.hpp"
#include "decoders/jpeg_decoder.hpp"
#include "tile_decoder.hpp"

// Reader
#include "concurrency/task_group.hpp"
#include "profile.hpp"
#include "cog_reader.hpp"
