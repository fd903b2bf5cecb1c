/**
 * This file is part of libfastcdc.
 */

#include "ingestion/chunker_params.h"

#include <inttypes.h>

#include <climits>

#include "ingestion/gear_table.h"
#include "options.h"
#include "util/logging.h"
#include "util/string.h"

namespace fastcdc {

const uint64_t ChunkerParams::kAbsoluteMinSize;
const uint64_t ChunkerParams::kAbsoluteMaxSize;
const uint64_t ChunkerParams::kMaxBufferSize;
const int ChunkerParams::kDefaultNormalization;

namespace {

bool IsInSizeRange(const uint64_t size) {
  return (size >= ChunkerParams::kAbsoluteMinSize) &&
         (size <= ChunkerParams::kAbsoluteMaxSize);
}

/**
 * Looks up an optional numeric key.  Returns false only if the key is present
 * but its value is not a number.
 */
bool GetOptionalNumber(const OptionsParser &parser,
                       const std::string &config_file,
                       const std::string &key,
                       bool *is_defined,
                       uint64_t *value)
{
  std::string value_str;
  *is_defined = parser.GetValue(key, &value_str);
  if (!*is_defined)
    return true;
  if (!String2Uint64Parse(value_str, value)) {
    LogFastcdc(kLogOptions, kLogSyslogErr,
               "Invalid value '%s' for parameter %s in %s",
               value_str.c_str(), key.c_str(), config_file.c_str());
    return false;
  }
  return true;
}

}  // anonymous namespace


Failures ChunkerParams::Resolve(
  const uint64_t average_size,
  const ChunkerOptions &options,
  ChunkerParams *params)
{
  const uint64_t min_size =
    (options.min_size == 0) ? average_size / 4 : options.min_size;
  const uint64_t max_size =
    (options.max_size == 0) ? average_size * 4 : options.max_size;
  const uint64_t buffer_size =
    (options.buffer_size == 0) ? max_size * 2 : options.buffer_size;
  int normalization = options.normalization;
  if (!options.disable_normalization && (normalization == 0))
    normalization = kDefaultNormalization;

  if (!IsInSizeRange(average_size))
    return kFailAverageSizeRange;
  if ((average_size & (average_size - 1)) != 0)
    return kFailAverageSizeNotPow2;
  if (!IsInSizeRange(min_size))
    return kFailMinSizeRange;
  if (!IsInSizeRange(max_size))
    return kFailMaxSizeRange;
  if (max_size <= min_size)
    return kFailMinNotBelowMax;
  if ((average_size > max_size) || (average_size < min_size))
    return kFailAverageSizeBounds;
  if (!options.disable_normalization &&
      ((normalization < 0) || (normalization > 3)))
  {
    return kFailNormalizationLevel;
  }
  if ((buffer_size <= max_size) || (buffer_size > kMaxBufferSize))
    return kFailBufferSize;

  const unsigned effective_normalization =
    options.disable_normalization ? 0 : static_cast<unsigned>(normalization);
  CutMasks masks;
  if (!CutMasks::Select(average_size, effective_normalization, &masks))
    return kFailMaskBitWidth;

  params->average_size_ = average_size;
  params->min_size_ = min_size;
  params->max_size_ = max_size;
  params->buffer_size_ = buffer_size;
  params->normalization_ = effective_normalization;
  params->seed_ = options.seed;
  return kFailOk;
}


bool GetOptionsFromFile(
  const std::string &config_file,
  uint64_t *average_size,
  ChunkerOptions *options)
{
  OptionsParser parser;
  if (!parser.TryParsePath(config_file)) {
    LogFastcdc(kLogOptions, kLogSyslogErr,
               "Could not parse chunker configuration: %s.",
               config_file.c_str());
    return false;
  }

  std::string avg_chunk_size_str;
  if (!parser.GetValue("FASTCDC_AVG_CHUNK_SIZE", &avg_chunk_size_str)) {
    LogFastcdc(kLogOptions, kLogSyslogErr,
               "Missing parameter %s in chunker configuration file.",
               "FASTCDC_AVG_CHUNK_SIZE");
    return false;
  }
  uint64_t avg_chunk_size;
  if (!String2Uint64Parse(avg_chunk_size_str, &avg_chunk_size)) {
    LogFastcdc(kLogOptions, kLogSyslogErr,
               "Invalid value '%s' for parameter %s in %s",
               avg_chunk_size_str.c_str(), "FASTCDC_AVG_CHUNK_SIZE",
               config_file.c_str());
    return false;
  }

  ChunkerOptions result;
  bool is_defined;
  uint64_t value;

  if (!GetOptionalNumber(parser, config_file, "FASTCDC_MIN_CHUNK_SIZE",
                         &is_defined, &value))
  {
    return false;
  }
  if (is_defined) result.WithMinSize(value);

  if (!GetOptionalNumber(parser, config_file, "FASTCDC_MAX_CHUNK_SIZE",
                         &is_defined, &value))
  {
    return false;
  }
  if (is_defined) result.WithMaxSize(value);

  if (!GetOptionalNumber(parser, config_file, "FASTCDC_NORMALIZATION",
                         &is_defined, &value))
  {
    return false;
  }
  if (is_defined) {
    if (value > static_cast<uint64_t>(INT_MAX)) {
      LogFastcdc(kLogOptions, kLogSyslogErr,
                 "Normalization level %" PRIu64 " out of range in %s",
                 value, config_file.c_str());
      return false;
    }
    result.WithNormalization(static_cast<int>(value));
  }

  if (!GetOptionalNumber(parser, config_file, "FASTCDC_SEED",
                         &is_defined, &value))
  {
    return false;
  }
  if (is_defined) result.WithSeed(value);

  if (!GetOptionalNumber(parser, config_file, "FASTCDC_BUFFER_SIZE",
                         &is_defined, &value))
  {
    return false;
  }
  if (is_defined) result.WithBufferSize(value);

  *average_size = avg_chunk_size;
  *options = result;
  LogFastcdc(kLogOptions, kLogDebug,
             "loaded chunker configuration from %s (average size %" PRIu64 ")",
             config_file.c_str(), avg_chunk_size);
  return true;
}

}  // namespace fastcdc
