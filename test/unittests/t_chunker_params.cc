/**
 * This file is part of libfastcdc.
 */

#include <gtest/gtest.h>

#include <unistd.h>

#include <cstdio>
#include <cstring>
#include <set>
#include <string>

#include "ingestion/chunker_params.h"
#include "util/posix.h"
#include "util/unlink_guard.h"

namespace fastcdc {

class T_ChunkerParams : public ::testing::Test {
 protected:
  Failures Resolve(const uint64_t average_size,
                   const ChunkerOptions &options)
  {
    return ChunkerParams::Resolve(average_size, options, &params_);
  }

  void WriteConfig(const std::string &content) {
    if (!config_file_.empty())
      unlink(config_file_.c_str());
    FILE *f = CreateTempFile("./fastcdc_ut_chunker_params", 0600, "w",
                             &config_file_);
    ASSERT_TRUE(f != NULL);
    unlink_guard_.Set(config_file_);
    ASSERT_EQ(content.length(), fwrite(content.data(), 1, content.length(), f));
    ASSERT_EQ(0, fclose(f));
  }

  ChunkerParams params_;
  std::string config_file_;
  UnlinkGuard unlink_guard_;
};


TEST_F(T_ChunkerParams, Defaults) {
  ASSERT_EQ(kFailOk, Resolve(16384, ChunkerOptions()));
  EXPECT_EQ(16384U, params_.average_size());
  EXPECT_EQ(4096U, params_.min_size());
  EXPECT_EQ(65536U, params_.max_size());
  EXPECT_EQ(131072U, params_.buffer_size());
  EXPECT_EQ(2U, params_.normalization());
  EXPECT_EQ(0U, params_.seed());
}


TEST_F(T_ChunkerParams, Overrides) {
  ASSERT_EQ(kFailOk, Resolve(16384, ChunkerOptions()
    .WithMinSize(4096)
    .WithMaxSize(65535)
    .WithNormalization(1)
    .WithSeed(666)
    .WithBufferSize(100000)));
  EXPECT_EQ(16384U, params_.average_size());
  EXPECT_EQ(4096U, params_.min_size());
  EXPECT_EQ(65535U, params_.max_size());
  EXPECT_EQ(100000U, params_.buffer_size());
  EXPECT_EQ(1U, params_.normalization());
  EXPECT_EQ(666U, params_.seed());

  // The default buffer size follows the overridden maximum size
  ASSERT_EQ(kFailOk, Resolve(1024, ChunkerOptions().WithMaxSize(3000)));
  EXPECT_EQ(6000U, params_.buffer_size());
}


TEST_F(T_ChunkerParams, Normalization) {
  ChunkerOptions options;
  EXPECT_EQ(0, options.normalization);
  EXPECT_FALSE(options.disable_normalization);

  options.WithNormalization(0);
  EXPECT_TRUE(options.disable_normalization);
  ASSERT_EQ(kFailOk, Resolve(1024, options));
  EXPECT_EQ(0U, params_.normalization());

  options.WithNormalization(3);
  EXPECT_FALSE(options.disable_normalization);
  ASSERT_EQ(kFailOk, Resolve(1024, options));
  EXPECT_EQ(3U, params_.normalization());
}


TEST_F(T_ChunkerParams, AverageSize) {
  EXPECT_EQ(kFailAverageSizeRange, Resolve(0, ChunkerOptions()));
  EXPECT_EQ(kFailAverageSizeRange, Resolve(32, ChunkerOptions()));
  EXPECT_EQ(kFailAverageSizeRange,
            Resolve(uint64_t(1) << 31, ChunkerOptions()));
  EXPECT_EQ(kFailAverageSizeNotPow2, Resolve(1000, ChunkerOptions()));
  EXPECT_EQ(kFailAverageSizeNotPow2, Resolve(16383, ChunkerOptions()
    .WithMinSize(4096).WithMaxSize(65535)));
  EXPECT_EQ(kFailOk, Resolve(256, ChunkerOptions()));
}


TEST_F(T_ChunkerParams, MinMaxSize) {
  // Default minimum size is 32 bytes
  EXPECT_EQ(kFailMinSizeRange, Resolve(128, ChunkerOptions()));
  EXPECT_EQ(kFailMinSizeRange, Resolve(1024, ChunkerOptions().WithMinSize(10)));
  EXPECT_EQ(kFailMinSizeRange,
            Resolve(1024, ChunkerOptions().WithMinSize(uint64_t(1) << 31)));
  // Default maximum size is 4GiB
  EXPECT_EQ(kFailMaxSizeRange, Resolve(uint64_t(1) << 30, ChunkerOptions()));
  EXPECT_EQ(kFailMaxSizeRange, Resolve(1024, ChunkerOptions().WithMaxSize(63)));

  EXPECT_EQ(kFailMinNotBelowMax, Resolve(8192, ChunkerOptions()
    .WithMinSize(10000).WithMaxSize(5000)));
  EXPECT_EQ(kFailMinNotBelowMax, Resolve(8192, ChunkerOptions()
    .WithMinSize(8192).WithMaxSize(8192)));

  EXPECT_EQ(kFailAverageSizeBounds, Resolve(8192, ChunkerOptions()
    .WithMinSize(1024).WithMaxSize(4096)));
  EXPECT_EQ(kFailAverageSizeBounds, Resolve(1024, ChunkerOptions()
    .WithMinSize(2048).WithMaxSize(8192)));
  EXPECT_EQ(kFailOk, Resolve(1024, ChunkerOptions()
    .WithMinSize(1024).WithMaxSize(1025)));
}


TEST_F(T_ChunkerParams, NormalizationLevel) {
  EXPECT_EQ(kFailNormalizationLevel,
            Resolve(16384, ChunkerOptions().WithNormalization(5)));
  EXPECT_EQ(kFailNormalizationLevel,
            Resolve(16384, ChunkerOptions().WithNormalization(4)));
  EXPECT_EQ(kFailNormalizationLevel,
            Resolve(16384, ChunkerOptions().WithNormalization(-1)));
}


TEST_F(T_ChunkerParams, BufferSize) {
  EXPECT_EQ(kFailBufferSize,
            Resolve(16384, ChunkerOptions().WithBufferSize(65536)));
  EXPECT_EQ(kFailBufferSize,
            Resolve(16384, ChunkerOptions().WithBufferSize(1000)));
  EXPECT_EQ(kFailOk, Resolve(16384, ChunkerOptions().WithBufferSize(65537)));

  // Oversized buffers are rejected instead of failing the allocation
  const uint64_t kGiB = 1024 * 1024 * 1024;
  EXPECT_EQ(kFailOk, Resolve(16384,
    ChunkerOptions().WithBufferSize(ChunkerParams::kMaxBufferSize)));
  EXPECT_EQ(kFailBufferSize, Resolve(16384,
    ChunkerOptions().WithBufferSize(ChunkerParams::kMaxBufferSize + 1)));
  EXPECT_EQ(kFailBufferSize, Resolve(16384,
    ChunkerOptions().WithBufferSize(uint64_t(1) << 62)));
  EXPECT_EQ(kFailOk, Resolve(8 * 1024 * 1024,
    ChunkerOptions().WithMaxSize(kGiB)));
  EXPECT_EQ(2 * kGiB, params_.buffer_size());
}


TEST_F(T_ChunkerParams, MaskBitWidth) {
  EXPECT_EQ(kFailMaskBitWidth,
            Resolve(64, ChunkerOptions().WithMinSize(64)));
  EXPECT_EQ(kFailMaskBitWidth, Resolve(128, ChunkerOptions()
    .WithMinSize(64).WithNormalization(3)));
  EXPECT_EQ(kFailMaskBitWidth, Resolve(uint64_t(1) << 24, ChunkerOptions()
    .WithMaxSize(uint64_t(1) << 25)));
  EXPECT_EQ(kFailMaskBitWidth, Resolve(uint64_t(1) << 26, ChunkerOptions()
    .WithMaxSize(uint64_t(1) << 27).WithNormalization(0)));
  EXPECT_EQ(kFailOk, Resolve(64, ChunkerOptions()
    .WithMinSize(64).WithNormalization(1)));
}


TEST_F(T_ChunkerParams, FailureKeepsParams) {
  ASSERT_EQ(kFailOk, Resolve(4096, ChunkerOptions().WithSeed(1)));
  EXPECT_EQ(kFailBufferSize,
            Resolve(16384, ChunkerOptions().WithBufferSize(10)));
  EXPECT_EQ(4096U, params_.average_size());
  EXPECT_EQ(1U, params_.seed());
}


TEST_F(T_ChunkerParams, Code2Ascii) {
  std::set<std::string> texts;
  for (unsigned i = 0; i < kFailNumEntries; ++i) {
    const char *text = Code2Ascii(static_cast<Failures>(i));
    ASSERT_TRUE(text != NULL);
    EXPECT_GT(strlen(text), 0U);
    texts.insert(text);
  }
  EXPECT_EQ(static_cast<size_t>(kFailNumEntries), texts.size());
  EXPECT_STREQ("OK", Code2Ascii(kFailOk));
  EXPECT_STREQ("no text", Code2Ascii(kFailNumEntries));
}


TEST_F(T_ChunkerParams, ConfigFile) {
  WriteConfig(
    "# chunker settings\n"
    "FASTCDC_AVG_CHUNK_SIZE=16384\n"
    "FASTCDC_MIN_CHUNK_SIZE=4096\n"
    "export FASTCDC_MAX_CHUNK_SIZE=65535\n"
    "FASTCDC_NORMALIZATION=1\n"
    "FASTCDC_SEED=\"666\"\n"
    "FASTCDC_BUFFER_SIZE=200000  # generous\n");
  uint64_t average_size = 0;
  ChunkerOptions options;
  ASSERT_TRUE(GetOptionsFromFile(config_file_, &average_size, &options));
  EXPECT_EQ(16384U, average_size);
  EXPECT_EQ(4096U, options.min_size);
  EXPECT_EQ(65535U, options.max_size);
  EXPECT_EQ(1, options.normalization);
  EXPECT_FALSE(options.disable_normalization);
  EXPECT_EQ(666U, options.seed);
  EXPECT_EQ(200000U, options.buffer_size);

  ASSERT_EQ(kFailOk, Resolve(average_size, options));
  EXPECT_EQ(65535U, params_.max_size());
}


TEST_F(T_ChunkerParams, ConfigFileDefaults) {
  WriteConfig("FASTCDC_AVG_CHUNK_SIZE=8192\n"
              "FASTCDC_NORMALIZATION=0\n");
  uint64_t average_size = 0;
  ChunkerOptions options;
  ASSERT_TRUE(GetOptionsFromFile(config_file_, &average_size, &options));
  EXPECT_EQ(8192U, average_size);
  EXPECT_EQ(0U, options.min_size);
  EXPECT_EQ(0U, options.max_size);
  EXPECT_EQ(0U, options.buffer_size);
  EXPECT_EQ(0U, options.seed);
  EXPECT_TRUE(options.disable_normalization);

  ASSERT_EQ(kFailOk, Resolve(average_size, options));
  EXPECT_EQ(2048U, params_.min_size());
  EXPECT_EQ(0U, params_.normalization());
}


TEST_F(T_ChunkerParams, ConfigFileErrors) {
  uint64_t average_size = 42;
  ChunkerOptions options;
  EXPECT_FALSE(GetOptionsFromFile("./no/such/config", &average_size,
                                  &options));

  WriteConfig("FASTCDC_MIN_CHUNK_SIZE=4096\n");
  EXPECT_FALSE(GetOptionsFromFile(config_file_, &average_size, &options));

  WriteConfig("FASTCDC_AVG_CHUNK_SIZE=16k\n");
  EXPECT_FALSE(GetOptionsFromFile(config_file_, &average_size, &options));

  WriteConfig("FASTCDC_AVG_CHUNK_SIZE=16384\n"
              "FASTCDC_SEED=-1\n");
  EXPECT_FALSE(GetOptionsFromFile(config_file_, &average_size, &options));

  WriteConfig("FASTCDC_AVG_CHUNK_SIZE=16384\n"
              "FASTCDC_NORMALIZATION=99999999999\n");
  EXPECT_FALSE(GetOptionsFromFile(config_file_, &average_size, &options));

  EXPECT_EQ(42U, average_size);
  EXPECT_EQ(0U, options.min_size);
}

}  // namespace fastcdc
