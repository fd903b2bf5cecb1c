/**
 * This file is part of libfastcdc.
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "util/logging.h"

namespace fastcdc {

struct LoggedMessage {
  LoggedMessage(LogSource s, int m, const std::string &t)
    : source(s), mask(m), text(t) { }
  LogSource source;
  int mask;
  std::string text;
};

static std::vector<LoggedMessage> *logged_messages = NULL;

static void RecordMessage(const LogSource source, const int mask,
                          const char *msg)
{
  logged_messages->push_back(LoggedMessage(source, mask, msg));
}


class T_Logging : public ::testing::Test {
 protected:
  virtual void SetUp() {
    logged_messages = &messages_;
    SetAltLogFunc(RecordMessage);
  }

  virtual void TearDown() {
    SetAltLogFunc(NULL);
    SetLogVerbosity(kLogNormal);
    SetLogSyslogPrefix("");
    logged_messages = NULL;
  }

  std::vector<LoggedMessage> messages_;
};


TEST_F(T_Logging, AltLogFunc) {
  LogFastcdc(kLogChunker, kLogStdout, "chunk %d of %s", 3, "stream");
  LogFastcdc(kLogOptions, kLogStderr | kLogShowSource, "missing key");
  ASSERT_EQ(2U, messages_.size());
  EXPECT_EQ(kLogChunker, messages_[0].source);
  EXPECT_EQ(kLogStdout, messages_[0].mask);
  EXPECT_EQ("chunk 3 of stream", messages_[0].text);
  EXPECT_EQ(kLogOptions, messages_[1].source);
  EXPECT_EQ("missing key", messages_[1].text);
}


#ifndef DEBUGMSG
TEST_F(T_Logging, DebugMessagesCompiledOut) {
  LogFastcdc(kLogChunker, kLogDebug, "invisible");
  EXPECT_TRUE(messages_.empty());
  LogFastcdc(kLogChunker, kLogDebug | kLogStdout, "visible");
  EXPECT_EQ(1U, messages_.size());
}
#endif


TEST_F(T_Logging, Verbosity) {
  SetLogVerbosity(kLogVerbose);
  LogFastcdc(kLogIngestion, kLogInfoMsg, "info");
  EXPECT_TRUE(messages_.empty());
  LogFastcdc(kLogIngestion, kLogVerboseMsg, "verbose");
  ASSERT_EQ(1U, messages_.size());
  EXPECT_EQ("verbose", messages_[0].text);

  SetLogVerbosity(kLogNormal);
  LogFastcdc(kLogIngestion, kLogInfoMsg, "info");
  LogFastcdc(kLogIngestion, kLogWarning, "warning");
  EXPECT_EQ(3U, messages_.size());

  SetLogVerbosity(kLogNone);
  LogFastcdc(kLogIngestion, kLogWarning, "suppressed");
  EXPECT_EQ(3U, messages_.size());
}


TEST_F(T_Logging, SyslogSettings) {
  SetLogSyslogLevel(1);
  EXPECT_EQ(1, GetLogSyslogLevel());
  SetLogSyslogLevel(2);
  EXPECT_EQ(2, GetLogSyslogLevel());
  SetLogSyslogLevel(42);
  EXPECT_EQ(3, GetLogSyslogLevel());

  SetLogSyslogFacility(5);
  EXPECT_EQ(5, GetLogSyslogFacility());
  SetLogSyslogFacility(8);
  EXPECT_EQ(-1, GetLogSyslogFacility());
}

}  // namespace fastcdc
