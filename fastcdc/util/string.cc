/**
 * This file is part of libfastcdc.
 *
 * Some common string functions.
 */

#include "util/string.h"

#include <errno.h>
#include <stdint.h>

#include <cstdio>
#include <cstdlib>
#include <string>

using namespace std;  // NOLINT

namespace fastcdc {

/**
 * Parse a string into a a uint64_t.
 *
 * Checks to make sure the full string is parsed and that the value is not
 * negative.  If an error occurs, this returns false and sets errno
 * appropriately.
 */
bool String2Uint64Parse(const std::string &value, uint64_t *result) {
  char *endptr = NULL;
  errno = 0;
  unsigned long long myval = strtoull(value.c_str(), &endptr, 10);  // NOLINT
  if ((value.size() == 0) || (endptr != (value.c_str() + value.size())) ||
      (value.find('-') != std::string::npos)) {
    errno = EINVAL;
    return false;
  }
  if (errno) {
    return false;
  }
  if (result) {
    *result = myval;
  }
  return true;
}

vector<string> SplitString(const string &str, char delim) {
  vector<string> result;
  const unsigned size = str.size();
  unsigned marker = 0;
  for (unsigned i = 0; i < size; ++i) {
    if (str[i] == delim) {
      result.push_back(str.substr(marker, i - marker));
      marker = i + 1;
    }
  }
  result.push_back(str.substr(marker));
  return result;
}

string JoinStrings(const vector<string> &strings, const string &joint) {
  string result = "";
  const unsigned size = strings.size();

  if (size > 0) {
    result = strings[0];
    for (unsigned i = 1; i < size; ++i) result += joint + strings[i];
  }

  return result;
}

bool GetLineFile(FILE *f, std::string *line) {
  int retval;
  line->clear();
  while (true) {
    retval = fgetc(f);
    if (ferror(f) && (errno == EINTR)) {
      clearerr(f);
      continue;
    } else if (retval == EOF) {
      break;
    }
    char c = static_cast<char>(retval);
    if (c == '\n') break;
    line->push_back(c);
  }
  return (retval != EOF) || !line->empty();
}

/**
 * Removes leading and trailing whitespaces.
 */
string Trim(const string &raw, bool trim_newline) {
  if (raw.empty()) return "";

  unsigned start_pos = 0;
  for (; (start_pos < raw.length()) &&
         (raw[start_pos] == ' ' || raw[start_pos] == '\t' ||
         (trim_newline && (raw[start_pos] == '\n' || raw[start_pos] == '\r')));
       ++start_pos)
  {
  }
  if (start_pos == raw.length()) return "";

  unsigned end_pos = raw.length() - 1;  // at least one character in raw
  for (;
       (end_pos > start_pos) &&
         (raw[end_pos] == ' ' || raw[end_pos] == '\t' ||
         (trim_newline && (raw[end_pos] == '\n' || raw[end_pos] == '\r')));
       --end_pos)
  {
  }

  return raw.substr(start_pos, end_pos - start_pos + 1);
}

}  // namespace fastcdc
