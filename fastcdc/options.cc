/**
 * This file is part of libfastcdc.
 *
 * Fills an internal map of key-value pairs from ASCII files in key=value
 * style.  Parameters can be overwritten.  Used to read chunker settings.
 */

#include "options.h"

#include <cstdio>

#include "util/logging.h"
#include "util/string.h"

using namespace std;  // NOLINT

namespace fastcdc {

string OptionsParser::TrimParameter(const string &parameter) const {
  string result = Trim(parameter);
  if (result.find("readonly ") == 0) {
    result = result.substr(9);
    result = Trim(result);
  } else if (result.find("export ") == 0) {
    result = result.substr(7);
    result = Trim(result);
  }
  return result;
}


string OptionsParser::SanitizeParameterAssignment(
  string *line,
  vector<string> *tokens) const
{
  size_t comment_idx = line->find("#");
  if (comment_idx != string::npos)
    *line = line->substr(0, comment_idx);
  *line = Trim(*line, true /* trim_newline */);
  if (line->empty())
    return "";
  *tokens = SplitString(*line, '=');
  if (tokens->size() < 2)
    return "";
  string parameter = TrimParameter((*tokens)[0]);
  if (parameter.find(" ") != string::npos)
    return "";
  return parameter;
}


bool OptionsParser::TryParsePath(const string &config_file) {
  LogFastcdc(kLogOptions, kLogDebug, "Parsing config file %s",
             config_file.c_str());
  string line;
  FILE *fconfig = fopen(config_file.c_str(), "r");
  if (fconfig == NULL)
    return false;

  // Read line by line and extract parameters
  while (GetLineFile(fconfig, &line)) {
    vector<string> tokens;
    string parameter = SanitizeParameterAssignment(&line, &tokens);
    if (parameter.empty())
      continue;

    // Strip quotes from value
    tokens.erase(tokens.begin());
    string value = Trim(JoinStrings(tokens, "="));
    unsigned value_length = value.length();
    if (value_length > 2) {
      if ( ((value[0] == '"') && ((value[value_length - 1] == '"'))) ||
           ((value[0] == '\'') && ((value[value_length - 1] == '\''))) )
      {
        value = value.substr(1, value_length - 2);
      }
    }

    config_[parameter] = value;
  }
  fclose(fconfig);
  return true;
}


bool OptionsParser::GetValue(const string &key, string *value) const {
  map<string, string>::const_iterator iter = config_.find(key);
  if (iter != config_.end()) {
    *value = iter->second;
    return true;
  }
  *value = "";
  return false;
}

}  // namespace fastcdc
