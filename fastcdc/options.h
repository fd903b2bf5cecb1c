/**
 * This file is part of libfastcdc.
 */

#ifndef FASTCDC_OPTIONS_H_
#define FASTCDC_OPTIONS_H_

#include <map>
#include <string>
#include <vector>

#include "util/export.h"

namespace fastcdc {

/**
 * Parses and stores the key=value pairs of configuration files.  A key that
 * is defined by several files takes the value from the last parsed one.
 *
 * Accepted lines are of the form
 *
 *  KEY=VALUE
 *
 * optionally prefixed with "export " or "readonly ".  Values can be quoted
 * with single or double quotes; everything following a '#' is a comment.
 */
class FASTCDC_EXPORT OptionsParser {
 public:
  OptionsParser() { }

  /**
   * Opens the config_file and extracts all contained variables and their
   * corresponding values.  Variables that were defined before are
   * overwritten.
   *
   * @param config_file  path to the configuration file
   * @return false if the file cannot be opened
   */
  bool TryParsePath(const std::string &config_file);

  /**
   * Gets the stored value for a concrete variable
   *
   * @param  key variable to be accessed in the map
   * @param  value container of the received value, if it exists
   * @return true if there was a value stored in the map for key
   */
  bool GetValue(const std::string &key, std::string *value) const;

 private:
  std::string TrimParameter(const std::string &parameter) const;
  std::string SanitizeParameterAssignment(
    std::string *line, std::vector<std::string> *tokens) const;

  std::map<std::string, std::string> config_;
};

}  // namespace fastcdc

#endif  // FASTCDC_OPTIONS_H_
