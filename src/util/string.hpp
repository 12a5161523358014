#pragma once

#include <string>
#include <vector>

#include "util/error.hpp"

typedef std::vector<std::string> TTuple;

TTuple SplitString(const std::string &str, const char sep, int max = 0);
std::string MergeEscapeStrings(const TTuple &tuple, char sep);

std::string StringTrim(const std::string& s, const std::string &what = " \t\n");
bool StringStartsWith(const std::string &str, const std::string &prefix);

typedef std::vector<std::pair<uint64_t, std::string>> TFlagsNames;
std::string StringFormatFlags(uint64_t flags,
                              const TFlagsNames &names,
                              const std::string sep = ",");
TError StringParseFlags(const std::string &str, const TFlagsNames &names,
                        uint64_t &result, const char sep = ',');

std::string StringFormat(const char *format, ...)
                         __attribute__ ((format (printf, 1, 2)));
