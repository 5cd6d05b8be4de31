#pragma once

#include <httplib.h>

#include <cstddef>
#include <string>

namespace relay {

std::string RedactHeaderValue(const std::string& key, const std::string& value);
std::string SanitizeBodyForLog(const std::string& body);
std::string TruncateForLog(std::string s, size_t max_chars);

// Prints method, path, redacted headers and sanitized body.
void LogRequestRaw(const httplib::Request& req);

}  // namespace relay
