/***
 * Name: pyjudge::support (fs)
 * Purpose: Whole-file reads for submissions and catalogs, replace-on-write
 *   for reports.
 * Theory of Operation: Errors come back as "<verb> '<path>': <strerror>" so
 *   callers can print them unchanged.
 */
#pragma once

#include <string>

namespace pyjudge {
namespace support {

/*** ReadFile: Read a regular file into out; false with err otherwise. */
bool ReadFile(const std::string& path, std::string& out, std::string& err);

/*** WriteFile: Write data to "<path>.tmp" and rename it over path. */
bool WriteFile(const std::string& path, const std::string& data, std::string& err);

}  // namespace support
}  // namespace pyjudge
