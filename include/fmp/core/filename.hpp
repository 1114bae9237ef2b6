#pragma once

#include <string>

namespace fmp {

/**
 * @brief Reduce a client-supplied name to a safe single path component
 *
 * Drops directory parts, replaces whitespace with '_', keeps
 * [A-Za-z0-9._-] and strips leading dots. Returns an empty string when
 * nothing usable is left.
 *
 *   "../../etc/passwd"   -> "passwd"
 *   "My Report (v2).pdf" -> "My_Report_v2.pdf"
 */
std::string sanitize_filename(const std::string& name);

/**
 * @brief Accept "type/subtype" with optional "; key=value" parameters
 *
 * Type and subtype are RFC 7230 tokens. Control characters and anything
 * outside printable ASCII are rejected, so the value is safe to echo back
 * as a header.
 */
bool is_valid_media_type(const std::string& value);

} // namespace fmp
