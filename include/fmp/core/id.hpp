#pragma once

#include <cstddef>
#include <string>

namespace fmp {

/**
 * @brief Random lowercase hex identifier of `bytes` random bytes
 *
 * Used for upload session ids and file record ids.
 */
std::string generate_id(std::size_t bytes = 16);

} // namespace fmp
