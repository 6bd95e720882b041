/*!
 * @file
 * @brief Whole-file helpers for endian streams.
 */

#pragma once

#include <core/common.h>

namespace oishii {

Result<std::vector<u8>> UtilReadFile(std::string_view path);

} // namespace oishii
