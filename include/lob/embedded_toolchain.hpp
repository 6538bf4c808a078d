#pragma once

#include <span>

namespace lob {

/**
 * @brief The gzip-compressed toolchain tarball baked in at build time.
 *
 * Defined in a source file generated by cmake/embed_archive.cmake. Empty when
 * the binary was built without an embedded toolchain.
 */
std::span<const unsigned char> embedded_toolchain_archive();

} // namespace lob
