#include "binary_writer.hxx"

namespace oishii {

Writer::Writer(uint32_t buffer_size, std::endian endian)
    : VectorStream(buffer_size), m_endian(endian) {}

} // namespace oishii
