// file      : cqlgen/buffer.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v2; see accompanying LICENSE file

#ifndef LIBCQLGEN_BUFFER_HXX
#define LIBCQLGEN_BUFFER_HXX

#include <vector>

namespace cqlgen
{
  // Opaque byte value (CQL blob).
  //
  typedef std::vector<unsigned char> buffer;
}

#endif // LIBCQLGEN_BUFFER_HXX
