// file      : cqlgen/generate.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef CQLGEN_GENERATE_HXX
#define CQLGEN_GENERATE_HXX

// Both render the table of the current context to its stream.
//
namespace dao
{
  void
  generate ();
}

namespace dto
{
  void
  generate ();
}

#endif // CQLGEN_GENERATE_HXX
