// file      : cqlgen/traversal/column.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef CQLGEN_TRAVERSAL_COLUMN_HXX
#define CQLGEN_TRAVERSAL_COLUMN_HXX

#include <cqlgen/semantics/column.hxx>
#include <cqlgen/traversal/elements.hxx>

namespace traversal
{
  struct column: node<semantics::column> {};
}

#endif // CQLGEN_TRAVERSAL_COLUMN_HXX
