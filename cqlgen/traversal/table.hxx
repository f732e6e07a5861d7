// file      : cqlgen/traversal/table.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef CQLGEN_TRAVERSAL_TABLE_HXX
#define CQLGEN_TRAVERSAL_TABLE_HXX

#include <cqlgen/semantics/table.hxx>
#include <cqlgen/traversal/elements.hxx>

namespace traversal
{
  struct table: scope_template<semantics::table> {};
}

#endif // CQLGEN_TRAVERSAL_TABLE_HXX
