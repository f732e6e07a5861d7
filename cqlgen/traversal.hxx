// file      : cqlgen/traversal.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef CQLGEN_TRAVERSAL_HXX
#define CQLGEN_TRAVERSAL_HXX

#include <cqlgen/traversal/elements.hxx>
#include <cqlgen/traversal/column.hxx>
#include <cqlgen/traversal/table.hxx>
#include <cqlgen/traversal/model.hxx>

#endif // CQLGEN_TRAVERSAL_HXX
