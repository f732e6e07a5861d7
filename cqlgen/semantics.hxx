// file      : cqlgen/semantics.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef CQLGEN_SEMANTICS_HXX
#define CQLGEN_SEMANTICS_HXX

#include <cqlgen/semantics/elements.hxx>
#include <cqlgen/semantics/column.hxx>
#include <cqlgen/semantics/table.hxx>
#include <cqlgen/semantics/model.hxx>

#endif // CQLGEN_SEMANTICS_HXX
