// file      : cqlgen/traversal/model.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef CQLGEN_TRAVERSAL_MODEL_HXX
#define CQLGEN_TRAVERSAL_MODEL_HXX

#include <cqlgen/semantics/model.hxx>
#include <cqlgen/traversal/elements.hxx>

namespace traversal
{
  struct model: scope_template<semantics::model> {};
}

#endif // CQLGEN_TRAVERSAL_MODEL_HXX
