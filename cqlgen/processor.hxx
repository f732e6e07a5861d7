// file      : cqlgen/processor.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef CQLGEN_PROCESSOR_HXX
#define CQLGEN_PROCESSOR_HXX

#include <cqlgen/options.hxx>
#include <cqlgen/semantics/model.hxx>

// Annotate the model with the information derived from it: the C++
// type mapping of each column ("type-mapping", type_mapping), the key
// structure of each table ("key-structure", key_structure), and the
// runtime headers each table needs ("import-flags", import_flags).
//
class processor
{
public:
  class failed {};

  void
  process (options const&, semantics::model&, semantics::path const&);

  processor () {}

private:
  processor (processor const&);
  processor& operator= (processor const&);
};

#endif // CQLGEN_PROCESSOR_HXX
