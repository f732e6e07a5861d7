// file      : cqlgen/validator.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef CQLGEN_VALIDATOR_HXX
#define CQLGEN_VALIDATOR_HXX

#include <cqlgen/options.hxx>
#include <cqlgen/semantics/model.hxx>

// Check the structural constraints of the model: at least one table,
// at least one column and one partition key per table, and non-empty
// names. Return false and issue diagnostics if any is violated.
//
class validator
{
public:
  bool
  validate (options const&, semantics::model&, semantics::path const&);

  validator () {}

private:
  validator (validator const&);
  validator& operator= (validator const&);
};

#endif // CQLGEN_VALIDATOR_HXX
