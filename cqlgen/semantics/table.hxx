// file      : cqlgen/semantics/table.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef CQLGEN_SEMANTICS_TABLE_HXX
#define CQLGEN_SEMANTICS_TABLE_HXX

#include <cqlgen/semantics/elements.hxx>

namespace semantics
{
  class model;

  // Table name is the name of the names edge from the model. Columns
  // are in the configuration order.
  //
  class table: public nameable, public semantics::scope
  {
  public:
    // Name of the C++ model type (class) that a row maps to.
    //
    string const&
    model_name () const {return model_name_;}

    // Name of the generated data access class.
    //
    string const&
    dao () const {return dao_;}

    // Base name of the generated files.
    //
    string const&
    generated_name () const {return generated_name_;}

  public:
    typedef semantics::model model_type;

    model_type&
    model () const;

  public:
    table (string const& model_name,
           string const& dao,
           string const& generated_name)
        : model_name_ (model_name),
          dao_ (dao),
          generated_name_ (generated_name)
    {
    }

    virtual string
    kind () const
    {
      return "table";
    }

    // Resolve ambiguity.
    //
    using nameable::scope;
    using nameable::add_edge_right;

  private:
    string model_name_;
    string dao_;
    string generated_name_;
  };
}

#endif // CQLGEN_SEMANTICS_TABLE_HXX
