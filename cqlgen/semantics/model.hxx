// file      : cqlgen/semantics/model.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef CQLGEN_SEMANTICS_MODEL_HXX
#define CQLGEN_SEMANTICS_MODEL_HXX

#include <vector>

#include <cqlgen/semantics/elements.hxx>

namespace semantics
{
  // Persistence configuration. Owns all the tables and columns and
  // carries the settings that are shared by all the tables.
  //
  class model: public graph<node, edge>, public scope
  {
  public:
    typedef std::vector<string> imports_type;

    string const&
    keyspace () const {return keyspace_;}

    void
    keyspace (string const& k) {keyspace_ = k;}

    // C++ namespace of the generated data access code, '::'-separated.
    //
    string const&
    namespace_ () const {return namespace__;}

    void
    namespace_ (string const& n) {namespace__ = n;}

    // Boilerplate template file. Empty path if not specified.
    //
    path const&
    boilerplate () const {return boilerplate_;}

    void
    boilerplate (path const& p) {boilerplate_ = p;}

    // Additional headers to include, in the configuration order.
    //
    imports_type const&
    imports () const {return imports_;}

    imports_type&
    imports () {return imports_;}

    // Namespace alias that qualifies model types in the data access
    // code. Empty if model types are not qualified.
    //
    string const&
    model_namespace () const {return model_namespace_;}

    void
    model_namespace (string const& n) {model_namespace_ = n;}

    // Model (DTO) generation. Disabled if the namespace is empty.
    //
    bool
    model_generation () const {return !model_generation_namespace_.empty ();}

    string const&
    model_generation_namespace () const
    {
      return model_generation_namespace_;
    }

    void
    model_generation_namespace (string const& n)
    {
      model_generation_namespace_ = n;
    }

    // Directory, relative to the output directory, for model headers.
    //
    path const&
    model_generation_location () const {return model_generation_location_;}

    void
    model_generation_location (path const& p)
    {
      model_generation_location_ = p;
    }

  public:
    model ()
    {
    }

    virtual string
    kind () const
    {
      return "model";
    }

  private:
    model (model const&);
    model& operator= (model const&);

  private:
    string keyspace_;
    string namespace__;
    path boilerplate_;
    imports_type imports_;
    string model_namespace_;
    string model_generation_namespace_;
    path model_generation_location_;
  };
}

#endif // CQLGEN_SEMANTICS_MODEL_HXX
