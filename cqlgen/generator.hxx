// file      : cqlgen/generator.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef CQLGEN_GENERATOR_HXX
#define CQLGEN_GENERATOR_HXX

#include <string>
#include <vector>
#include <cstddef> // std::size_t

#include <cqlgen/options.hxx>
#include <cqlgen/semantics/model.hxx>

class generator
{
public:
  class failed {};

  struct artifact
  {
    semantics::path file;
    std::string text;
    std::size_t sloc;
  };

  typedef std::vector<artifact> artifacts;

  // Render the headers of all the tables into memory. Nothing is
  // written.
  //
  artifacts
  render (options const&, semantics::model&, semantics::path const& file);

  // Render the headers and then write them out. If writing any of them
  // fails, the files already written are removed.
  //
  void
  generate (options const&, semantics::model&, semantics::path const& file);

  generator () {}

private:
  generator (generator const&);
  generator& operator= (generator const&);
};

#endif // CQLGEN_GENERATOR_HXX
