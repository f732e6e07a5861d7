// file      : cqlgen/diagnostics.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef CQLGEN_DIAGNOSTICS_HXX
#define CQLGEN_DIAGNOSTICS_HXX

#include <cstddef>
#include <iostream>

#include <cutl/fs/path.hxx>

using std::endl;

// Diagnostics for a position in an input file. If line is 0, only the
// file is printed. Column 0 is not printed.
//
std::ostream&
error (cutl::fs::path const&, std::size_t line, std::size_t clmn);

std::ostream&
warn (cutl::fs::path const&, std::size_t line, std::size_t clmn);

std::ostream&
info (cutl::fs::path const&, std::size_t line, std::size_t clmn);

std::ostream&
error (cutl::fs::path const&);

std::ostream&
warn (cutl::fs::path const&);

std::ostream&
info (cutl::fs::path const&);

// Diagnostics that are not associated with any input file.
//
std::ostream&
error ();

std::ostream&
warn ();

std::ostream&
info ();

#endif // CQLGEN_DIAGNOSTICS_HXX
